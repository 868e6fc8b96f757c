#include "gateway.h"
#include "gateway-internal.h"
#include <cerrno>
#include <cstring>
#include <system_error>
#include <fmt/format.h>
#include <oxenc/bt_serialize.h>

extern "C" {
#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
}

namespace termgate {

namespace {

std::string peer_string(const sockaddr_in& addr) {
    char ip[INET_ADDRSTRLEN] = {};
    inet_ntop(AF_INET, &addr.sin_addr, ip, sizeof(ip));
    return std::string{ip} + ":" + std::to_string(ntohs(addr.sin_port));
}

} // anonymous namespace

int Gateway::try_listen() {
    for (int attempt = 1; ; attempt++) {
        try {
            int fd = listen_tcp(BIND_ADDRESS, listen_port);
            TG_LOG(info, "Listening on port ", local_port(fd));
            return fd;
        } catch (const std::system_error& e) {
            if (attempt >= LISTEN_RETRIES) {
                TG_LOG(error, "Could not listen on port ", listen_port, " after ", attempt, " attempts");
                throw std::runtime_error("Could not listen on port " + std::to_string(listen_port) + ": " + e.what());
            }
            TG_LOG(info, "Could not listen on port ", listen_port, ": ", e.what(), "; retrying in ", LISTEN_RETRY_DELAY.count(), "ms");
            std::this_thread::sleep_for(LISTEN_RETRY_DELAY);
        }
    }
}

void Gateway::listener_loop() {
    set_thread_name("tg-listener");

    while (!stopping) {
        pollfd p{listen_fd, POLLIN, 0};
        int r = ::poll(&p, 1, static_cast<int>(POLL_INTERVAL.count()));
        if (r == 0)
            continue;
        if (r == -1) {
            if (errno != EINTR)
                TG_LOG(error, "poll on listening socket failed: ", strerror(errno));
            continue;
        }

        sockaddr_in addr{};
        socklen_t len = sizeof(addr);
        int fd = ::accept4(listen_fd, reinterpret_cast<sockaddr*>(&addr), &len, SOCK_CLOEXEC);
        if (fd == -1) {
            if (errno != EINTR && errno != EAGAIN && errno != ECONNABORTED)
                TG_LOG(warn, "accept failed: ", strerror(errno));
            continue;
        }

        Connection conn{fd, peer_string(addr)};
        TG_TRACE("Accepted connection from ", conn.remote());
        spawn_handler(std::move(conn));
    }
    TG_LOG(debug, "Listener thread stopping");
}

void Gateway::spawn_handler(Connection conn) {
    {
        std::lock_guard lock{handlers_mutex};
        active_handlers++;
    }
    try {
        std::thread{[this, conn = std::move(conn)]() mutable {
            set_thread_name("tg-conn");
            handle_connection(std::move(conn));
            std::lock_guard lock{handlers_mutex};
            active_handlers--;
            handlers_cv.notify_all();
        }}.detach();
    } catch (const std::system_error& e) {
        TG_LOG(error, "Unable to start connection thread: ", e.what(), "; dropping connection");
        std::lock_guard lock{handlers_mutex};
        active_handlers--;
        handlers_cv.notify_all();
    }
}

void Gateway::handle_connection(Connection conn) {
    const std::string remote = conn.remote();
    Request request{std::move(conn)};
    try {
        while (true) {
            auto frame = request.conn.read_frame(MAX_FRAME_SIZE, stopping, POLL_INTERVAL);
            if (!frame) {
                TG_TRACE("Connection from ", remote, " closed without a request");
                return;
            }
            auto term = decode_term(*frame);

            if (auto* admin = std::get_if<AdminCall>(&term)) {
                process_admin(request.conn, *admin);
                return;
            }
            if (auto* info = std::get_if<Info>(&term)) {
                TG_LOG(debug, "Got info `", info->command, "' from ", remote, "; awaiting action");
                request.info = std::move(*frame);
                continue;
            }

            request.action = std::move(*frame);
            dispatch_request(std::move(request), term);
            return;
        }
    } catch (const oxenc::bt_deserialize_invalid& e) {
        TG_LOG(warn, "Invalid term from ", remote, ": ", e.what(), "; closing connection");
    } catch (const std::exception& e) {
        TG_LOG(warn, "Failed to handle connection from ", remote, ": ", e.what(), "; closing connection");
    }
}

void Gateway::dispatch_request(Request request, const Term& term) {
    const auto& mod = action_module(term);

    if (std::holds_alternative<Cast>(term)) {
        if (!request.conn.send_frame(encode_noreply()))
            TG_LOG(debug, "Unable to acknowledge cast from ", request.conn.remote());
        request.conn.close();
        TG_TRACE("Closed cast");
    }

    auto pool = routing.lookup(mod);
    if (!pool) {
        TG_LOG(debug, "Dispatching ", mod, " to native handler");
        if (native_handler)
            native_handler(std::move(request));
        return;
    }

    TG_LOG(debug, "Found pool ", *pool, " for ", mod);
    request.pool = std::move(*pool);
    auto control = connect_control();
    detail::send_control(control, "NEW", oxenc::bt_serialize(detail::serialize_object(std::move(request))));
}

void Gateway::process_admin(Connection& conn, const AdminCall& admin) {
    TG_LOG(info, "Admin command `", admin.function, "' from ", conn.remote());
    std::string reply;
    if (admin.function == "reload_handlers") {
        try {
            pools->reload();
            reply = "Handlers reloaded.";
        } catch (const std::exception& e) {
            TG_LOG(error, "Handler reload failed: ", e.what());
            reply = "Handlers reload failed.";
        }
    } else if (admin.function == "stats") {
        auto control = connect_control();
        auto s = request_stats(control);
        reply = fmt::format("connections.total={}\nworkers.idle={}\nconnections.pending={}\n",
                s.total_dispatched, s.idle_workers, s.pending);
    } else {
        reply = "Admin function not supported.";
    }

    if (!conn.send_frame(encode_reply(reply)))
        TG_LOG(debug, "Unable to send admin reply to ", conn.remote());
    conn.close();
}

}
