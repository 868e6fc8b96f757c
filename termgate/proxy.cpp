#include "gateway.h"
#include "gateway-internal.h"
#include "fmt.h"
#include <system_error>
#include <oxenc/bt_serialize.h>

namespace termgate {

void Gateway::proxy_quit() {
    TG_LOG(debug, "All tasks finished, shutting down proxy thread");

    assert(tasks.empty());

    // A NEW sent just before QUIT (from a different control socket) may still be waiting; take
    // ownership of any such request so that its connection gets closed.
    std::vector<zmq::message_t> parts;
    while (recv_message_parts(command, parts, zmq::recv_flags::dontwait)) {
        if (parts.size() == 3 && view(parts[1]) == "NEW") {
            try {
                auto request = detail::deserialize_object<Request>(oxenc::bt_deserialize<uintptr_t>(view(parts[2])));
                TG_LOG(debug, "Dropping request for pool ", request.pool, ": shutting down");
            } catch (const oxenc::bt_deserialize_invalid& e) {
                TG_LOG(error, "Invalid NEW control message data: ", e.what());
            }
        } else if (parts.size() >= 2) {
            TG_LOG(debug, "Ignoring ", view(parts[1]), " control message received during shutdown");
        }
        parts.clear();
    }

    {
        std::lock_guard lock{control_sockets_mutex};
        proxy_shutting_down = true; // To prevent threads from opening new control sockets
    }
    command.set(zmq::sockopt::linger, 0);
    command.close();

    TG_LOG(debug, "Proxy thread teardown complete");
}

void Gateway::proxy_control_message(std::vector<zmq::message_t>& parts) {
    if (parts.size() < 2) {
        TG_LOG(error, "Received invalid ", parts.size(), "-part control message; ignoring");
        return;
    }
    auto route = view(parts[0]), cmd = view(parts[1]);
    TG_TRACE("control message: ", cmd);
    try {
        if (parts.size() == 3) {
            auto data = view(parts[2]);
            if (cmd == "NEW") {
                return proxy_new_request(detail::deserialize_object<Request>(oxenc::bt_deserialize<uintptr_t>(data)));
            } else if (cmd == "FREED") {
                return proxy_asset_freed(oxenc::bt_deserialize<uint64_t>(data));
            }
        } else if (parts.size() == 2) {
            if (cmd == "START") {
                // Command sent by the owning thread during startup; we send back a simple READY
                // reply to let it know we are running.
                return route_control(command, route, "READY");
            } else if (cmd == "STATS") {
                return route_control(command, route, "STATS", oxenc::bt_serialize(oxenc::bt_dict{
                        {"pending", static_cast<uint64_t>(pending.size())},
                        {"total", total_dispatched}}));
            } else if (cmd == "QUIT") {
                // Stop admitting; queued requests are dropped (closing their connections) and we
                // finish shutting down once the running tasks have reported back.
                TG_LOG(debug, "Received quit command; dropping ", pending.size(), " queued requests and waiting for ",
                        tasks.size(), " running tasks");
                quitting = true;
                pending = {};
                return;
            }
        }
    } catch (const oxenc::bt_deserialize_invalid& e) {
        TG_LOG(error, "Invalid ", cmd, " control message data: ", e.what(), "; ignoring");
        return;
    }
    TG_LOG(error, "Unexpected control message: ", cmd, " (", parts.size(), " parts); ignoring");
}

void Gateway::proxy_new_request(Request request) {
    if (quitting) {
        TG_LOG(debug, "Dropping request for pool ", request.pool, ": shutting down");
        return;
    }
    if (!pending.empty()) {
        // Something is already waiting, so we go to the back of the line even if our pool has an
        // idle asset right now.
        TG_LOG(debug, "Pre-queueing request for pool ", request.pool);
        pending.push(std::move(request));
        return;
    }
    proxy_try_lease(std::move(request));
}

void Gateway::proxy_try_lease(Request request) {
    std::optional<Asset> asset;
    try {
        asset = pools->lease(request.pool);
    } catch (const std::exception& e) {
        TG_LOG(error, "Unable to lease from pool ", request.pool, ": ", e.what(), "; dropping request");
        // If we were called for a freed slot, that slot now goes to the next queued request.
        proxy_service_queue();
        return;
    }

    if (!asset) {
        TG_LOG(debug, "Post-queueing request for pool ", request.pool);
        pending.push(std::move(request));
        return;
    }

    total_dispatched++;
    if (log_level() >= LogLevel::debug)
        TG_LOG(debug, fmt::format("Leased asset {} from pool {} (total dispatched = {})", *asset, request.pool, total_dispatched));

    auto id = next_task_id++;
    std::string pool = request.pool;
    try {
        tasks.emplace(id, std::thread{&Gateway::task_thread, this, id, std::move(request), *asset});
    } catch (const std::system_error& e) {
        TG_LOG(error, "Unable to start task thread: ", e.what(), "; dropping request");
        pools->release(pool, std::move(*asset));
        proxy_service_queue();
    }
}

void Gateway::proxy_asset_freed(uint64_t task_id) {
    auto it = tasks.find(task_id);
    if (it == tasks.end()) {
        TG_LOG(error, "Received FREED from unknown task ", task_id);
    } else {
        it->second.join();
        tasks.erase(it);
        TG_TRACE("Task ", task_id, " finished; ", tasks.size(), " tasks still running");
    }
    proxy_service_queue();
}

void Gateway::proxy_service_queue() {
    if (pending.empty() || quitting)
        return;

    // Whatever pool just freed a slot, it is always the head of the queue that gets the next
    // attempt; if its pool is still full it goes back to the tail.
    Request next = std::move(pending.front());
    pending.pop();
    proxy_try_lease(std::move(next));
}

void Gateway::proxy_loop() {
    set_thread_name("tg-proxy");

    std::vector<zmq::message_t> parts;
    while (!(quitting && tasks.empty())) {
        parts.clear();
        try {
            if (!recv_message_parts(command, parts))
                continue;
        } catch (const zmq::error_t& e) {
            TG_LOG(error, "Failed to read control message: ", e.what());
            continue;
        }
        proxy_control_message(parts);
    }

    proxy_quit();
}

}
