#include "gateway.h"
#include "gateway-internal.h"
#include <cassert>
#include <ostream>
#include <stdexcept>
#include <oxenc/bt_serialize.h>

#if defined(__FreeBSD__) || defined(__NetBSD__) || defined(__OpenBSD__)
extern "C" {
#include <pthread.h>
#include <pthread_np.h>
}
#endif

extern "C" {
#include <unistd.h>
}

namespace termgate {

namespace {

void check_not_started(const std::thread& proxy_thread, const std::string& verb) {
    if (proxy_thread.joinable())
        throw std::logic_error("Cannot " + verb + " after calling `start()`");
}

} // anonymous namespace

namespace detail {

void send_control(zmq::socket_t& sock, std::string_view cmd, std::string data) {
    auto c = create_message(std::move(cmd));
    if (data.empty()) {
        sock.send(c, zmq::send_flags::none);
    } else {
        auto d = create_message(std::move(data));
        sock.send(c, zmq::send_flags::sndmore);
        sock.send(d, zmq::send_flags::none);
    }
}

} // namespace detail

void set_thread_name(std::string name) {
#if defined(__linux__) || defined(__sun) || defined(__MINGW32__)
    if (name.size() > 15) name.resize(15);
    pthread_setname_np(pthread_self(), name.c_str());
#elif defined(__FreeBSD__) || defined(__NetBSD__) || defined(__OpenBSD__)
    pthread_set_name_np(pthread_self(), name.c_str());
#elif defined(__MACH__)
    pthread_setname_np(name.c_str());
#endif
}

void Gateway::log_level(LogLevel level) {
    log_lvl.store(level, std::memory_order_relaxed);
}

LogLevel Gateway::log_level() const {
    return log_lvl.load(std::memory_order_relaxed);
}

void Gateway::listen(uint16_t port) {
    check_not_started(proxy_thread, "change the listening port");
    listen_port = port;
}

void Gateway::add_pool(PoolConfig config) {
    check_not_started(proxy_thread, "add a pool");
    if (config.pool.empty())
        throw std::invalid_argument("Invalid pool: pool name cannot be empty");
    pool_configs.push_back(std::move(config));
}

void Gateway::set_native_handler(NativeHandler handler) {
    check_not_started(proxy_thread, "set the native handler");
    native_handler = std::move(handler);
}

std::atomic<int> next_id{1};

zmq::socket_t Gateway::connect_control() {
    zmq::socket_t sock{context, zmq::socket_type::dealer};
    sock.set(zmq::sockopt::linger, 1000);
    sock.set(zmq::sockopt::rcvtimeo, static_cast<int>(STATS_TIMEOUT.count()));
    sock.connect(ADDR_COMMAND);
    return sock;
}

/// Accesses a thread-local command socket connected to the proxy's command socket used to issue
/// commands in a thread-safe manner.  A mutex is only required here the first time a thread
/// accesses the control socket.
zmq::socket_t& Gateway::get_control_socket() {
    assert(proxy_thread.joinable());

    // Optimize by caching the last value; a Gateway is often a singleton and in that case we're
    // going to *always* hit this optimization.
    static thread_local int last_id = -1;
    static thread_local zmq::socket_t* last_socket = nullptr;
    if (object_id == last_id)
        return *last_socket;

    std::lock_guard lock{control_sockets_mutex};

    if (proxy_shutting_down)
        throw std::runtime_error("Unable to obtain Gateway control socket: proxy thread is shutting down");

    auto& socket = control_sockets[std::this_thread::get_id()];
    if (!socket)
        socket = std::make_unique<zmq::socket_t>(connect_control());
    last_id = object_id;
    last_socket = socket.get();
    return *last_socket;
}

Gateway::Gateway(
        std::shared_ptr<PoolManager> pools_,
        std::shared_ptr<WorkerTransport> transport_,
        Logger logger,
        LogLevel level)
    : object_id{next_id++}, log_lvl{level}, logger{std::move(logger)},
        pools{std::move(pools_)}, transport{std::move(transport_)}
{
    TG_TRACE("Constructing Gateway, id=", object_id, ", this=", this);

    if (!pools)
        throw std::invalid_argument("Gateway construction failed: no pool manager given");
    if (!transport)
        throw std::invalid_argument("Gateway construction failed: no worker transport given");
}

void Gateway::start() {
    if (proxy_thread.joinable())
        throw std::logic_error("Cannot call start() multiple times!");
    if (LISTEN_RETRIES < 1)
        throw std::out_of_range("Invalid LISTEN_RETRIES value " + std::to_string(LISTEN_RETRIES) + ": must be > 0");

    routing = RoutingTable{pool_configs};
    TG_LOG(info, "Starting gateway with ", pool_configs.size(), " pools serving ", routing.size(), " modules");
    if (log_level() >= LogLevel::debug)
        for (const auto& config : pool_configs)
            for (const auto& mod : config.modules)
                TG_LOG(debug, "    - ", mod, " -> ", *routing.lookup(mod));

    listen_fd = try_listen();
    bound_port = local_port(listen_fd);

    // We bind `command` here so that the `get_control_socket()` below is always connecting to a
    // bound socket; everything else about the socket belongs to the proxy thread.
    command = zmq::socket_t{context, zmq::socket_type::router};
    command.bind(ADDR_COMMAND);
    proxy_thread = std::thread{&Gateway::proxy_loop, this};

    TG_LOG(debug, "Waiting for proxy thread to get ready...");
    auto& control = get_control_socket();
    detail::send_control(control, "START");
    TG_TRACE("Sent START command");

    std::vector<zmq::message_t> parts;
    bool got;
    try { got = recv_message_parts(control, parts); }
    catch (const zmq::error_t& e) { throw std::runtime_error("Failure reading from Gateway proxy thread: "s + e.what()); }

    if (!(got && parts.size() == 1 && view(parts.front()) == "READY"))
        throw std::runtime_error("Invalid startup message from proxy thread (didn't get expected READY message)");
    TG_LOG(debug, "Proxy thread is ready");

    listener_thread = std::thread{&Gateway::listener_loop, this};
    TG_LOG(info, "Gateway listening on ", BIND_ADDRESS, ":", bound_port);
}

Stats Gateway::stats() {
    if (!proxy_thread.joinable())
        throw std::logic_error("Cannot query stats before calling `start()`");
    return request_stats(get_control_socket());
}

Stats Gateway::request_stats(zmq::socket_t& control) {
    detail::send_control(control, "STATS");
    std::vector<zmq::message_t> parts;
    if (!recv_message_parts(control, parts))
        throw std::runtime_error("Timed out waiting for stats from the proxy thread");
    if (parts.size() != 2 || view(parts[0]) != "STATS")
        throw std::runtime_error("Invalid stats reply from proxy thread");

    Stats s;
    // NB: bt_dict_consumer goes in alphabetical order
    oxenc::bt_dict_consumer data{view(parts[1])};
    if (!data.skip_until("pending"))
        throw std::runtime_error("Invalid stats reply from proxy thread: missing pending count");
    s.pending = data.consume_integer<uint64_t>();
    if (!data.skip_until("total"))
        throw std::runtime_error("Invalid stats reply from proxy thread: missing total count");
    s.total_dispatched = data.consume_integer<uint64_t>();
    s.idle_workers = pools->idle_count();
    return s;
}

Gateway::~Gateway() {
    if (!proxy_thread.joinable()) {
        if (listen_fd != -1)
            ::close(listen_fd);
        return;
    }

    TG_LOG(info, "Gateway shutting down");
    stopping = true;
    if (listener_thread.joinable())
        listener_thread.join();
    ::close(listen_fd);
    listen_fd = -1;

    {
        std::unique_lock lock{handlers_mutex};
        if (active_handlers > 0)
            TG_LOG(debug, "Waiting for ", active_handlers, " connection threads to finish");
        handlers_cv.wait(lock, [this] { return active_handlers == 0; });
    }

    TG_LOG(debug, "Shutting down proxy thread");
    detail::send_control(get_control_socket(), "QUIT");
    proxy_thread.join();
    TG_LOG(info, "Gateway proxy thread has stopped");
}

std::ostream& operator<<(std::ostream& os, LogLevel lvl) {
    os <<  (lvl == LogLevel::trace ? "trace" :
            lvl == LogLevel::debug ? "debug" :
            lvl == LogLevel::info  ? "info"  :
            lvl == LogLevel::warn  ? "warn"  :
            lvl == LogLevel::error ? "ERROR" :
            lvl == LogLevel::fatal ? "FATAL" :
            "unknown");
    return os;
}

std::ostream& operator<<(std::ostream& o, const Asset& a) {
    return o << a.endpoint << '#' << a.token;
}

}
// vim:sw=4:et
