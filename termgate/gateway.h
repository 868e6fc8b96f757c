#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <memory>
#include <mutex>
#include <queue>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>
#include <vector>
#include <zmq.hpp>
#include "pool.h"
#include "protocol.h"
#include "request.h"
#include "routing.h"

#if ZMQ_VERSION < ZMQ_MAKE_VERSION (4, 3, 0)
#error "ZMQ >= 4.3.0 required"
#endif

namespace termgate {

using namespace std::literals;

/// Logging levels passed into the Logger.  (Note that trace does nothing more than debug in a
/// release build).
enum class LogLevel { fatal, error, warn, info, debug, trace };

/// Counters reported by the `stats` admin command.
struct Stats {
    uint64_t total_dispatched = 0; ///< Lifetime number of requests that were handed a leased asset
    int idle_workers = 0;          ///< Idle assets across all pools, as reported by the PoolManager
    uint64_t pending = 0;          ///< Requests currently waiting in the pending queue
};

/**
 * The gateway: listens for framed term requests on a TCP port, routes them by module to worker
 * pools and runs each one on a leased asset.  All queueing decisions are made by a single proxy
 * thread; connection handling and worker calls happen on their own threads and only talk to the
 * proxy through control messages.
 */
class Gateway {

private:

    /// The zmq context used for the inproc control sockets
    zmq::context_t context;

    /// A unique id for this Gateway instance, assigned in a thread-safe manner during construction.
    const int object_id;

    /// The thread running the admission controller
    std::thread proxy_thread;

    /// The thread accepting incoming TCP connections
    std::thread listener_thread;

    /// Will be true (and is guarded by a mutex) if the proxy thread is quitting; guards against new
    /// control sockets from threads trying to talk to the proxy thread.
    bool proxy_shutting_down = false;

    /// Locked once per thread the first time it calls get_control_socket(), and by the proxy thread
    /// when it shuts down.
    std::mutex control_sockets_mutex;

    /// Called to obtain a "command" socket that attaches to `command` to talk to the proxy thread
    /// from a long-lived thread (e.g. the thread owning the Gateway).  This socket is unique per
    /// thread and Gateway instance.
    zmq::socket_t& get_control_socket();

    /// Creates a new, unshared socket connected to the proxy thread.  Used by the short-lived
    /// connection and task threads.
    zmq::socket_t connect_control();

    /// Stores all of the sockets created in different threads via `get_control_socket`.
    std::unordered_map<std::thread::id, std::unique_ptr<zmq::socket_t>> control_sockets;

public:

    /// Called to write a log message.  This will only be called if the `level` is >= the current
    /// Gateway object log level.  Takes four arguments: the log level of the message, the filename
    /// and line number where the log message was invoked, and the log message itself.
    using Logger = std::function<void(LogLevel level, const char* file, int line, std::string msg)>;

    /// Called, on the connection's thread, with any action request whose module is not served by a
    /// worker pool.  The handler takes ownership of the request (and thus of its connection).
    using NativeHandler = std::function<void(Request request)>;

    /// How many times to try binding the listening socket before giving up.
    int LISTEN_RETRIES = 500;

    /// How long to wait between attempts to bind the listening socket.
    std::chrono::milliseconds LISTEN_RETRY_DELAY = 5s;

    /// The largest frame we accept from a client; larger frames close the connection.
    uint32_t MAX_FRAME_SIZE = 64 * 1024 * 1024;

    /// How often blocked accept/read calls wake up to check whether the gateway is shutting down.
    std::chrono::milliseconds POLL_INTERVAL = 100ms;

    /// How long an admin `stats` request waits for the proxy thread to answer.
    std::chrono::milliseconds STATS_TIMEOUT = 5s;

    /// The IPv4 address to listen on.
    std::string BIND_ADDRESS = "0.0.0.0";

    /**
     * Gateway constructor.  This constructs the object but does not start it; you will typically
     * want to call `listen()` and `add_pool()` before calling `start()`.
     *
     * @param pools the pool manager that leases worker assets.
     *
     * @param transport performs the call of an action on a leased asset.
     *
     * @param logger a function or callable object that will be called with log messages.
     *
     * @param level the initial log level; defaults to warn.  Can be changed later via
     * `log_level(...)`.
     */
    Gateway(std::shared_ptr<PoolManager> pools,
            std::shared_ptr<WorkerTransport> transport,
            Logger logger = [](LogLevel, const char*, int, std::string) { },
            LogLevel level = LogLevel::warn);

    /**
     * Destructor; stops accepting connections, waits for connection threads and running tasks to
     * finish, drops any still-queued requests and stops the proxy thread.
     */
    ~Gateway();

    /// Sets the log level of the Gateway object.
    void log_level(LogLevel level);

    /// Gets the log level of the Gateway object.
    LogLevel log_level() const;

    /// Sets the TCP port to listen on.  0 (the default) picks a free port; see `port()`.  Cannot be
    /// called after `start()`.
    void listen(uint16_t port);

    /// Adds a worker pool and the modules it serves.  If a module is claimed by more than one pool,
    /// the pool added first serves it.  Cannot be called after `start()`.
    void add_pool(PoolConfig config);

    /// Sets the handler for action requests whose module no pool serves.  Without a handler such
    /// requests are dropped and their connection closed without a response.  Cannot be called
    /// after `start()`.
    void set_native_handler(NativeHandler handler);

    /**
     * Binds the listening socket (retrying up to LISTEN_RETRIES times, waiting LISTEN_RETRY_DELAY
     * between attempts), starts the proxy thread and starts accepting connections.  Throws
     * std::runtime_error if the socket cannot be bound.
     */
    void start();

    /// Returns the port we are listening on; only valid after `start()`.
    uint16_t port() const { return bound_port; }

    /// Returns the current admission counters.  Thread safe; only valid after `start()`.
    Stats stats();

    /// Returns the routing table built from the configured pools during `start()`.
    const RoutingTable& routing_table() const { return routing; }

    /// Internal logging function; use TG_LOG instead.
    template <typename... T>
    void log(LogLevel lvl, const char* filename, int line, const T&... stuff);

private:

    std::atomic<LogLevel> log_lvl;
    Logger logger;

    std::shared_ptr<PoolManager> pools;
    std::shared_ptr<WorkerTransport> transport;

    /// Pools added via add_pool(); folded into `routing` by start().
    std::vector<PoolConfig> pool_configs;
    RoutingTable routing;
    NativeHandler native_handler;

    uint16_t listen_port = 0;
    std::atomic<uint16_t> bound_port{0};
    int listen_fd = -1;

    /// Set by the destructor to stop the listener and connection threads.
    std::atomic<bool> stopping{false};

    /// Connection threads are detached; we count them so that destruction can wait for them.
    std::mutex handlers_mutex;
    std::condition_variable handlers_cv;
    int active_handlers = 0;

    /// Binds the listening socket, retrying as configured.  Returns the fd.
    int try_listen();

    /// The listener thread main loop
    void listener_loop();

    /// Starts a connection thread for a newly accepted connection.
    void spawn_handler(Connection conn);

    /// Reads and classifies the frames of one connection (runs in the connection's own thread).
    void handle_connection(Connection conn);

    /// Routes a decoded action request: to the native handler, or to the proxy thread.
    void dispatch_request(Request request, const Term& term);

    /// Answers an `__admin__` call inline and closes the connection.
    void process_admin(Connection& conn, const AdminCall& admin);

    /// Asks the proxy thread for its counters over `control`.
    Stats request_stats(zmq::socket_t& control);

    ////////////////////////////////////////////////////////////////////////////////////////////
    // Proxy-thread-only members.  Nothing below may be touched from any other thread once the
    // proxy thread is running.

    /// ROUTER socket on which the proxy receives control messages from every other thread
    zmq::socket_t command;

    /// Requests waiting for an asset, in arrival (or requeue) order, across all pools
    std::queue<Request> pending;

    /// Lifetime count of successful leases
    uint64_t total_dispatched = 0;

    /// Running task threads, keyed by task id; joined when the task reports FREED.
    std::unordered_map<uint64_t, std::thread> tasks;
    uint64_t next_task_id = 0;

    /// True once QUIT has been received; we stop admitting and wait for `tasks` to drain.
    bool quitting = false;

    /// The proxy thread main loop
    void proxy_loop();

    /// Handles one control message: [route, COMMAND] or [route, COMMAND, data]
    void proxy_control_message(std::vector<zmq::message_t>& parts);

    /// NEW: admission of a freshly decoded extern-routed request
    void proxy_new_request(Request request);

    /// Attempts to lease an asset for `request`; starts a task on success, queues it otherwise.
    void proxy_try_lease(Request request);

    /// FREED: a task has returned its asset
    void proxy_asset_freed(uint64_t task_id);

    /// Pops the head of the pending queue (if any) and retries its admission.
    void proxy_service_queue();

    /// Closes down the proxy thread's sockets after all tasks have finished.
    void proxy_quit();

    /// Body of a task thread: runs `request` on `asset`, then releases the asset, signals FREED and
    /// closes the connection, whatever happened.
    void task_thread(uint64_t id, Request request, Asset asset);
};

// When log messages are invoked we strip out anything before this in the filename:
constexpr std::string_view LOG_PREFIX{"termgate/", 9};
inline std::string_view trim_log_filename(std::string_view local_file) {
    auto chop = local_file.rfind(LOG_PREFIX);
    if (chop != local_file.npos)
        local_file.remove_prefix(chop);
    return local_file;
}

template <typename... T>
void Gateway::log(LogLevel lvl, const char* file, int line, const T&... stuff) {
    if (log_level() < lvl)
        return;

    std::ostringstream os;
    (os << ... << stuff);
    logger(lvl, trim_log_filename(file).data(), line, os.str());
}

std::ostream& operator<<(std::ostream& os, LogLevel lvl);

}

// vim:sw=4:et
