#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace termgate {

/// Owns one TCP socket carrying length-framed messages (a 4-byte big-endian length followed by
/// that many bytes).  The socket is closed on destruction; `close()` may be called any number of
/// times.  A Connection is used by only one thread at a time: it moves from the connection thread
/// through the proxy to the task thread along with its Request.
class Connection {
public:
    Connection() = default;
    Connection(int fd, std::string remote);
    ~Connection();

    Connection(Connection&& o) noexcept;
    Connection& operator=(Connection&& o) noexcept;
    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    /// Reads one frame.  Returns std::nullopt if the remote closed the connection before the first
    /// byte of a frame, or if `stop` became true while waiting.  Throws std::runtime_error on a
    /// frame longer than `max_size`, on a connection closed mid-frame, or on a socket error.
    std::optional<std::string> read_frame(uint32_t max_size, const std::atomic<bool>& stop,
            std::chrono::milliseconds poll_interval = std::chrono::milliseconds{100});

    /// Writes `data` as one frame.  Returns false if the write failed (typically because the remote
    /// has gone away); never throws.
    bool send_frame(std::string_view data);

    /// Closes the socket, if still open.
    void close();

    bool closed() const { return fd_ == -1; }
    int fd() const { return fd_; }

    /// The peer address as "ip:port", for logging.
    const std::string& remote() const { return remote_; }

private:
    // Returns false on EOF before any byte was read, or if stopped.
    bool read_exact(char* buf, size_t len, const std::atomic<bool>& stop, std::chrono::milliseconds poll_interval);

    int fd_ = -1;
    std::string remote_;
};

/// Creates a listening TCP socket bound to `address`:`port` (port 0 picks an ephemeral port).
/// Throws std::system_error on failure.
int listen_tcp(const std::string& address, uint16_t port, int backlog = 128);

/// Returns the local port a bound socket is listening on.
uint16_t local_port(int fd);

/// Opens a client connection to `host`:`port` (numeric IPv4 address).  Throws std::system_error on
/// failure.
Connection connect_tcp(const std::string& host, uint16_t port);

}
