#include "connection.h"
#include <array>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <system_error>

extern "C" {
#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>
}

namespace termgate {

namespace {

[[noreturn]] void throw_errno(const std::string& what) {
    throw std::system_error{errno, std::generic_category(), what};
}

sockaddr_in make_addr(const std::string& address, uint16_t port) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (inet_pton(AF_INET, address.c_str(), &addr.sin_addr) != 1)
        throw std::invalid_argument{"Invalid IPv4 address `" + address + "'"};
    return addr;
}

} // anonymous namespace

Connection::Connection(int fd, std::string remote) : fd_{fd}, remote_{std::move(remote)} {}

Connection::~Connection() { close(); }

Connection::Connection(Connection&& o) noexcept : fd_{o.fd_}, remote_{std::move(o.remote_)} {
    o.fd_ = -1;
}

Connection& Connection::operator=(Connection&& o) noexcept {
    if (this != &o) {
        close();
        fd_ = o.fd_;
        remote_ = std::move(o.remote_);
        o.fd_ = -1;
    }
    return *this;
}

void Connection::close() {
    if (fd_ == -1)
        return;
    ::close(fd_);
    fd_ = -1;
}

bool Connection::read_exact(char* buf, size_t len, const std::atomic<bool>& stop, std::chrono::milliseconds poll_interval) {
    size_t got = 0;
    while (got < len) {
        if (stop)
            return false;
        pollfd p{fd_, POLLIN, 0};
        int r = ::poll(&p, 1, static_cast<int>(poll_interval.count()));
        if (r == 0)
            continue;
        if (r == -1) {
            if (errno == EINTR) continue;
            throw_errno("poll failed");
        }
        ssize_t n = ::recv(fd_, buf + got, len - got, 0);
        if (n == 0) {
            if (got == 0)
                return false;
            throw std::runtime_error{"connection closed after " + std::to_string(got) + " of " + std::to_string(len) + " bytes"};
        }
        if (n == -1) {
            if (errno == EINTR || errno == EAGAIN) continue;
            throw_errno("recv failed");
        }
        got += static_cast<size_t>(n);
    }
    return true;
}

std::optional<std::string> Connection::read_frame(uint32_t max_size, const std::atomic<bool>& stop, std::chrono::milliseconds poll_interval) {
    if (fd_ == -1)
        return std::nullopt;
    std::array<unsigned char, 4> prefix;
    if (!read_exact(reinterpret_cast<char*>(prefix.data()), prefix.size(), stop, poll_interval))
        return std::nullopt;
    uint32_t size = uint32_t{prefix[0]} << 24 | uint32_t{prefix[1]} << 16 | uint32_t{prefix[2]} << 8 | uint32_t{prefix[3]};
    if (size > max_size)
        throw std::runtime_error{"frame of " + std::to_string(size) + " bytes exceeds the " + std::to_string(max_size) + " byte limit"};

    std::string data(size, '\0');
    if (size > 0 && !read_exact(data.data(), size, stop, poll_interval)) {
        if (stop)
            return std::nullopt;
        throw std::runtime_error{"connection closed before frame body"};
    }
    return data;
}

bool Connection::send_frame(std::string_view data) {
    if (fd_ == -1 || data.size() > UINT32_MAX)
        return false;
    uint32_t size = static_cast<uint32_t>(data.size());
    std::string buf;
    buf.reserve(4 + data.size());
    buf += static_cast<char>(size >> 24 & 0xff);
    buf += static_cast<char>(size >> 16 & 0xff);
    buf += static_cast<char>(size >> 8 & 0xff);
    buf += static_cast<char>(size & 0xff);
    buf += data;

    size_t sent = 0;
    while (sent < buf.size()) {
        ssize_t n = ::send(fd_, buf.data() + sent, buf.size() - sent, MSG_NOSIGNAL);
        if (n == -1) {
            if (errno == EINTR) continue;
            return false;
        }
        sent += static_cast<size_t>(n);
    }
    return true;
}

int listen_tcp(const std::string& address, uint16_t port, int backlog) {
    auto addr = make_addr(address, port);
    int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd == -1)
        throw_errno("socket failed");
    int one = 1;
    if (::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one)) == -1 ||
            ::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == -1 ||
            ::listen(fd, backlog) == -1) {
        int err = errno;
        ::close(fd);
        throw std::system_error{err, std::generic_category(), "unable to listen on " + address + ":" + std::to_string(port)};
    }
    return fd;
}

uint16_t local_port(int fd) {
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) == -1)
        throw_errno("getsockname failed");
    return ntohs(addr.sin_port);
}

Connection connect_tcp(const std::string& host, uint16_t port) {
    auto addr = make_addr(host, port);
    int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd == -1)
        throw_errno("socket failed");
    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == -1) {
        int err = errno;
        ::close(fd);
        throw std::system_error{err, std::generic_category(), "unable to connect to " + host + ":" + std::to_string(port)};
    }
    return Connection{fd, host + ":" + std::to_string(port)};
}

}
