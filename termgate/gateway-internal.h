#pragma once
#include "gateway.h"
#include <cassert>

// Inside some method:
//     TG_LOG(warn, "bad ", 42, " stuff");
//
// (The "this->" is here to work around gcc bugginess when called in a `this`-capturing lambda.)
#define TG_LOG(level, ...) this->log(LogLevel::level, __FILE__, __LINE__, __VA_ARGS__)

#ifndef NDEBUG
// Same as TG_LOG(trace, ...) when not doing a release build; nothing under a release build.
#  define TG_TRACE(...) this->log(LogLevel::trace, __FILE__, __LINE__, __VA_ARGS__)
#else
#  define TG_TRACE(...)
#endif

namespace termgate {

constexpr char ADDR_COMMAND[] = "inproc://tg-command";

/// Destructor for create_message(std::string&&) that zmq calls when it's done with the message.
extern "C" inline void message_buffer_destroy(void*, void* hint) {
    delete reinterpret_cast<std::string*>(hint);
}

/// Creates a message without needing to reallocate the provided string data
inline zmq::message_t create_message(std::string&& data) {
    auto* buffer = new std::string(std::move(data));
    return zmq::message_t{&(*buffer)[0], buffer->size(), message_buffer_destroy, buffer};
}

/// Create a message copying from a string_view
inline zmq::message_t create_message(std::string_view data) {
    return zmq::message_t{data.begin(), data.end()};
}

// Receive all the parts of a single message from the given socket.  Returns true if a message was
// received, false if called with flags=zmq::recv_flags::dontwait and no message was available (or
// if the socket's receive timeout expired).
inline bool recv_message_parts(zmq::socket_t& sock, std::vector<zmq::message_t>& parts, const zmq::recv_flags flags = zmq::recv_flags::none) {
    do {
        zmq::message_t msg;
        if (!sock.recv(msg, flags))
            return false;
        parts.push_back(std::move(msg));
    } while (parts.back().more());
    return true;
}

// Returns a string view of the given message data.  It's the caller's responsibility to keep the
// referenced message alive.  If you want a std::string instead just call `m.to_string()`
inline std::string_view view(const zmq::message_t& m) {
    return {m.data<char>(), m.size()};
}

namespace detail {

/// Takes an rvalue reference, moves it into a new instance then returns a uintptr_t value
/// containing the pointer to be serialized to pass (via zmq inproc) between threads.  The recipient
/// must call `deserialize_object<T>()` exactly once to take it back.
template <typename T>
uintptr_t serialize_object(T&& obj) {
    static_assert(std::is_rvalue_reference<decltype(obj)>::value, "serialize_object must be given an rvalue reference");
    auto* ptr = new T{std::forward<T>(obj)};
    return reinterpret_cast<uintptr_t>(ptr);
}

/// Takes a uintptr_t as produced by serialize_object and the type, converts the serialized value
/// back into a pointer, moves it into a new instance (to be returned) and destroys the
/// intermediate.
template <typename T> T deserialize_object(uintptr_t ptrval) {
    auto* ptr = reinterpret_cast<T*>(ptrval);
    T ret{std::move(*ptr)};
    delete ptr;
    return ret;
}

// Sends a control message to the proxy consisting of a single command code with an optional data
// part (the data frame is omitted if empty).
void send_control(zmq::socket_t& sock, std::string_view cmd, std::string data = {});

} // namespace detail

/// Sends a control message to a specific destination by prefixing the identity then appending the
/// command and optional data (if non-empty).  (This is needed when replying on a router socket,
/// i.e. inside the proxy thread).
inline void route_control(zmq::socket_t& sock, std::string_view identity, std::string_view cmd, const std::string& data = {}) {
    sock.send(create_message(identity), zmq::send_flags::sndmore);
    detail::send_control(sock, cmd, data);
}

/// Sets the name of the calling thread, as shown by debuggers and `top -H`; truncated to 15
/// characters.
void set_thread_name(std::string name);

}
