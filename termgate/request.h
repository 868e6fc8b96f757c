#pragma once
#include <optional>
#include <string>
#include "connection.h"

namespace termgate {

/// One client request.  Move-only: it travels from the connection thread to the proxy thread (and
/// possibly through the pending queue) to a task thread, taking its connection with it.  Dropping a
/// Request closes its connection.
struct Request {
    Connection conn;
    std::optional<std::string> info; ///< The raw payload of the latest `info` frame, if any
    std::string action;              ///< The raw payload of the call/cast frame
    std::string pool;                ///< The pool the action's module routes to

    Request() = default;
    explicit Request(Connection c) : conn{std::move(c)} {}
    Request(Request&&) = default;
    Request& operator=(Request&&) = default;
};

}
