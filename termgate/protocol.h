#pragma once
#include <string>
#include <string_view>
#include <variant>

namespace termgate {

/// Module name that addresses the gateway itself rather than a worker pool.
inline constexpr std::string_view ADMIN_MODULE = "__admin__";

/// A synchronous request: `["call", Mod, Fun, Args]`.  `args` holds the raw bt-encoded argument
/// value, untouched.
struct Call {
    std::string module;
    std::string function;
    std::string args;
};

/// A fire-and-forget request: `["cast", Mod, Fun, Args]`.
struct Cast {
    std::string module;
    std::string function;
    std::string args;
};

/// A metadata frame sent ahead of the real request: `["info", Command, Args]`.
struct Info {
    std::string command;
    std::string args;
};

/// A gateway administration command: `["call", "__admin__", Fun, Args]`.
struct AdminCall {
    std::string function;
    std::string args;
};

/// Inbound terms, decoded once at the connection boundary.
using Term = std::variant<Call, Cast, Info, AdminCall>;

/// Decodes a frame payload into a Term.  Throws oxenc::bt_deserialize_invalid if the payload is
/// not a bt-encoded list of one of the accepted shapes.
Term decode_term(std::string_view data);

/// Encodes a Term.  `args` values are embedded as-is and must already be bt-encoded; an empty
/// `args` is encoded as an empty list.
std::string encode_term(const Term& term);

/// Encodes the `["reply", Payload]` term used for admin responses.
std::string encode_reply(std::string_view payload);

/// Encodes the `["noreply"]` term used to acknowledge a cast.
std::string encode_noreply();

/// Returns the module an action term (Call or Cast) targets.  Throws std::invalid_argument for any
/// other term.
const std::string& action_module(const Term& term);

}
