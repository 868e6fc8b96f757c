#pragma once

#include <fmt/format.h>
#include "gateway.h"

template <>
struct fmt::formatter<termgate::LogLevel> : fmt::formatter<std::string> {
  auto format(termgate::LogLevel v, format_context& ctx) const {
    std::ostringstream os;
    os << v;
    return formatter<std::string>::format(os.str(), ctx);
  }
};
template <>
struct fmt::formatter<termgate::Asset> : fmt::formatter<std::string> {
  auto format(const termgate::Asset& a, format_context& ctx) const {
    return formatter<std::string>::format(
        fmt::format("{}#{}", a.endpoint, a.token), ctx);
  }
};
