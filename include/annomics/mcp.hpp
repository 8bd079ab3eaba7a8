#pragma once

#include "tools.hpp"

#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

namespace annomics::mcp {

    inline constexpr auto protocol_version = "2024-11-05"sv;
    inline constexpr auto server_name = "annomics-mcp"sv;
    inline constexpr auto server_version = "1.0.0"sv;

    // Handles one newline-delimited JSON-RPC message. Returns the response line, or
    // nullopt for notifications and blank lines.
    std::optional<std::string> handle_message(const tool_registry& registry, std::string_view line);

    // Serves requests from `in` until end of input, one response line per request on `out`.
    int run_mcp_server(const tool_registry& registry, std::istream& in, std::ostream& out);

}  // namespace annomics::mcp
