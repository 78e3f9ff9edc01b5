#pragma once

#include "service.hpp"

#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

namespace runbox::mcp {

    inline constexpr auto protocol_version = "2024-11-05"sv;
    inline constexpr auto execute_tool_name = "execute_code"sv;

    // Handles one JSON-RPC message; nullopt for notifications.
    std::optional<std::string> handle_message(const execution_service& service, std::string_view line);

    // Newline-delimited JSON-RPC 2.0 over the given streams until EOF.
    int run_server(const execution_service& service, std::istream& in, std::ostream& out);

}  // namespace runbox::mcp
