#pragma once

#include "backend.hpp"
#include "errors.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace runbox {

    struct error_location {
        size_t raw_line{};
        std::optional<size_t> raw_column{};
        size_t adjusted_line{};
        std::optional<size_t> adjusted_column{};
        // trimmed text of the user's line; empty when out of range
        std::string source_line_text{};
    };

    struct mapped_error {
        error_kind kind{error_kind::runtime};
        // raw error name as reported by the runtime ("TypeError", "ZeroDivisionError", ...)
        std::string name{"Error"};
        // message without location decorations
        std::string message{};
        // final user-facing message
        std::string display{};
        std::optional<error_location> location{};
        std::string stack{};
        // sandbox failures replace stdout with the cleaned error text
        std::optional<std::string> replacement_stdout{};
    };

    // Human label for a raw error name: "SyntaxError" -> "Syntax Error",
    // "TypeError" -> "Type Error", "ReferenceError" -> "Reference Error",
    // anything else unchanged.
    std::string error_label(std::string_view name);

    std::optional<std::string_view> syntax_hint(std::string_view message);

    bool is_syntax_error_name(std::string_view name);

    // `<Label>: Line <n>: `<text>` - <message>`; the label is dropped for a
    // plain Error or when already present, the line part without a location.
    std::string compose_message(
            std::string_view name, std::string_view message, const std::optional<error_location>& location);

    // Keeps frames of the generated script and user-authored lines; drops
    // engine-internal frames; normalizes frame indentation.
    std::string clean_stack(std::string_view stack, std::string_view script_name);

    // Strips directory prefixes in front of `script_name` (including file:// URLs).
    std::string strip_script_paths(std::string_view text, std::string_view script_name);

    // Builds a location from a raw line of the generated program, or nullopt
    // when the line falls outside the user body.
    std::optional<error_location> locate(
            const packaged_code& code, size_t raw_line, std::optional<size_t> raw_column);

    // Location on the last user line, used for syntax errors detected past the body.
    error_location clamp_to_last_line(const packaged_code& code, size_t raw_line);

    mapped_error map_isolate_error(const raw_outcome& raw, const packaged_code& code);
    mapped_error map_sandbox_error(const raw_outcome& raw, const packaged_code& code);

    // Entry point for every failed outcome, including timeouts and cancellations.
    mapped_error map_error(const raw_outcome& raw, const packaged_code& code, std::chrono::milliseconds timeout);

}  // namespace runbox
