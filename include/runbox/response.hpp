#pragma once

#include "backend.hpp"
#include "errors.hpp"
#include "provenance.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace runbox {

    struct execution_success {
        value result{};
        std::string stdout_text{};
        int64_t execution_time_ms{};
    };

    struct execution_failure {
        error_kind kind{error_kind::runtime};
        // user-facing message, location-enriched when one was recovered
        std::string message{};
        // raw error name reported as debug.errorType
        std::string error_type{};
        std::optional<size_t> line{};
        std::optional<size_t> column{};
        std::optional<std::string> line_content{};
        std::optional<std::string> stack{};
        std::string stdout_text{};
        int64_t execution_time_ms{};
    };

    using execution_outcome = std::variant<execution_success, execution_failure>;

    inline bool succeeded(const execution_outcome& outcome) {
        return std::holds_alternative<execution_success>(outcome);
    }

    // Removes exactly one trailing newline.
    std::string clean_stdout(std::string_view text);

    execution_success make_success(const raw_outcome& raw);

    execution_failure make_failure(const mapped_error& mapped, const raw_outcome& raw);

    // Failures raised before anything ran (validation, authorization, configuration).
    execution_failure make_failure(error_kind kind, std::string message, int64_t execution_time_ms = 0);

    // `{success, error?, output{result, stdout, executionTime}, debug?}`
    std::string render_response(const execution_outcome& outcome, output_mode mode = output_mode::compact);

}  // namespace runbox
