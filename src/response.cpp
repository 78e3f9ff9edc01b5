#include "runbox/response.hpp"

#include <glaze/glaze.hpp>

namespace runbox {

    namespace detail {

        struct wire_output {
            glz::raw_json result{"null"};
            std::string stdout_text{};
            int64_t execution_time{};
            struct glaze {
                using T = wire_output;
                static constexpr auto value =
                        glz::object("result", &T::result, "stdout", &T::stdout_text, "executionTime", &T::execution_time);
            };
        };

        struct wire_debug {
            std::optional<size_t> line{};
            std::optional<size_t> column{};
            std::string error_type{};
            std::optional<std::string> line_content{};
            std::optional<std::string> stack{};
            struct glaze {
                using T = wire_debug;
                static constexpr auto value = glz::object(
                        "line",
                        &T::line,
                        "column",
                        &T::column,
                        "errorType",
                        &T::error_type,
                        "lineContent",
                        &T::line_content,
                        "stack",
                        &T::stack);
            };
        };

        struct wire_response {
            bool success{};
            std::optional<std::string> error{};
            wire_output output{};
            std::optional<wire_debug> debug{};
            struct glaze {
                using T = wire_response;
                static constexpr auto value =
                        glz::object("success", &T::success, "error", &T::error, "output", &T::output, "debug", &T::debug);
            };
        };

        static wire_response to_wire(const execution_success& s) {
            wire_response resp{};
            resp.success = true;
            resp.output.result = glz::raw_json{to_json(s.result)};
            resp.output.stdout_text = s.stdout_text;
            resp.output.execution_time = s.execution_time_ms;
            return resp;
        }

        static wire_response to_wire(const execution_failure& f) {
            wire_response resp{};
            resp.success = false;
            resp.error = f.message;
            resp.output.stdout_text = f.stdout_text;
            resp.output.execution_time = f.execution_time_ms;
            resp.debug = wire_debug{
                    .line = f.line,
                    .column = f.column,
                    .error_type = f.error_type,
                    .line_content = f.line_content,
                    .stack = f.stack,
            };
            return resp;
        }

    }  // namespace detail

    std::string clean_stdout(std::string_view text) {
        if (text.ends_with('\n')) {
            text.remove_suffix(1U);
        }
        return std::string{text};
    }

    execution_success make_success(const raw_outcome& raw) {
        return execution_success{
                .result = raw.result,
                .stdout_text = clean_stdout(raw.stdout_text),
                .execution_time_ms = raw.elapsed_ms,
        };
    }

    execution_failure make_failure(const mapped_error& mapped, const raw_outcome& raw) {
        execution_failure f{};
        f.kind = mapped.kind;
        f.message = mapped.display.empty() ? mapped.message : mapped.display;
        f.error_type = mapped.name;
        if (mapped.location) {
            f.line = mapped.location->adjusted_line;
            f.column = mapped.location->adjusted_column;
            if (!mapped.location->source_line_text.empty()) {
                f.line_content = mapped.location->source_line_text;
            }
        }
        if (!mapped.stack.empty()) {
            f.stack = mapped.stack;
        }
        f.stdout_text = clean_stdout(mapped.replacement_stdout ? *mapped.replacement_stdout : raw.stdout_text);
        f.execution_time_ms = raw.elapsed_ms;
        return f;
    }

    execution_failure make_failure(error_kind kind, std::string message, int64_t execution_time_ms) {
        execution_failure f{};
        f.kind = kind;
        f.message = std::move(message);
        f.error_type = std::string{to_string(kind)};
        f.execution_time_ms = execution_time_ms;
        return f;
    }

    std::string render_response(const execution_outcome& outcome, output_mode mode) {
        auto wire = std::visit([](const auto& o) { return detail::to_wire(o); }, outcome);
        std::string buffer{};
        if (mode == output_mode::pretty) {
            (void)glz::write<glz::opts{.prettify = true}>(wire, buffer);
        }
        else {
            (void)glz::write_json(wire, buffer);
        }
        return buffer;
    }

}  // namespace runbox
