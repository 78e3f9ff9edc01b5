#pragma once

#include "imports.hpp"
#include "request.hpp"
#include "resolver.hpp"

#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace runbox {

    enum class backend_kind : uint8_t { isolate, sandbox };

    inline constexpr std::string_view to_string(backend_kind kind) {
        switch (kind) {
            case backend_kind::isolate:
                return "isolate"sv;
            case backend_kind::sandbox:
                return "sandbox"sv;
        }
        return "isolate"sv;
    }

    enum class module_format : uint8_t { script, commonjs, esm, python };

    inline constexpr std::string_view to_string(module_format format) {
        switch (format) {
            case module_format::script:
                return "script"sv;
            case module_format::commonjs:
                return "commonjs"sv;
            case module_format::esm:
                return "esm"sv;
            case module_format::python:
                return "python"sv;
        }
        return "script"sv;
    }

    inline constexpr auto result_sentinel = "__SIM_RESULT__="sv;
    // the harness starts the result line with its own newline so it never
    // shares a line with unterminated user output
    inline constexpr auto result_marker = "\n__SIM_RESULT__="sv;
    inline constexpr size_t max_result_bytes = 16U * 1024U * 1024U;
    inline constexpr auto isolate_script_name = "user-function.js"sv;

    // Python always needs the sandbox; JavaScript only with imports or
    // require(). A trusted custom tool written in JavaScript stays in the
    // isolate. Throws execution_error(configuration) when the sandbox is
    // required but disabled.
    backend_kind select_backend(language lang, bool has_imports, bool is_custom_tool, bool sandbox_enabled);

    struct packaged_code {
        std::string source{};
        language lang{language::javascript};
        backend_kind backend{backend_kind::isolate};
        module_format format{module_format::script};
        std::string script_name{};

        // newline-terminated lines emitted before the first body line
        size_t prologue_line_count{};
        // harness lines inside the prologue (function/try openers)
        size_t wrapper_line_count{};
        // custom-tool `const k = params.k;` lines inside the prologue
        size_t param_line_count{};
        size_t body_line_count{};
        std::string body_indent{};

        // resolved snippet before wrapping; source of error line text
        std::string user_code{};

        // globals installed by the isolate backend
        value_object params{};
        std::map<std::string, std::string, std::less<>> env_vars{};
        std::vector<context_binding> bindings{};

        size_t body_start_line() const { return prologue_line_count + 1U; }
        size_t body_end_line() const { return prologue_line_count + body_line_count; }
    };

    packaged_code package_code(
            const resolved_code& resolved,
            const dependency_report& deps,
            const execution_request& req,
            backend_kind backend);

    // Body lines recovered from `packaged.source` using its line counts,
    // with the body indent removed.
    std::string unpackage(const packaged_code& packaged);

    struct harness_output {
        std::optional<value> result{};
        // stdout with the result line removed
        std::string stdout_text{};
        bool stdout_truncated{false};
        // the result line was longer than the result limit and was dropped
        bool result_truncated{false};
    };

    // Incremental splitter for sandbox stdout. User output is kept up to
    // `stdout_limit` bytes; the harness result line is collected separately
    // so a capped stdout never loses the result. When several result lines
    // appear the last one wins and earlier ones are returned to stdout.
    class harness_stream {
      public:
        explicit harness_stream(
                size_t stdout_limit = std::numeric_limits<size_t>::max(), size_t result_limit = max_result_bytes);

        void append(std::string_view chunk);

        harness_output finish();

      private:
        void emit_stdout(std::string_view text);
        void release_held_result();

        size_t stdout_limit_;
        size_t result_limit_;
        std::string pending_{};
        std::string result_{};
        bool collecting_result_{false};
        bool has_result_{false};
        harness_output out_{};
    };

    // Splits the sandbox harness result line out of captured stdout.
    harness_output split_harness_output(std::string_view stdout_text);

}  // namespace runbox
