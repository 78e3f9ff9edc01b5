#include "utils.hpp"

namespace runbox::test {
    using namespace std::string_view_literals;

    namespace detail {
        static packaged_code package_for(const execution_request& req, backend_kind backend) {
            auto resolved = resolve_references(req.code, req);
            dependency_report deps{};
            if (req.lang == language::javascript) {
                deps = analyze_dependencies(resolved.code);
            }
            return package_code(resolved, deps, req, backend);
        }

        static raw_outcome failed(std::string name, std::string message) {
            raw_outcome raw{};
            raw.ok = false;
            raw.error_name = std::move(name);
            raw.error_message = std::move(message);
            return raw;
        }
    }  // namespace detail

    TEST_CASE("006: error labels and hints", "[006][provenance]") {
        CHECK(error_label("SyntaxError"sv) == "Syntax Error");
        CHECK(error_label("TypeError"sv) == "Type Error");
        CHECK(error_label("ReferenceError"sv) == "Reference Error");
        CHECK(error_label("RangeError"sv) == "RangeError");

        CHECK(syntax_hint("Unexpected end of input"sv) == std::optional{"(Check for missing closing brackets or braces)"sv});
        CHECK(syntax_hint("'(' was never closed"sv) == std::optional{"(Check for missing closing brackets or braces)"sv});
        CHECK(syntax_hint("Invalid or unexpected token"sv) ==
              std::optional{"(Check for missing quotes, brackets, or semicolons)"sv});
        CHECK_FALSE(syntax_hint("x is not defined"sv).has_value());

        CHECK(is_syntax_error_name("IndentationError"sv));
        CHECK_FALSE(is_syntax_error_name("TypeError"sv));
    }

    TEST_CASE("006: composed messages", "[006][provenance]") {
        error_location loc{};
        loc.adjusted_line = 3U;
        loc.source_line_text = "foo();";

        CHECK(compose_message("TypeError"sv, "foo is not a function"sv, loc) ==
              "Type Error: Line 3: `foo();` - foo is not a function");
        CHECK(compose_message("Error"sv, "boom"sv, loc) == "Line 3: `foo();` - boom");
        CHECK(compose_message("ReferenceError"sv, "x is not defined"sv, std::nullopt) ==
              "Reference Error: x is not defined");
        // label already present
        CHECK(compose_message("SyntaxError"sv, "syntax error near x"sv, std::nullopt) == "syntax error near x");

        loc.source_line_text.clear();
        CHECK(compose_message(""sv, "oops"sv, loc) == "Line 3 - oops");
    }

    TEST_CASE("006: runtime error lines are reported relative to the snippet", "[006][provenance]") {
        packaged_code code{};
        code.backend = backend_kind::isolate;
        code.script_name = std::string{isolate_script_name};
        code.prologue_line_count = 4U;
        code.body_line_count = 5U;
        code.user_code = "const a = 1;\nconst b = 2;\n  undefinedFn(a, b);\nconst c = 3;\nreturn c;";

        auto raw = detail::failed("ReferenceError", "undefinedFn is not defined");
        raw.raw_line = 7U;
        raw.raw_column = 3U;
        raw.stack = "ReferenceError: undefinedFn is not defined\n    at user-function.js:7:3\n    at user-function.js:10:1";

        auto m = map_error(raw, code, std::chrono::milliseconds{1000});
        CHECK(m.kind == error_kind::runtime);
        REQUIRE(m.location.has_value());
        CHECK(m.location->adjusted_line == 3U);
        CHECK(m.location->adjusted_column == std::optional<size_t>{3U});
        CHECK(m.location->source_line_text == "undefinedFn(a, b);");
        CHECK(m.display == "Reference Error: Line 3: `undefinedFn(a, b);` - undefinedFn is not defined");
        CHECK(m.stack.find("user-function.js:7:3") != std::string::npos);
    }

    TEST_CASE("006: frames outside the snippet are skipped", "[006][provenance]") {
        auto code = detail::package_for(detail::make_request("const a = 1;\nthrow new Error('bad');"), backend_kind::isolate);
        REQUIRE(code.prologue_line_count == 2U);

        SECTION("first in-range stack frame is used") {
            auto raw = detail::failed("Error", "bad");
            raw.raw_line = 1U;
            raw.stack = "Error: bad\n    at user-function.js:1:1\n    at user-function.js:4:7";
            auto m = map_isolate_error(raw, code);
            REQUIRE(m.location.has_value());
            CHECK(m.location->adjusted_line == 2U);
            CHECK(m.display == "Line 2: `throw new Error('bad');` - bad");
        }

        SECTION("no usable frame leaves the message bare") {
            auto raw = detail::failed("TypeError", "x is not iterable");
            raw.raw_line = 1U;
            auto m = map_isolate_error(raw, code);
            CHECK_FALSE(m.location.has_value());
            CHECK(m.display == "Type Error: x is not iterable");
        }
    }

    TEST_CASE("006: isolate syntax error past the body is clamped", "[006][provenance]") {
        auto code = detail::package_for(detail::make_request("const x = {\n  a: 1,\nreturn x;\n\n"), backend_kind::isolate);

        auto raw = detail::failed("SyntaxError", "Unexpected end of input");
        raw.is_compile_error = true;
        raw.raw_line = code.body_end_line() + 3U;

        auto m = map_isolate_error(raw, code);
        CHECK(m.kind == error_kind::compile);
        REQUIRE(m.location.has_value());
        CHECK(m.location->adjusted_line == 3U);
        CHECK(m.location->adjusted_column == std::optional<size_t>{9U});
        CHECK(m.display ==
              "Syntax Error: Line 3: `return x;` - Unexpected end of input "
              "(Check for missing closing brackets or braces)");
    }

    TEST_CASE("006: syntax errors thrown at run time are runtime failures", "[006][provenance]") {
        auto code = detail::package_for(
                detail::make_request("const s = 'x';\nreturn JSON.parse(s);\nconst unused = 1;"), backend_kind::isolate);

        auto raw = detail::failed("SyntaxError", "Unexpected token 'x', \"x\" is not valid JSON");
        raw.raw_line = code.prologue_line_count + 2U;

        auto m = map_isolate_error(raw, code);
        CHECK(m.kind == error_kind::runtime);
        REQUIRE(m.location.has_value());
        CHECK(m.location->adjusted_line == 2U);
        CHECK(m.display.starts_with("Syntax Error: Line 2: `return JSON.parse(s);`"));
    }

    TEST_CASE("006: python tracebacks", "[006][provenance]") {
        SECTION("runtime error in the innermost user frame") {
            auto req = detail::make_request("def f(v):\n    return 1 / v\nreturn f(0)", language::python);
            auto code = detail::package_for(req, backend_kind::sandbox);
            REQUIRE(code.prologue_line_count == 4U);

            raw_outcome raw{};
            raw.error_text =
                    "Traceback (most recent call last):\n"
                    "  File \"/tmp/runbox/job-1/main.py\", line 9, in <module>\n"
                    "    __runbox_result__ = __runbox_main__()\n"
                    "  File \"/tmp/runbox/job-1/main.py\", line 7, in __runbox_main__\n"
                    "    return f(0)\n"
                    "  File \"/tmp/runbox/job-1/main.py\", line 6, in f\n"
                    "    return 1 / v\n"
                    "ZeroDivisionError: division by zero\n";

            auto m = map_error(raw, code, std::chrono::milliseconds{1000});
            CHECK(m.kind == error_kind::runtime);
            CHECK(m.name == "ZeroDivisionError");
            REQUIRE(m.location.has_value());
            CHECK(m.location->adjusted_line == 2U);
            CHECK(m.display == "ZeroDivisionError: Line 2: `return 1 / v` - division by zero");
            REQUIRE(m.replacement_stdout.has_value());
            CHECK(*m.replacement_stdout == "ZeroDivisionError: division by zero");
            CHECK(m.stack.find("/tmp/runbox") == std::string::npos);
            CHECK(m.stack.find("File \"main.py\", line 6") != std::string::npos);
        }

        SECTION("indentation error past the body") {
            auto req = detail::make_request("x = 1\nif x:", language::python);
            auto code = detail::package_for(req, backend_kind::sandbox);
            REQUIRE(code.body_end_line() == 6U);

            raw_outcome raw{};
            raw.error_text =
                    "  File \"/tmp/runbox/job-2/main.py\", line 7\n"
                    "    pass\n"
                    "    ^^^^\n"
                    "IndentationError: expected an indented block after 'if' statement on line 6\n";

            auto m = map_sandbox_error(raw, code);
            CHECK(m.kind == error_kind::compile);
            CHECK(m.message == "expected an indented block after 'if' statement on line 2");
            REQUIRE(m.location.has_value());
            CHECK(m.location->adjusted_line == 2U);
            CHECK(m.location->adjusted_column == std::optional<size_t>{5U});
            CHECK(m.location->source_line_text == "if x:");
        }

        SECTION("location suffixes are removed from syntax messages") {
            auto req = detail::make_request("x = (1,\ny = 2", language::python);
            auto code = detail::package_for(req, backend_kind::sandbox);

            raw_outcome raw{};
            raw.error_text =
                    "  File \"/tmp/runbox/job-3/main.py\", line 5\n"
                    "    x = (1,\n"
                    "        ^\n"
                    "SyntaxError: '(' was never closed (main.py, line 5)\n";

            auto m = map_sandbox_error(raw, code);
            CHECK(m.message == "'(' was never closed (Check for missing closing brackets or braces)");
            REQUIRE(m.location.has_value());
            CHECK(m.location->adjusted_line == 1U);
            CHECK(m.display.starts_with("Syntax Error: Line 1: `x = (1,` - '(' was never closed"));
        }
    }

    TEST_CASE("006: node stderr", "[006][provenance]") {
        auto req = detail::make_request("const a = 1;\nnull.foo;\nreturn a;");
        auto code = detail::package_for(req, backend_kind::sandbox);
        REQUIRE(code.format == module_format::commonjs);
        REQUIRE(code.prologue_line_count == 5U);

        SECTION("runtime error") {
            raw_outcome raw{};
            raw.error_text =
                    "/tmp/runbox/job-4/main.cjs:7\n"
                    "null.foo;\n"
                    "     ^\n"
                    "\n"
                    "TypeError: Cannot read properties of null (reading 'foo')\n"
                    "    at /tmp/runbox/job-4/main.cjs:7:6\n"
                    "    at Object.<anonymous> (/tmp/runbox/job-4/main.cjs:10:7)\n";

            auto m = map_sandbox_error(raw, code);
            CHECK(m.kind == error_kind::runtime);
            CHECK(m.name == "TypeError");
            REQUIRE(m.location.has_value());
            CHECK(m.location->adjusted_line == 2U);
            CHECK(m.display == "Type Error: Line 2: `null.foo;` - Cannot read properties of null (reading 'foo')");
            CHECK(*m.replacement_stdout == "TypeError: Cannot read properties of null (reading 'foo')");
            CHECK(m.stack.find("/tmp/runbox") == std::string::npos);
        }

        SECTION("transpiler style header") {
            raw_outcome raw{};
            raw.error_text = "SyntaxError: /tmp/runbox/job-5/main.cjs: Unexpected token. (7:4)\n";

            auto m = map_sandbox_error(raw, code);
            CHECK(m.kind == error_kind::compile);
            CHECK(m.message == "Unexpected token (Check for missing quotes, brackets, or semicolons)");
            REQUIRE(m.location.has_value());
            CHECK(m.location->adjusted_line == 2U);
            CHECK(m.location->adjusted_column == std::optional<size_t>{4U});
        }

        SECTION("thrown non-error value") {
            raw_outcome raw{};
            raw.stdout_text = "partial\nplain string thrown\n";
            raw.error_text = "node:internal/process/esm_loader:40\n      internalBinding('errors').triggerUncaughtException(\n";

            auto m = map_sandbox_error(raw, code);
            CHECK(m.message == "plain string thrown");
            CHECK_FALSE(m.location.has_value());
        }
    }

    TEST_CASE("006: timeouts, cancellation and unavailability", "[006][provenance]") {
        packaged_code code{};
        code.script_name = std::string{isolate_script_name};

        raw_outcome raw{};
        raw.timed_out = true;
        auto timeout = map_error(raw, code, std::chrono::milliseconds{100});
        CHECK(timeout.kind == error_kind::timeout);
        CHECK(timeout.display == "Execution timed out after 100ms");

        raw = raw_outcome{};
        raw.cancelled = true;
        auto cancelled = map_error(raw, code, std::chrono::milliseconds{100});
        CHECK(cancelled.kind == error_kind::runtime);
        CHECK(cancelled.display == "Execution was cancelled");

        raw = raw_outcome{};
        raw.unavailable = true;
        raw.error_message = "No sandbox backend is available";
        auto unavailable = map_error(raw, code, std::chrono::milliseconds{100});
        CHECK(unavailable.kind == error_kind::backend_unavailable);
        CHECK(unavailable.display == "No sandbox backend is available");
    }

    TEST_CASE("006: stack cleanup", "[006][provenance]") {
        auto stack = clean_stack(
                "Error: boom\n  at f (user-function.js:3:9)\n    at node:internal/main:1:1\n    at vm.js:2:2\n\n"sv,
                "user-function.js"sv);
        CHECK(stack == "Error: boom\n    at f (user-function.js:3:9)");

        CHECK(strip_script_paths("at /tmp/a/b/main.py line"sv, "main.py"sv) == "at main.py line");
        CHECK(strip_script_paths("(file:///tmp/x/main.mjs:3:1)"sv, "main.mjs"sv) == "(main.mjs:3:1)");
    }
}  // namespace runbox::test
