#include "utils.hpp"

namespace runbox::test {
    using namespace std::string_view_literals;

    namespace detail {
        static packaged_code package(const execution_request& req, bool sandbox_enabled = true) {
            auto resolved = resolve_references(req.code, req);
            dependency_report deps{};
            if (req.lang == language::javascript) {
                deps = analyze_dependencies(resolved.code);
            }
            auto backend = select_backend(req.lang, deps.has_imports(), req.is_custom_tool, sandbox_enabled);
            return package_code(resolved, deps, req, backend);
        }

        static std::vector<std::string_view> source_lines(const packaged_code& p) {
            return utils::split_lines(p.source);
        }
    }  // namespace detail

    TEST_CASE("005: backend selection", "[005][packager]") {
        CHECK(select_backend(language::javascript, false, false, true) == backend_kind::isolate);
        CHECK(select_backend(language::javascript, false, false, false) == backend_kind::isolate);
        CHECK(select_backend(language::javascript, true, false, true) == backend_kind::sandbox);
        CHECK(select_backend(language::javascript, true, true, true) == backend_kind::isolate);
        CHECK(select_backend(language::python, false, false, true) == backend_kind::sandbox);

        SECTION("python without the sandbox") {
            try {
                (void)select_backend(language::python, false, false, false);
                FAIL("expected an exception");
            } catch (const execution_error& e) {
                CHECK(e.kind() == error_kind::configuration);
            }
        }

        SECTION("imports without the sandbox") {
            try {
                (void)select_backend(language::javascript, true, false, false);
                FAIL("expected an exception");
            } catch (const execution_error& e) {
                CHECK(e.kind() == error_kind::configuration);
                CHECK(std::string_view{e.what()}.find("import") != std::string_view::npos);
            }
        }
    }

    TEST_CASE("005: isolate packaging", "[005][packager]") {
        auto req = detail::make_request("const a = 1;\nconst b = 2;\nreturn a + b;");
        auto p = detail::package(req);

        CHECK(p.backend == backend_kind::isolate);
        CHECK(p.format == module_format::script);
        CHECK(p.script_name == isolate_script_name);
        CHECK(p.prologue_line_count == 2U);
        CHECK(p.wrapper_line_count == 2U);
        CHECK(p.param_line_count == 0U);
        CHECK(p.body_line_count == 3U);
        CHECK(p.body_start_line() == 3U);
        CHECK(p.body_end_line() == 5U);

        auto lines = detail::source_lines(p);
        CHECK(lines[0] == "(async () => {");
        CHECK(lines[p.body_start_line() - 1U] == "const a = 1;");
        CHECK(lines[p.body_end_line() - 1U] == "return a + b;");
        CHECK(unpackage(p) == req.code);
    }

    TEST_CASE("005: custom tool parameters are declared", "[005][packager]") {
        auto req = detail::make_request("return city.length + count;");
        req.is_custom_tool = true;
        req.params["city"] = make_string("Oslo");
        req.params["count"] = make_number(2.0);
        req.params["not-an-identifier"] = make_bool(true);
        req.params["class"] = make_bool(true);

        auto p = detail::package(req);
        CHECK(p.backend == backend_kind::isolate);
        CHECK(p.param_line_count == 2U);
        CHECK(p.prologue_line_count == 4U);

        auto lines = detail::source_lines(p);
        CHECK(lines[2] == "    const city = params.city;");
        CHECK(lines[3] == "    const count = params.count;");
        CHECK(lines[4] == "return city.length + count;");
        CHECK(unpackage(p) == req.code);
        CHECK(p.params.size() == 4U);
    }

    TEST_CASE("005: node packaging", "[005][packager]") {
        SECTION("esm with lifted imports") {
            auto req = detail::make_request("import os from 'os';\nconst n = os.cpus().length;\nreturn n;");
            req.params["k"] = make_string("v");
            auto p = detail::package(req);

            CHECK(p.backend == backend_kind::sandbox);
            CHECK(p.format == module_format::esm);
            CHECK(p.script_name == "main.mjs");

            auto lines = detail::source_lines(p);
            CHECK(lines[0] == "import os from 'os';");
            CHECK(lines[1].starts_with("const params = JSON.parse("));
            // import line is replaced by a blank body line
            CHECK(lines[p.body_start_line() - 1U].empty());
            CHECK(lines[p.body_start_line()] == "const n = os.cpus().length;");
            CHECK(p.body_line_count == 3U);
            CHECK(p.source.find(result_sentinel) != std::string::npos);
        }

        SECTION("commonjs") {
            auto req = detail::make_request("const fs = require('fs');\nreturn typeof fs;");
            auto p = detail::package(req);

            CHECK(p.format == module_format::commonjs);
            CHECK(p.script_name == "main.cjs");
            CHECK(p.source.find("createRequire") == std::string::npos);
            CHECK(unpackage(p) == req.code);
        }

        SECTION("esm that also requires") {
            auto req = detail::make_request("import a from 'a';\nconst b = require('b');\nreturn [a, b];");
            auto p = detail::package(req);

            CHECK(p.format == module_format::esm);
            auto lines = detail::source_lines(p);
            CHECK(lines[1].find("createRequire") != std::string_view::npos);
            CHECK(lines[2] == "const require = __runbox_create_require(import.meta.url);");
        }

        SECTION("bindings become constants") {
            auto req = detail::make_request("import x from 'x';\nreturn {{key}};");
            req.env_vars["key"] = "secret";
            auto p = detail::package(req);

            CHECK(p.source.find("const __var_key = \"secret\";\n") != std::string::npos);
        }
    }

    TEST_CASE("005: python packaging", "[005][packager]") {
        auto req = detail::make_request("x = 1\n\nreturn x + <variable.n>", language::python);
        workflow_variable n{};
        n.name = "n";
        n.type = variable_type::number;
        n.raw = make_string("2");
        req.workflow_variables["id"] = n;

        auto p = detail::package(req);
        CHECK(p.backend == backend_kind::sandbox);
        CHECK(p.format == module_format::python);
        CHECK(p.script_name == "main.py");
        CHECK(p.body_indent == "    ");
        // import, params, env, one binding, def
        CHECK(p.prologue_line_count == 5U);
        CHECK(p.wrapper_line_count == 1U);
        CHECK(p.body_line_count == 3U);

        auto lines = detail::source_lines(p);
        CHECK(lines[3] == "__variable_n = 2");
        CHECK(lines[4] == "def __runbox_main__():");
        CHECK(lines[5] == "    x = 1");
        CHECK(lines[6].empty());
        CHECK(lines[7] == "    return x + __variable_n");
        CHECK(lines[8] == "    pass");
        CHECK(unpackage(p) == "x = 1\n\nreturn x + __variable_n");
    }

    TEST_CASE("005: python packaging without the sandbox is refused", "[005][packager]") {
        auto req = detail::make_request("return 1", language::python);
        CHECK_THROWS_AS(detail::package(req, false), execution_error);
    }

    TEST_CASE("005: harness output splitting", "[005][packager]") {
        SECTION("result line is removed") {
            auto out = split_harness_output("hello\n\n__SIM_RESULT__={\"a\":1}\n"sv);
            REQUIRE(out.result.has_value());
            CHECK(to_json(*out.result) == R"({"a":1})");
            CHECK(out.stdout_text == "hello\n");
        }

        SECTION("output without a trailing newline") {
            auto out = split_harness_output("progress: \n__SIM_RESULT__=5\n"sv);
            REQUIRE(out.result.has_value());
            CHECK(as_number(*out.result) == std::optional<double>{5.0});
            CHECK(out.stdout_text == "progress: ");
        }

        SECTION("last result line wins") {
            auto out = split_harness_output("\n__SIM_RESULT__=1\n\n__SIM_RESULT__=2\n"sv);
            REQUIRE(out.result.has_value());
            CHECK(as_number(*out.result) == std::optional<double>{2.0});
            CHECK(out.stdout_text == "\n__SIM_RESULT__=1\n");
        }

        SECTION("undefined result is null") {
            auto out = split_harness_output("\n__SIM_RESULT__=undefined\n"sv);
            REQUIRE(out.result.has_value());
            CHECK(is_null(*out.result));
            CHECK(out.stdout_text.empty());
        }

        SECTION("no result line") {
            auto out = split_harness_output("just output\n"sv);
            CHECK_FALSE(out.result.has_value());
            CHECK(out.stdout_text == "just output\n");
        }
    }

    TEST_CASE("005: harness stream", "[005][packager]") {
        SECTION("marker split across chunks") {
            harness_stream stream{};
            stream.append("abc\n__SIM_RE"sv);
            stream.append("SULT__=[1,"sv);
            stream.append("2]\n"sv);
            auto out = stream.finish();
            REQUIRE(out.result.has_value());
            CHECK(to_json(*out.result) == "[1,2]");
            CHECK(out.stdout_text == "abc");
        }

        SECTION("capped stdout keeps the result") {
            harness_stream stream{8U};
            stream.append(std::string(1000U, 'x'));
            stream.append("\n__SIM_RESULT__={\"done\":true}\n"sv);
            auto out = stream.finish();
            CHECK(out.stdout_truncated);
            CHECK(out.stdout_text == "xxxxxxxx");
            REQUIRE(out.result.has_value());
            CHECK(to_json(*out.result) == R"({"done":true})");
        }

        SECTION("oversized result is dropped and flagged") {
            harness_stream stream{1024U, 4U};
            stream.append("\n__SIM_RESULT__=\"too long\"\n"sv);
            auto out = stream.finish();
            CHECK(out.result_truncated);
            CHECK_FALSE(out.result.has_value());
            CHECK_FALSE(out.stdout_truncated);
        }

        SECTION("output ends inside the result line") {
            harness_stream stream{};
            stream.append("\n__SIM_RESULT__=7"sv);
            auto out = stream.finish();
            REQUIRE(out.result.has_value());
            CHECK(as_number(*out.result) == std::optional<double>{7.0});
        }
    }
}  // namespace runbox::test
