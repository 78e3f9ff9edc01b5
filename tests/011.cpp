#include "utils.hpp"

namespace runbox::test {
    using namespace std::chrono_literals;
    using namespace std::string_view_literals;

    namespace detail {
        static packaged_code isolate_package(const execution_request& req) {
            auto resolved = resolve_references(req.code, req);
            auto deps = analyze_dependencies(resolved.code);
            return package_code(resolved, deps, req, backend_kind::isolate);
        }

        static run_options isolate_options(std::chrono::milliseconds timeout = 5s) {
            run_options opts{};
            opts.timeout = timeout;
            opts.owner = "user:test";
            return opts;
        }

        static isolate_backend& shared_isolates() {
            static isolate_backend backend{2U, 64U};
            return backend;
        }
    }  // namespace detail

    TEST_CASE("011: isolate returns results and console output", "[011][isolate]") {
        auto& backend = detail::shared_isolates();

        SECTION("object result") {
            auto code = detail::isolate_package(
                    detail::make_request("console.log('a', 1, { b: 2 });\nreturn { sum: 1 + 1, list: [true, null] };"));
            auto out = backend.run(code, detail::isolate_options());
            REQUIRE(out.ok);
            CHECK(to_json(out.result) == R"({"list":[true,null],"sum":2})");
            CHECK(out.stdout_text == "a 1 {\"b\":2}\n");
        }

        SECTION("no return value") {
            auto code = detail::isolate_package(detail::make_request("console.log(1 + 1)"));
            auto out = backend.run(code, detail::isolate_options());
            REQUIRE(out.ok);
            CHECK(is_null(out.result));
            CHECK(out.stdout_text == "2\n");
        }

        SECTION("await works at the top of the snippet") {
            auto code = detail::isolate_package(detail::make_request("const v = await Promise.resolve(41);\nreturn v + 1;"));
            auto out = backend.run(code, detail::isolate_options());
            REQUIRE(out.ok);
            CHECK(as_number(out.result) == std::optional<double>{42.0});
        }

        SECTION("params, environment and bindings are globals") {
            auto req = detail::make_request("return [params.x, environmentVariables.MODE, {{MODE}}, <variable.limit>];");
            req.params["x"] = make_number(5.0);
            req.env_vars["MODE"] = "fast";
            workflow_variable limit{};
            limit.name = "limit";
            limit.type = variable_type::number;
            limit.raw = make_string("10");
            req.workflow_variables["id"] = limit;

            auto out = backend.run(detail::isolate_package(req), detail::isolate_options());
            REQUIRE(out.ok);
            CHECK(to_json(out.result) == R"([5,"fast","fast",10])");
        }

        SECTION("custom tool parameters are locals") {
            auto req = detail::make_request("return city.toUpperCase() + count;");
            req.is_custom_tool = true;
            req.params["city"] = make_string("oslo");
            req.params["count"] = make_number(3.0);

            auto out = backend.run(detail::isolate_package(req), detail::isolate_options());
            REQUIRE(out.ok);
            REQUIRE(as_string(out.result) != nullptr);
            CHECK(*as_string(out.result) == "OSLO3");
        }

        SECTION("stdout is capped") {
            auto code = detail::isolate_package(detail::make_request("for (let i = 0; i < 100; ++i) console.log('xxxxxxxxxx');"));
            auto opts = detail::isolate_options();
            opts.max_stdout_bytes = 64U;
            auto out = backend.run(code, opts);
            REQUIRE(out.ok);
            CHECK(out.stdout_truncated);
            CHECK(out.stdout_text.size() <= 64U);
        }
    }

    TEST_CASE("011: isolate errors", "[011][isolate]") {
        auto& backend = detail::shared_isolates();

        SECTION("runtime error location") {
            auto code = detail::isolate_package(detail::make_request("const o = null;\nreturn o.x;"));
            auto out = backend.run(code, detail::isolate_options());
            REQUIRE_FALSE(out.ok);
            CHECK(out.error_name == "TypeError");

            auto mapped = map_error(out, code, 5s);
            CHECK(mapped.kind == error_kind::runtime);
            REQUIRE(mapped.location.has_value());
            CHECK(mapped.location->adjusted_line == 2U);
            CHECK(mapped.location->source_line_text == "return o.x;");
        }

        SECTION("syntax error location") {
            auto code = detail::isolate_package(detail::make_request("const a = 1;\nreturn a +;"));
            auto out = backend.run(code, detail::isolate_options());
            REQUIRE_FALSE(out.ok);
            CHECK(out.is_compile_error);
            CHECK(out.error_name == "SyntaxError");

            auto mapped = map_error(out, code, 5s);
            CHECK(mapped.kind == error_kind::compile);
            REQUIRE(mapped.location.has_value());
            CHECK(mapped.location->adjusted_line == 2U);
            CHECK(mapped.display.starts_with("Syntax Error: Line 2: `return a +;`"));
        }

        SECTION("syntax error raised while running") {
            auto code = detail::isolate_package(detail::make_request("const s = 'x';\nreturn JSON.parse(s);"));
            auto out = backend.run(code, detail::isolate_options());
            REQUIRE_FALSE(out.ok);
            CHECK_FALSE(out.is_compile_error);
            CHECK(out.error_name == "SyntaxError");

            auto mapped = map_error(out, code, 5s);
            CHECK(mapped.kind == error_kind::runtime);
            REQUIRE(mapped.location.has_value());
            CHECK(mapped.location->adjusted_line == 2U);
        }

        SECTION("thrown primitives") {
            auto code = detail::isolate_package(detail::make_request("throw 'plain failure';"));
            auto out = backend.run(code, detail::isolate_options());
            REQUIRE_FALSE(out.ok);
            CHECK(out.error_message == "plain failure");
        }

        SECTION("never settling promise") {
            auto code = detail::isolate_package(detail::make_request("return new Promise(() => {});"));
            auto out = backend.run(code, detail::isolate_options());
            REQUIRE_FALSE(out.ok);
            CHECK_FALSE(out.timed_out);
            CHECK(out.error_message.find("never resolved") != std::string::npos);
        }

        SECTION("no module loader") {
            auto code = detail::isolate_package(detail::make_request("return typeof require + typeof process;"));
            auto out = backend.run(code, detail::isolate_options());
            REQUIRE(out.ok);
            CHECK(*as_string(out.result) == "undefinedundefined");
        }
    }

    TEST_CASE("011: isolate limits", "[011][isolate]") {
        auto& backend = detail::shared_isolates();

        SECTION("infinite loop hits the deadline") {
            auto code = detail::isolate_package(detail::make_request("while (true) {}"));
            auto start = std::chrono::steady_clock::now();
            auto out = backend.run(code, detail::isolate_options(100ms));
            CHECK(std::chrono::steady_clock::now() - start < 5s);
            REQUIRE(out.timed_out);

            auto mapped = map_error(out, code, 100ms);
            CHECK(mapped.kind == error_kind::timeout);
            CHECK(mapped.display == "Execution timed out after 100ms");
        }

        SECTION("stop requests cancel the run") {
            std::stop_source source{};
            auto opts = detail::isolate_options(10s);
            opts.stop = source.get_token();
            std::jthread stopper{[&source] {
                std::this_thread::sleep_for(100ms);
                source.request_stop();
            }};

            auto code = detail::isolate_package(detail::make_request("while (true) {}"));
            auto out = backend.run(code, opts);
            CHECK(out.cancelled);
            CHECK_FALSE(out.timed_out);
        }

        SECTION("heap exhaustion") {
            auto code = detail::isolate_package(
                    detail::make_request("const keep = [];\nwhile (true) { keep.push(new Array(100000).fill(7)); }"));
            auto out = backend.run(code, detail::isolate_options(30s));
            REQUIRE_FALSE(out.ok);
            CHECK(out.error_name == "RangeError");
            CHECK(out.error_message == "Execution exceeded the memory limit of 64 MB");
        }

        SECTION("admission slots are returned after every run") {
            auto code = detail::isolate_package(detail::make_request("return 1;"));
            for (int i = 0; i < 4; ++i) {
                REQUIRE(backend.run(code, detail::isolate_options()).ok);
            }
            CHECK(backend.admission().active() == 0U);
            CHECK(backend.admission().capacity() == 2U);
        }
    }

    TEST_CASE("011: concurrent runs share the pool", "[011][isolate]") {
        isolate_backend backend{1U, 64U};
        auto code = detail::isolate_package(detail::make_request("let s = 0;\nfor (let i = 0; i < 1e5; ++i) s += i;\nreturn s;"));

        std::vector<raw_outcome> results(3U);
        {
            std::vector<std::jthread> threads{};
            for (size_t i = 0U; i < results.size(); ++i) {
                threads.emplace_back([&, i] {
                    auto opts = detail::isolate_options(10s);
                    opts.owner = "user:" + std::to_string(i);
                    results[i] = backend.run(code, opts);
                });
            }
        }
        for (const auto& r : results) {
            CHECK(r.ok);
            CHECK(as_number(r.result) == std::optional<double>{4999950000.0});
        }
    }
}  // namespace runbox::test
