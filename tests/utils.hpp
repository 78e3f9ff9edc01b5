#pragma once

#include "runbox.hpp"

#include <catch2/catch_test_macros.hpp>
#include <glaze/glaze.hpp>

#include "../src/internal/platform.hpp"

extern "C" {
#include <unistd.h>
}

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <limits>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <vector>

namespace runbox::test::detail {
    namespace fs = std::filesystem;

    struct temp_dir {
        fs::path path{};

        explicit temp_dir(std::string_view prefix) {
            auto now = std::chrono::system_clock::now().time_since_epoch().count();
            std::ostringstream dir_name{};
            dir_name << prefix << "_" << static_cast<long>(::getpid()) << "_" << now;
            path = fs::temp_directory_path() / dir_name.str();
            fs::create_directories(path);
        }

        ~temp_dir() {
            std::error_code ec{};
            fs::remove_all(path, ec);
        }
    };

    inline void write_text_file(const fs::path& path, std::string_view text) {
        std::ofstream out{path};
        REQUIRE(out.good());
        out << text;
        REQUIRE(out.good());
    }

    inline bool has_node() {
        return !internal::platform::tool::node_path.empty() &&
               fs::exists(fs::path{std::string{internal::platform::tool::node_path}});
    }

    inline bool has_python() {
        return !internal::platform::tool::python_path.empty() &&
               fs::exists(fs::path{std::string{internal::platform::tool::python_path}});
    }

    // Request for `code` with every optional field empty.
    inline execution_request make_request(std::string code, language lang = language::javascript) {
        execution_request req{};
        req.code = std::move(code);
        req.lang = lang;
        return req;
    }

    inline value json(std::string_view text) {
        auto parsed = parse_json(text);
        REQUIRE(parsed.has_value());
        return std::move(*parsed);
    }

    // Backend that records what it was asked to run and replays a canned outcome.
    struct fake_backend final : execution_backend {
        std::function<raw_outcome(const packaged_code&, const run_options&)> respond{};
        std::vector<packaged_code> seen{};
        std::vector<run_options> seen_options{};

        raw_outcome run(const packaged_code& code, const run_options& opts) override {
            seen.push_back(code);
            seen_options.push_back(opts);
            if (respond) {
                return respond(code, opts);
            }
            raw_outcome out{};
            out.ok = true;
            out.result = make_null();
            return out;
        }
    };

    inline service_config test_config(bool sandbox_enabled = true) {
        auto cfg = service_config::defaults();
        cfg.sandbox_enabled = sandbox_enabled;
        cfg.isolate_capacity = 2U;
        return cfg;
    }
}  // namespace runbox::test::detail
