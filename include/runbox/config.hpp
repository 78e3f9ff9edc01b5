#pragma once

#include "utils.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>

namespace runbox {

    using namespace std::string_view_literals;

    /*
     * runbox service options
     *
     * Execution limits
     * - default_timeout_ms: Timeout applied when a request carries none (or a non-positive one).
     * - max_timeout_ms: Upper bound; larger request timeouts are clamped.
     * - max_stdout_bytes: Captured stdout cap per execution (both backends).
     *
     * In-process VM (V8 isolates)
     * - isolate_capacity: Number of isolates allowed to run at once.
     * - isolate_owner_weight: Admission weight given to each owner key.
     * - isolate_heap_mb: Old-generation heap ceiling per isolate.
     *
     * Process sandbox
     * - sandbox_enabled: Master switch; Python and JS with imports need it.
     *   Overridden by RUNBOX_SANDBOX_ENABLED.
     * - node_path / python_path: Interpreters launched inside the sandbox.
     * - work_root: Parent directory of per-job working directories.
     * - sandbox_memory_mb: Address-space limit of sandboxed processes.
     * - sandbox_workers: Worker threads consuming the sandbox job queue.
     * - sandbox_network: "isolated" (new network namespace) or "inherit".
     *
     * Front end
     * - output: Response rendering, "compact" or "pretty".
     * - quiet/verbose: Log verbosity.
     * - print_config: Print resolved config and exit.
     */

    enum class language : uint8_t { javascript, python };
    enum class network_mode : uint8_t { isolated, inherit };
    enum class output_mode : uint8_t { compact, pretty };

    inline constexpr std::string_view to_string(language lang) {
        switch (lang) {
            case language::javascript:
                return "javascript"sv;
            case language::python:
                return "python"sv;
        }
        return "javascript"sv;
    }

    inline constexpr std::string_view to_string(network_mode mode) {
        switch (mode) {
            case network_mode::isolated:
                return "isolated"sv;
            case network_mode::inherit:
                return "inherit"sv;
        }
        return "isolated"sv;
    }

    inline constexpr std::string_view to_string(output_mode mode) {
        switch (mode) {
            case output_mode::compact:
                return "compact"sv;
            case output_mode::pretty:
                return "pretty"sv;
        }
        return "compact"sv;
    }

    inline bool try_parse_language(std::string_view value, language& out) {
        value = utils::trim_ascii(value);
        if (utils::str_case_eq(value, "javascript"sv) || utils::str_case_eq(value, "js"sv)) {
            out = language::javascript;
            return true;
        }
        if (utils::str_case_eq(value, "python"sv) || utils::str_case_eq(value, "py"sv)) {
            out = language::python;
            return true;
        }
        return false;
    }

    inline language parse_language(std::string_view value) {
        auto lang = language::javascript;
        if (!try_parse_language(value, lang)) {
            return language::javascript;
        }
        return lang;
    }

    inline bool try_parse_network_mode(std::string_view value, network_mode& out) {
        if (utils::str_case_eq(value, "isolated"sv) || utils::str_case_eq(value, "none"sv)) {
            out = network_mode::isolated;
            return true;
        }
        if (utils::str_case_eq(value, "inherit"sv) || utils::str_case_eq(value, "host"sv)) {
            out = network_mode::inherit;
            return true;
        }
        return false;
    }

    inline bool try_parse_output_mode(std::string_view value, output_mode& out) {
        if (utils::str_case_eq(value, "compact"sv) || utils::str_case_eq(value, "json"sv)) {
            out = output_mode::compact;
            return true;
        }
        if (utils::str_case_eq(value, "pretty"sv)) {
            out = output_mode::pretty;
            return true;
        }
        return false;
    }

    // Accepts 1/0, true/false, yes/no, on/off.
    inline std::optional<bool> parse_flag_value(std::string_view value) {
        value = utils::trim_ascii(value);
        for (auto t : {"1"sv, "true"sv, "yes"sv, "on"sv}) {
            if (utils::str_case_eq(value, t)) {
                return true;
            }
        }
        for (auto f : {"0"sv, "false"sv, "no"sv, "off"sv}) {
            if (utils::str_case_eq(value, f)) {
                return false;
            }
        }
        return std::nullopt;
    }

    inline constexpr int64_t default_execution_timeout_ms = 10'000;
    inline constexpr int64_t max_execution_timeout_ms = 210'000;

    struct service_config {
        int64_t default_timeout_ms{default_execution_timeout_ms};
        int64_t max_timeout_ms{max_execution_timeout_ms};
        size_t max_stdout_bytes{1U << 20U};

        size_t isolate_capacity{4U};
        uint32_t isolate_owner_weight{1U};
        size_t isolate_heap_mb{128U};

        bool sandbox_enabled{true};
        std::filesystem::path node_path{};
        std::filesystem::path python_path{};
        std::filesystem::path work_root{};
        size_t sandbox_memory_mb{512U};
        size_t sandbox_workers{4U};
        network_mode sandbox_network{network_mode::isolated};

        output_mode output{output_mode::compact};
        bool quiet{false};
        bool verbose{false};
        bool print_config{false};

        // Compiled-in defaults: interpreter paths found at configure time,
        // sandbox disabled when neither was found.
        static service_config defaults();
    };

    // Applies RUNBOX_SANDBOX_ENABLED; returns false on an unparseable value.
    bool apply_environment(service_config& cfg);

    // Reads a JSON config file; unknown keys are ignored. Throws on I/O or parse errors.
    void load_config_file(const std::filesystem::path& path, service_config& cfg);

    int64_t effective_timeout_ms(const service_config& cfg, std::optional<int64_t> requested);

    void print_config(const service_config& cfg, std::ostream& os);

}  // namespace runbox
