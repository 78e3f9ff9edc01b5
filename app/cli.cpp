#include "cli.hpp"

#include <CLI/CLI.hpp>

#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

namespace runbox::cli {

    namespace detail {

        using namespace std::string_view_literals;

        static std::optional<std::string> read_request(const std::optional<std::filesystem::path>& path) {
            if (!path) {
                return std::string{std::istreambuf_iterator<char>{std::cin}, std::istreambuf_iterator<char>{}};
            }
            std::ifstream in{*path, std::ios::binary};
            if (!in) {
                return std::nullopt;
            }
            std::ostringstream ss{};
            ss << in.rdbuf();
            return ss.str();
        }

        static void apply_log_level(const service_config& cfg) {
            if (cfg.quiet) {
                set_log_level(log_level::error);
            }
            else if (cfg.verbose) {
                set_log_level(log_level::info);
            }
            else {
                set_log_level(log_level::warn);
            }
        }

    }  // namespace detail

    std::optional<int> parse_cli(int argc, char** argv, cli_options& opts) {
        CLI::App app{"runbox: execute JavaScript and Python snippets in isolated runtimes"};
        auto& cfg = opts.cfg;

        bool show_version = false;
        std::string config_arg{};
        std::optional<int64_t> timeout_arg{};
        std::optional<int64_t> max_timeout_arg{};
        std::optional<size_t> max_stdout_arg{};
        std::optional<size_t> isolate_capacity_arg{};
        std::optional<uint32_t> owner_weight_arg{};
        std::optional<size_t> isolate_heap_arg{};
        std::optional<std::string> node_arg{};
        std::optional<std::string> python_arg{};
        std::optional<std::string> work_root_arg{};
        std::optional<size_t> sandbox_memory_arg{};
        std::optional<size_t> sandbox_workers_arg{};
        std::optional<std::string> network_arg{};
        std::optional<std::string> output_arg{};
        std::string request_arg{};

        app.add_flag("--version", show_version, "Print version and exit");
        app.add_option("-c,--config", config_arg, "JSON config file");
        app.add_option("--timeout", timeout_arg, "Default execution timeout in milliseconds");
        app.add_option("--max-timeout", max_timeout_arg, "Upper bound for request timeouts in milliseconds");
        app.add_option("--max-stdout", max_stdout_arg, "Captured stdout limit in bytes");
        app.add_option("--isolates", isolate_capacity_arg, "Concurrently running V8 isolates");
        app.add_option("--owner-weight", owner_weight_arg, "Isolate admission weight per owner");
        app.add_option("--isolate-heap-mb", isolate_heap_arg, "Heap limit per isolate in MiB");
        app.add_flag("--sandbox", "Enable the process sandbox");
        app.add_flag("--no-sandbox", "Disable the process sandbox");
        app.add_option("--node", node_arg, "node executable used by the sandbox");
        app.add_option("--python", python_arg, "python3 executable used by the sandbox");
        app.add_option("--work-root", work_root_arg, "Parent directory of sandbox working directories");
        app.add_option("--sandbox-memory-mb", sandbox_memory_arg, "Memory limit of sandboxed processes in MiB");
        app.add_option("--sandbox-workers", sandbox_workers_arg, "Sandbox worker threads");
        app.add_option("--network", network_arg, "Sandbox network: isolated|inherit");
        app.add_option("--output", output_arg, "Output mode: compact|pretty");
        app.add_flag("--print-config", cfg.print_config, "Print resolved config and exit");
        app.add_flag("--quiet", cfg.quiet, "Only log errors");
        app.add_flag("--verbose", cfg.verbose, "Log request progress");

        auto* exec = app.add_subcommand("exec", "Execute one request read from a file or stdin (default)");
        exec->add_option("-r,--request", request_arg, "Request JSON file; stdin when omitted");
        auto* serve = app.add_subcommand("serve", "Serve JSON-RPC requests over stdio");
        app.require_subcommand(0, 1);

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            return std::optional<int>{app.exit(e)};
        }

        if (cfg.quiet && cfg.verbose) {
            std::cerr << "--quiet and --verbose are mutually exclusive\n";
            return std::optional<int>{2};
        }
        if (app.get_option("--sandbox")->count() > 0U && app.get_option("--no-sandbox")->count() > 0U) {
            std::cerr << "--sandbox and --no-sandbox are mutually exclusive\n";
            return std::optional<int>{2};
        }

        if (show_version) {
            std::cout << "runbox 0.1.0\n";
            return std::optional<int>{0};
        }

        // defaults, then the config file, then the environment, then flags
        bool quiet = cfg.quiet;
        bool verbose = cfg.verbose;
        bool print = cfg.print_config;
        if (!config_arg.empty()) {
            try {
                load_config_file(config_arg, cfg);
            } catch (const std::exception& e) {
                std::cerr << e.what() << '\n';
                return std::optional<int>{2};
            }
        }
        if (!apply_environment(cfg)) {
            std::cerr << "invalid RUNBOX_SANDBOX_ENABLED value (expected 1|0|true|false|yes|no)\n";
            return std::optional<int>{2};
        }
        cfg.quiet = cfg.quiet || quiet;
        cfg.verbose = cfg.verbose || verbose;
        cfg.print_config = print;

        if (timeout_arg) {
            cfg.default_timeout_ms = *timeout_arg;
        }
        if (max_timeout_arg) {
            cfg.max_timeout_ms = *max_timeout_arg;
        }
        if (max_stdout_arg) {
            cfg.max_stdout_bytes = *max_stdout_arg;
        }
        if (isolate_capacity_arg) {
            cfg.isolate_capacity = *isolate_capacity_arg;
        }
        if (owner_weight_arg) {
            cfg.isolate_owner_weight = *owner_weight_arg;
        }
        if (isolate_heap_arg) {
            cfg.isolate_heap_mb = *isolate_heap_arg;
        }
        if (app.get_option("--sandbox")->count() > 0U) {
            cfg.sandbox_enabled = true;
        }
        if (app.get_option("--no-sandbox")->count() > 0U) {
            cfg.sandbox_enabled = false;
        }
        if (node_arg) {
            cfg.node_path = *node_arg;
        }
        if (python_arg) {
            cfg.python_path = *python_arg;
        }
        if (work_root_arg) {
            cfg.work_root = *work_root_arg;
        }
        if (sandbox_memory_arg) {
            cfg.sandbox_memory_mb = *sandbox_memory_arg;
        }
        if (sandbox_workers_arg) {
            cfg.sandbox_workers = *sandbox_workers_arg;
        }
        if (network_arg && !try_parse_network_mode(*network_arg, cfg.sandbox_network)) {
            std::cerr << "invalid --network value: " << *network_arg << " (expected isolated|inherit)\n";
            return std::optional<int>{2};
        }
        if (output_arg && !try_parse_output_mode(*output_arg, cfg.output)) {
            std::cerr << "invalid --output value: " << *output_arg << " (expected compact|pretty)\n";
            return std::optional<int>{2};
        }
        if (cfg.default_timeout_ms <= 0 || cfg.max_timeout_ms <= 0) {
            std::cerr << "timeouts must be positive\n";
            return std::optional<int>{2};
        }
        if (cfg.isolate_capacity == 0U || cfg.isolate_owner_weight == 0U || cfg.sandbox_workers == 0U) {
            std::cerr << "--isolates, --owner-weight and --sandbox-workers must be positive\n";
            return std::optional<int>{2};
        }

        if (serve->parsed()) {
            opts.cmd = command::serve;
        }
        else {
            opts.cmd = command::exec;
            if (!request_arg.empty()) {
                opts.request_file = request_arg;
            }
        }

        detail::apply_log_level(cfg);

        if (cfg.print_config) {
            print_config(cfg, std::cout);
            return std::optional<int>{0};
        }

        return std::nullopt;
    }

    int run_exec(const cli_options& opts) {
        auto body = detail::read_request(opts.request_file);
        if (!body) {
            std::cerr << "failed to read request file: " << opts.request_file->string() << '\n';
            return 2;
        }

        execution_service service{opts.cfg, make_backends(opts.cfg)};
        auto outcome = service.execute_json(*body);
        std::cout << render_response(outcome, opts.cfg.output) << '\n';
        return succeeded(outcome) ? 0 : 1;
    }

    int run_serve(const cli_options& opts) {
        execution_service service{opts.cfg, make_backends(opts.cfg)};
        log_info("serving JSON-RPC on stdio");
        return mcp::run_server(service, std::cin, std::cout);
    }

}  // namespace runbox::cli
