#include "runbox/config.hpp"

#include "runbox/errors.hpp"
#include "runbox/format.hpp"

#include "internal/platform.hpp"

#include <glaze/glaze.hpp>

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <system_error>

using namespace runbox::literals;
namespace fs = std::filesystem;

namespace runbox {

    namespace detail {

        // On-disk form; every key optional so partial files only override what they name.
        struct config_file {
            std::optional<int64_t> default_timeout_ms{};
            std::optional<int64_t> max_timeout_ms{};
            std::optional<size_t> max_stdout_bytes{};
            std::optional<size_t> isolate_capacity{};
            std::optional<uint32_t> isolate_owner_weight{};
            std::optional<size_t> isolate_heap_mb{};
            std::optional<bool> sandbox_enabled{};
            std::optional<std::string> node_path{};
            std::optional<std::string> python_path{};
            std::optional<std::string> work_root{};
            std::optional<size_t> sandbox_memory_mb{};
            std::optional<size_t> sandbox_workers{};
            std::optional<std::string> sandbox_network{};
            std::optional<std::string> output{};
            struct glaze {
                using T = config_file;
                static constexpr auto value = glz::object(
                        &T::default_timeout_ms,
                        &T::max_timeout_ms,
                        &T::max_stdout_bytes,
                        &T::isolate_capacity,
                        &T::isolate_owner_weight,
                        &T::isolate_heap_mb,
                        &T::sandbox_enabled,
                        &T::node_path,
                        &T::python_path,
                        &T::work_root,
                        &T::sandbox_memory_mb,
                        &T::sandbox_workers,
                        &T::sandbox_network,
                        &T::output);
            };
        };

        static fs::path default_work_root() {
            std::error_code ec{};
            auto tmp = fs::temp_directory_path(ec);
            if (ec) {
                tmp = "/tmp";
            }
            return tmp / "runbox";
        }

        template <typename T>
        static void assign_if(std::optional<T>& from, T& to) {
            if (from) {
                to = std::move(*from);
            }
        }

    }  // namespace detail

    service_config service_config::defaults() {
        service_config cfg{};
        cfg.node_path = fs::path{std::string{internal::platform::tool::node_path}};
        cfg.python_path = fs::path{std::string{internal::platform::tool::python_path}};
        cfg.sandbox_enabled = !cfg.node_path.empty() || !cfg.python_path.empty();
        cfg.work_root = detail::default_work_root();
        return cfg;
    }

    bool apply_environment(service_config& cfg) {
        const char* raw = std::getenv("RUNBOX_SANDBOX_ENABLED");
        if (raw == nullptr || *raw == '\0') {
            return true;
        }
        auto flag = parse_flag_value(raw);
        if (!flag) {
            return false;
        }
        cfg.sandbox_enabled = *flag;
        return true;
    }

    void load_config_file(const fs::path& path, service_config& cfg) {
        std::ifstream in{path, std::ios::binary};
        if (!in) {
            throw execution_error{error_kind::configuration, "failed to open config file: {}"_format(path.string())};
        }
        std::stringstream ss{};
        ss << in.rdbuf();
        auto text = ss.str();

        detail::config_file file{};
        auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(file, text);
        if (ec) {
            throw execution_error{
                    error_kind::configuration,
                    "invalid config file {}: {}"_format(path.string(), glz::format_error(ec, text))};
        }

        detail::assign_if(file.default_timeout_ms, cfg.default_timeout_ms);
        detail::assign_if(file.max_timeout_ms, cfg.max_timeout_ms);
        detail::assign_if(file.max_stdout_bytes, cfg.max_stdout_bytes);
        detail::assign_if(file.isolate_capacity, cfg.isolate_capacity);
        detail::assign_if(file.isolate_owner_weight, cfg.isolate_owner_weight);
        detail::assign_if(file.isolate_heap_mb, cfg.isolate_heap_mb);
        detail::assign_if(file.sandbox_enabled, cfg.sandbox_enabled);
        detail::assign_if(file.sandbox_memory_mb, cfg.sandbox_memory_mb);
        detail::assign_if(file.sandbox_workers, cfg.sandbox_workers);
        if (file.node_path) {
            cfg.node_path = *file.node_path;
        }
        if (file.python_path) {
            cfg.python_path = *file.python_path;
        }
        if (file.work_root) {
            cfg.work_root = *file.work_root;
        }
        if (file.sandbox_network && !try_parse_network_mode(*file.sandbox_network, cfg.sandbox_network)) {
            throw execution_error{
                    error_kind::configuration,
                    "invalid sandbox_network: {} (expected isolated|inherit)"_format(*file.sandbox_network)};
        }
        if (file.output && !try_parse_output_mode(*file.output, cfg.output)) {
            throw execution_error{
                    error_kind::configuration, "invalid output: {} (expected compact|pretty)"_format(*file.output)};
        }
        if (cfg.isolate_capacity == 0U || cfg.isolate_owner_weight == 0U || cfg.sandbox_workers == 0U) {
            throw execution_error{
                    error_kind::configuration,
                    "isolate_capacity, isolate_owner_weight and sandbox_workers must be positive"};
        }
    }

    int64_t effective_timeout_ms(const service_config& cfg, std::optional<int64_t> requested) {
        auto upper = cfg.max_timeout_ms > 0 ? cfg.max_timeout_ms : max_execution_timeout_ms;
        auto fallback = std::min(cfg.default_timeout_ms > 0 ? cfg.default_timeout_ms : default_execution_timeout_ms, upper);
        if (!requested || *requested <= 0) {
            return fallback;
        }
        return std::min(*requested, upper);
    }

    void print_config(const service_config& cfg, std::ostream& os) {
        os << "default_timeout_ms=" << cfg.default_timeout_ms << '\n';
        os << "max_timeout_ms=" << cfg.max_timeout_ms << '\n';
        os << "max_stdout_bytes=" << cfg.max_stdout_bytes << '\n';
        os << "isolate_capacity=" << cfg.isolate_capacity << '\n';
        os << "isolate_owner_weight=" << cfg.isolate_owner_weight << '\n';
        os << "isolate_heap_mb=" << cfg.isolate_heap_mb << '\n';
        os << "sandbox_enabled=" << (cfg.sandbox_enabled ? "true" : "false") << '\n';
        os << "node=" << (cfg.node_path.empty() ? "<none>" : cfg.node_path.string()) << '\n';
        os << "python=" << (cfg.python_path.empty() ? "<none>" : cfg.python_path.string()) << '\n';
        os << "work_root=" << cfg.work_root.string() << '\n';
        os << "sandbox_memory_mb=" << cfg.sandbox_memory_mb << '\n';
        os << "sandbox_workers=" << cfg.sandbox_workers << '\n';
        os << "sandbox_network=" << to_string(cfg.sandbox_network) << '\n';
        os << "output=" << to_string(cfg.output) << '\n';
    }

}  // namespace runbox
