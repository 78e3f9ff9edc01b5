#include "runbox/service.hpp"

#include "runbox/format.hpp"
#include "runbox/imports.hpp"
#include "runbox/packager.hpp"
#include "runbox/provenance.hpp"
#include "runbox/resolver.hpp"

#include <random>

using namespace runbox::literals;

namespace runbox {

    namespace detail {

        static int64_t elapsed_since(std::chrono::steady_clock::time_point start) {
            return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start)
                    .count();
        }

    }  // namespace detail

    authorizer local_authorizer() {
        return [](const execution_request& req) -> std::optional<std::string> {
            if (req.owner.empty()) {
                return std::string{"local"};
            }
            return req.owner;
        };
    }

    std::string make_request_id() {
        thread_local std::mt19937 gen{std::random_device{}()};
        std::uniform_int_distribution<uint32_t> dist{};
        return "{:08x}"_format(dist(gen));
    }

    execution_service::execution_service(service_config cfg, backend_set backends, authorizer auth)
            : cfg_{std::move(cfg)}, dispatcher_{std::move(backends)}, auth_{std::move(auth)} {}

    execution_outcome execution_service::execute_json(std::string_view body, std::stop_token stop) const {
        try {
            auto req = parse_request(body);
            return execute(req, std::move(stop));
        } catch (const execution_error& e) {
            log_warn("rejected request: ", e.what());
            return make_failure(e.kind(), e.what());
        } catch (const std::exception& e) {
            log_error("unexpected failure reading request: ", e.what());
            return make_failure(error_kind::runtime, e.what());
        }
    }

    execution_outcome execution_service::execute(const execution_request& req, std::stop_token stop) const {
        auto request_id = make_request_id();
        auto start = std::chrono::steady_clock::now();
        try {
            return run_pipeline(req, request_id, std::move(stop));
        } catch (const execution_error& e) {
            log_warn("[", request_id, "] ", to_string(e.kind()), ": ", e.what());
            return make_failure(e.kind(), e.what(), detail::elapsed_since(start));
        } catch (const std::exception& e) {
            log_error("[", request_id, "] execution failed: ", e.what());
            auto message = std::string_view{e.what()}.empty() ? std::string{"Unknown error"} : std::string{e.what()};
            return make_failure(error_kind::runtime, std::move(message), detail::elapsed_since(start));
        }
    }

    execution_outcome execution_service::run_pipeline(
            const execution_request& req, std::string_view request_id, std::stop_token stop) const {
        if (utils::trim_ascii(req.code).empty()) {
            throw execution_error{error_kind::validation, "No code provided"};
        }

        auto owner = auth_ ? auth_(req) : std::optional<std::string>{};
        if (!owner) {
            throw execution_error{error_kind::unauthorized, "Unauthorized"};
        }

        auto timeout_ms = effective_timeout_ms(cfg_, req.timeout_ms);
        log_info(
                "[",
                request_id,
                "] accepted: ",
                req.code.size(),
                " bytes of ",
                to_string(req.lang),
                ", ",
                req.params.size(),
                " params, timeout ",
                timeout_ms,
                "ms",
                req.workflow_id ? ", workflow " + *req.workflow_id : std::string{},
                req.is_custom_tool ? ", custom tool" : "");

        auto resolved = resolve_references(req.code, req);

        dependency_report deps{};
        if (req.lang == language::javascript) {
            deps = analyze_dependencies(resolved.code);
            if (deps.extraction.parse_failed) {
                log_warn("[", request_id, "] import scan failed; running the code without extraction");
            }
        }

        auto backend = select_backend(req.lang, deps.has_imports(), req.is_custom_tool, cfg_.sandbox_enabled);
        log_info("[", request_id, "] using ", to_string(backend), " backend");

        auto code = package_code(resolved, deps, req, backend);
        debug_log("[", request_id, "] prologue lines: ", code.prologue_line_count);

        run_options opts{};
        opts.timeout = std::chrono::milliseconds{timeout_ms};
        opts.owner = owner_key(*owner);
        opts.weight = cfg_.isolate_owner_weight;
        opts.stop = std::move(stop);
        opts.max_stdout_bytes = cfg_.max_stdout_bytes;

        auto raw = dispatcher_.execute(code, opts);
        if (raw.ok) {
            log_info("[", request_id, "] completed in ", raw.elapsed_ms, "ms");
            return make_success(raw);
        }

        auto mapped = map_error(raw, code, opts.timeout);
        log_warn(
                "[",
                request_id,
                "] ",
                to_string(mapped.kind),
                ": ",
                mapped.name,
                ": ",
                mapped.message,
                " -> ",
                mapped.display);
        return make_failure(mapped, raw);
    }

}  // namespace runbox
