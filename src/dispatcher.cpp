#include "runbox/dispatcher.hpp"

#include "runbox/format.hpp"
#include "runbox/isolate.hpp"
#include "runbox/process_sandbox.hpp"

using namespace runbox::literals;

namespace runbox {

    backend_set make_backends(const service_config& cfg) {
        backend_set backends{};
        backends.isolate = std::make_shared<isolate_backend>(cfg.isolate_capacity, cfg.isolate_heap_mb);
        if (cfg.sandbox_enabled) {
            backends.sandbox = std::make_shared<process_sandbox>(sandbox_settings::from_config(cfg));
        }
        return backends;
    }

    dispatcher::dispatcher(backend_set backends) : backends_{std::move(backends)} {}

    bool dispatcher::has_backend(backend_kind kind) const noexcept {
        return backend_for(kind) != nullptr;
    }

    execution_backend* dispatcher::backend_for(backend_kind kind) const noexcept {
        switch (kind) {
            case backend_kind::isolate:
                return backends_.isolate.get();
            case backend_kind::sandbox:
                return backends_.sandbox.get();
        }
        return nullptr;
    }

    raw_outcome dispatcher::execute(const packaged_code& code, const run_options& opts) const {
        auto* backend = backend_for(code.backend);
        if (backend == nullptr) {
            raw_outcome out{};
            out.unavailable = true;
            out.error_message = "No {} backend is available"_format(code.backend);
            return out;
        }

        debug_log("dispatching ", code.script_name, " to ", to_string(code.backend));
        auto start = std::chrono::steady_clock::now();
        try {
            return backend->run(code, opts);
        } catch (const std::exception& e) {
            log_error("{} backend failed: {}"_format(code.backend, e.what()));
            raw_outcome out{};
            out.unavailable = true;
            out.error_message = e.what();
            out.elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                                     std::chrono::steady_clock::now() - start)
                                     .count();
            return out;
        }
    }

}  // namespace runbox
