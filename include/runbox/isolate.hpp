#pragma once

#include "admission.hpp"
#include "backend.hpp"

namespace runbox {

    // In-process restricted VM: a fresh V8 isolate and context per run, no
    // network or module loader, heap-capped, hard-terminated by a watchdog
    // at the deadline or on cancellation. Admission to the fixed number of
    // concurrently running isolates is owner-weighted.
    class isolate_backend final : public execution_backend {
      public:
        isolate_backend(size_t capacity, size_t heap_limit_mb);

        raw_outcome run(const packaged_code& code, const run_options& opts) override;

        admission_pool& admission() noexcept { return pool_; }

      private:
        admission_pool pool_;
        size_t heap_limit_mb_;
    };

    // One-time process-wide V8 platform initialization; safe to call from any thread.
    void initialize_v8();

}  // namespace runbox
