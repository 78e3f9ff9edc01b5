#pragma once

#include "backend.hpp"

#include <memory>

namespace runbox {

    struct backend_set {
        std::shared_ptr<execution_backend> isolate{};
        std::shared_ptr<execution_backend> sandbox{};
    };

    // Builds the isolate backend and, when enabled, the process sandbox.
    backend_set make_backends(const service_config& cfg);

    // Routes packaged code to the backend chosen at packaging time. Backend
    // failures and missing backends come back as outcomes, never as exceptions.
    class dispatcher {
      public:
        explicit dispatcher(backend_set backends);

        raw_outcome execute(const packaged_code& code, const run_options& opts) const;

        bool has_backend(backend_kind kind) const noexcept;

      private:
        execution_backend* backend_for(backend_kind kind) const noexcept;

        backend_set backends_;
    };

}  // namespace runbox
