#pragma once

#include "packager.hpp"

#include <chrono>
#include <optional>
#include <stop_token>
#include <string>

namespace runbox {

    // What a backend observed, before any location mapping.
    struct raw_outcome {
        bool ok{false};
        value result{};
        std::string stdout_text{};
        bool stdout_truncated{false};

        // failure details; all empty on success
        std::string error_name{};
        std::string error_message{};
        std::string stack{};
        // free-form diagnostic text (sandbox stderr/stdout tail)
        std::string error_text{};
        std::optional<size_t> raw_line{};
        std::optional<size_t> raw_column{};
        bool is_compile_error{false};
        bool timed_out{false};
        bool cancelled{false};
        // the backend could not run the job at all
        bool unavailable{false};

        int64_t elapsed_ms{};
    };

    struct run_options {
        std::chrono::milliseconds timeout{default_execution_timeout_ms};
        // fairness key, "user:<id>"
        std::string owner{};
        uint32_t weight{1U};
        std::stop_token stop{};
        size_t max_stdout_bytes{1U << 20U};
    };

    class execution_backend {
      public:
        virtual ~execution_backend() = default;

        // Runs packaged code to completion, timeout or cancellation. Never
        // throws for failures of the user code; those are reported in the outcome.
        virtual raw_outcome run(const packaged_code& code, const run_options& opts) = 0;
    };

}  // namespace runbox
