#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace runbox {

    using namespace std::string_view_literals;

    enum class error_kind : uint8_t {
        validation,
        unauthorized,
        configuration,
        compile,
        runtime,
        timeout,
        backend_unavailable,
    };

    inline constexpr std::string_view to_string(error_kind kind) {
        switch (kind) {
            case error_kind::validation:
                return "ValidationError"sv;
            case error_kind::unauthorized:
                return "Unauthorized"sv;
            case error_kind::configuration:
                return "ConfigurationError"sv;
            case error_kind::compile:
                return "CompileError"sv;
            case error_kind::runtime:
                return "RuntimeError"sv;
            case error_kind::timeout:
                return "ExecutionTimeout"sv;
            case error_kind::backend_unavailable:
                return "BackendUnavailable"sv;
        }
        return "RuntimeError"sv;
    }

    // Errors that stop a request before (or instead of) running user code.
    class execution_error : public std::runtime_error {
      public:
        execution_error(error_kind kind, const std::string& message) : std::runtime_error{message}, kind_{kind} {}

        error_kind kind() const noexcept { return kind_; }

      private:
        error_kind kind_;
    };

}  // namespace runbox
