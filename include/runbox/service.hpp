#pragma once

#include "dispatcher.hpp"
#include "request.hpp"
#include "response.hpp"

#include <functional>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>

namespace runbox {

    // Approves a caller before anything runs; returns the owner id or nullopt.
    using authorizer = std::function<std::optional<std::string>(const execution_request&)>;

    // Accepts every request under its own `ownerId` ("local" by default).
    authorizer local_authorizer();

    // Fairness key used for isolate admission.
    inline std::string owner_key(std::string_view owner_id) {
        return "user:" + std::string{owner_id};
    }

    std::string make_request_id();

    class execution_service {
      public:
        execution_service(service_config cfg, backend_set backends, authorizer auth = local_authorizer());

        // Runs the whole pipeline. Never throws; every failure is an outcome.
        execution_outcome execute(const execution_request& req, std::stop_token stop = {}) const;

        // Parses the wire request first; malformed bodies become validation failures.
        execution_outcome execute_json(std::string_view body, std::stop_token stop = {}) const;

        const service_config& config() const noexcept { return cfg_; }

      private:
        execution_outcome run_pipeline(
                const execution_request& req, std::string_view request_id, std::stop_token stop) const;

        service_config cfg_;
        dispatcher dispatcher_;
        authorizer auth_;
    };

}  // namespace runbox
