#pragma once

#include "config.hpp"
#include "value.hpp"

#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace runbox {

    struct workflow_variable {
        std::string name{};
        variable_type type{variable_type::plain};
        value raw{};
    };

    // Per-block declared output schema: the set of top-level field names.
    using output_schema = value_object;

    struct execution_request {
        std::string code{};
        language lang{language::javascript};
        value_object params{};
        std::map<std::string, std::string, std::less<>> env_vars{};
        // block id -> recorded output
        value_object block_data{};
        // normalized block name -> block id
        std::map<std::string, std::string, std::less<>> block_name_mapping{};
        // block id -> declared output schema
        std::map<std::string, output_schema, std::less<>> block_output_schemas{};
        // variable id -> variable
        std::map<std::string, workflow_variable, std::less<>> workflow_variables{};
        // nullopt/non-positive -> configured default
        std::optional<int64_t> timeout_ms{};
        bool is_custom_tool{false};
        std::optional<std::string> workflow_id{};
        std::string owner{"local"};
    };

    // Reads the JSON wire request. Throws execution_error(validation) on
    // malformed JSON, missing code, or fields of the wrong shape.
    execution_request parse_request(std::string_view json);

    // Builds a request from an already-parsed JSON object (JSON-RPC arguments).
    execution_request request_from_value(const value& body);

}  // namespace runbox
