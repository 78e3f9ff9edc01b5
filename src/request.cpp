#include "runbox/request.hpp"

#include "runbox/errors.hpp"
#include "runbox/format.hpp"

#include <glaze/glaze.hpp>

#include <algorithm>
#include <cmath>
#include <limits>

using namespace runbox::literals;

namespace runbox {

    namespace detail {

        struct wire_request {
            std::optional<std::string> code{};
            std::optional<std::string> language{};
            std::optional<value> params{};
            std::optional<double> timeout{};
            std::optional<value> envVars{};
            std::optional<value> blockData{};
            std::optional<value> blockNameMapping{};
            std::optional<value> blockOutputSchemas{};
            std::optional<value> workflowVariables{};
            std::optional<std::string> workflowId{};
            std::optional<bool> isCustomTool{};
            std::optional<std::string> ownerId{};
            struct glaze {
                using T = wire_request;
                static constexpr auto value = glz::object(
                        &T::code,
                        &T::language,
                        &T::params,
                        &T::timeout,
                        &T::envVars,
                        &T::blockData,
                        &T::blockNameMapping,
                        &T::blockOutputSchemas,
                        &T::workflowVariables,
                        &T::workflowId,
                        &T::isCustomTool,
                        &T::ownerId);
            };
        };

        static const value_object& require_object(const std::optional<value>& field, std::string_view name) {
            static const value_object empty{};
            if (!field || is_null(*field)) {
                return empty;
            }
            if (auto* obj = as_object(*field)) {
                return *obj;
            }
            throw execution_error{error_kind::validation, "\"{}\" must be an object"_format(name)};
        }

        static workflow_variable to_workflow_variable(const std::string& id, const value& entry) {
            auto* obj = as_object(entry);
            if (obj == nullptr) {
                throw execution_error{error_kind::validation, "workflow variable \"{}\" must be an object"_format(id)};
            }
            workflow_variable var{};
            if (auto it = obj->find("name"); it != obj->end()) {
                if (auto* name = as_string(it->second)) {
                    var.name = *name;
                }
            }
            if (auto it = obj->find("type"); it != obj->end()) {
                if (auto* type = as_string(it->second)) {
                    var.type = parse_variable_type(*type);
                }
            }
            if (auto it = obj->find("value"); it != obj->end()) {
                var.raw = it->second;
            }
            else {
                var.raw = make_null();
            }
            return var;
        }

    }  // namespace detail

    execution_request parse_request(std::string_view json) {
        std::string buffer{json};
        detail::wire_request wire{};
        auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(wire, buffer);
        if (ec) {
            throw execution_error{
                    error_kind::validation, "Invalid request body: {}"_format(glz::format_error(ec, buffer))};
        }

        if (!wire.code || utils::trim_ascii(*wire.code).empty()) {
            throw execution_error{error_kind::validation, "No code provided"};
        }

        execution_request req{};
        req.code = std::move(*wire.code);
        req.lang = parse_language(wire.language.value_or(std::string{}));

        req.params = detail::require_object(wire.params, "params"sv);
        req.params.erase(std::string{"_context"});

        for (const auto& [key, v] : detail::require_object(wire.envVars, "envVars"sv)) {
            if (is_null(v)) {
                continue;
            }
            req.env_vars.emplace(key, stringify(v));
        }

        req.block_data = detail::require_object(wire.blockData, "blockData"sv);

        for (const auto& [name, id] : detail::require_object(wire.blockNameMapping, "blockNameMapping"sv)) {
            if (auto* text = as_string(id)) {
                req.block_name_mapping.emplace(name, *text);
            }
        }

        for (const auto& [id, schema] : detail::require_object(wire.blockOutputSchemas, "blockOutputSchemas"sv)) {
            if (auto* fields = as_object(schema)) {
                req.block_output_schemas.emplace(id, *fields);
            }
        }

        for (const auto& [id, entry] : detail::require_object(wire.workflowVariables, "workflowVariables"sv)) {
            req.workflow_variables.emplace(id, detail::to_workflow_variable(id, entry));
        }

        if (wire.timeout && std::isfinite(*wire.timeout)) {
            // bounded before the integer conversion; the service clamps further
            req.timeout_ms = static_cast<int64_t>(std::clamp(
                    *wire.timeout, 0.0, static_cast<double>(std::numeric_limits<int32_t>::max())));
        }
        req.is_custom_tool = wire.isCustomTool.value_or(false);
        req.workflow_id = std::move(wire.workflowId);
        if (wire.ownerId && !utils::trim_ascii(*wire.ownerId).empty()) {
            req.owner = std::move(*wire.ownerId);
        }

        return req;
    }

    execution_request request_from_value(const value& body) {
        if (as_object(body) == nullptr) {
            throw execution_error{error_kind::validation, "Invalid request body: expected an object"};
        }
        return parse_request(to_json(body));
    }

}  // namespace runbox
