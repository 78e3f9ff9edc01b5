#pragma once

#include "request.hpp"
#include "value.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace runbox {

    inline constexpr auto workflow_variable_prefix = "__variable_"sv;
    inline constexpr auto env_variable_prefix = "__var_"sv;
    inline constexpr auto block_tag_prefix = "__tag_"sv;

    enum class placeholder_kind : uint8_t { workflow_variable, env_variable, block_tag };

    inline constexpr std::string_view to_string(placeholder_kind kind) {
        switch (kind) {
            case placeholder_kind::workflow_variable:
                return "workflow_variable"sv;
            case placeholder_kind::env_variable:
                return "env_variable"sv;
            case placeholder_kind::block_tag:
                return "block_tag"sv;
        }
        return "block_tag"sv;
    }

    // One occurrence of a placeholder in the source text.
    struct placeholder_span {
        placeholder_kind kind{};
        size_t offset{};
        size_t length{};
        // text between the delimiters, trimmed
        std::string name{};
    };

    struct context_binding {
        std::string name{};
        value bound{};
    };

    struct resolved_code {
        std::string code{};
        // generated name -> value, in first-occurrence order
        std::vector<context_binding> bindings{};

        const value* find_binding(std::string_view name) const;
    };

    // `<variable.name>` occurrences.
    std::vector<placeholder_span> find_workflow_variable_placeholders(std::string_view code);

    // `{{name}}` occurrences.
    std::vector<placeholder_span> find_env_placeholders(std::string_view code);

    // `<a.b.c>` occurrences whose contents match [A-Za-z_]([A-Za-z0-9_.]*[A-Za-z0-9_])?.
    std::vector<placeholder_span> find_tag_placeholders(std::string_view code);

    // Lower case, whitespace removed.
    std::string normalize_name(std::string_view name);

    // Reserved prefix plus an injective escape of `name`: '_' -> "_1",
    // '.' -> "_0", other non-alphanumerics -> "_x" + two hex digits per byte.
    std::string make_binding_name(std::string_view prefix, std::string_view name);

    struct block_reference {
        // false when the first segment names no known block
        bool is_block{false};
        // nullopt when the block is known but the path resolves to nothing
        std::optional<value> resolved{};
    };

    // Resolves `<block.path>` segments against the request's block outputs.
    // Throws execution_error(validation) when the block declares an output
    // schema that lacks the referenced field.
    block_reference resolve_block_reference(
            std::string_view block_name, const std::vector<std::string_view>& path, const execution_request& req);

    // Substitutes all three placeholder grammars in `code` (workflow
    // variables, then `{{name}}`, then block tags). All three are located in
    // the original text, so later grammars never see an earlier substitution.
    // Throws execution_error(validation) on an unknown workflow variable.
    resolved_code resolve_references(std::string_view code, const execution_request& req);

}  // namespace runbox
