#include "runbox/resolver.hpp"

#include "runbox/errors.hpp"
#include "runbox/format.hpp"

#include <algorithm>
#include <span>

using namespace runbox::literals;

namespace runbox {

    namespace detail {

        static constexpr bool is_ascii_alpha(char c) {
            return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
        }

        static constexpr bool is_ascii_alnum(char c) {
            return is_ascii_alpha(c) || utils::is_ascii_digit(c);
        }

        static constexpr bool is_tag_char(char c) {
            return is_ascii_alnum(c) || c == '_' || c == '.';
        }

        static std::vector<std::string_view> split_path(std::string_view name) {
            std::vector<std::string_view> parts{};
            size_t cursor = 0U;
            while (true) {
                auto dot = name.find('.', cursor);
                if (dot == std::string_view::npos) {
                    parts.push_back(name.substr(cursor));
                    break;
                }
                parts.push_back(name.substr(cursor, dot - cursor));
                cursor = dot + 1U;
            }
            return parts;
        }

        struct replacement {
            size_t offset{};
            size_t length{};
            std::string text{};
        };

        static bool overlaps(const placeholder_span& span, const std::vector<replacement>& accepted) {
            return std::ranges::any_of(accepted, [&](const replacement& r) {
                return span.offset < r.offset + r.length && r.offset < span.offset + span.length;
            });
        }

        static void add_binding(resolved_code& out, const std::string& name, value v) {
            if (out.find_binding(name) != nullptr) {
                return;
            }
            out.bindings.push_back(context_binding{name, std::move(v)});
        }

        static const workflow_variable* find_workflow_variable(
                const execution_request& req, std::string_view normalized) {
            for (const auto& [id, var] : req.workflow_variables) {
                if (!var.name.empty() && normalize_name(var.name) == normalized) {
                    return &var;
                }
            }
            return nullptr;
        }

        static std::string available_variables(const execution_request& req) {
            std::vector<std::string> names{};
            for (const auto& [id, var] : req.workflow_variables) {
                if (!var.name.empty()) {
                    names.push_back(var.name);
                }
            }
            return utils::join_with_separator(names, ", "sv);
        }

        static std::optional<std::string> lookup_interpolation(const execution_request& req, std::string_view name) {
            if (auto it = req.params.find(name); it != req.params.end() && !is_null(it->second)) {
                return stringify(it->second);
            }
            if (auto it = req.env_vars.find(name); it != req.env_vars.end()) {
                return it->second;
            }
            return std::nullopt;
        }

        static std::optional<value> walk_path(const value& root, std::span<const std::string_view> path) {
            const value* cursor = &root;
            for (auto segment : path) {
                if (auto* obj = as_object(*cursor)) {
                    auto it = obj->find(segment);
                    if (it == obj->end()) {
                        return std::nullopt;
                    }
                    cursor = &it->second;
                    continue;
                }
                if (auto* arr = as_array(*cursor)) {
                    auto index = utils::parse_arithmetic<size_t>(segment);
                    if (!index || *index >= arr->size()) {
                        return std::nullopt;
                    }
                    cursor = &(*arr)[*index];
                    continue;
                }
                return std::nullopt;
            }
            return *cursor;
        }

    }  // namespace detail

    const value* resolved_code::find_binding(std::string_view name) const {
        for (const auto& b : bindings) {
            if (b.name == name) {
                return &b.bound;
            }
        }
        return nullptr;
    }

    std::vector<placeholder_span> find_workflow_variable_placeholders(std::string_view code) {
        static constexpr auto opener = "<variable."sv;
        std::vector<placeholder_span> spans{};
        size_t cursor = 0U;
        while ((cursor = code.find(opener, cursor)) != std::string_view::npos) {
            auto name_start = cursor + opener.size();
            auto close = code.find_first_of(">\n<"sv, name_start);
            if (close == std::string_view::npos || code[close] != '>') {
                cursor += 1U;
                continue;
            }
            auto name = utils::trim_ascii(code.substr(name_start, close - name_start));
            if (name.empty()) {
                cursor += 1U;
                continue;
            }
            spans.push_back(
                    placeholder_span{placeholder_kind::workflow_variable, cursor, close + 1U - cursor, std::string{name}});
            cursor = close + 1U;
        }
        return spans;
    }

    std::vector<placeholder_span> find_env_placeholders(std::string_view code) {
        std::vector<placeholder_span> spans{};
        size_t cursor = 0U;
        while ((cursor = code.find("{{"sv, cursor)) != std::string_view::npos) {
            auto name_start = cursor + 2U;
            auto close = code.find('}', name_start);
            if (close == std::string_view::npos || close == name_start || close + 1U >= code.size() ||
                code[close + 1U] != '}') {
                cursor += 1U;
                continue;
            }
            auto name = utils::trim_ascii(code.substr(name_start, close - name_start));
            if (name.empty()) {
                cursor += 1U;
                continue;
            }
            spans.push_back(placeholder_span{placeholder_kind::env_variable, cursor, close + 2U - cursor, std::string{name}});
            cursor = close + 2U;
        }
        return spans;
    }

    std::vector<placeholder_span> find_tag_placeholders(std::string_view code) {
        std::vector<placeholder_span> spans{};
        size_t cursor = 0U;
        while ((cursor = code.find('<', cursor)) != std::string_view::npos) {
            auto name_start = cursor + 1U;
            if (name_start >= code.size() || !(detail::is_ascii_alpha(code[name_start]) || code[name_start] == '_')) {
                cursor += 1U;
                continue;
            }
            auto end = name_start;
            while (end < code.size() && detail::is_tag_char(code[end])) {
                ++end;
            }
            if (end >= code.size() || code[end] != '>' || code[end - 1U] == '.') {
                cursor += 1U;
                continue;
            }
            spans.push_back(placeholder_span{
                    placeholder_kind::block_tag,
                    cursor,
                    end + 1U - cursor,
                    std::string{code.substr(name_start, end - name_start)}});
            cursor = end + 1U;
        }
        return spans;
    }

    std::string normalize_name(std::string_view name) {
        std::string out{};
        out.reserve(name.size());
        for (auto c : name) {
            if (!utils::is_ascii_space(c)) {
                out.push_back(utils::char_tolower(c));
            }
        }
        return out;
    }

    std::string make_binding_name(std::string_view prefix, std::string_view name) {
        static constexpr auto hex = "0123456789abcdef"sv;
        std::string out{prefix};
        for (auto c : name) {
            if (detail::is_ascii_alnum(c)) {
                out.push_back(c);
            }
            else if (c == '_') {
                out += "_1"sv;
            }
            else if (c == '.') {
                out += "_0"sv;
            }
            else {
                auto byte = static_cast<unsigned char>(c);
                out += "_x"sv;
                out.push_back(hex[byte >> 4U]);
                out.push_back(hex[byte & 0xFU]);
            }
        }
        return out;
    }

    block_reference resolve_block_reference(
            std::string_view block_name, const std::vector<std::string_view>& path, const execution_request& req) {
        block_reference ref{};
        if (block_name == "variable"sv) {
            return ref;
        }

        std::string block_id{};
        auto normalized = normalize_name(block_name);
        if (auto it = req.block_name_mapping.find(normalized); it != req.block_name_mapping.end()) {
            block_id = it->second;
        }
        else if (req.block_data.contains(block_name)) {
            block_id = std::string{block_name};
        }
        else {
            return ref;
        }
        ref.is_block = true;

        if (auto schema = req.block_output_schemas.find(block_id);
            !path.empty() && schema != req.block_output_schemas.end() && !schema->second.empty()) {
            if (!schema->second.contains(path.front())) {
                std::vector<std::string> fields{};
                for (const auto& [field, _] : schema->second) {
                    fields.push_back(field);
                }
                throw execution_error{
                        error_kind::validation,
                        "\"{}\" doesn't exist on block \"{}\". Available fields: {}"_format(
                                path.front(), block_name, utils::join_with_separator(fields, ", "sv))};
            }
        }

        auto data = req.block_data.find(block_id);
        if (data == req.block_data.end()) {
            return ref;
        }
        ref.resolved = detail::walk_path(data->second, path);
        return ref;
    }

    resolved_code resolve_references(std::string_view code, const execution_request& req) {
        resolved_code out{};
        std::vector<detail::replacement> accepted{};

        for (const auto& span : find_workflow_variable_placeholders(code)) {
            auto normalized = normalize_name(span.name);
            const auto* var = detail::find_workflow_variable(req, normalized);
            if (var == nullptr) {
                auto available = detail::available_variables(req);
                throw execution_error{
                        error_kind::validation,
                        available.empty() ? "Variable \"{}\" doesn't exist."_format(span.name)
                                          : "Variable \"{}\" doesn't exist. Available: {}"_format(span.name, available)};
            }
            auto binding = make_binding_name(workflow_variable_prefix, normalized);
            detail::add_binding(out, binding, coerce_variable(var->raw, var->type));
            accepted.push_back(detail::replacement{span.offset, span.length, binding});
        }

        for (const auto& span : find_env_placeholders(code)) {
            if (detail::overlaps(span, accepted)) {
                continue;
            }
            auto text = detail::lookup_interpolation(req, span.name);
            if (!text) {
                continue;
            }
            auto binding = make_binding_name(env_variable_prefix, span.name);
            detail::add_binding(out, binding, make_string(std::move(*text)));
            accepted.push_back(detail::replacement{span.offset, span.length, binding});
        }

        for (const auto& span : find_tag_placeholders(code)) {
            if (detail::overlaps(span, accepted)) {
                continue;
            }
            auto parts = detail::split_path(span.name);
            auto block_name = parts.front();
            std::vector<std::string_view> path{parts.begin() + 1, parts.end()};

            auto ref = resolve_block_reference(block_name, path, req);
            if (!ref.is_block) {
                continue;
            }
            if (!ref.resolved) {
                accepted.push_back(
                        detail::replacement{span.offset, span.length, std::string{undefined_literal(req.lang)}});
                continue;
            }
            auto binding = make_binding_name(block_tag_prefix, span.name);
            detail::add_binding(out, binding, parse_if_json_container(std::move(*ref.resolved)));
            accepted.push_back(detail::replacement{span.offset, span.length, binding});
        }

        std::ranges::sort(accepted, {}, &detail::replacement::offset);

        out.code = std::string{code};
        for (auto it = accepted.rbegin(); it != accepted.rend(); ++it) {
            out.code.replace(it->offset, it->length, it->text);
        }
        return out;
    }

}  // namespace runbox
