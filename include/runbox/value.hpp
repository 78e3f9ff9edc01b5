#pragma once

#include "config.hpp"

#include <glaze/glaze.hpp>

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace runbox {

    // Dynamic payload type for params, block outputs and bindings:
    // null | number | string | bool | array | object.
    using value = glz::generic;
    using value_array = value::array_t;
    using value_object = value::object_t;

    enum class value_type : uint8_t { null, number, string, boolean, array, object };

    inline constexpr std::string_view to_string(value_type type) {
        switch (type) {
            case value_type::null:
                return "null"sv;
            case value_type::number:
                return "number"sv;
            case value_type::string:
                return "string"sv;
            case value_type::boolean:
                return "boolean"sv;
            case value_type::array:
                return "array"sv;
            case value_type::object:
                return "object"sv;
        }
        return "null"sv;
    }

    value_type type_of(const value& v);

    inline bool is_null(const value& v) {
        return type_of(v) == value_type::null;
    }

    value make_null();
    value make_number(double number);
    value make_string(std::string text);
    value make_bool(bool flag);
    value make_array(value_array items = {});
    value make_object(value_object members = {});

    const std::string* as_string(const value& v);
    const value_object* as_object(const value& v);
    const value_array* as_array(const value& v);
    std::optional<double> as_number(const value& v);
    std::optional<bool> as_bool(const value& v);

    std::optional<value> parse_json(std::string_view text);
    std::string to_json(const value& v);

    // JSON text of `text` as a string literal, e.g. `a"b` -> `"a\"b"`.
    std::string quote_json_string(std::string_view text);

    // Textual form used for template interpolation: strings verbatim,
    // scalars in their JSON spelling, containers as JSON.
    std::string stringify(const value& v);

    // Trimmed text starts with '{' or '['.
    bool looks_like_json_container(std::string_view text);

    // JSON-looking strings are parsed back into structured values; anything
    // else (including unparseable text) is returned unchanged.
    value parse_if_json_container(value v);

    // Literal spelling of `v` in source code of `lang`.
    std::string format_literal(const value& v, language lang);

    // Literal used for references that resolve to nothing.
    inline constexpr std::string_view undefined_literal(language lang) {
        return lang == language::python ? "None"sv : "undefined"sv;
    }

    // Declaration form used by prologues: JSON.parse("<json>") or json.loads("<json>").
    std::string format_deserialized(const value& v, language lang);

    // Declared workflow-variable types and their canonical coercion.
    enum class variable_type : uint8_t { plain, number, boolean, json };

    inline constexpr std::string_view to_string(variable_type type) {
        switch (type) {
            case variable_type::plain:
                return "plain"sv;
            case variable_type::number:
                return "number"sv;
            case variable_type::boolean:
                return "boolean"sv;
            case variable_type::json:
                return "json"sv;
        }
        return "plain"sv;
    }

    // "string" is an alias of "plain"; "object"/"array" are aliases of "json".
    // Unknown names map to plain.
    variable_type parse_variable_type(std::string_view name);

    value coerce_variable(const value& raw, variable_type type);

    // Number(text) semantics: trimmed, empty -> 0, 0x/0o/0b prefixes, Infinity
    // and unparseable text -> nullopt.
    std::optional<double> parse_js_number(std::string_view text);

}  // namespace runbox
