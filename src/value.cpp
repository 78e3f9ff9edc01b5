#include "runbox/value.hpp"

#include "runbox/format.hpp"

#include <cmath>
#include <limits>

namespace runbox {

    using namespace runbox::literals;

    namespace detail {
        static bool has_non_finite(const value& v) {
            if (auto n = as_number(v)) {
                return !std::isfinite(*n);
            }
            if (auto* items = as_array(v)) {
                return std::ranges::any_of(*items, [](const value& item) { return has_non_finite(item); });
            }
            if (auto* members = as_object(v)) {
                return std::ranges::any_of(*members, [](const auto& kv) { return has_non_finite(kv.second); });
            }
            return false;
        }

        // JSON has no NaN or Infinity; they serialize as null like JSON.stringify
        static value without_non_finite(const value& v) {
            if (auto n = as_number(v)) {
                return std::isfinite(*n) ? v : make_null();
            }
            if (auto* items = as_array(v)) {
                value_array out{};
                out.reserve(items->size());
                for (const auto& item : *items) {
                    out.push_back(without_non_finite(item));
                }
                return make_array(std::move(out));
            }
            if (auto* members = as_object(v)) {
                value_object out{};
                for (const auto& [key, member] : *members) {
                    out.emplace(key, without_non_finite(member));
                }
                return make_object(std::move(out));
            }
            return v;
        }

        static bool is_decimal_number_char(char c) {
            return utils::is_ascii_digit(c) || c == '.' || c == 'e' || c == 'E' || c == '+' || c == '-';
        }

        static std::optional<double> parse_radix(std::string_view digits, int base) {
            if (digits.empty()) {
                return std::nullopt;
            }
            double out = 0.0;
            for (auto c : digits) {
                int digit = -1;
                auto lower = utils::char_tolower(c);
                if (utils::is_ascii_digit(lower)) {
                    digit = lower - '0';
                }
                else if (lower >= 'a' && lower <= 'f') {
                    digit = 10 + (lower - 'a');
                }
                if (digit < 0 || digit >= base) {
                    return std::nullopt;
                }
                out = out * base + digit;
            }
            return out;
        }
    }  // namespace detail

    value_type type_of(const value& v) {
        return std::visit(
                [](const auto& data) -> value_type {
                    using T = std::decay_t<decltype(data)>;
                    if constexpr (std::is_same_v<T, double>) {
                        return value_type::number;
                    }
                    else if constexpr (std::is_same_v<T, std::string>) {
                        return value_type::string;
                    }
                    else if constexpr (std::is_same_v<T, bool>) {
                        return value_type::boolean;
                    }
                    else if constexpr (std::is_same_v<T, value_array>) {
                        return value_type::array;
                    }
                    else if constexpr (std::is_same_v<T, value_object>) {
                        return value_type::object;
                    }
                    else {
                        return value_type::null;
                    }
                },
                v.data);
    }

    value make_null() {
        value v{};
        v.data = value::null_t{};
        return v;
    }

    value make_number(double number) {
        value v{};
        v.data = number;
        return v;
    }

    value make_string(std::string text) {
        value v{};
        v.data = std::move(text);
        return v;
    }

    value make_bool(bool flag) {
        value v{};
        v.data = flag;
        return v;
    }

    value make_array(value_array items) {
        value v{};
        v.data = std::move(items);
        return v;
    }

    value make_object(value_object members) {
        value v{};
        v.data = std::move(members);
        return v;
    }

    const std::string* as_string(const value& v) {
        return std::get_if<std::string>(&v.data);
    }

    const value_object* as_object(const value& v) {
        return std::get_if<value_object>(&v.data);
    }

    const value_array* as_array(const value& v) {
        return std::get_if<value_array>(&v.data);
    }

    std::optional<double> as_number(const value& v) {
        if (auto* d = std::get_if<double>(&v.data)) {
            return *d;
        }
        return std::nullopt;
    }

    std::optional<bool> as_bool(const value& v) {
        if (auto* b = std::get_if<bool>(&v.data)) {
            return *b;
        }
        return std::nullopt;
    }

    std::optional<value> parse_json(std::string_view text) {
        // glaze wants a null-terminated buffer
        std::string buffer{text};
        value out{};
        if (auto ec = glz::read_json(out, buffer)) {
            return std::nullopt;
        }
        return out;
    }

    std::string to_json(const value& v) {
        std::string out{};
        if (detail::has_non_finite(v)) {
            (void)glz::write_json(detail::without_non_finite(v), out);
        }
        else {
            (void)glz::write_json(v, out);
        }
        return out;
    }

    std::string quote_json_string(std::string_view text) {
        std::string out{};
        (void)glz::write_json(std::string{text}, out);
        return out;
    }

    std::string stringify(const value& v) {
        if (auto* text = as_string(v)) {
            return *text;
        }
        return to_json(v);
    }

    bool looks_like_json_container(std::string_view text) {
        text = utils::trim_ascii(text);
        return !text.empty() && (text.front() == '{' || text.front() == '[');
    }

    value parse_if_json_container(value v) {
        auto* text = as_string(v);
        if (text == nullptr || !looks_like_json_container(*text)) {
            return v;
        }
        if (auto parsed = parse_json(*text)) {
            return std::move(*parsed);
        }
        return v;
    }

    std::string format_literal(const value& v, language lang) {
        if (lang == language::javascript) {
            return to_json(v);
        }
        switch (type_of(v)) {
            case value_type::null:
                return "None";
            case value_type::boolean:
                return *as_bool(v) ? "True" : "False";
            case value_type::number:
                return std::isfinite(*as_number(v)) ? to_json(v) : std::string{"None"};
            case value_type::string:
                return quote_json_string(*as_string(v));
            case value_type::array:
            case value_type::object:
                return format_deserialized(v, lang);
        }
        return "None";
    }

    std::string format_deserialized(const value& v, language lang) {
        auto quoted = quote_json_string(to_json(v));
        if (lang == language::python) {
            return "json.loads({})"_format(quoted);
        }
        return "JSON.parse({})"_format(quoted);
    }

    variable_type parse_variable_type(std::string_view name) {
        name = utils::trim_ascii(name);
        if (utils::str_case_eq(name, "number"sv)) {
            return variable_type::number;
        }
        if (utils::str_case_eq(name, "boolean"sv)) {
            return variable_type::boolean;
        }
        if (utils::str_case_eq(name, "json"sv) || utils::str_case_eq(name, "object"sv) ||
            utils::str_case_eq(name, "array"sv)) {
            return variable_type::json;
        }
        return variable_type::plain;
    }

    std::optional<double> parse_js_number(std::string_view text) {
        text = utils::trim_ascii(text);
        if (text.empty()) {
            return 0.0;
        }

        if (text.size() > 2U && text[0] == '0') {
            auto prefix = utils::char_tolower(text[1]);
            if (prefix == 'x') {
                return detail::parse_radix(text.substr(2U), 16);
            }
            if (prefix == 'o') {
                return detail::parse_radix(text.substr(2U), 8);
            }
            if (prefix == 'b') {
                return detail::parse_radix(text.substr(2U), 2);
            }
        }

        if (!std::ranges::all_of(text, detail::is_decimal_number_char)) {
            return std::nullopt;
        }

        auto body = text;
        bool negative = false;
        if (body.front() == '+' || body.front() == '-') {
            negative = body.front() == '-';
            body.remove_prefix(1U);
        }
        if (body.empty() || body.front() == '+' || body.front() == '-') {
            return std::nullopt;
        }

        // from_chars rejects a bare leading '.'; JS accepts ".5"
        std::string digits{};
        if (body.front() == '.') {
            digits.push_back('0');
        }
        digits.append(body);

        auto parsed = utils::parse_arithmetic<double>(digits);
        if (!parsed) {
            // "5." is a valid JS number
            if (digits.back() == '.') {
                digits.pop_back();
                parsed = utils::parse_arithmetic<double>(digits);
            }
            if (!parsed) {
                return std::nullopt;
            }
        }
        if (!std::isfinite(*parsed)) {
            return std::nullopt;
        }
        return negative ? -*parsed : *parsed;
    }

    value coerce_variable(const value& raw, variable_type type) {
        if (is_null(raw)) {
            return raw;
        }

        switch (type) {
            case variable_type::plain:
                return raw;
            case variable_type::number: {
                if (as_number(raw)) {
                    return raw;
                }
                if (auto flag = as_bool(raw)) {
                    return make_number(*flag ? 1.0 : 0.0);
                }
                if (auto* text = as_string(raw)) {
                    if (auto parsed = parse_js_number(*text)) {
                        return make_number(*parsed);
                    }
                }
                return make_null();
            }
            case variable_type::boolean: {
                if (as_bool(raw)) {
                    return raw;
                }
                auto normalized = utils::to_lower_ascii(utils::trim_ascii(stringify(raw)));
                return make_bool(normalized == "true");
            }
            case variable_type::json: {
                if (auto* text = as_string(raw)) {
                    if (auto parsed = parse_json(*text)) {
                        return std::move(*parsed);
                    }
                }
                return raw;
            }
        }
        return raw;
    }

}  // namespace runbox
