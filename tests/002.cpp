#include "utils.hpp"

namespace runbox::test {
    using namespace std::string_view_literals;

    TEST_CASE("002: json round trip keeps integers integral", "[002][value]") {
        auto v = detail::json(R"({"a": 1, "b": [true, null, 2.5], "c": "x\"y"})");
        CHECK(type_of(v) == value_type::object);
        CHECK(to_json(v) == R"({"a":1,"b":[true,null,2.5],"c":"x\"y"})");

        CHECK(to_json(make_number(42.0)) == "42");
        CHECK(to_json(make_number(-0.5)) == "-0.5");
        CHECK(to_json(make_null()) == "null");
        CHECK_FALSE(parse_json("{oops").has_value());
    }

    TEST_CASE("002: non-finite numbers serialize as null", "[002][value]") {
        auto inf = std::numeric_limits<double>::infinity();
        CHECK(to_json(make_number(inf)) == "null");
        CHECK(to_json(make_array({make_number(1.0), make_number(std::nan(""))})) == "[1,null]");

        value_object members{};
        members.emplace("ok", make_number(2.0));
        members.emplace("bad", make_number(-inf));
        CHECK(to_json(make_object(std::move(members))) == R"({"bad":null,"ok":2})");

        CHECK(format_literal(make_number(inf), language::python) == "None");
        CHECK(format_literal(make_number(1.5), language::python) == "1.5");
    }

    TEST_CASE("002: stringify leaves strings bare", "[002][value]") {
        CHECK(stringify(make_string("plain")) == "plain");
        CHECK(stringify(make_number(3.0)) == "3");
        CHECK(stringify(make_bool(false)) == "false");
        CHECK(stringify(detail::json(R"([1,"a"])")) == R"([1,"a"])");
    }

    TEST_CASE("002: json-looking strings are parsed opportunistically", "[002][value]") {
        auto obj = parse_if_json_container(make_string(R"( {"k": [1, 2]} )"));
        REQUIRE(as_object(obj) != nullptr);
        CHECK(as_object(obj)->contains("k"));

        auto broken = parse_if_json_container(make_string("{not json"));
        REQUIRE(as_string(broken) != nullptr);
        CHECK(*as_string(broken) == "{not json");

        auto scalar = parse_if_json_container(make_string("42"));
        REQUIRE(as_string(scalar) != nullptr);
        CHECK(*as_string(scalar) == "42");
    }

    TEST_CASE("002: variable type names", "[002][value][coercion]") {
        CHECK(parse_variable_type("number"sv) == variable_type::number);
        CHECK(parse_variable_type("Boolean"sv) == variable_type::boolean);
        CHECK(parse_variable_type("json"sv) == variable_type::json);
        CHECK(parse_variable_type("object"sv) == variable_type::json);
        CHECK(parse_variable_type("array"sv) == variable_type::json);
        CHECK(parse_variable_type("string"sv) == variable_type::plain);
        CHECK(parse_variable_type("plain"sv) == variable_type::plain);
        CHECK(parse_variable_type("mystery"sv) == variable_type::plain);
    }

    TEST_CASE("002: number coercion follows JavaScript Number()", "[002][value][coercion]") {
        auto num = [](value raw) { return as_number(coerce_variable(raw, variable_type::number)); };

        CHECK(num(make_string("42")) == std::optional<double>{42.0});
        CHECK(num(make_string("  -3.5 ")) == std::optional<double>{-3.5});
        CHECK(num(make_string("")) == std::optional<double>{0.0});
        CHECK(num(make_string("0x1F")) == std::optional<double>{31.0});
        CHECK(num(make_string("0b101")) == std::optional<double>{5.0});
        CHECK(num(make_string(".5")) == std::optional<double>{0.5});
        CHECK(num(make_string("1e3")) == std::optional<double>{1000.0});
        CHECK(num(make_bool(true)) == std::optional<double>{1.0});
        CHECK(num(make_number(7.0)) == std::optional<double>{7.0});

        CHECK(is_null(coerce_variable(make_string("12abc"), variable_type::number)));
        CHECK(is_null(coerce_variable(make_string("1e999"), variable_type::number)));
        CHECK(is_null(coerce_variable(make_null(), variable_type::number)));
    }

    TEST_CASE("002: boolean and json coercion", "[002][value][coercion]") {
        CHECK(as_bool(coerce_variable(make_string(" TRUE "), variable_type::boolean)) == std::optional<bool>{true});
        CHECK(as_bool(coerce_variable(make_string("yes"), variable_type::boolean)) == std::optional<bool>{false});
        CHECK(as_bool(coerce_variable(make_bool(true), variable_type::boolean)) == std::optional<bool>{true});

        auto parsed = coerce_variable(make_string(R"({"a": [1]})"), variable_type::json);
        CHECK(type_of(parsed) == value_type::object);

        auto kept = coerce_variable(make_string("{broken"), variable_type::json);
        REQUIRE(as_string(kept) != nullptr);
        CHECK(*as_string(kept) == "{broken");

        auto plain = coerce_variable(make_string("42"), variable_type::plain);
        REQUIRE(as_string(plain) != nullptr);
        CHECK(*as_string(plain) == "42");
    }

    TEST_CASE("002: literals per language", "[002][value][literal]") {
        CHECK(format_literal(make_null(), language::python) == "None");
        CHECK(format_literal(make_bool(true), language::python) == "True");
        CHECK(format_literal(make_number(2.0), language::python) == "2");
        CHECK(format_literal(make_string("a\"b"), language::python) == R"("a\"b")");
        CHECK(format_literal(detail::json(R"({"x":1})"), language::python) == R"(json.loads("{\"x\":1}"))");

        CHECK(format_literal(make_null(), language::javascript) == "null");
        CHECK(format_literal(detail::json(R"({"x":[1,2]})"), language::javascript) == R"({"x":[1,2]})");
        CHECK(format_deserialized(detail::json("[1]"), language::javascript) == R"(JSON.parse("[1]"))");

        CHECK(undefined_literal(language::javascript) == "undefined"sv);
        CHECK(undefined_literal(language::python) == "None"sv);
    }
}  // namespace runbox::test
