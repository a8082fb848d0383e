#include <catch2/catch_all.hpp>

#include "jsonapi/json.hpp"
#include "jsonapi/convert.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

using namespace Catch;

namespace blog {

    struct Author {
        std::string name;
        std::optional<std::int32_t> age;
        std::vector<std::string> tags;
    };

    void to_json(JsonApi::value& v, const Author& a) {
        JsonApi::ObjectWriter{ v }
            .field("name", a.name)
            .optional("age", a.age)
            .field("tags", a.tags);
    }

    JsonApi::Status from_json(const JsonApi::value& v, Author& a) {
        auto obj = JsonApi::ObjectReader::open(v);
        if (!obj) return std::unexpected(obj.error());
        if (auto s = obj->required("name", a.name); !s) return s;
        if (auto s = obj->optional("age", a.age); !s) return s;
        return obj->required("tags", a.tags);
    }

} // namespace blog

namespace {

    JsonApi::value parse_ok(std::string_view text) {
        auto r = JsonApi::parse(text);
        REQUIRE(r);
        return std::move(*r);
    }

}


TEST_CASE("User Types Satisfy the Capability Concepts") {
    STATIC_REQUIRE(JsonApi::JsonConvertible<blog::Author>);
    STATIC_REQUIRE(JsonApi::JsonConvertible<std::vector<blog::Author>>);
    STATIC_REQUIRE(JsonApi::JsonConvertible<std::map<std::string, blog::Author, std::less<>>>);
    STATIC_REQUIRE(JsonApi::JsonConvertible<std::optional<double>>);
    STATIC_REQUIRE_FALSE(JsonApi::JsonSerializable<std::pair<int, int>>);
}

TEST_CASE("Decode User Type") {
    auto v = parse_ok(R"({"name":"Ada","age":36,"tags":["math","engines"],"extra":true})");
    auto author = JsonApi::deserialize<blog::Author>(v);

    REQUIRE(author);
    REQUIRE(author->name == "Ada");
    REQUIRE(author->age == 36);
    REQUIRE(author->tags == std::vector<std::string>{ "math", "engines" });
}

TEST_CASE("Encode User Type Omits Absent Optionals") {
    blog::Author a{ "Ada", std::nullopt, { "math" } };
    REQUIRE(JsonApi::dump(JsonApi::serialize(a)) == R"({"name":"Ada","tags":["math"]})");

    a.age = 36;
    REQUIRE(JsonApi::dump(JsonApi::serialize(a)) == R"({"name":"Ada","age":36,"tags":["math"]})");
}

TEST_CASE("Null Optional Member Reads as Absent") {
    auto author = JsonApi::deserialize<blog::Author>(parse_ok(R"({"name":"Ada","age":null,"tags":[]})"));
    REQUIRE(author);
    REQUIRE_FALSE(author->age.has_value());
}

TEST_CASE("Missing Required Member") {
    auto author = JsonApi::deserialize<blog::Author>(parse_ok(R"({"tags":[]})"));
    REQUIRE_FALSE(author);
    REQUIRE(author.error().errc == JsonApi::DecodeError::code::missing_member);
    REQUIRE(author.error().pointer == "/name");
}

TEST_CASE("Type Mismatch Reports a JSON Pointer") {
    auto author = JsonApi::deserialize<blog::Author>(parse_ok(R"({"name":"Ada","tags":["ok",7]})"));
    REQUIRE_FALSE(author);
    REQUIRE(author.error().errc == JsonApi::DecodeError::code::type_mismatch);
    REQUIRE(author.error().pointer == "/tags/1");
    REQUIRE(author.error().msg == "expected string, got number");
}

TEST_CASE("Pointer Segments are Escaped") {
    using Map = std::map<std::string, double, std::less<>>;
    auto m = JsonApi::deserialize<Map>(parse_ok(R"({"a/b~c":"no"})"));
    REQUIRE_FALSE(m);
    REQUIRE(m.error().pointer == "/a~1b~0c");
}

TEST_CASE("Integers Must be Whole and in Range") {
    REQUIRE(JsonApi::deserialize<std::int32_t>(parse_ok("42")).value() == 42);
    REQUIRE(JsonApi::deserialize<std::int64_t>(parse_ok("-9000000000")).value() == -9000000000);

    REQUIRE_FALSE(JsonApi::deserialize<std::int32_t>(parse_ok("1.5")));
    REQUIRE_FALSE(JsonApi::deserialize<std::uint8_t>(parse_ok("256")));
    REQUIRE_FALSE(JsonApi::deserialize<std::uint32_t>(parse_ok("-1")));
}

TEST_CASE("Scalars Decode Only From Their Own Kind") {
    REQUIRE(JsonApi::deserialize<bool>(parse_ok("true")).value());
    REQUIRE(JsonApi::deserialize<double>(parse_ok("2.5")).value() == Approx(2.5));
    REQUIRE(JsonApi::deserialize<std::string>(parse_ok(R"("x")")).value() == "x");

    auto wrong = JsonApi::deserialize<bool>(parse_ok("1"));
    REQUIRE_FALSE(wrong);
    REQUIRE(wrong.error().errc == JsonApi::DecodeError::code::type_mismatch);
    REQUIRE(wrong.error().pointer.empty());
}

TEST_CASE("Optional Round-Trips Through Null") {
    std::optional<double> none;
    REQUIRE(JsonApi::serialize(none).is_null());

    auto back = JsonApi::deserialize<std::optional<double>>(parse_ok("null"));
    REQUIRE(back);
    REQUIRE_FALSE(back->has_value());
}

TEST_CASE("Object Reader Collects Remaining Members in Order") {
    auto v = parse_ok(R"({"z":1,"known":true,"a":{"b":2}})");
    auto obj = JsonApi::ObjectReader::open(v);
    REQUIRE(obj);

    REQUIRE(obj->take("known") != nullptr);
    REQUIRE(obj->take("missing") == nullptr);

    auto rest = obj->remaining();
    REQUIRE(rest.size() == 2);
    REQUIRE(rest[0].first == "z");
    REQUIRE(rest[1].first == "a");
}

TEST_CASE("Object Reader Rejects Non-Objects") {
    auto v = parse_ok("[1]");
    auto obj = JsonApi::ObjectReader::open(v);
    REQUIRE_FALSE(obj);
    REQUIRE(obj.error().errc == JsonApi::DecodeError::code::type_mismatch);
}

TEST_CASE("Meta Members Must be Objects") {
    auto v = parse_ok(R"({"meta":[1]})");
    auto obj = JsonApi::ObjectReader::open(v);
    REQUIRE(obj);

    std::optional<JsonApi::value> meta;
    auto s = obj->optional_object("meta", meta);
    REQUIRE_FALSE(s);
    REQUIRE(s.error().pointer == "/meta");
}

TEST_CASE("Object Writer Extend Skips Written Keys") {
    JsonApi::value out;
    JsonApi::object extra;
    extra.emplace_back(JsonApi::string{ "a" }, JsonApi::value{ "dup" });
    extra.emplace_back(JsonApi::string{ "b" }, JsonApi::value{ true });

    JsonApi::ObjectWriter{ out }.field("a", 1.0).extend(extra);
    REQUIRE(JsonApi::dump(out) == R"({"a":1,"b":true})");
}

TEST_CASE("Describe Decode Error") {
    auto e = JsonApi::DecodeError::make(JsonApi::DecodeError::code::type_mismatch, "expected string, got number");
    e.within("title").within("attributes").within(std::size_t{ 0 });
    REQUIRE(JsonApi::describe(e) == "type_mismatch: expected string, got number at /0/attributes/title");
}
