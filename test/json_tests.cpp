#include <catch2/catch_all.hpp>

#include "jsonapi/json.hpp"

#include <cmath>
#include <limits>
#include <random>
#include <sstream>
#include <stdexcept>

using namespace Catch;

namespace {

    struct rng {
        std::mt19937_64 eng;

        rng() : eng(std::random_device{}()) {}

        size_t uniform_size(size_t min, size_t max) {
            std::uniform_int_distribution<size_t> dist(min, max);
            return dist(eng);
        }

        bool coin(double p = 0.5) {
            std::bernoulli_distribution dist(p);
            return dist(eng);
        }

        double uniform_double() {
            std::uniform_real_distribution dist(-1e6, 1e6);
            return dist(eng);
        }

        char ascii_char() {
            std::uniform_int_distribution<int> dist(32, 126);
            return static_cast<char>(dist(eng));
        }

        std::string random_string(size_t max_len = 16) {
            size_t len = uniform_size(0, max_len);
            std::string s;
            s.reserve(len);
            for (size_t i = 0; i < len; i++)
                s.push_back(ascii_char());
            return s;
        }
    };

    JsonApi::value random_json_value(rng& r, int depth = 0, int max_depth = 4);

    JsonApi::value random_primitive(rng& r) {
        switch (r.uniform_size(0, 3)) {
            case 0: return JsonApi::value{ nullptr };
            case 1: return JsonApi::value{ r.coin() };
            case 2: return JsonApi::value{ r.uniform_double() };
            case 3: {
                auto s = r.random_string();
                return JsonApi::value{ std::string_view{ s } };
            }
        }
        return JsonApi::value{ nullptr };
    }

    JsonApi::value random_array(rng& r, int depth, int max_depth) {
        auto res = JsonApi::value{};
        auto& arr = res.as_array();
        size_t n = r.uniform_size(0, 8);
        for (size_t i = 0; i < n; i++)
            arr.emplace_back(random_json_value(r, depth + 1, max_depth));
        return res;
    }

    JsonApi::value random_object(rng& r, int depth, int max_depth) {
        auto res = JsonApi::value{};
        (void)res.as_object();
        size_t n = r.uniform_size(0, 8);
        for (size_t i = 0; i < n; i++) {
            auto key = r.random_string();
            res[key] = random_json_value(r, depth + 1, max_depth);
        }
        return res;
    }

    JsonApi::value random_json_value(rng& r, int depth, int max_depth) {
        if (depth >= max_depth) return random_primitive(r);

        switch (r.uniform_size(0, 5)) {
            case 0:
            case 1:
                return random_primitive(r);
            case 2:
            case 3:
                return random_array(r, depth, max_depth);
            case 4:
            case 5:
                return random_object(r, depth, max_depth);
        }
        return random_primitive(r);
    }

    JsonApi::ParseResult parse_str(std::string_view s, const JsonApi::ParseOptions& opts = {}) {
        return JsonApi::parse(s, opts);
    }

    void expect_ok(std::string_view s, const JsonApi::ParseOptions& opts = {}) {
        auto r = parse_str(s, opts);
        REQUIRE(r);
    }

    void expect_fail(std::string_view s, JsonApi::ParseError::code code, const JsonApi::ParseOptions& opts = {}) {
        auto r = parse_str(s, opts);
        REQUIRE_FALSE(r);
        REQUIRE(r.error().errc == code);
    }

    struct CountingResource : std::pmr::memory_resource {
        size_t allocs = 0;
        size_t deallocs = 0;

        void* do_allocate(size_t bytes, size_t alignment) override {
            allocs++;
            return std::pmr::get_default_resource()->allocate(bytes, alignment);
        }

        void do_deallocate(void* p, size_t bytes, size_t alignment) override {
            deallocs++;
            std::pmr::get_default_resource()->deallocate(p, bytes, alignment);
        }

        bool do_is_equal(const std::pmr::memory_resource& other) const noexcept override {
            return this == &other;
        }
    };
}


TEST_CASE("DOM Dump/parse Round-Trip") {
    rng r;

    for (int i = 0; i < 100; i++) {
        JsonApi::value original = random_json_value(r);

        JsonApi::WriteOptions opts;
        opts.pretty = (i % 2 == 0);

        std::string s = JsonApi::dump(original, opts);
        INFO("dumped: " << s);

        auto parsed = JsonApi::parse(s);
        REQUIRE(parsed.has_value());
        REQUIRE(parsed.value() == original);
    }
}

TEST_CASE("Parse Primitives") {
    using JsonApi::parse;

    auto n = parse("null");
    REQUIRE(n);
    REQUIRE(n->is_null());

    auto t = parse("true");
    REQUIRE(t);
    REQUIRE(t->is_bool());
    REQUIRE(t->as_bool() == true);

    auto num = parse("123.5e-1");
    REQUIRE(num);
    REQUIRE(num->as_number() == Approx(12.35));
}

TEST_CASE("Parse String Escapes") {
    auto r = JsonApi::parse(R"("line\nbreak")");
    REQUIRE(r);
    REQUIRE(r->as_string() == "line\nbreak");

    auto euro = JsonApi::parse(R"("\u20AC")");
    REQUIRE(euro);
    REQUIRE(euro->as_string() == "\xE2\x82\xAC");

    auto emoji = JsonApi::parse(R"("\uD83D\uDE00")");
    REQUIRE(emoji);
    REQUIRE(emoji->as_string() == "\xF0\x9F\x98\x80");
}

TEST_CASE("Objects Keep Insertion Order") {
    auto r = JsonApi::parse(R"({"z":1,"a":2,"m":3})");
    REQUIRE(r);

    const auto& obj = r->as_object();
    REQUIRE(obj.size() == 3);
    REQUIRE(obj[0].first == "z");
    REQUIRE(obj[1].first == "a");
    REQUIRE(obj[2].first == "m");

    REQUIRE(JsonApi::dump(*r) == R"({"z":1,"a":2,"m":3})");
}

TEST_CASE("Sort Keys Option Orders Output") {
    auto r = JsonApi::parse(R"({"z":1,"a":{"y":true,"b":false}})");
    REQUIRE(r);
    REQUIRE(JsonApi::dump(*r, { .sort_keys = true }) == R"({"a":{"b":false,"y":true},"z":1})");
}

TEST_CASE("Equality Ignores Key Order") {
    auto a = JsonApi::parse(R"({"x":1,"y":[true,null]})");
    auto b = JsonApi::parse(R"({"y":[true,null],"x":1})");
    auto c = JsonApi::parse(R"({"y":[null,true],"x":1})");
    REQUIRE(a);
    REQUIRE(b);
    REQUIRE(c);

    REQUIRE(*a == *b);
    REQUIRE(*a != *c);
}

TEST_CASE("Equality Checks Keys on Both Sides") {
    JsonApi::object dup;
    dup.emplace_back(JsonApi::string{ "a" }, JsonApi::value{ 1.0 });
    dup.emplace_back(JsonApi::string{ "a" }, JsonApi::value{ 1.0 });

    JsonApi::object distinct;
    distinct.emplace_back(JsonApi::string{ "a" }, JsonApi::value{ 1.0 });
    distinct.emplace_back(JsonApi::string{ "b" }, JsonApi::value{ 2.0 });

    REQUIRE_FALSE(JsonApi::same_members(dup, distinct));
    REQUIRE_FALSE(JsonApi::same_members(distinct, dup));
    REQUIRE(JsonApi::value{ dup } != JsonApi::value{ distinct });
    REQUIRE(JsonApi::value{ distinct } != JsonApi::value{ dup });
}

TEST_CASE("Duplicate Names Keep First Position and Last Value") {
    auto r = parse_str(R"({"a":1,"b":2,"a":3})");
    REQUIRE(r);

    const auto& obj = r->as_object();
    REQUIRE(obj.size() == 2);
    REQUIRE(obj[0].first == "a");
    REQUIRE(obj[0].second.as_number() == Approx(3.0));
    REQUIRE(r->at("b").as_number() == Approx(2.0));
}

TEST_CASE("Pretty Output Uses Indent") {
    JsonApi::value v;
    v["a"] = 1.0;
    v["b"].as_array().emplace_back(true);

    std::string expected = "{\n    \"a\": 1,\n    \"b\": [\n        true\n    ]\n}";
    REQUIRE(JsonApi::dump(v, { .pretty = true, .indent = 4 }) == expected);
}

TEST_CASE("Numbers Dump in Shortest Form") {
    REQUIRE(JsonApi::dump(JsonApi::value{ 42.0 }) == "42");
    REQUIRE(JsonApi::dump(JsonApi::value{ 0.1 }) == "0.1");
    REQUIRE(JsonApi::dump(JsonApi::value{ -2.5 }) == "-2.5");
}

TEST_CASE("Strings Are Escaped on Output") {
    JsonApi::value v{ "quote \" backslash \\ newline \n tab \t bell \x07" };
    REQUIRE(JsonApi::dump(v) == R"("quote \" backslash \\ newline \n tab \t bell \u0007")");
}

TEST_CASE("Empty Array and Object Round-Trip") {
    JsonApi::value arr;
    (void)arr.as_array();

    JsonApi::value obj;
    (void)obj.as_object();

    auto r1 = JsonApi::parse(JsonApi::dump(arr));
    auto r2 = JsonApi::parse(JsonApi::dump(obj));

    REQUIRE(r1);
    REQUIRE(r1->is_array());
    REQUIRE(r1->as_array().empty());

    REQUIRE(r2);
    REQUIRE(r2->is_object());
    REQUIRE(r2->as_object().empty());
}

TEST_CASE("Object Operator[] Inserts Keys") {
    JsonApi::value v;
    v["x"] = 1.0;

    REQUIRE(v.is_object());
    REQUIRE(v["x"].as_number() == Approx(1.0));

    v["foo"];
    REQUIRE(v.contains("foo"));
    REQUIRE(v["foo"].is_null());
}

TEST_CASE("Array Operator[] Grows and Fills with Null") {
    JsonApi::value v;
    v["a"][3] = 42.0;

    auto& arr = v["a"].as_array();
    REQUIRE(arr.size() == 4);
    REQUIRE(arr[0].is_null());
    REQUIRE(arr[3].as_number() == Approx(42.0));
}

TEST_CASE("Find, At and Erase") {
    auto r = JsonApi::parse(R"({"a":1,"b":"two"})");
    REQUIRE(r);

    REQUIRE(r->find("a") != nullptr);
    REQUIRE(r->find("missing") == nullptr);
    REQUIRE(r->at("b").as_string() == "two");
    REQUIRE_THROWS_AS(r->at("missing"), std::out_of_range);

    REQUIRE(r->erase("a"));
    REQUIRE_FALSE(r->erase("a"));
    REQUIRE(r->size() == 1);
}

TEST_CASE("Value Uses Provided memory_resource") {
    CountingResource res;
    JsonApi::value v{ &res };

    v["key"] = "value";
    v["arr"].as_array().emplace_back(123.0);

    REQUIRE(res.allocs > 0);
    REQUIRE(v.resource() == &res);
}

TEST_CASE("Copies Are Deep") {
    JsonApi::value a;
    a["list"].as_array().emplace_back("x");

    JsonApi::value b = a;
    b["list"].as_array().emplace_back("y");

    REQUIRE(a["list"].size() == 1);
    REQUIRE(b["list"].size() == 2);
}

TEST_CASE("Line and Block Comments Are Accepted When Allowed") {
    std::string s = R"(
        // comment
        {
            "x": 1, /* comment */ "y": 2
        }
    )";

    JsonApi::ParseOptions opts;
    opts.allow_comments = true;

    auto r = JsonApi::parse(s, opts);
    REQUIRE(r);
    REQUIRE(r->as_object().size() == 2);
}

TEST_CASE("Comments Rejected When Not Allowed") {
    expect_fail("{ // comment\n \"x\": 1 }", JsonApi::ParseError::code::comment_not_allowed);
}

TEST_CASE("Trailing Commas Controlled by Option") {
    JsonApi::ParseOptions relaxed{};
    relaxed.allow_trailing_commas = true;

    expect_fail("[1,]", JsonApi::ParseError::code::trailing_comma_not_allowed);
    expect_fail("{\"a\":1,}", JsonApi::ParseError::code::trailing_comma_not_allowed);

    auto r = JsonApi::parse("[1,]", relaxed);
    REQUIRE(r);
    REQUIRE(r->as_array().size() == 1);

    auto o = JsonApi::parse("{ \"a\": 1, }", relaxed);
    REQUIRE(o);
    REQUIRE(o->as_object().size() == 1);
}

TEST_CASE("Max Depth is Enforced") {
    JsonApi::ParseOptions opts{};
    opts.max_depth = 3;

    expect_ok("[[[]]]", opts);
    expect_fail("[[[[]]]]", JsonApi::ParseError::code::depth_limit_exceeded, opts);
    expect_ok("{ \"1\": { \"2\": {}}}", opts);
    expect_fail("{ \"1\": { \"2\": { \"3\": {}}}}", JsonApi::ParseError::code::depth_limit_exceeded, opts);
}

TEST_CASE("Default Depth Limit") {
    REQUIRE(JsonApi::ParseOptions{}.max_depth == 512);

    expect_ok(std::string(512, '[') + std::string(512, ']'));
    expect_fail(std::string(513, '[') + std::string(513, ']'), JsonApi::ParseError::code::depth_limit_exceeded);

    JsonApi::ParseOptions unlimited{};
    unlimited.max_depth = 0;
    expect_ok(std::string(2000, '[') + std::string(2000, ']'), unlimited);
}

TEST_CASE("NaN and Inf Serialize as Null") {
    JsonApi::value v_nan{ std::numeric_limits<double>::quiet_NaN() };
    JsonApi::value v_inf{ std::numeric_limits<double>::infinity() };

    REQUIRE(JsonApi::dump(v_nan) == "null");
    REQUIRE(JsonApi::dump(v_inf) == "null");
}

TEST_CASE("Error Position in Range") {
    std::string s = "{\n  \"x\": 1,\n  oops\n}";
    auto r = JsonApi::parse(s);
    REQUIRE_FALSE(r);

    const auto& e = r.error();
    REQUIRE(e.offset <= s.size());
    REQUIRE(e.line == 3);
    REQUIRE(e.column >= 1);
    REQUIRE_FALSE(e.msg.empty());
}

TEST_CASE("Parse From Stream") {
    std::istringstream in{ R"({"data":[]})" };
    auto r = JsonApi::parse(in);
    REQUIRE(r);
    REQUIRE(r->at("data").is_array());
}

TEST_CASE("RFC8259 - Top-Level Single Value with Whitespace") {
    expect_ok(" 42 ");
    expect_ok("\n\n {\"a\":1}  \t");
    expect_ok("[1, 2, 3]");
    expect_ok("null");
    expect_ok("\"string\"");
}

TEST_CASE("RFC8259 - Trailing Characters are Rejected") {
    expect_fail("null true", JsonApi::ParseError::code::trailing_characters);
    expect_fail("{\"a\":1} 0", JsonApi::ParseError::code::trailing_characters);
    expect_fail("[] [ ]", JsonApi::ParseError::code::trailing_characters);
}

TEST_CASE("RFC8259 - non-JSON Whitespace is Rejected") {
    std::string s = "\xC2\xA0\x01";
    auto r = parse_str(s);
    REQUIRE_FALSE(r);
}

TEST_CASE("RFC8259 - Valid Numbers") {
    for (auto s : { "0", "123", "-0", "-123", "0.0", "-0.1", "10.5", "1e10", "1E10", "1e+10", "1e-10", "-1E-10", "1e308" }) {
        INFO("parsing: " << s);
        auto r = parse_str(s);
        REQUIRE(r);
        REQUIRE(r->is_number());
        REQUIRE(std::isfinite(r->as_number()));
    }
}

TEST_CASE("RFC8259 - Invalid Numbers are Rejected") {
    expect_fail("01",     JsonApi::ParseError::code::invalid_number);
    expect_fail("-01",    JsonApi::ParseError::code::invalid_number);
    expect_fail("1.",     JsonApi::ParseError::code::invalid_number);
    expect_fail("1.e10",  JsonApi::ParseError::code::invalid_number);
    expect_fail(".5",     JsonApi::ParseError::code::invalid_number);
    expect_fail("1e",     JsonApi::ParseError::code::invalid_number);
    expect_fail("1e+",    JsonApi::ParseError::code::invalid_number);
    expect_fail("1e-",    JsonApi::ParseError::code::invalid_number);
    expect_fail("1e1.2",  JsonApi::ParseError::code::trailing_characters);
    expect_fail("+1",     JsonApi::ParseError::code::unexpected_character);
}

TEST_CASE("RFC8259 - Control Characters Must be Escaped") {
    expect_fail("\"Hello\nWorld\"", JsonApi::ParseError::code::invalid_string);
    expect_fail("\"\x01\"", JsonApi::ParseError::code::invalid_string);
}

TEST_CASE("RFC8259 - Invalid Escapes") {
    expect_fail(R"("\q")", JsonApi::ParseError::code::invalid_escape);
    expect_fail(R"("\u12")", JsonApi::ParseError::code::invalid_unicode_escape);
    expect_fail(R"("\uZZZZ")", JsonApi::ParseError::code::invalid_unicode_escape);
    expect_fail(R"("\uD800")", JsonApi::ParseError::code::invalid_unicode_escape);
    expect_fail(R"("\uD800abc")", JsonApi::ParseError::code::invalid_unicode_escape);
    expect_fail(R"("\uDC00")", JsonApi::ParseError::code::invalid_unicode_escape);
}

TEST_CASE("RFC8259 - Invalid Arrays") {
    expect_fail("[", JsonApi::ParseError::code::unexpected_end_of_input);
    expect_fail("[1", JsonApi::ParseError::code::unexpected_end_of_input);
    expect_fail("[1,", JsonApi::ParseError::code::unexpected_end_of_input);
    expect_fail("[1 2]", JsonApi::ParseError::code::unexpected_character);
    expect_fail("[,1]", JsonApi::ParseError::code::unexpected_character);
}

TEST_CASE("RFC8259 - Invalid Objects") {
    expect_fail("{", JsonApi::ParseError::code::unexpected_end_of_input);
    expect_fail("{\"a\":1", JsonApi::ParseError::code::unexpected_end_of_input);
    expect_fail("{\"a\":1,", JsonApi::ParseError::code::unexpected_end_of_input);
    expect_fail("{a:1}", JsonApi::ParseError::code::unexpected_character);
    expect_fail("{\"a\" 1}", JsonApi::ParseError::code::unexpected_character);
    expect_fail("{,\"a\":1}", JsonApi::ParseError::code::unexpected_character);
}

TEST_CASE("RFC8259 - UTF-8 in Strings") {
    expect_ok("\"caf\xC3\xA9\"");
    expect_ok("\"snowman: \xE2\x98\x83\"");
    expect_fail("\"\xC0\xAF\"", JsonApi::ParseError::code::invalid_string);
}

TEST_CASE("RFC8259 - NaN and Infinity Tokens are Rejected") {
    expect_fail("NaN",       JsonApi::ParseError::code::unexpected_character);
    expect_fail("Infinity",  JsonApi::ParseError::code::unexpected_character);
    expect_fail("-Infinity", JsonApi::ParseError::code::invalid_number);
}

TEST_CASE("Empty and Whitespace-only Input is Rejected") {
    expect_fail("", JsonApi::ParseError::code::unexpected_end_of_input);
    expect_fail("   \n\t  ", JsonApi::ParseError::code::unexpected_end_of_input);
}

TEST_CASE("Describe Parse Error") {
    auto r = JsonApi::parse("[1,");
    REQUIRE_FALSE(r);
    std::string text = JsonApi::describe(r.error());
    REQUIRE(text.starts_with("unexpected_end_of_input: "));
    REQUIRE(text.find("line 1") != std::string::npos);
}
