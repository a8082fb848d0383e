#include <catch2/catch_all.hpp>

#include "jsonapi/media_type.hpp"

#include <string>
#include <vector>

using namespace Catch;


TEST_CASE("Plain Media Type") {
    JsonApi::MediaType mt;
    REQUIRE(mt.to_string() == "application/vnd.api+json");

    auto back = JsonApi::parse_media_type("application/vnd.api+json");
    REQUIRE(back);
    REQUIRE(*back == mt);
}

TEST_CASE("Media Type With Parameters") {
    JsonApi::MediaType mt;
    mt.ext = { "https://jsonapi.org/ext/atomic", "https://x/ext/version" };
    mt.profile = { "https://x/profiles/timestamps" };
    mt.quality = 0.5;

    REQUIRE(mt.to_string() ==
            R"(application/vnd.api+json; ext="https://jsonapi.org/ext/atomic https://x/ext/version"; profile="https://x/profiles/timestamps"; q=0.5)");

    auto back = JsonApi::parse_media_type(mt.to_string());
    REQUIRE(back);
    REQUIRE(*back == mt);
}

TEST_CASE("Media Type Names Are Case-Insensitive") {
    auto mt = JsonApi::parse_media_type(R"(Application/VND.API+JSON ;EXT="https://a/ext";  Profile=https://p/1)");
    REQUIRE(mt);
    REQUIRE(mt->ext == std::vector<std::string>{ "https://a/ext" });
    REQUIRE(mt->profile == std::vector<std::string>{ "https://p/1" });
    REQUIRE_FALSE(mt->quality);
}

TEST_CASE("Quoted Values May Contain Separators") {
    auto mt = JsonApi::parse_media_type(R"(application/vnd.api+json; profile="https://p/a;b  https://p/c")");
    REQUIRE(mt);
    REQUIRE(mt->profile == std::vector<std::string>{ "https://p/a;b", "https://p/c" });
}

TEST_CASE("Quality Weight") {
    auto one = JsonApi::parse_media_type("application/vnd.api+json; q=1");
    REQUIRE(one);
    REQUIRE(*one->quality == Approx(1.0));

    auto zero = JsonApi::parse_media_type("application/vnd.api+json;q=0");
    REQUIRE(zero);
    REQUIRE(*zero->quality == Approx(0.0));

    for (auto text : { "application/vnd.api+json; q=1.5", "application/vnd.api+json; q=-0.1", "application/vnd.api+json; q=high" }) {
        INFO("header: " << text);
        auto bad = JsonApi::parse_media_type(text);
        REQUIRE_FALSE(bad);
        REQUIRE(bad.error().errc == JsonApi::DecodeError::code::invalid_media_type);
        REQUIRE(bad.error().msg == "quality must be a number between 0 and 1");
    }
}

TEST_CASE("Rejected Media Types") {
    struct Case {
        const char* text;
        const char* msg;
    };

    const Case cases[] = {
        { "application/json", "not the JSON:API media type" },
        { "application/vnd.api+json; charset=utf-8", "only ext, profile and q parameters are allowed" },
        { "application/vnd.api+json; ext", "media type parameter has no value" },
        { R"(application/vnd.api+json; ext="https://a)", "unterminated quoted parameter value" },
    };

    for (const auto& c : cases) {
        INFO("header: " << c.text);
        auto mt = JsonApi::parse_media_type(c.text);
        REQUIRE_FALSE(mt);
        REQUIRE(mt.error().errc == JsonApi::DecodeError::code::invalid_media_type);
        REQUIRE(mt.error().msg == c.msg);
    }
}
