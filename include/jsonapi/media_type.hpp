#pragma once


/*
    -----------------------------------------------------
    JsonApi::MediaType - `application/vnd.api+json` headers
    -----------------------------------------------------
    Builds and reads the value of a `Content-Type` / `Accept` header for
    JSON:API content negotiation:

        application/vnd.api+json
        application/vnd.api+json; ext="https://a/ext https://b/ext"
        application/vnd.api+json; profile="https://p/1"; q=0.5

    `ext` and `profile` carry space separated URI lists; `q` is a quality
    weight in `[0, 1]`. No other media-type parameter is legal, so parsing
    rejects anything else with `invalid_media_type`. The media type name and
    parameter names are compared case-insensitively.
*/

#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "jsonapi/error.hpp"
#include "jsonapi/config.hpp"


/// @defgroup JsonApiMediaType Media type
/// @ingroup JsonApi
/// @brief Header value helper for JSON:API content negotiation
namespace JsonApi {

    /// @ingroup JsonApiMediaType
    struct MediaType {
        std::vector<std::string> ext{};
        std::vector<std::string> profile{};
        std::optional<double> quality{};

        /// @brief Renders the header value; empty lists are omitted
        [[nodiscard]] JSONAPI_API std::string to_string() const;

        friend bool operator==(const MediaType&, const MediaType&) = default;
    };

    /// @ingroup JsonApiMediaType
    /// @brief Parses a header value produced by a JSON:API peer
    [[nodiscard]] JSONAPI_API std::expected<MediaType, DecodeError> parse_media_type(std::string_view text);

} // namespace JsonApi
