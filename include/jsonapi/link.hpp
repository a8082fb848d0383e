#pragma once


/*
    ---------------------------------------------
    JsonApi::Link - hypermedia link and its codec
    ---------------------------------------------
    A JSON:API link has two legal wire shapes:

        "https://example.com/articles/1"

        {
            "href": "https://example.com/articles/1",
            "rel": "self",
            "describedby": "https://example.com/schemas/article",
            "title": "Article",
            "type": "text/html",
            "hreflang": "en",
            "meta": { "count": 10 }
        }

    Both decode to the same `Link` entity. `describedby` is itself a link
    (either shape) and nests recursively; a link owns its `describedby`
    exclusively, so copies are deep.

    --------
    Decoding
    --------
    - string  -> `Link{ href = string }`
    - null    -> no link (`std::nullopt`), never an error
    - object  -> recognised members decoded, unknown members ignored;
                 `href` must be present, otherwise `malformed_link`
    - anything else -> `malformed_link`
    A recognised member of the wrong JSON kind (e.g. `"title": 5`) fails
    with `type_mismatch` pointing at that member. A null optional member
    counts as absent.

    --------
    Encoding
    --------
    - A link whose optional fields are all absent (empty strings count as
      absent) and whose `href` is non-empty is written as the bare string
    - Otherwise an object is written with members in the order
      `href, rel, describedby, title, type, hreflang, meta`; absent fields
      are omitted, never written as null. `href` is omitted when empty
    - A present `meta` is written even when it is an empty object
*/

#include <expected>
#include <map>
#include <memory>
#include <optional>
#include <string>

#include "jsonapi/convert.hpp"
#include "jsonapi/value.hpp"
#include "jsonapi/error.hpp"
#include "jsonapi/config.hpp"


/// @defgroup JsonApiLink Links
/// @ingroup JsonApi
/// @brief The link entity and its dual-shape codec
namespace JsonApi {

    /// @ingroup JsonApiLink
    /// @brief A hypermedia link.
    struct Link {
        std::string href{};
        std::optional<std::string> rel{};
        std::unique_ptr<Link> describedby{};
        std::optional<std::string> title{};
        std::optional<std::string> type{};
        std::optional<std::string> hreflang{};
        std::optional<value> meta{};

        Link() = default;

        /// @brief A link carrying only @p target; encodes as a bare string
        JSONAPI_API explicit Link(std::string target);

        JSONAPI_API Link(const Link& other);

        JSONAPI_API Link& operator=(const Link& other);

        Link(Link&&) noexcept = default;

        Link& operator=(Link&&) noexcept = default;

        ~Link() = default;

        /// @brief True when the link encodes as a bare string
        [[nodiscard]] JSONAPI_API bool is_compact() const noexcept;

        friend JSONAPI_API bool operator==(const Link& lhs, const Link& rhs);
    };

    /// @ingroup JsonApiLink
    /// @brief Links keyed by relation name (`self`, `related`, `next`, ...)
    ///
    /// @details
    /// A member whose value is `null` means "no link" and is dropped on read.
    using Links = std::map<std::string, Link, std::less<>>;

    /// @ingroup JsonApiLink
    /// @brief Decodes either wire shape; `std::nullopt` for a JSON null
    [[nodiscard]] JSONAPI_API std::expected<std::optional<Link>, DecodeError> read_link(const value& v);

    /// @ingroup JsonApiLink
    /// @brief Encodes a link, choosing the bare string form when possible
    [[nodiscard]] JSONAPI_API value write_link(const Link& link, std::pmr::memory_resource* res = std::pmr::get_default_resource());

    JSONAPI_API void to_json(value& out, const Link& link);

    /// @brief Decodes a link that must exist; a JSON null is a `malformed_link`
    [[nodiscard]] JSONAPI_API Status from_json(const value& v, Link& out);

    /// @brief Decodes a links object, dropping members whose value is null
    [[nodiscard]] JSONAPI_API Status from_json(const value& v, Links& out);

} // namespace JsonApi
