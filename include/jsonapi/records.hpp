#pragma once


/*
    -------------------------------------------------------
    JsonApi records - identifiers, version info, error objects
    -------------------------------------------------------
    Flat data holders with no decision logic of their own. Each one decodes
    through `ObjectReader` and encodes through `ObjectWriter`, so absent
    optional members are omitted on output and a null member reads back as
    absent.

        ResourceIdentifier  { "type": "articles", "id": "1" }
        JsonApiInfo         { "version": "1.1", "ext": [...], "profile": [...] }
        ErrorObject         { "status": "404", "title": "Not Found",
                              "source": { "pointer": "/data/attributes" } }

    Unknown members are ignored, except on `ErrorLinks`, which keeps every
    member other than `about` and `type` so error documents that carry extra
    links re-serialise unchanged.
*/

#include <optional>
#include <string>
#include <vector>

#include "jsonapi/convert.hpp"
#include "jsonapi/link.hpp"
#include "jsonapi/value.hpp"
#include "jsonapi/config.hpp"


/// @defgroup JsonApiRecords Records
/// @ingroup JsonApi
/// @brief Passive JSON:API members with a plain structural codec
namespace JsonApi {

    /// @ingroup JsonApiRecords
    /// @brief The minimal `(type, id)` reference used inside relationships.
    ///
    /// @details
    /// `type` is required on the wire. At least one of `id` / `lid` is
    /// expected by convention; this is not checked.
    struct ResourceIdentifier {
        std::string type{};
        std::optional<std::string> id{};
        std::optional<std::string> lid{};
        std::optional<value> meta{};

        friend bool operator==(const ResourceIdentifier&, const ResourceIdentifier&) = default;
    };

    /// @ingroup JsonApiRecords
    /// @brief The top-level `jsonapi` member.
    struct JsonApiInfo {
        std::optional<std::string> version{};
        std::optional<std::vector<std::string>> ext{};
        std::optional<std::vector<std::string>> profile{};
        std::optional<value> meta{};

        friend bool operator==(const JsonApiInfo&, const JsonApiInfo&) = default;
    };

    struct ErrorLinks {
        std::optional<Link> about{};
        std::optional<Link> type{};
        object extensions{}; ///< Every other member, kept verbatim

        friend JSONAPI_API bool operator==(const ErrorLinks& lhs, const ErrorLinks& rhs);
    };

    struct ErrorSource {
        std::optional<std::string> pointer{};
        std::optional<std::string> parameter{};
        std::optional<std::string> header{};

        friend bool operator==(const ErrorSource&, const ErrorSource&) = default;
    };

    /// @ingroup JsonApiRecords
    /// @brief One entry of a document's `errors` array.
    struct ErrorObject {
        std::optional<std::string> id{};
        std::optional<ErrorLinks> links{};
        std::optional<std::string> status{};
        std::optional<std::string> code{};
        std::optional<std::string> title{};
        std::optional<std::string> detail{};
        std::optional<ErrorSource> source{};
        std::optional<value> meta{};

        friend bool operator==(const ErrorObject&, const ErrorObject&) = default;
    };

    JSONAPI_API void to_json(value& out, const ResourceIdentifier& id);
    [[nodiscard]] JSONAPI_API Status from_json(const value& v, ResourceIdentifier& out);

    JSONAPI_API void to_json(value& out, const JsonApiInfo& info);
    [[nodiscard]] JSONAPI_API Status from_json(const value& v, JsonApiInfo& out);

    JSONAPI_API void to_json(value& out, const ErrorLinks& links);
    [[nodiscard]] JSONAPI_API Status from_json(const value& v, ErrorLinks& out);

    JSONAPI_API void to_json(value& out, const ErrorSource& source);
    [[nodiscard]] JSONAPI_API Status from_json(const value& v, ErrorSource& out);

    JSONAPI_API void to_json(value& out, const ErrorObject& error);
    [[nodiscard]] JSONAPI_API Status from_json(const value& v, ErrorObject& out);

} // namespace JsonApi
