#pragma once


/*
    ------------------------------------------------------
    JsonApi resources and relationships - generic templates
    ------------------------------------------------------
    Wire shapes:

        resource      { "type": "articles", "id": "1", "lid"?: ...,
                        "attributes"?: {...}, "relationships"?: {...},
                        "links"?: {...}, "meta"?: {...} }

        relationship  { "links"?: {...}, "data"?: ..., "meta"?: {...},
                        <extension members>? }

    Both are templates so one definition covers the schema-agnostic and the
    schema-known usage:

        Resource                       open `value` attributes, erased
                                       relationships (`Relationship`)
        TypedResource<Article>         attributes decoded into `Article`
        TypedResource<Article, Rels>   relationships decoded into `Rels`

        Relationship                   `data` kept as a `Payload`
        ToOneRelationship<Id>          `data` is `std::optional<Id>`
        ToManyRelationship<Id>         `data` is `std::optional<std::vector<Id>>`

    Caller-supplied types only need the ADL `to_json` / `from_json` pair
    (`JsonConvertible`). A typed relationship whose `data` has the wrong
    shape fails with `shape_mismatch` at `/data`.

    Unknown resource members are ignored. Unknown relationship members are
    kept in `extensions` and written back after the known ones.
*/

#include <concepts>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "jsonapi/convert.hpp"
#include "jsonapi/link.hpp"
#include "jsonapi/payload.hpp"
#include "jsonapi/records.hpp"
#include "jsonapi/value.hpp"


/// @defgroup JsonApiResource Resources
/// @ingroup JsonApi
/// @brief Resource objects and relationships, erased or strongly typed
namespace JsonApi {

    /// @ingroup JsonApiResource
    /// @brief A relationship; `Data` decides how its linkage is materialised.
    template<typename Data>
    struct BasicRelationship {
        static_assert(DataSlot<Data>, "relationship data must be a Payload, std::optional<T> or std::optional<std::vector<T>>");

        std::optional<Links> links{};
        Data data{};
        std::optional<value> meta{};
        object extensions{};

        friend bool operator==(const BasicRelationship& lhs, const BasicRelationship& rhs)
            requires std::equality_comparable<Data>
        {
            return lhs.links == rhs.links
                && lhs.data == rhs.data
                && lhs.meta == rhs.meta
                && same_members(lhs.extensions, rhs.extensions);
        }
    };

    template<typename Id = ResourceIdentifier>
    using ToOneRelationship = BasicRelationship<std::optional<Id>>;

    template<typename Id = ResourceIdentifier>
    using ToManyRelationship = BasicRelationship<std::optional<std::vector<Id>>>;

    /// @ingroup JsonApiResource
    /// @brief A resource object with caller-selected attribute and relationship types.
    template<typename Attributes, typename Relationships>
    struct BasicResource {
        static_assert(JsonConvertible<Attributes>, "resource attributes need to_json/from_json overloads");
        static_assert(JsonConvertible<Relationships>, "resource relationships need to_json/from_json overloads");

        std::string type{};
        std::optional<std::string> id{};
        std::optional<std::string> lid{};
        std::optional<Attributes> attributes{};
        std::optional<Relationships> relationships{};
        std::optional<Links> links{};
        std::optional<value> meta{};

        friend bool operator==(const BasicResource&, const BasicResource&) = default;
    };

    template<typename T, typename R = std::map<std::string, Relationship, std::less<>>>
    using TypedResource = BasicResource<T, R>;

    template<typename Data>
    void to_json(value& out, const BasicRelationship<Data>& rel) {
        ObjectWriter writer{ out };
        writer.optional("links", rel.links);
        detail::write_data(writer, "data", rel.data);
        writer.optional("meta", rel.meta);
        writer.extend(rel.extensions);
    }

    template<typename Data>
    Status from_json(const value& v, BasicRelationship<Data>& out) {
        auto obj = ObjectReader::open(v);
        if (!obj) return std::unexpected(std::move(obj.error()));
        if (auto s = obj->optional("links", out.links); !s) return s;
        if (auto s = detail::read_data(obj->take("data"), out.data); !s) return std::unexpected(std::move(s.error().within("data")));
        if (auto s = obj->optional_object("meta", out.meta); !s) return s;
        out.extensions = obj->remaining();
        return {};
    }

    template<typename Attributes, typename Relationships>
    void to_json(value& out, const BasicResource<Attributes, Relationships>& resource) {
        ObjectWriter{ out }
            .field("type", resource.type)
            .optional("id", resource.id)
            .optional("lid", resource.lid)
            .optional("attributes", resource.attributes)
            .optional("relationships", resource.relationships)
            .optional("links", resource.links)
            .optional("meta", resource.meta);
    }

    template<typename Attributes, typename Relationships>
    Status from_json(const value& v, BasicResource<Attributes, Relationships>& out) {
        auto obj = ObjectReader::open(v);
        if (!obj) return std::unexpected(std::move(obj.error()));
        if (auto s = obj->required("type", out.type); !s) return s;
        if (auto s = obj->optional("id", out.id); !s) return s;
        if (auto s = obj->optional("lid", out.lid); !s) return s;
        if constexpr (std::same_as<Attributes, value>) {
            if (auto s = obj->optional_object("attributes", out.attributes); !s) return s;
        } else {
            if (auto s = obj->optional("attributes", out.attributes); !s) return s;
        }
        if (auto s = obj->optional("relationships", out.relationships); !s) return s;
        if (auto s = obj->optional("links", out.links); !s) return s;
        return obj->optional_object("meta", out.meta);
    }

} // namespace JsonApi
