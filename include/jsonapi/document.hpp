#pragma once


/*
    ----------------------------------------------
    JsonApi documents - the top-level envelope
    ----------------------------------------------
        {
            "jsonapi":  { "version": "1.1" },
            "data":     { ... } | [ ... ] | null,
            "errors":   [ ... ],
            "links":    { "self": "..." },
            "included": [ ... ],
            "meta":     { ... },
            <extension members>
        }

    `BasicDocument<Data>` is instantiated three ways:

        Document                 `data` kept erased as a `Payload`
        SingleDocument<R>        `data` projected into `std::optional<R>`
        CollectionDocument<R>    `data` projected into `std::optional<std::vector<R>>`

    Decoding a typed document steers `data` through the matching
    projection, so `{"data": []}` read as a `SingleDocument` fails with
    `shape_mismatch` at `/data`. An erased `Document` never fails on the
    shape of `data`; it only classifies it:

        has_single_resource()      data present and an object
        has_collection_resource()  data present and an array (even empty)
        has_errors()               errors present and non-empty

    The three facts are independent. A document carrying both `data` and
    `errors` is accepted and reports both.

    Every top-level member other than the six above lands in `extensions`
    (in source order) and is written back, after the known members, on
    output.
*/

#include <concepts>
#include <expected>
#include <optional>
#include <string>
#include <vector>

#include "jsonapi/convert.hpp"
#include "jsonapi/link.hpp"
#include "jsonapi/payload.hpp"
#include "jsonapi/records.hpp"
#include "jsonapi/resource.hpp"
#include "jsonapi/value.hpp"


/// @defgroup JsonApiDocument Documents
/// @ingroup JsonApi
/// @brief Top-level JSON:API documents, erased or strongly typed
namespace JsonApi {

    /// @ingroup JsonApiDocument
    /// @brief A JSON:API document whose primary data is held in a `Data` slot.
    template<typename Data>
    struct BasicDocument {
        static_assert(DataSlot<Data>, "document data must be a Payload, std::optional<T> or std::optional<std::vector<T>>");

        std::optional<JsonApiInfo> jsonapi{};
        Data data{};
        std::optional<std::vector<ErrorObject>> errors{};
        std::optional<Links> links{};
        std::optional<std::vector<Resource>> included{};
        std::optional<value> meta{};
        object extensions{};

        [[nodiscard]] bool has_single_resource() const noexcept {
            return detail::data_shape(data) == Payload::shape::object;
        }

        [[nodiscard]] bool has_collection_resource() const noexcept {
            return detail::data_shape(data) == Payload::shape::array;
        }

        [[nodiscard]] bool has_errors() const noexcept {
            return errors && !errors->empty();
        }

        friend bool operator==(const BasicDocument& lhs, const BasicDocument& rhs)
            requires std::equality_comparable<Data>
        {
            return lhs.jsonapi == rhs.jsonapi
                && lhs.data == rhs.data
                && lhs.errors == rhs.errors
                && lhs.links == rhs.links
                && lhs.included == rhs.included
                && lhs.meta == rhs.meta
                && same_members(lhs.extensions, rhs.extensions);
        }
    };

    /// @ingroup JsonApiDocument
    /// @brief Schema-agnostic document; project `data` later
    using Document = BasicDocument<Payload>;

    template<typename R = Resource>
    using SingleDocument = BasicDocument<std::optional<R>>;

    template<typename R = Resource>
    using CollectionDocument = BasicDocument<std::optional<std::vector<R>>>;

    template<typename Data>
    void to_json(value& out, const BasicDocument<Data>& doc) {
        ObjectWriter writer{ out };
        writer.optional("jsonapi", doc.jsonapi);
        detail::write_data(writer, "data", doc.data);
        writer.optional("errors", doc.errors)
            .optional("links", doc.links)
            .optional("included", doc.included)
            .optional("meta", doc.meta)
            .extend(doc.extensions);
    }

    template<typename Data>
    Status from_json(const value& v, BasicDocument<Data>& out) {
        auto obj = ObjectReader::open(v);
        if (!obj) return std::unexpected(std::move(obj.error()));
        if (auto s = obj->optional("jsonapi", out.jsonapi); !s) return s;
        if (auto s = detail::read_data(obj->take("data"), out.data); !s) return std::unexpected(std::move(s.error().within("data")));
        if (auto s = obj->optional("errors", out.errors); !s) return s;
        if (auto s = obj->optional("links", out.links); !s) return s;
        if (auto s = obj->optional("included", out.included); !s) return s;
        if (auto s = obj->optional_object("meta", out.meta); !s) return s;
        out.extensions = obj->remaining();
        return {};
    }

    namespace detail {

        template<typename Data>
        [[nodiscard]] BasicDocument<Data> rebind(const Document& doc, Data data) {
            BasicDocument<Data> out{};
            out.jsonapi = doc.jsonapi;
            out.data = std::move(data);
            out.errors = doc.errors;
            out.links = doc.links;
            out.included = doc.included;
            out.meta = doc.meta;
            out.extensions = doc.extensions;
            return out;
        }

    } // namespace detail

    /// @ingroup JsonApiDocument
    /// @brief Projects an erased document into a single-resource document.
    ///
    /// @details
    /// Everything but `data` is copied as is. @p doc is left untouched, so a
    /// `shape_mismatch` can be followed by `as_collection` on the same
    /// document.
    template<JsonDeserializable R = Resource>
    [[nodiscard]] std::expected<SingleDocument<R>, DecodeError> as_single(const Document& doc) {
        auto data = doc.data.single<R>();
        if (!data) return std::unexpected(std::move(data.error().within("data")));
        return detail::rebind(doc, std::move(*data));
    }

    /// @ingroup JsonApiDocument
    /// @brief Projects an erased document into a collection document
    template<JsonDeserializable R = Resource>
    [[nodiscard]] std::expected<CollectionDocument<R>, DecodeError> as_collection(const Document& doc) {
        auto data = doc.data.collection<R>();
        if (!data) return std::unexpected(std::move(data.error().within("data")));
        return detail::rebind(doc, std::move(*data));
    }

} // namespace JsonApi
