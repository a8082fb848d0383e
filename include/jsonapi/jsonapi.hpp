#pragma once


/*
    ------------------------------------------------------------
    JsonApi - typed object model and codec for JSON:API v1.1
    ------------------------------------------------------------

    This is the main public header for JsonApi

    It brings together:
        - The JSON DOM and text layer:  `JsonApi::value`, `parse`, `dump`
        - Error reporting types:        `JsonApi::ParseError`,
                                        `JsonApi::DecodeError`
        - Configuration options:        `JsonApi::ParseOptions`,
                                        `JsonApi::WriteOptions`
        - The JSON:API model:           `Link`, `Resource`, `Relationship`,
                                        `Document` and their typed variants
        - Media type helper:            `MediaType`, `parse_media_type`

    -------------------
    High-Level Overview
    -------------------
    - Text -> erased document:
        * `parse_document(text)` keeps `data` as a `Payload`; ask it
          `has_single_resource()` / `has_collection_resource()` /
          `has_errors()` and project later with `data.single<T>()` /
          `data.collection<T>()` or `as_single<T>(doc)` /
          `as_collection<T>(doc)`
    - Text -> typed document:
        * `parse_single_document<R>(text)` and
          `parse_collection_document<R>(text)` project `data` while
          decoding; a wrong shape is a `shape_mismatch`
    - Transport bodies:
        * `read_document<Doc>(stream)` treats an empty body or a literal
          `null` as "no document" (`std::nullopt`), not as an error
    - Output:
        * `to_text(entity)` writes any document, resource, relationship or
          link; links without metadata come out as bare strings

    Every failure is a `DecodeError`; a JSON syntax error arrives with
    `errc == DecodeError::code::syntax` and the `ParseError` attached. A
    failed parse never yields a partially-populated document.

    -----
    Usage
    -----
        #include <jsonapi/jsonapi.hpp>

        auto doc = JsonApi::parse_document(body);
        if (!doc) {
            std::println(stderr, "{}", JsonApi::describe(doc.error()));
            return 1;
        }
        if (doc->has_collection_resource()) {
            auto articles = doc->data.collection<JsonApi::TypedResource<Article>>();
            ...
        }
*/

/// @defgroup JsonApi JsonApi Library
/// @brief Core types and functions for JsonApi

/// @defgroup JsonApiAPI Top-level Parsing and Serialization API
/// @ingroup JsonApi
/// @brief Convenient free functions for reading and writing JSON:API text

#include <expected>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

#include "jsonapi/config.hpp"
#include "jsonapi/convert.hpp"
#include "jsonapi/document.hpp"
#include "jsonapi/error.hpp"
#include "jsonapi/json.hpp"
#include "jsonapi/link.hpp"
#include "jsonapi/media_type.hpp"
#include "jsonapi/options.hpp"
#include "jsonapi/payload.hpp"
#include "jsonapi/records.hpp"
#include "jsonapi/resource.hpp"
#include "jsonapi/value.hpp"

namespace JsonApi {

    namespace detail {

        /// @brief Parses a transport body; `std::nullopt` for an empty body or `null`
        [[nodiscard]] JSONAPI_API std::expected<std::optional<value>, DecodeError> read_body(std::istream& is, const ParseOptions& opts);

    } // namespace detail

    /// @ingroup JsonApiAPI
    /// @brief Parses @p text and decodes the tree into any `JsonDeserializable` type
    template<JsonDeserializable T>
    [[nodiscard]] std::expected<T, DecodeError> parse_as(std::string_view text, const ParseOptions& opts = {}) {
        auto tree = parse(text, opts);
        if (!tree) return std::unexpected(DecodeError::from(tree.error()));
        return deserialize<T>(*tree);
    }

    /// @ingroup JsonApiAPI
    /// @brief Parses a document, keeping `data` erased
    [[nodiscard]] JSONAPI_API std::expected<Document, DecodeError> parse_document(std::string_view text, const ParseOptions& opts = {});

    /// @ingroup JsonApiAPI
    /// @brief Parses a document whose `data` must be absent, null or one object
    template<JsonDeserializable R = Resource>
    [[nodiscard]] std::expected<SingleDocument<R>, DecodeError> parse_single_document(std::string_view text, const ParseOptions& opts = {}) {
        return parse_as<SingleDocument<R>>(text, opts);
    }

    /// @ingroup JsonApiAPI
    /// @brief Parses a document whose `data` must be absent, null or an array
    template<JsonDeserializable R = Resource>
    [[nodiscard]] std::expected<CollectionDocument<R>, DecodeError> parse_collection_document(std::string_view text, const ParseOptions& opts = {}) {
        return parse_as<CollectionDocument<R>>(text, opts);
    }

    /// @ingroup JsonApiAPI
    /// @brief Parses a standalone link; `std::nullopt` for the text `null`
    [[nodiscard]] JSONAPI_API std::expected<std::optional<Link>, DecodeError> parse_link(std::string_view text, const ParseOptions& opts = {});

    /// @ingroup JsonApiAPI
    /// @brief Reads a response body as a document.
    ///
    /// @details
    /// The whole stream is consumed. An empty (or whitespace-only) body and
    /// a body of `null` both mean "no document" and yield `std::nullopt`;
    /// every other failure is a `DecodeError`.
    template<JsonDeserializable Doc = Document>
    [[nodiscard]] std::expected<std::optional<Doc>, DecodeError> read_document(std::istream& is, const ParseOptions& opts = {}) {
        auto tree = detail::read_body(is, opts);
        if (!tree) return std::unexpected(std::move(tree.error()));
        if (!*tree) return std::optional<Doc>{};
        auto doc = deserialize<Doc>(**tree);
        if (!doc) return std::unexpected(std::move(doc.error()));
        return std::optional<Doc>{ std::move(*doc) };
    }

    /// @ingroup JsonApiAPI
    /// @brief Serialises any model entity (or other `JsonSerializable`) to text
    template<JsonSerializable T>
    [[nodiscard]] std::string to_text(const T& entity, const WriteOptions& opts = {}) {
        return dump(serialize(entity), opts);
    }

} // namespace JsonApi
