#pragma once


/*
    ---------------------------------------------------------------
    JsonApi::ParseError / JsonApi::DecodeError - structured failures
    ---------------------------------------------------------------
    Two error types cover every failure the library can report:

    - `ParseError` describes a JSON syntax failure found while tokenizing
      text into a `JsonApi::value` (offset, line, column, message)
    - `DecodeError` describes a failure to turn a `value` into a typed
      entity, or to project a document's erased `data` payload:
        * `syntax`             - the text was not JSON; `syntax` holds the
                                 underlying `ParseError`
        * `malformed_link`     - a link is neither a string nor an object,
                                 or a link object carries no `href`
        * `shape_mismatch`     - single projection on array data, collection
                                 projection on object data, or either on a
                                 scalar
        * `missing_member`     - a required member is absent
        * `type_mismatch`      - a member holds the wrong JSON kind
        * `invalid_media_type` - a media-type string is not the JSON:API
                                 media type or carries foreign parameters

    `DecodeError::pointer` is a JSON Pointer (RFC 6901) to the member that
    failed, relative to the value handed to the decoder. Nested decoders
    prefix it as the error travels outwards.

    Nothing here throws: both types travel inside `std::expected`.
*/

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "jsonapi/config.hpp"


/// @defgroup JsonApiError Errors
/// @ingroup JsonApi
/// @brief Error codes and structures produced by parsing and decoding
namespace JsonApi {

    /// @ingroup JsonApiError
    /// @brief Structured error information produced during JSON parsing.
    ///
    /// @details
    /// Returned by `JsonApi::parse(...)` when the input is not valid JSON.
    /// `offset` is a byte offset into the input and lies in `[0, input.size()]`;
    /// `line` and `column` are 1-based.
    struct ParseError {
        /// @ingroup JsonApiError
        /// @brief Category of a JSON syntax failure.
        enum class code : uint8_t {
            unexpected_character,       ///< Invalid or unexpected character.
            invalid_number,             ///< Malformed numeric literal.
            invalid_string,             ///< Malformed string literal or bad UTF-8.
            invalid_escape,             ///< Invalid escape sequence.
            invalid_unicode_escape,     ///< Invalid or unpaired `\uXXXX` escape.
            unexpected_end_of_input,    ///< Input ended prematurely.
            trailing_characters,        ///< Extra characters after the top-level value.
            comment_not_allowed,        ///< Comment found while `allow_comments` is off.
            trailing_comma_not_allowed, ///< Trailing comma while `allow_trailing_commas` is off.
            depth_limit_exceeded,       ///< Nesting deeper than `max_depth`.
        };

        code errc{};          ///< The classification of the parsing error.
        std::size_t offset{}; ///< Byte offset from the beginning of the input.
        std::size_t line{};   ///< Line number where the error occurred (1-based).
        std::size_t column{}; ///< Column number where the error occurred (1-based).
        std::string msg{};    ///< Human-readable diagnostic message.

        /// @brief Constructs a fully-populated `ParseError`.
        JSONAPI_API static ParseError make(code c, std::size_t o, std::size_t l, std::size_t col, std::string_view m);
    };

    /// @ingroup JsonApiError
    /// @brief Failure to decode a JSON value into a JSON:API entity.
    struct DecodeError {
        enum class code : uint8_t {
            syntax,
            malformed_link,
            shape_mismatch,
            missing_member,
            type_mismatch,
            invalid_media_type,
        };

        code errc{};
        std::string pointer{}; ///< JSON Pointer to the failing member ("" = the root).
        std::string msg{};
        ParseError syntax{};   ///< Only meaningful when `errc == code::syntax`.

        JSONAPI_API static DecodeError make(code c, std::string_view m, std::string_view pointer = {});

        JSONAPI_API static DecodeError from(const ParseError& e);

        /// @brief Prepends `/<segment>` to the pointer, escaping `~` and `/`
        JSONAPI_API DecodeError& within(std::string_view segment);

        JSONAPI_API DecodeError& within(std::size_t index);
    };

    [[nodiscard]] JSONAPI_API std::string_view code_name(ParseError::code c) noexcept;

    [[nodiscard]] JSONAPI_API std::string_view code_name(DecodeError::code c) noexcept;

    /// @ingroup JsonApiError
    /// @brief One-line description, e.g. `type_mismatch: expected string at /data/id`
    [[nodiscard]] JSONAPI_API std::string describe(const ParseError& e);

    [[nodiscard]] JSONAPI_API std::string describe(const DecodeError& e);

} // namespace JsonApi
