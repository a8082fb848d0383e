#pragma once


/*
    ---------------------------------------
    JsonApi JSON text layer - parse / dump
    ---------------------------------------
    Free functions converting between UTF-8 JSON text and `JsonApi::value`.
    Every JSON:API entry point in `jsonapi.hpp` runs on top of these; they
    are also usable on their own when a caller needs the raw tree.

    - `parse(std::string_view, ParseOptions)` / `parse(std::istream&, ...)`
      return `std::expected<value, ParseError>`
    - `dump(const value&, WriteOptions)` returns the text,
      `dump(const value&, std::ostream&, WriteOptions)` streams it

    Numbers are read as `double`. Non-finite numbers are written as `null`.
    Duplicate object keys keep the position of the first occurrence and the
    value of the last.
*/

#include <expected>
#include <iosfwd>
#include <string>
#include <string_view>

#include "jsonapi/value.hpp"
#include "jsonapi/error.hpp"
#include "jsonapi/options.hpp"

/// @defgroup JsonApiText JSON Text Layer
/// @ingroup JsonApi
/// @brief Parsing and writing raw JSON
namespace JsonApi {

    /// @ingroup JsonApiText
    /// @brief Result of parsing JSON text into a DOM tree
    using ParseResult = std::expected<value, ParseError>;

    /// @ingroup JsonApiText
    /// @brief Parses a JSON value from a string view
    ///
    /// @param input UTF-8 encoded JSON text
    /// @param opts Parsing configuration options
    /// @return The DOM tree, or a `ParseError` locating the failure
    [[nodiscard]] JSONAPI_API ParseResult parse(std::string_view input, const ParseOptions& opts = {});

    /// @ingroup JsonApiText
    /// @brief Reads the whole stream and parses it as JSON
    [[nodiscard]] JSONAPI_API ParseResult parse(std::istream& is, const ParseOptions& opts = {});

    /// @ingroup JsonApiText
    /// @brief Serializes a DOM value to a string
    [[nodiscard]] JSONAPI_API std::string dump(const value& v, const WriteOptions& opts = {});

    /// @ingroup JsonApiText
    /// @brief Serializes a DOM value into an output stream
    JSONAPI_API void dump(const value& v, std::ostream& os, const WriteOptions& opts = {});

} // namespace JsonApi
