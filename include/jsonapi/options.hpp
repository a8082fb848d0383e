#pragma once


/*
    -----------------------------------
    JsonApi parsing and writing options
    -----------------------------------
    Configuration aggregates for text-level operations. Every entry point
    that reads or writes text (`parse`, `parse_document`, `read_document`,
    `dump`, `to_text`) takes one of these as a trailing defaulted argument;
    there is no global configuration.

    - `ParseOptions` relaxes the RFC 8259 grammar (comments, trailing commas)
      and bounds nesting depth
    - `WriteOptions` selects compact or pretty output and key sorting

    Both are plain aggregates suitable for designated initializers:

        auto doc = JsonApi::parse_document(text, { .max_depth = 64 });
        auto out = JsonApi::to_text(doc.value(), { .pretty = true });
*/


#include <cstddef>

/// @defgroup JsonApiOptions Parsing and Writing Options
/// @ingroup JsonApi
/// @brief Configuration objects controlling parsing and serialization

namespace JsonApi {

    /// @ingroup JsonApiOptions
    /// @brief Configuration controlling JSON parsing behavior
    ///
    /// @details
    /// Strict RFC 8259 by default.
    ///
    /// `allow_comments`
    ///   - When `true`, `// ...` and `/* ... */` comments count as whitespace.
    ///   - When `false`, a comment fails with `comment_not_allowed`.
    /// `allow_trailing_commas`
    ///   - When `true`, `[1,2,]` and `{"a":1,}` are accepted.
    ///   - When `false`, they fail with `trailing_comma_not_allowed`.
    /// `max_depth`
    ///   - Maximum nesting depth of arrays/objects, `0` means unlimited.
    ///   - Deeper input fails with `depth_limit_exceeded`.
    struct ParseOptions {
        bool allow_comments = false;        ///< Accept `//` and `/* */` comments if true
        bool allow_trailing_commas = false; ///< Permit trailing commas in arrays/objects if true
        std::size_t max_depth = 512;        ///< Maximum allowed nesting depth (0 = unlimited)
    };

    /// @ingroup JsonApiOptions
    /// @brief Configuration controlling JSON serialization.
    ///
    /// @details
    /// `pretty` enables newlines and indentation, `indent` is the number of
    /// spaces per level (ignored when compact). Objects are written in member
    /// order unless `sort_keys` is set, in which case keys are written in
    /// lexicographic byte order at every level.
    struct WriteOptions {
        bool pretty = false;        ///< Enable pretty-printing (formatted output).
        std::size_t indent = 2;     ///< Number of spaces per indentation level.
        bool sort_keys = false;     ///< Sort object keys before writing if true.
    };

} // namespace JsonApi
