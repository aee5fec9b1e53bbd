#pragma once


/*
    -------------
    Verse options
    -------------
    Configuration aggregates for the three operations Verse performs:

    - `ConvertOptions` tunes `Verse::parse(...)` (value -> typed target)
        * `collect_errors`: keep converting past failing fields, elements and
          entries and report every failure at once. Off by default: the first
          failure aborts the conversion
        * `max_depth`: fail with `depth_limit_exceeded` instead of recursing
          deeper than this many nested levels. 0 means unlimited
    - `ReadOptions` tunes `Verse::read(...)` (JSON text -> value)
        * `allow_comments`, `allow_trailing_commas`, `max_depth`
    - `WriteOptions` tunes `Verse::dump(...)` (value -> JSON text)
        * `pretty`, `indent`

    All three are plain aggregates suitable for designated initializers:

        Verse::parse(v, post, { .collect_errors = true });
*/


#include <cstddef>

/// @defgroup VerseOptions Options
/// @ingroup Verse
/// @brief Configuration objects controlling conversion, reading and writing

namespace Verse {

    /// @ingroup VerseOptions
    /// @brief Configuration controlling value-to-type conversion
    ///
    /// @details
    /// `collect_errors`
    ///   - When `false` (default), the first failure aborts the conversion and
    ///     is returned with its path.
    ///   - When `true`, records, maps and lists keep converting their remaining
    ///     children after a failure. The result is a single
    ///     `ConvertError::code::multiple` error whose `causes` hold every leaf
    ///     failure in encounter order.
    /// `max_depth`
    ///   - Maximum nesting depth of the conversion. `0` means no explicit limit.
    struct ConvertOptions {
        bool collect_errors = false; ///< Report every failure instead of the first
        std::size_t max_depth = 0;   ///< Maximum nesting depth (0 = unlimited)
    };

    /// @ingroup VerseOptions
    /// @brief Configuration controlling JSON reading
    ///
    /// @details
    /// Strict RFC 8259 by default.
    /// `allow_comments`
    ///   - Accept line (`// ...`) and block (`/* ... */`) comments.
    /// `allow_trailing_commas`
    ///   - Accept `[1,2,]` and `{"a":1,}`.
    /// `max_depth`
    ///   - Maximum nesting of arrays/objects. `0` means no explicit limit.
    struct ReadOptions {
        bool allow_comments = false;        ///< Accept `//` and `/* */` comments if true
        bool allow_trailing_commas = false; ///< Permit trailing commas in arrays/objects if true
        std::size_t max_depth = 0;          ///< Maximum allowed nesting depth (0 = unlimited)
    };

    /// @ingroup VerseOptions
    /// @brief Configuration controlling JSON writing
    struct WriteOptions {
        bool pretty = false;    ///< Enable indented, multi-line output.
        std::size_t indent = 2; ///< Spaces per indentation level when pretty.
    };

} // namespace Verse
