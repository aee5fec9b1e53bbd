#pragma once


/*
    ------------------------------
    Verse JSON reading and writing
    ------------------------------
    A small RFC 8259 reader that decodes JSON text into a `Verse::value`
    tree, the matching writer, and `parse_json` wrappers that read and then
    convert in one call.

    - Reading:
        * `std::expected<value, ReadError> read(std::string_view, const ReadOptions& = {})`
        * `std::expected<value, ReadError> read(std::istream&, const ReadOptions& = {})`
        * Every number becomes a `float64`; duplicate object keys keep the
          last occurrence
    - Writing:
        * `std::string dump(const value&, const WriteOptions& = {})`
        * `void dump(const value&, std::ostream&, const WriteOptions& = {})`
        * Non-finite numbers are written as `null`
    - Read + convert:
        * `parse_json(text, target)` returns `std::expected<void, JsonError>`
          where `JsonError` holds either the `ReadError` or the
          `ConvertError`
*/

#include <expected>
#include <iosfwd>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "verse/value.hpp"
#include "verse/error.hpp"
#include "verse/options.hpp"
#include "verse/convert.hpp"

/// @defgroup VerseJson JSON Reading and Writing
/// @ingroup Verse
/// @brief Decoding JSON text into generic values and back

namespace Verse {

    /// @ingroup VerseJson
    /// @brief Result of reading JSON text
    using ReadResult = std::expected<value, ReadError>;

    /// @ingroup VerseJson
    /// @brief Failure of a combined read + convert
    using JsonError = std::variant<ReadError, ConvertError>;

    /// @ingroup VerseJson
    /// @brief Decodes a JSON document from a string view
    ///
    /// @param input UTF-8 encoded JSON text
    /// @param opts Reading options (comments, trailing commas, depth limit)
    /// @return The decoded value tree or the position and cause of the syntax error
    [[nodiscard]] VERSE_API ReadResult read(std::string_view input, const ReadOptions& opts = {});

    /// @ingroup VerseJson
    /// @brief Decodes a JSON document from the whole remaining content of @p is
    [[nodiscard]] VERSE_API ReadResult read(std::istream& is, const ReadOptions& opts = {});

    /// @ingroup VerseJson
    /// @brief Serializes a value to JSON text
    [[nodiscard]] VERSE_API std::string dump(const value& v, const WriteOptions& opts = {});

    /// @ingroup VerseJson
    /// @brief Serializes a value to JSON text written to @p os
    VERSE_API void dump(const value& v, std::ostream& os, const WriteOptions& opts = {});

    /// @ingroup VerseJson
    /// @brief Message of either alternative of a JsonError
    [[nodiscard]] VERSE_API std::string message(const JsonError& err);

    /// @ingroup VerseJson
    /// @brief Reads JSON text and converts it into @p out
    ///
    /// Example:
    /// @code
    /// Post post;
    /// if (auto r = Verse::parse_json(text, post); !r) {
    ///     std::cerr << Verse::message(r.error()) << '\n';
    /// }
    /// @endcode
    template<class T>
    [[nodiscard]] std::expected<void, JsonError> parse_json(std::string_view text, T& out,
                                                            const ConvertOptions& convert_opts = {},
                                                            const ReadOptions& read_opts = {}) {
        auto doc = read(text, read_opts);
        if (!doc) return std::unexpected(JsonError{ std::move(doc.error()) });
        if (auto r = parse(*doc, out, convert_opts); !r) return std::unexpected(JsonError{ std::move(r.error()) });
        return {};
    }

    /// @ingroup VerseJson
    /// @brief Reads JSON text from a stream and converts it into @p out
    template<class T>
    [[nodiscard]] std::expected<void, JsonError> parse_json(std::istream& is, T& out,
                                                            const ConvertOptions& convert_opts = {},
                                                            const ReadOptions& read_opts = {}) {
        auto doc = read(is, read_opts);
        if (!doc) return std::unexpected(JsonError{ std::move(doc.error()) });
        if (auto r = parse(*doc, out, convert_opts); !r) return std::unexpected(JsonError{ std::move(r.error()) });
        return {};
    }

} // namespace Verse
