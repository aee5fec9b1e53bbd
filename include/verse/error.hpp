#pragma once


/*
    ----------------------------------------------
    Verse errors - conversion and read diagnostics
    ----------------------------------------------
    Two error structures live here:

    - `Verse::ConvertError` describes why a generic value could not be
      converted into a target type:
        * `code errc`: failure category
            - `missing_value`         required target, absent input
            - `not_convertible`       scalar input with no hook and no
                                      direct conversion to the target
            - `unsupported_kinds`     array/object input into a target
                                      with no matching structure
            - `capacity_exceeded`     array input longer than a fixed array
            - `rejected`              a conversion hook refused the input
            - `depth_limit_exceeded`  `ConvertOptions::max_depth` reached
            - `multiple`              error collection mode; see `causes`
        * `std::string path`: where the failure happened, relative to the
          top-level target, e.g. `Comments[0].Commenter.Username` or
          `Metadata["tags"]`. Empty for the root
        * `std::string msg`: human-readable description
        * `std::vector<ConvertError> causes`: only populated for `multiple`

    - `Verse::ReadError` describes a failure while decoding JSON text into a
      `Verse::value` (offset, line, column, message)

    ------------
    Construction
    ------------
    - The engine builds errors with `ConvertError::make(...)` at the failing
      node and prefixes the path with `at_field`, `at_index` and `at_key`
      while unwinding
    - Conversion hooks report their own failures with `Verse::reject(msg)`
*/

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

#include "verse/config.hpp"


/// @defgroup VerseError Errors
/// @ingroup Verse
/// @brief Error codes and structures produced by conversion and reading
namespace Verse {

    /// @ingroup VerseError
    /// @brief Structured error produced when a value cannot be converted.
    ///
    /// @details
    /// Returned through `Verse::status` (`std::expected<void, ConvertError>`)
    /// by the engine and by conversion hooks. The first failure aborts the
    /// whole conversion unless `ConvertOptions::collect_errors` is set, in
    /// which case a single `multiple` error carries every leaf failure.
    struct ConvertError {
        /// @brief Failure categories
        enum class code : uint8_t {
            missing_value,        ///< Absent input for a required target.
            not_convertible,      ///< Scalar input cannot become the target type.
            unsupported_kinds,    ///< Container input has no matching target structure.
            capacity_exceeded,    ///< Input longer than a fixed-size target.
            rejected,             ///< A conversion hook refused the input.
            depth_limit_exceeded, ///< Nesting deeper than ConvertOptions::max_depth.
            multiple,             ///< Several failures collected; see causes.
        };

        code errc{};                        ///< Failure category.
        std::string path{};                 ///< Location relative to the top-level target.
        std::string msg{};                  ///< Human-readable diagnostic message.
        std::vector<ConvertError> causes{}; ///< Collected failures (`multiple` only).

        /// @brief Builds an error at the current node (empty path).
        VERSE_API static ConvertError make(code c, std::string_view m);

        /// @brief Combines several failures into one `multiple` error.
        ///
        /// @details
        /// Nested `multiple` errors are flattened so `causes` only holds leaf
        /// failures, in the order given.
        VERSE_API static ConvertError combine(std::vector<ConvertError> errors);

        /// @brief Prefixes the path (and the paths of all causes) with a record field name.
        VERSE_API ConvertError& at_field(std::string_view name);

        /// @brief Prefixes the path with a list or array index.
        VERSE_API ConvertError& at_index(std::size_t idx);

        /// @brief Prefixes the path with a map key.
        VERSE_API ConvertError& at_key(std::string_view key);

        /// @brief Returns `"<path>: <msg>"`, or `msg` at the root.
        ///
        /// @details
        /// For `multiple` errors, each cause is rendered and joined with `"; "`.
        [[nodiscard]] VERSE_API std::string what() const;
    };

    /// @ingroup VerseError
    /// @brief Result of a conversion step or a conversion hook
    using status = std::expected<void, ConvertError>;

    /// @ingroup VerseError
    /// @brief Builds the failure a conversion hook returns when it refuses its input.
    ///
    /// Example:
    /// @code
    /// Verse::status parse_string(std::string_view s) {
    ///     if (s.empty()) return Verse::reject("name must not be empty");
    ///     m_Name = s;
    ///     return {};
    /// }
    /// @endcode
    [[nodiscard]] VERSE_API std::unexpected<ConvertError> reject(std::string_view msg);

    /// @ingroup VerseError
    /// @brief Name of a conversion error code, e.g. `"missing_value"`
    [[nodiscard]] VERSE_API std::string_view code_name(ConvertError::code c) noexcept;

    /// @ingroup VerseError
    /// @brief Structured error produced while reading JSON text.
    ///
    /// @details
    /// Each error contains:
    ///
    /// - **errc**: classification of the syntax violation
    /// - **offset**: byte offset from the start of input
    /// - **line**: 1-based line number
    /// - **column**: 1-based column number (byte offset within the line)
    /// - **msg**: human-readable explanation
    struct ReadError {
        /// @brief Enumeration of syntax violations detected by the reader.
        enum class code : uint8_t {
            unexpected_character,   ///< Invalid or unexpected character.
            invalid_number,         ///< Malformed numeric literal.
            invalid_string,         ///< Malformed string literal or invalid UTF-8.
            invalid_escape,         ///< Invalid escape sequence.
            invalid_unicode_escape, ///< Invalid or malformed Unicode escape.
            unexpected_end_of_input,///< Input ended prematurely.
            trailing_characters,    ///< Extra characters after the value, or a disallowed trailing comma.
            depth_limit_exceeded,   ///< Maximum depth limit exceeded.
        };

        code errc{};          ///< The classification of the error.
        std::size_t offset{}; ///< Byte offset from the beginning of the input.
        std::size_t line{};   ///< Line number where the error occurred (1-based).
        std::size_t column{}; ///< Column number where the error occurred (1-based).
        std::string msg{};    ///< Human-readable diagnostic message.

        VERSE_API static ReadError make(code c, size_t o, size_t l, size_t col, std::string_view m);
    };

} // namespace Verse
