#pragma once


/*
    ------------------------------------------------
    Mimic error types - Structured failure reporting
    ------------------------------------------------
    Mimic reports failures through two plain structs carried inside
    `std::expected`:

    - `Mimic::ParseError`:
        * Produced by `parse(...)`, `decode(...)` and `read_file(...)`
        * Describes malformed input (with offset, line and column of the
          offending byte) or a failure to read the source file (`io_error`)
    - `Mimic::WriteError`:
        * Produced by `write_file(...)`
        * Describes a missing destination (`no_location`) or a failure of
          the underlying file write (`io_error`)

    ------
    Fields
    ------
    - `code errc`:
        * Enumerated error code describing failure category
        * The exact set of codes is documented alongside each enum
    - `size_t offset`, `size_t line`, `size_t column` (ParseError only):
        * Byte offset and 1-based line/column where the error was detected
        * All three are zero for `io_error`, where no text was scanned
    - `std::filesystem::path path` (WriteError only):
        * Destination that was being written, empty for `no_location`
    - `std::string msg`:
        * Human-readable description of the error
        * Intended for debugging and logging; not stable for programmatic use

    Neither struct is thrown. Precondition violations that indicate
    programming errors (e.g. registering a scalar value in the format
    registry) are reported with standard exceptions instead.
*/

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

#include "mimic/config.hpp"


/// @defgroup MimicError Errors
/// @ingroup Mimic
/// @brief Error codes and structures produced by parsing and file I/O
namespace Mimic {

    /// @ingroup MimicError
    /// @brief Structured error information produced while reading JSON.
    ///
    /// @details
    /// A `ParseError` is returned whenever `Mimic::parse(...)` fails to
    /// interpret the input as valid JSON, or when `Mimic::read_file(...)`
    /// cannot read its source. Each error contains:
    ///
    /// - **errc**: a classification of the error
    /// - **offset**: byte offset from the start of input where the error occurred
    /// - **line**: 1-based line number of the error position
    /// - **column**: 1-based column number (UTF-8 byte offset within the line)
    /// - **msg**: human-readable explanation of the error
    ///
    /// `ParseError` objects are returned in a `std::expected<value, ParseError>`
    /// through the `parse(...)`, `decode(...)` and `read_file(...)` functions.
    struct ParseError {
        /// @ingroup MimicError
        /// @brief Enumeration of possible error categories detected by the parser.
        ///
        /// @details
        /// Members:
        /// - `unexpected_character`
        ///     Encountered a character that is not valid in the current parsing state.
        ///     Example: using `@` where a value or delimiter is expected.
        ///
        /// - `invalid_number`
        ///     Number format does not match JSON grammar. Examples: leading zeros
        ///     (`012`), malformed exponents (`1e+`), missing digits after decimal.
        ///
        /// - `invalid_string`
        ///     String literal violated JSON constraints (e.g. unescaped control
        ///     characters, invalid UTF-8).
        ///
        /// - `invalid_escape`
        ///     Invalid escape sequence inside a string (e.g. `\k`, `\xFF`).
        ///
        /// - `invalid_unicode_escape`
        ///     Invalid `\uXXXX` sequence, malformed hex digits, or unpaired surrogate.
        ///
        /// - `unexpected_end_of_input`
        ///     Input ended before a complete JSON value could be parsed.
        ///
        /// - `trailing_characters`
        ///     Successfully parsed a complete JSON value, but non-whitespace
        ///     characters remain afterward. Also used for disallowed trailing commas.
        ///
        /// - `depth_limit_exceeded`
        ///     Nesting depth went past `ParseOptions::max_depth`. Off by default.
        ///
        /// - `io_error`
        ///     The source file could not be opened or read. No text was scanned.
        enum class code : uint8_t {
            unexpected_character,   ///< Invalid or unexpected character.
            invalid_number,         ///< Malformed numeric literal.
            invalid_string,         ///< Malformed string literal.
            invalid_escape,         ///< Invalid escape sequence.
            invalid_unicode_escape, ///< Invalid or malformed Unicode escape.
            unexpected_end_of_input,///< Input ended prematurely.
            trailing_characters,    ///< Extra characters after valid JSON.
            depth_limit_exceeded,   ///< Maximum depth limit exceeded.
            io_error,               ///< Reading the source failed.
        };

        code errc{};       ///< The classification of the parsing error.
        std::size_t offset{}; ///< Byte offset from the beginning of the input.
        std::size_t line{};   ///< Line number where the error occurred (1-based).
        std::size_t column{}; ///< Column number where the error occurred (1-based).
        std::string msg{};    ///< Human-readable diagnostic message.

        /// @ingroup MimicError
        /// @brief Constructs a fully-populated `ParseError` instance.
        ///
        /// @details
        /// Used internally by the parser to generate a structured error
        /// object with consistent formatting.
        ///
        /// @param c    The error code describing the category of failure.
        /// @param o    Byte offset from the start of the input.
        /// @param l    Line number (1-based).
        /// @param col  Column number (1-based).
        /// @param m    Human-readable error message.
        /// @return A fully constructed `ParseError`.
        MIMIC_API static ParseError make(code c, size_t o, size_t l, size_t col, std::string_view m);
    };

    /// @ingroup MimicError
    /// @brief Error returned by `Mimic::write_file(...)`.
    struct WriteError {
        /// @brief Failure categories of a write.
        enum class code : uint8_t {
            no_location, ///< No explicit path was given and none was recorded at read time.
            io_error,    ///< The destination could not be opened or written.
        };

        code errc{};                  ///< The classification of the failure.
        std::filesystem::path path{}; ///< Destination being written (empty for `no_location`).
        std::string msg{};            ///< Human-readable diagnostic message.

        /// @brief Constructs a fully-populated `WriteError` instance.
        MIMIC_API static WriteError make(code c, std::filesystem::path p, std::string_view m);
    };

    /// @ingroup MimicError
    /// @brief Returns a short, stable name for a parse error code (e.g. `"invalid_number"`).
    [[nodiscard]] MIMIC_API std::string_view to_string(ParseError::code c) noexcept;

    /// @ingroup MimicError
    /// @brief Returns a short, stable name for a write error code (e.g. `"no_location"`).
    [[nodiscard]] MIMIC_API std::string_view to_string(WriteError::code c) noexcept;

} // namespace Mimic
