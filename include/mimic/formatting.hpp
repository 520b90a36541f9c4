#pragma once


/*
    ------------------------------------------------------
    Mimic::Formatting - Inferred layout of a JSON document
    ------------------------------------------------------
    `detect_formatting(...)` scans JSON source text once and infers the
    three aggregate signals Mimic replays when writing the document back:

    - Indentation unit:
        * Each non-empty line contributes the leading run of spaces, or the
          leading run of tabs. A line that starts with a mix of both
          contributes nothing
        * The candidate unit of a line is derived from the previous
          indented line:
            - same run as the previous line: the previous candidate is
              counted again
            - same character, different length: the difference in length
              is the candidate (one extra nesting level)
            - different character, or no previous run: the whole run is
              the candidate
        * Lines without leading whitespace reset the previous run
        * The candidate seen most often wins; on equal counts the one seen
          first wins. No indented line means no unit
    - Line endings:
        * Every `\n` is counted as CRLF when preceded by `\r`, else as LF
        * CRLF is used only when it is strictly more frequent than LF
    - Trailing newline:
        * True when the last character of the text is `\n`

    The detector never fails; text without line breaks yields the defaults
    (no unit, LF, no trailing newline).
*/

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "mimic/config.hpp"

/// @defgroup MimicFormatting Formatting Detection
/// @ingroup Mimic
/// @brief Inference of indentation and line-ending conventions

namespace Mimic {

    /// @ingroup MimicFormatting
    /// @brief Formatting conventions recorded for a decoded document
    struct Formatting {
        std::optional<std::string> indent_unit{}; ///< Text of one indentation level, if any was detected.
        bool use_crlf = false;                    ///< CRLF line endings dominate.
        bool has_trailing_newline = false;        ///< Source text ends with a line ending.
        std::optional<std::filesystem::path> source_path{}; ///< Absolute path the document was read from.

        friend bool operator==(const Formatting&, const Formatting&) = default;
    };

    /// @ingroup MimicFormatting
    /// @brief Infers the formatting conventions of JSON source text
    ///
    /// @details
    /// Pure function of @p text. The returned `source_path` is always empty.
    ///
    /// Example:
    /// @code
    /// auto f = Mimic::detect_formatting("{\r\n\t\"a\": 1\r\n}\r\n");
    /// // f.indent_unit == "\t", f.use_crlf == true, f.has_trailing_newline == true
    /// @endcode
    [[nodiscard]] MIMIC_API Formatting detect_formatting(std::string_view text);

} // namespace Mimic
