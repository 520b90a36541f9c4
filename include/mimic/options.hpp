#pragma once


/*
    ---------------------------------
    Mimic parsing and writing options
    ---------------------------------
    This header defines configuration structures that control the behavior
    of parsing (JSON -> DOM) and writing (DOM -> JSON) operations

    -------------------------------------
    Parsing Options - Mimic::ParseOptions
    -------------------------------------
    `ParseOptions` tunes how `Mimic::parse(...)` and `Mimic::decode(...)` behave:

    - `bool allow_comments`:
        * When true, the parser accepts line (`// ...`) and block
          (`/ * ... * /`) comments in addition to standard JSON whitespace
        * When false (default, strict JSON), encountering a comment
          results in an `unexpected_character` parse error
    - `bool allow_trailing_commas`:
        * When true, the parser accepts trailing commas in arrays and objects
          e.g. `[1,2,]` or `{"a": 1,}`
        * When false (strict JSON), trailing commas produce a parse error
    - `size_t max_depth`:
        * Limit on nesting depth of arrays/objects, 512 by default
        * If exceeded, the parser fails with `depth_limit_exceeded`
        * A value of 0 removes the limit; the parser recurses once per
          level, so deep enough input then exhausts the stack

    -------------------------------------
    Writing Options - Mimic::WriteOptions
    -------------------------------------
    `WriteOptions` tunes how `Mimic::dump(...)` serializes DOM values back to
    JSON text:

    - `bool pretty`:
        * When false (default), produces compact JSON without extra whitespace
        * When true, outputs one member per line, indented per nesting level
    - `size_t indent`:
        * Number of spaces to indent per nesting level in pretty mode
        * Ignored if `pretty == false` or `indent_string` is not empty
    - `std::string indent_string`:
        * Literal text written once per nesting level in pretty mode
          (e.g. `"\t"` or `"   "`)
        * Takes precedence over `indent` when non-empty
    - `std::string newline`:
        * Line-ending sequence written between lines in pretty mode
        * `"\n"` by default; `"\r\n"` reproduces Windows line endings
    - `bool sort_keys`:
        * When true, object members are written in lexicographic key order
        * When false (default), members are written in insertion order

    `Mimic::encode(...)` fills a `WriteOptions` from the formatting recorded
    for a decoded value; callers only need these structs for direct use of
    `parse`/`dump`.
*/


#include <cstddef>
#include <string>

/// @defgroup MimicOptions Parsing and Writing Options
/// @ingroup Mimic
/// @brief Configuration objects controlling parsing and serialization

namespace Mimic {

    /// @ingroup MimicOptions
    /// @brief Configuration controlling JSON parsing behavior
    ///
    /// @details
    /// By default the parser is strict according to RFC 8259.
    ///
    /// Example:
    /// @code
    /// ParseOptions opts;
    /// opts.allow_comments = true;
    /// opts.max_depth = 32;
    /// auto result = Mimic::parse(text, opts);
    /// @endcode
    struct ParseOptions {
        bool allow_comments = false; ///< Accept `//` and `/* */` comments if true
        bool allow_trailing_commas = false; ///< Permit trailing commas in arrays/objects if true
        size_t max_depth = 512; ///< Maximum allowed nesting depth (0 = unlimited)
    };

    /// @ingroup MimicOptions
    /// @brief Configuration options controlling JSON serialization (dumping).
    ///
    /// Example:
    /// @code
    /// WriteOptions wo;
    /// wo.pretty = true;
    /// wo.indent_string = "\t";
    /// wo.newline = "\r\n";
    /// std::string json = Mimic::dump(v, wo);
    /// @endcode
    struct WriteOptions {
        bool pretty = false;          ///< Enable pretty-printing (formatted output).
        std::size_t indent = 2;       ///< Number of spaces per indentation level.
        std::string indent_string{};  ///< Per-level indentation text; overrides `indent` if set.
        std::string newline = "\n";   ///< Line ending used between lines in pretty mode.
        bool sort_keys = false;       ///< Sort object keys before writing if true.
    };


} // namespace Mimic
