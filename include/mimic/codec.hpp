#pragma once


/*
    ---------------------------------------
    Mimic codec - strict parse and dump API
    ---------------------------------------
    The plain, format-agnostic JSON reader and writer. These functions know
    nothing about the formatting of a source document; `decode`/`encode` in
    `roundtrip.hpp` layer formatting replay on top of them.

    - Parsing:
        * `std::expected<value, ParseError> parse(std::string_view, const ParseOptions& = {})`
        * `std::expected<value, ParseError> parse(std::istream&, const ParseOptions& = {})`
        * Strict RFC 8259 by default, with opt-in extensions (comments,
          trailing commas, depth limit)
    - Serialization:
        * `std::string dump(const value&, const WriteOptions& = {})`
        * `void dump(const value&, std::ostream&, const WriteOptions& = {})`
        * Output follows the conventions of ECMAScript `JSON.stringify`:
            - `": "` between key and value in pretty mode, `":"` otherwise
            - empty arrays and objects are written as `[]` and `{}`
            - numbers use the shortest round-tripping digits in
              `Number::toString` layout (`100`, `0.5`, `1e+21`, `1e-7`)
            - NaN and infinities are written as `null`
            - control characters are escaped as `\u00xx`
*/

/// @defgroup MimicAPI Top-level Parsing and Serialization API
/// @ingroup Mimic
/// @brief Convenient free functions for parsing and writing JSON

#include <expected>
#include <string>
#include <string_view>
#include <iosfwd>

#include "mimic/value.hpp"
#include "mimic/error.hpp"
#include "mimic/options.hpp"

namespace Mimic {

    /// @ingroup MimicAPI
    /// @brief Alias for the result type returned by JSON parsing function
    ///
    /// @details
    /// Successful parsing yeilds a fully constructed `Mimic::value` DOM tree.
    /// Failures are reported through a `ParseError` containing:
    ///  - error code
    ///  - line/column information
    ///  - byte offset
    ///  - human-readable message
    using ParseResult = std::expected<value, ParseError>;

    /// @ingroup MimicAPI
    /// @brief Parses a JSON document from a string view
    ///
    /// @details
    /// Attempts to parse the UTF-8 JSON text provided in @p input according
    /// to the rules defined by RFC 8259 and modified by the supplied
    /// `ParseOptions`. The returned value is not tracked; use
    /// `Mimic::decode(...)` to record the formatting of @p input.
    ///
    /// Example:
    /// @code
    /// auto res = Mimic::parse(R"({"x":42})");
    /// if (!res) {
    ///     std::cerr << res.error().msg << '\n';
    /// } else {
    ///     std::cout << Mimic::dump(res.value(), {.pretty = true });
    /// }
    /// @endcode
    ///
    /// @param input UTF-8 encoded JSON text to parse
    /// @param opts Parsing configuration options (comments, trailing commas, etc.)
    /// @return A `ParseResult` containing either a DOM tree or a parse error
    [[nodiscard]] MIMIC_API ParseResult parse(std::string_view input, const ParseOptions& opts = {});

    /// @ingroup MimicAPI
    /// @brief Parses a JSON document from an input stream
    ///
    /// @details
    /// Reads the entire contents of @p is and attempts to parse it as JSON using
    /// the provided `ParseOptions`.
    [[nodiscard]] MIMIC_API ParseResult parse(std::istream& is, const ParseOptions& opts = {});

    /// @ingroup MimicAPI
    /// @brief Serializes a JSON DOM value to a string
    ///
    /// @details
    /// Produces a UTF-8 JSON representation of the given `value` using the
    /// formatting rules specified in @p opts. Formatting recorded by
    /// `decode` is ignored here; see `Mimic::encode(...)`.
    ///
    /// @param v The DOM value to serialize
    /// @param opts Formatting options
    /// @return A UTF-8 JSON string representation of @p `v`.
    [[nodiscard]] MIMIC_API std::string dump(const value& v, const WriteOptions& opts = {});

    /// @ingroup MimicAPI
    /// @brief Serializes a JSON DOM value and writes it to an output stream
    ///
    /// @param v The DOM value to serialize
    /// @param os Output stream to receive JSON text
    /// @param opts Formatting options
    MIMIC_API void dump(const value& v, std::ostream& os, const WriteOptions& opts = {});

} // namespace Mimic
