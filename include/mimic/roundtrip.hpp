#pragma once


/*
    ----------------------------------------------
    Mimic round-trip API - formatting-aware decode
    ----------------------------------------------
    `decode` parses JSON text like `parse`, and additionally records how the
    text was laid out (see `formatting.hpp`). `encode` looks that record up
    and writes the value back the same way, so editing a document through
    Mimic does not reindent it or change its line endings.

        auto doc = Mimic::read_file("package.json");
        if (!doc) return fail(doc.error());
        (*doc)["version"] = "2.0.0";
        if (auto w = Mimic::write_file(*doc); !w) return fail(w.error());

    -----
    Rules
    -----
    - Only arrays and objects at the root of a decoded document are tracked.
      Scalars decode normally but carry no formatting
    - A value that was never decoded encodes exactly like `dump(v)`: compact,
      LF, no trailing newline
    - An explicit `space` argument to `encode` replaces the recorded
      indentation only; recorded line endings and trailing newline still
      apply
    - Tracking follows the value's identity: keep the decoded value (or move
      it), copies start out untracked

    ----------------
    Reviver/Replacer
    ----------------
    Both follow the contracts of ECMAScript `JSON.parse` / `JSON.stringify`:
    - Keys of array elements are their decimal index; the root key is ""
    - Reviver runs bottom-up. Returning `std::nullopt` removes an object
      member, sets an array element to null, and makes the root null
    - Replacer runs top-down on each value before its children. Returning
      `std::nullopt` omits an object member, writes null for an array
      element, and makes `encode` return an empty string for the root

    -----
    Space
    -----
    - An `int` means that many spaces, clamped to [0, 10]
    - A `std::string` is used verbatim, truncated to 10 characters
    - Zero and the empty string produce compact output
    - In a CRLF document every `\n` of the unit is written as `\r\n`, like
      the line breaks around it
*/

#include <expected>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "mimic/codec.hpp"
#include "mimic/formatting.hpp"

namespace Mimic {

    /// @ingroup MimicAPI
    /// @brief Transform applied to every decoded value, bottom-up
    using Reviver = std::function<std::optional<value>(std::string_view key, value v)>;

    /// @ingroup MimicAPI
    /// @brief Transform applied to every value before it is written, top-down
    using Replacer = std::function<std::optional<value>(std::string_view key, const value& v)>;

    /// @ingroup MimicAPI
    /// @brief Indentation override for `encode`: a space count or a literal unit
    using Space = std::variant<int, std::string>;

    /// @ingroup MimicAPI
    /// @brief Result of `write_file`
    using WriteResult = std::expected<void, WriteError>;

    /// @ingroup MimicAPI
    /// @brief Parses @p text and records its formatting against the result
    ///
    /// @details
    /// Parse failures are returned unchanged and nothing is recorded. If the
    /// (revived) result is an array or an object, the formatting detected in
    /// @p text is associated with it.
    [[nodiscard]] MIMIC_API ParseResult decode(std::string_view text, const Reviver& reviver = {}, const ParseOptions& opts = {});

    /// @ingroup MimicAPI
    /// @brief Serializes @p v using the formatting recorded for it
    ///
    /// Example:
    /// @code
    /// auto doc = Mimic::decode("{\r\n\t\"a\": 1\r\n}");
    /// Mimic::encode(*doc);          // "{\r\n\t\"a\": 1\r\n}"
    /// Mimic::encode(*doc, {}, 4);   // "{\r\n    \"a\": 1\r\n}"
    /// @endcode
    [[nodiscard]] MIMIC_API std::string encode(const value& v, const Replacer& replacer = {}, const std::optional<Space>& space = std::nullopt);

    /// @ingroup MimicAPI
    /// @brief Reads and decodes the file at @p path
    ///
    /// @details
    /// On success the absolute form of @p path is recorded as the document's
    /// source path, so `write_file` can be called without a destination.
    /// A file that cannot be read yields a `ParseError` with code `io_error`.
    [[nodiscard]] MIMIC_API ParseResult read_file(const std::filesystem::path& path, const ParseOptions& opts = {});

    /// @ingroup MimicAPI
    /// @brief Encodes @p v and writes it to @p path, or to the path it was read from
    ///
    /// @details
    /// @p path takes precedence over the recorded source path and does not
    /// replace it. Fails with `no_location` before touching the file system
    /// if neither is available. The file is written in binary mode.
    [[nodiscard]] MIMIC_API WriteResult write_file(const value& v, const std::optional<std::filesystem::path>& path = std::nullopt);

    /// @ingroup MimicAPI
    /// @brief Checks whether formatting is recorded for @p v
    [[nodiscard]] MIMIC_API bool is_tracked(const value& v);

    /// @ingroup MimicAPI
    /// @brief Former name of `is_tracked`. Logs a warning on first use.
    [[deprecated("use Mimic::is_tracked")]] [[nodiscard]] MIMIC_API bool is_managed(const value& v);

    /// @ingroup MimicAPI
    /// @brief Returns a snapshot of the formatting recorded for @p v
    [[nodiscard]] MIMIC_API std::optional<Formatting> get_formatting(const value& v);

} // namespace Mimic
