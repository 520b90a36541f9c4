#include "mimic/roundtrip.hpp"

#include <algorithm>
#include <cerrno>
#include <fstream>
#include <mutex>
#include <sstream>
#include <system_error>

#include "mimic/log.hpp"
#include "mimic/registry.hpp"


namespace Mimic {

    namespace detail {

        constexpr int max_gap = 10;

        std::string gap_from(const Space& space) {
            if (const int* count = std::get_if<int>(&space)) {
                return std::string(static_cast<size_t>(std::clamp(*count, 0, max_gap)), ' ');
            }
            const auto& unit = std::get<std::string>(space);
            return unit.substr(0, max_gap);
        }

        // Every LF in the output becomes CRLF, including any inside the gap.
        std::string to_crlf(std::string_view text) {
            std::string out;
            out.reserve(text.size());
            for (char c : text) {
                if (c == '\n') out += '\r';
                out += c;
            }
            return out;
        }

        std::string describe_unit(const std::optional<std::string>& unit) {
            if (!unit) return "none";
            const bool tabs = unit->front() == '\t';
            return std::to_string(unit->size()) + (tabs ? " tab" : " space") + (unit->size() == 1 ? "" : "s");
        }

        std::string errno_message() {
            return std::error_code{ errno, std::generic_category() }.message();
        }

        std::optional<value> revive(std::string_view key, value v, const Reviver& reviver) {
            if (v.is_array()) {
                auto& arr = v.as_array();
                for (size_t i = 0; i < arr.size(); i++) {
                    auto revived = revive(std::to_string(i), std::move(arr[i]), reviver);
                    arr[i] = revived ? std::move(*revived) : value{ nullptr, v.resource() };
                }
            } else if (v.is_object()) {
                auto& obj = v.as_object();
                for (auto it = obj.begin(); it != obj.end();) {
                    auto revived = revive(it->first, std::move(it->second), reviver);
                    if (!revived) {
                        it = obj.erase(it);
                        continue;
                    }
                    it->second = std::move(*revived);
                    ++it;
                }
            }
            return reviver(key, std::move(v));
        }

        std::optional<value> replace(std::string_view key, const value& v, const Replacer& replacer) {
            std::optional<value> out = replacer(key, v);
            if (!out) return std::nullopt;

            if (out->is_array()) {
                auto& arr = out->as_array();
                for (size_t i = 0; i < arr.size(); i++) {
                    auto replaced = replace(std::to_string(i), arr[i], replacer);
                    arr[i] = replaced ? std::move(*replaced) : value{ nullptr, out->resource() };
                }
            } else if (out->is_object()) {
                auto& obj = out->as_object();
                for (auto it = obj.begin(); it != obj.end();) {
                    auto replaced = replace(it->first, it->second, replacer);
                    if (!replaced) {
                        it = obj.erase(it);
                        continue;
                    }
                    it->second = std::move(*replaced);
                    ++it;
                }
            }
            return out;
        }

    } // namespace detail

    ParseResult decode(std::string_view text, const Reviver& reviver, const ParseOptions& opts) {
        auto parsed = parse(text, opts);
        if (!parsed) return parsed;

        if (reviver) {
            auto revived = detail::revive("", *std::move(parsed), reviver);
            parsed = revived ? *std::move(revived) : value{ nullptr };
        }

        if (!parsed->is_structured()) return parsed;

        Formatting formatting = detect_formatting(text);
        logger()->debug("decoded {} bytes: indent {}, {} line endings, {}trailing newline",
                        text.size(), detail::describe_unit(formatting.indent_unit),
                        formatting.use_crlf ? "CRLF" : "LF", formatting.has_trailing_newline ? "" : "no ");
        registry().associate(*parsed, std::move(formatting));
        return parsed;
    }

    std::string encode(const value& v, const Replacer& replacer, const std::optional<Space>& space) {
        const Formatting formatting = registry().lookup(v).value_or(Formatting{});

        std::string gap;
        if (space) gap = detail::gap_from(*space);
        else if (formatting.indent_unit) gap = detail::gap_from(Space{ *formatting.indent_unit });
        if (formatting.use_crlf) gap = detail::to_crlf(gap);

        WriteOptions opts;
        opts.pretty = !gap.empty();
        opts.indent_string = std::move(gap);
        opts.newline = formatting.use_crlf ? "\r\n" : "\n";

        std::string text;
        if (replacer) {
            auto replaced = detail::replace("", v, replacer);
            if (!replaced) return {};
            text = dump(*replaced, opts);
        } else {
            text = dump(v, opts);
        }

        if (formatting.has_trailing_newline) text += opts.newline;
        return text;
    }

    ParseResult read_file(const std::filesystem::path& path, const ParseOptions& opts) {
        // A directory opens fine on POSIX and reads as empty
        std::error_code status_ec;
        if (std::filesystem::is_directory(path, status_ec)) {
            std::string msg = "Failed to read '" + path.string() + "': " + std::make_error_code(std::errc::is_a_directory).message();
            logger()->error("{}", msg);
            return std::unexpected(ParseError::make(ParseError::code::io_error, 0, 0, 0, msg));
        }

        std::ifstream ifs(path, std::ios::binary);
        if (!ifs) {
            std::string msg = "Failed to open '" + path.string() + "': " + detail::errno_message();
            logger()->error("{}", msg);
            return std::unexpected(ParseError::make(ParseError::code::io_error, 0, 0, 0, msg));
        }

        std::ostringstream oss;
        oss << ifs.rdbuf();
        if (ifs.bad()) {
            std::string msg = "Failed to read '" + path.string() + "': " + detail::errno_message();
            logger()->error("{}", msg);
            return std::unexpected(ParseError::make(ParseError::code::io_error, 0, 0, 0, msg));
        }

        const std::string text = std::move(oss).str();
        auto result = decode(text, {}, opts);
        if (!result) return result;

        std::error_code ec;
        std::filesystem::path resolved = std::filesystem::absolute(path, ec);
        if (ec) resolved = path;
        if (registry().set_source_path(*result, resolved)) {
            logger()->debug("read '{}' ({} bytes)", resolved.string(), text.size());
        }
        return result;
    }

    WriteResult write_file(const value& v, const std::optional<std::filesystem::path>& path) {
        std::optional<std::filesystem::path> target = path;
        if (!target) {
            if (auto formatting = registry().lookup(v)) target = formatting->source_path;
        }
        if (!target) return std::unexpected(WriteError::make(WriteError::code::no_location, {}, "no location available"));

        const std::string text = encode(v);

        std::ofstream ofs(*target, std::ios::binary | std::ios::trunc);
        if (!ofs) {
            std::string msg = "Failed to open '" + target->string() + "' for writing: " + detail::errno_message();
            logger()->error("{}", msg);
            return std::unexpected(WriteError::make(WriteError::code::io_error, *target, msg));
        }

        ofs.write(text.data(), static_cast<std::streamsize>(text.size()));
        ofs.close();
        if (!ofs) {
            std::string msg = "Failed to write '" + target->string() + "': " + detail::errno_message();
            logger()->error("{}", msg);
            return std::unexpected(WriteError::make(WriteError::code::io_error, *target, msg));
        }

        logger()->debug("wrote '{}' ({} bytes)", target->string(), text.size());
        return {};
    }

    bool is_tracked(const value& v) {
        return registry().is_tracked(v);
    }

    bool is_managed(const value& v) {
        static std::once_flag warned;
        std::call_once(warned, [] {
            logger()->warn("Mimic::is_managed() is deprecated, please use Mimic::is_tracked() instead");
        });
        return is_tracked(v);
    }

    std::optional<Formatting> get_formatting(const value& v) {
        return registry().lookup(v);
    }

} // namespace Mimic
