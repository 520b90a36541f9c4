#include "mimic/error.hpp"

namespace Mimic {

    ParseError ParseError::make(code c, size_t o, size_t l, size_t col, std::string_view m) {
        ParseError e;
        e.errc = c;
        e.offset = o;
        e.line = l;
        e.column = col;
        e.msg.assign(m.begin(), m.end());
        return e;
    }

    WriteError WriteError::make(code c, std::filesystem::path p, std::string_view m) {
        WriteError e;
        e.errc = c;
        e.path = std::move(p);
        e.msg.assign(m.begin(), m.end());
        return e;
    }

    std::string_view to_string(ParseError::code c) noexcept {
        switch (c) {
        case ParseError::code::unexpected_character: return "unexpected_character";
        case ParseError::code::invalid_number: return "invalid_number";
        case ParseError::code::invalid_string: return "invalid_string";
        case ParseError::code::invalid_escape: return "invalid_escape";
        case ParseError::code::invalid_unicode_escape: return "invalid_unicode_escape";
        case ParseError::code::unexpected_end_of_input: return "unexpected_end_of_input";
        case ParseError::code::trailing_characters: return "trailing_characters";
        case ParseError::code::depth_limit_exceeded: return "depth_limit_exceeded";
        case ParseError::code::io_error: return "io_error";
        }
        return "unknown";
    }

    std::string_view to_string(WriteError::code c) noexcept {
        switch (c) {
        case WriteError::code::no_location: return "no_location";
        case WriteError::code::io_error: return "io_error";
        }
        return "unknown";
    }

} // namespace Mimic
