#include "mimic/codec.hpp"

#include <algorithm>
#include <sstream>
#include <charconv>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <vector>


namespace Mimic {

    namespace detail {
        ParseResult parse_impl(std::string_view text, const ParseOptions& opts);
        void dump_impl(const value& v, std::ostream& os, const WriteOptions& opts, size_t depth);
    } // namespace detail

    ParseResult parse(std::string_view input, const ParseOptions& opts) {
        return detail::parse_impl(input, opts);
    }

    ParseResult parse(std::istream& is, const ParseOptions& opts) {
        std::ostringstream oss;
        oss << is.rdbuf();
        return detail::parse_impl(oss.str(), opts);
    }

    std::string dump(const value& v, const WriteOptions& opts) {
        std::ostringstream oss;
        detail::dump_impl(v, oss, opts, 0);
        return oss.str();
    }

    void dump(const value& v, std::ostream& os, const WriteOptions& opts) {
        detail::dump_impl(v, os, opts, 0);
    }


#pragma region Parser
    // ================================
    // Internal parser implementation
    // ================================

    namespace detail {
        using expected_void = std::expected<void, ParseError>;
        template<typename T>
        using expected_t = std::expected<T, ParseError>;

        struct Scanner {
            std::string_view text;
            const ParseOptions& opts;
            size_t idx = 0;
            size_t line = 1;
            size_t column = 1;
            size_t depth = 0;
            std::pmr::memory_resource* mem_res;

            Scanner(std::string_view t, const ParseOptions& o, std::pmr::memory_resource* r)
                : text{ t }, opts{ o }, mem_res{ r } {}

            [[nodiscard]] bool eof() const noexcept { return idx >= text.size(); }
            [[nodiscard]] char peek() const noexcept { return eof() ? '\0' : text[idx]; }
            [[nodiscard]] char peek_next() const noexcept { return (idx + 1 < text.size()) ? text[idx + 1] : '\0'; }

            char get() {
                if (eof()) return '\0';
                char c = text[idx++];
                if (c == '\n') {
                    line++;
                    column = 1;
                } else column++;
                return c;
            }

            bool consume(char c) {
                if (peek() == c) {
                    get();
                    return true;
                }
                return false;
            }

            [[nodiscard]] std::unexpected<ParseError> fail(ParseError::code code, std::string_view msg) const {
                return std::unexpected(ParseError::make(code, idx, line, column, msg));
            }
        };

        // Tracks container nesting for the lifetime of one array/object parse.
        struct DepthGuard {
            Scanner& s;

            explicit DepthGuard(Scanner& sc) : s(sc) { s.depth++; }
            ~DepthGuard() { s.depth--; }

            [[nodiscard]] bool ok() const noexcept {
                return s.opts.max_depth == 0 || s.depth <= s.opts.max_depth;
            }
        };

        expected_t<value> parse_value(Scanner& s);

        // Length of the well-formed UTF-8 sequence starting at data[i], or 0.
        // Rejects overlong forms, surrogates and code points above U+10FFFF.
        size_t utf8_sequence_length(const unsigned char* data, size_t i, size_t n) noexcept {
            const unsigned char lead = data[i];
            if (lead <= 0x7F) return 1;

            size_t len = 0;
            unsigned char lo = 0x80, hi = 0xBF;
            if (lead >= 0xC2 && lead <= 0xDF) len = 2;
            else if (lead == 0xE0) { len = 3; lo = 0xA0; }
            else if (lead == 0xED) { len = 3; hi = 0x9F; }
            else if (lead >= 0xE1 && lead <= 0xEF) len = 3;
            else if (lead == 0xF0) { len = 4; lo = 0x90; }
            else if (lead == 0xF4) { len = 4; hi = 0x8F; }
            else if (lead >= 0xF1 && lead <= 0xF3) len = 4;
            else return 0;

            if (i + len > n) return 0;
            if (data[i + 1] < lo || data[i + 1] > hi) return 0;
            for (size_t k = 2; k < len; k++) {
                if ((data[i + k] & 0xC0) != 0x80) return 0;
            }
            return len;
        }

        bool is_valid_utf8(std::string_view s) noexcept {
            const auto* data = reinterpret_cast<const unsigned char*>(s.data());
            for (size_t i = 0; i < s.size();) {
                size_t len = utf8_sequence_length(data, i, s.size());
                if (len == 0) return false;
                i += len;
            }
            return true;
        }

        void append_utf8(uint32_t cp, string& out) {
            if (cp <= 0x7F) {
                out.push_back(static_cast<char>(cp));
            } else if (cp <= 0x7FF) {
                out.push_back(static_cast<char>(0xC0 | ((cp >> 6) & 0x1F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            } else if (cp <= 0xFFFF) {
                out.push_back(static_cast<char>(0xE0 | ((cp >> 12) & 0x0F)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            } else if (cp <= 0x10FFFF) {
                out.push_back(static_cast<char>(0xF0 | ((cp >> 18) & 0x07)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            } else {
                append_utf8(0xFFFDu, out);
            }
        }

        expected_void skip_ws_and_comments(Scanner& s) {
            while (!s.eof()) {
                char c = s.peek();

                if (c == ' ' || c == '\t' || c == '\r' || c == '\n') {
                    s.get();
                    continue;
                }

                if (!s.opts.allow_comments || c != '/') break;

                char next = s.peek_next();
                if (next == '/') {
                    s.get();
                    s.get();
                    while (!s.eof() && s.peek() != '\n') s.get();
                } else if (next == '*') {
                    s.get();
                    s.get();
                    bool closed = false;
                    while (!s.eof()) {
                        if (s.get() == '*' && s.consume('/')) {
                            closed = true;
                            break;
                        }
                    }
                    if (!closed) return s.fail(ParseError::code::unexpected_end_of_input, "Nonterminated block comment");
                } else {
                    break;
                }
            }
            return {};
        }

        expected_void parse_literal(Scanner& s, std::string_view literal, std::string_view fail_msg) {
            for (char expected : literal) {
                if (s.eof()) return s.fail(ParseError::code::unexpected_end_of_input, fail_msg);
                if (s.get() != expected) return s.fail(ParseError::code::unexpected_character, fail_msg);
            }
            return {};
        }

        expected_t<uint16_t> parse_hex4(Scanner& s) {
            uint16_t val = 0;
            for (int i = 0; i < 4; i++) {
                if (s.eof()) return s.fail(ParseError::code::invalid_unicode_escape, "Unexpected end in unicode escape");
                char h = s.get();
                unsigned digit = 0;
                if (h >= '0' && h <= '9') digit = h - '0';
                else if (h >= 'A' && h <= 'F') digit = 10 + (h - 'A');
                else if (h >= 'a' && h <= 'f') digit = 10 + (h - 'a');
                else return s.fail(ParseError::code::invalid_unicode_escape, "Invalid hex digit in unicode escape");
                val = static_cast<uint16_t>((val << 4) | digit);
            }
            return val;
        }

        expected_void parse_unicode_escape(Scanner& s, string& out) {
            auto first = parse_hex4(s);
            if (!first) return std::unexpected(first.error());

            if (*first >= 0xDC00 && *first <= 0xDFFF) return s.fail(ParseError::code::invalid_unicode_escape, "Unpaired low surrogate");
            if (*first < 0xD800 || *first > 0xDBFF) {
                append_utf8(*first, out);
                return {};
            }

            if (!(s.consume('\\') && s.consume('u'))) return s.fail(ParseError::code::invalid_unicode_escape, "Expected low surrogate after high surrogate");
            auto second = parse_hex4(s);
            if (!second) return std::unexpected(second.error());
            if (*second < 0xDC00 || *second > 0xDFFF) return s.fail(ParseError::code::invalid_unicode_escape, "Invalid low surrogate");

            append_utf8(0x10000u + ((static_cast<uint32_t>(*first - 0xD800) << 10) | static_cast<uint32_t>(*second - 0xDC00)), out);
            return {};
        }

        expected_t<string> parse_string(Scanner& s) {
            if (!s.consume('"')) return s.fail(ParseError::code::invalid_string, "Expected '\"' to start a string");

            string out{ allocator_type(s.mem_res) };

            while (!s.eof()) {
                char c = s.get();
                if (c == '"') {
                    if (!is_valid_utf8(out)) return s.fail(ParseError::code::invalid_string, "Invalid UTF-8 sequence in string");
                    return out;
                }
                if (static_cast<unsigned char>(c) < 0x20) return s.fail(ParseError::code::invalid_string, "Control character in string");
                if (c != '\\') {
                    out.push_back(c);
                    continue;
                }

                if (s.eof()) return s.fail(ParseError::code::invalid_escape, "Unfinished escape sequence");
                switch (s.get()) {
                case '"': out.push_back('"'); break;
                case '\\': out.push_back('\\'); break;
                case '/': out.push_back('/'); break;
                case 'b': out.push_back('\b'); break;
                case 'f': out.push_back('\f'); break;
                case 'n': out.push_back('\n'); break;
                case 'r': out.push_back('\r'); break;
                case 't': out.push_back('\t'); break;
                case 'u':
                    if (auto r = parse_unicode_escape(s, out); !r) return std::unexpected(r.error());
                    break;
                default:
                    return s.fail(ParseError::code::invalid_escape, "Invalid escape sequence");
                }
            }

            return s.fail(ParseError::code::unexpected_end_of_input, "Nonterminated string");
        }

        bool is_digit(char c) noexcept {
            return std::isdigit(static_cast<unsigned char>(c)) != 0;
        }

        expected_t<double> parse_number(Scanner& s) {
            size_t start = s.idx;

            if (s.consume('-') && !is_digit(s.peek())) return s.fail(ParseError::code::unexpected_character, "Expected digit after '-'");

            char first_digit = s.get();
            if (!is_digit(first_digit)) return s.fail(ParseError::code::invalid_number, "Expected digit");
            if (first_digit == '0' && is_digit(s.peek())) return s.fail(ParseError::code::invalid_number, "Leading zeros disallowed");
            while (is_digit(s.peek())) s.get();

            if (s.consume('.')) {
                if (!is_digit(s.peek())) return s.fail(ParseError::code::invalid_number, "Expected digit after '.'");
                while (is_digit(s.peek())) s.get();
            }

            if (s.peek() == 'e' || s.peek() == 'E') {
                s.get();
                if (s.peek() == '+' || s.peek() == '-') s.get();
                if (!is_digit(s.peek())) return s.fail(ParseError::code::invalid_number, "Expected digit in exponent");
                while (is_digit(s.peek())) s.get();

                char c = s.peek();
                bool boundary = c == '\0' || c == ',' || c == ']' || c == '}' || c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '/';
                if (!boundary) return s.fail(ParseError::code::invalid_number, "Invalid character in exponent");
            }

            auto num_sv = s.text.substr(start, s.idx - start);
            double res = 0.0;
            auto fc_res = std::from_chars(num_sv.data(), num_sv.data() + num_sv.size(), res);
            if (fc_res.ec == std::errc::result_out_of_range) {
                // from_chars refuses to round huge magnitudes; JSON.parse yields +-Infinity / 0
                res = std::strtod(std::string{ num_sv }.c_str(), nullptr);
            } else if (fc_res.ec != std::errc{}) {
                return s.fail(ParseError::code::invalid_number, "Failed to parse number");
            }
            return res;
        }

        expected_t<value> parse_array(Scanner& s) {
            DepthGuard guard{ s };
            if (!guard.ok()) return s.fail(ParseError::code::depth_limit_exceeded, "Maximum nesting depth exceeded");
            if (!s.consume('[')) return s.fail(ParseError::code::unexpected_character, "Expected '[' to start array");

            array arr{ allocator_type(s.mem_res) };

            if (auto ws = skip_ws_and_comments(s); !ws) return std::unexpected(ws.error());
            if (s.consume(']')) return value{ std::move(arr), s.mem_res };

            while (true) {
                auto elem = parse_value(s);
                if (!elem) return std::unexpected(std::move(elem.error()));
                arr.emplace_back(std::move(*elem));

                if (auto ws = skip_ws_and_comments(s); !ws) return std::unexpected(ws.error());

                char c = s.peek();
                if (c == ',') {
                    s.get();
                    if (auto ws = skip_ws_and_comments(s); !ws) return std::unexpected(ws.error());
                    if (s.peek() == ']') {
                        if (!s.opts.allow_trailing_commas) return s.fail(ParseError::code::trailing_characters, "Trailing commas not allowed");
                        s.get();
                        break;
                    }
                    continue;
                }
                if (c == ']') { s.get(); break; }
                if (s.eof()) return s.fail(ParseError::code::unexpected_end_of_input, "Unterminated array, expected ',' or ']'");
                return s.fail(ParseError::code::unexpected_character, "Expected ',' or ']' in array");
            }
            return value{ std::move(arr), s.mem_res };
        }

        expected_t<value> parse_object(Scanner& s) {
            DepthGuard guard{ s };
            if (!guard.ok()) return s.fail(ParseError::code::depth_limit_exceeded, "Maximum nesting depth exceeded");
            if (!s.consume('{')) return s.fail(ParseError::code::unexpected_character, "Expected '{' to start object");

            object obj{ object::allocator_type(s.mem_res) };

            if (auto ws = skip_ws_and_comments(s); !ws) return std::unexpected(ws.error());
            if (s.consume('}')) return value{ std::move(obj), s.mem_res };

            while (true) {
                if (s.eof()) return s.fail(ParseError::code::unexpected_end_of_input, "Unterminated object, expected '}' or string key");
                if (s.peek() != '"') return s.fail(ParseError::code::unexpected_character, "Expected \" to start object key");
                auto key = parse_string(s);
                if (!key) return std::unexpected(key.error());

                if (auto ws = skip_ws_and_comments(s); !ws) return std::unexpected(ws.error());
                if (s.eof()) return s.fail(ParseError::code::unexpected_end_of_input, "Unterminated object, expected ':' after key");
                if (!s.consume(':')) return s.fail(ParseError::code::unexpected_character, "Expected ':' after object key");

                auto val = parse_value(s);
                if (!val) return std::unexpected(val.error());
                // Duplicate keys: last value wins, first position is kept
                obj.insert_or_assign(*key, std::move(*val));

                if (auto ws = skip_ws_and_comments(s); !ws) return std::unexpected(ws.error());
                char c = s.peek();
                if (c == ',') {
                    s.get();
                    if (auto ws = skip_ws_and_comments(s); !ws) return std::unexpected(ws.error());
                    if (s.opts.allow_trailing_commas && s.consume('}')) break;
                    continue;
                }
                if (c == '}') { s.get(); break; }
                if (s.eof()) return s.fail(ParseError::code::unexpected_end_of_input, "Unterminated object, expected ',' or '}'");
                return s.fail(ParseError::code::unexpected_character, "Expected ',' or '}' in object");
            }
            return value{ std::move(obj), s.mem_res };
        }

        expected_t<value> parse_value(Scanner& s) {
            if (auto ws = skip_ws_and_comments(s); !ws) return std::unexpected(ws.error());
            if (s.eof()) return s.fail(ParseError::code::unexpected_end_of_input, "Expected JSON value");

            char c = s.peek();
            switch (c) {
            case 'n':
                if (auto r = parse_literal(s, "null", "Invalid 'null' literal"); !r) return std::unexpected(r.error());
                return value{ nullptr, s.mem_res };
            case 't':
                if (auto r = parse_literal(s, "true", "Invalid 'true' literal"); !r) return std::unexpected(r.error());
                return value{ true, s.mem_res };
            case 'f':
                if (auto r = parse_literal(s, "false", "Invalid 'false' literal"); !r) return std::unexpected(r.error());
                return value{ false, s.mem_res };
            case '"': {
                auto str = parse_string(s);
                if (!str) return std::unexpected(str.error());
                return value{ std::move(*str), s.mem_res };
            }
            case '[': return parse_array(s);
            case '{': return parse_object(s);
            default:
                if (c == '-' || is_digit(c)) {
                    auto num = parse_number(s);
                    if (!num) return std::unexpected(num.error());
                    return value{ *num, s.mem_res };
                }
                if (c == '.') return s.fail(ParseError::code::invalid_number, "Fractional values must start with a 0");
                return s.fail(ParseError::code::unexpected_character, "Unexpected character while parsing value");
            }
        }

        ParseResult parse_impl(std::string_view text, const ParseOptions& opts) {
            Scanner s{ text, opts, std::pmr::get_default_resource() };

            auto v = parse_value(s);
            if (!v) return std::unexpected(v.error());
            if (auto ws = skip_ws_and_comments(s); !ws) return std::unexpected(ws.error());
            if (!s.eof()) return s.fail(ParseError::code::trailing_characters, "Trailing characters after top-level JSON value");
            return *std::move(v);
        }
#pragma endregion
#pragma region Serializer

        // ================================
        // Internal serializer implementation
        // ================================

        void dump_string(std::string_view s, std::ostream& os) {
            static constexpr char hex[] = "0123456789abcdef";
            os.put('"');
            for (unsigned char c : s) {
                switch (c) {
                case '"': os << "\\\""; break;
                case '\\': os << "\\\\"; break;
                case '\b': os << "\\b"; break;
                case '\f': os << "\\f"; break;
                case '\n': os << "\\n"; break;
                case '\r': os << "\\r"; break;
                case '\t': os << "\\t"; break;
                default:
                    if (c < 0x20) os << "\\u00" << hex[(c >> 4) & 0xF] << hex[c & 0xF];
                    else os.put(static_cast<char>(c));
                    break;
                }
            }
            os.put('"');
        }

        // Number::toString layout over the shortest round-tripping digits.
        void dump_number(double d, std::ostream& os) {
            if (!std::isfinite(d)) {
                os << "null";
                return;
            }
            if (d == 0.0) {
                os.put('0');
                return;
            }

            char buf[64];
            auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), d, std::chars_format::scientific);
            if (ec != std::errc{}) {
                os << "0";
                return;
            }

            std::string_view sci{ buf, static_cast<size_t>(ptr - buf) };
            if (sci.front() == '-') {
                os.put('-');
                sci.remove_prefix(1);
            }

            const size_t e_pos = sci.find('e');
            std::string digits;
            for (char c : sci.substr(0, e_pos)) {
                if (c != '.') digits.push_back(c);
            }

            std::string_view exp_sv = sci.substr(e_pos + 1);
            if (exp_sv.front() == '+') exp_sv.remove_prefix(1);
            int exponent = 0;
            std::from_chars(exp_sv.data(), exp_sv.data() + exp_sv.size(), exponent);

            const int k = static_cast<int>(digits.size());
            const int n = exponent + 1;

            if (k <= n && n <= 21) {
                os << digits << std::string(static_cast<size_t>(n - k), '0');
            } else if (0 < n && n <= 21) {
                os << std::string_view{ digits }.substr(0, n) << '.' << std::string_view{ digits }.substr(n);
            } else if (-6 < n && n <= 0) {
                os << "0." << std::string(static_cast<size_t>(-n), '0') << digits;
            } else {
                os.put(digits[0]);
                if (k > 1) os << '.' << std::string_view{ digits }.substr(1);
                os << 'e' << (n - 1 < 0 ? '-' : '+') << std::abs(n - 1);
            }
        }

        void dump_indent(std::ostream& os, size_t depth, const WriteOptions& opts) {
            if (!opts.pretty) return;
            if (!opts.indent_string.empty()) {
                for (size_t i = 0; i < depth; i++) os << opts.indent_string;
                return;
            }
            size_t spaces = depth * opts.indent;
            for (size_t i = 0; i < spaces; i++) os.put(' ');
        }

        void dump_newline(std::ostream& os, const WriteOptions& opts) {
            if (opts.pretty) os << opts.newline;
        }

        void dump_impl(const value& v, std::ostream& os, const WriteOptions& opts, size_t depth) {
            switch (v.type()) {
            case kind::null: os << "null"; return;
            case kind::boolean: os << (v.as_bool() ? "true" : "false"); return;
            case kind::number: dump_number(v.as_number(), os); return;
            case kind::string: dump_string(v.as_string(), os); return;
            case kind::array: {
                const auto& arr = v.as_array();
                size_t n = arr.size();

                os.put('[');
                if (n == 0) {
                    os.put(']');
                    return;
                }

                dump_newline(os, opts);
                for (size_t i = 0; i < n; i++) {
                    dump_indent(os, depth + 1, opts);
                    dump_impl(arr[i], os, opts, depth + 1);
                    if (i + 1 < n) os.put(',');
                    dump_newline(os, opts);
                }
                dump_indent(os, depth, opts);
                os.put(']');
                return;
            }
            case kind::object: {
                const auto& obj = v.as_object();
                size_t n = obj.size();

                os.put('{');
                if (n == 0) {
                    os.put('}');
                    return;
                }

                std::vector<const object::value_type*> members;
                members.reserve(n);
                for (const auto& member : obj) members.push_back(&member);
                if (opts.sort_keys) {
                    std::stable_sort(members.begin(), members.end(), [](const auto* a, const auto* b) { return a->first < b->first; });
                }

                dump_newline(os, opts);
                for (size_t i = 0; i < n; i++) {
                    dump_indent(os, depth + 1, opts);
                    dump_string(members[i]->first, os);
                    os << (opts.pretty ? ": " : ":");
                    dump_impl(members[i]->second, os, opts, depth + 1);
                    if (i + 1 < n) os.put(',');
                    dump_newline(os, opts);
                }
                dump_indent(os, depth, opts);
                os.put('}');
                return;
            }
            }
            os << "null";
        }

#pragma endregion

    } // namespace detail

} // namespace Mimic
