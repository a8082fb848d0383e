#include "jsonapi/json.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <istream>
#include <iterator>
#include <ostream>
#include <sstream>
#include <vector>


namespace JsonApi {

    namespace detail {
        ParseResult parse_impl(std::string_view text, const ParseOptions& opts);
        void dump_impl(const value& v, std::ostream& os, const WriteOptions& opts, std::size_t depth);
    } // namespace detail

    ParseResult parse(std::string_view input, const ParseOptions& opts) {
        return detail::parse_impl(input, opts);
    }

    ParseResult parse(std::istream& is, const ParseOptions& opts) {
        std::string text{ std::istreambuf_iterator<char>{ is }, std::istreambuf_iterator<char>{} };
        return detail::parse_impl(text, opts);
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

    namespace detail {
        using expected_void = std::expected<void, ParseError>;
        template<typename T>
        using expected_t = std::expected<T, ParseError>;

        bool is_valid_utf8(std::string_view s) noexcept {
            static constexpr uint32_t min_code_point[] = { 0, 0, 0x80, 0x800, 0x10000 };
            std::size_t i = 0;
            while (i < s.size()) {
                auto lead = static_cast<unsigned char>(s[i]);
                if (lead < 0x80) {
                    i++;
                    continue;
                }

                std::size_t len = 0;
                uint32_t cp = 0;
                if ((lead & 0xE0) == 0xC0) { len = 2; cp = lead & 0x1F; }
                else if ((lead & 0xF0) == 0xE0) { len = 3; cp = lead & 0x0F; }
                else if ((lead & 0xF8) == 0xF0) { len = 4; cp = lead & 0x07; }
                else return false;

                if (i + len > s.size()) return false;
                for (std::size_t k = 1; k < len; k++) {
                    auto cont = static_cast<unsigned char>(s[i + k]);
                    if ((cont & 0xC0) != 0x80) return false;
                    cp = (cp << 6) | (cont & 0x3F);
                }
                // Overlong forms, surrogates and values past U+10FFFF are not UTF-8.
                if (cp < min_code_point[len] || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return false;
                i += len;
            }
            return true;
        }

        void append_utf8(uint32_t cp, string& out) {
            if (cp <= 0x7F) {
                out.push_back(static_cast<char>(cp));
            } else if (cp <= 0x7FF) {
                out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            } else if (cp <= 0xFFFF) {
                out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            } else {
                out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            }
        }

        [[nodiscard]] constexpr bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }

        class Parser {
        public:
            Parser(std::string_view text, const ParseOptions& opts, std::pmr::memory_resource* res)
                : m_Text{ text }, m_Opts{ opts }, m_MemRes{ res } {}

            ParseResult run() {
                if (auto ws = skip_ws(); !ws) return std::unexpected(ws.error());
                if (eof()) return fail(ParseError::code::unexpected_end_of_input, "Expected JSON value");
                auto v = parse_value();
                if (!v) return std::unexpected(std::move(v.error()));
                if (auto ws = skip_ws(); !ws) return std::unexpected(ws.error());
                if (!eof()) return fail(ParseError::code::trailing_characters, "Trailing characters after top-level JSON value");
                return std::move(*v);
            }

        private:
            struct DepthScope {
                std::size_t& depth;
                explicit DepthScope(std::size_t& d) : depth{ d } { depth++; }
                ~DepthScope() { depth--; }
                DepthScope(const DepthScope&) = delete;
                DepthScope& operator=(const DepthScope&) = delete;
            };

            std::string_view m_Text;
            const ParseOptions& m_Opts;
            std::pmr::memory_resource* m_MemRes;
            std::size_t m_Idx = 0;
            std::size_t m_Line = 1;
            std::size_t m_Column = 1;
            std::size_t m_Depth = 0;

            [[nodiscard]] bool eof() const noexcept { return m_Idx >= m_Text.size(); }

            [[nodiscard]] char peek(std::size_t ahead = 0) const noexcept {
                return m_Idx + ahead < m_Text.size() ? m_Text[m_Idx + ahead] : '\0';
            }

            char get() noexcept {
                if (eof()) return '\0';
                char c = m_Text[m_Idx++];
                if (c == '\n') {
                    m_Line++;
                    m_Column = 1;
                } else m_Column++;
                return c;
            }

            bool consume(char c) noexcept {
                if (eof() || peek() != c) return false;
                get();
                return true;
            }

            [[nodiscard]] std::unexpected<ParseError> fail(ParseError::code c, std::string_view msg) const {
                return std::unexpected(ParseError::make(c, m_Idx, m_Line, m_Column, msg));
            }

            expected_void skip_ws() {
                while (!eof()) {
                    char c = peek();
                    if (c == ' ' || c == '\t' || c == '\r' || c == '\n') {
                        get();
                        continue;
                    }
                    if (c != '/' || (peek(1) != '/' && peek(1) != '*')) break;
                    if (!m_Opts.allow_comments) return fail(ParseError::code::comment_not_allowed, "Comments are not allowed");

                    get();
                    if (get() == '/') {
                        while (!eof() && peek() != '\n') get();
                        continue;
                    }
                    bool closed = false;
                    while (!eof()) {
                        if (get() == '*' && consume('/')) {
                            closed = true;
                            break;
                        }
                    }
                    if (!closed) return fail(ParseError::code::unexpected_end_of_input, "Nonterminated block comment");
                }
                return {};
            }

            expected_void expect_literal(std::string_view literal) {
                for (char expected : literal) {
                    if (eof()) return fail(ParseError::code::unexpected_end_of_input, "Truncated literal");
                    if (peek() != expected) return fail(ParseError::code::unexpected_character, "Invalid literal");
                    get();
                }
                return {};
            }

            expected_t<uint16_t> parse_hex4() {
                uint16_t out = 0;
                for (int i = 0; i < 4; i++) {
                    if (eof()) return fail(ParseError::code::invalid_unicode_escape, "Unexpected end in unicode escape");
                    char h = get();
                    unsigned digit = 0;
                    if (is_digit(h)) digit = static_cast<unsigned>(h - '0');
                    else if (h >= 'a' && h <= 'f') digit = 10u + static_cast<unsigned>(h - 'a');
                    else if (h >= 'A' && h <= 'F') digit = 10u + static_cast<unsigned>(h - 'A');
                    else return fail(ParseError::code::invalid_unicode_escape, "Invalid hex digit in unicode escape");
                    out = static_cast<uint16_t>((out << 4) | digit);
                }
                return out;
            }

            expected_void parse_escape(string& out) {
                if (eof()) return fail(ParseError::code::invalid_escape, "Unfinished escape sequence");
                char esc = get();
                switch (esc) {
                case '"': out.push_back('"'); return {};
                case '\\': out.push_back('\\'); return {};
                case '/': out.push_back('/'); return {};
                case 'b': out.push_back('\b'); return {};
                case 'f': out.push_back('\f'); return {};
                case 'n': out.push_back('\n'); return {};
                case 'r': out.push_back('\r'); return {};
                case 't': out.push_back('\t'); return {};
                case 'u': break;
                default: return fail(ParseError::code::invalid_escape, "Invalid escape sequence");
                }

                auto high = parse_hex4();
                if (!high) return std::unexpected(high.error());
                if (*high >= 0xDC00 && *high <= 0xDFFF) return fail(ParseError::code::invalid_unicode_escape, "Unpaired low surrogate");
                if (*high < 0xD800 || *high > 0xDBFF) {
                    append_utf8(*high, out);
                    return {};
                }

                if (!(consume('\\') && consume('u'))) return fail(ParseError::code::invalid_unicode_escape, "Expected low surrogate after high surrogate");
                auto low = parse_hex4();
                if (!low) return std::unexpected(low.error());
                if (*low < 0xDC00 || *low > 0xDFFF) return fail(ParseError::code::invalid_unicode_escape, "Invalid low surrogate");
                append_utf8(0x10000u + ((static_cast<uint32_t>(*high - 0xD800) << 10) | static_cast<uint32_t>(*low - 0xDC00)), out);
                return {};
            }

            expected_t<string> parse_string() {
                if (!consume('"')) return fail(ParseError::code::invalid_string, "Expected '\"' to start a string");
                string out{ allocator_type(m_MemRes) };
                while (!eof()) {
                    char c = get();
                    if (c == '"') {
                        if (!is_valid_utf8(out)) return fail(ParseError::code::invalid_string, "Invalid UTF-8 sequence in string");
                        return out;
                    }
                    if (static_cast<unsigned char>(c) < 0x20) return fail(ParseError::code::invalid_string, "Control character in string");
                    if (c != '\\') {
                        out.push_back(c);
                        continue;
                    }
                    if (auto esc = parse_escape(out); !esc) return std::unexpected(esc.error());
                }
                return fail(ParseError::code::unexpected_end_of_input, "Nonterminated string");
            }

            expected_t<double> parse_number() {
                std::size_t start = m_Idx;
                consume('-');
                if (!is_digit(peek())) return fail(ParseError::code::invalid_number, "Expected digit");
                if (get() == '0' && is_digit(peek())) return fail(ParseError::code::invalid_number, "Leading zeros disallowed");
                while (is_digit(peek())) get();

                if (consume('.')) {
                    if (!is_digit(peek())) return fail(ParseError::code::invalid_number, "Expected digit after '.'");
                    while (is_digit(peek())) get();
                }
                if (peek() == 'e' || peek() == 'E') {
                    get();
                    if (peek() == '+' || peek() == '-') get();
                    if (!is_digit(peek())) return fail(ParseError::code::invalid_number, "Expected digit in exponent");
                    while (is_digit(peek())) get();
                }

                auto literal = m_Text.substr(start, m_Idx - start);
                double out = 0.0;
                auto [ptr, ec] = std::from_chars(literal.data(), literal.data() + literal.size(), out);
                if (ec != std::errc{} || ptr != literal.data() + literal.size())
                    return fail(ParseError::code::invalid_number, "Failed to parse number");
                return out;
            }

            /// Skips whitespace after a ',' and reports whether @p close follows.
            expected_t<bool> at_trailing_comma(char close) {
                if (auto ws = skip_ws(); !ws) return std::unexpected(ws.error());
                if (peek() != close) return false;
                if (!m_Opts.allow_trailing_commas) return fail(ParseError::code::trailing_comma_not_allowed, "Trailing commas not allowed");
                get();
                return true;
            }

            expected_t<value> parse_array() {
                DepthScope scope{ m_Depth };
                if (m_Opts.max_depth != 0 && m_Depth > m_Opts.max_depth) return fail(ParseError::code::depth_limit_exceeded, "Maximum nesting depth exceeded");
                get(); // '['

                value result{ array{ allocator_type(m_MemRes) }, m_MemRes };
                auto& arr = result.as_array();
                if (auto ws = skip_ws(); !ws) return std::unexpected(ws.error());
                if (consume(']')) return result;

                while (true) {
                    if (auto ws = skip_ws(); !ws) return std::unexpected(ws.error());
                    auto elem = parse_value();
                    if (!elem) return std::unexpected(std::move(elem.error()));
                    arr.emplace_back(std::move(*elem));

                    if (auto ws = skip_ws(); !ws) return std::unexpected(ws.error());
                    if (consume(']')) return result;
                    if (eof()) return fail(ParseError::code::unexpected_end_of_input, "Unterminated array, expected ',' or ']'");
                    if (!consume(',')) return fail(ParseError::code::unexpected_character, "Expected ',' or ']' in array");

                    auto trailing = at_trailing_comma(']');
                    if (!trailing) return std::unexpected(trailing.error());
                    if (*trailing) return result;
                }
            }

            expected_t<value> parse_object() {
                DepthScope scope{ m_Depth };
                if (m_Opts.max_depth != 0 && m_Depth > m_Opts.max_depth) return fail(ParseError::code::depth_limit_exceeded, "Maximum nesting depth exceeded");
                get(); // '{'

                value result{ object{ allocator_type(m_MemRes) }, m_MemRes };
                if (auto ws = skip_ws(); !ws) return std::unexpected(ws.error());
                if (consume('}')) return result;

                while (true) {
                    if (eof()) return fail(ParseError::code::unexpected_end_of_input, "Unterminated object, expected string key");
                    if (peek() != '"') return fail(ParseError::code::unexpected_character, "Expected '\"' to start object key");
                    auto key = parse_string();
                    if (!key) return std::unexpected(std::move(key.error()));

                    if (auto ws = skip_ws(); !ws) return std::unexpected(ws.error());
                    if (eof()) return fail(ParseError::code::unexpected_end_of_input, "Unterminated object, expected ':' after key");
                    if (!consume(':')) return fail(ParseError::code::unexpected_character, "Expected ':' after object key");
                    if (auto ws = skip_ws(); !ws) return std::unexpected(ws.error());

                    auto val = parse_value();
                    if (!val) return std::unexpected(std::move(val.error()));
                    result[*key] = std::move(*val);

                    if (auto ws = skip_ws(); !ws) return std::unexpected(ws.error());
                    if (consume('}')) return result;
                    if (eof()) return fail(ParseError::code::unexpected_end_of_input, "Unterminated object, expected ',' or '}'");
                    if (!consume(',')) return fail(ParseError::code::unexpected_character, "Expected ',' or '}' in object");

                    auto trailing = at_trailing_comma('}');
                    if (!trailing) return std::unexpected(trailing.error());
                    if (*trailing) return result;
                }
            }

            expected_t<value> parse_value() {
                if (eof()) return fail(ParseError::code::unexpected_end_of_input, "Expected JSON value");
                char c = peek();
                switch (c) {
                case 'n':
                    if (auto r = expect_literal("null"); !r) return std::unexpected(r.error());
                    return value{ nullptr, m_MemRes };
                case 't':
                    if (auto r = expect_literal("true"); !r) return std::unexpected(r.error());
                    return value{ true, m_MemRes };
                case 'f':
                    if (auto r = expect_literal("false"); !r) return std::unexpected(r.error());
                    return value{ false, m_MemRes };
                case '"': {
                    auto str = parse_string();
                    if (!str) return std::unexpected(std::move(str.error()));
                    return value{ std::move(*str), m_MemRes };
                }
                case '[': return parse_array();
                case '{': return parse_object();
                default:
                    if (c == '-' || is_digit(c)) {
                        auto num = parse_number();
                        if (!num) return std::unexpected(num.error());
                        return value{ *num, m_MemRes };
                    }
                    if (c == '.') return fail(ParseError::code::invalid_number, "Fractional values must start with a 0");
                    return fail(ParseError::code::unexpected_character, "Unexpected character while parsing value");
                }
            }
        };

        ParseResult parse_impl(std::string_view text, const ParseOptions& opts) {
            Parser parser{ text, opts, std::pmr::get_default_resource() };
            return parser.run();
        }

    } // namespace detail

#pragma endregion
#pragma region Serializer

    namespace detail {

        void dump_string(std::string_view s, std::ostream& os) {
            static constexpr char hex[] = "0123456789ABCDEF";
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
                    if (c < 0x20) os << "\\u00" << hex[c >> 4] << hex[c & 0xF];
                    else os.put(static_cast<char>(c));
                    break;
                }
            }
            os.put('"');
        }

        void dump_newline(std::ostream& os, std::size_t depth, const WriteOptions& opts) {
            if (!opts.pretty) return;
            os.put('\n');
            for (std::size_t i = 0; i < depth * opts.indent; i++) os.put(' ');
        }

        void dump_number(double d, std::ostream& os) {
            if (!std::isfinite(d)) {
                os << "null";
                return;
            }
            char buf[64];
            auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), d);
            if (ec != std::errc{}) os << "0";
            else os.write(buf, ptr - buf);
        }

        void dump_members(const object& obj, std::ostream& os, const WriteOptions& opts, std::size_t depth) {
            std::vector<const member*> order;
            order.reserve(obj.size());
            for (const auto& m : obj) order.push_back(&m);
            if (opts.sort_keys) {
                std::stable_sort(order.begin(), order.end(), [](const member* a, const member* b) { return a->first < b->first; });
            }

            for (std::size_t i = 0; i < order.size(); i++) {
                if (i != 0) os.put(',');
                dump_newline(os, depth + 1, opts);
                dump_string(order[i]->first, os);
                os << (opts.pretty ? ": " : ":");
                dump_impl(order[i]->second, os, opts, depth + 1);
            }
        }

        void dump_impl(const value& v, std::ostream& os, const WriteOptions& opts, std::size_t depth) {
            switch (v.type()) {
            case kind::null: os << "null"; return;
            case kind::boolean: os << (v.as_bool() ? "true" : "false"); return;
            case kind::number: dump_number(v.as_number(), os); return;
            case kind::string: dump_string(v.as_string(), os); return;
            case kind::array: {
                const auto& arr = v.as_array();
                os.put('[');
                if (arr.empty()) {
                    os.put(']');
                    return;
                }
                for (std::size_t i = 0; i < arr.size(); i++) {
                    if (i != 0) os.put(',');
                    dump_newline(os, depth + 1, opts);
                    dump_impl(arr[i], os, opts, depth + 1);
                }
                dump_newline(os, depth, opts);
                os.put(']');
                return;
            }
            case kind::object: {
                const auto& obj = v.as_object();
                os.put('{');
                if (obj.empty()) {
                    os.put('}');
                    return;
                }
                dump_members(obj, os, opts, depth);
                dump_newline(os, depth, opts);
                os.put('}');
                return;
            }
            }
            os << "null";
        }

    } // namespace detail

#pragma endregion

} // namespace JsonApi
