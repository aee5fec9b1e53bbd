#include "verse/json.hpp"
#include "verse/log.hpp"

#include <charconv>
#include <cmath>
#include <cstdint>
#include <istream>
#include <iterator>
#include <ostream>
#include <sstream>


namespace Verse {

#pragma region Reader

    namespace {

        template<typename T>
        using expected_t = std::expected<T, ReadError>;
        using expected_void = std::expected<void, ReadError>;

        using code = ReadError::code;

        bool is_space(char c) noexcept { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; }
        bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }

        // Validates the UTF-8 sequences of a decoded string, rejecting overlong
        // forms, surrogates and code points above U+10FFFF.
        bool is_valid_utf8(std::string_view s) noexcept {
            std::size_t i = 0;
            while (i < s.size()) {
                const auto c = static_cast<unsigned char>(s[i]);
                if (c <= 0x7F) {
                    i++;
                    continue;
                }

                std::size_t len = 0;
                unsigned char lo = 0x80;
                unsigned char hi = 0xBF;
                if (c >= 0xC2 && c <= 0xDF) {
                    len = 2;
                } else if (c >= 0xE0 && c <= 0xEF) {
                    len = 3;
                    if (c == 0xE0) lo = 0xA0;
                    if (c == 0xED) hi = 0x9F;
                } else if (c >= 0xF0 && c <= 0xF4) {
                    len = 4;
                    if (c == 0xF0) lo = 0x90;
                    if (c == 0xF4) hi = 0x8F;
                } else {
                    return false;
                }

                if (i + len > s.size()) return false;
                for (std::size_t k = 1; k < len; k++) {
                    const auto cc = static_cast<unsigned char>(s[i + k]);
                    if (cc < (k == 1 ? lo : 0x80) || cc > (k == 1 ? hi : 0xBF)) return false;
                }
                i += len;
            }
            return true;
        }

        void append_utf8(std::uint32_t cp, string& out) {
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

        class Reader {
        public:
            Reader(std::string_view text, const ReadOptions& opts, std::pmr::memory_resource* res)
                : m_Text{ text }, m_Opts{ opts }, m_MemRes{ res } {}

            expected_t<value> document() {
                auto v = any();
                if (!v) return v;
                if (auto ws = skip_space(); !ws) return std::unexpected(ws.error());
                if (!at_end()) return error(code::trailing_characters, "Trailing characters after top-level JSON value");
                return v;
            }

        private:
            std::string_view m_Text;
            const ReadOptions& m_Opts;
            std::pmr::memory_resource* m_MemRes;
            std::size_t m_Pos = 0;
            std::size_t m_Line = 1;
            std::size_t m_Column = 1;
            std::size_t m_Depth = 0;

            [[nodiscard]] bool at_end() const noexcept { return m_Pos >= m_Text.size(); }
            [[nodiscard]] char peek(std::size_t ahead = 0) const noexcept {
                return m_Pos + ahead < m_Text.size() ? m_Text[m_Pos + ahead] : '\0';
            }

            char advance() {
                if (at_end()) return '\0';
                const char c = m_Text[m_Pos++];
                if (c == '\n') {
                    m_Line++;
                    m_Column = 1;
                } else {
                    m_Column++;
                }
                return c;
            }

            bool accept(char c) {
                if (at_end() || peek() != c) return false;
                advance();
                return true;
            }

            [[nodiscard]] std::unexpected<ReadError> error(code c, std::string_view msg) const {
                return std::unexpected(ReadError::make(c, m_Pos, m_Line, m_Column, msg));
            }

            expected_void skip_space() {
                while (!at_end()) {
                    const char c = peek();
                    if (is_space(c)) {
                        advance();
                    } else if (c == '/' && m_Opts.allow_comments && peek(1) == '/') {
                        while (!at_end() && peek() != '\n') advance();
                    } else if (c == '/' && m_Opts.allow_comments && peek(1) == '*') {
                        advance();
                        advance();
                        while (!(peek() == '*' && peek(1) == '/')) {
                            if (at_end()) return error(code::unexpected_end_of_input, "Nonterminated block comment");
                            advance();
                        }
                        advance();
                        advance();
                    } else {
                        break;
                    }
                }
                return {};
            }

            expected_void keyword(std::string_view word) {
                for (char expected : word) {
                    if (at_end()) return error(code::unexpected_end_of_input, "Truncated literal");
                    if (advance() != expected) return error(code::unexpected_character, "Invalid literal");
                }
                return {};
            }

            expected_t<value> any() {
                if (auto ws = skip_space(); !ws) return std::unexpected(ws.error());
                if (at_end()) return error(code::unexpected_end_of_input, "Expected JSON value");

                switch (const char c = peek(); c) {
                case 'n':
                    if (auto r = keyword("null"); !r) return std::unexpected(r.error());
                    return value{ nullptr, m_MemRes };
                case 't':
                    if (auto r = keyword("true"); !r) return std::unexpected(r.error());
                    return value{ true, m_MemRes };
                case 'f':
                    if (auto r = keyword("false"); !r) return std::unexpected(r.error());
                    return value{ false, m_MemRes };
                case '"': {
                    auto s = text();
                    if (!s) return std::unexpected(s.error());
                    return value{ std::move(*s), m_MemRes };
                }
                case '[':
                    return list();
                case '{':
                    return members();
                default:
                    if (c == '-' || is_digit(c)) {
                        auto n = number();
                        if (!n) return std::unexpected(n.error());
                        return value{ *n, m_MemRes };
                    }
                    if (c == '.') return error(code::invalid_number, "Fractional values must start with a digit");
                    return error(code::unexpected_character, "Unexpected character while reading value");
                }
            }

            // Opens a container level; fails once max_depth levels are open.
            expected_void enter() {
                if (m_Opts.max_depth != 0 && m_Depth + 1 > m_Opts.max_depth) {
                    return error(code::depth_limit_exceeded, "Maximum nesting depth exceeded");
                }
                m_Depth++;
                return {};
            }

            expected_t<value> list() {
                if (auto d = enter(); !d) return std::unexpected(d.error());
                advance(); // '['

                array arr{ allocator_type(m_MemRes) };
                if (auto ws = skip_space(); !ws) return std::unexpected(ws.error());
                if (accept(']')) {
                    m_Depth--;
                    return value{ std::move(arr), m_MemRes };
                }

                while (true) {
                    auto elem = any();
                    if (!elem) return elem;
                    arr.emplace_back(std::move(*elem));

                    if (auto ws = skip_space(); !ws) return std::unexpected(ws.error());
                    if (accept(']')) break;
                    if (at_end()) return error(code::unexpected_end_of_input, "Unterminated array, expected ',' or ']'");
                    if (!accept(',')) return error(code::unexpected_character, "Expected ',' or ']' in array");

                    if (auto ws = skip_space(); !ws) return std::unexpected(ws.error());
                    if (peek() == ']') {
                        if (!m_Opts.allow_trailing_commas) return error(code::trailing_characters, "Trailing commas not allowed");
                        advance();
                        break;
                    }
                }
                m_Depth--;
                return value{ std::move(arr), m_MemRes };
            }

            expected_t<value> members() {
                if (auto d = enter(); !d) return std::unexpected(d.error());
                advance(); // '{'

                object obj{ std::less<>{}, allocator_type(m_MemRes) };
                if (auto ws = skip_space(); !ws) return std::unexpected(ws.error());
                if (accept('}')) {
                    m_Depth--;
                    return value{ std::move(obj), m_MemRes };
                }

                while (true) {
                    if (at_end()) return error(code::unexpected_end_of_input, "Unterminated object, expected '}' or string key");
                    if (peek() != '"') return error(code::unexpected_character, "Expected '\"' to start object key");
                    auto key = text();
                    if (!key) return std::unexpected(key.error());

                    if (auto ws = skip_space(); !ws) return std::unexpected(ws.error());
                    if (at_end()) return error(code::unexpected_end_of_input, "Unterminated object, expected ':' after key");
                    if (!accept(':')) return error(code::unexpected_character, "Expected ':' after object key");

                    auto member = any();
                    if (!member) return member;
                    // Duplicate keys: last occurrence wins
                    obj.insert_or_assign(std::move(*key), std::move(*member));

                    if (auto ws = skip_space(); !ws) return std::unexpected(ws.error());
                    if (accept('}')) break;
                    if (at_end()) return error(code::unexpected_end_of_input, "Unterminated object, expected ',' or '}'");
                    if (!accept(',')) return error(code::unexpected_character, "Expected ',' or '}' in object");

                    if (auto ws = skip_space(); !ws) return std::unexpected(ws.error());
                    if (m_Opts.allow_trailing_commas && accept('}')) break;
                }
                m_Depth--;
                return value{ std::move(obj), m_MemRes };
            }

            expected_t<std::uint16_t> hex4() {
                std::uint16_t unit = 0;
                for (int i = 0; i < 4; i++) {
                    if (at_end()) return error(code::invalid_unicode_escape, "Unexpected end in unicode escape");
                    const char h = advance();
                    unsigned digit = 0;
                    if (h >= '0' && h <= '9') digit = static_cast<unsigned>(h - '0');
                    else if (h >= 'A' && h <= 'F') digit = 10u + static_cast<unsigned>(h - 'A');
                    else if (h >= 'a' && h <= 'f') digit = 10u + static_cast<unsigned>(h - 'a');
                    else return error(code::invalid_unicode_escape, "Invalid hex digit in unicode escape");
                    unit = static_cast<std::uint16_t>((unit << 4) | digit);
                }
                return unit;
            }

            // Reads the code point of a \u escape (the "\u" already consumed),
            // joining surrogate pairs.
            expected_t<std::uint32_t> code_point() {
                auto high = hex4();
                if (!high) return std::unexpected(high.error());
                if (*high >= 0xDC00 && *high <= 0xDFFF) return error(code::invalid_unicode_escape, "Unpaired low surrogate");
                if (*high < 0xD800 || *high > 0xDBFF) return *high;

                if (!(accept('\\') && accept('u'))) return error(code::invalid_unicode_escape, "Expected low surrogate after high surrogate");
                auto low = hex4();
                if (!low) return std::unexpected(low.error());
                if (*low < 0xDC00 || *low > 0xDFFF) return error(code::invalid_unicode_escape, "Invalid low surrogate");
                return 0x10000u + ((static_cast<std::uint32_t>(*high - 0xD800) << 10) | static_cast<std::uint32_t>(*low - 0xDC00));
            }

            expected_t<string> text() {
                advance(); // opening quote
                string out{ allocator_type(m_MemRes) };

                while (!at_end()) {
                    const char c = advance();
                    if (c == '"') {
                        if (!is_valid_utf8(out)) return error(code::invalid_string, "Invalid UTF-8 sequence in string");
                        return out;
                    }
                    if (static_cast<unsigned char>(c) < 0x20) return error(code::invalid_string, "Control character in string");
                    if (c != '\\') {
                        out.push_back(c);
                        continue;
                    }

                    if (at_end()) return error(code::invalid_escape, "Unfinished escape sequence");
                    switch (advance()) {
                    case '"': out.push_back('"'); break;
                    case '\\': out.push_back('\\'); break;
                    case '/': out.push_back('/'); break;
                    case 'b': out.push_back('\b'); break;
                    case 'f': out.push_back('\f'); break;
                    case 'n': out.push_back('\n'); break;
                    case 'r': out.push_back('\r'); break;
                    case 't': out.push_back('\t'); break;
                    case 'u': {
                        auto cp = code_point();
                        if (!cp) return std::unexpected(cp.error());
                        append_utf8(*cp, out);
                        break;
                    }
                    default:
                        return error(code::invalid_escape, "Invalid escape sequence");
                    }
                }
                return error(code::unexpected_end_of_input, "Nonterminated string");
            }

            expected_t<double> number() {
                const std::size_t start = m_Pos;

                if (accept('-') && !is_digit(peek())) return error(code::unexpected_character, "Expected digit after '-'");
                if (advance() == '0' && is_digit(peek())) return error(code::invalid_number, "Leading zeros disallowed");
                while (is_digit(peek())) advance();

                if (accept('.')) {
                    if (!is_digit(peek())) return error(code::invalid_number, "Expected digit after '.'");
                    while (is_digit(peek())) advance();
                }

                if (peek() == 'e' || peek() == 'E') {
                    advance();
                    if (peek() == '+' || peek() == '-') advance();
                    if (!is_digit(peek())) return error(code::invalid_number, "Expected digit in exponent");
                    while (is_digit(peek())) advance();
                }

                const char next = peek();
                if (next == '.' || next == 'e' || next == 'E' || next == '+' || next == '-') {
                    return error(code::invalid_number, "Invalid character after number");
                }

                const auto digits = m_Text.substr(start, m_Pos - start);
                double result = 0.0;
                auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), result);
                if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
                    return error(code::invalid_number, "Failed to read number");
                }
                return result;
            }
        };

    } // namespace

    ReadResult read(std::string_view input, const ReadOptions& opts) {
        Reader reader{ input, opts, std::pmr::get_default_resource() };
        auto result = reader.document();
        if (!result && logger()->should_log(spdlog::level::debug)) {
            const auto& e = result.error();
            logger()->debug("JSON read failed at {}:{} (offset {}): {}", e.line, e.column, e.offset, e.msg);
        }
        return result;
    }

    ReadResult read(std::istream& is, const ReadOptions& opts) {
        std::ostringstream oss;
        oss << is.rdbuf();
        return read(oss.str(), opts);
    }

#pragma endregion
#pragma region Writer

    namespace {

        void write_string(std::string_view s, std::ostream& os) {
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
                    if (c < 0x20) {
                        static constexpr char hex[] = "0123456789ABCDEF";
                        os << "\\u00" << hex[(c >> 4) & 0xF] << hex[c & 0xF];
                    } else {
                        os.put(static_cast<char>(c));
                    }
                    break;
                }
            }
            os.put('"');
        }

        void write_number(const value& v, std::ostream& os) {
            char buf[64];
            const auto [ptr, ec] = std::visit([&buf](const auto& x) -> std::to_chars_result {
                using X = std::decay_t<decltype(x)>;
                if constexpr (std::is_floating_point_v<X>) {
                    return std::to_chars(buf, buf + sizeof(buf), x, std::chars_format::general);
                } else if constexpr (std::is_integral_v<X> && !std::is_same_v<X, bool>) {
                    return std::to_chars(buf, buf + sizeof(buf), x);
                } else {
                    return { buf, std::errc::invalid_argument };
                }
            }, v.storage());
            if (ec != std::errc{}) os << '0';
            else os.write(buf, ptr - buf);
        }

        void newline(std::ostream& os, std::size_t depth, const WriteOptions& opts) {
            if (!opts.pretty) return;
            os.put('\n');
            for (std::size_t i = 0; i < depth * opts.indent; i++) os.put(' ');
        }

        void write_value(const value& v, std::ostream& os, const WriteOptions& opts, std::size_t depth) {
            switch (v.type()) {
            case kind::null:
                os << "null";
                return;
            case kind::boolean:
                os << (v.as_bool() ? "true" : "false");
                return;
            case kind::number:
                if (!std::isfinite(v.as_number())) os << "null";
                else write_number(v, os);
                return;
            case kind::string:
                write_string(v.as_string(), os);
                return;
            case kind::array: {
                const auto& arr = v.as_array();
                os.put('[');
                for (std::size_t i = 0; i < arr.size(); i++) {
                    if (i != 0) os.put(',');
                    newline(os, depth + 1, opts);
                    write_value(arr[i], os, opts, depth + 1);
                }
                if (!arr.empty()) newline(os, depth, opts);
                os.put(']');
                return;
            }
            case kind::object: {
                // object is an ordered map, so members are written in key order
                const auto& obj = v.as_object();
                os.put('{');
                bool first = true;
                for (const auto& [k, member] : obj) {
                    if (!first) os.put(',');
                    first = false;
                    newline(os, depth + 1, opts);
                    write_string(k, os);
                    os << (opts.pretty ? ": " : ":");
                    write_value(member, os, opts, depth + 1);
                }
                if (!obj.empty()) newline(os, depth, opts);
                os.put('}');
                return;
            }
            }
        }

    } // namespace

    std::string dump(const value& v, const WriteOptions& opts) {
        std::ostringstream oss;
        write_value(v, oss, opts, 0);
        return oss.str();
    }

    void dump(const value& v, std::ostream& os, const WriteOptions& opts) {
        write_value(v, os, opts, 0);
    }

#pragma endregion

    std::string message(const JsonError& err) {
        return std::visit([](const auto& e) -> std::string {
            using E = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<E, ReadError>) {
                return "line " + std::to_string(e.line) + ", column " + std::to_string(e.column) + ": " + e.msg;
            } else {
                return e.what();
            }
        }, err);
    }

} // namespace Verse
