#pragma once

#include <cctype>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace apidoc::serde {

inline bool is_space(char c) noexcept {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

inline std::string_view trim_view(std::string_view sv) noexcept {
    while (!sv.empty() && is_space(sv.front())) {
        sv.remove_prefix(1);
    }
    while (!sv.empty() && is_space(sv.back())) {
        sv.remove_suffix(1);
    }
    return sv;
}

inline std::string to_lower(std::string_view sv) {
    std::string out(sv);
    for (char& c : out) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

inline bool iequals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

// Splits `text` at the first occurrence of `sep`. Returns nullopt when `sep`
// does not occur.
inline std::optional<std::pair<std::string_view, std::string_view>>
split_once(std::string_view text, std::string_view sep) noexcept {
    auto at = text.find(sep);
    if (at == std::string_view::npos) {
        return std::nullopt;
    }
    return std::pair{text.substr(0, at), text.substr(at + sep.size())};
}

// Lines without their terminator; a trailing '\r' is dropped as well.
inline std::vector<std::string_view> split_lines(std::string_view text) {
    std::vector<std::string_view> lines;
    size_t pos = 0;
    while (pos <= text.size()) {
        size_t end = text.find('\n', pos);
        if (end == std::string_view::npos) {
            end = text.size();
        }
        std::string_view line = text.substr(pos, end - pos);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        lines.push_back(line);
        pos = end + 1;
    }
    return lines;
}

struct json_cursor {
    const char* ptr;
    const char* end;
    const char* start; // Track start for position calculation

    json_cursor(const char* p, const char* e) : ptr(p), end(e), start(p) {}

    bool eof() const noexcept { return ptr >= end; }

    size_t pos() const noexcept { return static_cast<size_t>(ptr - start); }

    char peek() const noexcept { return eof() ? '\0' : *ptr; }

    void skip_ws() noexcept {
        while (!eof() && is_space(*ptr)) {
            ++ptr;
        }
    }

    bool consume(char c) noexcept {
        skip_ws();
        if (eof() || *ptr != c) {
            return false;
        }
        ++ptr;
        return true;
    }

    bool consume_literal(std::string_view lit) noexcept {
        if (static_cast<size_t>(end - ptr) < lit.size() ||
            std::string_view(ptr, lit.size()) != lit) {
            return false;
        }
        ptr += lit.size();
        return true;
    }

    // Raw string contents between the quotes, escapes left in place.
    std::optional<std::string_view> string() noexcept {
        skip_ws();
        if (eof() || *ptr != '\"') {
            return std::nullopt;
        }
        ++ptr;
        const char* str_start = ptr;
        while (!eof() && *ptr != '\"') {
            if (static_cast<unsigned char>(*ptr) < 0x20) {
                return std::nullopt;
            }
            if (*ptr == '\\' && (ptr + 1) < end) {
                ptr += 2;
                continue;
            }
            ++ptr;
        }
        if (eof()) {
            return std::nullopt;
        }
        const char* stop = ptr;
        ++ptr; // consume closing quote
        return std::string_view(str_start, static_cast<size_t>(stop - str_start));
    }

    // Strict JSON number grammar; returns the lexeme.
    std::optional<std::string_view> number() noexcept {
        skip_ws();
        const char* begin = ptr;
        const char* p = ptr;
        auto digits = [&]() {
            const char* d = p;
            while (p < end && std::isdigit(static_cast<unsigned char>(*p))) {
                ++p;
            }
            return p - d;
        };
        if (p < end && *p == '-') {
            ++p;
        }
        if (p < end && *p == '0') {
            ++p;
        } else if (digits() == 0) {
            return std::nullopt;
        }
        if (p < end && *p == '.') {
            ++p;
            if (digits() == 0) {
                return std::nullopt;
            }
        }
        if (p < end && (*p == 'e' || *p == 'E')) {
            ++p;
            if (p < end && (*p == '+' || *p == '-')) {
                ++p;
            }
            if (digits() == 0) {
                return std::nullopt;
            }
        }
        ptr = p;
        return std::string_view(begin, static_cast<size_t>(p - begin));
    }

    bool try_object_start() noexcept { return consume('{'); }
    bool try_object_end() noexcept { return consume('}'); }
    bool try_array_start() noexcept { return consume('['); }
    bool try_array_end() noexcept { return consume(']'); }
    bool try_comma() noexcept { return consume(','); }
};

inline void append_utf8(std::string& out, unsigned cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
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

inline std::optional<unsigned> parse_hex4(std::string_view sv) noexcept {
    if (sv.size() < 4) {
        return std::nullopt;
    }
    unsigned v = 0;
    for (size_t i = 0; i < 4; ++i) {
        char c = sv[i];
        v <<= 4;
        if (c >= '0' && c <= '9') {
            v |= static_cast<unsigned>(c - '0');
        } else if (c >= 'a' && c <= 'f') {
            v |= static_cast<unsigned>(c - 'a' + 10);
        } else if (c >= 'A' && c <= 'F') {
            v |= static_cast<unsigned>(c - 'A' + 10);
        } else {
            return std::nullopt;
        }
    }
    return v;
}

// Decodes the escapes of a raw string returned by json_cursor::string().
inline std::optional<std::string> unescape_json_string(std::string_view raw) {
    std::string out;
    out.reserve(raw.size());
    for (size_t i = 0; i < raw.size(); ++i) {
        char c = raw[i];
        if (c != '\\') {
            out.push_back(c);
            continue;
        }
        if (++i >= raw.size()) {
            return std::nullopt;
        }
        switch (raw[i]) {
        case '\"':
            out.push_back('\"');
            break;
        case '\\':
            out.push_back('\\');
            break;
        case '/':
            out.push_back('/');
            break;
        case 'b':
            out.push_back('\b');
            break;
        case 'f':
            out.push_back('\f');
            break;
        case 'n':
            out.push_back('\n');
            break;
        case 'r':
            out.push_back('\r');
            break;
        case 't':
            out.push_back('\t');
            break;
        case 'u': {
            auto cp = parse_hex4(raw.substr(i + 1));
            if (!cp) {
                return std::nullopt;
            }
            i += 4;
            unsigned code = *cp;
            if (code >= 0xD800 && code <= 0xDBFF && i + 6 < raw.size() &&
                raw.substr(i + 1, 2) == "\\u") {
                auto low = parse_hex4(raw.substr(i + 3));
                if (low && *low >= 0xDC00 && *low <= 0xDFFF) {
                    code = 0x10000 + ((code - 0xD800) << 10) + (*low - 0xDC00);
                    i += 6;
                }
            }
            append_utf8(out, code);
            break;
        }
        default:
            return std::nullopt;
        }
    }
    return out;
}

inline std::string escape_json_string(std::string_view sv) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(sv.size() + 8);
    for (char c : sv) {
        switch (c) {
        case '\\':
            out += "\\\\";
            break;
        case '\"':
            out += "\\\"";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                out += "\\u00";
                out.push_back(kHex[(static_cast<unsigned char>(c) >> 4) & 0xF]);
                out.push_back(kHex[static_cast<unsigned char>(c) & 0xF]);
            } else {
                out.push_back(c);
            }
            break;
        }
    }
    return out;
}

} // namespace apidoc::serde
