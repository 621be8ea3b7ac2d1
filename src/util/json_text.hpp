#ifndef DOCSANITIZER_UTIL_JSON_TEXT_HPP
#define DOCSANITIZER_UTIL_JSON_TEXT_HPP

#include <cstdint>
#include <cstdio>
#include <optional>
#include <stdexcept>
#include <string>

/**
 * @file json_text.hpp
 * @brief Just enough JSON for talking to the model backend: escaping string
 *        values when building a request body, and pulling a top-level string
 *        field back out of a reply.
 *
 * Replies are of the form {"model":"...","response":"...","done":true,...}.
 * The field scanner walks the object once, skipping nested values, so a key
 * that happens to appear inside another string value is never matched.
 */

namespace docsanitizer {
namespace util {
namespace json {

/**
 * @brief Escape a UTF-8 string for use inside a JSON string literal.
 */
inline std::string escape(const std::string &input)
{
    std::string out;
    out.reserve(input.size() + 16);
    for (unsigned char c : input) {
        switch (c) {
        case '"':
            out += "\\\"";
            break;
        case '\\':
            out += "\\\\";
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
        case '\b':
            out += "\\b";
            break;
        case '\f':
            out += "\\f";
            break;
        default:
            if (c < 0x20) {
                char buf[8];
                std::snprintf(buf, sizeof(buf), "\\u%04x", c);
                out += buf;
            } else {
                out += static_cast<char>(c);
            }
        }
    }
    return out;
}

namespace detail {

inline void appendUtf8(std::string &out, uint32_t cp)
{
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

inline uint32_t parseHex4(const std::string &s, size_t pos)
{
    if (pos + 4 > s.size()) {
        throw std::runtime_error("json: truncated \\u escape");
    }
    uint32_t value = 0;
    for (size_t i = pos; i < pos + 4; ++i) {
        char c = s[i];
        value <<= 4;
        if (c >= '0' && c <= '9') {
            value |= static_cast<uint32_t>(c - '0');
        } else if (c >= 'a' && c <= 'f') {
            value |= static_cast<uint32_t>(c - 'a' + 10);
        } else if (c >= 'A' && c <= 'F') {
            value |= static_cast<uint32_t>(c - 'A' + 10);
        } else {
            throw std::runtime_error("json: bad hex digit in \\u escape");
        }
    }
    return value;
}

inline void skipWhitespace(const std::string &s, size_t &pos)
{
    while (pos < s.size() && (s[pos] == ' ' || s[pos] == '\n' || s[pos] == '\r' || s[pos] == '\t')) {
        ++pos;
    }
}

/**
 * @brief Parse a string literal starting at s[pos] == '"'; pos ends past the closing quote.
 */
inline std::string parseString(const std::string &s, size_t &pos)
{
    if (pos >= s.size() || s[pos] != '"') {
        throw std::runtime_error("json: expected string");
    }
    ++pos;
    std::string out;
    while (pos < s.size()) {
        char c = s[pos++];
        if (c == '"') {
            return out;
        }
        if (c != '\\') {
            out += c;
            continue;
        }
        if (pos >= s.size()) {
            break;
        }
        char e = s[pos++];
        switch (e) {
        case '"':
            out += '"';
            break;
        case '\\':
            out += '\\';
            break;
        case '/':
            out += '/';
            break;
        case 'b':
            out += '\b';
            break;
        case 'f':
            out += '\f';
            break;
        case 'n':
            out += '\n';
            break;
        case 'r':
            out += '\r';
            break;
        case 't':
            out += '\t';
            break;
        case 'u': {
            uint32_t cp = parseHex4(s, pos);
            pos += 4;
            if (cp >= 0xD800 && cp <= 0xDBFF && pos + 6 <= s.size() && s[pos] == '\\' && s[pos + 1] == 'u') {
                uint32_t low = parseHex4(s, pos + 2);
                if (low >= 0xDC00 && low <= 0xDFFF) {
                    cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                    pos += 6;
                }
            }
            appendUtf8(out, cp);
            break;
        }
        default:
            throw std::runtime_error(std::string("json: invalid escape \\") + e);
        }
    }
    throw std::runtime_error("json: unterminated string");
}

/**
 * @brief Skip any JSON value starting at pos (string, number, literal, object, array).
 */
inline void skipValue(const std::string &s, size_t &pos)
{
    skipWhitespace(s, pos);
    if (pos >= s.size()) {
        throw std::runtime_error("json: unexpected end of input");
    }
    char c = s[pos];
    if (c == '"') {
        parseString(s, pos);
        return;
    }
    if (c == '{' || c == '[') {
        int depth = 0;
        while (pos < s.size()) {
            char d = s[pos];
            if (d == '"') {
                parseString(s, pos);
                continue;
            }
            if (d == '{' || d == '[') {
                ++depth;
            } else if (d == '}' || d == ']') {
                --depth;
                if (depth == 0) {
                    ++pos;
                    return;
                }
            }
            ++pos;
        }
        throw std::runtime_error("json: unterminated container");
    }
    while (pos < s.size() && s[pos] != ',' && s[pos] != '}' && s[pos] != ']') {
        ++pos;
    }
}

} // namespace detail

/**
 * @brief Find a top-level string field of a JSON object.
 * @return std::nullopt if the key is absent or its value is not a string.
 * @throw std::runtime_error if the text is not a well-formed object.
 */
inline std::optional<std::string> findStringField(const std::string &text, const std::string &key)
{
    size_t pos = 0;
    detail::skipWhitespace(text, pos);
    if (pos >= text.size() || text[pos] != '{') {
        throw std::runtime_error("json: expected object");
    }
    ++pos;
    for (;;) {
        detail::skipWhitespace(text, pos);
        if (pos < text.size() && text[pos] == '}') {
            return std::nullopt;
        }
        std::string name = detail::parseString(text, pos);
        detail::skipWhitespace(text, pos);
        if (pos >= text.size() || text[pos] != ':') {
            throw std::runtime_error("json: expected ':' after key");
        }
        ++pos;
        detail::skipWhitespace(text, pos);
        if (name == key) {
            if (pos < text.size() && text[pos] == '"') {
                return detail::parseString(text, pos);
            }
            return std::nullopt;
        }
        detail::skipValue(text, pos);
        detail::skipWhitespace(text, pos);
        if (pos < text.size() && text[pos] == ',') {
            ++pos;
            continue;
        }
        if (pos < text.size() && text[pos] == '}') {
            return std::nullopt;
        }
        throw std::runtime_error("json: expected ',' or '}'");
    }
}

} // namespace json
} // namespace util
} // namespace docsanitizer

#endif // DOCSANITIZER_UTIL_JSON_TEXT_HPP
