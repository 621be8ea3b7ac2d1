#include "extract/text_codec.hpp"

#include <algorithm>
#include <cctype>
#include <openssl/evp.h>

#include "extract/extracted_document.hpp"

namespace docsanitizer {
namespace extract {
namespace codec {

bool isValidUtf8(const std::string &text)
{
    size_t i = 0;
    const size_t n = text.size();
    while (i < n) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        size_t extra = 0;
        uint32_t cp = 0;
        if (c < 0x80) {
            ++i;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            extra = 1;
            cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            extra = 2;
            cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            extra = 3;
            cp = c & 0x07;
        } else {
            return false;
        }
        if (i + extra >= n) {
            return false;
        }
        for (size_t k = 1; k <= extra; ++k) {
            unsigned char cc = static_cast<unsigned char>(text[i + k]);
            if ((cc & 0xC0) != 0x80) {
                return false;
            }
            cp = (cp << 6) | (cc & 0x3F);
        }
        // Overlong forms, surrogates and out-of-range code points.
        if ((extra == 1 && cp < 0x80) || (extra == 2 && cp < 0x800) || (extra == 3 && cp < 0x10000) ||
            (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
            return false;
        }
        i += extra + 1;
    }
    return true;
}

std::string latin1ToUtf8(const std::string &text)
{
    std::string out;
    out.reserve(text.size() + text.size() / 4);
    for (unsigned char c : text) {
        if (c < 0x80) {
            out += static_cast<char>(c);
        } else {
            out += static_cast<char>(0xC0 | (c >> 6));
            out += static_cast<char>(0x80 | (c & 0x3F));
        }
    }
    return out;
}

std::string decodeText(const std::vector<uint8_t> &bytes)
{
    std::string text(bytes.begin(), bytes.end());
    if (text.size() >= 3 && static_cast<unsigned char>(text[0]) == 0xEF &&
        static_cast<unsigned char>(text[1]) == 0xBB && static_cast<unsigned char>(text[2]) == 0xBF) {
        text.erase(0, 3);
    }
    if (isValidUtf8(text)) {
        return text;
    }
    return latin1ToUtf8(text);
}

std::vector<std::string> splitLines(const std::string &text)
{
    std::vector<std::string> lines;
    size_t start = 0;
    while (start <= text.size()) {
        size_t end = text.find('\n', start);
        if (end == std::string::npos) {
            end = text.size();
        }
        std::string line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(std::move(line));
        if (end == text.size()) {
            break;
        }
        start = end + 1;
    }
    return lines;
}

std::string decodeBase64(const std::string &encoded)
{
    std::string clean;
    clean.reserve(encoded.size());
    for (char c : encoded) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            clean += c;
        }
    }
    if (clean.empty()) {
        return std::string();
    }
    if (clean.size() % 4 != 0) {
        throw ExtractionError("base64 payload length is not a multiple of 4");
    }

    size_t padding = 0;
    if (clean[clean.size() - 1] == '=') {
        ++padding;
        if (clean[clean.size() - 2] == '=') {
            ++padding;
        }
    }

    std::string out(clean.size() / 4 * 3, '\0');
    int written = EVP_DecodeBlock(reinterpret_cast<unsigned char *>(&out[0]),
                                  reinterpret_cast<const unsigned char *>(clean.data()),
                                  static_cast<int>(clean.size()));
    if (written < 0) {
        throw ExtractionError("malformed base64 payload");
    }
    out.resize(static_cast<size_t>(written) - padding);
    return out;
}

namespace {

int hexValue(char c)
{
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    return -1;
}

std::string charsetToUtf8(const std::string &charset, const std::string &bytes, bool &known)
{
    std::string cs = toLowerCopy(charset);
    known = true;
    if (cs == "utf-8" || cs == "utf8" || cs == "us-ascii" || cs == "ascii") {
        return bytes;
    }
    if (cs == "iso-8859-1" || cs == "latin1" || cs == "latin-1" || cs == "windows-1252") {
        return latin1ToUtf8(bytes);
    }
    known = false;
    return bytes;
}

} // namespace

std::string decodeQuotedPrintable(const std::string &encoded)
{
    std::string out;
    out.reserve(encoded.size());
    for (size_t i = 0; i < encoded.size(); ++i) {
        char c = encoded[i];
        if (c != '=') {
            out += c;
            continue;
        }
        // Soft line break: "=\r\n" or "=\n".
        if (i + 1 < encoded.size() && encoded[i + 1] == '\n') {
            i += 1;
            continue;
        }
        if (i + 2 < encoded.size() && encoded[i + 1] == '\r' && encoded[i + 2] == '\n') {
            i += 2;
            continue;
        }
        if (i + 2 < encoded.size()) {
            int hi = hexValue(encoded[i + 1]);
            int lo = hexValue(encoded[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out += static_cast<char>((hi << 4) | lo);
                i += 2;
                continue;
            }
        }
        out += c; // stray '=' kept literally
    }
    return out;
}

std::string decodeHeaderWords(const std::string &value)
{
    std::string out;
    size_t pos = 0;
    bool lastWasEncoded = false;
    while (pos < value.size()) {
        size_t start = value.find("=?", pos);
        if (start == std::string::npos) {
            out += value.substr(pos);
            break;
        }
        size_t q1 = value.find('?', start + 2);
        size_t q2 = q1 == std::string::npos ? q1 : value.find('?', q1 + 1);
        size_t end = q2 == std::string::npos ? q2 : value.find("?=", q2 + 1);
        if (end == std::string::npos) {
            out += value.substr(pos);
            break;
        }

        std::string between = value.substr(pos, start - pos);
        // Whitespace between two adjacent encoded-words is not part of the text.
        if (!(lastWasEncoded && trimCopy(between).empty())) {
            out += between;
        }

        std::string charset = value.substr(start + 2, q1 - start - 2);
        std::string encoding = toLowerCopy(value.substr(q1 + 1, q2 - q1 - 1));
        std::string payload = value.substr(q2 + 1, end - q2 - 1);

        std::string raw;
        bool decoded = true;
        if (encoding == "b") {
            try {
                raw = decodeBase64(payload);
            } catch (const ExtractionError &) {
                decoded = false;
            }
        } else if (encoding == "q") {
            std::string underscoresAsSpaces = payload;
            std::replace(underscoresAsSpaces.begin(), underscoresAsSpaces.end(), '_', ' ');
            raw = decodeQuotedPrintable(underscoresAsSpaces);
        } else {
            decoded = false;
        }

        bool knownCharset = false;
        std::string converted = decoded ? charsetToUtf8(charset, raw, knownCharset) : std::string();
        if (decoded && knownCharset) {
            out += converted;
            lastWasEncoded = true;
        } else {
            out += value.substr(start, end + 2 - start);
            lastWasEncoded = false;
        }
        pos = end + 2;
    }
    return out;
}

std::string escapeTableCell(const std::string &value)
{
    std::string out;
    out.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
        char c = value[i];
        if (c == '|') {
            out += "\\|";
        } else if (c == '\r') {
            if (i + 1 < value.size() && value[i + 1] == '\n') {
                continue;
            }
            out += ' ';
        } else if (c == '\n') {
            out += ' ';
        } else {
            out += c;
        }
    }
    return out;
}

std::string markdownRow(const std::vector<std::string> &cells)
{
    std::string row = "|";
    for (const auto &cell : cells) {
        row += " " + escapeTableCell(cell) + " |";
    }
    return row;
}

std::string markdownSeparator(size_t columns)
{
    std::string sep = "|";
    for (size_t i = 0; i < columns; ++i) {
        sep += "---|";
    }
    return sep;
}

std::string trimCopy(const std::string &text)
{
    static const char *whitespace = " \t\r\n";
    auto first = text.find_first_not_of(whitespace);
    if (first == std::string::npos) {
        return std::string();
    }
    auto last = text.find_last_not_of(whitespace);
    return text.substr(first, last - first + 1);
}

std::string toLowerCopy(const std::string &text)
{
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace codec
} // namespace extract
} // namespace docsanitizer
