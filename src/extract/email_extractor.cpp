#include "extract/format_extractors.hpp"

#include <cctype>
#include <cstdlib>
#include <map>
#include <optional>
#include <utility>

#include "extract/text_codec.hpp"
#include "util/json_text.hpp"

namespace docsanitizer {
namespace extract {

namespace {

constexpr int kMaxMimeDepth = 16;
const char *const kReportedHeaders[] = {"From", "To", "Cc", "Subject", "Date"};

using HeaderList = std::vector<std::pair<std::string, std::string>>;

struct MimePart
{
    HeaderList headers;
    std::string body;
};

struct ContentType
{
    std::string type = "text/plain";
    std::map<std::string, std::string> params;
};

std::optional<std::string> headerValue(const HeaderList &headers, const std::string &name)
{
    const std::string wanted = codec::toLowerCopy(name);
    for (const auto &h : headers) {
        if (codec::toLowerCopy(h.first) == wanted) {
            return h.second;
        }
    }
    return std::nullopt;
}

bool looksLikeHeaderLine(const std::string &line)
{
    auto colon = line.find(':');
    if (colon == std::string::npos || colon == 0) {
        return false;
    }
    for (size_t i = 0; i < colon; ++i) {
        unsigned char c = static_cast<unsigned char>(line[i]);
        if (c <= 32 || c >= 127) {
            return false;
        }
    }
    return true;
}

/**
 * Split "headers\n\nbody" (LF line endings). When @p requireHeaders is set the
 * first line must be a header field.
 */
MimePart parsePart(const std::string &text, bool requireHeaders)
{
    MimePart part;
    size_t pos = 0;

    // mbox "From " separator line.
    if (text.compare(0, 5, "From ") == 0) {
        pos = text.find('\n');
        pos = pos == std::string::npos ? text.size() : pos + 1;
    }

    while (pos < text.size()) {
        size_t eol = text.find('\n', pos);
        if (eol == std::string::npos) {
            eol = text.size();
        }
        std::string line = text.substr(pos, eol - pos);
        if (line.empty()) {
            pos = eol + 1;
            break;
        }
        if ((line[0] == ' ' || line[0] == '\t') && !part.headers.empty()) {
            part.headers.back().second += " " + codec::trimCopy(line);
        } else if (looksLikeHeaderLine(line)) {
            auto colon = line.find(':');
            part.headers.emplace_back(line.substr(0, colon), codec::trimCopy(line.substr(colon + 1)));
        } else if (part.headers.empty()) {
            if (requireHeaders) {
                throw ExtractionError("email: no header block found");
            }
            // A part without headers starts its body immediately.
            break;
        } else {
            throw ExtractionError("email: malformed header line");
        }
        pos = eol + 1;
    }

    if (requireHeaders && part.headers.empty()) {
        throw ExtractionError("email: no header block found");
    }
    part.body = pos < text.size() ? text.substr(pos) : std::string();
    return part;
}

ContentType parseContentType(const std::optional<std::string> &value)
{
    ContentType ct;
    if (!value) {
        return ct;
    }
    const std::string &v = *value;
    size_t semi = v.find(';');
    std::string type = codec::toLowerCopy(codec::trimCopy(v.substr(0, semi)));
    if (!type.empty()) {
        ct.type = type;
    }

    while (semi != std::string::npos) {
        size_t start = semi + 1;
        size_t eq = v.find('=', start);
        if (eq == std::string::npos) {
            break;
        }
        std::string key = codec::toLowerCopy(codec::trimCopy(v.substr(start, eq - start)));
        size_t valueStart = eq + 1;
        while (valueStart < v.size() && std::isspace(static_cast<unsigned char>(v[valueStart]))) {
            ++valueStart;
        }
        std::string param;
        if (valueStart < v.size() && v[valueStart] == '"') {
            size_t close = v.find('"', valueStart + 1);
            if (close == std::string::npos) {
                close = v.size();
            }
            param = v.substr(valueStart + 1, close - valueStart - 1);
            semi = close < v.size() ? v.find(';', close) : std::string::npos;
        } else {
            semi = v.find(';', valueStart);
            param = codec::trimCopy(v.substr(valueStart, semi == std::string::npos ? std::string::npos : semi - valueStart));
        }
        ct.params[key] = param;
    }
    return ct;
}

std::string toUtf8(const std::string &bytes, const std::string &charset)
{
    std::string cs = codec::toLowerCopy(charset);
    if (cs == "iso-8859-1" || cs == "latin1" || cs == "latin-1" || cs == "windows-1252") {
        return codec::latin1ToUtf8(bytes);
    }
    if (codec::isValidUtf8(bytes)) {
        return bytes;
    }
    return codec::latin1ToUtf8(bytes);
}

std::string decodeTransfer(const MimePart &part)
{
    std::string encoding = codec::toLowerCopy(headerValue(part.headers, "Content-Transfer-Encoding").value_or(""));
    encoding = codec::trimCopy(encoding);
    if (encoding == "base64") {
        return codec::decodeBase64(part.body);
    }
    if (encoding == "quoted-printable") {
        return codec::decodeQuotedPrintable(part.body);
    }
    return part.body;
}

std::string decodeHtmlEntities(const std::string &text)
{
    static const std::map<std::string, std::string> named = {
        {"nbsp", " "}, {"amp", "&"}, {"lt", "<"}, {"gt", ">"}, {"quot", "\""}, {"apos", "'"}};
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '&') {
            size_t semi = text.find(';', i + 1);
            if (semi != std::string::npos && semi - i <= 10) {
                std::string entity = text.substr(i + 1, semi - i - 1);
                auto it = named.find(entity);
                if (it != named.end()) {
                    out += it->second;
                    i = semi;
                    continue;
                }
                if (entity.size() > 1 && entity[0] == '#') {
                    bool hex = entity[1] == 'x' || entity[1] == 'X';
                    char *end = nullptr;
                    unsigned long cp = std::strtoul(entity.c_str() + (hex ? 2 : 1), &end, hex ? 16 : 10);
                    if (end && *end == '\0' && cp > 0 && cp <= 0x10FFFF) {
                        util::json::detail::appendUtf8(out, static_cast<uint32_t>(cp));
                        i = semi;
                        continue;
                    }
                }
            }
        }
        out += text[i];
    }
    return out;
}

/**
 * Crude HTML to text: drops script/style blocks and tags, turns block-level
 * closers into line breaks.
 */
std::string htmlToText(const std::string &html)
{
    const std::string lower = codec::toLowerCopy(html);
    std::string out;
    size_t i = 0;
    while (i < html.size()) {
        if (html[i] != '<') {
            out += html[i++];
            continue;
        }
        size_t close = html.find('>', i);
        if (close == std::string::npos) {
            break;
        }
        std::string tag = lower.substr(i + 1, close - i - 1);
        std::string tagName;
        for (char c : tag) {
            if (std::isalnum(static_cast<unsigned char>(c)) || c == '/') {
                tagName += c;
            } else {
                break;
            }
        }
        if (tagName == "script" || tagName == "style") {
            size_t end = lower.find("</" + tagName, close);
            if (end == std::string::npos) {
                break;
            }
            close = lower.find('>', end);
            if (close == std::string::npos) {
                break;
            }
        } else if (tagName == "br" || tagName == "br/" || tagName == "/p" || tagName == "/div" ||
                   tagName == "/tr" || tagName == "/li" || tagName == "/h1" || tagName == "/h2" ||
                   tagName == "/h3") {
            out += '\n';
        }
        i = close + 1;
    }

    std::string text = decodeHtmlEntities(out);
    std::string collapsed;
    size_t newlines = 0;
    for (const auto &line : codec::splitLines(text)) {
        std::string trimmed = codec::trimCopy(line);
        if (trimmed.empty()) {
            if (++newlines > 1) {
                continue;
            }
        } else {
            newlines = 0;
        }
        collapsed += trimmed + "\n";
    }
    return codec::trimCopy(collapsed);
}

struct BodyCandidates
{
    std::optional<std::string> plain;
    std::optional<std::string> html;
    size_t attachments = 0;
};

void collectBodies(const MimePart &part, int depth, BodyCandidates &found)
{
    if (depth > kMaxMimeDepth) {
        throw ExtractionError("email: MIME nesting too deep");
    }

    ContentType ct = parseContentType(headerValue(part.headers, "Content-Type"));
    std::string disposition = codec::toLowerCopy(headerValue(part.headers, "Content-Disposition").value_or(""));

    if (ct.type.compare(0, 10, "multipart/") == 0) {
        auto boundaryIt = ct.params.find("boundary");
        if (boundaryIt == ct.params.end() || boundaryIt->second.empty()) {
            throw ExtractionError("email: multipart body without a boundary");
        }
        const std::string delimiter = "--" + boundaryIt->second;

        // Delimiters only count at the start of a line.
        std::vector<size_t> marks;
        size_t pos = 0;
        while ((pos = part.body.find(delimiter, pos)) != std::string::npos) {
            if (pos == 0 || part.body[pos - 1] == '\n') {
                marks.push_back(pos);
            }
            pos += delimiter.size();
        }
        if (marks.empty()) {
            throw ExtractionError("email: multipart boundary never occurs in the body");
        }

        for (size_t m = 0; m < marks.size(); ++m) {
            size_t afterDelimiter = marks[m] + delimiter.size();
            if (part.body.compare(afterDelimiter, 2, "--") == 0) {
                break; // closing delimiter
            }
            size_t start = part.body.find('\n', afterDelimiter);
            if (start == std::string::npos) {
                break;
            }
            ++start;
            size_t end = m + 1 < marks.size() ? marks[m + 1] : part.body.size();
            if (end > start && part.body[end - 1] == '\n') {
                --end; // the line break before a delimiter belongs to it
            }
            std::string child = end > start ? part.body.substr(start, end - start) : std::string();
            collectBodies(parsePart(child, false), depth + 1, found);
        }
        return;
    }

    if (disposition.compare(0, 10, "attachment") == 0) {
        ++found.attachments;
        return;
    }

    if (ct.type == "text/plain" && !found.plain) {
        found.plain = toUtf8(decodeTransfer(part), ct.params["charset"]);
    } else if (ct.type == "text/html" && !found.html) {
        found.html = toUtf8(decodeTransfer(part), ct.params["charset"]);
    } else if (ct.type.compare(0, 5, "text/") != 0) {
        ++found.attachments;
    }
}

} // namespace

ExtractedDocument EmailExtractor::extract(const std::vector<uint8_t> &bytes) const
{
    std::string raw(bytes.begin(), bytes.end());
    std::string text;
    text.reserve(raw.size());
    for (size_t i = 0; i < raw.size(); ++i) {
        if (raw[i] == '\r' && i + 1 < raw.size() && raw[i + 1] == '\n') {
            continue;
        }
        text += raw[i];
    }

    MimePart message = parsePart(text, true);

    ExtractedDocument doc;
    doc.mediaKind = mediaKind();

    Segment headers;
    headers.kind = SegmentKind::EmailHeaders;
    headers.label = "Email Headers";
    headers.units.push_back("## Email Headers");
    for (const char *name : kReportedHeaders) {
        auto value = headerValue(message.headers, name);
        if (value && !value->empty()) {
            std::string decoded = codec::decodeHeaderWords(*value);
            if (!codec::isValidUtf8(decoded)) {
                decoded = codec::latin1ToUtf8(decoded);
            }
            headers.units.push_back(std::string("**") + name + ":** " + decoded);
        }
    }
    doc.segments.push_back(std::move(headers));

    BodyCandidates found;
    collectBodies(message, 0, found);

    std::string bodyText;
    if (found.plain) {
        bodyText = *found.plain;
        doc.metadata["body_type"] = "text/plain";
    } else if (found.html) {
        bodyText = htmlToText(*found.html);
        doc.metadata["body_type"] = "text/html";
    } else {
        doc.metadata["body_type"] = "none";
    }

    Segment body;
    body.kind = SegmentKind::EmailBody;
    body.label = "Email Body";
    body.units.push_back("## Email Body");
    auto lines = codec::splitLines(bodyText);
    while (!lines.empty() && codec::trimCopy(lines.back()).empty()) {
        lines.pop_back();
    }
    for (auto &line : lines) {
        body.units.push_back(std::move(line));
    }
    doc.segments.push_back(std::move(body));

    doc.metadata["attachment_count"] = std::to_string(found.attachments);
    return doc;
}

} // namespace extract
} // namespace docsanitizer
