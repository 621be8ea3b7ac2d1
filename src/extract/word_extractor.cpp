#include "extract/format_extractors.hpp"

#include <algorithm>
#include <cctype>

#include "extract/text_codec.hpp"
#include "extract/xml_reader.hpp"
#include "extract/zip_archive.hpp"

namespace docsanitizer {
namespace extract {

namespace {

const char *kDocumentPart = "word/document.xml";

/**
 * "Heading1", "heading 2", "Title" -> 1, 2, 1. Zero when not a heading style.
 */
int headingLevel(const std::string &style)
{
    std::string s = codec::toLowerCopy(style);
    s.erase(std::remove(s.begin(), s.end(), ' '), s.end());
    if (s == "title") {
        return 1;
    }
    if (s.compare(0, 7, "heading") != 0 || s.size() == 7) {
        return 0;
    }
    int level = 0;
    for (size_t i = 7; i < s.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) {
            return 0;
        }
        level = level * 10 + (s[i] - '0');
    }
    return std::min(std::max(level, 1), 6);
}

struct TableBuilder
{
    std::vector<std::vector<std::string>> rows;
    std::vector<std::string> row;
    std::string cell;

    std::vector<std::string> render() const
    {
        size_t columns = 0;
        for (const auto &r : rows) {
            columns = std::max(columns, r.size());
        }
        std::vector<std::string> lines;
        if (columns == 0) {
            return lines;
        }
        for (size_t i = 0; i < rows.size(); ++i) {
            std::vector<std::string> padded = rows[i];
            padded.resize(columns);
            lines.push_back(codec::markdownRow(padded));
            if (i == 0) {
                lines.push_back(codec::markdownSeparator(columns));
            }
        }
        return lines;
    }
};

} // namespace

ExtractedDocument WordExtractor::extract(const std::vector<uint8_t> &bytes) const
{
    ExtractedDocument doc;
    doc.mediaKind = mediaKind();

    std::string xml;
    try {
        ZipArchive archive(bytes);
        if (!archive.contains(kDocumentPart)) {
            throw ExtractionError(std::string("docx: missing ") + kDocumentPart);
        }
        xml = archive.read(kDocumentPart);
    } catch (const ZipError &ex) {
        throw ExtractionError(std::string("docx: ") + ex.what());
    }

    Segment body;
    body.kind = SegmentKind::Body;
    body.label = "Body";

    TableBuilder table;
    int tableDepth = 0;
    size_t tableCount = 0;
    size_t paragraphCount = 0;

    std::string paragraph;
    std::string style;
    bool inParagraph = false;
    bool inText = false;

    auto flushBody = [&]() {
        if (!body.units.empty()) {
            doc.segments.push_back(body);
            body.units.clear();
        }
    };

    try {
        XmlReader reader(xml);
        while (reader.next() != XmlReader::Token::End) {
            const auto token = reader.token();
            if (token == XmlReader::Token::Text) {
                if (inText) {
                    paragraph += reader.text();
                }
                continue;
            }

            const std::string local = reader.localName();
            const bool start = token == XmlReader::Token::StartElement;

            if (local == "p") {
                if (start) {
                    inParagraph = true;
                    paragraph.clear();
                    style.clear();
                } else {
                    inParagraph = false;
                    ++paragraphCount;
                    if (tableDepth > 0) {
                        std::string text = codec::trimCopy(paragraph);
                        if (!text.empty()) {
                            if (!table.cell.empty()) {
                                table.cell += ' ';
                            }
                            table.cell += text;
                        }
                    } else if (!codec::trimCopy(paragraph).empty()) {
                        int level = headingLevel(style);
                        body.units.push_back(level > 0 ? std::string(level, '#') + " " + paragraph : paragraph);
                    }
                }
            } else if (local == "pStyle" && start && inParagraph) {
                style = reader.attribute("w:val").value_or("");
            } else if (local == "t") {
                inText = start;
            } else if (local == "tab" && start && inParagraph) {
                paragraph += '\t';
            } else if ((local == "br" || local == "cr") && start && inParagraph) {
                paragraph += '\n';
            } else if (local == "tbl") {
                if (start) {
                    if (tableDepth++ == 0) {
                        table = TableBuilder();
                    }
                } else if (--tableDepth == 0) {
                    auto lines = table.render();
                    if (!lines.empty()) {
                        flushBody();
                        ++tableCount;
                        Segment segment;
                        segment.kind = SegmentKind::Table;
                        segment.label = "Table " + std::to_string(tableCount);
                        segment.units = std::move(lines);
                        doc.segments.push_back(std::move(segment));
                    }
                }
            } else if (tableDepth == 1 && local == "tr") {
                if (start) {
                    table.row.clear();
                } else {
                    table.rows.push_back(std::move(table.row));
                    table.row.clear();
                }
            } else if (tableDepth == 1 && local == "tc") {
                if (start) {
                    table.cell.clear();
                } else {
                    table.row.push_back(std::move(table.cell));
                    table.cell.clear();
                }
            }
        }
    } catch (const XmlError &ex) {
        throw ExtractionError(std::string("docx: ") + ex.what());
    }
    flushBody();

    doc.metadata["paragraph_count"] = std::to_string(paragraphCount);
    doc.metadata["table_count"] = std::to_string(tableCount);
    return doc;
}

} // namespace extract
} // namespace docsanitizer
