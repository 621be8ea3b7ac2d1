#include "extract/format_extractors.hpp"
#include "extract/text_codec.hpp"

namespace docsanitizer {
namespace extract {

std::vector<std::vector<std::string>> DelimitedTextExtractor::parseRecords(const std::string &text) const
{
    std::vector<std::vector<std::string>> records;
    std::vector<std::string> record;
    std::string field;
    bool inQuotes = false;
    bool fieldStarted = false;
    size_t line = 1;
    size_t quoteOpenedOnLine = 0;

    auto endField = [&]() {
        record.push_back(std::move(field));
        field.clear();
        fieldStarted = false;
    };
    auto endRecord = [&]() {
        endField();
        // A blank line is one empty field; it carries no data.
        if (!(record.size() == 1 && record.front().empty())) {
            records.push_back(std::move(record));
        }
        record.clear();
    };

    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (inQuotes) {
            if (c == '"') {
                if (i + 1 < text.size() && text[i + 1] == '"') {
                    field += '"';
                    ++i;
                } else {
                    inQuotes = false;
                }
            } else {
                if (c == '\n') {
                    ++line;
                }
                field += c;
            }
            continue;
        }

        if (c == '"' && !fieldStarted) {
            inQuotes = true;
            fieldStarted = true;
            quoteOpenedOnLine = line;
        } else if (c == delimiter_) {
            endField();
        } else if (c == '\r' && i + 1 < text.size() && text[i + 1] == '\n') {
            // handled by the '\n'
        } else if (c == '\n') {
            ++line;
            endRecord();
        } else {
            field += c;
            fieldStarted = true;
        }
    }

    if (inQuotes) {
        throw ExtractionError("csv: unterminated quoted field starting on line " + std::to_string(quoteOpenedOnLine));
    }
    if (fieldStarted || !field.empty() || !record.empty()) {
        endRecord();
    }
    return records;
}

ExtractedDocument DelimitedTextExtractor::extract(const std::vector<uint8_t> &bytes) const
{
    ExtractedDocument doc;
    doc.mediaKind = mediaKind();

    auto records = parseRecords(codec::decodeText(bytes));
    if (records.empty()) {
        doc.metadata["row_count"] = "0";
        doc.metadata["column_count"] = "0";
        return doc;
    }

    const size_t columns = records.front().size();
    Segment table;
    table.kind = SegmentKind::Table;
    table.label = "Table";
    table.units.push_back(codec::markdownRow(records.front()));
    table.units.push_back(codec::markdownSeparator(columns));

    for (size_t r = 1; r < records.size(); ++r) {
        auto &row = records[r];
        if (row.size() > columns) {
            throw ExtractionError("csv: record " + std::to_string(r + 1) + " has " + std::to_string(row.size()) +
                                  " fields, header has " + std::to_string(columns));
        }
        row.resize(columns);
        table.units.push_back(codec::markdownRow(row));
    }
    doc.segments.push_back(std::move(table));

    doc.metadata["row_count"] = std::to_string(records.size() - 1);
    doc.metadata["column_count"] = std::to_string(columns);
    return doc;
}

} // namespace extract
} // namespace docsanitizer
