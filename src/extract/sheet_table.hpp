#ifndef DOCSANITIZER_EXTRACT_SHEET_TABLE_HPP
#define DOCSANITIZER_EXTRACT_SHEET_TABLE_HPP

#include <algorithm>
#include <map>
#include <string>
#include <vector>
#include "extract/extracted_document.hpp"
#include "extract/text_codec.hpp"

namespace docsanitizer {
namespace extract {
namespace sheet {

// Last column a worksheet can address (XFD).
constexpr long kMaxColumn = 16383;

/// Non-empty cell text by zero-based column, one map per worksheet row.
using SheetRows = std::vector<std::map<int, std::string>>;

/**
 * @brief "## Sheet: <name>" followed by a Markdown table. The first non-empty
 *        row is the header; columns span the leftmost to the rightmost used
 *        cell. Empty when the sheet has no text.
 */
inline std::vector<std::string> renderSheet(const std::string &name, const SheetRows &rows)
{
    std::vector<const std::map<int, std::string> *> nonEmpty;
    int minColumn = -1;
    int maxColumn = -1;
    for (const auto &row : rows) {
        if (row.empty()) {
            continue;
        }
        nonEmpty.push_back(&row);
        int first = row.begin()->first;
        int last = row.rbegin()->first;
        minColumn = minColumn < 0 ? first : std::min(minColumn, first);
        maxColumn = std::max(maxColumn, last);
    }

    std::vector<std::string> units;
    if (nonEmpty.empty()) {
        return units;
    }

    const size_t columns = static_cast<size_t>(maxColumn - minColumn + 1);
    units.push_back("## Sheet: " + name);
    for (size_t r = 0; r < nonEmpty.size(); ++r) {
        std::vector<std::string> cells(columns);
        for (const auto &kv : *nonEmpty[r]) {
            cells[static_cast<size_t>(kv.first - minColumn)] = kv.second;
        }
        units.push_back(codec::markdownRow(cells));
        if (r == 0) {
            units.push_back(codec::markdownSeparator(columns));
        }
    }
    return units;
}

/**
 * @brief Append @p rows as a Sheet segment of @p doc.
 * @return false, appending nothing, when the sheet is empty.
 */
inline bool appendSheet(ExtractedDocument &doc, const std::string &name, const SheetRows &rows)
{
    auto units = renderSheet(name, rows);
    if (units.empty()) {
        return false;
    }
    Segment segment;
    segment.kind = SegmentKind::Sheet;
    segment.label = name;
    segment.units = std::move(units);
    doc.segments.push_back(std::move(segment));
    return true;
}

} // namespace sheet
} // namespace extract
} // namespace docsanitizer

#endif // DOCSANITIZER_EXTRACT_SHEET_TABLE_HPP
