#include "extract/format_extractors.hpp"

#include <map>
#include <memory>
#include <string>
#include <xls.h>

#include "extract/sheet_table.hpp"
#include "extract/text_codec.hpp"
#include "util/logger.hpp"

namespace docsanitizer {
namespace extract {

namespace logger = util::logger;

ExtractedDocument SpreadsheetExtractor::extractLegacy(const std::vector<uint8_t> &bytes)
{
    xls::xls_error_t error = xls::LIBXLS_OK;
    std::unique_ptr<xls::xlsWorkBook, void (*)(xls::xlsWorkBook *)> workbook(
        xls::xls_open_buffer(bytes.data(), bytes.size(), "UTF-8", &error), &xls::xls_close_WB);
    if (!workbook) {
        throw ExtractionError(std::string("xls: ") + xls::xls_getError(error));
    }

    ExtractedDocument doc;
    doc.mediaKind = core::MediaKind::Spreadsheet;

    const size_t sheetCount = workbook->sheets.count;
    if (sheetCount == 0) {
        throw ExtractionError("xls: workbook has no sheets");
    }
    size_t emptySheets = 0;
    for (size_t i = 0; i < sheetCount; ++i) {
        const char *rawName = workbook->sheets.sheet[i].name;
        const std::string name = rawName ? rawName : "Sheet" + std::to_string(i + 1);

        std::unique_ptr<xls::xlsWorkSheet, void (*)(xls::xlsWorkSheet *)> worksheet(
            xls::xls_getWorkSheet(workbook.get(), static_cast<int>(i)), &xls::xls_close_WS);
        xls::xls_error_t rc = worksheet ? xls::xls_parseWorkSheet(worksheet.get()) : xls::LIBXLS_ERROR_PARSE;
        if (rc != xls::LIBXLS_OK) {
            std::string reason = xls::xls_getError(rc);
            logger::warn("[SpreadsheetExtractor] sheet '" + name + "' unreadable: " + reason);
            doc.failures.push_back(SegmentFailure{name, "xls: " + reason});
            continue;
        }

        sheet::SheetRows rows;
        for (int r = 0; r <= worksheet->rows.lastrow; ++r) {
            std::map<int, std::string> row;
            for (int c = 0; c <= worksheet->rows.lastcol; ++c) {
                xls::xlsCell *cell = xls::xls_cell(worksheet.get(), static_cast<xls::WORD>(r), static_cast<xls::WORD>(c));
                // Hidden cells are the ones covered by a merged range.
                if (!cell || cell->isHidden || !cell->str) {
                    continue;
                }
                std::string value = cell->str;
                if (!codec::trimCopy(value).empty()) {
                    row[c] = std::move(value);
                }
            }
            rows.push_back(std::move(row));
        }
        if (!sheet::appendSheet(doc, name, rows)) {
            ++emptySheets;
        }
    }

    if (doc.segments.empty() && !doc.failures.empty()) {
        throw ExtractionError("xls: no readable sheet (" + doc.failures.front().label + ": " +
                              doc.failures.front().reason + ")");
    }

    doc.metadata["sheet_count"] = std::to_string(sheetCount);
    doc.metadata["empty_sheet_count"] = std::to_string(emptySheets);
    return doc;
}

} // namespace extract
} // namespace docsanitizer
