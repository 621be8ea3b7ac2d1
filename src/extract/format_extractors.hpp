#ifndef DOCSANITIZER_EXTRACT_FORMAT_EXTRACTORS_HPP
#define DOCSANITIZER_EXTRACT_FORMAT_EXTRACTORS_HPP

#include <string>
#include <vector>
#include "extract/extraction_strategy.hpp"

/**
 * @file format_extractors.hpp
 * @brief One ExtractionStrategy per supported media kind.
 *
 * Output is Markdown-flavoured: headings for sheets, pages and DOCX heading
 * styles, pipe tables for tabular data. Every table row is one unit so the
 * chunker never cuts a row in half.
 */

namespace docsanitizer {
namespace extract {

/**
 * @brief .txt: UTF-8, or Latin-1 transcoded to UTF-8. One unit per line.
 */
class PlainTextExtractor : public ExtractionStrategy
{
public:
    core::MediaKind mediaKind() const override { return core::MediaKind::PlainText; }
    ExtractedDocument extract(const std::vector<uint8_t> &bytes) const override;
};

/**
 * @brief .csv (RFC 4180) rendered as a Markdown table. The first record is
 *        the header row.
 */
class DelimitedTextExtractor : public ExtractionStrategy
{
public:
    explicit DelimitedTextExtractor(char delimiter = ',')
        : delimiter_(delimiter)
    {
    }

    core::MediaKind mediaKind() const override { return core::MediaKind::DelimitedText; }
    ExtractedDocument extract(const std::vector<uint8_t> &bytes) const override;

    /**
     * @brief Split CSV text into records.
     * @throw ExtractionError on an unterminated quoted field.
     */
    std::vector<std::vector<std::string>> parseRecords(const std::string &text) const;

private:
    char delimiter_;
};

/**
 * @brief .docx: paragraphs in document order, HeadingN styles as '#' headings,
 *        tables as separate Table segments.
 */
class WordExtractor : public ExtractionStrategy
{
public:
    core::MediaKind mediaKind() const override { return core::MediaKind::Word; }
    ExtractedDocument extract(const std::vector<uint8_t> &bytes) const override;
};

/**
 * @brief .xlsx and .xls: one Sheet segment per non-empty worksheet. A
 *        worksheet that cannot be read is recorded as a SegmentFailure; the
 *        others are kept.
 *
 * The container is recognised from the bytes. Legacy .xls workbooks are read
 * with libxls when it is found (DOCSANITIZER_HAVE_LIBXLS).
 */
class SpreadsheetExtractor : public ExtractionStrategy
{
public:
    core::MediaKind mediaKind() const override { return core::MediaKind::Spreadsheet; }
    ExtractedDocument extract(const std::vector<uint8_t> &bytes) const override;

    /// True for an OLE2 compound file (a BIFF .xls workbook).
    static bool isLegacyWorkbook(const std::vector<uint8_t> &bytes);

private:
    static ExtractedDocument extractLegacy(const std::vector<uint8_t> &bytes);
};

/**
 * @brief .pdf via poppler-cpp. One Page segment per page with text.
 *
 * Only built when poppler-cpp is found (DOCSANITIZER_HAVE_POPPLER).
 */
class PdfExtractor : public ExtractionStrategy
{
public:
    core::MediaKind mediaKind() const override { return core::MediaKind::Pdf; }
    ExtractedDocument extract(const std::vector<uint8_t> &bytes) const override;
};

/**
 * @brief .eml (RFC 822 / MIME): selected headers, then the text/plain body
 *        (text/html as a fallback, tags stripped).
 */
class EmailExtractor : public ExtractionStrategy
{
public:
    core::MediaKind mediaKind() const override { return core::MediaKind::Email; }
    ExtractedDocument extract(const std::vector<uint8_t> &bytes) const override;
};

} // namespace extract
} // namespace docsanitizer

#endif // DOCSANITIZER_EXTRACT_FORMAT_EXTRACTORS_HPP
