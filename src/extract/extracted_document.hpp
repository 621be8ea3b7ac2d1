#ifndef DOCSANITIZER_EXTRACT_EXTRACTED_DOCUMENT_HPP
#define DOCSANITIZER_EXTRACT_EXTRACTED_DOCUMENT_HPP

#include <map>
#include <stdexcept>
#include <string>
#include <vector>
#include "core/media_kind.hpp"

namespace docsanitizer {
namespace extract {

/**
 * @brief Raised by extraction strategies when a payload cannot be read as its
 *        declared format. The engine wraps it into core::ExtractionFailedError.
 */
class ExtractionError : public std::runtime_error
{
public:
    explicit ExtractionError(const std::string &message)
        : std::runtime_error(message)
    {
    }
};

enum class SegmentKind {
    Body,
    Page,
    Sheet,
    Table,
    EmailHeaders,
    EmailBody
};

inline const char *segmentKindName(SegmentKind kind)
{
    switch (kind) {
    case SegmentKind::Body:
        return "body";
    case SegmentKind::Page:
        return "page";
    case SegmentKind::Sheet:
        return "sheet";
    case SegmentKind::Table:
        return "table";
    case SegmentKind::EmailHeaders:
        return "email-headers";
    case SegmentKind::EmailBody:
        return "email-body";
    }
    return "body";
}

/**
 * @struct Segment
 * @brief A structural region of a document (a page, a sheet, the email body).
 *
 * Each unit is atomic for chunking purposes: a line, a paragraph, a table row
 * or a heading. Units of a segment are rendered joined by '\n'.
 */
struct Segment
{
    SegmentKind kind = SegmentKind::Body;
    std::string label;
    std::vector<std::string> units;

    std::string text() const
    {
        std::string out;
        for (size_t i = 0; i < units.size(); ++i) {
            if (i > 0) {
                out += '\n';
            }
            out += units[i];
        }
        return out;
    }
};

/**
 * @struct SegmentFailure
 * @brief A region that could not be read while the rest of the document was.
 */
struct SegmentFailure
{
    std::string label;
    std::string reason;
};

/**
 * @struct ExtractedDocument
 * @brief Flat text of one payload, in reading order, with structure markers.
 *        Segments are rendered joined by a blank line.
 */
struct ExtractedDocument
{
    static constexpr const char *kSegmentSeparator = "\n\n";
    static constexpr const char *kUnitSeparator = "\n";

    core::MediaKind mediaKind = core::MediaKind::PlainText;
    std::vector<Segment> segments;
    std::vector<SegmentFailure> failures;
    std::map<std::string, std::string> metadata;

    std::string text() const
    {
        std::string out;
        for (size_t i = 0; i < segments.size(); ++i) {
            if (i > 0) {
                out += kSegmentSeparator;
            }
            out += segments[i].text();
        }
        return out;
    }

    bool empty() const
    {
        for (const auto &segment : segments) {
            for (const auto &unit : segment.units) {
                if (unit.find_first_not_of(" \t\r\n") != std::string::npos) {
                    return false;
                }
            }
        }
        return true;
    }
};

} // namespace extract
} // namespace docsanitizer

#endif // DOCSANITIZER_EXTRACT_EXTRACTED_DOCUMENT_HPP
