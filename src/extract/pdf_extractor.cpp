#include "extract/format_extractors.hpp"

#include <algorithm>
#include <climits>
#include <memory>
#include <poppler-document.h>
#include <poppler-page.h>

#include "extract/text_codec.hpp"
#include "util/logger.hpp"

namespace docsanitizer {
namespace extract {

namespace logger = util::logger;

ExtractedDocument PdfExtractor::extract(const std::vector<uint8_t> &bytes) const
{
    if (bytes.size() > static_cast<size_t>(INT_MAX)) {
        throw ExtractionError("pdf: document too large");
    }

    std::unique_ptr<poppler::document> pdf(
        poppler::document::load_from_raw_data(reinterpret_cast<const char *>(bytes.data()),
                                              static_cast<int>(bytes.size())));
    if (!pdf) {
        throw ExtractionError("pdf: failed to parse document");
    }
    if (pdf->is_locked()) {
        throw ExtractionError("pdf: document is password protected");
    }

    ExtractedDocument doc;
    doc.mediaKind = mediaKind();

    const int pageCount = pdf->pages();
    for (int i = 0; i < pageCount; ++i) {
        const std::string label = "Page " + std::to_string(i + 1);
        std::unique_ptr<poppler::page> page(pdf->create_page(i));
        if (!page) {
            logger::warn("[PdfExtractor] could not load page " + std::to_string(i + 1));
            doc.failures.push_back(SegmentFailure{label, "page could not be loaded"});
            continue;
        }

        poppler::byte_array utf8 = page->text().to_utf8();
        std::string text(utf8.begin(), utf8.end());
        if (codec::trimCopy(text).empty()) {
            continue;
        }

        Segment segment;
        segment.kind = SegmentKind::Page;
        segment.label = label;
        segment.units.push_back("## " + label);
        for (auto &line : codec::splitLines(text)) {
            // Form feeds separate pages in poppler's text output.
            line.erase(std::remove(line.begin(), line.end(), '\f'), line.end());
            segment.units.push_back(std::move(line));
        }
        doc.segments.push_back(std::move(segment));
    }

    if (doc.segments.empty() && !doc.failures.empty()) {
        throw ExtractionError("pdf: no page could be loaded");
    }

    doc.metadata["page_count"] = std::to_string(pageCount);
    return doc;
}

} // namespace extract
} // namespace docsanitizer
