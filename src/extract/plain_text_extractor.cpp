#include "extract/format_extractors.hpp"
#include "extract/text_codec.hpp"

namespace docsanitizer {
namespace extract {

ExtractedDocument PlainTextExtractor::extract(const std::vector<uint8_t> &bytes) const
{
    ExtractedDocument doc;
    doc.mediaKind = mediaKind();

    std::string text = codec::decodeText(bytes);
    Segment body;
    body.kind = SegmentKind::Body;
    body.label = "Body";
    body.units = codec::splitLines(text);
    doc.segments.push_back(std::move(body));

    doc.metadata["line_count"] = std::to_string(doc.segments.front().units.size());
    return doc;
}

} // namespace extract
} // namespace docsanitizer
