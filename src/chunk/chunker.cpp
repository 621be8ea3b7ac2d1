#include "chunk/chunker.hpp"

#include <cctype>
#include <stdexcept>

namespace docsanitizer {
namespace chunk {

namespace {

bool isContinuationByte(char c)
{
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

} // namespace

Chunker::Chunker(size_t maxChunkChars)
    : maxChunkChars_(maxChunkChars)
{
    if (maxChunkChars_ == 0) {
        throw std::invalid_argument("Chunker: maxChunkChars must be positive");
    }
}

void Chunker::appendPieces(const std::string &unit, const std::string &separator, const std::string *label,
                           std::vector<Piece> &out) const
{
    size_t pos = 0;
    while (unit.size() - pos > maxChunkChars_) {
        const size_t limit = pos + maxChunkChars_;

        // Last whitespace at or before the limit, not at the very start.
        size_t cut = std::string::npos;
        for (size_t i = limit; i > pos; --i) {
            if (std::isspace(static_cast<unsigned char>(unit[i]))) {
                cut = i;
                break;
            }
        }
        if (cut != std::string::npos) {
            out.push_back(Piece{unit.substr(pos, cut - pos), std::string(1, unit[cut]), label});
            pos = cut + 1;
            continue;
        }

        // No whitespace: hard cut, backed off to a code point boundary.
        cut = limit;
        while (cut > pos && isContinuationByte(unit[cut])) {
            --cut;
        }
        if (cut == pos) {
            // Limit smaller than one code point: emit the whole code point.
            cut = pos + 1;
            while (cut < unit.size() && isContinuationByte(unit[cut])) {
                ++cut;
            }
        }
        out.push_back(Piece{unit.substr(pos, cut - pos), std::string(), label});
        pos = cut;
    }
    out.push_back(Piece{unit.substr(pos), separator, label});
}

std::vector<Chunk> Chunker::split(const extract::ExtractedDocument &document) const
{
    std::vector<Chunk> chunks;
    if (document.empty()) {
        return chunks;
    }

    std::vector<Piece> pieces;
    const auto &segments = document.segments;
    for (size_t s = 0; s < segments.size(); ++s) {
        const auto &units = segments[s].units;
        const bool lastSegment = s + 1 == segments.size();
        if (units.empty()) {
            // An empty segment still renders as "" between its separators.
            pieces.push_back(Piece{std::string(), lastSegment ? "" : extract::ExtractedDocument::kSegmentSeparator,
                                   &segments[s].label});
            continue;
        }
        for (size_t u = 0; u < units.size(); ++u) {
            std::string separator;
            if (u + 1 < units.size()) {
                separator = extract::ExtractedDocument::kUnitSeparator;
            } else if (!lastSegment) {
                separator = extract::ExtractedDocument::kSegmentSeparator;
            }
            appendPieces(units[u], separator, &segments[s].label, pieces);
        }
    }

    Chunk current;
    bool open = false;
    std::string pendingSeparator;
    for (auto &piece : pieces) {
        if (!open) {
            current = Chunk();
            current.text = std::move(piece.text);
            current.context = *piece.label;
            open = true;
        } else if (current.text.size() + pendingSeparator.size() + piece.text.size() <= maxChunkChars_) {
            current.text += pendingSeparator;
            current.text += piece.text;
        } else {
            current.separatorAfter = pendingSeparator;
            current.size = current.text.size();
            current.ordinal = chunks.size() + 1;
            chunks.push_back(std::move(current));

            current = Chunk();
            current.text = std::move(piece.text);
            current.context = *piece.label;
        }
        pendingSeparator = std::move(piece.separatorAfter);
    }
    if (open) {
        current.separatorAfter = pendingSeparator;
        current.size = current.text.size();
        current.ordinal = chunks.size() + 1;
        chunks.push_back(std::move(current));
    }
    return chunks;
}

} // namespace chunk
} // namespace docsanitizer
