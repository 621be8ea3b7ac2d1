#ifndef DOCSANITIZER_CHUNK_CHUNKER_HPP
#define DOCSANITIZER_CHUNK_CHUNKER_HPP

#include <string>
#include <vector>
#include "chunk/chunk.hpp"
#include "extract/extracted_document.hpp"

namespace docsanitizer {
namespace chunk {

/**
 * @class Chunker
 * @brief Packs a document's units greedily into chunks of at most
 *        maxChunkChars bytes.
 *
 * A unit is only ever split when it alone is larger than the limit: at the
 * last whitespace that fits, otherwise at a UTF-8 code point boundary.
 * Output depends on the input alone.
 */
class Chunker
{
public:
    /// @throw std::invalid_argument if maxChunkChars is zero.
    explicit Chunker(size_t maxChunkChars);

    std::vector<Chunk> split(const extract::ExtractedDocument &document) const;

    size_t maxChunkChars() const { return maxChunkChars_; }

private:
    struct Piece
    {
        std::string text;
        std::string separatorAfter;
        const std::string *label;
    };

    void appendPieces(const std::string &unit, const std::string &separator, const std::string *label,
                      std::vector<Piece> &out) const;

    size_t maxChunkChars_;
};

} // namespace chunk
} // namespace docsanitizer

#endif // DOCSANITIZER_CHUNK_CHUNKER_HPP
