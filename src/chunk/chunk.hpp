#ifndef DOCSANITIZER_CHUNK_CHUNK_HPP
#define DOCSANITIZER_CHUNK_CHUNK_HPP

#include <cstddef>
#include <string>

namespace docsanitizer {
namespace chunk {

/**
 * @struct Chunk
 * @brief A contiguous, size-bounded slice of a document's text.
 *
 * Joining every chunk's text followed by its separatorAfter, in ordinal order,
 * reproduces the document text exactly.
 */
struct Chunk
{
    size_t ordinal = 0;         ///< 1-based position in the document.
    std::string text;
    size_t size = 0;            ///< text.size(), in UTF-8 bytes.
    std::string separatorAfter; ///< Source text between this chunk and the next.
    std::string context;        ///< Label of the segment this chunk starts in.
};

} // namespace chunk
} // namespace docsanitizer

#endif // DOCSANITIZER_CHUNK_CHUNK_HPP
