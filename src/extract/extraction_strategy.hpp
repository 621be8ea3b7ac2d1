#ifndef DOCSANITIZER_EXTRACT_EXTRACTION_STRATEGY_HPP
#define DOCSANITIZER_EXTRACT_EXTRACTION_STRATEGY_HPP

#include <cstdint>
#include <vector>
#include "extract/extracted_document.hpp"

namespace docsanitizer {
namespace extract {

/**
 * @class ExtractionStrategy
 * @brief "bytes -> ordered text segments" for one document format.
 *
 * Implementations throw ExtractionError rather than return truncated or
 * garbled text. They are stateless and may be called concurrently.
 */
class ExtractionStrategy
{
public:
    virtual ~ExtractionStrategy() = default;

    virtual core::MediaKind mediaKind() const = 0;

    virtual ExtractedDocument extract(const std::vector<uint8_t> &bytes) const = 0;
};

} // namespace extract
} // namespace docsanitizer

#endif // DOCSANITIZER_EXTRACT_EXTRACTION_STRATEGY_HPP
