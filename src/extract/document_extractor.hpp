#ifndef DOCSANITIZER_EXTRACT_DOCUMENT_EXTRACTOR_HPP
#define DOCSANITIZER_EXTRACT_DOCUMENT_EXTRACTOR_HPP

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <vector>
#include "extract/extraction_strategy.hpp"

namespace docsanitizer {
namespace extract {

/**
 * @class DocumentExtractor
 * @brief Routes a payload to the strategy registered for its media kind.
 *
 * The default constructor registers every built-in strategy. PDF support is
 * present only when the build found poppler-cpp; without it a PDF payload
 * fails with ExtractionError like any other unsupported kind.
 */
class DocumentExtractor
{
public:
    static constexpr uint64_t kDefaultMaxDocumentBytes = 10ull * 1024 * 1024;

    explicit DocumentExtractor(uint64_t maxDocumentBytes = kDefaultMaxDocumentBytes);

    /**
     * @brief Add or replace the strategy for strategy->mediaKind().
     */
    void registerStrategy(std::unique_ptr<ExtractionStrategy> strategy);

    bool supports(core::MediaKind kind) const;

    std::vector<core::MediaKind> supportedKinds() const;

    /**
     * @throw ExtractionError for oversize payloads, unsupported kinds and
     *        anything the strategy rejects.
     */
    ExtractedDocument extract(const std::vector<uint8_t> &bytes, core::MediaKind kind) const;

    uint64_t maxDocumentBytes() const { return maxDocumentBytes_; }

private:
    uint64_t maxDocumentBytes_;
    mutable std::mutex registryMutex_;
    std::map<core::MediaKind, std::shared_ptr<const ExtractionStrategy>> strategies_;
};

} // namespace extract
} // namespace docsanitizer

#endif // DOCSANITIZER_EXTRACT_DOCUMENT_EXTRACTOR_HPP
