#include "extract/document_extractor.hpp"

#include <stdexcept>

#include "extract/format_extractors.hpp"
#include "util/logger.hpp"

namespace docsanitizer {
namespace extract {

namespace logger = util::logger;

DocumentExtractor::DocumentExtractor(uint64_t maxDocumentBytes)
    : maxDocumentBytes_(maxDocumentBytes)
{
    registerStrategy(std::make_unique<PlainTextExtractor>());
    registerStrategy(std::make_unique<DelimitedTextExtractor>());
    registerStrategy(std::make_unique<WordExtractor>());
    registerStrategy(std::make_unique<SpreadsheetExtractor>());
    registerStrategy(std::make_unique<EmailExtractor>());
#ifdef DOCSANITIZER_HAVE_POPPLER
    registerStrategy(std::make_unique<PdfExtractor>());
#else
    logger::warn("[DocumentExtractor] built without poppler-cpp: PDF documents are not supported.");
#endif
}

void DocumentExtractor::registerStrategy(std::unique_ptr<ExtractionStrategy> strategy)
{
    if (!strategy) {
        throw std::invalid_argument("DocumentExtractor: null strategy");
    }
    core::MediaKind kind = strategy->mediaKind();
    std::lock_guard<std::mutex> lock(registryMutex_);
    strategies_[kind] = std::shared_ptr<const ExtractionStrategy>(std::move(strategy));
}

bool DocumentExtractor::supports(core::MediaKind kind) const
{
    std::lock_guard<std::mutex> lock(registryMutex_);
    return strategies_.count(kind) != 0;
}

std::vector<core::MediaKind> DocumentExtractor::supportedKinds() const
{
    std::lock_guard<std::mutex> lock(registryMutex_);
    std::vector<core::MediaKind> kinds;
    for (const auto &kv : strategies_) {
        kinds.push_back(kv.first);
    }
    return kinds;
}

ExtractedDocument DocumentExtractor::extract(const std::vector<uint8_t> &bytes, core::MediaKind kind) const
{
    if (maxDocumentBytes_ > 0 && bytes.size() > maxDocumentBytes_) {
        throw ExtractionError("document of " + std::to_string(bytes.size()) + " bytes exceeds the maximum of " +
                              std::to_string(maxDocumentBytes_) + " bytes; split it into smaller parts");
    }

    std::shared_ptr<const ExtractionStrategy> strategy;
    {
        std::lock_guard<std::mutex> lock(registryMutex_);
        auto it = strategies_.find(kind);
        if (it != strategies_.end()) {
            strategy = it->second;
        }
    }
    if (!strategy) {
        throw ExtractionError(std::string("unsupported document type: ") + core::mediaKindName(kind));
    }

    ExtractedDocument doc = strategy->extract(bytes);
    doc.mediaKind = kind;

    size_t units = 0;
    for (const auto &segment : doc.segments) {
        units += segment.units.size();
    }
    logger::debug("[DocumentExtractor] " + std::string(core::mediaKindName(kind)) + ": " +
                  std::to_string(doc.segments.size()) + " segment(s), " + std::to_string(units) + " unit(s), " +
                  std::to_string(doc.failures.size()) + " failure(s)");
    return doc;
}

} // namespace extract
} // namespace docsanitizer
