#ifndef DOCSANITIZER_SANITIZE_SANITIZATION_ENGINE_HPP
#define DOCSANITIZER_SANITIZE_SANITIZATION_ENGINE_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "chunk/chunker.hpp"
#include "config/sanitizer_config.hpp"
#include "extract/document_extractor.hpp"
#include "policy/policy_resolver.hpp"
#include "sanitize/model_backend.hpp"
#include "sanitize/prompt_builder.hpp"
#include "sanitize/retry.hpp"
#include "sanitize/sanitization_result.hpp"
#include "store/object_store.hpp"
#include "util/thread_pool.hpp"

namespace docsanitizer {
namespace sanitize {

/**
 * @struct EngineOptions
 * @brief Engine tunables, normally taken from SanitizerConfig.
 */
struct EngineOptions
{
    size_t maxChunkChars = 6000;
    size_t chunkRetryCount = 2;
    size_t chunkFanOut = 4;
    std::chrono::milliseconds requestTimeout{900000};
    BackoffPolicy backoff;
    bool deleteAfterSanitize = true;
    uint64_t maxDocumentBytes = extract::DocumentExtractor::kDefaultMaxDocumentBytes;

    static EngineOptions fromConfig(const config::SanitizerConfig &cfg)
    {
        EngineOptions options;
        options.maxChunkChars = static_cast<size_t>(cfg.maxChunkChars);
        options.chunkRetryCount = static_cast<size_t>(cfg.chunkRetryCount);
        options.chunkFanOut = static_cast<size_t>(cfg.chunkFanOut);
        options.requestTimeout = std::chrono::duration_cast<std::chrono::milliseconds>(cfg.requestTimeout());
        options.backoff.maxRetries = static_cast<size_t>(cfg.backendRetryCount);
        options.backoff.initialDelay = cfg.backendBackoff();
        options.deleteAfterSanitize = cfg.deleteAfterSanitize;
        options.maxDocumentBytes = cfg.maxDocumentBytes;
        return options;
    }
};

/**
 * @class SanitizationEngine
 * @brief Drives one document through profile resolution, extraction,
 *        chunking, per-chunk model calls and reassembly.
 *
 * Extraction and chunk calls run on a pool of chunkFanOut threads owned by the
 * engine, so the fan-out limit bounds backend concurrency across every
 * concurrent sanitize() call, and requestTimeout covers extraction as well as
 * the model calls. The store, resolver and backend must outlive the engine.
 *
 * Usage Example:
 *  @code
 *    SanitizationEngine engine(store, resolver, backend, EngineOptions::fromConfig(cfg));
 *    SanitizationResult result = engine.sanitize(id, "default");
 *    std::cout << result.render();
 *  @endcode
 */
class SanitizationEngine
{
public:
    /**
     * @param delay Waits between backend retries. Defaults to SleepDelay.
     * @throw std::invalid_argument for a zero fan-out or chunk size.
     */
    SanitizationEngine(store::ObjectStore &store,
                       const policy::PolicyResolver &resolver,
                       ModelBackend &backend,
                       EngineOptions options = EngineOptions(),
                       std::shared_ptr<DelayStrategy> delay = nullptr);

    SanitizationEngine(const SanitizationEngine &) = delete;
    SanitizationEngine &operator=(const SanitizationEngine &) = delete;

    /**
     * @brief Sanitize stored object @p objectId under profile @p profileName.
     *
     * @throw core::ProfileNotFoundError, core::ProfileValidationError
     * @throw core::DocumentUnavailableError the id is unknown or expired.
     * @throw core::ExtractionFailedError
     * @throw core::BackendUnavailableError backend unreachable after retries.
     * @throw core::PartialSanitizationFailureError a chunk kept producing
     *        invalid output; names the lowest failing ordinal.
     * @throw core::TimeoutError requestTimeout elapsed.
     */
    SanitizationResult sanitize(const std::string &objectId, const std::string &profileName);

    const EngineOptions &options() const { return options_; }

    /// For registering additional extraction strategies.
    extract::DocumentExtractor &extractor() { return extractor_; }

    /**
     * @brief Placeholder markers added by the model, per category: occurrences
     *        in @p output minus occurrences in @p input, never negative.
     */
    static std::map<policy::PiiCategory, size_t> tallyMarkers(const std::string &input, const std::string &output);

private:
    // State of one sanitize() call shared with its chunk tasks. Tasks of a
    // call that already returned (timeout, failure) see cancelled == true.
    struct Invocation
    {
        Invocation(const policy::Profile &profile, core::MediaKind kind)
            : prompts(profile, kind)
        {
        }

        std::atomic<bool> cancelled{false};
        PromptBuilder prompts;
        std::vector<chunk::Chunk> chunks;
        std::vector<std::string> outputs;
        std::string objectId;
    };

    // Chunk task: fills invocation->outputs[index] or throws.
    void sanitizeChunk(const std::shared_ptr<Invocation> &invocation, size_t index);

    std::string generateWithBackoff(const std::string &prompt, const Invocation &invocation, size_t ordinal);

    store::ObjectStore &store_;
    const policy::PolicyResolver &resolver_;
    ModelBackend &backend_;
    EngineOptions options_;
    std::shared_ptr<DelayStrategy> delay_;
    extract::DocumentExtractor extractor_;
    chunk::Chunker chunker_;
    // Declared last: destroyed first, draining tasks while the members they use are alive.
    util::ThreadPool pool_;
};

} // namespace sanitize
} // namespace docsanitizer

#endif // DOCSANITIZER_SANITIZE_SANITIZATION_ENGINE_HPP
