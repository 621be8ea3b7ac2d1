#include "sanitize/sanitization_engine.hpp"

#include <future>
#include <optional>
#include <stdexcept>

#include "core/errors.hpp"
#include "sanitize/completion_check.hpp"
#include "util/logger.hpp"

namespace docsanitizer {
namespace sanitize {

namespace logger = util::logger;

namespace {

size_t checkedFanOut(size_t fanOut)
{
    if (fanOut == 0) {
        throw std::invalid_argument("SanitizationEngine: chunk fan-out must be at least 1");
    }
    return fanOut;
}

size_t countOccurrences(const std::string &haystack, const std::string &needle)
{
    if (needle.empty()) {
        return 0;
    }
    size_t count = 0;
    size_t pos = haystack.find(needle);
    while (pos != std::string::npos) {
        ++count;
        pos = haystack.find(needle, pos + needle.size());
    }
    return count;
}

} // namespace

SanitizationEngine::SanitizationEngine(store::ObjectStore &store,
                                       const policy::PolicyResolver &resolver,
                                       ModelBackend &backend,
                                       EngineOptions options,
                                       std::shared_ptr<DelayStrategy> delay)
    : store_(store)
    , resolver_(resolver)
    , backend_(backend)
    , options_(std::move(options))
    , delay_(delay ? std::move(delay) : std::make_shared<SleepDelay>())
    , extractor_(options_.maxDocumentBytes)
    , chunker_(options_.maxChunkChars)
    , pool_(checkedFanOut(options_.chunkFanOut))
{
    logger::debug("[SanitizationEngine] fan-out " + std::to_string(options_.chunkFanOut) + ", chunk size " +
                  std::to_string(options_.maxChunkChars) + ", model " + backend_.modelName());
}

std::map<policy::PiiCategory, size_t> SanitizationEngine::tallyMarkers(const std::string &input,
                                                                      const std::string &output)
{
    std::map<policy::PiiCategory, size_t> counts;
    for (policy::PiiCategory category : policy::allCategories()) {
        size_t added = 0;
        for (const auto &marker : policy::placeholderMarkers(category)) {
            size_t before = countOccurrences(input, marker);
            size_t after = countOccurrences(output, marker);
            if (after > before) {
                added += after - before;
            }
        }
        counts[category] = added;
    }
    return counts;
}

std::string SanitizationEngine::generateWithBackoff(const std::string &prompt,
                                                    const Invocation &invocation,
                                                    size_t ordinal)
{
    for (size_t attempt = 0;; ++attempt) {
        try {
            return backend_.generate(prompt, invocation.cancelled);
        } catch (const core::BackendUnavailableError &ex) {
            if (invocation.cancelled.load() || attempt >= options_.backoff.maxRetries) {
                throw;
            }
            auto wait = options_.backoff.delayFor(attempt);
            logger::warn("[SanitizationEngine] chunk " + std::to_string(ordinal) + ": " + ex.what() +
                         "; retrying in " + std::to_string(wait.count()) + " ms");
            delay_->wait(wait, invocation.cancelled);
        }
    }
}

void SanitizationEngine::sanitizeChunk(const std::shared_ptr<Invocation> &invocation, size_t index)
{
    const chunk::Chunk &chunk = invocation->chunks[index];
    const size_t chunkCount = invocation->chunks.size();
    if (detail::trimmed(chunk.text).empty()) {
        // Blank chunks pass through unchanged.
        invocation->outputs[index] = chunk.text;
        return;
    }
    const std::string prompt = invocation->prompts.build(chunk, chunkCount);

    std::string lastReason = "no attempt made";
    for (size_t attempt = 0; attempt <= options_.chunkRetryCount; ++attempt) {
        if (invocation->cancelled.load()) {
            return;
        }
        std::optional<std::string> reason;
        try {
            std::string completion = normalizeCompletion(generateWithBackoff(prompt, *invocation, chunk.ordinal));
            reason = rejectionReason(completion);
            if (!reason) {
                invocation->outputs[index] = withEdgeBreaksOf(chunk.text, completion);
                return;
            }
        } catch (const InvalidCompletionError &ex) {
            reason = std::string(ex.what());
        }
        lastReason = *reason;
        logger::warn("[SanitizationEngine] chunk " + std::to_string(chunk.ordinal) + " of " +
                     std::to_string(chunkCount) + " rejected (" + lastReason + "), attempt " +
                     std::to_string(attempt + 1) + " of " + std::to_string(options_.chunkRetryCount + 1));
    }
    throw core::PartialSanitizationFailureError(chunk.ordinal, chunkCount, lastReason);
}

SanitizationResult SanitizationEngine::sanitize(const std::string &objectId, const std::string &profileName)
{
    const auto started = std::chrono::steady_clock::now();
    const auto deadline = started + options_.requestTimeout;

    policy::Profile profile = resolver_.resolve(profileName);

    std::shared_ptr<const store::StoredObject> object;
    try {
        object = store_.get(objectId);
    } catch (const store::ObjectNotFoundError &) {
        logger::warn("[SanitizationEngine] document " + objectId + " is not available");
        throw core::DocumentUnavailableError(objectId);
    }

    auto timedOut = [&](const std::string &waitingFor) {
        logger::error("[SanitizationEngine] " + objectId + " timed out " + waitingFor);
        return core::TimeoutError("sanitization of " + objectId + " did not finish within " +
                                  std::to_string(options_.requestTimeout.count()) + " ms");
    };

    // Extraction runs on the pool and counts against the deadline.
    auto extraction = pool_.enqueue([this, object] { return extractor_.extract(object->bytes, object->mediaKind); });
    if (extraction.wait_until(deadline) == std::future_status::timeout) {
        throw timedOut("during extraction");
    }
    extract::ExtractedDocument document;
    try {
        document = extraction.get();
    } catch (const extract::ExtractionError &ex) {
        logger::error("[SanitizationEngine] extraction of " + objectId + " failed: " + ex.what());
        throw core::ExtractionFailedError(ex.what());
    } catch (const std::exception &ex) {
        logger::error("[SanitizationEngine] extraction of " + objectId + " aborted: " + ex.what());
        throw core::ExtractionFailedError(std::string("unexpected extraction failure: ") + ex.what());
    }

    SanitizationResult result;
    result.mediaKind = object->mediaKind;
    result.profileName = profile.name;
    result.modelName = backend_.modelName();
    result.segmentFailures = document.failures;
    for (policy::PiiCategory category : policy::allCategories()) {
        result.actionCounts[category] = 0;
    }

    auto invocation = std::make_shared<Invocation>(profile, object->mediaKind);
    invocation->objectId = objectId;
    invocation->chunks = chunker_.split(document);
    invocation->outputs.resize(invocation->chunks.size());
    object.reset();

    const size_t chunkCount = invocation->chunks.size();
    result.chunkCount = chunkCount;
    if (std::chrono::steady_clock::now() >= deadline) {
        throw timedOut("before the first model call");
    }
    logger::info("[SanitizationEngine] sanitizing " + objectId + " (" + core::mediaKindName(result.mediaKind) +
                 ") with profile '" + profile.name + "': " + std::to_string(chunkCount) + " chunk(s)");

    if (chunkCount > 0) {
        std::vector<std::future<void>> pending;
        pending.reserve(chunkCount);
        for (size_t i = 0; i < chunkCount; ++i) {
            pending.push_back(pool_.enqueue([this, invocation, i] { sanitizeChunk(invocation, i); }));
        }

        for (size_t i = 0; i < chunkCount; ++i) {
            if (pending[i].wait_until(deadline) == std::future_status::timeout) {
                invocation->cancelled = true;
                throw timedOut("waiting for chunk " + std::to_string(i + 1) + " of " + std::to_string(chunkCount));
            }
            try {
                pending[i].get();
            } catch (const core::SanitizerError &ex) {
                invocation->cancelled = true;
                logger::error(std::string("[SanitizationEngine] ") + ex.what());
                throw;
            } catch (const std::exception &ex) {
                invocation->cancelled = true;
                logger::error("[SanitizationEngine] chunk " + std::to_string(i + 1) + " failed: " + ex.what());
                throw core::PartialSanitizationFailureError(i + 1, chunkCount, ex.what());
            }
        }

        for (size_t i = 0; i < chunkCount; ++i) {
            const chunk::Chunk &chunk = invocation->chunks[i];
            result.text += invocation->outputs[i];
            result.text += chunk.separatorAfter;
            for (const auto &kv : tallyMarkers(chunk.text, invocation->outputs[i])) {
                result.actionCounts[kv.first] += kv.second;
            }
        }
    }

    result.timestamp = formatUtcTimestamp(std::chrono::system_clock::now());

    if (options_.deleteAfterSanitize) {
        if (!store_.remove(objectId)) {
            logger::debug("[SanitizationEngine] " + objectId + " was already gone at removal");
        }
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
    logger::info("[SanitizationEngine] " + objectId + " done in " + std::to_string(elapsed.count()) + " ms, " +
                 std::to_string(result.totalActions()) + " placeholder(s)");
    return result;
}

} // namespace sanitize
} // namespace docsanitizer
