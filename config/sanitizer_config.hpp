#ifndef DOCSANITIZER_CONFIG_SANITIZER_CONFIG_HPP
#define DOCSANITIZER_CONFIG_SANITIZER_CONFIG_HPP

#include <chrono>
#include <cstdint>
#include <string>

/**
 * @file sanitizer_config.hpp
 * @brief Tunables consumed by the object store, the chunker and the engine.
 *
 * USAGE:
 *   - Populate manually, or through util/config_parser.hpp from a key=value
 *     file plus environment overrides.
 */

namespace docsanitizer {
namespace config {

/**
 * @struct SanitizerConfig
 * @brief Process-wide settings. Durations are stored as plain integers so the
 *        parser can assign them directly; use the helper accessors for chrono.
 */
struct SanitizerConfig
{
    /// Ceiling for every *Seconds setting (ten years); keeps chrono arithmetic in range.
    static constexpr uint64_t kMaxDurationSeconds = 10ull * 365 * 24 * 60 * 60;

    SanitizerConfig()
        : objectTtlSeconds(300),
          sweepIntervalSeconds(0),
          maxObjectBytes(10 * 1024 * 1024),
          maxDocumentBytes(10 * 1024 * 1024),
          maxChunkChars(6000),
          chunkRetryCount(2),
          chunkFanOut(4),
          requestTimeoutSeconds(900),
          backendRetryCount(3),
          backendBackoffMillis(500),
          backendTimeoutSeconds(300),
          backendEndpoint("http://127.0.0.1:11434"),
          backendModel("phi4:14b"),
          temperature(0.1),
          topP(0.9),
          numPredict(8192),
          deleteAfterSanitize(true),
          profileDatabase("./docsanitizer_data/profiles.sqlite"),
          logLevel("INFO")
    {
    }

    /// How long an uploaded object stays readable.
    uint64_t objectTtlSeconds;

    /// Reclamation sweep period. Zero derives TTL/10 (at least one second).
    uint64_t sweepIntervalSeconds;

    /// Largest payload the store accepts. Zero disables the check.
    uint64_t maxObjectBytes;

    /// Largest payload the extractor will parse.
    uint64_t maxDocumentBytes;

    /// Upper bound on a chunk, in characters (UTF-8 bytes).
    uint64_t maxChunkChars;

    /// Extra attempts for a chunk whose model output fails validation.
    uint64_t chunkRetryCount;

    /// Maximum number of concurrent model calls.
    uint64_t chunkFanOut;

    /// End-to-end budget for one sanitize call.
    uint64_t requestTimeoutSeconds;

    /// Extra attempts when the model backend is unreachable.
    uint64_t backendRetryCount;

    /// First backoff delay; doubles on each further attempt.
    uint64_t backendBackoffMillis;

    /// Per-HTTP-request timeout for the model backend.
    uint64_t backendTimeoutSeconds;

    /// Base URL of the Ollama-compatible server.
    std::string backendEndpoint;

    /// Model name passed to the backend and written into output frontmatter.
    std::string backendModel;

    double temperature;
    double topP;
    uint64_t numPredict;

    /// Remove the stored object after a successful sanitize.
    bool deleteAfterSanitize;

    /// SQLite file holding sanitization profiles.
    std::string profileDatabase;

    std::string logLevel;

    /// Empty means console only.
    std::string logFile;

    std::chrono::seconds objectTtl() const { return std::chrono::seconds(objectTtlSeconds); }

    std::chrono::seconds sweepInterval() const
    {
        if (sweepIntervalSeconds > 0) {
            return std::chrono::seconds(sweepIntervalSeconds);
        }
        uint64_t derived = objectTtlSeconds / 10;
        return std::chrono::seconds(derived > 0 ? derived : 1);
    }

    std::chrono::seconds requestTimeout() const { return std::chrono::seconds(requestTimeoutSeconds); }

    std::chrono::milliseconds backendBackoff() const { return std::chrono::milliseconds(backendBackoffMillis); }
};

} // namespace config
} // namespace docsanitizer

#endif // DOCSANITIZER_CONFIG_SANITIZER_CONFIG_HPP
