#ifndef DOCSANITIZER_SANITIZE_SANITIZATION_RESULT_HPP
#define DOCSANITIZER_SANITIZE_SANITIZATION_RESULT_HPP

#include <chrono>
#include <ctime>
#include <map>
#include <sstream>
#include <string>
#include <vector>
#include "core/media_kind.hpp"
#include "extract/extracted_document.hpp"
#include "policy/pii_policy.hpp"
#include "util/json_text.hpp"

namespace docsanitizer {
namespace sanitize {

/// ISO-8601 UTC, second precision: 2024-05-01T12:00:00Z
inline std::string formatUtcTimestamp(std::chrono::system_clock::time_point tp)
{
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
#ifdef _WIN32
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

/**
 * @struct SanitizationResult
 * @brief Output of one sanitize call. Every category has an entry in
 *        actionCounts, zero when nothing observable happened.
 */
struct SanitizationResult
{
    std::string text;
    std::map<policy::PiiCategory, size_t> actionCounts;
    size_t chunkCount = 0;
    core::MediaKind mediaKind = core::MediaKind::PlainText;
    std::string profileName;
    std::string modelName;
    std::string timestamp;
    std::vector<extract::SegmentFailure> segmentFailures;

    size_t totalActions() const
    {
        size_t total = 0;
        for (const auto &kv : actionCounts) {
            total += kv.second;
        }
        return total;
    }

    size_t countFor(policy::PiiCategory category) const
    {
        auto it = actionCounts.find(category);
        return it != actionCounts.end() ? it->second : 0;
    }

    /**
     * @brief YAML frontmatter block, terminated by the closing "---" line.
     */
    std::string frontmatter() const
    {
        std::ostringstream out;
        out << "---\n";
        out << "source_type: " << core::mediaKindName(mediaKind) << "\n";
        out << "sanitization_timestamp: " << timestamp << "\n";
        out << "model_used: " << modelName << "\n";
        out << "profile_used: " << profileName << "\n";
        out << "chunk_count: " << chunkCount << "\n";
        out << "pii_actions:\n";
        for (policy::PiiCategory category : policy::allCategories()) {
            out << "  " << policy::categoryName(category) << ": " << countFor(category) << "\n";
        }
        if (!segmentFailures.empty()) {
            out << "unreadable_sections:\n";
            // JSON escapes are valid inside YAML double-quoted scalars.
            for (const auto &failure : segmentFailures) {
                out << "  - \"" << util::json::escape(failure.label) << "\"\n";
            }
        }
        out << "---\n";
        return out.str();
    }

    std::string render() const { return frontmatter() + "\n" + text + "\n"; }
};

} // namespace sanitize
} // namespace docsanitizer

#endif // DOCSANITIZER_SANITIZE_SANITIZATION_RESULT_HPP
