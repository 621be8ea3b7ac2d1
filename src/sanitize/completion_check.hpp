#ifndef DOCSANITIZER_SANITIZE_COMPLETION_CHECK_HPP
#define DOCSANITIZER_SANITIZE_COMPLETION_CHECK_HPP

#include <optional>
#include <string>
#include <vector>

namespace docsanitizer {
namespace sanitize {

/*
  Completion checks
  --------------------------------
  Models sometimes wrap the whole answer in a ``` fence, or answer with a
  refusal instead of the rewritten text. normalizeCompletion() undoes the
  first; rejectionReason() flags the second so the engine can retry.
*/

inline const std::vector<std::string> &refusalPrefixes()
{
    static const std::vector<std::string> prefixes = {
        "I'm sorry", "I am sorry", "I cannot", "I can't", "As an AI", "Error:",
    };
    return prefixes;
}

namespace detail {

inline bool isBlank(char c)
{
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

inline std::string trimmed(const std::string &s)
{
    size_t b = 0;
    size_t e = s.size();
    while (b < e && isBlank(s[b]))
        ++b;
    while (e > b && isBlank(s[e - 1]))
        --e;
    return s.substr(b, e - b);
}

} // namespace detail

/**
 * @brief Strip a fence that encloses the entire completion, and the blank
 *        lines a model tends to put around its answer.
 *
 * "```markdown\nbody\n```" becomes "body". Fences inside the text are kept.
 */
inline std::string normalizeCompletion(const std::string &raw)
{
    std::string text = raw;

    std::string t = detail::trimmed(text);
    if (t.size() >= 6 && t.compare(0, 3, "```") == 0 && t.compare(t.size() - 3, 3, "```") == 0) {
        size_t firstNewline = t.find('\n');
        size_t closing = t.size() - 3;
        if (firstNewline != std::string::npos && firstNewline < closing &&
            t.find("```", firstNewline) == closing) {
            text = t.substr(firstNewline + 1, closing - firstNewline - 1);
        }
    }

    size_t b = 0;
    while (b < text.size() && (text[b] == '\n' || text[b] == '\r'))
        ++b;
    size_t e = text.size();
    while (e > b && (text[e - 1] == '\n' || text[e - 1] == '\r'))
        --e;
    return text.substr(b, e - b);
}

/**
 * @brief Give @p completion the same leading and trailing line breaks as the
 *        chunk it was produced from.
 */
inline std::string withEdgeBreaksOf(const std::string &source, const std::string &completion)
{
    size_t lead = 0;
    while (lead < source.size() && (source[lead] == '\n' || source[lead] == '\r'))
        ++lead;
    if (lead == source.size()) {
        return source + completion;
    }
    size_t tail = source.size();
    while (tail > lead && (source[tail - 1] == '\n' || source[tail - 1] == '\r'))
        --tail;
    return source.substr(0, lead) + completion + source.substr(tail);
}

/**
 * @return Why @p completion is not acceptable sanitized text, or nullopt if
 *         it is.
 */
inline std::optional<std::string> rejectionReason(const std::string &completion)
{
    std::string t = detail::trimmed(completion);
    if (t.empty()) {
        return std::string("empty completion");
    }
    for (const auto &prefix : refusalPrefixes()) {
        if (t.compare(0, prefix.size(), prefix) == 0) {
            return "completion starts with \"" + prefix + "\"";
        }
    }
    return std::nullopt;
}

} // namespace sanitize
} // namespace docsanitizer

#endif // DOCSANITIZER_SANITIZE_COMPLETION_CHECK_HPP
