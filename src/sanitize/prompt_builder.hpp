#ifndef DOCSANITIZER_SANITIZE_PROMPT_BUILDER_HPP
#define DOCSANITIZER_SANITIZE_PROMPT_BUILDER_HPP

#include <string>
#include "chunk/chunk.hpp"
#include "core/media_kind.hpp"
#include "policy/pii_policy.hpp"

namespace docsanitizer {
namespace sanitize {

/**
 * @class PromptBuilder
 * @brief Turns (profile, chunk) into the instruction text sent to the model.
 *
 * The rules section is rendered once per profile; build() only adds the
 * chunk's position, section label and text. The chunk text is enclosed in
 * kBeginMarker / kEndMarker so a backend (or a test double) can find it.
 */
class PromptBuilder
{
public:
    static constexpr const char *kBeginMarker = "<<<BEGIN DOCUMENT CHUNK>>>";
    static constexpr const char *kEndMarker = "<<<END DOCUMENT CHUNK>>>";

    PromptBuilder(const policy::Profile &profile, core::MediaKind mediaKind);

    std::string build(const chunk::Chunk &chunk, size_t chunkCount) const;

    const std::string &rules() const { return rules_; }

    /// Instruction block for one category under one action.
    static std::string ruleFor(policy::PiiCategory category, policy::PiiAction action);

    /// Text between the markers of a built prompt, or "" if absent.
    static std::string chunkTextOf(const std::string &prompt);

private:
    std::string rules_;
    core::MediaKind mediaKind_;
};

} // namespace sanitize
} // namespace docsanitizer

#endif // DOCSANITIZER_SANITIZE_PROMPT_BUILDER_HPP
