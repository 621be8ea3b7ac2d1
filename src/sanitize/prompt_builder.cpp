#include "sanitize/prompt_builder.hpp"

namespace docsanitizer {
namespace sanitize {

using policy::PiiAction;
using policy::PiiCategory;

PromptBuilder::PromptBuilder(const policy::Profile &profile, core::MediaKind mediaKind)
    : mediaKind_(mediaKind)
{
    for (PiiCategory category : policy::allCategories()) {
        if (!rules_.empty()) {
            rules_ += "\n";
        }
        rules_ += ruleFor(category, profile.actionFor(category));
    }
}

std::string PromptBuilder::ruleFor(PiiCategory category, PiiAction action)
{
    switch (category) {
    case PiiCategory::PersonName:
        if (action == PiiAction::Delete) {
            return "### Person names: DELETE\n"
                   "- Replace every person name with [NAME_REMOVED].\n"
                   "- \"Jane Doe approved it\" becomes \"[NAME_REMOVED] approved it\".\n";
        }
        if (action == PiiAction::Invent) {
            return "### Person names: INVENT\n"
                   "- Replace every person name with a realistic synthetic name.\n"
                   "- The same real person always gets the same invented name.\n";
        }
        return "### Person names: KEEP_PART\n"
               "- Keep the first name only and drop middle and last names.\n"
               "- Number people who share a first name: \"John Smith\" becomes \"John 1\",\n"
               "  a different \"John Davis\" becomes \"John 2\".\n"
               "- The same real person always keeps the same number.\n";

    case PiiCategory::Email:
        if (action == PiiAction::Delete) {
            return "### Email addresses: DELETE\n"
                   "- Replace every email address with [EMAIL_REMOVED].\n";
        }
        return "### Email addresses: KEEP_PART\n"
               "- Keep the domain and mask the part before the @.\n"
               "- \"jane.doe@example.com\" becomes \"[EMAIL_REDACTED]@example.com\".\n";

    case PiiCategory::Phone:
        if (action == PiiAction::Delete) {
            return "### Phone numbers: DELETE\n"
                   "- Replace every phone number, in any format, with [PHONE_REMOVED].\n";
        }
        if (action == PiiAction::Invent) {
            return "### Phone numbers: INVENT\n"
                   "- Replace every phone number with a synthetic one in the same format,\n"
                   "  keeping the country and area code style.\n";
        }
        return "### Phone numbers: KEEP_PART\n"
               "- Keep the country and area code and mask the rest.\n"
               "- \"+1 (555) 123-4567\" becomes \"+1 (555) [PHONE_REDACTED]\".\n";

    case PiiCategory::Company:
        if (action == PiiAction::Invent) {
            return "### Company names: INVENT\n"
                   "- Replace every company name with a realistic synthetic one.\n"
                   "- The same real company always gets the same invented name.\n";
        }
        return "### Company names: KEEP_PART\n"
               "- Leave company names unchanged. Use context to tell them apart from person names.\n";

    case PiiCategory::Address:
        if (action == PiiAction::Delete) {
            return "### Physical addresses: DELETE\n"
                   "- Replace every street address, PO box or city/state/postcode combination\n"
                   "  with [ADDRESS_REMOVED].\n";
        }
        return "### Physical addresses: INVENT\n"
               "- Replace every address with a synthetic one of the same shape.\n";

    case PiiCategory::Financial:
        if (action == PiiAction::Delete) {
            return "### Financial data: DELETE\n"
                   "- Replace account numbers, card numbers, bank details and amounts tied to a\n"
                   "  person with [FINANCIAL_REMOVED]. General business figures may stay.\n";
        }
        return "### Financial data: INVENT\n"
               "- Replace financial data with synthetic values of the same format and magnitude.\n";

    case PiiCategory::IdNumbers:
        if (action == PiiAction::Delete) {
            return "### Identification numbers: DELETE\n"
                   "- Replace employee and customer IDs, SSN/TFN, passport and licence numbers\n"
                   "  with [ID_REMOVED].\n";
        }
        return "### Identification numbers: INVENT\n"
               "- Replace ID numbers with synthetic values of the same format and length.\n";

    case PiiCategory::DateOfBirth:
        if (action == PiiAction::Delete) {
            return "### Dates of birth: DELETE\n"
                   "- Replace every date of birth with [DOB_REMOVED]. Look for cues such as\n"
                   "  \"born on\", \"DOB:\" or \"birthday\".\n";
        }
        return "### Dates of birth: INVENT\n"
               "- Replace dates of birth with plausible synthetic dates in the same format.\n";
    }
    return std::string();
}

std::string PromptBuilder::build(const chunk::Chunk &chunk, size_t chunkCount) const
{
    std::string prompt;
    prompt.reserve(rules_.size() + chunk.text.size() + 1024);

    prompt += "You sanitize documents. Rewrite the document chunk below so that personally "
              "identifiable information (PII) is removed or transformed exactly as the rules say.\n\n";

    prompt += "## INSTRUCTIONS\n\n"
              "1. Keep the structure: headings, tables, lists and line breaks stay as they are.\n"
              "2. Use one replacement per real entity and reuse it for every occurrence.\n"
              "3. Use context to recognise PII that does not follow a standard format.\n"
              "4. Reply with the sanitized text only. No explanations, no code fences, no markers.\n\n";

    prompt += "## RULES\n\n";
    prompt += rules_;
    prompt += "\n";

    prompt += "## CONTEXT\n\n";
    prompt += "This is part " + std::to_string(chunk.ordinal) + " of " + std::to_string(chunkCount) + " of a " +
              core::mediaKindName(mediaKind_) + " document";
    if (!chunk.context.empty()) {
        prompt += ", in section \"" + chunk.context + "\"";
    }
    prompt += ".\n\n";

    prompt += kBeginMarker;
    prompt += "\n";
    prompt += chunk.text;
    prompt += "\n";
    prompt += kEndMarker;
    prompt += "\n\nSanitized chunk:\n";
    return prompt;
}

std::string PromptBuilder::chunkTextOf(const std::string &prompt)
{
    const std::string begin = std::string(kBeginMarker) + "\n";
    const std::string end = std::string("\n") + kEndMarker;
    size_t start = prompt.find(begin);
    if (start == std::string::npos) {
        return std::string();
    }
    start += begin.size();
    size_t stop = prompt.rfind(end);
    if (stop == std::string::npos || stop < start) {
        return std::string();
    }
    return prompt.substr(start, stop - start);
}

} // namespace sanitize
} // namespace docsanitizer
