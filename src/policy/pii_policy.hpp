#ifndef DOCSANITIZER_POLICY_PII_POLICY_HPP
#define DOCSANITIZER_POLICY_PII_POLICY_HPP

#include <algorithm>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "core/errors.hpp"

/**
 * @file pii_policy.hpp
 * @brief PII categories, the actions that may be applied to them, and the
 *        validated Profile type built from a raw stored record.
 *
 * The legal action table is fixed:
 *
 *   person_name    delete, invent, keep_part    (default keep_part)
 *   email          delete, keep_part            (default keep_part)
 *   phone          delete, invent, keep_part    (default delete)
 *   company        keep_part, invent            (default keep_part)
 *   address        delete, invent               (default delete)
 *   financial      delete, invent               (default delete)
 *   id_numbers     delete, invent               (default delete)
 *   date_of_birth  delete, invent               (default delete)
 */

namespace docsanitizer {
namespace policy {

enum class PiiCategory {
    PersonName,
    Email,
    Phone,
    Company,
    Address,
    Financial,
    IdNumbers,
    DateOfBirth
};

enum class PiiAction {
    Delete,
    Invent,
    KeepPart
};

using ActionMap = std::map<PiiCategory, PiiAction>;

inline const std::vector<PiiCategory> &allCategories()
{
    static const std::vector<PiiCategory> categories = {
        PiiCategory::PersonName, PiiCategory::Email,     PiiCategory::Phone,     PiiCategory::Company,
        PiiCategory::Address,    PiiCategory::Financial, PiiCategory::IdNumbers, PiiCategory::DateOfBirth};
    return categories;
}

inline const char *categoryName(PiiCategory category)
{
    switch (category) {
    case PiiCategory::PersonName:
        return "person_name";
    case PiiCategory::Email:
        return "email";
    case PiiCategory::Phone:
        return "phone";
    case PiiCategory::Company:
        return "company";
    case PiiCategory::Address:
        return "address";
    case PiiCategory::Financial:
        return "financial";
    case PiiCategory::IdNumbers:
        return "id_numbers";
    case PiiCategory::DateOfBirth:
        return "date_of_birth";
    }
    return "unknown";
}

inline const char *actionName(PiiAction action)
{
    switch (action) {
    case PiiAction::Delete:
        return "delete";
    case PiiAction::Invent:
        return "invent";
    case PiiAction::KeepPart:
        return "keep_part";
    }
    return "unknown";
}

inline std::optional<PiiCategory> parseCategory(const std::string &name)
{
    for (PiiCategory category : allCategories()) {
        if (name == categoryName(category)) {
            return category;
        }
    }
    return std::nullopt;
}

inline std::optional<PiiAction> parseAction(const std::string &name)
{
    for (PiiAction action : {PiiAction::Delete, PiiAction::Invent, PiiAction::KeepPart}) {
        if (name == actionName(action)) {
            return action;
        }
    }
    return std::nullopt;
}

inline std::vector<PiiAction> legalActions(PiiCategory category)
{
    switch (category) {
    case PiiCategory::PersonName:
    case PiiCategory::Phone:
        return {PiiAction::Delete, PiiAction::Invent, PiiAction::KeepPart};
    case PiiCategory::Email:
        return {PiiAction::Delete, PiiAction::KeepPart};
    case PiiCategory::Company:
        return {PiiAction::KeepPart, PiiAction::Invent};
    case PiiCategory::Address:
    case PiiCategory::Financial:
    case PiiCategory::IdNumbers:
    case PiiCategory::DateOfBirth:
        return {PiiAction::Delete, PiiAction::Invent};
    }
    return {};
}

inline bool isLegal(PiiCategory category, PiiAction action)
{
    auto legal = legalActions(category);
    return std::find(legal.begin(), legal.end(), action) != legal.end();
}

inline PiiAction defaultAction(PiiCategory category)
{
    switch (category) {
    case PiiCategory::PersonName:
    case PiiCategory::Email:
    case PiiCategory::Company:
        return PiiAction::KeepPart;
    default:
        return PiiAction::Delete;
    }
}

inline ActionMap defaultActions()
{
    ActionMap actions;
    for (PiiCategory category : allCategories()) {
        actions[category] = defaultAction(category);
    }
    return actions;
}

/**
 * @brief Literal placeholders a sanitized text may contain for @p category.
 *        Company names have none: they are kept or replaced, never masked.
 */
inline std::vector<std::string> placeholderMarkers(PiiCategory category)
{
    switch (category) {
    case PiiCategory::PersonName:
        return {"[NAME_REMOVED]"};
    case PiiCategory::Email:
        return {"[EMAIL_REMOVED]", "[EMAIL_REDACTED]"};
    case PiiCategory::Phone:
        return {"[PHONE_REMOVED]", "[PHONE_REDACTED]"};
    case PiiCategory::Company:
        return {};
    case PiiCategory::Address:
        return {"[ADDRESS_REMOVED]"};
    case PiiCategory::Financial:
        return {"[FINANCIAL_REMOVED]"};
    case PiiCategory::IdNumbers:
        return {"[ID_REMOVED]"};
    case PiiCategory::DateOfBirth:
        return {"[DOB_REMOVED]"};
    }
    return {};
}

// Human-readable effect of an action, for profile listings.
inline std::string actionDescription(PiiCategory category, PiiAction action)
{
    switch (category) {
    case PiiCategory::PersonName:
        if (action == PiiAction::Delete)
            return "Remove name completely, replace with [NAME_REMOVED]";
        if (action == PiiAction::Invent)
            return "Replace with a consistent synthetic name";
        return "Keep first name only, numbering duplicates (John 1, John 2)";
    case PiiCategory::Email:
        if (action == PiiAction::Delete)
            return "Remove email completely, replace with [EMAIL_REMOVED]";
        return "Keep domain only ([EMAIL_REDACTED]@company.com)";
    case PiiCategory::Phone:
        if (action == PiiAction::Delete)
            return "Remove phone completely, replace with [PHONE_REMOVED]";
        if (action == PiiAction::Invent)
            return "Replace with a synthetic phone number";
        return "Keep country/area code only (+1 (555) [PHONE_REDACTED])";
    case PiiCategory::Company:
        if (action == PiiAction::Invent)
            return "Replace with a consistent synthetic company name";
        return "Keep company name as-is";
    case PiiCategory::Address:
        return action == PiiAction::Delete ? "Remove address completely, replace with [ADDRESS_REMOVED]"
                                           : "Replace with a synthetic address";
    case PiiCategory::Financial:
        return action == PiiAction::Delete ? "Remove financial data, replace with [FINANCIAL_REMOVED]"
                                           : "Replace with synthetic financial data";
    case PiiCategory::IdNumbers:
        return action == PiiAction::Delete ? "Remove ID numbers, replace with [ID_REMOVED]"
                                           : "Replace with synthetic ID numbers";
    case PiiCategory::DateOfBirth:
        return action == PiiAction::Delete ? "Remove date of birth, replace with [DOB_REMOVED]"
                                           : "Replace with a synthetic date of birth";
    }
    return std::string();
}

/**
 * @brief Profile names: 1 to 50 characters from [A-Za-z0-9_-].
 * @throw core::ProfileValidationError otherwise.
 */
inline void validateProfileName(const std::string &name)
{
    if (name.empty()) {
        throw core::ProfileValidationError("profile name cannot be empty");
    }
    if (name.size() > 50) {
        throw core::ProfileValidationError("profile name cannot exceed 50 characters");
    }
    for (char c : name) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_' || c == '-';
        if (!ok) {
            throw core::ProfileValidationError("profile name '" + name +
                                               "' may only contain letters, digits, underscores and hyphens");
        }
    }
}

/**
 * @struct ProfileRecord
 * @brief A profile as persisted: category and action names, unvalidated.
 */
struct ProfileRecord
{
    int64_t id = 0;
    std::string name;
    std::string createdAt;
    std::string modifiedAt;
    std::map<std::string, std::string> actions;
};

/**
 * @struct Profile
 * @brief A validated profile: exactly one legal action for every category.
 */
struct Profile
{
    int64_t id = 0;
    std::string name;
    std::string createdAt;
    std::string modifiedAt;
    ActionMap actions;

    PiiAction actionFor(PiiCategory category) const
    {
        auto it = actions.find(category);
        return it != actions.end() ? it->second : defaultAction(category);
    }

    /**
     * @throw core::ProfileValidationError for unknown names, missing categories
     *        or an action outside the category's legal set.
     */
    static Profile fromRecord(const ProfileRecord &record)
    {
        Profile profile;
        profile.id = record.id;
        profile.name = record.name;
        profile.createdAt = record.createdAt;
        profile.modifiedAt = record.modifiedAt;

        for (const auto &kv : record.actions) {
            auto category = parseCategory(kv.first);
            if (!category) {
                throw core::ProfileValidationError("profile '" + record.name + "': unknown PII category '" +
                                                   kv.first + "'");
            }
            auto action = parseAction(kv.second);
            if (!action) {
                throw core::ProfileValidationError("profile '" + record.name + "': unknown action '" + kv.second +
                                                   "' for " + kv.first);
            }
            if (!isLegal(*category, *action)) {
                throw core::ProfileValidationError("profile '" + record.name + "': action '" + kv.second +
                                                   "' is not allowed for " + kv.first);
            }
            profile.actions[*category] = *action;
        }

        for (PiiCategory category : allCategories()) {
            if (profile.actions.count(category) == 0) {
                throw core::ProfileValidationError("profile '" + record.name + "': no action for " +
                                                   categoryName(category));
            }
        }
        return profile;
    }

    ProfileRecord toRecord() const
    {
        ProfileRecord record;
        record.id = id;
        record.name = name;
        record.createdAt = createdAt;
        record.modifiedAt = modifiedAt;
        for (const auto &kv : actions) {
            record.actions[categoryName(kv.first)] = actionName(kv.second);
        }
        return record;
    }
};

} // namespace policy
} // namespace docsanitizer

#endif // DOCSANITIZER_POLICY_PII_POLICY_HPP
