#ifndef DOCSANITIZER_POLICY_PROFILE_STORE_HPP
#define DOCSANITIZER_POLICY_PROFILE_STORE_HPP

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "policy/pii_policy.hpp"

struct sqlite3;

/**
 * @file profile_store.hpp
 * @brief Persistent sanitization profiles in SQLite.
 *
 * Schema:
 *   profiles(id, name UNIQUE COLLATE NOCASE, created_at, modified_at)
 *   profile_actions(profile_id, category, action)
 *
 * A "default" profile with the default action of every category is seeded
 * when the database is created; it can be changed but not deleted. Names are
 * matched case-insensitively. ":memory:" gives a private in-memory database.
 */

namespace docsanitizer {
namespace policy {

class ProfileStore
{
public:
    static constexpr const char *kDefaultProfileName = "default";

    /**
     * @brief Open or create the database and make sure the default profile exists.
     * @throw std::runtime_error if the database cannot be opened or initialised.
     */
    explicit ProfileStore(const std::string &databasePath);
    ~ProfileStore();

    ProfileStore(const ProfileStore &) = delete;
    ProfileStore &operator=(const ProfileStore &) = delete;

    /// Raw records in id order. Not validated.
    std::vector<ProfileRecord> listProfiles() const;

    /// Raw record by case-insensitive name, or nullopt.
    std::optional<ProfileRecord> loadRecord(const std::string &name) const;

    /**
     * @throw core::ProfileNotFoundError, core::ProfileValidationError
     */
    Profile getProfile(const std::string &name) const;

    /**
     * @brief Create @p name with the actions of @p fromProfile.
     * @throw core::ProfileValidationError for a bad or duplicate name, or a
     *        missing source profile.
     */
    Profile createProfile(const std::string &name, const std::string &fromProfile = kDefaultProfileName);

    /**
     * @brief Apply category -> action changes, all or nothing.
     * @throw core::ProfileNotFoundError, core::ProfileValidationError
     */
    Profile updateProfile(const std::string &name, const std::map<std::string, std::string> &changes);

    /**
     * @throw core::ProfileNotFoundError, or core::ProfileValidationError for
     *        the default profile.
     */
    void deleteProfile(const std::string &name);

    /// One line per profile: id, name and the action of every category.
    std::string formatProfilesTable() const;

    /// Category, action and description of one profile.
    std::string formatProfileDetail(const std::string &name) const;

    const std::string &databasePath() const { return databasePath_; }

private:
    void initSchema();
    void seedDefaultProfile();
    void exec(const char *sql, const std::string &what);
    std::optional<ProfileRecord> loadRecordLocked(const std::string &name) const;
    void insertActions(int64_t profileId, const std::map<std::string, std::string> &actions);

    std::string databasePath_;
    sqlite3 *db_ = nullptr;
    mutable std::mutex dbMutex_;
};

} // namespace policy
} // namespace docsanitizer

#endif // DOCSANITIZER_POLICY_PROFILE_STORE_HPP
