#ifndef DOCSANITIZER_POLICY_POLICY_RESOLVER_HPP
#define DOCSANITIZER_POLICY_POLICY_RESOLVER_HPP

#include <string>
#include "policy/pii_policy.hpp"
#include "policy/profile_store.hpp"
#include "util/logger.hpp"

namespace docsanitizer {
namespace policy {

/**
 * @class PolicyResolver
 * @brief Profile name -> validated Profile, copied so later edits to the
 *        store never affect a request already in progress.
 */
class PolicyResolver
{
public:
    explicit PolicyResolver(const ProfileStore &store)
        : store_(store)
    {
    }

    /**
     * @throw core::ProfileNotFoundError for an unknown name.
     * @throw core::ProfileValidationError when the stored record is not a
     *        complete, legal profile.
     */
    Profile resolve(const std::string &profileName) const
    {
        auto record = store_.loadRecord(profileName);
        if (!record) {
            util::logger::warn("[PolicyResolver] unknown profile '" + profileName + "'");
            throw core::ProfileNotFoundError(profileName);
        }
        try {
            return Profile::fromRecord(*record);
        } catch (const core::ProfileValidationError &ex) {
            util::logger::error(std::string("[PolicyResolver] stored profile is invalid: ") + ex.what());
            throw;
        }
    }

private:
    const ProfileStore &store_;
};

} // namespace policy
} // namespace docsanitizer

#endif // DOCSANITIZER_POLICY_POLICY_RESOLVER_HPP
