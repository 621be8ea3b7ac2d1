#ifndef DOCSANITIZER_TEST_UNIT_TEST_POLICY_HPP
#define DOCSANITIZER_TEST_UNIT_TEST_POLICY_HPP

// test/unit/test_policy.hpp
// -----------------------------------------------------------
// The category/action table, profile validation, the SQLite profile store and
// the resolver the engine calls.

#include <cstdio>
#include <gtest/gtest.h>
#include <map>
#include <sqlite3.h>
#include <string>

#include "policy/pii_policy.hpp"
#include "policy/policy_resolver.hpp"
#include "policy/profile_store.hpp"

namespace {

using docsanitizer::core::ProfileNotFoundError;
using docsanitizer::core::ProfileValidationError;
using docsanitizer::policy::PiiAction;
using docsanitizer::policy::PiiCategory;
using docsanitizer::policy::PolicyResolver;
using docsanitizer::policy::Profile;
using docsanitizer::policy::ProfileRecord;
using docsanitizer::policy::ProfileStore;
namespace policy = docsanitizer::policy;

ProfileRecord completeRecord(const std::string &name)
{
    ProfileRecord record;
    record.name = name;
    for (PiiCategory category : policy::allCategories()) {
        record.actions[policy::categoryName(category)] = policy::actionName(policy::defaultAction(category));
    }
    return record;
}

void execRaw(const std::string &path, const std::string &sql)
{
    sqlite3 *db = nullptr;
    ASSERT_EQ(sqlite3_open(path.c_str(), &db), SQLITE_OK);
    char *err = nullptr;
    int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
    std::string message = err ? err : "";
    sqlite3_free(err);
    sqlite3_close(db);
    ASSERT_EQ(rc, SQLITE_OK) << message;
}

TEST(PiiPolicyTest, LegalActionTable) {
    EXPECT_TRUE(policy::isLegal(PiiCategory::PersonName, PiiAction::KeepPart));
    EXPECT_TRUE(policy::isLegal(PiiCategory::Phone, PiiAction::Invent));
    EXPECT_FALSE(policy::isLegal(PiiCategory::Email, PiiAction::Invent));
    EXPECT_FALSE(policy::isLegal(PiiCategory::Company, PiiAction::Delete));
    EXPECT_FALSE(policy::isLegal(PiiCategory::Address, PiiAction::KeepPart));
    EXPECT_FALSE(policy::isLegal(PiiCategory::DateOfBirth, PiiAction::KeepPart));

    for (PiiCategory category : policy::allCategories()) {
        EXPECT_TRUE(policy::isLegal(category, policy::defaultAction(category))) << policy::categoryName(category);
    }
    EXPECT_EQ(policy::allCategories().size(), (size_t)8);
}

TEST(PiiPolicyTest, NamesRoundTrip) {
    for (PiiCategory category : policy::allCategories()) {
        auto parsed = policy::parseCategory(policy::categoryName(category));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, category);
    }
    EXPECT_FALSE(policy::parseCategory("ssn").has_value());
    EXPECT_FALSE(policy::parseAction("redact").has_value());
    EXPECT_EQ(policy::parseAction("keep_part").value(), PiiAction::KeepPart);
}

TEST(PiiPolicyTest, ProfileNameRules) {
    EXPECT_NO_THROW(policy::validateProfileName("legal-team_2"));
    EXPECT_THROW(policy::validateProfileName(""), ProfileValidationError);
    EXPECT_THROW(policy::validateProfileName(std::string(51, 'a')), ProfileValidationError);
    EXPECT_THROW(policy::validateProfileName("has space"), ProfileValidationError);
    EXPECT_THROW(policy::validateProfileName("semi;colon"), ProfileValidationError);
}

TEST(PiiPolicyTest, FromRecordValidatesEveryCategory) {
    ProfileRecord record = completeRecord("ok");
    Profile profile = Profile::fromRecord(record);
    EXPECT_EQ(profile.actionFor(PiiCategory::Phone), PiiAction::Delete);
    EXPECT_EQ(profile.actions.size(), (size_t)8);

    ProfileRecord missing = completeRecord("missing");
    missing.actions.erase("financial");
    EXPECT_THROW(Profile::fromRecord(missing), ProfileValidationError);

    ProfileRecord illegal = completeRecord("illegal");
    illegal.actions["company"] = "delete";
    EXPECT_THROW(Profile::fromRecord(illegal), ProfileValidationError);

    ProfileRecord unknownCategory = completeRecord("unknown");
    unknownCategory.actions["shoe_size"] = "delete";
    EXPECT_THROW(Profile::fromRecord(unknownCategory), ProfileValidationError);

    ProfileRecord unknownAction = completeRecord("unknown");
    unknownAction.actions["email"] = "shred";
    EXPECT_THROW(Profile::fromRecord(unknownAction), ProfileValidationError);
}

TEST(ProfileStoreTest, SeedsDefaultProfile) {
    ProfileStore store(":memory:");
    auto profiles = store.listProfiles();
    ASSERT_EQ(profiles.size(), (size_t)1);
    EXPECT_EQ(profiles[0].name, ProfileStore::kDefaultProfileName);

    Profile profile = store.getProfile("DEFAULT");
    EXPECT_EQ(profile.actionFor(PiiCategory::PersonName), PiiAction::KeepPart);
    EXPECT_EQ(profile.actionFor(PiiCategory::Address), PiiAction::Delete);
}

TEST(ProfileStoreTest, CreateUpdateDelete) {
    ProfileStore store(":memory:");
    Profile created = store.createProfile("strict");
    EXPECT_EQ(created.actionFor(PiiCategory::Email), PiiAction::KeepPart);
    EXPECT_THROW(store.createProfile("Strict"), ProfileValidationError);
    EXPECT_THROW(store.createProfile("bad name"), ProfileValidationError);
    EXPECT_THROW(store.createProfile("copy", "nope"), ProfileValidationError);

    Profile updated = store.updateProfile("strict", {{"person_name", "delete"}, {"email", "delete"}});
    EXPECT_EQ(updated.actionFor(PiiCategory::PersonName), PiiAction::Delete);
    EXPECT_EQ(updated.actionFor(PiiCategory::Email), PiiAction::Delete);

    // Copying picks up the current actions of the source.
    Profile copy = store.createProfile("strict-copy", "strict");
    EXPECT_EQ(copy.actionFor(PiiCategory::PersonName), PiiAction::Delete);

    store.deleteProfile("STRICT");
    EXPECT_THROW(store.getProfile("strict"), ProfileNotFoundError);
    EXPECT_THROW(store.deleteProfile("strict"), ProfileNotFoundError);
    EXPECT_THROW(store.deleteProfile("Default"), ProfileValidationError);
    EXPECT_EQ(store.listProfiles().size(), (size_t)2);
}

TEST(ProfileStoreTest, RejectedUpdateChangesNothing) {
    ProfileStore store(":memory:");
    EXPECT_THROW(store.updateProfile("default", {{"person_name", "delete"}, {"company", "delete"}}),
                 ProfileValidationError);
    EXPECT_THROW(store.updateProfile("default", {{"shoe_size", "delete"}}), ProfileValidationError);
    EXPECT_THROW(store.updateProfile("ghost", {{"email", "delete"}}), ProfileNotFoundError);
    EXPECT_EQ(store.getProfile("default").actionFor(PiiCategory::PersonName), PiiAction::KeepPart);
}

TEST(ProfileStoreTest, PersistsAcrossReopen) {
    const std::string path = "test_docsanitizer_profiles.sqlite";
    std::remove(path.c_str());
    {
        ProfileStore store(path);
        store.createProfile("hr");
        store.updateProfile("hr", {{"phone", "invent"}});
    }
    {
        ProfileStore store(path);
        EXPECT_EQ(store.listProfiles().size(), (size_t)2);
        EXPECT_EQ(store.getProfile("hr").actionFor(PiiCategory::Phone), PiiAction::Invent);
        EXPECT_NE(store.formatProfilesTable().find("invent"), std::string::npos);
        EXPECT_NE(store.formatProfileDetail("hr").find("Replace with a synthetic phone number"), std::string::npos);
    }
    std::remove(path.c_str());
}

TEST(PolicyResolverTest, ResolvesSnapshotOfProfile) {
    ProfileStore store(":memory:");
    store.createProfile("legal");
    PolicyResolver resolver(store);

    Profile resolved = resolver.resolve("legal");
    store.updateProfile("legal", {{"company", "invent"}});
    // The earlier resolution is a copy.
    EXPECT_EQ(resolved.actionFor(PiiCategory::Company), PiiAction::KeepPart);
    EXPECT_EQ(resolver.resolve("LEGAL").actionFor(PiiCategory::Company), PiiAction::Invent);
}

TEST(PolicyResolverTest, UnknownAndCorruptProfiles) {
    const std::string path = "test_docsanitizer_corrupt.sqlite";
    std::remove(path.c_str());
    ProfileStore store(path);
    store.createProfile("broken");
    PolicyResolver resolver(store);

    EXPECT_THROW(resolver.resolve("nobody"), ProfileNotFoundError);

    execRaw(path, "UPDATE profile_actions SET action = 'invent' WHERE category = 'email' AND profile_id = "
                  "(SELECT id FROM profiles WHERE name = 'broken');");
    EXPECT_THROW(resolver.resolve("broken"), ProfileValidationError);

    execRaw(path, "DELETE FROM profile_actions WHERE category = 'financial' AND profile_id = "
                  "(SELECT id FROM profiles WHERE name = 'broken');");
    EXPECT_THROW(resolver.resolve("broken"), ProfileValidationError);
    EXPECT_NO_THROW(resolver.resolve("default"));

    std::remove(path.c_str());
}

} // anonymous namespace

#endif // DOCSANITIZER_TEST_UNIT_TEST_POLICY_HPP
