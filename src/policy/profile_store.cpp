#include "policy/profile_store.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <sqlite3.h>
#include <stdexcept>

#include "util/logger.hpp"

namespace docsanitizer {
namespace policy {

namespace logger = util::logger;

namespace {

const char *kSchema = "CREATE TABLE IF NOT EXISTS profiles ("
                      " id INTEGER PRIMARY KEY AUTOINCREMENT,"
                      " name TEXT NOT NULL UNIQUE COLLATE NOCASE,"
                      " created_at TEXT NOT NULL DEFAULT (datetime('now')),"
                      " modified_at TEXT NOT NULL DEFAULT (datetime('now')));"
                      "CREATE TABLE IF NOT EXISTS profile_actions ("
                      " profile_id INTEGER NOT NULL REFERENCES profiles(id) ON DELETE CASCADE,"
                      " category TEXT NOT NULL,"
                      " action TEXT NOT NULL,"
                      " PRIMARY KEY (profile_id, category));";

// Finalizes on scope exit.
class Statement
{
public:
    Statement(sqlite3 *db, const char *sql)
    {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK || !stmt_) {
            std::string err = sqlite3_errmsg(db);
            sqlite3_finalize(stmt_);
            throw std::runtime_error("ProfileStore: prepare failed: " + err);
        }
    }
    ~Statement() { sqlite3_finalize(stmt_); }

    Statement(const Statement &) = delete;
    Statement &operator=(const Statement &) = delete;

    sqlite3_stmt *get() const { return stmt_; }

    void bind(int index, const std::string &value)
    {
        sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
    }
    void bind(int index, int64_t value) { sqlite3_bind_int64(stmt_, index, value); }

    std::string text(int column) const
    {
        const unsigned char *value = sqlite3_column_text(stmt_, column);
        return value ? std::string(reinterpret_cast<const char *>(value)) : std::string();
    }

private:
    sqlite3_stmt *stmt_ = nullptr;
};

std::string lowerCopy(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string padRight(const std::string &s, size_t width)
{
    return s.size() >= width ? s : s + std::string(width - s.size(), ' ');
}

} // namespace

ProfileStore::ProfileStore(const std::string &databasePath)
    : databasePath_(databasePath)
{
    if (databasePath_ != ":memory:") {
        std::filesystem::path parent = std::filesystem::path(databasePath_).parent_path();
        if (!parent.empty()) {
            std::error_code ec;
            std::filesystem::create_directories(parent, ec);
            if (ec) {
                throw std::runtime_error("ProfileStore: cannot create directory " + parent.string() + ": " +
                                         ec.message());
            }
        }
    }

    if (sqlite3_open(databasePath_.c_str(), &db_) != SQLITE_OK || !db_) {
        std::string err = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("ProfileStore: could not open database " + databasePath_ + ": " + err);
    }

    std::lock_guard<std::mutex> lock(dbMutex_);
    try {
        exec("PRAGMA foreign_keys = ON;", "enable foreign keys");
        initSchema();
        seedDefaultProfile();
    } catch (...) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
    logger::info("[ProfileStore] opened " + databasePath_);
}

ProfileStore::~ProfileStore()
{
    if (db_) {
        sqlite3_close(db_);
    }
}

void ProfileStore::exec(const char *sql, const std::string &what)
{
    char *errMsg = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        std::string err = errMsg ? errMsg : sqlite3_errmsg(db_);
        sqlite3_free(errMsg);
        throw std::runtime_error("ProfileStore: " + what + " failed: " + err);
    }
}

void ProfileStore::initSchema()
{
    exec(kSchema, "schema initialisation");
}

void ProfileStore::seedDefaultProfile()
{
    if (loadRecordLocked(kDefaultProfileName)) {
        return;
    }

    std::map<std::string, std::string> actions;
    for (PiiCategory category : allCategories()) {
        actions[categoryName(category)] = actionName(defaultAction(category));
    }

    exec("BEGIN TRANSACTION;", "begin");
    try {
        Statement insert(db_, "INSERT INTO profiles (name) VALUES (?);");
        insert.bind(1, std::string(kDefaultProfileName));
        if (sqlite3_step(insert.get()) != SQLITE_DONE) {
            throw std::runtime_error("ProfileStore: seeding default profile failed: " +
                                     std::string(sqlite3_errmsg(db_)));
        }
        insertActions(sqlite3_last_insert_rowid(db_), actions);
        exec("COMMIT;", "commit");
    } catch (...) {
        sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
        throw;
    }
    logger::info("[ProfileStore] seeded the default profile.");
}

void ProfileStore::insertActions(int64_t profileId, const std::map<std::string, std::string> &actions)
{
    Statement insert(db_, "INSERT OR REPLACE INTO profile_actions (profile_id, category, action) VALUES (?, ?, ?);");
    for (const auto &kv : actions) {
        sqlite3_reset(insert.get());
        insert.bind(1, profileId);
        insert.bind(2, kv.first);
        insert.bind(3, kv.second);
        if (sqlite3_step(insert.get()) != SQLITE_DONE) {
            throw std::runtime_error("ProfileStore: writing action " + kv.first + " failed: " +
                                     std::string(sqlite3_errmsg(db_)));
        }
    }
}

std::optional<ProfileRecord> ProfileStore::loadRecordLocked(const std::string &name) const
{
    ProfileRecord record;
    {
        Statement select(db_, "SELECT id, name, created_at, modified_at FROM profiles WHERE name = ?;");
        select.bind(1, name);
        int rc = sqlite3_step(select.get());
        if (rc == SQLITE_DONE) {
            return std::nullopt;
        }
        if (rc != SQLITE_ROW) {
            throw std::runtime_error("ProfileStore: lookup failed: " + std::string(sqlite3_errmsg(db_)));
        }
        record.id = sqlite3_column_int64(select.get(), 0);
        record.name = select.text(1);
        record.createdAt = select.text(2);
        record.modifiedAt = select.text(3);
    }

    Statement actions(db_, "SELECT category, action FROM profile_actions WHERE profile_id = ?;");
    actions.bind(1, record.id);
    int rc;
    while ((rc = sqlite3_step(actions.get())) == SQLITE_ROW) {
        record.actions[actions.text(0)] = actions.text(1);
    }
    if (rc != SQLITE_DONE) {
        throw std::runtime_error("ProfileStore: reading actions failed: " + std::string(sqlite3_errmsg(db_)));
    }
    return record;
}

std::optional<ProfileRecord> ProfileStore::loadRecord(const std::string &name) const
{
    std::lock_guard<std::mutex> lock(dbMutex_);
    return loadRecordLocked(name);
}

std::vector<ProfileRecord> ProfileStore::listProfiles() const
{
    std::lock_guard<std::mutex> lock(dbMutex_);
    std::vector<std::string> names;
    {
        Statement select(db_, "SELECT name FROM profiles ORDER BY id;");
        int rc;
        while ((rc = sqlite3_step(select.get())) == SQLITE_ROW) {
            names.push_back(select.text(0));
        }
        if (rc != SQLITE_DONE) {
            throw std::runtime_error("ProfileStore: listing failed: " + std::string(sqlite3_errmsg(db_)));
        }
    }

    std::vector<ProfileRecord> records;
    for (const auto &name : names) {
        if (auto record = loadRecordLocked(name)) {
            records.push_back(std::move(*record));
        }
    }
    return records;
}

Profile ProfileStore::getProfile(const std::string &name) const
{
    auto record = loadRecord(name);
    if (!record) {
        throw core::ProfileNotFoundError(name);
    }
    return Profile::fromRecord(*record);
}

Profile ProfileStore::createProfile(const std::string &name, const std::string &fromProfile)
{
    validateProfileName(name);

    std::lock_guard<std::mutex> lock(dbMutex_);
    if (loadRecordLocked(name)) {
        throw core::ProfileValidationError("profile '" + name + "' already exists");
    }
    auto source = loadRecordLocked(fromProfile);
    if (!source) {
        throw core::ProfileValidationError("source profile not found: " + fromProfile);
    }
    // Copy only a source that is itself valid.
    Profile::fromRecord(*source);

    exec("BEGIN TRANSACTION;", "begin");
    try {
        Statement insert(db_, "INSERT INTO profiles (name) VALUES (?);");
        insert.bind(1, name);
        if (sqlite3_step(insert.get()) != SQLITE_DONE) {
            throw std::runtime_error("ProfileStore: creating profile failed: " + std::string(sqlite3_errmsg(db_)));
        }
        insertActions(sqlite3_last_insert_rowid(db_), source->actions);
        exec("COMMIT;", "commit");
    } catch (...) {
        sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
        throw;
    }

    logger::info("[ProfileStore] created profile '" + name + "' from '" + source->name + "'");
    return Profile::fromRecord(*loadRecordLocked(name));
}

Profile ProfileStore::updateProfile(const std::string &name, const std::map<std::string, std::string> &changes)
{
    std::lock_guard<std::mutex> lock(dbMutex_);
    auto record = loadRecordLocked(name);
    if (!record) {
        throw core::ProfileNotFoundError(name);
    }

    for (const auto &kv : changes) {
        auto category = parseCategory(kv.first);
        if (!category) {
            throw core::ProfileValidationError("invalid PII category: " + kv.first);
        }
        auto action = parseAction(kv.second);
        if (!action || !isLegal(*category, *action)) {
            std::string legal;
            for (PiiAction a : legalActions(*category)) {
                legal += legal.empty() ? "" : ", ";
                legal += actionName(a);
            }
            throw core::ProfileValidationError("invalid action '" + kv.second + "' for " + kv.first +
                                               " (allowed: " + legal + ")");
        }
        record->actions[kv.first] = kv.second;
    }
    // The result must still be a complete, legal profile.
    Profile::fromRecord(*record);

    exec("BEGIN TRANSACTION;", "begin");
    try {
        insertActions(record->id, changes);
        Statement touch(db_, "UPDATE profiles SET modified_at = datetime('now') WHERE id = ?;");
        touch.bind(1, record->id);
        if (sqlite3_step(touch.get()) != SQLITE_DONE) {
            throw std::runtime_error("ProfileStore: updating profile failed: " + std::string(sqlite3_errmsg(db_)));
        }
        exec("COMMIT;", "commit");
    } catch (...) {
        sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
        throw;
    }

    logger::info("[ProfileStore] updated profile '" + record->name + "' (" + std::to_string(changes.size()) +
                 " change(s))");
    return Profile::fromRecord(*loadRecordLocked(name));
}

void ProfileStore::deleteProfile(const std::string &name)
{
    if (lowerCopy(name) == kDefaultProfileName) {
        throw core::ProfileValidationError("the default profile cannot be deleted");
    }

    std::lock_guard<std::mutex> lock(dbMutex_);
    auto record = loadRecordLocked(name);
    if (!record) {
        throw core::ProfileNotFoundError(name);
    }

    Statement remove(db_, "DELETE FROM profiles WHERE id = ?;");
    remove.bind(1, record->id);
    if (sqlite3_step(remove.get()) != SQLITE_DONE) {
        throw std::runtime_error("ProfileStore: deleting profile failed: " + std::string(sqlite3_errmsg(db_)));
    }
    logger::info("[ProfileStore] deleted profile '" + record->name + "'");
}

std::string ProfileStore::formatProfilesTable() const
{
    std::vector<std::string> headers = {"ID", "Name"};
    for (PiiCategory category : allCategories()) {
        headers.push_back(categoryName(category));
    }

    std::vector<std::vector<std::string>> rows;
    for (const auto &record : listProfiles()) {
        std::vector<std::string> row = {std::to_string(record.id), record.name};
        for (PiiCategory category : allCategories()) {
            auto it = record.actions.find(categoryName(category));
            row.push_back(it != record.actions.end() ? it->second : "?");
        }
        rows.push_back(std::move(row));
    }

    std::vector<size_t> widths;
    for (const auto &h : headers) {
        widths.push_back(h.size());
    }
    for (const auto &row : rows) {
        for (size_t i = 0; i < row.size(); ++i) {
            widths[i] = std::max(widths[i], row[i].size());
        }
    }

    auto renderRow = [&](const std::vector<std::string> &cells) {
        std::string line;
        for (size_t i = 0; i < cells.size(); ++i) {
            line += (i > 0 ? " | " : "") + padRight(cells[i], widths[i]);
        }
        return line;
    };

    std::string out = renderRow(headers) + "\n";
    for (size_t i = 0; i < widths.size(); ++i) {
        out += (i > 0 ? "-+-" : "") + std::string(widths[i], '-');
    }
    for (const auto &row : rows) {
        out += "\n" + renderRow(row);
    }
    return out;
}

std::string ProfileStore::formatProfileDetail(const std::string &name) const
{
    Profile profile = getProfile(name);
    std::string out = "Profile: " + profile.name + " (ID: " + std::to_string(profile.id) + ")\n";
    out += "Created: " + profile.createdAt + "\n";
    out += "Modified: " + profile.modifiedAt + "\n\n";
    out += padRight("PII Type", 15) + " | " + padRight("Action", 9) + " | Description\n";
    out += std::string(15, '-') + "-+-" + std::string(9, '-') + "-+-" + std::string(40, '-');
    for (PiiCategory category : allCategories()) {
        PiiAction action = profile.actionFor(category);
        out += "\n" + padRight(categoryName(category), 15) + " | " + padRight(actionName(action), 9) + " | " +
               actionDescription(category, action);
    }
    return out;
}

} // namespace policy
} // namespace docsanitizer
