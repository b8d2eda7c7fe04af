#include "idreg/user_db.hpp"
#include "idreg/logger.hpp"

#include <format>
#include <memory>
#include <utility>

namespace idreg
{

namespace {

constexpr const char* select_cols =
    "SELECT id, external_id, display_name, CAST(strftime('%s', created_at) AS INTEGER) FROM users ";

UserRecord read_row(sqlite3_stmt* stmt)
{
    UserRecord rec;
    rec.id = sqlite3_column_int64(stmt, 0);
    if (sqlite3_column_type(stmt, 1) != SQLITE_NULL)
    {
        rec.external_id = std::string(reinterpret_cast<const char*>(sqlite3_column_text(stmt, 1)),
                                      static_cast<size_t>(sqlite3_column_bytes(stmt, 1)));
    }
    rec.display_name = std::string(reinterpret_cast<const char*>(sqlite3_column_text(stmt, 2)),
                                   static_cast<size_t>(sqlite3_column_bytes(stmt, 2)));
    rec.created_at = std::chrono::sys_seconds(std::chrono::seconds(sqlite3_column_int64(stmt, 3)));
    return rec;
}

void bind_text(sqlite3_stmt* stmt, int idx, std::string_view sv)
{
    sqlite3_bind_text(stmt, idx, sv.data(), static_cast<int>(sv.size()), SQLITE_TRANSIENT);
}

void bind_optional(sqlite3_stmt* stmt, int idx, const std::optional<std::string>& val)
{
    if (val)
    {
        bind_text(stmt, idx, *val);
    }
    else
    {
        sqlite3_bind_null(stmt, idx);
    }
}

} // namespace

std::expected<UserDB, std::string> UserDB::open(const Config::DatabaseCfg& cfg)
{
    sqlite3* handle = nullptr;
    int rc = sqlite3_open_v2(cfg.path.c_str(), &handle,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    if (rc != SQLITE_OK)
    {
        std::string err = handle ? sqlite3_errmsg(handle) : sqlite3_errstr(rc);
        sqlite3_close(handle);
        return std::unexpected(std::format("Failed to open {}: {}", cfg.path, err));
    }
    
    UserDB db(handle);
    
    sqlite3_extended_result_codes(handle, 1);
    sqlite3_busy_timeout(handle, static_cast<int>(cfg.busy_timeout.count()));
    
    auto journal = std::format("PRAGMA journal_mode={};", cfg.journal_mode);
    if (sqlite3_exec(handle, journal.c_str(), nullptr, nullptr, nullptr) != SQLITE_OK)
    {
        IDREG_LOG_WARN("Could not set journal mode {} on {}: {}", cfg.journal_mode, cfg.path, db.last_error());
    }
    sqlite3_exec(handle, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, nullptr);
    
    IDREG_LOG_INFO("Opened database {}", cfg.path);
    return db;
}

UserDB::UserDB(sqlite3* handle)
    : db(handle)
{
}

UserDB::~UserDB()
{
    if (db)
    {
        sqlite3_close(db);
    }
}

UserDB::UserDB(UserDB&& other) noexcept
    : db(std::exchange(other.db, nullptr))
{
}

UserDB& UserDB::operator=(UserDB&& other) noexcept
{
    if (this != &other)
    {
        if (db) sqlite3_close(db);
        db = std::exchange(other.db, nullptr);
    }
    return *this;
}

std::string UserDB::last_error() const
{
    return db ? sqlite3_errmsg(db) : "database closed";
}

Errc UserDB::storage_error(std::string_view what, int rc)
{
    // Readers share the connection, so sqlite3_errmsg may belong to another call.
    IDREG_LOG_ERROR("{} failed: {} ({})", what, sqlite3_errstr(rc), rc);
    return Errc::StorageUnavailable;
}

std::expected<void, Errc> UserDB::exec(std::string_view sql)
{
    char* err = nullptr;
    int rc = sqlite3_exec(db, std::string(sql).c_str(), nullptr, nullptr, std::addressof(err));
    if (rc != SQLITE_OK)
    {
        IDREG_LOG_ERROR("SQL execution failed: {}", err ? err : sqlite3_errstr(rc));
        sqlite3_free(err);
        return std::unexpected(Errc::StorageUnavailable);
    }
    return {};
}

std::expected<UserDB::Transaction, Errc> UserDB::Transaction::begin(UserDB& db)
{
    if (auto res = db.exec("BEGIN IMMEDIATE;"); !res)
    {
        return std::unexpected(res.error());
    }
    return Transaction(db);
}

UserDB::Transaction::Transaction(UserDB& db)
    : owner(std::addressof(db))
{
}

UserDB::Transaction::Transaction(Transaction&& other) noexcept
    : owner(std::exchange(other.owner, nullptr))
{
}

UserDB::Transaction::~Transaction()
{
    if (owner && sqlite3_get_autocommit(owner->db) == 0)
    {
        if (sqlite3_exec(owner->db, "ROLLBACK;", nullptr, nullptr, nullptr) != SQLITE_OK)
        {
            IDREG_LOG_WARN("Rollback failed: {}", owner->last_error());
        }
    }
}

std::expected<void, Errc> UserDB::Transaction::commit()
{
    if (!owner)
    {
        return std::unexpected(Errc::StorageUnavailable);
    }
    if (auto res = owner->exec("COMMIT;"); !res)
    {
        return res;
    }
    owner = nullptr;
    return {};
}

std::expected<int64_t, Errc> UserDB::insert_user(const std::optional<std::string>& external_id,
                                                 std::string_view display_name)
{
    const char* sql = "INSERT INTO users (external_id, display_name) VALUES (?, ?);";
    sqlite3_stmt* stmt = nullptr;
    
    if (int rc = sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr); rc != SQLITE_OK)
    {
        return std::unexpected(storage_error("Prepare insert", rc));
    }
    
    bind_optional(stmt, 1, external_id);
    bind_text(stmt, 2, display_name);
    
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    
    if (rc == SQLITE_DONE)
    {
        return sqlite3_last_insert_rowid(db);
    }
    if ((rc & 0xff) == SQLITE_CONSTRAINT)
    {
        // "UNIQUE constraint failed: users.external_id[, users.display_name]"
        std::string_view msg = sqlite3_errmsg(db);
        IDREG_LOG_WARN("Insert rejected by storage: {}", msg);
        if (msg.find("display_name") != std::string_view::npos)
        {
            return std::unexpected(Errc::DuplicateIdentityPair);
        }
        if (msg.find("external_id") != std::string_view::npos)
        {
            return std::unexpected(Errc::DuplicateExternalId);
        }
        return std::unexpected(Errc::InvalidInput);
    }
    return std::unexpected(storage_error("Insert user", rc));
}

std::expected<UserRecord, Errc> UserDB::find_by_id(int64_t id)
{
    auto sql = std::string(select_cols) + "WHERE id = ?;";
    sqlite3_stmt* stmt = nullptr;
    
    if (int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr); rc != SQLITE_OK)
    {
        return std::unexpected(storage_error("Prepare lookup by id", rc));
    }
    
    sqlite3_bind_int64(stmt, 1, id);
    
    std::expected<UserRecord, Errc> result = std::unexpected(Errc::NotFound);
    int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW)
    {
        result = read_row(stmt);
    }
    else if (rc != SQLITE_DONE)
    {
        result = std::unexpected(storage_error("Lookup by id", rc));
    }
    
    sqlite3_finalize(stmt);
    return result;
}

std::expected<UserRecord, Errc> UserDB::find_one(const char* where, std::string_view key)
{
    auto sql = std::string(select_cols) + where;
    sqlite3_stmt* stmt = nullptr;
    
    if (int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr); rc != SQLITE_OK)
    {
        return std::unexpected(storage_error("Prepare lookup", rc));
    }
    
    bind_text(stmt, 1, key);
    
    std::expected<UserRecord, Errc> result = std::unexpected(Errc::NotFound);
    int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW)
    {
        result = read_row(stmt);
    }
    else if (rc != SQLITE_DONE)
    {
        result = std::unexpected(storage_error("Lookup", rc));
    }
    
    sqlite3_finalize(stmt);
    return result;
}

std::expected<UserRecord, Errc> UserDB::find_by_external_id(std::string_view external_id)
{
    return find_one("WHERE external_id = ?;", external_id);
}

std::expected<UserRecord, Errc> UserDB::find_by_display_name(std::string_view display_name)
{
    return find_one("WHERE display_name = ? ORDER BY id LIMIT 1;", display_name);
}

std::expected<bool, Errc> UserDB::external_id_taken(std::string_view external_id)
{
    auto found = find_by_external_id(external_id);
    if (found)
    {
        return true;
    }
    if (found.error() == Errc::NotFound)
    {
        return false;
    }
    return std::unexpected(found.error());
}

std::expected<bool, Errc> UserDB::identity_pair_taken(const std::optional<std::string>& external_id,
                                                      std::string_view display_name)
{
    // NULL never equals NULL, so an absent external id never matches here.
    const char* sql = "SELECT 1 FROM users WHERE external_id = ? AND display_name = ? LIMIT 1;";
    sqlite3_stmt* stmt = nullptr;
    
    if (int rc = sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr); rc != SQLITE_OK)
    {
        return std::unexpected(storage_error("Prepare identity pair check", rc));
    }
    
    bind_optional(stmt, 1, external_id);
    bind_text(stmt, 2, display_name);
    
    std::expected<bool, Errc> result = false;
    int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW)
    {
        result = true;
    }
    else if (rc != SQLITE_DONE)
    {
        result = std::unexpected(storage_error("Identity pair check", rc));
    }
    
    sqlite3_finalize(stmt);
    return result;
}

std::expected<int64_t, Errc> UserDB::count_users()
{
    const char* sql = "SELECT COUNT(*) FROM users;";
    sqlite3_stmt* stmt = nullptr;
    
    if (int rc = sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr); rc != SQLITE_OK)
    {
        return std::unexpected(storage_error("Prepare count", rc));
    }
    
    std::expected<int64_t, Errc> result = 0;
    if (int rc = sqlite3_step(stmt); rc == SQLITE_ROW)
    {
        result = sqlite3_column_int64(stmt, 0);
    }
    else
    {
        result = std::unexpected(storage_error("Count users", rc));
    }
    
    sqlite3_finalize(stmt);
    return result;
}

std::expected<std::vector<std::string>, Errc> UserDB::list_display_names()
{
    const char* sql = "SELECT display_name FROM users ORDER BY id;";
    sqlite3_stmt* stmt = nullptr;
    
    if (int rc = sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr); rc != SQLITE_OK)
    {
        return std::unexpected(storage_error("Prepare name listing", rc));
    }
    
    std::vector<std::string> names;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW)
    {
        names.emplace_back(reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0)),
                           static_cast<size_t>(sqlite3_column_bytes(stmt, 0)));
    }
    
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE)
    {
        return std::unexpected(storage_error("List display names", rc));
    }
    return names;
}

} // namespace idreg
