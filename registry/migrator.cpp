#include "idreg/migrator.hpp"
#include "idreg/logger.hpp"

#include <algorithm>
#include <array>

namespace idreg
{

namespace {

constexpr std::array<Migration, 1> builtin_migrations{{
    {
        20240601232612,
        "users",
        R"(
            CREATE TABLE users (
                id INTEGER PRIMARY KEY AUTOINCREMENT NOT NULL,
                external_id TEXT UNIQUE,
                display_name TEXT NOT NULL,
                created_at TIMESTAMP NOT NULL DEFAULT CURRENT_TIMESTAMP,
                UNIQUE(external_id, display_name)
            );
        )"
    },
}};

} // namespace

Migrator::Migrator(UserDB& udb, std::span<const Migration> migrations)
    : db(udb)
    , pending(migrations.begin(), migrations.end())
{
    std::ranges::sort(pending, {}, &Migration::version);
}

std::span<const Migration> Migrator::builtin()
{
    return builtin_migrations;
}

std::expected<void, Errc> Migrator::ensure_bookkeeping()
{
    return db.get().exec(R"(
        CREATE TABLE IF NOT EXISTS schema_migrations (
            version INTEGER PRIMARY KEY,
            name TEXT NOT NULL,
            applied_at TIMESTAMP NOT NULL DEFAULT CURRENT_TIMESTAMP
        );
    )");
}

std::expected<std::vector<int64_t>, Errc> Migrator::applied()
{
    if (auto res = ensure_bookkeeping(); !res)
    {
        return std::unexpected(res.error());
    }
    
    sqlite3* handle = db.get().native_handle();
    const char* sql = "SELECT version FROM schema_migrations ORDER BY version;";
    sqlite3_stmt* stmt = nullptr;
    
    if (sqlite3_prepare_v2(handle, sql, -1, &stmt, nullptr) != SQLITE_OK)
    {
        IDREG_LOG_ERROR("Reading applied migrations failed: {}", db.get().last_error());
        return std::unexpected(Errc::StorageUnavailable);
    }
    
    std::vector<int64_t> versions;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW)
    {
        versions.push_back(sqlite3_column_int64(stmt, 0));
    }
    sqlite3_finalize(stmt);
    
    if (rc != SQLITE_DONE)
    {
        IDREG_LOG_ERROR("Reading applied migrations failed: {}", db.get().last_error());
        return std::unexpected(Errc::StorageUnavailable);
    }
    return versions;
}

std::expected<void, Errc> Migrator::record(const Migration& m)
{
    const char* sql = "INSERT INTO schema_migrations (version, name) VALUES (?, ?);";
    sqlite3_stmt* stmt = nullptr;
    sqlite3* handle = db.get().native_handle();
    
    if (sqlite3_prepare_v2(handle, sql, -1, &stmt, nullptr) != SQLITE_OK)
    {
        IDREG_LOG_ERROR("Recording migration {} failed: {}", m.version, db.get().last_error());
        return std::unexpected(Errc::StorageUnavailable);
    }
    
    sqlite3_bind_int64(stmt, 1, m.version);
    sqlite3_bind_text(stmt, 2, m.name.data(), static_cast<int>(m.name.size()), SQLITE_TRANSIENT);
    
    int rc = sqlite3_step(stmt);
    if (rc != SQLITE_DONE)
    {
        IDREG_LOG_ERROR("Recording migration {} failed: {}", m.version, db.get().last_error());
    }
    sqlite3_finalize(stmt);
    
    if (rc != SQLITE_DONE)
    {
        return std::unexpected(Errc::StorageUnavailable);
    }
    return {};
}

std::expected<bool, Errc> Migrator::is_applied(int64_t version)
{
    const char* sql = "SELECT 1 FROM schema_migrations WHERE version = ?;";
    sqlite3_stmt* stmt = nullptr;
    
    int rc = sqlite3_prepare_v2(db.get().native_handle(), sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK)
    {
        IDREG_LOG_ERROR("Checking migration {} failed: {}", version, sqlite3_errstr(rc));
        return std::unexpected(Errc::StorageUnavailable);
    }
    
    sqlite3_bind_int64(stmt, 1, version);
    
    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    
    if (rc == SQLITE_ROW)
    {
        return true;
    }
    if (rc != SQLITE_DONE)
    {
        IDREG_LOG_ERROR("Checking migration {} failed: {}", version, sqlite3_errstr(rc));
        return std::unexpected(Errc::StorageUnavailable);
    }
    return false;
}

std::expected<size_t, Errc> Migrator::run()
{
    auto done = applied();
    if (!done)
    {
        return std::unexpected(done.error());
    }
    
    size_t count = 0;
    for (const auto& m : pending)
    {
        if (std::ranges::binary_search(*done, m.version))
        {
            continue;
        }
        
        auto txn = UserDB::Transaction::begin(db.get());
        if (!txn)
        {
            return std::unexpected(txn.error());
        }
        // Another connection may have applied it while we waited for the lock.
        auto already = is_applied(m.version);
        if (!already)
        {
            return std::unexpected(already.error());
        }
        if (*already)
        {
            IDREG_LOG_DEBUG("Migration {}_{} already applied elsewhere", m.version, m.name);
            continue;
        }
        if (auto res = db.get().exec(m.sql); !res)
        {
            IDREG_LOG_ERROR("Migration {}_{} failed, rolled back", m.version, m.name);
            return std::unexpected(res.error());
        }
        if (auto res = record(m); !res)
        {
            return std::unexpected(res.error());
        }
        if (auto res = txn->commit(); !res)
        {
            return std::unexpected(res.error());
        }
        
        IDREG_LOG_INFO("Applied migration {}_{}", m.version, m.name);
        ++count;
    }
    return count;
}

} // namespace idreg
