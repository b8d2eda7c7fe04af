#pragma once

#include "idreg/config.hpp"
#include "idreg/errc.hpp"
#include "idreg/user_record.hpp"
#include <sqlite3.h>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace idreg
{

/**
 * Thin owner of one SQLite connection holding the `users` table.
 * Statements are not synchronized here; IdentityRegistry decides who may
 * touch the connection and when.
 */
class UserDB
{
public:
    [[nodiscard]] static std::expected<UserDB, std::string> open(const Config::DatabaseCfg& cfg);
    ~UserDB();
    
    UserDB(const UserDB&) = delete;
    UserDB& operator=(const UserDB&) = delete;
    UserDB(UserDB&& other) noexcept;
    UserDB& operator=(UserDB&& other) noexcept;
    
    // Rolls back on destruction unless commit() succeeded.
    class Transaction
    {
    public:
        [[nodiscard]] static std::expected<Transaction, Errc> begin(UserDB& db);
        ~Transaction();
        
        Transaction(const Transaction&) = delete;
        Transaction& operator=(const Transaction&) = delete;
        Transaction(Transaction&& other) noexcept;
        Transaction& operator=(Transaction&&) = delete;
        
        [[nodiscard]] std::expected<void, Errc> commit();

    private:
        explicit Transaction(UserDB& db);
        UserDB* owner;
    };
    
    [[nodiscard]] std::expected<void, Errc> exec(std::string_view sql);
    
    [[nodiscard]] std::expected<int64_t, Errc> insert_user(const std::optional<std::string>& external_id,
                                                           std::string_view display_name);
    [[nodiscard]] std::expected<UserRecord, Errc> find_by_id(int64_t id);
    [[nodiscard]] std::expected<UserRecord, Errc> find_by_external_id(std::string_view external_id);
    [[nodiscard]] std::expected<UserRecord, Errc> find_by_display_name(std::string_view display_name);
    
    [[nodiscard]] std::expected<bool, Errc> external_id_taken(std::string_view external_id);
    [[nodiscard]] std::expected<bool, Errc> identity_pair_taken(const std::optional<std::string>& external_id,
                                                                std::string_view display_name);
    
    [[nodiscard]] std::expected<int64_t, Errc> count_users();
    [[nodiscard]] std::expected<std::vector<std::string>, Errc> list_display_names();
    
    [[nodiscard]] sqlite3* native_handle() const { return db; }
    [[nodiscard]] std::string last_error() const;

private:
    explicit UserDB(sqlite3* db);
    
    [[nodiscard]] std::expected<UserRecord, Errc> find_one(const char* sql, std::string_view key);
    [[nodiscard]] static Errc storage_error(std::string_view what, int rc);
    
    sqlite3* db;
};

} // namespace idreg
