#pragma once

#include "idreg/config.hpp"
#include "idreg/errc.hpp"
#include "idreg/threadpool.hpp"
#include "idreg/user_db.hpp"
#include "idreg/user_record.hpp"
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace idreg
{

/**
 * Owns the users table and enforces its identity invariants.
 *
 * Every insert runs on `writer` under an exclusive lock and inside an
 * IMMEDIATE transaction, so the uniqueness checks and the insert form one
 * atomic unit. Lookups share the lock and never see a half-finished insert.
 */
class IdentityRegistry
{
    struct Token
    {
        explicit Token() = default;
    };

public:
    // Opens the database and applies pending migrations before returning.
    [[nodiscard]] static std::expected<std::unique_ptr<IdentityRegistry>, std::string> create(
        const Config::DatabaseCfg& cfg,
        ThreadPool& writer
    );
    
    // Only reachable through create().
    IdentityRegistry(Token, UserDB db, ThreadPool& writer);
    
    IdentityRegistry(const IdentityRegistry&) = delete;
    IdentityRegistry& operator=(const IdentityRegistry&) = delete;
    
    [[nodiscard]] std::expected<UserRecord, Errc> register_user(std::optional<std::string> external_id,
                                                                std::string display_name);
    
    [[nodiscard]] std::expected<UserRecord, Errc> find_by_id(int64_t id) const;
    [[nodiscard]] std::expected<UserRecord, Errc> find_by_external_id(std::string_view external_id) const;
    [[nodiscard]] std::expected<UserRecord, Errc> find_by_display_name(std::string_view display_name) const;
    
    // External id wins; the display name is only consulted when no record
    // carries that external id.
    [[nodiscard]] std::expected<UserRecord, Errc> find_by_identity(std::string_view external_id,
                                                                   std::string_view display_name) const;
    
    [[nodiscard]] std::expected<int64_t, Errc> count() const;
    [[nodiscard]] std::expected<std::vector<std::string>, Errc> display_names() const;

private:
    [[nodiscard]] std::expected<UserRecord, Errc> insert_atomic(const std::optional<std::string>& external_id,
                                                                const std::string& display_name);
    
    mutable UserDB user_db;
    mutable std::shared_mutex mtx;
    std::reference_wrapper<ThreadPool> writer;
};

} // namespace idreg
