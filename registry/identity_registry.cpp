#include "idreg/identity_registry.hpp"
#include "idreg/logger.hpp"
#include "idreg/migrator.hpp"

#include <format>
#include <memory>
#include <mutex>

namespace idreg
{

std::expected<std::unique_ptr<IdentityRegistry>, std::string> IdentityRegistry::create(
    const Config::DatabaseCfg& cfg,
    ThreadPool& writer
)
{
    auto db_result = UserDB::open(cfg);
    if (!db_result)
    {
        return std::unexpected(db_result.error());
    }
    
    Migrator migrator(*db_result);
    if (auto ran = migrator.run(); !ran)
    {
        return std::unexpected(std::format("Migrating {} failed: {}", cfg.path, ran.error()));
    }
    else if (*ran > 0)
    {
        IDREG_LOG_INFO("Applied {} migration(s) to {}", *ran, cfg.path);
    }
    
    return std::make_unique<IdentityRegistry>(Token{}, std::move(*db_result), writer);
}

IdentityRegistry::IdentityRegistry(Token, UserDB db, ThreadPool& tp)
    : user_db(std::move(db))
    , writer(tp)
{
}

std::expected<UserRecord, Errc> IdentityRegistry::register_user(std::optional<std::string> external_id,
                                                                 std::string display_name)
{
    if (display_name.empty())
    {
        IDREG_LOG_WARN("Rejected registration: display name is empty");
        return std::unexpected(Errc::InvalidInput);
    }
    
    auto res = writer.get().submit([&] { return insert_atomic(external_id, display_name); });
    if (!res)
    {
        IDREG_LOG_ERROR("Writer unavailable for '{}': {}", display_name, res.error());
        return std::unexpected(Errc::StorageUnavailable);
    }
    return std::move(*res);
}

std::expected<UserRecord, Errc> IdentityRegistry::insert_atomic(const std::optional<std::string>& external_id,
                                                                const std::string& display_name)
{
    std::unique_lock lock(mtx);
    
    auto txn = UserDB::Transaction::begin(user_db);
    if (!txn)
    {
        return std::unexpected(txn.error());
    }
    
    if (external_id)
    {
        auto taken = user_db.external_id_taken(*external_id);
        if (!taken)
        {
            return std::unexpected(taken.error());
        }
        if (*taken)
        {
            IDREG_LOG_WARN("Rejected registration of '{}': external id {} already registered",
                           display_name, *external_id);
            return std::unexpected(Errc::DuplicateExternalId);
        }
    }
    
    auto pair_taken = user_db.identity_pair_taken(external_id, display_name);
    if (!pair_taken)
    {
        return std::unexpected(pair_taken.error());
    }
    if (*pair_taken)
    {
        IDREG_LOG_WARN("Rejected registration of '{}': identity pair already registered", display_name);
        return std::unexpected(Errc::DuplicateIdentityPair);
    }
    
    auto id = user_db.insert_user(external_id, display_name);
    if (!id)
    {
        return std::unexpected(id.error());
    }
    
    auto rec = user_db.find_by_id(*id);
    if (!rec)
    {
        // The row was inserted a moment ago inside this transaction.
        IDREG_LOG_ERROR("Newly-created user {} could not be read back: {}", *id, rec.error());
        return std::unexpected(Errc::StorageUnavailable);
    }
    
    if (auto res = txn->commit(); !res)
    {
        return std::unexpected(res.error());
    }
    
    IDREG_LOG_INFO("Registered user {} '{}' (external id {})", rec->id, rec->display_name,
                   rec->external_id.value_or("none"));
    return rec;
}

std::expected<UserRecord, Errc> IdentityRegistry::find_by_id(int64_t id) const
{
    std::shared_lock lock(mtx);
    IDREG_LOG_DEBUG("Lookup by id {}", id);
    return user_db.find_by_id(id);
}

std::expected<UserRecord, Errc> IdentityRegistry::find_by_external_id(std::string_view external_id) const
{
    std::shared_lock lock(mtx);
    IDREG_LOG_DEBUG("Lookup by external id {}", external_id);
    return user_db.find_by_external_id(external_id);
}

std::expected<UserRecord, Errc> IdentityRegistry::find_by_display_name(std::string_view display_name) const
{
    std::shared_lock lock(mtx);
    IDREG_LOG_DEBUG("Lookup by display name '{}'", display_name);
    return user_db.find_by_display_name(display_name);
}

std::expected<UserRecord, Errc> IdentityRegistry::find_by_identity(std::string_view external_id,
                                                                   std::string_view display_name) const
{
    std::shared_lock lock(mtx);
    IDREG_LOG_DEBUG("Lookup by identity {} / '{}'", external_id, display_name);
    auto rec = user_db.find_by_external_id(external_id);
    if (rec || rec.error() != Errc::NotFound)
    {
        return rec;
    }
    return user_db.find_by_display_name(display_name);
}

std::expected<int64_t, Errc> IdentityRegistry::count() const
{
    std::shared_lock lock(mtx);
    return user_db.count_users();
}

std::expected<std::vector<std::string>, Errc> IdentityRegistry::display_names() const
{
    std::shared_lock lock(mtx);
    return user_db.list_display_names();
}

} // namespace idreg
