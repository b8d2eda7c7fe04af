#pragma once

#include "idreg/errc.hpp"
#include "idreg/user_db.hpp"
#include <cstdint>
#include <expected>
#include <functional>
#include <span>
#include <string_view>
#include <vector>

namespace idreg
{

struct Migration
{
    int64_t version;
    std::string_view name;
    std::string_view sql;
};

/**
 * Applies schema migrations in version order, each in its own transaction.
 * Applied versions are recorded in `schema_migrations`, so running again
 * against an up-to-date database is a no-op.
 */
class Migrator
{
public:
    explicit Migrator(UserDB& db, std::span<const Migration> migrations = builtin());

    [[nodiscard]] std::expected<size_t, Errc> run();
    [[nodiscard]] std::expected<std::vector<int64_t>, Errc> applied();

    [[nodiscard]] static std::span<const Migration> builtin();

private:
    [[nodiscard]] std::expected<void, Errc> ensure_bookkeeping();
    [[nodiscard]] std::expected<void, Errc> record(const Migration& m);
    [[nodiscard]] std::expected<bool, Errc> is_applied(int64_t version);

    std::reference_wrapper<UserDB> db;
    std::vector<Migration> pending;
};

} // namespace idreg
