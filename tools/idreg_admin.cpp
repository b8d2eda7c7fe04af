#include "idreg/config.hpp"
#include "idreg/identity_registry.hpp"
#include "idreg/json_utils.hpp"
#include "idreg/legacy_import.hpp"
#include "idreg/logger.hpp"
#include "idreg/migrator.hpp"
#include "idreg/threadpool.hpp"

#include <charconv>
#include <cstdlib>
#include <fstream>
#include <optional>
#include <print>
#include <string>
#include <string_view>
#include <vector>

using idreg::Errc;
using idreg::IdentityRegistry;
using idreg::UserRecord;

namespace {

bool json_output = false;

void print_usage(const char* prog)
{
    std::println("Usage: {} [--db <path>] [--json] <command> [args]", prog);
    std::println("Commands:");
    std::println("  register <display_name> [external_id]  Register a new user");
    std::println("  show <id>                              Look up by registry id");
    std::println("  find <external_id>                     Look up by external id");
    std::println("  lookup <external_id> <display_name>    Look up by external id, then by name");
    std::println("  count                                  Number of registered users");
    std::println("  names                                  Display names in registration order");
    std::println("  import <file>                          Register one display name per line");
    std::println("  migrate                                Apply pending schema migrations");
    std::println("Config file: $IDREG_CONFIG or idreg_config.json");
}

void print_record(const UserRecord& rec)
{
    if (json_output)
    {
        std::println("{}", idreg::json_utils::serialize(rec));
    }
    else
    {
        std::println("{}", rec);
    }
}

int report(const std::expected<UserRecord, Errc>& res)
{
    if (!res)
    {
        std::println(stderr, "Error: {}", res.error());
        return 1;
    }
    print_record(*res);
    return 0;
}

int cmd_register(IdentityRegistry& reg, std::string_view name, std::optional<std::string_view> ext)
{
    std::optional<std::string> external_id;
    if (ext)
    {
        external_id = std::string(*ext);
    }
    return report(reg.register_user(std::move(external_id), std::string(name)));
}

int cmd_show(IdentityRegistry& reg, std::string_view arg)
{
    int64_t id = 0;
    if (auto [ptr, ec] = std::from_chars(arg.data(), arg.data() + arg.size(), id);
        ec != std::errc{} || ptr != arg.data() + arg.size())
    {
        std::println(stderr, "Invalid id '{}'", arg);
        return 1;
    }
    return report(reg.find_by_id(id));
}

int cmd_count(IdentityRegistry& reg)
{
    auto count = reg.count();
    if (!count)
    {
        std::println(stderr, "Error: {}", count.error());
        return 1;
    }
    std::println("{}", *count);
    return 0;
}

int cmd_names(IdentityRegistry& reg)
{
    auto names = reg.display_names();
    if (!names)
    {
        std::println(stderr, "Error: {}", names.error());
        return 1;
    }
    for (const auto& n : *names)
    {
        std::println("{}", n);
    }
    return 0;
}

int cmd_import(IdentityRegistry& reg, const std::string& path)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        std::println(stderr, "Failed to open {}", path);
        return 1;
    }

    auto stats = idreg::import_legacy(reg, file);
    std::println("Imported {} of {} names", stats.imported, stats.seen);
    return 0;
}

int cmd_migrate(const idreg::Config::DatabaseCfg& cfg)
{
    auto db = idreg::UserDB::open(cfg);
    if (!db)
    {
        std::println(stderr, "{}", db.error());
        return 1;
    }
    idreg::Migrator migrator(*db);
    auto ran = migrator.run();
    if (!ran)
    {
        std::println(stderr, "Migration failed: {}", ran.error());
        return 1;
    }
    std::println("Applied {} migration(s)", *ran);
    return 0;
}

} // namespace

int main(int argc, char** argv)
{
    std::optional<std::string> cli_db;
    std::vector<std::string_view> args;
    for (int i = 1; i < argc; ++i)
    {
        std::string_view a = argv[i];
        if (a == "--db" && i + 1 < argc)
        {
            cli_db = argv[++i];
        }
        else if (a == "--json")
        {
            json_output = true;
        }
        else
        {
            args.push_back(a);
        }
    }

    if (args.empty())
    {
        print_usage(argv[0]);
        return 1;
    }

    const char* env_cfg = std::getenv("IDREG_CONFIG");
    std::string cfg_path = env_cfg ? env_cfg : "idreg_config.json";
    auto config = idreg::Config::load_or_defaults(cfg_path, cli_db);
    if (!config)
    {
        std::println(stderr, "Invalid config {}: {}", cfg_path, config.error());
        return 1;
    }

    auto log_cfg = config->logging();
    if (auto result = idreg::Logger::init(log_cfg.level, log_cfg.file, log_cfg.max_size_mb, log_cfg.enable_console);
        !result)
    {
        std::println(stderr, "Failed to initialize logger: {}", result.error());
        return 1;
    }

    const auto& cmd = args[0];
    if (cmd == "migrate" && args.size() == 1)
    {
        int rc = cmd_migrate(config->database());
        idreg::Logger::shutdown();
        return rc;
    }

    idreg::ThreadPool writer(1);

    auto reg_res = IdentityRegistry::create(config->database(), writer);
    if (!reg_res)
    {
        std::println(stderr, "Failed to open registry: {}", reg_res.error());
        idreg::Logger::shutdown();
        return 1;
    }

    auto& reg = **reg_res;
    int rc = 1;

    if (cmd == "register" && (args.size() == 2 || args.size() == 3))
    {
        rc = cmd_register(reg, args[1], args.size() == 3 ? std::optional(args[2]) : std::nullopt);
    }
    else if (cmd == "show" && args.size() == 2)
    {
        rc = cmd_show(reg, args[1]);
    }
    else if (cmd == "find" && args.size() == 2)
    {
        rc = report(reg.find_by_external_id(args[1]));
    }
    else if (cmd == "lookup" && args.size() == 3)
    {
        rc = report(reg.find_by_identity(args[1], args[2]));
    }
    else if (cmd == "count" && args.size() == 1)
    {
        rc = cmd_count(reg);
    }
    else if (cmd == "names" && args.size() == 1)
    {
        rc = cmd_names(reg);
    }
    else if (cmd == "import" && args.size() == 2)
    {
        rc = cmd_import(reg, std::string(args[1]));
    }
    else
    {
        print_usage(argv[0]);
    }

    idreg::Logger::shutdown();
    return rc;
}
