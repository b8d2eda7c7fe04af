#pragma once

#include <boost/json.hpp>
#include <string>
#include <expected>
#include <optional>
#include <cstdint>
#include <chrono>

namespace json = boost::json;

namespace idreg
{

/**
 * Registry configuration loaded from JSON file.
 * Load-once at startup, immutable thereafter.
 */
class Config
{
public:
    struct DatabaseCfg
    {
        std::string path = "idreg.db";
        std::string journal_mode = "WAL";
        std::chrono::milliseconds busy_timeout{5000};
    };

    struct LoggingCfg
    {
        std::string level = "info";
        std::string file = "";
        size_t max_size_mb = 100;
        bool enable_console = true;
    };

    [[nodiscard]] static std::expected<Config, std::string> load(const std::string& filepath, std::optional<std::string> cli_db_path = std::nullopt);
    [[nodiscard]] static Config load_defaults(std::optional<std::string> cli_db_path = std::nullopt);
    [[nodiscard]] static std::expected<Config, std::string> load_or_defaults(const std::string& filepath, std::optional<std::string> cli_db_path = std::nullopt);

    [[nodiscard]] const DatabaseCfg& database() const { return db; }
    [[nodiscard]] const LoggingCfg& logging() const { return log; }

private:
    DatabaseCfg db;
    LoggingCfg log;

    [[nodiscard]] static std::expected<Config, std::string> parse(const json::value& jv);
};

} // namespace idreg
