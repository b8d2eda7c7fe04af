#include "idreg/config.hpp"

#include <algorithm>
#include <cctype>
#include <concepts>
#include <array>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <format>
#include <memory>

namespace idreg
{

namespace {

constexpr std::array journal_modes{"WAL", "DELETE", "TRUNCATE", "MEMORY"};
constexpr std::array log_levels{"debug", "info", "warn", "error"};

template<std::unsigned_integral Ty>
std::expected<Ty, std::string> get_uint(const json::object& obj, std::string_view key,
                                        Ty min_val, Ty max_val, Ty default_val)
{
    auto it = obj.find(key);
    if (it == obj.end())
    {
        return default_val;
    }
    if (!it->value().is_int64() && !it->value().is_uint64())
    {
        return std::unexpected(std::format("'{}' must be an integer", key));
    }
    if (it->value().is_int64() && it->value().as_int64() < 0)
    {
        return std::unexpected(std::format("'{}' must be between {} and {}", key, min_val, max_val));
    }
    auto val = it->value().to_number<uint64_t>();
    if (val < static_cast<uint64_t>(min_val) || val > static_cast<uint64_t>(max_val))
    {
        return std::unexpected(std::format("'{}' must be between {} and {}",
                                           key, min_val, max_val));
    }
    return static_cast<Ty>(val);
}

std::expected<std::string, std::string> get_string(const json::object& obj, std::string_view key, std::string_view default_val)
{
    auto it = obj.find(key);
    if (it == obj.end())
    {
        return std::string(default_val);
    }
    if (!it->value().is_string())
    {
        return std::unexpected(std::format("'{}' must be a string", key));
    }
    return std::string(it->value().as_string());
}

std::expected<bool, std::string> get_bool(const json::object& obj, std::string_view key, bool default_val)
{
    auto it = obj.find(key);
    if (it == obj.end())
    {
        return default_val;
    }
    if (!it->value().is_bool())
    {
        return std::unexpected(std::format("'{}' must be a boolean", key));
    }
    return it->value().as_bool();
}

// Absent sections fall back to defaults; present ones must be objects.
std::expected<const json::object*, std::string> get_section(const json::object& root, std::string_view key)
{
    auto it = root.find(key);
    if (it == root.end())
    {
        return nullptr;
    }
    if (!it->value().is_object())
    {
        return std::unexpected(std::format("'{}' must be a JSON object", key));
    }
    return std::addressof(it->value().as_object());
}

} // namespace

std::expected<Config, std::string> Config::load(const std::string& filepath, std::optional<std::string> cli_db_path)
{
    std::ifstream file(filepath);
    if (!file.is_open())
    {
        return std::unexpected(std::format("Failed to open config file: {}", filepath));
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    json::value jv;
    try
    {
        jv = json::parse(buffer.str());
    }
    catch (const std::exception& e)
    {
        return std::unexpected(std::format("JSON parse error: {}", e.what()));
    }
    auto result = parse(jv);
    if (result && cli_db_path.has_value())
    {
        result->db.path = std::move(*cli_db_path);
    }
    return result;
}

Config Config::load_defaults(std::optional<std::string> cli_db_path)
{
    Config cfg{};
    if (cli_db_path.has_value())
    {
        cfg.db.path = std::move(*cli_db_path);
    }
    return cfg;
}

std::expected<Config, std::string> Config::load_or_defaults(const std::string& filepath, std::optional<std::string> cli_db_path)
{
    std::error_code ec;
    if (!std::filesystem::exists(filepath, ec))
    {
        return load_defaults(std::move(cli_db_path));
    }
    return load(filepath, std::move(cli_db_path));
}

std::expected<Config, std::string> Config::parse(const json::value& jv)
{
    if (!jv.is_object())
    {
        return std::unexpected("Config root must be a JSON object");
    }
    const auto& root = jv.as_object();
    Config config;
    auto db_section = get_section(root, "database");
    if (!db_section)
    {
        return std::unexpected(db_section.error());
    }
    if (*db_section)
    {
        const auto& db = **db_section;
        if (auto path = get_string(db, "path", "idreg.db"); path && !path->empty())
        {
            config.db.path = *path;
        }
        else
        {
            return std::unexpected(path ? std::string("'path' must not be empty") : path.error());
        }
        auto mode = get_string(db, "journal_mode", "WAL");
        if (!mode)
        {
            return std::unexpected(mode.error());
        }
        std::ranges::transform(*mode, mode->begin(), [](unsigned char c){ return static_cast<char>(std::toupper(c)); });
        if (std::ranges::find(journal_modes, *mode) == journal_modes.end())
        {
            return std::unexpected("'journal_mode' must be one of WAL, DELETE, TRUNCATE, MEMORY");
        }
        config.db.journal_mode = *mode;
        if (auto busy = get_uint<uint64_t>(db, "busy_timeout_ms", 0, 600000, 5000); busy)
        {
            config.db.busy_timeout = std::chrono::milliseconds(*busy);
        }
        else
        {
            return std::unexpected(busy.error());
        }
    }
    auto log_section = get_section(root, "logging");
    if (!log_section)
    {
        return std::unexpected(log_section.error());
    }
    if (*log_section)
    {
        const auto& log = **log_section;
        auto level = get_string(log, "level", "info");
        if (!level)
        {
            return std::unexpected(level.error());
        }
        std::ranges::transform(*level, level->begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
        if (std::ranges::find(log_levels, *level) == log_levels.end())
        {
            return std::unexpected("'level' must be one of debug, info, warn, error");
        }
        config.log.level = *level;
        if (auto file = get_string(log, "file", ""); file)
        {
            config.log.file = *file;
        }
        else
        {
            return std::unexpected(file.error());
        }
        if (auto max_size = get_uint<size_t>(log, "max_size_mb", 1, 10000, 100); max_size)
        {
            config.log.max_size_mb = *max_size;
        }
        else
        {
            return std::unexpected(max_size.error());
        }
        if (auto console = get_bool(log, "enable_console", true); console)
        {
            config.log.enable_console = *console;
        }
        else
        {
            return std::unexpected(console.error());
        }
    }
    return config;
}

} // namespace idreg
