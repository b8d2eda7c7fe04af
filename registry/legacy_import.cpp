#include "idreg/legacy_import.hpp"
#include "idreg/logger.hpp"

#include <optional>
#include <string>

namespace idreg
{

ImportStats import_legacy(IdentityRegistry& reg, std::istream& in)
{
    ImportStats stats;
    std::string line;
    while (std::getline(in, line))
    {
        if (!line.empty() && line.back() == '\r')
        {
            line.pop_back();
        }
        if (line.empty())
        {
            continue;
        }
        ++stats.seen;
        if (auto res = reg.register_user(std::nullopt, line); res)
        {
            ++stats.imported;
        }
        else
        {
            IDREG_LOG_ERROR("Unable to import legacy user {}: {}", line, res.error());
        }
    }
    IDREG_LOG_INFO("Legacy import registered {} of {} names", stats.imported, stats.seen);
    return stats;
}

} // namespace idreg
