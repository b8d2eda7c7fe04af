#pragma once

#include <chrono>
#include <cstdint>
#include <format>
#include <optional>
#include <string>

namespace idreg
{

struct UserRecord
{
    int64_t id = 0;
    std::optional<std::string> external_id;
    std::string display_name;
    std::chrono::sys_seconds created_at{};
};

} // namespace idreg

template<>
struct std::formatter<idreg::UserRecord>
{
    constexpr auto parse(std::format_parse_context& fpc)
    {
        return fpc.begin();
    }

    auto format(const idreg::UserRecord& r, std::format_context& fc) const
    {
        return std::format_to(fc.out(), "#{} {} [{}] created {:%F %T}",
                              r.id, r.display_name, r.external_id.value_or("-"), r.created_at);
    }
};
