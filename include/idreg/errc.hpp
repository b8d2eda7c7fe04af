#pragma once

#include <cstdint>
#include <format>
#include <string_view>

namespace idreg
{

enum class Errc : uint8_t
{
    InvalidInput,
    DuplicateExternalId,
    DuplicateIdentityPair,
    NotFound,
    StorageUnavailable,
};

[[nodiscard]] constexpr std::string_view to_string(Errc e) noexcept
{
    switch (e)
    {
        case Errc::InvalidInput:          return "invalid input";
        case Errc::DuplicateExternalId:   return "duplicate external id";
        case Errc::DuplicateIdentityPair: return "duplicate identity pair";
        case Errc::NotFound:              return "not found";
        case Errc::StorageUnavailable:    return "storage unavailable";
    }
    return "unknown";
}

// Only infrastructure failures are worth retrying; the rest are deterministic.
[[nodiscard]] constexpr bool is_retryable(Errc e) noexcept
{
    return e == Errc::StorageUnavailable;
}

} // namespace idreg

template<>
struct std::formatter<idreg::Errc> : std::formatter<std::string_view>
{
    auto format(idreg::Errc e, std::format_context& fc) const
    {
        return std::formatter<std::string_view>::format(idreg::to_string(e), fc);
    }
};
