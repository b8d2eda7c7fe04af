#pragma once

#include "idreg/identity_registry.hpp"
#include <cstddef>
#include <istream>

namespace idreg
{

struct ImportStats
{
    size_t seen = 0;
    size_t imported = 0;
};

// Registers one display name per line, without an external id. Blank lines
// are skipped and a trailing '\r' is dropped; a line that fails to register
// is logged and the import carries on.
[[nodiscard]] ImportStats import_legacy(IdentityRegistry& reg, std::istream& in);

} // namespace idreg
