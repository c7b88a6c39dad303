#pragma once

#include <dv_alm/core/result.hpp>

#include <string>

namespace dv_alm {

// Random (version 4) UUID in lowercase 8-4-4-4-12 form, drawn from the
// OpenSSL CSPRNG. Err with category Internal when the RNG is not seeded.
[[nodiscard]] Result<std::string, Error> NewUuid();

} // namespace dv_alm
