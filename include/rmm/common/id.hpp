#pragma once

#include <cstdint>
#include <string>

namespace rmm::common {

/// Random RFC 4122 version 4 identifier, e.g. "3f2b...-4...".
[[nodiscard]] std::string generate_uuid();

/// 64 bits from the OpenSSL CSPRNG, for seeding per-component generators.
[[nodiscard]] std::uint64_t random_seed();

/// Milliseconds since the Unix epoch.
[[nodiscard]] std::int64_t now_ms();

} // namespace rmm::common
