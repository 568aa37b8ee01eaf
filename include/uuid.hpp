#pragma once

#include <cstdint>
#include <cstdio>
#include <random>
#include <string>

namespace mgen {

// Version 4 UUID string drawn from `rng`.
inline std::string RandomUuid(std::mt19937_64& rng) {
    uint64_t hi = rng();
    uint64_t lo = rng();
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;  // version 4
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;  // RFC 4122 variant

    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
                  static_cast<unsigned>(hi >> 32),
                  static_cast<unsigned>((hi >> 16) & 0xFFFF),
                  static_cast<unsigned>(hi & 0xFFFF),
                  static_cast<unsigned>(lo >> 48),
                  static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
    return std::string(buf);
}

// UUID from a randomly seeded per-thread engine.
inline std::string RandomUuid() {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    return RandomUuid(rng);
}

} // namespace mgen
