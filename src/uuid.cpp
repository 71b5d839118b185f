#include "mcpguard/uuid.hpp"

#include <cinttypes>
#include <cstdio>
#include <random>

namespace mcpguard {

std::string generate_uuid() {
    thread_local std::mt19937_64 gen{std::random_device{}()};
    std::uniform_int_distribution<uint64_t> dis;
    // Version 4 in the high nibble of the third group, variant 10xx in the fourth.
    const uint64_t hi = (dis(gen) & 0xFFFFFFFFFFFF0FFFull) | 0x0000000000004000ull;
    const uint64_t lo = (dis(gen) & 0x3FFFFFFFFFFFFFFFull) | 0x8000000000000000ull;

    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08" PRIx64 "-%04" PRIx64 "-%04" PRIx64 "-%04" PRIx64 "-%012" PRIx64,
                  hi >> 32, (hi >> 16) & 0xFFFF, hi & 0xFFFF, lo >> 48, lo & 0xFFFFFFFFFFFFull);
    return buf;
}

} // namespace mcpguard
