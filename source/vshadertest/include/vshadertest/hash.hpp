#pragma once

#include <xxhash.h>

#include <cstdint>
#include <cstdio>
#include <string>
#include <string_view>

namespace vshadertest
{
    inline uint64_t xxhash64(const void* data, size_t len, uint64_t seed = 0) { return XXH64(data, len, seed); }
    inline uint64_t xxhash64(std::string_view s, uint64_t seed = 0) { return XXH64(s.data(), s.size(), seed); }

    inline std::string hash_hex(uint64_t h)
    {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(h));
        return buf;
    }
} // namespace vshadertest
