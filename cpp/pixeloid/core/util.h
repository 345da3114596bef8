#ifndef PIXELOID_CORE_UTIL_H
#define PIXELOID_CORE_UTIL_H

#include <cstdint>
#include <cstddef>
#include <cstring>
#include <cmath>

#ifdef EMSCRIPTEN
#include <emscripten/emscripten.h>
#else
#include <chrono>
// Polyfill for native testing
inline double emscripten_get_now() {
    using namespace std::chrono;
    return duration_cast<duration<double, std::milli>>(system_clock::now().time_since_epoch()).count();
}
#endif

namespace pixeloid {

inline double nowMs() {
    return emscripten_get_now();
}

inline bool isFinite(double v) noexcept {
    return std::isfinite(v);
}

// =============================================================================
// Hash/Digest (FNV-1a)
// =============================================================================

constexpr std::uint64_t kDigestOffset = 14695981039346656037ull;
constexpr std::uint64_t kDigestPrime = 1099511628211ull;

inline std::uint64_t hashU32(std::uint64_t h, std::uint32_t v) {
    h ^= v;
    return h * kDigestPrime;
}

inline std::uint64_t hashBytes(std::uint64_t h, const std::uint8_t* data, std::size_t len) {
    for (std::size_t i = 0; i < len; ++i) {
        h ^= data[i];
        h *= kDigestPrime;
    }
    return h;
}

inline std::uint64_t canonicalizeF64(double v) {
    if (std::isnan(v)) return 0x7ff8000000000000ull;
    if (v == 0.0) return 0u;
    std::uint64_t bits = 0;
    std::memcpy(&bits, &v, sizeof(bits));
    return bits;
}

inline std::uint64_t hashF64(std::uint64_t h, double v) {
    const std::uint64_t bits = canonicalizeF64(v);
    h = hashU32(h, static_cast<std::uint32_t>(bits & 0xffffffffu));
    return hashU32(h, static_cast<std::uint32_t>(bits >> 32));
}

} // namespace pixeloid

#endif // PIXELOID_CORE_UTIL_H
