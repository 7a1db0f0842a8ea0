#pragma once
#include "pile.hpp"
#include <cstddef>
#include <cstdint>
#include <cstring>

namespace compost::det {

inline constexpr uint64_t kFnvOffset = 1469598103934665603ULL;

inline uint64_t fnv1a64(uint64_t h, const void* data, size_t n) {
    const unsigned char* p = static_cast<const unsigned char*>(data);
    for (size_t i = 0; i < n; ++i) { h ^= p[i]; h *= 1099511628211ULL; }
    return h;
}

inline uint64_t u64_le(uint64_t h, uint64_t v) {
    unsigned char b[8] = {
        static_cast<unsigned char>(v & 0xFFu),
        static_cast<unsigned char>((v >> 8) & 0xFFu),
        static_cast<unsigned char>((v >> 16) & 0xFFu),
        static_cast<unsigned char>((v >> 24) & 0xFFu),
        static_cast<unsigned char>((v >> 32) & 0xFFu),
        static_cast<unsigned char>((v >> 40) & 0xFFu),
        static_cast<unsigned char>((v >> 48) & 0xFFu),
        static_cast<unsigned char>((v >> 56) & 0xFFu)
    };
    return fnv1a64(h, b, 8);
}

// Bit pattern, so identical runs hash identically and any drift shows.
inline uint64_t f64_le(uint64_t h, double v) {
    uint64_t bits = 0;
    std::memcpy(&bits, &v, sizeof bits);
    return u64_le(h, bits);
}

inline uint64_t checksum(const PileState& s) {
    uint64_t h = kFnvOffset;
    h = f64_le(h, s.startTime);
    h = f64_le(h, s.lastUpdateTime);
    h = f64_le(h, s.lastTurnTime);
    h = f64_le(h, s.decompositionProgress);
    h = u64_le(h, s.isFinished ? 1u : 0u);
    h = f64_le(h, s.moistureLevel);
    h = f64_le(h, s.moistureLastCheck);
    h = f64_le(h, s.aerationLevel);
    h = f64_le(h, s.aerationLastUpdate);
    h = f64_le(h, s.aerationLastTurn);
    h = f64_le(h, s.internalTemperature);
    h = f64_le(h, s.ambientTemperature);
    h = f64_le(h, s.temperatureLastUpdate);
    return h;
}

inline uint64_t checksum(const CompostPile& pile) {
    uint64_t h = checksum(pile.toState());
    const MaterialCounts& m = pile.materials();
    h = u64_le(h, static_cast<uint64_t>(m.green));
    h = u64_le(h, static_cast<uint64_t>(m.brown));
    h = u64_le(h, static_cast<uint64_t>(m.other));
    return h;
}

} // namespace compost::det
