#pragma once

#include <cstdint>
#include <vector>

#if defined(_MSC_VER) && !defined(__clang__)
    #include <intrin.h>
#endif

namespace ptrie {

// Constants shared by both tries: 5-bit fragments, 32-way fan-out
constexpr uint32_t BITS = 5;
constexpr uint32_t BRANCH = 1 << BITS;     // 32
constexpr uint32_t MASK = BRANCH - 1;      // 0b11111
constexpr uint32_t HASH_WIDTH = 32;        // bits in a key hash

// Utility functions for popcount (bit counting)
#if defined(__GNUC__) || defined(__clang__)
    inline uint32_t popcount(uint32_t x) {
        return __builtin_popcount(x);  // Compiler intrinsic
    }
#elif defined(_MSC_VER)
    inline uint32_t popcount(uint32_t x) {
        return __popcnt(x);  // POPCNT instruction
    }
#else
    // Fallback implementation
    inline uint32_t popcount(uint32_t x) {
        x = x - ((x >> 1) & 0x55555555);
        x = (x & 0x33333333) + ((x >> 2) & 0x33333333);
        return (((x + (x >> 4)) & 0x0F0F0F0F) * 0x01010101) >> 24;
    }
#endif

// Single-bit mask for a slot (0..31)
inline uint32_t bit(uint32_t slot) {
    return 1u << slot;
}

// Dense array position of `slot` in a bitmap-indexed node
inline uint32_t rank(uint32_t mask, uint32_t slot) {
    return popcount(mask & (bit(slot) - 1));
}

// 5-bit slice of `hash` consumed at trie level `shift`
inline uint32_t fragment(uint32_t hash, uint32_t shift) {
    return shift < HASH_WIDTH ? (hash >> shift) & MASK : 0;
}

// Reverse of rank(): slot number of the `denseIndex`-th set bit.
// Returns BRANCH when mask has fewer than denseIndex + 1 bits set.
uint32_t slotAt(uint32_t mask, uint32_t denseIndex);

// Set slot numbers of `mask`, ascending
std::vector<uint32_t> setSlots(uint32_t mask);

} // namespace ptrie
