#include "bit_index.hpp"

namespace ptrie {

uint32_t slotAt(uint32_t mask, uint32_t denseIndex) {
    // Drop the lowest set bit denseIndex times, then locate the next one
    for (uint32_t i = 0; i < denseIndex && mask != 0; ++i) {
        mask &= mask - 1;
    }
    if (mask == 0) {
        return BRANCH;
    }
    return popcount((mask & (~mask + 1)) - 1);
}

std::vector<uint32_t> setSlots(uint32_t mask) {
    std::vector<uint32_t> slots;
    slots.reserve(popcount(mask));
    while (mask != 0) {
        uint32_t lowest = mask & (~mask + 1);
        slots.push_back(popcount(lowest - 1));
        mask &= mask - 1;
    }
    return slots;
}

} // namespace ptrie
