// SPDX-License-Identifier: MIT OR Apache-2.0
/**
 * @file memory.cpp
 * @brief Region zeroing.
 */

#include "memory.hpp"

namespace piboot {
namespace memory {

void zero_region(Region region) noexcept {
    if (region.empty()) return;
    uintptr_t current = region.start;
    const uintptr_t end = region.end;

    while (current < end && (current & (sizeof(uint64_t) - 1)) != 0) {
        *reinterpret_cast<volatile uint8_t*>(current) = 0;
        current++;
    }
    while (end - current >= sizeof(uint64_t)) {
        *reinterpret_cast<volatile uint64_t*>(current) = 0;
        current += sizeof(uint64_t);
    }
    while (current < end) {
        *reinterpret_cast<volatile uint8_t*>(current) = 0;
        current++;
    }
}

} // namespace memory
} // namespace piboot
