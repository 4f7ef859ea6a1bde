// SPDX-License-Identifier: MIT OR Apache-2.0
/**
 * @file memory.hpp
 * @brief Address ranges and the zero-initialised (BSS) region.
 * @details
 * The BSS bounds come from kernel.ld. Until the runtime initializer has cleared it, nothing may
 * read a zero-initialised object; the region is handed to runtime::run() which is its only
 * user during that phase.
 *
 * @see memory.cpp, runtime_init.hpp
 */

#ifndef PIBOOT_MEMORY_HPP
#define PIBOOT_MEMORY_HPP

#include <cstdint>
#include <cstddef>

namespace piboot {
namespace memory {

/// Half-open address range [start, end). start > end is treated as empty.
struct Region {
    uintptr_t start = 0;
    uintptr_t end = 0;

    constexpr bool empty() const noexcept { return end <= start; }
    constexpr size_t size() const noexcept { return empty() ? 0 : static_cast<size_t>(end - start); }
    constexpr bool contains(uintptr_t addr) const noexcept { return addr >= start && addr < end; }

    static Region from(const void* first, const void* last) noexcept {
        return Region{reinterpret_cast<uintptr_t>(first), reinterpret_cast<uintptr_t>(last)};
    }
};

/**
 * @brief Stores zero to every byte of @p region.
 * @details 64-bit stores for the aligned body, byte stores for the unaligned head and tail. All
 *          stores are volatile so the loop is neither elided nor turned into a memset call.
 *          An empty or malformed region is left alone.
 */
void zero_region(Region region) noexcept;

} // namespace memory
} // namespace piboot

#endif // PIBOOT_MEMORY_HPP
