// SPDX-License-Identifier: MIT OR Apache-2.0
/**
 * @file freestanding_stubs.cpp
 * @brief memcpy/memset for the kernel image.
 * @details
 * GCC lowers struct copies and zero-initialised aggregates on the stack to calls to these two
 * even with -ffreestanding. Nothing else in the image relies on the C library.
 * @note Built with -fno-tree-loop-distribute-patterns (GCC) so these loops are not themselves
 *       turned back into calls to memset/memcpy.
 */

#include <cstddef>

extern "C" {

void* memcpy(void* dest, const void* src, size_t count) {
    auto* d = static_cast<unsigned char*>(dest);
    const auto* s = static_cast<const unsigned char*>(src);
    while (count--) *d++ = *s++;
    return dest;
}

void* memset(void* dest, int value, size_t count) {
    auto* d = static_cast<unsigned char*>(dest);
    const auto byte = static_cast<unsigned char>(value);
    while (count--) *d++ = byte;
    return dest;
}

} // extern "C"
