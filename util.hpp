// SPDX-License-Identifier: MIT OR Apache-2.0
/**
 * @file util.hpp
 * @brief Freestanding string and formatting helpers for piboot.
 * @details
 * Used by the console and the panic handler before anything resembling a C library exists.
 * Everything here works on caller-provided buffers and never allocates.
 */

#ifndef PIBOOT_UTIL_HPP
#define PIBOOT_UTIL_HPP

#include <cstddef>
#include <cstdint>
#include <cstdarg>

namespace piboot {
namespace util {

/// Length of @p str; 0 for a null pointer.
inline size_t kstrlen(const char* str) noexcept {
    if (!str) return 0;
    size_t len = 0;
    while (str[len] != '\0') len++;
    return len;
}

// Number to string conversion. Return the length written, or -1 if the buffer is too small.
int int_to_str(int64_t value, char* buffer, size_t buffer_size, int base = 10) noexcept;
int uint64_to_str(uint64_t value, char* buffer, size_t buffer_size, int base = 10) noexcept;
int uint64_to_hex_str(uint64_t value, char* buffer, size_t buffer_size, bool leading_0x = true) noexcept;

/**
 * @brief Minimal vsnprintf: %s %c %d %i %u %x %X %p %%, with the ll length modifier.
 * @return Characters stored, excluding the terminator. Output is always NUL-terminated
 *         when @p bufsz is non-zero.
 */
int k_vsnprintf(char* buffer, size_t bufsz, const char* format, va_list args) noexcept;
int k_snprintf(char* buffer, size_t bufsz, const char* format, ...) noexcept __attribute__((format(printf, 3, 4)));

} // namespace util
} // namespace piboot

#endif // PIBOOT_UTIL_HPP
