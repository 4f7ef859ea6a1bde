// SPDX-License-Identifier: MIT OR Apache-2.0
/**
 * @file console.hpp
 * @brief Console capability consumed by kernel logic and the panic handler.
 * @details
 * The boot core only needs "write text". The concrete device lives in the board support
 * package (bsp::QemuOutput); this header describes the capability and a printf-style helper
 * on top of it. Nothing here allocates.
 *
 * @see console.cpp, bsp/raspberrypi.hpp
 */

#ifndef PIBOOT_CONSOLE_HPP
#define PIBOOT_CONSOLE_HPP

#include <cstddef>

namespace piboot {
namespace console {

/// Size of the stack buffer kprintf formats into. Longer output is truncated.
constexpr size_t KPRINTF_BUFFER_SIZE = 256;

/// Never deleted through a base pointer, so the destructor is not virtual. That keeps the board
/// console trivially destructible: no atexit registration for its static instance.
struct Write {
    virtual void write_char(char c) = 0;
    /// Writes a NUL-terminated string. A null pointer writes nothing.
    virtual void write_str(const char* str) = 0;
    /// Number of characters emitted so far, including any line-ending translation.
    virtual size_t chars_written() const = 0;

protected:
    ~Write() = default;
};

/**
 * @brief Formats with util::k_vsnprintf and writes the result to @p out.
 * @return Number of characters formatted (after truncation).
 */
int kprintf(Write& out, const char* format, ...) noexcept __attribute__((format(printf, 2, 3)));

} // namespace console
} // namespace piboot

#endif // PIBOOT_CONSOLE_HPP
