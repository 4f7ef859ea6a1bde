// SPDX-License-Identifier: MIT OR Apache-2.0
/**
 * @file kernel_globals.cpp
 * @brief Kernel-wide state and the kernel panic entry point.
 * @details
 *   - The panic latch (in .bss, so it reads false once the runtime initializer has run).
 *   - panic::panic(), which binds the panic handler to the board console and AArch64.
 */

#include "panic.hpp"
#include "cpu_aarch64.hpp"
#include "bsp/raspberrypi.hpp"

namespace piboot {

// Only the boot core runs kernel code, so a plain flag is enough.
bool g_panic_in_progress = false;

namespace panic {

void panic(const char* file, int line, const char* message) {
    PanicRecord record{file, line, message};
    handle<cpu::Aarch64>(bsp::console(), record, g_panic_in_progress);
}

} // namespace panic
} // namespace piboot
