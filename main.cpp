// SPDX-License-Identifier: MIT OR Apache-2.0
/**
 * @file main.cpp
 * @brief Kernel logic for piboot.
 * @details
 * Reached once, on the boot core, after the runtime initializer has cleared the BSS. There is
 * nothing to run yet beyond proving the boot path: announce the board and the cleared region,
 * then stop through the panic handler.
 *
 * @see piboot.hpp, runtime_init.hpp, panic.hpp
 */

#include "piboot.hpp"
#include "console.hpp"
#include "panic.hpp"
#include "runtime_init.hpp"
#include "bsp/raspberrypi.hpp"

namespace piboot {

extern "C" void kernel_main() {
    console::Write& con = bsp::console();
    console::kprintf(con, "%s %s kernel booted on core %llu\n", LOG_TAG, bsp::BOARD_NAME,
                     static_cast<unsigned long long>(bsp::BOOT_CORE_ID));

    memory::Region bss = runtime::bss_region();
    console::kprintf(con, "%s BSS cleared: %p - %p (%llu bytes)\n", LOG_TAG,
                     reinterpret_cast<void*>(bss.start), reinterpret_cast<void*>(bss.end),
                     static_cast<unsigned long long>(bss.size()));

    PIBOOT_PANIC("Stopping here.");
}

} // namespace piboot
