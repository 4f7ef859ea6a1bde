// SPDX-License-Identifier: MIT OR Apache-2.0
/**
 * @file panic.hpp
 * @brief Last-resort fault handler.
 * @details
 * Reports what is known about the fault through the console, then parks the core exactly like a
 * secondary core. A panic raised while a report is already being written skips straight to the
 * halt loop instead of recursing.
 *
 * @see panic.cpp, console.hpp
 */

#ifndef PIBOOT_PANIC_HPP
#define PIBOOT_PANIC_HPP

#include "cpu.hpp"
#include "console.hpp"
#include "bsp/raspberrypi.hpp"
#include <cstdint>

namespace piboot {
namespace panic {

inline constexpr const char* HEADER = "\n*** KERNEL PANIC ***\n";

struct PanicRecord {
    const char* file = nullptr;
    int line = 0;
    const char* message = nullptr;
};

/// Writes the panic report for @p record. Allocation-free; formats through the stack only.
void report(console::Write& out, const PanicRecord& record, uint32_t core_id) noexcept;

/**
 * @brief Masks interrupts, reports once, parks.
 * @param in_progress Latch shared by every panic on this core; set on the first report.
 */
template <typename Cpu>
[[noreturn]] void handle(console::Write& out, const PanicRecord& record, bool& in_progress) {
    Cpu::mask_interrupts();
    if (!in_progress) {
        in_progress = true;
        report(out, record, static_cast<uint32_t>(Cpu::read_core_affinity() & bsp::CORE_ID_MASK));
    }
    cpu::wait_forever<Cpu>();
}

/// Kernel panic entry: board console, AArch64 primitives. Kernel image only.
[[noreturn]] void panic(const char* file, int line, const char* message);

} // namespace panic
} // namespace piboot

#define PIBOOT_PANIC(msg) ::piboot::panic::panic(__FILE__, __LINE__, (msg))

#endif // PIBOOT_PANIC_HPP
