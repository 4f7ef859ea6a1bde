// SPDX-License-Identifier: MIT OR Apache-2.0
/**
 * @file cpu.hpp
 * @brief Architecture-neutral side of the CPU primitive layer.
 * @details
 * Boot-path code is written against a `Cpu` type with static members, each of which is a single
 * privileged instruction:
 *
 *   static uint64_t read_core_affinity();              // MPIDR_EL1
 *   static void set_stack_pointer(uintptr_t addr);     // SP
 *   static void wait_for_event();                      // WFE
 *   static void mask_interrupts();                     // DAIFSet
 *   [[noreturn]] static void branch_to(void (*)());    // BR, no link, no frame
 *
 * The kernel uses cpu::Aarch64 (cpu_aarch64.hpp). Host tests substitute a recording mock. Since
 * every member is static and inlined there is nothing left of the abstraction in the image.
 *
 * @see cpu_aarch64.hpp
 */

#ifndef PIBOOT_CPU_HPP
#define PIBOOT_CPU_HPP

#include <cstdint>

namespace piboot {
namespace cpu {

/// Signature of the code a core branches into once it has a stack.
using EntryFn = void (*)();

/**
 * @brief Parks the calling core for good.
 * @details wait_for_event() may return on any event (SEV from another core, an interrupt, a
 *          spurious wakeup), so it is re-issued forever.
 */
template <typename Cpu>
[[noreturn]] [[gnu::always_inline]] inline void wait_forever() {
    for (;;) {
        Cpu::wait_for_event();
    }
}

} // namespace cpu
} // namespace piboot

#endif // PIBOOT_CPU_HPP
