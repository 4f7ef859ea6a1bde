// SPDX-License-Identifier: MIT OR Apache-2.0
/**
 * @file cpu_aarch64.hpp
 * @brief AArch64 CPU primitives.
 * @details
 * One instruction per function. These run before the boot core has a stack, so every one is
 * forced inline and touches nothing but the registers named in its asm operands.
 * Only included by kernel-image sources.
 *
 * @see cpu.hpp
 */

#ifndef PIBOOT_CPU_AARCH64_HPP
#define PIBOOT_CPU_AARCH64_HPP

#include "cpu.hpp"
#include <cstdint>

namespace piboot {
namespace cpu {

struct Aarch64 {
    /// MPIDR_EL1: multiprocessor affinity. Aff0 (bits [7:0]) identifies the core in its cluster.
    [[gnu::always_inline]] static inline uint64_t read_core_affinity() {
        uint64_t v;
        asm volatile("mrs %0, mpidr_el1" : "=r"(v));
        return v;
    }

    [[gnu::always_inline]] static inline void set_stack_pointer(uintptr_t addr) {
        asm volatile("mov sp, %0" : : "r"(addr) : "memory");
    }

    /// Low-power wait until an event is signalled. Does not loop; see cpu::wait_forever().
    [[gnu::always_inline]] static inline void wait_for_event() {
        asm volatile("wfe" ::: "memory");
    }

    /// Masks debug, SError, IRQ and FIQ on this core.
    [[gnu::always_inline]] static inline void mask_interrupts() {
        asm volatile("msr daifset, #0xf" ::: "memory");
    }

    /// Plain branch: no link register write and no frame, so it is usable right after SP is set.
    [[noreturn]] [[gnu::always_inline]] static inline void branch_to(EntryFn target) {
        asm volatile("br %0" : : "r"(target) : "memory");
        __builtin_unreachable();
    }
};

} // namespace cpu
} // namespace piboot

#endif // PIBOOT_CPU_AARCH64_HPP
