// SPDX-License-Identifier: MIT OR Apache-2.0
/**
 * @file boot.hpp
 * @brief Entry trampoline: core gating, boot stack, hand-off.
 * @details
 * All four cores start executing _start at the load address. The policy (which core boots) is
 * a pure function of the affinity value so it can be exercised without hardware; start()
 * combines it with the CPU primitives. start() runs before any stack exists, so it is forced
 * inline into _start and only ever uses the primitives' registers.
 *
 * @see boot.cpp, cpu.hpp, runtime_init.hpp
 */

#ifndef PIBOOT_BOOT_HPP
#define PIBOOT_BOOT_HPP

#include "cpu.hpp"
#include "bsp/raspberrypi.hpp"
#include <cstdint>

namespace piboot {
namespace boot {

enum class CoreRole { BOOT, SECONDARY };

constexpr CoreRole classify_core(uint64_t affinity) noexcept {
    return (affinity & bsp::CORE_ID_MASK) == bsp::BOOT_CORE_ID ? CoreRole::BOOT : CoreRole::SECONDARY;
}

/**
 * @brief Gates the calling core.
 * @param stack_start Initial stack pointer for the boot core.
 * @param runtime_init Where the boot core continues once it has a stack. Never returns.
 *
 * Secondary cores are parked for good; there is no wake-up protocol.
 */
template <typename Cpu>
[[noreturn]] [[gnu::always_inline]] inline void start(uintptr_t stack_start, cpu::EntryFn runtime_init) {
    if (classify_core(Cpu::read_core_affinity()) == CoreRole::BOOT) {
        Cpu::set_stack_pointer(stack_start);
        Cpu::branch_to(runtime_init);
    }
    cpu::wait_forever<Cpu>();
}

} // namespace boot
} // namespace piboot

#endif // PIBOOT_BOOT_HPP
