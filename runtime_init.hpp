// SPDX-License-Identifier: MIT OR Apache-2.0
/**
 * @file runtime_init.hpp
 * @brief Runtime initializer: clears the BSS, then enters the kernel.
 * @details
 * First code on the boot core that runs with a stack. It has no console yet in any useful sense
 * and no way to report errors, so a malformed region simply clears nothing.
 *
 * @see runtime_init.cpp, memory.hpp, boot.hpp
 */

#ifndef PIBOOT_RUNTIME_INIT_HPP
#define PIBOOT_RUNTIME_INIT_HPP

#include "cpu.hpp"
#include "memory.hpp"

namespace piboot {
namespace runtime {

/**
 * @brief Zeroes @p bss exactly once, then calls @p kernel_entry exactly once.
 * @details kernel_entry is not expected to return. If it does, the core parks.
 */
template <typename Cpu, typename Entry>
[[noreturn]] void run(memory::Region bss, Entry kernel_entry) {
    memory::zero_region(bss);
    kernel_entry();
    cpu::wait_forever<Cpu>();
}

/// .bss bounds from kernel.ld. Kernel image only.
memory::Region bss_region() noexcept;

/// Boot core hand-off target of _start. Kernel image only.
[[noreturn]] void runtime_init();

} // namespace runtime
} // namespace piboot

#endif // PIBOOT_RUNTIME_INIT_HPP
