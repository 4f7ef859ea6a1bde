// SPDX-License-Identifier: MIT OR Apache-2.0
/**
 * @file runtime_init.cpp
 * @brief Kernel-image instantiation of the runtime initializer.
 */

#include "runtime_init.hpp"
#include "cpu_aarch64.hpp"
#include "piboot.hpp"

// Defined by kernel.ld, both 8-byte aligned.
extern "C" char __bss_start[];
extern "C" char __bss_end[];

namespace piboot {
namespace runtime {

memory::Region bss_region() noexcept {
    return memory::Region::from(__bss_start, __bss_end);
}

void runtime_init() {
    run<cpu::Aarch64>(bss_region(), kernel_main);
}

} // namespace runtime
} // namespace piboot
