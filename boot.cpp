// SPDX-License-Identifier: MIT OR Apache-2.0
/**
 * @file boot.cpp
 * @brief The kernel image's first instruction.
 * @details
 * kernel.ld places .text._start at the load address and asserts _start lands there. No stack
 * exists on entry: the function body is start() inlined, which uses registers only until SP has
 * been set, and then branches (not calls) into the runtime initializer. The image must be built
 * optimised for that to hold; CMakeLists.txt pins -O2 for the kernel.
 */

#include "boot.hpp"
#include "cpu_aarch64.hpp"
#include "runtime_init.hpp"

extern "C" [[noreturn]] [[gnu::used, gnu::section(".text._start")]] void _start() {
    piboot::boot::start<piboot::cpu::Aarch64>(piboot::bsp::BOOT_CORE_STACK_START, piboot::runtime::runtime_init);
}
