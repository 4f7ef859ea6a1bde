// SPDX-License-Identifier: MIT OR Apache-2.0
/**
 * @file cpp_runtime_stubs.cpp
 * @brief Minimal C++ ABI support for the freestanding kernel image.
 * @details
 * The image has no heap, no exceptions and no object that needs destroying. The one ABI symbol
 * the compiler still references is the pure-virtual trap in console::Write's vtable.
 */

#include "panic.hpp"

extern "C" [[noreturn]] void __cxa_pure_virtual() {
    PIBOOT_PANIC("pure virtual function call");
}
