// SPDX-License-Identifier: MIT OR Apache-2.0
/**
 * @file piboot.hpp
 * @brief Main internal kernel header for piboot.
 * @details
 * Kernel-wide declarations: the logical entry point reached from the runtime initializer and
 * the tag used on console log lines.
 */

#ifndef PIBOOT_HPP
#define PIBOOT_HPP

namespace piboot {

inline constexpr const char* LOG_TAG = "[piboot]";

/**
 * @brief Kernel logic, entered once on the boot core with a stack and a cleared BSS.
 * @note Never returns; it ends in a panic or runs forever.
 */
extern "C" [[noreturn]] void kernel_main();

} // namespace piboot

#endif // PIBOOT_HPP
