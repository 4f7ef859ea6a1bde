// SPDX-License-Identifier: MIT OR Apache-2.0
/**
 * @file raspberrypi.cpp
 * @brief Raspberry Pi board console instance.
 */

#include "raspberrypi.hpp"

namespace piboot {
namespace bsp {

namespace {
// Constant-initialised (vtable pointer included) and trivially destructible, so no constructor
// has to run and nothing is registered with atexit.
constinit QemuOutput g_qemu_output;
}

console::Write& console() { return g_qemu_output; }

} // namespace bsp
} // namespace piboot
