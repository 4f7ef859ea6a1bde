// SPDX-License-Identifier: MIT OR Apache-2.0
/**
 * @file raspberrypi.hpp
 * @brief Board support for the Raspberry Pi 3 / 4 (and the QEMU raspi3b/raspi4b machines).
 * @details
 * Board constants consumed by the boot path (core gating, stack, load address) and the
 * console used by kernel logic and the panic handler. The board is chosen at configure
 * time with the PIBOOT_BOARD cache variable; rpi4 defines PIBOOT_BOARD_RPI4.
 *
 * @see raspberrypi.cpp, console.hpp, boot.hpp
 */

#ifndef PIBOOT_BSP_RASPBERRYPI_HPP
#define PIBOOT_BSP_RASPBERRYPI_HPP

#include "../console.hpp"
#include <cstdint>
#include <cstddef>

namespace piboot {
namespace bsp {

// Core gating. MPIDR_EL1.Aff0 holds the core number; the four Cortex-A53/A72 cores use bits [1:0].
constexpr uint64_t BOOT_CORE_ID = 0;
constexpr uint64_t CORE_ID_MASK = 0b11;

// The firmware loads kernel8.img at 0x80000. The boot core's stack grows down from there.
constexpr uintptr_t KERNEL_LOAD_ADDRESS = 0x80000;
constexpr uintptr_t BOOT_CORE_STACK_START = KERNEL_LOAD_ADDRESS;

#if defined(PIBOOT_BOARD_RPI4)
constexpr uintptr_t PERIPHERAL_BASE = 0xFE000000;
constexpr const char* BOARD_NAME = "Raspberry Pi 4";
#else
constexpr uintptr_t PERIPHERAL_BASE = 0x3F000000;
constexpr const char* BOARD_NAME = "Raspberry Pi 3";
#endif

// PL011 UART0
constexpr uintptr_t UART_BASE = PERIPHERAL_BASE + 0x201000;
constexpr uint32_t UART_DR_REG = 0x00;

/// Device register access for the kernel image.
struct Mmio {
    static void write32(uintptr_t addr, uint32_t value) {
        *reinterpret_cast<volatile uint32_t*>(addr) = value;
    }
};

/**
 * @brief Console that stores straight into the PL011 data register.
 * @tparam Bus Provides `static void write32(uintptr_t, uint32_t)`; Mmio on the board.
 * @note QEMU needs no UART setup, so nothing is initialised and the FIFO is never polled.
 *       On hardware the firmware's UART configuration is relied on.
 */
template <typename Bus>
class QemuOutputT : public console::Write {
public:
    /// '\n' goes out as "\r\n"; both bytes are counted.
    void write_char(char c) override {
        if (c == '\n') {
            write_data_reg(static_cast<uint32_t>('\r'));
        }
        write_data_reg(static_cast<uint32_t>(static_cast<unsigned char>(c)));
    }

    void write_str(const char* str) override {
        if (!str) return;
        while (*str) write_char(*str++);
    }

    size_t chars_written() const override { return chars_written_; }

private:
    void write_data_reg(uint32_t value) {
        Bus::write32(UART_BASE + UART_DR_REG, value);
        chars_written_++;
    }

    size_t chars_written_ = 0;
};

using QemuOutput = QemuOutputT<Mmio>;

/// Board console. Lives in .data, so it is usable as soon as a stack exists.
console::Write& console();

} // namespace bsp
} // namespace piboot

#endif // PIBOOT_BSP_RASPBERRYPI_HPP
