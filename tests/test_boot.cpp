// SPDX-License-Identifier: MIT OR Apache-2.0
/**
 * @file test_boot.cpp
 * @brief Core gating and the boot core hand-off.
 */

#include "test_framework.hpp"
#include "mock_cpu.hpp"
#include "../boot.hpp"
#include "../runtime_init.hpp"
#include <array>

using piboot::boot::CoreRole;
using piboot::boot::classify_core;

static_assert(classify_core(0) == CoreRole::BOOT);
static_assert(classify_core(1) == CoreRole::SECONDARY);

namespace test {

namespace {

constexpr uint8_t POISON = 0xA5;

// Stand-in BSS for the end-to-end boot sequence; the guard bytes either side must survive.
constexpr size_t GUARD = 8;
alignas(16) std::array<uint8_t, 64 + 2 * GUARD> g_fake_bss_storage;

piboot::memory::Region fake_bss() {
    return piboot::memory::Region::from(g_fake_bss_storage.data() + GUARD,
                                        g_fake_bss_storage.data() + g_fake_bss_storage.size() - GUARD);
}

bool fake_bss_untouched() {
    for (uint8_t b : g_fake_bss_storage) {
        if (b != POISON) return false;
    }
    return true;
}

bool fake_bss_cleared() {
    for (size_t i = 0; i < g_fake_bss_storage.size(); ++i) {
        bool inside = i >= GUARD && i < g_fake_bss_storage.size() - GUARD;
        if (g_fake_bss_storage[i] != (inside ? 0 : POISON)) return false;
    }
    return true;
}

struct KernelReached {};

uintptr_t g_sp_at_runtime_entry = 0;
bool g_bss_clear_at_kernel_entry = false;

void fake_kernel_main() {
    MockCpu::note(CpuOp::KERNEL_ENTERED);
    g_bss_clear_at_kernel_entry = fake_bss_cleared();
    throw KernelReached{};
}

void fake_runtime_init() {
    MockCpu::note(CpuOp::RUNTIME_ENTERED);
    g_sp_at_runtime_entry = MockCpu::stack_pointer;
    piboot::runtime::run<MockCpu>(fake_bss(), fake_kernel_main);
}

// Hand-off target that breaks the contract by returning.
void returning_runtime_init() {
    MockCpu::note(CpuOp::RUNTIME_ENTERED);
}

void prepare(uint64_t affinity, unsigned simulated_events = 0) {
    MockCpu::reset(affinity, simulated_events);
    g_fake_bss_storage.fill(POISON);
    g_sp_at_runtime_entry = 0;
    g_bss_clear_at_kernel_entry = false;
}

bool boot_to_kernel() {
    try {
        piboot::boot::start<MockCpu>(piboot::bsp::BOOT_CORE_STACK_START, fake_runtime_init);
    } catch (const KernelReached&) {
        return true;
    } catch (const CoreParked&) {
        return false;
    }
    return false;
}

} // namespace

static bool test_classify_low_core_ids(piboot::console::Write* out) {
    if (classify_core(0) != CoreRole::BOOT) return fail(out, "affinity 0 must boot");
    for (uint64_t v : {1ULL, 2ULL, 3ULL}) {
        if (classify_core(v) != CoreRole::SECONDARY) return fail(out, "affinity 1..3 must park");
    }
    return true;
}

static bool test_classify_ignores_upper_affinity_bits(piboot::console::Write* out) {
    // Bit 31 of MPIDR_EL1 is RES1 on real hardware; Aff1 and above are outside the mask.
    if (classify_core(0x80000000ULL) != CoreRole::BOOT) return fail(out, "RES1 bit must be ignored");
    if (classify_core(0x80000001ULL) != CoreRole::SECONDARY) return fail(out, "0x80000001 is core 1");
    if (classify_core(0x100ULL) != CoreRole::BOOT) return fail(out, "Aff1 bits must be ignored");
    if (classify_core(0x81000103ULL) != CoreRole::SECONDARY) return fail(out, "0x...03 is core 3");
    return true;
}

static bool test_boot_core_sequence(piboot::console::Write* out) {
    prepare(0);
    if (!boot_to_kernel()) return fail(out, "boot core did not reach the kernel entry");

    const std::array<CpuOp, 5> expected = {CpuOp::READ_AFFINITY, CpuOp::SET_STACK_POINTER, CpuOp::BRANCH_TO,
                                           CpuOp::RUNTIME_ENTERED, CpuOp::KERNEL_ENTERED};
    if (MockCpu::trace.size() != expected.size()) return fail(out, "unexpected number of boot steps");
    for (size_t i = 0; i < expected.size(); ++i) {
        if (MockCpu::trace[i].op != expected[i]) return fail(out, "boot steps out of order");
    }
    if (MockCpu::count(CpuOp::KERNEL_ENTERED) != 1) return fail(out, "kernel entry must be called once");
    if (!g_bss_clear_at_kernel_entry) return fail(out, "BSS not cleared before kernel entry");
    if (!fake_bss_cleared()) return fail(out, "bytes outside the BSS were modified");
    return true;
}

static bool test_stack_set_before_runtime_entry(piboot::console::Write* out) {
    prepare(0);
    if (!boot_to_kernel()) return fail(out, "boot core did not reach the kernel entry");
    if (MockCpu::trace[1].value != piboot::bsp::BOOT_CORE_STACK_START) return fail(out, "wrong stack address");
    if (g_sp_at_runtime_entry != piboot::bsp::BOOT_CORE_STACK_START) {
        return fail(out, "SP not at the boot stack when the runtime initializer started");
    }
    if (MockCpu::trace[2].value != reinterpret_cast<uintptr_t>(&fake_runtime_init)) {
        return fail(out, "hand-off went to the wrong target");
    }
    return true;
}

static bool test_secondary_cores_park(piboot::console::Write* out) {
    for (uint64_t v : {1ULL, 2ULL, 3ULL}) {
        prepare(v);
        if (!ends_parked([] { piboot::boot::start<MockCpu>(piboot::bsp::BOOT_CORE_STACK_START, fake_runtime_init); })) {
            return fail(out, "secondary core did not park");
        }
        if (MockCpu::trace.size() != 2 || MockCpu::trace[0].op != CpuOp::READ_AFFINITY ||
            MockCpu::trace[1].op != CpuOp::WAIT_FOR_EVENT) {
            return fail(out, "secondary core did more than read affinity and wait");
        }
        if (MockCpu::count(CpuOp::SET_STACK_POINTER) != 0) return fail(out, "secondary core set SP");
        if (MockCpu::count(CpuOp::RUNTIME_ENTERED) != 0) return fail(out, "secondary core ran the runtime initializer");
        if (!fake_bss_untouched()) return fail(out, "secondary core touched the BSS");
    }
    return true;
}

static bool test_parked_core_survives_events(piboot::console::Write* out) {
    prepare(1, 3);
    if (!ends_parked([] { piboot::boot::start<MockCpu>(piboot::bsp::BOOT_CORE_STACK_START, fake_runtime_init); })) {
        return fail(out, "secondary core left the parking loop");
    }
    // Three simulated events wake it three times; it goes back to sleep each time.
    if (MockCpu::count(CpuOp::WAIT_FOR_EVENT) != 4) return fail(out, "parking loop did not re-issue WFE");
    if (MockCpu::count(CpuOp::RUNTIME_ENTERED) != 0) return fail(out, "event woke core into the boot path");
    return true;
}

static bool test_returning_hand_off_parks(piboot::console::Write* out) {
    prepare(0);
    if (!ends_parked([] { piboot::boot::start<MockCpu>(piboot::bsp::BOOT_CORE_STACK_START, returning_runtime_init); })) {
        return fail(out, "boot core did not park after the hand-off returned");
    }
    if (MockCpu::count(CpuOp::RUNTIME_ENTERED) != 1) return fail(out, "runtime initializer entered more than once");
    if (MockCpu::trace.back().op != CpuOp::WAIT_FOR_EVENT) return fail(out, "core did not end in the wait loop");
    return true;
}

void register_boot_tests(TestFramework& tf) {
    tf.register_test({"classify_low_ids", test_classify_low_core_ids, "Only core 0 of 0..3 boots"});
    tf.register_test({"classify_mask", test_classify_ignores_upper_affinity_bits, "Affinity bits above the core mask are ignored"});
    tf.register_test({"boot_sequence", test_boot_core_sequence, "Boot core: gate, stack, BSS clear, kernel entry"});
    tf.register_test({"boot_stack", test_stack_set_before_runtime_entry, "SP holds the boot stack at hand-off"});
    tf.register_test({"secondary_park", test_secondary_cores_park, "Cores 1..3 park without touching the BSS"});
    tf.register_test({"park_events", test_parked_core_survives_events, "Events do not release a parked core"});
    tf.register_test({"hand_off_return", test_returning_hand_off_parks, "A returning hand-off parks the boot core"});
}

} // namespace test
