// SPDX-License-Identifier: MIT OR Apache-2.0
/**
 * @file panic.cpp
 * @brief Panic report formatting.
 */

#include "panic.hpp"

namespace piboot {
namespace panic {

void report(console::Write& out, const PanicRecord& record, uint32_t core_id) noexcept {
    out.write_str(HEADER);
    if (record.message) {
        console::kprintf(out, "Message: %s\n", record.message);
    } else {
        out.write_str("Message: (no message)\n");
    }
    if (record.file) {
        console::kprintf(out, "Location: %s:%d\n", record.file, record.line);
    } else {
        out.write_str("Location: (unknown)\n");
    }
    console::kprintf(out, "Core: %u\nHalting.\n", core_id);
}

} // namespace panic
} // namespace piboot
