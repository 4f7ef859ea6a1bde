// SPDX-License-Identifier: MIT OR Apache-2.0
/**
 * @file console.cpp
 * @brief Formatted console output.
 */

#include "console.hpp"
#include "util.hpp"
#include <cstdarg>

namespace piboot {
namespace console {

int kprintf(Write& out, const char* format, ...) noexcept {
    char buf[KPRINTF_BUFFER_SIZE];
    va_list args;
    va_start(args, format);
    int len = util::k_vsnprintf(buf, sizeof(buf), format, args);
    va_end(args);
    out.write_str(buf);
    return len;
}

} // namespace console
} // namespace piboot
