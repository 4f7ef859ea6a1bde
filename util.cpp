// SPDX-License-Identifier: MIT OR Apache-2.0
/**
 * @file util.cpp
 * @brief Freestanding string and formatting helpers for piboot.
 */

#include "util.hpp"
#include <cstdarg>

namespace piboot {
namespace util {

static char* reverse_str(char* str, int length) {
    int start = 0; int end = length - 1;
    while (start < end) { char temp = str[start]; str[start] = str[end]; str[end] = temp; start++; end--; }
    return str;
}

static int num_to_str_base_internal(uint64_t magnitude, bool negative, char* buffer, size_t buffer_size, int base) {
    if (!buffer || buffer_size == 0) return -1;
    if (base < 2 || base > 36) {
        buffer[0] = '\0';
        return -1;
    }
    char* ptr = buffer;
    int chars_written = 0;
    if (negative) {
        if (static_cast<size_t>(chars_written + 1) >= buffer_size) { buffer[0] = '\0'; return -1; }
        *ptr++ = '-';
        chars_written++;
    }
    if (magnitude == 0) {
        if (static_cast<size_t>(chars_written + 1) >= buffer_size) { buffer[0] = '\0'; return -1; }
        *ptr++ = '0';
        *ptr = '\0';
        return chars_written + 1;
    }
    char* start_digits = ptr;
    int num_digits = 0;
    while (magnitude > 0) {
        if (static_cast<size_t>(chars_written + num_digits + 1) >= buffer_size) {
            buffer[0] = '\0';
            return -1;
        }
        unsigned remainder = static_cast<unsigned>(magnitude % static_cast<unsigned>(base));
        *ptr++ = (remainder > 9) ? static_cast<char>((remainder - 10) + 'a') : static_cast<char>(remainder + '0');
        magnitude /= static_cast<unsigned>(base);
        num_digits++;
    }
    *ptr = '\0';
    reverse_str(start_digits, num_digits);
    return chars_written + num_digits;
}

int int_to_str(int64_t value, char* buffer, size_t buffer_size, int base) noexcept {
    bool negative = base == 10 && value < 0;
    // Two's complement negation in unsigned arithmetic also covers INT64_MIN.
    uint64_t magnitude = negative ? (~static_cast<uint64_t>(value) + 1) : static_cast<uint64_t>(value);
    return num_to_str_base_internal(magnitude, negative, buffer, buffer_size, base);
}

int uint64_to_str(uint64_t value, char* buffer, size_t buffer_size, int base) noexcept {
    return num_to_str_base_internal(value, false, buffer, buffer_size, base);
}

int uint64_to_hex_str(uint64_t value, char* buffer, size_t buffer_size, bool leading_0x) noexcept {
    if (!buffer || buffer_size == 0) return -1;
    char* ptr = buffer;
    size_t current_written = 0;
    if (leading_0x) {
        if (buffer_size < 3) { buffer[0] = '\0'; return -1; }
        *ptr++ = '0'; *ptr++ = 'x'; current_written += 2;
    }
    int digits_len = num_to_str_base_internal(value, false, ptr, buffer_size - current_written, 16);
    if (digits_len < 0) { buffer[0] = '\0'; return -1; }
    return static_cast<int>(current_written + static_cast<size_t>(digits_len));
}

int k_vsnprintf(char* buffer, size_t bufsz, const char* format, va_list args) noexcept {
    if (!buffer || bufsz == 0) return 0;
    if (!format) { buffer[0] = '\0'; return 0; }
    char* buf_ptr = buffer;
    char* const buf_write_end = buffer + bufsz - 1;
    int total_written_chars = 0;
    char temp_num_buf[24];

    while (*format && buf_ptr < buf_write_end) {
        if (*format != '%') {
            *buf_ptr++ = *format++;
            total_written_chars++;
            continue;
        }
        format++;
        // l, ll and z all mean 64 bits on AArch64 (LP64).
        bool is_64bit = false;
        if (format[0] == 'l' && format[1] == 'l') { is_64bit = true; format += 2; }
        else if (format[0] == 'l' || format[0] == 'z') { is_64bit = true; format += 1; }

        int current_segment_len = 0;
        const char* str_to_copy_from = temp_num_buf;

        switch (*format) {
            case 's': {
                const char* s_arg = va_arg(args, const char*);
                if (!s_arg) s_arg = "(null)";
                str_to_copy_from = s_arg;
                current_segment_len = static_cast<int>(kstrlen(s_arg));
                break;
            }
            case 'c': {
                temp_num_buf[0] = static_cast<char>(va_arg(args, int));
                temp_num_buf[1] = '\0'; current_segment_len = 1;
                break;
            }
            case 'd': case 'i': {
                int64_t v = is_64bit ? static_cast<int64_t>(va_arg(args, long long)) : va_arg(args, int);
                current_segment_len = int_to_str(v, temp_num_buf, sizeof(temp_num_buf));
                break;
            }
            case 'u': {
                uint64_t v = is_64bit ? static_cast<uint64_t>(va_arg(args, unsigned long long)) : va_arg(args, unsigned int);
                current_segment_len = uint64_to_str(v, temp_num_buf, sizeof(temp_num_buf));
                break;
            }
            case 'x': case 'X': case 'p': {
                uint64_t hex_val;
                if (*format == 'p') hex_val = reinterpret_cast<uintptr_t>(va_arg(args, void*));
                else if (is_64bit) hex_val = va_arg(args, unsigned long long);
                else hex_val = va_arg(args, unsigned int);
                current_segment_len = uint64_to_hex_str(hex_val, temp_num_buf, sizeof(temp_num_buf), (*format == 'p'));
                if (*format == 'X') {
                    for (int k = 0; k < current_segment_len; ++k) {
                        if (temp_num_buf[k] >= 'a' && temp_num_buf[k] <= 'f') temp_num_buf[k] = static_cast<char>(temp_num_buf[k] - 'a' + 'A');
                    }
                }
                break;
            }
            case '%': {
                temp_num_buf[0] = '%'; temp_num_buf[1] = '\0'; current_segment_len = 1;
                break;
            }
            case '\0': {
                // Lone '%' at the end of the format string.
                *buf_ptr = '\0';
                return total_written_chars;
            }
            default: {
                // Unknown conversion: emit it literally.
                *buf_ptr++ = '%'; total_written_chars++;
                if (buf_ptr < buf_write_end) { *buf_ptr++ = *format; total_written_chars++; }
                str_to_copy_from = nullptr;
                break;
            }
        }

        if (str_to_copy_from && current_segment_len > 0) {
            for (int k = 0; k < current_segment_len && buf_ptr < buf_write_end; ++k) {
                *buf_ptr++ = str_to_copy_from[k];
                total_written_chars++;
            }
        }
        format++;
    }
    *buf_ptr = '\0';
    return total_written_chars;
}

int k_snprintf(char* buffer, size_t bufsz, const char* format, ...) noexcept {
    va_list args;
    va_start(args, format);
    int result = k_vsnprintf(buffer, bufsz, format, args);
    va_end(args);
    return result;
}

} // namespace util
} // namespace piboot
