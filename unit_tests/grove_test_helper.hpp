/*
 * grove_test_helper.hpp
 *
 * functions for using in unit tests
 *
 * Copyright (c) 2021 Cisco Systems, Inc. All rights reserved.  License at
 * https://github.com/cisco/mercury/blob/master/LICENSE
 */

#ifndef GROVE_TEST_HELPER_HPP
#define GROVE_TEST_HELPER_HPP

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>
#include "datum.h"

/*
 * from_hex() returns the bytes given by a string of hex digits;
 * whitespace between the digits is ignored
 */
inline std::vector<uint8_t> from_hex(const std::string &hex) {
    auto nibble = [](char c) -> uint8_t {
        if (c >= '0' && c <= '9') {
            return c - '0';
        }
        if (c >= 'a' && c <= 'f') {
            return c - 'a' + 10;
        }
        if (c >= 'A' && c <= 'F') {
            return c - 'A' + 10;
        }
        throw std::invalid_argument{"bad hex digit in test input"};
    };
    std::string digits;
    for (char c : hex) {
        if (c != ' ' && c != '\n') {
            digits += c;
        }
    }
    std::vector<uint8_t> out;
    for (size_t i = 0; i + 1 < digits.length(); i += 2) {
        out.push_back(nibble(digits[i]) << 4 | nibble(digits[i + 1]));
    }
    return out;
}

inline std::string to_hex(grove::datum d) {
    static const char hex_digit[] = "0123456789abcdef";
    std::string s;
    if (d.is_null()) {
        return s;
    }
    for (uint8_t x : d) {
        s += hex_digit[x >> 4];
        s += hex_digit[x & 0x0f];
    }
    return s;
}

inline std::string to_hex(const std::vector<uint8_t> &v) {
    return to_hex(grove::datum{v});
}

#endif // GROVE_TEST_HELPER_HPP
