/*
 * tid.cc
 *
 * timestamp identifiers (TIDs): sortable 13-character record keys
 *
 * Copyright (c) 2021 Cisco Systems, Inc. All rights reserved.  License at
 * https://github.com/cisco/mercury/blob/master/LICENSE
 */

#include <chrono>
#include <optional>
#include "tid.hpp"
#include "base32.hpp"
#include "err.h"

namespace grove {

std::string tid::create(uint64_t timestamp, uint32_t clock_id) {
    uint64_t v = ((timestamp & timestamp_mask) << 10) | (clock_id & clock_id_mask);
    v &= 0x7fffffffffffffff;
    return base32::encode_sortable(v, length);
}

// the first character holds the top five bits, of which the first is
// always zero
//
static bool is_valid_first_char(char c) {
    return (c >= '2' && c <= '7') || (c >= 'a' && c <= 'j');
}

void tid::validate(const std::string &s) {
    if (s.length() != length) {
        throw tid_error{"invalid tid length"};
    }
    if (!is_valid_first_char(s[0])) {
        throw tid_error{"invalid tid format"};
    }
    for (char c : s) {
        if (!base32::in_sortable_alphabet(c)) {
            throw tid_error{"invalid tid format"};
        }
    }
}

bool tid::is_valid(const std::string &s) {
    if (s.length() != length || !is_valid_first_char(s[0])) {
        return false;
    }
    for (char c : s) {
        if (!base32::in_sortable_alphabet(c)) {
            return false;
        }
    }
    return true;
}

tid::fields tid::parse(const std::string &s) {
    validate(s);
    std::optional<uint64_t> timestamp = base32::decode_sortable(s.substr(0, 11));
    std::optional<uint64_t> clock_id = base32::decode_sortable(s.substr(11, 2));
    if (!timestamp || !clock_id) {
        throw tid_error{"invalid tid format"};
    }
    return { *timestamp, static_cast<uint32_t>(*clock_id) };
}

std::string tid::clock::now() {
    using namespace std::chrono;
    uint64_t timestamp = duration_cast<microseconds>(system_clock::now().time_since_epoch()).count();

    {
        std::lock_guard<std::mutex> lock{mtx};
        if (timestamp <= last) {
            printf_err(log_debug, "tid clock %u did not advance, using %lu instead of %lu\n",
                       id, static_cast<unsigned long>(last + 1), static_cast<unsigned long>(timestamp));
            timestamp = last + 1;
        }
        last = timestamp;
    }
    return create(timestamp, id);
}

}  // namespace grove
