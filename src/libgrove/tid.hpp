/*
 * tid.hpp
 *
 * timestamp identifiers (TIDs): sortable 13-character record keys
 *
 * Copyright (c) 2021 Cisco Systems, Inc. All rights reserved.  License at
 * https://github.com/cisco/mercury/blob/master/LICENSE
 */

#ifndef GROVE_TID_HPP
#define GROVE_TID_HPP

#include <cstdint>
#include <mutex>
#include <stdexcept>
#include <string>

namespace grove {

class tid_error : public std::runtime_error {
public:
    explicit tid_error(const char *msg) : std::runtime_error{msg} { }
};

/// class tid creates and parses timestamp identifiers.  A TID is a
/// 64-bit integer whose top bit is zero, followed by a 53-bit
/// timestamp and a 10-bit clock identifier, written as 13 characters
/// of the sortable base32 alphabet `234567abcdefghijklmnopqrstuvwxyz`.
/// TIDs sort lexicographically in timestamp order.
///
class tid {
public:

    static constexpr size_t length = 13;

    static constexpr uint64_t timestamp_mask = 0x1fffffffffffff;    // 53 bits
    static constexpr uint32_t clock_id_mask  = 0x3ff;               // 10 bits

    struct fields {
        uint64_t timestamp;
        uint32_t clock_id;
    };

    /// returns the TID for \param timestamp (normally microseconds
    /// since the epoch) and \param clock_id; bits outside of the
    /// timestamp and clock id fields are ignored
    ///
    static std::string create(uint64_t timestamp, uint32_t clock_id);

    /// throws \ref tid_error if \param s is not a well-formed TID
    ///
    static void validate(const std::string &s);

    static bool is_valid(const std::string &s);

    /// returns the timestamp and clock id of the TID \param s, or
    /// throws \ref tid_error if it is not well-formed
    ///
    static fields parse(const std::string &s);

    /// class clock issues TIDs from the current time.  Each call to
    /// \ref now() uses a timestamp strictly greater than the one
    /// before, even if the system clock does not advance, so that the
    /// TIDs from one clock are unique and increasing.  A clock can be
    /// shared between threads.
    ///
    class clock {
        uint32_t id;
        std::mutex mtx;
        uint64_t last;

    public:

        explicit clock(uint32_t clock_id) : id{clock_id & clock_id_mask}, last{0} { }

        clock(const clock &) = delete;
        clock &operator=(const clock &) = delete;

        std::string now();
    };

};

}  // namespace grove

#endif // GROVE_TID_HPP
