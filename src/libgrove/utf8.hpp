/*
 * utf8.hpp
 *
 * strict UTF-8 validation
 *
 * Copyright (c) 2021 Cisco Systems, Inc. All rights reserved.  License at
 * https://github.com/cisco/mercury/blob/master/LICENSE
 */

#ifndef GROVE_UTF8_HPP
#define GROVE_UTF8_HPP

#include <cstdio>
#include <vector>
#include "datum.h"

namespace grove {

/// class utf8_string represents a sequence of UTF-8 code points in a
/// datum.  Only well-formed sequences as defined by RFC 3629 are
/// valid: overlong encodings, surrogate halves (U+D800..U+DFFF), code
/// points above U+10FFFF, unexpected continuation bytes, and
/// truncated sequences are all invalid.
///
class utf8_string : public datum {

    static bool is_continuation(uint8_t x) {
        return x >= 0x80 && x <= 0xbf;
    }

public:

    utf8_string(datum d) : datum{d} { }

    /// returns true if this string is valid UTF-8
    ///
    bool is_valid() const { return is_valid(*this); }

    // The table below lists the well-formed byte sequences.  The first
    // byte determines the length of the sequence and restricts the
    // range of the second byte; every other byte must be a
    // continuation byte (0x80..0xbf).
    //
    //  Code Points         First      Second     Third       Fourth
    //  U+0000..U+007F      00..7F     -          -           -
    //  U+0080..U+07FF      C2..DF     80..BF     -           -
    //  U+0800..U+0FFF      E0         A0..BF     80..BF      -
    //  U+1000..U+CFFF      E1..EC     80..BF     80..BF      -
    //  U+D000..U+D7FF      ED         80..9F     80..BF      -
    //  U+E000..U+FFFF      EE..EF     80..BF     80..BF      -
    //  U+10000..U+3FFFF    F0         90..BF     80..BF      80..BF
    //  U+40000..U+FFFFF    F1..F3     80..BF     80..BF      80..BF
    //  U+100000..U+10FFFF  F4         80..8F     80..BF      80..BF
    //
    static bool is_valid(datum d) {
        if (d.is_null()) {
            return true;
        }
        const uint8_t *x = d.data;
        const uint8_t *end = d.data_end;
        while (x < end) {
            uint8_t byte1 = *x;
            if (byte1 < 0x80) {
                x++;
                continue;
            }

            size_t seq_len;
            uint8_t lo = 0x80;      // bounds on the second byte
            uint8_t hi = 0xbf;
            if (byte1 >= 0xc2 && byte1 <= 0xdf) {
                seq_len = 2;
            } else if (byte1 >= 0xe0 && byte1 <= 0xef) {
                seq_len = 3;
                if (byte1 == 0xe0) {
                    lo = 0xa0;      // overlong
                } else if (byte1 == 0xed) {
                    hi = 0x9f;      // surrogate halves
                }
            } else if (byte1 >= 0xf0 && byte1 <= 0xf4) {
                seq_len = 4;
                if (byte1 == 0xf0) {
                    lo = 0x90;      // overlong
                } else if (byte1 == 0xf4) {
                    hi = 0x8f;      // above U+10FFFF
                }
            } else {
                return false;       // continuation byte, 0xc0, 0xc1, or 0xf5..0xff
            }

            if (end - x < (ssize_t)seq_len) {
                return false;       // sequence too short
            }
            if (x[1] < lo || x[1] > hi) {
                return false;
            }
            for (size_t i = 2; i < seq_len; i++) {
                if (!is_continuation(x[i])) {
                    return false;
                }
            }
            x += seq_len;
        }
        return true;
    }

    /// `utf8_string::unit_test()` performs unit tests on the class
    /// \ref utf8_string and returns `true` if they all pass, and
    /// `false` otherwise.  If \param f == `nullptr`, then no output
    /// is written; otherwise, output is written to \param f.
    ///
    static bool unit_test(FILE *f=nullptr) {

        class test_case {
            std::vector<uint8_t> input;
            bool valid;

        public:

            test_case(std::vector<uint8_t> in, bool is_valid) : input{in}, valid{is_valid} { }

            bool test() const {
                return utf8_string::is_valid(datum{input}) == valid;
            }

            void fprint(FILE *f, bool passed) const {
                for (const auto & x : input) { fprintf(f, "%02x", x); }
                fprintf(f, "\t%s\t%s\n", valid ? "valid" : "invalid", passed ? "passed" : "failed");
            }
        };

        std::vector<test_case> test_cases = {
            { { 'a', 'b', 'c' }, true },
            { { }, true },
            { { 0xc3, 0xa9 }, true },                    // U+00E9
            { { 0xe2, 0x82, 0xac }, true },              // U+20AC
            { { 0xed, 0x9f, 0xbf }, true },              // U+D7FF
            { { 0xee, 0x80, 0x80 }, true },              // U+E000 (private use is allowed)
            { { 0xf0, 0x9f, 0x98, 0x80 }, true },        // U+1F600
            { { 0xf4, 0x8f, 0xbf, 0xbf }, true },        // U+10FFFF
            { { 0x80 }, false },                         // unexpected continuation
            { { 0xc0, 0xaf }, false },                   // overlong '/'
            { { 0xc1, 0xbf }, false },                   // overlong
            { { 0xe0, 0x80, 0xaf }, false },             // overlong
            { { 0xed, 0xa0, 0x80 }, false },             // surrogate U+D800
            { { 0xf0, 0x80, 0x80, 0xaf }, false },       // overlong
            { { 0xf4, 0x90, 0x80, 0x80 }, false },       // U+110000
            { { 0xf5, 0x80, 0x80, 0x80 }, false },       // invalid lead byte
            { { 0xe2, 0x82 }, false },                   // truncated
            { { 0xc3, 0x28 }, false },                   // bad continuation
            { { 'a', 0xff, 'b' }, false },
        };

        bool no_tests_failed = true;
        for (const auto & tc : test_cases) {
            bool passed = tc.test();
            no_tests_failed &= passed;
            if (f) { tc.fprint(f, passed); }
        }
        if (f) { fprintf(f, "utf8_string::unit_test: %s\n", no_tests_failed ? "passed" : "failed"); }
        return no_tests_failed;
    }

};

}  // namespace grove

#endif // GROVE_UTF8_HPP
