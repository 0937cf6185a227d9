/*
 * base32.hpp
 *
 * unpadded base32 encoding (RFC 4648, lowercase alphabet) and the
 * sortable base32 alphabet used for record keys
 *
 * Copyright (c) 2021 Cisco Systems, Inc. All rights reserved.  License at
 * https://github.com/cisco/mercury/blob/master/LICENSE
 */

#ifndef GROVE_BASE32_HPP
#define GROVE_BASE32_HPP

#include <cstdio>
#include <optional>
#include <string>
#include <vector>
#include "datum.h"

namespace grove {

class base32 {

    // index[] maps a character to its five-bit value, or to -1 if the
    // character is not in the alphabet
    //
    using index_table = std::array<int8_t, 256>;

    static constexpr index_table make_index(const char *alphabet) {
        index_table t{};
        for (auto &x : t) {
            x = -1;
        }
        for (int8_t i = 0; i < 32; i++) {
            t[static_cast<uint8_t>(alphabet[i])] = i;
        }
        return t;
    }

public:

    static constexpr const char *rfc4648_lower = "abcdefghijklmnopqrstuvwxyz234567";

    static constexpr const char *sortable = "234567abcdefghijklmnopqrstuvwxyz";

    /// returns the unpadded base32 encoding of \param d, using the
    /// lowercase RFC 4648 alphabet
    ///
    static std::string encode(datum d) {
        std::string out;
        if (d.is_not_readable()) {
            return out;
        }
        out.reserve((d.length() * 8 + 4) / 5);

        uint32_t bits = 0;
        unsigned int num_bits = 0;
        for (uint8_t x : d) {
            bits = (bits << 8) | x;
            num_bits += 8;
            while (num_bits >= 5) {
                num_bits -= 5;
                out += rfc4648_lower[(bits >> num_bits) & 0x1f];
            }
        }
        if (num_bits > 0) {
            out += rfc4648_lower[(bits << (5 - num_bits)) & 0x1f];
        }
        return out;
    }

    /// decodes the unpadded, lowercase RFC 4648 base32 string \param
    /// s.  An empty optional is returned if \param s contains a
    /// character outside of the alphabet, has a length that no
    /// unpadded encoding can have, or has nonzero trailing bits.
    ///
    static std::optional<std::vector<uint8_t>> decode(const std::string &s) {
        static constexpr index_table index = make_index(rfc4648_lower);

        switch (s.length() % 8) {
        case 1:
        case 3:
        case 6:
            return std::nullopt;
        default:
            ;
        }

        std::vector<uint8_t> out;
        out.reserve(s.length() * 5 / 8);

        uint32_t bits = 0;
        unsigned int num_bits = 0;
        for (char c : s) {
            int8_t v = index[static_cast<uint8_t>(c)];
            if (v < 0) {
                return std::nullopt;
            }
            bits = (bits << 5) | v;
            num_bits += 5;
            if (num_bits >= 8) {
                num_bits -= 8;
                out.push_back(static_cast<uint8_t>(bits >> num_bits));
            }
        }
        if (bits & ((1u << num_bits) - 1)) {
            return std::nullopt;    // trailing bits must be zero
        }
        return out;
    }

    /// returns the \param width character big-endian encoding of \param
    /// v in the sortable alphabet; bits above `5 * width` are dropped
    ///
    static std::string encode_sortable(uint64_t v, size_t width) {
        std::string s(width, sortable[0]);
        for (size_t i = width; i > 0; i--) {
            s[i - 1] = sortable[v & 0x1f];
            v >>= 5;
        }
        return s;
    }

    /// decodes the sortable-alphabet string \param s, returning an
    /// empty optional if it contains a character outside the alphabet
    /// or has more than 12 characters
    ///
    static std::optional<uint64_t> decode_sortable(const std::string &s) {
        static constexpr index_table index = make_index(sortable);

        if (s.length() > 12) {
            return std::nullopt;
        }
        uint64_t v = 0;
        for (char c : s) {
            int8_t x = index[static_cast<uint8_t>(c)];
            if (x < 0) {
                return std::nullopt;
            }
            v = (v << 5) | static_cast<uint64_t>(x);
        }
        return v;
    }

    /// returns true if \param c is in the sortable alphabet
    ///
    static bool in_sortable_alphabet(char c) {
        return (c >= '2' && c <= '7') || (c >= 'a' && c <= 'z');
    }

    // class unit_test_case holds a single test case for
    // base32::encode() and base32::decode()
    //
    class unit_test_case {
        const char *plaintext;
        const char *encoded_text;

    public:

        unit_test_case(const char *in, const char *out) : plaintext{in}, encoded_text{out} { }

        bool test() const {
            std::string in{plaintext};
            if (encode(datum{in}) != encoded_text) {
                return false;
            }
            std::optional<std::vector<uint8_t>> decoded = decode(encoded_text);
            return decoded.has_value() && std::string(decoded->begin(), decoded->end()) == in;
        }

        void fprint(FILE *f, bool passed) const {
            fprintf(f, "base32 \"%s\" <-> \"%s\"\t%s\n", plaintext, encoded_text, passed ? "passed" : "failed");
        }
    };

    /// base32::unit_test() is a static function that performs a unit
    /// test of base32 and returns true if all tests passed, and
    /// returns false otherwise.  If \param f is not `nullptr`, output
    /// is written to it.
    ///
    static bool unit_test(FILE *f=nullptr) {

        // test cases following RFC 4648 Section 10, lowercase and
        // without padding
        //
        unit_test_case tests[] = {
            { "",       "" },
            { "f",      "my" },
            { "fo",     "mzxq" },
            { "foo",    "mzxw6" },
            { "foob",   "mzxw6yq" },
            { "fooba",  "mzxw6ytb" },
            { "foobar", "mzxw6ytboi" },
        };

        bool no_tests_failed = true;
        for (const auto & t : tests) {
            bool passed = t.test();
            no_tests_failed &= passed;
            if (f) { t.fprint(f, passed); }
        }

        // negative test cases (invalid input)
        //
        const char *negative_tests[] = {
            "m",           // impossible length
            "mzx",         // impossible length
            "mz",          // nonzero trailing bits
            "MZXW6",       // uppercase is not in the alphabet
            "mzxw1",       // '1' is not in the alphabet
            "mzxw6===",    // padding is not accepted
        };
        for (const auto & t : negative_tests) {
            bool passed = !decode(t).has_value();
            no_tests_failed &= passed;
            if (f) { fprintf(f, "base32 \"%s\"\t%s\n", t, passed ? "passed (input rejected)" : "failed (input accepted)"); }
        }

        if (encode_sortable(0, 3) != "222" or encode_sortable(31, 2) != "2z" or decode_sortable("2z") != 31u) {
            no_tests_failed = false;
            if (f) { fprintf(f, "base32 sortable alphabet\tfailed\n"); }
        }

        if (f) { fprintf(f, "base32::unit_test: %s\n", no_tests_failed ? "passed" : "failed"); }
        return no_tests_failed;
    }

};

}  // namespace grove

#endif // GROVE_BASE32_HPP
