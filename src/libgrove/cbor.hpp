/*
 * cbor.hpp
 *
 * compact binary object representation (cbor) primitives, following
 * RFC 8949, restricted to the deterministic DAG-CBOR subset
 *
 * Copyright (c) 2021 Cisco Systems, Inc. All rights reserved.  License at
 * https://github.com/cisco/mercury/blob/master/LICENSE
 */

#ifndef GROVE_CBOR_HPP
#define GROVE_CBOR_HPP

#include <cstdio>
#include <cstring>
#include <utility>
#include <vector>
#include "datum.h"

namespace grove::cbor {

    static constexpr uint8_t unsigned_integer_type = 0;
    static constexpr uint8_t negative_integer_type = 1;
    static constexpr uint8_t byte_string_type      = 2;
    static constexpr uint8_t text_string_type      = 3;
    static constexpr uint8_t array_type            = 4;
    static constexpr uint8_t map_type              = 5;
    static constexpr uint8_t tagged_item_type      = 6;
    static constexpr uint8_t simple_or_float_type  = 7;

    inline const char *major_type_name(uint8_t type) {
        switch (type) {
        case unsigned_integer_type: return "unsigned integer";
        case negative_integer_type: return "negative integer";
        case byte_string_type:      return "byte string";
        case text_string_type:      return "text string";
        case array_type:            return "array";
        case map_type:              return "map";
        case tagged_item_type:      return "tag";
        case simple_or_float_type:  return "simple value or float";
        default:
            ;
        }
        return "unknown";
    }

    // major type 7 additional information values accepted by
    // DAG-CBOR
    //
    static constexpr uint8_t simple_false   = 20;
    static constexpr uint8_t simple_true    = 21;
    static constexpr uint8_t simple_null    = 22;
    static constexpr uint8_t float64_info   = 27;

    // the only tag accepted by DAG-CBOR, which marks a CID link
    //
    static constexpr uint64_t cid_tag = 42;

    // initial_byte holds the major type (high-order 3 bits) and the
    // additional information (low-order 5 bits) of a data item.
    // Additional information 28 through 30 is reserved, and 31
    // (indefinite length or break) does not occur in DAG-CBOR.
    //
    class initial_byte {
        encoded<uint8_t> value;
    public:

        // read an initial byte from `d`
        //
        initial_byte(datum &d) : value{d} { }

        // construct an initial_byte for writing
        //
        initial_byte(uint8_t type, uint8_t info) :
            value{static_cast<uint8_t>(type << 5 | info)}
        { }

        uint8_t major_type() const { return value.slice<0,3>(); }

        uint8_t additional_info() const { return value.slice<3,8>(); }

        void write(writeable &buf) const {
            buf << value;
        }

    };

    /// header_status reports the outcome of reading an item header
    ///
    enum class header_status : uint8_t {
        ok,
        end_of_input,       ///< the initial byte or argument is truncated
        non_minimal,        ///< the argument has a shorter encoding
        reserved,           ///< additional information 28, 29, or 30
        indefinite,         ///< additional information 31
    };

    /// class header is the initial byte of a data item together with
    /// its argument.  It is used both to read headers, in which case
    /// the argument width is checked for minimality, and to write
    /// them, in which case the minimal width is always chosen.
    ///
    class header {
        initial_byte ib;
        uint64_t argument_;
        header_status status_;

    public:

        /// reads a header from the \ref datum \param d, which is
        /// advanced past it.  For major types 0 through 6, an
        /// argument held in more bytes than necessary is reported as
        /// `header_status::non_minimal`; for major type 7, the
        /// argument bytes are the bits of a float or a simple value
        /// and are not checked.
        ///
        header(datum &d) : ib{d}, argument_{0}, status_{header_status::ok} {

            if (d.is_null()) {
                status_ = header_status::end_of_input;
                return;
            }

            uint8_t ai = ib.additional_info();
            uint64_t minimum = 0;
            if (ai < 24) {
                argument_ = ai;
                return;
            }
            switch (ai) {
            case 24:
                argument_ = encoded<uint8_t>{d}.value();
                minimum = 24;
                break;
            case 25:
                argument_ = encoded<uint16_t>{d}.value();
                minimum = 0x100;
                break;
            case 26:
                argument_ = encoded<uint32_t>{d}.value();
                minimum = 0x10000;
                break;
            case 27:
                argument_ = encoded<uint64_t>{d}.value();
                minimum = 0x100000000;
                break;
            case 31:
                status_ = header_status::indefinite;
                return;
            default:
                status_ = header_status::reserved;
                return;
            }
            if (d.is_null()) {
                status_ = header_status::end_of_input;
                return;
            }
            if (ib.major_type() != simple_or_float_type && argument_ < minimum) {
                status_ = header_status::non_minimal;
            }
        }

        /// constructs a header, suitable for encoding, with the major
        /// type \param type and argument \param x
        ///
        header(uint8_t type, uint64_t x) :
            ib{type, additional_info(x)},
            argument_{x},
            status_{header_status::ok}
        { }

        // returns a `uint8_t` containing the appropriate additional
        // information field for encoding a `uint64_t` with the value
        // \param x
        //
        static uint8_t additional_info(uint64_t x) {
            if (x < 24) {
                return x;
            }
            if (x < 0x100) {
                return 24;          // one-byte uint
            }
            if (x < 0x10000) {
                return 25;          // two-byte uint
            }
            if (x < 0x100000000) {
                return 26;          // four-byte uint
            }
            return 27;              // eight-byte uint
        }

        header_status status() const { return status_; }

        uint8_t major_type() const { return ib.major_type(); }

        uint8_t additional_info() const { return ib.additional_info(); }

        uint64_t argument() const { return argument_; }

        /// encode this header into the \ref writeable \param buf
        ///
        void write(writeable &buf) const {
            ib.write(buf);
            switch (ib.additional_info()) {
            case 24:
                encoded<uint8_t>{static_cast<uint8_t>(argument_)}.write(buf);
                break;
            case 25:
                encoded<uint16_t>{static_cast<uint16_t>(argument_)}.write(buf);
                break;
            case 26:
                encoded<uint32_t>{static_cast<uint32_t>(argument_)}.write(buf);
                break;
            case 27:
                encoded<uint64_t>{argument_}.write(buf);
                break;
            default:
                ;
            }
        }

        /// `cbor::header::unit_test()` performs unit tests on the
        /// class \ref cbor::header and returns `true` if they all
        /// pass, and `false` otherwise.  If \param f == `nullptr`,
        /// then no output is written; otherwise, output is written to
        /// \param f.
        ///
        static bool unit_test(FILE *f=nullptr);

    };

    /// class float64 is an IEEE 754 double precision float, which
    /// DAG-CBOR always writes with the initial byte 0xfb
    ///
    class float64 {
        double value_;

    public:

        explicit float64(double d) : value_{d} { }

        /// returns the float whose bits are given by the argument of
        /// a major type 7 header with additional information 27
        ///
        static float64 from_bits(uint64_t bits) {
            double d;
            static_assert(sizeof(d) == sizeof(bits));
            ::memcpy(&d, &bits, sizeof(d));
            return float64{d};
        }

        double value() const { return value_; }

        void write(writeable &buf) const {
            uint64_t bits;
            ::memcpy(&bits, &value_, sizeof(bits));
            buf << initial_byte{simple_or_float_type, float64_info};
            encoded<uint64_t>{bits}.write(buf);
        }
    };

    /// compares the map keys \param a and \param b in canonical
    /// order (shorter keys first, then bytewise), returning an integer
    /// less than, equal to, or greater than zero
    ///
    inline int compare_map_keys(datum a, datum b) {
        if (a.length() != b.length()) {
            return a.length() < b.length() ? -1 : 1;
        }
        if (a.length() == 0) {
            return 0;
        }
        return ::memcmp(a.data, b.data, a.length());
    }

    // static unit test function for cbor::header
    //
    inline bool header::unit_test(FILE *f) {

        // valid input and output pairs, from RFC 8949 Appendix A
        //
        std::vector<std::pair<std::vector<uint8_t>,uint64_t>> test_cases = {
            {
                { { 0x00 }, 0 },
                { { 0x01 }, 1 },
                { { 0x0a }, 10 },
                { { 0x17 }, 23 },
                { { 0x18, 0x18 }, 24 },
                { { 0x18, 0x19 }, 25 },
                { { 0x18, 0x64 }, 100 },
                { { 0x19, 0x03, 0xe8 }, 1000 },
                { { 0x1a, 0x00, 0x0f, 0x42, 0x40 }, 1000000 },
                { { 0x1b, 0x00, 0x00, 0x00, 0xe8, 0xd4, 0xa5, 0x10, 0x00 }, 1000000000000 },
                { { 0x1b, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff }, 18446744073709551615u },
            }
        };

        bool no_tests_failed = true;
        if (f) { fprintf(f, "cbor::header test cases:\n"); }
        for (const auto & tc : test_cases) {
            datum d{tc.first};
            header h{d};
            bool decoding_passed = (h.status() == header_status::ok && h.argument() == tc.second && d.is_empty());

            dynamic_buffer dbuf{16};
            header{unsigned_integer_type, tc.second}.write(dbuf);
            bool encoding_passed = (dbuf.contents().cmp(datum{tc.first}) == 0);
            bool passed = decoding_passed and encoding_passed;
            no_tests_failed &= passed;

            if (f) {
                fprintf(f, "encoded: ");
                for (const auto & ee : tc.first) { fprintf(f, "%02x", ee);  }
                fprintf(f, "\tdecoded: %lu\tre-encoded: ", static_cast<unsigned long>(h.argument()));
                for (const auto & ee : dbuf.contents()) { fprintf(f, "%02x", ee);  }
                fprintf(f, "\t%s\n", passed ? "passed" : "failed");
            }
        }

        // negative test cases (invalid input)
        //
        std::vector<std::pair<std::vector<uint8_t>,header_status>> negative_test_cases = {
            {
                { { }, header_status::end_of_input },
                { { 0x19, 0x03 }, header_status::end_of_input },
                { { 0x18, 0x17 }, header_status::non_minimal },
                { { 0x19, 0x00, 0x0a }, header_status::non_minimal },
                { { 0x1a, 0x00, 0x00, 0xff, 0xff }, header_status::non_minimal },
                { { 0x1b, 0x00, 0x00, 0x00, 0x00, 0xff, 0xff, 0xff, 0xff }, header_status::non_minimal },
                { { 0x1c }, header_status::reserved },
                { { 0x5f }, header_status::indefinite },
                { { 0xff }, header_status::indefinite },
            }
        };
        if (f) { fprintf(f, "cbor::header negative test cases:\n"); }
        for (const auto & tc : negative_test_cases) {
            datum d{tc.first.data(), tc.first.data() + tc.first.size()};
            header h{d};
            bool passed = (h.status() == tc.second);
            no_tests_failed &= passed;
            if (f) {
                fprintf(f, "encoded: ");
                for (const auto & ee : tc.first) { fprintf(f, "%02x", ee);  }
                fprintf(f, "\t%s\n", passed ? "passed (input rejected)" : "failed (input accepted)");
            }
        }
        if (f) { fprintf(f, "cbor::header::unit_test: %s\n", no_tests_failed ? "passed" : "failed"); }

        return no_tests_failed;
    }

    /// unit_test() performs unit testing on all classes in the cbor
    /// namespace and returns true if they all pass, and false
    /// otherwise.  If \param f == `nullptr`, then no output is
    /// written; otherwise, output is written to \param f.
    ///
    inline bool unit_test(FILE *f=nullptr) {
        return header::unit_test(f);
    }

}  // namespace grove::cbor

#endif // GROVE_CBOR_HPP
