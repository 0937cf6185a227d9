/*
 * dynamic_buffer_test.cc
 *
 * Copyright (c) 2021 Cisco Systems, Inc. All rights reserved.  License at
 * https://github.com/cisco/mercury/blob/master/LICENSE
 */

#include <catch2/catch.hpp>
#include "grove_test_helper.hpp"
#include "datum.h"

using namespace grove;

SCENARIO("dynamic_buffer grows on demand") {
    GIVEN("a buffer with room for four bytes") {
        dynamic_buffer buf{4};
        REQUIRE(buf.capacity() == 4);
        REQUIRE(buf.readable_length() == 0);

        WHEN("three bytes are written") {
            uint8_t data[] = { 0x01, 0x02, 0x03 };
            buf.copy(data, sizeof(data));
            THEN("the capacity is unchanged") {
                CHECK(buf.capacity() == 4);
                CHECK(to_hex(buf.contents()) == "010203");
            }
        }
        WHEN("one more byte is written than fits") {
            uint8_t data[] = { 0x01, 0x02, 0x03, 0x04, 0x05 };
            buf.copy(data, sizeof(data));
            THEN("the capacity doubles") {
                CHECK(buf.capacity() == 8);
                CHECK(buf.readable_length() == 5);
                CHECK(to_hex(buf.contents()) == "0102030405");
            }
        }
        WHEN("more is written than doubling would hold") {
            std::vector<uint8_t> data(20, 0xab);
            buf << encoded<uint8_t>{0x7f};
            buf.copy(data.data(), data.size());
            THEN("the buffer grows to exactly the required size") {
                CHECK(buf.capacity() == 21);
                CHECK(buf.readable_length() == 21);
                CHECK(buf.contents().data[0] == 0x7f);
            }
        }
        WHEN("single bytes are appended one at a time") {
            for (uint8_t i = 0; i < 100; i++) {
                buf.copy(i);
            }
            THEN("every byte is kept in order") {
                std::vector<uint8_t> out = buf.finalize();
                REQUIRE(out.size() == 100);
                for (size_t i = 0; i < out.size(); i++) {
                    CHECK(out[i] == i);
                }
            }
        }
    }
}

TEST_CASE("dynamic_buffer writes integers in network byte order") {
    dynamic_buffer buf{1};
    buf << encoded<uint16_t>{0x0102} << encoded<uint32_t>{0x03040506} << encoded<uint64_t>{0x0708090a0b0c0d0e};
    CHECK(to_hex(buf.contents()) == "0102030405060708090a0b0c0d0e");
}

TEST_CASE("dynamic_buffer finalize returns exactly the written prefix") {
    dynamic_buffer buf{1024};
    std::string s{"hello"};
    buf << datum{s};
    std::vector<uint8_t> out = buf.finalize();
    CHECK(out.size() == 5);
    CHECK(std::string(out.begin(), out.end()) == "hello");
}

TEST_CASE("dynamic_buffer with zero initial size") {
    dynamic_buffer buf{0};
    CHECK(buf.is_null() == false);
    buf.copy(0x2a);
    CHECK(to_hex(buf.contents()) == "2a");
}

TEST_CASE("dynamic_buffer reset discards the contents") {
    dynamic_buffer buf{8};
    buf.copy(0x01);
    buf.reset();
    CHECK(buf.readable_length() == 0);
    buf.copy(0x02);
    CHECK(to_hex(buf.contents()) == "02");
}
