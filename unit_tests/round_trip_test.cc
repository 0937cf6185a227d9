/*
 * round_trip_test.cc
 *
 * Copyright (c) 2021 Cisco Systems, Inc. All rights reserved.  License at
 * https://github.com/cisco/mercury/blob/master/LICENSE
 */

#include <catch2/catch.hpp>
#include <limits>
#include "grove_test_helper.hpp"
#include "decoder.hpp"
#include "encoder.hpp"

using namespace grove;

static void check_round_trip(const value &v) {
    std::vector<uint8_t> encoding = cbor::encode_value(v);
    cbor::decode_result r = cbor::decode(datum{encoding});
    INFO("encoding: " << to_hex(encoding));
    REQUIRE(r);
    CHECK(r.val == v);
    CHECK(r.remainder.is_empty());

    // a second encoding is byte-identical to the first
    //
    CHECK(cbor::encode_value(r.val) == encoding);
}

TEST_CASE("every kind of value survives a round trip") {
    std::string content{"abc"};

    check_round_trip(nullptr);
    check_round_trip(true);
    check_round_trip(false);
    for (int64_t i : { int64_t{0}, int64_t{23}, int64_t{24}, int64_t{255}, int64_t{256}, int64_t{65535},
                       int64_t{65536}, int64_t{4294967295}, int64_t{4294967296},
                       std::numeric_limits<int64_t>::max(), int64_t{-1}, int64_t{-24}, int64_t{-25},
                       int64_t{-4294967297}, std::numeric_limits<int64_t>::min() }) {
        check_round_trip(i);
    }
    check_round_trip(std::numeric_limits<uint64_t>::max());
    check_round_trip(integer::from_argument(true, std::numeric_limits<uint64_t>::max()));
    check_round_trip(0.0);
    check_round_trip(-2.5);
    check_round_trip(std::numeric_limits<double>::max());
    check_round_trip(std::numeric_limits<double>::denorm_min());
    check_round_trip("");
    check_round_trip("hello, world");
    check_round_trip("\xf0\x9f\x98\x80 \xe2\x82\xac");
    check_round_trip(value::bytes{});
    check_round_trip(value::bytes(300, 0xee));
    check_round_trip(value::array{});
    check_round_trip(map{});
    check_round_trip(cid::create(cid::dag_cbor, datum{content}));
    check_round_trip(cid::create(cid::raw, datum{content}));
    check_round_trip(cid::create_empty(cid::dag_cbor));
}

TEST_CASE("nested values survive a round trip") {
    std::string content{"record"};
    cid link = cid::create(cid::dag_cbor, datum{content});

    map record{
        { "$type", "app.example.post" },
        { "text", "a short post" },
        { "createdAt", "2024-01-01T00:00:00.000Z" },
        { "langs", value::array{ "en", "fr" } },
        { "reply", map{ { "root", link }, { "parent", link } } },
        { "embed", map{ { "images", value::array{ map{ { "alt", "" }, { "size", 123456 } } } } } },
        { "score", -0.25 },
        { "tags", value::array{} },
        { "blob", value::bytes{ 0x00, 0xff } },
        { "deleted", false },
        { "parent", nullptr },
    };
    check_round_trip(record);

    std::vector<uint8_t> encoding = cbor::encode(record);
    cbor::decode_result r = cbor::decode(datum{encoding});
    REQUIRE(r);
    const value *reply = r.val.as_map().find("reply");
    REQUIRE(reply != nullptr);
    const value *root = reply->as_map().find("root");
    REQUIRE(root != nullptr);
    CHECK(root->as_link() == link);
}

TEST_CASE("the cid of an encoding is stable") {
    map m1{ { "b", 2 }, { "a", 1 } };
    map m2{ { "a", 1 }, { "b", 2 } };
    std::vector<uint8_t> e1 = cbor::encode(m1);
    std::vector<uint8_t> e2 = cbor::encode(m2);
    CHECK(cid::create(cid::dag_cbor, datum{e1}) == cid::create(cid::dag_cbor, datum{e2}));
}
