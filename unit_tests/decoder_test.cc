/*
 * decoder_test.cc
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

// checks that decoding the hex string \param hex fails with the error
// kind \param kind at offset \param offset
//
static void check_rejected(const std::string &hex, error_kind kind, size_t offset) {
    std::vector<uint8_t> input = from_hex(hex);
    cbor::decode_result r = cbor::decode(datum{input});
    INFO("input: " << hex);
    REQUIRE_FALSE(r);
    REQUIRE(r.error.has_value());
    CHECK(r.error->kind() == kind);
    CHECK(r.error->offset() == offset);
    CHECK(r.val.is_null());
}

static value decode_hex(const std::string &hex) {
    std::vector<uint8_t> input = from_hex(hex);
    cbor::decode_result r = cbor::decode(datum{input});
    INFO("input: " << hex);
    if (!r) {
        FAIL(r.error->what());
    }
    return r.val;
}

TEST_CASE("decoding integers") {
    CHECK(decode_hex("00") == value{0});
    CHECK(decode_hex("0a") == value{10});
    CHECK(decode_hex("17") == value{23});
    CHECK(decode_hex("1818") == value{24});
    CHECK(decode_hex("1903e8") == value{1000});
    CHECK(decode_hex("1a000f4240") == value{1000000});
    CHECK(decode_hex("1b000000e8d4a51000") == value{int64_t{1000000000000}});
    CHECK(decode_hex("1bffffffffffffffff") == value{std::numeric_limits<uint64_t>::max()});
    CHECK(decode_hex("20") == value{-1});
    CHECK(decode_hex("3863") == value{-100});
    CHECK(decode_hex("3903e7") == value{-1000});
    CHECK(decode_hex("3b7fffffffffffffff") == value{std::numeric_limits<int64_t>::min()});

    value v = decode_hex("3bffffffffffffffff");
    REQUIRE(v.get_type() == value::type::integer);
    CHECK(v.as_integer().is_negative());
    CHECK(v.as_integer().argument() == std::numeric_limits<uint64_t>::max());
    CHECK(v.as_integer().as_int64().has_value() == false);
    CHECK(v.as_integer().as_uint64().has_value() == false);

    value u = decode_hex("1bffffffffffffffff");
    CHECK(u.as_integer().as_int64().has_value() == false);
    CHECK(u.as_integer().as_uint64() == std::numeric_limits<uint64_t>::max());
    CHECK(decode_hex("00").as_integer().as_uint64() == uint64_t{0});
}

TEST_CASE("decoding simple values and floats") {
    CHECK(decode_hex("f4") == value{false});
    CHECK(decode_hex("f5") == value{true});
    CHECK(decode_hex("f6").is_null());
    CHECK(decode_hex("fb3ff199999999999a") == value{1.1});
    CHECK(decode_hex("fbc010666666666666") == value{-4.1});
    CHECK(decode_hex("fb8000000000000000").as_double() == 0.0);
}

TEST_CASE("decoding strings and containers") {
    CHECK(decode_hex("60") == value{""});
    CHECK(decode_hex("6449455446") == value{"IETF"});
    CHECK(decode_hex("62c3bc") == value{"\xc3\xbc"});
    CHECK(decode_hex("40") == value{value::bytes{}});
    CHECK(decode_hex("4401020304") == value{value::bytes{ 1, 2, 3, 4 }});
    CHECK(decode_hex("80") == value{value::array{}});
    CHECK(decode_hex("a0") == value{map{}});
    CHECK(decode_hex("8301820203820405") == value{value::array{ 1, value::array{ 2, 3 }, value::array{ 4, 5 } }});
    CHECK(decode_hex("a26161016162820203") == value{map{ { "a", 1 }, { "b", value::array{ 2, 3 } } }});
    CHECK(decode_hex("82a0a161618180") == value{value::array{ map{}, map{ { "a", value::array{ value{value::array{}} } } } }});
}

TEST_CASE("get_if gives access to the decoded alternative only") {
    value text = decode_hex("6449455446");
    REQUIRE(text.get_if<std::string>() != nullptr);
    CHECK(*text.get_if<std::string>() == "IETF");
    CHECK(text.get_if<value::bytes>() == nullptr);
    CHECK(text.get_if<integer>() == nullptr);

    value number = decode_hex("3863");
    REQUIRE(number.get_if<integer>() != nullptr);
    CHECK(number.get_if<integer>()->as_int64() == int64_t{-100});
    CHECK(number.get_if<std::string>() == nullptr);

    value list = decode_hex("820102");
    REQUIRE(list.get_if<value::array>() != nullptr);
    CHECK(list.get_if<value::array>()->size() == 2);
    CHECK(list.get_if<map>() == nullptr);
}

TEST_CASE("decoded maps are in canonical order") {
    value v = decode_hex("a46161026162046261610362626201");
    REQUIRE(v.get_type() == value::type::map);
    std::vector<std::string> keys;
    for (const auto &e : v.as_map()) {
        keys.push_back(e.first);
    }
    CHECK(keys == std::vector<std::string>{ "a", "b", "aa", "bb" });
    REQUIRE(v.as_map().find("bb") != nullptr);
    CHECK(*v.as_map().find("bb") == value{1});
}

TEST_CASE("decoding a link") {
    std::string content{"abc"};
    cid c = cid::create(cid::dag_cbor, datum{content});
    value v = decode_hex("d82a58250001711220ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    REQUIRE(v.get_type() == value::type::link);
    CHECK(v.as_link() == c);

    value e = decode_hex("d82a450001711200");
    REQUIRE(e.get_type() == value::type::link);
    CHECK(e.as_link().is_empty());
}

TEST_CASE("arguments must be minimally encoded") {
    CHECK(decode_hex("0a") == value{10});
    check_rejected("19000a", error_kind::non_minimal, 0);
    check_rejected("1817", error_kind::non_minimal, 0);
    check_rejected("1a0000ffff", error_kind::non_minimal, 0);
    check_rejected("1b00000000ffffffff", error_kind::non_minimal, 0);
    check_rejected("3817", error_kind::non_minimal, 0);
    check_rejected("580161", error_kind::non_minimal, 0);
    check_rejected("780161", error_kind::non_minimal, 0);
    check_rejected("980101", error_kind::non_minimal, 0);
    check_rejected("b8010101", error_kind::non_minimal, 0);
    check_rejected("8219000a01", error_kind::non_minimal, 1);
}

TEST_CASE("reserved and indefinite-length encodings are malformed") {
    check_rejected("1c", error_kind::malformed, 0);
    check_rejected("1d", error_kind::malformed, 0);
    check_rejected("1e", error_kind::malformed, 0);
    check_rejected("1f", error_kind::malformed, 0);
    check_rejected("5f4101ff", error_kind::malformed, 0);
    check_rejected("7f6161ff", error_kind::malformed, 0);
    check_rejected("9f01ff", error_kind::malformed, 0);
    check_rejected("bf616101ff", error_kind::malformed, 0);
    check_rejected("ff", error_kind::malformed, 0);
    check_rejected("8101ff", error_kind::trailing_data, 2);
}

TEST_CASE("text must be valid UTF-8") {
    check_rejected("62c328", error_kind::invalid_utf8, 0);
    check_rejected("63eda080", error_kind::invalid_utf8, 0);
    check_rejected("8201 61ff", error_kind::invalid_utf8, 2);
    check_rejected("a161ff01", error_kind::invalid_utf8, 1);
}

TEST_CASE("floats must be finite doubles") {
    check_rejected("fb7ff8000000000000", error_kind::invalid_float, 0);
    check_rejected("fb7ff0000000000000", error_kind::invalid_float, 0);
    check_rejected("fbfff0000000000000", error_kind::invalid_float, 0);
    check_rejected("f93c00", error_kind::invalid_float, 0);
    check_rejected("fa3f800000", error_kind::invalid_float, 0);
}

TEST_CASE("map keys must be text strings") {
    check_rejected("a10102", error_kind::invalid_map_key, 1);
    check_rejected("a1416101", error_kind::invalid_map_key, 1);
    check_rejected("a1f601", error_kind::invalid_map_key, 1);
}

SCENARIO("map keys must be in canonical order") {
    GIVEN("a map whose key \"bb\" precedes \"a\"") {
        std::vector<uint8_t> input = from_hex("a2 626262 01 6161 02");
        WHEN("it is decoded") {
            cbor::decode_result r = cbor::decode(datum{input});
            THEN("it is rejected for key order") {
                REQUIRE_FALSE(r);
                CHECK(r.error->kind() == error_kind::map_key_order);
                CHECK(r.error->offset() == 5);
                CHECK(r.error->path() == "$");
            }
        }
    }
    GIVEN("a map whose key \"b\" precedes \"a\"") {
        check_rejected("a2616201616102", error_kind::map_key_order, 4);
    }
    GIVEN("a map with a duplicate key") {
        std::vector<uint8_t> input = from_hex("a2 6161 01 6161 02");
        WHEN("it is decoded") {
            cbor::decode_result r = cbor::decode(datum{input});
            THEN("it is rejected as a duplicate, not for order") {
                REQUIRE_FALSE(r);
                CHECK(r.error->kind() == error_kind::duplicate_map_key);
                CHECK(r.error->offset() == 4);
            }
        }
    }
}

TEST_CASE("only tag 42 and the simple values false, true and null are supported") {
    check_rejected("c074323031332d30332d32315432303a30343a30305a", error_kind::unsupported, 0);
    check_rejected("c11a514b67b0", error_kind::unsupported, 0);
    check_rejected("d8184401020304", error_kind::unsupported, 0);
    check_rejected("f7", error_kind::unsupported, 0);
    check_rejected("f0", error_kind::unsupported, 0);
    check_rejected("f8ff", error_kind::unsupported, 0);
}

TEST_CASE("links must hold a prefixed cid") {
    // corrupted 0x00 prefix
    check_rejected("d82a58250101711220ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad",
                   error_kind::invalid_link, 0);
    // not a byte string
    check_rejected("d82a6161", error_kind::invalid_link, 0);
    // empty byte string
    check_rejected("d82a40", error_kind::invalid_link, 0);
    // prefix only
    check_rejected("d82a4100", error_kind::invalid_link, 0);
    // cid with an invalid codec
    check_rejected("d82a450001701200", error_kind::invalid_link, 0);
    // cid with a truncated digest
    check_rejected("d82a4600017112200a", error_kind::invalid_link, 0);
    // link inside an array
    check_rejected("8201d82a4100", error_kind::invalid_link, 2);
}

TEST_CASE("decode rejects trailing data, decode_first returns it") {
    std::vector<uint8_t> input = from_hex("0a0b");

    cbor::decode_result first = cbor::decode_first(datum{input});
    REQUIRE(first);
    CHECK(first.val == value{10});
    CHECK(to_hex(first.remainder) == "0b");

    cbor::decode_result all = cbor::decode(datum{input});
    REQUIRE_FALSE(all);
    CHECK(all.error->kind() == error_kind::trailing_data);
    CHECK(all.error->offset() == 1);
    CHECK(to_hex(all.remainder) == "0b");
}

TEST_CASE("empty input is an end of input error") {
    std::vector<uint8_t> empty;
    cbor::decode_result r = cbor::decode(datum{empty});
    REQUIRE_FALSE(r);
    CHECK(r.error->kind() == error_kind::end_of_input);
    CHECK(r.error->offset() == 0);

    std::string s;
    r = cbor::decode_first(datum{s});
    REQUIRE_FALSE(r);
    CHECK(r.error->kind() == error_kind::end_of_input);
}

TEST_CASE("counts larger than the input fail without large allocations") {
    check_rejected("9bffffffffffffffff", error_kind::end_of_input, 9);
    check_rejected("bbffffffffffffffff", error_kind::end_of_input, 9);
    check_rejected("5bffffffffffffffff", error_kind::end_of_input, 0);
    check_rejected("83 01 02", error_kind::end_of_input, 3);
}

SCENARIO("truncated input") {
    GIVEN("a valid encoding of a nested value") {
        std::string content{"abc"};
        map m{
            { "link", cid::create(cid::dag_cbor, datum{content}) },
            { "list", value::array{ 1, -1000, 1.5, "text", value::bytes{ 1, 2, 3 }, nullptr, true } },
            { "nested", map{ { "a", value::array{} }, { "bb", map{} }, { "long", int64_t{1} << 40 } } },
        };
        std::vector<uint8_t> encoding = cbor::encode(m);
        REQUIRE(cbor::decode(datum{encoding}));

        WHEN("any proper prefix is decoded") {
            THEN("the error is always end of input") {
                for (size_t len = 0; len < encoding.size(); len++) {
                    datum prefix{encoding.data(), encoding.data() + len};
                    cbor::decode_result r = cbor::decode(prefix);
                    INFO("prefix length " << len);
                    REQUIRE_FALSE(r);
                    CHECK(r.error->kind() == error_kind::end_of_input);
                }
            }
        }
    }
}

TEST_CASE("errors carry the path and offset of the failing item") {
    std::vector<uint8_t> input = from_hex(
        "a1 67 656e7472696573"              // "entries"
        " 84 a0 a0 a0"                      // array of four maps
        " a1 64 6e616d65"                   // { "name":
        " fb 7ff8000000000000");            //   NaN }
    cbor::decode_result r = cbor::decode(datum{input});
    REQUIRE_FALSE(r);
    CHECK(r.error->kind() == error_kind::invalid_float);
    CHECK(r.error->offset() == 19);
    CHECK(r.error->path() == "$.entries[3].name");
    CHECK(std::string{r.error->what()}.find("$.entries[3].name") != std::string::npos);
    CHECK(r.remainder.data == input.data() + 19);
}

SCENARIO("nesting depth is not limited by the call stack") {
    GIVEN("a million nested one-element arrays") {
        constexpr size_t depth = 1000000;
        std::vector<uint8_t> input(depth, 0x81);        // array of one element
        input.push_back(0x80);                          // innermost empty array

        WHEN("it is decoded") {
            cbor::decode_result r = cbor::decode(datum{input});
            REQUIRE(r);

            THEN("every level is present") {
                size_t levels = 0;
                const value *v = &r.val;
                while (!v->as_array().empty()) {
                    REQUIRE(v->as_array().size() == 1);
                    v = &v->as_array()[0];
                    levels++;
                }
                CHECK(levels == depth);
            }
            THEN("it re-encodes to the same bytes") {
                CHECK(cbor::encode_value(r.val) == input);
            }
            THEN("it equals a second decoding, and differs from a shallower one") {
                cbor::decode_result again = cbor::decode(datum{input});
                REQUIRE(again);
                CHECK(r.val == again.val);

                datum shallower{input.data() + 1, input.data() + input.size()};
                cbor::decode_result other = cbor::decode(shallower);
                REQUIRE(other);
                CHECK(r.val != other.val);
            }
            THEN("it can be destroyed") {
                r.val = value{};
                CHECK(r.val.is_null());
            }
        }
        WHEN("it is followed by trailing data") {
            input.push_back(0x00);
            cbor::decode_result r = cbor::decode(datum{input});
            THEN("the decoded value is discarded and the error reported") {
                REQUIRE_FALSE(r);
                CHECK(r.error->kind() == error_kind::trailing_data);
                CHECK(r.error->offset() == depth + 1);
            }
        }
        WHEN("it is truncated") {
            input.pop_back();
            cbor::decode_result r = cbor::decode(datum{input});
            THEN("the error is end of input") {
                REQUIRE_FALSE(r);
                CHECK(r.error->kind() == error_kind::end_of_input);
                CHECK(r.error->offset() == depth);
            }
        }
    }
    GIVEN("deeply nested maps") {
        constexpr size_t depth = 300000;
        std::vector<uint8_t> input;
        input.reserve(depth * 3 + 1);
        for (size_t i = 0; i < depth; i++) {
            input.push_back(0xa1);                      // { "a": ... }
            input.push_back(0x61);
            input.push_back('a');
        }
        input.push_back(0xf6);

        cbor::decode_result r = cbor::decode(datum{input});
        REQUIRE(r);
        CHECK(cbor::encode_value(r.val) == input);

        const value *v = &r.val;
        size_t levels = 0;
        while (v->get_type() == value::type::map) {
            v = v->as_map().find("a");
            REQUIRE(v != nullptr);
            levels++;
        }
        CHECK(levels == depth);
        CHECK(v->is_null());
    }
}
