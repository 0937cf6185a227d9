/*
 * functional_unit_test.cc
 *
 *
 * Copyright (c) 2021 Cisco Systems, Inc. All rights reserved.  License at
 * https://github.com/cisco/mercury/blob/master/LICENSE
 */

#include <catch2/catch.hpp>
#include "base32.hpp"
#include "cbor.hpp"
#include "utf8.hpp"

/*
 * The unit_test() functions defined in header files
 * can be tested here using CHECK framework.
 */
TEST_CASE("Testing unit_test() defined in class") {
    CHECK(grove::base32::unit_test() == true);
    CHECK(grove::utf8_string::unit_test() == true);
    CHECK(grove::cbor::header::unit_test() == true);
    CHECK(grove::cbor::unit_test() == true);
}
