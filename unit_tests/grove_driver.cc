/*
 * grove_driver.cc
 *
 * main() for the grove unit tests
 *
 * Copyright (c) 2021 Cisco Systems, Inc. All rights reserved.  License at
 * https://github.com/cisco/mercury/blob/master/LICENSE
 */

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
