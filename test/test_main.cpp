/*
 * Copyright (c) 2024 Gordon Bos <gordon@bosvangennip.nl> All rights reserved.
 *
 * Test runner for the Midea appliance library
 *
 *
 * Source code subject to GNU GENERAL PUBLIC LICENSE version 3
 */

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
