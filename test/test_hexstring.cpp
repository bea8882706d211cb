/*
 * Copyright (c) 2024 Gordon Bos <gordon@bosvangennip.nl> All rights reserved.
 *
 * Byte and hex string helper tests
 *
 *
 * Source code subject to GNU GENERAL PUBLIC LICENSE version 3
 */

#include <catch2/catch.hpp>
#include "../src/common/hexstring.hpp"


TEST_CASE("Hex encoding is lower case", "[hex]")
{
	std::vector<uint8_t> vData = { 0x00, 0xAB, 0x7F, 0xFF };
	REQUIRE(midea::hex::encode(vData) == "00ab7fff");
	REQUIRE(midea::hex::encode(std::vector<uint8_t>()).empty());
	REQUIRE(midea::hex::byte(0xA1) == "a1");
}

TEST_CASE("Hex decoding accepts both cases", "[hex]")
{
	std::vector<uint8_t> vData;
	REQUIRE(midea::hex::decode("00AbfF", vData));
	REQUIRE(vData == std::vector<uint8_t>({ 0x00, 0xAB, 0xFF }));
}

TEST_CASE("Hex decoding rejects malformed input", "[hex]")
{
	std::vector<uint8_t> vData;
	REQUIRE_FALSE(midea::hex::decode("abc", vData));
	REQUIRE_FALSE(midea::hex::decode("zz", vData));
	REQUIRE(vData.empty());
}

TEST_CASE("Little and big endian packing", "[hex]")
{
	uint8_t data[6];
	midea::bytes::to_le(6618611909121ULL, data, 6);
	REQUIRE(midea::hex::encode(data, 6) == "010203040506");
	REQUIRE(midea::bytes::from_le(data, 6) == 6618611909121ULL);

	midea::bytes::to_be(0x1234, data, 2);
	REQUIRE(data[0] == 0x12);
	REQUIRE(data[1] == 0x34);
}

TEST_CASE("Byte vectors from and to strings", "[hex]")
{
	std::vector<uint8_t> vData = midea::bytes::from_string("meicloud");
	REQUIRE(vData.size() == 8);
	REQUIRE(vData[0] == 'm');
	REQUIRE(midea::bytes::to_string(vData) == "meicloud");
}

TEST_CASE("Redacting sensitive values", "[hex]")
{
	REQUIRE(midea::redact("secret") == "******");
	REQUIRE(midea::redact("192.168.1.10", 5) == "192.1*******");
	REQUIRE(midea::redact("6618611909121", -4) == "*********9121");
	REQUIRE(midea::redact("abc", 8) == "abc");
	REQUIRE(midea::redact("") == "");
}

TEST_CASE("Lower case conversion leaves non ASCII bytes alone", "[hex]")
{
	REQUIRE(midea::lowercase("0xA1") == "0xa1");
	REQUIRE(midea::lowercase("Midea_AC_1234") == "midea_ac_1234");
	REQUIRE(midea::lowercase("\xc3\x89t\xc3\xa9") == "\xc3\x89t\xc3\xa9");
	REQUIRE(midea::lowercase("") == "");
}
