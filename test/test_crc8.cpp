/*
 * Copyright (c) 2024 Gordon Bos <gordon@bosvangennip.nl> All rights reserved.
 *
 * Frame check value tests
 *
 *
 * Source code subject to GNU GENERAL PUBLIC LICENSE version 3
 */

#include <catch2/catch.hpp>
#include "../src/crypto/crc8.hpp"
#include "../src/common/hexstring.hpp"


TEST_CASE("crc8 of the standard check string", "[crc8]")
{
	std::string szCheck = "123456789";
	std::vector<uint8_t> vData(szCheck.begin(), szCheck.end());
	REQUIRE(midea::crypto::crc8(vData) == 0xA1);
	REQUIRE(midea::crypto::crc8(vData.data(), vData.size()) == 0xA1);
}

TEST_CASE("crc8 of an empty buffer is zero", "[crc8]")
{
	REQUIRE(midea::crypto::crc8(std::vector<uint8_t>()) == 0);
}

TEST_CASE("Capability query trailer", "[crc8]")
{
	std::vector<uint8_t> vCommand;
	REQUIRE(midea::hex::decode("aa0ea100000000000303b501118ef6", vCommand));

	// crc over the payload after the 10 byte header
	REQUIRE(midea::crypto::crc8(&vCommand[10], 3) == 0x8E);
	// checksum over everything between sync header and checksum byte
	REQUIRE(midea::crypto::frame_checksum(&vCommand[1], vCommand.size() - 2) == 0xF6);
}

TEST_CASE("Checksum completes the byte sum to zero", "[crc8]")
{
	std::vector<uint8_t> vData = { 0x20, 0xAC, 0x03, 0x41, 0x81, 0xFF };
	uint8_t checksum = midea::crypto::frame_checksum(vData.data(), vData.size());
	unsigned int sum = checksum;
	for (const uint8_t byte : vData)
		sum += byte;
	REQUIRE((sum & 0xFF) == 0);
}
