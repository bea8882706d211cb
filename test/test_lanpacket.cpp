/*
 * Copyright (c) 2024 Gordon Bos <gordon@bosvangennip.nl> All rights reserved.
 *
 * Legacy packet envelope and discovery reply tests
 *
 *
 * Source code subject to GNU GENERAL PUBLIC LICENSE version 3
 */

#include <catch2/catch.hpp>
#include <cstring>
#include "../src/protocol/LanPacket.hpp"
#include "../src/common/hexstring.hpp"


namespace {

const std::string DISCOVERY_REPLY =
	"837000b8200f04035a5a0111a8007a80000000000000000000000000010203040506"
	"0000000000000000000000000000"
	"c136771d628d08f90ca694ad1a5893b77c7ea4ac6fed1dc7e2670058df2f44675638d33cddd5727c581d84b87f54b944bbc7440daf21c3fa9cab7b342b84ac6a630967cd7d9364d23d4d7a91591e277d90b13be000894715b606127e07c2fecff31443d17c3aac03a7656614ae1dca44"
	"8c53d543ede4d8d26c2008f541b804dc5b24fc8c2735ead584edc8dda92b243d";

std::vector<uint8_t> from_hex(const std::string &szHex)
{
	std::vector<uint8_t> vData;
	midea::hex::decode(szHex, vData);
	return vData;
}

struct tm fixed_time()
{
	struct tm when;
	memset(&when, 0, sizeof(when));
	when.tm_year = 2022 - 1900;
	when.tm_mon = 1;
	when.tm_mday = 16;
	when.tm_hour = 16;
	when.tm_min = 13;
	when.tm_sec = 50;
	return when;
}

}; // namespace


TEST_CASE("ZZ packet header layout", "[lanpacket]")
{
	MideaSecurity security;
	LanPacketCodec codec(security);
	std::vector<uint8_t> vCommand = from_hex("aa0ea100000000000303b501118ef6");
	struct tm when = fixed_time();
	std::vector<uint8_t> vPacket;

	SECTION("local packet carries the encrypted command")
	{
		REQUIRE(codec.build("6618611909121", vCommand, true, vPacket, &when, 12));
		REQUIRE(vPacket.size() == LAN_PACKET_HEADER_SIZE + 16 + LAN_PACKET_FINGERPRINT_SIZE);
		REQUIRE(midea::hex::encode(&vPacket[0], 4) == "5a5a0111");
		REQUIRE((size_t)vPacket[4] == vPacket.size());
		REQUIRE(vPacket[5] == 0x00);
		REQUIRE(vPacket[6] == 0x20);
		REQUIRE(midea::hex::encode(&vPacket[12], 8) == "0c320d1010021614");
		REQUIRE(midea::hex::encode(&vPacket[20], 8) == "0102030405060000");

		std::vector<uint8_t> vEncrypted(vPacket.begin() + LAN_PACKET_HEADER_SIZE, vPacket.end() - LAN_PACKET_FINGERPRINT_SIZE);
		std::vector<uint8_t> vDecrypted;
		REQUIRE(security.aes_decrypt(vEncrypted, vDecrypted));
		REQUIRE(vDecrypted == vCommand);

		std::vector<uint8_t> vHead(vPacket.begin(), vPacket.end() - LAN_PACKET_FINGERPRINT_SIZE);
		std::vector<uint8_t> vFingerprint(vPacket.end() - LAN_PACKET_FINGERPRINT_SIZE, vPacket.end());
		REQUIRE(security.md5fingerprint(vHead) == vFingerprint);
	}

	SECTION("cloud packet carries the plain command")
	{
		REQUIRE(codec.build("6618611909121", vCommand, false, vPacket, &when, 12));
		REQUIRE(vPacket.size() == LAN_PACKET_HEADER_SIZE + vCommand.size() + LAN_PACKET_FINGERPRINT_SIZE);
		REQUIRE(std::vector<uint8_t>(vPacket.begin() + LAN_PACKET_HEADER_SIZE, vPacket.begin() + LAN_PACKET_HEADER_SIZE + vCommand.size()) == vCommand);
	}

	SECTION("appliance id must be decimal")
	{
		REQUIRE_FALSE(codec.build("0xa1", vCommand, true, vPacket, &when));
		REQUIRE(codec.get_last_error_type() == midea::error::type::VALIDATION);
		REQUIRE(vPacket.empty());
	}
}

TEST_CASE("V2 replies as ZZ packets", "[lanpacket]")
{
	MideaSecurity security;
	LanPacketCodec codec(security);
	struct tm when = fixed_time();
	std::vector<uint8_t> vFirst;
	std::vector<uint8_t> vSecond;
	REQUIRE(codec.build("44", from_hex("aa0ea100000000000303b501118ef6"), true, vFirst, &when));
	REQUIRE(codec.build("44", from_hex("aa0ea100000000000303b501011381"), true, vSecond, &when));

	std::vector<uint8_t> vReply(vFirst);
	vReply.insert(vReply.end(), vSecond.begin(), vSecond.end());
	std::vector<std::vector<uint8_t> > vPackets;
	REQUIRE(codec.split_v2_reply(vReply, vPackets));
	REQUIRE(vPackets.size() == 2);
	REQUIRE(midea::hex::encode(vPackets[0]) == "b501118ef6");
	REQUIRE(midea::hex::encode(vPackets[1]) == "b501011381");
}

TEST_CASE("V2 replies as bare commands", "[lanpacket]")
{
	MideaSecurity security;
	LanPacketCodec codec(security);
	std::vector<std::vector<uint8_t> > vPackets;

	REQUIRE(codec.split_v2_reply(from_hex("aa0ea100000000000303b501118ef6aa0ea100000000000303b501011381"), vPackets));
	REQUIRE(vPackets.size() == 2);
	REQUIRE(midea::hex::encode(vPackets[0]) == "b501118ef6");
	REQUIRE(midea::hex::encode(vPackets[1]) == "b501011381");

	REQUIRE_FALSE(codec.split_v2_reply(from_hex("0102030405"), vPackets));
	REQUIRE(codec.get_last_error_type() == midea::error::type::PROTOCOL);
}

TEST_CASE("V3 frame bodies", "[lanpacket]")
{
	MideaSecurity security;
	LanPacketCodec codec(security);
	std::vector<uint8_t> vPacket;

	SECTION("encrypted ZZ envelope")
	{
		std::vector<uint8_t> vBody;
		REQUIRE(codec.build("44", from_hex("aa0ea100000000000303b501118ef6"), true, vBody));
		REQUIRE(codec.unwrap_v3_response(vBody, vPacket) == 1);
		REQUIRE(midea::hex::encode(vPacket) == "b501118ef6");
	}

	SECTION("bare command")
	{
		REQUIRE(codec.unwrap_v3_response(from_hex("aa0ea100000000000303b501118ef6"), vPacket) == 1);
		REQUIRE(midea::hex::encode(vPacket) == "b501118ef6");
	}

	SECTION("header only")
	{
		REQUIRE(codec.unwrap_v3_response(from_hex("aa0ea10000000000"), vPacket) == 0);
		REQUIRE(vPacket.empty());
	}
}

TEST_CASE("Discovery reply of a v3 dehumidifier", "[lanpacket]")
{
	MideaSecurity security;
	LanPacketCodec codec(security);
	std::vector<uint8_t> vReply = from_hex(DISCOVERY_REPLY);
	REQUIRE(vReply.size() == 192);

	midea::lan::tDeviceIdentity identity;
	REQUIRE(codec.parse_discovery_reply(vReply, identity));
	REQUIRE(identity.version == 3);
	REQUIRE(identity.appliance_id == "6618611909121");
	REQUIRE(identity.address == "192.0.1.2");
	REQUIRE(identity.port == 6444);
	REQUIRE(identity.serial_number == "000000P0000000Q1123456789ABC0000");
	REQUIRE(identity.ssid == "net_a1_9ABC");
	REQUIRE(identity.mac == "123456789abc");
	REQUIRE(identity.type == "0xa1");
	REQUIRE(identity.udp_version == 0x04000000);
	REQUIRE(identity.protocol_version == "069fcd");
	REQUIRE(identity.firmware_version == "3.0.8");
}

TEST_CASE("Discovery replies of unknown devices", "[lanpacket]")
{
	MideaSecurity security;
	LanPacketCodec codec(security);
	midea::lan::tDeviceIdentity identity;

	REQUIRE(codec.parse_discovery_reply(from_hex("0102030405"), identity));
	REQUIRE(identity.version == 0);

	REQUIRE_FALSE(codec.parse_discovery_reply(from_hex("5a5a0111"), identity));
	REQUIRE(codec.get_last_error_type() == midea::error::type::PROTOCOL);
}

TEST_CASE("Discovery broadcast message", "[lanpacket]")
{
	REQUIRE(midea::lan::DISCOVERY_MSG[0] == 0x5A);
	REQUIRE(midea::lan::DISCOVERY_MSG[1] == 0x5A);
	REQUIRE(midea::lan::DISCOVERY_MSG[4] == DISCOVERY_MSG_SIZE);
}

TEST_CASE("Udp id in both byte orders", "[lanpacket]")
{
	REQUIRE(midea::lan::udp_id(6618611909121ULL, true) == "f002d4ef1688e8a107bc277a38bc6efd");
	REQUIRE(midea::lan::udp_id(6618611909121ULL, false) == "022e3830025d65adee0ab69dfaad54d5");
}

TEST_CASE("Short serial number", "[lanpacket]")
{
	REQUIRE(midea::lan::short_sn("000000P0000000Q1123456789ABC0000") == "P0000000Q1123456789ABC");
	REQUIRE(midea::lan::short_sn("P0000000Q1123456789ABC").empty());
}

TEST_CASE("Appliance id parsing", "[lanpacket]")
{
	uint64_t applianceId;
	REQUIRE(midea::lan::parse_appliance_id("6618611909121", applianceId));
	REQUIRE(applianceId == 6618611909121ULL);
	REQUIRE_FALSE(midea::lan::parse_appliance_id("", applianceId));
	REQUIRE_FALSE(midea::lan::parse_appliance_id("12a4", applianceId));
}
