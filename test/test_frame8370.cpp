/*
 * Copyright (c) 2024 Gordon Bos <gordon@bosvangennip.nl> All rights reserved.
 *
 * V3 (8370) framing tests
 *
 *
 * Source code subject to GNU GENERAL PUBLIC LICENSE version 3
 */

#include <catch2/catch.hpp>
#include "../src/protocol/Frame8370.hpp"
#include "../src/common/hexstring.hpp"


namespace {

const std::string TCP_KEY = "e047884511f9504a074dfeed0451bcff4f63d8d8aa779fa03d3049027d0ac78b";

std::vector<uint8_t> from_hex(const std::string &szHex)
{
	std::vector<uint8_t> vData;
	midea::hex::decode(szHex, vData);
	return vData;
}

}; // namespace


TEST_CASE("Handshake frames travel unencrypted", "[frame8370]")
{
	Frame8370Codec codec;
	std::vector<uint8_t> vFrame;
	REQUIRE(codec.encode(from_hex("010203"), midea::msgtype::HANDSHAKE_REQUEST, vFrame));
	REQUIRE(midea::hex::encode(vFrame) == "8370000320000000010203");
	REQUIRE(codec.get_request_count() == 1);

	std::vector<std::vector<uint8_t> > vFrames;
	std::vector<uint8_t> vLeftover;
	REQUIRE(codec.decode(vFrame, vFrames, vLeftover));
	REQUIRE(vFrames.size() == 1);
	REQUIRE(midea::hex::encode(vFrames[0]) == "010203");
	REQUIRE(vLeftover.empty());
}

TEST_CASE("Frame length is size field plus eight", "[frame8370]")
{
	Frame8370Codec codec;
	codec.set_tcp_key(from_hex(TCP_KEY));
	std::vector<uint8_t> vData(37, 0x11);
	std::vector<uint8_t> vFrame;

	REQUIRE(codec.encode(vData, midea::msgtype::TRANSPARENT, vFrame));
	REQUIRE(vFrame.size() == vData.size() + 8);

	REQUIRE(codec.encode(vData, midea::msgtype::ENCRYPTED_REQUEST, vFrame));
	size_t size = ((size_t)vFrame[2] << 8) | vFrame[3];
	REQUIRE(vFrame.size() == size + 8);
	// counter and data are padded to whole AES blocks
	REQUIRE(((vFrame.size() - FRAME_8370_HEADER_SIZE - FRAME_8370_SIGNATURE_SIZE) % 16) == 0);
	REQUIRE((vFrame[5] & 0x0F) == midea::msgtype::ENCRYPTED_REQUEST);
	REQUIRE((vFrame[5] >> 4) == 16 - ((37 + 2) % 16));
}

TEST_CASE("Encrypted frames round trip between peers", "[frame8370]")
{
	Frame8370Codec client;
	Frame8370Codec appliance;
	client.set_tcp_key(from_hex(TCP_KEY));
	appliance.set_tcp_key(from_hex(TCP_KEY));

	std::vector<uint8_t> vData = from_hex("5a5a01116800200000000000000000000000000000000000000000000000000000000000");
	std::vector<uint8_t> vFrame;
	REQUIRE(client.encode(vData, midea::msgtype::ENCRYPTED_REQUEST, vFrame));
	REQUIRE(client.encode(vData, midea::msgtype::ENCRYPTED_REQUEST, vFrame));

	std::vector<std::vector<uint8_t> > vFrames;
	std::vector<uint8_t> vLeftover;
	REQUIRE(appliance.decode(vFrame, vFrames, vLeftover));
	REQUIRE(vFrames.size() == 1);
	REQUIRE(vFrames[0] == vData);
	// second frame sent by the client carries counter 1
	REQUIRE(appliance.get_response_count() == 1);
}

TEST_CASE("Encrypted types need a session key", "[frame8370]")
{
	Frame8370Codec codec;
	std::vector<uint8_t> vFrame;
	REQUIRE_FALSE(codec.has_tcp_key());
	REQUIRE_FALSE(codec.encode(from_hex("0102"), midea::msgtype::ENCRYPTED_REQUEST, vFrame));
	REQUIRE(codec.get_last_error_type() == midea::error::type::PROTOCOL);
	REQUIRE(vFrame.empty());

	codec.set_tcp_key(from_hex(TCP_KEY));
	REQUIRE(codec.has_tcp_key());
	codec.clear_tcp_key();
	REQUIRE_FALSE(codec.has_tcp_key());
}

TEST_CASE("Chained frames with trailing partial data", "[frame8370]")
{
	Frame8370Codec sender;
	Frame8370Codec receiver;
	sender.set_tcp_key(from_hex(TCP_KEY));
	receiver.set_tcp_key(from_hex(TCP_KEY));

	std::vector<uint8_t> vFirst;
	std::vector<uint8_t> vSecond;
	REQUIRE(sender.encode(from_hex("aabbcc"), midea::msgtype::ENCRYPTED_RESPONSE, vFirst));
	REQUIRE(sender.encode(from_hex("ddeeff00"), midea::msgtype::ENCRYPTED_RESPONSE, vSecond));

	std::vector<uint8_t> vBuffer(vFirst);
	vBuffer.insert(vBuffer.end(), vSecond.begin(), vSecond.end());
	vBuffer.push_back(0x83);
	vBuffer.push_back(0x70);

	std::vector<std::vector<uint8_t> > vFrames;
	std::vector<uint8_t> vLeftover;
	REQUIRE(receiver.decode(vBuffer, vFrames, vLeftover));
	REQUIRE(vFrames.size() == 2);
	REQUIRE(midea::hex::encode(vFrames[0]) == "aabbcc");
	REQUIRE(midea::hex::encode(vFrames[1]) == "ddeeff00");
	REQUIRE(midea::hex::encode(vLeftover) == "8370");
}

TEST_CASE("Malformed frames are rejected", "[frame8370]")
{
	Frame8370Codec codec;
	codec.set_tcp_key(from_hex(TCP_KEY));
	std::vector<std::vector<uint8_t> > vFrames;
	std::vector<uint8_t> vLeftover;

	SECTION("bad magic")
	{
		REQUIRE_FALSE(codec.decode(from_hex("5a5a000320000000010203"), vFrames, vLeftover));
		REQUIRE(codec.get_last_error_type() == midea::error::type::PROTOCOL);
		REQUIRE(vFrames.empty());
	}

	SECTION("bad flag byte")
	{
		REQUIRE_FALSE(codec.decode(from_hex("8370000321000000010203"), vFrames, vLeftover));
		REQUIRE(codec.get_last_error_type() == midea::error::type::PROTOCOL);
	}

	SECTION("tampered signature")
	{
		std::vector<uint8_t> vFrame;
		REQUIRE(codec.encode(from_hex("c80101"), midea::msgtype::ENCRYPTED_RESPONSE, vFrame));
		vFrame.back() ^= 0x01;
		REQUIRE_FALSE(codec.decode(vFrame, vFrames, vLeftover));
		REQUIRE(codec.get_last_error_type() == midea::error::type::PROTOCOL);
	}
}

TEST_CASE("Incremental decoder assembles frames fed in pieces", "[frame8370]")
{
	Frame8370Codec sender;
	Frame8370Codec receiver;
	sender.set_tcp_key(from_hex(TCP_KEY));
	receiver.set_tcp_key(from_hex(TCP_KEY));
	Frame8370Decoder decoder(receiver);

	std::vector<uint8_t> vFrame;
	REQUIRE(sender.encode(from_hex("c801012800"), midea::msgtype::ENCRYPTED_RESPONSE, vFrame));

	std::vector<std::vector<uint8_t> > vFrames;
	REQUIRE(decoder.feed(std::vector<uint8_t>(vFrame.begin(), vFrame.begin() + 4), vFrames) == 0);
	REQUIRE(decoder.pending() == 4);
	REQUIRE(decoder.feed(std::vector<uint8_t>(vFrame.begin() + 4, vFrame.begin() + 20), vFrames) == 0);
	REQUIRE(decoder.pending() == 20);
	REQUIRE(decoder.feed(std::vector<uint8_t>(vFrame.begin() + 20, vFrame.end()), vFrames) == 1);
	REQUIRE(decoder.pending() == 0);
	REQUIRE(midea::hex::encode(vFrames[0]) == "c801012800");

	// garbage empties the buffer
	REQUIRE(decoder.feed(from_hex("00112233445566778899"), vFrames) == -1);
	REQUIRE(decoder.pending() == 0);

	decoder.feed(std::vector<uint8_t>(vFrame.begin(), vFrame.begin() + 10), vFrames);
	decoder.reset();
	REQUIRE(decoder.pending() == 0);
}

TEST_CASE("Only request and response carry encryption", "[frame8370]")
{
	REQUIRE(Frame8370Codec::is_encrypted_type(midea::msgtype::ENCRYPTED_REQUEST));
	REQUIRE(Frame8370Codec::is_encrypted_type(midea::msgtype::ENCRYPTED_RESPONSE));
	REQUIRE_FALSE(Frame8370Codec::is_encrypted_type(midea::msgtype::HANDSHAKE_REQUEST));
	REQUIRE_FALSE(Frame8370Codec::is_encrypted_type(midea::msgtype::HANDSHAKE_RESPONSE));
	REQUIRE_FALSE(Frame8370Codec::is_encrypted_type(midea::msgtype::TRANSPARENT));
}
