/*
 * Copyright (c) 2024 Gordon Bos <gordon@bosvangennip.nl> All rights reserved.
 *
 * Cryptographic service tests
 *
 *
 * Source code subject to GNU GENERAL PUBLIC LICENSE version 3
 */

#include <catch2/catch.hpp>
#include "../src/crypto/Security.hpp"
#include "../src/common/hexstring.hpp"


namespace {

const std::string QUERY_CSV = "90,90,1,0,89,0,32,0,1,0,0,0,39,36,17,9,13,10,18,20,-38,73,0,0,0,16,0,0,0,0,0,0,0,0,0,0,0,0,0,0,-86,32,-95,0,0,0,0,0,3,3,65,33,0,-1,3,0,0,2,0,0,0,0,0,0,0,0,0,0,0,0,11,36,-92,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0";
const std::string QUERY_ENCRYPTED = "7c8911b6de8e29fa9a1538def06c9018a9995980893554fb80fd87c5478ac78b360f7b35433b8d451464bdcd3746c4f5c05a8099eceb79aeb9cc2cc712f90f1c9b3bb091bcf0e90bddf62d36f29550796c55acf8e637f7d3d68d11be993df933d94b2b43763219c85eb21b4d9bb9891f1ab4ccf24185ccbcc78c393a9212c24bef3466f9b3f18a6aabcd58e80ce9df61ccf13885ebd714595df69709f09722ff41eb37ea5b06f727b7fab01c94588459ccf13885ebd714595df69709f09722ff32b544a259d2fa6e7ddaac1fdff91bb0";
const std::string ACCESS_TOKEN = "87836529d24810fb715db61f2d3eba2ab920ebb829d567559397ded751813801";

std::vector<uint8_t> from_hex(const std::string &szHex)
{
	std::vector<uint8_t> vData;
	midea::hex::decode(szHex, vData);
	return vData;
}

}; // namespace


TEST_CASE("Login request signature", "[security]")
{
	MideaSecurity security;
	std::map<std::string, std::string> mPayload;
	mPayload["loginAccount"] = "user@example.com";
	mPayload["appId"] = "1017";
	mPayload["clientType"] = "1";
	mPayload["format"] = "2";
	mPayload["language"] = "en_US";
	mPayload["src"] = "17";
	mPayload["stamp"] = "20211226190000";

	std::string szExpected = "d1d0b37a6cc407e9b8fcecc1f2e250f6a9cfd83cfbf7e4443d30a34cb4e9a62d";
	REQUIRE(security.sign("/v1/user/login/id/get", mPayload) == szExpected);
	// host part and query string do not take part in the signature
	REQUIRE(security.sign("https://mapp.appsmb.com/v1/user/login/id/get", mPayload) == szExpected);
	REQUIRE(security.sign("https://mapp.appsmb.com/v1/user/login/id/get?x=1", mPayload) == szExpected);
}

TEST_CASE("Password hash", "[security]")
{
	MideaSecurity security;
	REQUIRE(security.encrypt_password("592758da-e522-4263-9cea-3bac916a0416", "passwordExample") == "f6a8f970344eb9b84f770d8eb9e8b511f4799bbce29bdef6990277783c243b5f");
}

TEST_CASE("Proxied request signature", "[security]")
{
	MideaSecurity security("ac21b9f9cbfe4ca5a88562ef25e2b768", midea::DEFAULT_SIGNKEY, "meicloud", "PROD_VnoClJI9aikS8dyy");
	std::string szData = "{\"appVersion\":\"2.22.0\",\"src\":\"10\",\"retryCount\":\"3\",\"format\":2,\"androidApiLevel\":\"27\",\"stamp\":\"20220216161350\",\"language\":\"en\",\"platformId\":\"1\",\"userName\":\"test@example.com\",\"clientVersion\":\"2.22.0\",\"deviceId\":\"babadeda\",\"reqId\":\"d0f7eb1638e3480bbbde67a22bf41298\",\"uid\":\"\",\"clientType\":1,\"appId\":\"1010\",\"userType\":\"0\",\"appVNum\":\"2.22.0\",\"deviceBrand\":\"Test device\"}";
	REQUIRE(security.sign_proxied(std::map<std::string, std::string>(), szData, "1645024430315") == "63c353e308fd7b6d1b84c55aedfbc70624974a6251d5f2992d408cd82135b812");
}

TEST_CASE("Data key from access token", "[security]")
{
	MideaSecurity security;
	REQUIRE(security.get_data_key().empty());

	REQUIRE(security.set_access_token("f4fe051b7611d07d54a7f0a5e07ca2beb920ebb829d567559397ded751813801"));
	REQUIRE(security.get_data_key() == "23f4b15525824bc3");

	REQUIRE(security.set_access_token(ACCESS_TOKEN));
	REQUIRE(security.get_data_key() == "22a12ec5fa154c5b");
	REQUIRE(security.get_access_token() == ACCESS_TOKEN);
}

TEST_CASE("Invalid access token keeps the previous data key", "[security]")
{
	MideaSecurity security;
	REQUIRE(security.set_access_token(ACCESS_TOKEN));
	REQUIRE_FALSE(security.set_access_token("not hex"));
	REQUIRE(security.get_data_key() == "22a12ec5fa154c5b");
}

TEST_CASE("String encryption with the data key", "[security]")
{
	MideaSecurity security;
	std::string szEncrypted;

	SECTION("without data key")
	{
		REQUIRE_FALSE(security.aes_encrypt_string(QUERY_CSV, szEncrypted));
		REQUIRE(security.get_last_error_type() == midea::error::type::GENERIC);
	}

	SECTION("query packet")
	{
		REQUIRE(security.set_access_token(ACCESS_TOKEN));
		REQUIRE(security.aes_encrypt_string(QUERY_CSV, szEncrypted));
		REQUIRE(szEncrypted == QUERY_ENCRYPTED);

		std::string szDecrypted;
		REQUIRE(security.aes_decrypt_string(QUERY_ENCRYPTED, szDecrypted));
		REQUIRE(szDecrypted == QUERY_CSV);
	}

	SECTION("serial number")
	{
		REQUIRE(security.aes_encrypt_string("000000P0000000Q1123456789ABC0000", szEncrypted, "22a12ec5fa154c5b"));
		REQUIRE(szEncrypted == "a88c9c9261514e41137978149b1df026b2f1e391fcf649bcca3c64973366525624f70ad3c44d0fb74047aa339c5684f8");
	}

	SECTION("malformed cipher text")
	{
		std::string szDecrypted;
		REQUIRE_FALSE(security.aes_decrypt_string("xyz", szDecrypted, "22a12ec5fa154c5b"));
		REQUIRE(security.get_last_error_type() == midea::error::type::PROTOCOL);
	}
}

TEST_CASE("Legacy packet cipher", "[security]")
{
	MideaSecurity security;
	std::vector<uint8_t> vPlain = from_hex("aa0ea100000000000303b501118ef6");
	std::vector<uint8_t> vEncrypted;
	REQUIRE(security.aes_encrypt(vPlain, vEncrypted));
	REQUIRE(vEncrypted.size() == 16);

	std::vector<uint8_t> vDecrypted;
	REQUIRE(security.aes_decrypt(vEncrypted, vDecrypted));
	REQUIRE(vDecrypted == vPlain);
}

TEST_CASE("CBC cipher leaves block aligned data unpadded", "[security]")
{
	MideaSecurity security;
	std::vector<uint8_t> vKey = from_hex("e047884511f9504a074dfeed0451bcff4f63d8d8aa779fa03d3049027d0ac78b");
	std::vector<uint8_t> vPlain(32, 0x5A);
	std::vector<uint8_t> vEncrypted;
	REQUIRE(security.aes_cbc_encrypt(vPlain, vKey, vEncrypted));
	REQUIRE(vEncrypted.size() == 32);

	std::vector<uint8_t> vDecrypted;
	REQUIRE(security.aes_cbc_decrypt(vEncrypted, vKey, vDecrypted));
	REQUIRE(vDecrypted == vPlain);
}

TEST_CASE("Session key from the handshake reply", "[security]")
{
	MideaSecurity security;
	std::vector<uint8_t> vKey = from_hex("a1a0b37a6cc407e9b8fcecc1f2e250f6a9cfd83cfbf7e4443d30a34cb4e9a62d");
	std::vector<uint8_t> vTcpKey;

	SECTION("valid reply")
	{
		std::vector<uint8_t> vResponse = from_hex("d4de051b7611d07d54a7f0a5e07ca2beb920ebb829d567559397ded751813801a2cb561936668c8f117d2ec0d5b74ba8c9a8381650c1ba2b42359af7baafdd00");
		REQUIRE(security.tcp_key(vResponse, vKey, vTcpKey));
		REQUIRE(midea::hex::encode(vTcpKey) == "e047884511f9504a074dfeed0451bcff4f63d8d8aa779fa03d3049027d0ac78b");
	}

	SECTION("error packet")
	{
		REQUIRE_FALSE(security.tcp_key(midea::bytes::from_string("ERROR"), vKey, vTcpKey));
		REQUIRE(security.get_last_error_type() == midea::error::type::AUTHENTICATION);
	}

	SECTION("short reply")
	{
		REQUIRE_FALSE(security.tcp_key(midea::bytes::from_string("TOOSHORT"), vKey, vTcpKey));
		REQUIRE(security.get_last_error_type() == midea::error::type::AUTHENTICATION);
	}

	SECTION("signature mismatch")
	{
		std::vector<uint8_t> vResponse = from_hex("a4ae051b7611d07d54a7f0a5e07ca2beb920ebb829d567559397ded751813801ffff5652c2faa70eaeae6c8b50d0af9a9a227f02cbab0161b9bd3abf59c75244");
		REQUIRE_FALSE(security.tcp_key(vResponse, vKey, vTcpKey));
		REQUIRE(security.get_last_error_type() == midea::error::type::AUTHENTICATION);
		REQUIRE(vTcpKey.empty());
	}
}

TEST_CASE("Digest helpers", "[security]")
{
	REQUIRE(MideaSecurity::md5_hex("") == "d41d8cd98f00b204e9800998ecf8427e");
	REQUIRE(MideaSecurity::sha256_hex("abc") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
	REQUIRE(MideaSecurity::sha256(midea::bytes::from_string("abc")).size() == 32);
	REQUIRE(MideaSecurity::md5(midea::bytes::from_string("abc")).size() == 16);
}
