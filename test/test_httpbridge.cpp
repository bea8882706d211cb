/*
 * Copyright (c) 2024 Gordon Bos <gordon@bosvangennip.nl> All rights reserved.
 *
 * HTTP bridge encoding and response mapping tests
 *
 *
 * Source code subject to GNU GENERAL PUBLIC LICENSE version 3
 */

#include <catch2/catch.hpp>
#include "../src/connection/MideaHTTPBridge.hpp"
#include "../src/common/jsoncppbridge.hpp"


TEST_CASE("URL encoding", "[httpbridge]")
{
	REQUIRE(MideaHTTPBridge::URLEncode("abcXYZ019-_.~") == "abcXYZ019-_.~");
	REQUIRE(MideaHTTPBridge::URLEncode("user@example.com") == "user%40example.com");
	REQUIRE(MideaHTTPBridge::URLEncode("a b&c=d/e") == "a%20b%26c%3Dd%2Fe");
	REQUIRE(MideaHTTPBridge::URLEncode("\xc3\xa9") == "%C3%A9");
	REQUIRE(MideaHTTPBridge::URLEncode("").empty());
}

TEST_CASE("Form encoding keeps key order", "[httpbridge]")
{
	std::map<std::string, std::string> mFields;
	mFields["stamp"] = "20240101120000";
	mFields["appId"] = "1017";
	mFields["loginAccount"] = "user@example.com";
	REQUIRE(MideaHTTPBridge::FormEncode(mFields) == "appId=1017&loginAccount=user%40example.com&stamp=20240101120000");
	REQUIRE(MideaHTTPBridge::FormEncode(std::map<std::string, std::string>()).empty());
}

TEST_CASE("Successful JSON responses pass through", "[httpbridge]")
{
	std::string szResponse = "{\"errorCode\":\"0\"}";
	std::vector<std::string> vHeaders = { "HTTP/1.1 200 OK", "Content-Type: application/json" };
	REQUIRE(MideaHTTPBridge::ProcessResponse(szResponse, vHeaders, true));
	REQUIRE(szResponse == "{\"errorCode\":\"0\"}");
}

TEST_CASE("Transfer errors become cloud style errors", "[httpbridge]")
{
	std::string szResponse;

	SECTION("curl failure")
	{
		std::vector<std::string> vHeaders = { "CURLE 28 Timeout was reached" };
		REQUIRE_FALSE(MideaHTTPBridge::ProcessResponse(szResponse, vHeaders, false));
		REQUIRE(szResponse == "{\"errorCode\":\"28\",\"msg\":\"Timeout was reached\"}");
	}

	SECTION("client initialisation failure")
	{
		std::vector<std::string> vHeaders = { "CURLE -1 Failed to create HTTP handle" };
		REQUIRE_FALSE(MideaHTTPBridge::ProcessResponse(szResponse, vHeaders, false));
		REQUIRE(szResponse == "{\"errorCode\":\"-1\",\"msg\":\"Failed to create HTTP handle\"}");
	}

	SECTION("http status")
	{
		szResponse = "{\"error\":\"missing\"}";
		std::vector<std::string> vHeaders = { "HTTP/1.1 100 Continue", "HTTP/1.1 404 Not Found" };
		REQUIRE_FALSE(MideaHTTPBridge::ProcessResponse(szResponse, vHeaders, true));
		REQUIRE(szResponse == "{\"errorCode\":\"404\",\"msg\":\"Not Found\"}");
	}

	SECTION("empty body")
	{
		std::vector<std::string> vHeaders = { "HTTP/1.1 204 No Content" };
		REQUIRE_FALSE(MideaHTTPBridge::ProcessResponse(szResponse, vHeaders, true));
		REQUIRE(szResponse == "{\"errorCode\":\"204\",\"msg\":\"No Content\"}");
	}

	SECTION("html page")
	{
		szResponse = "<html><head><title>Service \"Unavailable\"</title></head></html>";
		std::vector<std::string> vHeaders = { "HTTP/1.1 200 OK" };
		REQUIRE_FALSE(MideaHTTPBridge::ProcessResponse(szResponse, vHeaders, true));
		REQUIRE(szResponse == "{\"errorCode\":\"200\",\"msg\":\"Service \\\"Unavailable\\\"\"}");
	}

	SECTION("plain text")
	{
		szResponse = "teapot";
		std::vector<std::string> vHeaders;
		REQUIRE_FALSE(MideaHTTPBridge::ProcessResponse(szResponse, vHeaders, true));
		REQUIRE(szResponse == "{\"errorCode\":\"-1\",\"msg\":\"unhandled response\"}");
	}
}

TEST_CASE("Only status lines are kept from the reply headers", "[httpbridge]")
{
	REQUIRE(MideaHTTPBridge::IsStatusLine("HTTP/1.1 200 OK"));
	REQUIRE(MideaHTTPBridge::IsStatusLine("HTTP/2 503"));
	REQUIRE(MideaHTTPBridge::IsStatusLine("CURLE 7 Couldn't connect to server"));
	REQUIRE_FALSE(MideaHTTPBridge::IsStatusLine("Content-Type: application/json"));
	REQUIRE_FALSE(MideaHTTPBridge::IsStatusLine(""));

	std::string szResponse;
	std::vector<std::string> vHeaders = { "HTTP/2 503" };
	REQUIRE_FALSE(MideaHTTPBridge::ProcessResponse(szResponse, vHeaders, true));
	REQUIRE(szResponse == "{\"errorCode\":\"503\",\"msg\":\"HTTP 503\"}");
}

TEST_CASE("Form post to a closed port", "[httpbridge]")
{
	std::string szResponse;
	REQUIRE_FALSE(MideaHTTPBridge::PostForm("http://127.0.0.1:1/v1/user/login/id/get", "appId=1017", szResponse, 2));

	Json::Value jError;
	REQUIRE(midea::parse_json_string(szResponse, jError) == 0);
	REQUIRE(jError["errorCode"].asString() != "0");
	REQUIRE_FALSE(jError["msg"].asString().empty());
}
