/*
 * Copyright (c) 2024 Gordon Bos <gordon@bosvangennip.nl> All rights reserved.
 *
 * Logging facility tests
 *
 *
 * Source code subject to GNU GENERAL PUBLIC LICENSE version 3
 */

#include <catch2/catch.hpp>
#include "../src/common/Logger.hpp"


TEST_CASE("Default log levels", "[logger]")
{
	CLogger logger;
	REQUIRE(logger.IsLogLevelEnabled(LOG_NORM));
	REQUIRE(logger.IsLogLevelEnabled(LOG_STATUS));
	REQUIRE(logger.IsLogLevelEnabled(LOG_ERROR));
	REQUIRE_FALSE(logger.IsLogLevelEnabled(LOG_DEBUG_INT));
	REQUIRE_FALSE(logger.IsDebugLevelEnabled(DEBUG_NORM));

	logger.Log(LOG_STATUS, "unknown property=%02X%02X", 0xFF, 0x02);
	logger.Debug(DEBUG_LAN, "not recorded");
	REQUIRE(logger.GetLog().size() == 1);
	REQUIRE(logger.Contains("unknown property=FF02"));
	REQUIRE_FALSE(logger.Contains("not recorded"));
}

TEST_CASE("Level names", "[logger]")
{
	CLogger logger;

	REQUIRE(logger.SetLogFlags(std::string("error")));
	logger.Log(LOG_NORM, "normal line");
	logger.Log(LOG_ERROR, "broken");
	REQUIRE_FALSE(logger.Contains("normal line"));
	REQUIRE(logger.GetLog().back().logmessage == "Error: broken");

	REQUIRE(logger.SetLogFlags(std::string("info,warning")));
	REQUIRE(logger.IsLogLevelEnabled(LOG_NORM));
	REQUIRE_FALSE(logger.IsLogLevelEnabled(LOG_STATUS));

	REQUIRE_FALSE(logger.SetLogFlags(std::string("normal,verbose")));
	REQUIRE_FALSE(logger.SetDebugFlags(std::string("lan,bluetooth")));
}

TEST_CASE("Debug categories", "[logger]")
{
	CLogger logger;
	REQUIRE(logger.SetDebugFlags(std::string("lan,protocol")));
	REQUIRE(logger.IsLogLevelEnabled(LOG_DEBUG_INT));
	REQUIRE(logger.IsDebugLevelEnabled(DEBUG_LAN));
	REQUIRE(logger.IsDebugLevelEnabled(DEBUG_PROTOCOL));
	REQUIRE_FALSE(logger.IsDebugLevelEnabled(DEBUG_CLOUD));

	logger.Debug(DEBUG_LAN, "connecting to %s", "192.0.1.2");
	logger.Debug(DEBUG_CLOUD, "login");
	REQUIRE(logger.GetLog().size() == 1);
	REQUIRE(logger.GetLog().front().logmessage == "Debug: connecting to 192.0.1.2");
	REQUIRE(logger.GetLog().front().level == LOG_DEBUG_INT);

	logger.SetDebugFlags((uint32_t)0);
	REQUIRE_FALSE(logger.IsLogLevelEnabled(LOG_DEBUG_INT));
	REQUIRE_FALSE(logger.IsDebugLevelEnabled(DEBUG_LAN));
}

TEST_CASE("Backlog is bounded", "[logger]")
{
	CLogger logger;
	logger.SetBacklogSize(3);
	for (int i = 0; i < 5; i++)
		logger.Log(LOG_NORM, "line %d", i);
	REQUIRE(logger.GetLog().size() == 3);
	REQUIRE(logger.GetLog().front().logmessage == "line 2");

	logger.SetBacklogSize(1);
	REQUIRE(logger.GetLog().size() == 1);
	REQUIRE(logger.GetLog().front().logmessage == "line 4");

	logger.ClearLog();
	REQUIRE(logger.GetLog().empty());
}

TEST_CASE("Output file", "[logger]")
{
	CLogger logger;
	REQUIRE(logger.SetOutputFile(""));
	REQUIRE_FALSE(logger.SetOutputFile("/nonexistent/dir/midea.log"));
}
