/*
 * Copyright (c) 2024 Gordon Bos <gordon@bosvangennip.nl> All rights reserved.
 *
 * Status response decoding tests
 *
 *
 * Source code subject to GNU GENERAL PUBLIC LICENSE version 3
 */

#include <catch2/catch.hpp>
#include "../src/command/DehumidifierCommand.hpp"
#include "../src/command/AirConditionerCommand.hpp"
#include "../src/common/hexstring.hpp"


namespace {

std::vector<uint8_t> from_hex(const std::string &szHex)
{
	std::vector<uint8_t> vData;
	midea::hex::decode(szHex, vData);
	return vData;
}

}; // namespace


TEST_CASE("Dehumidifier status reply", "[responses]")
{
	DehumidifierResponse response;
	REQUIRE(response.decode(from_hex("c80101287f7f003c00000000000000003f5000000000024238")));
	REQUIRE(response.run_status);
	REQUIRE(response.mode == 1);
	REQUIRE(response.fan_speed == 40);
	REQUIRE(response.current_humidity == 63);
	REQUIRE(response.target_humidity == Approx(60));
	REQUIRE_FALSE(response.tank_full);
	REQUIRE(response.indoor_temperature == Approx(15.0));
	REQUIRE(response.on_timer.hour == 0);
	REQUIRE_FALSE(response.on_timer.set);
	REQUIRE_FALSE(response.off_timer.set);
	REQUIRE(response.off_timer.hour == 31);
	REQUIRE(response.has_light_class);
	REQUIRE(response.to_string().find("current_humidity=63") != std::string::npos);
}

TEST_CASE("Dehumidifier status reply of a Cube 20", "[responses]")
{
	DehumidifierResponse response;
	REQUIRE(response.decode(from_hex("c80101507f7f0023000000000000004b1e580000000000080a28")));
	REQUIRE(response.current_humidity == 30);
	REQUIRE(response.target_humidity == Approx(35));
	REQUIRE(response.tank_warning_level == 75);
	REQUIRE(response.fan_speed == 80);
}

TEST_CASE("Dehumidifier status reply with a full warning level", "[responses]")
{
	DehumidifierResponse response;
	REQUIRE(response.decode(from_hex("c80101507f7f003c00000000000000641e440000000000098370")));
	REQUIRE(response.current_humidity == 30);
	REQUIRE(response.target_humidity == Approx(60));
	REQUIRE(response.tank_warning_level == 100);
}

TEST_CASE("Dehumidifier status reply of a Cube 50", "[responses]")
{
	DehumidifierResponse response;
	REQUIRE(response.decode(from_hex("c80101507f7f00280010000000000064255000000000000716f0")));
	REQUIRE(response.current_humidity == 37);
	REQUIRE(response.tank_warning_level == 100);
	REQUIRE(response.target_humidity == Approx(40));
	REQUIRE(response.pump_switch_flag);
	REQUIRE_FALSE(response.pump_switch);
}

TEST_CASE("Dehumidifier values out of range are clamped", "[responses]")
{
	DehumidifierResponse response;
	REQUIRE(response.decode(from_hex("c80101287f7f007c00000000000000003fa200000000024238")));
	REQUIRE(response.target_humidity == Approx(99));
	REQUIRE(response.indoor_temperature == Approx(50));

	// decimal part still applies to the capped value
	REQUIRE(response.decode(from_hex("c80101287f7f007c08000000000000003fa200000000024238")));
	REQUIRE(response.target_humidity == Approx(99.5));
}

TEST_CASE("Dehumidifier timers", "[responses]")
{
	DehumidifierResponse response;
	REQUIRE(response.decode(from_hex("c8010128855d363c00000000000000003f5000000000024238")));
	REQUIRE(response.on_timer.set);
	REQUIRE(response.on_timer.status);
	REQUIRE(response.on_timer.hour == 33);
	REQUIRE(response.on_timer.minutes == 3);
	REQUIRE(response.off_timer.set);
	REQUIRE_FALSE(response.off_timer.status);
	REQUIRE(response.off_timer.hour == 23);
	REQUIRE(response.off_timer.minutes == 7);
}

TEST_CASE("Short dehumidifier reply", "[responses]")
{
	DehumidifierResponse response;
	REQUIRE(response.decode(from_hex("c80101287f7f003c00000000000000003f5238")));
	REQUIRE(response.current_humidity == 63);
	REQUIRE(response.target_humidity == Approx(60));
	REQUIRE_FALSE(response.has_light_class);
	REQUIRE_FALSE(response.has_light_value);
	REQUIRE(response.err_code == 0);

	REQUIRE_FALSE(response.decode(from_hex("c80101287f7f003c0000")));
}

TEST_CASE("Air conditioner reply without sensors", "[responses]")
{
	AirConditionerResponse response;
	REQUIRE(response.decode(from_hex("c80101287f7f003c00000000000000003f5000000000024238")));
	REQUIRE(response.target_temperature == Approx(17));
	REQUIRE_FALSE(response.has_indoor_temperature);
	REQUIRE_FALSE(response.has_outdoor_temperature);
}

TEST_CASE("Air conditioner sensor temperatures", "[responses]")
{
	AirConditionerResponse response;

	SECTION("whole degrees")
	{
		REQUIRE(response.decode(from_hex("c80101287f7f003c00000040200000003f5000000000024238")));
		REQUIRE(response.indoor_temperature == Approx(7));
		REQUIRE(response.outdoor_temperature == Approx(-9));
	}

	SECTION("half degrees")
	{
		REQUIRE(response.decode(from_hex("c80101287f7f003c00000041210000003f5000000000024238")));
		REQUIRE(response.indoor_temperature == Approx(7.5));
		REQUIRE(response.outdoor_temperature == Approx(-8.5));
	}

	SECTION("tenths below and above zero")
	{
		REQUIRE(response.decode(from_hex("c80101287f7f003c00000042240000243f5000000000024238")));
		REQUIRE(response.has_indoor_temperature);
		REQUIRE(response.indoor_temperature == Approx(8.4));
		REQUIRE(response.outdoor_temperature == Approx(-7.2));

		REQUIRE(response.decode(from_hex("c80101287f7f003c00000022520000373f5000000000024238")));
		REQUIRE(response.indoor_temperature == Approx(-8.7));
		REQUIRE(response.outdoor_temperature == Approx(16.3));
	}
}

TEST_CASE("Air conditioner mode and half degree target", "[responses]")
{
	AirConditionerResponse response;
	REQUIRE(response.decode(from_hex("c00052667f7f003c000004565a0070000000000000000001aca8")));
	REQUIRE(response.mode == 2);
	REQUIRE(response.target_temperature == Approx(18.5));
	REQUIRE(response.to_string().find("mode=2") != std::string::npos);
}
