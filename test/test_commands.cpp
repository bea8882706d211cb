/*
 * Copyright (c) 2024 Gordon Bos <gordon@bosvangennip.nl> All rights reserved.
 *
 * Appliance command encoding tests
 *
 *
 * Source code subject to GNU GENERAL PUBLIC LICENSE version 3
 */

#include <catch2/catch.hpp>
#include "../src/command/DehumidifierCommand.hpp"
#include "../src/command/AirConditionerCommand.hpp"
#include "../src/common/hexstring.hpp"


namespace {

std::string finalized(MideaCommand &command, const uint8_t start = 0)
{
	MideaCommandSequence sequence(start);
	return midea::hex::encode(command.finalize(sequence));
}

}; // namespace


TEST_CASE("Message ids wrap at 256", "[commands]")
{
	MideaCommandSequence sequence;
	REQUIRE(sequence.current() == 0);
	REQUIRE(sequence.next() == 1);
	REQUIRE(sequence.current() == 1);

	sequence.reset(255);
	REQUIRE(sequence.next() == 0);
	sequence.reset();
	REQUIRE(sequence.current() == 0);
}

TEST_CASE("Capability queries", "[commands]")
{
	DeviceCapabilitiesCommand dehumidifier(0xA1);
	REQUIRE(finalized(dehumidifier) == "aa0ea100000000000303b501118ef6");

	DeviceCapabilitiesCommandMore dehumidifierMore(0xA1);
	REQUIRE(finalized(dehumidifierMore) == "aa0ea100000000000303b501011381");

	DeviceCapabilitiesCommand airconditioner(0xAC);
	REQUIRE(finalized(airconditioner) == "aa0eac00000000000303b501118eeb");

	DeviceCapabilitiesCommandMore airconditionerMore(0xAC);
	REQUIRE(finalized(airconditionerMore) == "aa0eac00000000000303b501011376");
}

TEST_CASE("Capability query length byte excludes the sync byte", "[commands]")
{
	MideaCommandSequence sequence;
	DeviceCapabilitiesCommand first(0xA1);
	DeviceCapabilitiesCommandMore second(0xA1);
	std::vector<uint8_t> vFirst = first.finalize(sequence);
	std::vector<uint8_t> vSecond = second.finalize(sequence);
	REQUIRE((size_t)vFirst[1] == vFirst.size() - 1);
	REQUIRE((size_t)vSecond[1] == vSecond.size() - 1);
	REQUIRE(vFirst[12] == 0x11);
	REQUIRE(vSecond[12] == 0x01);
}

TEST_CASE("Capability queries do not use the message id", "[commands]")
{
	MideaCommandSequence sequence(7);
	DeviceCapabilitiesCommand command(0xA1);
	command.finalize(sequence);
	REQUIRE(sequence.current() == 7);
}

TEST_CASE("Dehumidifier status query", "[commands]")
{
	DehumidifierStatusCommand command;
	REQUIRE(finalized(command) == "aa20a100000000000003418100ff03ff000000000000000000000000000001294f");
}

TEST_CASE("Dehumidifier set command defaults", "[commands]")
{
	DehumidifierSetCommand command;
	REQUIRE(command.get_mode() == 1);
	REQUIRE(command.get_fan_speed() == 50);
	REQUIRE(command.get_target_humidity() == 0);
	REQUIRE(command.get_tank_warning_level() == 0);
	REQUIRE_FALSE(command.get_running());
	REQUIRE_FALSE(command.get_beep_prompt());
	REQUIRE_FALSE(command.get_pump_switch_flag());
}

TEST_CASE("Dehumidifier set command fields", "[commands]")
{
	DehumidifierSetCommand command;

	SECTION("pump switch flag")
	{
		command.set_pump_switch_flag(true);
		REQUIRE(command.get_pump_switch_flag());
		REQUIRE(finalized(command) == "aa20a100000000000302480001320000000000100000000000000000000001e8c6");
	}

	SECTION("tank warning level")
	{
		command.set_tank_warning_level(50);
		REQUIRE(command.get_tank_warning_level() == 50);
		REQUIRE(finalized(command) == "aa20a1000000000003024800013200000000000000000032000000000000014448");
	}

	SECTION("flags are independent")
	{
		command.set_running(true);
		command.set_beep_prompt(true);
		command.set_ion_mode(true);
		command.set_sleep_switch(true);
		command.set_vertical_swing(true);
		command.set_pump_switch(true);
		REQUIRE(command.get_running());
		REQUIRE(command.get_beep_prompt());
		REQUIRE(command.get_ion_mode());
		REQUIRE(command.get_sleep_switch());
		REQUIRE(command.get_vertical_swing());
		REQUIRE(command.get_pump_switch());
		REQUIRE_FALSE(command.get_pump_switch_flag());

		command.set_running(false);
		REQUIRE_FALSE(command.get_running());
		REQUIRE(command.get_beep_prompt());
	}

	SECTION("mode, fan speed and humidity")
	{
		command.set_mode(3);
		command.set_fan_speed(60);
		command.set_target_humidity(45);
		REQUIRE(command.get_mode() == 3);
		REQUIRE(command.get_fan_speed() == 60);
		REQUIRE(command.get_target_humidity() == 45);
	}
}

TEST_CASE("Air conditioner status query", "[commands]")
{
	AirConditionerStatusCommand command;
	REQUIRE(finalized(command) == "aa20ac00000000000003418100ff03ff00020000000000000000000000000171fa");

	AirConditionerStatusCommand second;
	REQUIRE(finalized(second, 2) == "aa20ac00000000000003418100ff03ff000200000000000000000000000003cd9c");

	AirConditionerStatusCommand third;
	REQUIRE(finalized(third, 0x10) == "aa20ac00000000000003418100ff03ff000200000000000000000000000011ec6f");
}

TEST_CASE("Air conditioner set command defaults", "[commands]")
{
	AirConditionerSetCommand command;
	REQUIRE_FALSE(command.get_running());
	REQUIRE_FALSE(command.get_beep_prompt());
	REQUIRE(command.get_mode() == 0);
	REQUIRE(command.get_fan_speed() == 0);
	REQUIRE(command.get_temperature() == Approx(16.0));
	REQUIRE_FALSE(command.get_turbo());
	REQUIRE_FALSE(command.get_screen());
	REQUIRE_FALSE(command.get_eco_mode());
	REQUIRE_FALSE(command.get_vertical_swing());
	REQUIRE_FALSE(command.get_horizontal_swing());
}

TEST_CASE("Air conditioner set command fields", "[commands]")
{
	AirConditionerSetCommand command;
	command.set_beep_prompt(true);
	command.set_screen(true);
	command.set_fan_speed(48);
	REQUIRE(finalized(command) == "aa23ac0000000000000240400030000000000000100000000000000000000100000078f6");

	command.set_mode(2);
	REQUIRE(command.get_mode() == 2);
	REQUIRE(finalized(command) == "aa23ac00000000000002404040300000000000001000000000000000000001000000ce60");
}

TEST_CASE("Air conditioner half degree temperatures", "[commands]")
{
	AirConditionerSetCommand command;
	command.set_beep_prompt(true);
	command.set_screen(true);
	command.set_turbo(true);
	command.set_fan_speed(40);
	REQUIRE(finalized(command) == "aa23ac000000000000024040002800000000000012000000000000000000010000000173");

	command.set_fan_speed(45);
	command.set_temperature(20.5);
	REQUIRE(command.get_temperature() == Approx(20.5));
	REQUIRE(finalized(command) == "aa23ac000000000000024040142d0000000000001200000000000000000001000000a7b4");
}

TEST_CASE("Air conditioner swing bits", "[commands]")
{
	AirConditionerSetCommand command;
	command.set_vertical_swing(true);
	REQUIRE(command.get_vertical_swing());
	REQUIRE_FALSE(command.get_horizontal_swing());

	command.set_horizontal_swing(true);
	REQUIRE(command.get_vertical_swing());
	REQUIRE(command.get_horizontal_swing());

	command.set_vertical_swing(false);
	command.set_horizontal_swing(false);
	REQUIRE_FALSE(command.get_vertical_swing());
	REQUIRE_FALSE(command.get_horizontal_swing());
}
