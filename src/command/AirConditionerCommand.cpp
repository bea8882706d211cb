/*
 * Copyright (c) 2024 Gordon Bos <gordon@bosvangennip.nl> All rights reserved.
 *
 * Air conditioner (0xAC) commands and status response
 *
 *
 * Source code subject to GNU GENERAL PUBLIC LICENSE version 3
 */

#include "AirConditionerCommand.hpp"
#include "../common/definitions.hpp"
#include <sstream>
#include <iomanip>


AirConditionerStatusCommand::AirConditionerStatusCommand() :
	MideaSequenceCommand(std::vector<uint8_t>({
		0xAA, 0x20, 0xAC, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x03,
		0x41, 0x81, 0x00, 0xFF, 0x03, 0xFF, 0x00, 0x02, 0x00, 0x00,
		0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
		0x00, 0x00, 0x00
	}))
{
}


AirConditionerSetCommand::AirConditionerSetCommand() :
	MideaSequenceCommand(std::vector<uint8_t>({
		0xAA, 0x23, 0xAC, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x02,
		0x40, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
		0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
		0x00, 0x00, 0x00, 0x00, 0x00, 0x00
	}))
{
}

bool AirConditionerSetCommand::get_running() const
{
	return get_bit(11, 0x01);
}

void AirConditionerSetCommand::set_running(const bool state)
{
	set_bit(11, 0x01, state);
}

bool AirConditionerSetCommand::get_beep_prompt() const
{
	return get_bit(11, 0x40);
}

void AirConditionerSetCommand::set_beep_prompt(const bool state)
{
	set_bit(11, 0x40, state);
}

int AirConditionerSetCommand::get_mode() const
{
	return get_bits(12, 0xE0, 5);
}

void AirConditionerSetCommand::set_mode(const int mode)
{
	set_bits(12, 0xE0, (uint8_t)(mode & 0x07), 5);
}

double AirConditionerSetCommand::get_temperature() const
{
	return get_bits(12, 0x0F) + 16.0 + (get_bit(12, 0x10) ? 0.5 : 0.0);
}

void AirConditionerSetCommand::set_temperature(const double temperature)
{
	set_bits(12, 0x1F, 0);
	if ((temperature < MIDEA_AC_MIN_TEMPERATURE) || (temperature > MIDEA_AC_MAX_TEMPERATURE))
		return;
	int whole = (int)temperature;
	set_bits(12, 0x0F, (uint8_t)(whole - MIDEA_AC_MIN_TEMPERATURE));
	set_bit(12, 0x10, (temperature - whole) >= 0.5);
}

int AirConditionerSetCommand::get_fan_speed() const
{
	return get_bits(13, 0x7F);
}

void AirConditionerSetCommand::set_fan_speed(const int speed)
{
	set_bits(13, 0x7F, (uint8_t)speed);
}

/* private */ void AirConditionerSetCommand::update_swing(const bool vertical, const bool horizontal)
{
	uint8_t swing = 0;
	if (vertical || horizontal)
		swing = 0x30;
	if (vertical)
		swing |= 0x0C;
	if (horizontal)
		swing |= 0x03;
	m_vData[17] = swing;
}

bool AirConditionerSetCommand::get_vertical_swing() const
{
	return get_bit(17, 0x0C);
}

void AirConditionerSetCommand::set_vertical_swing(const bool state)
{
	update_swing(state, get_horizontal_swing());
}

bool AirConditionerSetCommand::get_horizontal_swing() const
{
	return get_bit(17, 0x03);
}

void AirConditionerSetCommand::set_horizontal_swing(const bool state)
{
	update_swing(get_vertical_swing(), state);
}

bool AirConditionerSetCommand::get_turbo_fan() const
{
	return get_bit(18, 0x20);
}

void AirConditionerSetCommand::set_turbo_fan(const bool state)
{
	set_bit(18, 0x20, state);
}

bool AirConditionerSetCommand::get_dryer() const
{
	return get_bit(19, 0x04);
}

void AirConditionerSetCommand::set_dryer(const bool state)
{
	set_bit(19, 0x04, state);
}

bool AirConditionerSetCommand::get_purifier() const
{
	return get_bit(19, 0x20);
}

void AirConditionerSetCommand::set_purifier(const bool state)
{
	set_bit(19, 0x20, state);
}

bool AirConditionerSetCommand::get_eco_mode() const
{
	return get_bit(19, 0x80);
}

void AirConditionerSetCommand::set_eco_mode(const bool state)
{
	set_bit(19, 0x80, state);
}

bool AirConditionerSetCommand::get_comfort_sleep() const
{
	return get_bit(20, 0x80);
}

void AirConditionerSetCommand::set_comfort_sleep(const bool state)
{
	set_bit(20, 0x80, state);
	set_bits(18, 0x03, state ? 0x03 : 0x00);
}

bool AirConditionerSetCommand::get_fahrenheit() const
{
	return get_bit(20, 0x04);
}

void AirConditionerSetCommand::set_fahrenheit(const bool state)
{
	set_bit(20, 0x04, state);
}

bool AirConditionerSetCommand::get_turbo() const
{
	return get_bit(20, 0x02);
}

void AirConditionerSetCommand::set_turbo(const bool state)
{
	set_bit(20, 0x02, state);
}

bool AirConditionerSetCommand::get_screen() const
{
	return get_bit(20, 0x10);
}

void AirConditionerSetCommand::set_screen(const bool state)
{
	set_bit(20, 0x10, state);
}


/************************************************************************
 *									*
 *	Status response							*
 *									*
 ************************************************************************/

AirConditionerResponse::AirConditionerResponse()
{
	decode(std::vector<uint8_t>(AIRCONDITIONER_RESPONSE_MIN_SIZE, 0));
}

bool AirConditionerResponse::decode(const std::vector<uint8_t> &vData)
{
	size_t datalen = vData.size();
	if (datalen < AIRCONDITIONER_RESPONSE_MIN_SIZE)
		return false;

	run_status = ((vData[1] & 0x01) != 0);
	i_mode = ((vData[1] & 0x04) != 0);
	timing_mode = ((vData[1] & 0x10) != 0);
	quick_check = ((vData[1] & 0x20) != 0);
	appliance_error = ((vData[1] & 0x80) != 0);

	mode = (vData[2] & 0xE0) >> 5;
	target_temperature = (vData[2] & 0x0F) + 16.0 + (((vData[2] & 0x10) != 0) ? 0.5 : 0.0);
	fan_speed = vData[3] & 0x7F;

	midea::decode_on_timer(vData[4], vData[6], on_timer);
	midea::decode_off_timer(vData[5], vData[6], off_timer);

	vertical_swing = (vData[7] & 0x0C) >> 2;
	horizontal_swing = vData[7] & 0x03;

	comfort_sleep_value = vData[8] & 0x03;
	power_saving = ((vData[8] & 0x08) != 0);
	low_frequency_fan = ((vData[8] & 0x10) != 0);
	turbo_fan = ((vData[8] & 0x20) != 0);
	feel_own = ((vData[8] & 0x80) != 0);

	comfort_sleep = ((vData[9] & 0x40) != 0);
	natural_wind = ((vData[9] & 0x02) != 0);
	eco = ((vData[9] & 0x10) != 0);
	purifier = ((vData[9] & 0x20) != 0);
	dryer = ((vData[9] & 0x04) != 0);
	ptc = (vData[9] & 0x18) >> 3;
	aux_heat = ((vData[9] & 0x08) != 0);

	turbo = ((vData[10] & 0x02) != 0);
	fahrenheit = ((vData[10] & 0x04) != 0);
	prevent_freezing = ((vData[10] & 0x20) != 0);

	pmv = (vData[14] & 0x0F) * 0.5 - 3.5;

	has_indoor_temperature = ((vData[11] != 0) && (vData[11] != 0xFF));
	indoor_temperature = 0;
	if (has_indoor_temperature)
	{
		indoor_temperature = (vData[11] - 50) / 2.0;
		double digit = 0.1 * (vData[15] & 0x0F);
		if (indoor_temperature < 0)
			indoor_temperature -= digit;
		else
			indoor_temperature += digit;
	}

	has_outdoor_temperature = ((vData[12] != 0) && (vData[12] != 0xFF));
	outdoor_temperature = 0;
	if (has_outdoor_temperature)
	{
		outdoor_temperature = (vData[12] - 50) / 2.0;
		double digit = 0.1 * ((vData[15] & 0xF0) >> 4);
		if (outdoor_temperature < 0)
			outdoor_temperature -= digit;
		else
			outdoor_temperature += digit;
	}

	has_humidity = (datalen > 20);
	humidity = has_humidity ? vData[19] : 0;
	err_code = vData[16];
	return true;
}

std::string AirConditionerResponse::to_string() const
{
	std::stringstream ss;
	ss << std::fixed << std::setprecision(1);
	ss << "{run_status=" << midea::bool_to_string(run_status);
	ss << ", appliance_error=" << midea::bool_to_string(appliance_error);
	ss << ", mode=" << mode;
	ss << ", target_temperature=" << target_temperature;
	ss << ", fan_speed=" << fan_speed;
	ss << ", vertical_swing=" << vertical_swing;
	ss << ", horizontal_swing=" << horizontal_swing;
	ss << ", turbo_fan=" << midea::bool_to_string(turbo_fan);
	ss << ", turbo=" << midea::bool_to_string(turbo);
	ss << ", comfort_sleep=" << midea::bool_to_string(comfort_sleep);
	ss << ", eco=" << midea::bool_to_string(eco);
	ss << ", purifier=" << midea::bool_to_string(purifier);
	ss << ", dryer=" << midea::bool_to_string(dryer);
	ss << ", fahrenheit=" << midea::bool_to_string(fahrenheit);
	ss << ", pmv=" << pmv;
	ss << ", indoor_temperature=" << (has_indoor_temperature ? midea::decimal_to_string(indoor_temperature) : "none");
	ss << ", outdoor_temperature=" << (has_outdoor_temperature ? midea::decimal_to_string(outdoor_temperature) : "none");
	ss << ", humidity=" << (has_humidity ? std::to_string(humidity) : "none");
	ss << ", err_code=" << err_code << "}";
	return ss.str();
}
