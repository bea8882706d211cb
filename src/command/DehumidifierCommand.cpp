/*
 * Copyright (c) 2024 Gordon Bos <gordon@bosvangennip.nl> All rights reserved.
 *
 * Dehumidifier (0xA1) commands and status response
 *
 *
 * Source code subject to GNU GENERAL PUBLIC LICENSE version 3
 */

#include "DehumidifierCommand.hpp"
#include <sstream>


DehumidifierStatusCommand::DehumidifierStatusCommand() :
	MideaSequenceCommand(std::vector<uint8_t>({
		0xAA, 0x20, 0xA1, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x03,
		0x41, 0x81, 0x00, 0xFF, 0x03, 0xFF, 0x00, 0x00, 0x00, 0x00,
		0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
		0x00, 0x00, 0x00
	}))
{
}


DehumidifierSetCommand::DehumidifierSetCommand() :
	MideaSequenceCommand(std::vector<uint8_t>({
		0xAA, 0x20, 0xA1, 0x00, 0x00, 0x00, 0x00, 0x00, 0x03, 0x02,
		0x48, 0x00, 0x01, 0x32, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
		0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
		0x00, 0x00, 0x00
	}))
{
}

bool DehumidifierSetCommand::get_running() const
{
	return get_bit(11, 0x01);
}

void DehumidifierSetCommand::set_running(const bool state)
{
	set_bit(11, 0x01, state);
}

bool DehumidifierSetCommand::get_beep_prompt() const
{
	return get_bit(11, 0x40);
}

void DehumidifierSetCommand::set_beep_prompt(const bool state)
{
	set_bit(11, 0x40, state);
}

int DehumidifierSetCommand::get_mode() const
{
	return get_bits(12, 0x0F);
}

void DehumidifierSetCommand::set_mode(const int mode)
{
	set_bits(12, 0x0F, (uint8_t)mode);
}

int DehumidifierSetCommand::get_fan_speed() const
{
	return get_bits(13, 0x7F);
}

void DehumidifierSetCommand::set_fan_speed(const int speed)
{
	set_bits(13, 0x7F, (uint8_t)speed);
}

int DehumidifierSetCommand::get_target_humidity() const
{
	return get_bits(17, 0x7F);
}

void DehumidifierSetCommand::set_target_humidity(const int humidity)
{
	set_bits(17, 0x7F, (uint8_t)humidity);
}

bool DehumidifierSetCommand::get_ion_mode() const
{
	return get_bit(19, 0x40);
}

void DehumidifierSetCommand::set_ion_mode(const bool state)
{
	set_bit(19, 0x40, state);
}

bool DehumidifierSetCommand::get_pump_switch() const
{
	return get_bit(19, 0x08);
}

void DehumidifierSetCommand::set_pump_switch(const bool state)
{
	set_bit(19, 0x08, state);
}

bool DehumidifierSetCommand::get_pump_switch_flag() const
{
	return get_bit(19, 0x10);
}

void DehumidifierSetCommand::set_pump_switch_flag(const bool state)
{
	set_bit(19, 0x10, state);
}

bool DehumidifierSetCommand::get_sleep_switch() const
{
	return get_bit(19, 0x20);
}

void DehumidifierSetCommand::set_sleep_switch(const bool state)
{
	set_bit(19, 0x20, state);
}

bool DehumidifierSetCommand::get_vertical_swing() const
{
	return get_bit(20, 0x20);
}

void DehumidifierSetCommand::set_vertical_swing(const bool state)
{
	set_bit(20, 0x20, state);
}

int DehumidifierSetCommand::get_tank_warning_level() const
{
	return m_vData[23];
}

void DehumidifierSetCommand::set_tank_warning_level(const int level)
{
	m_vData[23] = (uint8_t)level;
}


/************************************************************************
 *									*
 *	Status response							*
 *									*
 ************************************************************************/

DehumidifierResponse::DehumidifierResponse()
{
	decode(std::vector<uint8_t>(DEHUMIDIFIER_RESPONSE_MIN_SIZE, 0));
}

bool DehumidifierResponse::decode(const std::vector<uint8_t> &vData)
{
	size_t datalen = vData.size();
	if (datalen < DEHUMIDIFIER_RESPONSE_MIN_SIZE)
		return false;

	fault = ((vData[1] & 0x80) != 0);
	run_status = ((vData[1] & 0x01) != 0);
	i_mode = ((vData[1] & 0x04) != 0);
	timing_mode = ((vData[1] & 0x10) != 0);
	quick_check = ((vData[1] & 0x20) != 0);
	mode = vData[2] & 0x0F;
	mode_fc = (vData[2] & 0xF0) >> 4;
	fan_speed = vData[3] & 0x7F;

	midea::decode_on_timer(vData[4], vData[6], on_timer);
	midea::decode_off_timer(vData[5], vData[6], off_timer);

	target_humidity = vData[7];
	if (target_humidity > 100)
		target_humidity = 99;
	target_humidity += (vData[8] & 0x0F) * 0.0625;

	filter_indicator = ((vData[9] & 0x80) != 0);
	ion_mode = ((vData[9] & 0x40) != 0);
	sleep_switch = ((vData[9] & 0x20) != 0);
	pump_switch_flag = ((vData[9] & 0x10) != 0);
	pump_switch = ((vData[9] & 0x08) != 0);
	display_class = vData[9] & 0x07;
	defrosting = ((vData[10] & 0x80) != 0);
	tank_level = vData[10] & 0x7F;
	tank_full = (tank_level >= 100);
	dust_time = vData[11] * 2;
	rare_show = (vData[12] & 0x38) >> 3;
	dust = vData[12] & 0x07;
	pm25 = vData[13] + (vData[14] * 256);
	tank_warning_level = vData[15];
	current_humidity = vData[16];

	indoor_temperature = (vData[17] - 50) / 2.0;
	if (indoor_temperature < -19)
		indoor_temperature = -20;
	if (indoor_temperature > 50)
		indoor_temperature = 50;
	double decimal = (vData[18] & 0x0F) * 0.1;
	if (indoor_temperature >= 0)
		indoor_temperature += decimal;
	else
		indoor_temperature -= decimal;

	has_light_class = (datalen > 19);
	light_class = has_light_class ? ((vData[19] & 0xC0) >> 6) : 0;
	up_down_swing = has_light_class && ((vData[19] & 0x20) != 0);
	left_right_swing = has_light_class && ((vData[19] & 0x10) != 0);
	has_light_value = (datalen > 20);
	light_value = has_light_value ? vData[20] : 0;
	err_code = (datalen > 21) ? vData[21] : 0;
	return true;
}

std::string DehumidifierResponse::to_string() const
{
	std::stringstream ss;
	ss << "{fault=" << midea::bool_to_string(fault);
	ss << ", run_status=" << midea::bool_to_string(run_status);
	ss << ", i_mode=" << midea::bool_to_string(i_mode);
	ss << ", quick_check=" << midea::bool_to_string(quick_check);
	ss << ", mode=" << mode;
	ss << ", fan_speed=" << fan_speed;
	ss << ", on_timer=" << (on_timer.set ? std::to_string(on_timer.hour) + "h" + std::to_string(on_timer.minutes) : "unset");
	ss << ", off_timer=" << (off_timer.set ? std::to_string(off_timer.hour) + "h" + std::to_string(off_timer.minutes) : "unset");
	ss << ", target_humidity=" << midea::decimal_to_string(target_humidity, 2);
	ss << ", current_humidity=" << current_humidity;
	ss << ", indoor_temperature=" << midea::decimal_to_string(indoor_temperature);
	ss << ", filter_indicator=" << midea::bool_to_string(filter_indicator);
	ss << ", ion_mode=" << midea::bool_to_string(ion_mode);
	ss << ", sleep_switch=" << midea::bool_to_string(sleep_switch);
	ss << ", pump_switch=" << midea::bool_to_string(pump_switch);
	ss << ", pump_switch_flag=" << midea::bool_to_string(pump_switch_flag);
	ss << ", defrosting=" << midea::bool_to_string(defrosting);
	ss << ", tank_level=" << tank_level;
	ss << ", tank_full=" << midea::bool_to_string(tank_full);
	ss << ", tank_warning_level=" << tank_warning_level;
	ss << ", pm25=" << pm25;
	ss << ", light_class=" << (has_light_class ? std::to_string(light_class) : "none");
	ss << ", err_code=" << err_code << "}";
	return ss.str();
}
