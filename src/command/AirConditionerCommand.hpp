/*
 * Copyright (c) 2024 Gordon Bos <gordon@bosvangennip.nl> All rights reserved.
 *
 * Air conditioner (0xAC) commands and status response
 *
 *
 * Source code subject to GNU GENERAL PUBLIC LICENSE version 3
 */

#ifndef _MideaAirConditionerCommand
#define _MideaAirConditionerCommand

#include "Command.hpp"

#define AIRCONDITIONER_RESPONSE_MIN_SIZE 17


class AirConditionerStatusCommand : public MideaSequenceCommand
{
public:
	AirConditionerStatusCommand();
};


/************************************************************************
 *									*
 *	Set command payload						*
 *									*
 *	11	0x01 power, 0x40 beep prompt				*
 *	12	0xE0 mode, 0x10 half degree, 0x0F temperature - 16	*
 *	13	0x7F fan speed						*
 *	17	swing: 0x30 when active, 0x0C vertical, 0x03 horizontal	*
 *	18	0x20 turbo fan, 0x03 comfort sleep value		*
 *	19	0x04 dryer, 0x20 purifier, 0x80 eco			*
 *	20	0x02 turbo, 0x04 fahrenheit, 0x10 screen, 0x80 sleep	*
 *									*
 ************************************************************************/

class AirConditionerSetCommand : public MideaSequenceCommand
{
public:
	AirConditionerSetCommand();

	bool get_running() const;
	void set_running(const bool state);
	bool get_beep_prompt() const;
	void set_beep_prompt(const bool state);
	int get_mode() const;
	void set_mode(const int mode);
	double get_temperature() const;
	// out of range temperatures clear the temperature bits
	void set_temperature(const double temperature);
	int get_fan_speed() const;
	void set_fan_speed(const int speed);
	bool get_vertical_swing() const;
	void set_vertical_swing(const bool state);
	bool get_horizontal_swing() const;
	void set_horizontal_swing(const bool state);
	bool get_turbo_fan() const;
	void set_turbo_fan(const bool state);
	bool get_dryer() const;
	void set_dryer(const bool state);
	bool get_purifier() const;
	void set_purifier(const bool state);
	bool get_eco_mode() const;
	void set_eco_mode(const bool state);
	bool get_comfort_sleep() const;
	void set_comfort_sleep(const bool state);
	bool get_fahrenheit() const;
	void set_fahrenheit(const bool state);
	bool get_turbo() const;
	void set_turbo(const bool state);
	bool get_screen() const;
	void set_screen(const bool state);

private:
	void update_swing(const bool vertical, const bool horizontal);
};


class AirConditionerResponse
{
public:
	AirConditionerResponse();

	bool decode(const std::vector<uint8_t> &vData);
	std::string to_string() const;

	bool run_status;
	bool i_mode;
	bool timing_mode;
	bool quick_check;
	bool appliance_error;
	int mode;
	double target_temperature;
	int fan_speed;
	midea::tTimerState on_timer;
	midea::tTimerState off_timer;
	int vertical_swing;
	int horizontal_swing;
	int comfort_sleep_value;
	bool power_saving;
	bool low_frequency_fan;
	bool turbo_fan;
	bool feel_own;
	bool comfort_sleep;
	bool natural_wind;
	bool eco;
	bool purifier;
	bool dryer;
	int ptc;
	bool aux_heat;
	bool turbo;
	bool fahrenheit;
	bool prevent_freezing;
	double pmv;

	// sensors report 0x00 or 0xFF when not fitted
	bool has_indoor_temperature;
	double indoor_temperature;
	bool has_outdoor_temperature;
	double outdoor_temperature;
	bool has_humidity;
	int humidity;
	int err_code;
};

#endif
