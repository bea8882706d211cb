/*
 * Copyright (c) 2024 Gordon Bos <gordon@bosvangennip.nl> All rights reserved.
 *
 * Dehumidifier (0xA1) commands and status response
 *
 *
 * Source code subject to GNU GENERAL PUBLIC LICENSE version 3
 */

#ifndef _MideaDehumidifierCommand
#define _MideaDehumidifierCommand

#include "Command.hpp"

#define DEHUMIDIFIER_RESPONSE_MIN_SIZE 19


class DehumidifierStatusCommand : public MideaSequenceCommand
{
public:
	DehumidifierStatusCommand();
};


/************************************************************************
 *									*
 *	Set command payload						*
 *									*
 *	11	0x01 power, 0x40 beep prompt				*
 *	12	0x0F mode						*
 *	13	0x7F fan speed						*
 *	17	0x7F target humidity					*
 *	19	0x08 pump, 0x10 pump flag, 0x20 sleep, 0x40 ion		*
 *	20	0x20 vertical swing					*
 *	23	tank warning level					*
 *									*
 ************************************************************************/

class DehumidifierSetCommand : public MideaSequenceCommand
{
public:
	DehumidifierSetCommand();

	bool get_running() const;
	void set_running(const bool state);
	bool get_beep_prompt() const;
	void set_beep_prompt(const bool state);
	int get_mode() const;
	void set_mode(const int mode);
	int get_fan_speed() const;
	void set_fan_speed(const int speed);
	int get_target_humidity() const;
	void set_target_humidity(const int humidity);
	bool get_ion_mode() const;
	void set_ion_mode(const bool state);
	bool get_pump_switch() const;
	void set_pump_switch(const bool state);
	bool get_pump_switch_flag() const;
	void set_pump_switch_flag(const bool state);
	bool get_sleep_switch() const;
	void set_sleep_switch(const bool state);
	bool get_vertical_swing() const;
	void set_vertical_swing(const bool state);
	int get_tank_warning_level() const;
	void set_tank_warning_level(const int level);
};


/*
 * Decoded status reply. Offsets are relative to the start of the
 * payload, i.e. the opcode byte is at index 0.
 */
class DehumidifierResponse
{
public:
	DehumidifierResponse();

	// false when the payload is too short to hold the status fields
	bool decode(const std::vector<uint8_t> &vData);
	std::string to_string() const;

	bool fault;
	bool run_status;
	bool i_mode;
	bool timing_mode;
	bool quick_check;
	int mode;
	int mode_fc;
	int fan_speed;
	midea::tTimerState on_timer;
	midea::tTimerState off_timer;
	double target_humidity;
	bool filter_indicator;
	bool ion_mode;
	bool sleep_switch;
	bool pump_switch_flag;
	bool pump_switch;
	int display_class;
	bool defrosting;
	int tank_level;
	bool tank_full;
	int dust_time;
	int rare_show;
	int dust;
	int pm25;
	int tank_warning_level;
	int current_humidity;
	double indoor_temperature;

	// trailing fields, absent in short replies
	bool has_light_class;
	int light_class;
	bool up_down_swing;
	bool left_right_swing;
	bool has_light_value;
	int light_value;
	int err_code;
};

#endif
