/*
 * Copyright (c) 2024 Gordon Bos <gordon@bosvangennip.nl> All rights reserved.
 *
 * Dehumidifier appliance model
 *
 *
 * Source code subject to GNU GENERAL PUBLIC LICENSE version 3
 */

#ifndef _MideaDehumidifier
#define _MideaDehumidifier

#include "Appliance.hpp"
#include "../command/DehumidifierCommand.hpp"


class DehumidifierAppliance : public MideaAppliance
{
public:
	DehumidifierAppliance(const std::string &szApplianceId, const std::string &szType);

	std::unique_ptr<MideaAppliance> clone() const override;
	midea::appliancetype::value get_family() const override;
	std::string get_model() const override;

	std::unique_ptr<MideaCommand> refresh_command() override;
	std::unique_ptr<MideaCommand> apply_command() override;
	bool process_response(const std::vector<uint8_t> &vData) override;

	std::vector<midea::property::tPropertyInfo> list_properties() const override;
	bool get_property(const std::string &szName, std::string &szValue) const override;
	midea::property::result::value set_property(const std::string &szName, const std::string &szValue) override;

	std::string to_string() const override;


/************************************************************************
 *									*
 *	State								*
 *									*
 *	Mode outside 0..15 is refused. Target humidity and fan speed	*
 *	are clamped into their range instead.				*
 *									*
 ************************************************************************/

	bool get_running() const;
	void set_running(const bool bRunning);
	int get_mode() const;
	bool set_mode(const int mode);
	int get_target_humidity() const;
	bool set_target_humidity(const double humidity);
	int get_fan_speed() const;
	bool set_fan_speed(const int speed);
	bool get_ion_mode() const;
	void set_ion_mode(const bool bState);
	bool get_pump() const;
	void set_pump(const bool bState);
	bool get_pump_switch_flag() const;
	void set_pump_switch_flag(const bool bState);
	bool get_sleep() const;
	void set_sleep(const bool bState);
	bool get_beep_prompt() const;
	void set_beep_prompt(const bool bState);
	bool get_vertical_swing() const;
	void set_vertical_swing(const bool bState);
	int get_tank_warning_level() const;
	bool set_tank_warning_level(const int level);

	int get_current_humidity() const;
	double get_current_temperature() const;
	bool get_tank_full() const;
	int get_tank_level() const;
	int get_error_code() const;
	bool get_defrosting() const;
	bool get_filter_indicator() const;

protected:
	bool parse_capability(const std::vector<uint8_t> &vData, const size_t index, size_t &width) override;

private:
	static const PropertySchema<DehumidifierAppliance>& schema();
	double get_target_humidity_value() const;

	bool m_bRunning;
	int m_iMode;
	int m_iTargetHumidity;
	int m_iFanSpeed;
	bool m_bIonMode;
	bool m_bPump;
	bool m_bPumpSwitchFlag;
	bool m_bSleep;
	bool m_bBeepPrompt;
	bool m_bVerticalSwing;
	int m_iTankWarningLevel;

	int m_iCurrentHumidity;
	double m_dCurrentTemperature;
	bool m_bTankFull;
	int m_iTankLevel;
	int m_iErrorCode;
	bool m_bDefrosting;
	bool m_bFilterIndicator;
};

#endif
