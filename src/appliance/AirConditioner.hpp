/*
 * Copyright (c) 2024 Gordon Bos <gordon@bosvangennip.nl> All rights reserved.
 *
 * Air conditioner appliance model
 *
 *
 * Source code subject to GNU GENERAL PUBLIC LICENSE version 3
 */

#ifndef _MideaAirConditioner
#define _MideaAirConditioner

#include "Appliance.hpp"
#include "../command/AirConditionerCommand.hpp"

// capability 0x25 carries seven temperature limits
#define B5_TEMPERATURES_ID 0x25
#define B5_TEMPERATURES_SIZE 10
#define B5_TEMPERATURES_COUNT 7


class AirConditionerAppliance : public MideaAppliance
{
public:
	AirConditionerAppliance(const std::string &szApplianceId, const std::string &szType);

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
 *	Mode is a three bit field, values outside 0..7 are refused.	*
 *	Target temperature must lie within 16..31 degrees.		*
 *									*
 ************************************************************************/

	bool get_running() const;
	void set_running(const bool bRunning);
	int get_mode() const;
	bool set_mode(const int mode);
	double get_target_temperature() const;
	bool set_target_temperature(const double temperature);
	int get_fan_speed() const;
	bool set_fan_speed(const int speed);
	bool get_eco_mode() const;
	void set_eco_mode(const bool bState);
	bool get_turbo() const;
	void set_turbo(const bool bState);
	bool get_turbo_fan() const;
	void set_turbo_fan(const bool bState);
	bool get_comfort_sleep() const;
	void set_comfort_sleep(const bool bState);
	bool get_purifier() const;
	void set_purifier(const bool bState);
	bool get_dryer() const;
	void set_dryer(const bool bState);
	bool get_fahrenheit() const;
	void set_fahrenheit(const bool bState);
	bool get_show_screen() const;
	void set_show_screen(const bool bState);
	bool get_vertical_swing() const;
	void set_vertical_swing(const bool bState);
	bool get_horizontal_swing() const;
	void set_horizontal_swing(const bool bState);
	bool get_beep_prompt() const;
	void set_beep_prompt(const bool bState);

	bool has_indoor_temperature() const;
	double get_indoor_temperature() const;
	bool has_outdoor_temperature() const;
	double get_outdoor_temperature() const;
	int get_humidity() const;
	int get_error_code() const;

protected:
	bool parse_capability(const std::vector<uint8_t> &vData, const size_t index, size_t &width) override;

private:
	static const PropertySchema<AirConditionerAppliance>& schema();
	std::string get_indoor_temperature_text() const;
	std::string get_outdoor_temperature_text() const;

	bool m_bRunning;
	int m_iMode;
	double m_dTargetTemperature;
	int m_iFanSpeed;
	bool m_bEcoMode;
	bool m_bTurbo;
	bool m_bTurboFan;
	bool m_bComfortSleep;
	bool m_bPurifier;
	bool m_bDryer;
	bool m_bFahrenheit;
	bool m_bShowScreen;
	bool m_bVerticalSwing;
	bool m_bHorizontalSwing;
	bool m_bBeepPrompt;

	bool m_bHasIndoorTemperature;
	double m_dIndoorTemperature;
	bool m_bHasOutdoorTemperature;
	double m_dOutdoorTemperature;
	int m_iHumidity;
	int m_iErrorCode;
};

#endif
