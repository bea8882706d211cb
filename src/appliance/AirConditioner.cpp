/*
 * Copyright (c) 2024 Gordon Bos <gordon@bosvangennip.nl> All rights reserved.
 *
 * Air conditioner appliance model
 *
 *
 * Source code subject to GNU GENERAL PUBLIC LICENSE version 3
 */

#include "AirConditioner.hpp"
#include "../common/Logger.hpp"
#include "../common/hexstring.hpp"
#include <sstream>


namespace {

typedef struct _tCapabilityName
{
	uint8_t id;
	const char *name;
} tCapabilityName;

const tCapabilityName capability_names[] = {
	{ 0x10, "fan_speed" },
	{ 0x12, "eco" },
	{ 0x13, "heat_8" },
	{ 0x14, "mode" },
	{ 0x15, "fan_swing" },
	{ 0x17, "filter_reminder" },
	{ 0x18, "electricity" },
	{ 0x1E, "anion" },
	{ 0x1F, "humidity" },
	{ 0x21, "filter_check" },
	{ 0x22, "fahrenheit" },
	{ 0x24, "screen_display" },
	{ 0x2A, "strong_fan" },
	{ 0x30, "energy_save_on_absence" },
	{ 0x32, "fan_straight" },
	{ 0x33, "fan_avoid" },
	{ 0x39, "self_clean" },
	{ 0x42, "prevent_direct_fan" },
	{ 0x43, "fa_no_fan_sense" }
};

}; // namespace


AirConditionerAppliance::AirConditionerAppliance(const std::string &szApplianceId, const std::string &szType) :
	MideaAppliance(szApplianceId, szType),
	m_bRunning(false),
	m_iMode(0),
	m_dTargetTemperature(0),
	m_iFanSpeed(40),
	m_bEcoMode(false),
	m_bTurbo(false),
	m_bTurboFan(false),
	m_bComfortSleep(false),
	m_bPurifier(false),
	m_bDryer(false),
	m_bFahrenheit(false),
	m_bShowScreen(true),
	m_bVerticalSwing(false),
	m_bHorizontalSwing(false),
	m_bBeepPrompt(false),
	m_bHasIndoorTemperature(false),
	m_dIndoorTemperature(0),
	m_bHasOutdoorTemperature(false),
	m_dOutdoorTemperature(0),
	m_iHumidity(0),
	m_iErrorCode(0)
{
}

std::unique_ptr<MideaAppliance> AirConditionerAppliance::clone() const
{
	return std::unique_ptr<MideaAppliance>(new AirConditionerAppliance(*this));
}

midea::appliancetype::value AirConditionerAppliance::get_family() const
{
	return midea::appliancetype::AIRCONDITIONER;
}

std::string AirConditionerAppliance::get_model() const
{
	return "Air conditioner";
}


/************************************************************************
 *									*
 *	Commands and responses						*
 *									*
 ************************************************************************/

std::unique_ptr<MideaCommand> AirConditionerAppliance::refresh_command()
{
	return std::unique_ptr<MideaCommand>(new AirConditionerStatusCommand());
}

std::unique_ptr<MideaCommand> AirConditionerAppliance::apply_command()
{
	AirConditionerSetCommand *cmd = new AirConditionerSetCommand();
	cmd->set_running(m_bRunning);
	cmd->set_mode(m_iMode);
	cmd->set_fan_speed(m_iFanSpeed);
	cmd->set_turbo(m_bTurbo);
	cmd->set_turbo_fan(m_bTurboFan);
	cmd->set_eco_mode(m_bEcoMode);
	cmd->set_purifier(m_bPurifier);
	cmd->set_dryer(m_bDryer);
	cmd->set_fahrenheit(m_bFahrenheit);
	cmd->set_comfort_sleep(m_bComfortSleep);
	cmd->set_beep_prompt(m_bBeepPrompt);
	cmd->set_screen(m_bShowScreen);
	cmd->set_vertical_swing(m_bVerticalSwing);
	cmd->set_horizontal_swing(m_bHorizontalSwing);
	cmd->set_temperature(m_dTargetTemperature);
	return std::unique_ptr<MideaCommand>(cmd);
}

bool AirConditionerAppliance::process_response(const std::vector<uint8_t> &vData)
{
	if (vData.empty())
	{
		m_bOnline = false;
		return true;
	}
	m_bOnline = true;
	m_bActive = true;

	_log.Debug(DEBUG_PROTOCOL, "Processing response for air conditioner id=%s data=%s", m_szApplianceId.c_str(), midea::hex::encode(vData).c_str());
	dump_response(vData);

	AirConditionerResponse response;
	if (!response.decode(vData))
		return set_error(midea::error::type::PROTOCOL, std::string("Air conditioner response too short: ") + std::to_string(vData.size()) + " bytes");
	_log.Debug(DEBUG_NORM, "Decoded response %s", response.to_string().c_str());

	m_bRunning = response.run_status;
	m_iMode = response.mode;
	// device reported values are taken as is
	m_dTargetTemperature = response.target_temperature;
	set_fan_speed(response.fan_speed);
	m_bEcoMode = response.eco;
	m_bTurbo = response.turbo;
	m_bTurboFan = response.turbo_fan;
	m_bComfortSleep = response.comfort_sleep;
	m_bPurifier = response.purifier;
	m_bDryer = response.dryer;
	m_bFahrenheit = response.fahrenheit;
	m_bVerticalSwing = (response.vertical_swing != 0);
	m_bHorizontalSwing = (response.horizontal_swing != 0);
	m_bHasIndoorTemperature = response.has_indoor_temperature;
	m_dIndoorTemperature = response.indoor_temperature;
	m_bHasOutdoorTemperature = response.has_outdoor_temperature;
	m_dOutdoorTemperature = response.outdoor_temperature;
	if (response.has_humidity)
		m_iHumidity = response.humidity;
	m_iErrorCode = response.err_code;
	return true;
}

/* protected */ bool AirConditionerAppliance::parse_capability(const std::vector<uint8_t> &vData, const size_t index, size_t &width)
{
	if (vData[index] == B5_TEMPERATURES_ID)
	{
		if (index + B5_TEMPERATURES_SIZE > vData.size())
			return false;
		for (int j = 0; j < B5_TEMPERATURES_COUNT; j++)
			m_mCapabilities[std::string("temperature") + std::to_string(j)] = vData[index + 3 + j];
		width = B5_TEMPERATURES_SIZE;
		return true;
	}
	for (const auto &capability : capability_names)
	{
		if (capability.id == vData[index])
		{
			m_mCapabilities[capability.name] = vData[index + 3];
			return true;
		}
	}
	return false;
}


/************************************************************************
 *									*
 *	State								*
 *									*
 ************************************************************************/

bool AirConditionerAppliance::get_running() const
{
	return m_bRunning;
}

void AirConditionerAppliance::set_running(const bool bRunning)
{
	m_bRunning = bRunning;
}

int AirConditionerAppliance::get_mode() const
{
	return m_iMode;
}

bool AirConditionerAppliance::set_mode(const int mode)
{
	if ((mode < 0) || (mode > 15))
		return set_error(midea::error::type::VALIDATION, std::string("Tried to set mode to invalid value: ") + std::to_string(mode));
	m_iMode = mode;
	return true;
}

double AirConditionerAppliance::get_target_temperature() const
{
	return m_dTargetTemperature;
}

bool AirConditionerAppliance::set_target_temperature(const double temperature)
{
	if ((temperature < MIDEA_AC_MIN_TEMPERATURE) || (temperature > MIDEA_AC_MAX_TEMPERATURE))
		return set_error(midea::error::type::VALIDATION, std::string("Tried to set target temperature ") + midea::decimal_to_string(temperature) + " out of allowed range");
	m_dTargetTemperature = temperature;
	return true;
}

int AirConditionerAppliance::get_fan_speed() const
{
	return m_iFanSpeed;
}

bool AirConditionerAppliance::set_fan_speed(const int speed)
{
	if (speed < 0)
	{
		_log.Log(LOG_STATUS, "Tried to set fan speed to less than 0: %d", speed);
		m_iFanSpeed = 0;
	}
	else if (speed > 127)
	{
		_log.Log(LOG_STATUS, "Tried to set fan speed to greater than 127: %d", speed);
		m_iFanSpeed = 127;
	}
	else
		m_iFanSpeed = speed;
	return true;
}

bool AirConditionerAppliance::get_eco_mode() const
{
	return m_bEcoMode;
}

void AirConditionerAppliance::set_eco_mode(const bool bState)
{
	m_bEcoMode = bState;
}

bool AirConditionerAppliance::get_turbo() const
{
	return m_bTurbo;
}

void AirConditionerAppliance::set_turbo(const bool bState)
{
	m_bTurbo = bState;
}

bool AirConditionerAppliance::get_turbo_fan() const
{
	return m_bTurboFan;
}

void AirConditionerAppliance::set_turbo_fan(const bool bState)
{
	m_bTurboFan = bState;
}

bool AirConditionerAppliance::get_comfort_sleep() const
{
	return m_bComfortSleep;
}

void AirConditionerAppliance::set_comfort_sleep(const bool bState)
{
	m_bComfortSleep = bState;
}

bool AirConditionerAppliance::get_purifier() const
{
	return m_bPurifier;
}

void AirConditionerAppliance::set_purifier(const bool bState)
{
	m_bPurifier = bState;
}

bool AirConditionerAppliance::get_dryer() const
{
	return m_bDryer;
}

void AirConditionerAppliance::set_dryer(const bool bState)
{
	m_bDryer = bState;
}

bool AirConditionerAppliance::get_fahrenheit() const
{
	return m_bFahrenheit;
}

void AirConditionerAppliance::set_fahrenheit(const bool bState)
{
	m_bFahrenheit = bState;
}

bool AirConditionerAppliance::get_show_screen() const
{
	return m_bShowScreen;
}

void AirConditionerAppliance::set_show_screen(const bool bState)
{
	m_bShowScreen = bState;
}

bool AirConditionerAppliance::get_vertical_swing() const
{
	return m_bVerticalSwing;
}

void AirConditionerAppliance::set_vertical_swing(const bool bState)
{
	m_bVerticalSwing = bState;
}

bool AirConditionerAppliance::get_horizontal_swing() const
{
	return m_bHorizontalSwing;
}

void AirConditionerAppliance::set_horizontal_swing(const bool bState)
{
	m_bHorizontalSwing = bState;
}

bool AirConditionerAppliance::get_beep_prompt() const
{
	return m_bBeepPrompt;
}

void AirConditionerAppliance::set_beep_prompt(const bool bState)
{
	m_bBeepPrompt = bState;
}

bool AirConditionerAppliance::has_indoor_temperature() const
{
	return m_bHasIndoorTemperature;
}

double AirConditionerAppliance::get_indoor_temperature() const
{
	return m_dIndoorTemperature;
}

bool AirConditionerAppliance::has_outdoor_temperature() const
{
	return m_bHasOutdoorTemperature;
}

double AirConditionerAppliance::get_outdoor_temperature() const
{
	return m_dOutdoorTemperature;
}

int AirConditionerAppliance::get_humidity() const
{
	return m_iHumidity;
}

int AirConditionerAppliance::get_error_code() const
{
	return m_iErrorCode;
}

/* private */ std::string AirConditionerAppliance::get_indoor_temperature_text() const
{
	return m_bHasIndoorTemperature ? midea::decimal_to_string(m_dIndoorTemperature) : "none";
}

/* private */ std::string AirConditionerAppliance::get_outdoor_temperature_text() const
{
	return m_bHasOutdoorTemperature ? midea::decimal_to_string(m_dOutdoorTemperature) : "none";
}


/************************************************************************
 *									*
 *	Named properties						*
 *									*
 ************************************************************************/

/* private */ const PropertySchema<AirConditionerAppliance>& AirConditionerAppliance::schema()
{
	static const PropertySchema<AirConditionerAppliance> properties = PropertySchema<AirConditionerAppliance>()
		.boolean("running", &AirConditionerAppliance::get_running, &AirConditionerAppliance::set_running)
		.integer("mode", &AirConditionerAppliance::get_mode, &AirConditionerAppliance::set_mode)
		.decimal("target_temperature", &AirConditionerAppliance::get_target_temperature, &AirConditionerAppliance::set_target_temperature)
		.integer("fan_speed", &AirConditionerAppliance::get_fan_speed, &AirConditionerAppliance::set_fan_speed)
		.boolean("eco_mode", &AirConditionerAppliance::get_eco_mode, &AirConditionerAppliance::set_eco_mode)
		.boolean("turbo", &AirConditionerAppliance::get_turbo, &AirConditionerAppliance::set_turbo)
		.boolean("turbo_fan", &AirConditionerAppliance::get_turbo_fan, &AirConditionerAppliance::set_turbo_fan)
		.boolean("comfort_sleep", &AirConditionerAppliance::get_comfort_sleep, &AirConditionerAppliance::set_comfort_sleep)
		.boolean("purifier", &AirConditionerAppliance::get_purifier, &AirConditionerAppliance::set_purifier)
		.boolean("dryer", &AirConditionerAppliance::get_dryer, &AirConditionerAppliance::set_dryer)
		.boolean("fahrenheit", &AirConditionerAppliance::get_fahrenheit, &AirConditionerAppliance::set_fahrenheit)
		.boolean("show_screen", &AirConditionerAppliance::get_show_screen, &AirConditionerAppliance::set_show_screen)
		.boolean("vertical_swing", &AirConditionerAppliance::get_vertical_swing, &AirConditionerAppliance::set_vertical_swing)
		.boolean("horizontal_swing", &AirConditionerAppliance::get_horizontal_swing, &AirConditionerAppliance::set_horizontal_swing)
		.boolean("beep_prompt", &AirConditionerAppliance::get_beep_prompt, &AirConditionerAppliance::set_beep_prompt)
		.text("indoor_temperature", &AirConditionerAppliance::get_indoor_temperature_text)
		.text("outdoor_temperature", &AirConditionerAppliance::get_outdoor_temperature_text)
		.integer("humidity", &AirConditionerAppliance::get_humidity)
		.integer("error_code", &AirConditionerAppliance::get_error_code);
	return properties;
}

std::vector<midea::property::tPropertyInfo> AirConditionerAppliance::list_properties() const
{
	return schema().list();
}

bool AirConditionerAppliance::get_property(const std::string &szName, std::string &szValue) const
{
	return schema().get(*this, szName, szValue);
}

midea::property::result::value AirConditionerAppliance::set_property(const std::string &szName, const std::string &szValue)
{
	return property_result(schema().set(*this, szName, szValue), szName, szValue);
}

std::string AirConditionerAppliance::to_string() const
{
	std::stringstream ss;
	ss << "[AirConditioner]{id=" << m_szApplianceId;
	ss << ", type=" << m_szType;
	ss << ", mode=" << m_iMode;
	ss << ", running=" << midea::bool_to_string(m_bRunning);
	ss << ", target_temperature=" << midea::decimal_to_string(m_dTargetTemperature);
	ss << ", indoor_temperature=" << get_indoor_temperature_text();
	ss << ", outdoor_temperature=" << get_outdoor_temperature_text();
	ss << ", turbo=" << midea::bool_to_string(m_bTurbo);
	ss << ", fan_speed=" << m_iFanSpeed;
	ss << ", turbo_fan=" << midea::bool_to_string(m_bTurboFan);
	ss << ", purifier=" << midea::bool_to_string(m_bPurifier);
	ss << ", dryer=" << midea::bool_to_string(m_bDryer);
	ss << ", sleep=" << midea::bool_to_string(m_bComfortSleep);
	ss << ", prompt=" << midea::bool_to_string(m_bBeepPrompt);
	ss << ", supports={";
	bool first = true;
	for (const auto &itt : m_mCapabilities)
	{
		ss << (first ? "" : ", ") << itt.first << "=" << itt.second;
		first = false;
	}
	ss << "}}";
	return ss.str();
}
