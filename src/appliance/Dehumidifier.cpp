/*
 * Copyright (c) 2024 Gordon Bos <gordon@bosvangennip.nl> All rights reserved.
 *
 * Dehumidifier appliance model
 *
 *
 * Source code subject to GNU GENERAL PUBLIC LICENSE version 3
 */

#include "Dehumidifier.hpp"
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
	{ 0x14, "mode" },
	{ 0x17, "filter" },
	{ 0x1D, "pump" },
	{ 0x1E, "ion" },
	{ 0x1F, "auto" },
	{ 0x20, "dry_clothes" },
	{ 0x24, "light" },
	{ 0x2D, "water_level" }
};

}; // namespace


DehumidifierAppliance::DehumidifierAppliance(const std::string &szApplianceId, const std::string &szType) :
	MideaAppliance(szApplianceId, szType),
	m_bRunning(false),
	m_iMode(0),
	m_iTargetHumidity(50),
	m_iFanSpeed(40),
	m_bIonMode(false),
	m_bPump(false),
	m_bPumpSwitchFlag(false),
	m_bSleep(false),
	m_bBeepPrompt(false),
	m_bVerticalSwing(false),
	m_iTankWarningLevel(0),
	m_iCurrentHumidity(45),
	m_dCurrentTemperature(0),
	m_bTankFull(false),
	m_iTankLevel(0),
	m_iErrorCode(0),
	m_bDefrosting(false),
	m_bFilterIndicator(false)
{
}

std::unique_ptr<MideaAppliance> DehumidifierAppliance::clone() const
{
	return std::unique_ptr<MideaAppliance>(new DehumidifierAppliance(*this));
}

midea::appliancetype::value DehumidifierAppliance::get_family() const
{
	return midea::appliancetype::DEHUMIDIFIER;
}

std::string DehumidifierAppliance::get_model() const
{
	return "Dehumidifier";
}


/************************************************************************
 *									*
 *	Commands and responses						*
 *									*
 ************************************************************************/

std::unique_ptr<MideaCommand> DehumidifierAppliance::refresh_command()
{
	return std::unique_ptr<MideaCommand>(new DehumidifierStatusCommand());
}

std::unique_ptr<MideaCommand> DehumidifierAppliance::apply_command()
{
	DehumidifierSetCommand *cmd = new DehumidifierSetCommand();
	cmd->set_running(m_bRunning);
	cmd->set_target_humidity(m_iTargetHumidity);
	cmd->set_mode(m_iMode);
	cmd->set_fan_speed(m_iFanSpeed);
	cmd->set_ion_mode(m_bIonMode);
	cmd->set_pump_switch(m_bPump);
	cmd->set_pump_switch_flag(m_bPumpSwitchFlag);
	cmd->set_sleep_switch(m_bSleep);
	cmd->set_beep_prompt(m_bBeepPrompt);
	cmd->set_vertical_swing(m_bVerticalSwing);
	cmd->set_tank_warning_level(m_iTankWarningLevel);
	return std::unique_ptr<MideaCommand>(cmd);
}

bool DehumidifierAppliance::process_response(const std::vector<uint8_t> &vData)
{
	if (vData.empty())
	{
		m_bOnline = false;
		return true;
	}
	m_bOnline = true;
	m_bActive = true;

	_log.Debug(DEBUG_PROTOCOL, "Processing response for dehumidifier id=%s data=%s", m_szApplianceId.c_str(), midea::hex::encode(vData).c_str());
	dump_response(vData);

	DehumidifierResponse response;
	if (!response.decode(vData))
		return set_error(midea::error::type::PROTOCOL, std::string("Dehumidifier response too short: ") + std::to_string(vData.size()) + " bytes");
	_log.Debug(DEBUG_NORM, "Decoded response %s", response.to_string().c_str());

	m_bRunning = response.run_status;
	m_bIonMode = response.ion_mode;
	m_iMode = response.mode;
	set_target_humidity(response.target_humidity);
	m_iCurrentHumidity = response.current_humidity;
	if (m_iCurrentHumidity > 100)
	{
		_log.Log(LOG_STATUS, "Current humidity measurement greater than 100%%, was %d", response.current_humidity);
		m_iCurrentHumidity = 0;
	}
	set_fan_speed(response.fan_speed);
	m_bTankFull = response.tank_full;
	m_iTankLevel = response.tank_level;
	m_iTankWarningLevel = response.tank_warning_level;
	m_dCurrentTemperature = response.indoor_temperature;
	m_iErrorCode = response.err_code;
	m_bDefrosting = response.defrosting;
	m_bFilterIndicator = response.filter_indicator;
	m_bPump = response.pump_switch;
	m_bPumpSwitchFlag = response.pump_switch_flag;
	m_bSleep = response.sleep_switch;
	m_bVerticalSwing = response.up_down_swing;
	return true;
}

/* protected */ bool DehumidifierAppliance::parse_capability(const std::vector<uint8_t> &vData, const size_t index, size_t &width)
{
	(void)width;
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

bool DehumidifierAppliance::get_running() const
{
	return m_bRunning;
}

void DehumidifierAppliance::set_running(const bool bRunning)
{
	m_bRunning = bRunning;
}

int DehumidifierAppliance::get_mode() const
{
	return m_iMode;
}

bool DehumidifierAppliance::set_mode(const int mode)
{
	if ((mode < 0) || (mode > 15))
		return set_error(midea::error::type::VALIDATION, std::string("Tried to set mode to invalid value: ") + std::to_string(mode));
	m_iMode = mode;
	return true;
}

int DehumidifierAppliance::get_target_humidity() const
{
	return m_iTargetHumidity;
}

/* private */ double DehumidifierAppliance::get_target_humidity_value() const
{
	return m_iTargetHumidity;
}

bool DehumidifierAppliance::set_target_humidity(const double humidity)
{
	if (humidity < 0)
	{
		_log.Debug(DEBUG_NORM, "Tried to set target humidity to less than 0%%: %g", humidity);
		m_iTargetHumidity = 0;
	}
	else if (humidity > 100)
	{
		_log.Debug(DEBUG_NORM, "Tried to set target humidity to greater than 100%%: %g", humidity);
		m_iTargetHumidity = 100;
	}
	else
		m_iTargetHumidity = (int)humidity;
	return true;
}

int DehumidifierAppliance::get_fan_speed() const
{
	return m_iFanSpeed;
}

bool DehumidifierAppliance::set_fan_speed(const int speed)
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

bool DehumidifierAppliance::get_ion_mode() const
{
	return m_bIonMode;
}

void DehumidifierAppliance::set_ion_mode(const bool bState)
{
	m_bIonMode = bState;
}

bool DehumidifierAppliance::get_pump() const
{
	return m_bPump;
}

void DehumidifierAppliance::set_pump(const bool bState)
{
	m_bPump = bState;
}

bool DehumidifierAppliance::get_pump_switch_flag() const
{
	return m_bPumpSwitchFlag;
}

void DehumidifierAppliance::set_pump_switch_flag(const bool bState)
{
	m_bPumpSwitchFlag = bState;
}

bool DehumidifierAppliance::get_sleep() const
{
	return m_bSleep;
}

void DehumidifierAppliance::set_sleep(const bool bState)
{
	m_bSleep = bState;
}

bool DehumidifierAppliance::get_beep_prompt() const
{
	return m_bBeepPrompt;
}

void DehumidifierAppliance::set_beep_prompt(const bool bState)
{
	m_bBeepPrompt = bState;
}

bool DehumidifierAppliance::get_vertical_swing() const
{
	return m_bVerticalSwing;
}

void DehumidifierAppliance::set_vertical_swing(const bool bState)
{
	m_bVerticalSwing = bState;
}

int DehumidifierAppliance::get_tank_warning_level() const
{
	return m_iTankWarningLevel;
}

bool DehumidifierAppliance::set_tank_warning_level(const int level)
{
	if ((level < 0) || (level > 100))
		return set_error(midea::error::type::VALIDATION, std::string("Tried to set tank warning level to invalid value: ") + std::to_string(level));
	m_iTankWarningLevel = level;
	return true;
}

int DehumidifierAppliance::get_current_humidity() const
{
	return m_iCurrentHumidity;
}

double DehumidifierAppliance::get_current_temperature() const
{
	return m_dCurrentTemperature;
}

bool DehumidifierAppliance::get_tank_full() const
{
	return m_bTankFull;
}

int DehumidifierAppliance::get_tank_level() const
{
	return m_iTankLevel;
}

int DehumidifierAppliance::get_error_code() const
{
	return m_iErrorCode;
}

bool DehumidifierAppliance::get_defrosting() const
{
	return m_bDefrosting;
}

bool DehumidifierAppliance::get_filter_indicator() const
{
	return m_bFilterIndicator;
}


/************************************************************************
 *									*
 *	Named properties						*
 *									*
 ************************************************************************/

/* private */ const PropertySchema<DehumidifierAppliance>& DehumidifierAppliance::schema()
{
	static const PropertySchema<DehumidifierAppliance> properties = PropertySchema<DehumidifierAppliance>()
		.boolean("running", &DehumidifierAppliance::get_running, &DehumidifierAppliance::set_running)
		.integer("mode", &DehumidifierAppliance::get_mode, &DehumidifierAppliance::set_mode)
		.decimal("target_humidity", &DehumidifierAppliance::get_target_humidity_value, &DehumidifierAppliance::set_target_humidity)
		.integer("fan_speed", &DehumidifierAppliance::get_fan_speed, &DehumidifierAppliance::set_fan_speed)
		.boolean("ion_mode", &DehumidifierAppliance::get_ion_mode, &DehumidifierAppliance::set_ion_mode)
		.boolean("pump", &DehumidifierAppliance::get_pump, &DehumidifierAppliance::set_pump)
		.boolean("pump_switch_flag", &DehumidifierAppliance::get_pump_switch_flag, &DehumidifierAppliance::set_pump_switch_flag)
		.boolean("sleep", &DehumidifierAppliance::get_sleep, &DehumidifierAppliance::set_sleep)
		.boolean("beep_prompt", &DehumidifierAppliance::get_beep_prompt, &DehumidifierAppliance::set_beep_prompt)
		.boolean("vertical_swing", &DehumidifierAppliance::get_vertical_swing, &DehumidifierAppliance::set_vertical_swing)
		.integer("tank_warning_level", &DehumidifierAppliance::get_tank_warning_level, &DehumidifierAppliance::set_tank_warning_level)
		.integer("current_humidity", &DehumidifierAppliance::get_current_humidity)
		.decimal("current_temperature", &DehumidifierAppliance::get_current_temperature)
		.boolean("tank_full", &DehumidifierAppliance::get_tank_full)
		.integer("tank_level", &DehumidifierAppliance::get_tank_level)
		.integer("error_code", &DehumidifierAppliance::get_error_code)
		.boolean("defrosting", &DehumidifierAppliance::get_defrosting)
		.boolean("filter_indicator", &DehumidifierAppliance::get_filter_indicator);
	return properties;
}

std::vector<midea::property::tPropertyInfo> DehumidifierAppliance::list_properties() const
{
	return schema().list();
}

bool DehumidifierAppliance::get_property(const std::string &szName, std::string &szValue) const
{
	return schema().get(*this, szName, szValue);
}

midea::property::result::value DehumidifierAppliance::set_property(const std::string &szName, const std::string &szValue)
{
	return property_result(schema().set(*this, szName, szValue), szName, szValue);
}

std::string DehumidifierAppliance::to_string() const
{
	std::stringstream ss;
	ss << "[Dehumidifier]{id=" << m_szApplianceId;
	ss << ", type=" << m_szType;
	ss << ", mode=" << m_iMode;
	ss << ", running=" << midea::bool_to_string(m_bRunning);
	ss << ", target_humidity=" << m_iTargetHumidity;
	ss << ", fan_speed=" << m_iFanSpeed;
	ss << ", tank_full=" << midea::bool_to_string(m_bTankFull);
	ss << ", current_humidity=" << m_iCurrentHumidity;
	ss << ", current_temperature=" << midea::decimal_to_string(m_dCurrentTemperature);
	ss << ", error_code=" << m_iErrorCode;
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
