/*
 * Copyright (c) 2024 Gordon Bos <gordon@bosvangennip.nl> All rights reserved.
 *
 * Appliance model base class and factory
 *
 *
 * Source code subject to GNU GENERAL PUBLIC LICENSE version 3
 */

#include "Appliance.hpp"
#include "Dehumidifier.hpp"
#include "AirConditioner.hpp"
#include "../common/Logger.hpp"
#include "../common/hexstring.hpp"
#include <bitset>
#include <cstdlib>


namespace midea {
  namespace appliancetype {

bool normalize(const int type, uint8_t &value)
{
	if ((type < -128) || (type > 255))
		return false;
	value = (uint8_t)(type & 0xFF);
	return true;
}

bool normalize(const std::string &szType, uint8_t &type)
{
	std::string szLower = midea::lowercase(szType);
	if (szLower.empty())
		return false;

	if (szLower.compare(0, 2, "0x") == 0)
	{
		std::string szHex = szLower.substr(2);
		if (szHex.empty() || (szHex.size() > 2) || (szHex.find_first_not_of("0123456789abcdef") != std::string::npos))
			return false;
		type = (uint8_t)strtoul(szHex.c_str(), nullptr, 16);
		return true;
	}

	size_t start = (szLower[0] == '-') ? 1 : 0;
	if ((szLower.size() > start) && (szLower.size() <= start + 4) && (szLower.find_first_not_of("0123456789", start) == std::string::npos))
		return normalize(atoi(szLower.c_str()), type);

	if ((szLower.size() <= 2) && (szLower.find_first_not_of("0123456789abcdef") == std::string::npos))
	{
		type = (uint8_t)strtoul(szLower.c_str(), nullptr, 16);
		return true;
	}
	return false;
}

bool type_matches(const std::string &szType1, const std::string &szType2)
{
	uint8_t type1, type2;
	if (normalize(szType1, type1) && normalize(szType2, type2))
		return (type1 == type2);

	return (midea::lowercase(szType1) == midea::lowercase(szType2));
}

bool type_matches(const int type1, const std::string &szType2)
{
	uint8_t value1, value2;
	return (normalize(type1, value1) && normalize(szType2, value2) && (value1 == value2));
}

bool type_matches(const std::string &szType1, const int type2)
{
	return type_matches(type2, szType1);
}

bool type_matches(const int type1, const int type2)
{
	uint8_t value1, value2;
	return (normalize(type1, value1) && normalize(type2, value2) && (value1 == value2));
}

std::string to_string(const uint8_t type)
{
	return std::string("0x") + midea::hex::byte(type);
}

  }; // namespace appliancetype
}; // namespace midea


/************************************************************************
 *									*
 *	Class construct							*
 *									*
 ************************************************************************/

MideaAppliance::MideaAppliance(const std::string &szApplianceId, const std::string &szType) :
	m_szApplianceId(szApplianceId),
	m_szType(szType),
	m_bOnline(false),
	m_bActive(false),
	m_eLastError(midea::error::type::NONE)
{
}

MideaAppliance::~MideaAppliance()
{
}

std::unique_ptr<MideaAppliance> MideaAppliance::create(const std::string &szApplianceId, const std::string &szType)
{
	uint8_t type = 0;
	midea::appliancetype::normalize(szType, type);
	switch (type)
	{
		case midea::appliancetype::DEHUMIDIFIER:
			return std::unique_ptr<MideaAppliance>(new DehumidifierAppliance(szApplianceId, szType));
		case midea::appliancetype::AIRCONDITIONER:
			return std::unique_ptr<MideaAppliance>(new AirConditionerAppliance(szApplianceId, szType));
		default:
			break;
	}
	_log.Log(LOG_STATUS, "Creating unsupported appliance %s of type %s", szApplianceId.c_str(), szType.c_str());
	return std::unique_ptr<MideaAppliance>(new MideaAppliance(szApplianceId, szType));
}

bool MideaAppliance::supported(const std::string &szType)
{
	uint8_t type;
	if (!midea::appliancetype::normalize(szType, type))
		return false;
	return ((type == midea::appliancetype::DEHUMIDIFIER) || (type == midea::appliancetype::AIRCONDITIONER));
}

std::unique_ptr<MideaAppliance> MideaAppliance::clone() const
{
	return std::unique_ptr<MideaAppliance>(new MideaAppliance(*this));
}


/************************************************************************
 *									*
 *	Identity and status						*
 *									*
 ************************************************************************/

std::string MideaAppliance::get_last_error()
{
	return m_szLastError;
}

midea::error::type::value MideaAppliance::get_last_error_type()
{
	return m_eLastError;
}

/* protected */ bool MideaAppliance::set_error(const midea::error::type::value eType, const std::string &szError)
{
	m_eLastError = eType;
	m_szLastError = szError;
	return false;
}

std::string MideaAppliance::get_appliance_id() const
{
	return m_szApplianceId;
}

std::string MideaAppliance::get_type() const
{
	return m_szType;
}

midea::appliancetype::value MideaAppliance::get_family() const
{
	return midea::appliancetype::UNKNOWN;
}

std::string MideaAppliance::get_model() const
{
	return m_szType;
}

std::string MideaAppliance::get_name() const
{
	if (m_szName.empty())
		return m_szApplianceId;
	return m_szName;
}

void MideaAppliance::set_name(const std::string &szName)
{
	m_szName = szName;
}

std::string MideaAppliance::get_serial_number() const
{
	return m_szSerialNumber;
}

void MideaAppliance::set_serial_number(const std::string &szSerialNumber)
{
	m_szSerialNumber = szSerialNumber;
}

bool MideaAppliance::is_online() const
{
	return m_bOnline;
}

void MideaAppliance::set_online(const bool bOnline)
{
	m_bOnline = bOnline;
}

bool MideaAppliance::is_active() const
{
	return m_bActive;
}

void MideaAppliance::set_active(const bool bActive)
{
	m_bActive = bActive;
}


/************************************************************************
 *									*
 *	Commands and responses						*
 *									*
 ************************************************************************/

std::unique_ptr<MideaCommand> MideaAppliance::refresh_command()
{
	return std::unique_ptr<MideaCommand>(new MideaCommand());
}

std::unique_ptr<MideaCommand> MideaAppliance::apply_command()
{
	return std::unique_ptr<MideaCommand>(new MideaCommand());
}

std::unique_ptr<MideaCommand> MideaAppliance::capabilities_command(const bool bMore)
{
	uint8_t type = (uint8_t)get_family();
	if (type == midea::appliancetype::UNKNOWN)
		midea::appliancetype::normalize(m_szType, type);
	if (bMore)
		return std::unique_ptr<MideaCommand>(new DeviceCapabilitiesCommandMore(type));
	return std::unique_ptr<MideaCommand>(new DeviceCapabilitiesCommand(type));
}

bool MideaAppliance::process_response(const std::vector<uint8_t> &vData)
{
	_log.Debug(DEBUG_NORM, "Ignored response for unsupported appliance %s", m_szApplianceId.c_str());
	if (vData.empty())
		m_bOnline = false;
	return true;
}

/* protected */ void MideaAppliance::dump_response(const std::vector<uint8_t> &vData)
{
	if (!_log.IsDebugLevelEnabled(DEBUG_PROTOCOL))
		return;
	for (size_t i = 0; i < vData.size(); i++)
		_log.Debug(DEBUG_PROTOCOL, "%2d %3d %02X %s", (int)i, vData[i], vData[i], std::bitset<8>(vData[i]).to_string().c_str());
}

bool MideaAppliance::process_capabilities(const std::vector<uint8_t> &vData, const int part)
{
	if (vData.empty())
		return true;
	if (vData[0] != B5_CAPABILITIES_OPCODE)
	{
		_log.Debug(DEBUG_NORM, "Not a B5 response");
		return set_error(midea::error::type::PROTOCOL, "Not a B5 response");
	}
	if (vData.size() < 2)
		return set_error(midea::error::type::PROTOCOL, "Truncated B5 response");

	if (part == 0)
		m_mCapabilities.clear();

	size_t count = vData[1];
	size_t i = 2;
	for (size_t n = 0; n < count; n++)
	{
		if (i + B5_ENTRY_SIZE > vData.size())
		{
			_log.Debug(DEBUG_PROTOCOL, "B5 response holds %d of %d announced entries", (int)n, (int)count);
			break;
		}
		size_t width = B5_ENTRY_SIZE;
		if ((vData[i + 1] != 0x02) || !parse_capability(vData, i, width))
			_log.Log(LOG_STATUS, "unknown property=%02X%02X", vData[i], vData[i + 1]);
		i += width;
	}
	return true;
}

const std::map<std::string, int>& MideaAppliance::get_capabilities() const
{
	return m_mCapabilities;
}

/* protected */ bool MideaAppliance::parse_capability(const std::vector<uint8_t> &vData, const size_t index, size_t &width)
{
	(void)vData;
	(void)index;
	(void)width;
	return false;
}


/************************************************************************
 *									*
 *	Named properties						*
 *									*
 ************************************************************************/

std::vector<midea::property::tPropertyInfo> MideaAppliance::list_properties() const
{
	return std::vector<midea::property::tPropertyInfo>();
}

bool MideaAppliance::get_property(const std::string &szName, std::string &szValue) const
{
	(void)szName;
	szValue.clear();
	return false;
}

midea::property::result::value MideaAppliance::set_property(const std::string &szName, const std::string &szValue)
{
	return property_result(midea::property::result::UNKNOWN_PROPERTY, szName, szValue);
}

/* protected */ midea::property::result::value MideaAppliance::property_result(const midea::property::result::value eResult, const std::string &szName, const std::string &szValue)
{
	switch (eResult)
	{
		case midea::property::result::OK:
			break;
		case midea::property::result::UNKNOWN_PROPERTY:
			set_error(midea::error::type::VALIDATION, std::string("Unknown property '") + szName + "' for " + get_model());
			break;
		case midea::property::result::READ_ONLY:
			set_error(midea::error::type::VALIDATION, std::string("Property '") + szName + "' is read only");
			break;
		case midea::property::result::INVALID_VALUE:
			set_error(midea::error::type::VALIDATION, std::string("Invalid value '") + szValue + "' for property '" + szName + "'");
			break;
		case midea::property::result::REJECTED:
			// the setter left its own message
			break;
	}
	return eResult;
}

std::string MideaAppliance::to_string() const
{
	return std::string("[UnknownAppliance]{id=") + m_szApplianceId + " type=" + m_szType + "}";
}
