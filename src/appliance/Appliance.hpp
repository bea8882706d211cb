/*
 * Copyright (c) 2024 Gordon Bos <gordon@bosvangennip.nl> All rights reserved.
 *
 * Appliance model base class and factory
 *
 *
 * Source code subject to GNU GENERAL PUBLIC LICENSE version 3
 */

#ifndef _MideaAppliance
#define _MideaAppliance

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <cstdint>
#include "PropertySchema.hpp"
#include "../command/Command.hpp"
#include "../common/definitions.hpp"
#include "../common/errors.hpp"

#define B5_CAPABILITIES_OPCODE 0xB5
#define B5_ENTRY_SIZE 4


namespace midea {
  namespace appliancetype {

	/*
	 * Reduces a type tag to its byte value. Accepted are hex notations
	 * ("a1", "0xA1") and decimal notations of the unsigned or signed
	 * byte ("161", "-95"). Strings of digits only are read as decimal.
	 */
	bool normalize(const std::string &szType, uint8_t &type);
	bool normalize(const int type, uint8_t &value);

	bool type_matches(const std::string &szType1, const std::string &szType2);
	bool type_matches(const int type1, const std::string &szType2);
	bool type_matches(const std::string &szType1, const int type2);
	bool type_matches(const int type1, const int type2);

	// canonical rendering, e.g. "0xa1"
	std::string to_string(const uint8_t type);

  }; // namespace appliancetype
}; // namespace midea


class MideaAppliance
{
public:
/************************************************************************
 *									*
 *	Class construct							*
 *									*
 ************************************************************************/

	MideaAppliance(const std::string &szApplianceId, const std::string &szType);
	virtual ~MideaAppliance();

	// selects the implementation for the type tag, unknown types get the base class
	static std::unique_ptr<MideaAppliance> create(const std::string &szApplianceId, const std::string &szType);
	static bool supported(const std::string &szType);

	virtual std::unique_ptr<MideaAppliance> clone() const;


/************************************************************************
 *									*
 *	Identity and status						*
 *									*
 ************************************************************************/

	std::string get_last_error();
	midea::error::type::value get_last_error_type();

	std::string get_appliance_id() const;
	std::string get_type() const;
	virtual midea::appliancetype::value get_family() const;
	virtual std::string get_model() const;
	std::string get_name() const;
	void set_name(const std::string &szName);
	std::string get_serial_number() const;
	void set_serial_number(const std::string &szSerialNumber);
	bool is_online() const;
	void set_online(const bool bOnline);
	bool is_active() const;
	void set_active(const bool bActive);


/************************************************************************
 *									*
 *	Commands and responses						*
 *									*
 *	An empty response marks the appliance offline and keeps the	*
 *	last known state.						*
 *									*
 ************************************************************************/

	virtual std::unique_ptr<MideaCommand> refresh_command();
	virtual std::unique_ptr<MideaCommand> apply_command();
	std::unique_ptr<MideaCommand> capabilities_command(const bool bMore);

	virtual bool process_response(const std::vector<uint8_t> &vData);

	/*
	 * Parses a B5 reply. Part 0 replaces the capability map, part 1
	 * merges into it. Unknown entries are logged and skipped.
	 */
	bool process_capabilities(const std::vector<uint8_t> &vData, const int part = 0);
	const std::map<std::string, int>& get_capabilities() const;


/************************************************************************
 *									*
 *	Named properties						*
 *									*
 ************************************************************************/

	virtual std::vector<midea::property::tPropertyInfo> list_properties() const;
	virtual bool get_property(const std::string &szName, std::string &szValue) const;
	virtual midea::property::result::value set_property(const std::string &szName, const std::string &szValue);

	virtual std::string to_string() const;

protected:
	/*
	 * Family hook for a capability entry at `index`. Returns false for
	 * unknown entries. `width` may be raised for wide entries.
	 */
	virtual bool parse_capability(const std::vector<uint8_t> &vData, const size_t index, size_t &width);

	void dump_response(const std::vector<uint8_t> &vData);
	bool set_error(const midea::error::type::value eType, const std::string &szError);
	midea::property::result::value property_result(const midea::property::result::value eResult, const std::string &szName, const std::string &szValue);

	std::string m_szApplianceId;
	std::string m_szType;
	std::string m_szName;
	std::string m_szSerialNumber;
	bool m_bOnline;
	bool m_bActive;
	std::map<std::string, int> m_mCapabilities;

	std::string m_szLastError;
	midea::error::type::value m_eLastError;
};

#endif
