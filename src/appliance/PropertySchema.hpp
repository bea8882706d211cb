/*
 * Copyright (c) 2024 Gordon Bos <gordon@bosvangennip.nl> All rights reserved.
 *
 * Named property access for appliance state
 *
 *
 * Source code subject to GNU GENERAL PUBLIC LICENSE version 3
 */

#ifndef _MideaPropertySchema
#define _MideaPropertySchema

#include <string>
#include <vector>
#include <functional>


namespace midea {
  namespace property {

	namespace kind {
		enum value {
			BOOLEAN = 0,
			INTEGER,
			DECIMAL,
			TEXT
		};
	}; // namespace kind

	namespace result {
		enum value {
			OK = 0,
			UNKNOWN_PROPERTY,
			READ_ONLY,
			INVALID_VALUE,	// not parseable as the property kind
			REJECTED	// parsed, refused by the appliance
		};
	}; // namespace result

	typedef struct _tPropertyInfo
	{
		std::string name;
		kind::value kind;
		bool writable;
	} tPropertyInfo;

	// accepts y, yes, t, true, on, 1 and n, no, f, false, off, 0 in any case
	bool parse_bool(const std::string &szValue, bool &value);
	bool parse_int(const std::string &szValue, int &value);
	bool parse_decimal(const std::string &szValue, double &value);

	std::string kind_to_string(const kind::value eKind);

  }; // namespace property
}; // namespace midea


/*
 * Static table mapping property names onto the typed accessors of an
 * appliance class. Entries without a setter are read only.
 */
template <class T>
class PropertySchema
{
public:
	typedef struct _tEntry
	{
		midea::property::tPropertyInfo info;
		std::function<std::string(const T&)> get;
		std::function<midea::property::result::value(T&, const std::string&)> set;
	} tEntry;

	PropertySchema &boolean(const std::string &szName, bool (T::*getter)() const, void (T::*setter)(const bool) = nullptr)
	{
		tEntry entry;
		entry.info = { szName, midea::property::kind::BOOLEAN, (setter != nullptr) };
		entry.get = [getter](const T &appliance) { return std::string((appliance.*getter)() ? "true" : "false"); };
		if (setter != nullptr)
		{
			entry.set = [setter](T &appliance, const std::string &szValue)
			{
				bool value;
				if (!midea::property::parse_bool(szValue, value))
					return midea::property::result::INVALID_VALUE;
				(appliance.*setter)(value);
				return midea::property::result::OK;
			};
		}
		m_vEntries.push_back(entry);
		return *this;
	}

	PropertySchema &integer(const std::string &szName, int (T::*getter)() const, bool (T::*setter)(const int) = nullptr)
	{
		tEntry entry;
		entry.info = { szName, midea::property::kind::INTEGER, (setter != nullptr) };
		entry.get = [getter](const T &appliance) { return std::to_string((appliance.*getter)()); };
		if (setter != nullptr)
		{
			entry.set = [setter](T &appliance, const std::string &szValue)
			{
				int value;
				if (!midea::property::parse_int(szValue, value))
					return midea::property::result::INVALID_VALUE;
				return (appliance.*setter)(value) ? midea::property::result::OK : midea::property::result::REJECTED;
			};
		}
		m_vEntries.push_back(entry);
		return *this;
	}

	PropertySchema &decimal(const std::string &szName, double (T::*getter)() const, bool (T::*setter)(const double) = nullptr)
	{
		tEntry entry;
		entry.info = { szName, midea::property::kind::DECIMAL, (setter != nullptr) };
		entry.get = [getter](const T &appliance)
		{
			std::string szValue = std::to_string((appliance.*getter)());
			// trim trailing zeros, keep one decimal
			size_t last = szValue.find_last_not_of('0');
			if ((last != std::string::npos) && (szValue[last] == '.'))
				last++;
			return szValue.substr(0, last + 1);
		};
		if (setter != nullptr)
		{
			entry.set = [setter](T &appliance, const std::string &szValue)
			{
				double value;
				if (!midea::property::parse_decimal(szValue, value))
					return midea::property::result::INVALID_VALUE;
				return (appliance.*setter)(value) ? midea::property::result::OK : midea::property::result::REJECTED;
			};
		}
		m_vEntries.push_back(entry);
		return *this;
	}

	PropertySchema &text(const std::string &szName, std::string (T::*getter)() const)
	{
		tEntry entry;
		entry.info = { szName, midea::property::kind::TEXT, false };
		entry.get = [getter](const T &appliance) { return (appliance.*getter)(); };
		m_vEntries.push_back(entry);
		return *this;
	}

	const tEntry* find(const std::string &szName) const
	{
		for (const auto &entry : m_vEntries)
		{
			if (entry.info.name == szName)
				return &entry;
		}
		return nullptr;
	}

	std::vector<midea::property::tPropertyInfo> list() const
	{
		std::vector<midea::property::tPropertyInfo> vInfo;
		for (const auto &entry : m_vEntries)
			vInfo.push_back(entry.info);
		return vInfo;
	}

	bool get(const T &appliance, const std::string &szName, std::string &szValue) const
	{
		const tEntry *entry = find(szName);
		if (entry == nullptr)
			return false;
		szValue = entry->get(appliance);
		return true;
	}

	midea::property::result::value set(T &appliance, const std::string &szName, const std::string &szValue) const
	{
		const tEntry *entry = find(szName);
		if (entry == nullptr)
			return midea::property::result::UNKNOWN_PROPERTY;
		if (!entry->info.writable)
			return midea::property::result::READ_ONLY;
		return entry->set(appliance, szValue);
	}

private:
	std::vector<tEntry> m_vEntries;
};

#endif
