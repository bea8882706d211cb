/*
 * Copyright (c) 2024 Gordon Bos <gordon@bosvangennip.nl> All rights reserved.
 *
 * Named property access for appliance state
 *
 *
 * Source code subject to GNU GENERAL PUBLIC LICENSE version 3
 */

#include "PropertySchema.hpp"
#include "../common/hexstring.hpp"
#include <cerrno>
#include <climits>
#include <cstdlib>


namespace midea {
  namespace property {

bool parse_bool(const std::string &szValue, bool &value)
{
	std::string szLower = midea::lowercase(szValue);
	if ((szLower == "y") || (szLower == "yes") || (szLower == "t") || (szLower == "true") || (szLower == "on") || (szLower == "1"))
	{
		value = true;
		return true;
	}
	if ((szLower == "n") || (szLower == "no") || (szLower == "f") || (szLower == "false") || (szLower == "off") || (szLower == "0"))
	{
		value = false;
		return true;
	}
	return false;
}

bool parse_int(const std::string &szValue, int &value)
{
	if (szValue.empty())
		return false;
	char *end = nullptr;
	errno = 0;
	long result = strtol(szValue.c_str(), &end, 10);
	if ((errno != 0) || (*end != '\0') || (result < INT_MIN) || (result > INT_MAX))
		return false;
	value = (int)result;
	return true;
}

bool parse_decimal(const std::string &szValue, double &value)
{
	if (szValue.empty())
		return false;
	char *end = nullptr;
	errno = 0;
	double result = strtod(szValue.c_str(), &end);
	if ((errno != 0) || (*end != '\0'))
		return false;
	value = result;
	return true;
}

std::string kind_to_string(const kind::value eKind)
{
	switch (eKind)
	{
		case kind::BOOLEAN:
			return "bool";
		case kind::INTEGER:
			return "int";
		case kind::DECIMAL:
			return "float";
		case kind::TEXT:
			return "text";
	}
	return "";
}

  }; // namespace property
}; // namespace midea
