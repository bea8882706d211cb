/*
 * Copyright (c) 2024 Gordon Bos <gordon@bosvangennip.nl> All rights reserved.
 *
 * Byte and hex string helpers
 *
 *
 * Source code subject to GNU GENERAL PUBLIC LICENSE version 3
 */

#include "hexstring.hpp"
#include <algorithm>
#include <cctype>

namespace midea {

namespace hex {

static const char hexdigits[] = "0123456789abcdef";

static int nibble(const char c)
{
	if ((c >= '0') && (c <= '9'))
		return c - '0';
	if ((c >= 'a') && (c <= 'f'))
		return c - 'a' + 10;
	if ((c >= 'A') && (c <= 'F'))
		return c - 'A' + 10;
	return -1;
}

std::string encode(const uint8_t *data, const size_t size)
{
	std::string szResult;
	szResult.reserve(size * 2);
	for (size_t i = 0; i < size; i++)
	{
		szResult.append(1, hexdigits[(data[i] >> 4) & 0x0F]);
		szResult.append(1, hexdigits[data[i] & 0x0F]);
	}
	return szResult;
}

std::string encode(const std::vector<uint8_t> &vData)
{
	if (vData.empty())
		return "";
	return encode(&vData[0], vData.size());
}

bool decode(const std::string &szHex, std::vector<uint8_t> &vData)
{
	vData.clear();
	if (szHex.size() & 1)
		return false;
	vData.reserve(szHex.size() / 2);
	for (size_t i = 0; i < szHex.size(); i += 2)
	{
		int hi = nibble(szHex[i]);
		int lo = nibble(szHex[i + 1]);
		if ((hi < 0) || (lo < 0))
		{
			vData.clear();
			return false;
		}
		vData.push_back((uint8_t)((hi << 4) | lo));
	}
	return true;
}

std::string byte(const uint8_t value)
{
	return encode(&value, 1);
}

}; // namespace hex


namespace bytes {

uint64_t from_le(const uint8_t *data, const size_t size)
{
	uint64_t result = 0;
	for (size_t i = size; i > 0; i--)
		result = (result << 8) | data[i - 1];
	return result;
}

void to_le(uint64_t value, uint8_t *data, const size_t size)
{
	for (size_t i = 0; i < size; i++)
	{
		data[i] = (uint8_t)(value & 0xFF);
		value >>= 8;
	}
}

void to_be(uint64_t value, uint8_t *data, const size_t size)
{
	for (size_t i = size; i > 0; i--)
	{
		data[i - 1] = (uint8_t)(value & 0xFF);
		value >>= 8;
	}
}

std::vector<uint8_t> from_string(const std::string &szData)
{
	return std::vector<uint8_t>(szData.begin(), szData.end());
}

std::string to_string(const std::vector<uint8_t> &vData)
{
	return std::string(vData.begin(), vData.end());
}

}; // namespace bytes


std::string redact(const std::string &szValue, const int visible)
{
	if (szValue.empty())
		return szValue;
	int length = (int)szValue.size();
	if (visible >= 0)
	{
		if (visible >= length)
			return szValue;
		return szValue.substr(0, visible) + std::string(length - visible, '*');
	}
	int keep = -visible;
	if (keep >= length)
		return szValue;
	return std::string(length - keep, '*') + szValue.substr(length - keep);
}

std::string lowercase(const std::string &szValue)
{
	std::string szLower(szValue);
	std::transform(szLower.begin(), szLower.end(), szLower.begin(), [](unsigned char c) { return (char)std::tolower(c); });
	return szLower;
}

}; // namespace midea
