/*
 * Copyright (c) 2024 Gordon Bos <gordon@bosvangennip.nl> All rights reserved.
 *
 * Byte and hex string helpers
 *
 *
 * Source code subject to GNU GENERAL PUBLIC LICENSE version 3
 */

#ifndef _MideaHexString
#define _MideaHexString

#include <string>
#include <vector>
#include <cstdint>


namespace midea {

  namespace hex {

	std::string encode(const std::vector<uint8_t> &vData);
	std::string encode(const uint8_t *data, const size_t size);
	bool decode(const std::string &szHex, std::vector<uint8_t> &vData);

	// "a1" style rendering of a single byte
	std::string byte(const uint8_t value);

  }; // namespace hex

  namespace bytes {

	uint64_t from_le(const uint8_t *data, const size_t size);
	void to_le(uint64_t value, uint8_t *data, const size_t size);
	void to_be(uint64_t value, uint8_t *data, const size_t size);
	std::vector<uint8_t> from_string(const std::string &szData);
	std::string to_string(const std::vector<uint8_t> &vData);

  }; // namespace bytes

	/*
	 * Masks all but the first `visible` characters of a sensitive value.
	 * A negative `visible` keeps the last characters instead.
	 */
	std::string redact(const std::string &szValue, const int visible = 0);

	std::string lowercase(const std::string &szValue);

}; // namespace midea

#endif
