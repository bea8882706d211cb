/*
 * Copyright (c) 2024 Gordon Bos <gordon@bosvangennip.nl> All rights reserved.
 *
 * Frame check values for Midea appliance commands
 *
 *
 * Source code subject to GNU GENERAL PUBLIC LICENSE version 3
 */

#pragma once
#include <cstdint>
#include <cstddef>
#include <vector>


namespace midea {
  namespace crypto {

	// Dallas/Maxim CRC8, seed 0
	uint8_t crc8(const uint8_t *data, const size_t size);
	uint8_t crc8(const std::vector<uint8_t> &vData);

	// two's complement of the byte sum
	uint8_t frame_checksum(const uint8_t *data, const size_t size);

  }; // namespace crypto
}; // namespace midea
