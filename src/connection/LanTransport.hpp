/*
 * Copyright (c) 2024 Gordon Bos <gordon@bosvangennip.nl> All rights reserved.
 *
 * Stream transport interface for local appliance sessions
 *
 *
 * Source code subject to GNU GENERAL PUBLIC LICENSE version 3
 */

#pragma once
#include <string>
#include <vector>
#include <cstdint>


class LanTransport
{
public:
	virtual ~LanTransport() {}

	virtual bool connect(const std::string &szAddress, const int iPort, const int iTimeoutSecs) = 0;
	virtual bool is_connected() = 0;
	virtual void disconnect() = 0;

	virtual bool send(const std::vector<uint8_t> &vData) = 0;

	/*
	 * Returns the number of bytes read, 0 when the read timed out and -1 on
	 * a socket error or when the peer closed the connection.
	 */
	virtual int receive(std::vector<uint8_t> &vData, const size_t maxsize) = 0;

	virtual std::string get_last_error() = 0;
};
