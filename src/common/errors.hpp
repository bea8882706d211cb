/*
 * Copyright (c) 2024 Gordon Bos <gordon@bosvangennip.nl> All rights reserved.
 *
 * Error classes for the Midea appliance library
 *
 *
 * Source code subject to GNU GENERAL PUBLIC LICENSE version 3
 */

#pragma once
#include <string>


namespace midea {
  namespace error {

    namespace type {
	enum value {
		NONE = 0,
		NETWORK,		// socket level, retryable
		PROTOCOL,		// malformed frame or signature mismatch
		AUTHENTICATION,		// handshake or session key failure
		UNSUPPORTED,		// appliance type or protocol version
		VALIDATION,		// property value out of range
		CLOUD,			// unmapped cloud error code
		CLOUD_AUTHENTICATION,
		CLOUD_REQUEST,
		RETRY_LATER,
		GENERIC
	};
    }; // namespace type

    static const std::string names[] = {
	"none",
	"network error",
	"protocol error",
	"authentication error",
	"unsupported",
	"validation error",
	"cloud error",
	"cloud authentication error",
	"cloud request error",
	"retry later",
	"error"
    };

    inline std::string to_string(const type::value eType)
    {
	if ((eType < type::NONE) || (eType > type::GENERIC))
		return names[type::GENERIC];
	return names[eType];
    }

  }; // namespace error
}; // namespace midea
