/*
 * Copyright (c) 2024 Gordon Bos <gordon@bosvangennip.nl> All rights reserved.
 *
 * Protocol constants and mobile application presets
 *
 *
 * Source code subject to GNU GENERAL PUBLIC LICENSE version 3
 */

#pragma once
#include <string>
#include <cstdint>

#define MIDEA_LAN_PORT 6444
#define MIDEA_DISCOVERY_PORT 6445
#define MIDEA_DEFAULT_RETRIES 3
#define MIDEA_SOCKET_TIMEOUT_SECS 2
#define MIDEA_CLOUD_TIMEOUT_SECS 9
#define MIDEA_BROADCAST_TIMEOUT_SECS 3
#define MIDEA_BROADCAST_RETRIES 3
#define MIDEA_MAX_BUFFER_SIZE 1024

#define MIDEA_AC_MIN_TEMPERATURE 16
#define MIDEA_AC_MAX_TEMPERATURE 31

#define MIDEA_DEHUMIDIFIER_BUCKET_FULL 38
#define MIDEA_DEHUMIDIFIER_BUCKET_REMOVED 37


namespace midea {

  namespace msgtype {
	enum value {
		HANDSHAKE_REQUEST = 0x0,
		HANDSHAKE_RESPONSE = 0x1,
		ENCRYPTED_RESPONSE = 0x3,
		ENCRYPTED_REQUEST = 0x6,
		TRANSPARENT = 0xF
	};
  }; // namespace msgtype

  namespace appliancetype {
	enum value {
		UNKNOWN = 0x00,
		DEHUMIDIFIER = 0xA1,
		AIRCONDITIONER = 0xAC
	};
  }; // namespace appliancetype

  static const std::string DEFAULT_APP_NAME = "NetHome Plus";
  static const std::string DEFAULT_APPKEY = "3742e9e5842d4ad59c2db887e12449f9";
  static const std::string DEFAULT_APP_ID = "1017";
  static const std::string DEFAULT_API_SERVER_URL = "https://mapp.appsmb.com/v1/";
  static const std::string DEFAULT_SIGNKEY = "xhdiwjnchekd4d512chdjx5d8e4c394D2D7S";
  static const std::string DEFAULT_IOTKEY = "meicloud";
  static const std::string DEFAULT_HMACKEY = "PROD_VnoClJI9aikS8dyy";

  namespace app {

	typedef struct _tAppPreset
	{
		std::string name;
		std::string appkey;
		std::string appid;
		std::string apiurl;
		std::string signkey;
		std::string iotkey;
		std::string hmackey;
		std::string proxied;
	} tAppPreset;

	// returns nullptr for unknown application names
	const tAppPreset* find(const std::string &szName);
	const tAppPreset* get_default();

  }; // namespace app

}; // namespace midea
