/*
 * Copyright (c) 2024 Gordon Bos <gordon@bosvangennip.nl> All rights reserved.
 *
 * Client for the Midea cloud API
 *
 *
 * Source code subject to GNU GENERAL PUBLIC LICENSE version 3
 */

#ifndef _MideaCloud
#define _MideaCloud

#include <string>
#include <vector>
#include <map>
#include <mutex>
#include <cstdint>
#include <json/json.h>
#include "../crypto/Security.hpp"
#include "../common/definitions.hpp"
#include "../common/errors.hpp"

#define MIDEA_CLOUD_FORMAT "2"
#define MIDEA_CLOUD_CLIENT_TYPE "1"
#define MIDEA_CLOUD_LANGUAGE "en_US"
#define MIDEA_CLOUD_SRC "17"
#define MIDEA_TRANSPARENT_HEADER_SIZE 50


namespace midea {
  namespace cloud {

	typedef struct _tCloudAppliance
	{
		std::string id;
		std::string name;
		std::string sn;		// decrypted serial number or "Unknown"
		std::string type;
		std::string model;
	} tCloudAppliance;

	namespace errorcode {
	enum value {
		VALUE_ILLEGAL = 3004,
		INVALID_PASSWORD = 3101,
		INVALID_USERNAME = 3102,
		INVALID_SESSION = 3106,
		FULL_RESTART = 3144,
		ASYNC_REPLY_MISSING = 3176,
		INVALID_APPKEY = 3301,
		RETRY_LATER = 7610,
		SYSTEM_ERROR = 9999
	};
	}; // namespace errorcode

	// bytes as comma separated signed values, e.g. "90,90,1,17,-128"
	std::string encode_as_csv(const std::vector<uint8_t> &vData);
	bool decode_from_csv(const std::string &szData, std::vector<uint8_t> &vData);

  }; // namespace cloud
}; // namespace midea


class MideaCloud
{
public:
/************************************************************************
 *									*
 *	Class construct							*
 *									*
 ************************************************************************/

	MideaCloud(const std::string &szAppKey, const std::string &szAccount, const std::string &szPassword, const std::string &szAppId = midea::DEFAULT_APP_ID, const std::string &szServerUrl = midea::DEFAULT_API_SERVER_URL, const std::string &szSignKey = midea::DEFAULT_SIGNKEY);
	MideaCloud(const midea::app::tAppPreset &preset, const std::string &szAccount, const std::string &szPassword);
	virtual ~MideaCloud();


/************************************************************************
 *									*
 *	Debug information and errors 					*
 *									*
 ************************************************************************/

	std::string get_last_error();
	midea::error::type::value get_last_error_type();
	int get_last_error_code();


/************************************************************************
 *									*
 *	Configuration							*
 *									*
 ************************************************************************/

	void set_max_retries(const int retries);
	int get_max_retries();
	void set_request_timeout(const long timeout);
	void set_sleep_interval(const double seconds);

	MideaSecurity& get_security();
	std::string to_string();


/************************************************************************
 *									*
 *	API requests							*
 *									*
 *	api_request() posts the signed form and returns the value of	*
 *	`szKey` in the reply, or the complete reply for an empty key.	*
 *	Transport failures and recoverable cloud errors are retried	*
 *	up to the configured maximum.					*
 *									*
 ************************************************************************/

	bool api_request(const std::string &szEndpoint, const std::map<std::string, std::string> &mArgs, Json::Value &jResult, const bool bAuthenticate = true, const std::string &szKey = "result");

	bool authenticate();
	bool list_appliances(std::vector<midea::cloud::tCloudAppliance> &vAppliances, const bool bForce = false);

	// token and key are returned empty when the cloud does not know the udp id
	bool get_token(const std::string &szUdpId, std::string &szToken, std::string &szKey);

	bool appliance_transparent_send(const std::string &szApplianceId, const std::vector<uint8_t> &vData, std::vector<std::vector<uint8_t> > &vReplies);


protected:
	virtual bool http_post(const std::string &szUrl, const std::string &szPostData, std::string &szResponse);

private:
	bool get_login_id();
	bool retry_api_request(const std::string &szEndpoint, const std::map<std::string, std::string> &mArgs, Json::Value &jResult, const bool bAuthenticate, const std::string &szKey, const std::string &szCause);
	bool retry_check(const std::string &szEndpoint, const std::string &szCause);
	bool handle_api_error(const int iErrorCode, const std::string &szMessage);
	void sleep(const double duration);
	bool set_error(const midea::error::type::value eType, const std::string &szError, const int iErrorCode = 0);

	std::recursive_mutex m_mutex;
	MideaSecurity m_security;

	std::string m_szAccount;
	std::string m_szPassword;
	std::string m_szAppId;
	std::string m_szServerUrl;

	std::string m_szLoginId;
	Json::Value m_jSession;
	std::vector<midea::cloud::tCloudAppliance> m_vApplianceList;

	int m_iRetries;
	int m_iMaxRetries;
	long m_iRequestTimeout;
	double m_dSleepInterval;

	std::string m_szLastError;
	midea::error::type::value m_eLastError;
	int m_iLastErrorCode;
};

#endif
