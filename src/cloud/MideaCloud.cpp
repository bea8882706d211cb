/*
 * Copyright (c) 2024 Gordon Bos <gordon@bosvangennip.nl> All rights reserved.
 *
 * Client for the Midea cloud API
 *
 *
 * Source code subject to GNU GENERAL PUBLIC LICENSE version 3
 */

#include "MideaCloud.hpp"
#include "../connection/MideaHTTPBridge.hpp"
#include "../common/jsoncppbridge.hpp"
#include "../common/hexstring.hpp"
#include "../common/messages.hpp"
#include "../common/Logger.hpp"
#include <ctime>
#include <cstdlib>
#include <cerrno>
#include <thread>
#include <chrono>


namespace {

// requests and replies that carry credentials are not written to the debug log
bool is_protected_request(const std::string &szEndpoint)
{
	return ((szEndpoint == "user/login/id/get") || (szEndpoint == "user/login"));
}

bool is_protected_response(const std::string &szEndpoint)
{
	return (is_protected_request(szEndpoint) || (szEndpoint == "iot/secure/getToken"));
}

std::string get_stamp()
{
	time_t now = time(nullptr);
	struct tm ltime;
	localtime_r(&now, &ltime);
	char szStamp[16];
	strftime(szStamp, sizeof(szStamp), "%Y%m%d%H%M%S", &ltime);
	return std::string(szStamp);
}

}; // namespace


namespace midea {
namespace cloud {

std::string encode_as_csv(const std::vector<uint8_t> &vData)
{
	std::string szCsv;
	for (const uint8_t byte : vData)
	{
		if (!szCsv.empty())
			szCsv.append(1, ',');
		szCsv.append(std::to_string((int)(int8_t)byte));
	}
	return szCsv;
}

bool decode_from_csv(const std::string &szData, std::vector<uint8_t> &vData)
{
	vData.clear();
	if (szData.empty())
		return true;

	const char *ptr = szData.c_str();
	while (true)
	{
		char *end;
		errno = 0;
		long value = strtol(ptr, &end, 10);
		if ((end == ptr) || (errno != 0) || (value < -128) || (value > 255))
			return false;
		if (value < 0)
			value += 256;
		vData.push_back((uint8_t)value);
		if (*end == '\0')
			break;
		if (*end != ',')
			return false;
		ptr = end + 1;
	}
	return true;
}

}; // namespace cloud
}; // namespace midea


/************************************************************************
 *									*
 *	Class construct							*
 *									*
 ************************************************************************/

MideaCloud::MideaCloud(const std::string &szAppKey, const std::string &szAccount, const std::string &szPassword, const std::string &szAppId, const std::string &szServerUrl, const std::string &szSignKey) :
	m_security(szAppKey, szSignKey),
	m_szAccount(szAccount),
	m_szPassword(szPassword),
	m_szAppId(szAppId),
	m_szServerUrl(szServerUrl),
	m_jSession(Json::nullValue),
	m_iRetries(0),
	m_iMaxRetries(MIDEA_DEFAULT_RETRIES),
	m_iRequestTimeout(MIDEA_CLOUD_TIMEOUT_SECS),
	m_dSleepInterval(1.0),
	m_eLastError(midea::error::type::NONE),
	m_iLastErrorCode(0)
{
	if (!m_szServerUrl.empty() && (m_szServerUrl.back() != '/'))
		m_szServerUrl.append(1, '/');
}

MideaCloud::MideaCloud(const midea::app::tAppPreset &preset, const std::string &szAccount, const std::string &szPassword) :
	MideaCloud(preset.appkey, szAccount, szPassword, preset.appid, preset.apiurl, preset.signkey)
{
}

MideaCloud::~MideaCloud()
{
}


/************************************************************************
 *									*
 *	Debug information and errors 					*
 *									*
 ************************************************************************/

std::string MideaCloud::get_last_error()
{
	return m_szLastError;
}

midea::error::type::value MideaCloud::get_last_error_type()
{
	return m_eLastError;
}

int MideaCloud::get_last_error_code()
{
	return m_iLastErrorCode;
}

/* private */ bool MideaCloud::set_error(const midea::error::type::value eType, const std::string &szError, const int iErrorCode)
{
	m_eLastError = eType;
	m_szLastError = szError;
	m_iLastErrorCode = iErrorCode;
	return false;
}


/************************************************************************
 *									*
 *	Configuration							*
 *									*
 ************************************************************************/

void MideaCloud::set_max_retries(const int retries)
{
	m_iMaxRetries = retries;
}

int MideaCloud::get_max_retries()
{
	return m_iMaxRetries;
}

void MideaCloud::set_request_timeout(const long timeout)
{
	m_iRequestTimeout = timeout;
}

void MideaCloud::set_sleep_interval(const double seconds)
{
	m_dSleepInterval = seconds;
}

MideaSecurity& MideaCloud::get_security()
{
	return m_security;
}

std::string MideaCloud::to_string()
{
	return "MideaCloud(" + m_szServerUrl + ")";
}

/* private */ void MideaCloud::sleep(const double duration)
{
	long iMilliSeconds = (long)(duration * m_dSleepInterval * 1000);
	if (iMilliSeconds > 0)
		std::this_thread::sleep_for(std::chrono::milliseconds(iMilliSeconds));
}


/************************************************************************
 *									*
 *	HTTP transport							*
 *									*
 ************************************************************************/

/* protected */ bool MideaCloud::http_post(const std::string &szUrl, const std::string &szPostData, std::string &szResponse)
{
	return MideaHTTPBridge::PostForm(szUrl, szPostData, szResponse, m_iRequestTimeout);
}


/************************************************************************
 *									*
 *	API requests							*
 *									*
 ************************************************************************/

bool MideaCloud::api_request(const std::string &szEndpoint, const std::map<std::string, std::string> &mArgs, Json::Value &jResult, const bool bAuthenticate, const std::string &szKey)
{
	std::lock_guard<std::recursive_mutex> lock(m_mutex);
	jResult = Json::nullValue;

	if (bAuthenticate && !authenticate())
		return false;

	if ((szEndpoint == "user/login") && !m_jSession.isNull() && !m_szLoginId.empty())
	{
		jResult = m_jSession;
		return true;
	}

	std::map<std::string, std::string> mData;
	mData["appId"] = m_szAppId;
	mData["format"] = MIDEA_CLOUD_FORMAT;
	mData["clientType"] = MIDEA_CLOUD_CLIENT_TYPE;
	mData["language"] = MIDEA_CLOUD_LANGUAGE;
	mData["src"] = MIDEA_CLOUD_SRC;
	mData["stamp"] = get_stamp();
	for (const auto &arg : mArgs)
		mData[arg.first] = arg.second;
	if (!m_jSession.isNull())
		mData["sessionId"] = midea::json_as_string(m_jSession["sessionId"]);

	std::string szUrl = m_szServerUrl + szEndpoint;
	mData["sign"] = m_security.sign(szUrl, mData);

	if (_log.IsDebugLevelEnabled(DEBUG_CLOUD) && !is_protected_request(szEndpoint))
	{
		std::string szArgs;
		for (const auto &field : mData)
		{
			szArgs.append(szArgs.empty() ? "" : ", ");
			szArgs.append(field.first);
			szArgs.append("=");
			szArgs.append((field.first == "sessionId") ? midea::redact(field.second) : field.second);
		}
		_log.Debug(DEBUG_CLOUD, "HTTP request %s: {%s}", szEndpoint.c_str(), szArgs.c_str());
	}

	std::string szResponse;
	if (!http_post(szUrl, MideaHTTPBridge::FormEncode(mData), szResponse))
	{
		Json::Value jError;
		std::string szCause = szResponse;
		if (midea::parse_json_string(szResponse, jError) == 0)
			szCause = midea::json_as_string(jError["msg"]);
		return retry_api_request(szEndpoint, mArgs, jResult, bAuthenticate, szKey, szCause);
	}

	if (!is_protected_response(szEndpoint))
		_log.Debug(DEBUG_CLOUD, "HTTP response text: %s", szResponse.c_str());

	Json::Value jPayload;
	if (midea::parse_json_string(szResponse, jPayload) != 0)
		return set_error(midea::error::type::CLOUD_REQUEST, midea::messages::invalidResponse);

	std::string szErrorCode = midea::json_as_string(jPayload["errorCode"]);
	if (!szErrorCode.empty() && (szErrorCode != "0"))
	{
		std::string szMessage = midea::json_as_string(jPayload["msg"]);
		int iErrorCode = (int)strtol(szErrorCode.c_str(), nullptr, 10);
		if (!handle_api_error(iErrorCode, szMessage))
			return false;
		// recovered, try again
		return retry_api_request(szEndpoint, mArgs, jResult, bAuthenticate, szKey, szMessage + " (" + szErrorCode + ")");
	}

	m_iRetries = 0;
	if (szKey.empty())
		jResult = jPayload;
	else if (jPayload.isMember(szKey))
		jResult = jPayload[szKey];
	return true;
}


/* private */ bool MideaCloud::retry_api_request(const std::string &szEndpoint, const std::map<std::string, std::string> &mArgs, Json::Value &jResult, const bool bAuthenticate, const std::string &szKey, const std::string &szCause)
{
	if (!retry_check(szEndpoint, szCause))
		return false;
	_log.Debug(DEBUG_CLOUD, "Retrying API call %s: %d of %d", szEndpoint.c_str(), m_iRetries + 1, m_iMaxRetries);
	return api_request(szEndpoint, mArgs, jResult, bAuthenticate, szKey);
}


/* private */ bool MideaCloud::retry_check(const std::string &szEndpoint, const std::string &szCause)
{
	m_iRetries++;
	if (m_iRetries >= m_iMaxRetries)
	{
		m_iRetries = 0;
		return set_error(midea::error::type::CLOUD_REQUEST, "Too many retries while calling " + szEndpoint + ", last error " + szCause);
	}
	sleep((double)m_iRetries);
	return true;
}


/************************************************************************
 *									*
 *	Cloud error dispatch						*
 *									*
 *	Returns true when the request should be retried.		*
 *									*
 ************************************************************************/

/* private */ bool MideaCloud::handle_api_error(const int iErrorCode, const std::string &szMessage)
{
	std::string szCause = szMessage + " (" + std::to_string(iErrorCode) + ")";
	switch (iErrorCode)
	{
		case midea::cloud::errorcode::VALUE_ILLEGAL:
		case midea::cloud::errorcode::INVALID_SESSION:
		{
			_log.Debug(DEBUG_CLOUD, "Restarting session: '%d' - '%s'", iErrorCode, szMessage.c_str());
			int iRetries = m_iRetries;
			if (!retry_check("session-restart", szCause))
				return false;
			m_jSession = Json::nullValue;
			if (!authenticate())
				return false;
			m_iRetries = iRetries;
			return true;
		}
		case midea::cloud::errorcode::FULL_RESTART:
		{
			_log.Debug(DEBUG_CLOUD, "Full connection restart: '%d' - '%s'", iErrorCode, szMessage.c_str());
			int iRetries = m_iRetries;
			if (!retry_check("full-restart", szCause))
				return false;
			m_jSession = Json::nullValue;
			if (!get_login_id())
				return false;
			if (!authenticate())
				return false;
			std::vector<midea::cloud::tCloudAppliance> vAppliances;
			if (!list_appliances(vAppliances, true))
				return false;
			m_iRetries = iRetries;
			return true;
		}
		case midea::cloud::errorcode::INVALID_PASSWORD:
		case midea::cloud::errorcode::INVALID_USERNAME:
		case midea::cloud::errorcode::INVALID_APPKEY:
			_log.Log(LOG_ERROR, "Authentication error: '%d' - '%s' for %s", iErrorCode, szMessage.c_str(), midea::redact(m_szAccount, 3).c_str());
			return set_error(midea::error::type::CLOUD_AUTHENTICATION, "Cloud authentication error: " + szCause, iErrorCode);
		case midea::cloud::errorcode::RETRY_LATER:
			_log.Debug(DEBUG_CLOUD, "Retry later: '%d' - '%s'", iErrorCode, szMessage.c_str());
			return set_error(midea::error::type::RETRY_LATER, "Retry later: " + szCause, iErrorCode);
		case midea::cloud::errorcode::ASYNC_REPLY_MISSING:
		case midea::cloud::errorcode::SYSTEM_ERROR:
			_log.Debug(DEBUG_CLOUD, "Ignored error: '%d' - '%s'", iErrorCode, szMessage.c_str());
			return true;
		default:
			return set_error(midea::error::type::CLOUD, "Midea cloud API error: " + szCause, iErrorCode);
	}
}


/************************************************************************
 *									*
 *	Session								*
 *									*
 ************************************************************************/

/* private */ bool MideaCloud::get_login_id()
{
	std::map<std::string, std::string> mArgs;
	mArgs["loginAccount"] = m_szAccount;
	Json::Value jResult;
	if (!api_request("user/login/id/get", mArgs, jResult, false))
		return false;
	if (!jResult.isObject() || !jResult.isMember("loginId"))
		return set_error(midea::error::type::AUTHENTICATION, "Unable to retrieve login id from Midea API");
	m_szLoginId = midea::json_as_string(jResult["loginId"]);
	return true;
}


bool MideaCloud::authenticate()
{
	std::lock_guard<std::recursive_mutex> lock(m_mutex);
	if (m_szLoginId.empty() && !get_login_id())
		return false;

	if (!m_jSession.isNull() && m_jSession.isMember("sessionId"))
		return true;

	std::map<std::string, std::string> mArgs;
	mArgs["loginAccount"] = m_szAccount;
	mArgs["password"] = m_security.encrypt_password(m_szLoginId, m_szPassword);
	Json::Value jSession;
	if (!api_request("user/login", mArgs, jSession, false))
		return false;

	if (!jSession.isObject() || !jSession.isMember("sessionId"))
	{
		m_jSession = Json::nullValue;
		return set_error(midea::error::type::AUTHENTICATION, "Unable to retrieve session id from Midea API");
	}
	m_jSession = jSession;
	std::string szAccessToken = midea::json_as_string(m_jSession["accessToken"]);
	if (!szAccessToken.empty() && !m_security.set_access_token(szAccessToken))
		return set_error(midea::error::type::AUTHENTICATION, m_security.get_last_error());

	_log.Debug(DEBUG_CLOUD, "Received session id %s", midea::redact(midea::json_as_string(m_jSession["sessionId"])).c_str());
	return true;
}


/************************************************************************
 *									*
 *	Appliance registry						*
 *									*
 ************************************************************************/

bool MideaCloud::list_appliances(std::vector<midea::cloud::tCloudAppliance> &vAppliances, const bool bForce)
{
	std::lock_guard<std::recursive_mutex> lock(m_mutex);
	if (!bForce && !m_vApplianceList.empty())
	{
		vAppliances = m_vApplianceList;
		return true;
	}

	Json::Value jGroups;
	if (!api_request("homegroup/list/get", std::map<std::string, std::string>(), jGroups))
		return false;
	_log.Debug(DEBUG_CLOUD, "Midea home group query result=%s", midea::json_as_string(jGroups).c_str());
	if (!jGroups.isObject() || !jGroups["list"].isArray() || jGroups["list"].empty())
		return set_error(midea::error::type::CLOUD_REQUEST, "Unable to get home groups from Midea API");

	std::string szHomeGroupId;
	for (const auto &jGroup : jGroups["list"])
	{
		if (midea::json_as_string(jGroup["isDefault"]) == "1")
		{
			szHomeGroupId = midea::json_as_string(jGroup["id"]);
			break;
		}
	}
	if (szHomeGroupId.empty())
		return set_error(midea::error::type::CLOUD_REQUEST, "Unable to get default home group from Midea API");

	std::map<std::string, std::string> mArgs;
	mArgs["homegroupId"] = szHomeGroupId;
	Json::Value jAppliances;
	if (!api_request("appliance/list/get", mArgs, jAppliances))
		return false;

	m_vApplianceList.clear();
	if (jAppliances.isObject() && jAppliances["list"].isArray())
	{
		for (const auto &jItem : jAppliances["list"])
		{
			midea::cloud::tCloudAppliance appliance;
			appliance.id = midea::json_as_string(jItem["id"]);
			appliance.name = midea::json_as_string(jItem["name"]);
			appliance.type = midea::json_as_string(jItem["type"]);
			appliance.model = midea::json_as_string(jItem["modelNumber"]);
			appliance.sn = "Unknown";
			std::string szEncryptedSn = midea::json_as_string(jItem["sn"]);
			if (!szEncryptedSn.empty() && !m_security.aes_decrypt_string(szEncryptedSn, appliance.sn))
				return set_error(midea::error::type::CLOUD_REQUEST, m_security.get_last_error());
			m_vApplianceList.push_back(appliance);
			_log.Debug(DEBUG_CLOUD, "Midea appliance id=%s sn=%s type=%s name=%s", midea::redact(appliance.id, 4).c_str(), midea::redact(appliance.sn, 8).c_str(), appliance.type.c_str(), appliance.name.c_str());
		}
	}
	vAppliances = m_vApplianceList;
	return true;
}


bool MideaCloud::get_token(const std::string &szUdpId, std::string &szToken, std::string &szKey)
{
	std::lock_guard<std::recursive_mutex> lock(m_mutex);
	szToken.clear();
	szKey.clear();

	std::map<std::string, std::string> mArgs;
	mArgs["udpid"] = szUdpId;
	Json::Value jResult;
	if (!api_request("iot/secure/getToken", mArgs, jResult))
		return false;
	if (!jResult.isObject() || !jResult["tokenlist"].isArray())
		return true;

	for (const auto &jToken : jResult["tokenlist"])
	{
		if (midea::json_as_string(jToken["udpId"]) == szUdpId)
		{
			szToken = midea::json_as_string(jToken["token"]);
			szKey = midea::json_as_string(jToken["key"]);
			break;
		}
	}
	return true;
}


/************************************************************************
 *									*
 *	Cloud relay							*
 *									*
 *	The packet travels as CSV of signed bytes, encrypted with the	*
 *	session data key. The reply carries a 50 byte relay header	*
 *	in front of the appliance response.				*
 *									*
 ************************************************************************/

bool MideaCloud::appliance_transparent_send(const std::string &szApplianceId, const std::vector<uint8_t> &vData, std::vector<std::vector<uint8_t> > &vReplies)
{
	std::lock_guard<std::recursive_mutex> lock(m_mutex);
	vReplies.clear();
	_log.Debug(DEBUG_CLOUD, "Sending to id=%s data=%s", midea::redact(szApplianceId, 4).c_str(), midea::hex::encode(vData).c_str());

	// the data key only exists after login
	if (!authenticate())
		return false;

	std::string szOrder;
	if (!m_security.aes_encrypt_string(midea::cloud::encode_as_csv(vData), szOrder))
		return set_error(midea::error::type::PROTOCOL, m_security.get_last_error());

	std::map<std::string, std::string> mArgs;
	mArgs["order"] = szOrder;
	mArgs["funId"] = "0000";
	mArgs["applianceId"] = szApplianceId;
	Json::Value jResult;
	if (!api_request("appliance/transparent/send", mArgs, jResult))
		return false;

	if (!jResult.isObject() || !jResult["reply"].isString())
		return set_error(midea::error::type::PROTOCOL, "Missing reply from transparent send");

	std::string szDecrypted;
	if (!m_security.aes_decrypt_string(jResult["reply"].asString(), szDecrypted))
		return set_error(midea::error::type::PROTOCOL, m_security.get_last_error());
	_log.Debug(DEBUG_CLOUD, "decrypted reply %s", szDecrypted.c_str());

	std::vector<uint8_t> vReply;
	if (!midea::cloud::decode_from_csv(szDecrypted, vReply))
		return set_error(midea::error::type::PROTOCOL, "Invalid reply encoding from transparent send");
	if (vReply.size() < MIDEA_TRANSPARENT_HEADER_SIZE)
		return set_error(midea::error::type::PROTOCOL, "Invalid payload size, was " + std::to_string(vReply.size()) + " expected 50 bytes");

	_log.Debug(DEBUG_CLOUD, "Received from id=%s data=%s", midea::redact(szApplianceId, 4).c_str(), midea::hex::encode(vReply).c_str());
	vReplies.push_back(std::vector<uint8_t>(vReply.begin() + MIDEA_TRANSPARENT_HEADER_SIZE, vReply.end()));
	return true;
}
