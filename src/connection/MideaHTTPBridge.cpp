/*
 * Copyright (c) 2024 Gordon Bos <gordon@bosvangennip.nl> All rights reserved.
 *
 * HTTPS transport for the Midea cloud API
 *
 *
 * Source code subject to GNU GENERAL PUBLIC LICENSE version 3
 */

#include "MideaHTTPBridge.hpp"
#include <curl/curl.h>
#include <mutex>
#include <new>
#include <sstream>
#include <iomanip>

#define MIDEA_CLOUD_CONNECT_TIMEOUT_SECS 5
#define MIDEA_CLOUD_USER_AGENT "mideapp/1.0"


bool MideaHTTPBridge::m_bCurlInitialized = false;

namespace {

std::mutex curl_mutex;

/*
 * curl calls these from C code, nothing may be thrown through it.
 * Returning a short count makes curl abort the transfer with a write error.
 */
size_t receive_status_line(char *contents, size_t size, size_t nmemb, void *userp)
{
	size_t realsize = size * nmemb;
	std::vector<std::string> *pvStatusLines = (std::vector<std::string>*)userp;
	std::string szLine(contents, realsize);
	size_t eol = szLine.find_first_of("\r\n");
	if (eol != std::string::npos)
		szLine.resize(eol);
	if (!MideaHTTPBridge::IsStatusLine(szLine))
		return realsize;
	try
	{
		pvStatusLines->push_back(szLine);
	}
	catch (const std::bad_alloc&)
	{
		return 0;
	}
	return realsize;
}

size_t receive_body(char *contents, size_t size, size_t nmemb, void *userp)
{
	size_t realsize = size * nmemb;
	std::string *pszBody = (std::string*)userp;
	try
	{
		pszBody->append(contents, realsize);
	}
	catch (const std::bad_alloc&)
	{
		return 0;
	}
	return realsize;
}

std::string error_json(const std::string &szCode, const std::string &szMessage)
{
	std::string szResponse = "{\"errorCode\":\"";
	szResponse.append(szCode);
	szResponse.append("\",\"msg\":\"");
	for (const char c : szMessage)
	{
		if ((c == '"') || (c == '\\'))
			szResponse.append(1, '\\');
		if ((unsigned char)c >= 0x20)
			szResponse.append(1, c);
	}
	szResponse.append("\"}");
	return szResponse;
}

// "HTTP/1.1 404 Not Found" and "CURLE 28 Timeout was reached" share one layout
void split_status_line(const std::string &szLine, std::string &szCode, std::string &szMessage)
{
	szCode.clear();
	szMessage.clear();
	size_t start = szLine.find(' ');
	if (start == std::string::npos)
	{
		szCode = "-1";
		szMessage = szLine;
		return;
	}
	start++;
	size_t end = szLine.find(' ', start);
	std::string szToken = szLine.substr(start, (end == std::string::npos) ? std::string::npos : end - start);
	size_t digits = (!szToken.empty() && (szToken[0] == '-')) ? 1 : 0;
	if ((szToken.size() <= digits) || (szToken.find_first_not_of("0123456789", digits) != std::string::npos))
	{
		szCode = "-1";
		szMessage = szLine;
		return;
	}
	szCode = szToken;
	if (end != std::string::npos)
		szMessage = szLine.substr(end + 1);
}

}; // namespace


/************************************************************************
 *									*
 * Transport								*
 *									*
 ************************************************************************/

/* private */ bool MideaHTTPBridge::GlobalInit()
{
	std::lock_guard<std::mutex> lock(curl_mutex);
	if (!m_bCurlInitialized)
		m_bCurlInitialized = (curl_global_init(CURL_GLOBAL_DEFAULT) == CURLE_OK);
	return m_bCurlInitialized;
}

void MideaHTTPBridge::CloseConnection()
{
	std::lock_guard<std::mutex> lock(curl_mutex);
	if (m_bCurlInitialized)
		curl_global_cleanup();
	m_bCurlInitialized = false;
}

/* private */ bool MideaHTTPBridge::Transfer(const std::string &szUrl, const std::string &szForm, const long iTimeOut, std::string &szResponse, std::vector<std::string> &vStatusLines)
{
	if (!GlobalInit())
	{
		vStatusLines.push_back("CURLE -1 Failed to initialize HTTP client");
		return false;
	}
	CURL *curl = curl_easy_init();
	if (!curl)
	{
		vStatusLines.push_back("CURLE -1 Failed to create HTTP handle");
		return false;
	}

	struct curl_slist *headers = nullptr;
	headers = curl_slist_append(headers, "Content-Type: application/x-www-form-urlencoded");
	headers = curl_slist_append(headers, "Accept: application/json");

	curl_easy_setopt(curl, CURLOPT_URL, szUrl.c_str());
	curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
	curl_easy_setopt(curl, CURLOPT_USERAGENT, MIDEA_CLOUD_USER_AGENT);
	curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, (long)MIDEA_CLOUD_CONNECT_TIMEOUT_SECS);
	curl_easy_setopt(curl, CURLOPT_TIMEOUT, iTimeOut);
	curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
	curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 0L);
	curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
	curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
	curl_easy_setopt(curl, CURLOPT_POST, 1L);
	curl_easy_setopt(curl, CURLOPT_POSTFIELDS, szForm.c_str());
	curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, (long)szForm.size());
	curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, receive_status_line);
	curl_easy_setopt(curl, CURLOPT_HEADERDATA, &vStatusLines);
	curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, receive_body);
	curl_easy_setopt(curl, CURLOPT_WRITEDATA, &szResponse);

	CURLcode res = curl_easy_perform(curl);
	if (res != CURLE_OK)
	{
		std::stringstream ss;
		ss << "CURLE " << (int)res << " " << curl_easy_strerror(res);
		vStatusLines.push_back(ss.str());
	}

	curl_slist_free_all(headers);
	curl_easy_cleanup(curl);
	return (res == CURLE_OK);
}

bool MideaHTTPBridge::PostForm(const std::string &szUrl, const std::string &szForm, std::string &szResponse, const long iTimeOut)
{
	szResponse.clear();
	std::vector<std::string> vStatusLines;
	bool bTransferOK = Transfer(szUrl, szForm, iTimeOut, szResponse, vStatusLines);
	return ProcessResponse(szResponse, vStatusLines, bTransferOK);
}


/************************************************************************
 *									*
 * Encoding								*
 *									*
 ************************************************************************/

std::string MideaHTTPBridge::URLEncode(const std::string &szDecodedString)
{
	std::stringstream ss;
	for (const char c : szDecodedString)
	{
		bool bUnreserved = ((c >= '0') && (c <= '9')) || ((c >= 'a') && (c <= 'z')) || ((c >= 'A') && (c <= 'Z')) ||
				(c == '-') || (c == '_') || (c == '.') || (c == '~');
		if (bUnreserved)
			ss << c;
		else
			ss << '%' << std::hex << std::uppercase << std::setfill('0') << std::setw(2) << (int)(unsigned char)c << std::nouppercase << std::dec;
	}
	return ss.str();
}

std::string MideaHTTPBridge::FormEncode(const std::map<std::string, std::string> &mFields)
{
	std::string szForm;
	for (const auto &field : mFields)
	{
		if (!szForm.empty())
			szForm.append(1, '&');
		szForm.append(URLEncode(field.first));
		szForm.append(1, '=');
		szForm.append(URLEncode(field.second));
	}
	return szForm;
}


/************************************************************************
 *									*
 * Response checking							*
 *									*
 ************************************************************************/

bool MideaHTTPBridge::IsStatusLine(const std::string &szLine)
{
	return ((szLine.compare(0, 5, "HTTP/") == 0) || (szLine.compare(0, 6, "CURLE ") == 0));
}

bool MideaHTTPBridge::ProcessResponse(std::string &szResponse, const std::vector<std::string> &vStatusLines, const bool bTransferOK)
{
	// interim replies such as 100 Continue come first, the final status is the last one
	std::string szStatus;
	for (const auto &szLine : vStatusLines)
	{
		if (IsStatusLine(szLine))
			szStatus = szLine;
	}

	std::string szCode;
	std::string szMessage;
	if (!szStatus.empty())
	{
		split_status_line(szStatus, szCode, szMessage);

		if (!bTransferOK && (szStatus[0] == 'C'))
		{
			szResponse = error_json(szCode, szMessage.empty() ? "HTTP client error " + szCode : szMessage);
			return false;
		}
		if ((szCode.size() == 3) && (szCode[0] >= '4'))
		{
			szResponse = error_json(szCode, szMessage.empty() ? "HTTP " + szCode : szMessage);
			return false;
		}
	}

	if (szResponse.empty())
	{
		szResponse = error_json(szCode.empty() ? "204" : szCode, szMessage.empty() ? "Midea cloud did not return any data" : szMessage);
		return false;
	}

	if ((szResponse[0] == '{') || (szResponse[0] == '['))
		return bTransferOK;

	// error pages from proxies and load balancers
	size_t title = szResponse.find("<title>");
	if (title != std::string::npos)
	{
		title += 7;
		size_t end = szResponse.find('<', title);
		szResponse = error_json(szCode.empty() ? "-1" : szCode, szResponse.substr(title, (end == std::string::npos) ? std::string::npos : end - title));
		return false;
	}

	szResponse = error_json("-1", "unhandled response");
	return false;
}
