/*
 * Copyright (c) 2024 Gordon Bos <gordon@bosvangennip.nl> All rights reserved.
 *
 * HTTPS transport for the Midea cloud API
 *
 *
 * Source code subject to GNU GENERAL PUBLIC LICENSE version 3
 */

#pragma once
#include <string>
#include <vector>
#include <map>
#include "../common/definitions.hpp"


class MideaHTTPBridge
{
public:
	/************************************************************************
	 *									*
	 * The Midea cloud only takes signed url encoded forms by POST and	*
	 * answers with a JSON document. Every failure on the way, from curl	*
	 * errors to HTML error pages, is turned into the cloud's own error	*
	 * layout {"errorCode":"<code>","msg":"<message>"} so callers only	*
	 * need a single parser.						*
	 *									*
	 ************************************************************************/

	static bool PostForm(const std::string &szUrl, const std::string &szForm, std::string &szResponse, const long iTimeOut = MIDEA_CLOUD_TIMEOUT_SECS);

	static std::string URLEncode(const std::string &szDecodedString);
	static std::string FormEncode(const std::map<std::string, std::string> &mFields);

	static bool ProcessResponse(std::string &szResponse, const std::vector<std::string> &vStatusLines, const bool bTransferOK);

	static bool IsStatusLine(const std::string &szLine);

	// releases curl's global state, call once when the process is done with the cloud
	static void CloseConnection();

private:
	static bool Transfer(const std::string &szUrl, const std::string &szForm, const long iTimeOut, std::string &szResponse, std::vector<std::string> &vStatusLines);
	static bool GlobalInit();

	static bool m_bCurlInitialized;
};
