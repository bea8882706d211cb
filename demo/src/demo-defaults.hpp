/*
 * Copyright (c) 2024 Gordon Bos <gordon@bosvangennip.nl> All rights reserved.
 *
 * Configuration file for midea-cmd
 *
 *
 * Source code subject to GNU GENERAL PUBLIC LICENSE version 3
 */

#ifndef MYPATH
#define MYPATH "/"
#endif

#ifndef CONF_FILE
#define CONF_FILE "mideaconfig"
#endif


#include <fstream>
#include <string>
#include <vector>
#include <map>


/*
 * Example:
 *
 *   # cloud account
 *   account = user@example.com
 *   password = 'secret password'
 *   app = NetHome Plus
 *
 *   # LAN discovery, comma separated or on multiple lines
 *   network = 192.168.1.0/24, 192.168.2.0/255.255.255.0
 *
 *   loglevel = status
 */

static const char* mideaconfig_keys[] = {
	"account", "password", "app", "appkey", "appid", "apiurl", "signkey",
	"ip", "id", "token", "key", "loglevel", "logfile", nullptr
};

std::map<std::string,std::string> mideaconfig;
std::vector<std::string> mideanetworks;
std::vector<std::string> mideaconfig_ignored;


std::string mideaconfig_trim(const std::string &szValue)
{
	size_t first = szValue.find_first_not_of(" \t\r");
	if (first == std::string::npos)
		return "";
	size_t last = szValue.find_last_not_of(" \t\r");
	std::string szTrimmed = szValue.substr(first, last - first + 1);
	if ((szTrimmed.size() > 1) && ((szTrimmed[0] == '"') || (szTrimmed[0] == '\'')) && (szTrimmed.back() == szTrimmed[0]))
		szTrimmed = szTrimmed.substr(1, szTrimmed.size() - 2);
	return szTrimmed;
}


bool mideaconfig_is_key(const std::string &szKey)
{
	for (int i = 0; mideaconfig_keys[i] != nullptr; i++)
	{
		if (szKey == mideaconfig_keys[i])
			return true;
	}
	return false;
}


void mideaconfig_add_networks(const std::string &szValue)
{
	size_t start = 0;
	while (start < szValue.size())
	{
		size_t end = szValue.find_first_of(", \t", start);
		if (end == std::string::npos)
			end = szValue.size();
		if (end > start)
			mideanetworks.push_back(szValue.substr(start, end - start));
		start = end + 1;
	}
}


/*
 * Fills mideaconfig with the recognised settings and mideanetworks with
 * every network listed. Unrecognised keys end up in mideaconfig_ignored.
 * Returns false when the file cannot be opened.
 */
bool read_mideaconfig(const std::string &configfile = CONF_FILE)
{
	std::ifstream myfile(configfile.c_str());
	if (!myfile.is_open())
		return false;

	std::string line;
	while (getline(myfile, line))
	{
		std::string szLine = mideaconfig_trim(line);
		if (szLine.empty() || (szLine[0] == '#') || (szLine[0] == ';'))
			continue;
		size_t pos = line.find('=');
		if (pos == std::string::npos)
			continue;

		std::string szKey = mideaconfig_trim(line.substr(0, pos));
		std::string szValue = mideaconfig_trim(line.substr(pos + 1));
		if (szKey == "network")
			mideaconfig_add_networks(szValue);
		else if (mideaconfig_is_key(szKey))
			mideaconfig[szKey] = szValue;
		else
			mideaconfig_ignored.push_back(szKey);
	}
	return true;
}


/*
 * An explicit file must exist. Without one the working directory is tried
 * first and then the install location.
 */
bool find_mideaconfig(const std::string &configfile, bool &bExplicit)
{
	bExplicit = (configfile != CONF_FILE);
	if (read_mideaconfig(configfile))
		return true;
	if (bExplicit)
		return false;
	return read_mideaconfig(std::string(MYPATH) + CONF_FILE);
}
