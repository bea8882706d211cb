/*
 * Copyright (c) 2024 Gordon Bos <gordon@bosvangennip.nl> All rights reserved.
 *
 * Command line tool to discover, query and control Midea appliances
 *
 *
 * Source code subject to GNU GENERAL PUBLIC LICENSE version 3
 */

#include <iostream>
#include <fstream>
#include <sstream>
#include <map>
#include <vector>
#include <memory>
#include <cstring>
#include <cstdio>
#include <stdlib.h>
#include "demo-defaults.hpp"
#include "common/Logger.hpp"
#include "common/hexstring.hpp"
#include "cloud/MideaCloud.hpp"
#include "device/LanDevice.hpp"
#include "discovery/Discovery.hpp"
#include "command/DehumidifierCommand.hpp"
#include "command/AirConditionerCommand.hpp"


#ifndef MYNAME
#define MYNAME "midea-cmd"
#endif

#define EXIT_IP_ID 7
#define EXIT_CREDENTIALS 8
#define EXIT_NO_APPLIANCE 9
#define EXIT_READ_ONLY 10
#define EXIT_NOT_APPLICABLE 11
#define EXIT_DUMP_FAMILY 21


using namespace std;

bool verbose, showcredentials, usecloud, dumpdehumidifier, dumpairconditioner;
std::string command, configfile, loglevel, logfile, payload, szERROR, szWARN;
map<std::string,std::string> options;
map<std::string,std::string> attributes;
vector<std::string> networks;

static const char* value_options[] = { "ip", "id", "token", "key", "account", "password", "app", "appkey", "appid", "apiurl", "signkey", nullptr };


void init_globals()
{
	configfile = CONF_FILE;

	verbose = false;
	showcredentials = false;
	usecloud = false;
	dumpdehumidifier = false;
	dumpairconditioner = false;
	command = "";
	payload = "";

	szERROR = "ERROR: ";
	szWARN = "WARNING: ";

	loglevel = "";
	logfile = "";
}


void usage(std::string mode)
{
	if (mode == "badparm")
	{
		cerr << "Bad parameter\n";
		exit(1);
	}
	if (mode == "short")
	{
		cout << "Usage: " << MYNAME << " [-hv] [-c file] <discover|status|set|dump> [OPTIONS]\n";
		cout << "Type \"" << MYNAME << " --help\" for more help\n";
		exit(0);
	}
	cout << "Usage: " << MYNAME << " [OPTIONS] <COMMAND> [COMMAND OPTIONS]\n";
	cout << endl;
	cout << "Commands:\n";
	cout << "  discover                  discovers appliances on local network\n";
	cout << "  status                    gets status from appliance\n";
	cout << "  set                       sets status of appliance\n";
	cout << "  dump <HEX>                decodes a raw status reply\n";
	cout << endl;
	cout << "Options:\n";
	cout << "  -h, --help                display this help and exit\n";
	cout << "  -v, --verbose             log raw protocol traffic\n";
	cout << "  -c, --conf=FILE           use FILE for credentials and defaults\n";
	cout << "      --log=LEVEL           logging level (error, status, normal, debug or all)\n";
	cout << "      --logfile=FILE        also write log lines to FILE\n";
	cout << "      --ip <ADDRESS>        IP address of the appliance\n";
	cout << "      --id <ID>             appliance id\n";
	cout << "      --token <TOKEN>       token used to communicate with appliance\n";
	cout << "      --key <KEY>           key used to communicate with appliance\n";
	cout << "      --account <ACCOUNT>   Midea app account\n";
	cout << "      --password <PASS>     Midea app password\n";
	cout << "      --app <NAME>          Midea app being used\n";
	cout << "      --appkey <KEY>        Midea app key\n";
	cout << "      --appid <ID>          Midea app id, must correspond to app key\n";
	cout << "      --apiurl <URL>        Midea API server url\n";
	cout << "      --signkey <KEY>       Midea sign key\n";
	cout << "      --cloud               relay commands through the Midea cloud\n";
	cout << "      --credentials         show credentials in output\n";
	cout << "      --network <NET>...    networks for discovery (e.g. 192.0.2.0/24)\n";
	cout << "      --dehumidifier        dump payload is a dehumidifier reply\n";
	cout << "      --airconditioner      dump payload is an air conditioner reply\n";
	cout << "      --<property> <VALUE>  property to change with the set command\n";
	cout << endl;
	exit(0);
}


void print_out(std::string message)
{
	cout << message << endl;
}


void print_err(std::string message)
{
	_log.Log(LOG_ERROR, "%s", message.c_str());
}


void log(std::string message)
{
	_log.Log(LOG_NORM, "%s", message.c_str());
}


void exit_error(std::string message)
{
	print_err(message);
	exit(1);
}


bool is_value_option(const std::string &szName)
{
	for (int i = 0; value_options[i] != nullptr; i++)
	{
		if (szName == value_options[i])
			return true;
	}
	return false;
}


void parse_args(int argc, char** argv) {
	int i=1;
	std::string word;
	while (i < argc) {
		word = argv[i];
		if (word.length() > 1 && word[0] == '-' && word[1] != '-') {
			for (size_t j=1;j<word.length();j++) {
				if (word[j] == 'h')
					usage("short");
				else if (word[j] == 'v')
					verbose = true;
				else if (word[j] == 'c')
				{
					if (j+1 < word.length())
						usage("badparm");
					i++;
					if (i >= argc)
						usage("badparm");
					configfile = argv[i];
				}
				else
					usage("badparm");
			}
		}
		else if (word == "--help")
			usage("long");
		else if (word == "--verbose")
			verbose = true;
		else if (word == "--credentials")
			showcredentials = true;
		else if (word == "--cloud")
			usecloud = true;
		else if (word == "--dehumidifier")
			dumpdehumidifier = true;
		else if (word == "--airconditioner")
			dumpairconditioner = true;
		else if (word.substr(0,7) == "--conf=")
			configfile = word.substr(7);
		else if (word.substr(0,6) == "--log=")
			loglevel = word.substr(6);
		else if (word.substr(0,10) == "--logfile=")
			logfile = word.substr(10);
		else if ((word == "--network") || (word == "--address"))
		{
			i++;
			while ( (i < argc) && (argv[i][0] != '-') )
			{
				networks.push_back(argv[i]);
				i++;
			}
			continue;
		}
		else if (word.substr(0,2) == "--")
		{
			std::string name = word.substr(2);
			i++;
			if (i >= argc)
				usage("badparm");
			if (name == "conf")
				configfile = argv[i];
			else if (name == "log")
				loglevel = argv[i];
			else if (name == "logfile")
				logfile = argv[i];
			else if (is_value_option(name))
				options[name] = argv[i];
			else
			{
				for (auto &c : name)
				{
					if (c == '-')
						c = '_';
				}
				attributes[name] = argv[i];
			}
		}
		else if (command.empty())
			command = word;
		else if ((command == "dump") && payload.empty())
			payload = word;
		else
			usage("badparm");
		i++;
	}
}


/*
 * Config file values fill in whatever the command line left open
 */
void merge_config()
{
	bool bExplicit;
	if (!find_mideaconfig(configfile, bExplicit) && bExplicit)
		exit_error(szERROR+"cannot open config file '"+configfile+"'");
	for (const auto &szKey : mideaconfig_ignored)
		cerr << szWARN << "ignoring unknown setting '" << szKey << "' in config file\n";

	if (networks.empty())
		networks = mideanetworks;
	for (const auto &itt : mideaconfig)
	{
		if (itt.first == "loglevel")
		{
			if (loglevel.empty())
				loglevel = itt.second;
		}
		else if (itt.first == "logfile")
		{
			if (logfile.empty())
				logfile = itt.second;
		}
		else if (options.find(itt.first) == options.end())
			options[itt.first] = itt.second;
	}
}


void start_logging()
{
	if (loglevel.empty())
		loglevel = "error";
	if (loglevel == "debug")
	{
		_log.SetLogFlags(LOG_ALL);
		_log.SetDebugFlags(DEBUG_NORM | DEBUG_LAN | DEBUG_CLOUD | DEBUG_DISCOVERY);
	}
	else if (!_log.SetLogFlags(loglevel))
		usage("badparm");
	if (verbose)
		_log.SetDebugFlags(DEBUG_ALL);
	_log.SetVerbose(true);
	if (!logfile.empty() && !_log.SetOutputFile(logfile))
		cerr << szWARN << "cannot open logfile '" << logfile << "'\n";
}


std::string get_option(const std::string &szName, const std::string &szDefault = "")
{
	map<std::string,std::string>::iterator it = options.find(szName);
	if ((it == options.end()) || it->second.empty())
		return szDefault;
	return it->second;
}


bool has_cloud_credentials()
{
	return ( (!get_option("account").empty()) && (!get_option("password").empty()) );
}


std::unique_ptr<MideaCloud> connect_to_cloud()
{
	std::unique_ptr<MideaCloud> cloud;
	std::string szApp = get_option("app");
	if (!szApp.empty())
	{
		const midea::app::tAppPreset *preset = midea::app::find(szApp);
		if (preset == nullptr)
			exit_error(szERROR+"unknown Midea app '"+szApp+"'");
		cloud.reset(new MideaCloud(*preset, get_option("account"), get_option("password")));
	}
	else
		cloud.reset(new MideaCloud(get_option("appkey", midea::DEFAULT_APPKEY), get_option("account"), get_option("password"),
				get_option("appid", midea::DEFAULT_APP_ID), get_option("apiurl", midea::DEFAULT_API_SERVER_URL), get_option("signkey", midea::DEFAULT_SIGNKEY)));

	log("connect to " + cloud->to_string());
	if (!cloud->authenticate())
		exit_error(szERROR+"cloud login failed: "+cloud->get_last_error());
	return cloud;
}


bool check_ip_id()
{
	bool hasIp = !get_option("ip").empty();
	bool hasId = !get_option("id").empty();
	if (hasIp && hasId)
	{
		print_err("Both ip address and id provided. Please provide only one");
		return false;
	}
	if (!hasIp && !hasId)
	{
		print_err("Missing ip address or appliance id");
		return false;
	}
	return true;
}


void output(MideaLanDevice &device)
{
	MideaAppliance *appliance = device.get_appliance();
	print_out("id " + device.get_serial_number() + "/" + device.get_appliance_id());
	print_out("  id      = " + device.get_appliance_id());
	print_out("  addr    = " + (device.get_address().empty() ? std::string("Unknown") : device.get_address()));
	print_out("  s/n     = " + device.get_serial_number());
	print_out("  model   = " + appliance->get_model());
	print_out("  ssid    = " + device.get_identity().ssid);
	print_out("  online  = " + midea::bool_to_string(device.is_online()));
	print_out("  name    = " + device.get_name());

	char line[128];
	for (const auto &info : appliance->list_properties())
	{
		std::string szValue;
		if (!appliance->get_property(info.name, szValue))
			continue;
		snprintf(line, sizeof(line), "  %-19s= %s", info.name.c_str(), szValue.c_str());
		print_out(line);
	}

	std::stringstream ss;
	ss << "{";
	for (const auto &capability : appliance->get_capabilities())
	{
		if (ss.tellp() > 1)
			ss << ", ";
		ss << capability.first << ": " << capability.second;
	}
	ss << "}";
	print_out("  supports= " + ss.str());
	print_out("  version = " + std::to_string(device.get_version()));

	if (showcredentials)
	{
		print_out("  token   = " + device.get_token());
		print_out("  key     = " + device.get_key());
	}
}


std::unique_ptr<MideaLanDevice> get_appliance(std::unique_ptr<MideaCloud> &cloud, int &exitcode)
{
	exitcode = 0;
	if (!check_ip_id())
	{
		exitcode = EXIT_IP_ID;
		return nullptr;
	}

	midea::lan::tStateRequest request;
	midea::lan::init_state_request(request);
	request.address = get_option("ip");
	request.appliance_id = get_option("id");

	if (get_option("token").empty())
	{
		if (!has_cloud_credentials())
		{
			print_err("Missing token/key or cloud credentials");
			exitcode = EXIT_CREDENTIALS;
			return nullptr;
		}
		cloud = connect_to_cloud();
		request.cloud = cloud.get();
		request.use_cloud = usecloud;
	}
	else
	{
		request.token = get_option("token");
		request.key = get_option("key");
	}

	midea::error::type::value eError;
	std::string szError;
	std::unique_ptr<MideaLanDevice> device = midea::lan::appliance_state(request, eError, szError);
	if (!device)
	{
		print_err("Unable to get appliance status for '" + (request.address.empty() ? request.appliance_id : request.address) + "': " + szError);
		exitcode = EXIT_NO_APPLIANCE;
	}
	return device;
}


int cmd_discover()
{
	std::unique_ptr<MideaCloud> cloud;
	if (has_cloud_credentials())
		cloud = connect_to_cloud();

	MideaDiscovery discovery(cloud.get());
	std::vector<std::unique_ptr<MideaLanDevice> > appliances;
	if (!discovery.find_appliances(networks, appliances))
		exit_error(szERROR+discovery.get_last_error());

	for (auto &appliance : appliances)
		output(*appliance);
	return 0;
}


int cmd_status()
{
	std::unique_ptr<MideaCloud> cloud;
	int exitcode;
	std::unique_ptr<MideaLanDevice> device = get_appliance(cloud, exitcode);
	if (!device)
		return exitcode;
	output(*device);
	return 0;
}


int cmd_set()
{
	std::unique_ptr<MideaCloud> cloud;
	int exitcode;
	std::unique_ptr<MideaLanDevice> device = get_appliance(cloud, exitcode);
	if (!device)
		return exitcode;

	std::vector<midea::property::tPropertyInfo> properties = device->get_appliance()->list_properties();
	std::map<std::string, std::string> values;
	std::string unused;
	for (const auto &attribute : attributes)
	{
		bool bFound = false;
		for (const auto &info : properties)
		{
			if (info.name != attribute.first)
				continue;
			if (!info.writable)
			{
				_log.Log(LOG_STATUS, "Read-only attribute '%s'", attribute.first.c_str());
				return EXIT_READ_ONLY;
			}
			_log.Log(LOG_NORM, "Setting attribute '%s' to '%s'", attribute.first.c_str(), attribute.second.c_str());
			values[attribute.first] = attribute.second;
			bFound = true;
			break;
		}
		if (!bFound)
			unused.append(unused.empty() ? attribute.first : ", " + attribute.first);
	}
	if (dumpdehumidifier || dumpairconditioner)
		unused.append(unused.empty() ? "dump family" : ", dump family");
	if (!unused.empty())
	{
		print_err("Not applicable options: " + unused);
		return EXIT_NOT_APPLICABLE;
	}

	if (!device->set_state(values, usecloud ? cloud.get() : nullptr))
		exit_error(szERROR+device->get_last_error());
	output(*device);
	return 0;
}


int cmd_dump()
{
	std::vector<uint8_t> data;
	if (!midea::hex::decode(payload, data))
		exit_error(szERROR+"payload is not a valid hex string");
	if (!dumpdehumidifier && !dumpairconditioner)
		return EXIT_DUMP_FAMILY;

	char line[32];
	for (size_t i = 0; i < data.size(); i++)
	{
		snprintf(line, sizeof(line), "%2d %3d %2x", (int)i, data[i], data[i]);
		print_out(line);
	}

	if (dumpdehumidifier)
	{
		DehumidifierResponse response;
		if (!response.decode(data))
			exit_error(szERROR+"payload too short for a dehumidifier reply");
		print_out(response.to_string());
	}
	else
	{
		AirConditionerResponse response;
		if (!response.decode(data))
			exit_error(szERROR+"payload too short for an air conditioner reply");
		print_out(response.to_string());
	}
	return 0;
}


int main(int argc, char** argv)
{
	init_globals();
	parse_args(argc, argv);
	merge_config();
	start_logging();

	if (command == "discover")
		return cmd_discover();
	if (command == "status")
		return cmd_status();
	if (command == "set")
		return cmd_set();
	if (command == "dump")
		return cmd_dump();

	usage("short");
	return 1;
}

