/*
 * Copyright (c) 2024 Gordon Bos <gordon@bosvangennip.nl> All rights reserved.
 *
 * Broadcast discovery of Midea appliances on the local network
 *
 *
 * Source code subject to GNU GENERAL PUBLIC LICENSE version 3
 */

#include "Discovery.hpp"
#include "../common/hexstring.hpp"
#include "../common/Logger.hpp"
#include <ifaddrs.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <algorithm>
#include <cstdlib>


namespace midea {
namespace discovery {

namespace {

bool parse_ipv4(const std::string &szAddress, uint32_t &address)
{
	struct in_addr addr;
	if (inet_pton(AF_INET, szAddress.c_str(), &addr) != 1)
		return false;
	address = ntohl(addr.s_addr);
	return true;
}

uint32_t prefix_mask(const int prefix)
{
	if (prefix <= 0)
		return 0;
	return (uint32_t)(0xFFFFFFFFULL << (32 - prefix));
}

int mask_prefix(const uint32_t mask)
{
	int prefix = 0;
	while ((prefix < 32) && (mask & (0x80000000U >> prefix)))
		prefix++;
	return prefix;
}

bool in_range(const tNetwork &network, const uint32_t base, const int prefix)
{
	if (network.prefix < prefix)
		return false;
	return ((network.address & prefix_mask(prefix)) == base);
}

}; // namespace


bool parse_network(const std::string &szNetwork, tNetwork &network)
{
	std::string szAddress = szNetwork;
	network.prefix = 32;
	size_t pos = szNetwork.find('/');
	if (pos != std::string::npos)
	{
		szAddress = szNetwork.substr(0, pos);
		std::string szPrefix = szNetwork.substr(pos + 1);
		if (szPrefix.empty())
			return false;
		if (szPrefix.find('.') != std::string::npos)
		{
			uint32_t mask;
			if (!parse_ipv4(szPrefix, mask))
				return false;
			network.prefix = mask_prefix(mask);
			if (prefix_mask(network.prefix) != mask)
				return false;
		}
		else
		{
			char *end;
			long prefix = strtol(szPrefix.c_str(), &end, 10);
			if ((*end != '\0') || (prefix < 0) || (prefix > 32))
				return false;
			network.prefix = (int)prefix;
		}
	}
	if (!parse_ipv4(szAddress, network.address))
		return false;
	network.address &= prefix_mask(network.prefix);
	return true;
}

std::string broadcast_address(const tNetwork &network)
{
	struct in_addr addr;
	addr.s_addr = htonl(network.address | ~prefix_mask(network.prefix));
	char szHost[INET_ADDRSTRLEN];
	if (inet_ntop(AF_INET, &addr, szHost, sizeof(szHost)) == nullptr)
		return "";
	return std::string(szHost);
}

bool is_private(const tNetwork &network)
{
	return (in_range(network, 0x0A000000, 8) || in_range(network, 0xAC100000, 12) || in_range(network, 0xC0A80000, 16));
}

bool is_loopback(const tNetwork &network)
{
	return in_range(network, 0x7F000000, 8);
}

bool is_link_local(const tNetwork &network)
{
	return in_range(network, 0xA9FE0000, 16);
}

bool get_broadcast_addresses(const std::vector<std::string> &vNetworks, std::vector<std::string> &vAddresses, std::string &szError)
{
	vAddresses.clear();
	std::vector<tNetwork> vNets;

	// networks given by the user do not need to be private
	for (const auto &szNetwork : vNetworks)
	{
		tNetwork network;
		if (!parse_network(szNetwork, network))
		{
			szError = "Invalid network " + szNetwork;
			return false;
		}
		if (!is_loopback(network) && !is_link_local(network))
			vNets.push_back(network);
	}

	if (vNetworks.empty())
	{
		struct ifaddrs *ifaddr;
		if (getifaddrs(&ifaddr) != 0)
		{
			szError = "Unable to list network interfaces";
			return false;
		}
		for (struct ifaddrs *ifa = ifaddr; ifa != nullptr; ifa = ifa->ifa_next)
		{
			if ((ifa->ifa_addr == nullptr) || (ifa->ifa_netmask == nullptr) || (ifa->ifa_addr->sa_family != AF_INET))
				continue;
			tNetwork network;
			network.prefix = mask_prefix(ntohl(((struct sockaddr_in*)ifa->ifa_netmask)->sin_addr.s_addr));
			network.address = ntohl(((struct sockaddr_in*)ifa->ifa_addr)->sin_addr.s_addr) & prefix_mask(network.prefix);
			if (is_private(network) && !is_loopback(network) && !is_link_local(network))
				vNets.push_back(network);
		}
		freeifaddrs(ifaddr);
	}

	if (vNets.empty())
	{
		szError = "No valid networks to send broadcast to";
		return false;
	}
	for (const auto &network : vNets)
	{
		std::string szBroadcast = broadcast_address(network);
		_log.Debug(DEBUG_DISCOVERY, "Network %s/%d, broadcast address %s", broadcast_address(tNetwork{network.address, 32}).c_str(), network.prefix, szBroadcast.c_str());
		if (std::find(vAddresses.begin(), vAddresses.end(), szBroadcast) == vAddresses.end())
			vAddresses.push_back(szBroadcast);
	}
	return true;
}

}; // namespace discovery
}; // namespace midea


/************************************************************************
 *									*
 *	Class construct							*
 *									*
 ************************************************************************/

MideaDiscovery::MideaDiscovery(MideaCloud *cloud) :
	m_cloud(cloud),
	m_iBroadcastTimeout(MIDEA_BROADCAST_TIMEOUT_SECS),
	m_iBroadcastRetries(MIDEA_BROADCAST_RETRIES),
	m_eLastError(midea::error::type::NONE)
{
}

MideaDiscovery::~MideaDiscovery()
{
	m_socket.close();
}

std::string MideaDiscovery::get_last_error()
{
	return m_szLastError;
}

midea::error::type::value MideaDiscovery::get_last_error_type()
{
	return m_eLastError;
}

/* private */ bool MideaDiscovery::set_error(const midea::error::type::value eType, const std::string &szError)
{
	m_eLastError = eType;
	m_szLastError = szError;
	return false;
}

void MideaDiscovery::set_broadcast_timeout(const int seconds)
{
	m_iBroadcastTimeout = seconds;
}

void MideaDiscovery::set_broadcast_retries(const int retries)
{
	m_iBroadcastRetries = retries;
}


/************************************************************************
 *									*
 *	Broadcast collection						*
 *									*
 ************************************************************************/

/* private */ void MideaDiscovery::broadcast_message(const std::vector<std::string> &vAddresses)
{
	std::vector<uint8_t> vMessage(midea::lan::DISCOVERY_MSG, midea::lan::DISCOVERY_MSG + DISCOVERY_MSG_SIZE);
	for (const auto &szAddress : vAddresses)
	{
		_log.Debug(DEBUG_DISCOVERY, "Broadcasting to %s", szAddress.c_str());
		if (!m_socket.send_to(szAddress, MIDEA_DISCOVERY_PORT, vMessage))
			_log.Debug(DEBUG_DISCOVERY, "Unable to send broadcast to: %s cause %s", szAddress.c_str(), m_socket.get_last_error().c_str());
	}
}

bool MideaDiscovery::collect_appliances(const std::vector<std::string> &vAddresses, std::vector<std::unique_ptr<MideaLanDevice> > &vAppliances)
{
	vAppliances.clear();
	if (!m_socket.open(true, m_iBroadcastTimeout))
		return set_error(midea::error::type::NETWORK, m_socket.get_last_error());

	broadcast_message(vAddresses);

	std::vector<std::unique_ptr<MideaLanDevice> > vScanned;
	MideaSecurity security;
	LanPacketCodec codec(security);
	while (true)
	{
		std::vector<uint8_t> vData;
		std::string szAddress;
		int numbytes = m_socket.receive_from(vData, szAddress, 512);
		if (numbytes == 0)
		{
			_log.Debug(DEBUG_DISCOVERY, "Finished broadcast collection");
			break;
		}
		if (numbytes < 0)
		{
			m_socket.close();
			return set_error(midea::error::type::NETWORK, m_socket.get_last_error());
		}
		if (m_knownIps.find(szAddress) != m_knownIps.end())
			continue;

		_log.Debug(DEBUG_PROTOCOL, "Reply from address=%s payload=%s", szAddress.c_str(), midea::hex::encode(vData).c_str());
		m_knownIps.insert(szAddress);
		midea::lan::tDeviceIdentity identity;
		if (!codec.parse_discovery_reply(vData, identity))
		{
			_log.Debug(DEBUG_DISCOVERY, "Invalid reply from %s: %s", szAddress.c_str(), codec.get_last_error().c_str());
			continue;
		}
		std::unique_ptr<MideaLanDevice> appliance(new MideaLanDevice(identity));
		if (MideaAppliance::supported(identity.type))
			vScanned.push_back(std::move(appliance));
		else
			_log.Debug(DEBUG_DISCOVERY, "Not supported appliance %s", appliance->to_string().c_str());
	}
	m_socket.close();

	// return only successfully identified appliances
	for (auto &appliance : vScanned)
	{
		if (appliance->is_identified(m_cloud))
			vAppliances.push_back(std::move(appliance));
	}
	return true;
}


/************************************************************************
 *									*
 *	Matching against the cloud registry				*
 *									*
 ************************************************************************/

/* private */ void MideaDiscovery::add_missing_appliances(const std::vector<midea::cloud::tCloudAppliance> &vCloudAppliances, std::vector<std::unique_ptr<MideaLanDevice> > &vAppliances, const int count)
{
	_log.Log(LOG_STATUS, "Some appliance(s) where not discovered on local network(s): %d discovered out of %d", (int)vAppliances.size(), count);
	for (const auto &known : vCloudAppliances)
	{
		if (!MideaAppliance::supported(known.type))
			continue;

		MideaLanDevice *local = nullptr;
		for (auto &appliance : vAppliances)
		{
			if (appliance->matches(known))
			{
				local = appliance.get();
				break;
			}
		}
		if (!local)
		{
			std::unique_ptr<MideaLanDevice> placeholder(new MideaLanDevice(known.id, known.type));
			placeholder->set_serial_number(known.sn);
			local = placeholder.get();
			vAppliances.push_back(std::move(placeholder));
			_log.Log(LOG_STATUS, "Unable to discover registered appliance id=%s sn=%s", midea::redact(known.id, 4).c_str(), midea::redact(known.sn, 8).c_str());
		}
		local->set_name(known.name);
	}
}

bool MideaDiscovery::find_appliances(const std::vector<std::string> &vNetworks, std::vector<std::unique_ptr<MideaLanDevice> > &vAppliances)
{
	std::vector<std::string> vAddresses;
	std::string szError;
	if (!midea::discovery::get_broadcast_addresses(vNetworks, vAddresses, szError))
		return set_error(midea::error::type::GENERIC, szError);

	_log.Debug(DEBUG_DISCOVERY, "Starting LAN discovery");
	std::vector<midea::cloud::tCloudAppliance> vCloudAppliances;
	if (m_cloud && !m_cloud->list_appliances(vCloudAppliances))
		return set_error(m_cloud->get_last_error_type(), m_cloud->get_last_error());

	int count = 0;
	std::set<std::string> knownCloudAppliances;
	for (const auto &details : vCloudAppliances)
	{
		if (MideaAppliance::supported(details.type))
			count++;
		knownCloudAppliances.insert(details.id);
	}

	for (int i = 0; i < m_iBroadcastRetries; i++)
	{
		_log.Debug(DEBUG_DISCOVERY, "Broadcast attempt %d of max %d", i + 1, m_iBroadcastRetries);
		std::vector<std::unique_ptr<MideaLanDevice> > vScanned;
		if (!collect_appliances(vAddresses, vScanned))
			return false;

		std::sort(vScanned.begin(), vScanned.end(), [](const std::unique_ptr<MideaLanDevice> &a, const std::unique_ptr<MideaLanDevice> &b) {
			return a->get_appliance_id() < b->get_appliance_id();
		});

		for (auto &scanned : vScanned)
		{
			bool bKnown = false;
			for (auto &appliance : vAppliances)
			{
				if (appliance->get_appliance_id() != scanned->get_appliance_id())
					continue;
				if (appliance->get_address() != scanned->get_address())
				{
					_log.Debug(DEBUG_DISCOVERY, "Known appliance %s, data changed %s", appliance->to_string().c_str(), scanned->to_string().c_str());
					appliance->update(*scanned);
				}
				bKnown = true;
				break;
			}
			if (bKnown)
				continue;

			bool bRegistered = false;
			for (const auto &details : vCloudAppliances)
			{
				if (!scanned->matches(details))
					continue;
				scanned->set_name(details.name);
				_log.Log(LOG_NORM, "Found appliance %s", scanned->to_string().c_str());
				knownCloudAppliances.erase(details.id);
				vAppliances.push_back(std::move(scanned));
				bRegistered = true;
				break;
			}
			if (bRegistered)
				continue;
			if (m_cloud)
				_log.Log(LOG_STATUS, "Found an appliance that is not registered to the account: %s", scanned->to_string().c_str());
			else
			{
				// nothing to match against
				_log.Log(LOG_NORM, "Found appliance %s", scanned->to_string().c_str());
				vAppliances.push_back(std::move(scanned));
			}
		}
		if (knownCloudAppliances.empty())
			break;
	}

	_log.Log(LOG_NORM, "Found %d of %d appliance(s)", (int)vAppliances.size(), count);
	if ((int)vAppliances.size() < count)
		add_missing_appliances(vCloudAppliances, vAppliances, count);
	return true;
}
