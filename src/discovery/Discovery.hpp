/*
 * Copyright (c) 2024 Gordon Bos <gordon@bosvangennip.nl> All rights reserved.
 *
 * Broadcast discovery of Midea appliances on the local network
 *
 *
 * Source code subject to GNU GENERAL PUBLIC LICENSE version 3
 */

#ifndef _MideaDiscovery
#define _MideaDiscovery

#include <string>
#include <vector>
#include <set>
#include <memory>
#include <cstdint>
#include "../device/LanDevice.hpp"
#include "../connection/TcpTransport.hpp"
#include "../cloud/MideaCloud.hpp"


namespace midea {
  namespace discovery {

	typedef struct _tNetwork
	{
		uint32_t address;	// host order
		int prefix;
	} tNetwork;

	// "192.168.1.0/24", "192.168.1.10/255.255.255.0" or a plain address (/32)
	bool parse_network(const std::string &szNetwork, tNetwork &network);
	std::string broadcast_address(const tNetwork &network);

	bool is_private(const tNetwork &network);
	bool is_loopback(const tNetwork &network);
	bool is_link_local(const tNetwork &network);

	/*
	 * Broadcast targets for the given networks. Without networks the
	 * private IPv4 interfaces of this host are used.
	 */
	bool get_broadcast_addresses(const std::vector<std::string> &vNetworks, std::vector<std::string> &vAddresses, std::string &szError);

  }; // namespace discovery
}; // namespace midea


class MideaDiscovery
{
public:
	explicit MideaDiscovery(MideaCloud *cloud = nullptr);
	~MideaDiscovery();

	std::string get_last_error();
	midea::error::type::value get_last_error_type();

	void set_broadcast_timeout(const int seconds);
	void set_broadcast_retries(const int retries);

	/*
	 * Sends the discovery datagram to every address and collects the
	 * replies until the receive times out. Only supported appliances
	 * that identify are returned. Repeated replies from one address
	 * are ignored for the lifetime of this object.
	 */
	bool collect_appliances(const std::vector<std::string> &vAddresses, std::vector<std::unique_ptr<MideaLanDevice> > &vAppliances);

	/*
	 * Runs broadcast rounds until every appliance registered to the
	 * cloud account was seen. Appliances already in vAppliances are
	 * updated in place, registered appliances that did not answer are
	 * added as placeholders.
	 */
	bool find_appliances(const std::vector<std::string> &vNetworks, std::vector<std::unique_ptr<MideaLanDevice> > &vAppliances);

private:
	void broadcast_message(const std::vector<std::string> &vAddresses);
	void add_missing_appliances(const std::vector<midea::cloud::tCloudAppliance> &vCloudAppliances, std::vector<std::unique_ptr<MideaLanDevice> > &vAppliances, const int count);
	bool set_error(const midea::error::type::value eType, const std::string &szError);

	MideaCloud *m_cloud;
	UdpSocket m_socket;
	std::set<std::string> m_knownIps;
	int m_iBroadcastTimeout;
	int m_iBroadcastRetries;

	std::string m_szLastError;
	midea::error::type::value m_eLastError;
};

#endif
