/*
 * Copyright (c) 2024 Gordon Bos <gordon@bosvangennip.nl> All rights reserved.
 *
 * Discovery network selection tests
 *
 *
 * Source code subject to GNU GENERAL PUBLIC LICENSE version 3
 */

#include <catch2/catch.hpp>
#include "../src/discovery/Discovery.hpp"


using namespace midea::discovery;


TEST_CASE("Network notations", "[discovery]")
{
	tNetwork network;

	SECTION("prefix length")
	{
		REQUIRE(parse_network("192.168.1.0/24", network));
		REQUIRE(network.prefix == 24);
		REQUIRE(network.address == 0xC0A80100);
		REQUIRE(broadcast_address(network) == "192.168.1.255");
	}

	SECTION("host bits are dropped")
	{
		REQUIRE(parse_network("10.1.2.3/8", network));
		REQUIRE(network.address == 0x0A000000);
		REQUIRE(broadcast_address(network) == "10.255.255.255");
	}

	SECTION("netmask")
	{
		REQUIRE(parse_network("192.168.1.10/255.255.255.0", network));
		REQUIRE(network.prefix == 24);
		REQUIRE(broadcast_address(network) == "192.168.1.255");
		REQUIRE(parse_network("172.16.5.4/255.255.240.0", network));
		REQUIRE(network.prefix == 20);
		REQUIRE(broadcast_address(network) == "172.16.15.255");
	}

	SECTION("plain address")
	{
		REQUIRE(parse_network("192.0.1.2", network));
		REQUIRE(network.prefix == 32);
		REQUIRE(broadcast_address(network) == "192.0.1.2");
	}

	SECTION("malformed input")
	{
		REQUIRE_FALSE(parse_network("", network));
		REQUIRE_FALSE(parse_network("192.168.1.0/", network));
		REQUIRE_FALSE(parse_network("192.168.1.0/33", network));
		REQUIRE_FALSE(parse_network("192.168.1.0/24x", network));
		REQUIRE_FALSE(parse_network("192.168.1.0/255.0.255.0", network));
		REQUIRE_FALSE(parse_network("192.168.1/24", network));
		REQUIRE_FALSE(parse_network("appliance.local", network));
	}
}

TEST_CASE("Address ranges", "[discovery]")
{
	tNetwork network;

	REQUIRE(parse_network("192.168.10.0/24", network));
	REQUIRE(is_private(network));
	REQUIRE(parse_network("10.0.0.0/16", network));
	REQUIRE(is_private(network));
	REQUIRE(parse_network("172.20.0.0/16", network));
	REQUIRE(is_private(network));
	REQUIRE(parse_network("172.32.0.0/16", network));
	REQUIRE_FALSE(is_private(network));
	// wider than the private block
	REQUIRE(parse_network("10.0.0.0/7", network));
	REQUIRE_FALSE(is_private(network));

	REQUIRE(parse_network("127.0.0.1/8", network));
	REQUIRE(is_loopback(network));
	REQUIRE_FALSE(is_private(network));
	REQUIRE(parse_network("169.254.3.0/24", network));
	REQUIRE(is_link_local(network));
}

TEST_CASE("Broadcast targets for given networks", "[discovery]")
{
	std::vector<std::string> vAddresses;
	std::string szError;

	REQUIRE(get_broadcast_addresses({ "192.168.1.0/24", "192.168.1.77/24", "203.0.113.0/24" }, vAddresses, szError));
	REQUIRE(vAddresses.size() == 2);
	REQUIRE(vAddresses[0] == "192.168.1.255");
	REQUIRE(vAddresses[1] == "203.0.113.255");

	REQUIRE(get_broadcast_addresses({ "192.0.1.2" }, vAddresses, szError));
	REQUIRE(vAddresses.size() == 1);
	REQUIRE(vAddresses[0] == "192.0.1.2");
}

TEST_CASE("Unusable networks", "[discovery]")
{
	std::vector<std::string> vAddresses;
	std::string szError;

	REQUIRE_FALSE(get_broadcast_addresses({ "192.168.1.0/40" }, vAddresses, szError));
	REQUIRE(szError == "Invalid network 192.168.1.0/40");

	REQUIRE_FALSE(get_broadcast_addresses({ "127.0.0.0/8", "169.254.0.0/16" }, vAddresses, szError));
	REQUIRE(szError == "No valid networks to send broadcast to");
	REQUIRE(vAddresses.empty());
}

TEST_CASE("Discovery without cloud reports nothing for no targets", "[discovery]")
{
	MideaDiscovery discovery;
	discovery.set_broadcast_timeout(1);
	discovery.set_broadcast_retries(1);

	std::vector<std::unique_ptr<MideaLanDevice> > vAppliances;
	REQUIRE_FALSE(discovery.find_appliances({ "127.0.0.0/8" }, vAppliances));
	REQUIRE(discovery.get_last_error_type() == midea::error::type::GENERIC);
	REQUIRE(vAppliances.empty());
}
