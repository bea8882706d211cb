/*
 * Copyright (c) 2024 Gordon Bos <gordon@bosvangennip.nl> All rights reserved.
 *
 * Local appliance session tests over a scripted transport
 *
 *
 * Source code subject to GNU GENERAL PUBLIC LICENSE version 3
 */

#include <catch2/catch.hpp>
#include <deque>
#include "../src/device/LanDevice.hpp"
#include "../src/appliance/Dehumidifier.hpp"
#include "../src/common/hexstring.hpp"
#include "../src/common/messages.hpp"


namespace {

const std::string APPLIANCE_ID = "6618611909121";
const std::string DEVICE_TOKEN = "469e2f7d0f1d3c8ab5d2a2f1c3b4e5f60718293a4b5c6d7e8f90a1b2c3d4e5f6";
const std::string DEVICE_KEY = "a1a0b37a6cc407e9b8fcecc1f2e250f6a9cfd83cfbf7e4443d30a34cb4e9a62d";
const std::string TCP_KEY = "e047884511f9504a074dfeed0451bcff4f63d8d8aa779fa03d3049027d0ac78b";
const std::string HANDSHAKE_REPLY = "8370004020010000"
	"d4de051b7611d07d54a7f0a5e07ca2beb920ebb829d567559397ded751813801a2cb561936668c8f117d2ec0d5b74ba8c9a8381650c1ba2b42359af7baafdd00";
const std::string STATUS_PAYLOAD = "c80101287f7f003c00000000000000003f5000000000024238";

std::vector<uint8_t> from_hex(const std::string &szHex)
{
	std::vector<uint8_t> vData;
	midea::hex::decode(szHex, vData);
	return vData;
}


/*
 * Transport answering every send with the next queued reply. An empty
 * queue behaves like a read timeout.
 */
class ScriptedTransport : public LanTransport
{
public:
	ScriptedTransport() :
		m_bConnected(false),
		m_iConnects(0)
	{
	}

	bool connect(const std::string &szAddress, const int iPort, const int iTimeoutSecs) override
	{
		(void)iTimeoutSecs;
		m_szAddress = szAddress;
		m_iPort = iPort;
		m_iConnects++;
		m_bConnected = true;
		return true;
	}

	bool is_connected() override
	{
		return m_bConnected;
	}

	void disconnect() override
	{
		m_bConnected = false;
	}

	bool send(const std::vector<uint8_t> &vData) override
	{
		m_vSent.push_back(vData);
		return true;
	}

	int receive(std::vector<uint8_t> &vData, const size_t maxsize) override
	{
		(void)maxsize;
		vData.clear();
		if (m_qReplies.empty())
			return 0;
		vData = m_qReplies.front();
		m_qReplies.pop_front();
		return (int)vData.size();
	}

	std::string get_last_error() override
	{
		return "read timed out";
	}

	bool m_bConnected;
	int m_iConnects;
	std::string m_szAddress;
	int m_iPort;
	std::deque<std::vector<uint8_t> > m_qReplies;
	std::vector<std::vector<uint8_t> > m_vSent;
};


// what a v3 appliance sends back for a status query
std::vector<uint8_t> v3_status_reply()
{
	MideaSecurity security;
	LanPacketCodec codec(security);
	std::vector<uint8_t> vBody;
	codec.build(APPLIANCE_ID, from_hex(std::string("aa23a100000000000303") + STATUS_PAYLOAD), true, vBody);

	Frame8370Codec appliance;
	appliance.set_tcp_key(from_hex(TCP_KEY));
	std::vector<uint8_t> vFrame;
	appliance.encode(vBody, midea::msgtype::ENCRYPTED_RESPONSE, vFrame);
	return vFrame;
}

// what a v2 appliance sends back for a status query
std::vector<uint8_t> v2_status_reply()
{
	return from_hex(std::string("aa22a100000000000303") + STATUS_PAYLOAD);
}

}; // namespace


TEST_CASE("V3 refresh after handshake", "[landevice]")
{
	MideaLanDevice device(APPLIANCE_ID, "a1", "192.0.1.2", 6444, DEVICE_TOKEN, DEVICE_KEY, 3);
	device.set_sleep_interval(0);
	ScriptedTransport *transport = new ScriptedTransport();
	transport->m_qReplies.push_back(from_hex(HANDSHAKE_REPLY));
	transport->m_qReplies.push_back(v3_status_reply());
	device.set_transport(std::unique_ptr<LanTransport>(transport));

	int changes = 0;
	device.sigStateChanged.connect([&changes](MideaLanDevice *changed) { (void)changed; changes++; });

	REQUIRE(device.refresh());
	REQUIRE(changes == 1);
	REQUIRE(device.is_online());
	REQUIRE(transport->m_szAddress == "192.0.1.2");
	REQUIRE(transport->m_iPort == 6444);

	// handshake carries the token in a plain frame
	REQUIRE(transport->m_vSent.size() == 2);
	REQUIRE(midea::hex::encode(&transport->m_vSent[0][0], 6) == "837000202000");
	REQUIRE((transport->m_vSent[1][5] & 0x0F) == midea::msgtype::ENCRYPTED_REQUEST);

	DehumidifierAppliance *appliance = dynamic_cast<DehumidifierAppliance*>(device.get_appliance());
	REQUIRE(appliance != nullptr);
	REQUIRE(appliance->get_current_humidity() == 63);
	REQUIRE(appliance->get_target_humidity() == 60);
	REQUIRE(appliance->is_online());
}

TEST_CASE("V3 session reuses the key", "[landevice]")
{
	MideaLanDevice device(APPLIANCE_ID, "a1", "192.0.1.2", 6444, DEVICE_TOKEN, DEVICE_KEY, 3);
	device.set_sleep_interval(0);
	ScriptedTransport *transport = new ScriptedTransport();
	transport->m_qReplies.push_back(from_hex(HANDSHAKE_REPLY));
	transport->m_qReplies.push_back(v3_status_reply());
	transport->m_qReplies.push_back(v3_status_reply());
	device.set_transport(std::unique_ptr<LanTransport>(transport));

	REQUIRE(device.refresh());
	REQUIRE(device.refresh());
	REQUIRE(transport->m_iConnects == 1);
	REQUIRE(transport->m_vSent.size() == 3);
}

TEST_CASE("V3 handshake needs token and key", "[landevice]")
{
	MideaLanDevice device(APPLIANCE_ID, "a1", "192.0.1.2", 6444, "", "", 3);
	device.set_sleep_interval(0);
	ScriptedTransport *transport = new ScriptedTransport();
	device.set_transport(std::unique_ptr<LanTransport>(transport));

	REQUIRE_FALSE(device.authenticate());
	REQUIRE(device.get_last_error_type() == midea::error::type::AUTHENTICATION);
	REQUIRE(device.get_last_error() == midea::messages::missingTokenKey);

	REQUIRE_FALSE(device.refresh());
	REQUIRE(device.get_last_error_type() == midea::error::type::AUTHENTICATION);
	REQUIRE(transport->m_vSent.empty());

	REQUIRE_FALSE(device.valid_token(nullptr));
	REQUIRE(device.get_last_error_type() == midea::error::type::AUTHENTICATION);
}

TEST_CASE("V3 handshake with a wrong key", "[landevice]")
{
	MideaLanDevice device(APPLIANCE_ID, "a1", "192.0.1.2", 6444, DEVICE_TOKEN, TCP_KEY, 3);
	device.set_sleep_interval(0);
	device.set_max_retries(1);
	ScriptedTransport *transport = new ScriptedTransport();
	transport->m_qReplies.push_back(from_hex(HANDSHAKE_REPLY));
	device.set_transport(std::unique_ptr<LanTransport>(transport));

	REQUIRE_FALSE(device.authenticate());
	REQUIRE(device.get_last_error_type() == midea::error::type::AUTHENTICATION);
}

TEST_CASE("V2 refresh", "[landevice]")
{
	MideaLanDevice device("44", "a1", "192.0.1.2", 6444, "", "", 2);
	device.set_sleep_interval(0);
	ScriptedTransport *transport = new ScriptedTransport();
	transport->m_qReplies.push_back(v2_status_reply());
	device.set_transport(std::unique_ptr<LanTransport>(transport));

	REQUIRE(device.refresh());
	REQUIRE(device.is_online());
	REQUIRE(transport->m_vSent.size() == 1);
	REQUIRE(transport->m_vSent[0][0] == 0x5A);

	std::string szValue;
	REQUIRE(device.get_appliance()->get_property("current_humidity", szValue));
	REQUIRE(szValue == "63");
}

TEST_CASE("Silent appliance goes offline", "[landevice]")
{
	MideaLanDevice device("44", "a1", "192.0.1.2", 6444, "", "", 2);
	device.set_sleep_interval(0);
	device.set_max_retries(2);
	ScriptedTransport *transport = new ScriptedTransport();
	transport->m_qReplies.push_back(v2_status_reply());
	device.set_transport(std::unique_ptr<LanTransport>(transport));

	REQUIRE(device.refresh());
	REQUIRE(device.is_online());

	REQUIRE_FALSE(device.refresh());
	REQUIRE(device.get_last_error_type() == midea::error::type::NETWORK);
	REQUIRE(device.is_online());
	REQUIRE_FALSE(device.refresh());
	REQUIRE(device.is_online());
	REQUIRE_FALSE(device.refresh());
	REQUIRE_FALSE(device.is_online());
	REQUIRE_FALSE(device.get_appliance()->is_online());
	REQUIRE_FALSE(transport->is_connected());
}

TEST_CASE("Named state changes are sent as one command", "[landevice]")
{
	MideaLanDevice device("44", "a1", "192.0.1.2", 6444, "", "", 2);
	device.set_sleep_interval(0);
	ScriptedTransport *transport = new ScriptedTransport();
	transport->m_qReplies.push_back(v2_status_reply());
	device.set_transport(std::unique_ptr<LanTransport>(transport));

	SECTION("valid values")
	{
		std::map<std::string, std::string> mValues = { { "target_humidity", "55" }, { "running", "on" }, { "turbo", "on" } };
		REQUIRE(device.set_state(mValues));
		REQUIRE(transport->m_vSent.size() == 1);

		MideaSecurity security;
		LanPacketCodec codec(security);
		std::vector<std::vector<uint8_t> > vPackets;
		REQUIRE(codec.split_v2_reply(transport->m_vSent[0], vPackets));
		REQUIRE(vPackets.size() == 1);
		REQUIRE(vPackets[0][0] == 0x48);
		REQUIRE((vPackets[0][1] & 0x01) == 0x01);
		REQUIRE(vPackets[0][7] == 55);
	}

	SECTION("read only value")
	{
		std::map<std::string, std::string> mValues = { { "current_humidity", "40" } };
		REQUIRE_FALSE(device.set_state(mValues));
		REQUIRE(device.get_last_error_type() == midea::error::type::VALIDATION);
		REQUIRE(transport->m_vSent.empty());
	}

	SECTION("invalid value")
	{
		std::map<std::string, std::string> mValues = { { "mode", "16" } };
		REQUIRE_FALSE(device.set_state(mValues));
		REQUIRE(device.get_last_error() == "Tried to set mode to invalid value: 16");
		REQUIRE(transport->m_vSent.empty());
	}
}

TEST_CASE("Unsupported protocol versions", "[landevice]")
{
	MideaLanDevice device("44", "a1", "192.0.1.2", 6444, "", "", 1);
	REQUIRE_FALSE(device.is_supported_version());
	REQUIRE_FALSE(device.identify());
	REQUIRE(device.get_last_error_type() == midea::error::type::UNSUPPORTED);

	std::vector<std::vector<uint8_t> > vResponses;
	REQUIRE_FALSE(device.appliance_send(from_hex("aa0ea100000000000303b501118ef6"), vResponses));
	REQUIRE(device.get_last_error_type() == midea::error::type::UNSUPPORTED);
}

TEST_CASE("Device identity", "[landevice]")
{
	MideaLanDevice device(APPLIANCE_ID, "a1", "192.0.1.2", 6444, DEVICE_TOKEN, DEVICE_KEY, 3);
	REQUIRE(device.get_appliance_id() == APPLIANCE_ID);
	REQUIRE(device.get_port() == 6444);
	REQUIRE(device.get_version() == 3);
	REQUIRE(device.get_name() == APPLIANCE_ID);
	REQUIRE(device.get_appliance()->get_family() == midea::appliancetype::DEHUMIDIFIER);

	midea::cloud::tCloudAppliance details;
	details.id = "1";
	details.sn = "000000P0000000Q1123456789ABC0000";
	REQUIRE_FALSE(device.matches(details));
	device.set_serial_number(details.sn);
	REQUIRE(device.matches(details));
	details.sn.clear();
	details.id = APPLIANCE_ID;
	REQUIRE(device.matches(details));

	MideaLanDevice moved(APPLIANCE_ID, "a1", "192.0.1.9", 6445, "00", "11", 3);
	device.update(moved);
	REQUIRE(device.get_address() == "192.0.1.9");
	REQUIRE(device.get_port() == 6445);
	REQUIRE(device.get_token() == "00");
	REQUIRE(device.get_key() == "11");
}
