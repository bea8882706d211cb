/*
 * Copyright (c) 2024 Gordon Bos <gordon@bosvangennip.nl> All rights reserved.
 *
 * Local network session with a Midea appliance
 *
 *
 * Source code subject to GNU GENERAL PUBLIC LICENSE version 3
 */

#ifndef _MideaLanDevice
#define _MideaLanDevice

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <mutex>
#include <cstdint>
#include <boost/signals2.hpp>
#include "../appliance/Appliance.hpp"
#include "../cloud/MideaCloud.hpp"
#include "../connection/LanTransport.hpp"
#include "../crypto/Security.hpp"
#include "../protocol/Frame8370.hpp"
#include "../protocol/LanPacket.hpp"
#include "../common/definitions.hpp"
#include "../common/errors.hpp"

#define MIDEA_HANDSHAKE_REPLY_OFFSET 8
#define MIDEA_HANDSHAKE_REPLY_SIZE 64


class MideaLanDevice
{
public:
/************************************************************************
 *									*
 *	Class construct							*
 *									*
 *	A device is created from a parsed discovery reply or from	*
 *	known coordinates. Without a transport a TCP socket is used.	*
 *									*
 ************************************************************************/

	MideaLanDevice(const midea::lan::tDeviceIdentity &identity, const std::string &szToken = "", const std::string &szKey = "");
	MideaLanDevice(const std::string &szApplianceId, const std::string &szType, const std::string &szAddress = "", const int iPort = MIDEA_LAN_PORT, const std::string &szToken = "", const std::string &szKey = "", const int iVersion = 3);
	~MideaLanDevice();

	void set_transport(std::unique_ptr<LanTransport> transport);


/************************************************************************
 *									*
 *	Debug information and errors 					*
 *									*
 ************************************************************************/

	std::string get_last_error();
	midea::error::type::value get_last_error_type();


/************************************************************************
 *									*
 *	Configuration							*
 *									*
 ************************************************************************/

	void set_max_retries(const int retries);
	int get_max_retries();
	void set_socket_timeout(const int seconds);
	// scales every back off delay, 0 disables them
	void set_sleep_interval(const double seconds);


/************************************************************************
 *									*
 *	Identity							*
 *									*
 ************************************************************************/

	const midea::lan::tDeviceIdentity& get_identity();
	MideaAppliance* get_appliance();

	std::string get_appliance_id();
	std::string get_type();
	std::string get_address();
	int get_port();
	int get_version();
	std::string get_name();
	void set_name(const std::string &szName);
	std::string get_serial_number();
	void set_serial_number(const std::string &szSerialNumber);
	std::string get_token();
	std::string get_key();
	bool is_online();
	bool is_supported_version();

	// true when the cloud registry entry describes this appliance
	bool matches(const midea::cloud::tCloudAppliance &details);

	std::string to_string();
	std::string dump();


/************************************************************************
 *									*
 *	Session								*
 *									*
 *	Passing a cloud object to refresh() and apply() routes the	*
 *	request through the cloud relay instead of the local socket.	*
 *									*
 ************************************************************************/

	bool authenticate();
	bool valid_token(MideaCloud *cloud);
	bool appliance_send(const std::vector<uint8_t> &vData, std::vector<std::vector<uint8_t> > &vResponses);

	bool refresh(MideaCloud *cloud = nullptr);
	bool apply(MideaCloud *cloud = nullptr);
	bool identify(MideaCloud *cloud = nullptr, const bool bUseCloud = false);
	bool is_identified(MideaCloud *cloud = nullptr);

	/*
	 * Writes named properties and sends the resulting set command.
	 * Unknown names are logged and skipped, invalid values abort
	 * before anything is sent.
	 */
	bool set_state(const std::map<std::string, std::string> &mValues, MideaCloud *cloud = nullptr);

	// takes over credentials and network coordinates, the session restarts
	void update(const MideaLanDevice &other);

	boost::signals2::signal<void(MideaLanDevice* device)> sigStateChanged;


private:
	void init();
	bool connect();
	void disconnect();
	bool request(const std::vector<uint8_t> &vMessage, std::vector<uint8_t> &vResponse);
	bool appliance_send_8370(const std::vector<uint8_t> &vData, std::vector<std::vector<uint8_t> > &vResponses);
	bool appliance_send_v2(const std::vector<uint8_t> &vData, std::vector<std::vector<uint8_t> > &vResponses);
	bool retry_send(const std::vector<uint8_t> &vData, std::vector<std::vector<uint8_t> > &vResponses);
	bool get_tcp_key(const std::vector<uint8_t> &vResponse);
	bool get_valid_token(MideaCloud *cloud);
	bool check_is_supported(const bool bUseCloud);
	bool status(MideaCommand &command, MideaCloud *cloud, std::vector<std::vector<uint8_t> > &vResponses);
	void check_for_offline(MideaCloud *cloud);
	void sleep(const double duration);
	bool set_error(const midea::error::type::value eType, const std::string &szError);

	std::recursive_mutex m_mutex;
	MideaSecurity m_security;
	LanPacketCodec m_packetCodec;
	Frame8370Codec m_frameCodec;
	Frame8370Decoder m_decoder;
	MideaCommandSequence m_sequence;
	std::unique_ptr<LanTransport> m_transport;
	std::unique_ptr<MideaAppliance> m_appliance;

	midea::lan::tDeviceIdentity m_identity;
	std::string m_szToken;
	std::string m_szKey;

	bool m_bOnline;
	bool m_bGotTcpKey;
	int m_iRetries;
	int m_iMaxRetries;
	int m_iNoResponses;
	int m_iSocketTimeout;
	double m_dSleepInterval;
	std::string m_szSocketError;

	std::string m_szLastError;
	midea::error::type::value m_eLastError;
};


namespace midea {
  namespace lan {

	typedef struct _tStateRequest
	{
		std::string address;
		std::string token;
		std::string key;
		MideaCloud *cloud;
		bool use_cloud;
		std::string appliance_id;
		std::string appliance_type;
		int retries;
		int timeout;
		long cloud_timeout;	// 0 = same as timeout
	} tStateRequest;

	void init_state_request(tStateRequest &request);

	/*
	 * Probes `address` on the discovery port, or uses the cloud relay
	 * when only an appliance id is given, then identifies the appliance
	 * and takes its name and serial number from the cloud registry.
	 * Returns nullptr and fills eError/szError on failure.
	 */
	std::unique_ptr<MideaLanDevice> appliance_state(const tStateRequest &request, midea::error::type::value &eError, std::string &szError);

  }; // namespace lan
}; // namespace midea

#endif
