/*
 * Copyright (c) 2024 Gordon Bos <gordon@bosvangennip.nl> All rights reserved.
 *
 * Legacy (v2 "ZZ") packet envelope and discovery replies
 *
 *
 * Source code subject to GNU GENERAL PUBLIC LICENSE version 3
 */

#ifndef _MideaLanPacket
#define _MideaLanPacket

#include <string>
#include <vector>
#include <cstdint>
#include <ctime>
#include "../crypto/Security.hpp"

#define LAN_PACKET_HEADER_SIZE 40
#define LAN_PACKET_FINGERPRINT_SIZE 16
#define LAN_COMMAND_HEADER_SIZE 10
#define DISCOVERY_MSG_SIZE 72


namespace midea {
  namespace lan {

	extern const uint8_t DISCOVERY_MSG[DISCOVERY_MSG_SIZE];

	typedef struct _tDeviceIdentity
	{
		int version;			// 2 = ZZ, 3 = 8370, 0 = unknown
		std::string appliance_id;	// decimal
		std::string address;
		int port;
		std::string serial_number;
		std::string ssid;
		std::string mac;
		std::string type;		// "0xa1" or, from the ssid, "a1"
		uint16_t subtype;
		uint8_t reserved;
		uint8_t flags;
		uint8_t extra;
		uint32_t udp_version;
		std::string protocol_version;
		std::string firmware_version;
		std::vector<uint8_t> randomkey;
	} tDeviceIdentity;

	void clear_identity(tDeviceIdentity &identity);
	std::string short_sn(const std::string &szSerialNumber);

	// hex(XOR of both halves of SHA256(id as 6 bytes))
	std::string udp_id(const uint64_t applianceId, const bool bLittleEndian);

	bool parse_appliance_id(const std::string &szApplianceId, uint64_t &applianceId);

  }; // namespace lan
}; // namespace midea


class LanPacketCodec
{
public:
	explicit LanPacketCodec(MideaSecurity &security);

	std::string get_last_error();
	midea::error::type::value get_last_error_type();

	/*
	 * Wraps a finalized command in a ZZ packet. Local packets carry the
	 * command AES-ECB encrypted, cloud relayed packets carry it plain.
	 * A null `when` stamps the packet with the current local time.
	 */
	bool build(const std::string &szApplianceId, const std::vector<uint8_t> &vCommand, const bool bLocal, std::vector<uint8_t> &vPacket, const struct tm *when = nullptr, const int centiseconds = 0);

	// v2 replies: concatenated ZZ packets or bare AA commands
	bool split_v2_reply(const std::vector<uint8_t> &vReply, std::vector<std::vector<uint8_t> > &vPackets);

	// 8370 frame bodies: -1 on error, 0 for an empty body, 1 when vPacket holds a payload
	int unwrap_v3_response(const std::vector<uint8_t> &vResponse, std::vector<uint8_t> &vPacket);

	bool parse_discovery_reply(const std::vector<uint8_t> &vData, midea::lan::tDeviceIdentity &identity);

private:
	bool set_error(const midea::error::type::value eType, const std::string &szError);

	MideaSecurity &m_security;
	std::string m_szLastError;
	midea::error::type::value m_eLastError;
};

#endif
