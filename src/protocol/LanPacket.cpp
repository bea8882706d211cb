/*
 * Copyright (c) 2024 Gordon Bos <gordon@bosvangennip.nl> All rights reserved.
 *
 * Legacy (v2 "ZZ") packet envelope and discovery replies
 *
 *
 * Source code subject to GNU GENERAL PUBLIC LICENSE version 3
 */

#include "LanPacket.hpp"
#include "../common/hexstring.hpp"
#include "../common/messages.hpp"
#include "../common/Logger.hpp"
#include <algorithm>
#include <chrono>
#include <cstring>


namespace midea {
namespace lan {

const uint8_t DISCOVERY_MSG[DISCOVERY_MSG_SIZE] = {
	0x5A, 0x5A, 0x01, 0x11, 0x48, 0x00, 0x92, 0x00,
	0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
	0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
	0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
	0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
	0x7F, 0x75, 0xBD, 0x6B, 0x3E, 0x4F, 0x8B, 0x76,
	0x2E, 0x84, 0x9C, 0x6E, 0x57, 0x8D, 0x65, 0x90,
	0x03, 0x6E, 0x9D, 0x43, 0x42, 0xA5, 0x0F, 0x1F,
	0x56, 0x9E, 0xB8, 0xEC, 0x91, 0x8E, 0x92, 0xE5
};


void clear_identity(tDeviceIdentity &identity)
{
	identity.version = 0;
	identity.appliance_id.clear();
	identity.address.clear();
	identity.port = 0;
	identity.serial_number.clear();
	identity.ssid.clear();
	identity.mac.clear();
	identity.type.clear();
	identity.subtype = 0;
	identity.reserved = 0;
	identity.flags = 0;
	identity.extra = 0;
	identity.udp_version = 0;
	identity.protocol_version.clear();
	identity.firmware_version.clear();
	identity.randomkey.clear();
}

std::string short_sn(const std::string &szSerialNumber)
{
	if ((szSerialNumber.size() == 32) && (szSerialNumber.compare(0, 6, "000000") == 0))
		return szSerialNumber.substr(6, 22);
	return "";
}

std::string udp_id(const uint64_t applianceId, const bool bLittleEndian)
{
	std::vector<uint8_t> vId(6);
	if (bLittleEndian)
		midea::bytes::to_le(applianceId, vId.data(), 6);
	else
		midea::bytes::to_be(applianceId, vId.data(), 6);

	std::vector<uint8_t> vDigest = MideaSecurity::sha256(vId);
	std::vector<uint8_t> vResult(16);
	for (size_t i = 0; i < 16; i++)
		vResult[i] = vDigest[i] ^ vDigest[i + 16];
	return midea::hex::encode(vResult);
}

bool parse_appliance_id(const std::string &szApplianceId, uint64_t &applianceId)
{
	applianceId = 0;
	if (szApplianceId.empty() || (szApplianceId.size() > 20))
		return false;
	for (const char c : szApplianceId)
	{
		if ((c < '0') || (c > '9'))
			return false;
		applianceId = applianceId * 10 + (uint64_t)(c - '0');
	}
	return true;
}

}; // namespace lan
}; // namespace midea


LanPacketCodec::LanPacketCodec(MideaSecurity &security) :
	m_security(security),
	m_eLastError(midea::error::type::NONE)
{
}

std::string LanPacketCodec::get_last_error()
{
	return m_szLastError;
}

midea::error::type::value LanPacketCodec::get_last_error_type()
{
	return m_eLastError;
}

/* private */ bool LanPacketCodec::set_error(const midea::error::type::value eType, const std::string &szError)
{
	m_eLastError = eType;
	m_szLastError = szError;
	return false;
}


/************************************************************************
 *									*
 *	ZZ packet							*
 *									*
 ************************************************************************/

bool LanPacketCodec::build(const std::string &szApplianceId, const std::vector<uint8_t> &vCommand, const bool bLocal, std::vector<uint8_t> &vPacket, const struct tm *when, const int centiseconds)
{
	vPacket.clear();
	uint64_t applianceId;
	if (!midea::lan::parse_appliance_id(szApplianceId, applianceId))
		return set_error(midea::error::type::VALIDATION, std::string("Invalid appliance id '") + szApplianceId + "'");

	struct tm ltime;
	int cs = centiseconds;
	if (when != nullptr)
		ltime = *when;
	else
	{
		auto now = std::chrono::system_clock::now();
		time_t tnow = std::chrono::system_clock::to_time_t(now);
		localtime_r(&tnow, &ltime);
		cs = (int)((std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000) / 10);
	}
	int year = ltime.tm_year + 1900;

	uint8_t header[LAN_PACKET_HEADER_SIZE];
	memset(header, 0, sizeof(header));
	header[0] = 0x5A;
	header[1] = 0x5A;
	header[2] = 0x01;
	header[3] = 0x11;
	header[6] = 0x20;
	header[12] = (uint8_t)cs;
	header[13] = (uint8_t)ltime.tm_sec;
	header[14] = (uint8_t)ltime.tm_min;
	header[15] = (uint8_t)ltime.tm_hour;
	header[16] = (uint8_t)ltime.tm_mday;
	header[17] = (uint8_t)(ltime.tm_mon + 1);
	header[18] = (uint8_t)(year % 100);
	header[19] = (uint8_t)(year / 100);
	midea::bytes::to_le(applianceId, &header[20], 8);

	vPacket.insert(vPacket.end(), header, header + LAN_PACKET_HEADER_SIZE);
	if (bLocal)
	{
		std::vector<uint8_t> vEncrypted;
		if (!m_security.aes_encrypt(vCommand, vEncrypted))
		{
			vPacket.clear();
			return set_error(m_security.get_last_error_type(), m_security.get_last_error());
		}
		vPacket.insert(vPacket.end(), vEncrypted.begin(), vEncrypted.end());
	}
	else
		vPacket.insert(vPacket.end(), vCommand.begin(), vCommand.end());

	midea::bytes::to_le(vPacket.size() + LAN_PACKET_FINGERPRINT_SIZE, &vPacket[4], 2);
	std::vector<uint8_t> vFingerprint = m_security.md5fingerprint(vPacket);
	vPacket.insert(vPacket.end(), vFingerprint.begin(), vFingerprint.end());
	return true;
}


bool LanPacketCodec::split_v2_reply(const std::vector<uint8_t> &vReply, std::vector<std::vector<uint8_t> > &vPackets)
{
	vPackets.clear();
	size_t replylen = vReply.size();

	if ((replylen > 5) && (vReply[0] == 0x5A) && (vReply[1] == 0x5A))
	{
		size_t i = 0;
		while (i < replylen)
		{
			if (i + 5 > replylen)
				break;
			size_t size = vReply[i + 4];
			if ((size < LAN_PACKET_HEADER_SIZE + LAN_PACKET_FINGERPRINT_SIZE) || (i + size > replylen))
				return set_error(midea::error::type::PROTOCOL, std::string(midea::messages::unknownResponseFormat) + " (truncated ZZ packet)");
			std::vector<uint8_t> vEncrypted(vReply.begin() + i + LAN_PACKET_HEADER_SIZE, vReply.begin() + i + size - LAN_PACKET_FINGERPRINT_SIZE);
			std::vector<uint8_t> vData;
			if (!m_security.aes_decrypt(vEncrypted, vData))
				return set_error(midea::error::type::PROTOCOL, m_security.get_last_error());
			if (vData.size() > LAN_COMMAND_HEADER_SIZE)
				vPackets.push_back(std::vector<uint8_t>(vData.begin() + LAN_COMMAND_HEADER_SIZE, vData.end()));
			i += size;
		}
		return true;
	}

	if ((replylen > 2) && (vReply[0] == 0xAA))
	{
		size_t i = 0;
		while (i < replylen)
		{
			if (i + 2 > replylen)
				break;
			size_t size = (size_t)vReply[i + 1] + 1;
			size_t end = std::min(i + size, replylen);
			if (end - i > LAN_COMMAND_HEADER_SIZE)
				vPackets.push_back(std::vector<uint8_t>(vReply.begin() + i + LAN_COMMAND_HEADER_SIZE, vReply.begin() + end));
			i += size;
		}
		return true;
	}

	return set_error(midea::error::type::PROTOCOL, std::string(midea::messages::unknownResponseFormat) + " " + midea::hex::encode(vReply));
}


int LanPacketCodec::unwrap_v3_response(const std::vector<uint8_t> &vResponse, std::vector<uint8_t> &vPacket)
{
	vPacket.clear();
	std::vector<uint8_t> vData(vResponse);
	if (vData.size() > LAN_PACKET_HEADER_SIZE + LAN_PACKET_FINGERPRINT_SIZE)
	{
		std::vector<uint8_t> vEncrypted(vData.begin() + LAN_PACKET_HEADER_SIZE, vData.end() - LAN_PACKET_FINGERPRINT_SIZE);
		if (!m_security.aes_decrypt(vEncrypted, vData))
		{
			set_error(midea::error::type::PROTOCOL, m_security.get_last_error());
			return -1;
		}
	}
	if (vData.size() <= LAN_COMMAND_HEADER_SIZE)
		return 0;
	vPacket.assign(vData.begin() + LAN_COMMAND_HEADER_SIZE, vData.end());
	return 1;
}


/************************************************************************
 *									*
 *	Discovery reply							*
 *									*
 *	Firmware variants send truncated replies, so every field past	*
 *	the ssid is optional.						*
 *									*
 ************************************************************************/

bool LanPacketCodec::parse_discovery_reply(const std::vector<uint8_t> &vData, midea::lan::tDeviceIdentity &identity)
{
	midea::lan::clear_identity(identity);
	if (vData.size() < 2)
		return set_error(midea::error::type::PROTOCOL, "Discovery reply too short");

	if ((vData[0] == 0x5A) && (vData[1] == 0x5A))
		identity.version = 2;
	else if ((vData[0] == 0x83) && (vData[1] == 0x70))
		identity.version = 3;
	else
	{
		identity.version = 0;
		return true;
	}

	std::vector<uint8_t> vPacket(vData);
	if ((vPacket.size() >= 10 + LAN_PACKET_FINGERPRINT_SIZE) && (vPacket[8] == 0x5A) && (vPacket[9] == 0x5A))
		vPacket = std::vector<uint8_t>(vData.begin() + 8, vData.end() - LAN_PACKET_FINGERPRINT_SIZE);

	if (vPacket.size() < LAN_PACKET_HEADER_SIZE + LAN_PACKET_FINGERPRINT_SIZE)
		return set_error(midea::error::type::PROTOCOL, "Discovery reply too short");

	identity.appliance_id = std::to_string(midea::bytes::from_le(&vPacket[20], 6));

	std::vector<uint8_t> vEncrypted(vPacket.begin() + LAN_PACKET_HEADER_SIZE, vPacket.end() - LAN_PACKET_FINGERPRINT_SIZE);
	std::vector<uint8_t> vReply;
	if (!m_security.aes_decrypt(vEncrypted, vReply))
		return set_error(midea::error::type::PROTOCOL, std::string("Unable to decrypt discovery reply: ") + m_security.get_last_error());

	_log.Debug(DEBUG_PROTOCOL, "Discovery reply decrypted: %s", midea::hex::encode(vReply).c_str());

	size_t replylen = vReply.size();
	if (replylen < 41)
		return set_error(midea::error::type::PROTOCOL, "Decrypted discovery reply too short");

	identity.address = std::to_string(vReply[3]) + "." + std::to_string(vReply[2]) + "." + std::to_string(vReply[1]) + "." + std::to_string(vReply[0]);
	identity.port = (int)midea::bytes::from_le(&vReply[4], 4);
	identity.serial_number = std::string(vReply.begin() + 8, vReply.begin() + 40);
	size_t ssidlen = vReply[40];
	if (replylen < 41 + ssidlen)
		return set_error(midea::error::type::PROTOCOL, "Discovery reply ssid exceeds payload");
	identity.ssid = std::string(vReply.begin() + 41, vReply.begin() + 41 + ssidlen);

	if (replylen >= 69 + ssidlen)
		identity.mac = midea::hex::encode(&vReply[63 + ssidlen], 6);
	else if (identity.serial_number.size() >= 32)
		identity.mac = identity.serial_number.substr(16, 16);

	if ((replylen >= 56 + ssidlen) && (vReply[55 + ssidlen] != 0))
	{
		identity.type = std::string("0x") + midea::hex::byte(vReply[55 + ssidlen]);
		if (replylen >= 59 + ssidlen)
			identity.subtype = (uint16_t)midea::bytes::from_le(&vReply[57 + ssidlen], 2);
	}
	else
	{
		// ssid like midea_xx_xxxx or net_xx_xxxx
		size_t first = identity.ssid.find('_');
		if (first != std::string::npos)
		{
			size_t second = identity.ssid.find('_', first + 1);
			identity.type = identity.ssid.substr(first + 1, (second == std::string::npos) ? std::string::npos : second - first - 1);
			identity.type = midea::lowercase(identity.type);
		}
		identity.subtype = 0;
	}

	if (replylen >= 46 + ssidlen)
	{
		identity.reserved = vReply[43 + ssidlen];
		identity.flags = vReply[44 + ssidlen];
		identity.extra = vReply[45 + ssidlen];
		if (replylen >= 50 + ssidlen)
			identity.udp_version = (uint32_t)midea::bytes::from_le(&vReply[46 + ssidlen], 4);
		if (replylen >= 72 + ssidlen)
		{
			identity.protocol_version = midea::hex::encode(&vReply[69 + ssidlen], 3);
			if (replylen >= 75 + ssidlen)
				identity.firmware_version = std::to_string(vReply[72 + ssidlen]) + "." + std::to_string(vReply[73 + ssidlen]) + "." + std::to_string(vReply[74 + ssidlen]);
			if (replylen >= 94 + ssidlen)
				identity.randomkey.assign(vReply.begin() + 78 + ssidlen, vReply.begin() + 94 + ssidlen);
		}
	}
	return true;
}
