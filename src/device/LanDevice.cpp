/*
 * Copyright (c) 2024 Gordon Bos <gordon@bosvangennip.nl> All rights reserved.
 *
 * Local network session with a Midea appliance
 *
 *
 * Source code subject to GNU GENERAL PUBLIC LICENSE version 3
 */

#include "LanDevice.hpp"
#include "../connection/TcpTransport.hpp"
#include "../common/hexstring.hpp"
#include "../common/messages.hpp"
#include "../common/Logger.hpp"
#include <thread>
#include <chrono>
#include <cstdio>
#include <algorithm>


/************************************************************************
 *									*
 *	Class construct							*
 *									*
 ************************************************************************/

MideaLanDevice::MideaLanDevice(const midea::lan::tDeviceIdentity &identity, const std::string &szToken, const std::string &szKey) :
	m_packetCodec(m_security),
	m_decoder(m_frameCodec),
	m_identity(identity),
	m_szToken(szToken),
	m_szKey(szKey)
{
	init();
}

MideaLanDevice::MideaLanDevice(const std::string &szApplianceId, const std::string &szType, const std::string &szAddress, const int iPort, const std::string &szToken, const std::string &szKey, const int iVersion) :
	m_packetCodec(m_security),
	m_decoder(m_frameCodec),
	m_szToken(szToken),
	m_szKey(szKey)
{
	midea::lan::clear_identity(m_identity);
	m_identity.version = iVersion;
	m_identity.appliance_id = szApplianceId;
	m_identity.type = szType;
	m_identity.address = szAddress;
	m_identity.port = iPort;
	init();
}

MideaLanDevice::~MideaLanDevice()
{
	disconnect();
}

/* private */ void MideaLanDevice::init()
{
	m_transport.reset(new TcpTransport());
	m_appliance = MideaAppliance::create(m_identity.appliance_id, m_identity.type);
	m_appliance->set_serial_number(m_identity.serial_number);
	m_bOnline = false;
	m_bGotTcpKey = false;
	m_iRetries = 0;
	m_iMaxRetries = MIDEA_DEFAULT_RETRIES;
	m_iNoResponses = 0;
	m_iSocketTimeout = MIDEA_SOCKET_TIMEOUT_SECS;
	m_dSleepInterval = 1.0;
	m_eLastError = midea::error::type::NONE;
}

void MideaLanDevice::set_transport(std::unique_ptr<LanTransport> transport)
{
	std::lock_guard<std::recursive_mutex> lock(m_mutex);
	disconnect();
	m_transport = std::move(transport);
}


/************************************************************************
 *									*
 *	Debug information and errors 					*
 *									*
 ************************************************************************/

std::string MideaLanDevice::get_last_error()
{
	return m_szLastError;
}

midea::error::type::value MideaLanDevice::get_last_error_type()
{
	return m_eLastError;
}

/* private */ bool MideaLanDevice::set_error(const midea::error::type::value eType, const std::string &szError)
{
	m_eLastError = eType;
	m_szLastError = szError;
	return false;
}


/************************************************************************
 *									*
 *	Configuration							*
 *									*
 ************************************************************************/

void MideaLanDevice::set_max_retries(const int retries)
{
	m_iMaxRetries = (retries < 1) ? 1 : retries;
}

int MideaLanDevice::get_max_retries()
{
	return m_iMaxRetries;
}

void MideaLanDevice::set_socket_timeout(const int seconds)
{
	m_iSocketTimeout = seconds;
}

void MideaLanDevice::set_sleep_interval(const double seconds)
{
	m_dSleepInterval = seconds;
}

/* private */ void MideaLanDevice::sleep(const double duration)
{
	long iMilliSeconds = (long)(duration * m_dSleepInterval * 1000);
	if (iMilliSeconds > 0)
		std::this_thread::sleep_for(std::chrono::milliseconds(iMilliSeconds));
}


/************************************************************************
 *									*
 *	Identity							*
 *									*
 ************************************************************************/

const midea::lan::tDeviceIdentity& MideaLanDevice::get_identity()
{
	return m_identity;
}

MideaAppliance* MideaLanDevice::get_appliance()
{
	return m_appliance.get();
}

std::string MideaLanDevice::get_appliance_id()
{
	return m_identity.appliance_id;
}

std::string MideaLanDevice::get_type()
{
	return m_identity.type;
}

std::string MideaLanDevice::get_address()
{
	return m_identity.address;
}

int MideaLanDevice::get_port()
{
	return m_identity.port;
}

int MideaLanDevice::get_version()
{
	return m_identity.version;
}

std::string MideaLanDevice::get_name()
{
	return m_appliance->get_name();
}

void MideaLanDevice::set_name(const std::string &szName)
{
	m_appliance->set_name(szName);
}

std::string MideaLanDevice::get_serial_number()
{
	return m_identity.serial_number;
}

void MideaLanDevice::set_serial_number(const std::string &szSerialNumber)
{
	m_identity.serial_number = szSerialNumber;
	m_appliance->set_serial_number(szSerialNumber);
}

std::string MideaLanDevice::get_token()
{
	return m_szToken;
}

std::string MideaLanDevice::get_key()
{
	return m_szKey;
}

bool MideaLanDevice::is_online()
{
	return m_bOnline;
}

bool MideaLanDevice::is_supported_version()
{
	return (m_identity.version >= 2);
}

bool MideaLanDevice::matches(const midea::cloud::tCloudAppliance &details)
{
	if (details.id == m_identity.appliance_id)
		return true;
	return (!m_identity.serial_number.empty() && (details.sn == m_identity.serial_number));
}

std::string MideaLanDevice::to_string()
{
	return "sn=" + midea::redact(m_identity.serial_number, 8) +
		" id=" + midea::redact(m_identity.appliance_id, 4) +
		" address=" + midea::redact(m_identity.address, 5) +
		" version=" + std::to_string(m_identity.version);
}

std::string MideaLanDevice::dump()
{
	char szFlags[64];
	snprintf(szFlags, sizeof(szFlags), "subtype=%x, flags=%x, extra=%x, reserved=%x", m_identity.subtype, m_identity.flags, m_identity.extra, m_identity.reserved);
	char szUdpVersion[16];
	snprintf(szUdpVersion, sizeof(szUdpVersion), "%x", m_identity.udp_version);

	std::string szDump = "{id=" + midea::redact(m_identity.appliance_id, 4);
	szDump.append(", address=" + midea::redact(m_identity.address, 5));
	szDump.append(", port=" + std::to_string(m_identity.port));
	szDump.append(", version=" + std::to_string(m_identity.version));
	szDump.append(", name=" + midea::redact(m_appliance->get_name()));
	szDump.append(std::string(", online=") + (m_bOnline ? "True" : "False"));
	szDump.append(", type=" + m_identity.type);
	szDump.append(", ");
	szDump.append(szFlags);
	szDump.append(", mac=" + midea::redact(m_identity.mac, 5));
	szDump.append(", ssid=" + m_identity.ssid);
	szDump.append(std::string(", udp_version=") + szUdpVersion);
	szDump.append(", protocol=" + m_identity.protocol_version);
	szDump.append(", version=" + m_identity.firmware_version);
	szDump.append(", sn=" + midea::redact(m_identity.serial_number, 8));
	szDump.append(", state=" + m_appliance->to_string() + "}");
	return szDump;
}


/************************************************************************
 *									*
 *	Socket handling							*
 *									*
 ************************************************************************/

/* private */ bool MideaLanDevice::connect()
{
	if (m_transport->is_connected())
		return true;

	disconnect();
	m_decoder.reset();
	_log.Debug(DEBUG_LAN, "Attempting new connection to %s", to_string().c_str());
	if (!m_transport->connect(m_identity.address, m_identity.port, m_iSocketTimeout))
	{
		_log.Debug(DEBUG_LAN, "Connection error: %s for %s", m_transport->get_last_error().c_str(), to_string().c_str());
		m_szSocketError = m_transport->get_last_error();
		disconnect();
		return false;
	}
	return true;
}

/* private */ void MideaLanDevice::disconnect()
{
	if (m_transport)
		m_transport->disconnect();
	m_bGotTcpKey = false;
}

/* private */ bool MideaLanDevice::request(const std::vector<uint8_t> &vMessage, std::vector<uint8_t> &vResponse)
{
	vResponse.clear();
	if (!connect())
	{
		_log.Debug(DEBUG_LAN, "Socket not open for %s", to_string().c_str());
		m_szSocketError = "Socket not open for " + m_identity.address;
		m_iRetries++;
		return false;
	}

	_log.Debug(DEBUG_PROTOCOL, "Sending to %s, message=%s", to_string().c_str(), midea::hex::encode(vMessage).c_str());
	if (!m_transport->send(vMessage))
	{
		_log.Debug(DEBUG_LAN, "Error sending to %s: %s", to_string().c_str(), m_transport->get_last_error().c_str());
		m_szSocketError = m_transport->get_last_error();
		disconnect();
		m_iRetries++;
		return false;
	}

	int numbytes = m_transport->receive(vResponse, MIDEA_MAX_BUFFER_SIZE);
	if (numbytes <= 0)
	{
		_log.Debug(DEBUG_LAN, "Error receiving from %s: %s", to_string().c_str(), m_transport->get_last_error().c_str());
		m_szSocketError = m_transport->get_last_error();
		if (numbytes < 0)
			disconnect();
		m_iRetries++;
		vResponse.clear();
		return false;
	}

	_log.Debug(DEBUG_PROTOCOL, "From %s, message=%s", to_string().c_str(), midea::hex::encode(vResponse).c_str());
	m_iRetries = 0;
	return true;
}


/************************************************************************
 *									*
 *	Handshake							*
 *									*
 *	The device answers the token with 64 bytes, AES-CBC encrypted	*
 *	with the key and followed by the SHA256 of the plain text.	*
 *									*
 ************************************************************************/

bool MideaLanDevice::authenticate()
{
	std::lock_guard<std::recursive_mutex> lock(m_mutex);
	if (m_szToken.empty() || m_szKey.empty())
		return set_error(midea::error::type::AUTHENTICATION, midea::messages::missingTokenKey);

	std::vector<uint8_t> vToken;
	if (!midea::hex::decode(m_szToken, vToken))
		return set_error(midea::error::type::AUTHENTICATION, "Invalid token " + midea::messages::invalidHex);

	std::vector<uint8_t> vResponse;
	for (int i = 0; i < m_iMaxRetries; i++)
	{
		std::vector<uint8_t> vRequest;
		if (!m_frameCodec.encode(vToken, midea::msgtype::HANDSHAKE_REQUEST, vRequest))
			return set_error(midea::error::type::AUTHENTICATION, m_frameCodec.get_last_error());
		if (request(vRequest, vResponse))
			break;
		if (i > 0)
		{
			_log.Debug(DEBUG_LAN, "Handshake retry %d of %d", i + 1, m_iMaxRetries);
			sleep(i + 1);
		}
	}
	if (vResponse.empty())
		return set_error(midea::error::type::AUTHENTICATION, "Failed to perform handshake for " + midea::redact(m_identity.serial_number, 8));

	_log.Debug(DEBUG_PROTOCOL, "handshake_response=%s for %s", midea::hex::encode(vResponse).c_str(), to_string().c_str());
	std::vector<uint8_t> vReply;
	if (vResponse.size() > MIDEA_HANDSHAKE_REPLY_OFFSET)
	{
		size_t iEnd = std::min(vResponse.size(), (size_t)(MIDEA_HANDSHAKE_REPLY_OFFSET + MIDEA_HANDSHAKE_REPLY_SIZE));
		vReply.assign(vResponse.begin() + MIDEA_HANDSHAKE_REPLY_OFFSET, vResponse.begin() + iEnd);
	}
	return get_tcp_key(vReply);
}

/* private */ bool MideaLanDevice::get_tcp_key(const std::vector<uint8_t> &vResponse)
{
	std::vector<uint8_t> vKey;
	if (!midea::hex::decode(m_szKey, vKey))
		return set_error(midea::error::type::AUTHENTICATION, "Invalid key " + midea::messages::invalidHex);

	std::vector<uint8_t> vTcpKey;
	if (!m_security.tcp_key(vResponse, vKey, vTcpKey))
		return set_error(midea::error::type::AUTHENTICATION, "Failed to get TCP key for " + midea::redact(m_identity.serial_number, 8) + ", cause " + m_security.get_last_error());

	m_frameCodec.set_tcp_key(vTcpKey);
	m_decoder.reset();
	m_bGotTcpKey = true;
	_log.Debug(DEBUG_LAN, "Got TCP key for: %s", to_string().c_str());
	// the device needs a moment before it accepts data
	sleep(0.5);
	return true;
}


/************************************************************************
 *									*
 *	Sending packets							*
 *									*
 ************************************************************************/

bool MideaLanDevice::appliance_send(const std::vector<uint8_t> &vData, std::vector<std::vector<uint8_t> > &vResponses)
{
	std::lock_guard<std::recursive_mutex> lock(m_mutex);
	vResponses.clear();
	if (m_identity.version >= 3)
		return appliance_send_8370(vData, vResponses);
	if (m_identity.version == 2)
		return appliance_send_v2(vData, vResponses);
	return set_error(midea::error::type::UNSUPPORTED, "Unsupported protocol " + std::to_string(m_identity.version));
}

/* private */ bool MideaLanDevice::appliance_send_8370(const std::vector<uint8_t> &vData, std::vector<std::vector<uint8_t> > &vResponses)
{
	if (!m_transport->is_connected() || !m_bGotTcpKey)
	{
		_log.Debug(DEBUG_LAN, "Socket %s closed, creating new socket", to_string().c_str());
		disconnect();
		for (int i = 0; i < m_iMaxRetries; i++)
		{
			if (authenticate())
				break;
			if (i == m_iMaxRetries - 1)
			{
				_log.Debug(DEBUG_LAN, "Failed to authenticate %s", to_string().c_str());
				return false;
			}
			_log.Debug(DEBUG_LAN, "Retrying authenticate, %d out of %d: %s", i + 2, m_iMaxRetries, to_string().c_str());
			disconnect();
			sleep((i + 1) * 2);
		}
	}

	std::vector<uint8_t> vFrame;
	if (!m_frameCodec.encode(vData, midea::msgtype::ENCRYPTED_REQUEST, vFrame))
		return set_error(m_frameCodec.get_last_error_type(), m_frameCodec.get_last_error());

	// back off before a resend
	sleep(m_iRetries);
	std::vector<uint8_t> vResponse;
	if (!request(vFrame, vResponse))
		return retry_send(vData, vResponses);

	std::vector<std::vector<uint8_t> > vFrames;
	if (m_decoder.feed(vResponse, vFrames) < 0)
		return set_error(midea::error::type::PROTOCOL, m_frameCodec.get_last_error());
	_log.Debug(DEBUG_PROTOCOL, "decode_8370 frames=%d overflow=%d for %s", (int)vFrames.size(), (int)m_decoder.pending(), to_string().c_str());

	for (const auto &vBody : vFrames)
	{
		std::vector<uint8_t> vPacket;
		int result = m_packetCodec.unwrap_v3_response(vBody, vPacket);
		if (result < 0)
			return set_error(m_packetCodec.get_last_error_type(), m_packetCodec.get_last_error());
		if (result > 0)
			vResponses.push_back(vPacket);
	}
	return true;
}

/* private */ bool MideaLanDevice::appliance_send_v2(const std::vector<uint8_t> &vData, std::vector<std::vector<uint8_t> > &vResponses)
{
	sleep(m_iRetries);
	_log.Debug(DEBUG_PROTOCOL, "appliance_send_v2 %s data=%s", to_string().c_str(), midea::hex::encode(vData).c_str());
	std::vector<uint8_t> vResponse;
	if (!request(vData, vResponse))
		return retry_send(vData, vResponses);

	if (!m_packetCodec.split_v2_reply(vResponse, vResponses))
		return set_error(m_packetCodec.get_last_error_type(), m_packetCodec.get_last_error() + " " + to_string());
	return true;
}

/* private */ bool MideaLanDevice::retry_send(const std::vector<uint8_t> &vData, std::vector<std::vector<uint8_t> > &vResponses)
{
	if (m_iRetries < m_iMaxRetries)
	{
		_log.Debug(DEBUG_LAN, "retrying appliance_send %d of %d", m_iRetries, m_iMaxRetries);
		m_szSocketError = midea::messages::emptyReply;
		m_iRetries++;
		bool bResult = appliance_send(vData, vResponses);
		m_iRetries = 0;
		return bResult;
	}
	std::string szError = m_szSocketError;
	m_szSocketError.clear();
	m_iRetries = 0;
	return set_error(midea::error::type::NETWORK, "Unable to send data after " + std::to_string(m_iMaxRetries) + " retries, last error " + szError + " for " + midea::redact(m_identity.serial_number, 8) + " (" + midea::redact(m_identity.appliance_id, 4) + ")");
}


/************************************************************************
 *									*
 *	Status and commands						*
 *									*
 ************************************************************************/

/* private */ bool MideaLanDevice::status(MideaCommand &command, MideaCloud *cloud, std::vector<std::vector<uint8_t> > &vResponses)
{
	vResponses.clear();
	std::vector<uint8_t> vPacket;
	if (!m_packetCodec.build(m_identity.appliance_id, command.finalize(m_sequence), (cloud == nullptr), vPacket))
		return set_error(m_packetCodec.get_last_error_type(), m_packetCodec.get_last_error());
	_log.Debug(DEBUG_PROTOCOL, "Packet for: %s data=%s", to_string().c_str(), midea::hex::encode(vPacket).c_str());

	bool bResult;
	if (cloud)
	{
		_log.Debug(DEBUG_LAN, "Sending request via cloud API to: %s", to_string().c_str());
		bResult = cloud->appliance_transparent_send(m_identity.appliance_id, vPacket, vResponses);
		if (!bResult)
			set_error(cloud->get_last_error_type(), cloud->get_last_error());
	}
	else
		bResult = appliance_send(vPacket, vResponses);

	if (!bResult || vResponses.empty())
	{
		_log.Debug(DEBUG_LAN, "Got no responses on status from: %s", to_string().c_str());
		m_iNoResponses++;
		check_for_offline(cloud);
	}
	else
	{
		m_iNoResponses = 0;
		m_bOnline = true;
		m_appliance->set_online(true);
		_log.Debug(DEBUG_LAN, "Got %d response(s) from: %s", (int)vResponses.size(), to_string().c_str());
	}
	return bResult;
}

/* private */ void MideaLanDevice::check_for_offline(MideaCloud *cloud)
{
	if (m_iNoResponses > m_iMaxRetries)
	{
		if (m_bOnline)
			_log.Debug(DEBUG_LAN, "No response for %s in %d retries. Considered offline", to_string().c_str(), m_iNoResponses);
		m_bOnline = false;
		m_appliance->set_online(false);
		if (!cloud)
			disconnect();
	}
}

bool MideaLanDevice::refresh(MideaCloud *cloud)
{
	std::lock_guard<std::recursive_mutex> lock(m_mutex);
	std::unique_ptr<MideaCommand> command = m_appliance->refresh_command();
	std::vector<std::vector<uint8_t> > vResponses;
	if (!status(*command, cloud, vResponses))
		return false;
	if (vResponses.empty())
		return true;

	if (vResponses.size() > 1)
		_log.Debug(DEBUG_LAN, "Got several responses on refresh from: %s, got=%d", to_string().c_str(), (int)vResponses.size());
	if (!m_appliance->process_response(vResponses.back()))
		return set_error(m_appliance->get_last_error_type(), m_appliance->get_last_error());
	sigStateChanged(this);
	return true;
}

bool MideaLanDevice::apply(MideaCloud *cloud)
{
	std::lock_guard<std::recursive_mutex> lock(m_mutex);
	std::unique_ptr<MideaCommand> command = m_appliance->apply_command();
	std::vector<uint8_t> vPacket;
	if (!m_packetCodec.build(m_identity.appliance_id, command->finalize(m_sequence), (cloud == nullptr), vPacket))
		return set_error(m_packetCodec.get_last_error_type(), m_packetCodec.get_last_error());
	_log.Debug(DEBUG_PROTOCOL, "Packet for %s data: %s", to_string().c_str(), midea::hex::encode(vPacket).c_str());

	std::vector<std::vector<uint8_t> > vResponses;
	bool bResult;
	if (cloud)
	{
		_log.Debug(DEBUG_LAN, "Sending request via cloud to %s", to_string().c_str());
		bResult = cloud->appliance_transparent_send(m_identity.appliance_id, vPacket, vResponses);
		if (!bResult)
			set_error(cloud->get_last_error_type(), cloud->get_last_error());
	}
	else
		bResult = appliance_send(vPacket, vResponses);

	if (!bResult || vResponses.empty())
	{
		_log.Debug(DEBUG_LAN, "Got no responses on apply from: %s", to_string().c_str());
		m_bOnline = false;
		m_appliance->set_online(false);
		if (!cloud)
			disconnect();
		return bResult;
	}

	if (vResponses.size() > 1)
		_log.Debug(DEBUG_LAN, "Got several responses on apply from: %s, %d", to_string().c_str(), (int)vResponses.size());
	m_bOnline = true;
	m_appliance->set_online(true);
	if (!m_appliance->process_response(vResponses.back()))
		return set_error(m_appliance->get_last_error_type(), m_appliance->get_last_error());
	sigStateChanged(this);
	return true;
}


/************************************************************************
 *									*
 *	Identification							*
 *									*
 *	v3 devices need a token/key pair. Without one the cloud is	*
 *	asked for the pair belonging to the udp id, trying both byte	*
 *	orders of the appliance id.					*
 *									*
 ************************************************************************/

/* private */ bool MideaLanDevice::get_valid_token(MideaCloud *cloud)
{
	uint64_t applianceId;
	if (!midea::lan::parse_appliance_id(m_identity.appliance_id, applianceId))
		return set_error(midea::error::type::VALIDATION, "Invalid appliance id " + m_identity.appliance_id);

	const bool bLittleEndian[2] = { true, false };
	for (const bool bLE : bLittleEndian)
	{
		std::string szUdpId = midea::lan::udp_id(applianceId, bLE);
		if (!cloud->get_token(szUdpId, m_szToken, m_szKey))
			return set_error(cloud->get_last_error_type(), cloud->get_last_error());
		if (authenticate())
		{
			_log.Debug(DEBUG_LAN, "Token valid for %s udp_id=%s", to_string().c_str(), szUdpId.c_str());
			return true;
		}
		_log.Debug(DEBUG_LAN, "Token check failed for udp_id=%s, %s", szUdpId.c_str(), m_szLastError.c_str());
		// token/key were not valid, forget them
		m_szToken.clear();
		m_szKey.clear();
	}
	return false;
}

bool MideaLanDevice::valid_token(MideaCloud *cloud)
{
	std::lock_guard<std::recursive_mutex> lock(m_mutex);
	if (m_szToken.empty() || m_szKey.empty())
	{
		if (!cloud)
			return set_error(midea::error::type::AUTHENTICATION, "Provide either token/key pair or cloud " + to_string());
		if (!get_valid_token(cloud))
		{
			if (m_eLastError == midea::error::type::AUTHENTICATION)
				return set_error(midea::error::type::AUTHENTICATION, "Unable to get valid token for " + midea::redact(m_identity.serial_number, 8));
			return false;
		}
		return true;
	}
	return authenticate();
}

/* private */ bool MideaLanDevice::check_is_supported(const bool bUseCloud)
{
	if (!is_supported_version() && !bUseCloud)
		return set_error(midea::error::type::UNSUPPORTED, "Appliance " + midea::redact(m_identity.serial_number, 8) + " protocol is not supported.");
	if (!MideaAppliance::supported(m_identity.type))
		return set_error(midea::error::type::UNSUPPORTED, "Unsupported appliance: " + dump());
	return true;
}

bool MideaLanDevice::identify(MideaCloud *cloud, const bool bUseCloud)
{
	std::lock_guard<std::recursive_mutex> lock(m_mutex);
	if (!check_is_supported(bUseCloud))
		return false;

	if ((m_identity.version >= 3) && !bUseCloud && !valid_token(cloud))
		return false;

	MideaCloud *relay = bUseCloud ? cloud : nullptr;
	for (int part = 0; part < 2; part++)
	{
		std::unique_ptr<MideaCommand> command = m_appliance->capabilities_command(part == 1);
		std::vector<std::vector<uint8_t> > vResponses;
		if (!status(*command, relay, vResponses))
			return false;
		if (vResponses.empty())
		{
			_log.Debug(DEBUG_LAN, "No response on device capabilities request%s", (part == 1) ? " (more)" : "");
			continue;
		}
		_log.Debug(DEBUG_PROTOCOL, "device capabilities %s response=%s", to_string().c_str(), midea::hex::encode(vResponses.back()).c_str());
		if (!m_appliance->process_capabilities(vResponses.back(), part))
			_log.Debug(DEBUG_LAN, "Ignoring capabilities of %s: %s", to_string().c_str(), m_appliance->get_last_error().c_str());
	}

	if (!refresh(relay))
		return false;
	_log.Debug(DEBUG_LAN, "Identified appliance: %s", dump().c_str());
	return true;
}

bool MideaLanDevice::is_identified(MideaCloud *cloud)
{
	if (identify(cloud))
		return true;
	_log.Debug(DEBUG_LAN, "Error identifying appliance %s", m_szLastError.c_str());
	return false;
}


/************************************************************************
 *									*
 *	State changes							*
 *									*
 ************************************************************************/

bool MideaLanDevice::set_state(const std::map<std::string, std::string> &mValues, MideaCloud *cloud)
{
	std::lock_guard<std::recursive_mutex> lock(m_mutex);
	for (const auto &value : mValues)
	{
		midea::property::result::value eResult = m_appliance->set_property(value.first, value.second);
		if (eResult == midea::property::result::OK)
			continue;
		if (eResult == midea::property::result::UNKNOWN_PROPERTY)
		{
			_log.Log(LOG_STATUS, "Unknown state attribute %s for %s", value.first.c_str(), to_string().c_str());
			continue;
		}
		return set_error(m_appliance->get_last_error_type(), m_appliance->get_last_error());
	}
	return apply(cloud);
}

void MideaLanDevice::update(const MideaLanDevice &other)
{
	std::lock_guard<std::recursive_mutex> lock(m_mutex);
	m_szToken = other.m_szToken;
	m_szKey = other.m_szKey;
	disconnect();
	m_iMaxRetries = other.m_iMaxRetries;
	m_iRetries = other.m_iRetries;
	m_identity.address = other.m_identity.address;
	m_identity.port = other.m_identity.port;
	m_identity.firmware_version = other.m_identity.firmware_version;
	m_identity.protocol_version = other.m_identity.protocol_version;
	m_identity.udp_version = other.m_identity.udp_version;
	m_identity.serial_number = other.m_identity.serial_number;
	m_identity.mac = other.m_identity.mac;
	m_identity.ssid = other.m_identity.ssid;
	m_appliance->set_serial_number(m_identity.serial_number);
}


/************************************************************************
 *									*
 *	Single appliance lookup						*
 *									*
 ************************************************************************/

namespace midea {
namespace lan {

void init_state_request(tStateRequest &request)
{
	request.address.clear();
	request.token.clear();
	request.key.clear();
	request.cloud = nullptr;
	request.use_cloud = false;
	request.appliance_id.clear();
	request.appliance_type = "a1";
	request.retries = MIDEA_DEFAULT_RETRIES;
	request.timeout = MIDEA_SOCKET_TIMEOUT_SECS;
	request.cloud_timeout = 0;
}

std::unique_ptr<MideaLanDevice> appliance_state(const tStateRequest &request, midea::error::type::value &eError, std::string &szError)
{
	eError = midea::error::type::NONE;
	szError.clear();
	std::unique_ptr<MideaLanDevice> device;

	if (!request.address.empty())
	{
		std::string szTarget = request.address + ":" + std::to_string(MIDEA_DISCOVERY_PORT);
		UdpSocket probe;
		std::vector<uint8_t> vReply;
		std::string szFrom;
		if (!probe.open(false, request.timeout) || !probe.send_to(request.address, MIDEA_DISCOVERY_PORT, std::vector<uint8_t>(DISCOVERY_MSG, DISCOVERY_MSG + DISCOVERY_MSG_SIZE)))
		{
			eError = midea::error::type::NETWORK;
			szError = "Could not connect to appliance " + szTarget + ": " + probe.get_last_error();
			return nullptr;
		}
		_log.Debug(DEBUG_DISCOVERY, "Sending to %s %s", midea::redact(szTarget, 5).c_str(), midea::hex::encode(DISCOVERY_MSG, DISCOVERY_MSG_SIZE).c_str());

		int numbytes = probe.receive_from(vReply, szFrom, 512);
		probe.close();
		if (numbytes <= 0)
		{
			eError = midea::error::type::NETWORK;
			szError = (numbytes == 0) ? "Timeout while connecting to appliance " + szTarget : "Could not connect to appliance " + szTarget;
			return nullptr;
		}
		_log.Debug(DEBUG_DISCOVERY, "Received from %s %s", midea::redact(szTarget, 5).c_str(), midea::hex::encode(vReply).c_str());

		MideaSecurity security;
		LanPacketCodec codec(security);
		tDeviceIdentity identity;
		if (!codec.parse_discovery_reply(vReply, identity))
		{
			eError = codec.get_last_error_type();
			szError = codec.get_last_error();
			return nullptr;
		}
		device.reset(new MideaLanDevice(identity, request.token, request.key));
		device->set_max_retries(request.retries);
		device->set_socket_timeout(request.timeout);
		_log.Debug(DEBUG_DISCOVERY, "Appliance %s", device->to_string().c_str());
	}
	else if (!request.appliance_id.empty())
	{
		if (!request.use_cloud || !request.cloud)
		{
			eError = midea::error::type::GENERIC;
			szError = "Missing cloud credentials";
			return nullptr;
		}
		device.reset(new MideaLanDevice(request.appliance_id, request.appliance_type));
	}
	else
	{
		eError = midea::error::type::GENERIC;
		szError = "Must provide either appliance id or network address";
		return nullptr;
	}

	if (request.cloud)
	{
		request.cloud->set_max_retries(request.retries);
		request.cloud->set_request_timeout(request.cloud_timeout ? request.cloud_timeout : request.timeout);
	}

	if (!device->identify(request.cloud, request.use_cloud))
	{
		eError = device->get_last_error_type();
		szError = device->get_last_error();
		return nullptr;
	}

	if (request.cloud)
	{
		std::vector<midea::cloud::tCloudAppliance> vAppliances;
		if (!request.cloud->list_appliances(vAppliances))
		{
			eError = request.cloud->get_last_error_type();
			szError = request.cloud->get_last_error();
			return nullptr;
		}
		for (const auto &details : vAppliances)
		{
			if (device->matches(details))
			{
				device->set_name(details.name);
				if (device->get_serial_number().empty())
					device->set_serial_number(details.sn);
				break;
			}
		}
	}
	return device;
}

}; // namespace lan
}; // namespace midea
