/*
 * Copyright (c) 2024 Gordon Bos <gordon@bosvangennip.nl> All rights reserved.
 *
 * V3 (8370) transport framing for Midea appliances
 *
 *
 * Source code subject to GNU GENERAL PUBLIC LICENSE version 3
 */

#include "Frame8370.hpp"
#include "../common/messages.hpp"
#include "../common/hexstring.hpp"
#include "../common/Logger.hpp"
#include <algorithm>
#include <openssl/rand.h>


Frame8370Codec::Frame8370Codec() :
	m_iRequestCount(0),
	m_iResponseCount(0),
	m_eLastError(midea::error::type::NONE)
{
}

Frame8370Codec::~Frame8370Codec()
{
	clear_tcp_key();
}


std::string Frame8370Codec::get_last_error()
{
	return m_szLastError;
}

midea::error::type::value Frame8370Codec::get_last_error_type()
{
	return m_eLastError;
}

/* private */ bool Frame8370Codec::set_error(const midea::error::type::value eType, const std::string &szError)
{
	m_eLastError = eType;
	m_szLastError = szError;
	return false;
}


void Frame8370Codec::set_tcp_key(const std::vector<uint8_t> &vTcpKey)
{
	m_vTcpKey = vTcpKey;
	m_iRequestCount = 0;
	m_iResponseCount = 0;
}

void Frame8370Codec::clear_tcp_key()
{
	std::fill(m_vTcpKey.begin(), m_vTcpKey.end(), 0);
	m_vTcpKey.clear();
}

bool Frame8370Codec::has_tcp_key()
{
	return !m_vTcpKey.empty();
}

uint16_t Frame8370Codec::get_request_count()
{
	return m_iRequestCount;
}

uint16_t Frame8370Codec::get_response_count()
{
	return m_iResponseCount;
}

void Frame8370Codec::set_request_count(const uint16_t count)
{
	m_iRequestCount = count;
}

bool Frame8370Codec::is_encrypted_type(const uint8_t msgtype)
{
	return ((msgtype == midea::msgtype::ENCRYPTED_REQUEST) || (msgtype == midea::msgtype::ENCRYPTED_RESPONSE));
}


/************************************************************************
 *									*
 *	Encoder								*
 *									*
 ************************************************************************/

bool Frame8370Codec::encode(const std::vector<uint8_t> &vData, const midea::msgtype::value eMsgType, std::vector<uint8_t> &vFrame)
{
	vFrame.clear();
	bool bEncrypted = is_encrypted_type(eMsgType);
	if (bEncrypted && m_vTcpKey.empty())
		return set_error(midea::error::type::PROTOCOL, midea::messages::missingTcpKey);

	std::vector<uint8_t> vBody(vData);
	size_t size = vBody.size();
	uint8_t pad = 0;
	if (bEncrypted)
	{
		if (((size + 2) % 16) != 0)
		{
			pad = (uint8_t)(16 - ((size + 2) & 0x0F));
			std::vector<uint8_t> vPadding(pad);
			if (RAND_bytes(vPadding.data(), pad) != 1)
				return set_error(midea::error::type::GENERIC, midea::messages::cryptoFailure);
			vBody.insert(vBody.end(), vPadding.begin(), vPadding.end());
		}
		size += pad + FRAME_8370_SIGNATURE_SIZE;
	}

	uint8_t header[FRAME_8370_HEADER_SIZE];
	header[0] = 0x83;
	header[1] = 0x70;
	midea::bytes::to_be(size, &header[2], 2);
	header[4] = 0x20;
	header[5] = (uint8_t)((pad << 4) | eMsgType);

	if (m_iRequestCount >= FRAME_8370_MAX_COUNT)
		m_iRequestCount = 0;
	uint8_t counter[2];
	midea::bytes::to_be(m_iRequestCount, counter, 2);
	m_iRequestCount++;
	vBody.insert(vBody.begin(), counter, counter + 2);

	vFrame.insert(vFrame.end(), header, header + FRAME_8370_HEADER_SIZE);
	if (!bEncrypted)
	{
		vFrame.insert(vFrame.end(), vBody.begin(), vBody.end());
		return true;
	}

	std::vector<uint8_t> vSigned(vFrame);
	vSigned.insert(vSigned.end(), vBody.begin(), vBody.end());
	std::vector<uint8_t> vSign = MideaSecurity::sha256(vSigned);

	std::vector<uint8_t> vEncrypted;
	if (!m_security.aes_cbc_encrypt(vBody, m_vTcpKey, vEncrypted))
	{
		vFrame.clear();
		return set_error(midea::error::type::PROTOCOL, m_security.get_last_error());
	}
	vFrame.insert(vFrame.end(), vEncrypted.begin(), vEncrypted.end());
	vFrame.insert(vFrame.end(), vSign.begin(), vSign.end());
	return true;
}


/************************************************************************
 *									*
 *	Decoder								*
 *									*
 *	decode() consumes every complete frame in vBuffer. A trailing	*
 *	partial frame is returned in vLeftover. Bad magic, a bad flag	*
 *	byte or a signature mismatch fail the whole call.		*
 *									*
 ************************************************************************/

bool Frame8370Codec::decode(const std::vector<uint8_t> &vBuffer, std::vector<std::vector<uint8_t> > &vFrames, std::vector<uint8_t> &vLeftover)
{
	vFrames.clear();
	vLeftover.clear();

	size_t offset = 0;
	while (offset < vBuffer.size())
	{
		size_t remaining = vBuffer.size() - offset;
		const uint8_t *data = &vBuffer[offset];
		if (remaining < FRAME_8370_HEADER_SIZE)
			break;
		if ((data[0] != 0x83) || (data[1] != 0x70))
		{
			vFrames.clear();
			return set_error(midea::error::type::PROTOCOL, midea::messages::notV3Message);
		}
		size_t size = (((size_t)data[2] << 8) | data[3]) + 8;
		if (remaining < size)
			break;

		std::vector<uint8_t> vBody;
		if (!decode_one(data, size, vBody))
		{
			vFrames.clear();
			return false;
		}
		vFrames.push_back(vBody);
		offset += size;
	}

	if (offset < vBuffer.size())
		vLeftover.assign(vBuffer.begin() + offset, vBuffer.end());
	return true;
}

/* private */ bool Frame8370Codec::decode_one(const uint8_t *data, const size_t size, std::vector<uint8_t> &vBody)
{
	if (data[4] != 0x20)
		return set_error(midea::error::type::PROTOCOL, midea::messages::badFlagByte);

	uint8_t pad = data[5] >> 4;
	uint8_t msgtype = data[5] & 0x0F;
	std::vector<uint8_t> vHeader(data, data + FRAME_8370_HEADER_SIZE);
	std::vector<uint8_t> vPayload(data + FRAME_8370_HEADER_SIZE, data + size);

	if (is_encrypted_type(msgtype))
	{
		if (m_vTcpKey.empty())
			return set_error(midea::error::type::PROTOCOL, midea::messages::missingTcpKey);
		if (vPayload.size() < FRAME_8370_SIGNATURE_SIZE)
			return set_error(midea::error::type::PROTOCOL, midea::messages::signatureMismatch);

		std::vector<uint8_t> vSign(vPayload.end() - FRAME_8370_SIGNATURE_SIZE, vPayload.end());
		vPayload.resize(vPayload.size() - FRAME_8370_SIGNATURE_SIZE);
		std::vector<uint8_t> vPlain;
		if (!m_security.aes_cbc_decrypt(vPayload, m_vTcpKey, vPlain))
			return set_error(midea::error::type::PROTOCOL, m_security.get_last_error());

		std::vector<uint8_t> vSigned(vHeader);
		vSigned.insert(vSigned.end(), vPlain.begin(), vPlain.end());
		if (MideaSecurity::sha256(vSigned) != vSign)
			return set_error(midea::error::type::PROTOCOL, midea::messages::signatureMismatch);

		if (pad > vPlain.size())
			return set_error(midea::error::type::PROTOCOL, midea::messages::signatureMismatch);
		vPlain.resize(vPlain.size() - pad);
		vPayload.swap(vPlain);
	}

	if (vPayload.size() < 2)
		return set_error(midea::error::type::PROTOCOL, midea::messages::notV3Message);

	m_iResponseCount = (uint16_t)((vPayload[0] << 8) | vPayload[1]);
	vBody.assign(vPayload.begin() + 2, vPayload.end());
	return true;
}


/************************************************************************
 *									*
 *	Incremental decoder						*
 *									*
 ************************************************************************/

Frame8370Decoder::Frame8370Decoder(Frame8370Codec &codec) :
	m_codec(codec)
{
}

int Frame8370Decoder::feed(const std::vector<uint8_t> &vData, std::vector<std::vector<uint8_t> > &vFrames)
{
	m_vBuffer.insert(m_vBuffer.end(), vData.begin(), vData.end());
	std::vector<uint8_t> vLeftover;
	if (!m_codec.decode(m_vBuffer, vFrames, vLeftover))
	{
		_log.Debug(DEBUG_PROTOCOL, "8370 decoder dropped %d bytes: %s", (int)m_vBuffer.size(), m_codec.get_last_error().c_str());
		m_vBuffer.clear();
		return -1;
	}
	m_vBuffer.swap(vLeftover);
	return (int)vFrames.size();
}

size_t Frame8370Decoder::pending()
{
	return m_vBuffer.size();
}

void Frame8370Decoder::reset()
{
	m_vBuffer.clear();
}
