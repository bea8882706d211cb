/*
 * Copyright (c) 2024 Gordon Bos <gordon@bosvangennip.nl> All rights reserved.
 *
 * V3 (8370) transport framing for Midea appliances
 *
 *
 * Source code subject to GNU GENERAL PUBLIC LICENSE version 3
 */

#ifndef _MideaFrame8370
#define _MideaFrame8370

#include <string>
#include <vector>
#include <cstdint>
#include "../crypto/Security.hpp"

#define FRAME_8370_HEADER_SIZE 6
#define FRAME_8370_SIGNATURE_SIZE 32
#define FRAME_8370_MAX_COUNT 0xFFF


/************************************************************************
 *									*
 *	Frame layout							*
 *									*
 *	83 70 <size BE16> 20 <pad<<4|type> <counter BE16> <body>	*
 *									*
 *	Encrypted types carry counter, body and random padding as	*
 *	AES-CBC ciphertext followed by SHA256(header + plaintext).	*
 *	The size field counts everything after the counter bytes	*
 *	plus padding and signature, so total length is size + 8.	*
 *									*
 ************************************************************************/

class Frame8370Codec
{
public:
	Frame8370Codec();
	~Frame8370Codec();

	std::string get_last_error();
	midea::error::type::value get_last_error_type();

	void set_tcp_key(const std::vector<uint8_t> &vTcpKey);
	void clear_tcp_key();
	bool has_tcp_key();

	bool encode(const std::vector<uint8_t> &vData, const midea::msgtype::value eMsgType, std::vector<uint8_t> &vFrame);
	bool decode(const std::vector<uint8_t> &vBuffer, std::vector<std::vector<uint8_t> > &vFrames, std::vector<uint8_t> &vLeftover);

	uint16_t get_request_count();
	uint16_t get_response_count();
	void set_request_count(const uint16_t count);

	static bool is_encrypted_type(const uint8_t msgtype);

private:
	bool decode_one(const uint8_t *data, const size_t size, std::vector<uint8_t> &vBody);
	bool set_error(const midea::error::type::value eType, const std::string &szError);

	MideaSecurity m_security;
	std::vector<uint8_t> m_vTcpKey;
	uint16_t m_iRequestCount;
	uint16_t m_iResponseCount;

	std::string m_szLastError;
	midea::error::type::value m_eLastError;
};


/*
 * Accumulates bytes read from the device and hands out complete frames
 */
class Frame8370Decoder
{
public:
	explicit Frame8370Decoder(Frame8370Codec &codec);

	// returns the number of completed frames or -1 on a malformed stream
	int feed(const std::vector<uint8_t> &vData, std::vector<std::vector<uint8_t> > &vFrames);
	size_t pending();
	void reset();

private:
	Frame8370Codec &m_codec;
	std::vector<uint8_t> m_vBuffer;
};

#endif
