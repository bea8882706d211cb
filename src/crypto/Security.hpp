/*
 * Copyright (c) 2024 Gordon Bos <gordon@bosvangennip.nl> All rights reserved.
 *
 * Cryptographic services for the Midea LAN and cloud protocols
 *
 *
 * Source code subject to GNU GENERAL PUBLIC LICENSE version 3
 */

#ifndef _MideaSecurity
#define _MideaSecurity

#include <string>
#include <vector>
#include <map>
#include <cstdint>
#include "../common/definitions.hpp"
#include "../common/errors.hpp"


class MideaSecurity
{
public:
/************************************************************************
 *									*
 *	Class construct							*
 *									*
 *	The application key selects the cloud signature and password	*
 *	hashes. The sign key is the static secret from which the	*
 *	legacy AES-ECB key is derived.					*
 *									*
 ************************************************************************/

	MideaSecurity(const std::string &szAppKey = midea::DEFAULT_APPKEY, const std::string &szSignKey = midea::DEFAULT_SIGNKEY, const std::string &szIotKey = midea::DEFAULT_IOTKEY, const std::string &szHmacKey = midea::DEFAULT_HMACKEY);
	~MideaSecurity();


/************************************************************************
 *									*
 *	Debug information and errors 					*
 *									*
 ************************************************************************/

	std::string get_last_error();
	midea::error::type::value get_last_error_type();


/************************************************************************
 *									*
 *	Block ciphers							*
 *									*
 *	aes_encrypt/aes_decrypt use AES-128-ECB with PKCS7 padding and	*
 *	the key MD5(sign key). The CBC variants use a zero IV, do not	*
 *	pad and select AES-128 or AES-256 from the key length.		*
 *									*
 ************************************************************************/

	bool aes_encrypt(const std::vector<uint8_t> &vPlain, std::vector<uint8_t> &vEncrypted);
	bool aes_decrypt(const std::vector<uint8_t> &vEncrypted, std::vector<uint8_t> &vPlain);
	bool aes_cbc_encrypt(const std::vector<uint8_t> &vPlain, const std::vector<uint8_t> &vKey, std::vector<uint8_t> &vEncrypted);
	bool aes_cbc_decrypt(const std::vector<uint8_t> &vEncrypted, const std::vector<uint8_t> &vKey, std::vector<uint8_t> &vPlain);

	std::vector<uint8_t> md5fingerprint(const std::vector<uint8_t> &vPacket);


/************************************************************************
 *									*
 *	LAN session key							*
 *									*
 *	tcp_key() validates the 64 byte handshake reply against the	*
 *	device key and returns the session key in vTcpKey.		*
 *									*
 ************************************************************************/

	bool tcp_key(const std::vector<uint8_t> &vResponse, const std::vector<uint8_t> &vKey, std::vector<uint8_t> &vTcpKey);


/************************************************************************
 *									*
 *	Cloud request signing and credentials				*
 *									*
 ************************************************************************/

	std::string sign(const std::string &szUrl, const std::map<std::string, std::string> &mPayload);
	std::string sign_proxied(const std::map<std::string, std::string> &mQuery, const std::string &szData, const std::string &szRandom);
	std::string encrypt_password(const std::string &szLoginId, const std::string &szPassword);
	std::string encrypt_iam_password(const std::string &szLoginId, const std::string &szPassword);


/************************************************************************
 *									*
 *	Cloud data key							*
 *									*
 *	The access token returned by the login is decrypted with the	*
 *	MD5 derived application key. The result is the data key used	*
 *	for the string encryption functions when no key is given.	*
 *									*
 ************************************************************************/

	bool set_access_token(const std::string &szAccessToken);
	std::string get_access_token();
	std::string get_data_key();
	std::string md5appkey();

	bool aes_encrypt_string(const std::string &szData, std::string &szEncryptedHex, const std::string &szKey = "");
	bool aes_decrypt_string(const std::string &szEncryptedHex, std::string &szData, const std::string &szKey = "");


/************************************************************************
 *									*
 *	Digest helpers							*
 *									*
 ************************************************************************/

	static std::vector<uint8_t> sha256(const std::vector<uint8_t> &vData);
	static std::vector<uint8_t> md5(const std::vector<uint8_t> &vData);
	static std::string sha256_hex(const std::string &szData);
	static std::string md5_hex(const std::string &szData);
	static std::string hmac_sha256_hex(const std::string &szKey, const std::string &szData);


private:
	bool cipher(const void *evp_cipher, const bool bEncrypt, const bool bPadding, const uint8_t *key, const std::vector<uint8_t> &vInput, std::vector<uint8_t> &vOutput);
	bool set_error(const midea::error::type::value eType, const std::string &szError);

	std::string m_szAppKey;
	std::string m_szSignKey;
	std::string m_szIotKey;
	std::string m_szHmacKey;
	std::vector<uint8_t> m_vEncKey;
	std::string m_szAccessToken;
	std::string m_szDataKey;

	std::string m_szLastError;
	midea::error::type::value m_eLastError;
};

#endif
