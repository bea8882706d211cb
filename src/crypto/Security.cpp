/*
 * Copyright (c) 2024 Gordon Bos <gordon@bosvangennip.nl> All rights reserved.
 *
 * Cryptographic services for the Midea LAN and cloud protocols
 *
 *
 * Source code subject to GNU GENERAL PUBLIC LICENSE version 3
 */

#include "Security.hpp"
#include "../common/hexstring.hpp"
#include "../common/messages.hpp"
#include <cstring>

#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/err.h>

#define AES_BLOCKSIZE 16


MideaSecurity::MideaSecurity(const std::string &szAppKey, const std::string &szSignKey, const std::string &szIotKey, const std::string &szHmacKey) :
	m_szAppKey(szAppKey),
	m_szSignKey(szSignKey),
	m_szIotKey(szIotKey),
	m_szHmacKey(szHmacKey),
	m_eLastError(midea::error::type::NONE)
{
	m_vEncKey = md5(midea::bytes::from_string(m_szSignKey));
}

MideaSecurity::~MideaSecurity()
{
}


std::string MideaSecurity::get_last_error()
{
	return m_szLastError;
}

midea::error::type::value MideaSecurity::get_last_error_type()
{
	return m_eLastError;
}

/* private */ bool MideaSecurity::set_error(const midea::error::type::value eType, const std::string &szError)
{
	m_eLastError = eType;
	m_szLastError = szError;
	return false;
}


/************************************************************************
 *									*
 *	Digest helpers							*
 *									*
 ************************************************************************/

static std::vector<uint8_t> evp_digest(const EVP_MD *md, const uint8_t *data, const size_t size)
{
	unsigned char digest[EVP_MAX_MD_SIZE];
	unsigned int digestlen = 0;
	std::vector<uint8_t> vResult;
	if (EVP_Digest(data, size, digest, &digestlen, md, nullptr) != 1)
		return vResult;
	vResult.insert(vResult.end(), digest, digest + digestlen);
	return vResult;
}

std::vector<uint8_t> MideaSecurity::sha256(const std::vector<uint8_t> &vData)
{
	return evp_digest(EVP_sha256(), vData.data(), vData.size());
}

std::vector<uint8_t> MideaSecurity::md5(const std::vector<uint8_t> &vData)
{
	return evp_digest(EVP_md5(), vData.data(), vData.size());
}

std::string MideaSecurity::sha256_hex(const std::string &szData)
{
	return midea::hex::encode(evp_digest(EVP_sha256(), (const uint8_t*)szData.c_str(), szData.size()));
}

std::string MideaSecurity::md5_hex(const std::string &szData)
{
	return midea::hex::encode(evp_digest(EVP_md5(), (const uint8_t*)szData.c_str(), szData.size()));
}

std::string MideaSecurity::hmac_sha256_hex(const std::string &szKey, const std::string &szData)
{
	unsigned char digest[EVP_MAX_MD_SIZE];
	unsigned int digestlen = 0;
	if (HMAC(EVP_sha256(), szKey.c_str(), (int)szKey.size(), (const unsigned char*)szData.c_str(), szData.size(), digest, &digestlen) == nullptr)
		return "";
	return midea::hex::encode(digest, digestlen);
}


/************************************************************************
 *									*
 *	Block ciphers							*
 *									*
 ************************************************************************/

/* private */ bool MideaSecurity::cipher(const void *evp_cipher, const bool bEncrypt, const bool bPadding, const uint8_t *key, const std::vector<uint8_t> &vInput, std::vector<uint8_t> &vOutput)
{
	vOutput.clear();
	const EVP_CIPHER *ciphertype = (const EVP_CIPHER*)evp_cipher;
	if (ciphertype == nullptr)
		return set_error(midea::error::type::GENERIC, midea::messages::cryptoFailure);

	unsigned char iv[AES_BLOCKSIZE];
	memset(iv, 0, sizeof(iv));

	std::vector<uint8_t> vBuffer(vInput.size() + AES_BLOCKSIZE);
	int outlen = 0;
	int finallen = 0;

	EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
	if (ctx == nullptr)
		return set_error(midea::error::type::GENERIC, midea::messages::cryptoFailure);

	bool bOK = (EVP_CipherInit_ex(ctx, ciphertype, nullptr, key, iv, bEncrypt ? 1 : 0) == 1);
	if (bOK)
		bOK = (EVP_CIPHER_CTX_set_padding(ctx, bPadding ? 1 : 0) == 1);
	if (bOK && !vInput.empty())
		bOK = (EVP_CipherUpdate(ctx, vBuffer.data(), &outlen, vInput.data(), (int)vInput.size()) == 1);
	if (bOK)
		bOK = (EVP_CipherFinal_ex(ctx, vBuffer.data() + outlen, &finallen) == 1);
	EVP_CIPHER_CTX_free(ctx);

	if (!bOK)
	{
		ERR_clear_error();
		return set_error(midea::error::type::PROTOCOL, midea::messages::cryptoFailure);
	}

	vBuffer.resize(outlen + finallen);
	vOutput.swap(vBuffer);
	return true;
}

bool MideaSecurity::aes_encrypt(const std::vector<uint8_t> &vPlain, std::vector<uint8_t> &vEncrypted)
{
	return cipher(EVP_aes_128_ecb(), true, true, m_vEncKey.data(), vPlain, vEncrypted);
}

bool MideaSecurity::aes_decrypt(const std::vector<uint8_t> &vEncrypted, std::vector<uint8_t> &vPlain)
{
	return cipher(EVP_aes_128_ecb(), false, true, m_vEncKey.data(), vEncrypted, vPlain);
}

static const EVP_CIPHER* cbc_for_key(const size_t keylen)
{
	if (keylen == 16)
		return EVP_aes_128_cbc();
	if (keylen == 24)
		return EVP_aes_192_cbc();
	if (keylen == 32)
		return EVP_aes_256_cbc();
	return nullptr;
}

bool MideaSecurity::aes_cbc_encrypt(const std::vector<uint8_t> &vPlain, const std::vector<uint8_t> &vKey, std::vector<uint8_t> &vEncrypted)
{
	return cipher(cbc_for_key(vKey.size()), true, false, vKey.data(), vPlain, vEncrypted);
}

bool MideaSecurity::aes_cbc_decrypt(const std::vector<uint8_t> &vEncrypted, const std::vector<uint8_t> &vKey, std::vector<uint8_t> &vPlain)
{
	return cipher(cbc_for_key(vKey.size()), false, false, vKey.data(), vEncrypted, vPlain);
}

std::vector<uint8_t> MideaSecurity::md5fingerprint(const std::vector<uint8_t> &vPacket)
{
	std::vector<uint8_t> vData(vPacket);
	vData.insert(vData.end(), m_szSignKey.begin(), m_szSignKey.end());
	return md5(vData);
}


/************************************************************************
 *									*
 *	LAN session key							*
 *									*
 ************************************************************************/

bool MideaSecurity::tcp_key(const std::vector<uint8_t> &vResponse, const std::vector<uint8_t> &vKey, std::vector<uint8_t> &vTcpKey)
{
	vTcpKey.clear();
	if (midea::bytes::to_string(vResponse) == "ERROR")
		return set_error(midea::error::type::AUTHENTICATION, midea::messages::handshakeErrorPacket);
	if (vResponse.size() != 64)
		return set_error(midea::error::type::AUTHENTICATION, std::string("Packet length error: ") + std::to_string(vResponse.size()) + " instead of 64");
	if (vKey.empty())
		return set_error(midea::error::type::AUTHENTICATION, midea::messages::missingTokenKey);

	std::vector<uint8_t> vPayload(vResponse.begin(), vResponse.begin() + 32);
	std::vector<uint8_t> vSign(vResponse.begin() + 32, vResponse.end());
	std::vector<uint8_t> vPlain;
	if (!aes_cbc_decrypt(vPayload, vKey, vPlain))
		return set_error(midea::error::type::AUTHENTICATION, m_szLastError);
	if (sha256(vPlain) != vSign)
		return set_error(midea::error::type::AUTHENTICATION, midea::messages::handshakeSignatureMismatch);

	vTcpKey.resize(vPlain.size());
	for (size_t i = 0; i < vPlain.size(); i++)
		vTcpKey[i] = vPlain[i] ^ vKey[i % vKey.size()];
	return true;
}


/************************************************************************
 *									*
 *	Cloud request signing and credentials				*
 *									*
 ************************************************************************/

/*
 * Signature over the url path, the sorted and unescaped query string and the app key
 */
std::string MideaSecurity::sign(const std::string &szUrl, const std::map<std::string, std::string> &mPayload)
{
	std::string szPath = szUrl;
	size_t pos = szPath.find("://");
	if (pos != std::string::npos)
	{
		pos = szPath.find('/', pos + 3);
		szPath = (pos == std::string::npos) ? "/" : szPath.substr(pos);
	}
	pos = szPath.find_first_of("?#");
	if (pos != std::string::npos)
		szPath = szPath.substr(0, pos);

	std::string szQuery;
	for (const auto &itt : mPayload)
	{
		if (!szQuery.empty())
			szQuery.append("&");
		szQuery.append(itt.first);
		szQuery.append("=");
		szQuery.append(itt.second);
	}
	return sha256_hex(szPath + szQuery + m_szAppKey);
}

std::string MideaSecurity::sign_proxied(const std::map<std::string, std::string> &mQuery, const std::string &szData, const std::string &szRandom)
{
	std::string szMessage = m_szIotKey;
	szMessage.append(szData);
	for (const auto &itt : mQuery)
	{
		szMessage.append(itt.first);
		szMessage.append(itt.second);
	}
	szMessage.append(szRandom);
	return hmac_sha256_hex(m_szHmacKey, szMessage);
}

std::string MideaSecurity::encrypt_password(const std::string &szLoginId, const std::string &szPassword)
{
	return sha256_hex(szLoginId + sha256_hex(szPassword) + m_szAppKey);
}

std::string MideaSecurity::encrypt_iam_password(const std::string &szLoginId, const std::string &szPassword)
{
	return sha256_hex(szLoginId + md5_hex(md5_hex(szPassword)) + m_szAppKey);
}


/************************************************************************
 *									*
 *	Cloud data key							*
 *									*
 ************************************************************************/

std::string MideaSecurity::md5appkey()
{
	return md5_hex(m_szAppKey).substr(0, 16);
}

bool MideaSecurity::set_access_token(const std::string &szAccessToken)
{
	std::string szDataKey;
	if (!aes_decrypt_string(szAccessToken, szDataKey, md5appkey()))
		return false;
	m_szAccessToken = szAccessToken;
	m_szDataKey = szDataKey;
	return true;
}

std::string MideaSecurity::get_access_token()
{
	return m_szAccessToken;
}

std::string MideaSecurity::get_data_key()
{
	return m_szDataKey;
}

bool MideaSecurity::aes_encrypt_string(const std::string &szData, std::string &szEncryptedHex, const std::string &szKey)
{
	szEncryptedHex.clear();
	std::string szUseKey = szKey.empty() ? m_szDataKey : szKey;
	if (szUseKey.size() != 16)
		return set_error(midea::error::type::GENERIC, midea::messages::missingDataKey);

	std::vector<uint8_t> vEncrypted;
	if (!cipher(EVP_aes_128_ecb(), true, true, (const uint8_t*)szUseKey.c_str(), midea::bytes::from_string(szData), vEncrypted))
		return false;
	szEncryptedHex = midea::hex::encode(vEncrypted);
	return true;
}

bool MideaSecurity::aes_decrypt_string(const std::string &szEncryptedHex, std::string &szData, const std::string &szKey)
{
	szData.clear();
	std::string szUseKey = szKey.empty() ? m_szDataKey : szKey;
	if (szUseKey.size() != 16)
		return set_error(midea::error::type::GENERIC, midea::messages::missingDataKey);

	std::vector<uint8_t> vEncrypted;
	if (!midea::hex::decode(szEncryptedHex, vEncrypted))
		return set_error(midea::error::type::PROTOCOL, midea::messages::invalidHex);

	std::vector<uint8_t> vPlain;
	if (!cipher(EVP_aes_128_ecb(), false, true, (const uint8_t*)szUseKey.c_str(), vEncrypted, vPlain))
		return false;
	szData = midea::bytes::to_string(vPlain);
	return true;
}
