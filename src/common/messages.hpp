/*
 * Copyright (c) 2024 Gordon Bos <gordon@bosvangennip.nl> All rights reserved.
 *
 * Message strings for the Midea appliance library
 *
 *
 * Source code subject to GNU GENERAL PUBLIC LICENSE version 3
 */

#pragma once
#include <string>


namespace midea {

  namespace messages {

    static const std::string invalidResponse = "Failed to parse server response as JSON";
    static const std::string missingDataKey = "Missing data key";
    static const std::string missingTcpKey = "Missing TCP key for local network access";
    static const std::string missingTokenKey = "Missing token/key pair";
    static const std::string notV3Message = "Message was not a v3 (8370) message";
    static const std::string badFlagByte = "Byte 4 was not 0x20";
    static const std::string signatureMismatch = "Signature does not match payload";
    static const std::string handshakeErrorPacket = "Authentication failed - error packet";
    static const std::string handshakeSignatureMismatch = "Packet signature mismatch";
    static const std::string cryptoFailure = "OpenSSL cipher operation failed";
    static const std::string invalidHex = "Invalid hexadecimal string";
    static const std::string unknownResponseFormat = "Unknown response format";
    static const std::string socketNotOpen = "Socket not open";
    static const std::string emptyReply = "empty reply";

  }; // namespace messages

}; // namespace midea
