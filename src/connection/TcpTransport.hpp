/*
 * Copyright (c) 2024 Gordon Bos <gordon@bosvangennip.nl> All rights reserved.
 *
 * TCP and UDP sockets for local appliance access
 *
 *
 * Source code subject to GNU GENERAL PUBLIC LICENSE version 3
 */

#ifndef _MideaTcpTransport
#define _MideaTcpTransport

#include "LanTransport.hpp"
#include <netinet/in.h>


namespace connection {
  namespace socket {

	bool resolve_host(const std::string &hostname, struct sockaddr_in& serv_addr);

  }; // namespace socket
}; // namespace connection


class TcpTransport : public LanTransport
{
public:
	TcpTransport();
	~TcpTransport();

	bool connect(const std::string &szAddress, const int iPort, const int iTimeoutSecs) override;
	bool is_connected() override;
	void disconnect() override;
	bool send(const std::vector<uint8_t> &vData) override;
	int receive(std::vector<uint8_t> &vData, const size_t maxsize) override;
	std::string get_last_error() override;

private:
	bool set_error(const std::string &szError);

	int m_sockfd;
	std::string m_szAddress;
	std::string m_szLastError;
};


/*
 * Datagram socket for discovery probes. Broadcast mode allows sending
 * to subnet broadcast addresses.
 */
class UdpSocket
{
public:
	UdpSocket();
	~UdpSocket();

	bool open(const bool bBroadcast, const int iTimeoutSecs);
	void close();
	bool send_to(const std::string &szAddress, const int iPort, const std::vector<uint8_t> &vData);

	// 0 on timeout, -1 on error, otherwise number of bytes and the sender's address
	int receive_from(std::vector<uint8_t> &vData, std::string &szAddress, const size_t maxsize);

	std::string get_last_error();

private:
	bool set_error(const std::string &szError);

	int m_sockfd;
	std::string m_szLastError;
};

#endif
