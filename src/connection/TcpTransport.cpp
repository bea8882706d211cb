/*
 * Copyright (c) 2024 Gordon Bos <gordon@bosvangennip.nl> All rights reserved.
 *
 * TCP and UDP sockets for local appliance access
 *
 *
 * Source code subject to GNU GENERAL PUBLIC LICENSE version 3
 */

#include "TcpTransport.hpp"
#include "../common/messages.hpp"
#include <netdb.h>
#include <unistd.h>
#include <sys/socket.h>
#include <arpa/inet.h>
#include <cstring>
#include <cerrno>


namespace connection {
namespace socket {

bool resolve_host(const std::string &hostname, struct sockaddr_in& serv_addr)
{
	if (hostname.empty())
		return false;
	memset(&serv_addr, 0, sizeof(serv_addr));
	serv_addr.sin_family = AF_INET;
	if (((hostname[0] ^ 0x30) < 10) && (inet_pton(AF_INET, hostname.c_str(), &serv_addr.sin_addr) == 1))
		return true;

	struct addrinfo hints;
	memset(&hints, 0, sizeof(hints));
	hints.ai_family = AF_INET;
	struct addrinfo *addr;
	if (getaddrinfo(hostname.c_str(), "0", &hints, &addr) == 0)
	{
		memcpy(&serv_addr, addr->ai_addr, sizeof(sockaddr_in));
		freeaddrinfo(addr);
		return true;
	}
	return false;
}

void set_timeout(const int sockfd, const int iTimeoutSecs)
{
	struct timeval timeout;
	timeout.tv_sec = iTimeoutSecs;
	timeout.tv_usec = 0;
	setsockopt(sockfd, SOL_SOCKET, SO_RCVTIMEO, (const char*)&timeout, sizeof timeout);
	setsockopt(sockfd, SOL_SOCKET, SO_SNDTIMEO, (const char*)&timeout, sizeof timeout);
}

}; // namespace socket
}; // namespace connection


/************************************************************************
 *									*
 *	TCP stream							*
 *									*
 ************************************************************************/

TcpTransport::TcpTransport() : m_sockfd(-1)
{
}

TcpTransport::~TcpTransport()
{
	disconnect();
}

std::string TcpTransport::get_last_error()
{
	return m_szLastError;
}

/* private */ bool TcpTransport::set_error(const std::string &szError)
{
	m_szLastError = szError;
	return false;
}

bool TcpTransport::connect(const std::string &szAddress, const int iPort, const int iTimeoutSecs)
{
	disconnect();
	m_szAddress = szAddress;

	struct sockaddr_in serv_addr;
	if (!connection::socket::resolve_host(szAddress, serv_addr))
		return set_error("Unable to resolve " + szAddress);
	serv_addr.sin_port = htons(iPort);

	m_sockfd = ::socket(AF_INET, SOCK_STREAM, 0);
	if (m_sockfd < 0)
		return set_error(std::string("Unable to open socket: ") + strerror(errno));

	// SO_SNDTIMEO also bounds the connect
	connection::socket::set_timeout(m_sockfd, iTimeoutSecs);
	if (::connect(m_sockfd, (struct sockaddr*)&serv_addr, sizeof(serv_addr)) != 0)
	{
		set_error(std::string("Could not connect to ") + szAddress + ":" + std::to_string(iPort) + ": " + strerror(errno));
		disconnect();
		return false;
	}
	return true;
}

bool TcpTransport::is_connected()
{
	return (m_sockfd >= 0);
}

void TcpTransport::disconnect()
{
	if (m_sockfd >= 0)
		::close(m_sockfd);
	m_sockfd = -1;
}

bool TcpTransport::send(const std::vector<uint8_t> &vData)
{
	if (m_sockfd < 0)
		return set_error(midea::messages::socketNotOpen);

	size_t sent = 0;
	while (sent < vData.size())
	{
		ssize_t numbytes = ::send(m_sockfd, &vData[sent], vData.size() - sent, MSG_NOSIGNAL);
		if (numbytes < 0)
		{
			if (errno == EINTR)
				continue;
			return set_error(std::string("Error sending to ") + m_szAddress + ": " + strerror(errno));
		}
		sent += (size_t)numbytes;
	}
	return true;
}

int TcpTransport::receive(std::vector<uint8_t> &vData, const size_t maxsize)
{
	vData.clear();
	if (m_sockfd < 0)
	{
		set_error(midea::messages::socketNotOpen);
		return -1;
	}

	vData.resize(maxsize);
	ssize_t numbytes;
	do
	{
		numbytes = ::recv(m_sockfd, &vData[0], maxsize, 0);
	} while ((numbytes < 0) && (errno == EINTR));

	if (numbytes < 0)
	{
		vData.clear();
		if ((errno == EAGAIN) || (errno == EWOULDBLOCK))
		{
			set_error("timed out");
			return 0;
		}
		set_error(std::string("Error receiving from ") + m_szAddress + ": " + strerror(errno));
		return -1;
	}
	vData.resize((size_t)numbytes);
	if (numbytes == 0)
	{
		set_error("No results from " + m_szAddress);
		return -1;
	}
	return (int)numbytes;
}


/************************************************************************
 *									*
 *	UDP datagrams							*
 *									*
 ************************************************************************/

UdpSocket::UdpSocket() : m_sockfd(-1)
{
}

UdpSocket::~UdpSocket()
{
	close();
}

std::string UdpSocket::get_last_error()
{
	return m_szLastError;
}

/* private */ bool UdpSocket::set_error(const std::string &szError)
{
	m_szLastError = szError;
	return false;
}

bool UdpSocket::open(const bool bBroadcast, const int iTimeoutSecs)
{
	close();
	m_sockfd = ::socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
	if (m_sockfd < 0)
		return set_error(std::string("Unable to open socket: ") + strerror(errno));
	if (bBroadcast)
	{
		int enable = 1;
		if (setsockopt(m_sockfd, SOL_SOCKET, SO_BROADCAST, &enable, sizeof(enable)) != 0)
		{
			set_error(std::string("Unable to enable broadcast: ") + strerror(errno));
			close();
			return false;
		}
	}
	connection::socket::set_timeout(m_sockfd, iTimeoutSecs);
	return true;
}

void UdpSocket::close()
{
	if (m_sockfd >= 0)
		::close(m_sockfd);
	m_sockfd = -1;
}

bool UdpSocket::send_to(const std::string &szAddress, const int iPort, const std::vector<uint8_t> &vData)
{
	if (m_sockfd < 0)
		return set_error(midea::messages::socketNotOpen);
	struct sockaddr_in dest_addr;
	if (!connection::socket::resolve_host(szAddress, dest_addr))
		return set_error("Unable to resolve " + szAddress);
	dest_addr.sin_port = htons(iPort);
	if (::sendto(m_sockfd, vData.data(), vData.size(), 0, (struct sockaddr*)&dest_addr, sizeof(dest_addr)) < 0)
		return set_error(std::string("Unable to send to ") + szAddress + ": " + strerror(errno));
	return true;
}

int UdpSocket::receive_from(std::vector<uint8_t> &vData, std::string &szAddress, const size_t maxsize)
{
	vData.clear();
	szAddress.clear();
	if (m_sockfd < 0)
	{
		set_error(midea::messages::socketNotOpen);
		return -1;
	}

	struct sockaddr_in src_addr;
	socklen_t addrlen = sizeof(src_addr);
	vData.resize(maxsize);
	ssize_t numbytes = ::recvfrom(m_sockfd, &vData[0], maxsize, 0, (struct sockaddr*)&src_addr, &addrlen);
	if (numbytes < 0)
	{
		vData.clear();
		if ((errno == EAGAIN) || (errno == EWOULDBLOCK) || (errno == EINTR))
			return 0;
		set_error(std::string("Error receiving datagram: ") + strerror(errno));
		return -1;
	}
	vData.resize((size_t)numbytes);

	char szHost[INET_ADDRSTRLEN];
	if (inet_ntop(AF_INET, &src_addr.sin_addr, szHost, sizeof(szHost)) != nullptr)
		szAddress = szHost;
	return (int)numbytes;
}
