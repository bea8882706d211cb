/*
 * Copyright (c) 2024 Gordon Bos <gordon@bosvangennip.nl> All rights reserved.
 *
 * Logging facility for the Midea appliance library
 *
 *
 * Source code subject to GNU GENERAL PUBLIC LICENSE version 3
 */

#include "Logger.hpp"
#include <cstdarg>
#include <cstdio>
#include <chrono>
#include <iostream>
#include <sstream>

#define MAX_LOG_LINE_LENGTH 2048
#define DEFAULT_BACKLOG_SIZE 100

CLogger _log;


namespace {

std::string log_timestamp()
{
	auto now = std::chrono::system_clock::now();
	time_t tnow = std::chrono::system_clock::to_time_t(now);
	int millis = (int)(std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000);
	struct tm ltime;
	localtime_r(&tnow, &ltime);
	char szDate[32];
	snprintf(szDate, sizeof(szDate), "%04d-%02d-%02d %02d:%02d:%02d.%03d", ltime.tm_year + 1900, ltime.tm_mon + 1, ltime.tm_mday, ltime.tm_hour, ltime.tm_min, ltime.tm_sec, millis);
	return std::string(szDate);
}

}; // namespace


CLogger::CLogger() :
	m_iBacklogSize(DEFAULT_BACKLOG_SIZE),
	m_iLogFlags(LOG_NORM | LOG_STATUS | LOG_ERROR),
	m_iDebugFlags(0),
	m_bVerbose(false)
{
}

CLogger::~CLogger()
{
	if (m_outputfile.is_open())
		m_outputfile.close();
}


/************************************************************************
 *									*
 * Configuration							*
 *									*
 ************************************************************************/

void CLogger::SetLogFlags(const uint32_t iFlags)
{
	std::lock_guard<std::mutex> l(m_mutex);
	m_iLogFlags = iFlags;
}

void CLogger::SetDebugFlags(const uint32_t iFlags)
{
	std::lock_guard<std::mutex> l(m_mutex);
	m_iDebugFlags = iFlags;
	if (m_iDebugFlags)
		m_iLogFlags |= LOG_DEBUG_INT;
	else
		m_iLogFlags &= ~LOG_DEBUG_INT;
}

/*
 * Accepts a comma separated list such as "normal,status,error" or "all"
 */
bool CLogger::SetLogFlags(const std::string &szFlags)
{
	uint32_t iFlags = 0;
	std::stringstream ss(szFlags);
	std::string szFlag;
	while (std::getline(ss, szFlag, ','))
	{
		if (szFlag.empty())
			continue;
		if (szFlag == "all")
			iFlags |= LOG_ALL;
		else if ((szFlag == "normal") || (szFlag == "info"))
			iFlags |= LOG_NORM;
		else if (szFlag == "status")
			iFlags |= LOG_STATUS;
		else if ((szFlag == "error") || (szFlag == "warning"))
			iFlags |= LOG_ERROR;
		else if (szFlag == "debug")
			iFlags |= LOG_DEBUG_INT;
		else
			return false;
	}
	SetLogFlags(iFlags);
	return true;
}

bool CLogger::SetDebugFlags(const std::string &szFlags)
{
	uint32_t iFlags = 0;
	std::stringstream ss(szFlags);
	std::string szFlag;
	while (std::getline(ss, szFlag, ','))
	{
		if (szFlag.empty())
			continue;
		if (szFlag == "all")
			iFlags |= DEBUG_ALL;
		else if (szFlag == "normal")
			iFlags |= DEBUG_NORM;
		else if (szFlag == "lan")
			iFlags |= DEBUG_LAN;
		else if (szFlag == "cloud")
			iFlags |= DEBUG_CLOUD;
		else if (szFlag == "discovery")
			iFlags |= DEBUG_DISCOVERY;
		else if (szFlag == "protocol")
			iFlags |= DEBUG_PROTOCOL;
		else
			return false;
	}
	SetDebugFlags(iFlags);
	return true;
}

bool CLogger::IsLogLevelEnabled(const _eLogLevel level)
{
	return ((m_iLogFlags & level) != 0);
}

bool CLogger::IsDebugLevelEnabled(const _eDebugLevel level)
{
	if (!(m_iLogFlags & LOG_DEBUG_INT))
		return false;
	return ((m_iDebugFlags & level) != 0);
}

bool CLogger::SetOutputFile(const std::string &szFilename)
{
	std::lock_guard<std::mutex> l(m_mutex);
	if (m_outputfile.is_open())
		m_outputfile.close();
	if (szFilename.empty())
		return true;
	m_outputfile.open(szFilename.c_str(), std::ios::out | std::ios::app);
	return m_outputfile.is_open();
}

void CLogger::SetVerbose(const bool bVerbose)
{
	m_bVerbose = bVerbose;
}

void CLogger::SetBacklogSize(const size_t iSize)
{
	std::lock_guard<std::mutex> l(m_mutex);
	m_iBacklogSize = iSize;
	while (m_lastlog.size() > m_iBacklogSize)
		m_lastlog.pop_front();
}


/************************************************************************
 *									*
 * Writers								*
 *									*
 ************************************************************************/

void CLogger::Log(const _eLogLevel level, const char *logline, ...)
{
	if (!IsLogLevelEnabled(level))
		return;

	va_list argList;
	char cbuffer[MAX_LOG_LINE_LENGTH];
	va_start(argList, logline);
	vsnprintf(cbuffer, sizeof(cbuffer), logline, argList);
	va_end(argList);

	WriteLine(level, cbuffer);
}

void CLogger::Debug(const _eDebugLevel level, const char *logline, ...)
{
	if (!IsDebugLevelEnabled(level))
		return;

	va_list argList;
	char cbuffer[MAX_LOG_LINE_LENGTH];
	va_start(argList, logline);
	vsnprintf(cbuffer, sizeof(cbuffer), logline, argList);
	va_end(argList);

	WriteLine(LOG_DEBUG_INT, cbuffer);
}

/* private */ void CLogger::WriteLine(const _eLogLevel level, const char *cbuffer)
{
	std::string szMessage;
	if (level == LOG_ERROR)
		szMessage = "Error: ";
	else if (level == LOG_DEBUG_INT)
		szMessage = "Debug: ";
	szMessage.append(cbuffer);

	std::string szLine = log_timestamp();
	szLine.append("  ");
	szLine.append(szMessage);

	std::lock_guard<std::mutex> l(m_mutex);

	tLogLineStruct lline;
	lline.logtime = time(nullptr);
	lline.level = level;
	lline.logmessage = szMessage;
	m_lastlog.push_back(lline);
	while (m_lastlog.size() > m_iBacklogSize)
		m_lastlog.pop_front();

	if (m_outputfile.is_open())
		m_outputfile << szLine << std::endl;

	if (level == LOG_ERROR)
		std::cerr << szLine << std::endl;
	else if (m_bVerbose)
		std::cout << szLine << std::endl;
}


/************************************************************************
 *									*
 * Backlog access							*
 *									*
 ************************************************************************/

std::deque<CLogger::tLogLineStruct> CLogger::GetLog()
{
	std::lock_guard<std::mutex> l(m_mutex);
	return m_lastlog;
}

bool CLogger::Contains(const std::string &szFragment)
{
	std::lock_guard<std::mutex> l(m_mutex);
	for (const auto &itt : m_lastlog)
	{
		if (itt.logmessage.find(szFragment) != std::string::npos)
			return true;
	}
	return false;
}

void CLogger::ClearLog()
{
	std::lock_guard<std::mutex> l(m_mutex);
	m_lastlog.clear();
}
