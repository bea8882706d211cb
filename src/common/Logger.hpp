/*
 * Copyright (c) 2024 Gordon Bos <gordon@bosvangennip.nl> All rights reserved.
 *
 * Logging facility for the Midea appliance library
 *
 *
 * Source code subject to GNU GENERAL PUBLIC LICENSE version 3
 */

#pragma once
#include <cstdint>
#include <ctime>
#include <string>
#include <deque>
#include <mutex>
#include <fstream>


enum _eLogLevel : uint32_t
{
	LOG_NORM	= 0x0000001,
	LOG_STATUS	= 0x0000002,
	LOG_ERROR	= 0x0000004,
	LOG_DEBUG_INT	= 0x0000008,
	LOG_ALL		= 0xFFFFFFF
};

enum _eDebugLevel : uint32_t
{
	DEBUG_NORM	= 0x0000001,
	DEBUG_LAN	= 0x0000002,
	DEBUG_CLOUD	= 0x0000004,
	DEBUG_DISCOVERY	= 0x0000008,
	DEBUG_PROTOCOL	= 0x0000010,	// raw frame hex dumps
	DEBUG_ALL	= 0xFFFFFFF
};


class CLogger
{
public:
	typedef struct _tLogLineStruct
	{
		time_t logtime;
		_eLogLevel level;
		std::string logmessage;
	} tLogLineStruct;

	CLogger();
	~CLogger();

	void SetLogFlags(const uint32_t iFlags);
	void SetDebugFlags(const uint32_t iFlags);
	bool SetLogFlags(const std::string &szFlags);
	bool SetDebugFlags(const std::string &szFlags);
	bool IsLogLevelEnabled(const _eLogLevel level);
	bool IsDebugLevelEnabled(const _eDebugLevel level);

	bool SetOutputFile(const std::string &szFilename);
	void SetVerbose(const bool bVerbose);
	void SetBacklogSize(const size_t iSize);

	void Log(const _eLogLevel level, const char *logline, ...)
#ifdef __GNUC__
		__attribute__((format(printf, 3, 4)))
#endif
		;
	void Debug(const _eDebugLevel level, const char *logline, ...)
#ifdef __GNUC__
		__attribute__((format(printf, 3, 4)))
#endif
		;

	std::deque<tLogLineStruct> GetLog();
	bool Contains(const std::string &szFragment);
	void ClearLog();

private:
	void WriteLine(const _eLogLevel level, const char *cbuffer);

	std::mutex m_mutex;
	std::ofstream m_outputfile;
	std::deque<tLogLineStruct> m_lastlog;
	size_t m_iBacklogSize;
	uint32_t m_iLogFlags;
	uint32_t m_iDebugFlags;
	bool m_bVerbose;
};

extern CLogger _log;
