/*
 * Copyright (c) 2024 Gordon Bos <gordon@bosvangennip.nl> All rights reserved.
 *
 * Base classes for Midea appliance commands
 *
 *
 * Source code subject to GNU GENERAL PUBLIC LICENSE version 3
 */

#include "Command.hpp"
#include "../crypto/crc8.hpp"
#include <sstream>
#include <iomanip>


namespace midea {

void decode_on_timer(const uint8_t value, const uint8_t minutes, tTimerState &timer)
{
	timer.status = ((value & 0x80) != 0);
	timer.set = (value != 0x7F);
	timer.hour = 0;
	timer.minutes = (value & 0x03);
	if (timer.set)
	{
		timer.hour = (value & 0xFC) >> 2;
		timer.minutes |= ((minutes & 0xF0) >> 4);
	}
}

void decode_off_timer(const uint8_t value, const uint8_t minutes, tTimerState &timer)
{
	timer.status = ((value & 0x80) != 0);
	timer.set = (value != 0x7F);
	timer.hour = (value & 0xFC) >> 2;
	timer.minutes = (value & 0x03) | (minutes & 0x0F);
}

std::string bool_to_string(const bool value)
{
	return value ? "true" : "false";
}

std::string decimal_to_string(const double value, const int precision)
{
	std::stringstream ss;
	ss << std::fixed << std::setprecision(precision) << value;
	return ss.str();
}

}; // namespace midea



MideaCommandSequence::MideaCommandSequence(const uint8_t value) :
	m_iValue(value)
{
}

uint8_t MideaCommandSequence::next()
{
	std::lock_guard<std::mutex> lock(m_mutex);
	m_iValue = (uint8_t)((m_iValue + 1) & 0xFF);
	return m_iValue;
}

uint8_t MideaCommandSequence::current()
{
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_iValue;
}

void MideaCommandSequence::reset(const uint8_t value)
{
	std::lock_guard<std::mutex> lock(m_mutex);
	m_iValue = value;
}


/************************************************************************
 *									*
 *	MideaCommand							*
 *									*
 ************************************************************************/

MideaCommand::MideaCommand()
{
}

MideaCommand::MideaCommand(const std::vector<uint8_t> &vData) :
	m_vData(vData)
{
}

MideaCommand::~MideaCommand()
{
}

const std::vector<uint8_t>& MideaCommand::get_data() const
{
	return m_vData;
}

size_t MideaCommand::size() const
{
	return m_vData.size();
}

bool MideaCommand::empty() const
{
	return m_vData.empty();
}

bool MideaCommand::get_bit(const size_t index, const uint8_t mask) const
{
	return (m_vData[index] & mask) != 0;
}

void MideaCommand::set_bit(const size_t index, const uint8_t mask, const bool state)
{
	m_vData[index] &= (uint8_t)~mask;
	if (state)
		m_vData[index] |= mask;
}

uint8_t MideaCommand::get_bits(const size_t index, const uint8_t mask, const uint8_t shift) const
{
	return (uint8_t)((m_vData[index] & mask) >> shift);
}

void MideaCommand::set_bits(const size_t index, const uint8_t mask, const uint8_t value, const uint8_t shift)
{
	m_vData[index] &= (uint8_t)~mask;
	m_vData[index] |= (uint8_t)((value << shift) & mask);
}

void MideaCommand::apply_checks()
{
	size_t size = m_vData.size();
	if (size < MIDEA_COMMAND_HEADER_SIZE + 2)
		return;
	m_vData[size - 2] = midea::crypto::crc8(&m_vData[MIDEA_COMMAND_HEADER_SIZE], size - MIDEA_COMMAND_HEADER_SIZE - 2);
	m_vData[size - 1] = midea::crypto::frame_checksum(&m_vData[1], size - 2);
}

std::vector<uint8_t> MideaCommand::finalize(MideaCommandSequence &sequence)
{
	(void)sequence;
	apply_checks();
	return m_vData;
}


MideaSequenceCommand::MideaSequenceCommand(const std::vector<uint8_t> &vData, const size_t sequenceIndex) :
	MideaCommand(vData),
	m_iSequenceIndex(sequenceIndex)
{
}

std::vector<uint8_t> MideaSequenceCommand::finalize(MideaCommandSequence &sequence)
{
	if (m_iSequenceIndex + 2 < m_vData.size())
		m_vData[m_iSequenceIndex] = sequence.next();
	apply_checks();
	return m_vData;
}


/************************************************************************
 *									*
 *	B5 capability queries						*
 *									*
 ************************************************************************/

DeviceCapabilitiesCommand::DeviceCapabilitiesCommand(const uint8_t applianceType) :
	MideaCommand(std::vector<uint8_t>({
		0xAA, 0x0E, applianceType, 0x00, 0x00, 0x00, 0x00, 0x00, 0x03, 0x03,
		0xB5, 0x01, 0x11, 0x00, 0x00
	}))
{
}

DeviceCapabilitiesCommandMore::DeviceCapabilitiesCommandMore(const uint8_t applianceType) :
	MideaCommand(std::vector<uint8_t>({
		0xAA, 0x0E, applianceType, 0x00, 0x00, 0x00, 0x00, 0x00, 0x03, 0x03,
		0xB5, 0x01, 0x01, 0x00, 0x00
	}))
{
}
