/*
 * Copyright (c) 2024 Gordon Bos <gordon@bosvangennip.nl> All rights reserved.
 *
 * Base classes for Midea appliance commands
 *
 *
 * Source code subject to GNU GENERAL PUBLIC LICENSE version 3
 */

#ifndef _MideaCommand
#define _MideaCommand

#include <string>
#include <vector>
#include <mutex>
#include <cstdint>

#define MIDEA_COMMAND_HEADER_SIZE 10
#define MIDEA_COMMAND_SEQUENCE_INDEX 30


namespace midea {

	typedef struct _tTimerState
	{
		bool status;
		bool set;
		int hour;
		int minutes;
	} tTimerState;

	// on timer: value byte plus the high nibble of the minutes byte
	void decode_on_timer(const uint8_t value, const uint8_t minutes, tTimerState &timer);
	// off timer: value byte plus the low nibble of the minutes byte
	void decode_off_timer(const uint8_t value, const uint8_t minutes, tTimerState &timer);

	std::string bool_to_string(const bool value);
	std::string decimal_to_string(const double value, const int precision = 1);

}; // namespace midea


/*
 * Message id source for sequenced commands. One instance is shared by
 * all commands sent through the same session.
 */
class MideaCommandSequence
{
public:
	explicit MideaCommandSequence(const uint8_t value = 0);

	// advances the counter (wrapping at 256) and returns the new value
	uint8_t next();
	uint8_t current();
	void reset(const uint8_t value = 0);

private:
	std::mutex m_mutex;
	uint8_t m_iValue;
};


/************************************************************************
 *									*
 *	Command layout							*
 *									*
 *	 0	sync header 0xAA					*
 *	 1	length (bytes after the sync header)			*
 *	 2	appliance type						*
 *	 3-8	frame check, reserved, message id, protocol versions	*
 *	 9	message type: 0x03 query, 0x02 control			*
 *	10	opcode							*
 *	...	payload							*
 *	-2	CRC8 over the payload					*
 *	-1	checksum over everything after the sync header		*
 *									*
 ************************************************************************/

class MideaCommand
{
public:
	MideaCommand();
	explicit MideaCommand(const std::vector<uint8_t> &vData);
	virtual ~MideaCommand();

	// writes the trailing check bytes and returns the wire image
	virtual std::vector<uint8_t> finalize(MideaCommandSequence &sequence);

	const std::vector<uint8_t>& get_data() const;
	size_t size() const;
	bool empty() const;

protected:
	bool get_bit(const size_t index, const uint8_t mask) const;
	void set_bit(const size_t index, const uint8_t mask, const bool state);
	uint8_t get_bits(const size_t index, const uint8_t mask, const uint8_t shift = 0) const;
	void set_bits(const size_t index, const uint8_t mask, const uint8_t value, const uint8_t shift = 0);

	void apply_checks();

	std::vector<uint8_t> m_vData;
};


/*
 * Commands that carry a message id byte. The id is taken from the
 * sequence when the command is finalized.
 */
class MideaSequenceCommand : public MideaCommand
{
public:
	explicit MideaSequenceCommand(const std::vector<uint8_t> &vData, const size_t sequenceIndex = MIDEA_COMMAND_SEQUENCE_INDEX);

	std::vector<uint8_t> finalize(MideaCommandSequence &sequence) override;

private:
	size_t m_iSequenceIndex;
};


/*
 * B5 capability queries. The first part lists the basic capabilities,
 * the second part asks for the remainder.
 */
class DeviceCapabilitiesCommand : public MideaCommand
{
public:
	explicit DeviceCapabilitiesCommand(const uint8_t applianceType);
};

class DeviceCapabilitiesCommandMore : public MideaCommand
{
public:
	explicit DeviceCapabilitiesCommandMore(const uint8_t applianceType);
};

#endif
