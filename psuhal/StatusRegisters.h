/***********************************************************************************************************************
*                                                                                                                      *
* libpsuhal                                                                                                            *
*                                                                                                                      *
* Copyright (c) 2012-2024 Andrew D. Zonenberg and contributors                                                         *
* All rights reserved.                                                                                                 *
*                                                                                                                      *
* Redistribution and use in source and binary forms, with or without modification, are permitted provided that the     *
* following conditions are met:                                                                                        *
*                                                                                                                      *
*    * Redistributions of source code must retain the above copyright notice, this list of conditions, and the         *
*      following disclaimer.                                                                                           *
*                                                                                                                      *
*    * Redistributions in binary form must reproduce the above copyright notice, this list of conditions and the       *
*      following disclaimer in the documentation and/or other materials provided with the distribution.                *
*                                                                                                                      *
*    * Neither the name of the author nor the names of any contributors may be used to endorse or promote products     *
*      derived from this software without specific prior written permission.                                           *
*                                                                                                                      *
* THIS SOFTWARE IS PROVIDED BY THE AUTHORS "AS IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED   *
* TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL *
* THE AUTHORS BE HELD LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES        *
* (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR       *
* BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT *
* (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE       *
* POSSIBILITY OF SUCH DAMAGE.                                                                                          *
*                                                                                                                      *
***********************************************************************************************************************/

/**
	@file
	@brief Bit definitions and decode tables for the IEEE 488.2 style status registers of the CPX400 family
 */

#ifndef StatusRegisters_h
#define StatusRegisters_h

/**
	@brief Status register decoding helpers

	The registers themselves are never stored. Each one is read once per command cycle, checked against the 8-bit
	range and decoded with the tables here.
 */
class StatusRegisters
{
public:

	//Status byte register (*STB?)
	enum StatusByteBits
	{
		STB_LIMIT_CH1		= 0x01,		//limit event pending on channel 1, read LSR1?
		STB_LIMIT_CH2		= 0x02,		//limit event pending on channel 2, read LSR2?
		STB_MESSAGE_AVAIL	= 0x10,		//output queue not empty
		STB_EVENT_STATUS	= 0x20,		//standard event status summary, read *ESR?
		STB_REQUEST_SERVICE	= 0x40		//RQS / MSS
	};

	//Standard event status register (*ESR?)
	enum EventStatusBits
	{
		ESR_OPERATION_COMPLETE	= 0x01,
		ESR_QUERY_ERROR			= 0x04,
		ESR_VERIFY_TIMEOUT		= 0x08,
		ESR_EXECUTION_ERROR		= 0x10,		//details in EER?
		ESR_COMMAND_ERROR		= 0x20,
		ESR_POWER_ON			= 0x80
	};

	//Limit event status register (LSR1? / LSR2?)
	enum LimitCondition
	{
		LIMIT_VOLTAGE_MODE		= 0x01,
		LIMIT_CURRENT_MODE		= 0x02,
		LIMIT_OVERVOLTAGE_TRIP	= 0x04,
		LIMIT_OVERCURRENT_TRIP	= 0x08,
		LIMIT_POWER_MODE		= 0x10,		//unregulated
		LIMIT_HARD_TRIP			= 0x40		//front panel reset required
	};

	static const int REGISTER_MIN = 0;
	static const int REGISTER_MAX = 255;

	static void CheckRange(const std::string& regname, long value);

	static std::vector<LimitCondition> DecodeLimitRegister(uint8_t lsr);
	static const char* GetLimitConditionText(LimitCondition cond);
	static std::string FormatLimitMessage(int chan, LimitCondition cond);

	static bool LookupExecutionError(long code, std::string& message);
	static void RaiseExecutionError(long code);
};

#endif
