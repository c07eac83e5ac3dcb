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
	@brief Implementation of StatusRegisters
 */

#include "psuhal.h"

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Range checking

/**
	@brief Verifies that a raw register reading fits in 8 bits

	Every status register on the device is 8 bits wide, so anything else means the reply was corrupted in transit.

	@param regname	Name of the register, for the error message
	@param value	Raw integer parsed from the reply
 */
void StatusRegisters::CheckRange(const string& regname, long value)
{
	if( (value < REGISTER_MIN) || (value > REGISTER_MAX) )
	{
		LogError("%s returned out of range value %ld\n", regname.c_str(), value);
		throw ProtocolConsistencyError(regname + " returned out of range value " + to_string(value));
	}
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Limit status register

/**
	@brief Returns every documented condition flagged in a limit status register, lowest bit first
 */
vector<StatusRegisters::LimitCondition> StatusRegisters::DecodeLimitRegister(uint8_t lsr)
{
	static const LimitCondition conditions[] =
	{
		LIMIT_VOLTAGE_MODE,
		LIMIT_CURRENT_MODE,
		LIMIT_OVERVOLTAGE_TRIP,
		LIMIT_OVERCURRENT_TRIP,
		LIMIT_POWER_MODE,
		LIMIT_HARD_TRIP
	};

	//bits 5 and 7 are unused
	vector<LimitCondition> ret;
	for(auto c : conditions)
	{
		if(lsr & c)
			ret.push_back(c);
	}
	return ret;
}

const char* StatusRegisters::GetLimitConditionText(LimitCondition cond)
{
	switch(cond)
	{
		case LIMIT_VOLTAGE_MODE:
			return "entered voltage limit mode";

		case LIMIT_CURRENT_MODE:
			return "entered current limit mode";

		case LIMIT_OVERVOLTAGE_TRIP:
			return "over voltage trip occurred";

		case LIMIT_OVERCURRENT_TRIP:
			return "over current trip occurred";

		case LIMIT_POWER_MODE:
			return "entered power limit mode (unregulated)";

		case LIMIT_HARD_TRIP:
			return "trip occurred (front panel reset required)";

		default:
			return "unknown limit condition";
	}
}

/**
	@brief Formats a limit observation as "CHn <condition>"
 */
string StatusRegisters::FormatLimitMessage(int chan, LimitCondition cond)
{
	return string("CH") + to_string(chan) + " " + GetLimitConditionText(cond);
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Execution error register

/**
	@brief Looks up the message for an execution error code

	@param code		Value read from EER?
	@param message	Set to "<code>: <description>" if the code is documented

	@return True if the code is in the table
 */
bool StatusRegisters::LookupExecutionError(long code, string& message)
{
	static const map<long, string> messages =
	{
		{0,   "No error encountered"},
		{1,   "Internal hardware error"},
		{2,   "Internal hardware error"},
		{3,   "Internal hardware error"},
		{4,   "Internal hardware error"},
		{5,   "Internal hardware error"},
		{6,   "Internal hardware error"},
		{7,   "Internal hardware error"},
		{8,   "Internal hardware error"},
		{9,   "Internal hardware error"},
		{100, "Range error, input value rejected"},
		{101, "Corrupted setup data"},
		{102, "Missing setup data"},
		{103, "No second output"},
		{104, "Command not valid with output on"},
		{200, "Read only, interface is locked"}
	};

	auto it = messages.find(code);
	if(it == messages.end())
		return false;

	message = to_string(code) + ": " + it->second;
	return true;
}

/**
	@brief Converts an execution error code into the matching exception

	Code 0 means the command executed and is a no-op.
 */
void StatusRegisters::RaiseExecutionError(long code)
{
	string message;
	if(!LookupExecutionError(code, message))
	{
		LogError("Execution error register returned undocumented code %ld\n", code);
		throw UnknownExecutionErrorCode(code);
	}

	if(code == 0)
		return;

	LogError("Execution error: %s\n", message.c_str());
	throw DeviceExecutionError(static_cast<int>(code), message);
}
