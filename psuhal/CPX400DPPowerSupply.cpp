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
	@author Andrew D. Zonenberg
	@brief Implementation of CPX400DPPowerSupply
 */

#include "psuhal.h"
#include "CPX400DPPowerSupply.h"

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction / destruction

CPX400DPPowerSupply::CPX400DPPowerSupply(const string& nickname, SCPITransport* transport)
	: Instrument(nickname, transport)
{
}

CPX400DPPowerSupply::~CPX400DPPowerSupply()
{
}

/**
	@brief Creates the driver and opens it

	Opening identifies the supply, turns on all status reporting and creates the channels.
 */
shared_ptr<CPX400DPPowerSupply> CPX400DPPowerSupply::Create(const string& nickname, SCPITransport* transport)
{
	shared_ptr<CPX400DPPowerSupply> psu(new CPX400DPPowerSupply(nickname, transport));
	psu->Open();
	return psu;
}

string CPX400DPPowerSupply::GetDriverNameInternal()
{
	return "cpx400dp";
}

/**
	@brief Number of outputs for a model name from *IDN?

	The S and SP variants are single output, everything else in the family has two.
 */
int CPX400DPPowerSupply::GetChannelCountForModel(const string& model)
{
	if( (model == "CPX400S") || (model == "CPX400SP") )
		return 1;

	if(model.find("CPX400D") != 0)
		LogWarning("Unrecognized model \"%s\", assuming two outputs\n", model.c_str());
	return 2;
}

/**
	@brief Enables every status summary bit and creates the channels
 */
void CPX400DPPowerSupply::DoOpen()
{
	for(auto c : m_channels)
		delete c;
	m_channels.clear();

	int nchans = GetChannelCountForModel(m_model);
	LogDebug("%s has %d outputs\n", m_model.c_str(), nchans);

	EnableReporting("*SRE");
	EnableReporting("*ESE");
	for(int i=1; i<=nchans; i++)
	{
		EnableReporting(string("LSE") + to_string(i));
		m_channels.push_back(new PowerSupplyChannel(this, i));
	}
}

/**
	@brief Writes 255 to an enable register and verifies it by reading the register back
 */
void CPX400DPPowerSupply::EnableReporting(const string& cmd)
{
	Send(cmd + " 255");

	string reply = Query(cmd + "?");

	//Some firmware echoes the register name before the value
	auto fields = explode(reply, ' ');
	long value = -1;
	if(fields.empty() || !ParseRegisterValue(fields.back(), value))
		throw ProtocolParseError("Bad reply \"" + reply + "\" to " + cmd + "?");

	if(value != StatusRegisters::REGISTER_MAX)
	{
		LogError("%s read back as %ld after writing 255\n", cmd.c_str(), value);
		throw ProtocolConsistencyError(cmd + " read back as " + to_string(value) + " after writing 255");
	}
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Command interface

/**
	@brief Sends a command that produces no response, then checks status
 */
void CPX400DPPowerSupply::Send(const string& cmd)
{
	lock_guard<recursive_mutex> lock(m_mutex);
	CheckOpen();

	lock_guard<recursive_mutex> tlock(m_transport->GetMutex());
	m_transport->SendCommand(cmd);
	CheckStatus();
}

/**
	@brief Sends a query, reads the one line reply, then checks status

	If the reply never arrives the status registers are still read, since they usually say why. The timeout is what
	gets thrown though; anything the status check finds at that point is only logged.
 */
string CPX400DPPowerSupply::Query(const string& cmd)
{
	lock_guard<recursive_mutex> lock(m_mutex);
	CheckOpen();

	lock_guard<recursive_mutex> tlock(m_transport->GetMutex());

	string reply;
	try
	{
		reply = m_transport->SendCommandImmediateWithReply(cmd);
	}
	catch(const TransportTimeoutError&)
	{
		LogError("%s: no reply to %s\n", m_nickname.c_str(), cmd.c_str());
		try
		{
			CheckStatus();
		}
		catch(const InstrumentError& sex)
		{
			LogError("%s: status check after timeout failed: %s\n", m_nickname.c_str(), sex.what());
		}
		throw;
	}

	CheckStatus();
	return Trim(reply);
}

void CPX400DPPowerSupply::Reset()
{
	Send("*RST");
}

/**
	@brief Clears the event registers and the error queue
 */
void CPX400DPPowerSupply::ClearStatus()
{
	Send("*CLS");
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Status cascade

/**
	@brief Reads the status byte and everything it points at

	Works through a queue of registers rather than recursing: STB adds LSR1/LSR2/ESR for its set bits, ESR adds EER.
	Each STB bit is handled on its own, so all of them get serviced in one pass.

	Limit conditions are reported and never thrown. ESR errors are collected while the queue drains and the one
	belonging to the lowest ESR bit is thrown at the end, so a query error does not stop EER from being read and
	cleared. Transport and range failures abort the check at once.
 */
void CPX400DPPowerSupply::CheckStatus()
{
	LogTrace("Checking status of %s\n", m_nickname.c_str());
	LogIndenter li;

	deque<StatusWorkItem> work;
	work.push_back({REG_STB, 1});

	exception_ptr pending;
	int pendingBit = 8;
	auto defer = [&](int bit, exception_ptr err)
	{
		if(bit < pendingBit)
		{
			pending = err;
			pendingBit = bit;
		}
	};

	while(!work.empty())
	{
		auto item = work.front();
		work.pop_front();

		if(item.m_depth > MAX_STATUS_DEPTH)
			throw ProtocolConsistencyError("Status register cascade exceeded " + to_string(MAX_STATUS_DEPTH) + " levels");

		switch(item.m_reg)
		{
			case REG_STB:
				{
					auto stb = ReadRegister("*STB?");
					if(stb & StatusRegisters::STB_LIMIT_CH1)
						work.push_back({REG_LSR1, item.m_depth + 1});
					if(stb & StatusRegisters::STB_LIMIT_CH2)
						work.push_back({REG_LSR2, item.m_depth + 1});
					if(stb & StatusRegisters::STB_EVENT_STATUS)
						work.push_back({REG_ESR, item.m_depth + 1});

					//bits 4 and 6 need no action, 2, 3 and 7 are unused
				}
				break;

			case REG_LSR1:
				ReportLimitConditions(1, ReadRegister("LSR1?"));
				break;

			case REG_LSR2:
				ReportLimitConditions(2, ReadRegister("LSR2?"));
				break;

			case REG_ESR:
				{
					auto esr = ReadRegister("*ESR?");

					//bits 0 and 7 are informational, 1 and 6 are unused
					if(esr & StatusRegisters::ESR_QUERY_ERROR)
					{
						LogError("%s reported a query error\n", m_nickname.c_str());
						defer(2, make_exception_ptr(ProtocolParseError("Query error reported by " + m_nickname)));
					}
					if(esr & StatusRegisters::ESR_VERIFY_TIMEOUT)
					{
						LogError("%s reported a verify timeout\n", m_nickname.c_str());
						defer(3, make_exception_ptr(DeviceTimeoutError("Verify timeout reported by " + m_nickname)));
					}
					if(esr & StatusRegisters::ESR_EXECUTION_ERROR)
						work.push_back({REG_EER, item.m_depth + 1});
					if(esr & StatusRegisters::ESR_COMMAND_ERROR)
					{
						LogError("%s reported a command error\n", m_nickname.c_str());
						defer(5, make_exception_ptr(ProtocolParseError("Command error reported by " + m_nickname)));
					}
				}
				break;

			case REG_EER:
				{
					//Not an 8-bit register, codes go up to 200+
					string reply = Trim(m_transport->SendCommandImmediateWithReply("EER?"));
					long code;
					if(!ParseRegisterValue(reply, code))
						throw ProtocolParseError("Bad reply \"" + reply + "\" to EER?");

					LogTrace("EER = %ld\n", code);
					try
					{
						StatusRegisters::RaiseExecutionError(code);
					}
					catch(const InstrumentError&)
					{
						defer(4, current_exception());
					}
				}
				break;
		}
	}

	if(pending)
		rethrow_exception(pending);
}

/**
	@brief Reads one 8-bit status register, with no status check of its own
 */
uint8_t CPX400DPPowerSupply::ReadRegister(const string& query)
{
	string reply = Trim(m_transport->SendCommandImmediateWithReply(query));

	long value;
	if(!ParseRegisterValue(reply, value))
	{
		LogError("Bad reply \"%s\" to %s\n", reply.c_str(), query.c_str());
		throw ProtocolParseError("Bad reply \"" + reply + "\" to " + query);
	}

	StatusRegisters::CheckRange(query, value);
	LogTrace("%s = 0x%02lx\n", query.c_str(), value);
	return static_cast<uint8_t>(value);
}

/**
	@brief Logs a warning and fires signal_limitEvent() for each condition set in a limit status register
 */
void CPX400DPPowerSupply::ReportLimitConditions(int chan, uint8_t lsr)
{
	for(auto cond : StatusRegisters::DecodeLimitRegister(lsr))
	{
		auto message = StatusRegisters::FormatLimitMessage(chan, cond);
		LogWarning("%s: %s\n", m_nickname.c_str(), message.c_str());
		m_limitEventSignal.emit(chan, cond, message);
	}
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Command helpers

void CPX400DPPowerSupply::SendChannelValue(const char* cmd, int chan, double value)
{
	CheckChannel(chan);

	char tmp[64];
	snprintf(tmp, sizeof(tmp), "%s%d %.3f", cmd, chan, value);
	Send(tmp);
}

/**
	@brief Reads back a setting. The reply repeats the command name, e.g. "V1 12.345"
 */
double CPX400DPPowerSupply::QuerySetting(const char* query, int chan)
{
	CheckChannel(chan);

	char tmp[32];
	snprintf(tmp, sizeof(tmp), "%s%d?", query, chan);
	auto reply = Query(tmp);

	auto fields = explode(reply, ' ');
	if(fields.empty())
		throw ProtocolParseError(string("Empty reply to ") + tmp);
	return ParseNumber(fields.back(), reply);
}

/**
	@brief Reads a live output measurement. The reply carries a unit suffix, e.g. "12.301V"
 */
double CPX400DPPowerSupply::QueryMeasurement(const char* query, int chan, char unit)
{
	CheckChannel(chan);

	char tmp[32];
	snprintf(tmp, sizeof(tmp), "%s%dO?", query, chan);
	auto reply = Query(tmp);

	string value = reply;
	if(!value.empty() && (value.back() == unit))
		value.pop_back();
	return ParseNumber(value, reply);
}

double CPX400DPPowerSupply::ParseNumber(const string& text, const string& reply)
{
	const char* start = text.c_str();
	char* end = nullptr;
	double value = strtod(start, &end);
	if(text.empty() || (end == start) || (*end != '\0'))
	{
		LogError("%s: unparseable reply \"%s\"\n", m_nickname.c_str(), reply.c_str());
		throw ProtocolParseError("Unparseable reply \"" + reply + "\"");
	}
	return value;
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Actual hardware interfacing

double CPX400DPPowerSupply::GetPowerVoltageActual(int chan)
{
	return QueryMeasurement("V", chan, 'V');
}

double CPX400DPPowerSupply::GetPowerVoltageNominal(int chan)
{
	return QuerySetting("V", chan);
}

double CPX400DPPowerSupply::GetPowerCurrentActual(int chan)
{
	return QueryMeasurement("I", chan, 'A');
}

double CPX400DPPowerSupply::GetPowerCurrentNominal(int chan)
{
	return QuerySetting("I", chan);
}

bool CPX400DPPowerSupply::GetPowerChannelActive(int chan)
{
	CheckChannel(chan);

	auto reply = Query(string("OP") + to_string(chan) + "?");
	auto fields = explode(reply, ' ');
	if(!fields.empty())
	{
		if(fields.back() == "1")
			return true;
		if(fields.back() == "0")
			return false;
	}

	LogError("%s: bad output state \"%s\"\n", m_nickname.c_str(), reply.c_str());
	throw ProtocolParseError("Bad output state \"" + reply + "\"");
}

double CPX400DPPowerSupply::GetPowerOvervoltageProtection(int chan)
{
	return QuerySetting("OVP", chan);
}

void CPX400DPPowerSupply::SetPowerOvervoltageProtection(int chan, double volts)
{
	SendChannelValue("OVP", chan, volts);
}

double CPX400DPPowerSupply::GetPowerOvercurrentProtection(int chan)
{
	return QuerySetting("OCP", chan);
}

void CPX400DPPowerSupply::SetPowerOvercurrentProtection(int chan, double amps)
{
	SendChannelValue("OCP", chan, amps);
}

void CPX400DPPowerSupply::SetPowerVoltage(int chan, double volts)
{
	SendChannelValue("V", chan, volts);
}

void CPX400DPPowerSupply::SetPowerCurrent(int chan, double amps)
{
	SendChannelValue("I", chan, amps);
}

void CPX400DPPowerSupply::SetPowerChannelActive(int chan, bool on)
{
	CheckChannel(chan);
	Send(string("OP") + to_string(chan) + (on ? " 1" : " 0"));
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Serialization

YAML::Node CPX400DPPowerSupply::SerializeConfiguration()
{
	auto node = Instrument::SerializeConfiguration();
	node["channels"] = SerializeChannels();
	return node;
}
