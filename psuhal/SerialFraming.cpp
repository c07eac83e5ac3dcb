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
	@brief Implementation of SerialFraming
 */

#include "psuhal.h"

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction / destruction

SerialFraming::SerialFraming()
	: m_baudrate(9600)
	, m_dataBits(8)
	, m_parity(PARITY_NONE)
	, m_stopBits(1)
	, m_xonxoff(true)
	, m_rtscts(false)
	, m_xoffThreshold(200)
	, m_xonThreshold(100)
	, m_timeout(1000)
	, m_terminator("\r\n")
{
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Validation

/**
	@brief Rejects settings the transport cannot apply

	A zero timeout is rejected as well: a read with no deadline would block forever on a dead link.
 */
void SerialFraming::Validate() const
{
	if( (m_dataBits < 5) || (m_dataBits > 8) )
		throw invalid_argument("data bits must be between 5 and 8, got " + to_string(m_dataBits));
	if( (m_stopBits != 1) && (m_stopBits != 2) )
		throw invalid_argument("stop bits must be 1 or 2, got " + to_string(m_stopBits));
	if(m_baudrate == 0)
		throw invalid_argument("baud rate must be nonzero");
	if(m_timeout.count() <= 0)
		throw invalid_argument("read timeout must be positive");
	if(m_terminator.empty())
		throw invalid_argument("line terminator must not be empty");
	if(m_xonxoff && m_rtscts)
		throw invalid_argument("software and hardware flow control are mutually exclusive");
}

string SerialFraming::ToString() const
{
	char tmp[128];
	snprintf(tmp, sizeof(tmp), "%u %u%c%u, flow=%s, timeout=%lld ms",
		m_baudrate,
		m_dataBits,
		"NOE"[m_parity],
		m_stopBits,
		m_xonxoff ? "xon/xoff" : (m_rtscts ? "rts/cts" : "none"),
		static_cast<long long>(m_timeout.count()));
	return string(tmp);
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Parity names

const char* SerialFraming::GetParityName(Parity p)
{
	switch(p)
	{
		case PARITY_ODD:
			return "odd";

		case PARITY_EVEN:
			return "even";

		case PARITY_NONE:
		default:
			return "none";
	}
}

SerialFraming::Parity SerialFraming::ParseParity(const string& name)
{
	if(name == "none")
		return PARITY_NONE;
	else if(name == "odd")
		return PARITY_ODD;
	else if(name == "even")
		return PARITY_EVEN;

	throw invalid_argument("unknown parity \"" + name + "\"");
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Serialization

/**
	@brief Loads framing settings from a YAML block

	Keys that are not present keep their default value.
 */
SerialFraming SerialFraming::FromYAML(const YAML::Node& node)
{
	SerialFraming ret;
	if(!node)
		return ret;

	if(node["baud"])
		ret.m_baudrate = node["baud"].as<unsigned int>();
	if(node["databits"])
		ret.m_dataBits = node["databits"].as<unsigned int>();
	if(node["parity"])
		ret.m_parity = ParseParity(node["parity"].as<string>());
	if(node["stopbits"])
		ret.m_stopBits = node["stopbits"].as<unsigned int>();
	if(node["xonxoff"])
		ret.m_xonxoff = node["xonxoff"].as<bool>();
	if(node["rtscts"])
		ret.m_rtscts = node["rtscts"].as<bool>();
	if(node["xoff_threshold"])
		ret.m_xoffThreshold = node["xoff_threshold"].as<unsigned int>();
	if(node["xon_threshold"])
		ret.m_xonThreshold = node["xon_threshold"].as<unsigned int>();
	if(node["timeout_ms"])
		ret.m_timeout = chrono::milliseconds(node["timeout_ms"].as<int64_t>());
	if(node["terminator"])
		ret.m_terminator = node["terminator"].as<string>();

	ret.Validate();
	return ret;
}

YAML::Node SerialFraming::SerializeConfiguration() const
{
	YAML::Node node;
	node["baud"] = m_baudrate;
	node["databits"] = m_dataBits;
	node["parity"] = GetParityName(m_parity);
	node["stopbits"] = m_stopBits;
	node["xonxoff"] = m_xonxoff;
	node["rtscts"] = m_rtscts;
	node["xoff_threshold"] = m_xoffThreshold;
	node["xon_threshold"] = m_xonThreshold;
	node["timeout_ms"] = static_cast<int64_t>(m_timeout.count());
	node["terminator"] = m_terminator;
	return node;
}
