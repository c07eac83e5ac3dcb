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
	@brief Implementation of InstrumentConfig
 */

#include "psuhal.h"

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction / destruction

InstrumentConfig::InstrumentConfig()
	: m_name("psu")
	, m_driver("cpx400dp")
	, m_transport("uart")
	, m_shutdownTimeout(5000)
{
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Loading

/**
	@brief Loads a session file from disk

	@throw std::invalid_argument if the file cannot be read or does not describe an instrument
 */
InstrumentConfig InstrumentConfig::Load(const string& path)
{
	YAML::Node doc;
	try
	{
		doc = YAML::LoadFile(path);
	}
	catch(const YAML::BadFile&)
	{
		LogError("Unable to open config file %s\n", path.c_str());
		throw invalid_argument("Unable to open config file " + path);
	}
	catch(const YAML::ParserException& ex)
	{
		LogError("Failed to parse config file %s: %s\n", path.c_str(), ex.what());
		throw invalid_argument("Failed to parse config file " + path + ": " + ex.what());
	}

	LogDebug("Loaded config from %s\n", path.c_str());
	return FromYAML(doc);
}

/**
	@brief Parses a whole session document

	Only the location is mandatory. Bad values (wrong type, unknown parity, etc) throw std::invalid_argument.
 */
InstrumentConfig InstrumentConfig::FromYAML(const YAML::Node& node)
{
	InstrumentConfig ret;

	auto inst = node["instrument"];
	if(!inst || !inst.IsMap())
		throw invalid_argument("Config has no \"instrument\" block");

	try
	{
		if(inst["name"])
			ret.m_name = inst["name"].as<string>();
		if(inst["driver"])
			ret.m_driver = inst["driver"].as<string>();
		if(inst["transport"])
			ret.m_transport = inst["transport"].as<string>();
		if(!inst["location"])
			throw invalid_argument("Config for " + ret.m_name + " has no location");
		ret.m_location = inst["location"].as<string>();

		ret.m_framing = SerialFraming::FromYAML(inst["framing"]);

		auto shutdown = node["shutdown"];
		if(shutdown && shutdown["timeout_ms"])
			ret.m_shutdownTimeout = chrono::milliseconds(shutdown["timeout_ms"].as<int64_t>());
	}
	catch(const YAML::Exception& ex)
	{
		LogError("Bad value in config: %s\n", ex.what());
		throw invalid_argument(string("Bad value in config: ") + ex.what());
	}

	if(ret.m_location.empty())
		throw invalid_argument("Config for " + ret.m_name + " has an empty location");
	if(ret.m_shutdownTimeout.count() <= 0)
		throw invalid_argument("Shutdown timeout must be positive");

	return ret;
}

YAML::Node InstrumentConfig::SerializeConfiguration() const
{
	YAML::Node node;

	auto inst = node["instrument"];
	inst["name"] = m_name;
	inst["driver"] = m_driver;
	inst["transport"] = m_transport;
	inst["location"] = m_location;
	inst["framing"] = m_framing.SerializeConfiguration();

	node["shutdown"]["timeout_ms"] = static_cast<int64_t>(m_shutdownTimeout.count());

	return node;
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Connection

/**
	@brief Creates the transport and driver named by this config and opens the instrument

	@throw std::invalid_argument for an unknown transport or driver name
 */
shared_ptr<Instrument> InstrumentConfig::OpenInstrument() const
{
	LogDebug("Connecting to %s (%s via %s at %s)\n",
		m_name.c_str(), m_driver.c_str(), m_transport.c_str(), m_location.c_str());
	LogIndenter li;

	//The UART transport gets the full framing block, anything else only has its connection string
	SCPITransport* transport = nullptr;
	if(m_transport == SCPIUARTTransport::GetTransportName())
		transport = new SCPIUARTTransport(m_location, m_framing);
	else
		transport = SCPITransport::CreateTransport(m_transport, m_location);
	if(!transport)
		throw invalid_argument("Unknown transport \"" + m_transport + "\"");

	auto inst = Instrument::CreateInstrument(m_driver, m_name, transport);
	if(!inst)
		throw invalid_argument("Unknown driver \"" + m_driver + "\"");

	return inst;
}
