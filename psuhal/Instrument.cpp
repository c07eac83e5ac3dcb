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
	@brief Implementation of Instrument
 */

#include "psuhal.h"
#include "Instrument.h"

using namespace std;

Instrument::CreateMapType Instrument::m_createprocs;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction / destruction

/**
	@brief Initializes the instrument. No I/O happens until Open().

	@param nickname		User-selected name
	@param transport	Connected transport. The instrument takes ownership.
 */
Instrument::Instrument(const string& nickname, SCPITransport* transport)
	: m_transport(transport)
	, m_nickname(nickname)
	, m_open(false)
{
}

Instrument::~Instrument()
{
	try
	{
		Close();
	}
	catch(const exception& ex)
	{
		LogError("Failed to close %s during destruction: %s\n", m_nickname.c_str(), ex.what());
	}

	//Never leave a dangling registry entry behind, even if Close() bailed out
	InstrumentRegistry::GetInstance().Remove(this);
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Lifecycle

/**
	@brief Identifies the instrument, runs driver bring-up, and publishes it in the InstrumentRegistry

	Calling Open() on an instrument that is already open is a no-op.
 */
void Instrument::Open()
{
	lock_guard<recursive_mutex> lock(m_mutex);

	if(m_open)
		return;

	//Throws bad_weak_ptr if we're not owned by a shared_ptr, before anything goes out on the wire
	auto self = shared_from_this();

	if(!m_transport || !m_transport->IsConnected())
		throw TransportOpenError("Transport for " + m_nickname + " is not connected");

	LogDebug("Opening %s on %s\n", m_nickname.c_str(), m_transport->GetConnectionString().c_str());
	LogIndenter li;

	//Commands are legal during bring-up, but nobody else sees us until it has finished
	m_open = true;
	try
	{
		Identify();
		DoOpen();
	}
	catch(const exception& ex)
	{
		m_open = false;
		LogError("Failed to open %s: %s\n", m_nickname.c_str(), ex.what());
		throw;
	}

	InstrumentRegistry::GetInstance().Add(self);
	LogDebug("%s is %s %s, serial %s, firmware %s\n",
		m_nickname.c_str(), m_vendor.c_str(), m_model.c_str(), m_serial.c_str(), m_fwVersion.c_str());
}

/**
	@brief Flushes and releases the transport and withdraws the instrument from the registry

	Safe to call any number of times; only the first call after Open() does anything. Waits for any command cycle
	in progress on another thread to finish first.
 */
void Instrument::Close()
{
	lock_guard<recursive_mutex> lock(m_mutex);

	if(!m_open)
		return;
	m_open = false;

	LogDebug("Closing %s\n", m_nickname.c_str());

	try
	{
		auto flushed = m_transport->FlushBuffers();
		if(flushed.first || flushed.second)
		{
			LogDebug("Discarded %zu input and %zu output bytes while closing %s\n",
				flushed.first, flushed.second, m_nickname.c_str());
		}
		m_transport->Close();
	}
	catch(const InstrumentError& ex)
	{
		InstrumentRegistry::GetInstance().Remove(this);
		LogError("Error while closing %s: %s\n", m_nickname.c_str(), ex.what());
		throw;
	}

	InstrumentRegistry::GetInstance().Remove(this);
}

bool Instrument::IsOpen() const
{
	lock_guard<recursive_mutex> lock(m_mutex);
	return m_open;
}

void Instrument::CheckOpen() const
{
	if(!m_open)
		throw InstrumentError(m_nickname + " is not open");
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Identification

/**
	@brief Reads *IDN? and fills in vendor, model, serial number and firmware version

	The reply is "manufacturer,model,serial,firmware".
 */
void Instrument::Identify()
{
	string reply = Trim(Query("*IDN?"));

	//Split by hand: explode() drops empty fields and we need to see them to validate the field count
	vector<string> fields;
	string tmp;
	for(auto c : reply)
	{
		if(c == ',')
		{
			fields.push_back(Trim(tmp));
			tmp = "";
		}
		else
			tmp += c;
	}
	fields.push_back(Trim(tmp));

	if(fields.size() != 4)
	{
		LogError("Bad *IDN? response \"%s\"\n", reply.c_str());
		throw ProtocolParseError("Bad *IDN? response \"" + reply + "\"");
	}

	m_vendor = fields[0];
	m_model = fields[1];
	m_serial = fields[2];
	m_fwVersion = fields[3];
}

string Instrument::GetTransportConnectionString()
{
	if(!m_transport)
		return "";
	return m_transport->GetConnectionString();
}

string Instrument::GetTransportName()
{
	if(!m_transport)
		return "";
	return m_transport->GetName();
}

/**
	@brief Human readable summary: driver, nickname, location, hardware and firmware identity
 */
string Instrument::GetDescription() const
{
	string location = "UNKNOWN";
	if(m_transport)
		location = m_transport->GetConnectionString();

	return
		"Driver: " + GetDriverName() + "\n" +
		"Name: " + m_nickname + "\n" +
		"Location: " + location + "\n" +
		"HW: " + m_vendor + " " + m_model + " " + m_serial + "\n" +
		"SW: " + m_fwVersion;
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Raw I/O

/**
	@brief Writes one line to the instrument with no status check
 */
void Instrument::Write(const string& data)
{
	lock_guard<recursive_mutex> lock(m_mutex);
	CheckOpen();
	m_transport->SendCommandImmediate(data);
}

/**
	@brief Reads one line from the instrument with no status check
 */
string Instrument::Read()
{
	lock_guard<recursive_mutex> lock(m_mutex);
	CheckOpen();

	lock_guard<recursive_mutex> tlock(m_transport->GetMutex());
	return m_transport->ReadReply();
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Serialization

YAML::Node Instrument::SerializeConfiguration()
{
	YAML::Node node;

	node["nick"] = m_nickname;
	node["name"] = GetName();
	node["vendor"] = GetVendor();
	node["serial"] = GetSerial();
	node["firmware"] = GetFirmwareVersion();
	node["driver"] = GetDriverName();
	node["transport"] = GetTransportName();
	node["args"] = GetTransportConnectionString();

	YAML::Node types;
	if(GetInstrumentTypes() & INST_PSU)
		types.push_back("psu");
	node["types"] = types;

	return node;
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Enumeration

void Instrument::DoAddDriverClass(string name, CreateProcType proc)
{
	m_createprocs[name] = proc;
}

void Instrument::EnumDrivers(vector<string>& names)
{
	for(CreateMapType::iterator it=m_createprocs.begin(); it != m_createprocs.end(); ++it)
		names.push_back(it->first);
}

/**
	@brief Creates and opens an instrument using the named driver

	@return The open instrument, or nullptr if no driver of that name is registered (the transport is deleted)
 */
shared_ptr<Instrument> Instrument::CreateInstrument(const string& driver, const string& nickname, SCPITransport* transport)
{
	if(m_createprocs.find(driver) != m_createprocs.end())
		return m_createprocs[driver](nickname, transport);

	LogError("Invalid driver name \"%s\"\n", driver.c_str());
	delete transport;
	return nullptr;
}
