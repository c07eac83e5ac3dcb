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
	@brief Declaration of Instrument
 */

#ifndef Instrument_h
#define Instrument_h

/**
	@brief An arbitrary lab instrument reached over a single SCPITransport

	This is the instrument capability set: raw write/read, identification, open/close, and the command level
	send/query/reset API that concrete drivers implement. Device-type capabilities (power supply channels etc) are
	separate interfaces a driver implements alongside this one.

	Instruments are always owned by a shared_ptr. Open() publishes the instrument in the InstrumentRegistry and
	Close() withdraws it, so create them through the driver's Create() factory or CreateInstrument().
 */
class Instrument
	: public std::enable_shared_from_this<Instrument>
{
public:
	Instrument(const std::string& nickname, SCPITransport* transport);
	virtual ~Instrument();

	////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
	// Instrument identification

	enum InstrumentTypes
	{
		//A power supply
		INST_PSU				=  0x04
	};

	/**
		@brief Returns a bitfield describing the set of instrument types that this instrument supports.
	 */
	virtual unsigned int GetInstrumentTypes() const =0;

	//Device information from *IDN?
	std::string GetName() const
	{ return m_model; }

	std::string GetVendor() const
	{ return m_vendor; }

	std::string GetSerial() const
	{ return m_serial; }

	std::string GetFirmwareVersion() const
	{ return m_fwVersion; }

	/**
		@brief User-selected name of the instrument, supplied at creation
	 */
	const std::string& GetNickname() const
	{ return m_nickname; }

	virtual std::string GetDriverName() const =0;

	std::string GetTransportConnectionString();
	std::string GetTransportName();

	std::string GetDescription() const;

	////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
	// Lifecycle

	void Open();
	void Close();
	bool IsOpen() const;

	/**
		@brief The lock serializing every command cycle on this instrument

		Reentrant, since the status check after a command issues its own queries through the same entry points.
	 */
	std::recursive_mutex& GetMutex() const
	{ return m_mutex; }

	////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
	// Command interface

	void Write(const std::string& data);
	std::string Read();

	/**
		@brief Sends a command that produces no response, then checks the device status
	 */
	virtual void Send(const std::string& cmd) =0;

	/**
		@brief Sends a query, reads one response line, then checks the device status
	 */
	virtual std::string Query(const std::string& cmd) =0;

	/**
		@brief Returns the instrument to its power-on default settings
	 */
	virtual void Reset() =0;

	////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
	// Serialization

	virtual YAML::Node SerializeConfiguration();

	////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
	// Driver creation

public:
	typedef std::shared_ptr<Instrument> (*CreateProcType)(const std::string& nickname, SCPITransport* transport);
	static void DoAddDriverClass(std::string name, CreateProcType proc);

	static void EnumDrivers(std::vector<std::string>& names);
	static std::shared_ptr<Instrument> CreateInstrument(
		const std::string& driver,
		const std::string& nickname,
		SCPITransport* transport);

protected:
	virtual void Identify();

	/**
		@brief Driver specific bring-up, run after identification while the open is still in progress
	 */
	virtual void DoOpen()
	{}

	void CheckOpen() const;

	//Class enumeration
	typedef std::map< std::string, CreateProcType > CreateMapType;
	static CreateMapType m_createprocs;

	std::unique_ptr<SCPITransport> m_transport;

	std::string m_nickname;

	//standard *IDN? fields
	std::string m_vendor;
	std::string m_model;
	std::string m_serial;
	std::string m_fwVersion;

	mutable std::recursive_mutex m_mutex;
	bool m_open;
};

#define INSTRUMENT_INITPROC(T) \
	static std::shared_ptr<Instrument> CreateInstance(const std::string& nickname, SCPITransport* transport) \
	{ \
		return T::Create(nickname, transport); \
	} \
	virtual std::string GetDriverName() const override \
	{ return GetDriverNameInternal(); }

#define AddDriverClass(T) Instrument::DoAddDriverClass(T::GetDriverNameInternal(), T::CreateInstance)

#endif
