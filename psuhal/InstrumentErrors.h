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
	@brief Exception types raised by transports, drivers and the shutdown coordinator
 */

#ifndef InstrumentErrors_h
#define InstrumentErrors_h

/**
	@brief Base class for every failure reported by libpsuhal
 */
class InstrumentError : public std::runtime_error
{
public:
	explicit InstrumentError(const std::string& what)
		: std::runtime_error(what)
	{}
};

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Transport layer

/**
	@brief The device file does not exist or the link could not be configured
 */
class TransportOpenError : public InstrumentError
{
public:
	explicit TransportOpenError(const std::string& what)
		: InstrumentError(what)
	{}
};

/**
	@brief A write to the link failed or was short
 */
class TransportWriteError : public InstrumentError
{
public:
	explicit TransportWriteError(const std::string& what)
		: InstrumentError(what)
	{}
};

/**
	@brief The link reported an I/O error or hangup while reading
 */
class TransportReadError : public InstrumentError
{
public:
	explicit TransportReadError(const std::string& what)
		: InstrumentError(what)
	{}
};

/**
	@brief No response arrived before the read timeout elapsed
 */
class TransportTimeoutError : public InstrumentError
{
public:
	explicit TransportTimeoutError(const std::string& what)
		: InstrumentError(what)
	{}
};

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Protocol layer

/**
	@brief Malformed response, or a query/command parsing error reported by the device
 */
class ProtocolParseError : public InstrumentError
{
public:
	explicit ProtocolParseError(const std::string& what)
		: InstrumentError(what)
	{}
};

/**
	@brief A register value that cannot exist on the hardware (out of 8-bit range, read-back mismatch, etc)

	Fatal for the operation in flight only. The instrument stays usable.
 */
class ProtocolConsistencyError : public InstrumentError
{
public:
	explicit ProtocolConsistencyError(const std::string& what)
		: InstrumentError(what)
	{}
};

/**
	@brief The device rejected a command and reported the reason in the execution error register
 */
class DeviceExecutionError : public InstrumentError
{
public:
	DeviceExecutionError(int code, const std::string& message)
		: InstrumentError(message)
		, m_code(code)
		, m_message(message)
	{}

	int GetCode() const
	{ return m_code; }

	const std::string& GetMessage() const
	{ return m_message; }

protected:
	int m_code;
	std::string m_message;
};

/**
	@brief The execution error register held a code that is not in the documented table
 */
class UnknownExecutionErrorCode : public InstrumentError
{
public:
	explicit UnknownExecutionErrorCode(long code)
		: InstrumentError(std::string("Unknown execution error code ") + std::to_string(code))
		, m_code(code)
	{}

	long GetCode() const
	{ return m_code; }

protected:
	long m_code;
};

/**
	@brief Device-side verify timeout (ESR bit 3)
 */
class DeviceTimeoutError : public InstrumentError
{
public:
	explicit DeviceTimeoutError(const std::string& what)
		: InstrumentError(what)
	{}
};

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Shutdown

/**
	@brief One or more instruments failed to close during a coordinated shutdown
 */
class ShutdownError : public InstrumentError
{
public:
	typedef std::vector< std::pair<std::string, std::string> > FailureList;

	ShutdownError(const std::string& what, const FailureList& failures)
		: InstrumentError(what)
		, m_failures(failures)
	{}

	/**
		@brief Instrument name and failure reason for every close that did not complete
	 */
	const FailureList& GetFailures() const
	{ return m_failures; }

protected:
	FailureList m_failures;
};

/**
	@brief The shutdown deadline elapsed before every instrument was closed
 */
class ShutdownTimeoutError : public ShutdownError
{
public:
	ShutdownTimeoutError(const std::string& what, const FailureList& failures)
		: ShutdownError(what, failures)
	{}
};

#endif
