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
	@author Alyssa Milburn
	@brief Declaration of SCPIUARTTransport
 */

#ifndef SCPIUARTTransport_h
#define SCPIUARTTransport_h

/**
	@brief Line oriented transport over a POSIX serial port

	The connection string is "devfile" or "devfile:baud". Everything else comes from SerialFraming.
 */
class SCPIUARTTransport : public SCPITransport
{
public:
	SCPIUARTTransport(const std::string& args);
	SCPIUARTTransport(const std::string& devfile, const SerialFraming& framing);
	virtual ~SCPIUARTTransport();

	virtual std::string GetConnectionString() override;
	static std::string GetTransportName();

	virtual void SendCommand(const std::string& cmd) override;
	virtual std::string ReadReply() override;
	virtual size_t GetPendingByteCount() override;
	virtual size_t FlushRXBuffer() override;
	virtual std::pair<size_t, size_t> FlushBuffers() override;
	virtual bool IsConnected() override;
	virtual void Close() override;

	const SerialFraming& GetFraming() const
	{ return m_framing; }

	void ApplyFraming(const SerialFraming& framing);

	TRANSPORT_INITPROC(SCPIUARTTransport)

protected:
	void Open();
	void WriteAll(const std::string& data);
	bool ReadChunk(std::chrono::steady_clock::time_point deadline);

	int m_fd;

	std::string m_devfile;
	SerialFraming m_framing;

	//Bytes already pulled from the port but not yet returned as a line
	std::string m_rxBuffer;
};

#endif
