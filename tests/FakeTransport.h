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
	@brief Declaration of FakeTransport
 */

#ifndef FakeTransport_h
#define FakeTransport_h

#include "psuhal.h"

/**
	@brief Scripted in-memory transport standing in for a CPX400DP on a serial port

	Queries are answered from a response table that starts out as an idle, healthy CPX400DP. In echo mode every set
	command ("V1 12.345") becomes the reply to the matching query ("V1?"), the way the real device reads back its
	settings. Queries with no entry in the table time out.

	Everything written is kept as a raw byte stream, written one byte at a time so that overlapping writers would
	show up interleaved, and as a list of lines.
 */
class FakeTransport : public SCPITransport
{
public:
	FakeTransport(const std::string& args = "");
	virtual ~FakeTransport();

	virtual std::string GetConnectionString() override
	{ return "fake:0"; }

	static std::string GetTransportName()
	{ return "fake"; }

	virtual void SendCommand(const std::string& cmd) override;
	virtual std::string ReadReply() override;
	virtual size_t GetPendingByteCount() override;
	virtual size_t FlushRXBuffer() override;
	virtual std::pair<size_t, size_t> FlushBuffers() override;
	virtual bool IsConnected() override;
	virtual void Close() override;

	TRANSPORT_INITPROC(FakeTransport)

	//Scripting
	void SetResponse(const std::string& query, const std::string& reply);
	void RemoveResponse(const std::string& query);
	void QueueResponse(const std::string& query, const std::string& reply);
	void SetEcho(bool echo);
	void InjectStaleInput(const std::string& line);
	void SetCloseFailure(bool fail);

	//Inspection
	std::vector<std::string> GetLines();
	std::string GetWire();
	void ClearLog();
	size_t CountLine(const std::string& line);
	int GetCloseCount();
	size_t GetDiscardedCount();

protected:
	std::mutex m_stateMutex;

	std::map<std::string, std::string> m_responses;
	std::map<std::string, std::deque<std::string> > m_queued;
	bool m_echo;

	std::deque<std::string> m_rx;
	size_t m_discarded;

	std::vector<std::string> m_lines;
	std::string m_wire;

	bool m_connected;
	bool m_failClose;
	int m_closeCount;
};

std::shared_ptr<CPX400DPPowerSupply> OpenFakeSupply(FakeTransport* fake, const std::string& nickname = "psu");

#endif
