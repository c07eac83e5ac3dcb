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
	@brief Implementation of SCPITransport
 */

#include "psuhal.h"

using namespace std;

SCPITransport::CreateMapType SCPITransport::m_createprocs;

SCPITransport::SCPITransport()
	: m_terminator("\r\n")
{
}

SCPITransport::~SCPITransport()
{
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Enumeration

void SCPITransport::DoAddTransportClass(string name, CreateProcType proc)
{
	m_createprocs[name] = proc;
}

void SCPITransport::EnumTransports(vector<string>& names)
{
	for(CreateMapType::iterator it=m_createprocs.begin(); it != m_createprocs.end(); ++it)
		names.push_back(it->first);
}

/**
	@brief Creates a transport by name

	@return The new transport, or NULL if no transport class of that name is registered. Failures to open the
	link itself are reported by the transport constructor.
 */
SCPITransport* SCPITransport::CreateTransport(const string& transport, const string& args)
{
	if(m_createprocs.find(transport) != m_createprocs.end())
		return m_createprocs[transport](args);

	LogError("Invalid transport name \"%s\"\n", transport.c_str());
	return NULL;
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Line helpers

/**
	@brief Appends the line terminator to a command unless it already ends with it
 */
string SCPITransport::TerminateLine(const string& cmd) const
{
	if( (cmd.length() >= m_terminator.length()) &&
		(cmd.compare(cmd.length() - m_terminator.length(), m_terminator.length(), m_terminator) == 0) )
	{
		return cmd;
	}

	return cmd + m_terminator;
}

/**
	@brief Throws away anything sitting unread in the receive path

	Leftover input at this point belongs to some earlier, mis-sequenced exchange and must never be taken as the
	reply to the next query.

	@return Number of bytes discarded
 */
size_t SCPITransport::DiscardStaleInput()
{
	lock_guard<recursive_mutex> lock(m_netMutex);

	if(GetPendingByteCount() == 0)
		return 0;

	size_t n = FlushRXBuffer();
	LogWarning("Flushed %zu bytes of unread content from the input buffer of %s\n",
		n, GetConnectionString().c_str());
	return n;
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Immediate command API

/**
	@brief Sends a command which does not require a response
 */
void SCPITransport::SendCommandImmediate(const string& cmd)
{
	lock_guard<recursive_mutex> lock(m_netMutex);
	SendCommand(cmd);
}

/**
	@brief Sends a command, then returns the response.

	Stale input is discarded before the command goes out. This is an atomic operation requiring no mutexing at the
	caller side.
 */
string SCPITransport::SendCommandImmediateWithReply(const string& cmd)
{
	lock_guard<recursive_mutex> lock(m_netMutex);

	DiscardStaleInput();
	SendCommand(cmd);

	return ReadReply();
}
