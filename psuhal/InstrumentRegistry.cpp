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
	@brief Implementation of InstrumentRegistry
 */

#include "psuhal.h"

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction / destruction

InstrumentRegistry::InstrumentRegistry()
{
}

InstrumentRegistry& InstrumentRegistry::GetInstance()
{
	static InstrumentRegistry registry;
	return registry;
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Add / remove

void InstrumentRegistry::Add(shared_ptr<Instrument> inst)
{
	lock_guard<mutex> lock(m_mutex);

	for(auto& e : m_instruments)
	{
		if(e.first == inst.get())
			return;
	}

	m_instruments.push_back(Entry(inst.get(), inst));
	LogTrace("Registered %s, %zu instruments open\n", inst->GetNickname().c_str(), m_instruments.size());
}

void InstrumentRegistry::Remove(const Instrument* inst)
{
	lock_guard<mutex> lock(m_mutex);

	for(auto it = m_instruments.begin(); it != m_instruments.end(); ++it)
	{
		if(it->first == inst)
		{
			m_instruments.erase(it);
			LogTrace("Unregistered instrument, %zu still open\n", m_instruments.size());
			return;
		}
	}
}

bool InstrumentRegistry::Contains(const Instrument* inst)
{
	lock_guard<mutex> lock(m_mutex);

	for(auto& e : m_instruments)
	{
		if( (e.first == inst) && !e.second.expired() )
			return true;
	}
	return false;
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Enumeration

/**
	@brief Returns strong references to every instrument still open, in the order they were opened
 */
vector< shared_ptr<Instrument> > InstrumentRegistry::GetOpenInstruments()
{
	lock_guard<mutex> lock(m_mutex);

	vector< shared_ptr<Instrument> > ret;
	for(auto& e : m_instruments)
	{
		auto inst = e.second.lock();
		if(inst)
			ret.push_back(inst);
	}
	return ret;
}

/**
	@brief Drops entries whose instrument no longer exists

	@return Number of entries removed
 */
size_t InstrumentRegistry::PurgeExpired()
{
	lock_guard<mutex> lock(m_mutex);

	size_t n = 0;
	auto it = m_instruments.begin();
	while(it != m_instruments.end())
	{
		if(it->second.expired())
		{
			it = m_instruments.erase(it);
			n++;
		}
		else
			++it;
	}

	if(n)
		LogWarning("Purged %zu instruments that were destroyed without being closed\n", n);
	return n;
}

size_t InstrumentRegistry::GetCount()
{
	lock_guard<mutex> lock(m_mutex);
	return m_instruments.size();
}
