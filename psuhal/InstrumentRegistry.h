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
	@brief Declaration of InstrumentRegistry
 */

#ifndef InstrumentRegistry_h
#define InstrumentRegistry_h

/**
	@brief Process-wide list of every instrument that is currently open

	Entries are added by Instrument::Open() and removed by Instrument::Close(). The registry holds weak references
	only, so it never keeps an instrument alive; an instrument whose last owner let go without closing it removes
	itself from its destructor, and GetOpenInstruments() skips anything that has already expired.
 */
class InstrumentRegistry
{
public:
	static InstrumentRegistry& GetInstance();

	void Add(std::shared_ptr<Instrument> inst);
	void Remove(const Instrument* inst);
	bool Contains(const Instrument* inst);

	std::vector< std::shared_ptr<Instrument> > GetOpenInstruments();
	size_t PurgeExpired();
	size_t GetCount();

protected:
	InstrumentRegistry();

	std::mutex m_mutex;

	//Insertion order, so shutdown closes instruments in the order they were opened
	typedef std::pair< const Instrument*, std::weak_ptr<Instrument> > Entry;
	std::list<Entry> m_instruments;
};

#endif
