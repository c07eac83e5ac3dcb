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
	@brief Declaration of ScopedInstrument
 */

#ifndef ScopedInstrument_h
#define ScopedInstrument_h

/**
	@brief Holds an open instrument and closes it when leaving scope, on every exit path

	Other shared_ptr owners may keep the object alive afterwards, but it will be closed and out of the registry.
 */
template<class T>
class ScopedInstrument
{
public:
	explicit ScopedInstrument(std::shared_ptr<T> inst)
		: m_inst(inst)
	{}

	~ScopedInstrument()
	{
		if(!m_inst)
			return;

		try
		{
			m_inst->Close();
		}
		catch(const std::exception& ex)
		{
			LogError("Failed to close %s on scope exit: %s\n", m_inst->GetNickname().c_str(), ex.what());
		}
	}

	ScopedInstrument(const ScopedInstrument&) =delete;
	ScopedInstrument& operator=(const ScopedInstrument&) =delete;

	T* operator->() const
	{ return m_inst.get(); }

	T& operator*() const
	{ return *m_inst; }

	std::shared_ptr<T> get() const
	{ return m_inst; }

protected:
	std::shared_ptr<T> m_inst;
};

#endif
