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
	@brief Declaration of ShutdownCoordinator
 */

#ifndef ShutdownCoordinator_h
#define ShutdownCoordinator_h

/**
	@brief Closes every open instrument when the host application is interrupted

	The host owns the interrupt handling. Its signal handler should only set a flag; the main loop then calls
	Shutdown(), which closes everything in the registry within a deadline. signal_shutdownStarted() and
	signal_shutdownFinished() bracket the shutdown so the host can block and restore its interrupt handler.
 */
class ShutdownCoordinator
{
public:
	ShutdownCoordinator(InstrumentRegistry& registry = InstrumentRegistry::GetInstance());
	virtual ~ShutdownCoordinator();

	bool Shutdown(std::chrono::milliseconds timeout);

	bool IsShutdownInProgress() const
	{ return m_inProgress; }

	sigc::signal<void()> signal_shutdownStarted()
	{ return m_shutdownStartedSignal; }

	sigc::signal<void()> signal_shutdownFinished()
	{ return m_shutdownFinishedSignal; }

protected:
	bool CloseAll(std::chrono::milliseconds timeout, ShutdownError::FailureList& failures);
	void Finish();
	void JoinWorker();

	InstrumentRegistry& m_registry;

	std::atomic<bool> m_inProgress;

	///@brief Close worker from the last shutdown, still running if that shutdown timed out
	std::thread m_worker;

	sigc::signal<void()> m_shutdownStartedSignal;
	sigc::signal<void()> m_shutdownFinishedSignal;
};

#endif
