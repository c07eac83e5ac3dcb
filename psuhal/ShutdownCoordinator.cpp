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
	@brief Implementation of ShutdownCoordinator
 */

#include "psuhal.h"

using namespace std;

/**
	@brief Progress of the close worker, shared between it and the waiting caller
 */
class ShutdownProgress
{
public:
	ShutdownProgress()
		: m_closed(0)
		, m_done(false)
	{}

	mutex m_mutex;
	condition_variable m_cond;

	size_t m_closed;
	bool m_done;
	ShutdownError::FailureList m_failures;
};

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction / destruction

ShutdownCoordinator::ShutdownCoordinator(InstrumentRegistry& registry)
	: m_registry(registry)
	, m_inProgress(false)
{
}

/**
	@brief Waits for a close worker left behind by a timed out shutdown

	The worker uses the registry and the log sinks, so it must be done before static destruction starts.
 */
ShutdownCoordinator::~ShutdownCoordinator()
{
	JoinWorker();
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Shutdown

/**
	@brief Closes every instrument in the registry

	@param timeout	Deadline for the whole shutdown

	@return False if a shutdown was already in progress and this request was ignored, true once everything closed

	@throw ShutdownTimeoutError if the deadline passed first, ShutdownError if any close failed. Both list every
	instrument that was not closed cleanly.
 */
bool ShutdownCoordinator::Shutdown(chrono::milliseconds timeout)
{
	if(m_inProgress.exchange(true))
	{
		LogWarning("Shutdown already in progress, ignoring request\n");
		return false;
	}

	LogDebug("Shutting down (timeout %lld ms)\n", static_cast<long long>(timeout.count()));

	//Anything a previous timed out shutdown was still closing has to finish first
	JoinWorker();

	ShutdownError::FailureList failures;
	bool complete = false;
	try
	{
		LogIndenter li;
		m_shutdownStartedSignal.emit();
		complete = CloseAll(timeout, failures);
	}
	catch(const exception& ex)
	{
		LogError("Shutdown aborted: %s\n", ex.what());
		Finish();
		throw;
	}
	Finish();

	if(!complete)
	{
		string names;
		for(auto& f : failures)
			names += " " + f.first;
		LogError("Shutdown timed out, still open:%s\n", names.c_str());
		throw ShutdownTimeoutError("Shutdown timed out, still open:" + names, failures);
	}

	if(!failures.empty())
	{
		string names;
		for(auto& f : failures)
			names += " " + f.first;
		throw ShutdownError("Failed to close" + names, failures);
	}

	LogDebug("Shutdown complete\n");
	return true;
}

void ShutdownCoordinator::Finish()
{
	m_inProgress = false;
	m_shutdownFinishedSignal.emit();
}

/**
	@brief Blocks until the close worker exits

	Each close is bounded by the transport timeout, so this is too.
 */
void ShutdownCoordinator::JoinWorker()
{
	if(!m_worker.joinable())
		return;

	LogDebug("Waiting for outstanding closes\n");
	m_worker.join();
}

/**
	@brief Closes instruments in registry order on a worker thread and waits for it until the deadline

	The worker keeps running past the deadline, so a close that was stuck behind a command in flight still happens
	eventually. It is joined by the next Shutdown() or by the destructor.

	@return True if the worker finished in time
 */
bool ShutdownCoordinator::CloseAll(chrono::milliseconds timeout, ShutdownError::FailureList& failures)
{
	auto deadline = chrono::steady_clock::now() + timeout;

	auto instruments = m_registry.GetOpenInstruments();
	LogDebug("Closing %zu instruments\n", instruments.size());

	auto progress = make_shared<ShutdownProgress>();
	m_worker = thread([instruments, progress]()
	{
		for(auto& inst : instruments)
		{
			try
			{
				inst->Close();
			}
			catch(const exception& ex)
			{
				LogError("Failed to close %s: %s\n", inst->GetNickname().c_str(), ex.what());

				lock_guard<mutex> lock(progress->m_mutex);
				progress->m_failures.push_back(make_pair(inst->GetNickname(), string(ex.what())));
			}

			lock_guard<mutex> lock(progress->m_mutex);
			progress->m_closed ++;
		}

		lock_guard<mutex> lock(progress->m_mutex);
		progress->m_done = true;
		progress->m_cond.notify_all();
	});

	bool done;
	{
		unique_lock<mutex> lock(progress->m_mutex);
		done = progress->m_cond.wait_until(lock, deadline, [&]{ return progress->m_done; });

		failures = progress->m_failures;
		if(!done)
		{
			for(size_t i=progress->m_closed; i<instruments.size(); i++)
			{
				failures.push_back(make_pair(
					instruments[i]->GetNickname(), string("close did not finish before the deadline")));
			}
		}
	}

	if(done)
		m_worker.join();
	return done;
}
