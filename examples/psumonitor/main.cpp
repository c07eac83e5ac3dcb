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
	@brief Program entry point
 */

#include "../../psuhal/psuhal.h"

#include <signal.h>
#include <string.h>

using namespace std;

//Set from the signal handler, acted on by the main loop
static volatile sig_atomic_t g_interrupted = 0;

static void OnInterrupt(int /*sig*/)
{
	g_interrupted = 1;
}

static void InstallInterruptHandler(void (*handler)(int))
{
	struct sigaction sa;
	memset(&sa, 0, sizeof(sa));
	sa.sa_handler = handler;
	sigemptyset(&sa.sa_mask);
	sigaction(SIGINT, &sa, NULL);
	sigaction(SIGTERM, &sa, NULL);
}

int main(int argc, char* argv[])
{
	Severity console_verbosity = Severity::NOTICE;

	string sconfig = "";
	string spsu = "";

	//Test configuration
	int channel = 1;
	double volts = -1;
	double amps = -1;

	//Parse command-line arguments
	for(int i=1; i<argc; i++)
	{
		string s(argv[i]);

		//Let the logger eat its args first
		if(ParseLoggerArguments(i, argc, argv, console_verbosity))
			continue;

		if(s == "--help")
		{
			fprintf(stderr,
				"Usage: psumonitor [--config file.yml | --psu /dev/ttyUSB0[:baud]] [--channel n] [--volts v] [--amps a]\n");
			return 0;
		}
		else if( (s == "--config") && (i+1 < argc) )
			sconfig = argv[++i];
		else if( (s == "--psu") && (i+1 < argc) )
			spsu = argv[++i];
		else if( (s == "--channel") && (i+1 < argc) )
			channel = atoi(argv[++i]);
		else if( (s == "--volts") && (i+1 < argc) )
			volts = atof(argv[++i]);
		else if( (s == "--amps") && (i+1 < argc) )
			amps = atof(argv[++i]);
		else
		{
			fprintf(stderr, "Unrecognized command-line argument \"%s\", use --help\n", s.c_str());
			return 1;
		}
	}

	//Set up logging
	g_log_sinks.emplace(g_log_sinks.begin(), new ColoredSTDLogSink(console_verbosity));

	TransportStaticInit();
	DriverStaticInit();

	InstrumentConfig config;
	try
	{
		if(!sconfig.empty())
			config = InstrumentConfig::Load(sconfig);
		else if(!spsu.empty())
		{
			config.m_location = spsu;

			//Accept the "device:baud" shorthand
			auto colon = spsu.rfind(':');
			if(colon != string::npos)
			{
				config.m_location = spsu.substr(0, colon);
				config.m_framing.m_baudrate = atoi(spsu.c_str() + colon + 1);
			}
		}
		else
		{
			LogError("No power supply specified, use --config or --psu\n");
			return 1;
		}
	}
	catch(const invalid_argument& ex)
	{
		LogError("%s\n", ex.what());
		return 1;
	}

	ShutdownCoordinator coordinator;

	//No more interrupts while we're closing things down, then back to the default behavior
	coordinator.signal_shutdownStarted().connect([]() { InstallInterruptHandler(SIG_IGN); });
	coordinator.signal_shutdownFinished().connect([]() { InstallInterruptHandler(SIG_DFL); });

	InstallInterruptHandler(OnInterrupt);

	//Held out here so the coordinator, not scope exit, does the closing
	shared_ptr<Instrument> inst;

	int ret = 0;
	try
	{
		inst = config.OpenInstrument();
		auto psu = dynamic_pointer_cast<CPX400DPPowerSupply>(inst);
		if(!psu)
		{
			LogError("%s is not a power supply\n", inst->GetNickname().c_str());
			inst->Close();
			return 1;
		}

		LogNotice("%s\n", psu->GetDescription().c_str());

		psu->signal_limitEvent().connect(
			[](int /*chan*/, StatusRegisters::LimitCondition /*cond*/, const string& message)
			{
				LogNotice("Limit event: %s\n", message.c_str());
			});

		//Initial configuration
		auto ch = psu->GetPowerChannel(channel);
		if(volts >= 0)
			ch->SetVoltageSetPoint(volts);
		if(amps >= 0)
			ch->SetCurrentSetPoint(amps);

		LogNotice("%s: set %.3f V / %.3f A, OVP %.3f V, OCP %.3f A, output %s\n",
			ch->GetHwname().c_str(),
			ch->GetVoltageSetPoint(),
			ch->GetCurrentSetPoint(),
			ch->GetOvervoltageProtection(),
			ch->GetOvercurrentProtection(),
			ch->IsOn() ? "on" : "off");

		//Poll until interrupted
		LogNotice("V,I\n");
		while(!g_interrupted)
		{
			LogNotice("%6.3f,%6.3f\n", ch->GetVoltageMeasured(), ch->GetCurrentMeasured());
			this_thread::sleep_for(chrono::milliseconds(500));
		}

		LogNotice("Interrupted, shutting down\n");
	}
	catch(const InstrumentError& ex)
	{
		LogError("%s\n", ex.what());
		ret = 1;
	}
	catch(const logic_error& ex)
	{
		LogError("%s\n", ex.what());
		ret = 1;
	}

	//Clean up whatever is still open
	try
	{
		coordinator.Shutdown(config.m_shutdownTimeout);
	}
	catch(const ShutdownError& ex)
	{
		LogError("%s\n", ex.what());
		for(auto& f : ex.GetFailures())
			LogError("    %s: %s\n", f.first.c_str(), f.second.c_str());
		ret = 1;
	}

	return ret;
}
