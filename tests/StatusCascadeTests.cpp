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
	@brief Tests for the status register cascade run after every command
 */

#include <catch2/catch.hpp>

#include "FakeTransport.h"

using namespace std;

static bool HasLine(const vector<string>& lines, const string& line)
{
	return find(lines.begin(), lines.end(), line) != lines.end();
}

TEST_CASE("StatusCascade_VisitsSelectedRegisters")
{
	auto fake = new FakeTransport;
	auto psu = OpenFakeSupply(fake);

	for(int stb=0; stb<256; stb++)
	{
		fake->ClearLog();
		fake->QueueResponse("*STB?", to_string(stb));

		psu->Send("*CLS");

		auto lines = fake->GetLines();
		INFO("STB = " << stb);
		REQUIRE(lines.size() >= 2);
		REQUIRE(lines[0] == "*CLS");
		REQUIRE(lines[1] == "*STB?");
		REQUIRE(HasLine(lines, "LSR1?") == ((stb & 0x01) != 0));
		REQUIRE(HasLine(lines, "LSR2?") == ((stb & 0x02) != 0));
		REQUIRE(HasLine(lines, "*ESR?") == ((stb & 0x20) != 0));
		REQUIRE_FALSE(HasLine(lines, "EER?"));

		size_t expected = 2;
		if(stb & 0x01)
			expected ++;
		if(stb & 0x02)
			expected ++;
		if(stb & 0x20)
			expected ++;
		REQUIRE(lines.size() == expected);
	}

	psu->Close();
}

TEST_CASE("StatusCascade_LimitWarningAndExecutionError")
{
	auto fake = new FakeTransport;
	auto psu = OpenFakeSupply(fake);

	vector<string> warnings;
	vector<int> channels;
	psu->signal_limitEvent().connect(
		[&](int chan, StatusRegisters::LimitCondition, const string& message)
		{
			channels.push_back(chan);
			warnings.push_back(message);
		});

	fake->QueueResponse("*STB?", "33");
	fake->QueueResponse("LSR1?", "4");
	fake->QueueResponse("*ESR?", "16");
	fake->QueueResponse("EER?", "104");

	int code = 0;
	string message;
	try
	{
		psu->Send("V1 50.000");
		FAIL("No exception raised");
	}
	catch(const DeviceExecutionError& ex)
	{
		code = ex.GetCode();
		message = ex.GetMessage();
	}

	REQUIRE(code == 104);
	REQUIRE(message == "104: Command not valid with output on");
	REQUIRE(warnings.size() == 1);
	REQUIRE(warnings[0] == "CH1 over voltage trip occurred");
	REQUIRE(channels[0] == 1);

	//Every register pointed at was read
	REQUIRE(fake->CountLine("LSR1?") == 1);
	REQUIRE(fake->CountLine("*ESR?") == 1);
	REQUIRE(fake->CountLine("EER?") == 1);

	//The supply is still usable afterwards
	REQUIRE_NOTHROW(psu->Send("V1 5.000"));

	psu->Close();
}

TEST_CASE("StatusCascade_LimitConditionsOnBothChannels")
{
	auto fake = new FakeTransport;
	auto psu = OpenFakeSupply(fake);

	vector<pair<int, StatusRegisters::LimitCondition>> events;
	psu->signal_limitEvent().connect(
		[&](int chan, StatusRegisters::LimitCondition cond, const string&)
		{
			events.push_back(make_pair(chan, cond));
		});

	//CH1 in CC mode, CH2 tripped on overcurrent and needs a front panel reset
	fake->QueueResponse("*STB?", "3");
	fake->QueueResponse("LSR1?", "2");
	fake->QueueResponse("LSR2?", "72");

	REQUIRE_NOTHROW(psu->GetPowerChannel(1)->GetVoltageSetPoint());

	REQUIRE(events.size() == 3);
	REQUIRE(events[0] == make_pair(1, StatusRegisters::LIMIT_CURRENT_MODE));
	REQUIRE(events[1] == make_pair(2, StatusRegisters::LIMIT_OVERCURRENT_TRIP));
	REQUIRE(events[2] == make_pair(2, StatusRegisters::LIMIT_HARD_TRIP));

	psu->Close();
}

TEST_CASE("StatusCascade_EventStatusErrors")
{
	auto fake = new FakeTransport;
	auto psu = OpenFakeSupply(fake);

	SECTION("Query error")
	{
		fake->QueueResponse("*STB?", "32");
		fake->QueueResponse("*ESR?", "4");
		REQUIRE_THROWS_AS(psu->Send("V1 1.000"), ProtocolParseError);
	}

	SECTION("Verify timeout")
	{
		fake->QueueResponse("*STB?", "32");
		fake->QueueResponse("*ESR?", "8");
		REQUIRE_THROWS_AS(psu->Send("V1 1.000"), DeviceTimeoutError);
	}

	SECTION("Command error")
	{
		fake->QueueResponse("*STB?", "32");
		fake->QueueResponse("*ESR?", "32");
		REQUIRE_THROWS_AS(psu->Send("BOGUS"), ProtocolParseError);
	}

	SECTION("Operation complete and power on are informational")
	{
		fake->QueueResponse("*STB?", "32");
		fake->QueueResponse("*ESR?", "129");
		REQUIRE_NOTHROW(psu->Send("V1 1.000"));
		REQUIRE(fake->CountLine("EER?") == 0);
	}

	SECTION("Query error does not stop EER from being read")
	{
		fake->QueueResponse("*STB?", "32");
		fake->QueueResponse("*ESR?", "20");
		fake->QueueResponse("EER?", "104");
		REQUIRE_THROWS_AS(psu->Send("V1 1.000"), ProtocolParseError);
		REQUIRE(fake->CountLine("EER?") == 1);
	}

	SECTION("Execution error is reported ahead of a command error")
	{
		fake->QueueResponse("*STB?", "32");
		fake->QueueResponse("*ESR?", "48");
		fake->QueueResponse("EER?", "100");
		REQUIRE_THROWS_AS(psu->Send("V1 1.000"), DeviceExecutionError);
	}

	SECTION("EER of zero is not an error")
	{
		fake->QueueResponse("*STB?", "32");
		fake->QueueResponse("*ESR?", "16");
		fake->QueueResponse("EER?", "0");
		REQUIRE_NOTHROW(psu->Send("V1 1.000"));
	}

	SECTION("Unknown EER code")
	{
		fake->QueueResponse("*STB?", "32");
		fake->QueueResponse("*ESR?", "16");
		fake->QueueResponse("EER?", "150");

		long code = 0;
		try
		{
			psu->Send("V1 1.000");
			FAIL("No exception raised");
		}
		catch(const UnknownExecutionErrorCode& ex)
		{
			code = ex.GetCode();
		}
		REQUIRE(code == 150);
	}

	SECTION("EER code wider than an int is not folded onto a documented one")
	{
		//4294967400 is 104 modulo 2^32
		fake->QueueResponse("*STB?", "32");
		fake->QueueResponse("*ESR?", "16");
		fake->QueueResponse("EER?", "4294967400");

		long code = 0;
		try
		{
			psu->Send("V1 1.000");
			FAIL("No exception raised");
		}
		catch(const UnknownExecutionErrorCode& ex)
		{
			code = ex.GetCode();
		}
		REQUIRE(code == 4294967400L);
	}

	psu->Close();
}

TEST_CASE("StatusCascade_ConsistencyErrors")
{
	auto fake = new FakeTransport;
	auto psu = OpenFakeSupply(fake);

	SECTION("STB above 255")
	{
		fake->QueueResponse("*STB?", "256");
		REQUIRE_THROWS_AS(psu->Send("V1 1.000"), ProtocolConsistencyError);
	}

	SECTION("Negative LSR")
	{
		fake->QueueResponse("*STB?", "1");
		fake->QueueResponse("LSR1?", "-1");
		REQUIRE_THROWS_AS(psu->Send("V1 1.000"), ProtocolConsistencyError);
	}

	SECTION("ESR above 255")
	{
		fake->QueueResponse("*STB?", "32");
		fake->QueueResponse("*ESR?", "1000");
		REQUIRE_THROWS_AS(psu->Send("V1 1.000"), ProtocolConsistencyError);
	}

	SECTION("Garbage STB")
	{
		fake->QueueResponse("*STB?", "hello");
		REQUIRE_THROWS_AS(psu->Send("V1 1.000"), ProtocolParseError);
	}

	//Only the operation in flight fails
	REQUIRE(psu->IsOpen());
	REQUIRE_NOTHROW(psu->Send("V1 2.000"));
	REQUIRE(psu->GetPowerVoltageNominal(1) == Approx(2.0));

	psu->Close();
}

TEST_CASE("StatusCascade_QueryTimeout")
{
	auto fake = new FakeTransport;
	auto psu = OpenFakeSupply(fake);

	SECTION("Status is still checked")
	{
		fake->RemoveResponse("V1O?");
		REQUIRE_THROWS_AS(psu->GetPowerVoltageActual(1), TransportTimeoutError);

		auto lines = fake->GetLines();
		REQUIRE(lines.size() == 2);
		REQUIRE(lines[0] == "V1O?");
		REQUIRE(lines[1] == "*STB?");
	}

	SECTION("Timeout wins over a status error")
	{
		fake->RemoveResponse("V1O?");
		fake->QueueResponse("*STB?", "32");
		fake->QueueResponse("*ESR?", "4");
		REQUIRE_THROWS_AS(psu->GetPowerVoltageActual(1), TransportTimeoutError);
		REQUIRE(fake->CountLine("*ESR?") == 1);
	}

	SECTION("Timeout wins over a failed status check")
	{
		fake->RemoveResponse("V1O?");
		fake->RemoveResponse("*STB?");
		REQUIRE_THROWS_AS(psu->GetPowerVoltageActual(1), TransportTimeoutError);
	}

	psu->Close();
}

TEST_CASE("StatusCascade_StaleInputDiscarded")
{
	auto fake = new FakeTransport;
	auto psu = OpenFakeSupply(fake);

	fake->SetResponse("V1?", "V1 3.300");
	fake->InjectStaleInput("V2 9.999");

	REQUIRE(psu->GetPowerVoltageNominal(1) == Approx(3.3));
	REQUIRE(fake->GetDiscardedCount() == 1);

	psu->Close();
}
