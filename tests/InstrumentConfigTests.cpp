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
	@brief Tests for SerialFraming and InstrumentConfig
 */

#include <catch2/catch.hpp>

#include "FakeTransport.h"

#include <fstream>
#include <unistd.h>

using namespace std;

TEST_CASE("SerialFraming_Defaults")
{
	SerialFraming framing;
	REQUIRE(framing.m_baudrate == 9600);
	REQUIRE(framing.m_dataBits == 8);
	REQUIRE(framing.m_parity == SerialFraming::PARITY_NONE);
	REQUIRE(framing.m_stopBits == 1);
	REQUIRE(framing.m_xonxoff);
	REQUIRE_FALSE(framing.m_rtscts);
	REQUIRE(framing.m_xoffThreshold == 200);
	REQUIRE(framing.m_xonThreshold == 100);
	REQUIRE(framing.m_timeout == chrono::milliseconds(1000));
	REQUIRE(framing.m_terminator == "\r\n");
	REQUIRE_NOTHROW(framing.Validate());
	REQUIRE(framing.ToString() == "9600 8N1, flow=xon/xoff, timeout=1000 ms");
}

TEST_CASE("SerialFraming_FromYAML")
{
	SECTION("Partial block keeps defaults")
	{
		auto node = YAML::Load("baud: 19200\nparity: even\ntimeout_ms: 250\n");
		auto framing = SerialFraming::FromYAML(node);
		REQUIRE(framing.m_baudrate == 19200);
		REQUIRE(framing.m_parity == SerialFraming::PARITY_EVEN);
		REQUIRE(framing.m_timeout == chrono::milliseconds(250));
		REQUIRE(framing.m_dataBits == 8);
		REQUIRE(framing.m_xonxoff);
	}

	SECTION("Missing block")
	{
		auto framing = SerialFraming::FromYAML(YAML::Node());
		REQUIRE(framing.m_baudrate == 9600);
	}

	SECTION("Bad values")
	{
		REQUIRE_THROWS_AS(SerialFraming::FromYAML(YAML::Load("databits: 9")), invalid_argument);
		REQUIRE_THROWS_AS(SerialFraming::FromYAML(YAML::Load("stopbits: 3")), invalid_argument);
		REQUIRE_THROWS_AS(SerialFraming::FromYAML(YAML::Load("parity: mark")), invalid_argument);
		REQUIRE_THROWS_AS(SerialFraming::FromYAML(YAML::Load("timeout_ms: 0")), invalid_argument);
		REQUIRE_THROWS_AS(SerialFraming::FromYAML(YAML::Load("rtscts: true")), invalid_argument);
		REQUIRE_NOTHROW(SerialFraming::FromYAML(YAML::Load("rtscts: true\nxonxoff: false")));
	}

	SECTION("Serialization reads back")
	{
		SerialFraming framing;
		framing.m_baudrate = 4800;
		framing.m_parity = SerialFraming::PARITY_ODD;
		framing.m_stopBits = 2;

		auto copy = SerialFraming::FromYAML(framing.SerializeConfiguration());
		REQUIRE(copy.m_baudrate == 4800);
		REQUIRE(copy.m_parity == SerialFraming::PARITY_ODD);
		REQUIRE(copy.m_stopBits == 2);
		REQUIRE(copy.m_terminator == "\r\n");
	}
}

static const char* g_sampleConfig =
	"instrument:\n"
	"  name: bench-psu\n"
	"  driver: cpx400dp\n"
	"  transport: uart\n"
	"  location: /dev/ttyUSB0\n"
	"  framing:\n"
	"    baud: 9600\n"
	"    xonxoff: true\n"
	"    timeout_ms: 500\n"
	"shutdown:\n"
	"  timeout_ms: 3000\n";

TEST_CASE("InstrumentConfig_FromYAML")
{
	SECTION("Full document")
	{
		auto config = InstrumentConfig::FromYAML(YAML::Load(g_sampleConfig));
		REQUIRE(config.m_name == "bench-psu");
		REQUIRE(config.m_driver == "cpx400dp");
		REQUIRE(config.m_transport == "uart");
		REQUIRE(config.m_location == "/dev/ttyUSB0");
		REQUIRE(config.m_framing.m_timeout == chrono::milliseconds(500));
		REQUIRE(config.m_shutdownTimeout == chrono::milliseconds(3000));
	}

	SECTION("Location only")
	{
		auto config = InstrumentConfig::FromYAML(YAML::Load("instrument:\n  location: /dev/ttyS0\n"));
		REQUIRE(config.m_driver == "cpx400dp");
		REQUIRE(config.m_transport == "uart");
		REQUIRE(config.m_framing.m_baudrate == 9600);
		REQUIRE(config.m_shutdownTimeout == chrono::milliseconds(5000));
	}

	SECTION("Invalid documents")
	{
		REQUIRE_THROWS_AS(InstrumentConfig::FromYAML(YAML::Load("foo: bar\n")), invalid_argument);
		REQUIRE_THROWS_AS(InstrumentConfig::FromYAML(YAML::Load("instrument:\n  name: x\n")), invalid_argument);
		REQUIRE_THROWS_AS(
			InstrumentConfig::FromYAML(YAML::Load("instrument:\n  location: /dev/ttyS0\n  framing:\n    baud: fast\n")),
			invalid_argument);
		REQUIRE_THROWS_AS(
			InstrumentConfig::FromYAML(YAML::Load("instrument:\n  location: /dev/ttyS0\nshutdown:\n  timeout_ms: -5\n")),
			invalid_argument);
	}

	SECTION("Serialization reads back")
	{
		auto config = InstrumentConfig::FromYAML(YAML::Load(g_sampleConfig));
		auto copy = InstrumentConfig::FromYAML(config.SerializeConfiguration());
		REQUIRE(copy.m_name == config.m_name);
		REQUIRE(copy.m_location == config.m_location);
		REQUIRE(copy.m_framing.m_timeout == config.m_framing.m_timeout);
		REQUIRE(copy.m_shutdownTimeout == config.m_shutdownTimeout);
	}
}

TEST_CASE("InstrumentConfig_Load")
{
	REQUIRE_THROWS_AS(InstrumentConfig::Load("/nonexistent/psu.yml"), invalid_argument);

	char path[] = "/tmp/psuhal-config-XXXXXX";
	int fd = mkstemp(path);
	REQUIRE(fd >= 0);
	close(fd);

	{
		ofstream out(path);
		out << g_sampleConfig;
	}
	auto config = InstrumentConfig::Load(path);
	REQUIRE(config.m_name == "bench-psu");

	{
		ofstream out(path);
		out << "instrument: [unterminated\n";
	}
	REQUIRE_THROWS_AS(InstrumentConfig::Load(path), invalid_argument);

	unlink(path);
}

TEST_CASE("InstrumentConfig_OpenInstrument")
{
	SECTION("Through a registered transport")
	{
		InstrumentConfig config;
		config.m_name = "configured";
		config.m_transport = "fake";
		config.m_location = "nowhere";

		auto inst = config.OpenInstrument();
		REQUIRE(inst->GetNickname() == "configured");
		REQUIRE(inst->IsOpen());
		inst->Close();
	}

	SECTION("Unknown names")
	{
		InstrumentConfig config;
		config.m_location = "nowhere";

		config.m_transport = "carrier-pigeon";
		REQUIRE_THROWS_AS(config.OpenInstrument(), invalid_argument);

		config.m_transport = "fake";
		config.m_driver = "nonexistent";
		REQUIRE_THROWS_AS(config.OpenInstrument(), invalid_argument);
	}

	SECTION("Missing serial device")
	{
		InstrumentConfig config;
		config.m_location = "/dev/psuhal-no-such-port";
		REQUIRE_THROWS_AS(config.OpenInstrument(), TransportOpenError);
	}
}
