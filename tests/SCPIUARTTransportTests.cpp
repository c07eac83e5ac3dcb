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
	@brief Tests for SCPIUARTTransport against a pseudo-terminal standing in for the serial port
 */

#include <catch2/catch.hpp>

#include "FakeTransport.h"

#include <fcntl.h>
#include <poll.h>
#include <stdlib.h>
#include <unistd.h>

using namespace std;

/**
	@brief Master side of a pty pair. The transport under test opens the slave side.
 */
class PseudoTerminal
{
public:
	PseudoTerminal()
	{
		m_master = posix_openpt(O_RDWR | O_NOCTTY);
		if(m_master < 0)
			throw runtime_error("posix_openpt failed");
		if( (grantpt(m_master) != 0) || (unlockpt(m_master) != 0) )
		{
			close(m_master);
			throw runtime_error("Couldn't unlock pty");
		}
		m_slave = ptsname(m_master);
	}

	~PseudoTerminal()
	{
		close(m_master);
	}

	const string& GetSlave() const
	{ return m_slave; }

	void Write(const string& data)
	{
		if(write(m_master, data.c_str(), data.length()) != static_cast<ssize_t>(data.length()))
			throw runtime_error("Short write to pty");
	}

	/**
		@brief Reads until at least len bytes arrived or the timeout passed
	 */
	string Read(size_t len, chrono::milliseconds timeout = chrono::milliseconds(1000))
	{
		string ret;
		auto deadline = chrono::steady_clock::now() + timeout;
		while(ret.length() < len)
		{
			auto remaining = chrono::duration_cast<chrono::milliseconds>(deadline - chrono::steady_clock::now());
			if(remaining.count() <= 0)
				break;

			struct pollfd pfd;
			pfd.fd = m_master;
			pfd.events = POLLIN;
			pfd.revents = 0;
			if(poll(&pfd, 1, static_cast<int>(remaining.count())) <= 0)
				break;

			char buf[128];
			ssize_t n = read(m_master, buf, sizeof(buf));
			if(n <= 0)
				break;
			ret.append(buf, n);
		}
		return ret;
	}

protected:
	int m_master;
	string m_slave;
};

static SerialFraming TestFraming()
{
	SerialFraming framing;
	framing.m_timeout = chrono::milliseconds(200);
	return framing;
}

TEST_CASE("SCPIUARTTransport_OpenFailure")
{
	REQUIRE_THROWS_AS(SCPIUARTTransport("/dev/psuhal-no-such-port", SerialFraming()), TransportOpenError);
	REQUIRE_THROWS_AS(SCPIUARTTransport("/dev/psuhal-no-such-port:9600"), TransportOpenError);
	REQUIRE_THROWS_AS(SCPITransport::CreateTransport("uart", "/dev/psuhal-no-such-port"), TransportOpenError);
}

TEST_CASE("SCPIUARTTransport_LineIO")
{
	PseudoTerminal pty;
	SCPIUARTTransport uart(pty.GetSlave(), TestFraming());

	REQUIRE(uart.IsConnected());
	REQUIRE(uart.GetName() == "uart");
	REQUIRE(uart.GetConnectionString() == pty.GetSlave() + ":9600");

	SECTION("Commands are terminated")
	{
		uart.SendCommand("V1 12.345");
		REQUIRE(pty.Read(11) == "V1 12.345\r\n");

		//Already terminated lines are sent as is
		uart.SendCommand("OP1 1\r\n");
		REQUIRE(pty.Read(7) == "OP1 1\r\n");
	}

	SECTION("Replies are split on the terminator")
	{
		pty.Write("V1 1.000\r\n12.301V\r\n");
		REQUIRE(uart.ReadReply() == "V1 1.000");
		REQUIRE(uart.ReadReply() == "12.301V");
	}

	SECTION("Reply arriving in pieces")
	{
		thread writer([&]()
		{
			pty.Write("THURLBY,CPX");
			this_thread::sleep_for(chrono::milliseconds(20));
			pty.Write("400DP,12345,1.03\r\n");
		});
		auto reply = uart.ReadReply();
		writer.join();
		REQUIRE(reply == "THURLBY,CPX400DP,12345,1.03");
	}

	SECTION("Nothing arrives")
	{
		auto start = chrono::steady_clock::now();
		REQUIRE_THROWS_AS(uart.ReadReply(), TransportTimeoutError);
		REQUIRE(chrono::steady_clock::now() - start >= chrono::milliseconds(150));
	}

	SECTION("Unterminated reply is returned after the timeout")
	{
		pty.Write("12.3");
		REQUIRE(uart.ReadReply() == "12.3");
	}

	SECTION("Stale input is discarded before a query")
	{
		pty.Write("junk\r\n");
		this_thread::sleep_for(chrono::milliseconds(50));
		REQUIRE(uart.GetPendingByteCount() == 6);

		thread device([&]()
		{
			if(!pty.Read(5).empty())
				pty.Write("0\r\n");
		});
		string reply;
		try
		{
			reply = uart.SendCommandImmediateWithReply("*STB?");
		}
		catch(const InstrumentError&)
		{
			device.join();
			throw;
		}
		device.join();

		REQUIRE(reply == "0");
		REQUIRE(uart.GetPendingByteCount() == 0);
	}

	SECTION("Flush reports what was discarded")
	{
		pty.Write("leftover\r\n");
		this_thread::sleep_for(chrono::milliseconds(50));

		auto flushed = uart.FlushBuffers();
		REQUIRE(flushed.first == 10);
		REQUIRE(uart.GetPendingByteCount() == 0);
		REQUIRE_THROWS_AS(uart.ReadReply(), TransportTimeoutError);
	}

	SECTION("Close is idempotent")
	{
		uart.Close();
		REQUIRE_FALSE(uart.IsConnected());
		uart.Close();
		REQUIRE_FALSE(uart.IsConnected());
		REQUIRE_THROWS_AS(uart.ReadReply(), TransportReadError);
	}
}

TEST_CASE("SCPIUARTTransport_Framing")
{
	PseudoTerminal pty;
	SCPIUARTTransport uart(pty.GetSlave(), TestFraming());

	REQUIRE(uart.GetFraming().m_baudrate == 9600);
	REQUIRE(uart.GetFraming().m_xonxoff);

	SerialFraming framing = TestFraming();
	framing.m_baudrate = 19200;
	framing.m_parity = SerialFraming::PARITY_EVEN;
	uart.ApplyFraming(framing);

	REQUIRE(uart.GetFraming().m_baudrate == 19200);
	REQUIRE(uart.GetFraming().m_parity == SerialFraming::PARITY_EVEN);
	REQUIRE(uart.GetConnectionString() == pty.GetSlave() + ":19200");

	framing.m_baudrate = 12345;
	REQUIRE_THROWS_AS(uart.ApplyFraming(framing), TransportOpenError);

	framing = TestFraming();
	framing.m_dataBits = 9;
	REQUIRE_THROWS_AS(uart.ApplyFraming(framing), TransportOpenError);
	REQUIRE(uart.GetFraming().m_baudrate == 19200);
}

TEST_CASE("SCPIUARTTransport_BadFramingOnOpen")
{
	PseudoTerminal pty;

	REQUIRE_THROWS_AS(SCPIUARTTransport(pty.GetSlave() + ":0"), TransportOpenError);

	SerialFraming framing = TestFraming();
	framing.m_stopBits = 3;
	REQUIRE_THROWS_AS(SCPIUARTTransport(pty.GetSlave(), framing), TransportOpenError);

	framing = TestFraming();
	framing.m_rtscts = true;
	REQUIRE_THROWS_AS(SCPIUARTTransport(pty.GetSlave(), framing), TransportOpenError);
}

TEST_CASE("SCPIUARTTransport_LongDevicePath")
{
	PseudoTerminal pty;

	char dir[] = "/tmp/psuhal-uart-XXXXXX";
	REQUIRE(mkdtemp(dir) != nullptr);
	string link = string(dir) + "/" + string(200, 'p');
	REQUIRE(symlink(pty.GetSlave().c_str(), link.c_str()) == 0);

	string connstring;
	{
		SCPIUARTTransport uart(link + ":19200");
		connstring = uart.GetConnectionString();
	}
	unlink(link.c_str());
	rmdir(dir);

	REQUIRE(connstring == link + ":19200");
}

TEST_CASE("SCPIUARTTransport_DriverOverPty")
{
	PseudoTerminal pty;
	auto uart = new SCPIUARTTransport(pty.GetSlave(), TestFraming());

	//Minimal CPX400DP: identify, accept the enable registers, report clean status
	atomic<bool> done(false);
	thread device([&]()
	{
		string pending;
		while(!done)
		{
			pending += pty.Read(1, chrono::milliseconds(20));
			size_t end;
			while( (end = pending.find("\r\n")) != string::npos)
			{
				string line = pending.substr(0, end);
				pending.erase(0, end + 2);

				if(line == "*IDN?")
					pty.Write("THURLBY THANDAR,CPX400DP,000123,1.00-1.00-1.00\r\n");
				else if(line == "*STB?")
					pty.Write("0\r\n");
				else if( (line == "*SRE?") || (line == "*ESE?") || (line == "LSE1?") || (line == "LSE2?") )
					pty.Write("255\r\n");
				else if(line == "V1O?")
					pty.Write("11.998V\r\n");
			}
		}
	});

	string vendor;
	string serial;
	double volts = 0;
	try
	{
		auto psu = CPX400DPPowerSupply::Create("pty", uart);
		vendor = psu->GetVendor();
		serial = psu->GetSerial();
		volts = psu->GetPowerChannel(1)->GetVoltageMeasured();
		psu->Close();
	}
	catch(const InstrumentError&)
	{
		done = true;
		device.join();
		throw;
	}

	done = true;
	device.join();

	REQUIRE(vendor == "THURLBY THANDAR");
	REQUIRE(serial == "000123");
	REQUIRE(volts == Approx(11.998));
}
