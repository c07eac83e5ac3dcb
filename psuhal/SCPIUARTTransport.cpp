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
	@author Alyssa Milburn
	@brief Implementation of SCPIUARTTransport
 */

#include <climits>
#include <fcntl.h>
#include <poll.h>
#include <string.h>
#include <errno.h>
#include <termios.h>
#include <unistd.h>
#include <sys/ioctl.h>
#include <sys/stat.h>

#include "psuhal.h"

using namespace std;

static speed_t BaudToSpeed(unsigned int baud);
static void ValidateFraming(const string& devfile, const SerialFraming& framing);

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction / destruction

SCPIUARTTransport::SCPIUARTTransport(const string& args)
	: m_fd(-1)
{
	//default framing if baud rate not specified
	m_devfile = args;

	auto colon = args.rfind(':');
	if( (colon != string::npos) && (colon + 1 < args.length()) && isdigit(static_cast<unsigned char>(args[colon + 1])) )
	{
		const char* start = args.c_str() + colon + 1;
		char* end = nullptr;
		errno = 0;
		unsigned long baudrate = strtoul(start, &end, 10);
		if( (*end == '\0') && (errno != ERANGE) && (baudrate <= UINT_MAX) )
		{
			m_devfile = args.substr(0, colon);
			m_framing.m_baudrate = static_cast<unsigned int>(baudrate);
		}
	}

	Open();
}

SCPIUARTTransport::SCPIUARTTransport(const string& devfile, const SerialFraming& framing)
	: m_fd(-1)
	, m_devfile(devfile)
	, m_framing(framing)
{
	Open();
}

SCPIUARTTransport::~SCPIUARTTransport()
{
	Close();
}

/**
	@brief Opens the device file and configures the line

	@throw TransportOpenError if the device does not exist, cannot be opened, or rejects the framing
 */
void SCPIUARTTransport::Open()
{
	ValidateFraming(m_devfile, m_framing);
	m_terminator = m_framing.m_terminator;

	LogDebug("Connecting to %s (%s)\n", m_devfile.c_str(), m_framing.ToString().c_str());

	struct stat st;
	if(0 != stat(m_devfile.c_str(), &st))
	{
		LogError("Serial device %s does not exist\n", m_devfile.c_str());
		throw TransportOpenError("Serial device " + m_devfile + " does not exist");
	}

	m_fd = open(m_devfile.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK | O_CLOEXEC);
	if(m_fd < 0)
	{
		string err = strerror(errno);
		LogError("Couldn't open %s: %s\n", m_devfile.c_str(), err.c_str());
		throw TransportOpenError("Couldn't open " + m_devfile + ": " + err);
	}

	try
	{
		ApplyFraming(m_framing);
	}
	catch(const TransportOpenError&)
	{
		close(m_fd);
		m_fd = -1;
		throw;
	}
}

/**
	@brief Reconfigures the open port with new line settings
 */
void SCPIUARTTransport::ApplyFraming(const SerialFraming& framing)
{
	lock_guard<recursive_mutex> lock(m_netMutex);

	ValidateFraming(m_devfile, framing);

	struct termios tio;
	if(0 != tcgetattr(m_fd, &tio))
		throw TransportOpenError("tcgetattr failed on " + m_devfile + ": " + strerror(errno));

	cfmakeraw(&tio);
	tio.c_cflag |= (CLOCAL | CREAD);

	tio.c_cflag &= ~CSIZE;
	switch(framing.m_dataBits)
	{
		case 5:
			tio.c_cflag |= CS5;
			break;

		case 6:
			tio.c_cflag |= CS6;
			break;

		case 7:
			tio.c_cflag |= CS7;
			break;

		case 8:
		default:
			tio.c_cflag |= CS8;
			break;
	}

	tio.c_cflag &= ~(PARENB | PARODD);
	if(framing.m_parity == SerialFraming::PARITY_EVEN)
		tio.c_cflag |= PARENB;
	else if(framing.m_parity == SerialFraming::PARITY_ODD)
		tio.c_cflag |= (PARENB | PARODD);

	if(framing.m_stopBits == 2)
		tio.c_cflag |= CSTOPB;
	else
		tio.c_cflag &= ~CSTOPB;

	tio.c_iflag &= ~(IXON | IXOFF | IXANY);
	if(framing.m_xonxoff)
		tio.c_iflag |= (IXON | IXOFF);

	if(framing.m_rtscts)
		tio.c_cflag |= CRTSCTS;
	else
		tio.c_cflag &= ~CRTSCTS;

	//Fully non-blocking, timeouts are done with poll()
	tio.c_cc[VMIN] = 0;
	tio.c_cc[VTIME] = 0;

	speed_t speed = BaudToSpeed(framing.m_baudrate);
	if(speed == B0)
		throw TransportOpenError("Unsupported baud rate " + to_string(framing.m_baudrate));
	cfsetispeed(&tio, speed);
	cfsetospeed(&tio, speed);

	if(0 != tcsetattr(m_fd, TCSANOW, &tio))
		throw TransportOpenError("tcsetattr failed on " + m_devfile + ": " + strerror(errno));

	if(framing.m_xonxoff)
	{
		LogTrace("XON/XOFF enabled, device XOFF at ~%u queued bytes, XON at ~%u free\n",
			framing.m_xoffThreshold, framing.m_xonThreshold);
	}

	m_framing = framing;
	m_terminator = framing.m_terminator;
}

/**
	@brief Checks line settings before they reach the port

	@throw TransportOpenError if the settings cannot be used
 */
static void ValidateFraming(const string& devfile, const SerialFraming& framing)
{
	try
	{
		framing.Validate();
	}
	catch(const invalid_argument& ex)
	{
		LogError("Can't configure %s: %s\n", devfile.c_str(), ex.what());
		throw TransportOpenError("Can't configure " + devfile + ": " + ex.what());
	}
}

static speed_t BaudToSpeed(unsigned int baud)
{
	switch(baud)
	{
		case 1200:		return B1200;
		case 2400:		return B2400;
		case 4800:		return B4800;
		case 9600:		return B9600;
		case 19200:		return B19200;
		case 38400:		return B38400;
		case 57600:		return B57600;
		case 115200:	return B115200;
		case 230400:	return B230400;
		default:		return B0;
	}
}

bool SCPIUARTTransport::IsConnected()
{
	return (m_fd >= 0);
}

/**
	@brief Discards pending I/O and releases the port. Safe to call more than once.
 */
void SCPIUARTTransport::Close()
{
	lock_guard<recursive_mutex> lock(m_netMutex);

	if(m_fd < 0)
		return;

	tcflush(m_fd, TCIOFLUSH);
	close(m_fd);
	m_fd = -1;
	m_rxBuffer.clear();

	LogDebug("Closed %s\n", m_devfile.c_str());
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Actual transport code

string SCPIUARTTransport::GetTransportName()
{
	return "uart";
}

string SCPIUARTTransport::GetConnectionString()
{
	return m_devfile + ":" + to_string(m_framing.m_baudrate);
}

void SCPIUARTTransport::SendCommand(const string& cmd)
{
	lock_guard<recursive_mutex> lock(m_netMutex);

	LogTrace("Sending %s\n", cmd.c_str());
	WriteAll(TerminateLine(cmd));
}

/**
	@brief Writes a buffer in full, waiting for the port to drain if the device has asserted XOFF
 */
void SCPIUARTTransport::WriteAll(const string& data)
{
	if(m_fd < 0)
		throw TransportWriteError("Write to closed port " + m_devfile);

	auto deadline = chrono::steady_clock::now() + m_framing.m_timeout;
	size_t pos = 0;
	while(pos < data.length())
	{
		ssize_t n = write(m_fd, data.c_str() + pos, data.length() - pos);
		if(n > 0)
		{
			pos += n;
			continue;
		}

		if( (n < 0) && (errno != EAGAIN) && (errno != EWOULDBLOCK) && (errno != EINTR) )
		{
			string err = strerror(errno);
			LogError("Write to %s failed: %s\n", m_devfile.c_str(), err.c_str());
			throw TransportWriteError("Write to " + m_devfile + " failed: " + err);
		}

		//Output queue full (flow controlled), wait for room
		auto remaining = chrono::duration_cast<chrono::milliseconds>(deadline - chrono::steady_clock::now());
		if(remaining.count() <= 0)
		{
			LogError("Timed out writing to %s after %zu of %zu bytes\n", m_devfile.c_str(), pos, data.length());
			throw TransportWriteError("Timed out writing to " + m_devfile);
		}

		struct pollfd pfd;
		pfd.fd = m_fd;
		pfd.events = POLLOUT;
		pfd.revents = 0;
		if( (poll(&pfd, 1, static_cast<int>(remaining.count())) < 0) && (errno != EINTR) )
			throw TransportWriteError("poll failed on " + m_devfile + ": " + strerror(errno));
	}
}

/**
	@brief Waits for more input and appends it to the receive buffer

	@return False if the deadline passed with nothing to read
 */
bool SCPIUARTTransport::ReadChunk(chrono::steady_clock::time_point deadline)
{
	auto remaining = chrono::duration_cast<chrono::milliseconds>(deadline - chrono::steady_clock::now());
	if(remaining.count() < 0)
		return false;

	struct pollfd pfd;
	pfd.fd = m_fd;
	pfd.events = POLLIN;
	pfd.revents = 0;
	int ret = poll(&pfd, 1, static_cast<int>(remaining.count()));
	if(ret == 0)
		return false;
	if(ret < 0)
	{
		if(errno == EINTR)
			return true;
		throw TransportReadError("poll failed on " + m_devfile + ": " + strerror(errno));
	}

	if(pfd.revents & (POLLERR | POLLHUP | POLLNVAL))
	{
		LogError("Serial device %s reported an error or hangup\n", m_devfile.c_str());
		throw TransportReadError("Serial device " + m_devfile + " reported an error or hangup");
	}

	char buf[256];
	ssize_t n = read(m_fd, buf, sizeof(buf));
	if(n > 0)
		m_rxBuffer.append(buf, n);
	else if( (n < 0) && (errno != EAGAIN) && (errno != EWOULDBLOCK) && (errno != EINTR) )
		throw TransportReadError("Read from " + m_devfile + " failed: " + strerror(errno));

	return true;
}

/**
	@brief Reads one line, without its terminator

	@throw TransportTimeoutError if nothing at all arrived before the timeout
 */
string SCPIUARTTransport::ReadReply()
{
	lock_guard<recursive_mutex> lock(m_netMutex);

	if(m_fd < 0)
		throw TransportReadError("Read from closed port " + m_devfile);

	auto deadline = chrono::steady_clock::now() + m_framing.m_timeout;
	while(true)
	{
		size_t end = m_rxBuffer.find(m_terminator);
		if(end != string::npos)
		{
			string ret = m_rxBuffer.substr(0, end);
			m_rxBuffer.erase(0, end + m_terminator.length());
			LogTrace("Got %s\n", ret.c_str());
			return ret;
		}

		if(!ReadChunk(deadline))
			break;
	}

	if(m_rxBuffer.empty())
	{
		throw TransportTimeoutError(
			"No response from " + m_devfile + " within " + to_string(m_framing.m_timeout.count()) + " ms");
	}

	//Got something, but the terminator never showed up. Hand back what we have.
	string ret;
	ret.swap(m_rxBuffer);
	LogWarning("Unterminated reply from %s after timeout: %s\n", m_devfile.c_str(), ret.c_str());
	return ret;
}

size_t SCPIUARTTransport::GetPendingByteCount()
{
	lock_guard<recursive_mutex> lock(m_netMutex);

	if(m_fd < 0)
		return 0;

	int avail = 0;
	if(0 != ioctl(m_fd, FIONREAD, &avail))
		avail = 0;
	return m_rxBuffer.length() + avail;
}

/**
	@brief Discards unread input

	@return Number of bytes discarded
 */
size_t SCPIUARTTransport::FlushRXBuffer()
{
	lock_guard<recursive_mutex> lock(m_netMutex);

	size_t n = GetPendingByteCount();
	m_rxBuffer.clear();
	if(m_fd >= 0)
		tcflush(m_fd, TCIFLUSH);
	return n;
}

/**
	@brief Discards unread input and unsent output

	@return Number of input and output bytes discarded
 */
pair<size_t, size_t> SCPIUARTTransport::FlushBuffers()
{
	lock_guard<recursive_mutex> lock(m_netMutex);

	if(m_fd < 0)
		return pair<size_t, size_t>(0, 0);

	size_t in = GetPendingByteCount();
	int out = 0;
	if(0 != ioctl(m_fd, TIOCOUTQ, &out))
		out = 0;

	m_rxBuffer.clear();
	if(0 != tcflush(m_fd, TCIOFLUSH))
		LogWarning("tcflush failed on %s: %s\n", m_devfile.c_str(), strerror(errno));

	LogTrace("Flushed %zu input and %d output bytes\n", in, out);
	return pair<size_t, size_t>(in, out);
}
