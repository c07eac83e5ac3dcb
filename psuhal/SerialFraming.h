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
	@brief Declaration of SerialFraming
 */

#ifndef SerialFraming_h
#define SerialFraming_h

/**
	@brief Line settings for a serial link

	Defaults are the CPX400DP remote interface settings from the instruction manual: 9600 baud, 8N1, XON/XOFF.
	The device asserts XOFF at roughly 200 characters in its 256 byte input queue and XON once roughly 100 are
	free again. The thresholds are device-side properties and are kept here for diagnostics only.
 */
class SerialFraming
{
public:
	SerialFraming();

	enum Parity
	{
		PARITY_NONE,
		PARITY_ODD,
		PARITY_EVEN
	};

	unsigned int m_baudrate;
	unsigned int m_dataBits;
	Parity m_parity;
	unsigned int m_stopBits;

	bool m_xonxoff;
	bool m_rtscts;
	unsigned int m_xoffThreshold;
	unsigned int m_xonThreshold;

	std::chrono::milliseconds m_timeout;
	std::string m_terminator;

	void Validate() const;
	std::string ToString() const;

	static SerialFraming FromYAML(const YAML::Node& node);
	YAML::Node SerializeConfiguration() const;

	static const char* GetParityName(Parity p);
	static Parity ParseParity(const std::string& name);
};

#endif
