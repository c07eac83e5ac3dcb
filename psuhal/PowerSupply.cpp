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
	@brief Implementation of PowerSupply
 */

#include "psuhal.h"

using namespace std;

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Construction / destruction

PowerSupply::PowerSupply()
{
}

PowerSupply::~PowerSupply()
{
	for(auto c : m_channels)
		delete c;
	m_channels.clear();
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Channel enumeration

/**
	@brief Verifies that a 1-based channel number exists on this supply

	@throw std::out_of_range if it does not
 */
void PowerSupply::CheckChannel(int chan) const
{
	if( (chan < 1) || (chan > GetPowerChannelCount()) )
	{
		throw out_of_range(
			"Channel " + to_string(chan) + " out of range, supply has " + to_string(GetPowerChannelCount()));
	}
}

string PowerSupply::GetPowerChannelName(int chan) const
{
	CheckChannel(chan);
	return m_channels[chan - 1]->GetHwname();
}

/**
	@brief Gets a channel by 1-based number
 */
PowerSupplyChannel* PowerSupply::GetPowerChannel(int chan) const
{
	CheckChannel(chan);
	return m_channels[chan - 1];
}

////////////////////////////////////////////////////////////////////////////////////////////////////////////////////////
// Serialization

/**
	@brief Reads back the live configuration of every channel
 */
YAML::Node PowerSupply::SerializeChannels()
{
	YAML::Node node;
	for(auto c : m_channels)
	{
		auto chnode = node[c->GetHwname()];
		chnode["index"] = c->GetIndex();
		chnode["voltage"] = c->GetVoltageSetPoint();
		chnode["current"] = c->GetCurrentSetPoint();
		chnode["ovp"] = c->GetOvervoltageProtection();
		chnode["ocp"] = c->GetOvercurrentProtection();
		chnode["enabled"] = c->IsOn();
	}
	return node;
}
