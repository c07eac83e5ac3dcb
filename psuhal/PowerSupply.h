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
	@brief Declaration of PowerSupply
 */

#ifndef PowerSupply_h
#define PowerSupply_h

class PowerSupplyChannel;

/**
	@brief Power supply capability set

	Channel numbers are 1-based, matching the front panel and the command set. A driver implements this next to
	Instrument; every call maps to exactly one command or query on the instrument and nothing is cached, since the
	outputs can change from the front panel or a protection trip at any time.
 */
class PowerSupply
{
public:
	PowerSupply();
	virtual ~PowerSupply();

	static const int MAX_CHANNELS = 4;

	//Channel info
	int GetPowerChannelCount() const
	{ return static_cast<int>(m_channels.size()); }

	std::string GetPowerChannelName(int chan) const;
	PowerSupplyChannel* GetPowerChannel(int chan) const;

	//Read sensors
	virtual double GetPowerVoltageActual(int chan) =0;				//measured output voltage
	virtual double GetPowerVoltageNominal(int chan) =0;				//set point
	virtual double GetPowerCurrentActual(int chan) =0;				//measured output current
	virtual double GetPowerCurrentNominal(int chan) =0;				//current limit
	virtual bool GetPowerChannelActive(int chan) =0;

	//Protection
	virtual double GetPowerOvervoltageProtection(int chan) =0;
	virtual void SetPowerOvervoltageProtection(int chan, double volts) =0;
	virtual double GetPowerOvercurrentProtection(int chan) =0;
	virtual void SetPowerOvercurrentProtection(int chan, double amps) =0;

	//Configuration
	virtual void SetPowerVoltage(int chan, double volts) =0;
	virtual void SetPowerCurrent(int chan, double amps) =0;
	virtual void SetPowerChannelActive(int chan, bool on) =0;

	YAML::Node SerializeChannels();

protected:
	void CheckChannel(int chan) const;

	/**
		@brief Set of all channels on this supply, channel n at index n-1
	 */
	std::vector<PowerSupplyChannel*> m_channels;
};

#endif
