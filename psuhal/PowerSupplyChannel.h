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
	@brief Declaration of PowerSupplyChannel
 */

#ifndef PowerSupplyChannel_h
#define PowerSupplyChannel_h

/**
	@brief A single channel of a power supply

	Holds nothing but its number; every accessor is forwarded to the owning supply and reflects the device state at
	the time of the call.
 */
class PowerSupplyChannel
{
public:
	PowerSupplyChannel(PowerSupply* powerSupply, int index);
	virtual ~PowerSupplyChannel();

	int GetIndex() const
	{ return m_index; }

	std::string GetHwname() const
	{ return m_hwname; }

	PowerSupply* GetPowerSupply() const
	{ return m_powerSupply; }

	//Live measurements
	double GetVoltageMeasured()
	{ return m_powerSupply->GetPowerVoltageActual(m_index); }

	double GetCurrentMeasured()
	{ return m_powerSupply->GetPowerCurrentActual(m_index); }

	//Set points
	double GetVoltageSetPoint()
	{ return m_powerSupply->GetPowerVoltageNominal(m_index); }

	void SetVoltageSetPoint(double volts)
	{ m_powerSupply->SetPowerVoltage(m_index, volts); }

	double GetCurrentSetPoint()
	{ return m_powerSupply->GetPowerCurrentNominal(m_index); }

	void SetCurrentSetPoint(double amps)
	{ m_powerSupply->SetPowerCurrent(m_index, amps); }

	//Protection limits
	double GetOvervoltageProtection()
	{ return m_powerSupply->GetPowerOvervoltageProtection(m_index); }

	void SetOvervoltageProtection(double volts)
	{ m_powerSupply->SetPowerOvervoltageProtection(m_index, volts); }

	double GetOvercurrentProtection()
	{ return m_powerSupply->GetPowerOvercurrentProtection(m_index); }

	void SetOvercurrentProtection(double amps)
	{ m_powerSupply->SetPowerOvercurrentProtection(m_index, amps); }

	//Output control
	bool IsOn()
	{ return m_powerSupply->GetPowerChannelActive(m_index); }

	void TurnOn()
	{ m_powerSupply->SetPowerChannelActive(m_index, true); }

	void TurnOff()
	{ m_powerSupply->SetPowerChannelActive(m_index, false); }

protected:
	PowerSupply* m_powerSupply;
	int m_index;
	std::string m_hwname;
};

#endif
