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
	@brief Declaration of CPX400DPPowerSupply
 */

#ifndef CPX400DPPowerSupply_h
#define CPX400DPPowerSupply_h

/**
	@brief TTi / Thurlby-Thandar CPX400 series bench power supply

	Every Send() and Query() is followed by a status check: *STB? is read and, depending on which bits are set, the
	limit status registers, the standard event status register and the execution error register. The whole cycle
	runs with the instrument lock held so nothing else reaches the wire in between.
 */
class CPX400DPPowerSupply
	: public Instrument
	, public PowerSupply
{
public:
	static std::shared_ptr<CPX400DPPowerSupply> Create(const std::string& nickname, SCPITransport* transport);
	virtual ~CPX400DPPowerSupply();

	virtual unsigned int GetInstrumentTypes() const override
	{ return INST_PSU; }

	//Command interface
	virtual void Send(const std::string& cmd) override;
	virtual std::string Query(const std::string& cmd) override;
	virtual void Reset() override;
	void ClearStatus();

	//Read sensors
	virtual double GetPowerVoltageActual(int chan) override;
	virtual double GetPowerVoltageNominal(int chan) override;
	virtual double GetPowerCurrentActual(int chan) override;
	virtual double GetPowerCurrentNominal(int chan) override;
	virtual bool GetPowerChannelActive(int chan) override;

	//Protection
	virtual double GetPowerOvervoltageProtection(int chan) override;
	virtual void SetPowerOvervoltageProtection(int chan, double volts) override;
	virtual double GetPowerOvercurrentProtection(int chan) override;
	virtual void SetPowerOvercurrentProtection(int chan, double amps) override;

	//Configuration
	virtual void SetPowerVoltage(int chan, double volts) override;
	virtual void SetPowerCurrent(int chan, double amps) override;
	virtual void SetPowerChannelActive(int chan, bool on) override;

	virtual YAML::Node SerializeConfiguration() override;

	static int GetChannelCountForModel(const std::string& model);

	typedef sigc::signal<void(int, StatusRegisters::LimitCondition, const std::string&)> LimitEventSignal;

	/**
		@brief Emitted for every limit condition found in LSR1?/LSR2?, after the warning is logged

		Handlers run on the thread issuing the command, with the instrument lock held.
	 */
	LimitEventSignal signal_limitEvent()
	{ return m_limitEventSignal; }

	static std::string GetDriverNameInternal();
	INSTRUMENT_INITPROC(CPX400DPPowerSupply)

protected:
	CPX400DPPowerSupply(const std::string& nickname, SCPITransport* transport);

	virtual void DoOpen() override;

	void EnableReporting(const std::string& cmd);

	//Status cascade
	enum StatusRegister
	{
		REG_STB,
		REG_LSR1,
		REG_LSR2,
		REG_ESR,
		REG_EER
	};

	struct StatusWorkItem
	{
		StatusRegister m_reg;
		int m_depth;
	};

	//STB -> LSR/ESR -> EER
	static const int MAX_STATUS_DEPTH = 3;

	void CheckStatus();
	uint8_t ReadRegister(const std::string& query);
	void ReportLimitConditions(int chan, uint8_t lsr);

	//Command helpers
	void SendChannelValue(const char* cmd, int chan, double value);
	double QuerySetting(const char* query, int chan);
	double QueryMeasurement(const char* query, int chan, char unit);
	double ParseNumber(const std::string& text, const std::string& reply);

	LimitEventSignal m_limitEventSignal;
};

#endif
