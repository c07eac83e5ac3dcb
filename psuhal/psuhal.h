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
	@brief Main library include file
 */

#ifndef psuhal_h
#define psuhal_h

#include <deque>
#include <vector>
#include <string>
#include <map>
#include <list>
#include <set>
#include <stdint.h>
#include <chrono>
#include <thread>
#include <memory>
#include <mutex>
#include <condition_variable>
#include <exception>
#include <cstdio>
#include <cstdlib>
#include <cerrno>
#include <cctype>
#include <atomic>
#include <functional>
#include <stdexcept>
#include <utility>
#include <algorithm>

#include <sigc++/sigc++.h>

#include <yaml-cpp/yaml.h>

#include <log/log.h>

#include "config.h"

#include "InstrumentErrors.h"
#include "StatusRegisters.h"

#include "SerialFraming.h"
#include "SCPITransport.h"
#include "SCPIUARTTransport.h"

#include "Instrument.h"
#include "InstrumentRegistry.h"
#include "ScopedInstrument.h"
#include "PowerSupply.h"
#include "PowerSupplyChannel.h"
#include "CPX400DPPowerSupply.h"

#include "InstrumentConfig.h"
#include "ShutdownCoordinator.h"

std::string Trim(const std::string& str);
std::vector<std::string> explode(const std::string& str, char separator);
bool ParseRegisterValue(const std::string& str, long& value);

void TransportStaticInit();
void DriverStaticInit();

const char* PsuhalGetVersion();

#endif
