/*
 * If not stated otherwise in this file or this component's license file the
 * following copyright and licenses apply:
 *
 * Copyright 2024 RDK Management
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 * http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
*/

/**
* @file EmeDrmUtils.h
* @brief Helpers for building and inspecting protection system specific header boxes
*/

#ifndef EmeDrmUtils_h
#define EmeDrmUtils_h

#include <stdint.h>
#include <string>
#include <vector>

#define PSSH_BOX_HEADER_SIZE 32		/**< size(4) + 'pssh'(4) + version/flags(4) + systemID(16) + dataSize(4) */
#define PSSH_SYSTEM_ID_SIZE 16

namespace EmeDrmUtils
{
	/**
	 *  @brief	Build a version 0 pssh box
	 *
	 *  @param[in]	systemId - system id in canonical uuid form
	 *  @param[in]	data - system specific payload
	 *  @param[out]	box - complete pssh box
	 *  @return	false if systemId is not a valid uuid
	 */
	bool buildPsshBox(const std::string &systemId, const std::vector<uint8_t> &data, std::vector<uint8_t> &box);

	/**
	 *  @fn 	getPsshSystemId
	 *  @param[in]	box - pssh box
	 *  @param[out]	systemId - system id in canonical lower case uuid form
	 *  @return	false if box is not a pssh box
	 */
	bool getPsshSystemId(const std::vector<uint8_t> &box, std::string &systemId);
}
#endif
