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
 * @file EmeInitDataExtractor.h
 * @brief Builds key session init data from playlist protection metadata
 */

#ifndef __EME_INIT_DATA_EXTRACTOR_H__
#define __EME_INIT_DATA_EXTRACTOR_H__

#include <string>
#include <vector>
#include "EmeDrmTypes.h"

/**
 * @brief Outcome of an extraction
 */
typedef enum
{
	eINIT_DATA_NOT_FOUND,		/**< No usable entry for the DRM identifier */
	eINIT_DATA_UNCHANGED,		/**< Same fingerprint as the current one, nothing done */
	eINIT_DATA_NEW			/**< New fingerprint recorded */
} EmeInitDataResult;

/**
 * @class EmeInitDataExtractor
 * @brief Turns protection metadata into cenc init data for the active key-system
 */
class EmeInitDataExtractor
{
public:
	explicit EmeInitDataExtractor(EmeControllerState &state) : mState(state)
	{
	}

	EmeInitDataExtractor(const EmeInitDataExtractor&) = delete;
	EmeInitDataExtractor& operator=(const EmeInitDataExtractor&) = delete;

	/**
	 * @brief Extract init data from the first entry tagged with drmIdentifier
	 *
	 * A new fingerprint is stored as the current pssh together with the init data type
	 * and init data. The init data is left empty when the payload cannot be decoded.
	 *
	 * @param[in] drmIdentifier - protection identifier of the configured key-system
	 * @param[in] keys - protection metadata entries of the fragment
	 */
	EmeInitDataResult Extract(const std::string &drmIdentifier, const std::vector<EmeLevelKey> &keys);

private:
	EmeControllerState &mState;
};

#endif /* __EME_INIT_DATA_EXTRACTOR_H__ */
