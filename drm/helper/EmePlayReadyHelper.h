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

#ifndef _EME_PLAYREADY_HELPER_H
#define _EME_PLAYREADY_HELPER_H

/**
 * @file EmePlayReadyHelper.h
 * @brief Handles the PlayReady key-system specifics
 */

#include <memory>
#include <utility>

#include "EmeKeySystemHelper.h"

/**
 * @class EmePlayReadyHelper
 * @brief PlayReady init data and license challenge handling
 */
class EmePlayReadyHelper: public EmeKeySystemHelper
{
public:
	friend class EmePlayReadyHelperFactory;

	const std::string& ocdmSystemId() const override;

	const std::string& drmIdentifier() const override;

	const std::string& friendlyName() const override { return FRIENDLY_NAME; }

	/**
	 * @brief Wrap the playlist payload (a PlayReady object) in a version 0 pssh box
	 */
	bool createInitData(const std::vector<uint8_t>& payload, std::vector<uint8_t>& initData) override;

	/**
	 * @brief Extract the challenge and HTTP headers from the UTF-16LE key message
	 * @throws EmeKeySystemException if the message has no usable <Challenge>
	 */
	void generateLicenseRequest(const std::vector<uint8_t>& keyMessage, EmeLicenseRequest& licenseRequest) const override;

	/**
	 * @brief Read the <HttpHeader> name/value pairs of a key message
	 */
	static std::vector<std::pair<std::string, std::string>> getHttpHeaders(const std::vector<uint8_t>& keyMessage);

	EmePlayReadyHelper() : FRIENDLY_NAME("PlayReady")
	{}

	~EmePlayReadyHelper() { }

private:
	static const std::string PLAYREADY_OCDM_ID;
	const std::string FRIENDLY_NAME;
};

/**
 * @class EmePlayReadyHelperFactory
 * @brief Creates PlayReady helpers
 */
class EmePlayReadyHelperFactory : public EmeKeySystemHelperFactory
{
	std::shared_ptr<EmeKeySystemHelper> createHelper() const override;

	bool isKeySystem(const std::string& keySystem) const override;

	bool isDrmIdentifier(const std::string& drmIdentifier) const override;

	void appendSystemId(std::vector<std::string>& systemIds) const override;
};

#endif //_EME_PLAYREADY_HELPER_H
