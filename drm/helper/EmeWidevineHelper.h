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

#ifndef _EME_WIDEVINE_HELPER_H
#define _EME_WIDEVINE_HELPER_H

/**
 * @file EmeWidevineHelper.h
 * @brief Handles the Widevine key-system specifics
 */

#include <map>
#include <memory>

#include "EmeKeySystemHelper.h"

/**
 * @class EmeWidevineHelper
 * @brief Widevine init data and license challenge handling
 */
class EmeWidevineHelper: public EmeKeySystemHelper
{
public:
	friend class EmeWidevineHelperFactory;

	const std::string& ocdmSystemId() const override;

	const std::string& drmIdentifier() const override;

	const std::string& friendlyName() const override { return FRIENDLY_NAME; }

	/**
	 * @brief The playlist payload already is a pssh box and is passed through, key IDs are logged
	 */
	bool createInitData(const std::vector<uint8_t>& payload, std::vector<uint8_t>& initData) override;

	/**
	 * @brief The challenge is the key message itself
	 */
	void generateLicenseRequest(const std::vector<uint8_t>& keyMessage, EmeLicenseRequest& licenseRequest) const override;

	/**
	 * @brief Collect the key IDs of a Widevine pssh box
	 * @retval true if at least one key ID or content ID was found
	 */
	bool parsePssh(const uint8_t* initData, uint32_t initDataLen);

	void getKeys(std::map<int, std::vector<uint8_t>>& keyIDs) const;

	EmeWidevineHelper() : FRIENDLY_NAME("Widevine"), mKeyIDs(), mProtectionScheme(0)
	{}

	~EmeWidevineHelper() { }

private:
	static const std::string WIDEVINE_OCDM_ID;
	static const std::string WIDEVINE_DRM_ID;
	const std::string FRIENDLY_NAME;
	std::map<int,std::vector<uint8_t>> mKeyIDs;
	uint32_t mProtectionScheme;
};

/**
 * @class EmeWidevineHelperFactory
 * @brief Creates Widevine helpers
 */
class EmeWidevineHelperFactory : public EmeKeySystemHelperFactory
{
	std::shared_ptr<EmeKeySystemHelper> createHelper() const override;

	bool isKeySystem(const std::string& keySystem) const override;

	bool isDrmIdentifier(const std::string& drmIdentifier) const override;

	void appendSystemId(std::vector<std::string>& systemIds) const override;
};

#endif //_EME_WIDEVINE_HELPER_H
