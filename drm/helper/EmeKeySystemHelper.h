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

#ifndef _EME_KEY_SYSTEM_HELPER_H
#define _EME_KEY_SYSTEM_HELPER_H

/**
 * @file EmeKeySystemHelper.h
 * @brief Key-system specific behaviour: init data, license challenge and identifiers
 */

#include <stdint.h>
#include <memory>
#include <string>
#include <vector>

#include "EmeDrmTypes.h"

/**
 * @class EmeKeySystemHelper
 * @brief Base class of the per key-system helpers
 */
class EmeKeySystemHelper
{
public:
	/**
	 * @brief Key-system string passed to the CDM access provider
	 */
	virtual const std::string& ocdmSystemId() const = 0;

	/**
	 * @brief Identifier used by playlists to tag protection metadata for this key-system
	 */
	virtual const std::string& drmIdentifier() const = 0;

	virtual const std::string& friendlyName() const = 0;

	/**
	 * @brief Turn a decoded playlist payload into init data for the key session
	 * @param[in] payload - base64 decoded payload of the protection metadata
	 * @param[out] initData - init data of type cenc
	 * @retval false if no init data could be built
	 */
	virtual bool createInitData(const std::vector<uint8_t>& payload, std::vector<uint8_t>& initData) = 0;

	/**
	 * @brief Fill the payload and headers of a license request from a key session message
	 * @throws EmeKeySystemException if the message cannot be turned into a challenge
	 */
	virtual void generateLicenseRequest(const std::vector<uint8_t>& keyMessage, EmeLicenseRequest& licenseRequest) const = 0;

	virtual ~EmeKeySystemHelper() {}
};

typedef std::shared_ptr<EmeKeySystemHelper> EmeKeySystemHelperPtr;

/**
 * @class EmeKeySystemHelperFactory
 * @brief Creates helpers for one key-system, registers itself with the engine on construction
 */
class EmeKeySystemHelperFactory
{
public:
	/**
	 * @brief Helper for the key-system
	 */
	virtual std::shared_ptr<EmeKeySystemHelper> createHelper() const = 0;

	/**
	 * @brief Check a configured key-system name against this factory
	 * @param[in] keySystem - key-system string, or friendly name in any case
	 */
	virtual bool isKeySystem(const std::string& keySystem) const = 0;

	/**
	 * @brief Check a playlist protection identifier against this factory
	 */
	virtual bool isDrmIdentifier(const std::string& drmIdentifier) const = 0;

	/**
	 * @brief Adds the system IDs supported by the factory to the given vector
	 */
	virtual void appendSystemId(std::vector<std::string>& systemIds) const = 0;

	EmeKeySystemHelperFactory();

	virtual ~EmeKeySystemHelperFactory() {}
};

/**
 * @class EmeKeySystemHelperEngine
 * @brief Registry of the helper factories
 */
class EmeKeySystemHelperEngine
{
public:
	/**
	 * @brief Get the helper for a configured key-system name
	 * @retval nullptr if the key-system is unknown
	 */
	std::shared_ptr<EmeKeySystemHelper> createHelper(const std::string& keySystem) const;

	/**
	 * @brief Get the helper for a playlist protection identifier
	 * @retval nullptr if the identifier is unknown
	 */
	std::shared_ptr<EmeKeySystemHelper> createHelperForDrmIdentifier(const std::string& drmIdentifier) const;

	bool isKeySystemSupported(const std::string& keySystem) const;

	void getSystemIds(std::vector<std::string>& ids) const;

	static EmeKeySystemHelperEngine& getInstance();

	void registerFactory(EmeKeySystemHelperFactory* factory);

private:
	EmeKeySystemHelperEngine() : mFactories() {}

	std::vector<EmeKeySystemHelperFactory*> mFactories;
};

#endif //_EME_KEY_SYSTEM_HELPER_H
