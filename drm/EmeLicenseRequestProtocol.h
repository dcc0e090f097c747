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
 * @file EmeLicenseRequestProtocol.h
 * @brief License exchange between key sessions and the license server
 */

#ifndef __EME_LICENSE_REQUEST_PROTOCOL_H__
#define __EME_LICENSE_REQUEST_PROTOCOL_H__

#include <map>
#include <memory>
#include <string>
#include <vector>
#include "EmeCdmInterfaces.h"
#include "EmeErrorReporter.h"
#include "EmeKeySessionManager.h"
#include "EmeScheduler.h"

/**
 * @brief Receives the license once the exchange succeeded
 */
typedef std::function<void (const std::vector<uint8_t> &license)> EmeLicenseCallback;

/**
 * @class EmeLicenseRequestProtocol
 * @brief Builds license challenges, sends them and retries failed exchanges
 */
class EmeLicenseRequestProtocol
{
public:
	EmeLicenseRequestProtocol(EmeControllerState &state, EmeKeySessionManager &sessionManager, EmeErrorReporter &reporter,
				std::shared_ptr<EmeScheduler> scheduler, std::shared_ptr<EmeLicenseTransport> transport);

	EmeLicenseRequestProtocol(const EmeLicenseRequestProtocol&) = delete;
	EmeLicenseRequestProtocol& operator=(const EmeLicenseRequestProtocol&) = delete;

	/**
	 * @brief Request a license for a key session message of the active item
	 *
	 * A failed exchange is retried from scratch until MAX_LICENSE_REQUEST_FAILURES
	 * consecutive failures have been seen, the next failure is fatal. A response
	 * arriving after the item was removed is dropped.
	 *
	 * @param[in] keyMessage - outgoing key session message
	 * @param[in] onSuccess - called with the license on success
	 */
	void RequestLicense(const std::vector<uint8_t> &keyMessage, EmeLicenseCallback onSuccess);

	/**
	 * @brief Configure the license server of a key-system
	 */
	void SetLicenseServerUrl(const std::string &keySystem, const std::string &url);

	/**
	 * @brief License server of a key-system
	 * @throws EmeKeySystemException if none is configured
	 */
	std::string GetLicenseServerUrl(const std::string &keySystem) const;

	void SetRequestCustomizer(EmeLicenseRequestCustomizer customizer);

	void SetResponseTransform(EmeLicenseResponseTransform transform);

private:
	void OnLicenseResponse(int itemId, const std::vector<uint8_t> &keyMessage, EmeLicenseCallback onSuccess, const std::string &url,
				const EmeLicenseResponse &response);

	EmeControllerState &mState;
	EmeKeySessionManager &mSessionManager;
	EmeErrorReporter &mReporter;
	std::shared_ptr<EmeScheduler> mScheduler;
	std::shared_ptr<EmeLicenseTransport> mTransport;
	std::map<std::string, std::string> mLicenseServerUrls;
	EmeLicenseRequestCustomizer mRequestCustomizer;
	EmeLicenseResponseTransform mResponseTransform;
};

#endif /* __EME_LICENSE_REQUEST_PROTOCOL_H__ */
