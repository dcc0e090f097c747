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
 * @file EmeKeySystemNegotiator.h
 * @brief Negotiates key-system access and owns the CDM instance
 */

#ifndef __EME_KEY_SYSTEM_NEGOTIATOR_H__
#define __EME_KEY_SYSTEM_NEGOTIATOR_H__

#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "EmeCdmInterfaces.h"
#include "EmeErrorReporter.h"
#include "EmeKeySessionManager.h"
#include "EmeScheduler.h"

/**
 * @brief Progress of the latest access request
 */
typedef enum
{
	eACCESS_NONE,			/**< Access never requested */
	eACCESS_PENDING,		/**< Latest request not settled yet */
	eACCESS_SETTLED			/**< Latest request granted or failed */
} EmeAccessState;

/**
 * @class EmeKeySystemNegotiator
 * @brief Requests key-system access and creates a single CDM instance per controller
 */
class EmeKeySystemNegotiator
{
public:
	EmeKeySystemNegotiator(std::shared_ptr<EmeCdmAccessProvider> accessProvider, EmeKeySessionManager &sessionManager,
				EmeErrorReporter &reporter, std::shared_ptr<EmeScheduler> scheduler);

	EmeKeySystemNegotiator(const EmeKeySystemNegotiator&) = delete;
	EmeKeySystemNegotiator& operator=(const EmeKeySystemNegotiator&) = delete;

	/**
	 * @brief Request access to a key-system
	 *
	 * An unknown key-system is reported as unsupported before any call to the access provider.
	 * Rejections are logged only, no session item is added for them.
	 *
	 * @param[in] keySystem - key-system string or friendly name
	 * @param[in] audioCodecs - audio codecs to support
	 * @param[in] videoCodecs - video codecs to support
	 * @param[in] options - robustness requirements
	 * @retval false if the key-system is not supported or no access provider is configured
	 */
	bool RequestAccess(const std::string &keySystem, const std::vector<std::string> &audioCodecs,
				const std::vector<std::string> &videoCodecs, const EmeDrmSystemOptions &options);

	/**
	 * @brief Run task on the scheduler once the latest access request settled
	 * @retval false if access was never requested, task is dropped
	 */
	bool WhenAccessSettled(std::function<void ()> task);

	EmeAccessState GetAccessState() const { return mAccessState; }

	bool IsAccessRequested() const { return mAccessState != eACCESS_NONE; }

	bool IsAccessPending() const { return mAccessState == eACCESS_PENDING; }

	std::shared_ptr<EmeCdmInstance> GetCdmInstance() const { return mCdmInstance; }

	/**
	 * @brief Capability requirements for a codec set, always exactly one configuration
	 */
	static std::vector<EmeMediaKeySystemConfiguration> BuildMediaKeySystemConfigurations(const std::vector<std::string> &audioCodecs,
				const std::vector<std::string> &videoCodecs, const EmeDrmSystemOptions &options);

private:
	void OnAccessGranted(int generation, const std::string &keySystem, std::shared_ptr<EmeKeySystemAccess> access);
	void OnAccessFailed(int generation, const std::string &keySystem, const std::string &error);
	void OnCdmCreated(int generation, const std::string &keySystem, std::shared_ptr<EmeKeySystemAccess> access, std::shared_ptr<EmeCdmInstance> cdm);
	void OnCdmFailed(int generation, const std::string &error);
	void Settle(int generation);

	std::shared_ptr<EmeCdmAccessProvider> mAccessProvider;
	EmeKeySessionManager &mSessionManager;
	EmeErrorReporter &mReporter;
	std::shared_ptr<EmeScheduler> mScheduler;
	std::shared_ptr<EmeCdmInstance> mCdmInstance;
	EmeAccessState mAccessState;
	int mGeneration;
	std::vector<std::function<void ()>> mWaiters;
};

#endif /* __EME_KEY_SYSTEM_NEGOTIATOR_H__ */
