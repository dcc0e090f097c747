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
 * @file EmeController.h
 * @brief Encrypted media key-system controller
 */

#ifndef __EME_CONTROLLER_H__
#define __EME_CONTROLLER_H__

#include <memory>
#include <string>
#include <vector>
#include "EmeConfig.h"
#include "EmeScheduler.h"
#include "EmeCdmInterfaces.h"
#include "EmeErrorReporter.h"
#include "EmeInitDataExtractor.h"
#include "EmeKeySessionManager.h"
#include "EmeKeySystemNegotiator.h"
#include "EmeLicenseRequestProtocol.h"

struct EmeSessionCloseResults;

/**
 * @class EmeController
 * @brief Drives key-system negotiation, key sessions and license exchange from player events
 *
 * Every handler is queued on the controller's scheduler and runs there, as does every
 * completion of the injected capabilities. The controller is disabled when no key-system
 * is configured.
 */
class EmeController
{
public:
	/**
	 * @param[in] controllerId - id tagging the controller's log lines
	 * @param[in] config - settings, read once at construction
	 * @param[in] accessProvider - grants key-system access
	 * @param[in] transport - license transport, a libcurl transport is created when null
	 */
	EmeController(int controllerId, const EmeConfig &config, std::shared_ptr<EmeCdmAccessProvider> accessProvider,
			std::shared_ptr<EmeLicenseTransport> transport = nullptr);

	/**
	 * @brief Stops the scheduler, queued handlers are discarded
	 */
	~EmeController();

	EmeController(const EmeController&) = delete;
	EmeController& operator=(const EmeController&) = delete;

	/**
	 * @brief Media element attached
	 * @param[in] sink - receives the CDM instance
	 */
	void OnMediaAttached(std::shared_ptr<EmeMediaSink> sink);

	/**
	 * @brief Media element detached, closes every key session and clears the media keys
	 */
	void OnMediaDetached();

	/**
	 * @brief Codecs of the presentation are known, empty entries are dropped
	 */
	void OnCodecsKnown(const std::vector<std::string> &audioCodecs, const std::vector<std::string> &videoCodecs);

	/**
	 * @brief Fragment loaded, with the protection metadata found for it
	 */
	void OnFragmentLoaded(const EmeFragmentProtection &protection);

	/**
	 * @brief Media element reported encrypted content
	 */
	void OnMediaEncrypted(const std::string &initDataType, const std::vector<uint8_t> &initData);

	void SetErrorListener(EmeErrorListener listener);

	void SetLicenseRequestCustomizer(EmeLicenseRequestCustomizer customizer);

	void SetLicenseResponseTransform(EmeLicenseResponseTransform transform);

	bool IsEnabled() const { return mEnabled; }

	const std::string& GetKeySystem() const { return mKeySystem; }

	std::shared_ptr<EmeScheduler> GetScheduler() const { return mScheduler; }

	/**
	 * @note read only from the scheduler thread, or once the scheduler is idle
	 */
	const EmeControllerState& GetState() const { return mState; }

	size_t GetSessionItemCount() const { return mSessionManager.GetItemCount(); }

	EmeSessionItemPtr GetActiveSessionItem() const { return mSessionManager.GetActiveItem(); }

	EmeAccessState GetAccessState() const { return mNegotiator.GetAccessState(); }

private:
	void DoMediaAttached(std::shared_ptr<EmeMediaSink> sink);
	void DoMediaDetached();
	void DoCodecsKnown(const std::vector<std::string> &audioCodecs, const std::vector<std::string> &videoCodecs);
	void DoFragmentLoaded(const EmeFragmentProtection &protection);
	void DoMediaEncrypted(const std::string &initDataType, const std::vector<uint8_t> &initData);

	void ProcessMediaEncrypted(const std::string &initDataType, const std::vector<uint8_t> &initData);
	void AttemptSetMediaKeys();
	void OnSessionClosed(std::shared_ptr<EmeSessionCloseResults> results, int itemId, bool success, const std::string &error);
	void FinishDetach(std::shared_ptr<EmeSessionCloseResults> results);

	int mControllerId;
	bool mEnabled;
	std::string mKeySystem;
	std::string mDrmIdentifier;
	EmeDrmSystemOptions mDrmSystemOptions;
	std::vector<std::string> mAudioCodecs;
	std::vector<std::string> mVideoCodecs;
	std::shared_ptr<EmeMediaSink> mMediaSink;
	bool mHandleEncrypted;			/**< encrypted signals are honoured only if media keys were not set at attach */

	EmeControllerState mState;
	EmeErrorReporter mReporter;
	std::shared_ptr<EmeScheduler> mScheduler;
	EmeKeySessionManager mSessionManager;
	EmeKeySystemNegotiator mNegotiator;
	EmeLicenseRequestProtocol mLicenseProtocol;
	EmeInitDataExtractor mInitDataExtractor;
};

#endif /* __EME_CONTROLLER_H__ */
