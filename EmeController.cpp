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
 * @file EmeController.cpp
 * @brief Encrypted media key-system controller
 */

#include "EmeController.h"
#include "EmeCurlLicenseTransport.h"
#include "EmeKeySystemHelper.h"
#include "EmeDefine.h"
#include "EmeLogManager.h"

/**
 * @struct EmeSessionCloseResults
 * @brief Outcome of closing the key sessions on detach
 */
struct EmeSessionCloseResults
{
	std::shared_ptr<EmeMediaSink> sink;
	size_t total;
	size_t pending;
	std::vector<std::string> failures;

	explicit EmeSessionCloseResults(std::shared_ptr<EmeMediaSink> mediaSink) : sink(mediaSink), total(0), pending(0), failures()
	{
	}
};

EmeController::EmeController(int controllerId, const EmeConfig &config, std::shared_ptr<EmeCdmAccessProvider> accessProvider,
			std::shared_ptr<EmeLicenseTransport> transport)
	: mControllerId(controllerId), mEnabled(false), mKeySystem(config.GetConfigValue(eEMEConfig_KeySystem)), mDrmIdentifier(),
	mDrmSystemOptions(), mAudioCodecs(), mVideoCodecs(), mMediaSink(), mHandleEncrypted(false),
	mState(), mReporter(), mScheduler(std::make_shared<EmeScheduler>()),
	mSessionManager(mState, mReporter, mScheduler),
	mNegotiator(accessProvider, mSessionManager, mReporter, mScheduler),
	mLicenseProtocol(mState, mSessionManager, mReporter, mScheduler,
			transport ? transport : std::make_shared<EmeCurlLicenseTransport>(config, controllerId)),
	mInitDataExtractor(mState)
{
	UsingControllerId id(mControllerId);
	mEnabled = !mKeySystem.empty();
	mDrmSystemOptions.audioRobustness = config.GetConfigValue(eEMEConfig_AudioRobustness);
	mDrmSystemOptions.videoRobustness = config.GetConfigValue(eEMEConfig_VideoRobustness);
	mLicenseProtocol.SetLicenseServerUrl(WIDEVINE_KEY_SYSTEM_STRING, config.GetConfigValue(eEMEConfig_WVLicenseServerUrl));
	mLicenseProtocol.SetLicenseServerUrl(PLAYREADY_KEY_SYSTEM_STRING, config.GetConfigValue(eEMEConfig_PRLicenseServerUrl));

	std::shared_ptr<EmeKeySystemHelper> helper = EmeKeySystemHelperEngine::getInstance().createHelper(mKeySystem);
	if (helper)
	{
		mDrmIdentifier = helper->drmIdentifier();
	}

	mSessionManager.SetKeyMessageHandler([this](EmeSessionItemPtr item, const std::vector<uint8_t> &message)
	{
		mLicenseProtocol.RequestLicense(message, [this, item](const std::vector<uint8_t> &license)
		{
			mSessionManager.UpdateSession(item, license);
		});
	});

	mScheduler->StartScheduler(mControllerId);
	if (mEnabled)
	{
		EMELOG_MIL("Key-system controller %d for '%s' (%s)", mControllerId, mKeySystem.c_str(),
				helper ? helper->friendlyName().c_str() : "unsupported");
	}
	else
	{
		EMELOG_INFO("No key-system configured, controller %d disabled", mControllerId);
	}
}

EmeController::~EmeController()
{
	mScheduler->StopScheduler();
}

void EmeController::OnMediaAttached(std::shared_ptr<EmeMediaSink> sink)
{
	eme_ScheduleClosure(*mScheduler, [this, sink]() { DoMediaAttached(sink); }, "MediaAttached");
}

void EmeController::OnMediaDetached()
{
	eme_ScheduleClosure(*mScheduler, [this]() { DoMediaDetached(); }, "MediaDetached");
}

void EmeController::OnCodecsKnown(const std::vector<std::string> &audioCodecs, const std::vector<std::string> &videoCodecs)
{
	eme_ScheduleClosure(*mScheduler, [this, audioCodecs, videoCodecs]() { DoCodecsKnown(audioCodecs, videoCodecs); }, "CodecsKnown");
}

void EmeController::OnFragmentLoaded(const EmeFragmentProtection &protection)
{
	eme_ScheduleClosure(*mScheduler, [this, protection]() { DoFragmentLoaded(protection); }, "FragmentLoaded");
}

void EmeController::OnMediaEncrypted(const std::string &initDataType, const std::vector<uint8_t> &initData)
{
	eme_ScheduleClosure(*mScheduler, [this, initDataType, initData]() { DoMediaEncrypted(initDataType, initData); }, "MediaEncrypted");
}

void EmeController::SetErrorListener(EmeErrorListener listener)
{
	eme_ScheduleClosure(*mScheduler, [this, listener]() { mReporter.SetListener(listener); }, "SetErrorListener");
}

void EmeController::SetLicenseRequestCustomizer(EmeLicenseRequestCustomizer customizer)
{
	eme_ScheduleClosure(*mScheduler, [this, customizer]() { mLicenseProtocol.SetRequestCustomizer(customizer); }, "SetLicenseRequestCustomizer");
}

void EmeController::SetLicenseResponseTransform(EmeLicenseResponseTransform transform)
{
	eme_ScheduleClosure(*mScheduler, [this, transform]() { mLicenseProtocol.SetResponseTransform(transform); }, "SetLicenseResponseTransform");
}

void EmeController::DoMediaAttached(std::shared_ptr<EmeMediaSink> sink)
{
	if (!mEnabled)
	{
		return;
	}
	mMediaSink = sink;
	mHandleEncrypted = !mState.hasSetMediaKeys;
	EMELOG_INFO("Media attached, encrypted events %s", mHandleEncrypted ? "handled" : "ignored");
}

void EmeController::DoMediaDetached()
{
	if (!mMediaSink)
	{
		return;
	}
	std::shared_ptr<EmeSessionCloseResults> results = std::make_shared<EmeSessionCloseResults>(mMediaSink);
	mMediaSink.reset();
	mHandleEncrypted = false;
	mState.hasSetMediaKeys = false;

	std::vector<EmeSessionItemPtr> items = mSessionManager.TakeAllItems();
	for (auto &item : items)
	{
		if (item->session)
		{
			results->total++;
		}
	}
	results->pending = results->total;
	EMELOG_INFO("Media detached, closing %zu key sessions", results->total);
	if (results->total == 0)
	{
		FinishDetach(results);
		return;
	}

	std::shared_ptr<EmeScheduler> scheduler = mScheduler;
	for (auto &item : items)
	{
		if (!item->session)
		{
			continue;
		}
		int itemId = item->id;
		item->session->Close([this, scheduler, results, itemId](bool success, const std::string &error)
		{
			eme_ScheduleClosure(*scheduler, [this, results, itemId, success, error]()
			{
				OnSessionClosed(results, itemId, success, error);
			}, "SessionClosed");
		});
	}
}

void EmeController::OnSessionClosed(std::shared_ptr<EmeSessionCloseResults> results, int itemId, bool success, const std::string &error)
{
	if (!success)
	{
		results->failures.push_back("item " + std::to_string(itemId) + ": " + error);
	}
	if (--results->pending == 0)
	{
		FinishDetach(results);
	}
}

void EmeController::FinishDetach(std::shared_ptr<EmeSessionCloseResults> results)
{
	if (results->failures.empty())
	{
		EMELOG_INFO("Closed %zu key sessions", results->total);
	}
	else
	{
		std::string summary;
		for (auto &failure : results->failures)
		{
			summary += (summary.empty() ? "" : "; ") + failure;
		}
		EMELOG_WARN("%zu of %zu key sessions failed to close: %s", results->failures.size(), results->total, summary.c_str());
	}

	std::shared_ptr<EmeScheduler> scheduler = mScheduler;
	results->sink->SetMediaKeys(nullptr, [scheduler](bool success, const std::string &error)
	{
		if (!success)
		{
			eme_ScheduleClosure(*scheduler, [error]() { EMELOG_WARN("Failed to clear media keys: %s", error.c_str()); }, "ClearMediaKeysFailed");
		}
	});
}

void EmeController::DoCodecsKnown(const std::vector<std::string> &audioCodecs, const std::vector<std::string> &videoCodecs)
{
	if (!mEnabled)
	{
		return;
	}
	mAudioCodecs.clear();
	mVideoCodecs.clear();
	for (auto &codec : audioCodecs)
	{
		if (!codec.empty())
		{
			mAudioCodecs.push_back(codec);
		}
	}
	for (auto &codec : videoCodecs)
	{
		if (!codec.empty())
		{
			mVideoCodecs.push_back(codec);
		}
	}
	EMELOG_INFO("Codecs known: %zu audio, %zu video", mAudioCodecs.size(), mVideoCodecs.size());
}

void EmeController::DoFragmentLoaded(const EmeFragmentProtection &protection)
{
	if (!mEnabled)
	{
		return;
	}

	if (protection.foundKeys)
	{
		EmeInitDataResult result = eINIT_DATA_NOT_FOUND;
		if (!mDrmIdentifier.empty())
		{
			result = mInitDataExtractor.Extract(mDrmIdentifier, protection.keys);
		}
		bool noSessionItem = (mSessionManager.GetItemCount() == 0) && !mNegotiator.IsAccessPending();
		if (result == eINIT_DATA_NEW || noSessionItem)
		{
			if (!mNegotiator.RequestAccess(mKeySystem, mAudioCodecs, mVideoCodecs, mDrmSystemOptions))
			{
				EMELOG_ERR("Key-system access request for '%s' rejected", mKeySystem.c_str());
			}
		}
	}

	// playlist init data is used once a key session exists
	if (!mState.initDataType.empty() && !mState.initData.empty() && mState.haveKeySession)
	{
		ProcessMediaEncrypted(mState.initDataType, mState.initData);
	}
}

void EmeController::DoMediaEncrypted(const std::string &initDataType, const std::vector<uint8_t> &initData)
{
	if (!mEnabled)
	{
		return;
	}
	if (!mMediaSink || !mHandleEncrypted)
	{
		EMELOG_DEBUG("Ignoring encrypted event");
		return;
	}
	if (initDataType.empty())
	{
		EMELOG_WARN("Ignoring encrypted event without init data type");
		return;
	}
	ProcessMediaEncrypted(initDataType, initData);
}

void EmeController::ProcessMediaEncrypted(const std::string &initDataType, const std::vector<uint8_t> &initData)
{
	EmePsshState &pssh = mState.pssh;
	if (!pssh.currentPssh.empty() && pssh.currentPssh == pssh.lastProcessedPssh)
	{
		EMELOG_INFO("Ignore media encrypted for duplicated PSSH");
		return;
	}
	pssh.lastProcessedPssh = pssh.currentPssh;
	EMELOG_INFO("Media is encrypted using \"%s\" init data type", initDataType.c_str());

	bool queued = mNegotiator.WhenAccessSettled([this, initDataType, initData]()
	{
		if (!mMediaSink)
		{
			EMELOG_INFO("Media detached while waiting for key-system access");
			return;
		}
		AttemptSetMediaKeys();
		mSessionManager.GenerateRequestForActiveSession(initDataType, initData);
	});
	if (!queued)
	{
		EMELOG_ERR("Fatal: Media is encrypted but no CDM access or no keys have been requested");
		mReporter.Report(eEME_ERROR_NO_KEYS, true);
	}
}

void EmeController::AttemptSetMediaKeys()
{
	if (mState.hasSetMediaKeys)
	{
		return;
	}
	EmeSessionItemPtr item = mSessionManager.GetActiveItem();
	if (!item || !item->cdmInstance)
	{
		EMELOG_ERR("Media is encrypted but no CDM access or no keys have been obtained yet");
		return;
	}

	EMELOG_INFO("Setting keys for encrypted media");
	std::shared_ptr<EmeScheduler> scheduler = mScheduler;
	mMediaSink->SetMediaKeys(item->cdmInstance, [scheduler](bool success, const std::string &error)
	{
		if (!success)
		{
			eme_ScheduleClosure(*scheduler, [error]() { EMELOG_ERR("Failed to set media keys: %s", error.c_str()); }, "SetMediaKeysFailed");
		}
	});
	mState.hasSetMediaKeys = true;
}
