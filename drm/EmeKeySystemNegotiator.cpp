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
 * @file EmeKeySystemNegotiator.cpp
 * @brief Negotiates key-system access and owns the CDM instance
 */

#include "EmeKeySystemNegotiator.h"
#include "EmeKeySystemHelper.h"
#include "EmeLogManager.h"

EmeKeySystemNegotiator::EmeKeySystemNegotiator(std::shared_ptr<EmeCdmAccessProvider> accessProvider, EmeKeySessionManager &sessionManager,
				EmeErrorReporter &reporter, std::shared_ptr<EmeScheduler> scheduler)
	: mAccessProvider(accessProvider), mSessionManager(sessionManager), mReporter(reporter), mScheduler(scheduler),
	mCdmInstance(), mAccessState(eACCESS_NONE), mGeneration(0), mWaiters()
{
}

std::vector<EmeMediaKeySystemConfiguration> EmeKeySystemNegotiator::BuildMediaKeySystemConfigurations(const std::vector<std::string> &audioCodecs,
				const std::vector<std::string> &videoCodecs, const EmeDrmSystemOptions &options)
{
	EmeMediaKeySystemConfiguration config;
	for (auto &codec : audioCodecs)
	{
		config.audioCapabilities.push_back(EmeMediaCapability("audio/mp4; codecs=\"" + codec + "\"", options.audioRobustness));
	}
	for (auto &codec : videoCodecs)
	{
		config.videoCapabilities.push_back(EmeMediaCapability("video/mp4; codecs=\"" + codec + "\"", options.videoRobustness));
	}
	return std::vector<EmeMediaKeySystemConfiguration>{ config };
}

bool EmeKeySystemNegotiator::RequestAccess(const std::string &keySystem, const std::vector<std::string> &audioCodecs,
				const std::vector<std::string> &videoCodecs, const EmeDrmSystemOptions &options)
{
	std::shared_ptr<EmeKeySystemHelper> helper = EmeKeySystemHelperEngine::getInstance().createHelper(keySystem);
	if (!helper)
	{
		EMELOG_ERR("Unknown key-system: %s", keySystem.c_str());
		mReporter.Report(eEME_ERROR_UNSUPPORTED_KEY_SYSTEM, true);
		return false;
	}
	if (!mAccessProvider)
	{
		// configuration fault, not a property of the key-system
		EMELOG_ERR("No key-system access provider configured");
		return false;
	}

	const std::string &systemId = helper->ocdmSystemId();
	std::vector<EmeMediaKeySystemConfiguration> configs = BuildMediaKeySystemConfigurations(audioCodecs, videoCodecs, options);
	int generation = ++mGeneration;
	mAccessState = eACCESS_PENDING;
	EMELOG_INFO("Requesting encrypted media key-system access for %s (%zu audio, %zu video capabilities)",
			systemId.c_str(), configs[0].audioCapabilities.size(), configs[0].videoCapabilities.size());

	std::shared_ptr<EmeScheduler> scheduler = mScheduler;
	mAccessProvider->RequestAccess(systemId, configs,
		[this, scheduler, generation, systemId](std::shared_ptr<EmeKeySystemAccess> access)
		{
			eme_ScheduleClosure(*scheduler, [this, generation, systemId, access]() { OnAccessGranted(generation, systemId, access); }, "AccessGranted");
		},
		[this, scheduler, generation, systemId](const std::string &error)
		{
			eme_ScheduleClosure(*scheduler, [this, generation, systemId, error]() { OnAccessFailed(generation, systemId, error); }, "AccessFailed");
		});
	return true;
}

void EmeKeySystemNegotiator::OnAccessGranted(int generation, const std::string &keySystem, std::shared_ptr<EmeKeySystemAccess> access)
{
	EMELOG_MIL("Access for key-system \"%s\" obtained", keySystem.c_str());
	if (mCdmInstance)
	{
		mSessionManager.AddSessionItem(mCdmInstance, access, keySystem);
		mSessionManager.OnCdmAvailable();
		Settle(generation);
		return;
	}
	if (!access)
	{
		OnCdmFailed(generation, "no access handle");
		return;
	}

	std::shared_ptr<EmeScheduler> scheduler = mScheduler;
	access->CreateCdmInstance(
		[this, scheduler, generation, keySystem, access](std::shared_ptr<EmeCdmInstance> cdm)
		{
			eme_ScheduleClosure(*scheduler, [this, generation, keySystem, access, cdm]() { OnCdmCreated(generation, keySystem, access, cdm); }, "CdmCreated");
		},
		[this, scheduler, generation](const std::string &error)
		{
			eme_ScheduleClosure(*scheduler, [this, generation, error]() { OnCdmFailed(generation, error); }, "CdmFailed");
		});
}

void EmeKeySystemNegotiator::OnAccessFailed(int generation, const std::string &keySystem, const std::string &error)
{
	EMELOG_ERR("Failed to obtain key-system \"%s\" access: %s", keySystem.c_str(), error.c_str());
	Settle(generation);
}

void EmeKeySystemNegotiator::OnCdmCreated(int generation, const std::string &keySystem, std::shared_ptr<EmeKeySystemAccess> access, std::shared_ptr<EmeCdmInstance> cdm)
{
	if (!cdm)
	{
		OnCdmFailed(generation, "no CDM instance returned");
		return;
	}
	if (!mCdmInstance)
	{
		mCdmInstance = cdm;
		EMELOG_MIL("Media-keys created for key-system \"%s\"", keySystem.c_str());
	}
	mSessionManager.AddSessionItem(mCdmInstance, access, keySystem);
	mSessionManager.OnCdmAvailable();
	Settle(generation);
}

void EmeKeySystemNegotiator::OnCdmFailed(int generation, const std::string &error)
{
	EMELOG_ERR("Failed to create media-keys: %s", error.c_str());
	Settle(generation);
}

void EmeKeySystemNegotiator::Settle(int generation)
{
	if (generation != mGeneration)
	{
		EMELOG_DEBUG("Access request %d settled, waiting for %d", generation, mGeneration);
		return;
	}
	mAccessState = eACCESS_SETTLED;
	std::vector<std::function<void ()>> waiters;
	waiters.swap(mWaiters);
	for (auto &task : waiters)
	{
		task();
	}
}

bool EmeKeySystemNegotiator::WhenAccessSettled(std::function<void ()> task)
{
	switch (mAccessState)
	{
		case eACCESS_NONE:
			return false;
		case eACCESS_PENDING:
			mWaiters.push_back(task);
			break;
		case eACCESS_SETTLED:
			eme_ScheduleClosure(*mScheduler, task, "AccessSettled");
			break;
	}
	return true;
}
