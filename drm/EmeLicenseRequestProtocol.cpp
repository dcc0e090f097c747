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
 * @file EmeLicenseRequestProtocol.cpp
 * @brief License exchange between key sessions and the license server
 */

#include "EmeLicenseRequestProtocol.h"
#include "EmeKeySystemHelper.h"
#include "EmeDefine.h"
#include "EmeUtils.h"
#include "EmeLogManager.h"

EmeLicenseRequestProtocol::EmeLicenseRequestProtocol(EmeControllerState &state, EmeKeySessionManager &sessionManager, EmeErrorReporter &reporter,
				std::shared_ptr<EmeScheduler> scheduler, std::shared_ptr<EmeLicenseTransport> transport)
	: mState(state), mSessionManager(sessionManager), mReporter(reporter), mScheduler(scheduler), mTransport(transport),
	mLicenseServerUrls(), mRequestCustomizer(), mResponseTransform()
{
}

void EmeLicenseRequestProtocol::SetLicenseServerUrl(const std::string &keySystem, const std::string &url)
{
	mLicenseServerUrls[keySystem] = url;
}

std::string EmeLicenseRequestProtocol::GetLicenseServerUrl(const std::string &keySystem) const
{
	auto it = mLicenseServerUrls.find(keySystem);
	if (it == mLicenseServerUrls.end() || it->second.empty())
	{
		throw EmeKeySystemException("no license server URL configured for key-system \"" + keySystem + "\"");
	}
	return it->second;
}

void EmeLicenseRequestProtocol::SetRequestCustomizer(EmeLicenseRequestCustomizer customizer)
{
	mRequestCustomizer = customizer;
}

void EmeLicenseRequestProtocol::SetResponseTransform(EmeLicenseResponseTransform transform)
{
	mResponseTransform = transform;
}

void EmeLicenseRequestProtocol::RequestLicense(const std::vector<uint8_t> &keyMessage, EmeLicenseCallback onSuccess)
{
	EMELOG_INFO("Requesting content license for key-system");

	EmeSessionItemPtr item = mSessionManager.GetActiveItem();
	if (!item)
	{
		EMELOG_ERR("Fatal error: Media is encrypted but no key-system access has been obtained yet");
		mReporter.Report(eEME_ERROR_NO_ACCESS, true);
		return;
	}

	try
	{
		EmeLicenseRequest request;
		request.url = GetLicenseServerUrl(item->keySystem);

		std::shared_ptr<EmeKeySystemHelper> helper = EmeKeySystemHelperEngine::getInstance().createHelper(item->keySystem);
		if (!helper)
		{
			throw EmeKeySystemException("unsupported key-system: " + item->keySystem);
		}
		helper->generateLicenseRequest(keyMessage, request);

		if (mRequestCustomizer)
		{
			try
			{
				mRequestCustomizer(request);
			}
			catch (const std::exception &e)
			{
				EMELOG_ERR("License request customizer failed: %s", e.what());
			}
		}

		if (!mTransport)
		{
			throw EmeKeySystemException("no license transport");
		}

		EMELOG_INFO("Sending license request to URL: %s (%zu bytes)", request.url.c_str(), request.payload.size());
		std::string url = request.url;
		int itemId = item->id;
		std::shared_ptr<EmeScheduler> scheduler = mScheduler;
		mTransport->Send(request, [this, scheduler, itemId, keyMessage, onSuccess, url](const EmeLicenseResponse &response)
		{
			eme_ScheduleClosure(*scheduler, [this, itemId, keyMessage, onSuccess, url, response]()
			{
				OnLicenseResponse(itemId, keyMessage, onSuccess, url, response);
			}, "LicenseResponse");
		});
	}
	catch (const std::exception &e)
	{
		EMELOG_ERR("Failure requesting DRM license: %s", e.what());
		mReporter.Report(eEME_ERROR_LICENSE_REQUEST_FAILED, true);
	}
}

void EmeLicenseRequestProtocol::OnLicenseResponse(int itemId, const std::vector<uint8_t> &keyMessage, EmeLicenseCallback onSuccess, const std::string &url,
				const EmeLicenseResponse &response)
{
	// item ids are never reused, a missing item was closed by a media detach
	if (!mSessionManager.GetItem(itemId))
	{
		EMELOG_WARN("Dropping license response for removed item %d", itemId);
		return;
	}

	if (response.transportError == 0 && IS_HTTP_SUCCESS(response.httpStatus))
	{
		mState.licenseRequestFailureCount = 0;
		EMELOG_MIL("License request succeeded (%zu bytes)", response.data.size());
		std::vector<uint8_t> license = response.data;
		if (mResponseTransform)
		{
			try
			{
				license = mResponseTransform(response, url);
			}
			catch (const std::exception &e)
			{
				EMELOG_ERR("License response transform failed: %s", e.what());
			}
		}
		onSuccess(license);
		return;
	}

	EMELOG_ERR("License request failed (%s). Status: %d transport error: %d", url.c_str(), response.httpStatus, response.transportError);
	mState.licenseRequestFailureCount++;
	if (mState.licenseRequestFailureCount > MAX_LICENSE_REQUEST_FAILURES)
	{
		mReporter.Report(eEME_ERROR_LICENSE_REQUEST_FAILED, true);
		return;
	}

	int attemptsLeft = MAX_LICENSE_REQUEST_FAILURES - mState.licenseRequestFailureCount + 1;
	EMELOG_WARN("Retrying license request, %d attempts left", attemptsLeft);
	RequestLicense(keyMessage, onSuccess);
}
