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
 * @file EmeCurlLicenseTransport.cpp
 * @brief libcurl license transport
 */

#include "EmeCurlLicenseTransport.h"
#include "EmeLogManager.h"

EmeCurlLicenseTransport::EmeCurlLicenseTransport(const EmeConfig &config, int controllerId)
	: mBaseConfig(), mDownloader(), mWorker()
{
	mBaseConfig.iDownloadTimeout = (uint32_t)config.GetConfigValue(eEMEConfig_DrmNetworkTimeout);
	mBaseConfig.iCurlConnectionTimeout = (uint32_t)config.GetConfigValue(eEMEConfig_CurlConnectTimeout);
	mBaseConfig.bSSLVerifyPeer = config.GetConfigValue(eEMEConfig_SslVerifyPeer);
	mBaseConfig.bVerbose = config.GetConfigValue(eEMEConfig_CurlLicenseLogging);
	mBaseConfig.userAgentString = config.GetConfigValue(eEMEConfig_UserAgent);
	mBaseConfig.proxyName = config.GetConfigValue(eEMEConfig_LicenseProxy);
	mBaseConfig.bIgnoreResponseHeader = !mBaseConfig.bVerbose;
	mWorker.StartScheduler(controllerId);
}

EmeCurlLicenseTransport::~EmeCurlLicenseTransport()
{
	// abort a transfer in progress so the worker can be joined, curl state is freed by the downloader afterwards
	mDownloader.Abort();
	mWorker.StopScheduler();
}

void EmeCurlLicenseTransport::ApplyHeaders(const EmeLicenseRequest &request, DownloadConfig &config)
{
	for (auto &header : request.headers)
	{
		std::string name = header.first;
		if (name.empty())
		{
			continue;
		}
		if (name.back() != ':')
		{
			name.push_back(':');
		}
		std::vector<std::string> &values = config.sCustomHeaders[name];
		values.insert(values.end(), header.second.begin(), header.second.end());
	}
}

void EmeCurlLicenseTransport::Send(const EmeLicenseRequest &request, EmeLicenseResponseCallback onComplete)
{
	int id = mWorker.ScheduleTask(AsyncTaskObj([this, request, onComplete](void *)
	{
		Perform(request, onComplete);
	}, this, "LicenseRequest"));
	if (id == EME_TASK_ID_INVALID)
	{
		throw EmeKeySystemException("license transport is not accepting requests");
	}
}

void EmeCurlLicenseTransport::Perform(const EmeLicenseRequest &request, EmeLicenseResponseCallback onComplete)
{
	std::shared_ptr<DownloadConfig> config = std::make_shared<DownloadConfig>(mBaseConfig);
	config->eRequestType = (request.method == EmeLicenseRequest::POST) ? eCURL_POST : eCURL_GET;
	config->postData = request.payload;
	ApplyHeaders(request, *config);
	if (config->bVerbose)
	{
		config->show();
	}

	std::shared_ptr<DownloadResponse> download = std::make_shared<DownloadResponse>();
	mDownloader.Initialize(config);
	int status = mDownloader.Download(request.url, download);
	if (config->bVerbose)
	{
		download->show();
	}

	EmeLicenseResponse response;
	if (download->curlRetValue != CURLE_OK)
	{
		response.transportError = download->curlRetValue;
	}
	else
	{
		response.httpStatus = status;
		response.data.swap(download->mDownloadData);
	}
	EMELOG_INFO("License response: http %d curl %d, %zu bytes", response.httpStatus, download->curlRetValue, response.data.size());
	onComplete(response);
}
