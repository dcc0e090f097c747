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
 * @file EmeCurlLicenseTransport.h
 * @brief libcurl license transport
 */

#ifndef __EME_CURL_LICENSE_TRANSPORT_H__
#define __EME_CURL_LICENSE_TRANSPORT_H__

#include <memory>
#include "EmeCdmInterfaces.h"
#include "EmeConfig.h"
#include "EmeScheduler.h"
#include "downloader/EmeCurlDownloader.h"

/**
 * @class EmeCurlLicenseTransport
 * @brief Posts license challenges with libcurl on a worker thread owned by the transport
 *
 * Requests are served one at a time in submission order. Completions are called
 * on the worker thread.
 */
class EmeCurlLicenseTransport : public EmeLicenseTransport
{
public:
	/**
	 * @param[in] config - network settings are read once, at construction
	 * @param[in] controllerId - id used to tag the worker's log lines
	 */
	EmeCurlLicenseTransport(const EmeConfig &config, int controllerId);

	~EmeCurlLicenseTransport();

	EmeCurlLicenseTransport(const EmeCurlLicenseTransport&) = delete;
	EmeCurlLicenseTransport& operator=(const EmeCurlLicenseTransport&) = delete;

	/**
	 * @throws EmeKeySystemException if the worker no longer accepts requests
	 */
	void Send(const EmeLicenseRequest &request, EmeLicenseResponseCallback onComplete) override;

	/**
	 * @brief Convert license request headers to the "Name:" keys the downloader expects
	 */
	static void ApplyHeaders(const EmeLicenseRequest &request, DownloadConfig &config);

private:
	void Perform(const EmeLicenseRequest &request, EmeLicenseResponseCallback onComplete);

	DownloadConfig mBaseConfig;
	EmeCurlDownloader mDownloader;
	EmeScheduler mWorker;
};

#endif /* __EME_CURL_LICENSE_TRANSPORT_H__ */
