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

/**************************************
* @file EmeCurlDownloader.h
* @brief Curl Downloader for license exchanges
**************************************/

#ifndef __EME_CURL_DOWNLOADER__
#define __EME_CURL_DOWNLOADER__

#include <stdint.h>
#include <unordered_map>
#include <vector>
#include <string>
#include <mutex>
#include <atomic>
#include <memory>
#include <curl/curl.h>
#include "EmeCurlDefine.h"

/**
 * @struct _downloadConfig
 * @brief structure to store the download configuration
 */
typedef struct _downloadConfig
{
	uint32_t iDownloadTimeout;
	uint32_t iCurlConnectionTimeout;

	CurlRequest eRequestType;
	bool	bSSLVerifyPeer;
	bool	bVerbose;
	bool 	bIgnoreResponseHeader;

	std::unordered_map<std::string, std::vector<std::string>> sCustomHeaders;	/**< header name including trailing ':' to values */
	std::string userAgentString;
	std::string postData;
	std::string proxyName;

	_downloadConfig() : iDownloadTimeout(DEFAULT_CURL_TIMEOUT),iCurlConnectionTimeout(DEFAULT_CURL_CONNECTTIMEOUT),
			eRequestType(eCURL_GET),bSSLVerifyPeer(true),bVerbose(false),bIgnoreResponseHeader(false),
			sCustomHeaders(),userAgentString(""),postData(""),proxyName("")
	{
	}
public:
	void show();
}DownloadConfig;

/**
 * @struct _downloadResponse
 * @brief structure to store the download response data
 */
typedef struct _downloadResponse
{
	int curlRetValue;
	int iHttpRetValue;

	std::string sEffectiveUrl;
	std::vector<std::string>  mResponseHeader;
	std::vector<std::uint8_t> mDownloadData;

	_downloadResponse() : curlRetValue(0), iHttpRetValue(0), sEffectiveUrl(""), mResponseHeader(), mDownloadData() {}

public:
	void clear()
	{
		mDownloadData.clear();
		sEffectiveUrl.clear();
		curlRetValue = 0;
		iHttpRetValue = 0;
		mResponseHeader.clear();
	}

	void show();
}DownloadResponse;

/**
 * @class EmeCurlDownloader
 * @brief Class to handle Curl download functionality
 */
class EmeCurlDownloader
{
public:
	EmeCurlDownloader();
	~EmeCurlDownloader();

	/**
	* @brief Initialize - prepare the curl handle for a download
	* @param[in] dnldCfg - configuration for download
	*/
	void Initialize(std::shared_ptr<DownloadConfig> dnldCfg);
	/**
	* @brief Release - function to stop the download and reset the download parameters
	*/
	void Release();
	/**
	* @brief Download - function to start  download
	* @param[in] urlStr - URL to download
	* @param[out] dnldData - structure to store download data
	* @return http status, or the curl error code when the transfer failed
	*/
	int Download(const std::string &urlStr, std::shared_ptr<DownloadResponse> dnldData );
	/**
	* @brief Abort - make a transfer in progress stop at its next progress callback and refuse later ones
	* @note safe to call from any thread, curl resources are left to the downloading thread
	*/
	void Abort();

private:
	void updateCurlParams();
	static size_t WriteCallback( void *contents, size_t size, size_t nmemb, void *userp );
	size_t write_callback(void *buffer, size_t sz, size_t n);
	static size_t HeaderCallback( void *contents, size_t size, size_t nmemb, void *userp );
	size_t header_callback(void *buffer, size_t sz, size_t n);
	static int ProgressCallback( void *clientp, curl_off_t dltotal, curl_off_t dlnow, curl_off_t ultotal, curl_off_t ulnow );

private:
	EmeCurlDownloader(const EmeCurlDownloader&) = delete;
	EmeCurlDownloader& operator=(const EmeCurlDownloader&) = delete;
	std::mutex mCurlMutex;
	std::atomic<bool> mDownloadActive;
	std::atomic<bool> mAborted;
	std::shared_ptr<DownloadConfig> mDnldCfg;
	std::shared_ptr<DownloadResponse> mDownloadResponse;
	CURL *mCurl;
	struct curl_slist *mHeaders;
};

#endif
