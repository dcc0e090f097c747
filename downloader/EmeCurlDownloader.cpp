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
* @file EmeCurlDownloader.cpp
* @brief Curl Downloader for license exchanges
**************************************/

#include "EmeCurlDownloader.h"
#include "EmeLogManager.h"
#include <iterator>

void _downloadConfig::show()
{
	EMELOG_INFO("iDownloadTimeout : %u", iDownloadTimeout);
	EMELOG_INFO("iCurlConnectionTimeout : %u", iCurlConnectionTimeout);
	EMELOG_INFO("bSSLVerifyPeer : %d", bSSLVerifyPeer);
	EMELOG_INFO("userAgentString :%s",userAgentString.c_str());
	EMELOG_INFO("proxyName :%s",proxyName.c_str());
	for (auto it = sCustomHeaders.begin(); it != sCustomHeaders.end(); it++)
	{
		if (!it->second.empty())
		{
			EMELOG_INFO("header : %s %s", it->first.c_str(), it->second.at(0).c_str());
		}
	}
}

void _downloadResponse::show()
{
	EMELOG_INFO("curlRetValue : %d", curlRetValue);
	EMELOG_INFO("iHttpRetValue : %d", iHttpRetValue);
	EMELOG_INFO("dataSize : %d bytes", (int)mDownloadData.size());
	EMELOG_INFO("effective Url : %s", sEffectiveUrl.c_str());
	for(auto it=mResponseHeader.begin();it < mResponseHeader.end();it++)
	{
		EMELOG_INFO("Header=>: %s",(*it).c_str());
	}
}

long eme_CurlEasyGetinfoLong( CURL *handle, CURLINFO info )
{
	long rc = -1;
	if( handle && curl_easy_getinfo(handle,info,&rc) != CURLE_OK )
	{
		EMELOG_WARN( "eme_CurlEasyGetinfoLong failure" );
	}
	return rc;
}

char *eme_CurlEasyGetinfoString( CURL *handle, CURLINFO info )
{
	char *rc = NULL;
	if( handle && curl_easy_getinfo(handle,info,&rc) != CURLE_OK )
	{
		EMELOG_WARN( "eme_CurlEasyGetinfoString failure" );
	}
	return rc;
}

EmeCurlDownloader::EmeCurlDownloader() : mCurlMutex(),mDownloadActive(false),mAborted(false),mDnldCfg(),mDownloadResponse(nullptr),
			mCurl(nullptr),mHeaders(NULL)
{
	EMELOG_INFO("Create Curl Downloader Instance ");
}

EmeCurlDownloader::~EmeCurlDownloader()
{
	mDownloadActive = false;
	if(mCurl)
	{
		curl_easy_cleanup(mCurl);
		mCurl = nullptr;
	}
	if (mHeaders != NULL)
	{
		curl_slist_free_all(mHeaders);
		mHeaders = NULL;
	}
}

int EmeCurlDownloader::Download(const std::string &urlStr, std::shared_ptr<DownloadResponse> dnldData )
{
	int httpRetVal=0;
	if(urlStr.size() == 0 || dnldData == nullptr)
	{
		EMELOG_ERR("Invalid inputs provided for download . Check the arguments. Url[%s] dnldData is Null[%d]", urlStr.c_str(), (dnldData == nullptr));
	}
	else if(mAborted)
	{
		EMELOG_WARN("Downloader aborted, ignoring download of %s", urlStr.c_str());
		dnldData->clear();
		dnldData->curlRetValue = CURLE_ABORTED_BY_CALLBACK;
	}
	else if(mCurl)
	{
		if(!mDownloadActive)
		{
			{
				std::lock_guard<std::mutex> lock(mCurlMutex);
				mDownloadActive		=	true;
				mDownloadResponse	=	dnldData;
				mDownloadResponse->clear();
				mDownloadResponse->sEffectiveUrl	=	urlStr;
				CURL_EASY_SETOPT_STRING(mCurl, CURLOPT_URL, urlStr.c_str());
			}
			int curlRetVal = curl_easy_perform(mCurl);
			if(curlRetVal == CURLE_OK)
			{
				httpRetVal = mDownloadResponse->iHttpRetValue = (int)eme_CurlEasyGetinfoLong( mCurl, CURLINFO_RESPONSE_CODE );
				char *effectiveUrlStr = eme_CurlEasyGetinfoString(mCurl, CURLINFO_EFFECTIVE_URL);
				if(effectiveUrlStr != NULL)
				{
					mDownloadResponse->sEffectiveUrl.assign(effectiveUrlStr);
				}
			}
			else
			{
				/*
				 * curl errors are below 100 and http status starts from 100,
				 * so the curl error travels in the http code slot
				 */
				EMELOG_WARN("curl_easy_perform failed: %d (%s)", curlRetVal, curl_easy_strerror((CURLcode)curlRetVal));
				mDownloadResponse->iHttpRetValue = httpRetVal = curlRetVal;
			}
			EMELOG_INFO("Download Status Ret:%d %d %s", curlRetVal, mDownloadResponse->iHttpRetValue, urlStr.c_str());
			mDownloadResponse->curlRetValue = curlRetVal;
			mDownloadActive = false;
			Release();
		}
		else
		{
			EMELOG_ERR("Already download in progress.Ignore new request for download %s",urlStr.c_str());
		}
	}
	else
	{
		EMELOG_ERR("Failed to Initialize CurlDownloader. mCurl is Null ");
	}
	return httpRetVal;
}

void EmeCurlDownloader::Initialize(std::shared_ptr<DownloadConfig> dnldCfg)
{
	if(dnldCfg == nullptr)
		return;

	// Release and reset any previously applied values
	Release();

	std::lock_guard<std::mutex> lock(mCurlMutex);
	mDnldCfg = dnldCfg;
	if(mCurl == NULL)
	{
		mCurl = curl_easy_init();
	}
	else
	{
		curl_easy_reset(mCurl);
	}
	if(mCurl)
	{
		updateCurlParams();
	}
	else
	{
		EMELOG_ERR("curl_easy_init failed");
	}
}

void EmeCurlDownloader::Release()
{
	std::lock_guard<std::mutex> lock(mCurlMutex);
	mDownloadActive = false;
	if (mHeaders != NULL)
	{
		if (mCurl)
		{
			CURL_EASY_SETOPT_LIST(mCurl, CURLOPT_HTTPHEADER, (struct curl_slist *)NULL);
		}
		curl_slist_free_all(mHeaders);
		mHeaders = NULL;
	}
}

void EmeCurlDownloader::Abort()
{
	mAborted = true;
}

void EmeCurlDownloader::updateCurlParams()
{
	if(mDnldCfg->bVerbose)
	{
		CURL_EASY_SETOPT_LONG(mCurl, CURLOPT_VERBOSE, 1L);
	}

	if(eCURL_POST == mDnldCfg->eRequestType)
	{
		CURL_EASY_SETOPT_LONG(mCurl, CURLOPT_POSTFIELDSIZE, mDnldCfg->postData.size());
		CURL_EASY_SETOPT_POINTER(mCurl, CURLOPT_POSTFIELDS, mDnldCfg->postData.data());
	}

	CURL_EASY_SETOPT_LONG(mCurl, CURLOPT_NOSIGNAL, 1L);
	CURL_EASY_SETOPT_POINTER(mCurl, CURLOPT_WRITEDATA, this);
	CURL_EASY_SETOPT_POINTER(mCurl, CURLOPT_XFERINFODATA, this);
	CURL_EASY_SETOPT_FUNC(mCurl, CURLOPT_XFERINFOFUNCTION, EmeCurlDownloader::ProgressCallback);
	if(!mDnldCfg->bIgnoreResponseHeader)
	{
		CURL_EASY_SETOPT_POINTER(mCurl, CURLOPT_HEADERDATA, this);
		CURL_EASY_SETOPT_FUNC(mCurl, CURLOPT_HEADERFUNCTION, EmeCurlDownloader::HeaderCallback);
	}
	CURL_EASY_SETOPT_FUNC(mCurl, CURLOPT_WRITEFUNCTION, EmeCurlDownloader::WriteCallback);
	CURL_EASY_SETOPT_LONG(mCurl, CURLOPT_TIMEOUT, mDnldCfg->iDownloadTimeout);
	CURL_EASY_SETOPT_LONG(mCurl, CURLOPT_CONNECTTIMEOUT, mDnldCfg->iCurlConnectionTimeout);
	CURL_EASY_SETOPT_LONG(mCurl, CURLOPT_IPRESOLVE, CURL_IPRESOLVE_WHATEVER);
	CURL_EASY_SETOPT_LONG(mCurl, CURLOPT_FOLLOWLOCATION, 1L);
	CURL_EASY_SETOPT_LONG(mCurl, CURLOPT_NOPROGRESS, 0L); // progress callback aborts released downloads

	CURL_EASY_SETOPT_STRING(mCurl, CURLOPT_USERAGENT, mDnldCfg->userAgentString.c_str());
	CURL_EASY_SETOPT_STRING(mCurl, CURLOPT_ACCEPT_ENCODING, "");

	if (!mDnldCfg->proxyName.empty())
	{
		CURL_EASY_SETOPT_STRING(mCurl, CURLOPT_PROXY, mDnldCfg->proxyName.c_str());
		CURL_EASY_SETOPT_LONG(mCurl, CURLOPT_PROXYAUTH, CURLAUTH_ANY);
	}

	if(!mDnldCfg->bSSLVerifyPeer)
	{
		CURL_EASY_SETOPT_LONG(mCurl, CURLOPT_SSL_VERIFYHOST, 0L);
		CURL_EASY_SETOPT_LONG(mCurl, CURLOPT_SSL_VERIFYPEER, 0L);
	}
	else
	{
		CURL_EASY_SETOPT_LONG(mCurl, CURLOPT_SSLVERSION, CURL_SSLVERSION_TLSv1_2);
		CURL_EASY_SETOPT_LONG(mCurl, CURLOPT_SSL_VERIFYPEER, 1L);
	}

	if (mDnldCfg->sCustomHeaders.size() > 0)
	{
		std::string customHeader;
		for (auto it = mDnldCfg->sCustomHeaders.begin(); it != mDnldCfg->sCustomHeaders.end(); it++)
		{
			for (const auto &headerValue : it->second)
			{
				customHeader = it->first;
				customHeader.push_back(' ');
				customHeader.append(headerValue);
				mHeaders = curl_slist_append(mHeaders, customHeader.c_str());
			}
		}
		CURL_EASY_SETOPT_LIST(mCurl, CURLOPT_HTTPHEADER, mHeaders);
	}
}

size_t EmeCurlDownloader::WriteCallback(void *buffer, size_t sz, size_t nmemb, void *userdata)
{
	size_t ret = 0;
	EmeCurlDownloader *context = static_cast<EmeCurlDownloader *>(userdata);
	if(context != NULL)
	{
		ret = context->write_callback(buffer, sz, nmemb);
	}
	return ret;
}

size_t EmeCurlDownloader::write_callback(void *buffer, size_t sz, size_t nmemb)
{
	size_t retSize = sz * nmemb;
	if(retSize)
	{
		std::lock_guard<std::mutex> lock(mCurlMutex);
		std::uint8_t *bufferS = static_cast<std::uint8_t*>( buffer );
		std::uint8_t *bufferE = bufferS + retSize;
		std::copy(bufferS, bufferE, std::back_inserter(this->mDownloadResponse->mDownloadData));
	}
	return retSize;
}

size_t EmeCurlDownloader::HeaderCallback(void *buffer, size_t sz, size_t nmemb, void *userdata)
{
	size_t ret = 0;
	EmeCurlDownloader *context = static_cast<EmeCurlDownloader *>(userdata);
	if(context != NULL)
	{
		ret = context->header_callback(buffer, sz, nmemb);
	}
	return ret;
}

size_t EmeCurlDownloader::header_callback(void *buffer, size_t sz, size_t nmemb)
{
	size_t retSize = sz * nmemb;
	if(retSize)
	{
		std::lock_guard<std::mutex> lock(mCurlMutex);
		std::uint8_t *bufferS = static_cast<std::uint8_t*>( buffer );
		std::string str(bufferS, bufferS + retSize);
		size_t pos = str.find_first_of("\r\n");
		if(pos != std::string::npos)
		{
			str.erase(pos);
		}
		if(str.size())
		{
			this->mDownloadResponse->mResponseHeader.push_back(str);
		}
	}
	return retSize;
}

int EmeCurlDownloader::ProgressCallback( void *clientp, curl_off_t dltotal, curl_off_t dlnow, curl_off_t ultotal, curl_off_t ulnow )
{
	int rc = 0;
	EmeCurlDownloader *context = static_cast<EmeCurlDownloader *>(clientp);
	if(context && (context->mAborted || !context->mDownloadActive))
	{
		EMELOG_WARN("Abort download... Abort called");
		rc = -1; // CURLE_ABORTED_BY_CALLBACK
	}
	return rc;
}
