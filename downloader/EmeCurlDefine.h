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

#ifndef __EME_CURL_DEFINE_H__
#define __EME_CURL_DEFINE_H__

/**
* @file EmeCurlDefine.h
* @brief Curl config defines
*/

#include <string>
#include <curl/curl.h>
#include "EmeLogManager.h"

#define DEFAULT_CURL_TIMEOUT 5L		/**< Default timeout for Curl downloads */
#define DEFAULT_CURL_CONNECTTIMEOUT 3L	/**< Curl socket connection timeout */

/**
 *
 * @enum Curl Request
 *
 */
enum CurlRequest
{
	eCURL_GET,
	eCURL_POST
};

#define CURL_EASY_SETOPT_POINTER( handle, option, parameter )\
	if (curl_easy_setopt( handle, option, parameter ) != CURLE_OK ) {\
		EMELOG_WARN("CURL_EASY_SETOPT_POINTER failure" );\
	}
#define CURL_EASY_SETOPT_STRING( handle, option, parameter)\
	if (curl_easy_setopt( handle, option, parameter ) != CURLE_OK ) {\
		EMELOG_WARN("CURL_EASY_SETOPT_STRING failure" );\
	}
#define CURL_EASY_SETOPT_LONG( handle, option, parameter )\
	if (curl_easy_setopt( handle, option, (long)parameter ) != CURLE_OK ) {\
		EMELOG_WARN("CURL_EASY_SETOPT_LONG failure" );\
	}
#define CURL_EASY_SETOPT_FUNC( handle, option, parameter )\
	if (curl_easy_setopt( handle, option, parameter ) != CURLE_OK) {\
		EMELOG_WARN("CURL_EASY_SETOPT_FUNC failure" );\
	}
#define CURL_EASY_SETOPT_LIST( handle, option, parameter )\
	if (curl_easy_setopt( handle, option, parameter ) != CURLE_OK) {\
		EMELOG_WARN("CURL_EASY_SETOPT_LIST failure" );\
	}

long eme_CurlEasyGetinfoLong( CURL *handle, CURLINFO info );
char *eme_CurlEasyGetinfoString( CURL *handle, CURLINFO info );

#endif  //__EME_CURL_DEFINE_H__
