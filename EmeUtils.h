/*
 * If not stated otherwise in this file or this component's license file the
 * following copyright and licenses apply:
 *
 * Copyright 2018 RDK Management
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
* @file EmeUtils.h
* @brief Context-free common utility functions.
*/

#ifndef __EME_UTILS_H__
#define __EME_UTILS_H__

#include <thread>
#include <memory>
#include <string>
#include <vector>
#include <chrono>
#include <cstdint>
#include <pthread.h>

#define NOW_STEADY_TS_MS std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now().time_since_epoch()).count()     /**< Getting current steady clock in milliseconds */

#define ARRAY_SIZE(A) (sizeof(A)/sizeof(A[0]))

/**HTTP SUccess*/
#define IS_HTTP_SUCCESS(code) ((code) == 200)

#define WRITE_HASCII( DST, BYTE ) \
{ \
	*DST++ = "0123456789abcdef"[BYTE>>4]; \
	*DST++ = "0123456789abcdef"[BYTE&0xf]; \
}

/**
 * @fn trim
 * @param[in][out] src Buffer containing string
 */
void trim(std::string& src);

/**
 * @fn SplitOnce
 * @brief split a string on the first occurrence of a delimiter
 * @param[in] src string to split
 * @param[in] delim delimiter character
 * @param[out] head text before the delimiter (whole string if not found)
 * @param[out] tail text after the delimiter (empty if not found)
 * @retval true if the delimiter was found
 */
bool SplitOnce(const std::string &src, char delim, std::string &head, std::string &tail);

std::size_t GetPrintableThreadID( const std::thread &t );
std::size_t GetPrintableThreadID( const pthread_t &t );
std::size_t GetPrintableThreadID();

/**
 * @brief Account for the EME_CFG_DIR override to give path to a config file
 * "/opt/somefile.txt" -> "$EME_CFG_DIR/somefile.txt" when EME_CFG_DIR is set
 * @param[in] filename config file name
 * @retval a full path
 */
std::string eme_GetConfigPath( const std::string &filename );

#endif  /* __EME_UTILS_H__ */
