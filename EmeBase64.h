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

#ifndef __EME_BASE64_H__
#define __EME_BASE64_H__

/**
 * @file EmeBase64.h
 * @brief base64 source Decoder
 */

#include <stddef.h>
#include <stdint.h>
#include <string>
#include <vector>

/**
 * @brief decode base64 encoded data to binary equivalent
 * whitespace is skipped, decoding stops at the first '=' pad character
 * @param src pointer to cstring containing base64-encoded data
 * @param len receives byte length of returned pointer, or zero upon failure
 * @retval pointer to malloc'd memory containing decoded binary data
 * @retval NULL if src holds characters outside the base64 alphabet or allocation fails
 * @note caller responsible for freeing returned data
 */
unsigned char *base64_Decode(const char *src, size_t *len);

/**
 * @brief decode base64 text into a byte vector
 * @param[in] src base64 text
 * @param[out] out decoded bytes
 * @retval false if src is not valid base64
 */
bool eme_Base64Decode(const std::string &src, std::vector<uint8_t> &out);

#endif /* __EME_BASE64_H__ */
