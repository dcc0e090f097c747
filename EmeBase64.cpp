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
 * @file EmeBase64.cpp
 * @brief base64 source Decoder
 */

#include "EmeBase64.h"
#include <stdlib.h>
#include <string.h>

static const char *base64_Alphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

#define BASE64_SKIP  (-1)
#define BASE64_PAD   (-2)
#define BASE64_BAD   (-3)

static int base64_Value(char c)
{
	if (c >= 'A' && c <= 'Z') return c - 'A';
	if (c >= 'a' && c <= 'z') return c - 'a' + 26;
	if (c >= '0' && c <= '9') return c - '0' + 52;
	switch (c)
	{
		case '+':
			return 62;
		case '/':
			return 63;
		case '=':
			return BASE64_PAD;
		case ' ':
		case '\t':
		case '\r':
		case '\n':
			return BASE64_SKIP;
		default:
			return BASE64_BAD;
	}
}

unsigned char *base64_Decode(const char *src, size_t *len)
{
	*len = 0;
	size_t srcLen = strlen(src);
	unsigned char *rc = (unsigned char *)malloc(((srcLen + 3) / 4) * 3 + 1);
	if (rc)
	{
		unsigned char *dst = rc;
		uint32_t accum = 0;
		int bits = 0;
		for (size_t i = 0; i < srcLen; i++)
		{
			int value = base64_Value(src[i]);
			if (value == BASE64_SKIP)
			{
				continue;
			}
			if (value == BASE64_PAD)
			{
				break;
			}
			if (value == BASE64_BAD)
			{
				free(rc);
				return NULL;
			}
			accum = (accum << 6) | (uint32_t)value;
			bits += 6;
			if (bits >= 8)
			{
				bits -= 8;
				*dst++ = (unsigned char)((accum >> bits) & 0xff);
			}
		}
		*len = (size_t)(dst - rc);
	}
	return rc;
}

bool eme_Base64Decode(const std::string &src, std::vector<uint8_t> &out)
{
	bool ret = false;
	size_t len = 0;
	unsigned char *decoded = base64_Decode(src.c_str(), &len);
	if (decoded)
	{
		out.assign(decoded, decoded + len);
		free(decoded);
		ret = true;
	}
	return ret;
}
