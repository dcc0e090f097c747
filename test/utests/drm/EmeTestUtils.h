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

#ifndef EME_TEST_UTILS_H
#define EME_TEST_UTILS_H

#include <cstring>
#include <string>
#include <utility>
#include <vector>

#include <gmock/gmock.h>

#include "EmeScheduler.h"
#include "EmeDrmTypes.h"

// For comparing memory buffers such as C-style arrays
MATCHER_P2(MemBufEq, buffer, elementCount, "")
{
	return std::memcmp(arg, buffer, elementCount * sizeof(buffer[0])) == 0;
}

/**
 * @brief Wait until the scheduler ran out of work
 *
 * Each round queues a marker task and waits for it, tasks queued by running
 * tasks are picked up by a later round.
 */
void FlushScheduler(EmeScheduler &scheduler, int rounds = 20);

/**
 * @brief Widevine pssh box (version 0) carrying the given key ids
 */
std::vector<uint8_t> BuildWidevinePssh(const std::vector<std::vector<uint8_t>> &keyIds);

/**
 * @brief Playlist protection entry for a pssh, in "data:text/plain;base64,<pssh>" form
 */
EmeLevelKey BuildLevelKey(const std::string &keyFormat, const std::vector<uint8_t> &pssh);

/**
 * @brief PlayReady key message as the CDM emits it, UTF-16LE encoded
 *
 * @param challenge - Challenge element text, omitted if empty
 * @param headers - HttpHeader name/value pairs
 */
std::vector<uint8_t> BuildPlayReadyKeyMessage(const std::string &challenge,
				const std::vector<std::pair<std::string, std::string>> &headers);

std::vector<uint8_t> ToUtf16LE(const std::string &text);

#endif /* EME_TEST_UTILS_H */
