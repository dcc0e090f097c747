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
* @file EmeDrmUtils.cpp
* @brief Helpers for building and inspecting protection system specific header boxes
*/

#include <string.h>
#include <uuid/uuid.h>

#include "EmeDrmUtils.h"
#include "EmeLogManager.h"

static void writeU32(std::vector<uint8_t> &buf, uint32_t value)
{
	buf.push_back((uint8_t)(value >> 24));
	buf.push_back((uint8_t)(value >> 16));
	buf.push_back((uint8_t)(value >> 8));
	buf.push_back((uint8_t)value);
}

bool EmeDrmUtils::buildPsshBox(const std::string &systemId, const std::vector<uint8_t> &data, std::vector<uint8_t> &box)
{
	uuid_t uuid;
	if (uuid_parse(systemId.c_str(), uuid) != 0)
	{
		EMELOG_ERR("invalid system id '%s'", systemId.c_str());
		return false;
	}

	box.clear();
	box.reserve(PSSH_BOX_HEADER_SIZE + data.size());
	writeU32(box, (uint32_t)(PSSH_BOX_HEADER_SIZE + data.size()));
	box.push_back('p');
	box.push_back('s');
	box.push_back('s');
	box.push_back('h');
	writeU32(box, 0); // version 0, no flags
	box.insert(box.end(), uuid, uuid + PSSH_SYSTEM_ID_SIZE);
	writeU32(box, (uint32_t)data.size());
	box.insert(box.end(), data.begin(), data.end());
	return true;
}

bool EmeDrmUtils::getPsshSystemId(const std::vector<uint8_t> &box, std::string &systemId)
{
	if (box.size() < PSSH_BOX_HEADER_SIZE || memcmp(&box[4], "pssh", 4) != 0)
	{
		EMELOG_WARN("not a pssh box (%zu bytes)", box.size());
		return false;
	}
	uuid_t uuid;
	memcpy(uuid, &box[12], PSSH_SYSTEM_ID_SIZE);
	char text[37];
	uuid_unparse_lower(uuid, text);
	systemId = text;
	return true;
}
