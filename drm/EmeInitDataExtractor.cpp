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
 * @file EmeInitDataExtractor.cpp
 * @brief Builds key session init data from playlist protection metadata
 */

#include "EmeInitDataExtractor.h"
#include <algorithm>

#include "EmeKeySystemHelper.h"
#include "EmeDrmUtils.h"
#include "EmeBase64.h"
#include "EmeDefine.h"
#include "EmeUtils.h"
#include "EmeLogManager.h"

EmeInitDataResult EmeInitDataExtractor::Extract(const std::string &drmIdentifier, const std::vector<EmeLevelKey> &keys)
{
	const EmeLevelKey *levelKey = nullptr;
	for (auto &key : keys)
	{
		if (key.keyFormat == drmIdentifier)
		{
			levelKey = &key;
			break;
		}
	}
	if (!levelKey)
	{
		EMELOG_WARN("No protection metadata for %s among %zu entries", drmIdentifier.c_str(), keys.size());
		return eINIT_DATA_NOT_FOUND;
	}

	std::string encoding;
	std::string pssh;
	if (!SplitOnce(levelKey->reluri, ',', encoding, pssh) || pssh.empty())
	{
		EMELOG_WARN("Malformed protection metadata uri '%s'", levelKey->reluri.c_str());
		return eINIT_DATA_NOT_FOUND;
	}

	if (pssh == mState.pssh.currentPssh)
	{
		EMELOG_DEBUG("Protection metadata unchanged");
		return eINIT_DATA_UNCHANGED;
	}
	mState.pssh.currentPssh = pssh;
	mState.initDataType = EME_INIT_DATA_TYPE_CENC;
	mState.initData.clear();

	if (encoding.find("base64") == std::string::npos)
	{
		EMELOG_WARN("Unsupported protection metadata encoding '%s'", encoding.c_str());
		return eINIT_DATA_NEW;
	}

	std::vector<uint8_t> payload;
	if (!eme_Base64Decode(pssh, payload))
	{
		EMELOG_ERR("Protection metadata is not valid base64");
		return eINIT_DATA_NEW;
	}

	std::shared_ptr<EmeKeySystemHelper> helper = EmeKeySystemHelperEngine::getInstance().createHelperForDrmIdentifier(drmIdentifier);
	if (!helper)
	{
		return eINIT_DATA_NEW;
	}
	if (!helper->createInitData(payload, mState.initData))
	{
		mState.initData.clear();
		return eINIT_DATA_NEW;
	}

	// a pssh box must belong to a key system some helper handles, raw payloads pass as they are
	std::string systemId;
	if (EmeDrmUtils::getPsshSystemId(mState.initData, systemId))
	{
		std::vector<std::string> systemIds;
		EmeKeySystemHelperEngine::getInstance().getSystemIds(systemIds);
		if (std::find(systemIds.begin(), systemIds.end(), systemId) == systemIds.end())
		{
			EMELOG_ERR("%s protection metadata carries a pssh for unknown system %s", helper->friendlyName().c_str(), systemId.c_str());
			mState.initData.clear();
			return eINIT_DATA_NEW;
		}
	}
	EMELOG_INFO("%s init data (%zu bytes) built from protection metadata", helper->friendlyName().c_str(), mState.initData.size());
	return eINIT_DATA_NEW;
}
