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
 * @file EmePlayReadyHelper.cpp
 * @brief Handles the PlayReady key-system helper functions
 */

#include <strings.h>
#include <libxml/parser.h>
#include <libxml/tree.h>

#include "EmePlayReadyHelper.h"
#include "EmeDrmUtils.h"
#include "EmeBase64.h"
#include "EmeDefine.h"
#include "EmeUtils.h"
#include "EmeLogManager.h"

static EmePlayReadyHelperFactory playready_helper_factory;

const std::string EmePlayReadyHelper::PLAYREADY_OCDM_ID = PLAYREADY_KEY_SYSTEM_STRING;

/**
 * @class KeyMessageDocument
 * @brief Owns the parsed key message
 */
class KeyMessageDocument
{
public:
	explicit KeyMessageDocument(const std::vector<uint8_t>& keyMessage) : mDoc(nullptr)
	{
		if (!keyMessage.empty())
		{
			mDoc = xmlReadMemory((const char *)keyMessage.data(), (int)keyMessage.size(), "noname.xml", "UTF-16LE", 0);
		}
		if (mDoc == nullptr)
		{
			EMELOG_ERR("Failed to parse key message (%zu bytes)", keyMessage.size());
			DumpBlob(keyMessage.data(), keyMessage.size());
		}
	}

	~KeyMessageDocument()
	{
		if (mDoc)
		{
			xmlFreeDoc(mDoc);
		}
	}

	KeyMessageDocument(const KeyMessageDocument&) = delete;
	KeyMessageDocument& operator=(const KeyMessageDocument&) = delete;

	xmlNode *getRoot() const
	{
		return mDoc ? xmlDocGetRootElement(mDoc) : nullptr;
	}

private:
	xmlDoc *mDoc;
};

/**
 * @brief depth first search for elements by local name
 */
static void findElements(xmlNode *node, const char *name, std::vector<xmlNode *> &found)
{
	for (xmlNode *cur = node; cur; cur = cur->next)
	{
		if (cur->type == XML_ELEMENT_NODE)
		{
			if (xmlStrcmp(cur->name, (const xmlChar *)name) == 0)
			{
				found.push_back(cur);
			}
			findElements(cur->children, name, found);
		}
	}
}

static std::string getText(xmlNode *node)
{
	std::string text;
	xmlChar *content = xmlNodeGetContent(node);
	if (content)
	{
		text = (const char *)content;
		xmlFree(content);
	}
	return text;
}

const std::string& EmePlayReadyHelper::ocdmSystemId() const
{
	return PLAYREADY_OCDM_ID;
}

const std::string& EmePlayReadyHelper::drmIdentifier() const
{
	// playlists tag PlayReady with the key-system string itself
	return PLAYREADY_OCDM_ID;
}

bool EmePlayReadyHelper::createInitData(const std::vector<uint8_t>& payload, std::vector<uint8_t>& initData)
{
	return EmeDrmUtils::buildPsshBox(PLAYREADY_SYSTEM_ID, payload, initData);
}

std::vector<std::pair<std::string, std::string>> EmePlayReadyHelper::getHttpHeaders(const std::vector<uint8_t>& keyMessage)
{
	std::vector<std::pair<std::string, std::string>> headers;
	KeyMessageDocument doc(keyMessage);
	std::vector<xmlNode *> httpHeaders;
	findElements(doc.getRoot(), "HttpHeader", httpHeaders);
	for (auto header : httpHeaders)
	{
		std::vector<xmlNode *> names;
		std::vector<xmlNode *> values;
		findElements(header->children, "name", names);
		findElements(header->children, "value", values);
		if (names.empty() || values.empty())
		{
			EMELOG_WARN("Skipping incomplete HttpHeader");
			continue;
		}
		headers.push_back(std::make_pair(getText(names.front()), getText(values.front())));
	}
	return headers;
}

void EmePlayReadyHelper::generateLicenseRequest(const std::vector<uint8_t>& keyMessage, EmeLicenseRequest& licenseRequest) const
{
	KeyMessageDocument doc(keyMessage);
	std::vector<xmlNode *> challenges;
	findElements(doc.getRoot(), "Challenge", challenges);
	std::string challengeText;
	if (!challenges.empty())
	{
		challengeText = getText(challenges.front());
		trim(challengeText);
	}
	if (challengeText.empty())
	{
		throw EmeKeySystemException("Cannot find <Challenge> in key message");
	}

	std::vector<uint8_t> challenge;
	if (!eme_Base64Decode(challengeText, challenge))
	{
		throw EmeKeySystemException("<Challenge> in key message is not valid base64");
	}

	licenseRequest.method = EmeLicenseRequest::POST;
	licenseRequest.payload.assign(challenge.begin(), challenge.end());
	for (auto &header : getHttpHeaders(keyMessage))
	{
		EMELOG_DEBUG("PlayReady header %s: %s", header.first.c_str(), header.second.c_str());
		licenseRequest.headers[header.first].push_back(header.second);
	}
}

bool EmePlayReadyHelperFactory::isKeySystem(const std::string& keySystem) const
{
	return (keySystem == PLAYREADY_KEY_SYSTEM_STRING) || (strcasecmp(keySystem.c_str(), "playready") == 0);
}

bool EmePlayReadyHelperFactory::isDrmIdentifier(const std::string& drmIdentifier) const
{
	return drmIdentifier == PLAYREADY_DRM_IDENTIFIER;
}

std::shared_ptr<EmeKeySystemHelper> EmePlayReadyHelperFactory::createHelper() const
{
	return std::make_shared<EmePlayReadyHelper>();
}

void EmePlayReadyHelperFactory::appendSystemId(std::vector<std::string>& systemIds) const
{
	systemIds.push_back(PLAYREADY_SYSTEM_ID);
}
