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
 * @file EmeKeySystemHelper.cpp
 * @brief Helper factory registration and lookup
 */

#include "EmeKeySystemHelper.h"
#include "EmeLogManager.h"

EmeKeySystemHelperFactory::EmeKeySystemHelperFactory()
{
	EmeKeySystemHelperEngine::getInstance().registerFactory(this);
}

EmeKeySystemHelperEngine& EmeKeySystemHelperEngine::getInstance()
{
	static EmeKeySystemHelperEngine instance;
	return instance;
}

void EmeKeySystemHelperEngine::registerFactory(EmeKeySystemHelperFactory* factory)
{
	mFactories.push_back(factory);
}

std::shared_ptr<EmeKeySystemHelper> EmeKeySystemHelperEngine::createHelper(const std::string& keySystem) const
{
	for (auto factory : mFactories)
	{
		if (factory->isKeySystem(keySystem))
		{
			return factory->createHelper();
		}
	}
	EMELOG_WARN("No helper for key-system '%s'", keySystem.c_str());
	return nullptr;
}

std::shared_ptr<EmeKeySystemHelper> EmeKeySystemHelperEngine::createHelperForDrmIdentifier(const std::string& drmIdentifier) const
{
	for (auto factory : mFactories)
	{
		if (factory->isDrmIdentifier(drmIdentifier))
		{
			return factory->createHelper();
		}
	}
	EMELOG_WARN("No helper for DRM identifier '%s'", drmIdentifier.c_str());
	return nullptr;
}

bool EmeKeySystemHelperEngine::isKeySystemSupported(const std::string& keySystem) const
{
	for (auto factory : mFactories)
	{
		if (factory->isKeySystem(keySystem))
		{
			return true;
		}
	}
	return false;
}

void EmeKeySystemHelperEngine::getSystemIds(std::vector<std::string>& ids) const
{
	for (auto factory : mFactories)
	{
		factory->appendSystemId(ids);
	}
}
