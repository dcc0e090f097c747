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
 * @file EmeKeySessionManager.cpp
 * @brief Owns the key sessions of the controller
 */

#include "EmeKeySessionManager.h"
#include "EmeLogManager.h"

bool EmeSessionItem::AdvanceState(EmeSessionItemState next)
{
	if (next <= state)
	{
		EMELOG_WARN("item %d: ignoring transition %s -> %s", id, GetStateName(state), GetStateName(next));
		return false;
	}
	EMELOG_DEBUG("item %d: %s -> %s", id, GetStateName(state), GetStateName(next));
	state = next;
	return true;
}

const char *EmeSessionItem::GetStateName(EmeSessionItemState state)
{
	switch (state)
	{
		case eSESSION_ITEM_UNINITIALIZED:
			return "Uninitialized";
		case eSESSION_ITEM_ACCESS_GRANTED:
			return "AccessGranted";
		case eSESSION_ITEM_SESSION_CREATED:
			return "SessionCreated";
		case eSESSION_ITEM_REQUEST_GENERATED:
			return "RequestGenerated";
		case eSESSION_ITEM_LICENSE_EXCHANGED:
			return "LicenseExchanged";
		case eSESSION_ITEM_FAILED:
			return "Failed";
	}
	return "Unknown";
}

EmeKeySessionManager::EmeKeySessionManager(EmeControllerState &state, EmeErrorReporter &reporter, std::shared_ptr<EmeScheduler> scheduler)
	: mState(state), mReporter(reporter), mScheduler(scheduler), mKeyMessageHandler(), mItems(),
	mActiveItemId(-1), mNextItemId(0)
{
}

void EmeKeySessionManager::SetKeyMessageHandler(EmeKeyMessageHandler handler)
{
	mKeyMessageHandler = handler;
}

int EmeKeySessionManager::AddSessionItem(std::shared_ptr<EmeCdmInstance> cdm, std::shared_ptr<EmeKeySystemAccess> access, const std::string &keySystem)
{
	int id = mNextItemId++;
	EmeSessionItemPtr item = std::make_shared<EmeSessionItem>(id, cdm, access, keySystem);
	item->AdvanceState(eSESSION_ITEM_ACCESS_GRANTED);
	mItems[id] = item;
	mActiveItemId = id;
	EMELOG_INFO("Added session item %d for %s", id, keySystem.c_str());
	return id;
}

void EmeKeySessionManager::OnCdmAvailable()
{
	for (auto &entry : mItems)
	{
		EmeSessionItemPtr item = entry.second;
		if (item->session || !item->cdmInstance)
		{
			continue;
		}
		item->session = item->cdmInstance->CreateSession();
		if (!item->session)
		{
			EMELOG_ERR("CDM failed to create a key session for item %d", item->id);
			continue;
		}
		item->AdvanceState(eSESSION_ITEM_SESSION_CREATED);
		mState.haveKeySession = true;
		EMELOG_MIL("New key-system session %s", item->session->GetSessionId().c_str());

		int itemId = item->id;
		std::shared_ptr<EmeScheduler> scheduler = mScheduler;
		item->session->SetMessageHandler([this, scheduler, itemId](const std::vector<uint8_t> &message)
		{
			eme_ScheduleClosure(*scheduler, [this, itemId, message]() { OnKeyMessage(itemId, message); }, "KeyMessage");
		});
	}
}

void EmeKeySessionManager::OnKeyMessage(int itemId, const std::vector<uint8_t> &message)
{
	EmeSessionItemPtr item = GetItem(itemId);
	if (!item)
	{
		EMELOG_WARN("Dropping key message of removed item %d", itemId);
		return;
	}
	EMELOG_INFO("Got key message (%zu bytes) on item %d, creating license request", message.size(), itemId);
	if (mKeyMessageHandler)
	{
		mKeyMessageHandler(item, message);
	}
	else
	{
		EMELOG_ERR("No key message handler installed");
	}
}

void EmeKeySessionManager::GenerateRequestForActiveSession(const std::string &initDataType, const std::vector<uint8_t> &initData)
{
	EmeSessionItemPtr item = GetActiveItem();
	if (!item)
	{
		EMELOG_ERR("Fatal: Media is encrypted but not any key-system access has been obtained yet");
		mState.pssh.lastProcessedPssh.clear();
		mReporter.Report(eEME_ERROR_NO_ACCESS, true);
		return;
	}

	if (item->initialized)
	{
		EMELOG_WARN("Key-Session already initialized but requested again");
		return;
	}

	if (!item->session)
	{
		EMELOG_ERR("Fatal: Media is encrypted but no key-session existing");
		mReporter.Report(eEME_ERROR_NO_SESSION, true);
		return;
	}

	if (initData.empty())
	{
		EMELOG_ERR("Fatal: initData required for generating a key session is null");
		mReporter.Report(eEME_ERROR_NO_INIT_DATA, true);
		return;
	}

	EMELOG_INFO("Generating key-session request for \"%s\" init data type (%zu bytes)", initDataType.c_str(), initData.size());
	item->initialized = true;
	item->AdvanceState(eSESSION_ITEM_REQUEST_GENERATED);

	int itemId = item->id;
	std::shared_ptr<EmeScheduler> scheduler = mScheduler;
	item->session->GenerateRequest(initDataType, initData, [this, scheduler, itemId](bool success, const std::string &error)
	{
		eme_ScheduleClosure(*scheduler, [this, itemId, success, error]() { OnGenerateRequestDone(itemId, success, error); }, "GenerateRequestDone");
	});
}

void EmeKeySessionManager::OnGenerateRequestDone(int itemId, bool success, const std::string &error)
{
	EmeSessionItemPtr item = GetItem(itemId);
	if (!item)
	{
		EMELOG_WARN("Dropping request generation result for removed item %d", itemId);
		return;
	}
	if (success)
	{
		EMELOG_DEBUG("Key-session generation succeeded");
		return;
	}
	EMELOG_ERR("Error generating key-session request: %s", error.c_str());
	item->AdvanceState(eSESSION_ITEM_FAILED);
	mReporter.Report(eEME_ERROR_NO_SESSION, false);
}

void EmeKeySessionManager::UpdateSession(EmeSessionItemPtr item, const std::vector<uint8_t> &license)
{
	if (!item->session)
	{
		EMELOG_ERR("item %d has no session to update", item->id);
		return;
	}
	EMELOG_INFO("Received license data (length: %zu), updating key-session", license.size());
	int itemId = item->id;
	std::shared_ptr<EmeScheduler> scheduler = mScheduler;
	item->session->Update(license, [this, scheduler, itemId](bool success, const std::string &error)
	{
		eme_ScheduleClosure(*scheduler, [this, itemId, success, error]() { OnUpdateDone(itemId, success, error); }, "UpdateDone");
	});
}

void EmeKeySessionManager::OnUpdateDone(int itemId, bool success, const std::string &error)
{
	EmeSessionItemPtr item = GetItem(itemId);
	if (!item)
	{
		EMELOG_WARN("Dropping session update result for removed item %d", itemId);
		return;
	}
	if (success)
	{
		EMELOG_MIL("License applied to key-session of item %d", itemId);
		item->AdvanceState(eSESSION_ITEM_LICENSE_EXCHANGED);
	}
	else
	{
		EMELOG_ERR("Key-session update failed on item %d: %s", itemId, error.c_str());
		item->AdvanceState(eSESSION_ITEM_FAILED);
	}
}

EmeSessionItemPtr EmeKeySessionManager::GetActiveItem() const
{
	return GetItem(mActiveItemId);
}

EmeSessionItemPtr EmeKeySessionManager::GetItem(int id) const
{
	auto it = mItems.find(id);
	if (it == mItems.end())
	{
		return nullptr;
	}
	return it->second;
}

std::vector<EmeSessionItemPtr> EmeKeySessionManager::TakeAllItems()
{
	std::vector<EmeSessionItemPtr> items;
	for (auto &entry : mItems)
	{
		items.push_back(entry.second);
	}
	mItems.clear();
	mActiveItemId = -1;
	return items;
}
