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
 * @file EmeKeySessionManager.h
 * @brief Owns the key sessions of the controller
 */

#ifndef __EME_KEY_SESSION_MANAGER_H__
#define __EME_KEY_SESSION_MANAGER_H__

#include <map>
#include <memory>
#include <string>
#include <vector>
#include "EmeCdmInterfaces.h"
#include "EmeErrorReporter.h"
#include "EmeScheduler.h"

/**
 * @brief Session item states, transitions only move forward
 */
typedef enum
{
	eSESSION_ITEM_UNINITIALIZED,
	eSESSION_ITEM_ACCESS_GRANTED,
	eSESSION_ITEM_SESSION_CREATED,
	eSESSION_ITEM_REQUEST_GENERATED,
	eSESSION_ITEM_LICENSE_EXCHANGED,
	eSESSION_ITEM_FAILED
} EmeSessionItemState;

/**
 * @struct EmeSessionItem
 * @brief A key-system access with its CDM instance and key session
 */
struct EmeSessionItem
{
	int id;
	std::shared_ptr<EmeCdmInstance> cdmInstance;
	std::shared_ptr<EmeKeySession> session;
	bool initialized;			/**< set once request generation was issued, never reset */
	std::shared_ptr<EmeKeySystemAccess> access;
	std::string keySystem;
	EmeSessionItemState state;

	EmeSessionItem(int itemId, std::shared_ptr<EmeCdmInstance> cdm, std::shared_ptr<EmeKeySystemAccess> keySystemAccess,
			const std::string &system) : id(itemId), cdmInstance(cdm), session(), initialized(false),
			access(keySystemAccess), keySystem(system), state(eSESSION_ITEM_UNINITIALIZED)
	{
	}

	/**
	 * @brief Move to a later state
	 * @retval false if next is not after the current state
	 */
	bool AdvanceState(EmeSessionItemState next);

	static const char *GetStateName(EmeSessionItemState state);
};

typedef std::shared_ptr<EmeSessionItem> EmeSessionItemPtr;

/**
 * @brief Receiver of key session messages, called on the scheduler thread
 */
typedef std::function<void (EmeSessionItemPtr item, const std::vector<uint8_t> &message)> EmeKeyMessageHandler;

/**
 * @class EmeKeySessionManager
 * @brief Identifier keyed store of session items with an explicit active item
 */
class EmeKeySessionManager
{
public:
	EmeKeySessionManager(EmeControllerState &state, EmeErrorReporter &reporter, std::shared_ptr<EmeScheduler> scheduler);

	EmeKeySessionManager(const EmeKeySessionManager&) = delete;
	EmeKeySessionManager& operator=(const EmeKeySessionManager&) = delete;

	/**
	 * @brief Set the receiver of outgoing session messages
	 */
	void SetKeyMessageHandler(EmeKeyMessageHandler handler);

	/**
	 * @brief Add an item for a granted access, it becomes the active item
	 * @return id of the new item
	 */
	int AddSessionItem(std::shared_ptr<EmeCdmInstance> cdm, std::shared_ptr<EmeKeySystemAccess> access, const std::string &keySystem);

	/**
	 * @brief Create a key session for every item that lacks one
	 */
	void OnCdmAvailable();

	/**
	 * @brief Issue request generation on the active item's session, at most once per item
	 */
	void GenerateRequestForActiveSession(const std::string &initDataType, const std::vector<uint8_t> &initData);

	/**
	 * @brief Feed a license response into an item's session
	 */
	void UpdateSession(EmeSessionItemPtr item, const std::vector<uint8_t> &license);

	/**
	 * @retval nullptr if there is no item
	 */
	EmeSessionItemPtr GetActiveItem() const;

	EmeSessionItemPtr GetItem(int id) const;

	size_t GetItemCount() const { return mItems.size(); }

	/**
	 * @brief Remove every item from the store
	 * @return the removed items
	 */
	std::vector<EmeSessionItemPtr> TakeAllItems();

private:
	void OnKeyMessage(int itemId, const std::vector<uint8_t> &message);
	void OnGenerateRequestDone(int itemId, bool success, const std::string &error);
	void OnUpdateDone(int itemId, bool success, const std::string &error);

	EmeControllerState &mState;
	EmeErrorReporter &mReporter;
	std::shared_ptr<EmeScheduler> mScheduler;
	EmeKeyMessageHandler mKeyMessageHandler;
	std::map<int, EmeSessionItemPtr> mItems;
	int mActiveItemId;
	int mNextItemId;
};

#endif /* __EME_KEY_SESSION_MANAGER_H__ */
