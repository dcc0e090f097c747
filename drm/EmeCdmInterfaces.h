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
 * @file EmeCdmInterfaces.h
 * @brief Capabilities the key-system controller consumes
 *
 * Implementations may complete callbacks on any thread, the controller
 * re-posts every completion to its own scheduler.
 */

#ifndef __EME_CDM_INTERFACES_H__
#define __EME_CDM_INTERFACES_H__

#include <memory>
#include <string>
#include <vector>
#include "EmeDrmTypes.h"

class EmeCdmInstance;

/**
 * @class EmeKeySession
 * @brief A key session created by a CDM instance
 */
class EmeKeySession
{
public:
	typedef std::function<void (const std::vector<uint8_t> &message)> MessageHandler;

	virtual ~EmeKeySession() {}

	virtual std::string GetSessionId() const = 0;

	/**
	 * @brief Install the receiver of the session's outgoing license messages
	 */
	virtual void SetMessageHandler(MessageHandler handler) = 0;

	virtual void GenerateRequest(const std::string &initDataType, const std::vector<uint8_t> &initData, EmeCompletionCallback done) = 0;

	virtual void Update(const std::vector<uint8_t> &response, EmeCompletionCallback done) = 0;

	virtual void Close(EmeCompletionCallback done) = 0;
};

/**
 * @class EmeCdmInstance
 * @brief Handle to a content decryption module instance
 */
class EmeCdmInstance
{
public:
	virtual ~EmeCdmInstance() {}

	/**
	 * @brief Create a key session
	 * @retval nullptr if the CDM could not create one
	 */
	virtual std::shared_ptr<EmeKeySession> CreateSession() = 0;
};

/**
 * @class EmeKeySystemAccess
 * @brief Access granted to a key-system
 */
class EmeKeySystemAccess
{
public:
	typedef std::function<void (std::shared_ptr<EmeCdmInstance> cdm)> CreatedCallback;
	typedef std::function<void (const std::string &error)> FailureCallback;

	virtual ~EmeKeySystemAccess() {}

	virtual void CreateCdmInstance(CreatedCallback onCreated, FailureCallback onFailure) = 0;
};

/**
 * @class EmeCdmAccessProvider
 * @brief Grants access to a key-system for a set of capability requirements
 */
class EmeCdmAccessProvider
{
public:
	typedef std::function<void (std::shared_ptr<EmeKeySystemAccess> access)> GrantedCallback;
	typedef std::function<void (const std::string &error)> FailureCallback;

	virtual ~EmeCdmAccessProvider() {}

	virtual void RequestAccess(const std::string &keySystem, const std::vector<EmeMediaKeySystemConfiguration> &configs,
				GrantedCallback onGranted, FailureCallback onFailure) = 0;
};

/**
 * @class EmeMediaSink
 * @brief Media element the decryption keys are attached to
 */
class EmeMediaSink
{
public:
	virtual ~EmeMediaSink() {}

	/**
	 * @brief Attach a CDM instance, or detach the current one when cdm is nullptr
	 */
	virtual void SetMediaKeys(std::shared_ptr<EmeCdmInstance> cdm, EmeCompletionCallback done) = 0;
};

/**
 * @class EmeLicenseTransport
 * @brief Sends a license request to a license server
 */
class EmeLicenseTransport
{
public:
	virtual ~EmeLicenseTransport() {}

	/**
	 * @brief Send a license request, onComplete is called exactly once
	 * @note may throw if the request cannot be dispatched
	 */
	virtual void Send(const EmeLicenseRequest &request, EmeLicenseResponseCallback onComplete) = 0;
};

#endif /* __EME_CDM_INTERFACES_H__ */
