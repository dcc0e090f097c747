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
 * @file EmeDrmTypes.h
 * @brief Data types shared by the key-system controller components
 */

#ifndef __EME_DRM_TYPES_H__
#define __EME_DRM_TYPES_H__

#include <stdint.h>
#include <string>
#include <vector>
#include <unordered_map>
#include <functional>
#include <exception>

/**
 * @brief Key-system error kinds, all reported under the key-system error category
 */
typedef enum
{
	eEME_ERROR_NO_KEYS,			/**< Media is encrypted but key-system access was never requested */
	eEME_ERROR_NO_ACCESS,			/**< No key-system access has been obtained */
	eEME_ERROR_NO_SESSION,			/**< No key session, or key session request generation failed */
	eEME_ERROR_NO_INIT_DATA,		/**< Init data required for request generation is absent */
	eEME_ERROR_LICENSE_REQUEST_FAILED,	/**< License request retries exhausted, or request could not be built */
	eEME_ERROR_UNSUPPORTED_KEY_SYSTEM	/**< Negotiation requested for an unknown key-system */
} EmeKeySystemErrorKind;

/**
 * @struct EmeKeySystemError
 * @brief Error notification emitted by the controller
 */
struct EmeKeySystemError
{
	EmeKeySystemErrorKind kind;
	bool fatal;

	EmeKeySystemError(EmeKeySystemErrorKind errorKind, bool isFatal) : kind(errorKind), fatal(isFatal)
	{
	}
};

typedef std::function<void (const EmeKeySystemError &error)> EmeErrorListener;

/**
 * @class EmeKeySystemException
 * @brief Thrown while building a license request
 */
class EmeKeySystemException : public std::exception
{
public:
	explicit EmeKeySystemException(const std::string &message) : mMessage(message)
	{
	}

	const char *what() const noexcept override
	{
		return mMessage.c_str();
	}

private:
	std::string mMessage;
};

/**
 * @struct EmeMediaCapability
 * @brief One audio or video capability of a key-system configuration
 */
struct EmeMediaCapability
{
	std::string contentType;	/**< e.g. video/mp4; codecs="avc1.4d401f" */
	std::string robustness;

	EmeMediaCapability(const std::string &type, const std::string &robust) : contentType(type), robustness(robust)
	{
	}
};

/**
 * @struct EmeMediaKeySystemConfiguration
 * @brief Capability requirements passed to the CDM access provider
 */
struct EmeMediaKeySystemConfiguration
{
	std::vector<EmeMediaCapability> audioCapabilities;
	std::vector<EmeMediaCapability> videoCapabilities;
};

/**
 * @struct EmeDrmSystemOptions
 * @brief Robustness requirements for the negotiated key-system
 */
struct EmeDrmSystemOptions
{
	std::string audioRobustness;
	std::string videoRobustness;
};

/**
 * @struct EmeLicenseRequest
 * @brief License request handed to the license transport
 */
struct EmeLicenseRequest
{
	enum LicenseMethod { GET, POST };

	LicenseMethod method;
	std::string url;
	std::unordered_map<std::string, std::vector<std::string>> headers;
	std::string payload;

	EmeLicenseRequest() : method(POST), url(), headers(), payload()
	{
	}
};

/**
 * @struct EmeLicenseResponse
 * @brief Result of a license exchange
 */
struct EmeLicenseResponse
{
	int transportError;		/**< 0 when the exchange completed, transport specific error code otherwise */
	int httpStatus;
	std::vector<uint8_t> data;

	EmeLicenseResponse() : transportError(0), httpStatus(0), data()
	{
	}
};

typedef std::function<void (const EmeLicenseResponse &response)> EmeLicenseResponseCallback;

/**
 * @brief Hook allowed to modify a license request before it is sent
 */
typedef std::function<void (EmeLicenseRequest &request)> EmeLicenseRequestCustomizer;

/**
 * @brief Hook allowed to replace the license response body
 */
typedef std::function<std::vector<uint8_t> (const EmeLicenseResponse &response, const std::string &url)> EmeLicenseResponseTransform;

/**
 * @brief Generic completion of an asynchronous capability call
 * @param success - true if the call succeeded
 * @param error - failure description, empty on success
 */
typedef std::function<void (bool success, const std::string &error)> EmeCompletionCallback;

/**
 * @struct EmeLevelKey
 * @brief Content protection metadata entry of a playlist
 */
struct EmeLevelKey
{
	std::string keyFormat;		/**< DRM identifier, e.g. urn:uuid:edef8ba9-79d6-4ace-a3c8-27dcd51d21ed */
	std::string reluri;		/**< "<encoding>,<pssh>", e.g. data:text/plain;base64,AAAA... */

	EmeLevelKey(const std::string &format = "", const std::string &uri = "") : keyFormat(format), reluri(uri)
	{
	}
};

/**
 * @struct EmeFragmentProtection
 * @brief Protection information of a loaded fragment
 */
struct EmeFragmentProtection
{
	bool foundKeys;
	std::vector<EmeLevelKey> keys;

	EmeFragmentProtection() : foundKeys(false), keys()
	{
	}
};

/**
 * @struct EmePsshState
 * @brief Most recent protection fingerprint versus the one already acted upon
 */
struct EmePsshState
{
	std::string currentPssh;
	std::string lastProcessedPssh;
};

/**
 * @struct EmeControllerState
 * @brief State shared by reference between the controller components
 */
struct EmeControllerState
{
	EmePsshState pssh;
	int licenseRequestFailureCount;
	bool haveKeySession;
	bool hasSetMediaKeys;
	std::string initDataType;
	std::vector<uint8_t> initData;

	EmeControllerState() : pssh(), licenseRequestFailureCount(0), haveKeySession(false),
		hasSetMediaKeys(false), initDataType(), initData()
	{
	}
};

#endif /* __EME_DRM_TYPES_H__ */
