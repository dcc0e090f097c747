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
 * @file EmeErrorReporter.h
 * @brief Reports key-system errors to the embedding player
 */

#ifndef __EME_ERROR_REPORTER_H__
#define __EME_ERROR_REPORTER_H__

#include "EmeDrmTypes.h"

#define EME_KEY_SYSTEM_ERROR_CATEGORY "keySystemError"

/**
 * @class EmeErrorReporter
 * @brief Emits one notification per reported key-system error
 */
class EmeErrorReporter
{
public:
	EmeErrorReporter() : mListener(), mReportCount(0)
	{
	}

	EmeErrorReporter(const EmeErrorReporter&) = delete;
	EmeErrorReporter& operator=(const EmeErrorReporter&) = delete;

	/**
	 * @brief Set the receiver of error notifications, replaces any previous one
	 */
	void SetListener(EmeErrorListener listener);

	/**
	 * @brief Log and notify a key-system error
	 * @param[in] kind - error kind
	 * @param[in] fatal - true if playback cannot continue
	 */
	void Report(EmeKeySystemErrorKind kind, bool fatal);

	int GetReportCount() const { return mReportCount; }

	/**
	 * @brief Stable name of an error kind, e.g. keySystemNoKeys
	 */
	static const char *GetErrorName(EmeKeySystemErrorKind kind);

private:
	EmeErrorListener mListener;
	int mReportCount;
};

#endif /* __EME_ERROR_REPORTER_H__ */
