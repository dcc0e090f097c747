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
 * @file EmeErrorReporter.cpp
 * @brief Reports key-system errors to the embedding player
 */

#include "EmeErrorReporter.h"
#include "EmeLogManager.h"

void EmeErrorReporter::SetListener(EmeErrorListener listener)
{
	mListener = listener;
}

void EmeErrorReporter::Report(EmeKeySystemErrorKind kind, bool fatal)
{
	mReportCount++;
	if (fatal)
	{
		EMELOG_ERR("%s: %s (fatal)", EME_KEY_SYSTEM_ERROR_CATEGORY, GetErrorName(kind));
	}
	else
	{
		EMELOG_WARN("%s: %s (non-fatal)", EME_KEY_SYSTEM_ERROR_CATEGORY, GetErrorName(kind));
	}
	if (mListener)
	{
		mListener(EmeKeySystemError(kind, fatal));
	}
}

const char *EmeErrorReporter::GetErrorName(EmeKeySystemErrorKind kind)
{
	switch (kind)
	{
		case eEME_ERROR_NO_KEYS:
			return "keySystemNoKeys";
		case eEME_ERROR_NO_ACCESS:
			return "keySystemNoAccess";
		case eEME_ERROR_NO_SESSION:
			return "keySystemNoSession";
		case eEME_ERROR_NO_INIT_DATA:
			return "keySystemNoInitData";
		case eEME_ERROR_LICENSE_REQUEST_FAILED:
			return "keySystemLicenseRequestFailed";
		case eEME_ERROR_UNSUPPORTED_KEY_SYSTEM:
			return "keySystemUnsupported";
	}
	return "keySystemUnknownError";
}
