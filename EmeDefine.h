/*
 * If not stated otherwise in this file or this component's license file the
 * following copyright and licenses apply:
 *
 * Copyright 2018 RDK Management
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

#ifndef __EME_DEFINE_H__
#define __EME_DEFINE_H__

/**
 * @file EmeDefine.h
 * @brief Macros for the EME key-system controller
 */

#include <limits.h>

#define EME_CFG_PATH "/opt/emekeysystem.cfg"
#define EME_JSON_PATH "/opt/emekeysystem.json"

#define EME_VERSION "1.02"

#define MAX_LICENSE_REQUEST_FAILURES 3				/**< Consecutive license request failures tolerated before the error is fatal */
#define DEFAULT_DRM_NETWORK_TIMEOUT 5				/**< default value for drmNetworkTimeout - 5 sec */
#define DEFAULT_CURL_CONNECT_TIMEOUT 3				/**< default connection timeout for license requests - 3 sec */

#define EME_TASK_ID_INVALID 0
#define EME_SCHEDULER_ID_DEFAULT 1				/**< First task id handed out by a scheduler */
#define EME_SCHEDULER_ID_MAX_VALUE INT_MAX			/**< Task ids wrap back to the default after this */

#define EME_INIT_DATA_TYPE_CENC "cenc"

#define WIDEVINE_KEY_SYSTEM_STRING "com.widevine.alpha"
#define PLAYREADY_KEY_SYSTEM_STRING "com.microsoft.playready"

#define WIDEVINE_DRM_IDENTIFIER "urn:uuid:edef8ba9-79d6-4ace-a3c8-27dcd51d21ed"
#define PLAYREADY_DRM_IDENTIFIER "com.microsoft.playready"

#define WIDEVINE_SYSTEM_ID "edef8ba9-79d6-4ace-a3c8-27dcd51d21ed"
#define PLAYREADY_SYSTEM_ID "9a04f079-9840-4286-ab92-e65be0885f95"

/**
 * @brief Config ownership values
 */
typedef enum
{
	EME_DEFAULT_SETTING            = 0,        /**< Lowest priority */
	EME_OPERATOR_SETTING           = 1,
	EME_APPLICATION_SETTING        = 2,
	EME_DEV_CFG_SETTING            = 3,        /**< Highest priority */
	EME_MAX_SETTING
}ConfigPriority;

#endif /* __EME_DEFINE_H__ */
