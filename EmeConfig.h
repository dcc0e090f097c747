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

/**
 * @file EmeConfig.h
 * @brief Configurations for the EME key-system controller
 */

#ifndef __EME_CONFIG_H__
#define __EME_CONFIG_H__

#include <map>
#include <string>
#include <cjson/cJSON.h>
#include "EmeDefine.h"
#include "EmeLogManager.h"

//////////////// Adding a new configuration /////////////
/// a) Identify the value type ( bool / int / string )
/// b) Add an enum value in EMEConfigSettingBool, EMEConfigSettingInt or EMEConfigSettingString,
///		just before the MaxValue entry
/// c) Add the config string and its enum value at the matching position of
///		mConfigLookupTableBool, mConfigLookupTableInt or mConfigLookupTableString
/// d) Use SetConfigValue / GetConfigValue with the enum
////////////////////////////////////////////////////////////

/**
 * @brief Boolean Config Settings
 */
typedef enum
{
	eEMEConfig_SslVerifyPeer,				/**< Verify license server certificate */
	eEMEConfig_CurlLicenseLogging,				/**< Log license request headers and curl verbose output */
	eEMEConfig_InfoLogging,					/**< Enable info logging */
	eEMEConfig_DebugLogging,				/**< Enable debug logging */
	eEMEConfig_TraceLogging,				/**< Enable trace logging */
	eEMEConfig_BoolMaxValue					/**< Max value of bool config always last element */
} EMEConfigSettingBool;
#define EMECONFIG_BOOL_COUNT (eEMEConfig_BoolMaxValue)

/**
 * @brief Integer Config Settings
 */
typedef enum
{
	eEMEConfig_DrmNetworkTimeout,				/**< License request timeout in sec */
	eEMEConfig_CurlConnectTimeout,				/**< Curl timeout for the connect phase in sec */
	eEMEConfig_IntMaxValue					/**< Max value of int config always last element */
} EMEConfigSettingInt;
#define EMECONFIG_INT_COUNT (eEMEConfig_IntMaxValue)

/**
 * @brief String Config Settings
 */
typedef enum
{
	eEMEConfig_KeySystem,					/**< Key system in use (com.widevine.alpha / com.microsoft.playready) */
	eEMEConfig_WVLicenseServerUrl,				/**< Widevine License server URL */
	eEMEConfig_PRLicenseServerUrl,				/**< PlayReady License server URL */
	eEMEConfig_AudioRobustness,				/**< Robustness level requested for audio capabilities */
	eEMEConfig_VideoRobustness,				/**< Robustness level requested for video capabilities */
	eEMEConfig_LicenseProxy,				/**< License Proxy */
	eEMEConfig_UserAgent,					/**< Curl user-agent string */
	eEMEConfig_LogLevel,					/**< Overrides info/debug/trace */
	eEMEConfig_StringMaxValue				/**< Max value for string config always last element */
} EMEConfigSettingString;
#define EMECONFIG_STRING_COUNT (eEMEConfig_StringMaxValue)

/**
 * @struct EmeOwnerLookupEntry
 * @brief Config ownership enum string mapping table
 */
struct EmeOwnerLookupEntry
{
	const char* ownerName;
	ConfigPriority ownerValue;
};

/**
 * @struct ConfigValueBool
 * @brief Config Boolean data type
 */
typedef struct ConfigValueBool
{
	ConfigPriority owner;
	bool value;
	ConfigPriority lastowner;
	bool lastvalue;
	ConfigValueBool():owner(EME_DEFAULT_SETTING),value(false),lastowner(EME_DEFAULT_SETTING),lastvalue(false){}
} ConfigValueBool;

/**
 * @brief Config Int data type
 */
typedef struct ConfigValueInt
{
	ConfigPriority owner;
	int value;
	ConfigPriority lastowner;
	int lastvalue;
	ConfigValueInt():owner(EME_DEFAULT_SETTING),value(0),lastowner(EME_DEFAULT_SETTING),lastvalue(0){}
} ConfigValueInt;

/**
 * @brief Config String data type
 */
typedef struct ConfigValueString
{
	ConfigPriority owner;
	std::string value;
	ConfigPriority lastowner;
	std::string lastvalue;
	ConfigValueString():owner(EME_DEFAULT_SETTING),value(""),lastowner(EME_DEFAULT_SETTING),lastvalue(""){}
} ConfigValueString;

/**
 * @class EmeConfig
 * @brief Owner-prioritized store of key-system controller settings
 */
class EmeConfig
{
public:
	/**
	 * @fn EmeConfig
	 * @brief constructor, loads default values
	 */
	EmeConfig();

	~EmeConfig(){};

	/**
	 * @brief Copy constructor disabled
	 *
	 */
	EmeConfig(const EmeConfig&) = delete;

	/**
	 * @brief assignment operator disabled
	 *
	 */
	EmeConfig& operator=(const EmeConfig&) = delete;

	/**
	 * @fn Initialize
	 * @brief reset every setting to its default value and owner
	 */
	void Initialize();

	/**
	 * @fn ReadEmeCfgTxtFile
	 * @param[in] path - config file in key=value format
	 * @return true if the file was read
	 */
	bool ReadEmeCfgTxtFile(const std::string &path = EME_CFG_PATH);

	/**
	 * @fn ReadEmeCfgJsonFile
	 * @param[in] path - config file in json format
	 * @return true if the file was read
	 */
	bool ReadEmeCfgJsonFile(const std::string &path = EME_JSON_PATH);

	/**
	 * @fn ParseEmeCfgJsonString
	 * @brief parses configuration from a json document
	 * @param[in] cfg - json text
	 * @param[in] owner - Owner who is setting the value
	 * @return false if cfg is not valid json
	 */
	bool ParseEmeCfgJsonString(const std::string &cfg, ConfigPriority owner);

	/**
	 * @fn SetConfigValue
	 * @param[in] owner  - ownership of new set call
	 * @param[in] cfg	- Configuration enum to set
	 * @param[in] value   - value to set
	 */
	void SetConfigValue(ConfigPriority owner, EMEConfigSettingBool cfg , const bool &value);
	void SetConfigValue(ConfigPriority owner, EMEConfigSettingInt cfg , const int &value);
	void SetConfigValue(ConfigPriority owner, EMEConfigSettingString cfg , const std::string &value);

	/**
	 * @fn IsConfigSet
	 *
	 * @param[in] cfg - Configuration enum
	 * @return true / false
	 */
	bool IsConfigSet(EMEConfigSettingBool cfg) const;
	bool GetConfigValue( EMEConfigSettingBool cfg ) const;
	int GetConfigValue( EMEConfigSettingInt cfg ) const;
	std::string GetConfigValue( EMEConfigSettingString cfg ) const;

	ConfigPriority GetConfigOwner(EMEConfigSettingBool cfg) const;
	ConfigPriority GetConfigOwner(EMEConfigSettingInt cfg) const;
	ConfigPriority GetConfigOwner(EMEConfigSettingString cfg) const;

	/**
	 * @fn ProcessConfigJson
	 * @param[in] cfgdata - json format
	 * @param[in] owner   - Owner who is setting the value
	 */
	bool ProcessConfigJson(const cJSON *cfgdata, ConfigPriority owner );

	/**
	 * @fn ProcessConfigText
	 * @param[in] cfg - config text ( single key=value line )
	 * @param[in] owner   - Owner who is setting the value
	 */
	void ProcessConfigText(std::string &cfg, ConfigPriority owner );

	/**
	 * @fn RestoreConfiguration
	 * @param[in] owner - Owner value for reverting
	 * @return None
	 */
	void RestoreConfiguration(ConfigPriority owner);

	/**
	 * @fn ConfigureLogSettings
	 * @brief apply info/debug/trace/logLevel settings to EmeLogManager
	 */
	void ConfigureLogSettings();

	/**
	 * @fn ShowConfiguration
	 * @param[in] owner - list settings held by this owner, EME_MAX_SETTING for all
	 */
	void ShowConfiguration(ConfigPriority owner);

	const char * GetConfigName(EMEConfigSettingBool cfg ) const;
	const char * GetConfigName(EMEConfigSettingInt cfg ) const;
	const char * GetConfigName(EMEConfigSettingString cfg ) const;

private:
	ConfigValueBool configValueBool[EMECONFIG_BOOL_COUNT];
	ConfigValueInt configValueInt[EMECONFIG_INT_COUNT];
	ConfigValueString configValueString[EMECONFIG_STRING_COUNT];
};

#endif /* __EME_CONFIG_H__ */
