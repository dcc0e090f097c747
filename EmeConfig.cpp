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
 * @file EmeConfig.cpp
 * @brief Configuration related Functionality for the key-system controller
 */
#include "EmeConfig.h"
#include "EmeUtils.h"
#include <assert.h>
#include <string.h>
#include <strings.h>
#include <ctype.h>
#include <stdlib.h>
#include <fstream>
#include <algorithm>

#define ERROR_TEXT_BAD_RANGE "Set failed. Input beyond the configured range"

typedef enum
{
	eCONFIG_RANGE_ANY,
	eCONFIG_RANGE_TIMEOUT, // 0..50
	eCONFIG_RANGE_MAX_VALUE,
} ConfigValidRange;
#define CONFIG_RANGE_ENUM_COUNT (eCONFIG_RANGE_MAX_VALUE)

/**
  * @brief lookup table for categories of valid ranges, used for value validation
 */
static const struct
{
	int minValue;
	int maxValue;
	ConfigValidRange type;
} mConfigValueValidRange[] =
{
	{ 0, INT_MAX, eCONFIG_RANGE_ANY },
	{ 0, 50, eCONFIG_RANGE_TIMEOUT },
};

/**
 * @brief Config Owners enum-string mapping table
 */
static const EmeOwnerLookupEntry mOwnerLookupTable[] =
{
	{"def",EME_DEFAULT_SETTING},
	{"oper",EME_OPERATOR_SETTING},
	{"app",EME_APPLICATION_SETTING},
	{"cfg",EME_DEV_CFG_SETTING},
	{"unknown",EME_MAX_SETTING}
};

struct ConfigLookupEntryInt
{
	int defaultValue;
	const char* cmdString;
	EMEConfigSettingInt configEnum;
	bool bConfigurableByOperator;
	ConfigValidRange validRange;
};

struct ConfigLookupEntryBool
{
	bool defaultValue;
	const char* cmdString;
	EMEConfigSettingBool configEnum;
	bool bConfigurableByOperator;
};

struct ConfigLookupEntryString
{
	const char *defaultValue;
	const char* cmdString;
	EMEConfigSettingString configEnum;
	bool bConfigurableByOperator;
};

/**
 * @brief Bool config lookup table, order matches EMEConfigSettingBool
 */
static const ConfigLookupEntryBool mConfigLookupTableBool[] =
{
	{true,"sslVerifyPeer",eEMEConfig_SslVerifyPeer,false},
	{false,"curlLicenseLogging",eEMEConfig_CurlLicenseLogging,true},
	{false,"info",eEMEConfig_InfoLogging,true},
	{false,"debug",eEMEConfig_DebugLogging,false},
	{false,"trace",eEMEConfig_TraceLogging,false},
};

/**
 * @brief Int config lookup table, order matches EMEConfigSettingInt
 */
static const ConfigLookupEntryInt mConfigLookupTableInt[] =
{
	{DEFAULT_DRM_NETWORK_TIMEOUT,"drmNetworkTimeout",eEMEConfig_DrmNetworkTimeout,true,eCONFIG_RANGE_TIMEOUT},
	{DEFAULT_CURL_CONNECT_TIMEOUT,"curlConnectTimeout",eEMEConfig_CurlConnectTimeout,true,eCONFIG_RANGE_TIMEOUT},
};

/**
 * @brief String config lookup table, order matches EMEConfigSettingString
 */
static const ConfigLookupEntryString mConfigLookupTableString[] =
{
	{"","drmSystem",eEMEConfig_KeySystem,false},
	{"","widevineLicenseUrl",eEMEConfig_WVLicenseServerUrl,false},
	{"","playreadyLicenseUrl",eEMEConfig_PRLicenseServerUrl,false},
	{"","audioRobustness",eEMEConfig_AudioRobustness,false},
	{"","videoRobustness",eEMEConfig_VideoRobustness,false},
	{"","licenseProxy",eEMEConfig_LicenseProxy,true},
	{"EmeKeySystem/" EME_VERSION,"userAgent",eEMEConfig_UserAgent,false},
	{"","logLevel",eEMEConfig_LogLevel,true},
};

class ConfigLookup
{
private:
	std::map<std::string, ConfigLookupEntryBool> lookupBool;
	std::map<std::string, ConfigLookupEntryInt> lookupInt;
	std::map<std::string, ConfigLookupEntryString> lookupString;

public:
	static bool ConfigStringValueToBool( const char *value_cstr )
	{
		bool rc = false;
		if( value_cstr )
		{
			if( isdigit((unsigned char)*value_cstr) )
			{
				int ival = atoi(value_cstr);
				if( ival == 1 )
				{
					rc = true;
				}
				else if( ival!=0 )
				{
					EMELOG_ERR( "unexpected input: %s", value_cstr );
				}
			}
			else if( strcasecmp(value_cstr,"true")==0 )
			{
				rc = true;
			}
			else if( strcasecmp(value_cstr,"false")!=0 )
			{
				EMELOG_ERR( "unexpected input: %s", value_cstr );
			}
		}
		return rc;
	}

	void Process( EmeConfig *emeConfig, ConfigPriority owner, const std::string &key, const std::string &value )
	{ // used while parsing text config
		const char *value_cstr = value.c_str();
		auto iter = lookupBool.find(key);
		if( iter != lookupBool.end())
		{
			auto cfg = iter->second;
			EMELOG_MIL("Parsed value for dev cfg property %s - %s", key.c_str(), value_cstr );
			if( value.empty() )
			{ // bare key toggles the flag
				bool currentValue = emeConfig->GetConfigValue(cfg.configEnum);
				emeConfig->SetConfigValue( owner, cfg.configEnum, !currentValue );
			}
			else
			{
				emeConfig->SetConfigValue( owner, cfg.configEnum, ConfigStringValueToBool(value_cstr) );
			}
			return;
		}
		auto iterInt = lookupInt.find(key);
		if( iterInt != lookupInt.end() )
		{
			int conv = atoi( value_cstr );
			emeConfig->SetConfigValue(owner,iterInt->second.configEnum,conv);
			return;
		}
		auto iterString = lookupString.find(key);
		if( iterString != lookupString.end() )
		{
			if(value.size())
			{
				emeConfig->SetConfigValue(owner,iterString->second.configEnum,value);
			}
			return;
		}
		EMELOG_WARN("Unknown config key: %s", key.c_str());
	}

	static bool IsOwnerAllowed( ConfigPriority owner, bool bConfigurableByOperator, const std::string &name )
	{
		if( owner == EME_OPERATOR_SETTING && !bConfigurableByOperator )
		{
			EMELOG_WARN("%s is not configurable by operator", name.c_str());
			return false;
		}
		return true;
	}

	void Process( EmeConfig *emeConfig, ConfigPriority owner, cJSON *searchObj )
	{ // called from EmeConfig::ProcessConfigJson
		auto it = lookupBool.find(searchObj->string);
		if( it != lookupBool.end() )
		{
			if( !IsOwnerAllowed(owner, it->second.bConfigurableByOperator, it->first) ) return;
			bool conv = cJSON_IsTrue(searchObj);
			emeConfig->SetConfigValue(owner,it->second.configEnum,conv);
			EMELOG_MIL("Parsed value for property %s - %s",it->first.c_str(),conv?"true":"false");
			return;
		}
		auto itInt = lookupInt.find(searchObj->string);
		if( itInt != lookupInt.end() )
		{
			if( !IsOwnerAllowed(owner, itInt->second.bConfigurableByOperator, itInt->first) ) return;
			if( cJSON_IsNumber(searchObj) )
			{
				auto conv = (int)searchObj->valueint;
				emeConfig->SetConfigValue(owner,itInt->second.configEnum,conv);
				EMELOG_MIL("Parsed value for property %s - %d",itInt->first.c_str(),conv);
			}
			else
			{
				EMELOG_ERR("Invalid format for %s ",itInt->first.c_str());
			}
			return;
		}
		auto itString = lookupString.find(searchObj->string);
		if( itString != lookupString.end() )
		{
			if( !IsOwnerAllowed(owner, itString->second.bConfigurableByOperator, itString->first) ) return;
			if( cJSON_IsString(searchObj) && searchObj->valuestring != NULL )
			{
				auto conv = std::string(searchObj->valuestring);
				emeConfig->SetConfigValue(owner,itString->second.configEnum,conv);
				EMELOG_MIL("Parsed value for property %s - %s",itString->first.c_str(),conv.c_str() );
			}
			else
			{
				EMELOG_ERR("Invalid format for %s ",itString->first.c_str());
			}
		}
	}

	ConfigLookup(): lookupBool(), lookupInt(), lookupString()
	{ // populate collection of std::map for lookup by config name
		assert( ARRAY_SIZE(mConfigValueValidRange) == CONFIG_RANGE_ENUM_COUNT );
		for( int i=0; i<CONFIG_RANGE_ENUM_COUNT; i++ )
		{
			assert( mConfigValueValidRange[i].type == i );
		}

		assert( ARRAY_SIZE(mConfigLookupTableInt) == EMECONFIG_INT_COUNT );
		for( int i=0; i<EMECONFIG_INT_COUNT; i++ )
		{
			assert( mConfigLookupTableInt[i].configEnum == i );
			lookupInt[mConfigLookupTableInt[i].cmdString] = mConfigLookupTableInt[i];
		}

		assert( ARRAY_SIZE(mConfigLookupTableBool) == EMECONFIG_BOOL_COUNT );
		for( int i=0; i<EMECONFIG_BOOL_COUNT; ++i )
		{
			assert( mConfigLookupTableBool[i].configEnum == i );
			lookupBool[mConfigLookupTableBool[i].cmdString] = mConfigLookupTableBool[i];
		}

		assert( ARRAY_SIZE(mConfigLookupTableString) == EMECONFIG_STRING_COUNT );
		for( int i=0; i<EMECONFIG_STRING_COUNT; ++i )
		{
			assert( mConfigLookupTableString[i].configEnum == i );
			lookupString[mConfigLookupTableString[i].cmdString] = mConfigLookupTableString[i];
		}
	}
};

static ConfigLookup mConfigLookup;

/////////////////// Public Functions /////////////////////////////////////

EmeConfig::EmeConfig()
{
	Initialize();
}

void EmeConfig::Initialize()
{
	for( int i=0; i<EMECONFIG_BOOL_COUNT; i++ )
	{
		configValueBool[i] = ConfigValueBool();
		configValueBool[i].value = mConfigLookupTableBool[i].defaultValue;
	}
	for( int i=0; i<EMECONFIG_INT_COUNT; i++ )
	{
		configValueInt[i] = ConfigValueInt();
		configValueInt[i].value = mConfigLookupTableInt[i].defaultValue;
	}
	for( int i=0; i<EMECONFIG_STRING_COUNT; i++ )
	{
		configValueString[i] = ConfigValueString();
		configValueString[i].value = mConfigLookupTableString[i].defaultValue;
	}
}

/**
 * @brief Gets the boolean configuration value
 */
bool EmeConfig::IsConfigSet(EMEConfigSettingBool cfg) const
{
	if (cfg < EMECONFIG_BOOL_COUNT)
	{
		return configValueBool[cfg].value;
	}
	return false;
}

bool EmeConfig::GetConfigValue( EMEConfigSettingBool cfg ) const
{
	if(cfg < EMECONFIG_BOOL_COUNT)
	{
		return configValueBool[cfg].value;
	}
	return false;
}

/**
 * @brief GetConfigValue - Gets configuration for integer data type
 */
int EmeConfig::GetConfigValue(EMEConfigSettingInt cfg) const
{
	if(cfg < EMECONFIG_INT_COUNT)
	{
		return configValueInt[cfg].value;
	}
	return 0;
}

/**
 * @brief GetConfigValue - Gets configuration for string data type
 */
std::string EmeConfig::GetConfigValue(EMEConfigSettingString cfg) const
{
	if(cfg < EMECONFIG_STRING_COUNT)
	{
		return configValueString[cfg].value;
	}
	return "";
}

ConfigPriority EmeConfig::GetConfigOwner(EMEConfigSettingBool cfg) const
{
	return configValueBool[cfg].owner;
}
ConfigPriority EmeConfig::GetConfigOwner(EMEConfigSettingInt cfg) const
{
	return configValueInt[cfg].owner;
}
ConfigPriority EmeConfig::GetConfigOwner(EMEConfigSettingString cfg) const
{
	return configValueString[cfg].owner;
}

void EmeConfig::SetConfigValue(ConfigPriority newowner, EMEConfigSettingBool cfg ,const bool &value)
{
	const char * cfgName = GetConfigName(cfg);
	ConfigValueBool &setting = configValueBool[cfg];
	if(setting.owner <= newowner )
	{
		if(setting.owner != newowner)
		{
			setting.lastvalue = setting.value;
			setting.lastowner = setting.owner;
		}
		setting.value = value;
		setting.owner = newowner;
		EMELOG_MIL("%s New Owner[%d]",cfgName,newowner);
	}
	else
	{
		EMELOG_WARN("%s Owner[%d] not allowed to Set ,current Owner[%d]",cfgName,newowner,setting.owner);
	}
}

void EmeConfig::SetConfigValue(ConfigPriority newowner, EMEConfigSettingInt cfg ,const int &value)
{
	auto cfgInfo = mConfigLookupTableInt[cfg];
	ConfigValueInt &setting = configValueInt[cfg];
	auto range = mConfigValueValidRange[cfgInfo.validRange];
	if( value<range.minValue || value>range.maxValue )
	{
		EMELOG_ERR("%s %s [%d]", cfgInfo.cmdString, ERROR_TEXT_BAD_RANGE, value);
	}
	else if(setting.owner <= newowner )
	{
		if(setting.owner != newowner)
		{
			setting.lastvalue = setting.value;
			setting.lastowner = setting.owner;
		}
		setting.value = value;
		setting.owner = newowner;
		EMELOG_MIL("%s New Owner[%d]", cfgInfo.cmdString, newowner);
	}
	else
	{
		EMELOG_WARN("%s Owner[%d] not allowed to Set ,current Owner[%d]", cfgInfo.cmdString, newowner, setting.owner);
	}
}

void EmeConfig::SetConfigValue(ConfigPriority newowner, EMEConfigSettingString cfg ,const std::string &value)
{
	const char * cfgName = GetConfigName(cfg);
	ConfigValueString &setting = configValueString[cfg];
	if(setting.owner <= newowner )
	{
		if(setting.owner != newowner)
		{
			setting.lastvalue = setting.value;
			setting.lastowner = setting.owner;
		}
		setting.value = value;
		setting.owner = newowner;
		EMELOG_MIL("%s New Owner[%d]",cfgName,newowner);
	}
	else
	{
		EMELOG_WARN("%s Owner[%d] not allowed to Set ,current Owner[%d]", cfgName, newowner, setting.owner);
	}
}

/**
 * @brief ProcessConfigJson - Function to parse and process json configuration
 *
 * @return bool - true on success
 */
bool EmeConfig::ProcessConfigJson(const cJSON *cfgdata, ConfigPriority owner )
{
	bool retval = false;

	if(cfgdata != NULL)
	{
		for(cJSON *searchObj = cfgdata->child; NULL != searchObj; searchObj=searchObj->next)
		{
			if( searchObj->string )
			{
				mConfigLookup.Process( this, owner, searchObj );
			}
		}

		cJSON *drmConfig = cJSON_GetObjectItem(cfgdata,"drmConfig");
		if(drmConfig)
		{
			EMELOG_MIL("Parsed value for property DrmConfig");
			for( cJSON *subitem = drmConfig->child; subitem; subitem = subitem->next )
			{
				if( !cJSON_IsString(subitem) || subitem->string == NULL )
				{
					continue;
				}
				std::string conv = std::string(subitem->valuestring);
				if(strcasecmp(PLAYREADY_KEY_SYSTEM_STRING,subitem->string)==0)
				{
					EMELOG_MIL("Playready License Server URL config param received - %s", conv.c_str());
					SetConfigValue(owner,eEMEConfig_PRLicenseServerUrl,conv);
				}
				else if(strcasecmp(WIDEVINE_KEY_SYSTEM_STRING,subitem->string)==0)
				{
					EMELOG_MIL("Widevine License Server URL config param received - %s", conv.c_str());
					SetConfigValue(owner,eEMEConfig_WVLicenseServerUrl,conv);
				}
			}

			cJSON *preferredKeySystemItem = cJSON_GetObjectItem(drmConfig, "preferredKeysystem");
			if (preferredKeySystemItem && cJSON_IsString(preferredKeySystemItem))
			{
				const char * preferredKeySystem = preferredKeySystemItem->valuestring;
				EMELOG_MIL("preferredKeySystem received - %s", preferredKeySystem );
				SetConfigValue(owner, eEMEConfig_KeySystem, std::string(preferredKeySystem));
			}
		}

		cJSON *drmSystemOptions = cJSON_GetObjectItem(cfgdata,"drmSystemOptions");
		if(drmSystemOptions)
		{
			cJSON *audio = cJSON_GetObjectItem(drmSystemOptions, "audioRobustness");
			if( audio && cJSON_IsString(audio) )
			{
				SetConfigValue(owner, eEMEConfig_AudioRobustness, std::string(audio->valuestring));
			}
			cJSON *video = cJSON_GetObjectItem(drmSystemOptions, "videoRobustness");
			if( video && cJSON_IsString(video) )
			{
				SetConfigValue(owner, eEMEConfig_VideoRobustness, std::string(video->valuestring));
			}
		}
		retval = true;
	}

	return retval;
}

/**
 * @brief ProcessConfigText - Function to parse and process configuration text
 */
void EmeConfig::ProcessConfigText(std::string &cfg, ConfigPriority owner )
{
	if( !cfg.empty() )
	{
		char c = cfg[0];
		if( (unsigned char)c < ' ' )
		{ // ignore newline
		}
		else if( c == '#')
		{ // ignore comments
		}
		else
		{
			//trim whitespace from the end of the string
			cfg.erase(std::find_if(cfg.rbegin(), cfg.rend(), [](unsigned char ch) {return !std::isspace(ch);}).base(), cfg.end());
			size_t position = 0;
			std::string key,value;
			std::size_t delimiterPos = cfg.find("=");
			if(delimiterPos != std::string::npos)
			{
				key = cfg.substr(0, delimiterPos);
				key.erase(std::remove_if(key.begin(), key.end(), [](unsigned char ch) {return std::isspace(ch);}), key.end());
				value = cfg.substr(delimiterPos + 1);
				position = value.find_first_not_of(' ');
				if( position == std::string::npos )
				{
					EMELOG_WARN( "unexpected cfg: '%s'", cfg.c_str() );
					value.clear();
				}
				else
				{
					value = value.substr(position);
				}
			}
			else
			{
				key = cfg;
			}

			mConfigLookup.Process( this, owner, key, value );
		}
	}
}

bool EmeConfig::ParseEmeCfgJsonString(const std::string &cfg, ConfigPriority owner)
{
	bool retVal = false;
	cJSON *cfgdata = cJSON_Parse(cfg.c_str());
	if( cfgdata )
	{
		retVal = ProcessConfigJson(cfgdata, owner);
		cJSON_Delete(cfgdata);
		ConfigureLogSettings();
	}
	else
	{
		EMELOG_ERR("Invalid json config");
	}
	return retVal;
}

/**
 * @brief ReadEmeCfgJsonFile - Function to parse and process configuration file in json format
 *
 * @return true if read successfully
 */
bool EmeConfig::ReadEmeCfgJsonFile(const std::string &path)
{
	bool retVal=false;
	std::string cfgPath = eme_GetConfigPath(path);

	if (!cfgPath.empty())
	{
		std::ifstream f(cfgPath, std::ifstream::in | std::ifstream::binary);
		if (f.good())
		{
			EMELOG_MIL("opened %s", cfgPath.c_str());
			std::filebuf* pbuf = f.rdbuf();
			std::size_t size = pbuf->pubseekoff (0,f.end,f.in);
			pbuf->pubseekpos (0,f.in);
			std::string jsonbuffer(size, '\0');
			pbuf->sgetn (&jsonbuffer[0],size);
			f.close();

			retVal = ParseEmeCfgJsonString(jsonbuffer, EME_DEV_CFG_SETTING);
			if (retVal)
			{
				ShowConfiguration(EME_DEV_CFG_SETTING);
			}
		}
	}
	return retVal;
}

/**
 * @brief ReadEmeCfgTxtFile - Function to parse and process configuration file in text format
 *
 */
bool EmeConfig::ReadEmeCfgTxtFile(const std::string &path)
{
	bool retVal = false;
	std::string cfgPath = eme_GetConfigPath(path);

	if (!cfgPath.empty())
	{
		std::ifstream f(cfgPath, std::ifstream::in | std::ifstream::binary);
		if (f.good())
		{
			EMELOG_MIL("opened %s", cfgPath.c_str());
			std::string buf;
			while (std::getline(f, buf))
			{
				ProcessConfigText(buf, EME_DEV_CFG_SETTING);
			}
			f.close();
			ConfigureLogSettings();
			ShowConfiguration(EME_DEV_CFG_SETTING);
			retVal = true;
		}
	}
	return retVal;
}

/**
 * @brief ConfigureLogSettings - This function configures log settings for LogManager instance
 *
 */
void EmeConfig::ConfigureLogSettings()
{
	std::string logString = configValueString[eEMEConfig_LogLevel].value;

	if(configValueBool[eEMEConfig_TraceLogging].value || logString.compare("trace") == 0)
	{
		EmeLogManager::setLogLevel(eLOGLEVEL_TRACE);
		EmeLogManager::lockLogLevel(true);
	}
	else if(configValueBool[eEMEConfig_DebugLogging].value || logString.compare("debug") == 0)
	{
		EmeLogManager::setLogLevel(eLOGLEVEL_DEBUG);
		EmeLogManager::lockLogLevel(true);
	}
	else if((configValueBool[eEMEConfig_InfoLogging].value || logString.compare("info") == 0))
	{
		EmeLogManager::setLogLevel(eLOGLEVEL_INFO);
		EmeLogManager::lockLogLevel(true);
	}
}

const char * EmeConfig::GetConfigName(EMEConfigSettingBool cfg ) const
{
	return mConfigLookupTableBool[cfg].cmdString;
}
const char * EmeConfig::GetConfigName(EMEConfigSettingInt cfg ) const
{
	return mConfigLookupTableInt[cfg].cmdString;
}
const char *EmeConfig::GetConfigName(EMEConfigSettingString cfg ) const
{
	return mConfigLookupTableString[cfg].cmdString;
}

/**
 * @brief RestoreConfiguration - Function is restore last configuration value from current ownership
 */
void EmeConfig::RestoreConfiguration(ConfigPriority owner )
{
	for(int i=0;i<EMECONFIG_BOOL_COUNT;i++)
	{
		if(configValueBool[i].owner == owner && configValueBool[i].owner != configValueBool[i].lastowner)
		{
			EMELOG_MIL("Cfg [%-3d][%-20s][%-5s]->[%-5s][%s]->[%s]",i,GetConfigName((EMEConfigSettingBool)i), mOwnerLookupTable[configValueBool[i].owner].ownerName,
				mOwnerLookupTable[configValueBool[i].lastowner].ownerName,configValueBool[i].value?"true":"false",configValueBool[i].lastvalue?"true":"false");
			configValueBool[i].owner = configValueBool[i].lastowner;
			configValueBool[i].value = configValueBool[i].lastvalue;
		}
	}

	for(int i=0;i<EMECONFIG_INT_COUNT;i++)
	{
		if(configValueInt[i].owner == owner && configValueInt[i].owner != configValueInt[i].lastowner)
		{
			EMELOG_MIL("Cfg [%-3d][%-20s][%-5s]->[%-5s][%d]->[%d]",i,GetConfigName((EMEConfigSettingInt)i), mOwnerLookupTable[configValueInt[i].owner].ownerName,
				mOwnerLookupTable[configValueInt[i].lastowner].ownerName,configValueInt[i].value,configValueInt[i].lastvalue);
			configValueInt[i].owner = configValueInt[i].lastowner;
			configValueInt[i].value = configValueInt[i].lastvalue;
		}
	}

	for(int i=0;i<EMECONFIG_STRING_COUNT;i++)
	{
		if(configValueString[i].owner == owner && configValueString[i].owner != configValueString[i].lastowner)
		{
			EMELOG_MIL("Cfg [%-3d][%-20s][%-5s]->[%-5s][%s]->[%s]",i,GetConfigName((EMEConfigSettingString)i), mOwnerLookupTable[configValueString[i].owner].ownerName,
				mOwnerLookupTable[configValueString[i].lastowner].ownerName,configValueString[i].value.c_str(),configValueString[i].lastvalue.c_str());
			configValueString[i].owner = configValueString[i].lastowner;
			configValueString[i].value = configValueString[i].lastvalue;
		}
	}
}

/**
 * @brief ShowConfiguration - Function to list configuration values based on the owner
 */
void EmeConfig::ShowConfiguration(ConfigPriority owner)
{
	for( int i=0; i<EMECONFIG_BOOL_COUNT; i++ )
	{
		if(configValueBool[i].owner == owner || owner == EME_MAX_SETTING)
		{
			EMELOG_MIL("Cfg [%-34s][%-5s][%s]", GetConfigName((EMEConfigSettingBool)i), mOwnerLookupTable[configValueBool[i].owner].ownerName,configValueBool[i].value?"true":"false");
		}
	}

	for( int i=0; i<EMECONFIG_INT_COUNT; i++ )
	{
		if(configValueInt[i].owner == owner || owner == EME_MAX_SETTING)
		{
			EMELOG_MIL("Cfg [%-34s][%-5s][%d]", GetConfigName((EMEConfigSettingInt)i), mOwnerLookupTable[configValueInt[i].owner].ownerName,configValueInt[i].value);
		}
	}

	for(int i=0;i<EMECONFIG_STRING_COUNT;i++)
	{
		if(configValueString[i].owner == owner || owner == EME_MAX_SETTING)
		{
			EMELOG_MIL("Cfg [%-34s][%-5s][%s]", GetConfigName((EMEConfigSettingString)i), mOwnerLookupTable[configValueString[i].owner].ownerName,configValueString[i].value.c_str());
		}
	}
}
