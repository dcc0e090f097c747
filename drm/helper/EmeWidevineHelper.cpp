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
 * @file EmeWidevineHelper.cpp
 * @brief Handles the Widevine key-system helper functions
 */

#include <string.h>
#include <strings.h>
#include <memory>

#include "EmeWidevineHelper.h"
#include "EmeDefine.h"
#include "EmeLogManager.h"

static EmeWidevineHelperFactory widevine_helper_factory;

const std::string EmeWidevineHelper::WIDEVINE_OCDM_ID = WIDEVINE_KEY_SYSTEM_STRING;
const std::string EmeWidevineHelper::WIDEVINE_DRM_ID = WIDEVINE_DRM_IDENTIFIER;

#define READ_U32(buf) \
	((uint32_t)buf[0] << 24) | ((uint32_t)buf[1] << 16) | ((uint32_t)buf[2] << 8) | buf[3]; buf+=4;

static long ParseMultiInt( const unsigned char **ppData, const unsigned char *fin )
{
	const unsigned char *psshData = *ppData;
	long iVal = 0;
	int shift = 0;
	while( psshData<fin )
	{
		int code = *psshData++;
		iVal |= (code&0x7f)<<shift;
		if( !(code&0x80) )
		{
			break;
		}
		shift += 7;
	}
	*ppData = psshData;
	return iVal;
}

/**
 https://www.w3.org/TR/2014/WD-encrypted-media-20140828/cenc-format.html
*/
bool EmeWidevineHelper::parsePssh( const uint8_t* psshData, uint32_t psshSize )
{
	bool rc = false;
	uint32_t kidCount = 0;
	mKeyIDs.clear();
	if( psshSize < 32 )
	{
		EMELOG_ERR( "pssh too short (%u bytes)", psshSize );
		return false;
	}
	const uint8_t *fin = &psshData[psshSize];
	uint32_t boxSize = READ_U32(psshData);
	if( boxSize != psshSize )
	{
		EMELOG_ERR( "unexpected boxSize %u expected %u", boxSize, psshSize );
	}
	else
	{
		uint32_t boxType = READ_U32(psshData);
		if( boxType != 0x70737368 ) // 'pssh'
		{
			EMELOG_ERR( "unexpected boxType %08x", boxType );
		}
		else
		{
			uint32_t versionAndFlags = READ_U32(psshData);
			static const uint8_t systemID_WideVine[16] =
			{
				0xed,0xef,0x8b,0xa9,0x79,0xd6,0x4a,0xce,0xa3,0xc8,0x27,0xdc,0xd5,0x1d,0x21,0xed
			};
			if( memcmp(psshData,systemID_WideVine,sizeof(systemID_WideVine))!=0 )
			{
				EMELOG_ERR( "unexpected systemID" );
			}
			else
			{
				psshData += sizeof(systemID_WideVine);
				uint8_t psshDataVer = versionAndFlags>>24;
				if( psshDataVer == 0 )
				{
					uint32_t sz = READ_U32(psshData);
					if( fin - psshData != sz )
					{
						EMELOG_ERR( "unexpected size %u expected %d", sz, (int)(fin-psshData) );
					}
					long iVal;
					while( psshData<fin )
					{
						uint8_t fieldType = *psshData++;
						switch( fieldType )
						{
							case 0x38: // Crypto Period Index (deprecated)
							case 0x50: // Crypto Period Duration (deprecated)
							case 0x08: // Algorithm (deprecated)
								iVal = ParseMultiInt( &psshData, fin );
								EMELOG_DEBUG( "%02x: %ld", fieldType, iVal );
								break;

							case 0x48: // protection scheme
								mProtectionScheme = (uint32_t)ParseMultiInt( &psshData, fin );
								EMELOG_INFO( "protection scheme %08x", mProtectionScheme );
								break;

							case 0x22: // Content ID, some streams carry a content id but no key id
							case 0x12: // Key ID
							{
								if( psshData>=fin )
								{
									break;
								}
								int fieldSize = *psshData++;
								if( fieldSize>0 && &psshData[fieldSize] <= fin )
								{
									std::vector<uint8_t> keyId;
									keyId.assign( psshData, &psshData[fieldSize] );
									mKeyIDs[kidCount++] = keyId;
									rc = true;
								}
								psshData += fieldSize;
							}
								break;

							case 0x32: // Policy (deprecated)
							case 0x2a: // Track Type (deprecated)
							case 0x1a: // Provider (deprecated)
							{
								if( psshData>=fin )
								{
									break;
								}
								int fieldSize = *psshData++;
								if( &psshData[fieldSize] > fin )
								{
									fieldSize = (int)(fin-psshData);
								}
								EMELOG_DEBUG( "0x%02x: '%.*s'", (int)fieldType, fieldSize, psshData );
								psshData += fieldSize;
							}
								break;

							default:
								// unknown
								break;
						}
					}
				}
				else if( psshDataVer == 1 )
				{
					kidCount = READ_U32(psshData);
					uint8_t fieldSize = 16;
					for( uint32_t i=0; i<kidCount && &psshData[fieldSize] <= fin; i++ )
					{
						std::vector<uint8_t> keyId;
						keyId.assign( psshData, &psshData[fieldSize] );
						mKeyIDs[i]=keyId;
						psshData += fieldSize;
						rc = true;
					}
				}
				else
				{
					EMELOG_ERR("unsupported PSSH version: %u", psshDataVer);
				}
			}
		}
	}
	return rc;
}

void EmeWidevineHelper::getKeys(std::map<int, std::vector<uint8_t>>& keyIDs) const
{
	keyIDs = this->mKeyIDs;
}

const std::string& EmeWidevineHelper::ocdmSystemId() const
{
	return WIDEVINE_OCDM_ID;
}

const std::string& EmeWidevineHelper::drmIdentifier() const
{
	return WIDEVINE_DRM_ID;
}

bool EmeWidevineHelper::createInitData(const std::vector<uint8_t>& payload, std::vector<uint8_t>& initData)
{
	if (payload.empty())
	{
		EMELOG_ERR("empty Widevine pssh");
		return false;
	}
	if (parsePssh(payload.data(), (uint32_t)payload.size()))
	{
		for (auto &keyId : mKeyIDs)
		{
			EMELOG_INFO("Widevine key id[%d] %s", keyId.first, EmeLogManager::getHexDebugStr(keyId.second).c_str());
		}
	}
	else
	{
		EMELOG_WARN("no key id found in Widevine pssh, passing it on unchanged");
	}
	initData = payload;
	return true;
}

void EmeWidevineHelper::generateLicenseRequest(const std::vector<uint8_t>& keyMessage, EmeLicenseRequest& licenseRequest) const
{
	licenseRequest.method = EmeLicenseRequest::POST;
	licenseRequest.payload.assign(keyMessage.begin(), keyMessage.end());
}

bool EmeWidevineHelperFactory::isKeySystem(const std::string& keySystem) const
{
	return (keySystem == WIDEVINE_KEY_SYSTEM_STRING) || (strcasecmp(keySystem.c_str(), "widevine") == 0);
}

bool EmeWidevineHelperFactory::isDrmIdentifier(const std::string& drmIdentifier) const
{
	return drmIdentifier == WIDEVINE_DRM_IDENTIFIER;
}

std::shared_ptr<EmeKeySystemHelper> EmeWidevineHelperFactory::createHelper() const
{
	return std::make_shared<EmeWidevineHelper>();
}

void EmeWidevineHelperFactory::appendSystemId(std::vector<std::string>& systemIds) const
{
	systemIds.push_back(WIDEVINE_SYSTEM_ID);
}
