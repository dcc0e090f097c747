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

#include <map>
#include <memory>
#include <vector>

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "EmeWidevineHelper.h"
#include "EmeDefine.h"
#include "EmeTestUtils.h"

using namespace testing;

class EmeWidevineHelperTests : public Test
{
protected:
	std::shared_ptr<EmeKeySystemHelper> mHelper;

	void SetUp() override
	{
		mHelper = EmeKeySystemHelperEngine::getInstance().createHelper(WIDEVINE_KEY_SYSTEM_STRING);
		ASSERT_TRUE(mHelper != nullptr);
	}

	void TearDown() override
	{
		mHelper = nullptr;
	}
};

TEST_F(EmeWidevineHelperTests, Identifiers)
{
	EXPECT_EQ(mHelper->ocdmSystemId(), WIDEVINE_KEY_SYSTEM_STRING);
	EXPECT_EQ(mHelper->drmIdentifier(), WIDEVINE_DRM_IDENTIFIER);
	EXPECT_EQ(mHelper->friendlyName(), "Widevine");
}

TEST_F(EmeWidevineHelperTests, EngineLookup)
{
	EmeKeySystemHelperEngine &engine = EmeKeySystemHelperEngine::getInstance();

	EXPECT_TRUE(engine.isKeySystemSupported("widevine"));
	EXPECT_TRUE(engine.isKeySystemSupported("Widevine"));
	EXPECT_FALSE(engine.isKeySystemSupported("org.w3.clearkey"));
	EXPECT_TRUE(engine.createHelperForDrmIdentifier(WIDEVINE_DRM_IDENTIFIER) != nullptr);
	EXPECT_TRUE(engine.createHelper("org.w3.clearkey") == nullptr);

	std::vector<std::string> systemIds;
	engine.getSystemIds(systemIds);
	EXPECT_THAT(systemIds, Contains(WIDEVINE_SYSTEM_ID));
}

TEST_F(EmeWidevineHelperTests, ParsePsshKeyIds)
{
	//Arrange: pssh with two key ids
	std::vector<uint8_t> kid1(16, 0x11);
	std::vector<uint8_t> kid2(16, 0x22);
	std::vector<uint8_t> pssh = BuildWidevinePssh({kid1, kid2});
	EmeWidevineHelper helper;

	//Act
	bool parsed = helper.parsePssh(pssh.data(), (uint32_t)pssh.size());

	//Assert: both key ids are extracted in order
	ASSERT_TRUE(parsed);
	std::map<int, std::vector<uint8_t>> keyIds;
	helper.getKeys(keyIds);
	ASSERT_EQ(keyIds.size(), 2);
	EXPECT_EQ(keyIds[0], kid1);
	EXPECT_EQ(keyIds[1], kid2);
}

TEST_F(EmeWidevineHelperTests, ParsePsshRejectsForeignBox)
{
	std::vector<uint8_t> pssh = BuildWidevinePssh({std::vector<uint8_t>(16, 0x11)});
	pssh[12] ^= 0xff; // corrupt the system id
	EmeWidevineHelper helper;

	EXPECT_FALSE(helper.parsePssh(pssh.data(), (uint32_t)pssh.size()));
	EXPECT_FALSE(helper.parsePssh(pssh.data(), 16));
}

TEST_F(EmeWidevineHelperTests, CreateInitDataPassesPsshThrough)
{
	std::vector<uint8_t> pssh = BuildWidevinePssh({std::vector<uint8_t>(16, 0x33)});
	std::vector<uint8_t> initData;

	EXPECT_TRUE(mHelper->createInitData(pssh, initData));
	EXPECT_EQ(initData, pssh);

	// payloads without key ids are still handed to the CDM
	std::vector<uint8_t> opaque = {0x01, 0x02, 0x03};
	EXPECT_TRUE(mHelper->createInitData(opaque, initData));
	EXPECT_EQ(initData, opaque);

	EXPECT_FALSE(mHelper->createInitData(std::vector<uint8_t>(), initData));
}

TEST_F(EmeWidevineHelperTests, LicenseRequestIsRawMessage)
{
	std::vector<uint8_t> keyMessage = {0x08, 0x04, 0x12, 0x00, 0xff};
	EmeLicenseRequest request;

	mHelper->generateLicenseRequest(keyMessage, request);

	EXPECT_EQ(request.method, EmeLicenseRequest::POST);
	EXPECT_EQ(request.payload, std::string(keyMessage.begin(), keyMessage.end()));
	EXPECT_TRUE(request.headers.empty());
}
