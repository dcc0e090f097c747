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

#include <memory>
#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "EmeKeySystemNegotiator.h"
#include "EmeDefine.h"
#include "MockEmeCdm.h"
#include "EmeTestUtils.h"

using namespace testing;

class KeySystemNegotiatorTests : public Test
{
protected:
	std::shared_ptr<EmeScheduler> mScheduler;
	EmeControllerState mState;
	EmeErrorReporter mReporter;
	std::vector<EmeKeySystemError> mErrors;
	std::shared_ptr<StrictMock<MockEmeCdmAccessProvider>> mProvider;
	std::shared_ptr<StrictMock<MockEmeKeySystemAccess>> mAccess;
	std::shared_ptr<NiceMock<MockEmeCdmInstance>> mCdm;
	std::shared_ptr<NiceMock<MockEmeKeySession>> mSession;
	std::unique_ptr<EmeKeySessionManager> mManager;
	std::unique_ptr<EmeKeySystemNegotiator> mNegotiator;
	EmeDrmSystemOptions mOptions;
	std::vector<std::string> mAudio = {"mp4a.40.2", "ec-3"};
	std::vector<std::string> mVideo = {"avc1.4d401f"};

	void SetUp() override
	{
		mScheduler = std::make_shared<EmeScheduler>();
		mScheduler->StartScheduler(0);
		mReporter.SetListener([this](const EmeKeySystemError &error) { mErrors.push_back(error); });
		mProvider = std::make_shared<StrictMock<MockEmeCdmAccessProvider>>();
		mAccess = std::make_shared<StrictMock<MockEmeKeySystemAccess>>();
		mCdm = std::make_shared<NiceMock<MockEmeCdmInstance>>();
		mSession = std::make_shared<NiceMock<MockEmeKeySession>>();
		ON_CALL(*mCdm, CreateSession()).WillByDefault(Return(mSession));
		mManager = std::unique_ptr<EmeKeySessionManager>(new EmeKeySessionManager(mState, mReporter, mScheduler));
		mNegotiator = std::unique_ptr<EmeKeySystemNegotiator>(new EmeKeySystemNegotiator(mProvider, *mManager, mReporter, mScheduler));
		mOptions.audioRobustness = "SW_SECURE_CRYPTO";
		mOptions.videoRobustness = "HW_SECURE_ALL";
	}

	void TearDown() override
	{
		mScheduler->StopScheduler();
		mNegotiator = nullptr;
		mManager = nullptr;
	}
};

TEST_F(KeySystemNegotiatorTests, ConfigurationFromCodecs)
{
	//Act
	std::vector<EmeMediaKeySystemConfiguration> configs =
		EmeKeySystemNegotiator::BuildMediaKeySystemConfigurations(mAudio, mVideo, mOptions);

	//Assert: exactly one configuration, one capability per codec
	ASSERT_EQ(configs.size(), 1);
	ASSERT_EQ(configs[0].audioCapabilities.size(), 2);
	ASSERT_EQ(configs[0].videoCapabilities.size(), 1);
	EXPECT_EQ(configs[0].audioCapabilities[0].contentType, "audio/mp4; codecs=\"mp4a.40.2\"");
	EXPECT_EQ(configs[0].audioCapabilities[1].contentType, "audio/mp4; codecs=\"ec-3\"");
	EXPECT_EQ(configs[0].audioCapabilities[0].robustness, "SW_SECURE_CRYPTO");
	EXPECT_EQ(configs[0].videoCapabilities[0].contentType, "video/mp4; codecs=\"avc1.4d401f\"");
	EXPECT_EQ(configs[0].videoCapabilities[0].robustness, "HW_SECURE_ALL");
}

TEST_F(KeySystemNegotiatorTests, ConfigurationWithoutCodecs)
{
	std::vector<EmeMediaKeySystemConfiguration> configs =
		EmeKeySystemNegotiator::BuildMediaKeySystemConfigurations(std::vector<std::string>(), std::vector<std::string>(), mOptions);

	ASSERT_EQ(configs.size(), 1);
	EXPECT_TRUE(configs[0].audioCapabilities.empty());
	EXPECT_TRUE(configs[0].videoCapabilities.empty());
}

TEST_F(KeySystemNegotiatorTests, UnsupportedKeySystem)
{
	//Act: the provider must not be called
	bool requested = mNegotiator->RequestAccess("org.w3.clearkey", mAudio, mVideo, mOptions);

	//Assert: reported synchronously
	EXPECT_FALSE(requested);
	ASSERT_EQ(mErrors.size(), 1);
	EXPECT_EQ(mErrors[0].kind, eEME_ERROR_UNSUPPORTED_KEY_SYSTEM);
	EXPECT_TRUE(mErrors[0].fatal);
	EXPECT_FALSE(mNegotiator->IsAccessRequested());
}

TEST_F(KeySystemNegotiatorTests, MissingAccessProvider)
{
	//Arrange: negotiator built without a provider
	EmeKeySystemNegotiator negotiator(nullptr, *mManager, mReporter, mScheduler);

	//Act
	bool requested = negotiator.RequestAccess(WIDEVINE_KEY_SYSTEM_STRING, mAudio, mVideo, mOptions);

	//Assert: refused without reporting an unsupported key-system
	EXPECT_FALSE(requested);
	EXPECT_TRUE(mErrors.empty());
	EXPECT_FALSE(negotiator.IsAccessRequested());
}

TEST_F(KeySystemNegotiatorTests, AccessGrantedCreatesSessionItem)
{
	//Arrange
	std::vector<EmeMediaKeySystemConfiguration> configs;
	EXPECT_CALL(*mProvider, RequestAccess(WIDEVINE_KEY_SYSTEM_STRING, _, _, _))
		.WillOnce(DoAll(SaveArg<1>(&configs), InvokeArgument<2>(mAccess)));
	EXPECT_CALL(*mAccess, CreateCdmInstance(_, _)).WillOnce(InvokeArgument<0>(mCdm));

	//Act: friendly name resolves to the key-system string
	EXPECT_TRUE(mNegotiator->RequestAccess("widevine", mAudio, mVideo, mOptions));
	FlushScheduler(*mScheduler);

	//Assert
	ASSERT_EQ(configs.size(), 1);
	EXPECT_EQ(configs[0].audioCapabilities.size(), 2);
	EXPECT_EQ(mNegotiator->GetAccessState(), eACCESS_SETTLED);
	EXPECT_EQ(mNegotiator->GetCdmInstance(), mCdm);
	ASSERT_EQ(mManager->GetItemCount(), 1);
	EmeSessionItemPtr item = mManager->GetActiveItem();
	EXPECT_EQ(item->keySystem, WIDEVINE_KEY_SYSTEM_STRING);
	EXPECT_EQ(item->access, mAccess);
	EXPECT_EQ(item->session, mSession);
	EXPECT_TRUE(mState.haveKeySession);
	EXPECT_TRUE(mErrors.empty());
}

TEST_F(KeySystemNegotiatorTests, CdmCreatedOnce)
{
	//Arrange: two grants
	EXPECT_CALL(*mProvider, RequestAccess(_, _, _, _)).Times(2).WillRepeatedly(InvokeArgument<2>(mAccess));
	EXPECT_CALL(*mAccess, CreateCdmInstance(_, _)).Times(1).WillOnce(InvokeArgument<0>(mCdm));

	//Act
	mNegotiator->RequestAccess(WIDEVINE_KEY_SYSTEM_STRING, mAudio, mVideo, mOptions);
	FlushScheduler(*mScheduler);
	mNegotiator->RequestAccess(WIDEVINE_KEY_SYSTEM_STRING, mAudio, mVideo, mOptions);
	FlushScheduler(*mScheduler);

	//Assert: second item shares the CDM instance
	ASSERT_EQ(mManager->GetItemCount(), 2);
	EXPECT_EQ(mManager->GetItem(0)->cdmInstance, mManager->GetItem(1)->cdmInstance);
	EXPECT_EQ(mManager->GetActiveItem()->id, 1);
}

TEST_F(KeySystemNegotiatorTests, AccessRejectedIsLoggedOnly)
{
	EXPECT_CALL(*mProvider, RequestAccess(_, _, _, _)).WillOnce(InvokeArgument<3>(std::string("NotSupportedError")));

	EXPECT_TRUE(mNegotiator->RequestAccess(WIDEVINE_KEY_SYSTEM_STRING, mAudio, mVideo, mOptions));
	FlushScheduler(*mScheduler);

	EXPECT_EQ(mNegotiator->GetAccessState(), eACCESS_SETTLED);
	EXPECT_EQ(mManager->GetItemCount(), 0);
	EXPECT_TRUE(mErrors.empty());
}

TEST_F(KeySystemNegotiatorTests, CdmCreationFailure)
{
	EXPECT_CALL(*mProvider, RequestAccess(_, _, _, _)).WillOnce(InvokeArgument<2>(mAccess));
	EXPECT_CALL(*mAccess, CreateCdmInstance(_, _)).WillOnce(InvokeArgument<1>(std::string("out of resources")));

	mNegotiator->RequestAccess(WIDEVINE_KEY_SYSTEM_STRING, mAudio, mVideo, mOptions);
	FlushScheduler(*mScheduler);

	EXPECT_EQ(mNegotiator->GetAccessState(), eACCESS_SETTLED);
	EXPECT_TRUE(mNegotiator->GetCdmInstance() == nullptr);
	EXPECT_EQ(mManager->GetItemCount(), 0);
}

TEST_F(KeySystemNegotiatorTests, WhenAccessSettled)
{
	//Arrange: hold the grant until the test releases it
	EmeCdmAccessProvider::GrantedCallback grant;
	EXPECT_CALL(*mProvider, RequestAccess(_, _, _, _)).WillOnce(SaveArg<2>(&grant));
	EXPECT_CALL(*mAccess, CreateCdmInstance(_, _)).WillOnce(InvokeArgument<0>(mCdm));
	int runs = 0;

	//Act/Assert: never requested, task dropped
	EXPECT_FALSE(mNegotiator->WhenAccessSettled([&runs]() { runs++; }));

	mNegotiator->RequestAccess(WIDEVINE_KEY_SYSTEM_STRING, mAudio, mVideo, mOptions);
	EXPECT_TRUE(mNegotiator->WhenAccessSettled([&runs]() { runs++; }));
	FlushScheduler(*mScheduler);
	EXPECT_EQ(runs, 0);

	grant(mAccess);
	FlushScheduler(*mScheduler);
	EXPECT_EQ(runs, 1);

	// already settled, runs on the scheduler
	EXPECT_TRUE(mNegotiator->WhenAccessSettled([&runs]() { runs++; }));
	FlushScheduler(*mScheduler);
	EXPECT_EQ(runs, 2);
}

TEST_F(KeySystemNegotiatorTests, StaleGrantDoesNotSettle)
{
	//Arrange: two outstanding requests, answers held back
	std::vector<EmeCdmAccessProvider::GrantedCallback> grants;
	EXPECT_CALL(*mProvider, RequestAccess(_, _, _, _)).Times(2)
		.WillRepeatedly(Invoke([&grants](const std::string &, const std::vector<EmeMediaKeySystemConfiguration> &,
				EmeCdmAccessProvider::GrantedCallback onGranted, EmeCdmAccessProvider::FailureCallback)
		{
			grants.push_back(onGranted);
		}));
	EXPECT_CALL(*mAccess, CreateCdmInstance(_, _)).WillOnce(InvokeArgument<0>(mCdm));
	int runs = 0;

	mNegotiator->RequestAccess(WIDEVINE_KEY_SYSTEM_STRING, mAudio, mVideo, mOptions);
	mNegotiator->RequestAccess(WIDEVINE_KEY_SYSTEM_STRING, mAudio, mVideo, mOptions);
	mNegotiator->WhenAccessSettled([&runs]() { runs++; });
	ASSERT_EQ(grants.size(), 2);

	//Act: the older request answers first
	grants[0](mAccess);
	FlushScheduler(*mScheduler);

	//Assert: still waiting for the latest one
	EXPECT_EQ(runs, 0);
	EXPECT_TRUE(mNegotiator->IsAccessPending());

	grants[1](mAccess);
	FlushScheduler(*mScheduler);
	EXPECT_EQ(runs, 1);
	EXPECT_EQ(mManager->GetItemCount(), 2);
}
