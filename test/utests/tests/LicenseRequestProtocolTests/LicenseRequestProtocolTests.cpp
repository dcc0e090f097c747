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
#include <stdexcept>
#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "EmeLicenseRequestProtocol.h"
#include "EmeDefine.h"
#include "MockEmeCdm.h"
#include "EmeTestUtils.h"

using namespace testing;

#define TEST_WIDEVINE_URL "https://wv.example.com/license"
#define TEST_PLAYREADY_URL "https://pr.example.com/rightsmanager.asmx"

class LicenseRequestProtocolTests : public Test
{
protected:
	std::shared_ptr<EmeScheduler> mScheduler;
	EmeControllerState mState;
	EmeErrorReporter mReporter;
	std::vector<EmeKeySystemError> mErrors;
	std::shared_ptr<StrictMock<MockEmeLicenseTransport>> mTransport;
	std::unique_ptr<EmeKeySessionManager> mManager;
	std::unique_ptr<EmeLicenseRequestProtocol> mProtocol;
	std::vector<uint8_t> mKeyMessage = {0x08, 0x01, 0x12, 0x10};
	std::vector<std::vector<uint8_t>> mLicenses;
	EmeLicenseResponse mOkResponse;
	EmeLicenseResponse mFailedResponse;

	void SetUp() override
	{
		mScheduler = std::make_shared<EmeScheduler>();
		mScheduler->StartScheduler(0);
		mReporter.SetListener([this](const EmeKeySystemError &error) { mErrors.push_back(error); });
		mTransport = std::make_shared<StrictMock<MockEmeLicenseTransport>>();
		mManager = std::unique_ptr<EmeKeySessionManager>(new EmeKeySessionManager(mState, mReporter, mScheduler));
		mProtocol = std::unique_ptr<EmeLicenseRequestProtocol>(new EmeLicenseRequestProtocol(mState, *mManager, mReporter, mScheduler, mTransport));
		mProtocol->SetLicenseServerUrl(WIDEVINE_KEY_SYSTEM_STRING, TEST_WIDEVINE_URL);
		mProtocol->SetLicenseServerUrl(PLAYREADY_KEY_SYSTEM_STRING, TEST_PLAYREADY_URL);

		mOkResponse.httpStatus = 200;
		mOkResponse.data = {0xca, 0xfe};
		mFailedResponse.httpStatus = 500;
	}

	void TearDown() override
	{
		mScheduler->StopScheduler();
		mProtocol = nullptr;
		mManager = nullptr;
	}

	void RequestLicense(const std::vector<uint8_t> &keyMessage)
	{
		mProtocol->RequestLicense(keyMessage, [this](const std::vector<uint8_t> &license) { mLicenses.push_back(license); });
		FlushScheduler(*mScheduler);
	}
};

TEST_F(LicenseRequestProtocolTests, NoActiveItem)
{
	//Act
	RequestLicense(mKeyMessage);

	//Assert: nothing sent
	ASSERT_EQ(mErrors.size(), 1);
	EXPECT_EQ(mErrors[0].kind, eEME_ERROR_NO_ACCESS);
	EXPECT_TRUE(mErrors[0].fatal);
}

TEST_F(LicenseRequestProtocolTests, WidevineRequest)
{
	//Arrange
	mManager->AddSessionItem(nullptr, nullptr, WIDEVINE_KEY_SYSTEM_STRING);
	EmeLicenseRequest sent;
	EXPECT_CALL(*mTransport, Send(_, _)).WillOnce(DoAll(SaveArg<0>(&sent), InvokeArgument<1>(mOkResponse)));

	//Act
	RequestLicense(mKeyMessage);

	//Assert: raw message posted, license handed back
	EXPECT_EQ(sent.url, TEST_WIDEVINE_URL);
	EXPECT_EQ(sent.method, EmeLicenseRequest::POST);
	EXPECT_EQ(sent.payload, std::string(mKeyMessage.begin(), mKeyMessage.end()));
	EXPECT_TRUE(sent.headers.empty());
	ASSERT_EQ(mLicenses.size(), 1);
	EXPECT_EQ(mLicenses[0], mOkResponse.data);
	EXPECT_TRUE(mErrors.empty());
}

TEST_F(LicenseRequestProtocolTests, PlayReadyRequest)
{
	mManager->AddSessionItem(nullptr, nullptr, PLAYREADY_KEY_SYSTEM_STRING);
	EmeLicenseRequest sent;
	EXPECT_CALL(*mTransport, Send(_, _)).WillOnce(DoAll(SaveArg<0>(&sent), InvokeArgument<1>(mOkResponse)));

	RequestLicense(BuildPlayReadyKeyMessage("PENoYWxsZW5nZS8+", {{"Content-Type", "text/xml; charset=utf-8"}}));

	EXPECT_EQ(sent.url, TEST_PLAYREADY_URL);
	EXPECT_EQ(sent.payload, "<Challenge/>");
	EXPECT_EQ(sent.headers["Content-Type"], std::vector<std::string>{"text/xml; charset=utf-8"});
	EXPECT_EQ(mLicenses.size(), 1);
}

TEST_F(LicenseRequestProtocolTests, PlayReadyMissingChallenge)
{
	//Arrange: nothing may be sent
	mManager->AddSessionItem(nullptr, nullptr, PLAYREADY_KEY_SYSTEM_STRING);

	//Act
	RequestLicense(BuildPlayReadyKeyMessage("", {{"Content-Type", "text/xml"}}));

	//Assert
	ASSERT_EQ(mErrors.size(), 1);
	EXPECT_EQ(mErrors[0].kind, eEME_ERROR_LICENSE_REQUEST_FAILED);
	EXPECT_TRUE(mErrors[0].fatal);
	EXPECT_TRUE(mLicenses.empty());
}

TEST_F(LicenseRequestProtocolTests, MissingLicenseServerUrl)
{
	mProtocol->SetLicenseServerUrl(WIDEVINE_KEY_SYSTEM_STRING, "");
	mManager->AddSessionItem(nullptr, nullptr, WIDEVINE_KEY_SYSTEM_STRING);

	RequestLicense(mKeyMessage);

	ASSERT_EQ(mErrors.size(), 1);
	EXPECT_EQ(mErrors[0].kind, eEME_ERROR_LICENSE_REQUEST_FAILED);
	EXPECT_THROW(mProtocol->GetLicenseServerUrl(WIDEVINE_KEY_SYSTEM_STRING), EmeKeySystemException);
	EXPECT_THROW(mProtocol->GetLicenseServerUrl("org.w3.clearkey"), EmeKeySystemException);
	EXPECT_EQ(mProtocol->GetLicenseServerUrl(PLAYREADY_KEY_SYSTEM_STRING), TEST_PLAYREADY_URL);
}

TEST_F(LicenseRequestProtocolTests, RetryUntilSuccess)
{
	//Arrange: two failures, then success
	mManager->AddSessionItem(nullptr, nullptr, WIDEVINE_KEY_SYSTEM_STRING);
	EmeLicenseResponse transportFailure;
	transportFailure.transportError = 7;
	EXPECT_CALL(*mTransport, Send(_, _))
		.WillOnce(InvokeArgument<1>(mFailedResponse))
		.WillOnce(InvokeArgument<1>(transportFailure))
		.WillOnce(InvokeArgument<1>(mOkResponse));

	//Act
	RequestLicense(mKeyMessage);

	//Assert: counter reset on success
	EXPECT_EQ(mLicenses.size(), 1);
	EXPECT_EQ(mState.licenseRequestFailureCount, 0);
	EXPECT_TRUE(mErrors.empty());
}

TEST_F(LicenseRequestProtocolTests, FourthFailureIsFatal)
{
	//Arrange: server always fails
	mManager->AddSessionItem(nullptr, nullptr, WIDEVINE_KEY_SYSTEM_STRING);
	EXPECT_CALL(*mTransport, Send(_, _)).Times(MAX_LICENSE_REQUEST_FAILURES + 1)
		.WillRepeatedly(InvokeArgument<1>(mFailedResponse));

	//Act
	RequestLicense(mKeyMessage);

	//Assert: one fatal error, no fifth attempt
	ASSERT_EQ(mErrors.size(), 1);
	EXPECT_EQ(mErrors[0].kind, eEME_ERROR_LICENSE_REQUEST_FAILED);
	EXPECT_TRUE(mErrors[0].fatal);
	EXPECT_TRUE(mLicenses.empty());
	EXPECT_EQ(mState.licenseRequestFailureCount, MAX_LICENSE_REQUEST_FAILURES + 1);
}

TEST_F(LicenseRequestProtocolTests, TransportThrows)
{
	mManager->AddSessionItem(nullptr, nullptr, WIDEVINE_KEY_SYSTEM_STRING);
	EXPECT_CALL(*mTransport, Send(_, _)).WillOnce(Throw(EmeKeySystemException("worker stopped")));

	RequestLicense(mKeyMessage);

	ASSERT_EQ(mErrors.size(), 1);
	EXPECT_EQ(mErrors[0].kind, eEME_ERROR_LICENSE_REQUEST_FAILED);
	EXPECT_TRUE(mErrors[0].fatal);
}

TEST_F(LicenseRequestProtocolTests, RequestCustomizer)
{
	//Arrange: customizer rewrites the url and adds a header
	mManager->AddSessionItem(nullptr, nullptr, WIDEVINE_KEY_SYSTEM_STRING);
	mProtocol->SetRequestCustomizer([](EmeLicenseRequest &request)
	{
		request.url += "?token=abc";
		request.headers["X-Custom"].push_back("1");
	});
	EmeLicenseRequest sent;
	EXPECT_CALL(*mTransport, Send(_, _)).WillOnce(DoAll(SaveArg<0>(&sent), InvokeArgument<1>(mOkResponse)));

	//Act
	RequestLicense(mKeyMessage);

	//Assert
	EXPECT_EQ(sent.url, TEST_WIDEVINE_URL "?token=abc");
	EXPECT_EQ(sent.headers["X-Custom"], std::vector<std::string>{"1"});
}

TEST_F(LicenseRequestProtocolTests, FailingCustomizerIsIgnored)
{
	mManager->AddSessionItem(nullptr, nullptr, WIDEVINE_KEY_SYSTEM_STRING);
	mProtocol->SetRequestCustomizer([](EmeLicenseRequest &) { throw std::runtime_error("customizer bug"); });
	EXPECT_CALL(*mTransport, Send(_, _)).WillOnce(InvokeArgument<1>(mOkResponse));

	RequestLicense(mKeyMessage);

	EXPECT_EQ(mLicenses.size(), 1);
	EXPECT_TRUE(mErrors.empty());
}

TEST_F(LicenseRequestProtocolTests, ResponseTransform)
{
	mManager->AddSessionItem(nullptr, nullptr, WIDEVINE_KEY_SYSTEM_STRING);
	std::string transformUrl;
	mProtocol->SetResponseTransform([&transformUrl](const EmeLicenseResponse &response, const std::string &url)
	{
		transformUrl = url;
		std::vector<uint8_t> unwrapped(response.data.rbegin(), response.data.rend());
		return unwrapped;
	});
	EXPECT_CALL(*mTransport, Send(_, _)).WillOnce(InvokeArgument<1>(mOkResponse));

	RequestLicense(mKeyMessage);

	ASSERT_EQ(mLicenses.size(), 1);
	EXPECT_EQ(mLicenses[0], (std::vector<uint8_t>{0xfe, 0xca}));
	EXPECT_EQ(transformUrl, TEST_WIDEVINE_URL);
}

TEST_F(LicenseRequestProtocolTests, FailingTransformKeepsResponse)
{
	mManager->AddSessionItem(nullptr, nullptr, WIDEVINE_KEY_SYSTEM_STRING);
	mProtocol->SetResponseTransform([](const EmeLicenseResponse &, const std::string &) -> std::vector<uint8_t>
	{
		throw std::runtime_error("transform bug");
	});
	EXPECT_CALL(*mTransport, Send(_, _)).WillOnce(InvokeArgument<1>(mOkResponse));

	RequestLicense(mKeyMessage);

	ASSERT_EQ(mLicenses.size(), 1);
	EXPECT_EQ(mLicenses[0], mOkResponse.data);
}

TEST_F(LicenseRequestProtocolTests, FailedResponseAfterItemRemoved)
{
	//Arrange: response held by the transport
	mManager->AddSessionItem(nullptr, nullptr, WIDEVINE_KEY_SYSTEM_STRING);
	EmeLicenseResponseCallback onComplete;
	EXPECT_CALL(*mTransport, Send(_, _)).WillOnce(SaveArg<1>(&onComplete));
	RequestLicense(mKeyMessage);
	ASSERT_TRUE((bool)onComplete);

	//Act: items closed before the server answers
	mManager->TakeAllItems();
	onComplete(mFailedResponse);
	FlushScheduler(*mScheduler);

	//Assert: no retry and no error
	EXPECT_TRUE(mErrors.empty());
	EXPECT_EQ(mState.licenseRequestFailureCount, 0);
}

TEST_F(LicenseRequestProtocolTests, LicenseAfterItemRemovedNotDelivered)
{
	mManager->AddSessionItem(nullptr, nullptr, WIDEVINE_KEY_SYSTEM_STRING);
	EmeLicenseResponseCallback onComplete;
	EXPECT_CALL(*mTransport, Send(_, _)).WillOnce(SaveArg<1>(&onComplete));
	RequestLicense(mKeyMessage);
	ASSERT_TRUE((bool)onComplete);

	mManager->TakeAllItems();
	onComplete(mOkResponse);
	FlushScheduler(*mScheduler);

	EXPECT_TRUE(mLicenses.empty());
	EXPECT_TRUE(mErrors.empty());
}
