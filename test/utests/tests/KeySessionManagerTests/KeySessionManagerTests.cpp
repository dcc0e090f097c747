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
#include <vector>

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "EmeKeySessionManager.h"
#include "MockEmeCdm.h"
#include "EmeTestUtils.h"

using namespace testing;

class KeySessionManagerTests : public Test
{
protected:
	std::shared_ptr<EmeScheduler> mScheduler;
	EmeControllerState mState;
	EmeErrorReporter mReporter;
	std::vector<EmeKeySystemError> mErrors;
	std::unique_ptr<EmeKeySessionManager> mManager;
	std::shared_ptr<StrictMock<MockEmeCdmInstance>> mCdm;
	std::shared_ptr<NiceMock<MockEmeKeySession>> mSession;
	std::vector<uint8_t> mInitData = {0x00, 0x00, 0x00, 0x20, 'p', 's', 's', 'h'};

	void SetUp() override
	{
		mScheduler = std::make_shared<EmeScheduler>();
		mScheduler->StartScheduler(0);
		mReporter.SetListener([this](const EmeKeySystemError &error) { mErrors.push_back(error); });
		mManager = std::unique_ptr<EmeKeySessionManager>(new EmeKeySessionManager(mState, mReporter, mScheduler));
		mCdm = std::make_shared<StrictMock<MockEmeCdmInstance>>();
		mSession = std::make_shared<NiceMock<MockEmeKeySession>>();
		ON_CALL(*mSession, GetSessionId()).WillByDefault(Return("session-1"));
	}

	void TearDown() override
	{
		mScheduler->StopScheduler();
		mManager = nullptr;
	}

	void AddItemWithSession()
	{
		EXPECT_CALL(*mCdm, CreateSession()).WillOnce(Return(mSession));
		mManager->AddSessionItem(mCdm, nullptr, WIDEVINE_KEY_SYSTEM_STRING);
		mManager->OnCdmAvailable();
	}
};

TEST_F(KeySessionManagerTests, AddedItemBecomesActive)
{
	//Act
	int first = mManager->AddSessionItem(mCdm, nullptr, WIDEVINE_KEY_SYSTEM_STRING);
	int second = mManager->AddSessionItem(mCdm, nullptr, WIDEVINE_KEY_SYSTEM_STRING);

	//Assert
	EXPECT_NE(first, second);
	EXPECT_EQ(mManager->GetItemCount(), 2);
	ASSERT_TRUE(mManager->GetActiveItem() != nullptr);
	EXPECT_EQ(mManager->GetActiveItem()->id, second);
	EXPECT_EQ(mManager->GetItem(first)->state, eSESSION_ITEM_ACCESS_GRANTED);
	EXPECT_FALSE(mManager->GetItem(first)->initialized);
}

TEST_F(KeySessionManagerTests, SessionCreatedOncePerItem)
{
	//Arrange
	AddItemWithSession();

	//Act: a second availability signal must not create another session
	mManager->OnCdmAvailable();

	//Assert
	EmeSessionItemPtr item = mManager->GetActiveItem();
	EXPECT_EQ(item->session, mSession);
	EXPECT_EQ(item->state, eSESSION_ITEM_SESSION_CREATED);
	EXPECT_TRUE(mState.haveKeySession);
}

TEST_F(KeySessionManagerTests, SessionCreationFailure)
{
	//Arrange
	EXPECT_CALL(*mCdm, CreateSession()).WillOnce(Return(nullptr));
	mManager->AddSessionItem(mCdm, nullptr, WIDEVINE_KEY_SYSTEM_STRING);

	//Act
	mManager->OnCdmAvailable();

	//Assert: item kept without a session
	EXPECT_TRUE(mManager->GetActiveItem()->session == nullptr);
	EXPECT_FALSE(mState.haveKeySession);
}

TEST_F(KeySessionManagerTests, GenerateRequestOnce)
{
	//Arrange
	AddItemWithSession();
	EXPECT_CALL(*mSession, GenerateRequest(EME_INIT_DATA_TYPE_CENC, mInitData, _))
		.WillOnce(InvokeArgument<2>(true, std::string()));

	//Act: second attempt on the same item is ignored
	mManager->GenerateRequestForActiveSession(EME_INIT_DATA_TYPE_CENC, mInitData);
	mManager->GenerateRequestForActiveSession(EME_INIT_DATA_TYPE_CENC, mInitData);
	FlushScheduler(*mScheduler);

	//Assert
	EmeSessionItemPtr item = mManager->GetActiveItem();
	EXPECT_TRUE(item->initialized);
	EXPECT_EQ(item->state, eSESSION_ITEM_REQUEST_GENERATED);
	EXPECT_TRUE(mErrors.empty());
}

TEST_F(KeySessionManagerTests, GenerateRequestWithoutItem)
{
	//Arrange
	mState.pssh.currentPssh = "AAAA";
	mState.pssh.lastProcessedPssh = "AAAA";

	//Act
	mManager->GenerateRequestForActiveSession(EME_INIT_DATA_TYPE_CENC, mInitData);

	//Assert: fatal, and the fingerprint may be processed again
	ASSERT_EQ(mErrors.size(), 1);
	EXPECT_EQ(mErrors[0].kind, eEME_ERROR_NO_ACCESS);
	EXPECT_TRUE(mErrors[0].fatal);
	EXPECT_TRUE(mState.pssh.lastProcessedPssh.empty());
}

TEST_F(KeySessionManagerTests, GenerateRequestWithoutSession)
{
	EXPECT_CALL(*mCdm, CreateSession()).WillOnce(Return(nullptr));
	mManager->AddSessionItem(mCdm, nullptr, WIDEVINE_KEY_SYSTEM_STRING);
	mManager->OnCdmAvailable();

	mManager->GenerateRequestForActiveSession(EME_INIT_DATA_TYPE_CENC, mInitData);

	ASSERT_EQ(mErrors.size(), 1);
	EXPECT_EQ(mErrors[0].kind, eEME_ERROR_NO_SESSION);
	EXPECT_TRUE(mErrors[0].fatal);
}

TEST_F(KeySessionManagerTests, GenerateRequestWithoutInitData)
{
	AddItemWithSession();
	EXPECT_CALL(*mSession, GenerateRequest(_, _, _)).Times(0);

	mManager->GenerateRequestForActiveSession(EME_INIT_DATA_TYPE_CENC, std::vector<uint8_t>());

	ASSERT_EQ(mErrors.size(), 1);
	EXPECT_EQ(mErrors[0].kind, eEME_ERROR_NO_INIT_DATA);
	EXPECT_TRUE(mErrors[0].fatal);
	EXPECT_FALSE(mManager->GetActiveItem()->initialized);
}

TEST_F(KeySessionManagerTests, GenerateRequestRejected)
{
	//Arrange: CDM rejects the init data
	AddItemWithSession();
	EXPECT_CALL(*mSession, GenerateRequest(_, _, _))
		.WillOnce(InvokeArgument<2>(false, std::string("bad init data")));

	//Act
	mManager->GenerateRequestForActiveSession(EME_INIT_DATA_TYPE_CENC, mInitData);
	FlushScheduler(*mScheduler);

	//Assert: non-fatal, item stays initialized
	ASSERT_EQ(mErrors.size(), 1);
	EXPECT_EQ(mErrors[0].kind, eEME_ERROR_NO_SESSION);
	EXPECT_FALSE(mErrors[0].fatal);
	EXPECT_TRUE(mManager->GetActiveItem()->initialized);
	EXPECT_EQ(mManager->GetActiveItem()->state, eSESSION_ITEM_FAILED);
}

TEST_F(KeySessionManagerTests, GenerateRequestResultAfterItemRemoved)
{
	//Arrange: completion held by the session
	AddItemWithSession();
	EmeCompletionCallback done;
	EXPECT_CALL(*mSession, GenerateRequest(_, _, _)).WillOnce(SaveArg<2>(&done));
	mManager->GenerateRequestForActiveSession(EME_INIT_DATA_TYPE_CENC, mInitData);
	ASSERT_TRUE((bool)done);
	std::vector<EmeSessionItemPtr> items = mManager->TakeAllItems();

	//Act: CDM rejects after the item was closed
	done(false, std::string("session closed"));
	FlushScheduler(*mScheduler);

	//Assert
	EXPECT_TRUE(mErrors.empty());
	EXPECT_EQ(items[0]->state, eSESSION_ITEM_REQUEST_GENERATED);
}

TEST_F(KeySessionManagerTests, UpdateResultAfterItemRemoved)
{
	AddItemWithSession();
	EmeCompletionCallback done;
	EXPECT_CALL(*mSession, Update(_, _)).WillOnce(SaveArg<1>(&done));
	mManager->UpdateSession(mManager->GetActiveItem(), std::vector<uint8_t>{0x01});
	ASSERT_TRUE((bool)done);
	std::vector<EmeSessionItemPtr> items = mManager->TakeAllItems();

	done(true, std::string());
	FlushScheduler(*mScheduler);

	EXPECT_EQ(items[0]->state, eSESSION_ITEM_SESSION_CREATED);
}

TEST_F(KeySessionManagerTests, KeyMessageForwarded)
{
	//Arrange: capture the session's message handler
	EmeKeySession::MessageHandler handler;
	EXPECT_CALL(*mSession, SetMessageHandler(_)).WillOnce(SaveArg<0>(&handler));
	AddItemWithSession();
	ASSERT_TRUE((bool)handler);

	int messageItemId = -1;
	std::vector<uint8_t> received;
	mManager->SetKeyMessageHandler([&](EmeSessionItemPtr item, const std::vector<uint8_t> &message)
	{
		messageItemId = item->id;
		received = message;
	});

	//Act: CDM emits a message
	std::vector<uint8_t> message = {0x0a, 0x0b};
	handler(message);
	FlushScheduler(*mScheduler);

	//Assert
	EXPECT_EQ(messageItemId, mManager->GetActiveItem()->id);
	EXPECT_EQ(received, message);
}

TEST_F(KeySessionManagerTests, UpdateSession)
{
	AddItemWithSession();
	std::vector<uint8_t> license = {0x01, 0x02};
	EXPECT_CALL(*mSession, GenerateRequest(_, _, _)).WillOnce(InvokeArgument<2>(true, std::string()));
	EXPECT_CALL(*mSession, Update(license, _)).WillOnce(InvokeArgument<1>(true, std::string()));

	mManager->GenerateRequestForActiveSession(EME_INIT_DATA_TYPE_CENC, mInitData);
	mManager->UpdateSession(mManager->GetActiveItem(), license);
	FlushScheduler(*mScheduler);

	EXPECT_EQ(mManager->GetActiveItem()->state, eSESSION_ITEM_LICENSE_EXCHANGED);
}

TEST_F(KeySessionManagerTests, UpdateSessionFailureIsLoggedOnly)
{
	AddItemWithSession();
	EXPECT_CALL(*mSession, Update(_, _)).WillOnce(InvokeArgument<1>(false, std::string("license rejected")));

	mManager->UpdateSession(mManager->GetActiveItem(), std::vector<uint8_t>{0x01});
	FlushScheduler(*mScheduler);

	EXPECT_EQ(mManager->GetActiveItem()->state, eSESSION_ITEM_FAILED);
	EXPECT_TRUE(mErrors.empty());
}

TEST_F(KeySessionManagerTests, TakeAllItems)
{
	AddItemWithSession();

	std::vector<EmeSessionItemPtr> items = mManager->TakeAllItems();

	ASSERT_EQ(items.size(), 1);
	EXPECT_EQ(items[0]->session, mSession);
	EXPECT_EQ(mManager->GetItemCount(), 0);
	EXPECT_TRUE(mManager->GetActiveItem() == nullptr);
}

TEST_F(KeySessionManagerTests, StatesOnlyMoveForward)
{
	EmeSessionItem item(0, nullptr, nullptr, WIDEVINE_KEY_SYSTEM_STRING);

	EXPECT_TRUE(item.AdvanceState(eSESSION_ITEM_SESSION_CREATED));
	EXPECT_FALSE(item.AdvanceState(eSESSION_ITEM_ACCESS_GRANTED));
	EXPECT_FALSE(item.AdvanceState(eSESSION_ITEM_SESSION_CREATED));
	EXPECT_EQ(item.state, eSESSION_ITEM_SESSION_CREATED);
	EXPECT_STREQ(EmeSessionItem::GetStateName(eSESSION_ITEM_LICENSE_EXCHANGED), "LicenseExchanged");
}
