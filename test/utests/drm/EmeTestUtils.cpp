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

#include <chrono>
#include <future>
#include <memory>

#include "EmeTestUtils.h"

void FlushScheduler(EmeScheduler &scheduler, int rounds)
{
	for (int i = 0; i < rounds; i++)
	{
		std::shared_ptr<std::promise<void>> done = std::make_shared<std::promise<void>>();
		std::future<void> marker = done->get_future();
		int id = scheduler.ScheduleTask(AsyncTaskObj([done](void *) { done->set_value(); }, nullptr, "FlushMarker"));
		if (id == EME_TASK_ID_INVALID)
		{
			return;
		}
		if (marker.wait_for(std::chrono::seconds(5)) != std::future_status::ready)
		{
			ADD_FAILURE() << "scheduler did not drain";
			return;
		}
	}
}

static void appendU32(std::vector<uint8_t> &buf, uint32_t value)
{
	buf.push_back((uint8_t)(value >> 24));
	buf.push_back((uint8_t)(value >> 16));
	buf.push_back((uint8_t)(value >> 8));
	buf.push_back((uint8_t)value);
}

std::vector<uint8_t> BuildWidevinePssh(const std::vector<std::vector<uint8_t>> &keyIds)
{
	static const uint8_t systemId[16] =
	{
		0xed,0xef,0x8b,0xa9,0x79,0xd6,0x4a,0xce,0xa3,0xc8,0x27,0xdc,0xd5,0x1d,0x21,0xed
	};
	std::vector<uint8_t> data;
	data.push_back(0x48); // protection scheme 'cenc'
	data.push_back(0xe3);
	data.push_back(0xdc);
	data.push_back(0x95);
	data.push_back(0x9b);
	data.push_back(0x06);
	for (auto &keyId : keyIds)
	{
		data.push_back(0x12);
		data.push_back((uint8_t)keyId.size());
		data.insert(data.end(), keyId.begin(), keyId.end());
	}

	std::vector<uint8_t> box;
	appendU32(box, (uint32_t)(32 + data.size()));
	box.push_back('p');
	box.push_back('s');
	box.push_back('s');
	box.push_back('h');
	appendU32(box, 0);
	box.insert(box.end(), systemId, systemId + sizeof(systemId));
	appendU32(box, (uint32_t)data.size());
	box.insert(box.end(), data.begin(), data.end());
	return box;
}

static std::string ToBase64(const std::vector<uint8_t> &data)
{
	static const char alphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
	std::string out;
	size_t i = 0;
	for (; i + 2 < data.size(); i += 3)
	{
		uint32_t triple = (data[i] << 16) | (data[i + 1] << 8) | data[i + 2];
		out.push_back(alphabet[(triple >> 18) & 0x3f]);
		out.push_back(alphabet[(triple >> 12) & 0x3f]);
		out.push_back(alphabet[(triple >> 6) & 0x3f]);
		out.push_back(alphabet[triple & 0x3f]);
	}
	if (i < data.size())
	{
		uint32_t triple = data[i] << 16;
		if (i + 1 < data.size())
		{
			triple |= data[i + 1] << 8;
		}
		out.push_back(alphabet[(triple >> 18) & 0x3f]);
		out.push_back(alphabet[(triple >> 12) & 0x3f]);
		out.push_back((i + 1 < data.size()) ? alphabet[(triple >> 6) & 0x3f] : '=');
		out.push_back('=');
	}
	return out;
}

EmeLevelKey BuildLevelKey(const std::string &keyFormat, const std::vector<uint8_t> &pssh)
{
	return EmeLevelKey(keyFormat, "data:text/plain;base64," + ToBase64(pssh));
}

std::vector<uint8_t> ToUtf16LE(const std::string &text)
{
	std::vector<uint8_t> out;
	out.reserve(text.size() * 2);
	for (char c : text)
	{
		out.push_back((uint8_t)c);
		out.push_back(0x00);
	}
	return out;
}

std::vector<uint8_t> BuildPlayReadyKeyMessage(const std::string &challenge,
				const std::vector<std::pair<std::string, std::string>> &headers)
{
	std::string xml = "<PlayReadyKeyMessage type=\"LicenseAcquisition\"><LicenseAcquisition Version=\"1\">";
	if (!challenge.empty())
	{
		xml += "<Challenge encoding=\"base64encoded\">" + challenge + "</Challenge>";
	}
	xml += "<HttpHeaders>";
	for (auto &header : headers)
	{
		xml += "<HttpHeader><name>" + header.first + "</name><value>" + header.second + "</value></HttpHeader>";
	}
	xml += "</HttpHeaders></LicenseAcquisition></PlayReadyKeyMessage>";
	return ToUtf16LE(xml);
}
