#include "PCH.hpp"

#include "Pipeline/UploadNotice.hpp"

#include "Utils.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace
{
	// Empty when missing or not a string.
	String GetString(const json& rObject, const char* pName)
	{
		auto it = rObject.find(pName);

		if (it == rObject.end() || !it->is_string())
			return String();

		return it->get<String>();
	}
}

namespace StorageEvent
{
	bool Parse(const String& rJSON, Vector<UploadNotice>& rList)
	{
		const auto root = json::parse(rJSON, nullptr, false);

		if (root.is_discarded() || !root.is_object())
			return false;

		auto recordsIt = root.find("Records");

		if (recordsIt == root.end() || !recordsIt->is_array())
			return false;

		for (const auto& rRecord : *recordsIt)
		{
			if (!rRecord.is_object())
				continue;

			auto s3It = rRecord.find("s3");

			if (s3It == rRecord.end() || !s3It->is_object())
				continue;

			auto bucketIt = s3It->find("bucket");
			auto objectIt = s3It->find("object");

			if (bucketIt == s3It->end() || !bucketIt->is_object()
				|| objectIt == s3It->end() || !objectIt->is_object())
			{
				LOG_WARNING(Log::Channel::API, "Skipping storage event record without bucket or object.");
				continue;
			}

			UploadNotice notice;

			notice.bucket = GetString(*bucketIt, "name");
			notice.key = Utils::UrlDecode(GetString(*objectIt, "key"));

			if (notice.bucket.empty() || notice.key.empty())
			{
				LOG_WARNING(Log::Channel::API, "Skipping storage event record without bucket or key.");
				continue;
			}

			rList.push_back(notice);
		}

		return true;
	}
}
