#include "PCH.hpp"

#include "Tracking/TrackingNotifier.hpp"

#include "Utils.hpp"

#include <curl/curl.h>

#include <nlohmann/json.hpp>

namespace
{
	size_t DiscardResponse(char*, size_t size, size_t count, void*)
	{
		return size * count;
	}
}

const char* TrackingSink::ToString(TrackingStatus status)
{
	switch (status)
	{
		case TrackingStatus::Processing:		return "PROCESSING";
		case TrackingStatus::DetectionComplete:	return "DETECTION_COMPLETE";
		case TrackingStatus::DetectionFailed:	return "DETECTION_FAILED";
		case TrackingStatus::Skipped:			return "SKIPPED";
	}

	return "UNKNOWN";
}

TrackingNotifier::TrackingNotifier(const String& rEndpoint, U32 maxAttempts, U32 retryDelayMs)
	: mEndpoint(rEndpoint)
	, mMaxAttempts(std::max(maxAttempts, 1u))
	, mRetryDelayMs(retryDelayMs)
{
	LOG_MESSAGE(Log::Channel::Tracking, "Tracking endpoint: %s (attempts: %u, retry delay: %u ms)", rEndpoint.c_str(), mMaxAttempts, retryDelayMs);
}

TrackingNotifier::~TrackingNotifier()
{
	Stop();

	std::lock_guard<std::mutex> lock(mQueueMutex);

	if (!mQueue.empty())
		LOG_WARNING(Log::Channel::Tracking, "Dropping %zu undelivered status updates.", mQueue.size());
}

void TrackingNotifier::Start()
{
	if (mThread.joinable())
		return;

	{
		std::lock_guard<std::mutex> lock(mQueueMutex);
		mIsStopRequested = false;
	}

	mThread = std::thread(&TrackingNotifier::ThreadProc, this);
}

void TrackingNotifier::Stop()
{
	if (!mThread.joinable())
		return;

	{
		std::lock_guard<std::mutex> lock(mQueueMutex);
		mIsStopRequested = true;
	}

	mCondition.notify_all();
	mThread.join();
}

void TrackingNotifier::ThreadProc()
{
	LOG_MESSAGE(Log::Channel::Tracking, "Tracking delivery started.");

	// Retries become due without a wake up.
	const auto pollInterval = std::chrono::milliseconds(std::max(std::min(mRetryDelayMs, 250u), 10u));

	for (;;)
	{
		bool isStopRequested;

		{
			std::unique_lock<std::mutex> lock(mQueueMutex);

			mCondition.wait_for(lock, pollInterval, [this] { return !mQueue.empty() || mIsStopRequested; });

			isStopRequested = mIsStopRequested;
		}

		Process();

		if (isStopRequested)
			break;
	}

	LOG_MESSAGE(Log::Channel::Tracking, "Tracking delivery stopped.");
}

String TrackingNotifier::MakeBody(const String& rStorageKey, TrackingStatus status, const String& rDetail, const String& rUpdatedAt)
{
	nlohmann::json body;

	body["file_key"] = rStorageKey;
	body["processing_status"] = ToString(status);
	body["detail"] = rDetail;
	body["updated_at"] = rUpdatedAt;

	return body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

void TrackingNotifier::SetStatus(const String& rStorageKey, TrackingStatus status, const String& rDetail)
{
	LOG_DEBUG(Log::Channel::Tracking, "Queued %s for \"%s\".", ToString(status), rStorageKey.c_str());

	Notice notice;

	notice.storageKey = rStorageKey;
	notice.body = MakeBody(rStorageKey, status, rDetail, Utils::StringFromUtcNow());
	notice.nextAttemptTP = std::chrono::steady_clock::now();

	{
		std::lock_guard<std::mutex> lock(mQueueMutex);

		auto it = std::remove_if(mQueue.begin(), mQueue.end(), [&rStorageKey](const Notice& r) { return r.storageKey == rStorageKey; });

		if (it != mQueue.end())
			LOG_DEBUG(Log::Channel::Tracking, "Replacing the pending status of \"%s\".", rStorageKey.c_str());

		mQueue.erase(it, mQueue.end());
		mQueue.push_back(std::move(notice));
	}

	mCondition.notify_one();
}

size_t TrackingNotifier::GetQueueSize()
{
	std::lock_guard<std::mutex> lock(mQueueMutex);
	return mQueue.size();
}

void TrackingNotifier::Process()
{
	std::lock_guard<std::mutex> deliveryLock(mDeliveryMutex);

	const auto currentTP = std::chrono::steady_clock::now();

	Vector<Notice> localQueue;
	{
		std::lock_guard<std::mutex> lock(mQueueMutex);

		if (mQueue.empty())
			return;

		// Take only what is due, the rest waits for its retry delay.
		auto it = std::stable_partition(mQueue.begin(), mQueue.end(), [&currentTP](const Notice& r) { return r.nextAttemptTP > currentTP; });

		localQueue.assign(std::make_move_iterator(it), std::make_move_iterator(mQueue.end()));
		mQueue.erase(it, mQueue.end());
	}

	Vector<Notice> retryQueue;

	for (auto& rNotice : localQueue)
	{
		rNotice.attempts++;

		if (Send(rNotice.body))
		{
			LOG_DEBUG(Log::Channel::Tracking, "Delivered status of \"%s\".", rNotice.storageKey.c_str());
			continue;
		}

		if (rNotice.attempts >= mMaxAttempts)
		{
			LOG_ERROR(Log::Channel::Tracking, "Giving up on status of \"%s\" after %u attempts!", rNotice.storageKey.c_str(), rNotice.attempts);
			continue;
		}

		LOG_WARNING(Log::Channel::Tracking, "Status of \"%s\" not delivered, retry %u of %u in %u ms.",
			rNotice.storageKey.c_str(), rNotice.attempts, mMaxAttempts - 1, mRetryDelayMs);

		rNotice.nextAttemptTP = std::chrono::steady_clock::now() + std::chrono::milliseconds(mRetryDelayMs);
		retryQueue.push_back(std::move(rNotice));
	}

	if (!retryQueue.empty())
	{
		std::lock_guard<std::mutex> lock(mQueueMutex);

		for (auto& rNotice : retryQueue)
		{
			const auto& rKey = rNotice.storageKey;

			// A status queued during the round is newer.
			if (std::any_of(mQueue.begin(), mQueue.end(), [&rKey](const Notice& r) { return r.storageKey == rKey; }))
			{
				LOG_DEBUG(Log::Channel::Tracking, "Not retrying the superseded status of \"%s\".", rKey.c_str());
				continue;
			}

			mQueue.push_back(std::move(rNotice));
		}
	}
}

bool TrackingNotifier::Send(const String& rBody)
{
	CURL* pCurl = curl_easy_init();

	if (!pCurl)
	{
		LOG_ERROR(Log::Channel::Tracking, "Failed for \"curl_easy_init\"!");
		return false;
	}

	curl_slist* pHeaders = curl_slist_append(nullptr, "Content-Type: application/json");

	curl_easy_setopt(pCurl, CURLOPT_URL, mEndpoint.c_str());
	curl_easy_setopt(pCurl, CURLOPT_HTTPHEADER, pHeaders);
	curl_easy_setopt(pCurl, CURLOPT_POSTFIELDS, rBody.c_str());
	curl_easy_setopt(pCurl, CURLOPT_POSTFIELDSIZE, static_cast<long>(rBody.size()));
	curl_easy_setopt(pCurl, CURLOPT_CONNECTTIMEOUT, 3L);
	curl_easy_setopt(pCurl, CURLOPT_TIMEOUT, 10L);
	curl_easy_setopt(pCurl, CURLOPT_NOSIGNAL, 1L);
	curl_easy_setopt(pCurl, CURLOPT_WRITEFUNCTION, DiscardResponse);

	const CURLcode result = curl_easy_perform(pCurl);

	long httpCode = 0;

	if (result == CURLE_OK)
		curl_easy_getinfo(pCurl, CURLINFO_RESPONSE_CODE, &httpCode);
	else
		LOG_WARNING(Log::Channel::Tracking, "Tracking request failed: %s", curl_easy_strerror(result));

	curl_slist_free_all(pHeaders);
	curl_easy_cleanup(pCurl);

	if (result == CURLE_OK && (httpCode < 200 || httpCode >= 300))
		LOG_WARNING(Log::Channel::Tracking, "Tracking endpoint responded with HTTP %ld.", httpCode);

	return result == CURLE_OK && httpCode >= 200 && httpCode < 300;
}
