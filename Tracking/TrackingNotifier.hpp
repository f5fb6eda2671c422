#pragma once

#include "Tracking/TrackingSink.hpp"

// Queues status updates and delivers them as JSON POSTs to the tracking endpoint from its own thread,
// so a slow endpoint never holds up the caller. Failed deliveries are retried after "retryDelayMs",
// up to "maxAttempts" deliveries in total. At most one update per storage key is pending, a newer
// status replaces the queued one and a failed older one is not retried once a newer one is queued.
class TrackingNotifier : public TrackingSink
{
public:
	TrackingNotifier(const String& rEndpoint, U32 maxAttempts, U32 retryDelayMs);
	virtual ~TrackingNotifier();

	// Thread safe, only queues the update.
	void SetStatus(const String& rStorageKey, TrackingStatus status, const String& rDetail) override;

	// Starts the delivery thread.
	void Start();
	// Stops the delivery thread after one last delivery round. Derived classes call it before they are gone.
	void Stop();

	// Delivers every queued update that is due.
	void Process();

	size_t GetQueueSize();

	// {"file_key", "processing_status", "detail", "updated_at"}
	static String MakeBody(const String& rStorageKey, TrackingStatus status, const String& rDetail, const String& rUpdatedAt);

protected:

	// True on a 2xx response.
	virtual bool Send(const String& rBody);

private:

	void ThreadProc();

	struct Notice
	{
		String		storageKey;
		String		body;
		U32			attempts = 0;
		TimePoint	nextAttemptTP;
	};

	const String	mEndpoint;
	const U32		mMaxAttempts;
	const U32		mRetryDelayMs;

	Vector<Notice>	mQueue;
	std::mutex		mQueueMutex;

	// One delivery round at a time, keeps the per key order.
	std::mutex		mDeliveryMutex;

	bool					mIsStopRequested = false;
	std::condition_variable	mCondition;
	std::thread				mThread;
};
