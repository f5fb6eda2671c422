#include "PCH.hpp"

#include "Tracking/TrackingNotifier.hpp"

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

namespace
{
	// Records bodies instead of posting them; fails the first "failures" sends.
	class RecordingNotifier : public TrackingNotifier
	{
	public:
		RecordingNotifier(U32 maxAttempts, U32 retryDelayMs, U32 failures)
			: TrackingNotifier("http://127.0.0.1:1/tracking", maxAttempts, retryDelayMs)
			, mFailures(failures)
		{ }

		~RecordingNotifier() override { Stop(); }

		Vector<String> GetBodies()
		{
			std::lock_guard<std::mutex> lock(mMutex);
			return mBodies;
		}

		// "processing_status" of every delivered body, in delivery order.
		Vector<String> GetDeliveredStatuses()
		{
			Vector<String> list;

			for (const auto& rBody : GetBodies())
				list.push_back(nlohmann::json::parse(rBody)["processing_status"].get<String>());

			return list;
		}

		std::atomic<U32> numSends{ 0 };

	protected:

		bool Send(const String& rBody) override
		{
			numSends++;

			std::lock_guard<std::mutex> lock(mMutex);

			if (mFailures > 0)
			{
				mFailures--;
				return false;
			}

			mBodies.push_back(rBody);
			return true;
		}

	private:

		std::mutex		mMutex;
		Vector<String>	mBodies;
		U32				mFailures;
	};
}

class TrackingNotifierTests : public ::testing::Test
{
protected:
	void SetUp() override {}
	void TearDown() override {}
};

TEST_F(TrackingNotifierTests, BodyCarriesKeyStatusAndDetail)
{
	const auto body = nlohmann::json::parse(TrackingNotifier::MakeBody("a/b.jpg", TrackingStatus::DetectionComplete, "3 detections", "2024-05-17T06:31:02Z"));

	ASSERT_EQ(body["file_key"], "a/b.jpg");
	ASSERT_EQ(body["processing_status"], "DETECTION_COMPLETE");
	ASSERT_EQ(body["detail"], "3 detections");
	ASSERT_EQ(body["updated_at"], "2024-05-17T06:31:02Z");
}

TEST_F(TrackingNotifierTests, StatusNames)
{
	ASSERT_STREQ(TrackingSink::ToString(TrackingStatus::Processing), "PROCESSING");
	ASSERT_STREQ(TrackingSink::ToString(TrackingStatus::DetectionFailed), "DETECTION_FAILED");
	ASSERT_STREQ(TrackingSink::ToString(TrackingStatus::Skipped), "SKIPPED");
}

TEST_F(TrackingNotifierTests, QueuedUntilProcessed)
{
	RecordingNotifier notifier(3, 0, 0);

	notifier.SetStatus("a.jpg", TrackingStatus::Processing, "");
	notifier.SetStatus("b.jpg", TrackingStatus::Skipped, "Already processed");

	ASSERT_EQ(notifier.GetQueueSize(), 2u);
	ASSERT_EQ(notifier.numSends.load(), 0u);

	notifier.Process();

	ASSERT_EQ(notifier.GetQueueSize(), 0u);
	ASSERT_EQ(notifier.GetDeliveredStatuses(), Vector<String>({ "PROCESSING", "SKIPPED" }));
}

TEST_F(TrackingNotifierTests, NewerStatusReplacesThePendingOne)
{
	RecordingNotifier notifier(3, 0, 0);

	notifier.SetStatus("a.jpg", TrackingStatus::Processing, "");
	notifier.SetStatus("a.jpg", TrackingStatus::DetectionComplete, "0 detections");

	ASSERT_EQ(notifier.GetQueueSize(), 1u);

	notifier.Process();

	ASSERT_EQ(notifier.GetDeliveredStatuses(), Vector<String>({ "DETECTION_COMPLETE" }));
}

TEST_F(TrackingNotifierTests, FailedOlderStatusIsNotDeliveredAfterANewerOne)
{
	RecordingNotifier notifier(3, 50, 1);

	notifier.SetStatus("a.jpg", TrackingStatus::Processing, "");
	notifier.Process();

	ASSERT_EQ(notifier.GetQueueSize(), 1u);

	notifier.SetStatus("a.jpg", TrackingStatus::DetectionComplete, "2 detections");
	notifier.Process();

	std::this_thread::sleep_for(std::chrono::milliseconds(80));

	notifier.Process();

	ASSERT_EQ(notifier.GetQueueSize(), 0u);
	ASSERT_EQ(notifier.GetDeliveredStatuses(), Vector<String>({ "DETECTION_COMPLETE" }));
}

TEST_F(TrackingNotifierTests, DeliveryThreadSendsWithoutTheCaller)
{
	RecordingNotifier notifier(3, 10, 1);

	notifier.Start();

	notifier.SetStatus("a.jpg", TrackingStatus::DetectionFailed, "decode: broken");

	const auto endTP = std::chrono::steady_clock::now() + std::chrono::seconds(5);

	while (notifier.GetBodies().empty() && std::chrono::steady_clock::now() < endTP)
		std::this_thread::sleep_for(std::chrono::milliseconds(5));

	notifier.Stop();

	ASSERT_EQ(notifier.GetDeliveredStatuses(), Vector<String>({ "DETECTION_FAILED" }));
	ASSERT_EQ(notifier.numSends.load(), 2u);
}

TEST_F(TrackingNotifierTests, FailedDeliveryIsRetried)
{
	RecordingNotifier notifier(3, 0, 2);

	notifier.SetStatus("a.jpg", TrackingStatus::DetectionFailed, "Decode: broken");

	notifier.Process();
	ASSERT_EQ(notifier.GetQueueSize(), 1u);

	notifier.Process();
	ASSERT_EQ(notifier.GetQueueSize(), 1u);

	notifier.Process();
	ASSERT_EQ(notifier.GetQueueSize(), 0u);
	ASSERT_EQ(notifier.numSends.load(), 3u);
	ASSERT_EQ(notifier.GetBodies().size(), 1u);
}

TEST_F(TrackingNotifierTests, DroppedAfterMaxAttempts)
{
	RecordingNotifier notifier(2, 0, 10);

	notifier.SetStatus("a.jpg", TrackingStatus::Processing, "");

	notifier.Process();
	notifier.Process();
	notifier.Process();

	ASSERT_EQ(notifier.GetQueueSize(), 0u);
	ASSERT_EQ(notifier.numSends.load(), 2u);
	ASSERT_TRUE(notifier.GetBodies().empty());
}

TEST_F(TrackingNotifierTests, RetryWaitsForTheDelay)
{
	RecordingNotifier notifier(3, 60 * 1000, 1);

	notifier.SetStatus("a.jpg", TrackingStatus::Processing, "");

	notifier.Process();
	notifier.Process();

	ASSERT_EQ(notifier.numSends.load(), 1u);
	ASSERT_EQ(notifier.GetQueueSize(), 1u);
}
