#include "PCH.hpp"

#include "Statistics/StatisticsRefresher.hpp"

#include "Storage/Store.hpp"

StatisticsRefresher::StatisticsRefresher(Store& rStore, U32 intervalSec)
	: mStore(rStore)
	, mIntervalSec(intervalSec)
{
	mThread = std::thread(&StatisticsRefresher::ThreadProc, this);
}

StatisticsRefresher::~StatisticsRefresher()
{
	LOG_MESSAGE(Log::Channel::Stats, "Statistics refresher is stopping.");

	{
		std::lock_guard<std::mutex> lock(mMutex);
		mIsStopRequested = true;
	}

	mCondition.notify_all();
	mThread.join();
}

void StatisticsRefresher::RequestRefresh()
{
	{
		std::lock_guard<std::mutex> lock(mMutex);
		mIsRequested = true;
	}

	mCondition.notify_all();
}

void StatisticsRefresher::ThreadProc()
{
	LOG_MESSAGE(Log::Channel::Stats, "Statistics refresher started. (Interval: %u s)", mIntervalSec);

	for (;;)
	{
		{
			std::unique_lock<std::mutex> lock(mMutex);

			auto isWoken = [this] { return mIsRequested || mIsStopRequested; };

			if (mIntervalSec == 0)
				mCondition.wait(lock, isWoken);
			else
				mCondition.wait_for(lock, std::chrono::seconds(mIntervalSec), isWoken);

			if (mIsStopRequested)
				break;

			mIsRequested = false;
		}

		try
		{
			mStore.RefreshStatistics();
			mNumRefreshes++;
		}
		catch (const PipelineException& e)
		{
			mNumFailures++;
			LOG_ERROR(Log::Channel::Stats, "Statistics refresh failed: %s", e.GetText());
		}
	}

	LOG_MESSAGE(Log::Channel::Stats, "Statistics refresher stopped.");
}
