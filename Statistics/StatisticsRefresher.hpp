
#pragma once

class Store;

// Recomputes the aggregate tables on its own thread, every "intervalSec" (0 = on request only) and on request.
// "rStore" must not be used by anyone else, it normally wraps a dedicated connection.
class StatisticsRefresher
{
public:
	StatisticsRefresher(Store& rStore, U32 intervalSec);
	~StatisticsRefresher();

	// Returns immediately; requests arriving during a refresh are merged into one more run.
	void RequestRefresh();

	auto GetNumRefreshes() const { return mNumRefreshes.load(); }
	auto GetNumFailures() const { return mNumFailures.load(); }

private:

	void ThreadProc();

	Store&		mStore;
	const U32	mIntervalSec;

	bool		mIsRequested = false;
	bool		mIsStopRequested = false;

	std::mutex				mMutex;
	std::condition_variable	mCondition;

	std::atomic<U32>		mNumRefreshes{ 0 };
	std::atomic<U32>		mNumFailures{ 0 };

	std::thread				mThread;
};
