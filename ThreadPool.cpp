#include "PCH.hpp"

#include "ThreadPool.hpp"

ThreadPool::ThreadPool(size_t numThreads)
{
	if (numThreads == 0)
		numThreads = 1;

	mThreads.reserve(numThreads);

	for (size_t i = 0; i < numThreads; ++i)
		mThreads.emplace_back(&ThreadPool::WorkerProc, this);

	LOG_MESSAGE(Log::Channel::Main, "Thread pool started with %zu workers.", numThreads);
}

ThreadPool::~ThreadPool()
{
	{
		std::lock_guard<std::mutex> lock(mTaskLock);
		mIsStopRequested = true;
	}

	mCondition.notify_all();

	for (auto& rThread : mThreads)
		rThread.join();
}

void ThreadPool::WorkerProc()
{
	for (;;)
	{
		std::function<void()> task;

		{
			std::unique_lock<std::mutex> lock(mTaskLock);

			mCondition.wait(lock, [this] { return !mTasks.empty() || mIsStopRequested; });

			// Queued tasks are still finished on shutdown.
			if (mTasks.empty())
				return;

			task = std::move(mTasks.front());
			mTasks.pop();
		}

		// packaged_task keeps the task's exception for the future.
		task();

		bool isIdle;

		{
			std::lock_guard<std::mutex> lock(mTaskLock);
			isIdle = --mNumTasks == 0;
		}

		if (isIdle)
			mIdleCondition.notify_all();
	}
}

void ThreadPool::WaitAll()
{
	std::unique_lock<std::mutex> lock(mTaskLock);

	mIdleCondition.wait(lock, [this] { return mNumTasks == 0; });
}
