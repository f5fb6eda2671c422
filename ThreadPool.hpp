#pragma once

#include <future>

// Fixed number of workers draining one FIFO queue of pipeline invocations.
class ThreadPool
{
public:
	ThreadPool(size_t numThreads);
	~ThreadPool();

	ThreadPool(const ThreadPool&) = delete;
	ThreadPool& operator=(const ThreadPool&) = delete;

	// Blocks until the queue is empty and no worker is busy.
	void WaitAll();

	U32 GetNumTasks() const { return mNumTasks.load(); }

	// Exceptions thrown by the task end up in the returned future.
	// Throws Exception once the pool is shutting down.
	template<typename T, typename ...Args>
	auto Enqueue(T&& f, Args&&... args) -> std::future<decltype(f(args...))>
	{
		using ReturnType = decltype(f(args...));

		auto taskPtr = std::make_shared<std::packaged_task<ReturnType()>>(std::bind(std::forward<T>(f), std::forward<Args>(args)...));

		auto future = taskPtr->get_future();

		{
			std::lock_guard<std::mutex> lock(mTaskLock);

			if (mIsStopRequested)
				throw Exception("Thread pool is stopping, task rejected!");

			mTasks.emplace([taskPtr]() { (*taskPtr)(); });

			++mNumTasks;
		}

		mCondition.notify_one();

		return future;
	}

private:

	void WorkerProc();

	Vector<std::thread>					mThreads;
	std::queue<std::function<void()>>	mTasks;

	std::mutex							mTaskLock;
	std::condition_variable				mCondition;		// Task queued or stop.
	std::condition_variable				mIdleCondition;	// mNumTasks dropped to zero.

	bool				mIsStopRequested = false;

	// Queued plus running.
	std::atomic<U32>	mNumTasks{ 0 };
};
