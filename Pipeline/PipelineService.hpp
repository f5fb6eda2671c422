
#pragma once

#include <future>

#include "Pipeline/Orchestrator.hpp"

class ThreadPool;

// Runs every submitted notice as an independent invocation on the worker pool.
class PipelineService
{
public:
	PipelineService(Orchestrator& rOrchestrator, StoreProvider& rStoreProvider, ThreadPool& rThreadPool);

	// Never blocks on the processing itself.
	std::future<ProcessOutcome> Submit(const UploadNotice& rNotice);

	auto GetNumSubmitted() const { return mNumSubmitted.load(); }

private:

	ProcessOutcome Run(const UploadNotice& rNotice);

	Orchestrator&	mOrchestrator;
	StoreProvider&	mStoreProvider;
	ThreadPool&		mThreadPool;

	std::atomic<U64> mNumSubmitted{ 0 };
};
