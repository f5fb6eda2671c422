#include "PCH.hpp"

#include "Pipeline/PipelineService.hpp"

#include "ThreadPool.hpp"

PipelineService::PipelineService(Orchestrator& rOrchestrator, StoreProvider& rStoreProvider, ThreadPool& rThreadPool)
	: mOrchestrator(rOrchestrator)
	, mStoreProvider(rStoreProvider)
	, mThreadPool(rThreadPool)
{ }

std::future<ProcessOutcome> PipelineService::Submit(const UploadNotice& rNotice)
{
	LOG_MESSAGE(Log::Channel::Pipeline, "Submitted \"%s/%s\".", rNotice.bucket.c_str(), rNotice.key.c_str());

	mNumSubmitted++;

	return mThreadPool.Enqueue([this](const UploadNotice& rTaskNotice) { return Run(rTaskNotice); }, rNotice);
}

ProcessOutcome PipelineService::Run(const UploadNotice& rNotice)
{
	ProcessOutcome outcome = ProcessOutcome::Deferred;

	try
	{
		mStoreProvider.Run([&](Store& rStore) { outcome = mOrchestrator.Process(rStore, rNotice); });
	}
	catch (const Exception& e)
	{
		LOG_ERROR(Log::Channel::Pipeline, "Invocation for \"%s\" aborted: %s", rNotice.key.c_str(), e.GetText());
	}
	catch (const std::exception& e)
	{
		LOG_ERROR(Log::Channel::Pipeline, "Invocation for \"%s\" aborted: %s", rNotice.key.c_str(), e.what());
	}

	LOG_DEBUG(Log::Channel::Pipeline, "Invocation for \"%s\" ended: %s", rNotice.key.c_str(), ToString(outcome));

	return outcome;
}
