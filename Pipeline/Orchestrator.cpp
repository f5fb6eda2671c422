#include "PCH.hpp"

#include "Pipeline/Orchestrator.hpp"
#include "Pipeline/ImageSource.hpp"
#include "Pipeline/StorageKeyParser.hpp"

#include "Inference/Detector.hpp"
#include "Inference/Classifier.hpp"
#include "Inference/ImageCrop.hpp"

#include "Metadata/MetadataExtractor.hpp"

#include "Utils.hpp"

#include <opencv2/core.hpp>

const char* ToString(ProcessOutcome outcome)
{
	switch (outcome)
	{
		case ProcessOutcome::Completed:	return "completed";
		case ProcessOutcome::Failed:	return "failed";
		case ProcessOutcome::Skipped:	return "skipped";
		case ProcessOutcome::Busy:		return "busy";
		case ProcessOutcome::Deferred:	return "deferred";
		case ProcessOutcome::Rejected:	return "rejected";
	}

	return "unknown";
}

Orchestrator::Orchestrator(const PipelineSettings& rSettings, Detector& rDetector, Classifier& rClassifier, ImageSource& rSource, TrackingSink& rTracking)
	: mSettings(rSettings)
	, mDetector(rDetector)
	, mClassifier(rClassifier)
	, mSource(rSource)
	, mTracking(rTracking)
{
	LOG_MESSAGE(Log::Channel::Pipeline, "Pipeline thresholds: detection %.2f, classification %.2f. Timeout %u s, %u attempts, backoff %u..%u ms.",
		rSettings.detectionThreshold, rSettings.classificationThreshold, rSettings.invocationTimeoutSec,
		rSettings.retry.maxAttempts, rSettings.retry.backoffMs, rSettings.retry.backoffMaxMs);
}

template<typename T>
auto Orchestrator::WithRetry(const Deadline& rDeadline, const char* pStage, T&& f) -> decltype(f())
{
	for (U32 attempt = 1;; ++attempt)
	{
		if (rDeadline.IsExpired())
			throw PipelineException(ErrorKind::Timeout, false, "%s: invocation timeout of %u s reached!", pStage, mSettings.invocationTimeoutSec);

		try
		{
			return f();
		}
		catch (const PipelineException& e)
		{
			if (!e.IsRetryable())
				throw;

			if (attempt >= mSettings.retry.maxAttempts)
				throw PipelineException(e.GetKind(), false, "%s failed after %u attempts: %s", pStage, attempt, e.GetText());

			const U32 delayMs = mSettings.retry.GetDelayMs(attempt);

			if (delayMs >= rDeadline.GetRemainingMs())
				throw PipelineException(ErrorKind::Timeout, false, "%s: invocation timeout of %u s reached after %u attempts: %s",
					pStage, mSettings.invocationTimeoutSec, attempt, e.GetText());

			LOG_WARNING(Log::Channel::Pipeline, "%s attempt %u failed, retrying in %u ms: %s", pStage, attempt, delayMs, e.GetText());

			std::this_thread::sleep_for(std::chrono::milliseconds(delayMs));
		}
	}
}

ProcessOutcome Orchestrator::Process(Store& rStore, const UploadNotice& rNotice)
{
	const Deadline deadline(mSettings.invocationTimeoutSec);
	const StorageKeyParser key(rNotice.key);

	if (!key.IsValid())
	{
		LOG_ERROR(Log::Channel::Pipeline, "Rejected malformed storage key \"%s\"!", rNotice.key.c_str());
		NotifyTracking(rNotice.key, TrackingStatus::DetectionFailed, "Malformed storage key");
		return ProcessOutcome::Rejected;
	}

	Model::ImageRecord image;
	ProcessOutcome outcome;

	if (!Claim(rStore, rNotice, key, deadline, image, outcome))
		return outcome;

	LOG_MESSAGE(Log::Channel::Pipeline, "Claimed \"%s\". (Image id: %" PRIu64 ")", rNotice.key.c_str(), image.id);
	NotifyTracking(rNotice.key, TrackingStatus::Processing, String());

	Vector<Model::DetectionRecord> detections;

	try
	{
		RunStages(rStore, rNotice, key, deadline, image, detections);

		WithRetry(deadline, "Persist", [&]() { rStore.CompleteImage(image, detections); });
	}
	catch (const PipelineException& e)
	{
		return HandleFailure(rStore, image, e);
	}
	catch (const Exception& e)
	{
		return HandleFailure(rStore, image, PipelineException(ErrorKind::Internal, false, "%s", e.GetText()));
	}
	catch (const std::exception& e)
	{
		return HandleFailure(rStore, image, PipelineException(ErrorKind::Internal, false, "%s", e.what()));
	}

	LOG_MESSAGE(Log::Channel::Pipeline, "Completed \"%s\" with %zu detections.", rNotice.key.c_str(), detections.size());
	NotifyTracking(rNotice.key, TrackingStatus::DetectionComplete, std::to_string(detections.size()) + " detections");

	return ProcessOutcome::Completed;
}

bool Orchestrator::Claim(Store& rStore, const UploadNotice& rNotice, const StorageKeyParser& rKey, const Deadline& rDeadline, Model::ImageRecord& rImage, ProcessOutcome& rOutcome)
{
	ClaimResult claim;

	try
	{
		// Idempotency guard, a redelivered notice for a finished image does no work at all.
		Model::ImageRecord existing;

		if (WithRetry(rDeadline, "Lookup", [&]() { return rStore.FindImage(rNotice.key, existing); }) && Model::IsTerminal(existing.status))
		{
			claim = ClaimResult::AlreadyTerminal;
		}
		else
		{
			rImage.bucket = rNotice.bucket;
			rImage.storageKey = rNotice.key;
			rImage.fileName = rKey.GetFileName();
			rImage.projectName = rKey.GetProjectName();
			rImage.country = rKey.GetCountry();
			rImage.client = rKey.GetClient();
			rImage.sourceCameraId = rKey.GetCameraId();

			// Unregistered cameras keep a NULL location.
			if (!rImage.sourceCameraId.empty())
				rImage.locationId = WithRetry(rDeadline, "Location lookup", [&]() { return rStore.FindLocationId(rImage.sourceCameraId); });

			claim = WithRetry(rDeadline, "Claim", [&]() { return rStore.ClaimImage(rImage, mSettings.invocationTimeoutSec); });
		}
	}
	catch (const Exception& e)
	{
		LOG_ERROR(Log::Channel::Pipeline, "Failed to claim \"%s\": %s", rNotice.key.c_str(), e.GetText());
		rOutcome = ProcessOutcome::Deferred;
		return false;
	}
	catch (const std::exception& e)
	{
		LOG_ERROR(Log::Channel::Pipeline, "Failed to claim \"%s\": %s", rNotice.key.c_str(), e.what());
		rOutcome = ProcessOutcome::Deferred;
		return false;
	}

	switch (claim)
	{
		case ClaimResult::Claimed:
			return true;

		case ClaimResult::AlreadyTerminal:
			LOG_MESSAGE(Log::Channel::Pipeline, "Skipping \"%s\", already processed.", rNotice.key.c_str());
			NotifyTracking(rNotice.key, TrackingStatus::Skipped, "Already processed");
			rOutcome = ProcessOutcome::Skipped;
			return false;

		case ClaimResult::OwnedByOther:
			LOG_MESSAGE(Log::Channel::Pipeline, "Skipping \"%s\", another invocation is processing it.", rNotice.key.c_str());
			rOutcome = ProcessOutcome::Busy;
			return false;
	}

	rOutcome = ProcessOutcome::Deferred;
	return false;
}

void Orchestrator::RunStages(Store& rStore, const UploadNotice& rNotice, const StorageKeyParser& rKey, const Deadline& rDeadline,
	Model::ImageRecord& rImage, Vector<Model::DetectionRecord>& rDetections)
{
	ByteBuffer bytes;

	WithRetry(rDeadline, "Load", [&]() { mSource.Load(rNotice, bytes); });

	rImage.fileSize = bytes.size();
	rImage.fileHash = Utils::Sha256Hex(bytes.data(), bytes.size());

	// Only undecodable bytes throw here; missing EXIF is fine.
	cv::Mat decoded;
	Metadata::Extract(bytes, rImage.metadata, &decoded);

	if (!rImage.metadata.hasCapturedAt && rKey.HasTimestamp())
	{
		rImage.metadata.capturedAt = rKey.GetTimestampStr();
		rImage.metadata.hasCapturedAt = true;
	}

	LOG_DEBUG(Log::Channel::Pipeline, "\"%s\": %ux%u %s, quality %.3f.", rNotice.key.c_str(),
		rImage.metadata.width, rImage.metadata.height, rImage.metadata.format.c_str(), rImage.metadata.quality);

	WithRetry(rDeadline, "Metadata", [&]() { rStore.UpdateImageMetadata(rImage); });

	const auto objects = WithRetry(rDeadline, "Detection", [&]() { return mDetector.Detect(bytes, mSettings.detectionThreshold); });

	rDetections.reserve(objects.size());

	for (const auto& rObject : objects)
	{
		Model::DetectionRecord detection;

		detection.imageId = rImage.id;
		detection.type = rObject.type;
		detection.box = rObject.box;
		detection.detectorConfidence = rObject.confidence;

		// Person and vehicle detections never carry a species.
		if (rObject.type == DetectionType::Animal)
			ClassifyAnimal(rStore, decoded, rDeadline, detection);

		rDetections.push_back(std::move(detection));
	}
}

void Orchestrator::ClassifyAnimal(Store& rStore, const cv::Mat& rImage, const Deadline& rDeadline, Model::DetectionRecord& rDetection)
{
	int x, y, width, height;

	ImageCrop::GetRegion(rImage.cols, rImage.rows, rDetection.box, mSettings.cropPadding, x, y, width, height);

	if (width == 0 || height == 0)
	{
		LOG_WARNING(Log::Channel::Pipeline, "Animal box (%f, %f, %f, %f) covers no pixels, not classified.",
			rDetection.box.x, rDetection.box.y, rDetection.box.w, rDetection.box.h);
		return;
	}

	const ByteBuffer crop(ImageCrop::Crop(rImage, rDetection.box, mSettings.cropPadding));

	auto candidates = WithRetry(rDeadline, "Classification", [&]() { return mClassifier.Classify(crop, mSettings.classificationThreshold); });

	if (candidates.empty())
		return;

	const auto& rTop = candidates.front();

	// Unknown species get a stub row with only the scientific name.
	rDetection.speciesId = WithRetry(rDeadline, "Species", [&]() { return rStore.GetOrCreateSpeciesStub(rTop.scientificName); });
	rDetection.hasClassification = true;
	rDetection.classifierConfidence = rTop.confidence;
	rDetection.topCandidates = std::move(candidates);
}

ProcessOutcome Orchestrator::HandleFailure(Store& rStore, const Model::ImageRecord& rImage, const PipelineException& rError)
{
	if (rError.GetKind() == ErrorKind::ClaimLost)
	{
		LOG_WARNING(Log::Channel::Pipeline, "Abandoning \"%s\": %s", rImage.storageKey.c_str(), rError.GetText());
		return ProcessOutcome::Busy;
	}

	const String message(Utils::ToValidUtf8(String(PipelineException::KindToString(rError.GetKind())) + ": " + rError.GetText()));

	bool isRecorded;

	try
	{
		// The invocation deadline may be gone already, recording the failure gets its own budget.
		const Deadline deadline(mSettings.invocationTimeoutSec);

		isRecorded = WithRetry(deadline, "Fail", [&]() { return rStore.FailImage(rImage, message); });
	}
	catch (const Exception& e)
	{
		LOG_ERROR(Log::Channel::Pipeline, "\"%s\" stays in processing, failure not recorded: %s (%s)", rImage.storageKey.c_str(), e.GetText(), message.c_str());
		return ProcessOutcome::Deferred;
	}
	catch (const std::exception& e)
	{
		LOG_ERROR(Log::Channel::Pipeline, "\"%s\" stays in processing, failure not recorded: %s (%s)", rImage.storageKey.c_str(), e.what(), message.c_str());
		return ProcessOutcome::Deferred;
	}

	if (!isRecorded)
	{
		LOG_WARNING(Log::Channel::Pipeline, "\"%s\" is owned by another invocation, failure not recorded: %s", rImage.storageKey.c_str(), message.c_str());
		return ProcessOutcome::Busy;
	}

	LOG_ERROR(Log::Channel::Pipeline, "Failed \"%s\": %s", rImage.storageKey.c_str(), message.c_str());
	NotifyTracking(rImage.storageKey, TrackingStatus::DetectionFailed, message);

	return ProcessOutcome::Failed;
}

void Orchestrator::NotifyTracking(const String& rStorageKey, TrackingStatus status, const String& rDetail)
{
	try
	{
		mTracking.SetStatus(rStorageKey, status, rDetail);
	}
	catch (const Exception& e)
	{
		LOG_ERROR(Log::Channel::Tracking, "Status %s for \"%s\" not queued: %s", TrackingSink::ToString(status), rStorageKey.c_str(), e.GetText());
	}
	catch (const std::exception& e)
	{
		LOG_ERROR(Log::Channel::Tracking, "Status %s for \"%s\" not queued: %s", TrackingSink::ToString(status), rStorageKey.c_str(), e.what());
	}
}
