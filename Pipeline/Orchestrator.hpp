
#pragma once

#include "Pipeline/RetryPolicy.hpp"
#include "Pipeline/UploadNotice.hpp"
#include "Storage/Store.hpp"
#include "Tracking/TrackingSink.hpp"

namespace cv { class Mat; }

class Detector;
class Classifier;
class ImageSource;
class StorageKeyParser;

struct PipelineSettings
{
	F32			detectionThreshold = 0.6f;
	F32			classificationThreshold = 0.5f;
	U32			invocationTimeoutSec = 0;
	F32			cropPadding = 0.1f;
	RetryPolicy	retry;
};

enum class ProcessOutcome : U8
{
	Completed,
	Failed,
	Skipped,	// Completed or failed by an earlier delivery.
	Busy,		// Another invocation owns the image.
	Deferred,	// Nothing could be recorded, the image stays pending / processing for a later delivery.
	Rejected	// Unusable storage key, nothing written.
};

const char* ToString(ProcessOutcome outcome);

// Runs one uploaded image through extraction, detection, classification and persistence.
//
// The store's claim makes a run exclusive per storage key: an image is processed at most once to a
// terminal state and all of its detections become visible in one transaction. Transient failures are
// retried with backoff inside the invocation timeout; everything else ends the image as failed.
// Holds no per-image state, one instance serves all workers.
class Orchestrator
{
public:
	Orchestrator(const PipelineSettings& rSettings, Detector& rDetector, Classifier& rClassifier, ImageSource& rSource, TrackingSink& rTracking);

	ProcessOutcome Process(Store& rStore, const UploadNotice& rNotice);

	auto GetSettings() const -> const PipelineSettings& { return mSettings; }

private:

	// Calls "f" until it succeeds, a non-retryable PipelineException is thrown, the attempts run out
	// or the deadline passes (ErrorKind::Timeout).
	template<typename T>
	auto WithRetry(const Deadline& rDeadline, const char* pStage, T&& f) -> decltype(f());

	bool Claim(Store& rStore, const UploadNotice& rNotice, const StorageKeyParser& rKey, const Deadline& rDeadline, Model::ImageRecord& rImage, ProcessOutcome& rOutcome);

	void RunStages(Store& rStore, const UploadNotice& rNotice, const StorageKeyParser& rKey, const Deadline& rDeadline,
		Model::ImageRecord& rImage, Vector<Model::DetectionRecord>& rDetections);

	void ClassifyAnimal(Store& rStore, const cv::Mat& rImage, const Deadline& rDeadline, Model::DetectionRecord& rDetection);

	ProcessOutcome HandleFailure(Store& rStore, const Model::ImageRecord& rImage, const PipelineException& rError);

	void NotifyTracking(const String& rStorageKey, TrackingStatus status, const String& rDetail);

private:

	const PipelineSettings mSettings;

	Detector&		mDetector;
	Classifier&		mClassifier;
	ImageSource&	mSource;
	TrackingSink&	mTracking;
};
