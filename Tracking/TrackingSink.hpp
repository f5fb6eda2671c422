
#pragma once

enum class TrackingStatus : U8
{
	Processing,
	DetectionComplete,
	DetectionFailed,
	Skipped
};

// Best-effort status side channel. Never part of the database transaction.
class TrackingSink
{
public:
	virtual ~TrackingSink() = default;

	virtual void SetStatus(const String& rStorageKey, TrackingStatus status, const String& rDetail) = 0;

	// "PROCESSING", "DETECTION_COMPLETE", "DETECTION_FAILED", "SKIPPED"
	static const char* ToString(TrackingStatus status);
};
