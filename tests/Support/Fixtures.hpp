
#pragma once

#include "Inference/Detector.hpp"
#include "Inference/Classifier.hpp"
#include "Pipeline/ImageSource.hpp"
#include "Tracking/TrackingSink.hpp"

// Returns a fixed set of objects. Thread safe.
class FixtureDetector : public Detector
{
public:
	const char* GetName() const override { return "FixtureDetector"; }

	void SetObjects(const Vector<DetectedObject>& rObjects);
	void AddObject(DetectionType type, F32 confidence, F32 x = 0.25f, F32 y = 0.25f, F32 w = 0.5f, F32 h = 0.5f);

	// The next "count" calls throw AdapterTransient.
	void FailTransiently(U32 count);
	// Every call throws AdapterPermanent.
	void FailPermanently();

	U32 GetNumCalls() const { return mNumCalls.load(); }

protected:

	void Run(const ByteBuffer& rImage, F32 threshold, Vector<DetectedObject>& rObjects) override;

private:

	std::mutex				mMutex;
	Vector<DetectedObject>	mObjects;
	U32						mTransientFailures = 0;
	bool					mIsPermanentFailure = false;
	std::atomic<U32>		mNumCalls{ 0 };
};

// Answers every crop with the same candidates. Thread safe.
class FixtureClassifier : public Classifier
{
public:
	const char* GetName() const override { return "FixtureClassifier"; }

	void AddCandidate(const String& rScientificName, const String& rCommonName, F32 confidence);

	void FailTransiently(U32 count);

	U32 GetNumCalls() const { return mNumCalls.load(); }

protected:

	void Run(const ByteBuffer& rCrop, F32 threshold, Vector<Model::SpeciesCandidate>& rCandidates) override;

private:

	std::mutex						mMutex;
	Vector<Model::SpeciesCandidate>	mCandidates;
	U32								mTransientFailures = 0;
	std::atomic<U32>				mNumCalls{ 0 };
};

// Objects kept in memory by "bucket/key". A missing object reads as AdapterTransient, like an unreadable file.
class MemoryImageSource : public ImageSource
{
public:
	void Add(const String& rBucket, const String& rKey, const ByteBuffer& rBytes);

	void Load(const UploadNotice& rNotice, ByteBuffer& rBytes) override;

	// Blocks every Load until Release is called.
	void Hold();
	void Release();

private:

	std::mutex					mMutex;
	std::condition_variable		mCondition;
	bool						mIsHeld = false;

	UnorderedMap<String, ByteBuffer> mObjects;
};

class RecordingTrackingSink : public TrackingSink
{
public:
	struct Entry
	{
		String			storageKey;
		TrackingStatus	status;
		String			detail;
	};

	void SetStatus(const String& rStorageKey, TrackingStatus status, const String& rDetail) override;

	void SetFailing(bool isFailing);

	Vector<Entry> GetEntries();
	Vector<TrackingStatus> GetStatuses(const String& rStorageKey);

private:

	std::mutex		mMutex;
	Vector<Entry>	mEntries;
	bool			mIsFailing = false;
};

namespace TestImage
{
	// Textured BGR test picture encoded as "ext" (".jpg", ".png", ...).
	ByteBuffer Make(int width, int height, const String& rExtension = ".jpg");

	// Re-encodes "rBytes" with an EXIF block of camera trap tags.
	ByteBuffer AddExif(const ByteBuffer& rBytes, const String& rMake = "Browning");
}
