
#pragma once

#include "Storage/Store.hpp"

// In-process Store with the same guarantees as the MySQL schema: one row per storage key,
// detections cascade with their image, the detection count is the live row count and a
// completion batch is all-or-nothing. Thread safe.
class MemoryStore : public Store
{
public:
	enum class Operation : U8
	{
		FindImage,
		FindLocation,
		Claim,
		UpdateMetadata,
		SpeciesStub,
		Complete,
		Fail,
		Refresh
	};

	SpeciesId UpsertSpecies(const Model::SpeciesRecord& rSpecies) override;
	SpeciesId GetOrCreateSpeciesStub(const String& rScientificName) override;

	LocationId UpsertLocation(const Model::LocationRecord& rLocation) override;
	LocationId FindLocationId(const String& rCameraId) override;

	bool FindImage(const String& rStorageKey, Model::ImageRecord& rImage) override;
	ClaimResult ClaimImage(Model::ImageRecord& rImage, U32 leaseSec) override;
	void UpdateImageMetadata(const Model::ImageRecord& rImage) override;
	void CompleteImage(const Model::ImageRecord& rImage, const Vector<Model::DetectionRecord>& rDetections) override;
	bool FailImage(const Model::ImageRecord& rImage, const String& rErrorMessage) override;
	bool DeleteImage(ImageId id) override;
	void GetDetections(ImageId id, Vector<Model::DetectionRecord>& rDetections) override;

	void RefreshStatistics() override;
	void GetLocationStatistics(Vector<Model::LocationStatistics>& rList) override;
	void GetSpeciesStatistics(const Model::SpeciesStatisticsFilter& rFilter, Vector<Model::SpeciesStatistics>& rList) override;

	// The next "count" calls of "operation" throw a retryable Persistence error.
	void FailTransiently(Operation operation, U32 count);
	// Every call of "operation" throws a non-retryable Persistence error.
	void FailPermanently(Operation operation);
	// CompleteImage writes "count" detections of the batch and then fails (retryable), rolling the batch back.
	void InterruptCompletionAfter(size_t count);

	// Runs before "operation" executes, outside the store lock.
	void SetHook(Operation operation, std::function<void()> hook);

	// Another invocation took the claim over.
	void StealClaim(const String& rStorageKey);
	// Moves the claim time back, as if the claiming invocation started "seconds" earlier.
	void AgeClaim(const String& rStorageKey, U32 seconds);

	size_t GetNumImages();
	size_t GetNumDetections();
	size_t GetNumSpecies();
	U32 GetNumCalls(Operation operation);

	bool GetSpecies(const String& rScientificName, Model::SpeciesRecord& rSpecies);
	bool GetLocation(const String& rCameraId, Model::LocationRecord& rLocation);

private:

	struct ImageRow
	{
		Model::ImageRecord	record;
		TimePoint			claimedTP;
	};

	void BeginCall(Operation operation);

	ImageRow* FindRow(ImageId id);
	U32 CountDetections(ImageId id) const;

	std::mutex mMutex;

	SpeciesId	mSpeciesIdCounter = 0;
	LocationId	mLocationIdCounter = 0;
	ImageId		mImageIdCounter = 0;
	DetectionId	mDetectionIdCounter = 0;

	UnorderedMap<String, Model::SpeciesRecord>	mSpecies;
	UnorderedMap<String, Model::LocationRecord>	mLocations;
	UnorderedMap<String, ImageRow>				mImages;
	Vector<Model::DetectionRecord>				mDetections;

	Vector<Model::LocationStatistics>	mLocationStatistics;
	Vector<Model::SpeciesStatistics>	mSpeciesStatistics;

	UnorderedMap<U8, U32>					mTransientFailures;
	UnorderedMap<U8, bool>					mPermanentFailures;
	UnorderedMap<U8, U32>					mNumCalls;
	UnorderedMap<U8, std::function<void()>>	mHooks;

	bool	mIsCompletionInterrupted = false;
	size_t	mInterruptAfter = 0;
};

// Every worker shares the one thread safe MemoryStore.
class MemoryStoreProvider : public StoreProvider
{
public:
	MemoryStoreProvider(MemoryStore& rStore) : mStore(rStore) { }

	void Run(const std::function<void(Store&)>& rTask) override { rTask(mStore); }

private:

	MemoryStore& mStore;
};
