
#pragma once

#include "Model/Records.hpp"

enum class ClaimResult : U8
{
	Claimed,			// This invocation owns the image now.
	AlreadyTerminal,	// Completed or failed earlier.
	OwnedByOther		// Another invocation is processing it.
};

// Relational store of the catalog, images and detections.
// Every failure is thrown as PipelineException with ErrorKind::Persistence (or ClaimLost).
class Store
{
public:
	virtual ~Store() = default;

	virtual SpeciesId UpsertSpecies(const Model::SpeciesRecord& rSpecies) = 0;
	virtual SpeciesId GetOrCreateSpeciesStub(const String& rScientificName) = 0;

	virtual LocationId UpsertLocation(const Model::LocationRecord& rLocation) = 0;
	// InvalidLocationId for an unregistered camera.
	virtual LocationId FindLocationId(const String& rCameraId) = 0;

	virtual bool FindImage(const String& rStorageKey, Model::ImageRecord& rImage) = 0;

	// Creates the pending row when the key is new, then moves it to processing with a fresh claim token.
	// On success "rImage" is reloaded from the store (id, status, claim token).
	virtual ClaimResult ClaimImage(Model::ImageRecord& rImage, U32 leaseSec) = 0;

	virtual void UpdateImageMetadata(const Model::ImageRecord& rImage) = 0;

	// Inserts all detections and marks the image completed in one transaction.
	virtual void CompleteImage(const Model::ImageRecord& rImage, const Vector<Model::DetectionRecord>& rDetections) = 0;

	// False when the claim was lost and the row was left untouched.
	virtual bool FailImage(const Model::ImageRecord& rImage, const String& rErrorMessage) = 0;

	virtual bool DeleteImage(ImageId id) = 0;

	virtual void GetDetections(ImageId id, Vector<Model::DetectionRecord>& rDetections) = 0;

	virtual void RefreshStatistics() = 0;
	virtual void GetLocationStatistics(Vector<Model::LocationStatistics>& rList) = 0;
	virtual void GetSpeciesStatistics(const Model::SpeciesStatisticsFilter& rFilter, Vector<Model::SpeciesStatistics>& rList) = 0;
};

// Hands a worker exclusive use of a Store for the duration of one task.
class StoreProvider
{
public:
	virtual ~StoreProvider() = default;

	virtual void Run(const std::function<void(Store&)>& rTask) = 0;
};

namespace Storage
{
	// 32 random hex characters.
	String NewClaimToken();
}
