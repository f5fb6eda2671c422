
#pragma once

#include "Storage/Store.hpp"

namespace Database { class Connection; class ConnectionPool; }

// Store on top of one MySQL connection. Not thread safe, one instance per worker.
class MySQLStore : public Store
{
public:
	MySQLStore(Database::Connection& rConnection);

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

private:

	PipelineException MakeError(const char* pOperation) const;

	Database::Connection& mConnection;
};

class MySQLStoreProvider : public StoreProvider
{
public:
	MySQLStoreProvider(Database::ConnectionPool& rPool);

	void Run(const std::function<void(Store&)>& rTask) override;

private:

	Database::ConnectionPool& mPool;
};
