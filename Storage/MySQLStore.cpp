#include <PCH.hpp>

#include "Storage/MySQLStore.hpp"

#include "Database/Database.hpp"
#include "Database/DatabaseConnectionPool.hpp"
#include "Database/DatabaseCatalog.hpp"
#include "Database/DatabaseImages.hpp"
#include "Database/DatabaseStatistics.hpp"

MySQLStore::MySQLStore(Database::Connection& rConnection)
	: mConnection(rConnection)
{ }

PipelineException MySQLStore::MakeError(const char* pOperation) const
{
	const auto errorCode = mConnection.GetLastErrorCode();

	return PipelineException(ErrorKind::Persistence, Database::IsTransientError(errorCode),
		"%s failed: %s (MySQL error %u)", pOperation, mConnection.GetLastError(), errorCode);
}

SpeciesId MySQLStore::UpsertSpecies(const Model::SpeciesRecord& rSpecies)
{
	const auto id = Database::Species::Upsert(mConnection, rSpecies);

	if (id == InvalidSpeciesId)
		throw MakeError("Species upsert");

	return id;
}

SpeciesId MySQLStore::GetOrCreateSpeciesStub(const String& rScientificName)
{
	const auto id = Database::Species::GetOrCreateStub(mConnection, rScientificName);

	if (id == InvalidSpeciesId)
		throw MakeError("Species stub insert");

	return id;
}

LocationId MySQLStore::UpsertLocation(const Model::LocationRecord& rLocation)
{
	const auto id = Database::Locations::Upsert(mConnection, rLocation);

	if (id == InvalidLocationId)
		throw MakeError("Location upsert");

	return id;
}

LocationId MySQLStore::FindLocationId(const String& rCameraId)
{
	LocationId id;

	if (!Database::Locations::GetId(mConnection, rCameraId, id))
		throw MakeError("Location lookup");

	return id;
}

bool MySQLStore::FindImage(const String& rStorageKey, Model::ImageRecord& rImage)
{
	bool isFound;

	if (!Database::Images::Get(mConnection, rStorageKey, rImage, isFound))
		throw MakeError("Image lookup");

	return isFound;
}

ClaimResult MySQLStore::ClaimImage(Model::ImageRecord& rImage, U32 leaseSec)
{
	bool isInserted;

	if (!Database::Images::InsertPending(mConnection, rImage, isInserted))
		throw MakeError("Image insert");

	if (isInserted)
		LOG_DEBUG(Log::Channel::DB, "New image row: %s", rImage.storageKey.c_str());

	const String claimToken(Storage::NewClaimToken());

	bool isClaimed;

	if (!Database::Images::Claim(mConnection, rImage.storageKey, claimToken, leaseSec, isClaimed))
		throw MakeError("Image claim");

	Model::ImageRecord stored;

	if (!FindImage(rImage.storageKey, stored))
		throw PipelineException(ErrorKind::Persistence, true, "Image row \"%s\" vanished while claiming!", rImage.storageKey.c_str());

	if (!isClaimed)
	{
		rImage.id = stored.id;
		rImage.status = stored.status;

		return Model::IsTerminal(stored.status) ? ClaimResult::AlreadyTerminal : ClaimResult::OwnedByOther;
	}

	rImage = stored;
	rImage.claimToken = claimToken;

	return ClaimResult::Claimed;
}

void MySQLStore::UpdateImageMetadata(const Model::ImageRecord& rImage)
{
	if (!Database::Images::UpdateMetadata(mConnection, rImage))
		throw MakeError("Image metadata update");
}

void MySQLStore::CompleteImage(const Model::ImageRecord& rImage, const Vector<Model::DetectionRecord>& rDetections)
{
	Database::Transaction transaction(mConnection);

	if (!transaction.IsStarted())
		throw MakeError("Begin transaction");

	bool isOwned;

	if (!Database::Images::LockClaim(mConnection, rImage.id, rImage.claimToken, isOwned))
		throw MakeError("Image lock");

	if (!isOwned)
		throw PipelineException(ErrorKind::ClaimLost, false, "Image \"%s\" is no longer claimed by this run!", rImage.storageKey.c_str());

	if (!Database::Detections::InsertBatch(mConnection, rImage.id, rDetections))
		throw MakeError("Detections insert");

	if (!Database::Images::MarkCompleted(mConnection, rImage.id))
		throw MakeError("Image completion");

	if (!transaction.Commit())
		throw MakeError("Commit");
}

bool MySQLStore::FailImage(const Model::ImageRecord& rImage, const String& rErrorMessage)
{
	bool isOwned;

	if (!Database::Images::MarkFailed(mConnection, rImage.id, rImage.claimToken, rErrorMessage, isOwned))
		throw MakeError("Image failure update");

	return isOwned;
}

bool MySQLStore::DeleteImage(ImageId id)
{
	bool isDeleted;

	if (!Database::Images::Delete(mConnection, id, isDeleted))
		throw MakeError("Image delete");

	return isDeleted;
}

void MySQLStore::GetDetections(ImageId id, Vector<Model::DetectionRecord>& rDetections)
{
	if (!Database::Detections::GetByImage(mConnection, id, rDetections))
		throw MakeError("Detections lookup");
}

void MySQLStore::RefreshStatistics()
{
	if (!Database::Statistics::Refresh(mConnection))
		throw PipelineException(ErrorKind::Persistence, true, "Statistics refresh failed!");
}

void MySQLStore::GetLocationStatistics(Vector<Model::LocationStatistics>& rList)
{
	if (!Database::Statistics::GetLocations(mConnection, rList))
		throw MakeError("Location statistics lookup");
}

void MySQLStore::GetSpeciesStatistics(const Model::SpeciesStatisticsFilter& rFilter, Vector<Model::SpeciesStatistics>& rList)
{
	if (!Database::Statistics::GetSpecies(mConnection, rFilter, rList))
		throw MakeError("Species statistics lookup");
}

MySQLStoreProvider::MySQLStoreProvider(Database::ConnectionPool& rPool)
	: mPool(rPool)
{ }

void MySQLStoreProvider::Run(const std::function<void(Store&)>& rTask)
{
	auto connection = mPool.Acquire();

	MySQLStore store(*connection);

	rTask(store);
}
