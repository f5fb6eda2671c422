
#pragma once

namespace Model { struct ImageRecord; struct DetectionRecord; }

namespace Database
{
	namespace Images
	{
		// No-op when the storage key already has a row ("rIsInserted" is false then).
		bool InsertPending(Connection& rConnection, const Model::ImageRecord& rImage, bool& rIsInserted);

		// pending -> processing, or takes over a processing run whose claim is older than "leaseSec".
		bool Claim(Connection& rConnection, const String& rStorageKey, const String& rClaimToken, U32 leaseSec, bool& rIsClaimed);

		bool Get(Connection& rConnection, const String& rStorageKey, Model::ImageRecord& rImage, bool& rIsFound);

		// Only touches the row while "rImage.claimToken" still owns it.
		bool UpdateMetadata(Connection& rConnection, const Model::ImageRecord& rImage);

		// Row lock (SELECT ... FOR UPDATE) for the rest of the current transaction.
		bool LockClaim(Connection& rConnection, ImageId id, const String& rClaimToken, bool& rIsOwned);

		bool MarkCompleted(Connection& rConnection, ImageId id);
		bool MarkFailed(Connection& rConnection, ImageId id, const String& rClaimToken, const String& rErrorMessage, bool& rIsOwned);

		// Detections are removed by the ON DELETE CASCADE foreign key.
		bool Delete(Connection& rConnection, ImageId id, bool& rIsDeleted);
	}

	namespace Detections
	{
		// One multi-row INSERT. The caller owns the transaction.
		bool InsertBatch(Connection& rConnection, ImageId imageId, const Vector<Model::DetectionRecord>& rDetections);

		// Ordered by detector confidence, descending.
		bool GetByImage(Connection& rConnection, ImageId imageId, Vector<Model::DetectionRecord>& rDetections);
	}
}
