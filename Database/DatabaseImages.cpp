#include <PCH.hpp>

#include "Database.hpp"
#include "DatabaseQuery.hpp"
#include "DatabaseTables.hpp"
#include "DatabaseImages.hpp"

#include "Model/Records.hpp"

#include <nlohmann/json.hpp>

namespace Database
{
	namespace
	{
		String ExifToJson(const Model::ImageMetadata& rMetadata)
		{
			if (rMetadata.exifTags.empty())
				return String();

			nlohmann::json json = nlohmann::json::object();

			for (const auto& r : rMetadata.exifTags)
				json[r.first] = r.second;

			return json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
		}

		String TopCandidatesToJson(const Vector<Model::SpeciesCandidate>& rCandidates)
		{
			if (rCandidates.empty())
				return String();

			nlohmann::json json = nlohmann::json::array();

			for (const auto& r : rCandidates)
			{
				json.push_back({
					{ "scientific_name", r.scientificName },
					{ "common_name", r.commonName },
					{ "confidence", r.confidence }
				});
			}

			return json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
		}

		void TopCandidatesFromJson(const String& rText, Vector<Model::SpeciesCandidate>& rCandidates)
		{
			if (rText.empty())
				return;

			auto json = nlohmann::json::parse(rText, nullptr, false);

			if (!json.is_array())
			{
				LOG_WARNING(Log::Channel::DB, "Malformed species_top5 value: %s", rText.c_str());
				return;
			}

			for (const auto& r : json)
			{
				Model::SpeciesCandidate candidate;

				candidate.scientificName = r.value("scientific_name", "");
				candidate.commonName = r.value("common_name", "");
				candidate.confidence = r.value("confidence", 0.0f);

				rCandidates.emplace_back(candidate);
			}
		}
	}

	namespace Images
	{
		auto InsertPending(Connection& rConnection, const Model::ImageRecord& rImage, bool& rIsInserted) -> bool
		{
			using namespace Table::Images;

			rIsInserted = false;

			// Registered cameras only, so the foreign key never rejects the row.
			const bool isRegistered = rImage.locationId != InvalidLocationId;

			std::ostringstream ss;

			ss	<< "INSERT INTO " << TableName
				<< " (" << Bucket
				<< ',' << Key
				<< ',' << FileName
				<< ',' << CameraId
				<< ',' << SourceCameraId
				<< ',' << LocationId
				<< ',' << ProjectName
				<< ',' << Client
				<< ',' << Country
				<< ',' << Status
				<< ") VALUES ("
				<< rConnection.Quote(rImage.bucket)
				<< ',' << rConnection.Quote(rImage.storageKey)
				<< ',' << rConnection.Quote(rImage.fileName)
				<< ',' << (isRegistered ? rConnection.Quote(rImage.sourceCameraId) : String("NULL"))
				<< ',' << rConnection.QuoteOrNull(rImage.sourceCameraId)
				<< ',' << (isRegistered ? std::to_string(rImage.locationId) : String("NULL"))
				<< ',' << rConnection.QuoteOrNull(rImage.projectName)
				<< ',' << rConnection.QuoteOrNull(rImage.client)
				<< ',' << rConnection.QuoteOrNull(rImage.country)
				<< ",'pending') ON DUPLICATE KEY UPDATE " << Key << '=' << Key;

			Query query(rConnection);

			if (!query.Exec(ss.str()))
			{
				LOG_ERROR(Log::Channel::DB, "SQL query failed for \"Database::Images::InsertPending\"! (%s)", rImage.storageKey.c_str());
				return false;
			}

			rIsInserted = query.AffectedRows() == 1;
			return true;
		}

		auto Claim(Connection& rConnection, const String& rStorageKey, const String& rClaimToken, U32 leaseSec, bool& rIsClaimed) -> bool
		{
			using namespace Table::Images;

			rIsClaimed = false;

			std::ostringstream ss;

			ss	<< "UPDATE "	<< TableName
				<< " SET "		<< Status << "='processing'"
				<< ','			<< ClaimToken << '=' << rConnection.Quote(rClaimToken)
				<< ','			<< ClaimedAt << "=NOW()"
				<< ','			<< ErrorMessage << "=NULL"
				<< " WHERE "	<< Key << '=' << rConnection.Quote(rStorageKey)
				<< " AND ("		<< Status << "='pending' OR (" << Status << "='processing' AND ("
				<< ClaimedAt << " IS NULL OR " << ClaimedAt << "<NOW()-INTERVAL " << leaseSec << " SECOND)))";

			Query query(rConnection);

			if (!query.Exec(ss.str()))
			{
				LOG_ERROR(Log::Channel::DB, "SQL query failed for \"Database::Images::Claim\"! (%s)", rStorageKey.c_str());
				return false;
			}

			rIsClaimed = query.AffectedRows() == 1;
			return true;
		}

		auto Get(Connection& rConnection, const String& rStorageKey, Model::ImageRecord& rImage, bool& rIsFound) -> bool
		{
			using namespace Table::Images;

			rIsFound = false;

			std::ostringstream ss;

			ss	<< "SELECT "	<< Id				// 0
				<< ','			<< Bucket			// 1
				<< ','			<< Key				// 2
				<< ','			<< FileName			// 3
				<< ','			<< FileSize			// 4
				<< ','			<< FileHash			// 5
				<< ','			<< Width			// 6
				<< ','			<< Height			// 7
				<< ','			<< Format			// 8
				<< ','			<< SourceCameraId	// 9
				<< ','			<< LocationId		// 10
				<< ','			<< CapturedAt		// 11
				<< ','			<< Status			// 12
				<< ','			<< ErrorMessage		// 13
				<< ','			<< ClaimToken		// 14
				<< ','			<< DetectionCount	// 15
				<< ','			<< HasDetections	// 16
				<< ','			<< ProjectName		// 17
				<< ','			<< Client			// 18
				<< ','			<< Country			// 19
				<< ','			<< CameraMake		// 20
				<< ','			<< CameraModel		// 21
				<< ','			<< GpsLatitude		// 22
				<< ','			<< GpsLongitude		// 23
				<< ','			<< Brightness		// 24
				<< ','			<< Sharpness		// 25
				<< ','			<< Quality			// 26
				<< " FROM "		<< TableName
				<< " WHERE "	<< Key << '=' << rConnection.Quote(rStorageKey);

			Query query(rConnection);

			if (!query.Exec(ss.str()))
			{
				LOG_ERROR(Log::Channel::DB, "SQL query failed for \"Database::Images::Get\"! (%s)", rStorageKey.c_str());
				return false;
			}

			if (!query.Next())
				return true;

			rIsFound = true;

			rImage.id				= query.ValueU64(0);
			rImage.bucket			= query.ValueString(1);
			rImage.storageKey		= query.ValueString(2);
			rImage.fileName			= query.ValueString(3);
			rImage.fileSize			= query.ValueU64(4);
			rImage.fileHash			= query.ValueString(5);
			rImage.metadata.width	= query.ValueU32(6);
			rImage.metadata.height	= query.ValueU32(7);
			rImage.metadata.format	= query.ValueString(8);
			rImage.sourceCameraId	= query.ValueString(9);
			rImage.locationId		= query.ValueU32(10);

			rImage.metadata.hasCapturedAt = !query.IsNull(11);
			rImage.metadata.capturedAt = query.ValueString(11);

			if (!Model::FromString(query.ValueString(12), rImage.status))
				LOG_WARNING(Log::Channel::DB, "Unknown processing status \"%s\"!", query.ValueString(12).c_str());

			rImage.errorMessage		= query.ValueString(13);
			rImage.claimToken		= query.ValueString(14);
			rImage.detectionCount	= query.ValueU32(15);
			rImage.hasDetections	= query.ValueBool(16);
			rImage.projectName		= query.ValueString(17);
			rImage.client			= query.ValueString(18);
			rImage.country			= query.ValueString(19);
			rImage.metadata.cameraMake	= query.ValueString(20);
			rImage.metadata.cameraModel	= query.ValueString(21);

			rImage.metadata.hasGps = !query.IsNull(22) && !query.IsNull(23);
			rImage.metadata.gpsLatitude = query.ValueF64(22);
			rImage.metadata.gpsLongitude = query.ValueF64(23);

			rImage.metadata.brightness	= static_cast<F32> (query.ValueF64(24));
			rImage.metadata.sharpness	= static_cast<F32> (query.ValueF64(25));
			rImage.metadata.quality		= static_cast<F32> (query.ValueF64(26));

			return true;
		}

		auto UpdateMetadata(Connection& rConnection, const Model::ImageRecord& rImage) -> bool
		{
			using namespace Table::Images;

			const auto& rMeta = rImage.metadata;

			std::ostringstream ss;

			ss	<< "UPDATE "	<< TableName
				<< " SET "		<< FileSize << '=' << rImage.fileSize
				<< ','			<< FileHash << '=' << rConnection.QuoteOrNull(rImage.fileHash)
				<< ','			<< Width << '=' << rMeta.width
				<< ','			<< Height << '=' << rMeta.height
				<< ','			<< Format << '=' << rConnection.QuoteOrNull(rMeta.format)
				<< ','			<< CapturedAt << '=' << (rMeta.hasCapturedAt ? rConnection.Quote(rMeta.capturedAt) : String("NULL"))
				<< ','			<< ExifData << '=' << rConnection.QuoteOrNull(ExifToJson(rMeta))
				<< ','			<< GpsLatitude << '=' << (rMeta.hasGps ? FormatDecimal(rMeta.gpsLatitude, 8) : String("NULL"))
				<< ','			<< GpsLongitude << '=' << (rMeta.hasGps ? FormatDecimal(rMeta.gpsLongitude, 8) : String("NULL"))
				<< ','			<< GpsAltitude << '=' << (rMeta.hasGpsAltitude ? FormatDecimal(rMeta.gpsAltitude, 2) : String("NULL"))
				<< ','			<< CameraMake << '=' << rConnection.QuoteOrNull(rMeta.cameraMake)
				<< ','			<< CameraModel << '=' << rConnection.QuoteOrNull(rMeta.cameraModel)
				<< ','			<< Brightness << '=' << FormatDecimal(rMeta.brightness, 4)
				<< ','			<< Sharpness << '=' << FormatDecimal(rMeta.sharpness, 4)
				<< ','			<< Quality << '=' << FormatDecimal(rMeta.quality, 4)
				<< " WHERE "	<< Id << '=' << rImage.id
				<< " AND "		<< ClaimToken << '=' << rConnection.Quote(rImage.claimToken)
				<< " AND "		<< Status << "='processing'";

			Query query(rConnection);

			if (!query.Exec(ss.str()))
			{
				LOG_ERROR(Log::Channel::DB, "SQL query failed for \"Database::Images::UpdateMetadata\"! (Image id: %" PRIu64 ")", rImage.id);
				return false;
			}

			return true;
		}

		auto LockClaim(Connection& rConnection, ImageId id, const String& rClaimToken, bool& rIsOwned) -> bool
		{
			using namespace Table::Images;

			rIsOwned = false;

			std::ostringstream ss;

			ss	<< "SELECT "	<< Status
				<< ','			<< ClaimToken
				<< " FROM "		<< TableName
				<< " WHERE "	<< Id << '=' << id
				<< " FOR UPDATE";

			Query query(rConnection);

			if (!query.Exec(ss.str()))
			{
				LOG_ERROR(Log::Channel::DB, "SQL query failed for \"Database::Images::LockClaim\"! (Image id: %" PRIu64 ")", id);
				return false;
			}

			if (query.Next())
				rIsOwned = query.ValueString(0) == "processing" && query.ValueString(1) == rClaimToken;

			return true;
		}

		auto MarkCompleted(Connection& rConnection, ImageId id) -> bool
		{
			using namespace Table::Images;

			std::ostringstream ss;

			ss	<< "UPDATE "	<< TableName
				<< " SET "		<< Status << "='completed'"
				<< ','			<< ProcessedAt << "=NOW()"
				<< ','			<< ErrorMessage << "=NULL"
				<< ','			<< ClaimToken << "=NULL"
				<< " WHERE "	<< Id << '=' << id;

			Query query(rConnection);

			if (!query.Exec(ss.str()))
			{
				LOG_ERROR(Log::Channel::DB, "SQL query failed for \"Database::Images::MarkCompleted\"! (Image id: %" PRIu64 ")", id);
				return false;
			}

			return true;
		}

		auto MarkFailed(Connection& rConnection, ImageId id, const String& rClaimToken, const String& rErrorMessage, bool& rIsOwned) -> bool
		{
			using namespace Table::Images;

			rIsOwned = false;

			std::ostringstream ss;

			ss	<< "UPDATE "	<< TableName
				<< " SET "		<< Status << "='failed'"
				<< ','			<< ProcessedAt << "=NOW()"
				<< ','			<< ErrorMessage << '=' << rConnection.Quote(rErrorMessage)
				<< ','			<< ClaimToken << "=NULL"
				<< " WHERE "	<< Id << '=' << id
				<< " AND "		<< ClaimToken << '=' << rConnection.Quote(rClaimToken)
				<< " AND "		<< Status << "='processing'";

			Query query(rConnection);

			if (!query.Exec(ss.str()))
			{
				LOG_ERROR(Log::Channel::DB, "SQL query failed for \"Database::Images::MarkFailed\"! (Image id: %" PRIu64 ")", id);
				return false;
			}

			rIsOwned = query.AffectedRows() == 1;
			return true;
		}

		auto Delete(Connection& rConnection, ImageId id, bool& rIsDeleted) -> bool
		{
			using namespace Table::Images;

			std::ostringstream ss;

			ss << "DELETE FROM " << TableName << " WHERE " << Id << '=' << id;

			Query query(rConnection);

			if (!query.Exec(ss.str()))
			{
				LOG_ERROR(Log::Channel::DB, "SQL query failed for \"Database::Images::Delete\"! (Image id: %" PRIu64 ")", id);
				return false;
			}

			rIsDeleted = query.AffectedRows() == 1;
			return true;
		}
	}

	namespace Detections
	{
		auto InsertBatch(Connection& rConnection, ImageId imageId, const Vector<Model::DetectionRecord>& rDetections) -> bool
		{
			using namespace Table::Detections;

			if (rDetections.empty())
				return true;

			std::ostringstream ss;

			ss	<< "INSERT INTO " << TableName
				<< " (" << ImageId
				<< ',' << SpeciesId
				<< ',' << Type
				<< ',' << X
				<< ',' << Y
				<< ',' << W
				<< ',' << H
				<< ',' << DetectorConfidence
				<< ',' << ClassifierConfidence
				<< ',' << OverallConfidence
				<< ',' << Top5
				<< ',' << IsVerified
				<< ',' << IsFalsePositive
				<< ',' << NeedsReview
				<< ") VALUES ";

			for (size_t i = 0; i < rDetections.size(); ++i)
			{
				const auto& r = rDetections[i];

				if (i != 0)
					ss << ',';

				ss	<< '(' << imageId
					<< ',' << (r.speciesId != InvalidSpeciesId ? std::to_string(r.speciesId) : String("NULL"))
					<< ",'" << Model::ToString(r.type) << '\''
					<< ',' << FormatDecimal(r.box.x, 6)
					<< ',' << FormatDecimal(r.box.y, 6)
					<< ',' << FormatDecimal(r.box.w, 6)
					<< ',' << FormatDecimal(r.box.h, 6)
					<< ',' << FormatDecimal(r.detectorConfidence, 4)
					<< ',' << (r.hasClassification ? FormatDecimal(r.classifierConfidence, 4) : String("NULL"))
					<< ',' << FormatDecimal(r.GetOverallConfidence(), 4)
					<< ',' << rConnection.QuoteOrNull(TopCandidatesToJson(r.topCandidates))
					<< ',' << (r.isVerified ? 1 : 0)
					<< ',' << (r.isFalsePositive ? 1 : 0)
					<< ',' << (r.needsReview ? 1 : 0)
					<< ')';
			}

			Query query(rConnection);

			if (!query.Exec(ss.str()))
			{
				LOG_ERROR(Log::Channel::DB, "SQL query failed for \"Database::Detections::InsertBatch\"! (Image id: %" PRIu64 ", Rows: %zu)", imageId, rDetections.size());
				return false;
			}

			return true;
		}

		auto GetByImage(Connection& rConnection, ImageId imageId, Vector<Model::DetectionRecord>& rDetections) -> bool
		{
			namespace D = Table::Detections;
			namespace S = Table::Species;

			std::ostringstream ss;

			ss	<< "SELECT d." << D::Id					// 0
				<< ",d."	<< D::SpeciesId				// 1
				<< ",d."	<< D::Type						// 2
				<< ",d."	<< D::X						// 3
				<< ",d."	<< D::Y						// 4
				<< ",d."	<< D::W						// 5
				<< ",d."	<< D::H						// 6
				<< ",d."	<< D::DetectorConfidence		// 7
				<< ",d."	<< D::ClassifierConfidence		// 8
				<< ",d."	<< D::Top5						// 9
				<< ",d."	<< D::IsVerified				// 10
				<< ",d."	<< D::IsFalsePositive			// 11
				<< ",d."	<< D::NeedsReview				// 12
				<< ",s."	<< S::ScientificName				// 13
				<< ",s."	<< S::CommonName					// 14
				<< " FROM "	<< D::TableName << " d"
				<< " LEFT JOIN " << S::TableName << " s ON s." << S::Id << "=d." << D::SpeciesId
				<< " WHERE d." << D::ImageId << '=' << imageId
				<< " ORDER BY d." << D::DetectorConfidence << " DESC, d." << D::Id;

			Query query(rConnection);

			if (!query.Exec(ss.str()))
			{
				LOG_ERROR(Log::Channel::DB, "SQL query failed for \"Database::D::GetByImage\"! (Image id: %" PRIu64 ")", imageId);
				return false;
			}

			rDetections.reserve(query.NumResults());

			while (query.Next())
			{
				Model::DetectionRecord r;

				r.id		= query.ValueU64(0);
				r.imageId	= imageId;
				r.speciesId	= query.ValueU32(1);

				if (!Model::FromString(query.ValueString(2), r.type))
					LOG_WARNING(Log::Channel::DB, "Unknown detection type \"%s\"!", query.ValueString(2).c_str());

				r.box.x = static_cast<F32> (query.ValueF64(3));
				r.box.y = static_cast<F32> (query.ValueF64(4));
				r.box.w = static_cast<F32> (query.ValueF64(5));
				r.box.h = static_cast<F32> (query.ValueF64(6));

				r.detectorConfidence = static_cast<F32> (query.ValueF64(7));
				r.hasClassification = !query.IsNull(8);
				r.classifierConfidence = static_cast<F32> (query.ValueF64(8));

				TopCandidatesFromJson(query.ValueString(9), r.topCandidates);

				r.isVerified		= query.ValueBool(10);
				r.isFalsePositive	= query.ValueBool(11);
				r.needsReview		= query.ValueBool(12);
				r.scientificName	= query.ValueString(13);
				r.commonName		= query.ValueString(14);

				rDetections.emplace_back(std::move(r));
			}

			return true;
		}
	}
}
