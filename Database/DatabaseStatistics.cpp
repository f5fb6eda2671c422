#include <PCH.hpp>

#include "Database.hpp"
#include "DatabaseQuery.hpp"
#include "DatabaseTables.hpp"
#include "DatabaseStatistics.hpp"

#include "Model/Records.hpp"

namespace Database
{
	namespace Statistics
	{
		namespace
		{
			namespace T = Table;

			String BuildLocationStatisticsSQL()
			{
				namespace LS = T::LocationStatistics;
				namespace L = T::Locations;
				namespace I = T::Images;
				namespace D = T::Detections;

				std::ostringstream ss;

				ss	<< "INSERT INTO " << LS::TableName
					<< " (" << LS::LocationId
					<< ',' << LS::CameraId
					<< ',' << LS::LocationName
					<< ',' << LS::Latitude
					<< ',' << LS::Longitude
					<< ',' << LS::TotalImages
					<< ',' << LS::TotalDetections
					<< ',' << LS::UniqueSpecies
					<< ',' << LS::UniqueAnimalSpecies
					<< ',' << LS::FirstCapture
					<< ',' << LS::LastCapture
					<< ',' << LS::AvgDetectionConfidence
					<< ',' << LS::AvgSpeciesConfidence
					<< ") SELECT l." << L::Id
					<< ",l." << L::CameraId
					<< ",l." << L::LocationName
					<< ",l." << L::Latitude
					<< ",l." << L::Longitude
					<< ",COUNT(DISTINCT i." << I::Id << ')'
					<< ",COUNT(d." << D::Id << ')'
					<< ",COUNT(DISTINCT d." << D::SpeciesId << ')'
					<< ",COUNT(DISTINCT CASE WHEN d." << D::Type << "='animal' THEN d." << D::SpeciesId << " END)"
					<< ",MIN(i." << I::CapturedAt << ')'
					<< ",MAX(i." << I::CapturedAt << ')'
					<< ",AVG(d." << D::DetectorConfidence << ')'
					<< ",AVG(d." << D::ClassifierConfidence << ')'
					<< " FROM " << L::TableName << " l"
					<< " LEFT JOIN " << I::TableName << " i ON i." << I::CameraId << "=l." << L::CameraId
					<< " LEFT JOIN " << D::TableName << " d ON d." << D::ImageId << "=i." << I::Id
					<< " GROUP BY l." << L::Id << ",l." << L::CameraId << ",l." << L::LocationName
					<< ",l." << L::Latitude << ",l." << L::Longitude;

				return ss.str();
			}

			String BuildSpeciesStatisticsSQL()
			{
				namespace SS = T::SpeciesStatistics;
				namespace S = T::Species;
				namespace I = T::Images;
				namespace D = T::Detections;

				std::ostringstream ss;

				ss	<< "INSERT INTO " << SS::TableName
					<< " (" << SS::SpeciesId
					<< ',' << SS::ScientificName
					<< ',' << SS::CommonName
					<< ',' << SS::ConservationStatus
					<< ',' << SS::TotalDetections
					<< ',' << SS::ImagesWithSpecies
					<< ',' << SS::UniqueLocations
					<< ',' << SS::FirstObserved
					<< ',' << SS::LastObserved
					<< ',' << SS::AvgConfidence
					<< ',' << SS::AvgDetectionSize
					<< ") SELECT s." << S::Id
					<< ",s." << S::ScientificName
					<< ",s." << S::CommonName
					<< ",s." << S::ConservationStatus
					<< ",COUNT(d." << D::Id << ')'
					<< ",COUNT(DISTINCT d." << D::ImageId << ')'
					<< ",COUNT(DISTINCT i." << I::CameraId << ')'
					<< ",MIN(i." << I::CapturedAt << ')'
					<< ",MAX(i." << I::CapturedAt << ')'
					<< ",AVG(d." << D::ClassifierConfidence << ')'
					<< ",AVG(d." << D::W << "*d." << D::H << ')'
					<< " FROM " << S::TableName << " s"
					<< " JOIN " << D::TableName << " d ON d." << D::SpeciesId << "=s." << S::Id
					<< " AND d." << D::Type << "='animal'"
					<< " JOIN " << I::TableName << " i ON i." << I::Id << "=d." << D::ImageId
					<< " GROUP BY s." << S::Id << ",s." << S::ScientificName
					<< ",s." << S::CommonName << ",s." << S::ConservationStatus;

				return ss.str();
			}
		}

		auto Refresh(Connection& rConnection) -> bool
		{
			static const String locationSQL(BuildLocationStatisticsSQL());
			static const String speciesSQL(BuildSpeciesStatisticsSQL());

			const auto startTP = std::chrono::steady_clock::now();

			// Readers keep the previous aggregates until the commit.
			Transaction transaction(rConnection, true);

			if (!transaction.IsStarted())
			{
				LOG_ERROR(Log::Channel::Stats, "Failed to start the statistics transaction!");
				return false;
			}

			const String statements[] =
			{
				String("DELETE FROM ") + Table::LocationStatistics::TableName,
				locationSQL,
				String("DELETE FROM ") + Table::SpeciesStatistics::TableName,
				speciesSQL,
			};

			for (const auto& rStatement : statements)
			{
				Query query(rConnection);

				if (!query.Exec(rStatement))
				{
					LOG_ERROR(Log::Channel::Stats, "Statistics refresh failed! (Reason: %s)", rConnection.GetLastError());
					return false;
				}
			}

			if (!transaction.Commit())
			{
				LOG_ERROR(Log::Channel::Stats, "Statistics refresh commit failed! (Reason: %s)", rConnection.GetLastError());
				return false;
			}

			const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - startTP).count();

			LOG_MESSAGE(Log::Channel::Stats, "Statistics refreshed. (%lld ms)", static_cast<long long> (ms));
			return true;
		}

		auto GetLocations(Connection& rConnection, Vector<Model::LocationStatistics>& rList) -> bool
		{
			using namespace Table::LocationStatistics;

			std::ostringstream ss;

			ss	<< "SELECT "	<< LocationId
				<< ','			<< CameraId
				<< ','			<< LocationName
				<< ','			<< Latitude
				<< ','			<< Longitude
				<< ','			<< TotalImages
				<< ','			<< TotalDetections
				<< ','			<< UniqueSpecies
				<< ','			<< FirstCapture
				<< ','			<< LastCapture
				<< ','			<< AvgDetectionConfidence
				<< ','			<< UniqueAnimalSpecies
				<< ','			<< AvgSpeciesConfidence
				<< " FROM "		<< TableName
				<< " ORDER BY "	<< TotalDetections << " DESC," << CameraId;

			Query query(rConnection);

			if (!query.Exec(ss.str()))
			{
				LOG_ERROR(Log::Channel::DB, "SQL query failed for \"Database::Statistics::GetLocations\"!");
				return false;
			}

			rList.reserve(query.NumResults());

			while (query.Next())
			{
				Model::LocationStatistics r;

				r.locationId		= query.ValueU32(0);
				r.cameraId			= query.ValueString(1);
				r.locationName		= query.ValueString(2);
				r.latitude			= query.ValueF64(3);
				r.longitude			= query.ValueF64(4);
				r.totalImages		= query.ValueU64(5);
				r.totalDetections	= query.ValueU64(6);
				r.uniqueSpecies		= query.ValueU32(7);
				r.firstCapture		= query.ValueString(8);
				r.lastCapture		= query.ValueString(9);
				r.avgDetectionConfidence = query.ValueF64(10);
				r.uniqueAnimalSpecies	= query.ValueU32(11);
				r.avgSpeciesConfidence	= query.ValueF64(12);

				rList.emplace_back(std::move(r));
			}

			return true;
		}

		auto GetSpecies(Connection& rConnection, const Model::SpeciesStatisticsFilter& rFilter, Vector<Model::SpeciesStatistics>& rList) -> bool
		{
			using namespace Table::SpeciesStatistics;

			std::ostringstream ss;

			ss	<< "SELECT "	<< SpeciesId
				<< ','			<< ScientificName
				<< ','			<< CommonName
				<< ','			<< ConservationStatus
				<< ','			<< TotalDetections
				<< ','			<< ImagesWithSpecies
				<< ','			<< UniqueLocations
				<< ','			<< FirstObserved
				<< ','			<< LastObserved
				<< ','			<< AvgConfidence
				<< ','			<< AvgDetectionSize
				<< " FROM "		<< TableName;

			if (rFilter.hasConservationStatus)
				ss << " WHERE " << ConservationStatus << "='" << Model::ToString(rFilter.conservationStatus) << '\'';

			ss	<< " ORDER BY "	<< TotalDetections << " DESC," << ScientificName
				<< " LIMIT "	<< rFilter.limit
				<< " OFFSET "	<< rFilter.offset;

			Query query(rConnection);

			if (!query.Exec(ss.str()))
			{
				LOG_ERROR(Log::Channel::DB, "SQL query failed for \"Database::Statistics::GetSpecies\"!");
				return false;
			}

			rList.reserve(query.NumResults());

			while (query.Next())
			{
				Model::SpeciesStatistics r;

				r.speciesId			= query.ValueU32(0);
				r.scientificName	= query.ValueString(1);
				r.commonName		= query.ValueString(2);

				if (!query.IsNull(3) && !Model::FromString(query.ValueString(3), r.conservationStatus))
					LOG_WARNING(Log::Channel::DB, "Unknown conservation status \"%s\"!", query.ValueString(3).c_str());

				r.totalDetections	= query.ValueU64(4);
				r.imagesWithSpecies	= query.ValueU64(5);
				r.uniqueLocations	= query.ValueU32(6);
				r.firstObserved		= query.ValueString(7);
				r.lastObserved		= query.ValueString(8);
				r.avgConfidence		= query.ValueF64(9);
				r.avgDetectionSize	= query.ValueF64(10);

				rList.emplace_back(std::move(r));
			}

			return true;
		}
	}
}
