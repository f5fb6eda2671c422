#include <PCH.hpp>

#include "Database.hpp"
#include "DatabaseQuery.hpp"
#include "DatabaseTables.hpp"
#include "DatabaseCatalog.hpp"

#include "Model/Records.hpp"

namespace Database
{
	namespace
	{
		// "`col`=COALESCE(VALUES(`col`),`col`)"
		void KeepUnlessGiven(std::ostringstream& ss, const char* pColumn)
		{
			ss << ',' << pColumn << "=COALESCE(VALUES(" << pColumn << ")," << pColumn << ')';
		}
	}

	namespace Species
	{
		auto Upsert(Connection& rConnection, const Model::SpeciesRecord& rSpecies) -> SpeciesId
		{
			using namespace Table::Species;

			const auto& rTaxonomy = rSpecies.taxonomy;
			const String status(Model::ToString(rSpecies.conservationStatus));

			std::ostringstream ss;

			ss	<< "INSERT INTO " << TableName
				<< " (" << ScientificName
				<< ',' << CommonName
				<< ',' << Kingdom
				<< ',' << Phylum
				<< ',' << Class
				<< ',' << Order
				<< ',' << Family
				<< ',' << Genus
				<< ',' << ConservationStatus
				<< ',' << Description
				<< ") VALUES ("
				<< rConnection.Quote(rSpecies.scientificName)
				<< ',' << rConnection.QuoteOrNull(rSpecies.commonName)
				<< ',' << rConnection.QuoteOrNull(rTaxonomy.kingdom)
				<< ',' << rConnection.QuoteOrNull(rTaxonomy.phylum)
				<< ',' << rConnection.QuoteOrNull(rTaxonomy.className)
				<< ',' << rConnection.QuoteOrNull(rTaxonomy.order)
				<< ',' << rConnection.QuoteOrNull(rTaxonomy.family)
				<< ',' << rConnection.QuoteOrNull(rTaxonomy.genus)
				<< ',' << rConnection.QuoteOrNull(status)
				<< ',' << rConnection.QuoteOrNull(rSpecies.description)
				<< ") ON DUPLICATE KEY UPDATE " << Id << "=LAST_INSERT_ID(" << Id << ')';

			KeepUnlessGiven(ss, CommonName);
			KeepUnlessGiven(ss, Kingdom);
			KeepUnlessGiven(ss, Phylum);
			KeepUnlessGiven(ss, Class);
			KeepUnlessGiven(ss, Order);
			KeepUnlessGiven(ss, Family);
			KeepUnlessGiven(ss, Genus);
			KeepUnlessGiven(ss, ConservationStatus);
			KeepUnlessGiven(ss, Description);

			Query query(rConnection);

			if (!query.Exec(ss.str()))
			{
				LOG_ERROR(Log::Channel::DB, "SQL query failed for \"Database::Species::Upsert\"! (%s)", rSpecies.scientificName.c_str());
				return InvalidSpeciesId;
			}

			return static_cast<SpeciesId> (query.LastInsertId());
		}

		auto GetOrCreateStub(Connection& rConnection, const String& rScientificName) -> SpeciesId
		{
			using namespace Table::Species;

			std::ostringstream ss;

			ss	<< "INSERT INTO "	<< TableName
				<< " ("				<< ScientificName
				<< ") VALUES ("		<< rConnection.Quote(rScientificName)
				<< ") ON DUPLICATE KEY UPDATE " << Id << "=LAST_INSERT_ID(" << Id << ')';

			Query query(rConnection);

			if (!query.Exec(ss.str()))
			{
				LOG_ERROR(Log::Channel::DB, "SQL query failed for \"Database::Species::GetOrCreateStub\"! (%s)", rScientificName.c_str());
				return InvalidSpeciesId;
			}

			// 1 - a new stub row, 0 - the species was already in the catalog.
			if (query.AffectedRows() == 1)
				LOG_MESSAGE(Log::Channel::DB, "New species stub: \"%s\"", rScientificName.c_str());

			return static_cast<SpeciesId> (query.LastInsertId());
		}
	}

	namespace Locations
	{
		auto Upsert(Connection& rConnection, const Model::LocationRecord& rLocation) -> LocationId
		{
			using namespace Table::Locations;

			std::ostringstream ss;

			ss	<< "INSERT INTO " << TableName
				<< " (" << CameraId
				<< ',' << LocationName
				<< ',' << Latitude
				<< ',' << Longitude
				<< ',' << Altitude
				<< ',' << Country
				<< ',' << StateProvince
				<< ',' << ProtectedArea
				<< ',' << HabitatType
				<< ',' << VegetationType
				<< ',' << CameraModel
				<< ',' << Notes
				<< ',' << IsActive
				<< ") VALUES ("
				<< rConnection.Quote(rLocation.cameraId)
				<< ',' << rConnection.QuoteOrNull(rLocation.locationName)
				<< ',' << FormatDecimal(rLocation.latitude, 8)
				<< ',' << FormatDecimal(rLocation.longitude, 8)
				<< ',' << (rLocation.hasAltitude ? FormatDecimal(rLocation.altitude, 2) : String("NULL"))
				<< ',' << rConnection.QuoteOrNull(rLocation.country)
				<< ',' << rConnection.QuoteOrNull(rLocation.stateProvince)
				<< ',' << rConnection.QuoteOrNull(rLocation.protectedArea)
				<< ',' << rConnection.QuoteOrNull(rLocation.habitatType)
				<< ',' << rConnection.QuoteOrNull(rLocation.vegetationType)
				<< ',' << rConnection.QuoteOrNull(rLocation.cameraModel)
				<< ',' << rConnection.QuoteOrNull(rLocation.notes)
				<< ',' << (rLocation.isActive ? 1 : 0)
				<< ") ON DUPLICATE KEY UPDATE " << Id << "=LAST_INSERT_ID(" << Id << ')'
				// Coordinates always follow the latest registration, the trigger re-derives "geom".
				<< ',' << Latitude << "=VALUES(" << Latitude << ')'
				<< ',' << Longitude << "=VALUES(" << Longitude << ')'
				<< ',' << IsActive << "=VALUES(" << IsActive << ')';

			KeepUnlessGiven(ss, LocationName);
			KeepUnlessGiven(ss, Altitude);
			KeepUnlessGiven(ss, Country);
			KeepUnlessGiven(ss, StateProvince);
			KeepUnlessGiven(ss, ProtectedArea);
			KeepUnlessGiven(ss, HabitatType);
			KeepUnlessGiven(ss, VegetationType);
			KeepUnlessGiven(ss, CameraModel);
			KeepUnlessGiven(ss, Notes);

			Query query(rConnection);

			if (!query.Exec(ss.str()))
			{
				LOG_ERROR(Log::Channel::DB, "SQL query failed for \"Database::Locations::Upsert\"! (%s)", rLocation.cameraId.c_str());
				return InvalidLocationId;
			}

			return static_cast<LocationId> (query.LastInsertId());
		}

		auto GetId(Connection& rConnection, const String& rCameraId, LocationId& rId) -> bool
		{
			using namespace Table::Locations;

			rId = InvalidLocationId;

			std::ostringstream ss;

			ss	<< "SELECT "	<< Id
				<< " FROM "		<< TableName
				<< " WHERE "	<< CameraId << '=' << rConnection.Quote(rCameraId);

			Query query(rConnection);

			if (!query.Exec(ss.str()))
			{
				LOG_ERROR(Log::Channel::DB, "SQL query failed for \"Database::Locations::GetId\"!");
				return false;
			}

			if (query.Next())
				rId = query.ValueU32(0);

			return true;
		}
	}
}
