
#pragma once

namespace Model { struct SpeciesRecord; struct LocationRecord; }

namespace Database
{
	namespace Species
	{
		// Insert or update by scientific name. Empty descriptive fields never overwrite stored ones.
		// Returns the row id, or InvalidSpeciesId on failure.
		SpeciesId Upsert(Connection& rConnection, const Model::SpeciesRecord& rSpecies);

		// Row with only the scientific name populated, unless the species already exists.
		SpeciesId GetOrCreateStub(Connection& rConnection, const String& rScientificName);
	}

	namespace Locations
	{
		LocationId Upsert(Connection& rConnection, const Model::LocationRecord& rLocation);

		// "rId" is InvalidLocationId when the camera isn't registered. Returns false on query failure.
		bool GetId(Connection& rConnection, const String& rCameraId, LocationId& rId);
	}
}
