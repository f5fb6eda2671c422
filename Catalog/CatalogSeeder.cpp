#include <PCH.hpp>

#include "Catalog/CatalogSeeder.hpp"

#include "Storage/Store.hpp"
#include "Utils.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace
{
	String GetString(const json& rObject, const char* pKey)
	{
		auto it = rObject.find(pKey);

		if (it == rObject.end() || !it->is_string())
			return String();

		return Utils::Trim(it->get<String>());
	}

	bool GetNumber(const json& rObject, const char* pKey, F64& rValue)
	{
		auto it = rObject.find(pKey);

		if (it == rObject.end() || !it->is_number())
			return false;

		rValue = it->get<F64>();
		return true;
	}

	bool ReadText(const String& rFileName, String& rText)
	{
		ByteBuffer buffer;

		if (!Utils::ReadFile(rFileName, buffer))
			return false;

		rText.assign(buffer.begin(), buffer.end());
		return true;
	}
}

namespace Catalog
{
	bool LoadTaxonomy(const String& rFileName, Taxonomy& rTaxonomy)
	{
		String text;

		if (!ReadText(rFileName, text))
		{
			LOG_ERROR(Log::Channel::Main, "Failed to read the taxonomy file \"%s\"!", rFileName.c_str());
			return false;
		}

		return ParseTaxonomy(text, rTaxonomy);
	}

	bool ParseTaxonomy(const String& rJSON, Taxonomy& rTaxonomy)
	{
		const auto root = json::parse(rJSON, nullptr, false);

		if (root.is_discarded() || !root.is_object())
		{
			LOG_ERROR(Log::Channel::Main, "Taxonomy is not a JSON object!");
			return false;
		}

		for (auto it = root.begin(); it != root.end(); ++it)
		{
			U32 classIndex;

			if (!Utils::StringTo(it.key().c_str(), classIndex) || !it.value().is_object())
			{
				LOG_WARNING(Log::Channel::Main, "Skipping taxonomy entry \"%s\".", it.key().c_str());
				continue;
			}

			const auto& rEntry = it.value();

			Model::SpeciesRecord species;

			species.scientificName = GetString(rEntry, "scientific_name");
			species.commonName = GetString(rEntry, "common_name");
			species.description = GetString(rEntry, "description");

			if (species.scientificName.empty())
			{
				LOG_WARNING(Log::Channel::Main, "Taxonomy entry %u has no scientific name.", classIndex);
				continue;
			}

			auto taxonomyIt = rEntry.find("taxonomy");

			if (taxonomyIt != rEntry.end() && taxonomyIt->is_object())
			{
				species.taxonomy.kingdom = GetString(*taxonomyIt, "kingdom");
				species.taxonomy.phylum = GetString(*taxonomyIt, "phylum");
				species.taxonomy.className = GetString(*taxonomyIt, "class");
				species.taxonomy.order = GetString(*taxonomyIt, "order");
				species.taxonomy.family = GetString(*taxonomyIt, "family");
				species.taxonomy.genus = GetString(*taxonomyIt, "genus");
			}

			const String status(GetString(rEntry, "conservation_status"));

			if (!status.empty() && !Model::FromString(status, species.conservationStatus))
				LOG_WARNING(Log::Channel::Main, "Unknown conservation status \"%s\" for %s.", status.c_str(), species.scientificName.c_str());

			rTaxonomy[classIndex] = species;
		}

		LOG_MESSAGE(Log::Channel::Main, "Loaded taxonomy for %zu species.", rTaxonomy.size());
		return true;
	}

	bool LoadLocations(const String& rFileName, Vector<Model::LocationRecord>& rList)
	{
		String text;

		if (!ReadText(rFileName, text))
		{
			LOG_ERROR(Log::Channel::Main, "Failed to read the locations file \"%s\"!", rFileName.c_str());
			return false;
		}

		return ParseLocations(text, rList);
	}

	bool ParseLocations(const String& rJSON, Vector<Model::LocationRecord>& rList)
	{
		const auto root = json::parse(rJSON, nullptr, false);

		if (root.is_discarded() || !root.is_array())
		{
			LOG_ERROR(Log::Channel::Main, "Locations is not a JSON array!");
			return false;
		}

		for (const auto& rEntry : root)
		{
			if (!rEntry.is_object())
				continue;

			Model::LocationRecord location;

			location.cameraId = GetString(rEntry, "camera_id");

			if (location.cameraId.empty()
				|| !GetNumber(rEntry, "latitude", location.latitude)
				|| !GetNumber(rEntry, "longitude", location.longitude))
			{
				LOG_WARNING(Log::Channel::Main, "Skipping camera \"%s\" without an id or coordinates.", location.cameraId.c_str());
				continue;
			}

			if (location.latitude < -90.0 || location.latitude > 90.0 || location.longitude < -180.0 || location.longitude > 180.0)
			{
				LOG_WARNING(Log::Channel::Main, "Skipping camera \"%s\" with invalid coordinates.", location.cameraId.c_str());
				continue;
			}

			location.hasAltitude = GetNumber(rEntry, "altitude", location.altitude);

			location.locationName = GetString(rEntry, "location_name");
			location.country = GetString(rEntry, "country");
			location.stateProvince = GetString(rEntry, "state_province");
			location.protectedArea = GetString(rEntry, "protected_area");
			location.habitatType = GetString(rEntry, "habitat_type");
			location.vegetationType = GetString(rEntry, "vegetation_type");
			location.cameraModel = GetString(rEntry, "camera_model");
			location.notes = GetString(rEntry, "notes");

			auto activeIt = rEntry.find("is_active");

			if (activeIt != rEntry.end() && activeIt->is_boolean())
				location.isActive = activeIt->get<bool>();

			rList.push_back(location);
		}

		LOG_MESSAGE(Log::Channel::Main, "Loaded %zu camera locations.", rList.size());
		return true;
	}

	size_t SeedSpecies(Store& rStore, const Taxonomy& rTaxonomy)
	{
		size_t count = 0;

		for (const auto& rPair : rTaxonomy)
		{
			rStore.UpsertSpecies(rPair.second);
			count++;
		}

		return count;
	}

	size_t SeedLocations(Store& rStore, const Vector<Model::LocationRecord>& rList)
	{
		for (const auto& rLocation : rList)
			rStore.UpsertLocation(rLocation);

		return rList.size();
	}
}
