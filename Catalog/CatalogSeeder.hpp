
#pragma once

#include "Model/Records.hpp"

class Store;

// Class index of the species model -> species.
using Taxonomy = UnorderedMap<U32, Model::SpeciesRecord>;

namespace Catalog
{
	// {"<class index>": {"scientific_name", "common_name", "taxonomy": {"kingdom" .. "genus"}, "conservation_status"}}
	// Entries without a scientific name are skipped. False when the file can't be read or parsed.
	bool LoadTaxonomy(const String& rFileName, Taxonomy& rTaxonomy);
	bool ParseTaxonomy(const String& rJSON, Taxonomy& rTaxonomy);

	// [{"camera_id", "latitude", "longitude", "altitude", "location_name", "country", ...}]
	bool LoadLocations(const String& rFileName, Vector<Model::LocationRecord>& rList);
	bool ParseLocations(const String& rJSON, Vector<Model::LocationRecord>& rList);

	// Upserts by natural key. Returns the number of rows written; throws PipelineException.
	size_t SeedSpecies(Store& rStore, const Taxonomy& rTaxonomy);
	size_t SeedLocations(Store& rStore, const Vector<Model::LocationRecord>& rList);
}
