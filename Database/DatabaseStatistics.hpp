
#pragma once

namespace Model { struct LocationStatistics; struct SpeciesStatistics; struct SpeciesStatisticsFilter; }

namespace Database
{
	namespace Statistics
	{
		// Recomputes both aggregate tables in one READ COMMITTED transaction.
		bool Refresh(Connection& rConnection);

		// Ordered by total detections, descending.
		bool GetLocations(Connection& rConnection, Vector<Model::LocationStatistics>& rList);
		bool GetSpecies(Connection& rConnection, const Model::SpeciesStatisticsFilter& rFilter, Vector<Model::SpeciesStatistics>& rList);
	}
}
