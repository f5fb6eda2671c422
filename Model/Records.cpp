#include <PCH.hpp>

#include "Model/Records.hpp"

namespace Model
{
	namespace
	{
		struct ConservationStatusName
		{
			ConservationStatus	status;
			const char*			name;
		};

		const ConservationStatusName ConservationStatusNames[] =
		{
			{ ConservationStatus::LC, "LC" },
			{ ConservationStatus::NT, "NT" },
			{ ConservationStatus::VU, "VU" },
			{ ConservationStatus::EN, "EN" },
			{ ConservationStatus::CR, "CR" },
			{ ConservationStatus::EW, "EW" },
			{ ConservationStatus::EX, "EX" },
			{ ConservationStatus::DD, "DD" },
			{ ConservationStatus::NE, "NE" },
		};
	}

	const char* ToString(ProcessingStatus status)
	{
		switch (status)
		{
			case ProcessingStatus::Pending:		return "pending";
			case ProcessingStatus::Processing:	return "processing";
			case ProcessingStatus::Completed:	return "completed";
			case ProcessingStatus::Failed:		return "failed";
		}

		return "";
	}

	const char* ToString(DetectionType type)
	{
		switch (type)
		{
			case DetectionType::Animal:		return "animal";
			case DetectionType::Person:		return "person";
			case DetectionType::Vehicle:	return "vehicle";
		}

		return "";
	}

	const char* ToString(ConservationStatus status)
	{
		for (const auto& r : ConservationStatusNames)
		{
			if (r.status == status)
				return r.name;
		}

		return "";
	}

	bool FromString(const String& rText, ProcessingStatus& rStatus)
	{
		if (rText == "pending")			rStatus = ProcessingStatus::Pending;
		else if (rText == "processing")	rStatus = ProcessingStatus::Processing;
		else if (rText == "completed")	rStatus = ProcessingStatus::Completed;
		else if (rText == "failed")		rStatus = ProcessingStatus::Failed;
		else
			return false;

		return true;
	}

	bool FromString(const String& rText, DetectionType& rType)
	{
		if (rText == "animal")			rType = DetectionType::Animal;
		else if (rText == "person")		rType = DetectionType::Person;
		else if (rText == "vehicle")	rType = DetectionType::Vehicle;
		else
			return false;

		return true;
	}

	bool FromString(const String& rText, ConservationStatus& rStatus)
	{
		for (const auto& r : ConservationStatusNames)
		{
			if (rText == r.name)
			{
				rStatus = r.status;
				return true;
			}
		}

		rStatus = ConservationStatus::Unknown;
		return false;
	}

	bool BoundingBox::IsNormalized() const
	{
		auto isUnit = [](F32 v) { return v >= 0.0f && v <= 1.0f; };

		return isUnit(x) && isUnit(y) && isUnit(w) && isUnit(h);
	}

	F32 DetectionRecord::GetOverallConfidence() const
	{
		if (!hasClassification)
			return detectorConfidence;

		return (detectorConfidence + classifierConfidence) / 2.0f;
	}
}
