
#pragma once

enum class ProcessingStatus : U8
{
	Pending,
	Processing,
	Completed,	// Terminal.
	Failed		// Terminal.
};

enum class DetectionType : U8
{
	Animal,
	Person,
	Vehicle
};

enum class ConservationStatus : U8
{
	Unknown,	// NULL in the database.
	LC, NT, VU, EN, CR, EW, EX, DD, NE
};

namespace Model
{
	const char* ToString(ProcessingStatus status);
	const char* ToString(DetectionType type);
	const char* ToString(ConservationStatus status);

	bool FromString(const String& rText, ProcessingStatus& rStatus);
	bool FromString(const String& rText, DetectionType& rType);
	bool FromString(const String& rText, ConservationStatus& rStatus);

	inline bool IsTerminal(ProcessingStatus status)
	{
		return status == ProcessingStatus::Completed || status == ProcessingStatus::Failed;
	}

	struct Taxonomy
	{
		String kingdom;
		String phylum;
		String className;
		String order;
		String family;
		String genus;
	};

	struct SpeciesRecord
	{
		SpeciesId			id = InvalidSpeciesId;
		String				scientificName; // Natural key.
		String				commonName;
		Taxonomy			taxonomy;
		ConservationStatus	conservationStatus = ConservationStatus::Unknown;
		String				description;
	};

	struct LocationRecord
	{
		LocationId	id = InvalidLocationId;
		String		cameraId; // Natural key.
		String		locationName;
		F64			latitude = 0.0;
		F64			longitude = 0.0;
		bool		hasAltitude = false;
		F64			altitude = 0.0;
		String		country;
		String		stateProvince;
		String		protectedArea;
		String		habitatType;
		String		vegetationType;
		String		cameraModel;
		String		notes;
		bool		isActive = true;
	};

	// Normalized to the image dimensions, every value in [0,1].
	struct BoundingBox
	{
		F32 x = 0.0f;
		F32 y = 0.0f;
		F32 w = 0.0f;
		F32 h = 0.0f;

		bool IsNormalized() const;
	};

	struct SpeciesCandidate
	{
		String	scientificName;
		String	commonName;
		F32		confidence = 0.0f;
	};

	struct DetectionRecord
	{
		DetectionId		id = 0;
		ImageId			imageId = InvalidImageId;
		DetectionType	type = DetectionType::Animal;
		BoundingBox		box;
		F32				detectorConfidence = 0.0f;

		// Only ever set for DetectionType::Animal.
		SpeciesId		speciesId = InvalidSpeciesId;
		bool			hasClassification = false;
		F32				classifierConfidence = 0.0f;
		Vector<SpeciesCandidate> topCandidates; // Descending, at most 5.

		// Filled by reads only.
		String			scientificName;
		String			commonName;

		bool			isVerified = false;
		bool			isFalsePositive = false;
		bool			needsReview = true;

		F32 GetOverallConfidence() const;
	};

	struct ImageMetadata
	{
		U32		width = 0;
		U32		height = 0;
		String	format; // "jpeg", "png", ...

		bool	hasCapturedAt = false;
		String	capturedAt; // "YYYY-MM-DD HH:MM:SS"

		bool	hasGps = false;
		F64		gpsLatitude = 0.0;
		F64		gpsLongitude = 0.0;
		bool	hasGpsAltitude = false;
		F64		gpsAltitude = 0.0;

		String	cameraMake;
		String	cameraModel;

		// Raw EXIF values kept for the `exif_data` column.
		UnorderedMap<String, String> exifTags;

		F32		brightness = 0.0f;
		F32		sharpness = 0.0f;
		F32		quality = 0.0f;
	};

	struct ImageRecord
	{
		ImageId		id = InvalidImageId;
		String		bucket;
		String		storageKey; // Natural key.
		String		fileName;
		U64			fileSize = 0;
		String		fileHash;

		String		projectName;
		String		country;
		String		client;

		// Camera id taken from the storage key, kept even for unregistered cameras.
		String		sourceCameraId;
		// Set when "sourceCameraId" matches a registered location.
		LocationId	locationId = InvalidLocationId;

		ImageMetadata metadata;

		ProcessingStatus status = ProcessingStatus::Pending;
		String		errorMessage;
		String		claimToken;

		U32			detectionCount = 0;
		bool		hasDetections = false;
	};

	struct LocationStatistics
	{
		LocationId	locationId = InvalidLocationId;
		String		cameraId;
		String		locationName;
		F64			latitude = 0.0;
		F64			longitude = 0.0;
		U64			totalImages = 0;
		U64			totalDetections = 0;
		U32			uniqueSpecies = 0;
		U32			uniqueAnimalSpecies = 0;
		String		firstCapture;
		String		lastCapture;
		F64			avgDetectionConfidence = 0.0;
		F64			avgSpeciesConfidence = 0.0;	// Classified detections only.
	};

	struct SpeciesStatistics
	{
		SpeciesId	speciesId = InvalidSpeciesId;
		String		scientificName;
		String		commonName;
		ConservationStatus conservationStatus = ConservationStatus::Unknown;
		U64			totalDetections = 0;
		U64			imagesWithSpecies = 0;
		U32			uniqueLocations = 0;
		String		firstObserved;
		String		lastObserved;
		F64			avgConfidence = 0.0;
		F64			avgDetectionSize = 0.0;		// Mean box width * height.
	};

	struct SpeciesStatisticsFilter
	{
		bool				hasConservationStatus = false;
		ConservationStatus	conservationStatus = ConservationStatus::Unknown;
		U32					limit = 100;
		U32					offset = 0;
	};
}
