
#pragma once

namespace Database
{
	namespace Table
	{
		namespace Species
		{
			constexpr auto TableName			= "`species`";
			constexpr auto Id					= "`id`";
			constexpr auto ScientificName		= "`scientific_name`";
			constexpr auto CommonName			= "`common_name`";
			constexpr auto Kingdom				= "`taxonomy_kingdom`";
			constexpr auto Phylum				= "`taxonomy_phylum`";
			constexpr auto Class				= "`taxonomy_class`";
			constexpr auto Order				= "`taxonomy_order`";
			constexpr auto Family				= "`taxonomy_family`";
			constexpr auto Genus				= "`taxonomy_genus`";
			constexpr auto ConservationStatus	= "`conservation_status`";
			constexpr auto Description			= "`description`";
		}

		namespace Locations
		{
			constexpr auto TableName		= "`locations`";
			constexpr auto Id				= "`id`";
			constexpr auto CameraId			= "`camera_id`";
			constexpr auto LocationName		= "`location_name`";
			constexpr auto Latitude			= "`latitude`";
			constexpr auto Longitude		= "`longitude`";
			constexpr auto Altitude			= "`altitude`";
			constexpr auto Country			= "`country`";
			constexpr auto StateProvince	= "`state_province`";
			constexpr auto ProtectedArea	= "`protected_area`";
			constexpr auto HabitatType		= "`habitat_type`";
			constexpr auto VegetationType	= "`vegetation_type`";
			constexpr auto CameraModel		= "`camera_model`";
			constexpr auto Notes			= "`notes`";
			constexpr auto IsActive			= "`is_active`";
		}

		namespace Images
		{
			constexpr auto TableName		= "`images`";
			constexpr auto Id				= "`id`";
			constexpr auto Bucket			= "`s3_bucket`";
			constexpr auto Key				= "`s3_key`";
			constexpr auto FileName			= "`file_name`";
			constexpr auto FileSize			= "`file_size`";
			constexpr auto FileHash			= "`file_hash`";
			constexpr auto Width			= "`width`";
			constexpr auto Height			= "`height`";
			constexpr auto Format			= "`format`";
			constexpr auto CameraId			= "`camera_id`";		// FK, NULL for unregistered cameras.
			constexpr auto SourceCameraId	= "`source_camera_id`";
			constexpr auto LocationId		= "`location_id`";
			constexpr auto CapturedAt		= "`captured_at`";
			constexpr auto UploadedAt		= "`uploaded_at`";
			constexpr auto ProcessedAt		= "`processed_at`";
			constexpr auto ProjectName		= "`project_name`";
			constexpr auto Client			= "`client`";
			constexpr auto Country			= "`country`";
			constexpr auto ExifData			= "`exif_data`";
			constexpr auto GpsLatitude		= "`gps_latitude`";
			constexpr auto GpsLongitude		= "`gps_longitude`";
			constexpr auto GpsAltitude		= "`gps_altitude`";
			constexpr auto CameraMake		= "`camera_make`";
			constexpr auto CameraModel		= "`camera_model`";
			constexpr auto Status			= "`processing_status`";
			constexpr auto ErrorMessage		= "`error_message`";
			constexpr auto ClaimToken		= "`claim_token`";
			constexpr auto ClaimedAt		= "`claimed_at`";
			constexpr auto HasDetections	= "`has_detections`";
			constexpr auto DetectionCount	= "`detection_count`";
			constexpr auto Brightness		= "`brightness_score`";
			constexpr auto Sharpness		= "`sharpness_score`";
			constexpr auto Quality			= "`quality_score`";
		}

		namespace Detections
		{
			constexpr auto TableName			= "`detections`";
			constexpr auto Id					= "`id`";
			constexpr auto ImageId				= "`image_id`";
			constexpr auto SpeciesId			= "`species_id`";
			constexpr auto Type					= "`detection_type`";
			constexpr auto X					= "`bbox_x`";
			constexpr auto Y					= "`bbox_y`";
			constexpr auto W					= "`bbox_width`";
			constexpr auto H					= "`bbox_height`";
			constexpr auto DetectorConfidence	= "`megadetector_confidence`";
			constexpr auto ClassifierConfidence	= "`speciesnet_confidence`";
			constexpr auto OverallConfidence	= "`overall_confidence`";
			constexpr auto Top5					= "`species_top5`";
			constexpr auto IsVerified			= "`is_verified`";
			constexpr auto IsFalsePositive		= "`is_false_positive`";
			constexpr auto NeedsReview			= "`needs_review`";
			constexpr auto CreatedAt			= "`created_at`";
		}

		namespace LocationStatistics
		{
			constexpr auto TableName				= "`location_statistics`";
			constexpr auto LocationId				= "`location_id`";
			constexpr auto CameraId					= "`camera_id`";
			constexpr auto LocationName				= "`location_name`";
			constexpr auto Latitude					= "`latitude`";
			constexpr auto Longitude				= "`longitude`";
			constexpr auto TotalImages				= "`total_images`";
			constexpr auto TotalDetections			= "`total_detections`";
			constexpr auto UniqueSpecies			= "`unique_species`";
			constexpr auto UniqueAnimalSpecies		= "`unique_animal_species`";
			constexpr auto FirstCapture				= "`first_capture`";
			constexpr auto LastCapture				= "`last_capture`";
			constexpr auto AvgDetectionConfidence	= "`avg_detection_confidence`";
			constexpr auto AvgSpeciesConfidence		= "`avg_species_confidence`";
		}

		namespace SpeciesStatistics
		{
			constexpr auto TableName			= "`species_statistics`";
			constexpr auto SpeciesId			= "`species_id`";
			constexpr auto ScientificName		= "`scientific_name`";
			constexpr auto CommonName			= "`common_name`";
			constexpr auto ConservationStatus	= "`conservation_status`";
			constexpr auto TotalDetections		= "`total_detections`";
			constexpr auto ImagesWithSpecies	= "`images_with_species`";
			constexpr auto UniqueLocations		= "`unique_locations`";
			constexpr auto FirstObserved		= "`first_observed`";
			constexpr auto LastObserved			= "`last_observed`";
			constexpr auto AvgConfidence		= "`avg_confidence`";
			constexpr auto AvgDetectionSize		= "`avg_detection_size`";
		}
	}
}
