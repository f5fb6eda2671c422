#include "PCH.hpp"

#include "Support/MemoryStore.hpp"

#include "Utils.hpp"

#include <set>

namespace
{
	// utf8mb4 columns in strict mode refuse malformed text.
	void CheckText(const char* pField, const String& rValue)
	{
		if (Utils::ToValidUtf8(rValue) != rValue)
			throw PipelineException(ErrorKind::Persistence, false, "Incorrect string value for column \"%s\".", pField);
	}
}

SpeciesId MemoryStore::UpsertSpecies(const Model::SpeciesRecord& rSpecies)
{
	std::lock_guard<std::mutex> lock(mMutex);

	auto it = mSpecies.find(rSpecies.scientificName);

	if (it == mSpecies.end())
	{
		auto& rRow = mSpecies[rSpecies.scientificName];

		rRow = rSpecies;
		rRow.id = ++mSpeciesIdCounter;

		return rRow.id;
	}

	const auto id = it->second.id;

	it->second = rSpecies;
	it->second.id = id;

	return id;
}

SpeciesId MemoryStore::GetOrCreateSpeciesStub(const String& rScientificName)
{
	BeginCall(Operation::SpeciesStub);

	std::lock_guard<std::mutex> lock(mMutex);

	auto it = mSpecies.find(rScientificName);

	if (it != mSpecies.end())
		return it->second.id;

	auto& rRow = mSpecies[rScientificName];

	rRow.scientificName = rScientificName;
	rRow.id = ++mSpeciesIdCounter;

	return rRow.id;
}

LocationId MemoryStore::UpsertLocation(const Model::LocationRecord& rLocation)
{
	std::lock_guard<std::mutex> lock(mMutex);

	auto it = mLocations.find(rLocation.cameraId);

	LocationId id = (it == mLocations.end()) ? ++mLocationIdCounter : it->second.id;

	auto& rRow = mLocations[rLocation.cameraId];

	rRow = rLocation;
	rRow.id = id;

	return id;
}

LocationId MemoryStore::FindLocationId(const String& rCameraId)
{
	BeginCall(Operation::FindLocation);

	std::lock_guard<std::mutex> lock(mMutex);

	auto it = mLocations.find(rCameraId);

	return it == mLocations.end() ? InvalidLocationId : it->second.id;
}

bool MemoryStore::FindImage(const String& rStorageKey, Model::ImageRecord& rImage)
{
	BeginCall(Operation::FindImage);

	std::lock_guard<std::mutex> lock(mMutex);

	auto it = mImages.find(rStorageKey);

	if (it == mImages.end())
		return false;

	rImage = it->second.record;
	return true;
}

ClaimResult MemoryStore::ClaimImage(Model::ImageRecord& rImage, U32 leaseSec)
{
	BeginCall(Operation::Claim);

	std::lock_guard<std::mutex> lock(mMutex);

	auto it = mImages.find(rImage.storageKey);

	if (it == mImages.end())
	{
		ImageRow row;

		row.record = rImage;
		row.record.id = ++mImageIdCounter;
		row.record.status = ProcessingStatus::Pending;
		row.record.claimToken.clear();
		row.record.detectionCount = 0;
		row.record.hasDetections = false;

		it = mImages.emplace(rImage.storageKey, row).first;
	}

	auto& rRow = it->second;
	const auto nowTP = std::chrono::steady_clock::now();

	const bool isAbandoned = rRow.record.status == ProcessingStatus::Processing
		&& nowTP - rRow.claimedTP > std::chrono::seconds(leaseSec);

	if (rRow.record.status != ProcessingStatus::Pending && !isAbandoned)
	{
		rImage.id = rRow.record.id;
		rImage.status = rRow.record.status;

		return Model::IsTerminal(rRow.record.status) ? ClaimResult::AlreadyTerminal : ClaimResult::OwnedByOther;
	}

	rRow.record.status = ProcessingStatus::Processing;
	rRow.record.claimToken = Storage::NewClaimToken();
	rRow.record.errorMessage.clear();
	rRow.claimedTP = nowTP;

	rImage = rRow.record;

	return ClaimResult::Claimed;
}

void MemoryStore::UpdateImageMetadata(const Model::ImageRecord& rImage)
{
	BeginCall(Operation::UpdateMetadata);

	std::lock_guard<std::mutex> lock(mMutex);

	auto pRow = FindRow(rImage.id);

	if (!pRow || pRow->record.claimToken != rImage.claimToken || pRow->record.status != ProcessingStatus::Processing)
		return;

	CheckText("camera_make", rImage.metadata.cameraMake);
	CheckText("camera_model", rImage.metadata.cameraModel);

	for (const auto& rTag : rImage.metadata.exifTags)
		CheckText("exif_data", rTag.second);

	auto& rRecord = pRow->record;

	rRecord.fileSize = rImage.fileSize;
	rRecord.fileHash = rImage.fileHash;
	rRecord.metadata = rImage.metadata;
	rRecord.locationId = rImage.locationId;
}

void MemoryStore::CompleteImage(const Model::ImageRecord& rImage, const Vector<Model::DetectionRecord>& rDetections)
{
	BeginCall(Operation::Complete);

	std::lock_guard<std::mutex> lock(mMutex);

	auto pRow = FindRow(rImage.id);

	if (!pRow || pRow->record.claimToken != rImage.claimToken || pRow->record.status != ProcessingStatus::Processing)
		throw PipelineException(ErrorKind::ClaimLost, false, "Image %" PRIu64 " is no longer owned by this invocation.", rImage.id);

	// Staged like an open transaction, nothing is visible before the end.
	Vector<Model::DetectionRecord> staged;

	for (const auto& rDetection : rDetections)
	{
		if (mIsCompletionInterrupted && staged.size() == mInterruptAfter)
		{
			mIsCompletionInterrupted = false;
			throw PipelineException(ErrorKind::Persistence, true, "Completion interrupted after %zu of %zu detections.", staged.size(), rDetections.size());
		}

		for (const auto& rCandidate : rDetection.topCandidates)
			CheckText("species_top5", rCandidate.scientificName);

		auto detection = rDetection;

		detection.id = ++mDetectionIdCounter;
		detection.imageId = rImage.id;

		staged.push_back(std::move(detection));
	}

	for (auto& rDetection : staged)
		mDetections.push_back(std::move(rDetection));

	pRow->record.status = ProcessingStatus::Completed;
	pRow->record.detectionCount = CountDetections(rImage.id);
	pRow->record.hasDetections = pRow->record.detectionCount > 0;
}

bool MemoryStore::FailImage(const Model::ImageRecord& rImage, const String& rErrorMessage)
{
	BeginCall(Operation::Fail);

	std::lock_guard<std::mutex> lock(mMutex);

	auto pRow = FindRow(rImage.id);

	if (!pRow || pRow->record.claimToken != rImage.claimToken || pRow->record.status != ProcessingStatus::Processing)
		return false;

	pRow->record.status = ProcessingStatus::Failed;
	pRow->record.errorMessage = rErrorMessage;

	return true;
}

bool MemoryStore::DeleteImage(ImageId id)
{
	std::lock_guard<std::mutex> lock(mMutex);

	auto it = std::find_if(mImages.begin(), mImages.end(), [id](const std::pair<const String, ImageRow>& r) { return r.second.record.id == id; });

	if (it == mImages.end())
		return false;

	mImages.erase(it);

	mDetections.erase(std::remove_if(mDetections.begin(), mDetections.end(),
		[id](const Model::DetectionRecord& r) { return r.imageId == id; }), mDetections.end());

	return true;
}

void MemoryStore::GetDetections(ImageId id, Vector<Model::DetectionRecord>& rDetections)
{
	std::lock_guard<std::mutex> lock(mMutex);

	for (const auto& rDetection : mDetections)
	{
		if (rDetection.imageId != id)
			continue;

		auto detection = rDetection;

		for (const auto& rPair : mSpecies)
		{
			if (rPair.second.id == detection.speciesId)
			{
				detection.scientificName = rPair.second.scientificName;
				detection.commonName = rPair.second.commonName;
				break;
			}
		}

		rDetections.push_back(std::move(detection));
	}

	std::stable_sort(rDetections.begin(), rDetections.end(),
		[](const Model::DetectionRecord& a, const Model::DetectionRecord& b) { return a.detectorConfidence > b.detectorConfidence; });
}

void MemoryStore::RefreshStatistics()
{
	BeginCall(Operation::Refresh);

	std::lock_guard<std::mutex> lock(mMutex);

	UnorderedMap<ImageId, const Model::ImageRecord*> images;

	for (const auto& rPair : mImages)
		images[rPair.second.record.id] = &rPair.second.record;

	Vector<Model::LocationStatistics> locationStatistics;

	for (const auto& rPair : mLocations)
	{
		const auto& rLocation = rPair.second;

		Model::LocationStatistics stats;

		stats.locationId = rLocation.id;
		stats.cameraId = rLocation.cameraId;
		stats.locationName = rLocation.locationName;
		stats.latitude = rLocation.latitude;
		stats.longitude = rLocation.longitude;

		std::set<SpeciesId> species;
		std::set<SpeciesId> animalSpecies;
		F64 confidenceSum = 0.0;
		F64 speciesConfidenceSum = 0.0;
		U32 numClassified = 0;

		for (const auto& rImagePair : images)
		{
			const auto& rImage = *rImagePair.second;

			if (rImage.locationId != rLocation.id)
				continue;

			stats.totalImages++;

			if (rImage.metadata.hasCapturedAt)
			{
				if (stats.firstCapture.empty() || rImage.metadata.capturedAt < stats.firstCapture)
					stats.firstCapture = rImage.metadata.capturedAt;

				if (stats.lastCapture.empty() || rImage.metadata.capturedAt > stats.lastCapture)
					stats.lastCapture = rImage.metadata.capturedAt;
			}

			for (const auto& rDetection : mDetections)
			{
				if (rDetection.imageId != rImage.id)
					continue;

				stats.totalDetections++;
				confidenceSum += rDetection.detectorConfidence;

				if (rDetection.speciesId != InvalidSpeciesId)
				{
					species.insert(rDetection.speciesId);

					if (rDetection.type == DetectionType::Animal)
						animalSpecies.insert(rDetection.speciesId);
				}

				if (rDetection.hasClassification)
				{
					speciesConfidenceSum += rDetection.classifierConfidence;
					numClassified++;
				}
			}
		}

		stats.uniqueSpecies = static_cast<U32>(species.size());
		stats.uniqueAnimalSpecies = static_cast<U32>(animalSpecies.size());

		if (numClassified > 0)
			stats.avgSpeciesConfidence = speciesConfidenceSum / numClassified;

		if (stats.totalDetections > 0)
			stats.avgDetectionConfidence = confidenceSum / stats.totalDetections;

		locationStatistics.push_back(stats);
	}

	std::stable_sort(locationStatistics.begin(), locationStatistics.end(),
		[](const Model::LocationStatistics& a, const Model::LocationStatistics& b) { return a.totalDetections > b.totalDetections; });

	Vector<Model::SpeciesStatistics> speciesStatistics;

	for (const auto& rPair : mSpecies)
	{
		const auto& rSpecies = rPair.second;

		Model::SpeciesStatistics stats;

		stats.speciesId = rSpecies.id;
		stats.scientificName = rSpecies.scientificName;
		stats.commonName = rSpecies.commonName;
		stats.conservationStatus = rSpecies.conservationStatus;

		std::set<ImageId> imageIds;
		std::set<LocationId> locationIds;
		F64 confidenceSum = 0.0;
		F64 sizeSum = 0.0;

		for (const auto& rDetection : mDetections)
		{
			if (rDetection.speciesId != rSpecies.id)
				continue;

			stats.totalDetections++;
			confidenceSum += rDetection.classifierConfidence;
			sizeSum += rDetection.box.w * rDetection.box.h;
			imageIds.insert(rDetection.imageId);

			auto imageIt = images.find(rDetection.imageId);

			if (imageIt == images.end())
				continue;

			const auto& rImage = *imageIt->second;

			if (rImage.locationId != InvalidLocationId)
				locationIds.insert(rImage.locationId);

			if (rImage.metadata.hasCapturedAt)
			{
				if (stats.firstObserved.empty() || rImage.metadata.capturedAt < stats.firstObserved)
					stats.firstObserved = rImage.metadata.capturedAt;

				if (stats.lastObserved.empty() || rImage.metadata.capturedAt > stats.lastObserved)
					stats.lastObserved = rImage.metadata.capturedAt;
			}
		}

		if (stats.totalDetections == 0)
			continue;

		stats.imagesWithSpecies = imageIds.size();
		stats.uniqueLocations = static_cast<U32>(locationIds.size());
		stats.avgConfidence = confidenceSum / stats.totalDetections;
		stats.avgDetectionSize = sizeSum / stats.totalDetections;

		speciesStatistics.push_back(stats);
	}

	std::stable_sort(speciesStatistics.begin(), speciesStatistics.end(),
		[](const Model::SpeciesStatistics& a, const Model::SpeciesStatistics& b) { return a.totalDetections > b.totalDetections; });

	mLocationStatistics = std::move(locationStatistics);
	mSpeciesStatistics = std::move(speciesStatistics);
}

void MemoryStore::GetLocationStatistics(Vector<Model::LocationStatistics>& rList)
{
	std::lock_guard<std::mutex> lock(mMutex);

	rList = mLocationStatistics;
}

void MemoryStore::GetSpeciesStatistics(const Model::SpeciesStatisticsFilter& rFilter, Vector<Model::SpeciesStatistics>& rList)
{
	std::lock_guard<std::mutex> lock(mMutex);

	size_t numSkipped = 0;

	for (const auto& rStats : mSpeciesStatistics)
	{
		if (rFilter.hasConservationStatus && rStats.conservationStatus != rFilter.conservationStatus)
			continue;

		if (numSkipped++ < rFilter.offset)
			continue;

		if (rList.size() >= rFilter.limit)
			break;

		rList.push_back(rStats);
	}
}

void MemoryStore::FailTransiently(Operation operation, U32 count)
{
	std::lock_guard<std::mutex> lock(mMutex);

	mTransientFailures[static_cast<U8>(operation)] = count;
}

void MemoryStore::FailPermanently(Operation operation)
{
	std::lock_guard<std::mutex> lock(mMutex);

	mPermanentFailures[static_cast<U8>(operation)] = true;
}

void MemoryStore::InterruptCompletionAfter(size_t count)
{
	std::lock_guard<std::mutex> lock(mMutex);

	mIsCompletionInterrupted = true;
	mInterruptAfter = count;
}

void MemoryStore::SetHook(Operation operation, std::function<void()> hook)
{
	std::lock_guard<std::mutex> lock(mMutex);

	mHooks[static_cast<U8>(operation)] = std::move(hook);
}

void MemoryStore::StealClaim(const String& rStorageKey)
{
	std::lock_guard<std::mutex> lock(mMutex);

	auto it = mImages.find(rStorageKey);

	if (it == mImages.end())
		return;

	it->second.record.status = ProcessingStatus::Processing;
	it->second.record.claimToken = Storage::NewClaimToken();
	it->second.claimedTP = std::chrono::steady_clock::now();
}

void MemoryStore::AgeClaim(const String& rStorageKey, U32 seconds)
{
	std::lock_guard<std::mutex> lock(mMutex);

	auto it = mImages.find(rStorageKey);

	if (it != mImages.end())
		it->second.claimedTP -= std::chrono::seconds(seconds);
}

size_t MemoryStore::GetNumImages()
{
	std::lock_guard<std::mutex> lock(mMutex);

	return mImages.size();
}

size_t MemoryStore::GetNumDetections()
{
	std::lock_guard<std::mutex> lock(mMutex);

	return mDetections.size();
}

size_t MemoryStore::GetNumSpecies()
{
	std::lock_guard<std::mutex> lock(mMutex);

	return mSpecies.size();
}

U32 MemoryStore::GetNumCalls(Operation operation)
{
	std::lock_guard<std::mutex> lock(mMutex);

	auto it = mNumCalls.find(static_cast<U8>(operation));

	return it == mNumCalls.end() ? 0 : it->second;
}

bool MemoryStore::GetSpecies(const String& rScientificName, Model::SpeciesRecord& rSpecies)
{
	std::lock_guard<std::mutex> lock(mMutex);

	auto it = mSpecies.find(rScientificName);

	if (it == mSpecies.end())
		return false;

	rSpecies = it->second;
	return true;
}

bool MemoryStore::GetLocation(const String& rCameraId, Model::LocationRecord& rLocation)
{
	std::lock_guard<std::mutex> lock(mMutex);

	auto it = mLocations.find(rCameraId);

	if (it == mLocations.end())
		return false;

	rLocation = it->second;
	return true;
}

void MemoryStore::BeginCall(Operation operation)
{
	std::function<void()> hook;
	{
		std::lock_guard<std::mutex> lock(mMutex);

		auto it = mHooks.find(static_cast<U8>(operation));

		if (it != mHooks.end())
			hook = it->second;
	}

	if (hook)
		hook();

	std::lock_guard<std::mutex> lock(mMutex);

	const auto index = static_cast<U8>(operation);

	mNumCalls[index]++;

	if (mPermanentFailures[index])
		throw PipelineException(ErrorKind::Persistence, false, "Injected permanent failure (operation %u).", static_cast<U32>(index));

	auto& rTransient = mTransientFailures[index];

	if (rTransient > 0)
	{
		rTransient--;
		throw PipelineException(ErrorKind::Persistence, true, "Injected transient failure (operation %u).", static_cast<U32>(index));
	}
}

auto MemoryStore::FindRow(ImageId id) -> ImageRow*
{
	for (auto& rPair : mImages)
	{
		if (rPair.second.record.id == id)
			return &rPair.second;
	}

	return nullptr;
}

U32 MemoryStore::CountDetections(ImageId id) const
{
	return static_cast<U32>(std::count_if(mDetections.begin(), mDetections.end(),
		[id](const Model::DetectionRecord& r) { return r.imageId == id; }));
}
