#include "PCH.hpp"

#include "Support/Fixtures.hpp"

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <opencv2/imgcodecs.hpp>

#include <exiv2/exiv2.hpp>

void FixtureDetector::SetObjects(const Vector<DetectedObject>& rObjects)
{
	std::lock_guard<std::mutex> lock(mMutex);

	mObjects = rObjects;
}

void FixtureDetector::AddObject(DetectionType type, F32 confidence, F32 x, F32 y, F32 w, F32 h)
{
	DetectedObject object;

	object.type = type;
	object.confidence = confidence;
	object.box.x = x;
	object.box.y = y;
	object.box.w = w;
	object.box.h = h;

	std::lock_guard<std::mutex> lock(mMutex);

	mObjects.push_back(object);
}

void FixtureDetector::FailTransiently(U32 count)
{
	std::lock_guard<std::mutex> lock(mMutex);

	mTransientFailures = count;
}

void FixtureDetector::FailPermanently()
{
	std::lock_guard<std::mutex> lock(mMutex);

	mIsPermanentFailure = true;
}

void FixtureDetector::Run(const ByteBuffer& rImage, F32 threshold, Vector<DetectedObject>& rObjects)
{
	mNumCalls++;

	std::lock_guard<std::mutex> lock(mMutex);

	if (mIsPermanentFailure)
		throw PipelineException(ErrorKind::AdapterPermanent, false, "Detector rejected the image.");

	if (mTransientFailures > 0)
	{
		mTransientFailures--;
		throw PipelineException(ErrorKind::AdapterTransient, true, "Detector service unavailable.");
	}

	rObjects = mObjects;
}

void FixtureClassifier::AddCandidate(const String& rScientificName, const String& rCommonName, F32 confidence)
{
	Model::SpeciesCandidate candidate;

	candidate.scientificName = rScientificName;
	candidate.commonName = rCommonName;
	candidate.confidence = confidence;

	std::lock_guard<std::mutex> lock(mMutex);

	mCandidates.push_back(candidate);
}

void FixtureClassifier::FailTransiently(U32 count)
{
	std::lock_guard<std::mutex> lock(mMutex);

	mTransientFailures = count;
}

void FixtureClassifier::Run(const ByteBuffer& rCrop, F32 threshold, Vector<Model::SpeciesCandidate>& rCandidates)
{
	mNumCalls++;

	std::lock_guard<std::mutex> lock(mMutex);

	if (mTransientFailures > 0)
	{
		mTransientFailures--;
		throw PipelineException(ErrorKind::AdapterTransient, true, "Classifier service unavailable.");
	}

	rCandidates = mCandidates;
}

void MemoryImageSource::Add(const String& rBucket, const String& rKey, const ByteBuffer& rBytes)
{
	std::lock_guard<std::mutex> lock(mMutex);

	mObjects[rBucket + '/' + rKey] = rBytes;
}

void MemoryImageSource::Load(const UploadNotice& rNotice, ByteBuffer& rBytes)
{
	std::unique_lock<std::mutex> lock(mMutex);

	mCondition.wait(lock, [this] { return !mIsHeld; });

	auto it = mObjects.find(rNotice.bucket + '/' + rNotice.key);

	if (it == mObjects.end())
		throw PipelineException(ErrorKind::AdapterTransient, true, "Object \"%s\" not found.", rNotice.key.c_str());

	rBytes = it->second;
}

void MemoryImageSource::Hold()
{
	std::lock_guard<std::mutex> lock(mMutex);

	mIsHeld = true;
}

void MemoryImageSource::Release()
{
	{
		std::lock_guard<std::mutex> lock(mMutex);
		mIsHeld = false;
	}

	mCondition.notify_all();
}

void RecordingTrackingSink::SetStatus(const String& rStorageKey, TrackingStatus status, const String& rDetail)
{
	std::lock_guard<std::mutex> lock(mMutex);

	if (mIsFailing)
		throw Exception("Tracking store unreachable.");

	mEntries.push_back(Entry{ rStorageKey, status, rDetail });
}

void RecordingTrackingSink::SetFailing(bool isFailing)
{
	std::lock_guard<std::mutex> lock(mMutex);

	mIsFailing = isFailing;
}

auto RecordingTrackingSink::GetEntries() -> Vector<Entry>
{
	std::lock_guard<std::mutex> lock(mMutex);

	return mEntries;
}

Vector<TrackingStatus> RecordingTrackingSink::GetStatuses(const String& rStorageKey)
{
	std::lock_guard<std::mutex> lock(mMutex);

	Vector<TrackingStatus> list;

	for (const auto& rEntry : mEntries)
	{
		if (rEntry.storageKey == rStorageKey)
			list.push_back(rEntry.status);
	}

	return list;
}

namespace TestImage
{
	ByteBuffer Make(int width, int height, const String& rExtension)
	{
		cv::Mat image(height, width, CV_8UC3, cv::Scalar(90, 120, 60));

		// Edges, so the sharpness signal is well above zero.
		for (int x = 0; x < width; x += 16)
			cv::line(image, cv::Point(x, 0), cv::Point(x, height - 1), cv::Scalar(230, 230, 230), 2);

		cv::rectangle(image, cv::Point(width / 4, height / 4), cv::Point(width / 2, height / 2), cv::Scalar(20, 40, 200), cv::FILLED);

		std::vector<uchar> encoded;

		if (!cv::imencode(rExtension, image, encoded))
			throw ExceptionVA("Failed to encode the test image as \"%s\"!", rExtension.c_str());

		return ByteBuffer(encoded.begin(), encoded.end());
	}

	ByteBuffer AddExif(const ByteBuffer& rBytes, const String& rMake)
	{
		auto image = Exiv2::ImageFactory::open(rBytes.data(), rBytes.size());

		Exiv2::ExifData exif;

		exif["Exif.Image.Make"] = rMake;
		exif["Exif.Image.Model"] = "BTC-8E";
		exif["Exif.Photo.DateTimeOriginal"] = "2024:05:17 06:31:02";
		exif["Exif.Photo.ExposureTime"] = "1/250";
		exif["Exif.Photo.FNumber"] = "28/10";
		exif["Exif.Photo.ISOSpeedRatings"] = "400";
		exif["Exif.GPSInfo.GPSLatitudeRef"] = "N";
		exif["Exif.GPSInfo.GPSLatitude"] = "52/1 44/1 2580/100";
		exif["Exif.GPSInfo.GPSLongitudeRef"] = "W";
		exif["Exif.GPSInfo.GPSLongitude"] = "23/1 51/1 4032/100";
		exif["Exif.GPSInfo.GPSAltitudeRef"] = "0";
		exif["Exif.GPSInfo.GPSAltitude"] = "170/1";

		image->setExifData(exif);
		image->writeMetadata();

		auto& rIo = image->io();

		if (rIo.open() != 0)
			throw Exception("Failed to reopen the EXIF image buffer!");

		ByteBuffer output(rIo.size());
		rIo.read(output.data(), output.size());
		rIo.close();

		return output;
	}
}
