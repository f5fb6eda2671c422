#include <PCH.hpp>

#include "Metadata/MetadataExtractor.hpp"

#include <cmath>
#include <cstring>

#include "Utils.hpp"

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <opencv2/imgcodecs.hpp>

#include <exiv2/exiv2.hpp>

namespace
{
	constexpr F64 SharpnessScale = 500.0;

	bool HasPrefix(const U8* pData, size_t size, const char* pMagic, size_t magicSize, size_t offset = 0)
	{
		if (size < offset + magicSize)
			return false;

		return memcmp(pData + offset, pMagic, magicSize) == 0;
	}

	// "2019:03:14 09:50:09" -> "2019-03-14 09:50:09"
	bool ParseExifDateTime(const String& rValue, String& rDateTime)
	{
		int year, month, day, hour, minute, second;

		if (sscanf(rValue.c_str(), "%4d:%2d:%2d %2d:%2d:%2d", &year, &month, &day, &hour, &minute, &second) != 6)
			return false;

		if (year < 1970 || month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60)
			return false;

		char buffer[32];
		snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d %02d:%02d:%02d", year, month, day, hour, minute, second);

		rDateTime = buffer;
		return true;
	}

	F64 RationalToDouble(const Exiv2::Rational& r)
	{
		return r.second == 0 ? 0.0 : static_cast<F64>(r.first) / static_cast<F64>(r.second);
	}

	// Degrees, minutes and seconds stored as three rationals.
	bool ReadCoordinate(const Exiv2::ExifData& rData, const char* pKey, const char* pRefKey, char negativeRef, F64& rValue)
	{
		auto it = rData.findKey(Exiv2::ExifKey(pKey));

		if (it == rData.end() || it->count() < 3)
			return false;

		auto refIt = rData.findKey(Exiv2::ExifKey(pRefKey));

		if (refIt == rData.end())
			return false;

		const auto& rValueData = it->value();

		rValue = RationalToDouble(rValueData.toRational(0))
			+ RationalToDouble(rValueData.toRational(1)) / 60.0
			+ RationalToDouble(rValueData.toRational(2)) / 3600.0;

		const String ref(refIt->toString());

		if (!ref.empty() && ref[0] == negativeRef)
			rValue = -rValue;

		return true;
	}

	bool FindString(const Exiv2::ExifData& rData, const char* pKey, String& rValue)
	{
		auto it = rData.findKey(Exiv2::ExifKey(pKey));

		if (it == rData.end())
			return false;

		// EXIF ASCII fields carry whatever bytes the camera firmware wrote.
		rValue = Utils::ToValidUtf8(Utils::Trim(it->toString()));
		return !rValue.empty();
	}
}

namespace Metadata
{
	auto DetectFormat(const U8* pData, size_t size) -> String
	{
		if (HasPrefix(pData, size, "\xFF\xD8\xFF", 3))
			return "jpeg";

		if (HasPrefix(pData, size, "\x89PNG\r\n\x1A\n", 8))
			return "png";

		if (HasPrefix(pData, size, "II*\0", 4) || HasPrefix(pData, size, "MM\0*", 4))
			return "tiff";

		if (HasPrefix(pData, size, "BM", 2))
			return "bmp";

		if (HasPrefix(pData, size, "RIFF", 4) && HasPrefix(pData, size, "WEBP", 4, 8))
			return "webp";

		return String();
	}

	auto Extract(const ByteBuffer& rBytes, Model::ImageMetadata& rMetadata, cv::Mat* pDecoded) -> void
	{
		if (rBytes.empty())
			throw PipelineException(ErrorKind::Decode, false, "Image is empty!");

		rMetadata.format = DetectFormat(rBytes.data(), rBytes.size());

		if (rMetadata.format.empty())
			throw PipelineException(ErrorKind::UnsupportedFormat, false, "Unsupported image format! (%zu bytes)", rBytes.size());

		cv::Mat image;

		try
		{
			image = cv::imdecode(cv::Mat(1, static_cast<int>(rBytes.size()), CV_8UC1, const_cast<U8*>(rBytes.data())), cv::IMREAD_COLOR);
		}
		catch (const cv::Exception& e)
		{
			throw PipelineException(ErrorKind::Decode, false, "Image decode failed! (%s)", e.what());
		}

		if (image.empty())
			throw PipelineException(ErrorKind::Decode, false, "Image can't be decoded! (format: %s, %zu bytes)", rMetadata.format.c_str(), rBytes.size());

		rMetadata.width = static_cast<U32>(image.cols);
		rMetadata.height = static_cast<U32>(image.rows);

		ReadExif(rBytes, rMetadata);
		ComputeQuality(image, rMetadata);

		if (pDecoded)
			*pDecoded = std::move(image);
	}

	auto ReadExif(const ByteBuffer& rBytes, Model::ImageMetadata& rMetadata) -> void
	{
		static std::once_flag logLevelFlag;

		// Exiv2 prints its own warnings to stderr otherwise.
		std::call_once(logLevelFlag, []() { Exiv2::LogMsg::setLevel(Exiv2::LogMsg::mute); });

		try
		{
			auto image = Exiv2::ImageFactory::open(rBytes.data(), rBytes.size());

			if (!image.get())
				return;

			image->readMetadata();

			const auto& rData = image->exifData();

			if (rData.empty())
			{
				LOG_DEBUG(Log::Channel::Metadata, "No EXIF block.");
				return;
			}

			String value;

			if ((FindString(rData, "Exif.Photo.DateTimeOriginal", value) || FindString(rData, "Exif.Image.DateTime", value))
				&& ParseExifDateTime(value, rMetadata.capturedAt))
			{
				rMetadata.hasCapturedAt = true;
			}

			FindString(rData, "Exif.Image.Make", rMetadata.cameraMake);
			FindString(rData, "Exif.Image.Model", rMetadata.cameraModel);

			if (ReadCoordinate(rData, "Exif.GPSInfo.GPSLatitude", "Exif.GPSInfo.GPSLatitudeRef", 'S', rMetadata.gpsLatitude)
				&& ReadCoordinate(rData, "Exif.GPSInfo.GPSLongitude", "Exif.GPSInfo.GPSLongitudeRef", 'W', rMetadata.gpsLongitude))
			{
				rMetadata.hasGps = true;
			}

			auto altitudeIt = rData.findKey(Exiv2::ExifKey("Exif.GPSInfo.GPSAltitude"));

			if (altitudeIt != rData.end() && altitudeIt->count() > 0)
			{
				rMetadata.gpsAltitude = RationalToDouble(altitudeIt->value().toRational(0));
				rMetadata.hasGpsAltitude = true;

				// Ref 1 means below sea level.
				auto refIt = rData.findKey(Exiv2::ExifKey("Exif.GPSInfo.GPSAltitudeRef"));

				if (refIt != rData.end() && refIt->toString() == "1")
					rMetadata.gpsAltitude = -rMetadata.gpsAltitude;
			}

			static const std::pair<const char*, const char*> tags[] =
			{
				{ "Exif.Photo.ExposureTime",	"exposuretime" },
				{ "Exif.Photo.FNumber",			"fnumber" },
				{ "Exif.Photo.ISOSpeedRatings",	"iso" },
				{ "Exif.Photo.FocalLength",		"focallength" }
			};

			for (const auto& rTag : tags)
			{
				if (FindString(rData, rTag.first, value))
					rMetadata.exifTags[rTag.second] = value;
			}

			if (!rMetadata.cameraMake.empty())
				rMetadata.exifTags["camera_make"] = rMetadata.cameraMake;

			if (!rMetadata.cameraModel.empty())
				rMetadata.exifTags["camera_model"] = rMetadata.cameraModel;
		}
		catch (const Exiv2::Error& e)
		{
			LOG_WARNING(Log::Channel::Metadata, "EXIF read failed: %s", e.what());
		}
	}

	auto ComputeQuality(const cv::Mat& rImage, Model::ImageMetadata& rMetadata) -> void
	{
		cv::Mat grey;

		if (rImage.channels() == 1)
			grey = rImage;
		else
			cv::cvtColor(rImage, grey, cv::COLOR_BGR2GRAY);

		const F64 brightness = cv::mean(grey)[0] / 255.0;

		// 3x3 aperture: [0 1 0; 1 -4 1; 0 1 0].
		cv::Mat laplacian;
		cv::Laplacian(grey, laplacian, CV_64F);

		cv::Scalar mean, deviation;
		cv::meanStdDev(laplacian, mean, deviation);

		const F64 sharpness = std::min(deviation[0] * deviation[0] / SharpnessScale, 1.0);

		rMetadata.brightness = static_cast<F32>(brightness);
		rMetadata.sharpness = static_cast<F32>(sharpness);
		rMetadata.quality = static_cast<F32>((1.0 - std::fabs(brightness - 0.5) * 2.0) * 0.3 + sharpness * 0.7);
	}
}
