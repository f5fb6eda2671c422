
#pragma once

#include "Model/Records.hpp"

namespace cv { class Mat; }

namespace Metadata
{
	// "jpeg", "png", "tiff", "bmp" or "webp" from the leading magic bytes. Empty when unknown.
	String DetectFormat(const U8* pData, size_t size);

	// Decodes the image and fills dimensions, EXIF fields and the quality signals.
	// Missing or broken EXIF leaves the optional fields unset; only undecodable bytes throw
	// (PipelineException, ErrorKind::UnsupportedFormat or ErrorKind::Decode).
	// "pDecoded" receives the decoded BGR image when given.
	void Extract(const ByteBuffer& rBytes, Model::ImageMetadata& rMetadata, cv::Mat* pDecoded = nullptr);

	// Fills "hasCapturedAt", GPS, make/model and the raw tag subset. Never throws.
	void ReadExif(const ByteBuffer& rBytes, Model::ImageMetadata& rMetadata);

	// Brightness is the mean grey level in [0,1], sharpness the Laplacian variance / 500 clamped to 1.
	void ComputeQuality(const cv::Mat& rImage, Model::ImageMetadata& rMetadata);
}
