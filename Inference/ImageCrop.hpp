
#pragma once

#include "Model/Records.hpp"

namespace cv { class Mat; }

namespace ImageCrop
{
	constexpr int JpegQuality = 95;

	// Pixel rectangle of "rBox", grown by "padding" (fraction of the box size) on each side
	// and clamped to the image. Empty when nothing of the box lies inside the image.
	void GetRegion(int imageWidth, int imageHeight, const Model::BoundingBox& rBox, F32 padding, int& rX, int& rY, int& rWidth, int& rHeight);

	// Padded region of "rImage" re-encoded as JPEG. Throws PipelineException (Decode) when the region is empty.
	ByteBuffer Crop(const cv::Mat& rImage, const Model::BoundingBox& rBox, F32 padding);

	// Decodes "rBytes" with OpenCV. Empty Mat on failure.
	cv::Mat Decode(const ByteBuffer& rBytes);
}
