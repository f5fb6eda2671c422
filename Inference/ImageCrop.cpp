#include <PCH.hpp>

#include "Inference/ImageCrop.hpp"

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

namespace ImageCrop
{
	void GetRegion(int imageWidth, int imageHeight, const Model::BoundingBox& rBox, F32 padding, int& rX, int& rY, int& rWidth, int& rHeight)
	{
		const int x = static_cast<int>(rBox.x * imageWidth);
		const int y = static_cast<int>(rBox.y * imageHeight);
		const int width = static_cast<int>(rBox.w * imageWidth);
		const int height = static_cast<int>(rBox.h * imageHeight);

		const int padX = static_cast<int>(width * padding);
		const int padY = static_cast<int>(height * padding);

		const int left = std::max(0, x - padX);
		const int top = std::max(0, y - padY);
		const int right = std::min(imageWidth, x + width + padX);
		const int bottom = std::min(imageHeight, y + height + padY);

		rX = left;
		rY = top;
		rWidth = std::max(0, right - left);
		rHeight = std::max(0, bottom - top);
	}

	ByteBuffer Crop(const cv::Mat& rImage, const Model::BoundingBox& rBox, F32 padding)
	{
		int x, y, width, height;

		GetRegion(rImage.cols, rImage.rows, rBox, padding, x, y, width, height);

		if (width == 0 || height == 0)
			throw PipelineException(ErrorKind::Decode, false, "Empty crop region (%f, %f, %f, %f) of %dx%d image!", rBox.x, rBox.y, rBox.w, rBox.h, rImage.cols, rImage.rows);

		const cv::Mat region(rImage, cv::Rect(x, y, width, height));

		ByteBuffer buffer;
		bool isEncoded = false;

		try
		{
			isEncoded = cv::imencode(".jpg", region, buffer, { cv::IMWRITE_JPEG_QUALITY, JpegQuality });
		}
		catch (const cv::Exception& e)
		{
			LOG_ERROR(Log::Channel::Inference, "Crop encode failed: %s", e.what());
		}

		if (!isEncoded)
			throw PipelineException(ErrorKind::Decode, false, "Failed to encode %dx%d crop!", width, height);

		return buffer;
	}

	cv::Mat Decode(const ByteBuffer& rBytes)
	{
		if (rBytes.empty())
			return cv::Mat();

		try
		{
			return cv::imdecode(rBytes, cv::IMREAD_COLOR);
		}
		catch (const cv::Exception& e)
		{
			LOG_WARNING(Log::Channel::Inference, "Image decode failed: %s", e.what());
		}

		return cv::Mat();
	}
}
