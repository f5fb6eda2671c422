#include "PCH.hpp"

#include "Inference/ImageCrop.hpp"

#include <gtest/gtest.h>

#include <opencv2/core.hpp>

class ImageCropTests : public ::testing::Test
{
protected:
	void SetUp() override
	{
		mImage = cv::Mat(100, 200, CV_8UC3, cv::Scalar(40, 80, 120));
	}

	void TearDown() override {}

	static Model::BoundingBox MakeBox(F32 x, F32 y, F32 w, F32 h)
	{
		Model::BoundingBox box;

		box.x = x;
		box.y = y;
		box.w = w;
		box.h = h;

		return box;
	}

	cv::Mat mImage;
};

TEST_F(ImageCropTests, RegionIsPaddedOnEachSide)
{
	int x, y, width, height;

	ImageCrop::GetRegion(200, 100, MakeBox(0.25f, 0.2f, 0.5f, 0.5f), 0.1f, x, y, width, height);

	ASSERT_EQ(x, 40);
	ASSERT_EQ(y, 15);
	ASSERT_EQ(width, 120);
	ASSERT_EQ(height, 60);
}

TEST_F(ImageCropTests, RegionIsClampedToTheImage)
{
	int x, y, width, height;

	ImageCrop::GetRegion(200, 100, MakeBox(0.75f, 0.0f, 0.5f, 1.0f), 0.1f, x, y, width, height);

	ASSERT_EQ(x, 140);
	ASSERT_EQ(y, 0);
	ASSERT_EQ(width, 60);
	ASSERT_EQ(height, 100);
}

TEST_F(ImageCropTests, CropIsAJpegOfTheRegion)
{
	const auto bytes = ImageCrop::Crop(mImage, MakeBox(0.25f, 0.2f, 0.5f, 0.5f), 0.1f);

	ASSERT_GT(bytes.size(), 3u);
	ASSERT_EQ(bytes[0], 0xFF);
	ASSERT_EQ(bytes[1], 0xD8);

	const auto decoded = ImageCrop::Decode(bytes);

	ASSERT_EQ(decoded.cols, 120);
	ASSERT_EQ(decoded.rows, 60);
}

TEST_F(ImageCropTests, EmptyRegionThrows)
{
	try
	{
		ImageCrop::Crop(mImage, MakeBox(1.0f, 0.5f, 0.0f, 0.2f), 0.1f);
		FAIL() << "Empty region cropped.";
	}
	catch (const PipelineException& e)
	{
		ASSERT_EQ(e.GetKind(), ErrorKind::Decode);
	}
}

TEST_F(ImageCropTests, DecodeOfGarbageIsEmpty)
{
	ASSERT_TRUE(ImageCrop::Decode(ByteBuffer()).empty());
	ASSERT_TRUE(ImageCrop::Decode(ByteBuffer(64, 0x13)).empty());
}
