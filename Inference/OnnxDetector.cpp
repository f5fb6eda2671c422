#include <PCH.hpp>

#include "Inference/OnnxDetector.hpp"
#include "Inference/ImageCrop.hpp"

#include <opencv2/imgproc.hpp>

namespace
{
	constexpr F32 NmsThreshold = 0.45f;

	const DetectionType ClassTypes[] = { DetectionType::Animal, DetectionType::Person, DetectionType::Vehicle };

	cv::Mat Letterbox(const cv::Mat& rImage, int inputSize, F32& rScale, int& rPadX, int& rPadY)
	{
		rScale = std::min(static_cast<F32>(inputSize) / rImage.cols, static_cast<F32>(inputSize) / rImage.rows);

		const int width = std::max(1, static_cast<int>(rImage.cols * rScale));
		const int height = std::max(1, static_cast<int>(rImage.rows * rScale));

		cv::Mat resized;
		cv::resize(rImage, resized, cv::Size(width, height));

		rPadX = (inputSize - width) / 2;
		rPadY = (inputSize - height) / 2;

		cv::Mat padded;
		cv::copyMakeBorder(resized, padded, rPadY, inputSize - height - rPadY, rPadX, inputSize - width - rPadX,
			cv::BORDER_CONSTANT, cv::Scalar(114, 114, 114));

		return padded;
	}
}

OnnxDetector::OnnxDetector(const String& rModelPath, int inputSize)
	: mInputSize(inputSize)
{
	try
	{
		mNet = cv::dnn::readNetFromONNX(rModelPath);
	}
	catch (const cv::Exception& e)
	{
		throw ExceptionVA("Failed to load the detector model \"%s\"! (%s)", rModelPath.c_str(), e.what());
	}

	if (mNet.empty())
		throw ExceptionVA("Detector model \"%s\" is empty!", rModelPath.c_str());

	LOG_MESSAGE(Log::Channel::Inference, "ONNX detector loaded: %s", rModelPath.c_str());
}

void OnnxDetector::Run(const ByteBuffer& rImage, F32 threshold, Vector<DetectedObject>& rObjects)
{
	const cv::Mat image(ImageCrop::Decode(rImage));

	if (image.empty())
		throw PipelineException(ErrorKind::AdapterPermanent, false, "Detector input can't be decoded!");

	F32 scale;
	int padX, padY;

	const cv::Mat input(Letterbox(image, mInputSize, scale, padX, padY));
	const cv::Mat blob(cv::dnn::blobFromImage(input, 1.0 / 255.0, cv::Size(mInputSize, mInputSize), cv::Scalar(), true, false));

	cv::Mat output;

	try
	{
		std::lock_guard<std::mutex> lock(mMutex);

		mNet.setInput(blob);
		output = mNet.forward();
	}
	catch (const cv::Exception& e)
	{
		throw PipelineException(ErrorKind::AdapterPermanent, false, "Detector inference failed! (%s)", e.what());
	}

	// [1, N, 5 + classes]: cx, cy, w, h, objectness, class scores.
	if (output.dims != 3 || output.size[2] < 6)
		throw PipelineException(ErrorKind::AdapterPermanent, false, "Unexpected detector output shape!");

	const int numRows = output.size[1];
	const int numColumns = output.size[2];
	const int numClasses = std::min(numColumns - 5, static_cast<int>(sizeof(ClassTypes) / sizeof(ClassTypes[0])));

	const cv::Mat rows(numRows, numColumns, CV_32F, output.ptr<float>());

	std::vector<cv::Rect>	boxes;
	std::vector<float>		scores;
	std::vector<int>		classIds;

	for (int i = 0; i < numRows; ++i)
	{
		const float* pRow = rows.ptr<float>(i);

		int bestClass = 0;

		for (int c = 1; c < numClasses; ++c)
		{
			if (pRow[5 + c] > pRow[5 + bestClass])
				bestClass = c;
		}

		const float confidence = pRow[4] * pRow[5 + bestClass];

		if (confidence < threshold)
			continue;

		const float cx = (pRow[0] - padX) / scale;
		const float cy = (pRow[1] - padY) / scale;
		const float w = pRow[2] / scale;
		const float h = pRow[3] / scale;

		boxes.emplace_back(static_cast<int>(cx - w / 2), static_cast<int>(cy - h / 2), static_cast<int>(w), static_cast<int>(h));
		scores.push_back(confidence);
		classIds.push_back(bestClass);
	}

	std::vector<int> indices;
	cv::dnn::NMSBoxes(boxes, scores, threshold, NmsThreshold, indices);

	const cv::Rect imageRect(0, 0, image.cols, image.rows);

	for (int index : indices)
	{
		const cv::Rect box(boxes[index] & imageRect);

		if (box.area() == 0)
			continue;

		DetectedObject object;

		object.type = ClassTypes[classIds[index]];
		object.confidence = scores[index];
		object.box.x = static_cast<F32>(box.x) / image.cols;
		object.box.y = static_cast<F32>(box.y) / image.rows;
		object.box.w = static_cast<F32>(box.width) / image.cols;
		object.box.h = static_cast<F32>(box.height) / image.rows;

		rObjects.push_back(object);
	}
}
