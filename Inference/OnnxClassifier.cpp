#include <PCH.hpp>

#include "Inference/OnnxClassifier.hpp"
#include "Inference/ImageCrop.hpp"

#include <cmath>

#include <opencv2/imgproc.hpp>

namespace
{
	constexpr int ResizeSize = 256;
	constexpr int InputSize = 224;

	// Resize the shorter side to 256, center crop 224, RGB, ImageNet mean/std.
	cv::Mat Preprocess(const cv::Mat& rImage)
	{
		const F64 scale = static_cast<F64>(ResizeSize) / std::min(rImage.cols, rImage.rows);

		cv::Mat resized;
		cv::resize(rImage, resized, cv::Size(std::max(InputSize, static_cast<int>(std::lround(rImage.cols * scale))),
			std::max(InputSize, static_cast<int>(std::lround(rImage.rows * scale)))));

		const cv::Rect center((resized.cols - InputSize) / 2, (resized.rows - InputSize) / 2, InputSize, InputSize);

		cv::Mat rgb;
		cv::cvtColor(resized(center), rgb, cv::COLOR_BGR2RGB);

		cv::Mat input;
		rgb.convertTo(input, CV_32FC3, 1.0 / 255.0);

		cv::subtract(input, cv::Scalar(0.485, 0.456, 0.406), input);
		cv::divide(input, cv::Scalar(0.229, 0.224, 0.225), input);

		return cv::dnn::blobFromImage(input);
	}
}

OnnxClassifier::OnnxClassifier(const String& rModelPath, const Taxonomy& rTaxonomy)
	: mTaxonomy(rTaxonomy)
{
	try
	{
		mNet = cv::dnn::readNetFromONNX(rModelPath);
	}
	catch (const cv::Exception& e)
	{
		throw ExceptionVA("Failed to load the classifier model \"%s\"! (%s)", rModelPath.c_str(), e.what());
	}

	if (mNet.empty())
		throw ExceptionVA("Classifier model \"%s\" is empty!", rModelPath.c_str());

	LOG_MESSAGE(Log::Channel::Inference, "ONNX classifier loaded: %s (%zu species)", rModelPath.c_str(), mTaxonomy.size());
}

void OnnxClassifier::Run(const ByteBuffer& rCrop, F32 threshold, Vector<Model::SpeciesCandidate>& rCandidates)
{
	const cv::Mat image(ImageCrop::Decode(rCrop));

	if (image.empty())
		throw PipelineException(ErrorKind::AdapterPermanent, false, "Classifier input can't be decoded!");

	const cv::Mat blob(Preprocess(image));

	cv::Mat output;

	try
	{
		std::lock_guard<std::mutex> lock(mMutex);

		mNet.setInput(blob);
		output = mNet.forward();
	}
	catch (const cv::Exception& e)
	{
		throw PipelineException(ErrorKind::AdapterPermanent, false, "Classifier inference failed! (%s)", e.what());
	}

	const cv::Mat logits(output.reshape(1, 1));

	if (logits.empty())
		throw PipelineException(ErrorKind::AdapterPermanent, false, "Classifier returned no scores!");

	// Softmax.
	double maxLogit;
	cv::minMaxLoc(logits, nullptr, &maxLogit);

	cv::Mat probabilities;
	cv::exp(logits - maxLogit, probabilities);
	probabilities /= cv::sum(probabilities)[0];

	const int numClasses = probabilities.cols;

	Vector<int> order(static_cast<size_t>(numClasses));
	for (int i = 0; i < numClasses; ++i)
		order[i] = i;

	const auto topCount = std::min(static_cast<size_t>(numClasses), MaxSpeciesCandidates);
	const float* pProbabilities = probabilities.ptr<float>(0);

	std::partial_sort(order.begin(), order.begin() + topCount, order.end(), [pProbabilities](int a, int b)
	{
		return pProbabilities[a] > pProbabilities[b];
	});

	for (size_t i = 0; i < topCount; ++i)
	{
		const auto classIndex = static_cast<U32>(order[i]);

		Model::SpeciesCandidate candidate;

		candidate.confidence = pProbabilities[classIndex];

		auto it = mTaxonomy.find(classIndex);

		if (it != mTaxonomy.end())
		{
			candidate.scientificName = it->second.scientificName;
			candidate.commonName = it->second.commonName;
		}
		else
		{
			candidate.scientificName = "Unknown_" + std::to_string(classIndex);
			candidate.commonName = "Unknown";
		}

		rCandidates.push_back(candidate);
	}
}
