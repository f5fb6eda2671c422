
#pragma once

#include "Inference/Detector.hpp"

#include <opencv2/dnn.hpp>

// YOLOv5 style ONNX export (class 0 animal, 1 person, 2 vehicle) run on OpenCV DNN.
class OnnxDetector : public Detector
{
public:
	// Throws Exception when the model can't be loaded.
	OnnxDetector(const String& rModelPath, int inputSize = 640);

	const char* GetName() const override { return "OnnxDetector"; }

protected:

	void Run(const ByteBuffer& rImage, F32 threshold, Vector<DetectedObject>& rObjects) override;

private:

	const int	mInputSize;

	// Net::forward is not reentrant.
	std::mutex		mMutex;
	cv::dnn::Net	mNet;
};
