
#pragma once

#include "Inference/Classifier.hpp"
#include "Catalog/CatalogSeeder.hpp"

#include <opencv2/dnn.hpp>

// Softmax species classifier (224x224 ImageNet normalized input) run on OpenCV DNN.
// Class indices are mapped to species by the taxonomy file.
class OnnxClassifier : public Classifier
{
public:
	// Throws Exception when the model can't be loaded.
	OnnxClassifier(const String& rModelPath, const Taxonomy& rTaxonomy);

	const char* GetName() const override { return "OnnxClassifier"; }

protected:

	void Run(const ByteBuffer& rCrop, F32 threshold, Vector<Model::SpeciesCandidate>& rCandidates) override;

private:

	const Taxonomy	mTaxonomy;

	std::mutex		mMutex;
	cv::dnn::Net	mNet;
};
