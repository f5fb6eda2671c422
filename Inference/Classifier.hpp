
#pragma once

#include "Model/Records.hpp"

constexpr size_t MaxSpeciesCandidates = 5;

// Species classifier for one cropped animal region.
class Classifier
{
public:
	virtual ~Classifier() = default;

	// At most MaxSpeciesCandidates candidates with confidence >= "threshold", best first.
	// Empty when nothing clears the threshold.
	// Throws PipelineException (AdapterTransient, AdapterPermanent).
	Vector<Model::SpeciesCandidate> Classify(const ByteBuffer& rCrop, F32 threshold);

	virtual const char* GetName() const = 0;

protected:

	// Candidates in any order; filtering and ranking is done by Classify.
	virtual void Run(const ByteBuffer& rCrop, F32 threshold, Vector<Model::SpeciesCandidate>& rCandidates) = 0;
};
