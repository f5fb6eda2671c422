#include <PCH.hpp>

#include "Inference/Classifier.hpp"
#include "Inference/Detector.hpp"

#include <cmath>

auto Classifier::Classify(const ByteBuffer& rCrop, F32 threshold) -> Vector<Model::SpeciesCandidate>
{
	ValidateThreshold(threshold, GetName());

	if (rCrop.empty())
		throw PipelineException(ErrorKind::AdapterPermanent, false, "%s: empty crop!", GetName());

	Vector<Model::SpeciesCandidate> candidates;

	Run(rCrop, threshold, candidates);

	candidates.erase(std::remove_if(candidates.begin(), candidates.end(), [threshold](const Model::SpeciesCandidate& r)
	{
		return r.scientificName.empty() || std::isnan(r.confidence) || r.confidence > 1.0f || r.confidence < threshold;
	}), candidates.end());

	std::stable_sort(candidates.begin(), candidates.end(), [](const Model::SpeciesCandidate& a, const Model::SpeciesCandidate& b)
	{
		return a.confidence > b.confidence;
	});

	if (candidates.size() > MaxSpeciesCandidates)
		candidates.resize(MaxSpeciesCandidates);

	if (candidates.empty())
		LOG_DEBUG(Log::Channel::Inference, "%s: no species above threshold %.2f.", GetName(), threshold);
	else
		LOG_DEBUG(Log::Channel::Inference, "%s: top species %s (%.3f).", GetName(), candidates.front().scientificName.c_str(), candidates.front().confidence);

	return candidates;
}
