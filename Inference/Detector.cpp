#include <PCH.hpp>

#include "Inference/Detector.hpp"

#include <cmath>

void ValidateThreshold(F32 threshold, const char* pAdapterName)
{
	if (!(threshold >= 0.0f && threshold <= 1.0f))
		throw PipelineException(ErrorKind::AdapterPermanent, false, "%s: confidence threshold %f is outside [0,1]!", pAdapterName, threshold);
}

auto Detector::Detect(const ByteBuffer& rImage, F32 threshold) -> Vector<DetectedObject>
{
	ValidateThreshold(threshold, GetName());

	if (rImage.empty())
		throw PipelineException(ErrorKind::AdapterPermanent, false, "%s: empty image!", GetName());

	Vector<DetectedObject> objects;

	Run(rImage, threshold, objects);

	Vector<DetectedObject> list;
	list.reserve(objects.size());

	for (const auto& rObject : objects)
	{
		if (std::isnan(rObject.confidence) || rObject.confidence > 1.0f)
		{
			LOG_WARNING(Log::Channel::Inference, "%s: dropping %s with invalid confidence %f.", GetName(), Model::ToString(rObject.type), rObject.confidence);
			continue;
		}

		if (rObject.confidence < threshold)
			continue;

		if (!rObject.box.IsNormalized())
		{
			LOG_WARNING(Log::Channel::Inference, "%s: dropping %s with invalid box (%f, %f, %f, %f).", GetName(), Model::ToString(rObject.type),
				rObject.box.x, rObject.box.y, rObject.box.w, rObject.box.h);
			continue;
		}

		list.push_back(rObject);
	}

	LOG_DEBUG(Log::Channel::Inference, "%s: %zu of %zu objects at threshold %.2f.", GetName(), list.size(), objects.size(), threshold);

	return list;
}
