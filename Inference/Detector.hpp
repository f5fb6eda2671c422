
#pragma once

#include "Model/Records.hpp"

struct DetectedObject
{
	DetectionType		type = DetectionType::Animal;
	Model::BoundingBox	box;
	F32					confidence = 0.0f;
};

// Animal / person / vehicle detector with swappable backends.
class Detector
{
public:
	virtual ~Detector() = default;

	// Returns only objects with confidence >= "threshold" and a normalized box,
	// in the order the backend reported them. Overlapping boxes are kept as they are.
	// Throws PipelineException (AdapterTransient, AdapterPermanent).
	Vector<DetectedObject> Detect(const ByteBuffer& rImage, F32 threshold);

	virtual const char* GetName() const = 0;

protected:

	virtual void Run(const ByteBuffer& rImage, F32 threshold, Vector<DetectedObject>& rObjects) = 0;
};

// Throws PipelineException (AdapterPermanent) for a threshold outside [0,1].
void ValidateThreshold(F32 threshold, const char* pAdapterName);
