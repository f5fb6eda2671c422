
#pragma once

#include "Inference/Classifier.hpp"
#include "Inference/RemoteChannel.hpp"

class RemoteClassifier : public Classifier
{
public:
	RemoteClassifier(const String& rAddress, U16 port, U32 timeoutSec);

	const char* GetName() const override { return "RemoteClassifier"; }

	// <Root><Species scientificName="Ursus arctos" commonName="Brown Bear" probability="0.91"/></Root>
	static void ParseResponse(const String& rXML, Vector<Model::SpeciesCandidate>& rCandidates);

protected:

	void Run(const ByteBuffer& rCrop, F32 threshold, Vector<Model::SpeciesCandidate>& rCandidates) override;

private:

	RemoteChannel mChannel;
};
