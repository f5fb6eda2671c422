#include <PCH.hpp>

#include "Inference/RemoteClassifier.hpp"

#include <tinyxml2.h>

RemoteClassifier::RemoteClassifier(const String& rAddress, U16 port, U32 timeoutSec)
	: mChannel(rAddress, port, timeoutSec)
{
	LOG_MESSAGE(Log::Channel::Inference, "Remote classifier: %s:%u", rAddress.c_str(), port);
}

void RemoteClassifier::Run(const ByteBuffer& rCrop, F32 threshold, Vector<Model::SpeciesCandidate>& rCandidates)
{
	const String xml(mChannel.Exchange(RemoteChannel::MessageType::Classify, threshold, rCrop));

	ParseResponse(xml, rCandidates);
}

void RemoteClassifier::ParseResponse(const String& rXML, Vector<Model::SpeciesCandidate>& rCandidates)
{
	tinyxml2::XMLDocument xml;

	auto pRootElement = RemoteChannel::GetRoot(xml, rXML);

	for (auto pSpeciesElement = pRootElement->FirstChildElement("Species"); pSpeciesElement; pSpeciesElement = pSpeciesElement->NextSiblingElement("Species"))
	{
		const char* pScientificName = pSpeciesElement->Attribute("scientificName");

		Model::SpeciesCandidate candidate;

		if (!pScientificName || pSpeciesElement->QueryFloatAttribute("probability", &candidate.confidence) != tinyxml2::XML_SUCCESS)
			throw PipelineException(ErrorKind::AdapterPermanent, false, "Species element is missing attributes!");

		candidate.scientificName = pScientificName;

		if (const char* pCommonName = pSpeciesElement->Attribute("commonName"))
			candidate.commonName = pCommonName;

		rCandidates.push_back(candidate);
	}
}
