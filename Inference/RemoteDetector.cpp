#include <PCH.hpp>

#include "Inference/RemoteDetector.hpp"

#include <tinyxml2.h>

RemoteDetector::RemoteDetector(const String& rAddress, U16 port, U32 timeoutSec)
	: mChannel(rAddress, port, timeoutSec)
{
	LOG_MESSAGE(Log::Channel::Inference, "Remote detector: %s:%u", rAddress.c_str(), port);
}

void RemoteDetector::Run(const ByteBuffer& rImage, F32 threshold, Vector<DetectedObject>& rObjects)
{
	const String xml(mChannel.Exchange(RemoteChannel::MessageType::Detect, threshold, rImage));

	ParseResponse(xml, rObjects);
}

void RemoteDetector::ParseResponse(const String& rXML, Vector<DetectedObject>& rObjects)
{
	tinyxml2::XMLDocument xml;

	auto pRootElement = RemoteChannel::GetRoot(xml, rXML);

	for (auto pResultElement = pRootElement->FirstChildElement("Result"); pResultElement; pResultElement = pResultElement->NextSiblingElement("Result"))
	{
		for (auto pObjectElement = pResultElement->FirstChildElement("Object"); pObjectElement; pObjectElement = pObjectElement->NextSiblingElement("Object"))
		{
			const char* pName = pObjectElement->Attribute("name");

			DetectedObject object;

			if (!pName || !Model::FromString(pName, object.type))
			{
				LOG_WARNING(Log::Channel::Inference, "Ignoring object of unknown class \"%s\".", pName ? pName : "");
				continue;
			}

			if (pObjectElement->QueryFloatAttribute("probability", &object.confidence) != tinyxml2::XML_SUCCESS
				|| pObjectElement->QueryFloatAttribute("x", &object.box.x) != tinyxml2::XML_SUCCESS
				|| pObjectElement->QueryFloatAttribute("y", &object.box.y) != tinyxml2::XML_SUCCESS
				|| pObjectElement->QueryFloatAttribute("w", &object.box.w) != tinyxml2::XML_SUCCESS
				|| pObjectElement->QueryFloatAttribute("h", &object.box.h) != tinyxml2::XML_SUCCESS)
			{
				throw PipelineException(ErrorKind::AdapterPermanent, false, "Detection object \"%s\" is missing attributes!", pName);
			}

			rObjects.push_back(object);
		}
	}
}
