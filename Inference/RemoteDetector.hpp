
#pragma once

#include "Inference/Detector.hpp"
#include "Inference/RemoteChannel.hpp"

class RemoteDetector : public Detector
{
public:
	RemoteDetector(const String& rAddress, U16 port, U32 timeoutSec);

	const char* GetName() const override { return "RemoteDetector"; }

	// <Root><Result><Object name="animal" probability="0.93" x=".." y=".." w=".." h=".."/></Result></Root>
	static void ParseResponse(const String& rXML, Vector<DetectedObject>& rObjects);

protected:

	void Run(const ByteBuffer& rImage, F32 threshold, Vector<DetectedObject>& rObjects) override;

private:

	RemoteChannel mChannel;
};
