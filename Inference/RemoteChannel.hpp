
#pragma once

namespace tinyxml2 { class XMLDocument; class XMLElement; }

// Request / response exchange with a remote inference service.
//
// Every message starts with a packed header { mark (7), type, size }, "size" covering the whole message.
// Request:  header, request id (u32), threshold in permille (u16), payload size (u32), payload bytes.
// Response: header, echoed request id (u32), XML document.
class RemoteChannel
{
public:
	enum class MessageType : U8
	{
		Detect = 2,
		Classify = 3,
		Result = 4
	};

	RemoteChannel(const String& rAddress, U16 port, U32 timeoutSec);

	// One connection per call. Connection, send and receive failures and timeouts are
	// AdapterTransient; a response that breaks the framing is AdapterPermanent.
	String Exchange(MessageType type, F32 threshold, const ByteBuffer& rPayload);

	// "Root" element of a response. Error responses (<Root error=".." retryable="0|1"/>) and
	// malformed documents are thrown as PipelineException.
	static const tinyxml2::XMLElement* GetRoot(tinyxml2::XMLDocument& rDocument, const String& rXML);

	auto& GetAddress() const { return mAddress; }
	auto GetPort() const { return mPort; }

private:

	static constexpr U32 MaxResponseSize = 16 * 1024 * 1024;

	const String	mAddress;
	const U16		mPort;
	const U32		mTimeoutSec;

	std::atomic<U32> mRequestIdCounter{ 0 };
};
