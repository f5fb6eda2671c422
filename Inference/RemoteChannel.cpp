#include <PCH.hpp>

#include "Inference/RemoteChannel.hpp"

#include "Socket.hpp"

#include <cmath>

#include <tinyxml2.h>

namespace
{
	constexpr U8 HeaderMark = 7;

#pragma pack(push, 1)
	struct Header
	{
		U8	mark = HeaderMark;
		U8	type = 0;
		U32	size = 0;
	};

	struct Request
	{
		Header	header;
		U32		requestId = 0;
		U16		thresholdPermille = 0;
		U32		payloadSize = 0;

		// ... payload follows.
	};

	struct Response
	{
		Header	header;
		U32		requestId = 0;

		// ... XML follows.
	};
#pragma pack(pop)
}

RemoteChannel::RemoteChannel(const String& rAddress, U16 port, U32 timeoutSec)
	: mAddress(rAddress)
	, mPort(port)
	, mTimeoutSec(timeoutSec)
{ }

auto RemoteChannel::Exchange(MessageType type, F32 threshold, const ByteBuffer& rPayload) -> String
{
	Request request;

	request.header.type = static_cast<U8>(type);
	request.header.size = static_cast<U32>(sizeof(Request) + rPayload.size());
	request.requestId = ++mRequestIdCounter;
	request.thresholdPermille = static_cast<U16>(std::lround(threshold * 1000.0f));
	request.payloadSize = static_cast<U32>(rPayload.size());

	SocketId socketId = INVALID_SOCKET;
	String xml;

	try
	{
		socketId = Socket::Connect(mAddress, mPort, mTimeoutSec);

		Socket::Send(socketId, reinterpret_cast<const char*>(&request), sizeof(Request));
		Socket::Send(socketId, reinterpret_cast<const char*>(rPayload.data()), static_cast<ssize_t>(rPayload.size()));

		Response response;

		if (!Socket::Read(socketId, reinterpret_cast<char*>(&response), sizeof(Response)))
			throw PipelineException(ErrorKind::AdapterTransient, true, "No response from %s:%u within %u s!", mAddress.c_str(), mPort, mTimeoutSec);

		if (response.header.mark != HeaderMark
			|| response.header.type != static_cast<U8>(MessageType::Result)
			|| response.header.size < sizeof(Response)
			|| response.header.size > MaxResponseSize)
		{
			throw PipelineException(ErrorKind::AdapterPermanent, false, "Malformed response header from %s:%u! (mark: %u, type: %u, size: %u)",
				mAddress.c_str(), mPort, response.header.mark, response.header.type, response.header.size);
		}

		if (response.requestId != request.requestId)
			throw PipelineException(ErrorKind::AdapterPermanent, false, "Response for request %u, expected %u!", response.requestId, request.requestId);

		xml.resize(response.header.size - sizeof(Response));

		if (!xml.empty() && !Socket::Read(socketId, &xml[0], xml.size()))
			throw PipelineException(ErrorKind::AdapterTransient, true, "Incomplete response from %s:%u!", mAddress.c_str(), mPort);
	}
	catch (const PipelineException&)
	{
		Socket::Close(socketId);
		throw;
	}
	catch (const Exception& e)
	{
		Socket::Close(socketId);
		throw PipelineException(ErrorKind::AdapterTransient, true, "%s", e.GetText());
	}

	Socket::Close(socketId);

	return xml;
}

auto RemoteChannel::GetRoot(tinyxml2::XMLDocument& rDocument, const String& rXML) -> const tinyxml2::XMLElement*
{
	if (rDocument.Parse(rXML.c_str(), rXML.size()) != tinyxml2::XML_SUCCESS)
		throw PipelineException(ErrorKind::AdapterPermanent, false, "Failed to parse the response XML! (%s)", rDocument.ErrorStr());

	auto pRootElement = rDocument.FirstChildElement("Root");
	if (!pRootElement)
		throw PipelineException(ErrorKind::AdapterPermanent, false, "Response XML root element not found!");

	const char* pError = pRootElement->Attribute("error");

	if (pError)
	{
		const bool isRetryable = pRootElement->BoolAttribute("retryable", false);

		throw PipelineException(isRetryable ? ErrorKind::AdapterTransient : ErrorKind::AdapterPermanent, isRetryable,
			"Inference service error: %s", pError);
	}

	return pRootElement;
}
