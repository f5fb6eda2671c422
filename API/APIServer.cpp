#include "PCH.hpp"

#include "Utils.hpp"
#include "Socket.hpp"

#include "API/APIServer.hpp"

#include "Pipeline/PipelineService.hpp"
#include "Statistics/StatisticsRefresher.hpp"

#include <nlohmann/json.hpp>

#include <sys/socket.h>
#include <netinet/in.h> // sockaddr_in
#include <arpa/inet.h>	// inet_ntoa

using json = nlohmann::json;

namespace
{
	const char* GetStatusText(U16 status)
	{
		switch (status)
		{
			case 200: return "OK";
			case 202: return "Accepted";
			case 400: return "Bad Request";
			case 404: return "Not Found";
			case 405: return "Method Not Allowed";
			case 413: return "Payload Too Large";
			case 500: return "Internal Server Error";
			case 503: return "Service Unavailable";
		}

		return "Unknown";
	}

	APIServer::Response MakeError(U16 status, const String& rMessage)
	{
		APIServer::Response response;

		response.status = status;
		response.body = json{ { "error", rMessage } }.dump(-1, ' ', false, json::error_handler_t::replace);

		return response;
	}

	APIServer::Response MakeAccepted(size_t numAccepted)
	{
		APIServer::Response response;

		response.status = 202;
		response.body = json{ { "accepted", numAccepted } }.dump();

		return response;
	}

	// "bucket=camtrap&key=a%2Fb.jpg"
	void ParseQuery(const String& rQuery, UnorderedMap<String, String>& rMap)
	{
		for (const auto& rToken : Utils::Split(rQuery, '&'))
		{
			if (rToken.empty())
				continue;

			auto pos = rToken.find_first_of('=');

			if (pos == String::npos)
				rMap[Utils::UrlDecode(rToken)] = String();
			else
				rMap[Utils::UrlDecode(rToken.substr(0, pos))] = Utils::UrlDecode(rToken.substr(pos + 1));
		}
	}
}

APIServer::APIServer(PipelineService& rService, StoreProvider& rStoreProvider, StatisticsRefresher& rRefresher)
	: mService(rService)
	, mStoreProvider(rStoreProvider)
	, mRefresher(rRefresher)
{ }

APIServer::~APIServer()
{
	for (auto& rSocketId : mClientSockets)
		Socket::Close(rSocketId);

	Socket::Close(mServerSocket);
}

bool APIServer::Start(U16 port)
{
	try
	{
		mServerSocket = Socket::CreateServer(port, 32);
	}
	catch (const Exception& e)
	{
		LOG_ERROR(Log::Channel::API, e.GetText());
		return false;
	}

	LOG_MESSAGE(Log::Channel::API, "API Server started. (Port %d)", port);
	return true;
}

void APIServer::Update()
{
	this->HandleNewConnection();

	if (mClientSockets.empty())
		return;

	const auto numClients = mClientSockets.size();
	const auto currentTP = std::chrono::steady_clock::now();

	for (size_t i = 0; i < numClients; ++i)
	{
		// Ignore free slots.
		if (mClientSockets.at(i) == INVALID_SOCKET)
			continue;

		this->HandleClient(static_cast<APIClientId>(i), currentTP);
	}
}

void APIServer::HandleNewConnection()
{
	sockaddr_in from;
	socklen_t	fromSize = sizeof(sockaddr_in);

	auto clientSocket = accept(mServerSocket, (sockaddr*)&from, &fromSize);

	if (clientSocket == INVALID_SOCKET)
		return;

	// Sockets are "blocking" by default, so set it to a "non-blocking".
	Socket::SetNonBlocking(clientSocket);

	{
		String	clientIPString = inet_ntoa(from.sin_addr);
		U16	clientPort = ntohs(from.sin_port);

		LOG_DEBUG(Log::Channel::API, "API connection from: %s:%d", clientIPString.c_str(), clientPort);
	}

	this->AddClient(clientSocket);
}

void APIServer::HandleClient(APIClientId clientId, const TimePoint& rCurrentTP)
{
	auto& rSocketId = mClientSockets.at(clientId);
	auto& rBuffer = mClientBuffers.at(clientId);

	//=============================================
	// Handle reads.
	static char readBuffer[4096];

	for (;;)
	{
		auto bytesRead = recv(rSocketId, readBuffer, sizeof(readBuffer), 0);

		if (bytesRead > 0)
		{
			rBuffer.append(readBuffer, static_cast<size_t>(bytesRead));

			// Enough to answer 413, the rest is never read.
			if (rBuffer.size() > MaxRequestSize)
				break;

			continue;
		}

		if (bytesRead == 0)
		{
			LOG_DEBUG(Log::Channel::API, "Client closed the connection.");
			this->ReleaseClient(clientId);
			return;
		}

		const int errorCode = Socket::GetErrorCode();

		if (errorCode == EINTR)
			continue;

		if (errorCode == EWOULDBLOCK || errorCode == EAGAIN)
			break;

		LOG_WARNING(Log::Channel::API, "Failed for \"recv\"! (Error: %s, Code: %d)", Socket::GetErrorString(errorCode), errorCode);
		this->ReleaseClient(clientId);
		return;
	}

	if (!rBuffer.empty())
	{
		Request request;
		Response response;

		auto result = ParseRequest(rBuffer, request);

		if (result == ParseResult::TooLarge)
			response = MakeError(413, "request too large");
		else if (result == ParseResult::Malformed)
			response = MakeError(400, "malformed request");
		else if (result == ParseResult::Complete)
		{
			try
			{
				response = this->HandleRequest(request);
			}
			catch (const Exception& e)
			{
				LOG_ERROR(Log::Channel::API, "Failed to handle \"%s\": %s", request.path.c_str(), e.GetText());
				response = MakeError(503, "service unavailable");
			}
			catch (const std::exception& e)
			{
				LOG_ERROR(Log::Channel::API, "Failed to handle \"%s\": %s", request.path.c_str(), e.what());
				response = MakeError(500, "internal error");
			}
		}

		if (result != ParseResult::Incomplete)
		{
			try
			{
				Socket::SendText(rSocketId, MakeHTTPResponse(response));
			}
			catch (const Exception& e)
			{
				LOG_WARNING(Log::Channel::API, "Failed to send the response: %s", e.GetText());
			}

			this->ReleaseClient(clientId);
			return;
		}
	}

	//=============================================
	// Handle timeouts.
	const auto& clientTP = mClientTimePoints.at(clientId);

	auto seconds = std::chrono::duration_cast<std::chrono::seconds>(rCurrentTP - clientTP).count();

	if (seconds > ClientTimeout)
	{
		LOG_WARNING(Log::Channel::API, "Client timeout. (Slot: %u)", clientId);

		this->ReleaseClient(clientId);
	}
}

void APIServer::ReleaseClient(APIClientId clientId)
{
	Socket::Close(mClientSockets.at(clientId));

	mClientBuffers.at(clientId).clear();

	// Allow slot to be re-used.
	mClientReleasedIds.push_back(clientId);
}

auto APIServer::HandleRequest(const Request& rRequest) -> Response
{
	LOG_MESSAGE(Log::Channel::API, "%s %s", rRequest.method.c_str(), rRequest.path.c_str());

	if (rRequest.path == "/events")
	{
		if (rRequest.method != "POST")
			return MakeError(405, "use POST");

		return this->HandleEvents(rRequest);
	}

	if (rRequest.method != "GET")
	{
		if (rRequest.path == "/upload" || rRequest.path == "/refresh-stats" || rRequest.path == "/status")
			return MakeError(405, "use GET");

		return MakeError(404, "unknown path");
	}

	if (rRequest.path == "/upload")
		return this->HandleUpload(rRequest);

	if (rRequest.path == "/refresh-stats")
	{
		mRefresher.RequestRefresh();
		return MakeAccepted(1);
	}

	if (rRequest.path == "/status")
		return this->HandleStatus(rRequest);

	LOG_WARNING(Log::Channel::API, "Received the unknown request: \"%s\"!", rRequest.path.c_str());

	return MakeError(404, "unknown path");
}

auto APIServer::HandleEvents(const Request& rRequest) -> Response
{
	Vector<UploadNotice> notices;

	if (!StorageEvent::Parse(rRequest.body, notices))
	{
		LOG_WARNING(Log::Channel::API, "Rejected a storage event that is not a notification.");
		return MakeError(400, "body is not a storage notification");
	}

	for (const auto& rNotice : notices)
		mService.Submit(rNotice);

	return MakeAccepted(notices.size());
}

auto APIServer::HandleUpload(const Request& rRequest) -> Response
{
	auto bucketIt = rRequest.query.find("bucket");
	auto keyIt = rRequest.query.find("key");

	if (bucketIt == rRequest.query.end() || bucketIt->second.empty()
		|| keyIt == rRequest.query.end() || keyIt->second.empty())
	{
		return MakeError(400, "\"bucket\" and \"key\" are required");
	}

	UploadNotice notice;

	notice.bucket = bucketIt->second;
	notice.key = keyIt->second;

	mService.Submit(notice);

	return MakeAccepted(1);
}

auto APIServer::HandleStatus(const Request& rRequest) -> Response
{
	auto keyIt = rRequest.query.find("key");

	if (keyIt == rRequest.query.end() || keyIt->second.empty())
		return MakeError(400, "\"key\" is required");

	Model::ImageRecord image;
	bool isFound = false;

	try
	{
		mStoreProvider.Run([&](Store& rStore) { isFound = rStore.FindImage(keyIt->second, image); });
	}
	catch (const Exception& e)
	{
		LOG_ERROR(Log::Channel::API, "Status lookup for \"%s\" failed: %s", keyIt->second.c_str(), e.GetText());
		return MakeError(500, "status lookup failed");
	}

	if (!isFound)
		return MakeError(404, "unknown key");

	json body =
	{
		{ "storage_key", image.storageKey },
		{ "processing_status", Model::ToString(image.status) },
		{ "error_message", nullptr },
		{ "detection_count", image.detectionCount },
	};

	if (!image.errorMessage.empty())
		body["error_message"] = image.errorMessage;

	Response response;
	response.body = body.dump(-1, ' ', false, json::error_handler_t::replace);

	return response;
}

// SAMPLE:
// "GET /status?key=proj%2Fcam%2Fimg.jpg HTTP/1.1\r\nHost: ..\r\n\r\n"
// "POST /events HTTP/1.1\r\nContent-Length: 123\r\n\r\n{...}"
auto APIServer::ParseRequest(const String& rData, Request& rRequest) -> ParseResult
{
	auto headerEnd = rData.find("\r\n\r\n");

	if (headerEnd == String::npos)
		return rData.size() > MaxRequestSize ? ParseResult::TooLarge : ParseResult::Incomplete;

	const auto lines = Utils::Split(rData.substr(0, headerEnd), '\n');

	if (lines.empty())
		return ParseResult::Malformed;

	// Request line.
	{
		const auto parts = Utils::Split(Utils::Trim(lines.front()), ' ');

		if (parts.size() != 3 || !Utils::StartsWith(parts[2], "HTTP/"))
			return ParseResult::Malformed;

		rRequest.method = parts[0];

		const auto& rTarget = parts[1];

		if (rTarget.empty() || rTarget.front() != '/')
			return ParseResult::Malformed;

		auto pos = rTarget.find_first_of('?');

		rRequest.path = rTarget.substr(0, pos);
		rRequest.query.clear();

		if (pos != String::npos)
			ParseQuery(rTarget.substr(pos + 1), rRequest.query);
	}

	size_t contentLength = 0;

	for (size_t i = 1; i < lines.size(); ++i)
	{
		const auto line = Utils::Trim(lines[i]);

		auto pos = line.find_first_of(':');

		if (pos == String::npos)
			continue;

		if (!Utils::IsEqual(Utils::Trim(line.substr(0, pos)), "Content-Length"))
			continue;

		const auto value = Utils::Trim(line.substr(pos + 1));

		if (value.empty() || !std::all_of(value.begin(), value.end(), [](char c) { return c >= '0' && c <= '9'; }))
			return ParseResult::Malformed;

		if (!Utils::StringTo(value.c_str(), contentLength))
			return ParseResult::Malformed;
	}

	const auto bodyStart = headerEnd + 4;

	if (contentLength > MaxRequestSize || bodyStart + contentLength > MaxRequestSize)
		return ParseResult::TooLarge;

	if (rData.size() - bodyStart < contentLength)
		return ParseResult::Incomplete;

	rRequest.body = rData.substr(bodyStart, contentLength);

	return ParseResult::Complete;
}

String APIServer::MakeHTTPResponse(const Response& rResponse)
{
	std::ostringstream ss;

	ss	<< "HTTP/1.1 " << rResponse.status << ' ' << GetStatusText(rResponse.status) << "\r\n"
		<< "Content-Type: application/json\r\n"
		<< "Content-Length: " << rResponse.body.size() << "\r\n"
		<< "Connection: close\r\n"
		<< "\r\n"
		<< rResponse.body;

	return ss.str();
}

auto APIServer::AddClient(SocketId socketId) -> APIClientId
{
	APIClientId id;

	if (mClientReleasedIds.empty())
	{
		id = mClientIdCounter++;

		if (mClientSockets.size() <= id)
		{
			const std::size_t newSize = id + 1;

			mClientSockets.resize(newSize, INVALID_SOCKET);
			mClientTimePoints.resize(newSize);
			mClientBuffers.resize(newSize);
		}
	}
	else
	{
		id = mClientReleasedIds.back();
		mClientReleasedIds.pop_back();
	}

	mClientSockets.at(id) = socketId;
	mClientTimePoints.at(id) = std::chrono::steady_clock::now();
	mClientBuffers.at(id).clear();

	return id;
}
