
#pragma once

class PipelineService;
class StoreProvider;
class StatisticsRefresher;

using APIClientId = U32;

/*
	POST /events					Object storage notification, every record is submitted.
	GET  /upload?bucket=..&key=..	Submits one object.
	GET  /refresh-stats				Requests an aggregate refresh.
	GET  /status?key=..				Processing status of one image.
*/
class APIServer
{
public:
	struct Request
	{
		String method;
		String path;
		UnorderedMap<String, String> query; // Values are URL decoded.
		String body;
	};

	struct Response
	{
		U16		status = 200;
		String	body; // JSON.
	};

	static constexpr size_t MaxRequestSize = 1024 * 1024;

	enum class ParseResult : U8
	{
		Incomplete,	// Wait for more bytes.
		Complete,
		Malformed,
		TooLarge	// Headers or declared body beyond MaxRequestSize.
	};

	APIServer(PipelineService& rService, StoreProvider& rStoreProvider, StatisticsRefresher& rRefresher);
	~APIServer();

	bool Start(U16 port);

	void Update();

	Response HandleRequest(const Request& rRequest);

	static ParseResult ParseRequest(const String& rData, Request& rRequest);
	static String MakeHTTPResponse(const Response& rResponse);

private:

	void HandleNewConnection();
	void HandleClient(APIClientId clientId, const TimePoint& rCurrentTP);
	void ReleaseClient(APIClientId clientId);

	Response HandleEvents(const Request& rRequest);
	Response HandleUpload(const Request& rRequest);
	Response HandleStatus(const Request& rRequest);

	APIClientId AddClient(SocketId socketId);

private:

	static constexpr U32 ClientTimeout = 10; // In seconds.

	PipelineService&		mService;
	StoreProvider&			mStoreProvider;
	StatisticsRefresher&	mRefresher;

	SocketId	mServerSocket = INVALID_SOCKET;

	APIClientId			mClientIdCounter = 0;

	Vector<APIClientId>	mClientReleasedIds;

	Vector<SocketId>	mClientSockets;
	Vector<TimePoint>	mClientTimePoints;
	Vector<String>		mClientBuffers;
};
