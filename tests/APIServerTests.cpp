#include "PCH.hpp"

#include "Utils.hpp"

#include "API/APIServer.hpp"

#include "Pipeline/PipelineService.hpp"
#include "Statistics/StatisticsRefresher.hpp"
#include "ThreadPool.hpp"

#include "Support/MemoryStore.hpp"
#include "Support/Fixtures.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace
{
	const String Bucket("camtrap-raw");
	const String Key("serengeti/TZ/tawiri/CAM001/2024-05-17/CAM001_20240517063102123.jpg");

	class UnavailableStoreProvider : public StoreProvider
	{
	public:
		void Run(const std::function<void(Store&)>& rTask) override
		{
			throw Exception("No database connection available.");
		}
	};
}

class APIServerTests : public ::testing::Test
{
protected:
	void SetUp() override
	{
		mSettings.invocationTimeoutSec = 30;
		mSettings.retry.maxAttempts = 1;

		mSource.Add(Bucket, Key, TestImage::Make(320, 240));

		mOrchestrator = std::make_unique<Orchestrator>(mSettings, mDetector, mClassifier, mSource, mTracking);
		mService = std::make_unique<PipelineService>(*mOrchestrator, mProvider, mThreadPool);
		mRefresher = std::make_unique<StatisticsRefresher>(mStatsStore, 0);
		mServer = std::make_unique<APIServer>(*mService, mProvider, *mRefresher);
	}

	void TearDown() override
	{
		mThreadPool.WaitAll();
	}

	APIServer::Response Send(const String& rMethod, const String& rTarget, const String& rBody = String())
	{
		std::ostringstream ss;

		ss	<< rMethod << ' ' << rTarget << " HTTP/1.1\r\n"
			<< "Host: localhost\r\n"
			<< "Content-Length: " << rBody.size() << "\r\n"
			<< "\r\n"
			<< rBody;

		APIServer::Request request;

		EXPECT_EQ(APIServer::ParseRequest(ss.str(), request), APIServer::ParseResult::Complete);

		return mServer->HandleRequest(request);
	}

	static String GetError(const APIServer::Response& rResponse)
	{
		return json::parse(rResponse.body).value("error", String());
	}

	PipelineSettings		mSettings;

	MemoryStore				mStore;
	MemoryStore				mStatsStore;
	MemoryStoreProvider		mProvider{ mStore };
	FixtureDetector			mDetector;
	FixtureClassifier		mClassifier;
	MemoryImageSource		mSource;
	RecordingTrackingSink	mTracking;
	ThreadPool				mThreadPool{ 2 };

	UniquePtr<Orchestrator>			mOrchestrator;
	UniquePtr<PipelineService>		mService;
	UniquePtr<StatisticsRefresher>	mRefresher;
	UniquePtr<APIServer>			mServer;
};

TEST_F(APIServerTests, ParsesRequestLineAndQuery)
{
	APIServer::Request request;

	const String data("GET /status?key=a%2Fb%2Fc.jpg&flag HTTP/1.1\r\nHost: x\r\n\r\n");

	ASSERT_EQ(APIServer::ParseRequest(data, request), APIServer::ParseResult::Complete);
	ASSERT_EQ(request.method, "GET");
	ASSERT_EQ(request.path, "/status");
	ASSERT_EQ(request.query.at("key"), "a/b/c.jpg");
	ASSERT_EQ(request.query.count("flag"), 1u);
	ASSERT_TRUE(request.body.empty());
}

TEST_F(APIServerTests, WaitsForTheWholeBody)
{
	APIServer::Request request;

	ASSERT_EQ(APIServer::ParseRequest("POST /events HTTP/1.1\r\nHost: x", request), APIServer::ParseResult::Incomplete);

	String data("POST /events HTTP/1.1\r\ncontent-length: 10\r\n\r\n{\"a\":");

	ASSERT_EQ(APIServer::ParseRequest(data, request), APIServer::ParseResult::Incomplete);

	data += "true}";

	ASSERT_EQ(APIServer::ParseRequest(data, request), APIServer::ParseResult::Complete);
	ASSERT_EQ(request.body, "{\"a\":true}");
}

TEST_F(APIServerTests, RejectsMalformedRequests)
{
	APIServer::Request request;

	ASSERT_EQ(APIServer::ParseRequest("GET\r\n\r\n", request), APIServer::ParseResult::Malformed);
	ASSERT_EQ(APIServer::ParseRequest("GET /status HTTP/1.1 extra\r\n\r\n", request), APIServer::ParseResult::Malformed);
	ASSERT_EQ(APIServer::ParseRequest("GET status HTTP/1.1\r\n\r\n", request), APIServer::ParseResult::Malformed);
	ASSERT_EQ(APIServer::ParseRequest("GET /status FTP/1.0\r\n\r\n", request), APIServer::ParseResult::Malformed);
	ASSERT_EQ(APIServer::ParseRequest("POST /events HTTP/1.1\r\nContent-Length: -5\r\n\r\n", request), APIServer::ParseResult::Malformed);
	ASSERT_EQ(APIServer::ParseRequest("POST /events HTTP/1.1\r\nContent-Length: 12abc\r\n\r\n", request), APIServer::ParseResult::Malformed);
}

TEST_F(APIServerTests, OversizedRequestsAreRefusedEarly)
{
	APIServer::Request request;

	// Declared body over the limit, refused before any of it arrives.
	const String declared("POST /events HTTP/1.1\r\nContent-Length: 2097152\r\n\r\n{");

	ASSERT_EQ(APIServer::ParseRequest(declared, request), APIServer::ParseResult::TooLarge);

	// Headers that never end.
	String endless("GET /status HTTP/1.1\r\n");

	endless.append(APIServer::MaxRequestSize, 'x');

	ASSERT_EQ(APIServer::ParseRequest(endless, request), APIServer::ParseResult::TooLarge);

	// Just under the limit is still waited for.
	const String pending("POST /events HTTP/1.1\r\nContent-Length: 1024\r\n\r\n{");

	ASSERT_EQ(APIServer::ParseRequest(pending, request), APIServer::ParseResult::Incomplete);
}

TEST_F(APIServerTests, BuildsResponseWithHeaders)
{
	APIServer::Response response;

	response.status = 404;
	response.body = "{\"error\":\"unknown path\"}";

	const auto text = APIServer::MakeHTTPResponse(response);

	ASSERT_EQ(text.find("HTTP/1.1 404 Not Found\r\n"), 0u);
	ASSERT_NE(text.find("Content-Type: application/json\r\n"), String::npos);
	ASSERT_NE(text.find("Content-Length: 24\r\n"), String::npos);
	ASSERT_NE(text.find("Connection: close\r\n"), String::npos);
	ASSERT_EQ(text.substr(text.size() - response.body.size()), response.body);
}

TEST_F(APIServerTests, EventsSubmitEveryRecord)
{
	const String record = R"({ "s3": { "bucket": { "name": "camtrap-raw" }, "object": { "key": ")" + Key + R"(" } } })";
	const String body = R"({ "Records": [ )" + record + ", " + record + " ] }";

	const auto response = Send("POST", "/events", body);

	ASSERT_EQ(response.status, 202);
	ASSERT_EQ(json::parse(response.body).at("accepted").get<int>(), 2);

	mThreadPool.WaitAll();

	ASSERT_EQ(mService->GetNumSubmitted(), 2u);
	ASSERT_EQ(mStore.GetNumImages(), 1u);

	Model::ImageRecord image;

	ASSERT_TRUE(mStore.FindImage(Key, image));
	ASSERT_EQ(image.status, ProcessingStatus::Completed);
}

TEST_F(APIServerTests, EventsRejectNonNotifications)
{
	ASSERT_EQ(Send("POST", "/events", "not json").status, 400);
	ASSERT_EQ(Send("POST", "/events", "{\"Records\":5}").status, 400);
	ASSERT_EQ(Send("POST", "/events", "[]").status, 400);
	ASSERT_EQ(Send("GET", "/events").status, 405);

	ASSERT_EQ(mService->GetNumSubmitted(), 0u);
}

TEST_F(APIServerTests, EventsWithWrongFieldTypesAreSkipped)
{
	const auto response = Send("POST", "/events", R"({"Records":[{"s3":{"bucket":{"name":5},"object":{"key":"a.jpg"}}}]})");

	ASSERT_EQ(response.status, 202);
	ASSERT_EQ(mService->GetNumSubmitted(), 0u);

	// Still serving.
	ASSERT_EQ(Send("GET", "/unknown").status, 404);
}

TEST_F(APIServerTests, UploadNeedsBucketAndKey)
{
	ASSERT_EQ(Send("GET", "/upload?bucket=camtrap-raw").status, 400);
	ASSERT_EQ(Send("GET", "/upload?key=a.jpg").status, 400);
	ASSERT_EQ(Send("GET", "/upload?bucket=&key=a.jpg").status, 400);
	ASSERT_EQ(Send("POST", "/upload?bucket=camtrap-raw&key=a.jpg").status, 405);

	const auto response = Send("GET", "/upload?bucket=camtrap-raw&key=" + Utils::UrlEncode(Key));

	ASSERT_EQ(response.status, 202);

	mThreadPool.WaitAll();

	Model::ImageRecord image;

	ASSERT_TRUE(mStore.FindImage(Key, image));
	ASSERT_EQ(image.status, ProcessingStatus::Completed);
}

TEST_F(APIServerTests, StatusReportsTheImage)
{
	ASSERT_EQ(Send("GET", "/status").status, 400);

	const auto missing = Send("GET", "/status?key=nothing.jpg");

	ASSERT_EQ(missing.status, 404);
	ASSERT_FALSE(GetError(missing).empty());

	mDetector.AddObject(DetectionType::Person, 0.9f);
	ASSERT_EQ(mOrchestrator->Process(mStore, UploadNotice{ Bucket, Key }), ProcessOutcome::Completed);

	const auto response = Send("GET", "/status?key=" + Utils::UrlEncode(Key));

	ASSERT_EQ(response.status, 200);

	const auto body = json::parse(response.body);

	ASSERT_EQ(body.at("storage_key").get<String>(), Key);
	ASSERT_EQ(body.at("processing_status").get<String>(), "completed");
	ASSERT_TRUE(body.at("error_message").is_null());
	ASSERT_EQ(body.at("detection_count").get<int>(), 1);
}

TEST_F(APIServerTests, StatusReportsTheFailure)
{
	mDetector.FailPermanently();
	ASSERT_EQ(mOrchestrator->Process(mStore, UploadNotice{ Bucket, Key }), ProcessOutcome::Failed);

	const auto body = json::parse(Send("GET", "/status?key=" + Utils::UrlEncode(Key)).body);

	ASSERT_EQ(body.at("processing_status").get<String>(), "failed");
	ASSERT_EQ(body.at("error_message").get<String>().find("adapter-permanent"), 0u);
	ASSERT_EQ(body.at("detection_count").get<int>(), 0);
}

TEST_F(APIServerTests, StatusLookupFailureIsReported)
{
	UnavailableStoreProvider provider;
	APIServer server(*mService, provider, *mRefresher);

	APIServer::Request request;

	ASSERT_EQ(APIServer::ParseRequest("GET /status?key=a.jpg HTTP/1.1\r\n\r\n", request), APIServer::ParseResult::Complete);
	ASSERT_EQ(server.HandleRequest(request).status, 500);
}

TEST_F(APIServerTests, RefreshStatsIsAccepted)
{
	ASSERT_EQ(Send("GET", "/refresh-stats").status, 202);

	const auto endTP = std::chrono::steady_clock::now() + std::chrono::seconds(10);

	while (mRefresher->GetNumRefreshes() == 0 && std::chrono::steady_clock::now() < endTP)
		std::this_thread::sleep_for(std::chrono::milliseconds(1));

	ASSERT_GE(mRefresher->GetNumRefreshes(), 1u);
	ASSERT_EQ(mStore.GetNumCalls(MemoryStore::Operation::Refresh), 0u);
	ASSERT_GE(mStatsStore.GetNumCalls(MemoryStore::Operation::Refresh), 1u);
}

TEST_F(APIServerTests, UnknownPathIsNotFound)
{
	ASSERT_EQ(Send("GET", "/").status, 404);
	ASSERT_EQ(Send("GET", "/metrics").status, 404);
	ASSERT_EQ(Send("DELETE", "/images").status, 404);
}
