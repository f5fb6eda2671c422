#include "PCH.hpp"

#include "Main.hpp"
#include "Config.hpp"
#include "ThreadPool.hpp"
#include "Utils.hpp"

#include "Database/Database.hpp"
#include "Database/DatabaseConnectionPool.hpp"

#include "Storage/MySQLStore.hpp"

#include "Inference/RemoteDetector.hpp"
#include "Inference/RemoteClassifier.hpp"
#include "Inference/OnnxDetector.hpp"
#include "Inference/OnnxClassifier.hpp"

#include "Pipeline/ImageSource.hpp"
#include "Pipeline/PipelineService.hpp"

#include "Tracking/TrackingNotifier.hpp"
#include "Statistics/StatisticsRefresher.hpp"

#include "API/APIServer.hpp"

#include <curl/curl.h>

#include <csignal>	// signal

std::atomic_bool gIsQuitRequested = {false};

void SignalHandler(int n)
{
	gIsQuitRequested = true;
}

Main::Main(const String& rConfigFileName)
	: mConfigFileName(rConfigFileName)
{
	// This will let us to determine when our application will need to be closed.
	signal(SIGTERM, &SignalHandler);
	signal(SIGINT, &SignalHandler);

	mysql_library_init(0, nullptr, nullptr);
	curl_global_init(CURL_GLOBAL_DEFAULT);
}

Main::~Main()
{
	// Everything that may still touch a connection or a worker goes first.
	APIServerPtr.reset();
	ThreadPoolPtr.reset();
	ServicePtr.reset();
	OrchestratorPtr.reset();
	RefresherPtr.reset();
	StatsStorePtr.reset();
	StatsDatabasePtr.reset();
	StoreProviderPtr.reset();
	DatabasePoolPtr.reset();
	TrackingPtr.reset();

	curl_global_cleanup();
	mysql_library_end();
}

String ThreadIdToString(const std::thread::id& id)
{
	std::stringstream ss;
	ss << id;
	return ss.str();
}

int Main::Run()
{
	Database::Info dbInfo;

	try
	{
		ConfigPtr = std::make_unique<Config>(mConfigFileName);

		SetupLogSystem();

		LOG_MESSAGE(Log::Channel::Main, "Num CPU cores: %d", std::thread::hardware_concurrency());
		LOG_MESSAGE(Log::Channel::Main, "Main thread id: %s", ThreadIdToString(std::this_thread::get_id()).c_str());
		LOG_MESSAGE(Log::Channel::Main, "Config: %s", mConfigFileName.c_str());

		SetupPipelineSettings();

		SetupDatabaseConnections(dbInfo);

		SetupThreadPool();

		SetupTaxonomy();

		SetupInferenceBackends();

		SetupImageSource();

		SetupTracking();

		SeedCatalog();

		SetupStatisticsRefresher();

		SetupPipeline();

		SetupAPIServer();

		while (!gIsQuitRequested)
		{
			APIServerPtr->Update();

			std::this_thread::sleep_for(std::chrono::milliseconds(10));
		}

		LOG_WARNING(Log::Channel::Main, "Quit requested. (Stopping the application)");

		// No new work once the listener is gone.
		APIServerPtr.reset();

		WaitForWorkers();

		// One last delivery round for the final status updates.
		TrackingPtr->Stop();
	}
	catch (const Exception& e)
	{
		if (LogFilePtr)
			LogFilePtr->Write(Log::Channel::Main, Log::Level::Error, __LINE__, __FUNCTION__, e.GetText());
		else
			std::cout << "ERROR: [LOG NOT INITIALIZED] : " << e.GetText() << std::endl;

		return EXIT_FAILURE;
	}
	catch (const std::exception& e)
	{
		if (LogFilePtr)
			LogFilePtr->Write(Log::Channel::Main, Log::Level::Error, __LINE__, __FUNCTION__, e.what());
		else
			std::cout << "ERROR: [LOG NOT INITIALIZED] : " << e.what() << std::endl;

		return EXIT_FAILURE;
	}

	return EXIT_SUCCESS;
}

const String& Main::GetPathApplication()
{
	if (mPathFor.application.empty())
		mPathFor.application = Utils::GetApplicationPath();

	return mPathFor.application;
}

String Main::ReadRequired(const char* pKey) const
{
	if (!ConfigPtr->Has(pKey))
		throw ExceptionVA("Config key \"%s\" is missing the value!", pKey);

	String value;
	ConfigPtr->Read(pKey, value);

	return value;
}

U32 Main::ReadRequiredU32(const char* pKey) const
{
	const auto value = ReadRequired(pKey);

	U32 result;

	if (!Utils::StringTo(value.c_str(), result))
		throw ExceptionVA("Config key \"%s\" value \"%s\" is not an unsigned integer!", pKey, value.c_str());

	return result;
}

void Main::SetupLogSystem()
{
	// Nothing can be logged before this, so "Has" and not "Read".
	if (!ConfigPtr->Has("log_path"))
		throw Exception("Config key \"log_path\" is missing the value!");

	String logPath;

	ConfigPtr->Read("log_path", logPath);

	if (!Utils::EndsWith(logPath, '/'))
		logPath += '/';

	if (!Utils::StartsWith(logPath, "/"))
		logPath = GetPathApplication() + logPath;

	if (!Utils::MakePath(logPath))
		throw ExceptionVA("Failed to setup log path: \"%s\"!", logPath.c_str());

	auto level = Log::Level::Debug;
	bool isConsoleEnabled = true;

	String levelText;

	if (ConfigPtr->Has("log_level"))
	{
		ConfigPtr->Read("log_level", levelText);

		if (!Log::LevelFromString(levelText, level))
			throw ExceptionVA("Config key \"log_level\" value \"%s\" is not one of debug, info, warning or error!", levelText.c_str());
	}

	if (ConfigPtr->Has("log_console"))
		ConfigPtr->Read("log_console", isConsoleEnabled);

	LogFilePtr = std::make_unique<Log>(logPath, level, isConsoleEnabled);
}

void Main::SetupPipelineSettings()
{
	auto readThreshold = [this](const char* pKey, F32& rValue)
	{
		if (!ConfigPtr->Has(pKey))
		{
			LOG_WARNING(Log::Channel::Main, "Config \"%s\" not set! (Using default, %.2f)", pKey, rValue);
			return;
		}

		ConfigPtr->Read(pKey, rValue);

		if (!(rValue >= 0.0f && rValue <= 1.0f))
			throw ExceptionVA("Config key \"%s\" must be within [0, 1]!", pKey);
	};

	readThreshold("detection_threshold", mSettings.detectionThreshold);
	readThreshold("classification_threshold", mSettings.classificationThreshold);
	readThreshold("crop_padding", mSettings.cropPadding);

	mSettings.invocationTimeoutSec = ReadRequiredU32("invocation_timeout_sec");
	mSettings.retry.maxAttempts = ReadRequiredU32("retry_max_attempts");
	mSettings.retry.backoffMs = ReadRequiredU32("retry_backoff_ms");
	mSettings.retry.backoffMaxMs = ReadRequiredU32("retry_backoff_max_ms");

	if (mSettings.invocationTimeoutSec == 0)
		throw Exception("Config key \"invocation_timeout_sec\" can't be zero!");

	if (mSettings.retry.maxAttempts == 0)
		throw Exception("Config key \"retry_max_attempts\" can't be zero!");

	if (mSettings.retry.backoffMaxMs < mSettings.retry.backoffMs)
		throw Exception("Config key \"retry_backoff_max_ms\" is smaller than \"retry_backoff_ms\"!");

	LOG_MESSAGE(Log::Channel::Main, "Thresholds: detection %.2f, classification %.2f. Timeout %u s, %u attempts, backoff %u..%u ms.",
		mSettings.detectionThreshold, mSettings.classificationThreshold, mSettings.invocationTimeoutSec,
		mSettings.retry.maxAttempts, mSettings.retry.backoffMs, mSettings.retry.backoffMaxMs);
}

void Main::SetupDatabaseConnections(Database::Info& rDBInfo)
{
	ConfigPtr->Read("db_port", rDBInfo.port);
	ConfigPtr->Read("db_hostname", rDBInfo.hostname);
	ConfigPtr->Read("db_username", rDBInfo.username);
	ConfigPtr->Read("db_password", rDBInfo.password);
	ConfigPtr->Read("db_name", rDBInfo.database);

	if (rDBInfo.hostname.empty())	throw Exception("Config key \"db_hostname\" is missing the value!");
	if (rDBInfo.database.empty())	throw Exception("Config key \"db_name\" is missing the value!");

	U32 poolSize = 0;

	if (ConfigPtr->Has("db_pool_size"))
		ConfigPtr->Read("db_pool_size", poolSize);

	if (poolSize == 0)
	{
		poolSize = 4;
		LOG_WARNING(Log::Channel::Main, "Config \"db_pool_size\" not set! (Using default, %u)", poolSize);
	}

	LOG_MESSAGE(Log::Channel::Main, "Connecting to the Database (%s:%d)", rDBInfo.hostname.c_str(), rDBInfo.port);

	DatabasePoolPtr = std::make_unique<Database::ConnectionPool>(rDBInfo, poolSize);
	StoreProviderPtr = std::make_unique<MySQLStoreProvider>(*DatabasePoolPtr);

	// The refresher owns a connection of its own.
	StatsDatabasePtr = std::make_unique<Database::Connection>();

	if (!StatsDatabasePtr->Connect(rDBInfo, 7, 3))
		throw Exception("Failed to connect to the Database!");

	StatsStorePtr = std::make_unique<MySQLStore>(*StatsDatabasePtr);
}

void Main::SetupThreadPool()
{
	U32 numThreads = 0;

	if (ConfigPtr->Has("worker_threads"))
		ConfigPtr->Read("worker_threads", numThreads);

	if (numThreads == 0)
	{
		numThreads = std::max(1u, std::thread::hardware_concurrency());
		LOG_WARNING(Log::Channel::Main, "Config \"worker_threads\" not set! (Using default, %u)", numThreads);
	}

	ThreadPoolPtr = std::make_unique<ThreadPool>(numThreads);
}

void Main::SetupTaxonomy()
{
	if (!ConfigPtr->Has("taxonomy_path"))
	{
		LOG_WARNING(Log::Channel::Main, "Config \"taxonomy_path\" not set! (No species catalog seeding)");
		return;
	}

	String path;
	ConfigPtr->Read("taxonomy_path", path);

	if (!Catalog::LoadTaxonomy(path, mTaxonomy))
		throw ExceptionVA("Failed to load the taxonomy: \"%s\"!", path.c_str());

	LOG_MESSAGE(Log::Channel::Main, "Taxonomy loaded. (%zu classes)", mTaxonomy.size());
}

void Main::SetupInferenceBackends()
{
	U32 timeoutSec = 0;

	if (ConfigPtr->Has("inference_timeout_sec"))
		ConfigPtr->Read("inference_timeout_sec", timeoutSec);

	if (timeoutSec == 0)
	{
		timeoutSec = std::max(1u, mSettings.invocationTimeoutSec / 4);
		LOG_WARNING(Log::Channel::Main, "Config \"inference_timeout_sec\" not set! (Using default, %u seconds)", timeoutSec);
	}

	const auto detectorBackend = ReadRequired("detector_backend");

	if (detectorBackend == "remote")
	{
		const auto address = ReadRequired("detector_address");
		const auto port = static_cast<U16>(ReadRequiredU32("detector_port"));

		DetectorPtr = std::make_unique<RemoteDetector>(address, port, timeoutSec);
	}
	else if (detectorBackend == "onnx")
	{
		DetectorPtr = std::make_unique<OnnxDetector>(ReadRequired("detector_model_path"));
	}
	else
	{
		throw ExceptionVA("Unknown \"detector_backend\": \"%s\"! (Expected \"remote\" or \"onnx\")", detectorBackend.c_str());
	}

	const auto classifierBackend = ReadRequired("classifier_backend");

	if (classifierBackend == "remote")
	{
		const auto address = ReadRequired("classifier_address");
		const auto port = static_cast<U16>(ReadRequiredU32("classifier_port"));

		ClassifierPtr = std::make_unique<RemoteClassifier>(address, port, timeoutSec);
	}
	else if (classifierBackend == "onnx")
	{
		if (mTaxonomy.empty())
			throw Exception("The \"onnx\" classifier needs \"taxonomy_path\" for its class names!");

		ClassifierPtr = std::make_unique<OnnxClassifier>(ReadRequired("classifier_model_path"), mTaxonomy);
	}
	else
	{
		throw ExceptionVA("Unknown \"classifier_backend\": \"%s\"! (Expected \"remote\" or \"onnx\")", classifierBackend.c_str());
	}

	LOG_MESSAGE(Log::Channel::Main, "Inference backends: %s, %s.", DetectorPtr->GetName(), ClassifierPtr->GetName());
}

void Main::SetupImageSource()
{
	auto rootPath = ReadRequired("storage_root");

	if (!Utils::EndsWith(rootPath, '/'))
		rootPath += '/';

	if (!Utils::StartsWith(rootPath, "/"))
		rootPath = GetPathApplication() + rootPath;

	ImageSourcePtr = std::make_unique<FileImageSource>(rootPath);

	LOG_MESSAGE(Log::Channel::Main, "Storage root: %s", rootPath.c_str());
}

void Main::SetupTracking()
{
	const auto endpoint = ReadRequired("tracking_endpoint");

	U32 maxAttempts = 0;
	U32 retryDelayMs = 0;

	if (ConfigPtr->Has("tracking_max_attempts"))
		ConfigPtr->Read("tracking_max_attempts", maxAttempts);

	if (ConfigPtr->Has("tracking_retry_delay_ms"))
		ConfigPtr->Read("tracking_retry_delay_ms", retryDelayMs);

	if (maxAttempts == 0)
	{
		maxAttempts = 3;
		LOG_WARNING(Log::Channel::Main, "Config \"tracking_max_attempts\" not set! (Using default, %u)", maxAttempts);
	}

	TrackingPtr = std::make_unique<TrackingNotifier>(endpoint, maxAttempts, retryDelayMs);
	TrackingPtr->Start();
}

void Main::SeedCatalog()
{
	Vector<Model::LocationRecord> locations;

	if (ConfigPtr->Has("locations_path"))
	{
		String path;
		ConfigPtr->Read("locations_path", path);

		if (!Catalog::LoadLocations(path, locations))
			throw ExceptionVA("Failed to load the camera locations: \"%s\"!", path.c_str());
	}

	if (mTaxonomy.empty() && locations.empty())
		return;

	try
	{
		const auto numSpecies = Catalog::SeedSpecies(*StatsStorePtr, mTaxonomy);
		const auto numLocations = Catalog::SeedLocations(*StatsStorePtr, locations);

		LOG_MESSAGE(Log::Channel::Main, "Catalog seeded. (%zu species, %zu locations)", numSpecies, numLocations);
	}
	catch (const PipelineException& e)
	{
		throw ExceptionVA("Catalog seeding failed: %s", e.GetText());
	}
}

void Main::SetupStatisticsRefresher()
{
	U32 intervalSec = 0;

	if (ConfigPtr->Has("stats_refresh_interval_sec"))
		ConfigPtr->Read("stats_refresh_interval_sec", intervalSec);
	else
		LOG_WARNING(Log::Channel::Main, "Config \"stats_refresh_interval_sec\" not set! (Refreshing on request only)");

	RefresherPtr = std::make_unique<StatisticsRefresher>(*StatsStorePtr, intervalSec);
}

void Main::SetupPipeline()
{
	OrchestratorPtr = std::make_unique<Orchestrator>(mSettings, *DetectorPtr, *ClassifierPtr, *ImageSourcePtr, *TrackingPtr);
	ServicePtr = std::make_unique<PipelineService>(*OrchestratorPtr, *StoreProviderPtr, *ThreadPoolPtr);
}

void Main::SetupAPIServer()
{
	U16 port = 0;

	ConfigPtr->Read("api_port", port);

	if (port == 0)
		throw Exception("Config is missing API server port!");

	APIServerPtr = std::make_unique<APIServer>(*ServicePtr, *StoreProviderPtr, *RefresherPtr);

	if (!APIServerPtr->Start(port))
		throw Exception("API server failed to start!");
}

void Main::WaitForWorkers()
{
	if (!ThreadPoolPtr)
		return;

	LOG_MESSAGE(Log::Channel::Main, "Waiting for %u queued invocations.", ThreadPoolPtr->GetNumTasks());

	ThreadPoolPtr->WaitAll();
}

// Main application entry point.
int main(int argc, char *argv[])
{
	const String configFileName = (argc > 1) ? String(argv[1]) : Utils::GetApplicationPath() + "Server.conf";

	Main app(configFileName);

	return app.Run();
}
