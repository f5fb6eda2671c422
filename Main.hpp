
#pragma once

#include "Pipeline/Orchestrator.hpp"
#include "Catalog/CatalogSeeder.hpp"

// Forward declarations.
class Log;
class Config;
class ThreadPool;
class APIServer;
class Detector;
class Classifier;
class ImageSource;
class TrackingNotifier;
class StatisticsRefresher;
class PipelineService;
class MySQLStore;
class MySQLStoreProvider;

extern std::atomic_bool gIsQuitRequested;

namespace Database { struct Info; class Connection; class ConnectionPool; }

class Main
{
public:
	Main(const String& rConfigFileName);
	~Main();

	int Run();

	const String& GetPathApplication();

	UniquePtr<Log>						LogFilePtr;
	UniquePtr<Config>					ConfigPtr;
	UniquePtr<Database::ConnectionPool>	DatabasePoolPtr;
	UniquePtr<Database::Connection>		StatsDatabasePtr;
	UniquePtr<MySQLStoreProvider>		StoreProviderPtr;
	UniquePtr<MySQLStore>				StatsStorePtr;
	UniquePtr<ThreadPool>				ThreadPoolPtr;
	UniquePtr<Detector>					DetectorPtr;
	UniquePtr<Classifier>				ClassifierPtr;
	UniquePtr<ImageSource>				ImageSourcePtr;
	UniquePtr<TrackingNotifier>			TrackingPtr;
	UniquePtr<StatisticsRefresher>		RefresherPtr;
	UniquePtr<Orchestrator>				OrchestratorPtr;
	UniquePtr<PipelineService>			ServicePtr;
	UniquePtr<APIServer>				APIServerPtr;

private:

	void SetupLogSystem();
	void SetupDatabaseConnections(Database::Info& rDBInfo);
	void SetupThreadPool();
	void SetupPipelineSettings();
	void SetupTaxonomy();
	void SetupInferenceBackends();
	void SetupImageSource();
	void SetupTracking();
	void SeedCatalog();
	void SetupStatisticsRefresher();
	void SetupPipeline();
	void SetupAPIServer();

	void WaitForWorkers();

	String ReadRequired(const char* pKey) const;
	U32 ReadRequiredU32(const char* pKey) const;

	const String		mConfigFileName;

	PipelineSettings	mSettings;
	Taxonomy			mTaxonomy;

	struct
	{
		String application;
	} mPathFor;
};
