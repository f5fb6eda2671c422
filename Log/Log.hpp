#pragma once

// Process-wide asynchronous logger. Producers only queue, one writer thread formats and writes
// to "<path>YYYYMMDD_HHMMSS_log.txt" and optionally to stdout.
class Log
{
public:
	enum class Channel
	{
		Main,
		DB,
		API,
		Pipeline,
		Metadata,
		Inference,
		Tracking,
		Stats
	};

	enum class Level
	{
		Debug,
		Info,
		Warning,
		Error
	};

	Log(const String& rPath, Level minLevel = Level::Debug, bool isConsoleEnabled = true);
	~Log();

	void WriteVA(Channel channel, Level level, int line, const char* pFuncName, const char* pFormat, ...);
	void Write(Channel channel, Level level, int line, const char* pFuncName, const String& rMessage);

	void SetMinLevel(Level level) { mMinLevel = level; }
	Level GetMinLevel() const { return mMinLevel.load(); }

	auto GetFileName() const -> const String& { return mFileName; }

	// "debug", "info", "warning", "error" (any case).
	static bool LevelFromString(const String& rText, Level& rLevel);

private:

	void ThreadProc();

	struct Record
	{
		Record(Channel channel, Level level, int line, const char* pFuncName, const String& rMessage)
			: channel(channel)
			, level(level)
			, line(line)
			, func(pFuncName)
			, text(rMessage)
			, timePoint(std::chrono::system_clock::now())
		{ }

		Channel		channel;
		Level		level;
		int			line;
		String		func;
		String		text;
		std::chrono::system_clock::time_point timePoint;
	};

	static String Format(const Record& rRecord);

private:

	const String			mFileName;
	const bool				mIsConsoleEnabled;

	std::atomic<Level>		mMinLevel;

	std::atomic_bool		mIsStopRequested{ false };
	std::condition_variable	mCondition;

	std::queue<Record>		mQueue;
	std::mutex				mQueueLock;

	std::thread				mThread;
};

extern Log* gpLog;

#define LOG_DEBUG(channel, ...)		gpLog->WriteVA(channel, Log::Level::Debug, __LINE__, __FUNCTION__, __VA_ARGS__)
#define LOG_MESSAGE(channel, ...)	gpLog->WriteVA(channel, Log::Level::Info, __LINE__, __FUNCTION__, __VA_ARGS__)
#define LOG_WARNING(channel, ...)	gpLog->WriteVA(channel, Log::Level::Warning, __LINE__, __FUNCTION__, __VA_ARGS__)
#define LOG_ERROR(channel, ...)		gpLog->WriteVA(channel, Log::Level::Error, __LINE__, __FUNCTION__, __VA_ARGS__)
