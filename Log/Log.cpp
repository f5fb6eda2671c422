#include "PCH.hpp"

#include "Utils.hpp"
#include "Log.hpp"

#include <cstdarg>	// va_start

Log* gpLog = nullptr;

namespace
{
	String MakeFileName(const String& rPath)
	{
		auto posixTime = time(nullptr);

		struct tm tm;
		localtime_r(&posixTime, &tm);

		char buffer[16];
		strftime(buffer, sizeof(buffer), "%Y%m%d_%H%M%S", &tm);

		return rPath + buffer + "_log.txt";
	}

	const char* GetChannelTag(Log::Channel channel)
	{
		switch (channel)
		{
			case Log::Channel::Main:		return "[Main] | ";
			case Log::Channel::DB:			return "[DB]   | ";
			case Log::Channel::API:			return "[API]  | ";
			case Log::Channel::Pipeline:	return "[PIPE] | ";
			case Log::Channel::Metadata:	return "[META] | ";
			case Log::Channel::Inference:	return "[INF]  | ";
			case Log::Channel::Tracking:	return "[TRK]  | ";
			case Log::Channel::Stats:		return "[STAT] | ";
		}

		return "[?]    | ";
	}
}

Log::Log(const String& rPath, Level minLevel, bool isConsoleEnabled)
	: mFileName(MakeFileName(rPath))
	, mIsConsoleEnabled(isConsoleEnabled)
	, mMinLevel(minLevel)
	, mThread(&Log::ThreadProc, this)
{
	gpLog = this;

	Write(Channel::Main, Level::Info, __LINE__, __FUNCTION__, "=======================================================================");
	Write(Channel::Main, Level::Info, __LINE__, __FUNCTION__, "Start [LOG FILE: \"" + mFileName + "\"]");
	Write(Channel::Main, Level::Info, __LINE__, __FUNCTION__, "=======================================================================");
}

Log::~Log()
{
	Write(Channel::Main, Level::Info, __LINE__, __FUNCTION__, "End.");

	{
		std::lock_guard<std::mutex> lock(mQueueLock);
		mIsStopRequested = true;
	}

	mCondition.notify_all();
	mThread.join();

	if (gpLog == this)
		gpLog = nullptr;
}

bool Log::LevelFromString(const String& rText, Level& rLevel)
{
	if (Utils::IsEqual(rText, "debug"))			rLevel = Level::Debug;
	else if (Utils::IsEqual(rText, "info"))		rLevel = Level::Info;
	else if (Utils::IsEqual(rText, "warning"))	rLevel = Level::Warning;
	else if (Utils::IsEqual(rText, "error"))	rLevel = Level::Error;
	else
		return false;

	return true;
}

void Log::Write(Channel channel, Level level, int line, const char* pFuncName, const String& rMessage)
{
	if (level < mMinLevel.load())
		return;

	{
		std::lock_guard<std::mutex> lock(mQueueLock);
		mQueue.emplace(channel, level, line, pFuncName, rMessage);
	}

	mCondition.notify_one();
}

void Log::WriteVA(Channel channel, Level level, int line, const char* pFunctionName, const char* pFormat, ...)
{
	// Skip the formatting for filtered records.
	if (level < mMinLevel.load())
		return;

	char buffer[4096];

	va_list args;
	va_start(args, pFormat);

	// Returns the length the full text would have, or a negative value on an output error.
	const int result = vsnprintf(buffer, sizeof(buffer), pFormat, args);

	va_end(args);

	size_t length = result < 0 ? 0 : static_cast<size_t>(result);

	if (length > sizeof(buffer) - 1)
		length = sizeof(buffer) - 1;

	Write(channel, level, line, pFunctionName, String(buffer, length));
}

// "[2024-05-17 06:31:02.123] | [PIPE] | I | Claimed ..."
String Log::Format(const Record& rRecord)
{
	const auto posixTime = std::chrono::system_clock::to_time_t(rRecord.timePoint);
	const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(rRecord.timePoint.time_since_epoch()).count() % 1000;

	struct tm tm;
	localtime_r(&posixTime, &tm);

	std::ostringstream ss;

	ss << '[' << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << ms << "] | ";

	ss << GetChannelTag(rRecord.channel);

	switch (rRecord.level)
	{
		case Level::Debug:		ss << 'D';	break;
		case Level::Info:		ss << 'I';	break;
		case Level::Warning:	ss << 'W';	break;
		case Level::Error:		ss << 'E';	break;
	}

	ss << " | " << rRecord.text;

	if (rRecord.level == Level::Error)
		ss << " (Func: " << rRecord.func << ", Line: " << rRecord.line << ")";

	return ss.str();
}

void Log::ThreadProc()
{
	std::ofstream file(mFileName, std::ios_base::out | std::ios_base::trunc);

	// Console only then, the records are still drained.
	if (!file.is_open())
		std::cerr << "Failed to open the log file \"" << mFileName << "\"!" << std::endl;

	std::queue<Record> batch;

	for (;;)
	{
		{
			std::unique_lock<std::mutex> lock(mQueueLock);

			mCondition.wait(lock, [this] { return !mQueue.empty() || mIsStopRequested; });

			if (mQueue.empty())
				return; // Stop requested, everything written.

			std::swap(batch, mQueue);
		}

		bool isErrorWritten = false;

		while (!batch.empty())
		{
			const auto& rRecord = batch.front();
			const auto line = Format(rRecord);

			if (mIsConsoleEnabled)
				std::cout << line << '\n';

			if (file.is_open())
				file << line << '\n';

			isErrorWritten |= rRecord.level == Level::Error;

			batch.pop();
		}

		if (mIsConsoleEnabled)
			std::cout.flush();

		if (file.is_open())
			file.flush();

		if (isErrorWritten && mIsConsoleEnabled)
			std::cerr.flush();
	}
}
