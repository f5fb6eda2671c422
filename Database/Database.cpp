#include <PCH.hpp>

#include "Database.hpp"
#include "DatabaseQuery.hpp"

#include <mysql/mysqld_error.h>
#include <mysql/errmsg.h>

#include <iomanip> // std::setprecision

namespace Database
{
	Connection::Connection()
	{
		if (!(mpHandle = mysql_init(nullptr)))
			throw Exception("Failed for \"mysql_init\"!");
	}

	Connection::~Connection()
	{
		if (mpHandle)
			mysql_close(mpHandle);
	}

	bool Connection::Connect(const Info& rInfo, U32 connectTimeoutSecs /* = 7 */, int numRetries /* = 1 */)
	{
		mInfo = rInfo;

		for (int i = 0; i < numRetries; ++i)
		{
			// The connect timeout in seconds.
			mysql_options(mpHandle, MYSQL_OPT_CONNECT_TIMEOUT, &connectTimeoutSecs);
			mysql_options(mpHandle, MYSQL_SET_CHARSET_NAME, "utf8mb4");

			if (mysql_real_connect(
				mpHandle,
				rInfo.hostname.c_str(),
				rInfo.username.c_str(),
				rInfo.password.c_str(),
				rInfo.database.c_str(),
				rInfo.port, nullptr, 0))
				break;

			if (i == (numRetries - 1))
			{
				LOG_ERROR(Log::Channel::DB, "%s", mysql_error(mpHandle));
				return false;
			}
			else
			{
				LOG_WARNING(Log::Channel::DB, "%s Retrying... (Attempt %d of %d)", mysql_error(mpHandle), i + 1, numRetries);
				std::this_thread::sleep_for(std::chrono::seconds(1));
				continue;
			}
		}

		mIsInTransaction = false;

		LOG_MESSAGE(Log::Channel::DB, "Successfully connected to the Database.");
		return true;
	}

	bool Connection::ReConnect()
	{
		// A failed "mysql_real_connect" leaves the handle unusable, start from a fresh one.
		mysql_close(mpHandle);

		if (!(mpHandle = mysql_init(nullptr)))
			throw Exception("Failed for \"mysql_init\"!");

		return this->Connect(mInfo);
	}

	bool Connection::Exec(const char* pStatement)
	{
		if (mysql_query(mpHandle, pStatement) != 0)
		{
			LOG_ERROR(Log::Channel::DB, "Query failed: \"%s\"! (Reason: %s)", pStatement, mysql_error(mpHandle));
			return false;
		}

		return true;
	}

	// The isolation level applies to the next transaction only.
	bool Connection::Begin(bool isReadCommitted /* = false */)
	{
		if (mysql_ping(mpHandle) != 0)
		{
			LOG_WARNING(Log::Channel::DB, "Disconnected from the Database! (Trying to reconnect)");

			if (!ReConnect())
				return false;
		}

		if (isReadCommitted && !Exec("SET TRANSACTION ISOLATION LEVEL READ COMMITTED"))
			return false;

		if (!Exec("START TRANSACTION"))
			return false;

		mIsInTransaction = true;
		return true;
	}

	bool Connection::Commit()
	{
		mIsInTransaction = false;

		return Exec("COMMIT");
	}

	bool Connection::Rollback()
	{
		mIsInTransaction = false;

		return Exec("ROLLBACK");
	}

	String Connection::EscapeString(const String& rInput)
	{
		Vector<char> output(rInput.length() * 2 + 1, 0);

		const auto length = mysql_real_escape_string(mpHandle, output.data(), rInput.c_str(), static_cast<unsigned long>(rInput.length()));

		return String(output.data(), length);
	}

	String Connection::Quote(const String& rInput)
	{
		return '\'' + EscapeString(rInput) + '\'';
	}

	String Connection::QuoteOrNull(const String& rInput)
	{
		if (rInput.empty())
			return "NULL";

		return Quote(rInput);
	}

	unsigned int Connection::GetLastErrorCode() const
	{
		return mysql_errno(mpHandle);
	}

	const char* Connection::GetLastError() const
	{
		return mysql_error(mpHandle);
	}

	Transaction::Transaction(Connection& rConnection, bool isReadCommitted /* = false */)
		: mConnection(rConnection)
	{
		mIsStarted = mConnection.Begin(isReadCommitted);
	}

	Transaction::~Transaction()
	{
		if (mIsStarted && !mIsDone)
		{
			if (!mConnection.Rollback())
				LOG_ERROR(Log::Channel::DB, "Rollback failed! (Reason: %s)", mConnection.GetLastError());
		}
	}

	bool Transaction::Commit()
	{
		if (!mIsStarted || mIsDone)
			return false;

		mIsDone = true;

		return mConnection.Commit();
	}

	String FormatDecimal(F64 value, int precision)
	{
		std::ostringstream ss;

		ss << std::fixed << std::setprecision(precision) << value;

		return ss.str();
	}

	bool IsTransientError(unsigned int errorCode)
	{
		switch (errorCode)
		{
			case ER_LOCK_WAIT_TIMEOUT:	// 1205
			case ER_LOCK_DEADLOCK:		// 1213
			case CR_CONNECTION_ERROR:	// 2002
			case CR_CONN_HOST_ERROR:	// 2003
			case CR_SERVER_GONE_ERROR:	// 2006
			case CR_SERVER_LOST:		// 2013
				return true;
		}

		return false;
	}
}
