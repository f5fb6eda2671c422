#include <PCH.hpp>

#include "Database.hpp"
#include "DatabaseQuery.hpp"

namespace Database
{
	Query::Query(Connection& rDB) 
		: mConnection(rDB)
	{ }

	Query::~Query()
	{
		if (mpResult)
			mysql_free_result(mpResult);
	}

	bool Query::Exec(const String& rQueryString)
	{
		if (mpResult)
		{
			mysql_free_result(mpResult);
			mpResult = nullptr;
			mpRow = nullptr;
		}

		// Reconnecting inside a transaction would silently drop it, so the statement fails instead.
		if (!mConnection.IsInTransaction() && mysql_ping(mConnection.GetHandle()) != 0)
		{
			LOG_WARNING(Log::Channel::DB, "Disconnected from the Database! (Trying to reconnect)");

			if (!mConnection.ReConnect())
				return false;
		}

		auto handle = mConnection.GetHandle();

		if (mysql_query(handle, rQueryString.c_str()) != 0)
		{
			LOG_ERROR(Log::Channel::DB, "Query failed: \"%s\"! (Reason: %s, Code: %u)", rQueryString.c_str(), mysql_error(handle), mysql_errno(handle));
			return false;
		}

		mpResult = mysql_store_result(handle);

		if (!mpResult && mysql_field_count(handle) != 0)
		{
			LOG_ERROR(Log::Channel::DB, "Failed to store the result of: \"%s\"! (Reason: %s)", rQueryString.c_str(), mysql_error(handle));
			return false;
		}

		mAffectedRows = mpResult ? 0 : static_cast<U64> (mysql_affected_rows(handle));

		return true;
	}

	bool Query::Next()
	{
		if (!mpResult)
			return false;

		mpRow = mysql_fetch_row(mpResult);

		if (!mpRow)
			return false;

		mpLengths = mysql_fetch_lengths(mpResult);

		return true;
	}

	U64 Query::LastInsertId() const
	{
		return static_cast<U64> (mysql_insert_id(mConnection.GetHandle()));
	}

	U64 Query::NumResults() const
	{
		if (!mpResult)
			return 0;

		return static_cast<U64> (mysql_num_rows(mpResult));
	}

	unsigned int Query::ErrorCode() const
	{
		return mysql_errno(mConnection.GetHandle());
	}
}
