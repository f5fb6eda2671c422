
#pragma once

#include <mysql/mysql.h>

namespace Database
{
	struct Info
	{
		U16	port = 0;
		String hostname;
		String username;
		String password;
		String database;
	};

	class Connection
	{
		friend class Query;
	public:
		Connection();
		~Connection();

		Connection(const Connection&) = delete;
		Connection& operator=(const Connection&) = delete;

		bool Connect(const Info& rInfo, U32 connectTimeoutSecs = 7, int numRetries = 1);
		bool ReConnect();

		bool Begin(bool isReadCommitted = false);
		bool Commit();
		bool Rollback();

		auto IsInTransaction() const { return mIsInTransaction; }

		String EscapeString(const String& rInput);

		// Escaped and single quoted, i.e. 'O\'Brien'.
		String Quote(const String& rInput);

		// Quoted value, or NULL for an empty input.
		String QuoteOrNull(const String& rInput);

		unsigned int GetLastErrorCode() const;
		const char* GetLastError() const;

		auto GetHandle() { return mpHandle; }

	private:

		bool Exec(const char* pStatement);

		Info	mInfo;
		MYSQL*	mpHandle = nullptr;
		bool	mIsInTransaction = false;
	};

	// Rolls back on scope exit unless committed.
	class Transaction
	{
	public:
		Transaction(Connection& rConnection, bool isReadCommitted = false);
		~Transaction();

		Transaction(const Transaction&) = delete;
		Transaction& operator=(const Transaction&) = delete;

		auto IsStarted() const { return mIsStarted; }

		bool Commit();

	private:

		Connection&	mConnection;
		bool		mIsStarted = false;
		bool		mIsDone = false;
	};

	// Fixed precision, so DECIMAL columns never receive exponent notation.
	String FormatDecimal(F64 value, int precision);

	// Lock wait timeout, deadlock or a lost connection.
	bool IsTransientError(unsigned int errorCode);
}
