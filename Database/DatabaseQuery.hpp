
#pragma once

namespace Database
{
	class Query
	{
	public:
		Query(Connection& rDB);
		~Query();

		Query(const Query&) = delete;
		Query& operator=(const Query&) = delete;

		bool Exec(const String& rQueryString);
		bool Next();
		U64 LastInsertId() const;
		U64 NumResults() const;

		// Rows changed (or matched with CLIENT_FOUND_ROWS) by the last INSERT/UPDATE/DELETE.
		U64 AffectedRows() const { return mAffectedRows; }

		unsigned int ErrorCode() const;

		auto Value(int index) { return mpRow[index]; }

		bool IsNull(int index) const { return mpRow[index] == nullptr; }

		String ValueString(int index)
		{
			if (!mpRow[index])
				return String();

			return String(mpRow[index], mpLengths[index]);
		}

		bool ValueBool(int index)
		{ 
			if (!mpRow[index])
				return false;

			return *mpRow[index] != '0';
		}

		U8 ValueU8(int index)
		{
			if (!mpRow[index])
				return 0;

			return static_cast<U8> (std::atoi(mpRow[index]));
		}

		U32 ValueU32(int index)
		{
			if (!mpRow[index])
				return 0;

			return static_cast<U32> (std::strtoul(mpRow[index], nullptr, 10));
		}

		U64 ValueU64(int index)
		{
			if (!mpRow[index])
				return 0;

			return static_cast<U64> (std::strtoull(mpRow[index], nullptr, 10));
		}

		F64 ValueF64(int index)
		{
			if (!mpRow[index])
				return 0.0;

			return std::strtod(mpRow[index], nullptr);
		}

	private:

		Connection&		mConnection;
		MYSQL_RES*		mpResult = nullptr;
		MYSQL_ROW		mpRow = nullptr;
		unsigned long*	mpLengths = nullptr;
		U64				mAffectedRows = 0;
	};
}
