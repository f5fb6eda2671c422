#include <PCH.hpp>

#include "Database.hpp"
#include "DatabaseConnectionPool.hpp"

namespace Database
{
	ConnectionPool::Lease::Lease(ConnectionPool& rPool, Connection* pConnection)
		: mPool(rPool)
		, mpConnection(pConnection)
	{ }

	ConnectionPool::Lease::Lease(Lease&& r)
		: mPool(r.mPool)
		, mpConnection(r.mpConnection)
	{
		r.mpConnection = nullptr;
	}

	ConnectionPool::Lease::~Lease()
	{
		if (mpConnection)
			mPool.Release(mpConnection);
	}

	ConnectionPool::ConnectionPool(const Info& rInfo, size_t size, U32 connectTimeoutSec /* = 7 */)
	{
		if (size == 0)
			throw Exception("Database connection pool size can't be zero!");

		mConnections.reserve(size);
		mIdle.reserve(size);

		for (size_t i = 0; i < size; ++i)
		{
			auto connectionPtr = std::make_unique<Connection>();

			if (!connectionPtr->Connect(rInfo, connectTimeoutSec, 3))
				throw ExceptionVA("Failed to open pooled Database connection %zu of %zu!", i + 1, size);

			mIdle.push_back(connectionPtr.get());
			mConnections.emplace_back(std::move(connectionPtr));
		}

		LOG_MESSAGE(Log::Channel::DB, "Database connection pool ready. (%zu connections)", size);
	}

	ConnectionPool::Lease ConnectionPool::Acquire()
	{
		std::unique_lock<std::mutex> lock(mMutex);

		mCondition.wait(lock, [this] { return !mIdle.empty(); });

		auto pConnection = mIdle.back();
		mIdle.pop_back();

		return Lease(*this, pConnection);
	}

	void ConnectionPool::Release(Connection* pConnection)
	{
		// A connection must never go back to the pool with an open transaction.
		if (pConnection->IsInTransaction() && !pConnection->Rollback())
			LOG_ERROR(Log::Channel::DB, "Rollback of a released connection failed! (Reason: %s)", pConnection->GetLastError());

		{
			std::lock_guard<std::mutex> lock(mMutex);
			mIdle.push_back(pConnection);
		}

		mCondition.notify_one();
	}
}
