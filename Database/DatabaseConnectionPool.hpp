
#pragma once

namespace Database
{
	// Fixed set of connections shared by the pipeline workers, one per worker at a time.
	class ConnectionPool
	{
	public:
		class Lease
		{
		public:
			Lease(ConnectionPool& rPool, Connection* pConnection);
			Lease(Lease&& r);
			~Lease();

			Lease(const Lease&) = delete;
			Lease& operator=(const Lease&) = delete;
			Lease& operator=(Lease&&) = delete;

			Connection& operator*() { return *mpConnection; }
			Connection* operator->() { return mpConnection; }

		private:

			ConnectionPool&	mPool;
			Connection*		mpConnection;
		};

		// Throws Exception when any of the connections can't be established.
		ConnectionPool(const Info& rInfo, size_t size, U32 connectTimeoutSec = 7);

		ConnectionPool(const ConnectionPool&) = delete;
		ConnectionPool& operator=(const ConnectionPool&) = delete;

		// Blocks until a connection is free.
		Lease Acquire();

		auto GetSize() const { return mConnections.size(); }

	private:

		void Release(Connection* pConnection);

		Vector<UniquePtr<Connection>>	mConnections;
		Vector<Connection*>				mIdle;

		std::mutex						mMutex;
		std::condition_variable			mCondition;
	};
}
