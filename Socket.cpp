#include "PCH.hpp"

#include "Socket.hpp"

#include <fcntl.h>

#include <unistd.h>		// close
#include <sys/socket.h>	// socket
#include <netinet/in.h> // sockaddr_in
#include <sys/ioctl.h>	// ioctl
#include <sys/time.h>	// timeval
#include <netdb.h>		// getaddrinfo
#include <poll.h>

#include <string.h>	// strerror

namespace
{
	// Waits for a non-blocking "connect" to finish.
	bool WaitConnected(SocketId socketId, U32 timeoutSec)
	{
		pollfd fd{};

		fd.fd = socketId;
		fd.events = POLLOUT;

		const int result = poll(&fd, 1, static_cast<int>(timeoutSec * 1000));

		if (result <= 0)
			return false;

		int error = 0;
		socklen_t length = sizeof(error);

		if (getsockopt(socketId, SOL_SOCKET, SO_ERROR, &error, &length) == SOCKET_ERROR)
			return false;

		if (error != 0)
		{
			errno = error;
			return false;
		}

		return true;
	}
}

namespace Socket
{
	// IMPORTANT: Exception is thrown on failure. User is responsible for handling the exception.
	// port - If set to zero, the system assigns a free port and "rPort" receives it.
	SocketId CreateServer(U16& rPort, int maxConnectionsQuery, bool isBlocking /* = false */)
	{
		SocketId socketId = Socket::Create();

		try
		{
			Socket::SetReusable(socketId);

			if (!isBlocking)
				Socket::SetNonBlocking(socketId);

			sockaddr_in addr{};

			addr.sin_family = AF_INET;
			addr.sin_addr.s_addr = htonl(INADDR_ANY);
			addr.sin_port = htons(rPort);

			if (bind(socketId, (struct sockaddr*) &addr, sizeof(sockaddr_in)) == SOCKET_ERROR)
			{
				int errorCode = Socket::GetErrorCode();
				throw ExceptionVA("Failed for \"bind\"! (Error: %s, Code: %d)", Socket::GetErrorString(errorCode), errorCode);
			}

			if (rPort == 0)
			{
				struct sockaddr_in sin;
				socklen_t len = sizeof(sin);

				if (getsockname(socketId, (struct sockaddr *)&sin, &len) != -1)
					rPort = ntohs(sin.sin_port);
			}

			if (listen(socketId, maxConnectionsQuery) == -1)
				throw Exception("Failed for \"listen\"!");
		}
		catch (const Exception&)
		{
			Socket::Close(socketId);
			throw;
		}

		return socketId;
	}

	SocketId Create()
	{
		SocketId socketId = socket(AF_INET, SOCK_STREAM, 0);

		if (socketId == SOCKET_ERROR)
		{
			int errorCode = Socket::GetErrorCode();
			throw ExceptionVA("Failed for \"socket\"! (Error: %s, Code: %d)", Socket::GetErrorString(errorCode), errorCode);
		}

		return socketId;
	}

	void Close(SocketId& rSocketId)
	{
		if (rSocketId != INVALID_SOCKET)
		{
			close(rSocketId);

			rSocketId = INVALID_SOCKET;
		}
	}

	SocketId Connect(const String& rHostname, U16 port, U32 timeoutSec)
	{
		addrinfo hints{};
		{
			hints.ai_family = AF_UNSPEC;	// To allow both IPv4 and IPv6 addresses.
			hints.ai_socktype = SOCK_STREAM;
			hints.ai_protocol = IPPROTO_TCP;
		}

		const String portString(std::to_string(port));

		addrinfo* pAddrInfo = nullptr;

		int result = getaddrinfo(rHostname.c_str(), portString.c_str(), &hints, &pAddrInfo);
		if (result != 0)
			throw ExceptionVA("Failed for \"getaddrinfo(\"%s:%s\")\"! (Error: %s, Code: %d)", rHostname.c_str(), portString.c_str(), gai_strerror(result), result);

		SocketId socketId = INVALID_SOCKET;
		int errorCode = 0;

		for (addrinfo* p = pAddrInfo; p; p = p->ai_next)
		{
			socketId = socket(p->ai_family, p->ai_socktype, p->ai_protocol);

			if (socketId == INVALID_SOCKET)
			{
				errorCode = Socket::GetErrorCode();
				continue;
			}

			const int flags = fcntl(socketId, F_GETFL, 0);
			fcntl(socketId, F_SETFL, flags | O_NONBLOCK);

			// "O_NONBLOCK is set for the file descriptor for the socket and the connection cannot be immediately established;
			//  the connection shall be established asynchronously"
			if (connect(socketId, p->ai_addr, p->ai_addrlen) == 0
				|| (Socket::GetErrorCode() == EINPROGRESS && WaitConnected(socketId, timeoutSec)))
			{
				fcntl(socketId, F_SETFL, flags);
				break;
			}

			errorCode = Socket::GetErrorCode();

			Socket::Close(socketId);
		}

		freeaddrinfo(pAddrInfo);

		if (socketId == INVALID_SOCKET)
		{
			if (errorCode == 0)
				errorCode = ETIMEDOUT;

			throw ExceptionVA("Failed to connect to %s:%u! (Error: %s, Code: %d)", rHostname.c_str(), port, Socket::GetErrorString(errorCode), errorCode);
		}

		try
		{
			Socket::SetTimeout(socketId, timeoutSec);
		}
		catch (const Exception&)
		{
			Socket::Close(socketId);
			throw;
		}

		return socketId;
	}

	void SendText(SocketId socketId, const String& rText)
	{
		Socket::Send(socketId, rText.c_str(), static_cast<ssize_t>(rText.size()));
	}

	void Send(SocketId socketId, const char* pBuffer, const ssize_t bufferSize)
	{
		// MSG_NOSIGNAL - Requests not to send SIGPIPE on errors on stream oriented sockets when the other end breaks the connection.
		ssize_t numBytesSent = 0;

		while (numBytesSent < bufferSize)
		{
			const ssize_t bytesSent = send(socketId, pBuffer + numBytesSent, bufferSize - numBytesSent, MSG_NOSIGNAL);

			if (bytesSent == 0)
				throw Exception("Failed for \"send\"! (Socket was closed)");

			if (bytesSent == SOCKET_ERROR)
			{
				int errorCode = Socket::GetErrorCode();

				// Non-blocking socket with a full send buffer. On a blocking socket this is the send timeout.
				if (errorCode == EWOULDBLOCK && !Socket::IsBlocking(socketId))
				{
					std::this_thread::yield();
					continue;
				}

				// Throwing exception instead of LOG_ERROR because it will be more clearer on where did the send function failed.
				throw ExceptionVA("Failed for \"send\"! (Error: %s, Code: %d)", Socket::GetErrorString(errorCode), errorCode);
			}

			numBytesSent += bytesSent;
		}
	}

	bool Read(SocketId socketId, char* pBuffer, const size_t bufferSize)
	{
		size_t bytesReceivedTotal = 0;

		while (bytesReceivedTotal < bufferSize)
		{
			ssize_t bytesReceived = recv(socketId, &pBuffer[bytesReceivedTotal], bufferSize - bytesReceivedTotal, 0);

			if (bytesReceived == 0)
				break; // No more data.

			if (bytesReceived == SOCKET_ERROR)
			{
				int errorCode = Socket::GetErrorCode();

				if (errorCode == EINTR)
					continue;

				if (errorCode == EWOULDBLOCK)
				{
					// Receive timeout of a blocking socket.
					if (Socket::IsBlocking(socketId))
					{
						LOG_WARNING(Log::Channel::Main, "Socket read timed out. (%zu of %zu bytes)", bytesReceivedTotal, bufferSize);
						break;
					}

					std::this_thread::yield();
					continue;
				}

				LOG_ERROR(Log::Channel::Main, "Failed for \"recv\"! (Error: %s, Code: %d)", Socket::GetErrorString(errorCode), errorCode);
				break;
			}

			bytesReceivedTotal += bytesReceived;
		}

		return (bytesReceivedTotal == bufferSize);
	}

	void SetReusable(SocketId socketId)
	{
		int enable = 1;

		if (setsockopt(socketId, SOL_SOCKET, SO_REUSEADDR, &enable, sizeof(enable)) < 0)
		{
			int errorCode = Socket::GetErrorCode();
			throw ExceptionVA("Failed for \"setsockopt(SO_REUSEADDR)\"! (Error: %s, Code: %d)", Socket::GetErrorString(errorCode), errorCode);
		}
	}

	void SetNonBlocking(SocketId socketId, bool isOn /* = true */)
	{
		int value = isOn ? 1 : 0;

		if (ioctl(socketId, FIONBIO, &value) == SOCKET_ERROR)
		{
			int errorCode = Socket::GetErrorCode();
			throw ExceptionVA("Failed to change the socket's non-blocking mode! (Error: %s, Code: %d)", Socket::GetErrorString(errorCode), errorCode);
		}
	}

	void SetTimeout(SocketId socketId, U32 timeoutSec)
	{
		timeval tv{};

		tv.tv_sec = static_cast<time_t>(timeoutSec);

		if (setsockopt(socketId, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0
			|| setsockopt(socketId, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) < 0)
		{
			int errorCode = Socket::GetErrorCode();
			throw ExceptionVA("Failed for \"setsockopt(SO_RCVTIMEO)\"! (Error: %s, Code: %d)", Socket::GetErrorString(errorCode), errorCode);
		}
	}

	bool IsBlocking(SocketId socketId)
	{
		int value = fcntl(socketId, F_GETFL, 0);

		if (value == -1)
			return true;

		return !(value & O_NONBLOCK);
	}

	char* GetErrorString(int errorCode)
	{
		return strerror(errorCode); // Return a string describing error number.
	}

	int GetErrorCode()
	{
		return errno;
	}
}
