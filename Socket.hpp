#pragma once

namespace Socket
{
	SocketId CreateServer(U16& rPort, int maxConnectionsQuery, bool isBlocking = false);

	SocketId Create();
	void     Close(SocketId& rSocketId);

	// Blocking TCP connection with send/receive timeouts set to "timeoutSec".
	// Resolves host names. Throws Exception when no address could be reached in time.
	SocketId Connect(const String& rHostname, U16 port, U32 timeoutSec);

	void SendText(SocketId socketId, const String& rText);
	void Send(SocketId socketId, const char* pBuffer, const ssize_t bufferSize);

	// False when the peer closed the connection, the receive timeout expired or recv failed.
	bool Read(SocketId socketId, char* pBuffer, const size_t bufferSize);

	void SetReusable(SocketId socketId);
	void SetNonBlocking(SocketId socketId, bool isOn = true);
	void SetTimeout(SocketId socketId, U32 timeoutSec);
	bool IsBlocking(SocketId socketId);

	char* GetErrorString(int errorCode);

	int GetErrorCode();
};
