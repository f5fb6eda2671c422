
#pragma once

namespace Utils
{

	// ISO 8601 UTC, i.e. "2024-05-17T06:31:02Z".
	String StringFromUtcNow();

	String GetApplicationPath();

	bool MakePath(String path);
	bool EndsWith(const String& rStr, const String& rEnding);
	bool EndsWith(const String& rStr, const char c);
	bool StartsWith(const String& rStr, const String& rPrefix);
	bool IsEqual(const String& a, const String& b);

	String Trim(const String& rStr);
	Vector<String> Split(const String& rStr, char delimiter);

	// Decodes "%XX" escapes. With "isPlusSpace", '+' is decoded as a space (form / S3 event key encoding).
	String UrlDecode(const String& rStr, bool isPlusSpace = true);
	String UrlEncode(const String& rStr);

	// Every byte that is not part of a well-formed UTF-8 sequence becomes U+FFFD.
	String ToValidUtf8(const String& rStr);

	// Lowercase hex SHA-256 digest.
	String Sha256Hex(const U8* pData, size_t size);

	bool ReadFile(const String& rFileName, ByteBuffer& rBuffer);

	template <typename T>
	bool StringTo(const char* pValue, T& r)
	{
		try
		{
			r = static_cast<T> (std::stoul(pValue));
		}
		catch (const std::invalid_argument& e)
		{
			r = 0;
			return false;
		}
		catch (const std::out_of_range& e)
		{
			r = 0;
			return false;
		}

		return true;
	}
}
