#include "PCH.hpp"

#include <sys/stat.h>	// mkdir
#include <unistd.h>		// readlink

#include <iomanip> // std::put_time, std::setw

#include <openssl/evp.h>

#include "Utils.hpp"
#include "Exception.hpp"

namespace Utils
{
	auto StringFromUtcNow() -> String
	{
		auto posixTime = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());

		std::tm tm{};
		gmtime_r(&posixTime, &tm);

		std::ostringstream ss;
		ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");

		return ss.str();
	}

	auto GetApplicationPath() -> String
	{
		char buffer[1024]{};

		// i.e. "/opt/camtrap/bin/CamTrapServer"
		const auto length = ::readlink("/proc/self/exe", buffer, sizeof(buffer) - 1);

		if (length == -1)
			throw Exception("GetApplicationPath failed for \"readlink\"!");

		String path(buffer);

		const size_t pos = path.find_last_of('/');

		if (pos != String::npos)
			path = path.substr(0, pos + 1); // Get rid of "CamTrapServer"

		return path; // "/opt/camtrap/bin/"
	}

	// https://stackoverflow.com/questions/675039/how-can-i-create-directory-tree-in-c-linux
	auto MakePath(String path) -> bool
	{
		if (path.empty())
			return false;

		if (path[path.size() - 1] != '/')
			path += '/';

		const mode_t mode = 0777;

		std::size_t pos = 0;

		while ((pos = path.find_first_of('/', pos)) != String::npos)
		{
			const String dir(path.substr(0, pos++));

			if (dir.size() == 0)
				continue;

			if (mkdir(dir.c_str(), mode) != 0 && errno != EEXIST)
			{
				printf("Failed to create \"%s\" dir while creating path: \"%s\"!\n", dir.c_str(), path.c_str());
				return false;
			}
		}

		return true;
	}

	// NOTE: "String::ends_with" contains this, but only from C++ 20
	auto EndsWith(const String& rStr, const String& rEnding) -> bool
	{
		if (rStr.length() < rEnding.length())
			return false;

		return rStr.compare(rStr.length() - rEnding.length(), rEnding.length(), rEnding) == 0;
	}

	auto EndsWith(const String& rStr, const char c) -> bool
	{
		return rStr.size() > 0 && rStr[rStr.size() - 1] == c;
	}

	auto StartsWith(const String& rStr, const String& rPrefix) -> bool
	{
		return rStr.compare(0, rPrefix.length(), rPrefix) == 0;
	}

	auto IsEqual(const String& a, const String& b) -> bool
	{
		if (a.size() != b.size())
			return false;

		return std::equal(
			a.begin(), a.end(),
			b.begin(),
			[](char a, char b) { return tolower(a) == tolower(b); });
	}

	auto Trim(const String& rStr) -> String
	{
		const char* pWhitespace = " \t\r\n";

		const auto begin = rStr.find_first_not_of(pWhitespace);

		if (begin == String::npos)
			return String();

		const auto end = rStr.find_last_not_of(pWhitespace);

		return rStr.substr(begin, end - begin + 1);
	}

	auto Split(const String& rStr, char delimiter) -> Vector<String>
	{
		Vector<String> output;

		std::stringstream ss(rStr);
		String token;

		while (std::getline(ss, token, delimiter))
			output.emplace_back(token);

		return output;
	}

	auto UrlDecode(const String& rStr, bool isPlusSpace /* = true */) -> String
	{
		String output;
		output.reserve(rStr.size());

		for (size_t i = 0; i < rStr.size(); ++i)
		{
			const char c = rStr[i];

			if (c == '%' && i + 2 < rStr.size() && isxdigit(static_cast<unsigned char> (rStr[i + 1])) && isxdigit(static_cast<unsigned char> (rStr[i + 2])))
			{
				output += static_cast<char> (std::stoi(rStr.substr(i + 1, 2), nullptr, 16));
				i += 2;
			}
			else if (c == '+' && isPlusSpace)
			{
				output += ' ';
			}
			else
			{
				output += c;
			}
		}

		return output;
	}

	auto UrlEncode(const String& rStr) -> String
	{
		std::ostringstream ss;

		ss.fill('0');
		ss << std::hex << std::uppercase;

		for (unsigned char c : rStr)
		{
			if (isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' || c == '/')
				ss << c;
			else
				ss << '%' << std::setw(2) << static_cast<int> (c);
		}

		return ss.str();
	}

	auto ToValidUtf8(const String& rStr) -> String
	{
		static const char replacement[] = "\xEF\xBF\xBD";

		String result;
		result.reserve(rStr.size());

		const auto* p = reinterpret_cast<const U8*>(rStr.data());
		const size_t size = rStr.size();

		for (size_t i = 0; i < size; )
		{
			const U8 c = p[i];

			if (c < 0x80)
			{
				result += static_cast<char>(c);
				++i;
				continue;
			}

			size_t length = 0;
			U8 low = 0x80;
			U8 high = 0xBF;

			// Second byte ranges exclude overlong forms, surrogates and code points above U+10FFFF.
			if (c >= 0xC2 && c <= 0xDF)			length = 2;
			else if (c == 0xE0)					{ length = 3; low = 0xA0; }
			else if (c == 0xED)					{ length = 3; high = 0x9F; }
			else if (c >= 0xE1 && c <= 0xEF)	length = 3;
			else if (c == 0xF0)					{ length = 4; low = 0x90; }
			else if (c >= 0xF1 && c <= 0xF3)	length = 4;
			else if (c == 0xF4)					{ length = 4; high = 0x8F; }

			bool isValid = length != 0 && i + length <= size;

			for (size_t k = 1; isValid && k < length; ++k)
			{
				const U8 next = p[i + k];

				isValid = k == 1 ? (next >= low && next <= high) : (next >= 0x80 && next <= 0xBF);
			}

			if (!isValid)
			{
				result += replacement;
				++i;
				continue;
			}

			result.append(rStr, i, length);
			i += length;
		}

		return result;
	}

	auto Sha256Hex(const U8* pData, size_t size) -> String
	{
		unsigned char digest[EVP_MAX_MD_SIZE];
		unsigned int digestLength = 0;

		if (EVP_Digest(pData, size, digest, &digestLength, EVP_sha256(), nullptr) != 1)
			throw Exception("Failed for \"EVP_Digest(sha256)\"!");

		std::ostringstream ss;

		ss.fill('0');
		ss << std::hex;

		for (unsigned int i = 0; i < digestLength; ++i)
			ss << std::setw(2) << static_cast<int> (digest[i]);

		return ss.str();
	}

	auto ReadFile(const String& rFileName, ByteBuffer& rBuffer) -> bool
	{
		std::ifstream fileStream(rFileName, std::ios::in | std::ifstream::binary);

		if (!fileStream.is_open())
			return false;

		// Determine the file size.
		fileStream.seekg(0, std::ios_base::end);

		const auto length = fileStream.tellg();

		if (length < 0)
			return false;

		rBuffer.resize(static_cast<size_t> (length));

		fileStream.seekg(0, std::ios_base::beg);
		fileStream.read(reinterpret_cast<char*> (rBuffer.data()), length);

		return static_cast<bool> (fileStream) || length == 0;
	}
}
