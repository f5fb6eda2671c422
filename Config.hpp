
#pragma once

#include "Utils.hpp"

class Config
{
public:
	Config(const String& rFilename);

	bool Has(const char* pKey) const;

	void Read(const char* pKey, String& r) const;
	void Read(const char* pKey, F64& r) const;
	void Read(const char* pKey, F32& r) const;
	void Read(const char* pKey, bool& r) const;

	// Unsigned integers. "r" is left as is when the key is missing or the value is not a number.
	template<typename T>
	inline void Read(const char* pKey, T& r) const
	{
		auto it = mMap.find(pKey);

		if (it == mMap.end())
		{
			LOG_ERROR(Log::Channel::Main, "Config key \"%s\" not found!", pKey);
			return;
		}

		T value;

		if (!Utils::StringTo(it->second.c_str(), value))
		{
			LOG_ERROR(Log::Channel::Main, "Config key \"%s\" value \"%s\" is not integer!", pKey, it->second.c_str());
			return;
		}

		r = value;
	}

private:

	UnorderedMap<String, String> mMap;
};
