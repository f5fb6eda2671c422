#include <PCH.hpp>

#include "Config.hpp"
#include "Utils.hpp"

Config::Config(const String& rFilename)
{
	std::ifstream file(rFilename);

	if (!file.is_open())
		throw ExceptionVA("Failed to open: \"%s\"!", rFilename.c_str());

	for (String line; std::getline(file, line); )
	{
		// Files edited on Windows.
		if (!line.empty() && line.back() == '\r')
			line.pop_back();

		// Skip empty lines and comments.
		if (line.empty() || line.find("//") == 0)
			continue;

		std::size_t pos = line.find_first_of('=');

		if (pos == String::npos)
			continue;

		mMap[Utils::Trim(line.substr(0, pos))] = Utils::Trim(line.substr(pos + 1));
	}
}

bool Config::Has(const char* pKey) const
{
	auto it = mMap.find(pKey);

	return it != mMap.end() && !it->second.empty();
}

void Config::Read(const char* pKey, String& r) const
{
	try
	{
		r = mMap.at(pKey);
	}
	catch (const std::out_of_range& e)
	{
		LOG_ERROR(Log::Channel::Main, "Config key \"%s\" not found!", pKey);
	}
}

void Config::Read(const char* pKey, F64& r) const
{
	try
	{
		r = std::stod(mMap.at(pKey));
	}
	catch (const std::invalid_argument& e)
	{
		LOG_ERROR(Log::Channel::Main, "Config key \"%s\" value is not a number!", pKey);
	}
	catch (const std::out_of_range& e)
	{
		LOG_ERROR(Log::Channel::Main, "Config key \"%s\" not found!", pKey);
	}
}

void Config::Read(const char* pKey, F32& r) const
{
	F64 value = r;

	Read(pKey, value);

	r = static_cast<F32> (value);
}

// "1", "true", "yes" and "on" (any case) are true, anything else is false.
void Config::Read(const char* pKey, bool& r) const
{
	auto it = mMap.find(pKey);

	if (it == mMap.end())
	{
		LOG_ERROR(Log::Channel::Main, "Config key \"%s\" not found!", pKey);
		return;
	}

	const auto& rValue = it->second;

	r = rValue == "1" || Utils::IsEqual(rValue, "true") || Utils::IsEqual(rValue, "yes") || Utils::IsEqual(rValue, "on");
}
