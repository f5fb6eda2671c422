#include "PCH.hpp"

#include <regex>

#include "Pipeline/StorageKeyParser.hpp"

StorageKeyParser::StorageKeyParser(const String& rStorageKey)
{
	if (rStorageKey.empty())
		return;

	Vector<String> segments;
	{
		std::istringstream ss(rStorageKey);
		String segment;

		while (std::getline(ss, segment, '/'))
			segments.push_back(segment);

		// "a/b/" ends with an empty file name.
		if (rStorageKey.back() == '/')
			segments.emplace_back();
	}

	for (const auto& rSegment : segments)
	{
		if (rSegment.empty() || rSegment == "." || rSegment == "..")
			return;
	}

	mFileName = segments.back();
	segments.pop_back();

	String* fields[] = { &mProjectName, &mCountry, &mClient, &mCameraId, &mDateFolder };

	for (size_t i = 0; i < segments.size() && i < sizeof(fields) / sizeof(fields[0]); ++i)
		*fields[i] = segments[i];

	// Only a real "YYYY-MM-DD" counts as a date folder.
	if (!mDateFolder.empty() && !std::regex_match(mDateFolder, std::regex("20\\d{2}-\\d{2}-\\d{2}")))
		mDateFolder.clear();

	ParseFileName();

	mIsValid = true;
}

void StorageKeyParser::ParseFileName()
{
	// Look for "_20", this will indicate that we're dealing with a timestamp.
	std::regex r("_(20\\d{2})(\\d{2})(\\d{2})(\\d{2})(\\d{2})(\\d{2})(\\d{3})");
	std::smatch m;

	if (!std::regex_search(mFileName, m, r))
		return;

	const int month = std::stoi(m[2].str());
	const int day = std::stoi(m[3].str());
	const int hour = std::stoi(m[4].str());
	const int minute = std::stoi(m[5].str());
	const int second = std::stoi(m[6].str());

	if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 59)
		return;

	std::ostringstream ss;

	ss << m[1] << '-' << m[2] << '-' << m[3] << ' ' << m[4] << ':' << m[5] << ':' << m[6];

	mTimestampStr = ss.str(); // "2019-03-14 09:50:09"
	mTimestampMs = static_cast<U16> (std::stoi(m[7].str()));
}
