
#pragma once

// Storage key layout: "project/country/client/camera-id/YYYY-MM-DD/file.ext".
// Directory segments are filled from the left, missing ones stay empty.
// Sample: "serengeti/TZ/tawiri/CAM-017/2024-05-17/CAM-017_20240517063102123.jpg"
class StorageKeyParser
{
public:
	StorageKeyParser(const String& rStorageKey);

	// False for an empty key, an empty segment, or a "." / ".." segment.
	auto IsValid() const { return mIsValid; }

	auto GetProjectName() const -> const String& { return mProjectName; }
	auto GetCountry() const -> const String& { return mCountry; }
	auto GetClient() const -> const String& { return mClient; }
	auto GetCameraId() const -> const String& { return mCameraId; }
	auto GetDateFolder() const -> const String& { return mDateFolder; }
	auto GetFileName() const -> const String& { return mFileName; }

	// Capture time embedded in the file name ("..._YYYYMMDDhhmmssmmm..."), as "YYYY-MM-DD hh:mm:ss".
	auto HasTimestamp() const { return !mTimestampStr.empty(); }
	auto GetTimestampStr() const -> const String& { return mTimestampStr; }
	auto GetTimestampMs() const { return mTimestampMs; }

private:

	void ParseFileName();

	String	mProjectName;
	String	mCountry;
	String	mClient;
	String	mCameraId;
	String	mDateFolder;
	String	mFileName;

	String	mTimestampStr;
	U16		mTimestampMs = 0;

	bool	mIsValid = false;
};
