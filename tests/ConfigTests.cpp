#include "PCH.hpp"

#include "Config.hpp"

#include <gtest/gtest.h>

#include <cstdio>

class ConfigTests : public ::testing::Test
{
protected:
	void SetUp() override
	{
		mFileName = ::testing::TempDir() + "camtrap_config_test.conf";

		std::ofstream file(mFileName, std::ios::out | std::ios::trunc);

		file << "// Comment line\r\n"
			 << "db_hostname = db.local\r\n"
			 << "db_port=3306\n"
			 << "detection_threshold=0.75\n"
			 << "empty_key=\n"
			 << "is_enabled=yes\n"
			 << "not_a_number=abc\n"
			 << "line without separator\n";
	}

	void TearDown() override
	{
		std::remove(mFileName.c_str());
	}

	String mFileName;
};

TEST_F(ConfigTests, ReadsTrimmedValues)
{
	Config config(mFileName);

	String hostname;
	config.Read("db_hostname", hostname);

	ASSERT_EQ(hostname, "db.local");
}

TEST_F(ConfigTests, ReadsNumbers)
{
	Config config(mFileName);

	U16 port = 0;
	F32 threshold = 0.0f;

	config.Read("db_port", port);
	config.Read("detection_threshold", threshold);

	ASSERT_EQ(port, 3306);
	ASSERT_FLOAT_EQ(threshold, 0.75f);
}

TEST_F(ConfigTests, ReadsBooleans)
{
	Config config(mFileName);

	bool isEnabled = false;
	config.Read("is_enabled", isEnabled);

	ASSERT_TRUE(isEnabled);
}

TEST_F(ConfigTests, HasIgnoresEmptyAndMissingValues)
{
	Config config(mFileName);

	ASSERT_TRUE(config.Has("db_port"));
	ASSERT_FALSE(config.Has("empty_key"));
	ASSERT_FALSE(config.Has("missing_key"));
	ASSERT_FALSE(config.Has("// Comment line"));
}

TEST_F(ConfigTests, InvalidIntegerKeepsTheDefault)
{
	Config config(mFileName);

	U32 value = 42;
	config.Read("not_a_number", value);

	ASSERT_EQ(value, 42u);

	config.Read("missing_key", value);

	ASSERT_EQ(value, 42u);
}

TEST_F(ConfigTests, MissingFileThrows)
{
	ASSERT_THROW(Config("/nonexistent/camtrap/Server.conf"), Exception);
}
