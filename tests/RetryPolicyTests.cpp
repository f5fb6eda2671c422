#include "PCH.hpp"

#include "Pipeline/RetryPolicy.hpp"

#include <gtest/gtest.h>

class RetryPolicyTests : public ::testing::Test
{
protected:
	void SetUp() override {}
	void TearDown() override {}
};

TEST_F(RetryPolicyTests, BackoffDoublesUpToTheCap)
{
	RetryPolicy policy;

	policy.maxAttempts = 6;
	policy.backoffMs = 100;
	policy.backoffMaxMs = 500;

	ASSERT_EQ(policy.GetDelayMs(1), 100u);
	ASSERT_EQ(policy.GetDelayMs(2), 200u);
	ASSERT_EQ(policy.GetDelayMs(3), 400u);
	ASSERT_EQ(policy.GetDelayMs(4), 500u);
	ASSERT_EQ(policy.GetDelayMs(30), 500u);
}

TEST_F(RetryPolicyTests, ZeroBackoffNeverWaits)
{
	RetryPolicy policy;

	ASSERT_EQ(policy.GetDelayMs(1), 0u);
	ASSERT_EQ(policy.GetDelayMs(5), 0u);
}

TEST_F(RetryPolicyTests, DeadlineExpires)
{
	Deadline expired(0);

	ASSERT_TRUE(expired.IsExpired());
	ASSERT_EQ(expired.GetRemainingMs(), 0u);

	Deadline running(60);

	ASSERT_FALSE(running.IsExpired());
	ASSERT_GT(running.GetRemainingMs(), 59000u);
	ASSERT_LE(running.GetRemainingMs(), 60000u);
}
