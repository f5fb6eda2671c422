
#pragma once

// Exponential backoff: "backoffMs", doubled per retry, capped at "backoffMaxMs".
struct RetryPolicy
{
	U32 maxAttempts = 1;
	U32 backoffMs = 0;
	U32 backoffMaxMs = 0;

	// Delay before attempt "attempt + 1", "attempt" counting from 1.
	U32 GetDelayMs(U32 attempt) const;
};

// Overall time budget of one invocation.
class Deadline
{
public:
	Deadline(U32 timeoutSec);

	bool IsExpired() const;
	U32 GetRemainingMs() const;

private:

	TimePoint mEndTP;
};
