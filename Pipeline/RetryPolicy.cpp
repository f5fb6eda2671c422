#include "PCH.hpp"

#include "Pipeline/RetryPolicy.hpp"

U32 RetryPolicy::GetDelayMs(U32 attempt) const
{
	U64 delay = backoffMs;

	for (U32 i = 1; i < attempt && delay < backoffMaxMs; ++i)
		delay *= 2;

	return static_cast<U32>(std::min<U64>(delay, backoffMaxMs));
}

Deadline::Deadline(U32 timeoutSec)
	: mEndTP(std::chrono::steady_clock::now() + std::chrono::seconds(timeoutSec))
{ }

bool Deadline::IsExpired() const
{
	return std::chrono::steady_clock::now() >= mEndTP;
}

U32 Deadline::GetRemainingMs() const
{
	const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(mEndTP - std::chrono::steady_clock::now()).count();

	return remaining > 0 ? static_cast<U32>(remaining) : 0;
}
