
#pragma once

constexpr int ExceptionTextSize = 2048;

class Exception
{
public:
	Exception() { mText[0] = 0; };
	Exception(const char* pText);

	const char* GetText() const { return mText; }

protected:

	char mText[ExceptionTextSize];
};

class ExceptionVA : public Exception
{
public:
	ExceptionVA(const char* pFormat, ...);
};

// Failure classes of a single image's processing run.
enum class ErrorKind : U8
{
	Decode,				// Image bytes can't be decoded at all.
	UnsupportedFormat,
	AdapterTransient,	// Inference service unreachable, timed out, busy.
	AdapterPermanent,	// Input rejected by the inference service.
	Persistence,
	Timeout,			// Invocation deadline passed.
	ClaimLost,			// Another invocation owns the image now.
	Internal			// Unexpected library failure, never retried.
};

class PipelineException : public Exception
{
public:
	PipelineException(ErrorKind kind, bool isRetryable, const char* pFormat, ...);

	auto GetKind() const { return mKind; }
	auto IsRetryable() const { return mIsRetryable; }

	static const char* KindToString(ErrorKind kind);

private:

	ErrorKind	mKind;
	bool		mIsRetryable;
};
