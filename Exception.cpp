#include <PCH.hpp>

#include "Exception.hpp"

#include <string.h>	// strncpy
#include <cstdarg>	// va_start
#include <cstdio>	// vsnprintf

Exception::Exception(const char* pText)
{
	strncpy(mText, pText, ExceptionTextSize - 1);

	mText[ExceptionTextSize - 1] = 0;
}

ExceptionVA::ExceptionVA(const char* pFormat, ...)
{
	va_list args;
	va_start(args, pFormat);

	// Returns the number of characters written (not including the terminating null) 
	// Or a negative value if an output error occurs.
	vsnprintf(mText, sizeof(mText) - 1, pFormat, args);

	va_end(args);

	mText[sizeof(mText) - 1] = 0;
}

PipelineException::PipelineException(ErrorKind kind, bool isRetryable, const char* pFormat, ...)
	: mKind(kind)
	, mIsRetryable(isRetryable)
{
	va_list args;
	va_start(args, pFormat);

	vsnprintf(mText, sizeof(mText) - 1, pFormat, args);

	va_end(args);

	mText[sizeof(mText) - 1] = 0;
}

const char* PipelineException::KindToString(ErrorKind kind)
{
	switch (kind)
	{
		case ErrorKind::Decode:				return "decode";
		case ErrorKind::UnsupportedFormat:	return "unsupported-format";
		case ErrorKind::AdapterTransient:	return "adapter-transient";
		case ErrorKind::AdapterPermanent:	return "adapter-permanent";
		case ErrorKind::Persistence:		return "persistence";
		case ErrorKind::Timeout:			return "timeout";
		case ErrorKind::ClaimLost:			return "claim-lost";
		case ErrorKind::Internal:			return "internal";
	}

	return "unknown";
}
