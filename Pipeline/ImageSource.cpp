#include "PCH.hpp"

#include "Pipeline/ImageSource.hpp"

#include "Utils.hpp"

FileImageSource::FileImageSource(const String& rRootPath)
	: mRootPath(rRootPath)
{
	if (!mRootPath.empty() && !Utils::EndsWith(mRootPath, '/'))
		mRootPath += '/';

	LOG_MESSAGE(Log::Channel::Pipeline, "Image source: %s", mRootPath.c_str());
}

void FileImageSource::Load(const UploadNotice& rNotice, ByteBuffer& rBytes)
{
	for (const auto& rPart : { rNotice.bucket, rNotice.key })
	{
		if (rPart.empty() || rPart.front() == '/' || rPart == ".." || Utils::StartsWith(rPart, "../")
			|| rPart.find("/../") != String::npos || Utils::EndsWith(rPart, "/.."))
		{
			throw PipelineException(ErrorKind::Decode, false, "Refusing object path \"%s/%s\"!", rNotice.bucket.c_str(), rNotice.key.c_str());
		}
	}

	const String fileName(mRootPath + rNotice.bucket + '/' + rNotice.key);

	if (!Utils::ReadFile(fileName, rBytes))
		throw PipelineException(ErrorKind::AdapterTransient, true, "Failed to read \"%s\"!", fileName.c_str());

	if (rBytes.empty())
		throw PipelineException(ErrorKind::Decode, false, "Object \"%s\" is empty!", fileName.c_str());
}
