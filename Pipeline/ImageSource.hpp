
#pragma once

#include "Pipeline/UploadNotice.hpp"

// Loads the bytes of an uploaded object.
class ImageSource
{
public:
	virtual ~ImageSource() = default;

	// Throws PipelineException: AdapterTransient when the object can't be read right now,
	// Decode when it is empty or its key is unusable.
	virtual void Load(const UploadNotice& rNotice, ByteBuffer& rBytes) = 0;
};

// Object store mirrored on the local file system as "<root>/<bucket>/<key>".
class FileImageSource : public ImageSource
{
public:
	FileImageSource(const String& rRootPath);

	void Load(const UploadNotice& rNotice, ByteBuffer& rBytes) override;

private:

	String mRootPath;
};
