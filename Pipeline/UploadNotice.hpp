
#pragma once

// One uploaded object, as named by the storage notification.
struct UploadNotice
{
	String bucket;
	String key;
};

namespace StorageEvent
{
	// {"Records":[{"s3":{"bucket":{"name":".."},"object":{"key":".."}}}]}
	// Keys arrive URL encoded ('+' for space). Records without a bucket or key are skipped.
	// False when the body is not such a document.
	bool Parse(const String& rJSON, Vector<UploadNotice>& rList);
}
