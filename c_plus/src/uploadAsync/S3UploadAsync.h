#ifndef S3UPLOADASYNC_H
#define S3UPLOADASYNC_H

#include "../common/UploadCommon.h"

// Response codes returned in the "code" field of every facade response
enum FacadeResponseCode {
    RESPONSE_SUCCESS = 0,
    RESPONSE_INVALID_TASK = 1,
    RESPONSE_QUEUE_FULL = 2,
    RESPONSE_ENGINE_STOPPED = 3,
    RESPONSE_UNKNOWN_TASK = 4,
    // SDK resources were successfully initialized
    RESPONSE_SDK_INIT_SUCCESS = 5,
    // SDK resources were successfully cleaned up
    RESPONSE_SDK_CLEAN_SUCCESS = 6,
    RESPONSE_INTERNAL_ERROR = 9
};

// C ABI for foreign callers (e.g. a GUI). Every function returns a JSON document;
// returned pointers stay valid until the next call on the same thread.
extern "C" {
    // configJson: engine config keys plus a "credentials" object
    // {"accessKeyId", "secretAccessKey", "sessionToken"?, "expirationTimestampSecondsInUTC"?}
    S3BATCH_API const char* InitializeUploadEngine(const char* configJson);

    // tasksJson: [{"sourcePath", "bucketName", "objectKey"?}, ...]
    // Success response carries "taskIds" in submission order
    S3BATCH_API const char* UploadFilesAsync(const char* tasksJson);

    S3BATCH_API const char* CancelUpload(const char* taskId);

    // Copies the status snapshot JSON into buffer (truncating); returns bytes copied, 0 on error
    S3BATCH_API int GetUploadStatusBytes(unsigned char* buffer, int bufferSize);

    S3BATCH_API const char* ShutdownUploadEngine(int drainTimeoutMs);
}

// S3UPLOADASYNC_H
#endif
