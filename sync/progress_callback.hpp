#pragma once
#include <cstddef>
#include <cstdint>
#include "../common/model.hpp"

// Observer for runJob(). Every method is invoked inline on the thread that is
// running the job, so implementations must return quickly.
//
// Order per job: onJobStarted, then for each item onFileStarted ...
// onFileCompleted (with at most one onFileProgress in between), and finally
// onJobCompleted.
class ProgressCallback {
public:
    virtual ~ProgressCallback() = default;

    virtual void onJobStarted(const TransferJob& job) = 0;
    virtual void onFileStarted(const TransferJob& job, size_t fileIndex, const FileItem& file) = 0;
    // job.totalBytesCopied already includes bytesThisFile
    virtual void onFileProgress(const TransferJob& job, size_t fileIndex, uint64_t bytesThisFile) = 0;
    virtual void onFileCompleted(const TransferJob& job, size_t fileIndex, const FileItem& file) = 0;
    virtual void onJobCompleted(const TransferJob& job) = 0;
};
