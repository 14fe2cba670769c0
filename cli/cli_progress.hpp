#pragma once
#include <chrono>
#include <ostream>
#include <string>
#include "../sync/progress_callback.hpp"

// Terminal renderer for a running job: header, throttled progress bar, and a
// summary with the failed and mismatched items.
class CliProgress : public ProgressCallback {
public:
    CliProgress(std::ostream& out, bool verbose);

    void onJobStarted(const TransferJob& job) override;
    void onFileStarted(const TransferJob& job, size_t fileIndex, const FileItem& file) override;
    void onFileProgress(const TransferJob& job, size_t fileIndex, uint64_t bytesThisFile) override;
    void onFileCompleted(const TransferJob& job, size_t fileIndex, const FileItem& file) override;
    void onJobCompleted(const TransferJob& job) override;

    static std::string formatBytes(uint64_t bytes);
    static std::string formatDuration(std::chrono::seconds elapsed);
    static std::string progressBar(unsigned percent);

private:
    void drawProgress(const TransferJob& job);
    static std::string displayName(const FileItem& file);

    std::ostream& out_;
    bool verbose_;
    std::chrono::steady_clock::time_point startTime_;
    std::chrono::steady_clock::time_point lastProgressUpdate_;
};
