#include "sync_engine.hpp"
#include "overwrite_policy.hpp"
#include "../checksum/checksum.hpp"
#include "../common/config.hpp"
#include "../destination/destination_manager.hpp"
#include "../source/tree_enumerator.hpp"
#include <ctime>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <random>
#include <sstream>

namespace fs = std::filesystem;

namespace {

std::string makeJobId() {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&t, &tm);

    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<uint32_t> dist;

    std::ostringstream id;
    id << std::put_time(&tm, "%Y%m%d-%H%M%S") << "-"
       << std::hex << std::setw(8) << std::setfill('0') << dist(gen);
    return id.str();
}

Result<void> requirePending(const TransferJob& job, const char* operation) {
    if (job.state == JobState::Pending) return Result<void>::Ok();
    return Result<void>::Error(EngineError(ErrorKind::InvalidState, job.sourcePath,
        std::string("job must be Pending to ") + operation + ", current state: " + jobStateName(job.state)));
}

void verifyCopiedItem(TransferJob& job, FileItem& item) {
    if (!job.verifyAfterCopy || !job.checksumAlgorithm) return;

    auto verified = verifyFileItem(item, *job.checksumAlgorithm);
    if (!verified.success) {
        item.errorMessage = "Checksum verification error: " + verified.error.toString();
    } else if (!verified.data) {
        item.errorMessage = "Checksum verification failed: source and destination differ";
    }
}

} // namespace

Result<TransferJob> createJob(const fs::path& source, const fs::path& destination,
                              Mode mode, OverwritePolicy overwritePolicy) {
    std::error_code ec;
    fs::file_status st = fs::status(source, ec);
    if (st.type() == fs::file_type::not_found) {
        return Result<TransferJob>::Error(EngineError(ErrorKind::SourceNotFound, source));
    }
    if (ec) {
        return Result<TransferJob>::Error(EngineError::fromErrorCode(ErrorKind::SourceAccessDenied, source, ec));
    }
    if (!fs::is_directory(st)) {
        return Result<TransferJob>::Error(EngineError(ErrorKind::InvalidPath, source, "source must be a directory"));
    }

    const std::string& dest = destination.native();
    if (dest.empty()) {
        return Result<TransferJob>::Error(EngineError(ErrorKind::InvalidPath, destination, "destination path is empty"));
    }
    if (dest.find('\0') != std::string::npos) {
        return Result<TransferJob>::Error(EngineError(ErrorKind::InvalidPath, destination, "destination path contains a NUL byte"));
    }
    if (dest.size() > Config::MAX_PATH_LENGTH) {
        return Result<TransferJob>::Error(EngineError(ErrorKind::PathTooLong, destination));
    }

    TransferJob job;
    job.id = makeJobId();
    job.mode = mode;
    job.sourcePath = source;
    job.destinationPath = destination;
    job.overwritePolicy = overwritePolicy;
    job.createdAt = std::chrono::system_clock::now();
    return Result<TransferJob>::Ok(std::move(job));
}

Result<void> planJob(TransferJob& job) {
    auto pending = requirePending(job, "plan");
    if (!pending.success) return pending;

    TreeEnumerator enumerator(job.sourcePath, job.destinationPath);
    auto items = enumerator.enumerate();
    if (!items.success) return Result<void>::Error(items.error);

    job.files = std::move(items.data);
    job.totalBytesToCopy = std::accumulate(job.files.begin(), job.files.end(), uint64_t{0},
        [](uint64_t sum, const FileItem& f) { return f.isDir ? sum : sum + f.fileSize; });
    return Result<void>::Ok();
}

Result<void> runJob(TransferJob& job, ProgressCallback* callback) {
    auto pending = requirePending(job, "run");
    if (!pending.success) return pending;

    if (job.mode == Mode::Move) {
        std::cerr << "[SyncEngine] Move mode does not remove source files yet, running job "
                  << job.id << " as a copy\n";
    }

    job.state = JobState::Running;
    job.startTime = std::chrono::system_clock::now();
    if (callback) callback->onJobStarted(job);

    for (size_t index = 0; index < job.files.size(); ++index) {
        job.currentFileIndex = index;
        FileItem& item = job.files[index];

        if (callback) callback->onFileStarted(job, index, item);

        // a directory the enumerator could not read is already Failed
        if (isTerminal(item.state)) {
            if (callback) callback->onFileCompleted(job, index, item);
            continue;
        }

        if (decideForItem(item, job.overwritePolicy) == TransferAction::Skip) {
            item.state = FileState::Skipped;
            if (callback) callback->onFileCompleted(job, index, item);
            continue;
        }

        DestinationManager dest(item.destinationPath);
        item.state = FileState::Copying;

        if (item.isDir) {
            auto created = dest.ensureDirectory();
            if (created.success) {
                item.state = FileState::Done;
            } else {
                item.markFailed(created.error);
            }
            if (callback) callback->onFileCompleted(job, index, item);
            continue;
        }

        auto copied = dest.copyFrom(item.sourcePath);
        if (copied.success) {
            item.bytesCopied = copied.data;
            item.state = FileState::Done;
            job.totalBytesCopied += copied.data;
            if (callback) callback->onFileProgress(job, index, copied.data);
            verifyCopiedItem(job, item);
        } else {
            item.markFailed(copied.error);
        }

        if (callback) callback->onFileCompleted(job, index, item);
    }

    job.state = JobState::Completed;
    job.endTime = std::chrono::system_clock::now();
    job.currentFileIndex.reset();
    if (callback) callback->onJobCompleted(job);

    return Result<void>::Ok();
}
