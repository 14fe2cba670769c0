#include "cli_progress.hpp"
#include "../common/config.hpp"
#include <iomanip>
#include <sstream>

CliProgress::CliProgress(std::ostream& out, bool verbose)
    : out_(out), verbose_(verbose), startTime_(std::chrono::steady_clock::now()) {}

std::string CliProgress::formatBytes(uint64_t bytes) {
    static const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    double size = static_cast<double>(bytes);
    size_t unit = 0;
    while (size >= 1024.0 && unit < 4) {
        size /= 1024.0;
        ++unit;
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << size << " " << units[unit];
    return oss.str();
}

std::string CliProgress::formatDuration(std::chrono::seconds elapsed) {
    long long secs = elapsed.count();
    long long hours = secs / 3600;
    long long mins = (secs % 3600) / 60;
    secs %= 60;

    std::ostringstream oss;
    if (hours > 0) {
        oss << hours << "h " << mins << "m " << secs << "s";
    } else if (mins > 0) {
        oss << mins << "m " << secs << "s";
    } else {
        oss << secs << "s";
    }
    return oss.str();
}

std::string CliProgress::progressBar(unsigned percent) {
    if (percent > 100) percent = 100;
    size_t filled = percent / 5;
    return "[" + std::string(filled, '=') + std::string(20 - filled, ' ') + "] " + std::to_string(percent) + "%";
}

std::string CliProgress::displayName(const FileItem& file) {
    std::string name = file.sourcePath.filename().string();
    return name.empty() ? "(unknown)" : name;
}

void CliProgress::onJobStarted(const TransferJob& job) {
    startTime_ = std::chrono::steady_clock::now();
    out_ << "Preparing transfer...\n"
         << "  Source: " << job.sourcePath.string() << "\n"
         << "  Destination: " << job.destinationPath.string() << "\n"
         << "  Mode: " << modeName(job.mode) << "\n"
         << "  Total: " << formatBytes(job.totalBytesToCopy) << " across " << job.files.size() << " items\n\n";
}

void CliProgress::onFileStarted(const TransferJob&, size_t fileIndex, const FileItem& file) {
    if (!verbose_) return;
    out_ << "[" << std::setw(3) << fileIndex << "] Starting: " << displayName(file) << "\n";
}

void CliProgress::onFileProgress(const TransferJob& job, size_t, uint64_t) {
    auto now = std::chrono::steady_clock::now();
    if (now - lastProgressUpdate_ < std::chrono::milliseconds(Config::PROGRESS_THROTTLE_MS)) return;
    lastProgressUpdate_ = now;
    drawProgress(job);
}

void CliProgress::drawProgress(const TransferJob& job) {
    unsigned percent = 100;
    if (job.totalBytesToCopy > 0) {
        percent = static_cast<unsigned>(static_cast<double>(job.totalBytesCopied) / job.totalBytesToCopy * 100.0);
    }

    out_ << "\rProgress: " << progressBar(percent) << " | "
         << formatBytes(job.totalBytesCopied) << "/" << formatBytes(job.totalBytesToCopy) << std::flush;
}

void CliProgress::onFileCompleted(const TransferJob&, size_t fileIndex, const FileItem& file) {
    if (!verbose_) return;
    out_ << "[" << std::setw(3) << fileIndex << "] " << fileStateName(file.state) << ": " << displayName(file) << "\n";
}

void CliProgress::onJobCompleted(const TransferJob& job) {
    size_t done = 0, skipped = 0, failed = 0, verifiedOk = 0, verifiedMismatch = 0;
    for (const FileItem& file : job.files) {
        switch (file.state) {
            case FileState::Done:
                ++done;
                if (file.metadata.verificationPassed) {
                    if (*file.metadata.verificationPassed) ++verifiedOk;
                    else ++verifiedMismatch;
                }
                break;
            case FileState::Skipped: ++skipped; break;
            case FileState::Failed:  ++failed; break;
            default: break;
        }
    }

    // throttling may have swallowed the last update
    drawProgress(job);

    auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - startTime_);

    out_ << "\nTransfer complete!\n"
         << "Summary: " << done << " done, " << skipped << " skipped, " << failed << " failed\n";
    if (job.verifyAfterCopy && job.checksumAlgorithm) {
        out_ << "Verification: " << verifiedOk << " OK, " << verifiedMismatch << " mismatch\n";
    }
    out_ << "Bytes copied: " << formatBytes(job.totalBytesCopied) << "\n"
         << "Elapsed: " << formatDuration(elapsed) << "\n";

    if (failed > 0) {
        out_ << "\nFailed files:\n";
        for (const FileItem& file : job.files) {
            if (file.state != FileState::Failed) continue;
            out_ << "  " << displayName(file) << ": " << file.errorMessage.value_or("(unknown error)") << "\n";
        }
    }

    if (verifiedMismatch > 0) {
        out_ << "\nVerification mismatches:\n";
        for (const FileItem& file : job.files) {
            if (file.metadata.verificationPassed == false) {
                out_ << "  " << displayName(file) << ": source and destination checksums differ\n";
            }
        }
    }
}
