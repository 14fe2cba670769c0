#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "engine_error.hpp"
#include "../checksum/checksum_value.hpp"

enum class Mode { Copy, Move };

enum class FileState { Pending, Copying, Done, Skipped, Failed };

enum class JobState { Pending, Running, Completed };

enum class OverwritePolicy {
    Skip,         // keep whatever is already at the destination
    Overwrite,
    Ask,          // no prompt available in the engine, resolves like Skip
    SmartUpdate   // copy when the sizes differ
};

struct FileMetadata {
    std::optional<ChecksumValue> sourceChecksum;
    std::optional<ChecksumValue> destChecksum;
    std::optional<bool> verificationPassed;
    std::optional<uint32_t> attributes;   // reserved
};

struct FileItem {
    std::size_t id = 0;
    std::filesystem::path sourcePath;
    std::filesystem::path destinationPath;
    uint64_t fileSize = 0;                 // 0 for directories
    FileState state = FileState::Pending;
    uint64_t bytesCopied = 0;
    std::optional<int> errorCode;
    std::optional<std::string> errorMessage;
    bool isDir = false;
    std::optional<std::filesystem::file_time_type> lastModified;
    FileMetadata metadata;

    void markFailed(const EngineError& err);
};

struct JobMetadata {
    std::optional<std::string> customData;   // free slot for front-ends
};

struct TransferJob {
    std::string id;
    Mode mode = Mode::Copy;
    std::filesystem::path sourcePath;
    std::filesystem::path destinationPath;
    OverwritePolicy overwritePolicy = OverwritePolicy::Skip;
    std::vector<FileItem> files;
    JobState state = JobState::Pending;
    std::optional<EngineError> error;
    uint64_t totalBytesToCopy = 0;
    uint64_t totalBytesCopied = 0;
    std::optional<std::size_t> currentFileIndex;
    std::chrono::system_clock::time_point createdAt;
    std::optional<std::chrono::system_clock::time_point> startTime;
    std::optional<std::chrono::system_clock::time_point> endTime;
    JobMetadata metadata;
    std::optional<ChecksumAlgorithm> checksumAlgorithm;
    bool verifyAfterCopy = false;
};

bool isTerminal(FileState state);
bool hasFailures(const TransferJob& job);

const char* modeName(Mode mode);
const char* fileStateName(FileState state);
const char* jobStateName(JobState state);
const char* overwritePolicyName(OverwritePolicy policy);

std::optional<Mode> parseMode(const std::string& name);
// "smart" and "smart-update" both map to SmartUpdate
std::optional<OverwritePolicy> parseOverwritePolicy(const std::string& name);
