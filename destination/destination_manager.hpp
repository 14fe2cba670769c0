#pragma once
#include <cstdint>
#include <filesystem>
#include "../common/result.hpp"

// Filesystem side effects at one destination path.
class DestinationManager{
public:
    explicit DestinationManager(const std::filesystem::path& destinationPath);

    Result<void> ensureParentDirExists() const;
    // creates the destination path itself as a directory, parents included
    Result<void> ensureDirectory() const;
    // returns bytes written; ReadError names the source side, WriteError the destination side
    Result<uint64_t> copyFrom(const std::filesystem::path& sourcePath) const;

private:
    Result<void> ensureDirAt(const std::filesystem::path& dir) const;
    Result<std::filesystem::path> reserveTemp() const;
    void removeTemp(const std::filesystem::path& tempPath) const;

    std::filesystem::path destPath_;
};
