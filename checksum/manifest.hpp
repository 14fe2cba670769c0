#pragma once
#include <filesystem>
#include <functional>
#include <string>
#include <utility>
#include <vector>
#include "checksum.hpp"

// One "<hex> <relative-path>" record.
struct ManifestEntry {
    std::string relativePath;
    std::string hex;
};

struct ManifestCheck {
    std::string relativePath;
    ChecksumValue expected;
    ChecksumValue actual;
    bool matches;
};

// The "; Algorithm:" header line is informational only and is not parsed back.
std::string generateManifest(const std::vector<std::pair<std::string, ChecksumValue>>& fileChecksums,
                             ChecksumAlgorithm algorithm);

std::vector<ManifestEntry> parseManifest(const std::string& content);

Result<std::vector<ManifestCheck>> verifyManifest(
    const std::string& content,
    const std::function<Result<ChecksumValue>(const std::string&)>& checksumOf);

// Entries that are absolute or climb above root fail with InvalidPath.
Result<std::vector<ManifestCheck>> verifyManifestAgainstRoot(const std::string& content,
                                                             const std::filesystem::path& root,
                                                             ChecksumAlgorithm algorithm);

// Relative path and source checksum of every item that was hashed during the run.
std::vector<std::pair<std::string, ChecksumValue>> buildJobManifest(const TransferJob& job);

Result<std::string> readManifestFile(const std::filesystem::path& path);
Result<void> writeManifestFile(const std::filesystem::path& path, const std::string& content);
