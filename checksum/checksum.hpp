#pragma once
#include <filesystem>
#include <memory>
#include "checksum_value.hpp"
#include "../common/model.hpp"
#include "../common/result.hpp"

// Streaming digest. update() may be called any number of times with chunks of
// any length; finalize() is called once and ends the hasher's useful life.
// A backend failure during update() surfaces as an error from finalize().
class ChecksumHasher {
public:
    virtual ~ChecksumHasher() = default;
    virtual void update(const char* data, size_t len) = 0;
    virtual Result<ChecksumValue> finalize() = 0;
};

Result<std::unique_ptr<ChecksumHasher>> createHasher(ChecksumAlgorithm algorithm);

Result<ChecksumValue> computeFileChecksum(const std::filesystem::path& path, ChecksumAlgorithm algorithm);

// Compares source and destination digests of a copied item and records both on
// item.metadata. A mismatch is returned as false; only I/O problems fail.
Result<bool> verifyFileItem(FileItem& item, ChecksumAlgorithm algorithm);
