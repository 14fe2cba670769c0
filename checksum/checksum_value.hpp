#pragma once
#include <optional>
#include <string>
#include <utility>

enum class ChecksumAlgorithm { Crc32, Md5, Sha256, Blake3 };

const char* checksumAlgorithmName(ChecksumAlgorithm algorithm);
// accepts any letter case, nullopt for unknown names
std::optional<ChecksumAlgorithm> parseChecksumAlgorithm(const std::string& name);

// Digest produced by a hasher or read back from a manifest line.
class ChecksumValue {
public:
    ChecksumValue() = default;
    ChecksumValue(ChecksumAlgorithm algorithm, std::string hex)
        : algorithm_(algorithm), hex_(std::move(hex)) {}

    ChecksumAlgorithm algorithm() const { return algorithm_; }
    const std::string& hex() const { return hex_; }

    // "sha256:2cf2..."
    std::string toStringWithAlgorithm() const;

    bool operator==(const ChecksumValue& other) const {
        return algorithm_ == other.algorithm_ && hex_ == other.hex_;
    }
    bool operator!=(const ChecksumValue& other) const { return !(*this == other); }

private:
    ChecksumAlgorithm algorithm_ = ChecksumAlgorithm::Sha256;
    std::string hex_;
};
