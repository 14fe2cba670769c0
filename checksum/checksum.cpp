#include "checksum.hpp"
#include "../common/config.hpp"
#include "../common/hash_utils.hpp"
#include <cerrno>
#include <climits>
#include <fstream>
#include <vector>
#include <openssl/evp.h>
#include <zlib.h>
#include <blake3.h>

const char* checksumAlgorithmName(ChecksumAlgorithm algorithm) {
    switch (algorithm) {
        case ChecksumAlgorithm::Crc32:  return "crc32";
        case ChecksumAlgorithm::Md5:    return "md5";
        case ChecksumAlgorithm::Sha256: return "sha256";
        case ChecksumAlgorithm::Blake3: return "blake3";
    }
    return "sha256";
}

std::optional<ChecksumAlgorithm> parseChecksumAlgorithm(const std::string& name) {
    std::string lower = HashUtils::toLower(name);
    if (lower == "crc32") return ChecksumAlgorithm::Crc32;
    if (lower == "md5") return ChecksumAlgorithm::Md5;
    if (lower == "sha256") return ChecksumAlgorithm::Sha256;
    if (lower == "blake3") return ChecksumAlgorithm::Blake3;
    return std::nullopt;
}

std::string ChecksumValue::toStringWithAlgorithm() const {
    return std::string(checksumAlgorithmName(algorithm_)) + ":" + hex_;
}

namespace {

class Crc32Hasher : public ChecksumHasher {
public:
    Crc32Hasher() : crc_(crc32(0L, Z_NULL, 0)) {}

    void update(const char* data, size_t len) override {
        const Bytef* p = reinterpret_cast<const Bytef*>(data);
        // zlib takes uInt lengths
        while (len > 0) {
            uInt n = len > UINT_MAX ? UINT_MAX : static_cast<uInt>(len);
            crc_ = crc32(crc_, p, n);
            p += n;
            len -= n;
        }
    }

    Result<ChecksumValue> finalize() override {
        return Result<ChecksumValue>::Ok(
            ChecksumValue(ChecksumAlgorithm::Crc32, HashUtils::toHex(static_cast<uint32_t>(crc_))));
    }

private:
    uLong crc_;
};

struct EvpCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

// MD5 and SHA-256 both go through the OpenSSL EVP interface. A failed update
// is remembered and reported by finalize().
class EvpHasher : public ChecksumHasher {
public:
    EvpHasher(ChecksumAlgorithm algorithm, const EVP_MD* md)
        : algorithm_(algorithm), ctx_(EVP_MD_CTX_new()) {
        ok_ = ctx_ && EVP_DigestInit_ex(ctx_.get(), md, nullptr) == 1;
    }

    bool ready() const { return ok_; }

    void update(const char* data, size_t len) override {
        if (!ok_ || len == 0) return;
        ok_ = EVP_DigestUpdate(ctx_.get(), data, len) == 1;
    }

    Result<ChecksumValue> finalize() override {
        unsigned char digest[EVP_MAX_MD_SIZE];
        unsigned int digestLen = 0;
        bool finished = ok_ && EVP_DigestFinal_ex(ctx_.get(), digest, &digestLen) == 1;
        ok_ = false;   // the context is spent either way
        if (!finished) {
            return Result<ChecksumValue>::Error(EngineError(ErrorKind::Unknown, {},
                std::string(checksumAlgorithmName(algorithm_)) + " digest computation failed in OpenSSL"));
        }
        return Result<ChecksumValue>::Ok(ChecksumValue(algorithm_, HashUtils::toHex(digest, digestLen)));
    }

private:
    ChecksumAlgorithm algorithm_;
    std::unique_ptr<EVP_MD_CTX, EvpCtxDeleter> ctx_;
    bool ok_ = false;
};

class Blake3Hasher : public ChecksumHasher {
public:
    Blake3Hasher() { blake3_hasher_init(&hasher_); }

    void update(const char* data, size_t len) override {
        blake3_hasher_update(&hasher_, data, len);
    }

    Result<ChecksumValue> finalize() override {
        uint8_t out[BLAKE3_OUT_LEN];
        blake3_hasher_finalize(&hasher_, out, BLAKE3_OUT_LEN);
        return Result<ChecksumValue>::Ok(
            ChecksumValue(ChecksumAlgorithm::Blake3, HashUtils::toHex(out, BLAKE3_OUT_LEN)));
    }

private:
    blake3_hasher hasher_;
};

Result<std::unique_ptr<ChecksumHasher>> makeEvp(ChecksumAlgorithm algorithm, const EVP_MD* md) {
    auto hasher = std::make_unique<EvpHasher>(algorithm, md);
    if (!hasher->ready()) {
        return Result<std::unique_ptr<ChecksumHasher>>::Error(
            EngineError(ErrorKind::UnsupportedAlgorithm, {}, std::string(checksumAlgorithmName(algorithm)) + " digest could not be initialised"));
    }
    return Result<std::unique_ptr<ChecksumHasher>>::Ok(std::move(hasher));
}

} // namespace

Result<std::unique_ptr<ChecksumHasher>> createHasher(ChecksumAlgorithm algorithm) {
    using HasherResult = Result<std::unique_ptr<ChecksumHasher>>;
    switch (algorithm) {
        case ChecksumAlgorithm::Crc32:
            return HasherResult::Ok(std::make_unique<Crc32Hasher>());
        case ChecksumAlgorithm::Md5:
            return makeEvp(algorithm, EVP_md5());
        case ChecksumAlgorithm::Sha256:
            return makeEvp(algorithm, EVP_sha256());
        case ChecksumAlgorithm::Blake3:
            return HasherResult::Ok(std::make_unique<Blake3Hasher>());
    }
    return HasherResult::Error(EngineError(ErrorKind::UnsupportedAlgorithm, {}, "unknown algorithm"));
}

Result<ChecksumValue> computeFileChecksum(const std::filesystem::path& path, ChecksumAlgorithm algorithm) {
    auto hasher = createHasher(algorithm);
    if (!hasher.success) {
        EngineError err = hasher.error;
        err.path = path;
        return Result<ChecksumValue>::Error(err);
    }

    errno = 0;
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Result<ChecksumValue>::Error(EngineError::fromErrno(ErrorKind::ReadError, path, errno));
    }

    std::vector<char> buffer(Config::HASH_BUFFER_SIZE);
    while (file.read(buffer.data(), buffer.size()) || file.gcount() > 0) {
        hasher.data->update(buffer.data(), static_cast<size_t>(file.gcount()));
    }
    if (file.bad()) {
        return Result<ChecksumValue>::Error(EngineError::fromErrno(ErrorKind::ReadError, path, errno));
    }

    auto digest = hasher.data->finalize();
    if (!digest.success) digest.error.path = path;
    return digest;
}

Result<bool> verifyFileItem(FileItem& item, ChecksumAlgorithm algorithm) {
    if (item.isDir) {
        item.metadata.verificationPassed = true;
        return Result<bool>::Ok(true);
    }

    ChecksumValue sourceChecksum;
    if (item.metadata.sourceChecksum && item.metadata.sourceChecksum->algorithm() == algorithm) {
        sourceChecksum = *item.metadata.sourceChecksum;
    } else {
        auto computed = computeFileChecksum(item.sourcePath, algorithm);
        if (!computed.success) return Result<bool>::Error(computed.error);
        sourceChecksum = computed.data;
        item.metadata.sourceChecksum = sourceChecksum;
    }

    auto destChecksum = computeFileChecksum(item.destinationPath, algorithm);
    if (!destChecksum.success) return Result<bool>::Error(destChecksum.error);
    item.metadata.destChecksum = destChecksum.data;

    bool matches = sourceChecksum.hex() == destChecksum.data.hex();
    item.metadata.verificationPassed = matches;
    return Result<bool>::Ok(matches);
}
