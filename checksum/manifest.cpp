#include "manifest.hpp"
#include "../common/config.hpp"
#include "../common/hash_utils.hpp"
#include <cerrno>
#include <fstream>
#include <sstream>

namespace {

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) return "";
    size_t end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

} // namespace

std::string generateManifest(const std::vector<std::pair<std::string, ChecksumValue>>& fileChecksums,
                             ChecksumAlgorithm algorithm) {
    std::ostringstream out;
    out << Config::MANIFEST_COMMENT << " Checksum file generated by " << Config::MANIFEST_GENERATOR << "\n";
    out << Config::MANIFEST_COMMENT << " Algorithm: " << checksumAlgorithmName(algorithm) << "\n";
    out << "\n";
    for (const auto& [relPath, checksum] : fileChecksums) {
        out << checksum.hex() << " " << relPath << "\n";
    }
    return out.str();
}

std::vector<ManifestEntry> parseManifest(const std::string& content) {
    std::vector<ManifestEntry> entries;
    std::istringstream in(content);
    std::string line;

    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line[0] == Config::MANIFEST_COMMENT) continue;

        // path may contain spaces, the digest never does
        size_t sep = line.find(' ');
        if (sep == std::string::npos) continue;

        std::string hex = line.substr(0, sep);
        std::string relPath = trim(line.substr(sep + 1));
        if (relPath.empty()) continue;

        entries.push_back({relPath, HashUtils::toLower(hex)});
    }
    return entries;
}

Result<std::vector<ManifestCheck>> verifyManifest(
    const std::string& content,
    const std::function<Result<ChecksumValue>(const std::string&)>& checksumOf) {
    std::vector<ManifestCheck> results;

    for (const ManifestEntry& entry : parseManifest(content)) {
        auto actual = checksumOf(entry.relativePath);
        if (!actual.success) {
            return Result<std::vector<ManifestCheck>>::Error(actual.error);
        }

        ChecksumValue expected(actual.data.algorithm(), entry.hex);
        bool matches = actual.data.hex() == entry.hex;
        results.push_back({entry.relativePath, expected, actual.data, matches});
    }

    return Result<std::vector<ManifestCheck>>::Ok(std::move(results));
}

Result<std::vector<ManifestCheck>> verifyManifestAgainstRoot(const std::string& content,
                                                             const std::filesystem::path& root,
                                                             ChecksumAlgorithm algorithm) {
    return verifyManifest(content, [&](const std::string& relPath) {
        std::filesystem::path rel(relPath);
        std::filesystem::path normal = rel.lexically_normal();
        if (rel.has_root_path() || (!normal.empty() && *normal.begin() == "..")) {
            return Result<ChecksumValue>::Error(EngineError(ErrorKind::InvalidPath, rel,
                                                            "manifest entry points outside the root"));
        }
        return computeFileChecksum(root / rel, algorithm);
    });
}

std::vector<std::pair<std::string, ChecksumValue>> buildJobManifest(const TransferJob& job) {
    std::vector<std::pair<std::string, ChecksumValue>> entries;
    for (const FileItem& item : job.files) {
        if (item.isDir || !item.metadata.sourceChecksum) continue;
        std::string relPath = item.sourcePath.lexically_relative(job.sourcePath).generic_string();
        entries.emplace_back(relPath, *item.metadata.sourceChecksum);
    }
    return entries;
}

Result<std::string> readManifestFile(const std::filesystem::path& path) {
    errno = 0;
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Result<std::string>::Error(EngineError::fromErrno(ErrorKind::ReadError, path, errno));
    }

    std::ostringstream content;
    content << file.rdbuf();
    if (file.bad()) {
        return Result<std::string>::Error(EngineError::fromErrno(ErrorKind::ReadError, path, errno));
    }
    return Result<std::string>::Ok(content.str());
}

Result<void> writeManifestFile(const std::filesystem::path& path, const std::string& content) {
    errno = 0;
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        return Result<void>::Error(EngineError::fromErrno(ErrorKind::WriteError, path, errno));
    }

    file << content;
    file.flush();
    if (!file) {
        return Result<void>::Error(EngineError::fromErrno(ErrorKind::WriteError, path, errno));
    }
    return Result<void>::Ok();
}
