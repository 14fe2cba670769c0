#include "destination_manager.hpp"
#include "../common/config.hpp"
#include <cerrno>
#include <fcntl.h>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <random>
#include <sstream>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

DestinationManager::DestinationManager(const fs::path& destinationPath) : destPath_(destinationPath) {}

Result<void> DestinationManager::ensureDirAt(const fs::path& dir) const {
    std::error_code ec;
    fs::file_status st = fs::status(dir, ec);

    if (fs::exists(st)) {
        if (fs::is_directory(st)) return Result<void>::Ok();
        return Result<void>::Error(EngineError(ErrorKind::DirectoryCreationFailed, dir,
                                               "path exists but is not a directory"));
    }
    if (st.type() != fs::file_type::not_found) {
        return Result<void>::Error(EngineError::fromErrorCode(ErrorKind::DirectoryCreationFailed, dir, ec));
    }

    ec.clear();
    fs::create_directories(dir, ec);
    if (ec) {
        return Result<void>::Error(EngineError::fromErrorCode(ErrorKind::DirectoryCreationFailed, dir, ec));
    }
    return Result<void>::Ok();
}

Result<void> DestinationManager::ensureParentDirExists() const {
    fs::path parent = destPath_.parent_path();
    if (parent.empty()) return Result<void>::Ok();
    return ensureDirAt(parent);
}

Result<void> DestinationManager::ensureDirectory() const {
    return ensureDirAt(destPath_);
}

Result<uint64_t> DestinationManager::copyFrom(const fs::path& sourcePath) const {
    auto parent = ensureParentDirExists();
    if (!parent.success) return Result<uint64_t>::Error(parent.error);

    std::error_code ec;
    fs::file_time_type srcMtime = fs::last_write_time(sourcePath, ec);
    bool haveMtime = !ec;

    errno = 0;
    std::ifstream in(sourcePath, std::ios::binary);
    if (!in) {
        return Result<uint64_t>::Error(EngineError::fromErrno(ErrorKind::ReadError, sourcePath, errno));
    }

    // write next to the destination and swap in at the end, an existing
    // destination stays intact if anything below fails
    auto reserved = reserveTemp();
    if (!reserved.success) return Result<uint64_t>::Error(reserved.error);
    const fs::path& tempPath = reserved.data;

    errno = 0;
    std::ofstream out(tempPath, std::ios::binary | std::ios::trunc);
    if (!out) {
        int err = errno;
        removeTemp(tempPath);
        return Result<uint64_t>::Error(EngineError::fromErrno(ErrorKind::WriteError, destPath_, err));
    }

    std::vector<char> buffer(Config::COPY_BUFFER_SIZE);
    uint64_t total = 0;
    while (true) {
        errno = 0;
        in.read(buffer.data(), buffer.size());
        std::streamsize n = in.gcount();
        if (in.bad()) {
            int err = errno;
            out.close();
            removeTemp(tempPath);
            return Result<uint64_t>::Error(EngineError::fromErrno(ErrorKind::ReadError, sourcePath, err));
        }
        if (n > 0) {
            errno = 0;
            out.write(buffer.data(), n);
            if (!out) {
                int err = errno;
                out.close();
                removeTemp(tempPath);
                return Result<uint64_t>::Error(EngineError::fromErrno(ErrorKind::WriteError, destPath_, err));
            }
            total += static_cast<uint64_t>(n);
        }
        if (!in) break;  // eof
    }

    errno = 0;
    out.close();
    if (out.fail()) {
        int err = errno;
        removeTemp(tempPath);
        return Result<uint64_t>::Error(EngineError::fromErrno(ErrorKind::WriteError, destPath_, err));
    }

    fs::rename(tempPath, destPath_, ec);
    if (ec) {
        removeTemp(tempPath);
        return Result<uint64_t>::Error(EngineError::fromErrorCode(ErrorKind::WriteError, destPath_, ec));
    }

    if (haveMtime) {
        fs::last_write_time(destPath_, srcMtime, ec);  // best effort
    }

    return Result<uint64_t>::Ok(total);
}

// Creates an empty temp file beside the destination under a name nobody else
// holds. O_EXCL keeps an existing file of the same name untouched.
Result<fs::path> DestinationManager::reserveTemp() const {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<uint32_t> dist;

    for (int attempt = 0; attempt < Config::TEMP_NAME_ATTEMPTS; ++attempt) {
        std::ostringstream tag;
        tag << Config::TEMP_TAG << std::hex << std::setw(8) << std::setfill('0') << dist(gen)
            << Config::TEMP_SUFFIX;
        fs::path candidate = destPath_;
        candidate += tag.str();

        int fd = ::open(candidate.c_str(), O_WRONLY | O_CREAT | O_EXCL, 0644);
        if (fd >= 0) {
            ::close(fd);
            return Result<fs::path>::Ok(candidate);
        }
        if (errno != EEXIST) {
            return Result<fs::path>::Error(EngineError::fromErrno(ErrorKind::WriteError, destPath_, errno));
        }
    }
    return Result<fs::path>::Error(EngineError(ErrorKind::WriteError, destPath_,
                                               "no free temporary file name next to the destination"));
}

void DestinationManager::removeTemp(const fs::path& tempPath) const {
    std::error_code ec;
    fs::remove(tempPath, ec);
    if (ec) {
        std::cerr << "[DestinationManager] Failed to remove temp file " << tempPath.string()
                  << ": " << ec.message() << "\n";
    }
}
