#include "tree_enumerator.hpp"
#include <iostream>

namespace fs = std::filesystem;

TreeEnumerator::TreeEnumerator(const fs::path& sourceRoot, const fs::path& destinationRoot)
    : sourceRoot_(sourceRoot), destinationRoot_(destinationRoot) {}

Result<std::vector<FileItem>> TreeEnumerator::enumerate() const {
    std::vector<FileItem> items;
    auto walked = walk(sourceRoot_, fs::path(), items);
    if (!walked.success) {
        return Result<std::vector<FileItem>>::Error(walked.error);
    }
    return Result<std::vector<FileItem>>::Ok(std::move(items));
}

// Symlinks are never descended into, which keeps link cycles from recursing.
// A link is listed as a file and the copy later follows it.
Result<void> TreeEnumerator::walk(const fs::path& dir, const fs::path& relPath, std::vector<FileItem>& items) const {
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        return Result<void>::Error(EngineError::fromErrorCode(ErrorKind::EnumerationFailed, dir, ec));
    }

    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) break;
        const fs::directory_entry& entry = *it;

        fs::file_status linkStatus = entry.symlink_status(ec);
        if (ec) {
            return Result<void>::Error(EngineError::fromErrorCode(ErrorKind::EnumerationFailed, dir, ec));
        }

        fs::path entryRel = relPath / entry.path().filename();

        if (fs::is_directory(linkStatus)) {
            size_t dirIndex = items.size();
            items.push_back(makeItem(entry, entryRel, true, dirIndex));

            auto sub = walk(entry.path(), entryRel, items);
            if (!sub.success) {
                // drop whatever was listed below the failed directory
                items.resize(dirIndex + 1);
                items[dirIndex].markFailed(sub.error);
                std::cerr << "[TreeEnumerator] " << sub.error.toString() << "\n";
            }
        } else {
            items.push_back(makeItem(entry, entryRel, false, items.size()));
        }
    }

    if (ec) {
        return Result<void>::Error(EngineError::fromErrorCode(ErrorKind::EnumerationFailed, dir, ec));
    }
    return Result<void>::Ok();
}

FileItem TreeEnumerator::makeItem(const fs::directory_entry& entry, const fs::path& relPath, bool isDir, size_t id) const {
    FileItem item;
    item.id = id;
    item.sourcePath = entry.path();
    item.destinationPath = destinationRoot_ / relPath;
    item.isDir = isDir;

    std::error_code ec;
    if (!isDir) {
        // follows links; a dangling one is listed with size 0
        uint64_t size = entry.file_size(ec);
        item.fileSize = ec ? 0 : size;
    }

    auto mtime = entry.last_write_time(ec);
    if (!ec) item.lastModified = mtime;

    return item;
}
