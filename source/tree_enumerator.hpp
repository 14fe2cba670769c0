#pragma once
#include <filesystem>
#include <vector>
#include "../common/model.hpp"
#include "../common/result.hpp"

// Flattens a source tree into FileItems, parents before children, with the
// destination path of every entry already resolved under destinationRoot.
class TreeEnumerator {
public:
    TreeEnumerator(const std::filesystem::path& sourceRoot, const std::filesystem::path& destinationRoot);
    Result<std::vector<FileItem>> enumerate() const;

private:
    Result<void> walk(const std::filesystem::path& dir, const std::filesystem::path& relPath,
                      std::vector<FileItem>& items) const;
    FileItem makeItem(const std::filesystem::directory_entry& entry, const std::filesystem::path& relPath,
                      bool isDir, size_t id) const;

    std::filesystem::path sourceRoot_;
    std::filesystem::path destinationRoot_;
};
