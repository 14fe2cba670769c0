#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include "../common/model.hpp"

enum class TransferAction { Copy, Skip };

struct DestinationState {
    bool exists = false;
    std::optional<uint64_t> size;   // empty when the destination exists but could not be sized
};

// Pure decision table, no filesystem access.
TransferAction decideAction(const DestinationState& dest, OverwritePolicy policy, uint64_t sourceSize);

// Stat errors report the destination as absent so the item is attempted.
DestinationState probeDestination(const std::filesystem::path& path);

// Directories always resolve to Copy so that their children have a place to land.
TransferAction decideForItem(const FileItem& item, OverwritePolicy policy);
