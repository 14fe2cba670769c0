#include "overwrite_policy.hpp"

namespace fs = std::filesystem;

TransferAction decideAction(const DestinationState& dest, OverwritePolicy policy, uint64_t sourceSize) {
    if (!dest.exists) return TransferAction::Copy;

    switch (policy) {
        case OverwritePolicy::Skip:
            return TransferAction::Skip;
        case OverwritePolicy::Overwrite:
            return TransferAction::Copy;
        case OverwritePolicy::Ask:
            // nobody to ask here
            return TransferAction::Skip;
        case OverwritePolicy::SmartUpdate:
            if (!dest.size) return TransferAction::Copy;
            return *dest.size == sourceSize ? TransferAction::Skip : TransferAction::Copy;
    }
    return TransferAction::Skip;
}

DestinationState probeDestination(const fs::path& path) {
    DestinationState state;
    std::error_code ec;
    fs::file_status st = fs::symlink_status(path, ec);
    // a destination that cannot be stat'ed is treated as absent, the copy
    // attempt then either succeeds or records the real error on the item
    if (ec || st.type() == fs::file_type::not_found) return state;

    state.exists = true;

    uint64_t size = fs::file_size(path, ec);
    if (!ec) state.size = size;
    return state;
}

TransferAction decideForItem(const FileItem& item, OverwritePolicy policy) {
    if (item.isDir) return TransferAction::Copy;
    return decideAction(probeDestination(item.destinationPath), policy, item.fileSize);
}
