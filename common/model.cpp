#include "model.hpp"
#include "hash_utils.hpp"
#include <algorithm>

void FileItem::markFailed(const EngineError& err) {
    state = FileState::Failed;
    errorCode = err.osError;
    errorMessage = err.toString();
}

bool isTerminal(FileState state) {
    return state == FileState::Done || state == FileState::Skipped || state == FileState::Failed;
}

bool hasFailures(const TransferJob& job) {
    return std::any_of(job.files.begin(), job.files.end(),
                       [](const FileItem& f) { return f.state == FileState::Failed; });
}

const char* modeName(Mode mode) {
    switch (mode) {
        case Mode::Copy: return "Copy";
        case Mode::Move: return "Move";
    }
    return "Copy";
}

const char* fileStateName(FileState state) {
    switch (state) {
        case FileState::Pending: return "Pending";
        case FileState::Copying: return "Copying";
        case FileState::Done:    return "Done";
        case FileState::Skipped: return "Skipped";
        case FileState::Failed:  return "Failed";
    }
    return "Pending";
}

const char* jobStateName(JobState state) {
    switch (state) {
        case JobState::Pending:   return "Pending";
        case JobState::Running:   return "Running";
        case JobState::Completed: return "Completed";
    }
    return "Pending";
}

const char* overwritePolicyName(OverwritePolicy policy) {
    switch (policy) {
        case OverwritePolicy::Skip:        return "Skip";
        case OverwritePolicy::Overwrite:   return "Overwrite";
        case OverwritePolicy::Ask:         return "Ask";
        case OverwritePolicy::SmartUpdate: return "SmartUpdate";
    }
    return "Skip";
}

std::optional<Mode> parseMode(const std::string& name) {
    std::string lower = HashUtils::toLower(name);
    if (lower == "copy") return Mode::Copy;
    if (lower == "move") return Mode::Move;
    return std::nullopt;
}

std::optional<OverwritePolicy> parseOverwritePolicy(const std::string& name) {
    std::string lower = HashUtils::toLower(name);
    if (lower == "skip") return OverwritePolicy::Skip;
    if (lower == "overwrite") return OverwritePolicy::Overwrite;
    if (lower == "ask") return OverwritePolicy::Ask;
    if (lower == "smart" || lower == "smart-update" || lower == "smartupdate")
        return OverwritePolicy::SmartUpdate;
    return std::nullopt;
}
