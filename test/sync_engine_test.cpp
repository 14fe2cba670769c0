#include <cassert>
#include <cerrno>
#include <iostream>
#include <string>
#include <vector>
#include "sync/sync_engine.hpp"
#include "test_support.hpp"

namespace fs = std::filesystem;

// Records every notification as a short string, e.g. "file_started(2)".
class RecordingCallback : public ProgressCallback {
public:
    std::vector<std::string> calls;

    void onJobStarted(const TransferJob& job) override {
        assert(job.state == JobState::Running);
        calls.push_back("job_started");
    }
    void onFileStarted(const TransferJob& job, size_t fileIndex, const FileItem&) override {
        assert(job.currentFileIndex == fileIndex);
        calls.push_back("file_started(" + std::to_string(fileIndex) + ")");
    }
    void onFileProgress(const TransferJob&, size_t fileIndex, uint64_t bytes) override {
        calls.push_back("file_progress(" + std::to_string(fileIndex) + "," + std::to_string(bytes) + ")");
    }
    void onFileCompleted(const TransferJob&, size_t fileIndex, const FileItem& file) override {
        assert(isTerminal(file.state));
        calls.push_back("file_completed(" + std::to_string(fileIndex) + ")");
    }
    void onJobCompleted(const TransferJob& job) override {
        assert(job.state == JobState::Completed);
        calls.push_back("job_completed");
    }
};

// Overwrites the freshly copied destination before verification gets to it.
class TamperingCallback : public RecordingCallback {
public:
    void onFileProgress(const TransferJob& job, size_t fileIndex, uint64_t bytes) override {
        RecordingCallback::onFileProgress(job, fileIndex, bytes);
        writeFile(job.files[fileIndex].destinationPath, "tampered!");
    }
};

static const FileItem& itemFor(const TransferJob& job, const fs::path& source) {
    for (const FileItem& f : job.files) {
        if (f.sourcePath == source) return f;
    }
    assert(false && "item not found");
    return job.files.front();
}

static uint64_t doneBytes(const TransferJob& job) {
    uint64_t sum = 0;
    for (const FileItem& f : job.files) {
        if (f.state == FileState::Done) sum += f.bytesCopied;
    }
    return sum;
}

static TransferJob plannedJob(const fs::path& src, const fs::path& dst, OverwritePolicy policy,
                              Mode mode = Mode::Copy) {
    auto created = createJob(src, dst, mode, policy);
    assert(created.success);
    TransferJob job = std::move(created.data);
    auto planned = planJob(job);
    assert(planned.success);
    return job;
}

static void makeSampleTree(const fs::path& src) {
    writeFile(src / "a.txt", "hello");
    writeFile(src / "sub" / "b.txt", "abc");
}

static void testCreateJobValidation() {
    ScratchDir dir("create");
    fs::path src = dir.path() / "src";
    fs::create_directories(src);
    writeFile(dir.path() / "file.txt", "x");

    auto ok = createJob(src, dir.path() / "dst", Mode::Copy, OverwritePolicy::Skip);
    assert(ok.success);
    assert(ok.data.state == JobState::Pending);
    assert(ok.data.files.empty());
    assert(!ok.data.id.empty());
    assert(!ok.data.currentFileIndex);
    assert(!ok.data.startTime && !ok.data.endTime);

    auto missing = createJob(dir.path() / "nope", dir.path() / "dst", Mode::Copy, OverwritePolicy::Skip);
    assert(!missing.success && missing.error.kind == ErrorKind::SourceNotFound);

    auto notDir = createJob(dir.path() / "file.txt", dir.path() / "dst", Mode::Copy, OverwritePolicy::Skip);
    assert(!notDir.success && notDir.error.kind == ErrorKind::InvalidPath);

    auto emptyDest = createJob(src, fs::path(), Mode::Copy, OverwritePolicy::Skip);
    assert(!emptyDest.success && emptyDest.error.kind == ErrorKind::InvalidPath);

    auto longDest = createJob(src, fs::path(std::string(5000, 'd')), Mode::Copy, OverwritePolicy::Skip);
    assert(!longDest.success && longDest.error.kind == ErrorKind::PathTooLong);
    std::cout << "[PASS] create job validation" << std::endl;
}

static void testCopyIntoEmptyDestination() {
    ScratchDir dir("scenario_copy");
    fs::path src = dir.path() / "src";
    fs::path dst = dir.path() / "dst";
    makeSampleTree(src);

    TransferJob job = plannedJob(src, dst, OverwritePolicy::Skip);
    assert(job.state == JobState::Pending);
    assert(job.files.size() == 3);
    assert(job.totalBytesToCopy == 8);

    auto ran = runJob(job);
    assert(ran.success);
    assert(job.state == JobState::Completed);
    assert(job.startTime && job.endTime);
    assert(!job.currentFileIndex);
    for (const FileItem& f : job.files) {
        assert(f.state == FileState::Done);
        assert(!f.errorCode && !f.errorMessage);
        assert(!f.metadata.verificationPassed);
    }
    assert(job.totalBytesCopied == 8);
    assert(job.totalBytesCopied == doneBytes(job));
    assert(readFile(dst / "a.txt") == "hello");
    assert(readFile(dst / "sub" / "b.txt") == "abc");
    assert(!hasFailures(job));
    std::cout << "[PASS] copy into empty destination" << std::endl;
}

static void testSkipKeepsExistingFile() {
    ScratchDir dir("scenario_skip");
    fs::path src = dir.path() / "src";
    fs::path dst = dir.path() / "dst";
    makeSampleTree(src);
    writeFile(dst / "a.txt", "other content");

    TransferJob job = plannedJob(src, dst, OverwritePolicy::Skip);
    assert(runJob(job).success);

    assert(itemFor(job, src / "a.txt").state == FileState::Skipped);
    assert(itemFor(job, src / "sub" / "b.txt").state == FileState::Done);
    assert(readFile(dst / "a.txt") == "other content");
    assert(job.totalBytesCopied == 3);
    assert(job.totalBytesCopied == doneBytes(job));
    std::cout << "[PASS] skip keeps existing file" << std::endl;
}

static void testOverwriteAndSmartUpdate() {
    ScratchDir dir("scenario_overwrite");
    fs::path src = dir.path() / "src";
    fs::path dst = dir.path() / "dst";
    makeSampleTree(src);
    writeFile(dst / "a.txt", "HELLO");       // same size, different bytes
    writeFile(dst / "sub" / "b.txt", "ab");  // different size

    TransferJob smart = plannedJob(src, dst, OverwritePolicy::SmartUpdate);
    assert(runJob(smart).success);
    assert(itemFor(smart, src / "a.txt").state == FileState::Skipped);
    assert(itemFor(smart, src / "sub" / "b.txt").state == FileState::Done);
    assert(readFile(dst / "a.txt") == "HELLO");
    assert(readFile(dst / "sub" / "b.txt") == "abc");

    TransferJob overwrite = plannedJob(src, dst, OverwritePolicy::Overwrite);
    assert(runJob(overwrite).success);
    assert(itemFor(overwrite, src / "a.txt").state == FileState::Done);
    assert(readFile(dst / "a.txt") == "hello");

    writeFile(dst / "a.txt", "changed");
    TransferJob ask = plannedJob(src, dst, OverwritePolicy::Ask);
    assert(runJob(ask).success);
    assert(itemFor(ask, src / "a.txt").state == FileState::Skipped);
    assert(readFile(dst / "a.txt") == "changed");
    std::cout << "[PASS] overwrite, smart update and ask" << std::endl;
}

static void testRunTwiceIsRejected() {
    ScratchDir dir("run_twice");
    fs::path src = dir.path() / "src";
    makeSampleTree(src);

    TransferJob job = plannedJob(src, dir.path() / "dst", OverwritePolicy::Overwrite);
    assert(runJob(job).success);

    std::vector<FileState> before;
    for (const FileItem& f : job.files) before.push_back(f.state);
    uint64_t copiedBefore = job.totalBytesCopied;
    auto endBefore = job.endTime;

    RecordingCallback cb;
    auto again = runJob(job, &cb);
    assert(!again.success);
    assert(again.error.kind == ErrorKind::InvalidState);
    assert(cb.calls.empty());
    assert(job.state == JobState::Completed);
    assert(job.totalBytesCopied == copiedBefore);
    assert(job.endTime == endBefore);
    for (size_t i = 0; i < job.files.size(); ++i) assert(job.files[i].state == before[i]);

    auto replan = planJob(job);
    assert(!replan.success && replan.error.kind == ErrorKind::InvalidState);
    assert(job.files.size() == before.size());
    std::cout << "[PASS] run twice is rejected" << std::endl;
}

static void testNotificationOrder() {
    ScratchDir dir("events");
    fs::path src = dir.path() / "src";
    writeFile(src / "only.txt", "12");

    TransferJob job = plannedJob(src, dir.path() / "dst", OverwritePolicy::Skip);
    RecordingCallback cb;
    assert(runJob(job, &cb).success);

    std::vector<std::string> expected = {
        "job_started", "file_started(0)", "file_progress(0,2)", "file_completed(0)", "job_completed"};
    assert(cb.calls == expected);

    // second run over the same tree skips, so no progress event
    TransferJob skipped = plannedJob(src, dir.path() / "dst", OverwritePolicy::Skip);
    RecordingCallback cb2;
    assert(runJob(skipped, &cb2).success);
    std::vector<std::string> expectedSkip = {"job_started", "file_started(0)", "file_completed(0)", "job_completed"};
    assert(cb2.calls == expectedSkip);
    std::cout << "[PASS] notification order" << std::endl;
}

static void testVerificationPassesAndRecordsChecksums() {
    ScratchDir dir("verify_ok");
    fs::path src = dir.path() / "src";
    makeSampleTree(src);

    TransferJob job = plannedJob(src, dir.path() / "dst", OverwritePolicy::Skip);
    job.verifyAfterCopy = true;
    job.checksumAlgorithm = ChecksumAlgorithm::Sha256;
    assert(runJob(job).success);

    const FileItem& a = itemFor(job, src / "a.txt");
    assert(a.state == FileState::Done);
    assert(a.metadata.verificationPassed == true);
    assert(a.metadata.sourceChecksum && a.metadata.destChecksum);
    assert(a.metadata.sourceChecksum->hex() ==
           "2cf24dba5fb0a30e26e83b2ac5b9e29e1b161e5c1fa7425e73043362938b9824");
    assert(!a.errorMessage);

    const FileItem& sub = itemFor(job, src / "sub");
    assert(!sub.metadata.sourceChecksum);
    std::cout << "[PASS] verification passes and records checksums" << std::endl;
}

static void testTamperedDestinationFailsVerification() {
    ScratchDir dir("verify_tamper");
    fs::path src = dir.path() / "src";
    writeFile(src / "a.txt", "hello");

    TransferJob job = plannedJob(src, dir.path() / "dst", OverwritePolicy::Skip);
    job.verifyAfterCopy = true;
    job.checksumAlgorithm = ChecksumAlgorithm::Sha256;

    TamperingCallback cb;
    assert(runJob(job, &cb).success);

    const FileItem& a = job.files[0];
    assert(a.state == FileState::Done);
    assert(a.metadata.verificationPassed == false);
    assert(a.errorMessage && a.errorMessage->find("Checksum verification failed") != std::string::npos);
    assert(!a.errorCode);
    assert(!hasFailures(job));
    std::cout << "[PASS] tampered destination fails verification" << std::endl;
}

static void testItemFailureDoesNotStopJob() {
    ScratchDir dir("isolation");
    fs::path src = dir.path() / "src";
    makeSampleTree(src);
    writeFile(src / "vanishing.txt", "soon gone");

    TransferJob job = plannedJob(src, dir.path() / "dst", OverwritePolicy::Skip);
    fs::remove(src / "vanishing.txt");

    assert(runJob(job).success);
    assert(job.state == JobState::Completed);

    const FileItem& gone = itemFor(job, src / "vanishing.txt");
    assert(gone.state == FileState::Failed);
    assert(gone.errorCode && *gone.errorCode == ENOENT);
    assert(gone.errorMessage);
    assert(itemFor(job, src / "a.txt").state == FileState::Done);
    assert(itemFor(job, src / "sub" / "b.txt").state == FileState::Done);
    assert(hasFailures(job));
    assert(job.totalBytesCopied == doneBytes(job));
    std::cout << "[PASS] item failure does not stop job" << std::endl;
}

static void testPlanFailsWhenSourceVanishes() {
    ScratchDir dir("plan_missing");
    fs::path src = dir.path() / "src";
    fs::create_directories(src);

    auto created = createJob(src, dir.path() / "dst", Mode::Copy, OverwritePolicy::Skip);
    assert(created.success);
    TransferJob job = std::move(created.data);
    fs::remove_all(src);

    auto planned = planJob(job);
    assert(!planned.success);
    assert(planned.error.kind == ErrorKind::EnumerationFailed);
    assert(job.files.empty());
    assert(job.state == JobState::Pending);
    std::cout << "[PASS] plan fails when source vanishes" << std::endl;
}

static void testMoveRunsAsCopy() {
    ScratchDir dir("move");
    fs::path src = dir.path() / "src";
    makeSampleTree(src);

    TransferJob job = plannedJob(src, dir.path() / "dst", OverwritePolicy::Skip, Mode::Move);
    assert(runJob(job).success);
    assert(fs::exists(src / "a.txt"));
    assert(readFile(dir.path() / "dst" / "a.txt") == "hello");
    std::cout << "[PASS] move runs as copy" << std::endl;
}

static void testEmptyDirectoryIsMirrored() {
    ScratchDir dir("empty_dir");
    fs::path src = dir.path() / "src";
    fs::create_directories(src / "hollow");

    TransferJob job = plannedJob(src, dir.path() / "dst", OverwritePolicy::Skip);
    assert(job.totalBytesToCopy == 0);
    assert(runJob(job).success);
    assert(job.files.size() == 1 && job.files[0].state == FileState::Done);
    assert(fs::is_directory(dir.path() / "dst" / "hollow"));
    std::cout << "[PASS] empty directory is mirrored" << std::endl;
}

static void testUnreachableDestinationFailsInsteadOfSkipping() {
    ScratchDir dir("too_long");
    fs::path src = dir.path() / "src";
    writeFile(src / std::string(200, 'n'), "abc");
    // the root itself is accepted, the item's destination path exceeds PATH_MAX
    fs::path dst = padPath(dir.path() / "dst", 4090);

    TransferJob job = plannedJob(src, dst, OverwritePolicy::Skip);
    assert(job.files.size() == 1);
    assert(runJob(job).success);

    const FileItem& item = job.files[0];
    assert(item.state == FileState::Failed);
    assert(item.errorCode.has_value());
    assert(item.errorMessage.has_value());
    assert(hasFailures(job));
    assert(job.totalBytesCopied == 0);
    std::cout << "[PASS] unreachable destination fails instead of skipping" << std::endl;
}

static void testTempLookalikeInDestinationSurvives() {
    ScratchDir dir("lookalike");
    fs::path src = dir.path() / "src";
    fs::path dst = dir.path() / "dst";
    writeFile(src / "a.txt", "hello");
    writeFile(dst / "a.txt.treecopy.tmp", "USER DATA");

    TransferJob job = plannedJob(src, dst, OverwritePolicy::Skip);
    assert(runJob(job).success);
    assert(itemFor(job, src / "a.txt").state == FileState::Done);
    assert(readFile(dst / "a.txt") == "hello");
    assert(readFile(dst / "a.txt.treecopy.tmp") == "USER DATA");

    size_t entries = 0;
    for (const auto& entry : fs::directory_iterator(dst)) {
        (void)entry;
        ++entries;
    }
    assert(entries == 2);
    std::cout << "[PASS] temp lookalike in destination survives" << std::endl;
}

int main() {
    std::cout << "[Test] Starting sync engine tests..." << std::endl;
    testCreateJobValidation();
    testCopyIntoEmptyDestination();
    testSkipKeepsExistingFile();
    testOverwriteAndSmartUpdate();
    testRunTwiceIsRejected();
    testNotificationOrder();
    testVerificationPassesAndRecordsChecksums();
    testTamperedDestinationFailsVerification();
    testItemFailureDoesNotStopJob();
    testPlanFailsWhenSourceVanishes();
    testMoveRunsAsCopy();
    testEmptyDirectoryIsMirrored();
    testUnreachableDestinationFailsInsteadOfSkipping();
    testTempLookalikeInDestinationSurvives();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
