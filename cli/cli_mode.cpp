#include "cli_mode.hpp"
#include "cli_progress.hpp"
#include "../checksum/manifest.hpp"
#include "../sync/sync_engine.hpp"
#include <filesystem>
#include <optional>

namespace fs = std::filesystem;

namespace {

struct CopyOptions {
    std::string src;
    std::string dst;
    std::string mode = "copy";
    std::string overwrite = "skip";
    std::optional<std::string> hash;
    std::optional<std::string> manifest;
    bool verify = false;
    bool verbose = false;
};

struct CheckOptions {
    std::string manifest;
    std::string root;
    std::string hash = "sha256";
};

// Pulls the value that follows a --flag; false when it is missing.
bool takeValue(const std::vector<std::string>& args, size_t& i, std::string& value) {
    if (i + 1 >= args.size()) return false;
    value = args[++i];
    return true;
}

} // namespace

CliMode::CliMode(std::ostream& out, std::ostream& err) : out_(out), err_(err) {}

int CliMode::run(const std::vector<std::string>& args) {
    if (args.empty()) {
        err_ << "Insufficient arguments\n";
        printHelp();
        return EXIT_ERROR;
    }

    const std::string& command = args[0];
    std::vector<std::string> rest(args.begin() + 1, args.end());

    if (command == "copy") {
        return runCopy(rest);
    } else if (command == "check") {
        return runCheck(rest);
    } else if (command == "help" || command == "--help" || command == "-h") {
        printHelp();
        return EXIT_OK;
    }

    err_ << "Unknown command '" << command << "'. Type 'treecopy help' for available commands.\n";
    return EXIT_ERROR;
}

int CliMode::runCopy(const std::vector<std::string>& args) {
    CopyOptions opts;
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        std::string value;
        bool ok = true;

        if (arg == "--src") ok = takeValue(args, i, opts.src);
        else if (arg == "--dst") ok = takeValue(args, i, opts.dst);
        else if (arg == "--mode") ok = takeValue(args, i, opts.mode);
        else if (arg == "--overwrite") ok = takeValue(args, i, opts.overwrite);
        else if (arg == "--hash") { ok = takeValue(args, i, value); opts.hash = value; }
        else if (arg == "--manifest") { ok = takeValue(args, i, value); opts.manifest = value; }
        else if (arg == "--verify") opts.verify = true;
        else if (arg == "--verbose") opts.verbose = true;
        else {
            err_ << "Unknown option '" << arg << "'\n";
            return EXIT_ERROR;
        }

        if (!ok) {
            err_ << "Missing value for " << arg << "\n";
            return EXIT_ERROR;
        }
    }

    if (opts.src.empty() || opts.dst.empty()) {
        err_ << "Usage: copy --src <path> --dst <path> [options]\n";
        return EXIT_ERROR;
    }

    fs::path src(opts.src);
    fs::path dst(opts.dst);
    std::error_code ec;

    if (!fs::exists(src, ec)) {
        err_ << "Error: Source directory does not exist: " << src.string() << "\n";
        return EXIT_ERROR;
    }
    if (!fs::is_directory(src, ec)) {
        err_ << "Error: Source is not a directory: " << src.string() << "\n";
        return EXIT_ERROR;
    }
    fs::path dstParent = dst.parent_path();
    if (!dstParent.empty() && !fs::exists(dstParent, ec)) {
        err_ << "Error: Parent of destination does not exist: " << dstParent.string() << "\n";
        return EXIT_ERROR;
    }

    auto mode = parseMode(opts.mode);
    if (!mode) {
        err_ << "Error: Invalid mode '" << opts.mode << "'. Must be 'copy' or 'move'\n";
        return EXIT_ERROR;
    }

    auto policy = parseOverwritePolicy(opts.overwrite);
    if (!policy) {
        err_ << "Error: Invalid overwrite policy '" << opts.overwrite
             << "'. Must be 'skip', 'overwrite', or 'smart'\n";
        return EXIT_ERROR;
    }
    if (*policy == OverwritePolicy::Ask) {
        err_ << "Error: Policy 'ask' is not supported in CLI mode (requires interactive input). "
                "Use 'skip', 'overwrite', or 'smart'\n";
        return EXIT_ERROR;
    }

    if (opts.hash && !opts.verify) {
        err_ << "Error: --hash requires --verify\n";
        return EXIT_ERROR;
    }
    if (opts.manifest && !opts.verify) {
        err_ << "Error: --manifest requires --verify\n";
        return EXIT_ERROR;
    }

    std::optional<ChecksumAlgorithm> algorithm;
    if (opts.verify) {
        std::string name = opts.hash.value_or("sha256");
        algorithm = parseChecksumAlgorithm(name);
        if (!algorithm) {
            err_ << "Error: Invalid hash algorithm '" << name
                 << "'. Must be 'crc32', 'md5', 'sha256', or 'blake3'\n";
            return EXIT_ERROR;
        }
    }

    auto created = createJob(src, dst, *mode, *policy);
    if (!created.success) {
        err_ << "Error: Job creation failed: " << created.error.toString() << "\n";
        return EXIT_ERROR;
    }
    TransferJob job = std::move(created.data);
    if (opts.verify) {
        job.verifyAfterCopy = true;
        job.checksumAlgorithm = algorithm;
    }

    auto planned = planJob(job);
    if (!planned.success) {
        err_ << "Error: Job planning failed: " << planned.error.toString() << "\n";
        return EXIT_ERROR;
    }

    CliProgress progress(err_, opts.verbose);
    auto ran = runJob(job, &progress);
    if (!ran.success) {
        err_ << "Error: Job execution failed: " << ran.error.toString() << "\n";
        return EXIT_ERROR;
    }

    if (opts.manifest) {
        std::string content = generateManifest(buildJobManifest(job), *algorithm);
        auto written = writeManifestFile(*opts.manifest, content);
        if (!written.success) {
            err_ << "Error: Could not write manifest: " << written.error.toString() << "\n";
            return EXIT_ERROR;
        }
    }

    bool mismatch = false;
    for (const FileItem& file : job.files) {
        if (file.metadata.verificationPassed == false) mismatch = true;
    }

    if (hasFailures(job)) {
        err_ << "Error: One or more files failed to transfer\n";
        return EXIT_ITEMS_FAILED;
    }
    if (mismatch) {
        err_ << "Error: One or more files failed verification\n";
        return EXIT_ITEMS_FAILED;
    }
    return EXIT_OK;
}

int CliMode::runCheck(const std::vector<std::string>& args) {
    CheckOptions opts;
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        bool ok = true;

        if (arg == "--manifest") ok = takeValue(args, i, opts.manifest);
        else if (arg == "--root") ok = takeValue(args, i, opts.root);
        else if (arg == "--hash") ok = takeValue(args, i, opts.hash);
        else {
            err_ << "Unknown option '" << arg << "'\n";
            return EXIT_ERROR;
        }

        if (!ok) {
            err_ << "Missing value for " << arg << "\n";
            return EXIT_ERROR;
        }
    }

    if (opts.manifest.empty() || opts.root.empty()) {
        err_ << "Usage: check --manifest <file> --root <path> [--hash <algorithm>]\n";
        return EXIT_ERROR;
    }

    auto algorithm = parseChecksumAlgorithm(opts.hash);
    if (!algorithm) {
        err_ << "Error: Invalid hash algorithm '" << opts.hash
             << "'. Must be 'crc32', 'md5', 'sha256', or 'blake3'\n";
        return EXIT_ERROR;
    }

    auto content = readManifestFile(opts.manifest);
    if (!content.success) {
        err_ << "Error: " << content.error.toString() << "\n";
        return EXIT_ERROR;
    }

    auto checks = verifyManifestAgainstRoot(content.data, opts.root, *algorithm);
    if (!checks.success) {
        err_ << "Error: " << checks.error.toString() << "\n";
        return EXIT_ERROR;
    }

    size_t good = 0, bad = 0;
    for (const ManifestCheck& check : checks.data) {
        if (check.matches) {
            ++good;
            out_ << "OK        " << check.relativePath << "\n";
        } else {
            ++bad;
            out_ << "MISMATCH  " << check.relativePath << "\n";
        }
    }
    out_ << good << " OK, " << bad << " mismatch\n";

    return bad == 0 ? EXIT_OK : EXIT_ITEMS_FAILED;
}

void CliMode::printHelp() const {
    out_ << "Available Commands:\n"
         << " copy --src <path> --dst <path>                Copy a directory tree\n"
         << "      [--mode copy|move]                       Move currently behaves like copy\n"
         << "      [--overwrite skip|overwrite|smart]       What to do with existing files (default skip)\n"
         << "      [--verify] [--hash <algorithm>]          Verify copies: crc32, md5, sha256 (default), blake3\n"
         << "      [--manifest <file>]                      Write source checksums after a verified copy\n"
         << "      [--verbose]                              Print every item\n"
         << " check --manifest <file> --root <path>         Verify files under root against a manifest\n"
         << "       [--hash <algorithm>]\n"
         << " help                                          Show this help\n";
}
