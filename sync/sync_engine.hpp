#pragma once
#include <filesystem>
#include "../common/model.hpp"
#include "../common/result.hpp"
#include "progress_callback.hpp"

// Validates the inputs and returns a Pending job with no items.
Result<TransferJob> createJob(const std::filesystem::path& source, const std::filesystem::path& destination,
                              Mode mode, OverwritePolicy overwritePolicy);

// Enumerates the source tree into job.files. Pending jobs only; the state is left unchanged.
Result<void> planJob(TransferJob& job);

// Processes every item in order and leaves the job Completed. Item failures are
// recorded on the items; an error is returned only when the job is not Pending.
Result<void> runJob(TransferJob& job, ProgressCallback* callback = nullptr);
