#pragma once

// Execution Result Capturer: RawExecutionRecord + output mount -> CapturedResult.

#include "environment.h"
#include "types.h"

#include <filesystem>
#include <string>

namespace codeloop {

// Build the complete result of one execution. Output mount contents are
// only read when the run was not timed out.
// Throws CaptureFailed when the capture itself cannot be trusted: a pipe
// read failed, the summary is unreadable or not a JSON object, the
// bootstrap reported that it could not write the summary, or a declared
// output cannot be read or decoded. Exit 0 with no summary otherwise only
// sets exited_without_summary; the attempt fails like any other.
CapturedResult capture_result(const RawExecutionRecord& rec, const std::filesystem::path& output_dir);

// stderr shows generated code writing to the read-only input mount.
bool detect_mount_write_violation(const std::string& stderr_text);

} // namespace codeloop
