#pragma once

// Fixed program run inside every sandbox before the generated code.

#include <filesystem>
#include <string>

namespace codeloop {

// Mount points as seen from inside the sandbox.
constexpr const char* kInputMount = "/inputs";
constexpr const char* kOutputMount = "/outputs";

// Files on the input mount.
constexpr const char* kBootstrapFile = "prelude.py";
constexpr const char* kCodeFile = "code.py";
constexpr const char* kManifestFile = "manifest.json";

// Result summary the bootstrap leaves on the output mount.
constexpr const char* kResultFile = "_result.json";

// stderr prefix the bootstrap prints when it cannot write the summary.
constexpr const char* kSummaryWriteFailed = "bootstrap: cannot write result summary";

// Environment variables that relocate the mounts (host-side runs of the
// bootstrap); unset inside the sandbox.
constexpr const char* kInputDirEnv = "CODELOOP_INPUT_DIR";
constexpr const char* kOutputDirEnv = "CODELOOP_OUTPUT_DIR";

// Python source of the bootstrap. Binds marshaled variables by name,
// provides emit(name, value) for declared outputs, runs code.py under an
// exception-capturing scope and writes the result summary before exit.
const std::string& bootstrap_source();

// Write prelude.py and code.py into input_dir.
// Throws EnvironmentCreateFailed if either file cannot be written.
void write_bootstrap(const std::filesystem::path& input_dir, const std::string& code);

} // namespace codeloop
