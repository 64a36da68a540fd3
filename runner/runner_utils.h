#pragma once

#include "codeloop/config.h"
#include "codeloop/container.h"
#include "codeloop/environment.h"
#include "codeloop/generator.h"
#include "codeloop/types.h"

#include <filesystem>
#include <string>

namespace codeloop {

std::string slurp(const std::string& path);

// SIGINT/SIGTERM cancel the returned token (process-wide).
CancelToken& install_cancel_signals();

EnvironmentOptions environment_options(const Config& cfg);
ExternalCommandOptions command_options(const Config& cfg, const Credential& cred);

// {name: envelope} file; an empty path yields no variables.
VariableMap load_variables_file(const std::string& path);

// <state_dir>/gen_codes/<run_id>.py, headed by the request as comments.
// Returns the written path.
std::filesystem::path save_generated_code(const std::filesystem::path& state_dir,
                                          const std::string& run_id,
                                          const std::string& request_text,
                                          const std::string& code);

void print_attempt(const Attempt& a);
void print_outputs(const VariableMap& outputs, const std::vector<OutputFile>& files);

} // namespace codeloop
