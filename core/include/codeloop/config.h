#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace codeloop {

enum class Profile { DEV, PROD };

// Detect profile from CODELOOP_PROFILE env var. Default: DEV.
Profile detect_profile();

const char* profile_name(Profile p);

// Apply profile defaults: sets env vars that are not already set.
// DEV: generous timeouts, runner image built on demand
// PROD: tight timeouts, image must exist already, fewer pids
void apply_profile_defaults(Profile p);

// Resolved settings handed to the workflow and its collaborators.
struct Config {
    Profile profile{Profile::DEV};

    std::string runtime{"docker"};            // CODELOOP_RUNTIME (docker, podman, or a path)
    std::string image{"codeloop-runner:py313"};
    int exec_timeout_ms{120000};
    int gen_timeout_ms{120000};
    size_t memory_mb{1024};
    double cpus{1.0};
    int pids_limit{256};
    std::string network{"none"};
    std::filesystem::path work_root;          // default: system temp dir
    bool auto_build_image{false};
    int max_attempts{3};
    std::filesystem::path state_dir;          // gen_codes/ and logs/ live here

    std::string generator_cmd;                // CODELOOP_GENERATOR_CMD
    std::string judge_cmd;                    // CODELOOP_JUDGE_CMD
    std::vector<std::string> allowed_exe;     // CODELOOP_GENERATOR_ALLOWED_EXE (csv); empty = built-in list
    bool allow_unsafe{false};                 // CODELOOP_GENERATOR_ALLOW_UNSAFE=1

    // Throws std::runtime_error on malformed or out-of-range values.
    static Config from_env();
};

// KEY=VALUE lines; '#' comments, blank lines and a leading "export " are
// ignored, one level of matching quotes is stripped.
std::map<std::string, std::string> parse_dotenv(const std::string& text);

// Dotenv files searched for the API key, in priority order.
std::vector<std::filesystem::path> credential_candidates();

struct Credential {
    std::string value;
    std::string source;   // "env", or the dotenv path it came from
    bool found() const { return !value.empty(); }
};

// CODELOOP_API_KEY from the environment, else the first candidate file
// that defines it.
Credential discover_credential();

} // namespace codeloop
