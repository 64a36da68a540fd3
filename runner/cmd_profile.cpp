#include "cmd_profile.h"

#include "codeloop/config.h"

#include <iostream>

using namespace codeloop;

int cmd_profile(int, char**) {
    Profile p = detect_profile();
    apply_profile_defaults(p);
    Config cfg;
    try {
        cfg = Config::from_env();
    } catch (const std::runtime_error& e) {
        std::cerr << "[codeloop] " << e.what() << "\n";
        return 2;
    }
    Credential cred = discover_credential();

    std::cout << "profile          " << profile_name(cfg.profile) << "\n"
              << "runtime          " << cfg.runtime << "\n"
              << "image            " << cfg.image << "\n"
              << "exec_timeout_ms  " << cfg.exec_timeout_ms << "\n"
              << "gen_timeout_ms   " << cfg.gen_timeout_ms << "\n"
              << "memory_mb        " << cfg.memory_mb << "\n"
              << "cpus             " << cfg.cpus << "\n"
              << "pids_limit       " << cfg.pids_limit << "\n"
              << "network          " << cfg.network << "\n"
              << "work_root        " << cfg.work_root.string() << "\n"
              << "auto_build_image " << (cfg.auto_build_image ? "1" : "0") << "\n"
              << "max_attempts     " << cfg.max_attempts << "\n"
              << "state_dir        " << cfg.state_dir.string() << "\n"
              << "generator_cmd    " << (cfg.generator_cmd.empty() ? "-" : cfg.generator_cmd) << "\n"
              << "judge_cmd        " << (cfg.judge_cmd.empty() ? "-" : cfg.judge_cmd) << "\n"
              << "api_key          " << (cred.found() ? "found (" + cred.source + ")" : std::string("missing")) << "\n";
    return 0;
}
