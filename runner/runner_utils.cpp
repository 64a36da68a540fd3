#include "runner_utils.h"

#include "codeloop/json_util.h"
#include "codeloop/marshal.h"

#include <csignal>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace codeloop {

namespace {

CancelToken g_cancel;

void on_signal(int) { g_cancel.cancel(); }

} // namespace

std::string slurp(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f) throw std::runtime_error("cannot open: " + path);
    std::stringstream ss; ss << f.rdbuf();
    return ss.str();
}

CancelToken& install_cancel_signals() {
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);
    return g_cancel;
}

EnvironmentOptions environment_options(const Config& cfg) {
    EnvironmentOptions o;
    o.image = cfg.image;
    o.network = cfg.network;
    o.memory_mb = cfg.memory_mb;
    o.cpus = cfg.cpus;
    o.pids_limit = cfg.pids_limit;
    o.auto_build_image = cfg.auto_build_image;
    return o;
}

ExternalCommandOptions command_options(const Config& cfg, const Credential& cred) {
    ExternalCommandOptions o;
    o.timeout_ms = cfg.gen_timeout_ms;
    if (!cfg.allowed_exe.empty()) o.allowed_exe = cfg.allowed_exe;
    o.allow_unsafe = cfg.allow_unsafe;
    o.api_key = cred.value;
    return o;
}

VariableMap load_variables_file(const std::string& path) {
    if (path.empty()) return {};
    json_util::Doc doc = json_util::parse(slurp(path));
    if (!doc) throw std::runtime_error("variables file is not valid JSON: " + path);
    return variables_from_json(doc.root);
}

std::filesystem::path save_generated_code(const std::filesystem::path& state_dir,
                                          const std::string& run_id,
                                          const std::string& request_text,
                                          const std::string& code) {
    const auto dir = state_dir / "gen_codes";
    std::filesystem::create_directories(dir);
    const auto path = dir / (run_id + ".py");

    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f) throw std::runtime_error("cannot write " + path.string());
    f << "# User request:\n";
    std::istringstream in(request_text);
    std::string line;
    while (std::getline(in, line)) f << "# " << line << "\n";
    f << "\n" << code;
    if (!code.empty() && code.back() != '\n') f << "\n";
    if (!f) throw std::runtime_error("short write to " + path.string());
    return path;
}

void print_attempt(const Attempt& a) {
    std::cout << "--- attempt " << a.index << ": " << (a.success ? "success" : "failure");
    if (!a.success) std::cout << " (" << failure_kind_name(a.failure) << ")";
    std::cout << ", exit " << a.exit_status << ", " << a.duration_ms << " ms\n";
    std::cout << a.analysis << "\n";
    if (!a.success && !a.stderr_text.empty()) {
        std::cout << "stderr:\n" << a.stderr_text;
        if (a.stderr_text.back() != '\n') std::cout << "\n";
    }
}

void print_outputs(const VariableMap& outputs, const std::vector<OutputFile>& files) {
    for (const auto& kv : outputs) {
        std::cout << "output " << kv.first << " = " << render_value(kv.second) << "\n";
    }
    for (const auto& f : files) {
        std::cout << "file " << f.path << " (" << f.bytes.size() << " bytes)\n";
    }
}

} // namespace codeloop
