#include "codeloop/config.h"

#include <algorithm>
#include <cctype>
#include <climits>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace codeloop {

namespace {

const char* kApiKeyVar = "CODELOOP_API_KEY";

std::string trim_ws(std::string s) {
    while (!s.empty() && (s.back()=='\n' || s.back()=='\r' || s.back()==' ' || s.back()=='\t')) s.pop_back();
    size_t i=0;
    while (i<s.size() && (s[i]=='\n' || s[i]=='\r' || s[i]==' ' || s[i]=='\t')) i++;
    if (i) s.erase(0,i);
    return s;
}

std::string lower_ascii(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return (char)std::tolower(c); });
    return s;
}

const char* env_or_null(const char* name) {
    const char* v = std::getenv(name);
    return (v && *v) ? v : nullptr;
}

long long getenv_ll(const char* name, long long defv, long long min_v, long long max_v = INT_MAX) {
    const char* v = env_or_null(name);
    if (!v) return defv;
    long long out = 0;
    try {
        size_t pos = 0;
        out = std::stoll(v, &pos);
        if (pos != std::string(v).size()) throw std::invalid_argument("trailing characters");
    } catch (const std::exception&) {
        throw std::runtime_error(std::string(name) + ": not an integer: " + v);
    }
    if (out < min_v) throw std::runtime_error(std::string(name) + " must be >= " + std::to_string(min_v));
    if (out > max_v) throw std::runtime_error(std::string(name) + " must be <= " + std::to_string(max_v));
    return out;
}

double getenv_double(const char* name, double defv) {
    const char* v = env_or_null(name);
    if (!v) return defv;
    double out = 0;
    try {
        out = std::stod(v);
    } catch (const std::exception&) {
        throw std::runtime_error(std::string(name) + ": not a number: " + v);
    }
    if (!(out > 0)) throw std::runtime_error(std::string(name) + " must be > 0");
    return out;
}

bool getenv_flag(const char* name, bool defv) {
    const char* v = env_or_null(name);
    if (!v) return defv;
    std::string s = lower_ascii(v);
    return s == "1" || s == "true" || s == "yes" || s == "on";
}

std::string getenv_str(const char* name, const std::string& defv) {
    const char* v = env_or_null(name);
    return v ? std::string(v) : defv;
}

std::vector<std::string> split_csv(const std::string& s) {
    std::vector<std::string> out;
    std::string cur;
    std::istringstream in(s);
    while (std::getline(in, cur, ',')) {
        cur = trim_ws(cur);
        if (!cur.empty()) out.push_back(cur);
    }
    return out;
}

std::filesystem::path home_dir() {
    const char* h = env_or_null("HOME");
    return h ? std::filesystem::path(h) : std::filesystem::path();
}

std::filesystem::path default_state_dir() {
    if (const char* x = env_or_null("XDG_STATE_HOME")) return std::filesystem::path(x) / "codeloop";
    auto h = home_dir();
    if (h.empty()) return std::filesystem::path(".codeloop");
    return h / ".local" / "state" / "codeloop";
}

} // namespace

Profile detect_profile() {
    const char* env = std::getenv("CODELOOP_PROFILE");
    if (!env) return Profile::DEV;

    std::string val = lower_ascii(env);
    if (val == "prod" || val == "production") return Profile::PROD;
    return Profile::DEV;
}

const char* profile_name(Profile p) {
    switch (p) {
        case Profile::PROD: return "prod";
        case Profile::DEV:  return "dev";
    }
    return "dev";
}

void apply_profile_defaults(Profile p) {
    // must run before any worker threads exist: setenv races with getenv
    constexpr int NO_OVERWRITE = 0;

    switch (p) {
        case Profile::DEV:
            setenv("CODELOOP_EXEC_TIMEOUT_MS",   "120000", NO_OVERWRITE);
            setenv("CODELOOP_GEN_TIMEOUT_MS",    "120000", NO_OVERWRITE);
            setenv("CODELOOP_AUTO_BUILD_IMAGE",  "1",      NO_OVERWRITE);
            setenv("CODELOOP_NETWORK",           "none",   NO_OVERWRITE);
            setenv("CODELOOP_PIDS_LIMIT",        "256",    NO_OVERWRITE);
            break;

        case Profile::PROD:
            setenv("CODELOOP_EXEC_TIMEOUT_MS",   "60000",  NO_OVERWRITE);
            setenv("CODELOOP_GEN_TIMEOUT_MS",    "60000",  NO_OVERWRITE);
            setenv("CODELOOP_AUTO_BUILD_IMAGE",  "0",      NO_OVERWRITE);
            setenv("CODELOOP_NETWORK",           "none",   NO_OVERWRITE);
            setenv("CODELOOP_PIDS_LIMIT",        "128",    NO_OVERWRITE);
            break;
    }
}

Config Config::from_env() {
    Config c;
    c.profile = detect_profile();
    c.runtime = getenv_str("CODELOOP_RUNTIME", c.runtime);
    c.image = getenv_str("CODELOOP_IMAGE", c.image);
    c.exec_timeout_ms = (int)getenv_ll("CODELOOP_EXEC_TIMEOUT_MS", c.exec_timeout_ms, 1);
    c.gen_timeout_ms = (int)getenv_ll("CODELOOP_GEN_TIMEOUT_MS", c.gen_timeout_ms, 1);
    c.memory_mb = (size_t)getenv_ll("CODELOOP_MEMORY_MB", (long long)c.memory_mb, 0, LLONG_MAX / (1024 * 1024));
    c.cpus = getenv_double("CODELOOP_CPUS", c.cpus);
    c.pids_limit = (int)getenv_ll("CODELOOP_PIDS_LIMIT", c.pids_limit, 0);
    c.network = getenv_str("CODELOOP_NETWORK", c.network);
    c.auto_build_image = getenv_flag("CODELOOP_AUTO_BUILD_IMAGE", c.auto_build_image);
    c.max_attempts = (int)getenv_ll("CODELOOP_MAX_ATTEMPTS", c.max_attempts, 1);

    if (const char* w = env_or_null("CODELOOP_WORK_ROOT")) {
        c.work_root = w;
    } else {
        std::error_code ec;
        c.work_root = std::filesystem::temp_directory_path(ec);
        if (ec) c.work_root = "/tmp";
    }
    if (const char* s = env_or_null("CODELOOP_STATE_DIR")) c.state_dir = s;
    else c.state_dir = default_state_dir();

    c.generator_cmd = getenv_str("CODELOOP_GENERATOR_CMD", "");
    c.judge_cmd = getenv_str("CODELOOP_JUDGE_CMD", "");
    if (const char* al = env_or_null("CODELOOP_GENERATOR_ALLOWED_EXE")) c.allowed_exe = split_csv(al);
    c.allow_unsafe = getenv_flag("CODELOOP_GENERATOR_ALLOW_UNSAFE", false);
    return c;
}

std::map<std::string, std::string> parse_dotenv(const std::string& text) {
    std::map<std::string, std::string> out;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        line = trim_ws(line);
        if (line.empty() || line[0] == '#') continue;
        if (line.rfind("export ", 0) == 0) line = trim_ws(line.substr(7));
        auto eq = line.find('=');
        if (eq == std::string::npos || eq == 0) continue;
        std::string key = trim_ws(line.substr(0, eq));
        std::string val = trim_ws(line.substr(eq + 1));
        if (val.size() >= 2 && (val.front() == '"' || val.front() == '\'') && val.back() == val.front()) {
            val = val.substr(1, val.size() - 2);
        }
        out[key] = val;
    }
    return out;
}

std::vector<std::filesystem::path> credential_candidates() {
    std::vector<std::filesystem::path> c;
    if (const char* o = env_or_null("CODELOOP_DOTENV_PATH")) c.emplace_back(o);
    c.emplace_back(std::filesystem::path(".env"));
    c.emplace_back(std::filesystem::path("/secrets/codeloop/.env"));
    if (const char* x = env_or_null("XDG_CONFIG_HOME")) {
        c.push_back(std::filesystem::path(x) / "codeloop" / ".env");
    } else if (!home_dir().empty()) {
        c.push_back(home_dir() / ".config" / "codeloop" / ".env");
    }
    if (!home_dir().empty()) c.push_back(home_dir() / ".local" / "state" / "codeloop" / ".env");
    return c;
}

Credential discover_credential() {
    Credential cred;
    if (const char* v = env_or_null(kApiKeyVar)) {
        cred.value = v;
        cred.source = "env";
        return cred;
    }
    for (const auto& p : credential_candidates()) {
        std::ifstream f(p, std::ios::binary);
        if (!f) continue;
        std::ostringstream ss;
        ss << f.rdbuf();
        auto kv = parse_dotenv(ss.str());
        auto it = kv.find(kApiKeyVar);
        if (it != kv.end() && !it->second.empty()) {
            cred.value = it->second;
            cred.source = p.string();
            return cred;
        }
    }
    return cred;
}

} // namespace codeloop
