#include "codeloop/container.h"
#include "codeloop/bootstrap.h"
#include "codeloop/workspace.h"

#include <fstream>
#include <iomanip>
#include <memory>
#include <mutex>
#include <sstream>

namespace codeloop {

namespace {

// Serializes create/kill/remove/build traffic to the daemon across every
// workflow running in this process.
std::mutex& daemon_mutex() {
    static std::mutex m;
    return m;
}

std::string trim_ws(std::string s) {
    while (!s.empty() && (s.back()=='\n' || s.back()=='\r' || s.back()==' ' || s.back()=='\t')) s.pop_back();
    size_t i=0;
    while (i<s.size() && (s[i]=='\n' || s[i]=='\r' || s[i]==' ' || s[i]=='\t')) i++;
    if (i) s.erase(0,i);
    return s;
}

std::string describe_failure(const std::string& what, const ProcResult& pr) {
    std::ostringstream oss;
    oss << what << " (exit_code=" << pr.exit_code;
    if (pr.timed_out) oss << ", timed out";
    oss << ")";
    std::string detail = trim_ws(pr.output);
    if (detail.empty()) detail = pr.error;
    if (!detail.empty()) oss << ": " << detail;
    return oss.str();
}

constexpr int kControlTimeoutMs = 60 * 1000;
constexpr int kBuildTimeoutMs = 20 * 60 * 1000;

} // namespace

const std::string& runner_dockerfile() {
    static const std::string df =
        "FROM python:3.13-slim\n"
        "\n"
        "RUN pip install --no-cache-dir \\\n"
        "    pandas \\\n"
        "    numpy \\\n"
        "    matplotlib \\\n"
        "    seaborn\n"
        "\n"
        "ENV MPLCONFIGDIR=/tmp\n"
        "WORKDIR /work\n";
    return df;
}

DockerCli::DockerCli(std::string binary) : binary_(std::move(binary)) {
    // the client is a trusted host tool: no rlimits, no output cap
    control_lim_.timeout_ms = kControlTimeoutMs;
    control_lim_.stdout_max_bytes = 0;
    control_lim_.rlimit_cpu_sec = 0;
    control_lim_.rlimit_as_mb = 0;
    control_lim_.rlimit_fsize_mb = 0;
    control_lim_.rlimit_nofile = 0;
    control_lim_.rlimit_nproc = 0;
    control_lim_.no_new_privs = false;
}

ProcResult DockerCli::control(const std::vector<std::string>& args, int timeout_ms) {
    std::vector<std::string> argv;
    argv.reserve(args.size() + 1);
    argv.push_back(binary_);
    argv.insert(argv.end(), args.begin(), args.end());

    ProcLimits lim = control_lim_;
    lim.timeout_ms = timeout_ms;
    ProcResult pr;
    if (!proc_run_capture_sandboxed(argv, "", lim, &pr)) {
        pr.exit_code = 127;
        if (pr.output.empty()) pr.output = pr.error;
    }
    return pr;
}

bool DockerCli::available() {
    ProcResult pr = control({"version", "--format", "{{.Server.Version}}"}, 10 * 1000);
    return pr.exit_code == 0 && !pr.timed_out;
}

std::string DockerCli::ensure_image(const std::string& image) {
    std::lock_guard<std::mutex> lk(daemon_mutex());

    ProcResult insp = control({"image", "inspect", image}, kControlTimeoutMs);
    if (insp.exit_code == 0) return "";

    std::unique_ptr<TempDir> ctx;
    try {
        ctx = std::make_unique<TempDir>(std::filesystem::temp_directory_path(), "codeloop_build_");
    } catch (const std::exception& e) {
        return std::string("cannot create build context: ") + e.what();
    }
    {
        std::ofstream f(ctx->path() / "Dockerfile", std::ios::binary);
        if (!f) return "cannot write Dockerfile into " + ctx->path().string();
        f << runner_dockerfile();
    }

    ProcResult build = control({"build", "-t", image, ctx->path().string()}, kBuildTimeoutMs);
    if (build.exit_code != 0) {
        return describe_failure("failed to build sandbox image " + image, build) +
               "\nhint: pre-build or pull an image and set CODELOOP_IMAGE to skip builds";
    }
    return "";
}

std::vector<std::string> DockerCli::create_argv(const ContainerSpec& spec) const {
    std::vector<std::string> av = {"create", "--name", spec.name};
    av.push_back("--network");
    av.push_back(spec.network.empty() ? "none" : spec.network);
    if (spec.memory_mb > 0) {
        av.push_back("--memory");
        av.push_back(std::to_string(spec.memory_mb) + "m");
    }
    if (spec.cpus > 0) {
        std::ostringstream c;
        c << std::fixed << std::setprecision(2) << spec.cpus;
        av.push_back("--cpus");
        av.push_back(c.str());
    }
    if (spec.pids_limit > 0) {
        av.push_back("--pids-limit");
        av.push_back(std::to_string(spec.pids_limit));
    }
    av.push_back("-v");
    av.push_back(spec.input_dir + ":" + kInputMount + ":ro");
    av.push_back("-v");
    av.push_back(spec.output_dir + ":" + kOutputMount + ":rw");
    for (const auto& e : spec.env) {
        av.push_back("-e");
        av.push_back(e);
    }
    av.push_back("-w");
    av.push_back("/work");
    av.push_back(spec.image);
    av.insert(av.end(), spec.command.begin(), spec.command.end());
    return av;
}

bool DockerCli::create(const ContainerSpec& spec, std::string* id, std::string* err) {
    std::lock_guard<std::mutex> lk(daemon_mutex());
    ProcResult pr = control(create_argv(spec), kControlTimeoutMs);
    if (pr.exit_code != 0 || pr.timed_out) {
        if (err) *err = describe_failure("container create failed", pr);
        return false;
    }
    // the id is the last non-empty line (pull progress may precede it)
    std::string out = trim_ws(pr.output);
    auto nl = out.find_last_of('\n');
    if (id) *id = trim_ws(nl == std::string::npos ? out : out.substr(nl + 1));
    if (id && id->empty()) *id = spec.name;
    return true;
}

bool DockerCli::start_attach(const std::string& id, int timeout_ms,
                             const CancelToken* cancel, ProcResult* res) {
    ProcLimits lim = control_lim_;
    lim.timeout_ms = timeout_ms;
    return proc_run_capture_split({binary_, "start", "-a", id}, "", lim, cancel, res);
}

void DockerCli::kill(const std::string& id) {
    std::lock_guard<std::mutex> lk(daemon_mutex());
    (void)control({"kill", id}, kControlTimeoutMs);
}

bool DockerCli::remove(const std::string& id, std::string* err) {
    std::lock_guard<std::mutex> lk(daemon_mutex());
    ProcResult pr = control({"rm", "-f", "-v", id}, kControlTimeoutMs);
    if (pr.exit_code != 0) {
        if (err) *err = describe_failure("container remove failed", pr);
        return false;
    }
    return true;
}

} // namespace codeloop
