#include "codeloop/environment.h"
#include "codeloop/bootstrap.h"
#include "codeloop/errors.h"

#include <system_error>

namespace codeloop {

// Kills (while still running) and removes one container exactly once, on
// whichever path leaves ContainerEnvironment::run.
class InstanceGuard {
public:
    InstanceGuard(ContainerEnvironment& env, std::string id) : env_(env), id_(std::move(id)) {}
    ~InstanceGuard() {
        std::string ignored;
        teardown(&ignored);
    }

    InstanceGuard(const InstanceGuard&) = delete;
    InstanceGuard& operator=(const InstanceGuard&) = delete;

    void mark_running(bool r) { running_ = r; }

    bool teardown(std::string* err) {
        if (done_) return true;
        done_ = true;
        if (running_) env_.rt_.kill(id_);
        bool ok = env_.rt_.remove(id_, err);
        env_.set_state(EnvState::DESTROYED);
        return ok;
    }

private:
    ContainerEnvironment& env_;
    std::string id_;
    bool running_{false};
    bool done_{false};
};

namespace {

bool summary_exists(const std::filesystem::path& output_dir) {
    std::error_code ec;
    return std::filesystem::exists(output_dir / kResultFile, ec);
}

} // namespace

ContainerEnvironment::ContainerEnvironment(IContainerRuntime& runtime, EnvironmentOptions opts)
    : rt_(runtime), opts_(std::move(opts)) {}

void ContainerEnvironment::set_state(EnvState s) {
    state_ = s;
    history_.push_back(s);
}

RawExecutionRecord ContainerEnvironment::run(const ExecutionSpec& spec) {
    history_.clear();

    if (opts_.auto_build_image && !image_ready_) {
        std::string err = rt_.ensure_image(opts_.image);
        if (!err.empty()) throw EnvironmentCreateFailed(err);
        image_ready_ = true;
    }
    if (spec.cancel && spec.cancel->cancelled()) {
        throw WorkflowCancelled("cancelled before " + spec.instance_name + " was created");
    }

    ContainerSpec cs;
    cs.name = spec.instance_name;
    cs.image = opts_.image;
    cs.input_dir = spec.input_dir.string();
    cs.output_dir = spec.output_dir.string();
    cs.command = {opts_.python, "-u", std::string(kInputMount) + "/" + kBootstrapFile};
    cs.network = opts_.network;
    cs.memory_mb = opts_.memory_mb;
    cs.cpus = opts_.cpus;
    cs.pids_limit = opts_.pids_limit;
    cs.env = opts_.env;

    std::string id, err;
    if (!rt_.create(cs, &id, &err)) {
        throw EnvironmentCreateFailed(err.empty() ? "cannot create " + cs.name : err);
    }
    set_state(EnvState::CREATED);
    InstanceGuard guard(*this, id);

    set_state(EnvState::RUNNING);
    guard.mark_running(true);
    ProcResult pr;
    if (!rt_.start_attach(id, spec.timeout_ms, spec.cancel, &pr)) {
        throw EnvironmentCreateFailed("cannot start " + cs.name + ": " + pr.error);
    }

    if (pr.cancelled) {
        (void)guard.teardown(&err);
        throw WorkflowCancelled("cancelled while " + cs.name + " was running");
    }

    RawExecutionRecord rec;
    rec.instance_name = cs.name;
    rec.timed_out = pr.timed_out;
    rec.exit_status = pr.exit_code;
    rec.stdout_text = std::move(pr.output);
    rec.stderr_text = std::move(pr.error_output);
    rec.io_error = pr.io_error;
    rec.io_error_detail = pr.error;
    rec.duration_ms = pr.duration_ms;

    if (pr.timed_out) {
        rec.end_state = EnvState::TIMED_OUT;
        set_state(EnvState::TIMED_OUT);
    } else {
        rec.end_state = EnvState::COMPLETED;
        set_state(EnvState::COMPLETED);
        guard.mark_running(false);

        // 125: the daemon refused to run the container.
        // 127 with no output at all: the client binary itself is missing.
        bool no_summary = !summary_exists(spec.output_dir);
        bool silent = rec.stdout_text.empty() && rec.stderr_text.empty();
        if (no_summary && (rec.exit_status == 125 || (rec.exit_status == 127 && silent))) {
            std::string detail = rec.stderr_text.empty() ? rec.stdout_text : rec.stderr_text;
            throw EnvironmentCreateFailed("runtime could not run " + cs.name + " (exit " +
                                          std::to_string(rec.exit_status) + ")" +
                                          (detail.empty() ? "" : ": " + detail));
        }
    }

    std::string rm_err;
    if (!guard.teardown(&rm_err)) rec.teardown_error = rm_err;
    return rec;
}

} // namespace codeloop
