#pragma once

// Isolated Execution Environment: one disposable container per attempt.

#include "container.h"
#include "types.h"

#include <filesystem>
#include <string>
#include <vector>

namespace codeloop {

struct ExecutionSpec {
    std::string instance_name;          // unique per attempt
    std::filesystem::path input_dir;    // holds prelude.py, code.py, manifest.json, vars/
    std::filesystem::path output_dir;
    int timeout_ms{120000};
    const CancelToken* cancel{nullptr};
};

// What the environment observed, before any interpretation.
struct RawExecutionRecord {
    std::string instance_name;
    EnvState end_state{EnvState::COMPLETED}; // COMPLETED or TIMED_OUT
    int exit_status{-1};
    bool timed_out{false};
    std::string stdout_text;
    std::string stderr_text;
    bool io_error{false};
    std::string io_error_detail;
    int64_t duration_ms{0};
    std::string teardown_error; // non-empty if removal failed
};

class IExecutionEnvironment {
public:
    virtual ~IExecutionEnvironment() = default;

    // Run the bootstrap (and through it the generated code) in a fresh
    // instance and tear the instance down before returning or throwing.
    // Throws EnvironmentCreateFailed or WorkflowCancelled.
    virtual RawExecutionRecord run(const ExecutionSpec& spec) = 0;
};

struct EnvironmentOptions {
    std::string image{"codeloop-runner:py313"};
    std::string python{"python"};
    std::string network{"none"};
    size_t memory_mb{1024};
    double cpus{1.0};
    int pids_limit{256};
    std::vector<std::string> env;   // "KEY=VALUE" passed into the sandbox
    bool auto_build_image{false};   // ensure_image once before the first instance
};

class ContainerEnvironment : public IExecutionEnvironment {
public:
    ContainerEnvironment(IContainerRuntime& runtime, EnvironmentOptions opts);

    RawExecutionRecord run(const ExecutionSpec& spec) override;

    // Lifecycle of the most recent instance (DESTROYED once run() returns).
    EnvState state() const { return state_; }
    const std::vector<EnvState>& history() const { return history_; }

    const EnvironmentOptions& options() const { return opts_; }

private:
    friend class InstanceGuard;
    void set_state(EnvState s);

    IContainerRuntime& rt_;
    EnvironmentOptions opts_;
    bool image_ready_{false};
    EnvState state_{EnvState::DESTROYED};
    std::vector<EnvState> history_;
};

} // namespace codeloop
