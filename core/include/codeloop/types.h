#pragma once
#include "value.h"

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace codeloop {

struct RunHeader {
    std::string spec_version{"1.0.0"};
    std::string run_id;          // uuid-like
    std::string request_id;      // caller-supplied tracing ID (optional)
};

// Cooperative cancellation flag shared between the caller and a running workflow.
class CancelToken {
public:
    void cancel() { flag_.store(true); }
    bool cancelled() const { return flag_.load(); }

private:
    std::atomic<bool> flag_{false};
};

// Lifecycle of one isolated execution environment instance.
enum class EnvState {
    CREATED,
    RUNNING,
    COMPLETED,
    TIMED_OUT,
    DESTROYED,
};

// Refinement controller states.
enum class WorkflowState {
    GENERATING,
    EXECUTING,
    EVALUATING,
    RETRYING,
    SUCCEEDED,
    EXHAUSTED,
};

// Why an attempt did not succeed.
enum class FailureKind {
    NONE,
    TIMED_OUT,
    RAISED,
    NONZERO_EXIT,
};

const char* env_state_name(EnvState s);
const char* workflow_state_name(WorkflowState s);
const char* failure_kind_name(FailureKind k);

// A file the generated code left in the output mount.
struct OutputFile {
    std::string path;   // relative to the output mount
    std::string bytes;
};

struct CapturedResult {
    std::string stdout_text;
    std::string stderr_text;
    int exit_status{-1};
    bool timed_out{false};

    // parsed from the bootstrap's result summary
    bool summary_present{false};
    bool exited_without_summary{false}; // exit 0, but the bootstrap never finished
    std::string exception_type;
    std::string exception_message;
    VariableMap declared_outputs;

    std::vector<OutputFile> output_files;
    bool mount_write_violation{false};
    int64_t duration_ms{0};
};

struct Evaluation {
    bool success{false};
    FailureKind failure{FailureKind::NONE};
    std::string analysis;
    std::optional<bool> judge_satisfied;
};

struct Attempt {
    int index{0}; // 1-based
    std::string code;
    std::string stdout_text;
    std::string stderr_text;
    int exit_status{-1};
    bool success{false};
    FailureKind failure{FailureKind::NONE};
    std::string analysis;
    std::optional<bool> judge_satisfied;
    bool mount_write_violation{false};
    int64_t duration_ms{0};
    VariableMap outputs;
    std::vector<OutputFile> output_files;
};

struct Request {
    Request(std::string text, VariableMap vars, int ceiling,
            std::vector<std::string> context = {});

    const std::string request_text;
    const VariableMap variables;
    const int max_attempts;
    const std::vector<std::string> context_notes;
};

struct WorkflowResult {
    std::string run_id;
    bool success{false};
    WorkflowState final_state{WorkflowState::EXHAUSTED};
    std::vector<Attempt> attempts;
    std::string final_code;     // empty unless success
    VariableMap final_outputs;  // declared outputs of the successful attempt
};

} // namespace codeloop
