#pragma once

// Runs exactly one attempt: workspace -> marshal -> bootstrap -> environment
// -> capture -> cleanup.

#include "environment.h"
#include "log.h"
#include "types.h"

#include <filesystem>
#include <string>

namespace codeloop {

struct ExecutorOptions {
    std::filesystem::path work_root;   // parent of per-attempt workspaces
    int timeout_ms{120000};            // wall-clock deadline per attempt
    bool marshal_all_variables{false}; // default: only names the code uses
};

class AttemptExecutor {
public:
    AttemptExecutor(IExecutionEnvironment& env, ExecutorOptions opts, IEventSink* sink = nullptr);

    // Throws SerializationError, EnvironmentCreateFailed, CaptureFailed or
    // WorkflowCancelled. The instance and the host workspace are gone by
    // the time this returns or throws.
    CapturedResult execute(const std::string& run_id,
                           int attempt_index,
                           const std::string& code,
                           const VariableMap& variables,
                           const CancelToken* cancel);

    const ExecutorOptions& options() const { return opts_; }

private:
    IExecutionEnvironment& env_;
    ExecutorOptions opts_;
    IEventSink* sink_;
};

} // namespace codeloop
