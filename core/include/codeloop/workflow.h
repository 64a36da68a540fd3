#pragma once

// Refinement Controller:
//   GENERATING -> EXECUTING -> EVALUATING -> SUCCEEDED
//                                        \-> RETRYING -> GENERATING
//                                        \-> EXHAUSTED

#include "evaluator.h"
#include "executor.h"
#include "generator.h"
#include "log.h"
#include "types.h"

#include <string>
#include <vector>

namespace codeloop {

struct WorkflowOptions {
    std::string run_id;             // generated when empty
    IEventSink* sink{nullptr};      // not owned; NullEventSink when null
};

class Workflow {
public:
    Workflow(Request request,
             ICodeGenerator& generator,
             AttemptExecutor& executor,
             const Evaluator& evaluator,
             WorkflowOptions opts = {});

    // Blocks until SUCCEEDED or EXHAUSTED. Attempts run strictly one after
    // another. Throws SerializationError (before any attempt),
    // EnvironmentCreateFailed, CaptureFailed, GenerationFailed or
    // WorkflowCancelled; nothing is retried after a throw.
    WorkflowResult run(const CancelToken* cancel = nullptr);

    const std::string& run_id() const { return run_id_; }
    WorkflowState state() const { return state_; }
    const Request& request() const { return request_; }

private:
    WorkflowResult run_attempts(const CancelToken* cancel);
    void transition(WorkflowState to, int attempt);
    void emit(int step, const std::string& name, const std::string& payload_json);
    GenerationRequest build_generation_request(int attempt_index, const std::vector<Attempt>& attempts) const;

    const Request request_;
    ICodeGenerator& generator_;
    AttemptExecutor& executor_;
    const Evaluator& evaluator_;
    IEventSink* sink_;
    std::string run_id_;
    std::string data_description_;
    WorkflowState state_{WorkflowState::GENERATING};
};

Feedback feedback_from(const Attempt& a);

} // namespace codeloop
