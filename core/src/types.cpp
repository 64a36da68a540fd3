#include "codeloop/types.h"
#include "codeloop/errors.h"

#include <stdexcept>

namespace codeloop {

Request::Request(std::string text, VariableMap vars, int ceiling, std::vector<std::string> context)
    : request_text(std::move(text)),
      variables(std::move(vars)),
      max_attempts(ceiling),
      context_notes(std::move(context)) {
    // an unbounded retry loop is never allowed
    if (max_attempts < 1) {
        throw std::invalid_argument("Request: attempt ceiling must be >= 1 (got " +
                                    std::to_string(max_attempts) + ")");
    }
}

const char* env_state_name(EnvState s) {
    switch (s) {
        case EnvState::CREATED: return "CREATED";
        case EnvState::RUNNING: return "RUNNING";
        case EnvState::COMPLETED: return "COMPLETED";
        case EnvState::TIMED_OUT: return "TIMED_OUT";
        case EnvState::DESTROYED: return "DESTROYED";
    }
    return "UNKNOWN";
}

const char* workflow_state_name(WorkflowState s) {
    switch (s) {
        case WorkflowState::GENERATING: return "GENERATING";
        case WorkflowState::EXECUTING: return "EXECUTING";
        case WorkflowState::EVALUATING: return "EVALUATING";
        case WorkflowState::RETRYING: return "RETRYING";
        case WorkflowState::SUCCEEDED: return "SUCCEEDED";
        case WorkflowState::EXHAUSTED: return "EXHAUSTED";
    }
    return "UNKNOWN";
}

const char* failure_kind_name(FailureKind k) {
    switch (k) {
        case FailureKind::NONE: return "NONE";
        case FailureKind::TIMED_OUT: return "TIMED_OUT";
        case FailureKind::RAISED: return "RAISED";
        case FailureKind::NONZERO_EXIT: return "NONZERO_EXIT";
    }
    return "UNKNOWN";
}

const char* error_kind_name(ErrorKind k) {
    switch (k) {
        case ErrorKind::SERIALIZATION: return "SerializationError";
        case ErrorKind::ENVIRONMENT_CREATE: return "EnvironmentCreateFailed";
        case ErrorKind::CAPTURE: return "CaptureFailed";
        case ErrorKind::GENERATION: return "GenerationFailed";
        case ErrorKind::CANCELLED: return "WorkflowCancelled";
    }
    return "Error";
}

} // namespace codeloop
