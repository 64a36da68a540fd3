#include "codeloop/workflow.h"
#include "codeloop/errors.h"
#include "codeloop/ids.h"
#include "codeloop/json_util.h"
#include "codeloop/marshal.h"

#include <json-c/json.h>

#include <exception>

namespace codeloop {

namespace {

NullEventSink g_null_sink;

std::string outputs_json(const std::vector<std::string>& names) {
    json_util::Doc arr(json_object_new_array());
    for (const auto& n : names) json_object_array_add(arr.root, json_util::new_string(n));
    return json_util::to_string_plain(arr.root);
}

} // namespace

Feedback feedback_from(const Attempt& a) {
    Feedback f;
    f.attempt_index = a.index;
    f.code = a.code;
    f.stdout_text = a.stdout_text;
    f.stderr_text = a.stderr_text;
    f.analysis = a.analysis;
    f.failure = a.failure;
    return f;
}

Workflow::Workflow(Request request,
                   ICodeGenerator& generator,
                   AttemptExecutor& executor,
                   const Evaluator& evaluator,
                   WorkflowOptions opts)
    : request_(std::move(request)),
      generator_(generator),
      executor_(executor),
      evaluator_(evaluator),
      sink_(opts.sink ? opts.sink : &g_null_sink),
      run_id_(opts.run_id.empty() ? gen_run_id() : opts.run_id) {}

void Workflow::emit(int step, const std::string& name, const std::string& payload_json) {
    sink_->event(step, name, payload_json);
}

void Workflow::transition(WorkflowState to, int attempt) {
    std::string payload = std::string("{\"from\":\"") + workflow_state_name(state_) +
                          "\",\"to\":\"" + workflow_state_name(to) +
                          "\",\"attempt\":" + std::to_string(attempt) + "}";
    state_ = to;
    emit(attempt, "state_transition", payload);
}

GenerationRequest Workflow::build_generation_request(int attempt_index, const std::vector<Attempt>& attempts) const {
    GenerationRequest g;
    g.request_text = request_.request_text;
    g.data_description = data_description_;
    g.context_notes = request_.context_notes;
    g.attempt_index = attempt_index;
    for (const auto& a : attempts) g.history.push_back(feedback_from(a));
    if (!attempts.empty()) g.previous = feedback_from(attempts.back());
    return g;
}

WorkflowResult Workflow::run(const CancelToken* cancel) {
    try {
        return run_attempts(cancel);
    } catch (const Error& e) {
        emit(0, "workflow_failed",
             std::string("{\"error_kind\":\"") + error_kind_name(e.kind()) +
             "\",\"state\":\"" + workflow_state_name(state_) +
             "\",\"message\":" + json_util::quote(e.what()) + "}");
        throw;
    }
}

WorkflowResult Workflow::run_attempts(const CancelToken* cancel) {
    WorkflowResult result;
    result.run_id = run_id_;
    state_ = WorkflowState::GENERATING;

    emit(0, "workflow_started",
         "{\"max_attempts\":" + std::to_string(request_.max_attempts) +
         ",\"variables\":" + std::to_string(request_.variables.size()) + "}");

    // every variable must be marshalable before anything is generated or run
    validate_variables(request_.variables);
    data_description_ = describe_variables(request_.variables);

    for (int idx = 1; idx <= request_.max_attempts; idx++) {
        if (cancel && cancel->cancelled()) throw WorkflowCancelled("cancelled before attempt " + std::to_string(idx));

        Attempt attempt;
        attempt.index = idx;
        emit(idx, "attempt_started", "{\"attempt\":" + std::to_string(idx) + "}");

        // GENERATING
        try {
            attempt.code = generator_.generate(build_generation_request(idx, result.attempts));
        } catch (const Error&) {
            throw;
        } catch (const std::exception& e) {
            throw GenerationFailed(std::string("generator: ") + e.what());
        }

        transition(WorkflowState::EXECUTING, idx);
        CapturedResult captured = executor_.execute(run_id_, idx, attempt.code, request_.variables, cancel);

        transition(WorkflowState::EVALUATING, idx);
        Evaluation ev = evaluator_.evaluate(request_.request_text, attempt.code, captured);

        attempt.stdout_text = std::move(captured.stdout_text);
        attempt.stderr_text = std::move(captured.stderr_text);
        attempt.exit_status = captured.exit_status;
        attempt.mount_write_violation = captured.mount_write_violation;
        attempt.duration_ms = captured.duration_ms;
        attempt.outputs = std::move(captured.declared_outputs);
        attempt.output_files = std::move(captured.output_files);
        attempt.success = ev.success;
        attempt.failure = ev.failure;
        attempt.analysis = std::move(ev.analysis);
        attempt.judge_satisfied = ev.judge_satisfied;

        {
            json_util::Doc p(json_object_new_object());
            json_object_object_add(p.root, "attempt", json_object_new_int(idx));
            json_object_object_add(p.root, "success", json_object_new_boolean(attempt.success));
            json_object_object_add(p.root, "failure", json_object_new_string(failure_kind_name(attempt.failure)));
            json_object_object_add(p.root, "exit_status", json_object_new_int(attempt.exit_status));
            json_object_object_add(p.root, "duration_ms", json_object_new_int64(attempt.duration_ms));
            json_object_object_add(p.root, "mount_write_violation", json_object_new_boolean(attempt.mount_write_violation));
            if (attempt.judge_satisfied) {
                json_object_object_add(p.root, "judge_satisfied", json_object_new_boolean(*attempt.judge_satisfied));
            }
            emit(idx, "attempt_finished", json_util::to_string_plain(p.root));
        }

        result.attempts.push_back(std::move(attempt));
        const Attempt& done = result.attempts.back();

        if (done.success) {
            transition(WorkflowState::SUCCEEDED, idx);
            result.success = true;
            result.final_code = done.code;
            result.final_outputs = done.outputs;
            break;
        }
        if (idx == request_.max_attempts) {
            transition(WorkflowState::EXHAUSTED, idx);
            break;
        }
        transition(WorkflowState::RETRYING, idx);
        transition(WorkflowState::GENERATING, idx + 1);
    }

    result.final_state = state_;
    std::vector<std::string> out_names;
    for (const auto& kv : result.final_outputs) out_names.push_back(kv.first);
    emit((int)result.attempts.size(), "workflow_finished",
         std::string("{\"success\":") + (result.success ? "true" : "false") +
         ",\"final_state\":\"" + workflow_state_name(result.final_state) +
         "\",\"attempts\":" + std::to_string(result.attempts.size()) +
         ",\"outputs\":" + outputs_json(out_names) + "}");
    return result;
}

} // namespace codeloop
