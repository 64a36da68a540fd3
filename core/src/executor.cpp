#include "codeloop/executor.h"
#include "codeloop/bootstrap.h"
#include "codeloop/capture.h"
#include "codeloop/json_util.h"
#include "codeloop/marshal.h"
#include "codeloop/workspace.h"


namespace codeloop {

AttemptExecutor::AttemptExecutor(IExecutionEnvironment& env, ExecutorOptions opts, IEventSink* sink)
    : env_(env), opts_(std::move(opts)), sink_(sink) {
    if (opts_.work_root.empty()) opts_.work_root = std::filesystem::temp_directory_path();
}

CapturedResult AttemptExecutor::execute(const std::string& run_id,
                                        int attempt_index,
                                        const std::string& code,
                                        const VariableMap& variables,
                                        const CancelToken* cancel) {
    AttemptWorkspace ws(opts_.work_root, run_id, attempt_index);

    VariableMap to_send = opts_.marshal_all_variables ? variables : select_used_variables(code, variables);
    std::vector<std::string> sent = marshal_variables(to_send, ws.input_dir());
    write_bootstrap(ws.input_dir(), code);

    if (sink_) {
        json_util::Doc p(json_object_new_object());
        json_object* arr = json_object_new_array();
        for (const auto& n : sent) json_object_array_add(arr, json_util::new_string(n));
        json_object_object_add(p.root, "variables", arr);
        json_object_object_add(p.root, "workspace", json_util::new_string(ws.root().string()));
        sink_->event(attempt_index, "inputs_marshaled", json_util::to_string_plain(p.root));
    }

    ExecutionSpec spec;
    // codeloop-<run_id>-a<N>-<suffix>: unique even when run ids repeat
    spec.instance_name = ws.root().filename().string();
    spec.input_dir = ws.input_dir();
    spec.output_dir = ws.output_dir();
    spec.timeout_ms = opts_.timeout_ms;
    spec.cancel = cancel;

    RawExecutionRecord rec = env_.run(spec);
    if (!rec.teardown_error.empty() && sink_) {
        sink_->event(attempt_index, "teardown_warning",
                     "{\"detail\":" + json_util::quote(rec.teardown_error) + "}");
    }

    CapturedResult result = capture_result(rec, ws.output_dir());

    std::string rm_err;
    if (!ws.release(&rm_err) && sink_) {
        sink_->event(attempt_index, "workspace_cleanup_warning", "{\"detail\":" + json_util::quote(rm_err) + "}");
    }
    return result;
}

} // namespace codeloop
