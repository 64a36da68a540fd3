#include "cmd_run.h"
#include "runner_utils.h"

#include "codeloop/config.h"
#include "codeloop/container.h"
#include "codeloop/environment.h"
#include "codeloop/errors.h"
#include "codeloop/evaluator.h"
#include "codeloop/executor.h"
#include "codeloop/generator.h"
#include "codeloop/ids.h"
#include "codeloop/json_util.h"
#include "codeloop/log.h"
#include "codeloop/marshal.h"
#include "codeloop/workflow.h"

#include <cstdlib>
#include <iostream>
#include <memory>

using namespace codeloop;

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitExhausted = 1;
constexpr int kExitUsage = 2;
constexpr int kExitFatal = 3;
constexpr int kExitCancelled = 130;

struct RunRequestFile {
    std::string request_id;
    std::string request_text;
    VariableMap variables;
    int max_attempts{0};
    std::vector<std::string> context;
    std::string generator_cmd;
    std::string judge_cmd;
};

RunRequestFile parse_request_file(const std::string& path) {
    json_util::Doc doc = json_util::parse(slurp(path));
    if (!doc || !json_object_is_type(doc.root, json_type_object)) {
        throw std::runtime_error("run request is not a JSON object: " + path);
    }
    RunRequestFile r;
    r.request_id = json_util::get_string(doc.root, "request_id").value_or("");
    r.request_text = json_util::get_string(doc.root, "request_text").value_or("");
    r.max_attempts = (int)json_util::get_int(doc.root, "max_attempts").value_or(0);
    r.context = json_util::get_string_array(doc.root, "context");
    r.generator_cmd = json_util::get_string(doc.root, "generator_cmd").value_or("");
    r.judge_cmd = json_util::get_string(doc.root, "judge_cmd").value_or("");
    json_object* vars = nullptr;
    if (json_object_object_get_ex(doc.root, "variables", &vars)) r.variables = variables_from_json(vars);
    return r;
}

} // namespace

int cmd_run(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "usage: codeloop_cli run <request.json> [--log <file>] [--max-attempts N] [--verbose]\n";
        std::cerr << "env: CODELOOP_GENERATOR_CMD, CODELOOP_JUDGE_CMD, CODELOOP_IMAGE, CODELOOP_EXEC_TIMEOUT_MS\n";
        return kExitUsage;
    }
    std::string req_path = argv[2];
    std::string log_path;
    int max_attempts_override = 0;
    bool verbose = false;
    for (int i = 3; i < argc; i++) {
        std::string a = argv[i];
        if (a == "--log" && i + 1 < argc) { log_path = argv[++i]; continue; }
        if (a == "--max-attempts" && i + 1 < argc) { max_attempts_override = std::atoi(argv[++i]); continue; }
        if (a == "--verbose") { verbose = true; continue; }
        std::cerr << "unknown option: " << a << "\n";
        return kExitUsage;
    }

    apply_profile_defaults(detect_profile());

    Config cfg;
    RunRequestFile rf;
    try {
        cfg = Config::from_env();
        rf = parse_request_file(req_path);
    } catch (const SerializationError& e) {
        std::cerr << "[codeloop] " << e.what() << "\n";
        return kExitFatal;
    } catch (const std::runtime_error& e) {
        std::cerr << "[codeloop] " << e.what() << "\n";
        return kExitUsage;
    }
    if (rf.request_text.empty()) {
        std::cerr << "[codeloop] run request missing request_text\n";
        return kExitUsage;
    }
    int ceiling = max_attempts_override > 0 ? max_attempts_override
                : rf.max_attempts > 0 ? rf.max_attempts : cfg.max_attempts;
    std::string gen_cmd = rf.generator_cmd.empty() ? cfg.generator_cmd : rf.generator_cmd;
    std::string judge_cmd = rf.judge_cmd.empty() ? cfg.judge_cmd : rf.judge_cmd;
    if (gen_cmd.empty()) {
        std::cerr << "[codeloop] no generator command (request generator_cmd or CODELOOP_GENERATOR_CMD)\n";
        return kExitUsage;
    }

    Credential cred = discover_credential();
    if (cred.found()) std::cerr << "[codeloop] API key from " << cred.source << "\n";
    else std::cerr << "[WARN] no CODELOOP_API_KEY found; the generator runs without one\n";

    RunHeader hdr;
    hdr.run_id = gen_run_id();
    hdr.request_id = rf.request_id;
    if (log_path.empty()) {
        auto log_dir = cfg.state_dir / "logs";
        std::error_code ec;
        std::filesystem::create_directories(log_dir, ec);
        if (ec) {
            std::cerr << "[codeloop] cannot create " << log_dir << ": " << ec.message() << "\n";
            return kExitFatal;
        }
        log_path = (log_dir / ("run_" + hdr.run_id + ".jsonl")).string();
    }

    CancelToken& cancel = install_cancel_signals();
    try {
        JsonlEventSink jsonl(hdr, log_path);
        StderrEventSink console;
        std::vector<IEventSink*> sinks{&jsonl};
        if (verbose) sinks.push_back(&console);
        TeeEventSink sink(sinks);

        DockerCli runtime(cfg.runtime);
        ContainerEnvironment env(runtime, environment_options(cfg));
        ExecutorOptions xo;
        xo.work_root = cfg.work_root;
        xo.timeout_ms = cfg.exec_timeout_ms;
        AttemptExecutor executor(env, xo, &sink);

        ExternalCommandOptions co = command_options(cfg, cred);
        ExternalProcessGenerator generator(gen_cmd, co);
        std::unique_ptr<ExternalProcessJudge> judge;
        if (!judge_cmd.empty()) judge = std::make_unique<ExternalProcessJudge>(judge_cmd, co);
        Evaluator evaluator(judge.get());

        Request request(rf.request_text, rf.variables, ceiling, rf.context);
        WorkflowOptions wo;
        wo.run_id = hdr.run_id;
        wo.sink = &sink;
        Workflow wf(request, generator, executor, evaluator, wo);

        std::cerr << "[codeloop] run " << hdr.run_id << " (max " << ceiling << " attempts), log " << log_path << "\n";
        WorkflowResult result = wf.run(&cancel);

        for (const auto& a : result.attempts) print_attempt(a);
        if (!result.success) {
            std::cout << "=== exhausted after " << result.attempts.size() << " attempts\n";
            return kExitExhausted;
        }
        const Attempt& last = result.attempts.back();
        print_outputs(last.outputs, last.output_files);
        auto saved = save_generated_code(cfg.state_dir, hdr.run_id, rf.request_text, result.final_code);
        std::cout << "=== succeeded on attempt " << last.index << "; code saved to " << saved.string() << "\n";
        return kExitSuccess;
    } catch (const WorkflowCancelled& e) {
        std::cerr << "[codeloop] " << e.what() << "\n";
        return kExitCancelled;
    } catch (const Error& e) {
        std::cerr << "[codeloop] fatal: " << e.what() << "\n";
        return kExitFatal;
    } catch (const std::exception& e) {
        std::cerr << "[codeloop] fatal: " << e.what() << "\n";
        return kExitFatal;
    }
}
