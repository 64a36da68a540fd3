#include "cmd_exec.h"
#include "runner_utils.h"

#include "codeloop/config.h"
#include "codeloop/container.h"
#include "codeloop/environment.h"
#include "codeloop/errors.h"
#include "codeloop/evaluator.h"
#include "codeloop/executor.h"
#include "codeloop/ids.h"
#include "codeloop/marshal.h"

#include <cstdlib>
#include <fstream>
#include <iostream>

using namespace codeloop;

// One sandboxed execution of a local file, no generation involved.
int cmd_exec(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "usage: codeloop_cli exec <code.py> [--vars vars.json] [--timeout-ms N] [--out <dir>]\n";
        return 2;
    }
    std::string code_path = argv[2];
    std::string vars_path;
    std::string out_dir;
    int timeout_ms = 0;
    for (int i = 3; i < argc; i++) {
        std::string a = argv[i];
        if (a == "--vars" && i + 1 < argc) { vars_path = argv[++i]; continue; }
        if (a == "--timeout-ms" && i + 1 < argc) { timeout_ms = std::atoi(argv[++i]); continue; }
        if (a == "--out" && i + 1 < argc) { out_dir = argv[++i]; continue; }
        std::cerr << "unknown option: " << a << "\n";
        return 2;
    }

    apply_profile_defaults(detect_profile());
    CancelToken& cancel = install_cancel_signals();
    try {
        Config cfg = Config::from_env();
        std::string code = slurp(code_path);
        VariableMap vars = load_variables_file(vars_path);
        validate_variables(vars);

        DockerCli runtime(cfg.runtime);
        ContainerEnvironment env(runtime, environment_options(cfg));
        ExecutorOptions xo;
        xo.work_root = cfg.work_root;
        xo.timeout_ms = timeout_ms > 0 ? timeout_ms : cfg.exec_timeout_ms;
        StderrEventSink console;
        AttemptExecutor executor(env, xo, &console);

        CapturedResult r = executor.execute(gen_run_id(), 1, code, vars, &cancel);
        Evaluation ev = Evaluator().evaluate("", code, r);

        std::cout << "=== stdout\n" << r.stdout_text;
        std::cout << "=== stderr\n" << r.stderr_text;
        std::cout << "=== exit status " << r.exit_status << (r.timed_out ? " (timed out)" : "") << "\n";
        print_outputs(r.declared_outputs, r.output_files);
        std::cout << ev.analysis << "\n";

        if (!out_dir.empty()) {
            for (const auto& f : r.output_files) {
                auto dst = std::filesystem::path(out_dir) / f.path;
                std::filesystem::create_directories(dst.parent_path());
                std::ofstream o(dst, std::ios::binary | std::ios::trunc);
                o.write(f.bytes.data(), (std::streamsize)f.bytes.size());
                if (!o) {
                    std::cerr << "[codeloop] cannot write " << dst << "\n";
                    return 3;
                }
            }
        }
        return ev.success ? 0 : 1;
    } catch (const WorkflowCancelled& e) {
        std::cerr << "[codeloop] " << e.what() << "\n";
        return 130;
    } catch (const std::exception& e) {
        std::cerr << "[codeloop] fatal: " << e.what() << "\n";
        return 3;
    }
}
