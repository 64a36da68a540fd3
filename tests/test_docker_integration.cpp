// Runs generated code in real containers. Needs a docker daemon and
// CODELOOP_DOCKER_TESTS=1; otherwise it reports SKIPPED and passes.

#include "test_common.h"

#include "codeloop/container.h"
#include "codeloop/environment.h"
#include "codeloop/errors.h"
#include "codeloop/evaluator.h"
#include "codeloop/executor.h"
#include "codeloop/generator.h"
#include "codeloop/workflow.h"

#include <algorithm>

using namespace codeloop;

struct FixedGenerator : public ICodeGenerator {
    std::vector<std::string> codes;
    size_t calls{0};
    std::string generate(const GenerationRequest&) override {
        return codes[std::min(calls++, codes.size() - 1)];
    }
};

int main() {
    const char* gate = std::getenv("CODELOOP_DOCKER_TESTS");
    if (!gate || std::string(gate) != "1") {
        std::cerr << "test_docker_integration: SKIPPED (set CODELOOP_DOCKER_TESTS=1)" << std::endl;
        return 0;
    }
    const char* bin = std::getenv("CODELOOP_RUNTIME");
    DockerCli docker(bin && *bin ? bin : "docker");
    if (!docker.available()) {
        std::cerr << "test_docker_integration: SKIPPED (no container runtime)" << std::endl;
        return 0;
    }

    auto root = make_test_dir("docker");
    EnvironmentOptions eo;
    eo.auto_build_image = true;
    ContainerEnvironment env(docker, eo);
    AttemptExecutor executor(env, ExecutorOptions{root, 60000, false});
    Evaluator evaluator;

    // Test 1: variables in, declared outputs and files out
    {
        FixedGenerator gen;
        gen.codes = {
            "total = sum(prices) * factor\n"
            "print('total', total)\n"
            "emit('total', total)\n"
            "open('/outputs/report.txt', 'w').write('ok')\n",
        };
        VariableMap vars{{"prices", Value::list({Value::integer(2), Value::integer(3)})},
                         {"factor", Value::integer(10)}};
        Workflow wf(Request("sum the prices", vars, 1), gen, executor, evaluator);
        WorkflowResult r = wf.run();
        expect_true(r.success, "workflow succeeded");
        expect_true(contains(r.attempts[0].stdout_text, "total 50"), "stdout captured: " + r.attempts[0].stdout_text);
        expect_true(r.final_outputs.count("total") && r.final_outputs.at("total") == Value::integer(50),
                    "declared output returned");
        expect_eq_ll((long long)r.attempts[0].output_files.size(), 1, "one output file");
        expect_eq_str(r.attempts[0].output_files[0].bytes, "ok", "output file content");
    }

    // Test 2: the input mount is read-only, and a failure feeds the retry
    {
        FixedGenerator gen;
        gen.codes = {"open('/inputs/hack.txt', 'w').write('x')\n", "print('recovered')\n"};
        Workflow wf(Request("q", {}, 2), gen, executor, evaluator);
        WorkflowResult r = wf.run();
        expect_true(r.attempts[0].mount_write_violation, "read-only mount enforced");
        expect_true(r.attempts[0].failure == FailureKind::RAISED, "write raised");
        expect_true(r.success, "second attempt succeeded");
    }

    // Test 3: a runaway attempt is stopped at its deadline
    {
        AttemptExecutor quick(env, ExecutorOptions{root, 3000, false});
        FixedGenerator gen;
        gen.codes = {"import time\ntime.sleep(60)\n"};
        Workflow wf(Request("q", {}, 1), gen, quick, evaluator);
        WorkflowResult r = wf.run();
        expect_true(!r.success, "not successful");
        expect_true(r.attempts[0].failure == FailureKind::TIMED_OUT, "TIMED_OUT");
        expect_true(r.attempts[0].duration_ms < 30000, "stopped near the deadline");
    }

    expect_true(std::filesystem::is_empty(root), "no workspace left behind");
    std::filesystem::remove_all(root);
    std::cerr << "test_docker_integration: ALL PASSED" << std::endl;
    return 0;
}
