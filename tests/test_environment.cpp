#include "test_common.h"
#include "fake_runtime.h"

#include "codeloop/environment.h"
#include "codeloop/errors.h"
#include "codeloop/workspace.h"

#include <algorithm>

using namespace codeloop;

static ExecutionSpec make_spec(const AttemptWorkspace& ws, const std::string& name, const CancelToken* cancel = nullptr) {
    ExecutionSpec s;
    s.instance_name = name;
    s.input_dir = ws.input_dir();
    s.output_dir = ws.output_dir();
    s.timeout_ms = 1000;
    s.cancel = cancel;
    return s;
}

static bool same_states(const std::vector<EnvState>& got, const std::vector<EnvState>& want) {
    return got == want;
}

int main() {
    auto root = make_test_dir("env");

    // Test 1: workspace layout and cleanup
    {
        std::filesystem::path kept;
        {
            AttemptWorkspace ws(root, "run1", 1);
            kept = ws.root();
            expect_true(std::filesystem::is_directory(ws.input_dir() / "vars"), "inputs/vars created");
            expect_true(std::filesystem::is_directory(ws.output_dir() / "vars"), "outputs/vars created");
            expect_true(contains(kept.filename().string(), "codeloop-run1-a1-"), "workspace name carries run and attempt");
        }
        expect_true(!std::filesystem::exists(kept), "workspace removed on scope exit");
    }

    // Test 2: normal lifecycle, one instance, torn down once
    {
        FakeContainerRuntime rt;
        rt.behavior = [](const ContainerSpec& spec, const CancelToken*, ProcResult* res) {
            res->output = "hello\n";
            fake_write_summary(spec.output_dir, "ok", 0, "", "", {});
        };
        EnvironmentOptions opts;
        opts.image = "img:test";
        ContainerEnvironment env(rt, opts);
        AttemptWorkspace ws(root, "run2", 1);
        RawExecutionRecord rec = env.run(make_spec(ws, "codeloop-run2-a1"));

        expect_eq_str(rec.stdout_text, "hello\n", "stdout forwarded");
        expect_eq_ll(rec.exit_status, 0, "exit 0");
        expect_true(rec.end_state == EnvState::COMPLETED, "COMPLETED");
        expect_true(same_states(env.history(), {EnvState::CREATED, EnvState::RUNNING, EnvState::COMPLETED,
                                                EnvState::DESTROYED}), "lifecycle order");
        expect_true(env.state() == EnvState::DESTROYED, "destroyed after run");
        expect_eq_ll(rt.removes, 1, "removed exactly once");
        expect_eq_ll(rt.kills, 0, "no kill for a finished container");
        expect_eq_ll(rt.live, 0, "nothing left alive");

        const ContainerSpec& cs = rt.specs.begin()->second;
        expect_eq_str(cs.image, "img:test", "image from options");
        expect_eq_str(cs.network, "none", "no network by default");
        expect_eq_ll((long long)cs.command.size(), 3, "python -u prelude");
        expect_eq_str(cs.command[2], "/inputs/prelude.py", "bootstrap entry point");
    }

    // Test 3: timeout is recorded, container killed then removed
    {
        FakeContainerRuntime rt;
        rt.behavior = [](const ContainerSpec&, const CancelToken*, ProcResult* res) {
            res->timed_out = true;
            res->exit_code = 137;
            res->output = "partial";
        };
        ContainerEnvironment env(rt, EnvironmentOptions{});
        AttemptWorkspace ws(root, "run3", 1);
        RawExecutionRecord rec = env.run(make_spec(ws, "codeloop-run3-a1"));
        expect_true(rec.timed_out, "timed out");
        expect_true(rec.end_state == EnvState::TIMED_OUT, "TIMED_OUT state");
        expect_true(same_states(env.history(), {EnvState::CREATED, EnvState::RUNNING, EnvState::TIMED_OUT,
                                                EnvState::DESTROYED}), "timeout lifecycle");
        expect_eq_ll(rt.kills, 1, "killed once");
        expect_eq_ll(rt.removes, 1, "removed once");
        auto k = std::find(rt.calls.begin(), rt.calls.end(), "kill id-codeloop-run3-a1");
        auto r = std::find(rt.calls.begin(), rt.calls.end(), "remove id-codeloop-run3-a1");
        expect_true(k != rt.calls.end() && r != rt.calls.end() && k < r, "kill precedes remove");
    }

    // Test 4: create failure is fatal and leaves nothing to remove
    {
        FakeContainerRuntime rt;
        rt.fail_create = true;
        ContainerEnvironment env(rt, EnvironmentOptions{});
        AttemptWorkspace ws(root, "run4", 1);
        bool threw = false;
        try {
            (void)env.run(make_spec(ws, "codeloop-run4-a1"));
        } catch (const EnvironmentCreateFailed& e) {
            threw = contains(e.what(), "Docker daemon");
        }
        expect_true(threw, "EnvironmentCreateFailed with the runtime's message");
        expect_eq_ll(rt.removes, 0, "no remove without a container");
    }

    // Test 5: attach that never starts still tears the container down
    {
        FakeContainerRuntime rt;
        rt.fail_start = true;
        ContainerEnvironment env(rt, EnvironmentOptions{});
        AttemptWorkspace ws(root, "run5", 1);
        bool threw = false;
        try {
            (void)env.run(make_spec(ws, "codeloop-run5-a1"));
        } catch (const EnvironmentCreateFailed&) {
            threw = true;
        }
        expect_true(threw, "start failure is EnvironmentCreateFailed");
        expect_eq_ll(rt.removes, 1, "removed on the exception path");
        expect_eq_ll(rt.live, 0, "nothing alive");
        expect_true(env.state() == EnvState::DESTROYED, "destroyed after throw");
    }

    // Test 6: daemon exit 125 without a summary is an infrastructure failure
    {
        FakeContainerRuntime rt;
        rt.behavior = [](const ContainerSpec&, const CancelToken*, ProcResult* res) {
            res->exit_code = 125;
            res->error_output = "Error response from daemon: OCI runtime create failed";
        };
        ContainerEnvironment env(rt, EnvironmentOptions{});
        AttemptWorkspace ws(root, "run6", 1);
        bool threw = false;
        try {
            (void)env.run(make_spec(ws, "codeloop-run6-a1"));
        } catch (const EnvironmentCreateFailed& e) {
            threw = contains(e.what(), "OCI runtime");
        }
        expect_true(threw, "exit 125 is EnvironmentCreateFailed");
        expect_eq_ll(rt.removes, 1, "removed after 125");
    }

    // Test 7: cancellation while running
    {
        FakeContainerRuntime rt;
        rt.behavior = [](const ContainerSpec&, const CancelToken*, ProcResult* res) {
            res->cancelled = true;
            res->exit_code = 137;
        };
        ContainerEnvironment env(rt, EnvironmentOptions{});
        AttemptWorkspace ws(root, "run7", 1);
        bool threw = false;
        try {
            (void)env.run(make_spec(ws, "codeloop-run7-a1"));
        } catch (const WorkflowCancelled&) {
            threw = true;
        }
        expect_true(threw, "WorkflowCancelled");
        expect_eq_ll(rt.kills, 1, "running container killed on cancel");
        expect_eq_ll(rt.removes, 1, "removed once on cancel");
    }

    // Test 8: cancellation before create never touches the runtime
    {
        FakeContainerRuntime rt;
        ContainerEnvironment env(rt, EnvironmentOptions{});
        AttemptWorkspace ws(root, "run8", 1);
        CancelToken cancel;
        cancel.cancel();
        bool threw = false;
        try {
            (void)env.run(make_spec(ws, "codeloop-run8-a1", &cancel));
        } catch (const WorkflowCancelled&) {
            threw = true;
        }
        expect_true(threw, "cancelled before create");
        expect_eq_ll(rt.creates, 0, "no container created");
    }

    // Test 9: image is ensured once per environment; failure is fatal
    {
        FakeContainerRuntime rt;
        rt.behavior = emulate_bootstrap;
        EnvironmentOptions opts;
        opts.auto_build_image = true;
        ContainerEnvironment env(rt, opts);
        for (int i = 1; i <= 2; i++) {
            AttemptWorkspace ws(root, "run9", i);
            write_all(ws.input_dir() / kCodeFile, "print ok\n");
            (void)env.run(make_spec(ws, "codeloop-run9-a" + std::to_string(i)));
        }
        expect_eq_ll(rt.ensure_calls, 1, "ensure_image once");
        expect_eq_ll(rt.max_live, 1, "never two instances alive");

        FakeContainerRuntime bad;
        bad.ensure_error = "failed to build sandbox image";
        ContainerEnvironment env2(bad, opts);
        AttemptWorkspace ws(root, "run9b", 1);
        bool threw = false;
        try {
            (void)env2.run(make_spec(ws, "codeloop-run9b-a1"));
        } catch (const EnvironmentCreateFailed&) {
            threw = true;
        }
        expect_true(threw, "image failure is EnvironmentCreateFailed");
        expect_eq_ll(bad.creates, 0, "no container without an image");
    }

    // Test 10: a failed removal is reported, not thrown
    {
        FakeContainerRuntime rt;
        rt.fail_remove = true;
        rt.behavior = emulate_bootstrap;
        ContainerEnvironment env(rt, EnvironmentOptions{});
        AttemptWorkspace ws(root, "run10", 1);
        write_all(ws.input_dir() / kCodeFile, "print ok\n");
        RawExecutionRecord rec = env.run(make_spec(ws, "codeloop-run10-a1"));
        expect_true(contains(rec.teardown_error, "busy"), "teardown error surfaced");
        expect_eq_ll(rt.removes, 1, "removal attempted once");
    }

    // Test 11: docker create argv
    {
        DockerCli cli("docker");
        ContainerSpec cs;
        cs.name = "codeloop-x-a1";
        cs.image = "codeloop-runner:py313";
        cs.input_dir = "/host/in";
        cs.output_dir = "/host/out";
        cs.command = {"python", "-u", "/inputs/prelude.py"};
        cs.memory_mb = 512;
        cs.cpus = 1.5;
        cs.pids_limit = 64;
        cs.env = {"MPLBACKEND=Agg"};
        auto av = cli.create_argv(cs);
        auto has_pair = [&](const std::string& a, const std::string& b) {
            for (size_t i = 0; i + 1 < av.size(); i++) {
                if (av[i] == a && av[i + 1] == b) return true;
            }
            return false;
        };
        expect_eq_str(av.front(), "create", "create subcommand");
        expect_true(has_pair("-v", "/host/in:/inputs:ro"), "input mount read-only");
        expect_true(has_pair("-v", "/host/out:/outputs:rw"), "output mount read-write");
        expect_true(has_pair("--network", "none"), "network none");
        expect_true(has_pair("--memory", "512m"), "memory limit");
        expect_true(has_pair("--cpus", "1.50"), "cpu limit");
        expect_true(has_pair("--pids-limit", "64"), "pids limit");
        expect_true(has_pair("-e", "MPLBACKEND=Agg"), "env passed");
        expect_true(has_pair("codeloop-runner:py313", "python"), "image then command");
        expect_eq_str(av.back(), "/inputs/prelude.py", "bootstrap last");
    }

    std::filesystem::remove_all(root);
    std::cerr << "test_environment: ALL PASSED" << std::endl;
    return 0;
}
