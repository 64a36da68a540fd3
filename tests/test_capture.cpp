#include "test_common.h"
#include "fake_runtime.h"

#include "codeloop/capture.h"
#include "codeloop/errors.h"

using namespace codeloop;

static RawExecutionRecord record(int exit_status) {
    RawExecutionRecord r;
    r.instance_name = "codeloop-t-a1";
    r.exit_status = exit_status;
    r.stdout_text = "out\n";
    r.stderr_text = "";
    r.duration_ms = 12;
    return r;
}

template <typename F>
static bool throws_capture_failed(F f) {
    try {
        f();
    } catch (const CaptureFailed&) {
        return true;
    }
    return false;
}

int main() {
    auto root = make_test_dir("capture");

    // Test 1: full capture of summary, declared outputs and files
    {
        auto out = root / "ok";
        write_all(out / "vars" / "total.json", "{\"kind\":\"value\",\"name\":\"total\",\"value\":42}");
        write_all(out / "vars" / ".total.tmp", "garbage");
        write_all(out / "plots" / "chart.png", std::string("\x89PNG\0data", 9));
        write_all(out / "report.txt", "done");
        fake_write_summary(out, "ok", 0, "", "", {"total"});

        CapturedResult r = capture_result(record(0), out);
        expect_true(r.summary_present, "summary read");
        expect_eq_str(r.stdout_text, "out\n", "stdout copied");
        expect_eq_ll((long long)r.declared_outputs.size(), 1, "one declared output");
        expect_true(r.declared_outputs.at("total") == Value::integer(42), "declared value decoded");
        expect_eq_ll((long long)r.output_files.size(), 2, "files outside vars/ and the summary");
        expect_eq_str(r.output_files[0].path, "plots/chart.png", "sorted relative paths");
        expect_eq_ll((long long)r.output_files[0].bytes.size(), 9, "binary bytes kept");
        expect_eq_str(r.output_files[1].bytes, "done", "text file bytes");
        expect_eq_ll(r.duration_ms, 12, "duration carried");
    }

    // Test 2: printed nothing is not the same as capture failure
    {
        auto out = root / "silent";
        fake_write_summary(out, "ok", 0, "", "", {});
        RawExecutionRecord rec = record(0);
        rec.stdout_text.clear();
        CapturedResult r = capture_result(rec, out);
        expect_true(r.stdout_text.empty() && r.summary_present, "empty output with a summary is fine");
    }

    // Test 3: exit 0 without a summary is flagged; a bootstrap that could not
    // write the summary makes the capture untrustworthy
    {
        auto out = root / "nosummary";
        std::filesystem::create_directories(out);
        CapturedResult r = capture_result(record(0), out);
        expect_true(!r.summary_present, "no summary");
        expect_true(r.exited_without_summary, "exit 0 without a summary flagged");
        expect_eq_ll(r.exit_status, 0, "exit status kept");

        RawExecutionRecord rec = record(0);
        rec.stderr_text = std::string(kSummaryWriteFailed) + ": [Errno 28] No space left on device\n";
        expect_true(throws_capture_failed([&] { (void)capture_result(rec, out); }), "unwritable summary on exit 0");
    }

    // Test 4: non-zero exit without a summary is an ordinary failed run
    {
        auto out = root / "crash";
        std::filesystem::create_directories(out);
        RawExecutionRecord rec = record(137);
        rec.stderr_text = "Killed\n";
        CapturedResult r = capture_result(rec, out);
        expect_true(!r.summary_present, "no summary");
        expect_eq_ll(r.exit_status, 137, "exit carried");
    }

    // Test 5: corrupt summary, pipe failure and a listed but missing output
    {
        auto out = root / "corrupt";
        write_all(out / kResultFile, "[1,2");
        expect_true(throws_capture_failed([&] { (void)capture_result(record(0), out); }), "corrupt summary");

        RawExecutionRecord rec = record(0);
        rec.io_error = true;
        rec.io_error_detail = "read failed: EIO";
        expect_true(throws_capture_failed([&] { (void)capture_result(rec, root / "ok"); }), "pipe read failure");

        auto out2 = root / "listed";
        fake_write_summary(out2, "ok", 0, "", "", {"ghost"});
        expect_true(throws_capture_failed([&] { (void)capture_result(record(0), out2); }), "listed output missing");
    }

    // Test 6: timed-out runs skip the output mount
    {
        auto out = root / "timeout";
        write_all(out / kResultFile, "not json at all");
        RawExecutionRecord rec = record(137);
        rec.timed_out = true;
        CapturedResult r = capture_result(rec, out);
        expect_true(r.timed_out, "timed out flag");
        expect_true(!r.summary_present && r.output_files.empty(), "partial output ignored");
    }

    // Test 7: exception details and mount write violations
    {
        auto out = root / "raised";
        fake_write_summary(out, "raised", 1, "OSError", "[Errno 30] Read-only file system: '/inputs/x'", {});
        RawExecutionRecord rec = record(1);
        rec.stderr_text = "Traceback (most recent call last):\nOSError: [Errno 30] Read-only file system: '/inputs/x'\n";
        CapturedResult r = capture_result(rec, out);
        expect_eq_str(r.exception_type, "OSError", "exception type from summary");
        expect_true(r.mount_write_violation, "read-only mount write detected");

        expect_true(detect_mount_write_violation("PermissionError: [Errno 13] Permission denied: '/inputs/a.csv'"),
                    "permission error on the input mount");
        expect_true(!detect_mount_write_violation("PermissionError: [Errno 13] Permission denied: '/etc/shadow'"),
                    "permission error elsewhere is not a mount violation");
    }

    // Test 8: json files the generated code writes under vars/ are plain output files
    {
        auto out = root / "userjson";
        write_all(out / "vars" / "total.json", "{\"kind\":\"value\",\"name\":\"total\",\"value\":3}");
        write_all(out / "vars" / "data.json", "[1, 2]");
        fake_write_summary(out, "ok", 0, "", "", {"total"});

        CapturedResult r = capture_result(record(0), out);
        expect_eq_ll((long long)r.declared_outputs.size(), 1, "only the listed output is declared");
        expect_true(r.declared_outputs.at("total") == Value::integer(3), "listed output decoded");
        expect_eq_ll((long long)r.output_files.size(), 1, "user json kept as a file");
        expect_eq_str(r.output_files[0].path, "vars/data.json", "user json path");
        expect_eq_str(r.output_files[0].bytes, "[1, 2]", "user json bytes");
    }

    std::filesystem::remove_all(root);
    std::cerr << "test_capture: ALL PASSED" << std::endl;
    return 0;
}
