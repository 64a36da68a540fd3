#include "codeloop/generator.h"
#include "codeloop/errors.h"
#include "codeloop/ids.h"
#include "codeloop/json_util.h"

#include <json-c/json.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace codeloop {

namespace {

std::string trim_ws(std::string s) {
    while (!s.empty() && (s.back()=='\n' || s.back()=='\r' || s.back()==' ' || s.back()=='\t')) s.pop_back();
    size_t i=0;
    while (i<s.size() && (s[i]=='\n' || s[i]=='\r' || s[i]==' ' || s[i]=='\t')) i++;
    if (i) s.erase(0,i);
    return s;
}

std::string lower_ascii(std::string s) {
    for (char& c : s) {
        if (c >= 'A' && c <= 'Z') c = (char)(c - 'A' + 'a');
    }
    return s;
}

json_object* feedback_json(const Feedback& f) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "attempt_index", json_object_new_int(f.attempt_index));
    json_object_object_add(o, "code", json_util::new_string(f.code));
    json_object_object_add(o, "stdout", json_util::new_string(f.stdout_text));
    json_object_object_add(o, "stderr", json_util::new_string(f.stderr_text));
    json_object_object_add(o, "analysis", json_util::new_string(f.analysis));
    json_object_object_add(o, "failure", json_object_new_string(failure_kind_name(f.failure)));
    return o;
}

std::vector<std::string> checked_argv(const std::string& cmd, const ExternalCommandOptions& opts,
                                      const char* what) {
    std::vector<std::string> argv = split_argv_quoted(cmd);
    if (argv.empty()) throw GenerationFailed(std::string(what) + " command is empty or badly quoted");
    if (!opts.allow_unsafe) {
        std::string exe_base = lower_ascii(std::filesystem::path(argv[0]).filename().string());
        bool ok = false;
        for (const auto& a : opts.allowed_exe) {
            if (exe_base == lower_ascii(a)) { ok = true; break; }
        }
        if (!ok) throw GenerationFailed(std::string(what) + " executable not allowed: " + exe_base);
    }
    return argv;
}

// Payload goes through a temp file; argv stays small whatever the request holds.
std::string run_external(const std::vector<std::string>& argv, const std::string& payload,
                         const ExternalCommandOptions& opts, const char* what) {
    std::filesystem::path payload_path;
    try {
        payload_path = std::filesystem::temp_directory_path() /
                       ("codeloop_payload_" + std::to_string((uint64_t)secure_rand32()) + ".json");
    } catch (const std::exception& e) {
        throw GenerationFailed(std::string("cannot place ") + what + " payload: " + e.what());
    }
    {
        std::ofstream f(payload_path, std::ios::binary);
        if (!f) throw GenerationFailed(std::string("cannot write ") + what + " payload " + payload_path.string());
        f.write(payload.data(), (std::streamsize)payload.size());
    }

    std::vector<std::string> av = argv;
    av.push_back(payload_path.string());

    ProcLimits lim;
    lim.timeout_ms = opts.timeout_ms;
    lim.stdout_max_bytes = opts.stdout_max_bytes;
    lim.rlimit_cpu_sec = 0;
    lim.rlimit_as_mb = 0;
    lim.rlimit_fsize_mb = 0;
    lim.rlimit_nofile = 0;
    lim.rlimit_nproc = 0;
    if (!opts.api_key.empty()) lim.env_set.push_back("CODELOOP_API_KEY=" + opts.api_key);

    ProcResult pr;
    bool started = proc_run_capture_split(av, opts.cwd, lim, nullptr, &pr);

    std::error_code ec;
    std::filesystem::remove(payload_path, ec);

    if (!started) {
        throw GenerationFailed(std::string(what) + " not started: " + pr.error);
    }
    if (pr.timed_out) {
        throw GenerationFailed(std::string(what) + " timed out after " + std::to_string(opts.timeout_ms) + " ms");
    }
    if (pr.exit_code != 0) {
        std::string detail = trim_ws(pr.error_output);
        throw GenerationFailed(std::string(what) + " exit_code=" + std::to_string(pr.exit_code) +
                               (detail.empty() ? "" : ": " + detail));
    }
    if (pr.output_truncated) {
        throw GenerationFailed(std::string(what) + " output exceeded " + std::to_string(opts.stdout_max_bytes) + " bytes");
    }
    return pr.output;
}

} // namespace

std::string extract_code(const std::string& answer) {
    size_t open = answer.find("```");
    if (open != std::string::npos) {
        size_t eol = answer.find('\n', open);
        if (eol != std::string::npos) {
            std::string lang = lower_ascii(trim_ws(answer.substr(open + 3, eol - open - 3)));
            if (lang.empty() || lang == "python" || lang == "py" || lang == "python3") {
                size_t close = answer.find("```", eol + 1);
                std::string body = answer.substr(eol + 1, close == std::string::npos ? std::string::npos : close - eol - 1);
                return trim_ws(body) + "\n";
            }
        }
    }
    std::string t = trim_ws(answer);
    return t.empty() ? t : t + "\n";
}

std::string generation_payload(const GenerationRequest& req) {
    json_util::Doc root(json_object_new_object());
    json_object_object_add(root.root, "mode", json_object_new_string("generate"));
    json_object_object_add(root.root, "request_text", json_util::new_string(req.request_text));
    json_object_object_add(root.root, "data_description", json_util::new_string(req.data_description));
    json_object* ctx = json_object_new_array();
    for (const auto& c : req.context_notes) json_object_array_add(ctx, json_util::new_string(c));
    json_object_object_add(root.root, "context", ctx);
    json_object_object_add(root.root, "attempt_index", json_object_new_int(req.attempt_index));
    json_object_object_add(root.root, "previous", req.previous ? feedback_json(*req.previous) : nullptr);
    json_object* hist = json_object_new_array();
    for (const auto& f : req.history) json_object_array_add(hist, feedback_json(f));
    json_object_object_add(root.root, "history", hist);
    return json_util::to_string_plain(root.root);
}

std::string judge_payload(const std::string& request_text, const std::string& code, const CapturedResult& result) {
    json_util::Doc root(json_object_new_object());
    json_object_object_add(root.root, "mode", json_object_new_string("judge"));
    json_object_object_add(root.root, "request_text", json_util::new_string(request_text));
    json_object_object_add(root.root, "code", json_util::new_string(code));
    json_object_object_add(root.root, "stdout", json_util::new_string(result.stdout_text));
    json_object_object_add(root.root, "stderr", json_util::new_string(result.stderr_text));
    json_object_object_add(root.root, "exit_status", json_object_new_int(result.exit_status));
    json_object* outs = json_object_new_array();
    for (const auto& kv : result.declared_outputs) json_object_array_add(outs, json_util::new_string(kv.first));
    json_object_object_add(root.root, "declared_outputs", outs);
    json_object* files = json_object_new_array();
    for (const auto& f : result.output_files) json_object_array_add(files, json_util::new_string(f.path));
    json_object_object_add(root.root, "output_files", files);
    return json_util::to_string_plain(root.root);
}

ExternalProcessGenerator::ExternalProcessGenerator(std::string cmd, ExternalCommandOptions opts)
    : cmd_(std::move(cmd)), opts_(std::move(opts)) {
    argv_ = checked_argv(cmd_, opts_, "generator");
}

std::string ExternalProcessGenerator::generate(const GenerationRequest& req) {
    std::string answer = run_external(argv_, generation_payload(req), opts_, "generator");
    std::string code = extract_code(answer);
    if (code.empty()) throw GenerationFailed("generator returned no code");
    return code;
}

ExternalProcessJudge::ExternalProcessJudge(std::string cmd, ExternalCommandOptions opts)
    : cmd_(std::move(cmd)), opts_(std::move(opts)) {
    argv_ = checked_argv(cmd_, opts_, "judge");
}

JudgeVerdict ExternalProcessJudge::judge(const std::string& request_text,
                                         const std::string& code,
                                         const CapturedResult& result) {
    std::string answer = trim_ws(run_external(argv_, judge_payload(request_text, code, result), opts_, "judge"));

    JudgeVerdict v;
    json_util::Doc doc = json_util::parse(answer);
    if (doc && json_object_is_type(doc.root, json_type_object)) {
        v.satisfied = json_util::get_bool(doc.root, "satisfied").value_or(false);
        v.analysis = json_util::get_string(doc.root, "analysis").value_or("");
        return v;
    }
    std::istringstream in(answer);
    std::string first;
    in >> first;
    first = lower_ascii(first);
    while (!first.empty() && !(first.back() >= 'a' && first.back() <= 'z')) first.pop_back();
    v.satisfied = (first == "yes" || first == "satisfied");
    v.analysis = answer;
    return v;
}

} // namespace codeloop
