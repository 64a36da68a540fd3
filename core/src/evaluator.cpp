#include "codeloop/evaluator.h"

#include <sstream>
#include <vector>

namespace codeloop {

namespace {

bool is_word_char(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_' || c == '.';
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// "pkg.SomeError: msg" / "SomeException" at the start of a line.
bool is_exception_line(const std::string& line) {
    size_t i = 0;
    while (i < line.size() && is_word_char(line[i])) i++;
    if (i == 0) return false;
    if (i < line.size() && line[i] != ':') return false;
    std::string head = line.substr(0, i);
    return ends_with(head, "Error") || ends_with(head, "Exception");
}

std::vector<std::string> lines_of(const std::string& text) {
    std::vector<std::string> out;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        out.push_back(line);
    }
    return out;
}

std::string trim_text(const std::string& s, size_t max) {
    if (s.size() <= max) return s;
    return s.substr(0, max) + "...";
}

} // namespace

bool has_exception_trace(const std::string& stderr_text) {
    if (stderr_text.find("Traceback (most recent call last):") != std::string::npos) return true;
    for (const auto& l : lines_of(stderr_text)) {
        if (is_exception_line(l)) return true;
    }
    return false;
}

std::string last_exception_line(const std::string& stderr_text) {
    auto lines = lines_of(stderr_text);
    for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
        if (is_exception_line(*it)) return *it;
    }
    return "";
}

Evaluation Evaluator::evaluate(const std::string& request_text,
                               const std::string& code,
                               const CapturedResult& result) const {
    Evaluation ev;
    std::ostringstream a;

    if (result.timed_out) {
        ev.failure = FailureKind::TIMED_OUT;
        a << "Execution timed out after " << result.duration_ms << " ms; the sandbox was terminated.";
    } else if (result.exit_status != 0 || has_exception_trace(result.stderr_text)) {
        const bool raised = !result.exception_type.empty() || has_exception_trace(result.stderr_text);
        ev.failure = raised ? FailureKind::RAISED : FailureKind::NONZERO_EXIT;
        a << "Execution failed (" << failure_kind_name(ev.failure)
          << ", exit status " << result.exit_status << ").";
        if (!result.exception_type.empty()) {
            a << " " << result.exception_type;
            if (!result.exception_message.empty()) a << ": " << trim_text(result.exception_message, 400);
        } else {
            std::string last = last_exception_line(result.stderr_text);
            if (!last.empty()) a << " " << trim_text(last, 400);
        }
    } else if (result.exited_without_summary) {
        ev.failure = FailureKind::NONZERO_EXIT;
        a << "Execution failed (" << failure_kind_name(ev.failure)
          << ", exit status 0). The process exited without a result summary;"
          << " do not call os._exit() or end the interpreter from the generated code.";
    } else {
        ev.success = true;
        a << "Execution succeeded (exit status 0).";
        if (!result.declared_outputs.empty()) {
            a << " Declared outputs:";
            for (const auto& kv : result.declared_outputs) a << " " << kv.first;
            a << ".";
        }
        if (!result.output_files.empty()) a << " Output files: " << result.output_files.size() << ".";
    }
    if (result.mount_write_violation) {
        a << " The code tried to write to the read-only input mount; write under /outputs instead.";
    }

    if (ev.success && judge_) {
        try {
            JudgeVerdict v = judge_->judge(request_text, code, result);
            ev.judge_satisfied = v.satisfied;
            a << " Judge: " << (v.satisfied ? "satisfied" : "not satisfied");
            if (!v.analysis.empty()) a << ". " << v.analysis;
        } catch (const std::exception& e) {
            a << " Judge unavailable: " << e.what();
        }
    }

    ev.analysis = a.str();
    return ev;
}

} // namespace codeloop
