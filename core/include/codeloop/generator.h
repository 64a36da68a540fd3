#pragma once

// Code-generation collaborator seam and its external-process transport.

#include "evaluator.h"
#include "proc.h"
#include "types.h"

#include <optional>
#include <string>
#include <vector>

namespace codeloop {

// What the generator learns about one earlier attempt.
struct Feedback {
    int attempt_index{0};
    std::string code;
    std::string stdout_text;
    std::string stderr_text;
    std::string analysis;
    FailureKind failure{FailureKind::NONE};
};

struct GenerationRequest {
    std::string request_text;
    std::string data_description;
    std::vector<std::string> context_notes;
    int attempt_index{1};
    std::optional<Feedback> previous;   // set for every attempt after the first
    std::vector<Feedback> history;      // all earlier attempts, oldest first
};

class ICodeGenerator {
public:
    virtual ~ICodeGenerator() = default;
    // Returns code text. Throws GenerationFailed.
    virtual std::string generate(const GenerationRequest& req) = 0;
};

// Body of the first ```python / ```py / ``` fence, else the trimmed text.
std::string extract_code(const std::string& answer);

struct ExternalCommandOptions {
    int timeout_ms{120000};
    std::vector<std::string> allowed_exe{"python3", "python", "bash", "sh", "node"};
    bool allow_unsafe{false};          // skip the executable allowlist
    std::string api_key;               // exported to the child as CODELOOP_API_KEY
    std::string cwd;
    size_t stdout_max_bytes{4 * 1024 * 1024};
};

// Runs `cmd <payload.json>`; the child's stdout is the answer.
class ExternalProcessGenerator : public ICodeGenerator {
public:
    ExternalProcessGenerator(std::string cmd, ExternalCommandOptions opts);
    std::string generate(const GenerationRequest& req) override;

private:
    std::vector<std::string> argv_;
    std::string cmd_;
    ExternalCommandOptions opts_;
};

// Same transport, payload "mode":"judge". The answer is either
// {"satisfied":bool,"analysis":"..."} or free text, which counts as
// satisfied only when its first word is "yes" or "satisfied".
class ExternalProcessJudge : public IJudge {
public:
    ExternalProcessJudge(std::string cmd, ExternalCommandOptions opts);
    JudgeVerdict judge(const std::string& request_text,
                       const std::string& code,
                       const CapturedResult& result) override;

private:
    std::vector<std::string> argv_;
    std::string cmd_;
    ExternalCommandOptions opts_;
};

// Payload documents (exposed for tests and for generator authors).
std::string generation_payload(const GenerationRequest& req);
std::string judge_payload(const std::string& request_text, const std::string& code, const CapturedResult& result);

} // namespace codeloop
