#pragma once

// Outcome Evaluator: baseline mechanical verdict plus optional advisory judge.

#include "types.h"

#include <string>

namespace codeloop {

struct JudgeVerdict {
    bool satisfied{false};
    std::string analysis;
};

// Qualitative "does this output answer the request" check. Advisory only.
class IJudge {
public:
    virtual ~IJudge() = default;
    // May throw; the evaluator records the failure and moves on.
    virtual JudgeVerdict judge(const std::string& request_text,
                               const std::string& code,
                               const CapturedResult& result) = 0;
};

class Evaluator {
public:
    explicit Evaluator(IJudge* judge = nullptr) : judge_(judge) {}

    // Never mutates `result`. Failure if the run timed out, exited nonzero,
    // or stderr carries an exception trace. The judge is consulted only
    // when that baseline verdict is success and never changes it.
    Evaluation evaluate(const std::string& request_text,
                        const std::string& code,
                        const CapturedResult& result) const;

private:
    IJudge* judge_;
};

// "Traceback (most recent call last):" or a line like "ValueError: ...".
bool has_exception_trace(const std::string& stderr_text);

// Last line of a Python traceback ("KeyError: 'x'"), or "" if none.
std::string last_exception_line(const std::string& stderr_text);

} // namespace codeloop
