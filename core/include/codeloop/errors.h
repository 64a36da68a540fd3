#pragma once
#include <stdexcept>
#include <string>

namespace codeloop {

// Fatal, run-terminating failures. Per-attempt failures (timeouts, raised
// exceptions) never surface as exceptions; they live in the Attempt record.
enum class ErrorKind {
    SERIALIZATION,
    ENVIRONMENT_CREATE,
    CAPTURE,
    GENERATION,
    CANCELLED,
};

const char* error_kind_name(ErrorKind k);

class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& msg)
        : std::runtime_error(std::string(error_kind_name(kind)) + ": " + msg), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

class SerializationError : public Error {
public:
    SerializationError(const std::string& variable, const std::string& reason)
        : Error(ErrorKind::SERIALIZATION, "variable '" + variable + "': " + reason),
          variable_(variable), reason_(reason) {}

    const std::string& variable() const { return variable_; }
    const std::string& reason() const { return reason_; }

private:
    std::string variable_;
    std::string reason_;
};

class EnvironmentCreateFailed : public Error {
public:
    explicit EnvironmentCreateFailed(const std::string& msg)
        : Error(ErrorKind::ENVIRONMENT_CREATE, msg) {}
};

class CaptureFailed : public Error {
public:
    explicit CaptureFailed(const std::string& msg)
        : Error(ErrorKind::CAPTURE, msg) {}
};

class GenerationFailed : public Error {
public:
    explicit GenerationFailed(const std::string& msg)
        : Error(ErrorKind::GENERATION, msg) {}
};

class WorkflowCancelled : public Error {
public:
    explicit WorkflowCancelled(const std::string& msg)
        : Error(ErrorKind::CANCELLED, msg) {}
};

} // namespace codeloop
