#pragma once
#include "types.h"

#include <fstream>
#include <mutex>
#include <string>
#include <vector>

namespace codeloop {

// Destination for structured workflow events. payload_json is a JSON object.
class IEventSink {
public:
    virtual ~IEventSink() = default;
    virtual void event(int step, const std::string& name, const std::string& payload_json) = 0;
};

// One canonical (sorted-key) JSON object per line.
class JsonlEventSink : public IEventSink {
public:
    // Throws std::runtime_error if `path` cannot be opened for writing.
    JsonlEventSink(const RunHeader& hdr, const std::string& path);
    void event(int step, const std::string& name, const std::string& payload_json) override;
    const std::string& path() const { return path_; }

private:
    RunHeader hdr_;
    std::string path_;
    std::ofstream out_;
    std::mutex mu_;
};

// "[codeloop] <name> <payload>" on stderr.
class StderrEventSink : public IEventSink {
public:
    void event(int step, const std::string& name, const std::string& payload_json) override;

private:
    std::mutex mu_;
};

class NullEventSink : public IEventSink {
public:
    void event(int, const std::string&, const std::string&) override {}
};

// Fans every event out to several sinks (not owned).
class TeeEventSink : public IEventSink {
public:
    explicit TeeEventSink(std::vector<IEventSink*> sinks) : sinks_(std::move(sinks)) {}
    void event(int step, const std::string& name, const std::string& payload_json) override;

private:
    std::vector<IEventSink*> sinks_;
};

// Re-serialize JSON text with sorted object keys.
// Returns the input unchanged if it does not parse.
std::string canonical_json(const std::string& raw);

} // namespace codeloop
