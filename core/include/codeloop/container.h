#pragma once

// Container runtime seam. The environment talks to the runtime only through
// IContainerRuntime so tests can observe the lifecycle without a daemon.

#include "proc.h"
#include "types.h"

#include <string>
#include <vector>

namespace codeloop {

struct ContainerSpec {
    std::string name;        // unique per attempt
    std::string image;
    std::string input_dir;   // host path, mounted read-only at kInputMount
    std::string output_dir;  // host path, mounted read-write at kOutputMount
    std::vector<std::string> command;
    std::string network{"none"};
    size_t memory_mb{1024};
    double cpus{1.0};
    int pids_limit{256};
    std::vector<std::string> env; // "KEY=VALUE"
};

class IContainerRuntime {
public:
    virtual ~IContainerRuntime() = default;

    // Make sure `image` is available locally. Returns empty on success,
    // otherwise a diagnostic.
    virtual std::string ensure_image(const std::string& image) = 0;

    // Create (but do not start) a container. Returns false with a
    // diagnostic in *err when the runtime cannot create it.
    virtual bool create(const ContainerSpec& spec, std::string* id, std::string* err) = 0;

    // Start the container and block until it exits, the deadline passes or
    // `cancel` fires. stdout/stderr of the container land in res->output /
    // res->error_output. Returns false if the attach process never started.
    virtual bool start_attach(const std::string& id, int timeout_ms,
                              const CancelToken* cancel, ProcResult* res) = 0;

    // Best-effort stop of a running container.
    virtual void kill(const std::string& id) = 0;

    // Force-remove the container. Returns false with a diagnostic on failure.
    virtual bool remove(const std::string& id, std::string* err) = 0;
};

// Drives the docker (or podman) command-line client.
class DockerCli : public IContainerRuntime {
public:
    explicit DockerCli(std::string binary = "docker");

    std::string ensure_image(const std::string& image) override;
    bool create(const ContainerSpec& spec, std::string* id, std::string* err) override;
    bool start_attach(const std::string& id, int timeout_ms,
                      const CancelToken* cancel, ProcResult* res) override;
    void kill(const std::string& id) override;
    bool remove(const std::string& id, std::string* err) override;

    // True if the client answers `version`.
    bool available();

    // docker create argv for `spec` (exposed for tests).
    std::vector<std::string> create_argv(const ContainerSpec& spec) const;

private:
    ProcResult control(const std::vector<std::string>& args, int timeout_ms);

    std::string binary_;
    ProcLimits control_lim_;
};

// Dockerfile used when the runner image has to be built locally.
const std::string& runner_dockerfile();

} // namespace codeloop
