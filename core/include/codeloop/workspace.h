#pragma once

#include <filesystem>
#include <string>

namespace codeloop {

// Uniquely named directory removed recursively on destruction.
class TempDir {
public:
    // Throws std::runtime_error if the directory cannot be created.
    TempDir(const std::filesystem::path& parent, const std::string& prefix);
    ~TempDir();

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

    // Remove now; later calls (and the destructor) are no-ops.
    // Returns false with a diagnostic when something could not be removed.
    bool remove(std::string* err);

private:
    std::filesystem::path path_;
    bool removed_{false};
};

// Host side of one attempt's mounts:
//   <root>/codeloop-<run_id>-a<N>-XXXXXX/{inputs,inputs/vars,outputs,outputs/vars}
class AttemptWorkspace {
public:
    // Throws EnvironmentCreateFailed when the directories cannot be created.
    AttemptWorkspace(const std::filesystem::path& root, const std::string& run_id, int attempt);

    const std::filesystem::path& root() const { return dir_.path(); }
    std::filesystem::path input_dir() const { return dir_.path() / "inputs"; }
    std::filesystem::path output_dir() const { return dir_.path() / "outputs"; }

    bool release(std::string* err) { return dir_.remove(err); }

private:
    static TempDir make_dir(const std::filesystem::path& root, const std::string& run_id, int attempt);

    TempDir dir_;
};

} // namespace codeloop
