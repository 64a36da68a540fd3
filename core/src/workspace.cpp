#include "codeloop/workspace.h"
#include "codeloop/errors.h"

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <system_error>
#include <vector>

#include <stdlib.h>

namespace codeloop {

TempDir::TempDir(const std::filesystem::path& parent, const std::string& prefix) {
    std::string tmpl = (parent / (prefix + "XXXXXX")).string();
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');
    if (!mkdtemp(buf.data())) {
        throw std::runtime_error("mkdtemp(" + tmpl + ") failed: " + std::strerror(errno));
    }
    path_ = std::filesystem::path(buf.data());
}

TempDir::~TempDir() {
    std::string ignored;
    (void)remove(&ignored);
}

bool TempDir::remove(std::string* err) {
    if (removed_) return true;
    removed_ = true;
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    if (ec) {
        if (err) *err = "cannot remove " + path_.string() + ": " + ec.message();
        return false;
    }
    return true;
}

TempDir AttemptWorkspace::make_dir(const std::filesystem::path& root, const std::string& run_id, int attempt) {
    std::error_code ec;
    std::filesystem::create_directories(root, ec);
    if (ec) throw EnvironmentCreateFailed("cannot create work root " + root.string() + ": " + ec.message());
    try {
        return TempDir(root, "codeloop-" + run_id + "-a" + std::to_string(attempt) + "-");
    } catch (const std::runtime_error& e) {
        throw EnvironmentCreateFailed(e.what());
    }
}

AttemptWorkspace::AttemptWorkspace(const std::filesystem::path& root, const std::string& run_id, int attempt)
    : dir_(make_dir(root, run_id, attempt)) {
    for (const auto& d : {input_dir() / "vars", output_dir() / "vars"}) {
        std::error_code ec;
        std::filesystem::create_directories(d, ec);
        if (ec) throw EnvironmentCreateFailed("cannot create " + d.string() + ": " + ec.message());
    }
    // the sandbox user is not the host user; it must be able to write outputs
    std::error_code ec;
    std::filesystem::permissions(output_dir(), std::filesystem::perms::all, ec);
    if (!ec) std::filesystem::permissions(output_dir() / "vars", std::filesystem::perms::all, ec);
    if (!ec) std::filesystem::permissions(dir_.path(), std::filesystem::perms::owner_all |
                                          std::filesystem::perms::group_exec | std::filesystem::perms::others_exec, ec);
    if (!ec) std::filesystem::permissions(input_dir(), std::filesystem::perms::owner_all |
                                          std::filesystem::perms::group_read | std::filesystem::perms::group_exec |
                                          std::filesystem::perms::others_read | std::filesystem::perms::others_exec, ec);
    if (ec) throw EnvironmentCreateFailed("cannot set workspace permissions: " + ec.message());
}

} // namespace codeloop
