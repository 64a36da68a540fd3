#include "cmd_image.h"
#include "runner_utils.h"

#include "codeloop/config.h"
#include "codeloop/container.h"

#include <iostream>

using namespace codeloop;

int cmd_image(int argc, char** argv) {
    bool print_dockerfile = false;
    for (int i = 2; i < argc; i++) {
        std::string a = argv[i];
        if (a == "--dockerfile") { print_dockerfile = true; continue; }
        std::cerr << "usage: codeloop_cli image [--dockerfile]\n";
        return 2;
    }
    if (print_dockerfile) {
        std::cout << runner_dockerfile();
        return 0;
    }

    apply_profile_defaults(detect_profile());
    Config cfg;
    try {
        cfg = Config::from_env();
    } catch (const std::runtime_error& e) {
        std::cerr << "[codeloop] " << e.what() << "\n";
        return 2;
    }

    DockerCli runtime(cfg.runtime);
    if (!runtime.available()) {
        std::cerr << "[codeloop] container runtime '" << cfg.runtime << "' is not available\n";
        return 3;
    }
    std::cerr << "[codeloop] ensuring image " << cfg.image << "\n";
    std::string err = runtime.ensure_image(cfg.image);
    if (!err.empty()) {
        std::cerr << "[codeloop] " << err << "\n";
        return 3;
    }
    std::cout << cfg.image << "\n";
    return 0;
}
