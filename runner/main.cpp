#include "cmd_exec.h"
#include "cmd_image.h"
#include "cmd_profile.h"
#include "cmd_run.h"

#include <iostream>
#include <string>

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "codeloop_cli <run|exec|image|profile> ...\n";
        return 2;
    }
    std::string cmd = argv[1];
    if (cmd == "run") return cmd_run(argc, argv);
    if (cmd == "exec") return cmd_exec(argc, argv);
    if (cmd == "image") return cmd_image(argc, argv);
    if (cmd == "profile") return cmd_profile(argc, argv);
    std::cerr << "unknown command: " << cmd << "\n";
    return 2;
}
