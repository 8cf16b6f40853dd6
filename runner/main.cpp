#include "cmd_bridge.h"
#include "cmd_serve.h"
#include "cmd_submit.h"

#include "mixmaster/types.h"

#include <exception>
#include <iostream>
#include <string>

static int run(int argc, char** argv) {
    // No command (or only options) is the socket-activated bridge.
    if (argc < 2 || argv[1][0] == '-') {
        if (argc >= 2 && std::string(argv[1]) == "--version") {
            std::cout << MIXMASTER_VERSION << "\n";
            return 0;
        }
        return cmd_bridge(argc, argv, 1);
    }

    std::string cmd = argv[1];
    if (cmd == "bridge") return cmd_bridge(argc, argv, 2);
    if (cmd == "serve") return cmd_serve(argc, argv, 2);
    if (cmd == "submit") return cmd_submit(argc, argv, 2);
    if (cmd == "version") {
        std::cout << MIXMASTER_VERSION << "\n";
        return 0;
    }
    std::cerr << "mmbridge [bridge|serve|submit|version] ...\n";
    std::cerr << "unknown command: " << cmd << "\n";
    return 2;
}

int main(int argc, char** argv) {
    try {
        return run(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "mmbridge: " << e.what() << "\n";
        return 2;
    }
}
