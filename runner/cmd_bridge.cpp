#include "cmd_bridge.h"
#include "runner_utils.h"
#include "serve_http.h"

#include "mixmaster/config.h"
#include "mixmaster/pipeline.h"

#include <csignal>
#include <iostream>
#include <string>

using namespace mixmaster;

// One request on stdin/stdout: the socket-activation (Accept=yes) and
// inetd entry point.
int cmd_bridge(int argc, char** argv, int first_arg) {
    std::string config_flag;
    for (int i = first_arg; i < argc; i++) {
        std::string a = argv[i];
        if (a == "--config" && i + 1 < argc) { config_flag = argv[++i]; continue; }
        std::cerr << "usage: mmbridge [bridge] [--config PATH]\n";
        return 2;
    }

    // A peer that hangs up early must not kill us mid-response.
    ::signal(SIGPIPE, SIG_IGN);

    const int timeout_sec = runner_detail::getenv_int("MIXMASTER_SOCKET_TIMEOUT_SEC", 10);
    if (is_socket(STDIN_FILENO)) set_socket_timeouts(STDIN_FILENO, timeout_sec);

    FdStreamBuf inbuf(STDIN_FILENO);
    FdStreamBuf outbuf(STDOUT_FILENO);
    std::istream in(&inbuf);
    std::ostream out(&outbuf);

    PipelineOptions opts;
    opts.config_path = resolve_config_path(config_flag);
    PipelineResult res = handle_connection(in, out, opts);
    return exit_code_for(res.outcome);
}
