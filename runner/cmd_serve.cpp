#include "cmd_serve.h"
#include "runner_utils.h"
#include "serve_http.h"

#include "mixmaster/config.h"
#include "mixmaster/pipeline.h"

#include <cerrno>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

using namespace mixmaster;

// Local listener for development and smoke tests. Connections are handled
// one after another, each exactly like a socket-activated bridge run,
// including a fresh configuration load.
int cmd_serve(int argc, char** argv, int first_arg) {
    // Ignore SIGPIPE: writing to disconnected clients should not crash the server
    ::signal(SIGPIPE, SIG_IGN);

    std::string host = "127.0.0.1";
    int port = 8080;
    std::string config_flag;

    for (int i = first_arg; i < argc; i++) {
        std::string a = argv[i];
        if (a == "--host" && i + 1 < argc) { host = argv[++i]; continue; }
        if (a == "--port" && i + 1 < argc) { port = std::atoi(argv[++i]); continue; }
        if (a == "--config" && i + 1 < argc) { config_flag = argv[++i]; continue; }
        std::cerr << "usage: mmbridge serve [--host H] [--port P] [--config PATH]\n";
        return 2;
    }
    if (port <= 0 || port > 65535) {
        std::cerr << "bad port\n";
        return 2;
    }

    const int timeout_sec = runner_detail::getenv_int("MIXMASTER_SOCKET_TIMEOUT_SEC", 10);

    int sfd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (sfd < 0) { std::cerr << "socket failed\n"; return 2; }
    {
        int one = 1;
        if (::setsockopt(sfd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one)) != 0) {
            std::cerr << "[serve] SO_REUSEADDR not set\n";
        }
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons((uint16_t)port);
    if (::inet_pton(AF_INET, host.c_str(), &addr.sin_addr) <= 0) {
        std::cerr << "bad host\n";
        ::close(sfd);
        return 2;
    }

    if (::bind(sfd, (sockaddr*)&addr, sizeof(addr)) < 0) {
        std::cerr << "bind failed\n";
        ::close(sfd);
        return 2;
    }

    if (::listen(sfd, 16) < 0) {
        std::cerr << "listen failed\n";
        ::close(sfd);
        return 2;
    }

    PipelineOptions opts;
    opts.config_path = resolve_config_path(config_flag);

    std::cerr << "[serve] http://" << host << ":" << port << " config=" << opts.config_path << "\n";

    while (true) {
        sockaddr_in caddr{};
        socklen_t clen = sizeof(caddr);
        int cfd = ::accept(sfd, (sockaddr*)&caddr, &clen);
        if (cfd < 0) {
            if (errno == EINTR || errno == ECONNABORTED) continue;
            std::cerr << "[serve] accept failed: " << std::strerror(errno) << "\n";
            break;
        }
        set_socket_timeouts(cfd, timeout_sec);

        {
            FdStreamBuf buf(cfd);
            std::istream in(&buf);
            std::ostream out(&buf);
            PipelineResult res = handle_connection(in, out, opts);
            if (res.outcome.kind == OutcomeKind::CONFIG_MISSING) {
                std::cerr << "[serve] configuration missing: " << opts.config_path << "\n";
            }
        }
        ::close(cfd);
    }
    ::close(sfd);
    return 2;
}
