// dap_relay: bridges an editor's debugger, a Maya command port and a debug
// engine injected into Maya.

#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <string>

#include <unistd.h>

#include "dap_transport.h"
#include "interceptor.h"
#include "relay_config.h"
#include "relay_log.h"

int main(int argc, char** argv) {
    relay_config_t cfg = relay_config_defaults();
    std::string err;

    switch (relay_config_parse(argc, argv, cfg, err)) {
        case CONFIG_HELP:
            fputs(relay_config_usage(argv[0]).c_str(), stderr);
            return 0;
        case CONFIG_ERROR:
            fprintf(stderr, "%s: %s\n", argv[0], err.c_str());
            fputs(relay_config_usage(argv[0]).c_str(), stderr);
            return 2;
        case CONFIG_OK:
            break;
    }

    signal(SIGPIPE, SIG_IGN);
    relay_log_init(cfg.log_path.empty() ? nullptr : cfg.log_path.c_str());
    relay_log_set_verbose(cfg.verbose);
    relay_log("starting, pid %d", (int)getpid());

    dap_transport debugger(STDIN_FILENO, STDOUT_FILENO);

    // The remediation text has already reached the debugger as an output
    // event; nothing can proceed without the host, so leave right away.
    auto on_fatal = [](const std::string&) {
        relay_log("host application unreachable, exiting");
        relay_log_shutdown();
        _exit(EXIT_FAILURE);
    };

    relay session(
        [&debugger](const std::string& text) { debugger.send(text); },
        on_fatal,
        cfg.attach);

    frame_read_result_t r = debugger.run([&session](const std::string& msg) {
        session.on_debugger_message(msg);
    });
    if (r == FRAME_READ_ERROR) {
        relay_log("debugger channel failed: %s", debugger.error().c_str());
    } else {
        relay_log("debugger channel closed");
    }

    session.shutdown();
    relay_log_shutdown();
    return 0;
}
