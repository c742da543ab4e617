#include "relay_config.h"

#include <cerrno>
#include <cstdlib>
#include <cstring>

relay_config_t relay_config_defaults(void) {
    relay_config_t cfg;
    cfg.verbose = false;
    cfg.attach = attach_default_options();
    return cfg;
}

static bool parse_positive(const char* text, int& out) {
    char* end = nullptr;
    errno = 0;
    long v = strtol(text, &end, 10);
    if (errno != 0 || end == text || *end != '\0' || v <= 0 || v > 3600000) return false;
    out = (int)v;
    return true;
}

config_result_t relay_config_parse(int argc, char** argv, relay_config_t& cfg, std::string& err) {
    const char* env = getenv("DAP_RELAY_DEBUGPY");
    if (env && *env) cfg.attach.engine_path = env;

    for (int i = 1; i < argc; i++) {
        const char* arg = argv[i];
        bool has_value = (i + 1 < argc);

        if (strcmp(arg, "-h") == 0 || strcmp(arg, "--help") == 0) {
            return CONFIG_HELP;
        } else if (strcmp(arg, "--verbose") == 0) {
            cfg.verbose = true;
        } else if (strcmp(arg, "--log") == 0 && has_value) {
            cfg.log_path = argv[++i];
        } else if (strcmp(arg, "--debugpy") == 0 && has_value) {
            cfg.attach.engine_path = argv[++i];
        } else if (strcmp(arg, "--host-timeout") == 0 && has_value) {
            if (!parse_positive(argv[++i], cfg.attach.host_timeout_ms)) {
                err = std::string("invalid --host-timeout value '") + argv[i] + "'";
                return CONFIG_ERROR;
            }
        } else if (strcmp(arg, "--engine-timeout") == 0 && has_value) {
            if (!parse_positive(argv[++i], cfg.attach.engine_timeout_ms)) {
                err = std::string("invalid --engine-timeout value '") + argv[i] + "'";
                return CONFIG_ERROR;
            }
        } else if (strcmp(arg, "--engine-attempts") == 0 && has_value) {
            if (!parse_positive(argv[++i], cfg.attach.engine_attempts)) {
                err = std::string("invalid --engine-attempts value '") + argv[i] + "'";
                return CONFIG_ERROR;
            }
        } else {
            err = std::string("unknown or incomplete option '") + arg + "'";
            return CONFIG_ERROR;
        }
    }
    return CONFIG_OK;
}

std::string relay_config_usage(const char* prog) {
    std::string u;
    u += std::string("usage: ") + prog + " [options]\n";
    u += "Relays a debugger's protocol stream (stdin/stdout) to a debug engine\n";
    u += "injected into a running Maya session through its command port.\n\n";
    u += "  --log <file>            also append log lines to <file>\n";
    u += "  --debugpy <dir>         directory holding debugpy, added to Maya's sys.path\n";
    u += "                          (default: $DAP_RELAY_DEBUGPY)\n";
    u += "  --host-timeout <ms>     command port connect timeout (default 3000)\n";
    u += "  --engine-timeout <ms>   timeout of one debug engine connect attempt (default 1000)\n";
    u += "  --engine-attempts <n>   debug engine connect attempts (default 20)\n";
    u += "  --verbose               log every relayed message\n";
    u += "  -h, --help              show this help\n";
    return u;
}
