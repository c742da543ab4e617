#include "session_config.h"
#include "utils.h"

using json = nlohmann::json;

const char SESSION_HOST_KEY[]    = "maya";
const char SESSION_ENGINE_KEY[]  = "debugpy";
const char SESSION_PROGRAM_KEY[] = "program";

static bool read_port(const json& v, int& port) {
    if (v.is_number_integer()) {
        long long p = v.get<long long>();
        if (p < 1 || p > 65535) return false;
        port = (int)p;
        return true;
    }
    if (v.is_string()) return parse_port(v.get<std::string>(), port);
    return false;
}

static bool read_endpoint(const json& args, const char* key,
                          std::string& host, int& port, std::string& err) {
    auto it = args.find(key);
    if (it == args.end() || !it->is_object()) {
        err = std::string("missing '") + key + "' settings";
        return false;
    }
    auto h = it->find("host");
    if (h == it->end() || !h->is_string() || h->get<std::string>().empty()) {
        err = std::string("missing '") + key + ".host'";
        return false;
    }
    auto p = it->find("port");
    if (p == it->end() || !read_port(*p, port)) {
        err = std::string("missing or invalid '") + key + ".port'";
        return false;
    }
    host = h->get<std::string>();
    return true;
}

bool session_config_parse(const json& arguments, session_config_t& out, std::string& err) {
    if (!arguments.is_object()) {
        err = "attach request has no arguments";
        return false;
    }

    session_config_t cfg = {};
    if (!read_endpoint(arguments, SESSION_HOST_KEY, cfg.host_name, cfg.host_port, err)) return false;
    if (!read_endpoint(arguments, SESSION_ENGINE_KEY, cfg.engine_host, cfg.engine_port, err)) return false;

    auto prog = arguments.find(SESSION_PROGRAM_KEY);
    if (prog == arguments.end() || !prog->is_string() || prog->get<std::string>().empty()) {
        err = std::string("missing '") + SESSION_PROGRAM_KEY + "'";
        return false;
    }
    cfg.program = prog->get<std::string>();

    out = cfg;
    return true;
}

json session_engine_attach_args(const session_config_t& cfg) {
    std::string dir = path_dirname(cfg.program);

    json mapping;
    mapping["localRoot"] = dir;
    mapping["remoteRoot"] = dir;

    json args;
    args["name"] = "Maya Remote Attach";
    args["type"] = "python";
    args["request"] = "attach";
    args["host"] = cfg.engine_host;
    args["port"] = cfg.engine_port;
    args["program"] = cfg.program;
    args["pathMappings"] = json::array({ mapping });
    return args;
}
