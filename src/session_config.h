#pragma once

#include <string>

#include <nlohmann/json.hpp>

// Snapshot of an attach request's arguments. Built once per attach and
// read-only afterwards.
struct session_config_t {
    std::string host_name;     // host application command port
    int         host_port;
    std::string engine_host;   // debug engine listen address
    int         engine_port;
    std::string program;
};

// Argument keys used by the editor's launch configuration.
extern const char SESSION_HOST_KEY[];     // "maya"
extern const char SESSION_ENGINE_KEY[];   // "debugpy"
extern const char SESSION_PROGRAM_KEY[];  // "program"

bool session_config_parse(const nlohmann::json& arguments, session_config_t& out, std::string& err);

// Attach arguments in the shape the debug engine expects. Only the engine
// address and the program location are carried over.
nlohmann::json session_engine_attach_args(const session_config_t& cfg);
