#pragma once

#include "attach.h"

#include <string>

typedef struct {
    std::string log_path;        // empty = stderr only
    bool verbose;
    attach_options_t attach;
} relay_config_t;

typedef enum {
    CONFIG_OK,
    CONFIG_HELP,
    CONFIG_ERROR
} config_result_t;

relay_config_t relay_config_defaults(void);

// Reads argv (and DAP_RELAY_DEBUGPY for the engine path) into cfg.
config_result_t relay_config_parse(int argc, char** argv, relay_config_t& cfg, std::string& err);

std::string relay_config_usage(const char* prog);
