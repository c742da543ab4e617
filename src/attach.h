#pragma once

#include "engine_session.h"
#include "host_cmd.h"
#include "session_config.h"

#include <atomic>
#include <string>

// Bootstrap of one debug session:
//   connect to host -> inject engine -> connect to engine -> start relaying

typedef enum {
    ATTACH_OK,
    ATTACH_HOST_UNREACHABLE,    // fatal: the relay is useless without the host
    ATTACH_INJECT_FAILED,
    ATTACH_ENGINE_UNREACHABLE,
    ATTACH_CANCELLED
} attach_result_t;

typedef struct {
    std::string engine_path;     // prepended to the host's sys.path, may be empty
    int host_timeout_ms;
    int engine_timeout_ms;       // per engine connect attempt
    int engine_attempts;
    int engine_retry_ms;
} attach_options_t;

attach_options_t attach_default_options(void);

typedef struct {
    std::string injection_code;
    std::string run_directive;
} attach_plan_t;

attach_plan_t attach_prepare(const session_config_t& cfg, const attach_options_t& opt);

attach_result_t attach_run(const session_config_t& cfg, const attach_options_t& opt,
                           const attach_plan_t& plan,
                           host_cmd_channel& host, engine_session& engine,
                           engine_message_fn on_engine_message,
                           const std::atomic<bool>& cancel);

const char* attach_result_str(attach_result_t r);
