#include "attach.h"
#include "host_templates.h"
#include "relay_log.h"

#include <chrono>
#include <thread>

attach_options_t attach_default_options(void) {
    attach_options_t opt;
    opt.host_timeout_ms = HOST_CMD_CONNECT_TIMEOUT_MS;
    opt.engine_timeout_ms = 1000;
    opt.engine_attempts = 20;
    opt.engine_retry_ms = 250;
    return opt;
}

attach_plan_t attach_prepare(const session_config_t& cfg, const attach_options_t& opt) {
    attach_plan_t plan;
    plan.injection_code = tmpl_injection_code(cfg.engine_host, cfg.engine_port, opt.engine_path);
    plan.run_directive = tmpl_run_directive(cfg.program);
    return plan;
}

attach_result_t attach_run(const session_config_t& cfg, const attach_options_t& opt,
                           const attach_plan_t& plan,
                           host_cmd_channel& host, engine_session& engine,
                           engine_message_fn on_engine_message,
                           const std::atomic<bool>& cancel) {
    relay_log("attach: connecting to host command port %s:%d", cfg.host_name.c_str(), cfg.host_port);
    if (host.connect(cfg.host_name, cfg.host_port, opt.host_timeout_ms) != HOST_CMD_OK) {
        relay_log("attach: %s", host.last_error().c_str());
        return ATTACH_HOST_UNREACHABLE;
    }

    relay_log("attach: injecting debug engine");
    if (!host.submit(plan.injection_code, "inject")) return ATTACH_INJECT_FAILED;

    // The engine listens only once the host has run the injection. Each
    // attempt is time-bounded so shutdown can cancel the retries.
    int attempt = 0;
    for (;;) {
        if (cancel.load()) return ATTACH_CANCELLED;
        if (engine.connect(cfg.engine_host, cfg.engine_port, opt.engine_timeout_ms)) break;
        if (++attempt >= opt.engine_attempts) return ATTACH_ENGINE_UNREACHABLE;
        std::this_thread::sleep_for(std::chrono::milliseconds(opt.engine_retry_ms));
    }

    if (!engine.start(on_engine_message)) return ATTACH_ENGINE_UNREACHABLE;
    relay_log("attach: debug session is live");
    return ATTACH_OK;
}

const char* attach_result_str(attach_result_t r) {
    switch (r) {
        case ATTACH_OK:                 return "ok";
        case ATTACH_HOST_UNREACHABLE:   return "host command port unreachable";
        case ATTACH_INJECT_FAILED:      return "debug engine injection failed";
        case ATTACH_ENGINE_UNREACHABLE: return "debug engine unreachable";
        case ATTACH_CANCELLED:          return "cancelled";
    }
    return "?";
}
