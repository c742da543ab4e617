#pragma once

#include "attach.h"
#include "engine_session.h"
#include "host_cmd.h"
#include "session_config.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

#include <nlohmann/json.hpp>

// Sits between the debugger and the debug engine. Answers "initialize"
// itself, rewrites "attach" for the engine and starts the bootstrap, and
// forwards everything else. Engine traffic goes back to the debugger unless
// it answers a request the relay already answered.

typedef std::function<void(const std::string&)> debugger_send_fn;
typedef std::function<void(const std::string& remediation)> fatal_fn;

class relay {
public:
    relay(debugger_send_fn send_fn, fatal_fn fatal_handler, const attach_options_t& opts);
    ~relay();

    void on_debugger_message(const std::string& raw);
    void on_engine_message(const std::string& raw);

    // Stored once per attach, consumed by the first configurationDone.
    void store_run_directive(const std::string& directive);

    void shutdown();

#ifdef RELAY_TESTING
    engine_session& engine() { return engine_link; }
    host_cmd_channel& host() { return host_link; }
    bool attach_active() const;
#endif

private:
    void handle_initialize(const nlohmann::json& msg);
    bool handle_attach(nlohmann::json& msg);
    void attach_worker(session_config_t cfg, attach_plan_t plan);
    void submit_run_directive();

    void send_response(const nlohmann::json& request, bool success,
                       const std::string& message, const nlohmann::json& body);
    void send_event(const std::string& event, const nlohmann::json& body);
    void send_to_debugger(const nlohmann::json& msg);

    debugger_send_fn to_debugger;
    fatal_fn on_fatal;
    attach_options_t options;

    engine_session engine_link;
    host_cmd_channel host_link;

    mutable std::mutex lock;
    bool attach_started;
    std::string run_directive;
    bool run_directive_pending;
    std::thread attach_thread;

    std::atomic<bool> shutting_down;
    std::atomic<int64_t> next_seq;
};

nlohmann::json make_initialize_capabilities(void);
