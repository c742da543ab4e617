#include "interceptor.h"
#include "host_templates.h"
#include "relay_log.h"

using json = nlohmann::json;

// ---- JSON field helpers ----

static std::string string_field(const json& msg, const char* key) {
    auto it = msg.find(key);
    if (it == msg.end() || !it->is_string()) return "";
    return it->get<std::string>();
}

// -1 when absent; DAP sequence numbers start at 1.
static int64_t seq_field(const json& msg, const char* key) {
    auto it = msg.find(key);
    if (it == msg.end() || !it->is_number_integer()) return -1;
    return it->get<int64_t>();
}

static std::string to_text(const json& msg) {
    return msg.dump(-1, ' ', false, json::error_handler_t::replace);
}

json make_initialize_capabilities(void) {
    json raised;
    raised["filter"] = "raised";
    raised["label"] = "Raised Exceptions";
    raised["default"] = false;

    json uncaught;
    uncaught["filter"] = "uncaught";
    uncaught["label"] = "Uncaught Exceptions";
    uncaught["default"] = true;

    json caps;
    caps["supportsConfigurationDoneRequest"] = true;
    caps["supportsConditionalBreakpoints"] = true;
    caps["supportsHitConditionalBreakpoints"] = true;
    caps["supportsEvaluateForHovers"] = true;
    caps["supportsSetVariable"] = true;
    caps["supportsExceptionInfoRequest"] = true;
    caps["supportsLogPoints"] = true;
    caps["exceptionBreakpointFilters"] = json::array({ raised, uncaught });
    return caps;
}

relay::relay(debugger_send_fn send_fn, fatal_fn fatal_handler, const attach_options_t& opts)
    : to_debugger(send_fn)
    , on_fatal(fatal_handler)
    , options(opts)
    , attach_started(false)
    , run_directive_pending(false)
    , shutting_down(false)
    , next_seq(1) {
}

relay::~relay() {
    shutdown();
}

// ---- Debugger -> engine ----

void relay::on_debugger_message(const std::string& raw) {
    json msg = json::parse(raw, nullptr, false);
    if (msg.is_discarded() || !msg.is_object()) {
        relay_log("relay: dropping undecodable debugger message: %s", raw.c_str());
        return;
    }
    relay_log_debug("debugger -> relay: %s", raw.c_str());

    std::string cmd = string_field(msg, "command");
    if (cmd == "initialize") {
        handle_initialize(msg);
        engine_link.enqueue(raw);   // the engine still initializes its own state
    } else if (cmd == "attach") {
        if (handle_attach(msg)) engine_link.enqueue(to_text(msg));
    } else {
        engine_link.enqueue(raw);
    }
}

void relay::handle_initialize(const json& msg) {
    int64_t seq = seq_field(msg, "seq");
    if (seq >= 0) engine_link.mark_answered(seq);
    send_response(msg, true, "", make_initialize_capabilities());
}

bool relay::handle_attach(json& msg) {
    session_config_t cfg = {};
    std::string err;
    auto args = msg.find("arguments");
    if (!session_config_parse(args != msg.end() ? *args : json(), cfg, err)) {
        relay_log("relay: rejecting attach: %s", err.c_str());
        send_response(msg, false, "Invalid attach configuration: " + err, json());
        return false;
    }

    attach_plan_t plan = attach_prepare(cfg, options);
    relay_log("relay: run directive:\n%s", plan.run_directive.c_str());

    bool rejected = false;
    {
        std::lock_guard<std::mutex> lk(lock);
        if (attach_started || shutting_down.load()) {
            rejected = true;
        } else {
            attach_started = true;
            run_directive = plan.run_directive;
            run_directive_pending = true;
            attach_thread = std::thread(&relay::attach_worker, this, cfg, plan);
        }
    }
    if (rejected) {
        relay_log("relay: rejecting attach, a host session is already attached");
        send_response(msg, false, "A host session is already attached to this relay", json());
        return false;
    }

    msg["arguments"] = session_engine_attach_args(cfg);
    relay_log("relay: attach arguments for the debug engine: %s", to_text(msg["arguments"]).c_str());
    return true;
}

void relay::attach_worker(session_config_t cfg, attach_plan_t plan) {
    attach_result_t r = attach_run(cfg, options, plan, host_link, engine_link,
                                   [this](const std::string& m) { on_engine_message(m); },
                                   shutting_down);
    if (r == ATTACH_OK || r == ATTACH_CANCELLED) return;

    if (r == ATTACH_HOST_UNREACHABLE) {
        std::string text = tmpl_remediation(cfg.host_name, cfg.host_port);
        relay_log("relay: %s", text.c_str());
        json body;
        body["category"] = "stderr";
        body["output"] = text;
        send_event("output", body);
        if (on_fatal) on_fatal(text);
        return;
    }

    relay_log("relay: debug session is not functional: %s", attach_result_str(r));
    json body;
    body["category"] = "console";
    body["output"] = std::string("Debug session could not be started: ") + attach_result_str(r) + "\n";
    send_event("output", body);
}

void relay::store_run_directive(const std::string& directive) {
    std::lock_guard<std::mutex> lk(lock);
    run_directive = directive;
    run_directive_pending = true;
}

// ---- Engine -> debugger ----

void relay::on_engine_message(const std::string& raw) {
    json msg = json::parse(raw, nullptr, false);
    if (msg.is_discarded() || !msg.is_object()) {
        relay_log("relay: suppressing undecodable engine message: %s", raw.c_str());
        return;
    }

    if (string_field(msg, "command") == "configurationDone") submit_run_directive();

    int64_t request_seq = seq_field(msg, "request_seq");
    if (request_seq >= 0 && engine_link.is_answered(request_seq)) {
        relay_log("relay: request %lld already answered, engine response: %s",
                  (long long)request_seq, raw.c_str());
        return;
    }
    relay_log_debug("relay -> debugger: %s", raw.c_str());
    to_debugger(raw);
}

void relay::submit_run_directive() {
    std::string directive;
    {
        std::lock_guard<std::mutex> lk(lock);
        if (!run_directive_pending) {
            relay_log("relay: configurationDone with no run directive pending");
            return;
        }
        directive = run_directive;
        run_directive_pending = false;
    }
    relay_log("relay: configuration done, running program");
    if (!host_link.submit(directive, "run")) {
        relay_log("relay: could not submit the run directive: %s", host_link.last_error().c_str());
    }
}

// ---- Outbound to debugger ----

void relay::send_response(const json& request, bool success,
                          const std::string& message, const json& body) {
    json resp;
    resp["seq"] = next_seq.fetch_add(1);
    resp["type"] = "response";
    resp["request_seq"] = seq_field(request, "seq");
    resp["success"] = success;
    resp["command"] = string_field(request, "command");
    if (!message.empty()) resp["message"] = message;
    if (!body.is_null()) resp["body"] = body;
    send_to_debugger(resp);
}

void relay::send_event(const std::string& event, const json& body) {
    json ev;
    ev["seq"] = next_seq.fetch_add(1);
    ev["type"] = "event";
    ev["event"] = event;
    ev["body"] = body;
    send_to_debugger(ev);
}

void relay::send_to_debugger(const json& msg) {
    std::string text = to_text(msg);
    relay_log_debug("relay -> debugger: %s", text.c_str());
    to_debugger(text);
}

void relay::shutdown() {
    shutting_down.store(true);

    std::thread worker;
    {
        std::lock_guard<std::mutex> lk(lock);
        worker.swap(attach_thread);
    }
    if (worker.joinable()) worker.join();

    engine_link.stop();
    host_link.close();
}

// ---- Testing API ----

#ifdef RELAY_TESTING

bool relay::attach_active() const {
    std::lock_guard<std::mutex> lk(lock);
    return attach_started;
}

#endif // RELAY_TESTING
