#include "doctest.h"
#include "test_helpers.h"
#include "interceptor.h"
#include "host_templates.h"
#include "utils.h"

using json = nlohmann::json;

static attach_options_t test_options() {
    attach_options_t opt = attach_default_options();
    opt.host_timeout_ms = 1000;
    opt.engine_attempts = 2;
    opt.engine_retry_ms = 10;
    return opt;
}

static const char TEST_PROGRAM[] = "/home/user/tools/rig_check.py";

static std::string attach_request(int seq, int host_port, int engine_port) {
    json req;
    req["seq"] = seq;
    req["type"] = "request";
    req["command"] = "attach";
    req["arguments"]["maya"]["host"] = "127.0.0.1";
    req["arguments"]["maya"]["port"] = host_port;
    req["arguments"]["debugpy"]["host"] = "127.0.0.1";
    req["arguments"]["debugpy"]["port"] = engine_port;
    req["arguments"]["program"] = TEST_PROGRAM;
    return req.dump();
}

// First message in msgs whose key equals value, or null.
static json find_message(const std::vector<std::string>& msgs, const char* key, const char* value) {
    for (const auto& m : msgs) {
        json j = json::parse(m, nullptr, false);
        if (j.is_object() && j.value(key, "") == value) return j;
    }
    return json();
}

struct RelayFixture {
    MessageCapture debugger;
    MessageCapture fatal;
    relay r;

    RelayFixture()
        : r([this](const std::string& t) { debugger.push(t); },
            [this](const std::string& t) { fatal.push(t); },
            test_options()) {
        relay_log_clear();
    }
};

TEST_SUITE("interceptor") {

    // -------------------------------------------------------------------------
    // initialize
    // -------------------------------------------------------------------------

    TEST_CASE("T01: initialize is answered by the relay and still forwarded") {
        RelayFixture f;
        std::string req = "{\"seq\":1,\"type\":\"request\",\"command\":\"initialize\",\"arguments\":{\"adapterID\":\"mayapy\"}}";
        f.r.on_debugger_message(req);

        REQUIRE(f.debugger.count() == 1);
        json resp = json::parse(f.debugger.snapshot()[0]);
        CHECK(resp["type"] == "response");
        CHECK(resp["seq"] == 1);
        CHECK(resp["request_seq"] == 1);
        CHECK(resp["success"] == true);
        CHECK(resp["command"] == "initialize");
        CHECK(resp["body"] == make_initialize_capabilities());

        std::deque<std::string> queued = f.r.engine().queued_messages();
        REQUIRE(queued.size() == 1);
        CHECK(queued[0] == req);
        CHECK(f.r.engine().is_answered(1));
    }

    TEST_CASE("T02: capabilities advertise configurationDone and the exception filters") {
        json caps = make_initialize_capabilities();
        CHECK(caps["supportsConfigurationDoneRequest"] == true);
        CHECK(caps["supportsConditionalBreakpoints"] == true);
        REQUIRE(caps["exceptionBreakpointFilters"].size() == 2);
        CHECK(caps["exceptionBreakpointFilters"][0]["filter"] == "raised");
        CHECK(caps["exceptionBreakpointFilters"][0]["default"] == false);
        CHECK(caps["exceptionBreakpointFilters"][1]["filter"] == "uncaught");
        CHECK(caps["exceptionBreakpointFilters"][1]["default"] == true);
    }

    TEST_CASE("T03: the engine's answer to initialize is suppressed") {
        RelayFixture f;
        f.r.on_debugger_message("{\"seq\":1,\"type\":\"request\",\"command\":\"initialize\"}");
        REQUIRE(f.debugger.count() == 1);

        f.r.on_engine_message("{\"seq\":1,\"type\":\"response\",\"request_seq\":1,\"success\":true,\"command\":\"initialize\",\"body\":{}}");
        CHECK(f.debugger.count() == 1);
        CHECK(relay_log_contains("request 1 already answered"));
    }

    // -------------------------------------------------------------------------
    // Pass-through
    // -------------------------------------------------------------------------

    TEST_CASE("T04: other debugger requests reach the engine queue byte for byte") {
        RelayFixture f;
        std::string req = "{ \"seq\": 5, \"type\": \"request\", \"command\": \"threads\" }";
        f.r.on_debugger_message(req);
        std::deque<std::string> queued = f.r.engine().queued_messages();
        REQUIRE(queued.size() == 1);
        CHECK(queued[0] == req);
        CHECK(f.debugger.count() == 0);
    }

    TEST_CASE("T05: engine traffic reaches the debugger byte for byte") {
        RelayFixture f;
        std::string ev = "{\"seq\":9, \"type\":\"event\",\"event\":\"stopped\",\"body\":{\"reason\":\"breakpoint\",\"text\":\"\\u00e9\"}}";
        std::string resp = "{\"seq\":10,\"type\":\"response\",\"request_seq\":5,\"success\":true,\"command\":\"threads\"}";
        f.r.on_engine_message(ev);
        f.r.on_engine_message(resp);

        std::vector<std::string> got = f.debugger.snapshot();
        REQUIRE(got.size() == 2);
        CHECK(got[0] == ev);
        CHECK(got[1] == resp);
    }

    TEST_CASE("T06: undecodable messages are dropped in both directions") {
        RelayFixture f;
        f.r.on_debugger_message("{\"seq\":1,");
        f.r.on_debugger_message("[1,2,3]");
        CHECK(f.r.engine().queued_messages().empty());
        CHECK(relay_log_contains("dropping undecodable debugger message"));

        f.r.on_engine_message("not json");
        CHECK(f.debugger.count() == 0);
        CHECK(relay_log_contains("suppressing undecodable engine message"));
    }

    // -------------------------------------------------------------------------
    // attach
    // -------------------------------------------------------------------------

    TEST_CASE("T07: attach with invalid arguments is answered with a failure") {
        RelayFixture f;
        f.r.on_debugger_message("{\"seq\":2,\"type\":\"request\",\"command\":\"attach\",\"arguments\":{\"program\":\"x.py\"}}");

        REQUIRE(f.debugger.count() == 1);
        json resp = json::parse(f.debugger.snapshot()[0]);
        CHECK(resp["success"] == false);
        CHECK(resp["request_seq"] == 2);
        CHECK(resp["command"] == "attach");
        CHECK(resp["message"] == "Invalid attach configuration: missing 'maya' settings");
        CHECK(f.r.engine().queued_messages().empty());
        CHECK_FALSE(f.r.attach_active());
    }

    TEST_CASE("T08: unreachable host is fatal and the engine is never contacted") {
        RelayFixture f;
        int host_port = refused_port();
        f.r.on_debugger_message(attach_request(2, host_port, 5678));

        // The rewritten attach is queued for the engine.
        std::deque<std::string> queued = f.r.engine().queued_messages();
        REQUIRE(queued.size() == 1);
        json fwd = json::parse(queued[0]);
        CHECK(fwd["command"] == "attach");
        CHECK(fwd["seq"] == 2);
        CHECK(fwd["arguments"]["host"] == "127.0.0.1");
        CHECK(fwd["arguments"]["port"] == 5678);
        CHECK(fwd["arguments"]["program"] == TEST_PROGRAM);
        CHECK(fwd["arguments"].find("maya") == fwd["arguments"].end());

        REQUIRE(f.fatal.wait_for(1));
        std::string remediation = tmpl_remediation("127.0.0.1", host_port);
        CHECK(f.fatal.snapshot()[0] == remediation);

        REQUIRE(f.debugger.wait_for(1));
        json ev = find_message(f.debugger.snapshot(), "event", "output");
        REQUIRE(ev.is_object());
        CHECK(ev["body"]["category"] == "stderr");
        CHECK(ev["body"]["output"] == remediation);

        CHECK(f.r.engine().state() == ENGINE_DISCONNECTED);
        CHECK_FALSE(relay_log_contains("engine: connecting"));
    }

    TEST_CASE("T09: a second attach is rejected") {
        RelayFixture f;
        f.r.on_debugger_message(attach_request(2, refused_port(), 5678));
        REQUIRE(f.fatal.wait_for(1));
        CHECK(f.r.attach_active());

        f.r.on_debugger_message(attach_request(3, refused_port(), 5679));
        REQUIRE(f.debugger.wait_for(2));
        json resp = find_message(f.debugger.snapshot(), "type", "response");
        REQUIRE(resp.is_object());
        CHECK(resp["request_seq"] == 3);
        CHECK(resp["success"] == false);
        CHECK(resp["message"] == "A host session is already attached to this relay");

        // Only the first attach was forwarded, and only one bootstrap ran.
        CHECK(f.r.engine().queued_messages().size() == 1);
        CHECK(f.fatal.count() == 1);
    }

    TEST_CASE("T10: attach after shutdown is rejected") {
        RelayFixture f;
        f.r.shutdown();
        f.r.on_debugger_message(attach_request(2, refused_port(), 5678));
        REQUIRE(f.debugger.count() == 1);
        json resp = json::parse(f.debugger.snapshot()[0]);
        CHECK(resp["success"] == false);
        CHECK(f.fatal.count() == 0);
    }

    TEST_CASE("T11: unreachable engine is reported on the console and is not fatal") {
        RelayFixture f;
        LoopbackListener host_port;
        f.r.on_debugger_message(attach_request(2, host_port.port, refused_port()));

        REQUIRE(f.debugger.wait_for(1));
        json ev = find_message(f.debugger.snapshot(), "event", "output");
        REQUIRE(ev.is_object());
        CHECK(ev["body"]["category"] == "console");
        CHECK(ev["body"]["output"].get<std::string>().find("debug engine unreachable") != std::string::npos);
        CHECK(f.fatal.count() == 0);
    }

    // -------------------------------------------------------------------------
    // configurationDone
    // -------------------------------------------------------------------------

    TEST_CASE("T12: configurationDone runs the program once, before the debugger hears of it") {
        RelayFixture f;
        LoopbackListener host_port;
        f.r.on_debugger_message(attach_request(2, host_port.port, refused_port()));

        int host_peer = host_port.accept_client();
        REQUIRE(host_peer >= 0);
        std::string inject = read_until(host_peer, "\");");
        CHECK(inject.find("dap_relay_inject.py") != std::string::npos);
        REQUIRE(f.debugger.wait_for(1));   // bootstrap finished (engine unreachable)

        std::string done = "{\"seq\":7,\"type\":\"response\",\"request_seq\":3,\"success\":true,\"command\":\"configurationDone\"}";
        f.r.on_engine_message(done);

        // The run command is on the wire by the time the response is forwarded.
        std::vector<std::string> got = f.debugger.snapshot();
        CHECK(got.back() == done);
        std::string run = read_until(host_peer, "\");", 1, 1000);
        std::string run_path = path_join(temp_dir(), "dap_relay_run.py");
        CHECK(run == tmpl_exec_command(run_path));
        CHECK(read_file(run_path) == tmpl_run_directive(TEST_PROGRAM));

        // A second configurationDone does not run it again.
        f.r.on_engine_message(done);
        CHECK(stays_quiet(host_peer));
        CHECK(relay_log_contains("configurationDone with no run directive pending"));
        close(host_peer);
    }

    TEST_CASE("T13: configurationDone with nothing stored submits nothing") {
        RelayFixture f;
        f.r.on_engine_message("{\"seq\":1,\"type\":\"response\",\"request_seq\":1,\"success\":true,\"command\":\"configurationDone\"}");
        CHECK(f.debugger.count() == 1);
        CHECK(relay_log_contains("configurationDone with no run directive pending"));
    }

    TEST_CASE("T14: a stored run directive is consumed by configurationDone") {
        RelayFixture f;
        LoopbackListener host_port;
        REQUIRE(f.r.host().connect("127.0.0.1", host_port.port, 1000) == HOST_CMD_OK);
        int host_peer = host_port.accept_client();
        REQUIRE(host_peer >= 0);

        f.r.store_run_directive("print('custom')\n");
        f.r.on_engine_message("{\"seq\":1,\"type\":\"response\",\"request_seq\":4,\"success\":true,\"command\":\"configurationDone\"}");
        CHECK(read_until(host_peer, "\");").find("dap_relay_run.py") != std::string::npos);
        CHECK(read_file(path_join(temp_dir(), "dap_relay_run.py")) == "print('custom')\n");
        close(host_peer);
    }

    // -------------------------------------------------------------------------
    // Whole session
    // -------------------------------------------------------------------------

    TEST_CASE("T15: debugger, host and engine end to end") {
        RelayFixture f;
        LoopbackListener host_port;
        LoopbackListener engine_port;

        f.r.on_debugger_message("{\"seq\":1,\"type\":\"request\",\"command\":\"initialize\"}");
        f.r.on_debugger_message(attach_request(2, host_port.port, engine_port.port));

        int host_peer = host_port.accept_client();
        REQUIRE(host_peer >= 0);
        int engine_peer = engine_port.accept_client();
        REQUIRE(engine_peer >= 0);
        REQUIRE(wait_until([&] { return f.r.engine().state() == ENGINE_RELAYING; }));

        // Engine sees initialize, then the rewritten attach.
        frame_decoder dec;
        std::string body;
        REQUIRE(read_frame(engine_peer, dec, body));
        CHECK(json::parse(body)["command"] == "initialize");
        REQUIRE(read_frame(engine_peer, dec, body));
        json fwd = json::parse(body);
        CHECK(fwd["command"] == "attach");
        CHECK(fwd["arguments"]["port"] == engine_port.port);

        write_frame(engine_peer, "{\"seq\":1,\"type\":\"response\",\"request_seq\":1,\"success\":true,\"command\":\"initialize\",\"body\":{}}");
        write_frame(engine_peer, "{\"seq\":2,\"type\":\"event\",\"event\":\"initialized\"}");
        write_frame(engine_peer, "{\"seq\":3,\"type\":\"response\",\"request_seq\":2,\"success\":true,\"command\":\"attach\"}");
        REQUIRE(f.debugger.wait_for(3));

        f.r.on_debugger_message("{\"seq\":3,\"type\":\"request\",\"command\":\"configurationDone\"}");
        REQUIRE(read_frame(engine_peer, dec, body));
        CHECK(json::parse(body)["command"] == "configurationDone");
        write_frame(engine_peer, "{\"seq\":4,\"type\":\"response\",\"request_seq\":3,\"success\":true,\"command\":\"configurationDone\"}");
        REQUIRE(f.debugger.wait_for(4));

        std::vector<std::string> got = f.debugger.snapshot();
        CHECK(json::parse(got[0])["command"] == "initialize");
        CHECK(json::parse(got[1])["event"] == "initialized");
        CHECK(json::parse(got[2])["command"] == "attach");
        CHECK(json::parse(got[3])["command"] == "configurationDone");

        // Injection first, then the run directive.
        std::string host_bytes = read_until(host_peer, "\");", 2);
        size_t inject_at = host_bytes.find("dap_relay_inject.py");
        size_t run_at = host_bytes.find("dap_relay_run.py");
        REQUIRE(inject_at != std::string::npos);
        REQUIRE(run_at != std::string::npos);
        CHECK(inject_at < run_at);

        // The engine's initialize answer never reached the debugger.
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        CHECK(f.debugger.count() == 4);
        CHECK(f.fatal.count() == 0);

        f.r.shutdown();
        CHECK(f.r.engine().state() == ENGINE_CLOSED);
        CHECK_FALSE(f.r.host().is_connected());
        close(host_peer);
        close(engine_peer);
    }
}
