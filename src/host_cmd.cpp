#include "host_cmd.h"
#include "host_templates.h"
#include "relay_log.h"
#include "socket_io.h"
#include "utils.h"

#include <cerrno>
#include <cstdio>
#include <cstring>

host_cmd_channel::host_cmd_channel() : fd(-1) {
}

host_cmd_channel::~host_cmd_channel() {
    close();
}

host_cmd_result_t host_cmd_channel::connect(const std::string& host, int port, int timeout_ms) {
    std::lock_guard<std::mutex> lk(lock);
    sock_close(fd);

    std::string why;
    fd = sock_connect(host, port, timeout_ms, why);
    if (fd < 0) {
        err = why;
        return HOST_CMD_UNREACHABLE;
    }
    err.clear();
    relay_log("host: connected to command port %s:%d", host.c_str(), port);
    return HOST_CMD_OK;
}

static bool write_script(const std::string& path, const std::string& code, std::string& err) {
    FILE* fp = fopen(path.c_str(), "w");
    if (!fp) {
        err = "cannot create " + path + ": " + strerror(errno);
        return false;
    }
    size_t n = fwrite(code.data(), 1, code.size(), fp);
    bool ok = (n == code.size());
    if (fclose(fp) != 0) ok = false;
    if (!ok) err = "cannot write " + path + ": " + strerror(errno);
    return ok;
}

bool host_cmd_channel::submit(const std::string& code, const char* tag) {
    std::lock_guard<std::mutex> lk(lock);
    if (fd < 0) {
        err = "host command port is not connected";
        relay_log("host: cannot submit %s: %s", tag, err.c_str());
        return false;
    }

    std::string path = path_join(temp_dir(), std::string("dap_relay_") + tag + ".py");
    if (!write_script(path, code, err)) {
        relay_log("host: %s", err.c_str());
        return false;
    }

    std::string cmd = tmpl_exec_command(path);
    relay_log_debug("host: sending %s", cmd.c_str());
    if (!sock_write_all(fd, cmd.data(), cmd.size())) {
        err = std::string("write to command port failed: ") + strerror(errno);
        relay_log("host: %s", err.c_str());
        return false;
    }
    relay_log("host: submitted %s (%s)", tag, path.c_str());
    return true;
}

bool host_cmd_channel::is_connected() const {
    std::lock_guard<std::mutex> lk(lock);
    return fd >= 0;
}

void host_cmd_channel::close() {
    std::lock_guard<std::mutex> lk(lock);
    sock_close(fd);
}

std::string host_cmd_channel::last_error() const {
    std::lock_guard<std::mutex> lk(lock);
    return err;
}
