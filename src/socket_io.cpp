#include "socket_io.h"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

static int connect_one(const struct addrinfo* ai, int timeout_ms, std::string& err) {
    int fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (fd < 0) {
        err = std::string("socket() failed: ") + strerror(errno);
        return -1;
    }

    if (timeout_ms < 0) {
        if (connect(fd, ai->ai_addr, ai->ai_addrlen) < 0) {
            err = strerror(errno);
            close(fd);
            return -1;
        }
        return fd;
    }

    int flags = fcntl(fd, F_GETFL, 0);
    fcntl(fd, F_SETFL, flags | O_NONBLOCK);

    int rc = connect(fd, ai->ai_addr, ai->ai_addrlen);
    if (rc < 0 && errno != EINPROGRESS) {
        err = strerror(errno);
        close(fd);
        return -1;
    }

    if (rc < 0) {
        struct pollfd pfd;
        pfd.fd = fd;
        pfd.events = POLLOUT;
        pfd.revents = 0;
        int ret;
        do {
            ret = poll(&pfd, 1, timeout_ms);
        } while (ret < 0 && errno == EINTR);

        if (ret == 0) {
            err = "timed out after " + std::to_string(timeout_ms) + " ms";
            close(fd);
            return -1;
        }
        if (ret < 0) {
            err = std::string("poll() failed: ") + strerror(errno);
            close(fd);
            return -1;
        }

        int so_error = 0;
        socklen_t len = sizeof(so_error);
        if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) < 0 || so_error != 0) {
            err = strerror(so_error ? so_error : errno);
            close(fd);
            return -1;
        }
    }

    fcntl(fd, F_SETFL, flags);
    return fd;
}

int sock_connect(const std::string& host, int port, int timeout_ms, std::string& err) {
    struct addrinfo hints;
    memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    std::string service = std::to_string(port);
    int gai = getaddrinfo(host.c_str(), service.c_str(), &hints, &res);
    if (gai != 0) {
        err = std::string("cannot resolve ") + host + ": " + gai_strerror(gai);
        return -1;
    }

    int fd = -1;
    for (struct addrinfo* ai = res; ai; ai = ai->ai_next) {
        fd = connect_one(ai, timeout_ms, err);
        if (fd >= 0) break;
    }
    freeaddrinfo(res);

    if (fd < 0) {
        err = "cannot connect to " + host + ":" + service + ": " + err;
    }
    return fd;
}

bool sock_write_all(int fd, const char* data, size_t len) {
    if (fd < 0) {
        errno = EBADF;
        return false;
    }
    while (len > 0) {
        ssize_t n = send(fd, data, len, MSG_NOSIGNAL);
        if (n < 0 && errno == ENOTSOCK) n = write(fd, data, len);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        data += n;
        len -= (size_t)n;
    }
    return true;
}

void sock_shutdown(int fd) {
    if (fd >= 0) ::shutdown(fd, SHUT_RDWR);
}

void sock_close(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}
