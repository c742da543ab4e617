#pragma once

#include <cstddef>
#include <string>

// Opens a TCP connection. timeout_ms < 0 blocks until the OS gives up.
// Returns the connected fd, or -1 with err filled in.
int  sock_connect(const std::string& host, int port, int timeout_ms, std::string& err);

// Writes all of data. Sockets are written with MSG_NOSIGNAL, other fds
// (pipes, stdout) with write().
bool sock_write_all(int fd, const char* data, size_t len);

void sock_shutdown(int fd);
void sock_close(int& fd);
