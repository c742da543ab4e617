#include "frame_codec.h"
#include "utils.h"

#include <cerrno>
#include <cstdlib>
#include <cstring>

#include <unistd.h>

const char FRAME_CONTENT_HEADER[] = "Content-Length: ";

std::string frame_encode(const std::string& body) {
    std::string out = FRAME_CONTENT_HEADER;
    out += std::to_string(body.size());
    out += "\r\n\r\n";
    out += body;
    return out;
}

frame_decoder::frame_decoder()
    : state(FRAME_HEADER), content_length(0) {
}

void frame_decoder::reset() {
    state = FRAME_HEADER;
    line.clear();
    content_length = 0;
    body_buf.clear();
    ready.clear();
    err.clear();
}

void frame_decoder::fail(const std::string& why) {
    state = FRAME_FAILED;
    err = why;
}

// One header line, CR already stripped.
void frame_decoder::header_line_done() {
    if (line.empty()) {
        // End of header block. Zero or missing length: nothing to deliver.
        if (content_length > 0) {
            state = FRAME_BODY;
            body_buf.clear();
        }
        return;
    }

    static const char name[] = "Content-Length:";
    if (!starts_with_nocase(line, name)) return;   // other headers are skipped

    std::string value = trim(line.substr(sizeof(name) - 1));
    if (value.empty()) {
        fail("empty Content-Length value");
        return;
    }
    char* end = nullptr;
    errno = 0;
    long long n = strtoll(value.c_str(), &end, 10);
    if (errno != 0 || !end || *end != '\0' || n < 0) {
        fail("invalid Content-Length value '" + value + "'");
        return;
    }
    content_length = n;
}

bool frame_decoder::feed(const char* data, size_t len) {
    size_t i = 0;
    while (i < len) {
        switch (state) {
            case FRAME_FAILED:
                return false;

            case FRAME_HEADER: {
                char c = data[i++];
                if (c == '\n') {
                    if (!line.empty() && line[line.size() - 1] == '\r') line.erase(line.size() - 1);
                    header_line_done();
                    line.clear();
                } else if (line.size() >= FRAME_MAX_HEADER_LINE) {
                    fail("header line exceeds " + std::to_string(FRAME_MAX_HEADER_LINE) + " bytes");
                } else {
                    line += c;
                }
                break;
            }

            case FRAME_BODY: {
                size_t want = (size_t)content_length - body_buf.size();
                size_t take = len - i < want ? len - i : want;
                body_buf.append(data + i, take);
                i += take;
                if (body_buf.size() == (size_t)content_length) {
                    ready.push_back(body_buf);
                    body_buf.clear();
                    content_length = 0;
                    state = FRAME_HEADER;
                }
                break;
            }
        }
    }
    return state != FRAME_FAILED;
}

bool frame_decoder::next(std::string& body) {
    if (ready.empty()) return false;
    body.swap(ready.front());
    ready.pop_front();
    return true;
}

frame_read_result_t frame_decoder::read_message(int fd, std::string& body) {
    for (;;) {
        if (next(body)) return FRAME_READ_MESSAGE;
        if (state == FRAME_FAILED) return FRAME_READ_ERROR;

        char buf[4096];
        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n == 0) return FRAME_READ_EOF;
        if (n < 0) {
            if (errno == EINTR) continue;
            err = strerror(errno);
            return FRAME_READ_ERROR;
        }
        feed(buf, (size_t)n);
    }
}
