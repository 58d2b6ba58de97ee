// ============================================================================
// link_io.cpp — implementation for link_io.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

/**
 * @file link_io.cpp
 */

#include "link_io.hpp"     // declarations for open_serial(), open_tcp(), write_frame(), ...
#include "slip.hpp"        // meshlink::slip::framed() and FrameReader for frame boundaries

// POSIX / termios / sockets
#include <fcntl.h>         // ::open flags (O_RDWR, O_NOCTTY, O_NONBLOCK), fcntl
#include <unistd.h>        // ::read, ::write, ::close, usleep
#include <termios.h>       // termios struct + raw mode helpers
#include <poll.h>          // poll(2) for every timeout in this file
#include <netdb.h>         // getaddrinfo
#include <sys/socket.h>    // socket, connect, getsockopt
#include <netinet/in.h>
#include <cerrno>
#include <chrono>
#include <cstring>         // strerror
#include <utility>

namespace meshlink {

using Clock = std::chrono::steady_clock;

static void set_err(std::string* err, const std::string& msg) {
    if (err) *err = msg;
}

// Milliseconds left until @p deadline, clamped at zero.
static int remaining_ms(Clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

// ---------------------------------------------------------------------------
// set_raw()
// ----------
// Configure a TTY fd for raw serial I/O at the given baud.
// - cfmakeraw: 8N1, no echo, no line discipline.
// - CLOCAL|CREAD, no hardware flow control.
// - VMIN=0, VTIME=0: reads never block; poll() owns all timing.
// ---------------------------------------------------------------------------
static bool set_raw(int fd, speed_t baud) {
    termios tio{};
    if (tcgetattr(fd, &tio) != 0) return false;

    cfmakeraw(&tio);
    cfsetispeed(&tio, baud);
    cfsetospeed(&tio, baud);

    tio.c_cflag |= (CLOCAL | CREAD);
    tio.c_cflag &= ~CRTSCTS;
    tio.c_cc[VMIN]  = 0;
    tio.c_cc[VTIME] = 0;

    if (tcsetattr(fd, TCSANOW, &tio) != 0) return false;
    tcflush(fd, TCIOFLUSH);
    return true;
}

static speed_t baud_to_speed(int baud) {
    switch (baud) {
        case 9600:   return B9600;
        case 19200:  return B19200;
        case 38400:  return B38400;
        case 57600:  return B57600;
        case 115200: return B115200;
#ifdef B230400
        case 230400: return B230400;
#endif
#ifdef B460800
        case 460800: return B460800;
#endif
        default:     return B115200;
    }
}

int open_serial(const std::string& dev, int baud, int boot_delay_ms, std::string* err) {
    int fd = ::open(dev.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
    if (fd < 0) {                                   // perm, missing, busy
        set_err(err, dev + ": " + std::strerror(errno));
        return -1;
    }

    if (!set_raw(fd, baud_to_speed(baud))) {
        set_err(err, dev + ": termios: " + std::strerror(errno));
        ::close(fd);
        return -1;
    }

    if (boot_delay_ms > 0) usleep(static_cast<useconds_t>(boot_delay_ms) * 1000);  // USB auto-reset
    tcflush(fd, TCIOFLUSH);                         // drop boot chatter
    return fd;
}

// ---------------------------------------------------------------------------
// connect_one()
// -------------
// Non-blocking connect to a single resolved address, bounded by timeout_ms.
// Returns the connected fd or -1 (err set).
// ---------------------------------------------------------------------------
static int connect_one(const addrinfo* ai, int timeout_ms, std::string* err) {
    int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
    if (fd < 0) { set_err(err, std::strerror(errno)); return -1; }

    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) != 0) {
        set_err(err, std::strerror(errno));
        ::close(fd);
        return -1;
    }

    if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) return fd;  // immediate (loopback)
    if (errno != EINPROGRESS) {
        set_err(err, std::strerror(errno));
        ::close(fd);
        return -1;
    }

    pollfd pfd{fd, POLLOUT, 0};
    int pr = ::poll(&pfd, 1, timeout_ms);
    if (pr <= 0) {
        set_err(err, pr == 0 ? "timeout" : std::strerror(errno));
        ::close(fd);
        return -1;
    }

    int so_err = 0;
    socklen_t len = sizeof(so_err);
    if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_err, &len) != 0 || so_err != 0) {
        set_err(err, std::strerror(so_err ? so_err : errno));
        ::close(fd);
        return -1;
    }
    return fd;
}

int open_tcp(const std::string& host, uint16_t port, int timeout_ms, std::string* err) {
    addrinfo hints{};
    hints.ai_family   = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* res = nullptr;
    const std::string service = std::to_string(port);
    int rc = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &res);
    if (rc != 0) {
        set_err(err, host + ": " + gai_strerror(rc));
        return -1;
    }

    int fd = -1;
    std::string last = "no_address";
    for (const addrinfo* ai = res; ai && fd < 0; ai = ai->ai_next) {
        fd = connect_one(ai, timeout_ms, &last);
    }
    ::freeaddrinfo(res);

    if (fd < 0) set_err(err, host + ":" + service + ": " + last);
    return fd;
}

bool tcp_port_open(const std::string& host, uint16_t port, int timeout_ms) {
    int fd = open_tcp(host, port, timeout_ms, nullptr);
    if (fd < 0) return false;
    ::close(fd);
    return true;
}

// ---------------------------------------------------------------------------
// write_frame()
// -------------
// SLIP-encode and write the whole frame. Unlike a TTY write of a few bytes,
// a JSON document can exceed the socket/driver buffer, so loop on partial
// writes and wait for POLLOUT in between, within one overall deadline.
// ---------------------------------------------------------------------------
bool write_frame(int fd, const std::vector<uint8_t>& payload, int timeout_ms) {
    if (fd < 0) return false;
    const std::vector<uint8_t> out = slip::framed(payload.data(), payload.size());

    const auto deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);
    size_t off = 0;
    while (off < out.size()) {
        ssize_t w = ::write(fd, out.data() + off, out.size() - off);
        if (w > 0) { off += static_cast<size_t>(w); continue; }
        if (w < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) return false;

        pollfd pfd{fd, POLLOUT, 0};
        int pr = ::poll(&pfd, 1, remaining_ms(deadline));
        if (pr == 0) return false;                  // deadline passed
        if (pr < 0 && errno != EINTR) return false;
    }
    return true;
}

// ---------------------------------------------------------------------------
// read_frame()
// ------------
// Assemble exactly one SLIP frame before the deadline.
// - One byte per read(2) so bytes after the closing END stay in the kernel
//   buffer for the next call.
// - read() == 0 on a socket is EOF: the peer went away, stop.
// - Sockets and TTYs share this path; only the EOF rule differs.
// ---------------------------------------------------------------------------
bool read_frame(int fd, std::vector<uint8_t>& out, int timeout_ms) {
    out.clear();
    if (fd < 0) return false;

    slip::FrameReader reader;
    const bool tty = ::isatty(fd) == 1;
    const auto deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);
    pollfd pfd{fd, POLLIN, 0};
    uint8_t byte = 0;

    while (true) {
        int left = remaining_ms(deadline);
        if (left == 0) return false;                // timeout expired

        int pr = ::poll(&pfd, 1, left);
        if (pr == 0) return false;
        if (pr < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        if (pfd.revents & (POLLERR | POLLNVAL)) return false;
        if (pfd.revents & (POLLIN | POLLHUP)) {
            ssize_t n = ::read(fd, &byte, 1);
            if (n == 1) {
                if (auto frame = reader.push(byte)) {
                    out = std::move(*frame);
                    return true;
                }
                continue;
            }
            if (n == 0) {
                // Raw TTYs with VMIN=0 may return 0 without data; on a socket it is EOF.
                if (!tty || (pfd.revents & POLLHUP)) return false;
                continue;
            }
            if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) return false;
        }
    }
}

bool close_link(int fd) {
    if (fd < 0) return true;
    return ::close(fd) == 0;
}

} // namespace meshlink
