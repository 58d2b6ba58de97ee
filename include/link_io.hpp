/**
 * @file link_io.hpp
 * @brief Open a radio link (Linux TTY in raw mode, or a TCP socket) and move SLIP-framed payloads.
 *
 * @details
 * PURPOSE
 * -------
 * This header declares the minimal surface meshlink needs to talk to a radio
 * from a Linux host. Both transports end up as a plain file descriptor, so the
 * framing functions work on either. It pairs with link_io.cpp for the POSIX work
 * and with slip.hpp for message framing.
 *
 * ROLE IN MESHLINK
 * ----------------
 * - meshlink::open_serial: acquire a TTY fd, set raw 8N1, absorb boot noise after reset.
 * - meshlink::open_tcp: non-blocking connect bounded by a timeout.
 * - meshlink::tcp_port_open: bare connect probe used by network discovery.
 * - meshlink::write_frame / read_frame: one SLIP frame out / in, both bounded in time.
 * - meshlink::close_link: release the fd, reporting whether close(2) succeeded.
 *
 * These functions are used by:
 * - LinkRadioClient (link_client.cpp): the production radio client.
 * - NetworkDiscoverer (net_discovery.cpp): TCP reachability probes.
 *
 * OPERATIONAL NOTES
 * -----------------
 * - Device selection: the port enumerator resolves "auto" to a concrete path
 *   before anything here is called.
 * - Permissions: the runtime user needs the dialout group (or equivalent) for serial.
 * - Timeouts: every call that can block takes a millisecond bound. A false
 *   return means timeout or I/O error; upper layers decide what that means.
 * - Concurrency: do not share one fd between threads. The connector's
 *   per-resource lock makes sure only one session per radio exists at a time.
 *
 * EXAMPLE
 * -------
 * @code
 *   std::string err;
 *   int fd = meshlink::open_tcp("10.0.0.5", 4403, 2000, &err);
 *   if (fd < 0) { // err says why  }
 *
 *   std::vector<uint8_t> req(...), resp;
 *   if (meshlink::write_frame(fd, req, 1000) && meshlink::read_frame(fd, resp, 5000)) {
 *       // resp holds one decoded payload
 *   }
 *   meshlink::close_link(fd);
 * @endcode
 */
#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace meshlink {

/**
 * @brief Open a Linux TTY device in raw mode and return its file descriptor.
 *
 *   - Opens with O_RDWR | O_NOCTTY | O_NONBLOCK.
 *   - Raw 8N1, no echo, no flow control; baud from a small table (9600..460800,
 *     unknown values fall back to 115200).
 *   - Sleeps @p boot_delay_ms to let USB CDC boards finish their auto-reset,
 *     then flushes whatever they printed while booting.
 *
 * @param dev            Device path, e.g. "/dev/ttyACM0".
 * @param baud           Requested baud rate.
 * @param boot_delay_ms  Settle time after open.
 * @param err            Optional; receives strerror text on failure.
 * @return fd >= 0, or -1 on failure.
 */
int open_serial(const std::string& dev, int baud = 115200, int boot_delay_ms = 400,
                std::string* err = nullptr);

/**
 * @brief Connect to @p host:@p port within @p timeout_ms.
 *
 * Resolves with getaddrinfo (IPv4 and IPv6), tries each address in turn with a
 * non-blocking connect and poll(2). The returned socket stays non-blocking;
 * read_frame/write_frame poll before touching it.
 *
 * @return fd >= 0, or -1 with @p err set ("timeout", "Connection refused", ...).
 */
int open_tcp(const std::string& host, uint16_t port, int timeout_ms,
             std::string* err = nullptr);

/**
 * @brief True if a TCP connect to @p host:@p port succeeds within @p timeout_ms.
 *
 * The socket is closed immediately; nothing is sent.
 */
bool tcp_port_open(const std::string& host, uint16_t port, int timeout_ms);

/**
 * @brief SLIP-encode @p payload and write the whole frame, looping on partial writes.
 *
 * @return true if every byte was written before @p timeout_ms elapsed.
 */
bool write_frame(int fd, const std::vector<uint8_t>& payload, int timeout_ms = 1500);

/**
 * @brief Read one SLIP frame, bounded by an overall deadline of @p timeout_ms.
 *
 * @param out  Cleared at entry; holds the decoded payload on success.
 * @return true if a complete frame arrived; false on timeout, EOF, or I/O error.
 */
bool read_frame(int fd, std::vector<uint8_t>& out, int timeout_ms = 1500);

/**
 * @brief Close an fd from open_serial()/open_tcp().
 *
 * @return false if close(2) reported an error (the fd is gone either way).
 *         Negative fds are a no-op returning true.
 */
bool close_link(int fd);

} // namespace meshlink
