// ============================================================================
// connection.cpp — implementation for meshlink/connection.hpp
// ============================================================================

#include "meshlink/connection.hpp"
#include "meshlink/errors.hpp"

#include <cctype>

namespace meshlink {

const char* connection_kind_name(ConnectionKind kind) {
    switch (kind) {
        case ConnectionKind::Serial: return "serial";
        case ConnectionKind::Tcp:    return "tcp";
    }
    return "unknown";
}

ConnectionKind parse_connection_kind(const std::string& raw) {
    std::string s = raw;
    for (auto& c : s) c = (char)std::tolower((unsigned char)c);
    if (s == "serial") return ConnectionKind::Serial;
    if (s == "tcp")    return ConnectionKind::Tcp;
    throw MeshError(ErrorCode::InvalidConnectionKind, raw);
}

ConnectionSpec ConnectionSpec::serial(const std::string& port) {
    ConnectionSpec s;
    s.kind = ConnectionKind::Serial;
    s.serial_port = port.empty() ? AUTODETECT_SERIAL : port;
    return s;
}

ConnectionSpec ConnectionSpec::tcp(const std::string& host, uint16_t port) {
    ConnectionSpec s;
    s.kind = ConnectionKind::Tcp;
    s.serial_port.clear();
    s.tcp_host = host;
    s.tcp_port = port;
    return s;
}

bool ConnectionSpec::is_autodetect() const {
    return serial_port.empty() || serial_port == AUTODETECT_SERIAL;
}

uint16_t ConnectionSpec::effective_tcp_port() const {
    return tcp_port ? tcp_port : DEFAULT_TCP_PORT;
}

std::string ConnectionSpec::describe() const {
    if (kind == ConnectionKind::Serial)
        return std::string("serial:") + (is_autodetect() ? AUTODETECT_SERIAL : serial_port);
    return "tcp:" + tcp_host + ":" + std::to_string(effective_tcp_port());
}

std::string ResolvedTransport::key() const {
    if (kind == ConnectionKind::Serial) return "serial:" + serial_port;
    return "tcp:" + tcp_host + ":" + std::to_string(tcp_port);
}

} // namespace meshlink
