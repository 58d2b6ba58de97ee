// ============================================================================
// errors.cpp — implementation for meshlink/errors.hpp
// ============================================================================

#include "meshlink/errors.hpp"

namespace meshlink {

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::SerialPortNotFound:       return "serial_port_not_found";
        case ErrorCode::TcpHostMissing:           return "tcp_host_missing";
        case ErrorCode::DeviceLibraryUnavailable: return "device_library_unavailable";
        case ErrorCode::SerialBackendUnavailable: return "serial_backend_unavailable";
        case ErrorCode::ConnectionFailed:         return "connection_failed";
        case ErrorCode::InvalidConnectionKind:    return "invalid_connection_type";
        case ErrorCode::UnsupportedOperation:     return "unsupported_operation";
        case ErrorCode::InvalidArgument:          return "invalid_argument";
        case ErrorCode::NotReady:                 return "not_ready";
        case ErrorCode::UnknownConnection:        return "unknown_connection";
        case ErrorCode::NoConnections:            return "no_connections";
        case ErrorCode::AmbiguousConnection:      return "ambiguous_connection";
    }
    return "unknown_error";
}

static std::string render(ErrorCode code, const std::string& detail) {
    std::string s = error_code_name(code);
    if (!detail.empty()) {
        s += ':';
        s += detail;
    }
    return s;
}

MeshError::MeshError(ErrorCode code, const std::string& detail)
: std::runtime_error(render(code, detail)), code_(code), detail_(detail) {}

} // namespace meshlink
