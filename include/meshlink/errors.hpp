#pragma once
/**
 * @file errors.hpp
 * @brief Typed failures raised by the meshlink core.
 *
 * @details
 * PURPOSE
 * -------
 * Every failure the core can report is one of a short, fixed list. Callers
 * switch on @ref meshlink::ErrorCode to decide what to tell a user; they never
 * string-match messages. The message text is still stable and script-friendly
 * (e.g. "serial_port_not_found", "unsupported_operation:reboot").
 *
 * PROPAGATION
 * -----------
 * - Discovery and port enumeration absorb failures into "no candidates".
 * - The first read of a new connection surfaces as ErrorCode::NotReady.
 * - Steady-state polls capture the message into the snapshot error field.
 * - Commands always propagate to their caller.
 * - Transport close failures are logged and swallowed at every call site.
 */

#include <stdexcept>
#include <string>

namespace meshlink {

enum class ErrorCode {
    SerialPortNotFound,
    TcpHostMissing,
    DeviceLibraryUnavailable,
    SerialBackendUnavailable,
    ConnectionFailed,
    InvalidConnectionKind,
    UnsupportedOperation,
    InvalidArgument,

    // Setup and connection-selector failures
    NotReady,
    UnknownConnection,
    NoConnections,
    AmbiguousConnection
};

/**
 * @brief Stable lowercase token for an error code ("tcp_host_missing", ...).
 */
const char* error_code_name(ErrorCode code);

/**
 * @class MeshError
 * @brief The single exception type thrown by the core.
 *
 * what() renders as "<code>" or "<code>:<detail>" when a detail is attached.
 * detail() is the free-form part alone (the lower-level error for
 * ConnectionFailed, the operation name for UnsupportedOperation, the reason
 * for InvalidArgument).
 */
class MeshError : public std::runtime_error {
public:
    explicit MeshError(ErrorCode code, const std::string& detail = {});

    ErrorCode code() const noexcept { return code_; }
    const std::string& detail() const noexcept { return detail_; }

private:
    ErrorCode   code_;
    std::string detail_;
};

} // namespace meshlink
