#pragma once
/**
 * @file connector.hpp
 * @brief Connection resolver and scoped transport lifetime.
 *
 * @details
 * PURPOSE
 * -------
 * Turns a ConnectionSpec into an open RadioClient and guarantees the client
 * is closed exactly once, whatever happens while it is in use.
 *
 *   spec --resolve--> ResolvedTransport --lock resource--> library.open_*()
 *        --> TransportHandle (RAII) --> ~TransportHandle: close(), unlock
 *
 * FAILURES (open_transport)
 * -------------------------
 *  - SerialPortNotFound        serial spec, find_port() found nothing
 *  - TcpHostMissing            tcp spec with an empty host
 *  - DeviceLibraryUnavailable  no client library configured
 *  - ConnectionFailed(detail)  anything the library raised while opening
 *  - InvalidConnectionKind     kind outside Serial/Tcp
 *  - SerialBackendUnavailable  the port listing itself failed
 *
 * ONE SESSION PER RADIO
 * ---------------------
 * Opening two sessions against one serial port or one TCP radio is undefined
 * at the firmware level. The connector keeps one mutex per resolved resource
 * key; a TransportHandle holds that lock for its whole lifetime, so a command
 * issued while a poll is in flight waits for the poll's handle to close.
 *
 * CLOSE
 * -----
 * Close failures are logged at warn level and swallowed: the handle is being
 * discarded regardless, and the caller's real result (telemetry, command
 * outcome, or the original exception) must not be replaced by a close error.
 */

#include "meshlink/connection.hpp"
#include "meshlink/errors.hpp"
#include "meshlink/radio_client.hpp"
#include "meshlink/telemetry.hpp"
#include "port_enumerator.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

namespace meshlink {

class TransportHandle {
public:
    TransportHandle(std::unique_ptr<RadioClient> client,
                    ResolvedTransport resolved,
                    std::optional<UsbPortInfo> usb,
                    std::unique_lock<std::mutex> lock);
    ~TransportHandle();

    TransportHandle(TransportHandle&&) = default;
    TransportHandle& operator=(TransportHandle&&) = delete;
    TransportHandle(const TransportHandle&) = delete;
    TransportHandle& operator=(const TransportHandle&) = delete;

    RadioClient& client() { return *client_; }
    const RadioClient& client() const { return *client_; }

    const ResolvedTransport&          resolved() const { return resolved_; }
    const std::optional<UsbPortInfo>& usb() const { return usb_; }

    /// Close now (idempotent). Errors are logged, never thrown. Releases the resource lock.
    void close() noexcept;

private:
    std::unique_ptr<RadioClient> client_;
    ResolvedTransport            resolved_;
    std::optional<UsbPortInfo>   usb_;
    std::unique_lock<std::mutex> lock_;
};

class Connector {
public:
    /// @param library  may be null; every open then fails with DeviceLibraryUnavailable.
    Connector(PortEnumerator ports, std::shared_ptr<DeviceLibrary> library);

    Connector(const Connector&) = delete;
    Connector& operator=(const Connector&) = delete;

    /**
     * @brief Resolve and open. See the failure list in the file header.
     */
    TransportHandle open_transport(const ConnectionSpec& spec);

    /**
     * @brief Open, run @p fn(handle), close. The one helper every caller uses.
     *
     * Typed MeshErrors from @p fn propagate unchanged; any other std::exception
     * is wrapped as ConnectionFailed(what). The handle closes in both cases.
     */
    template <typename Fn>
    auto with_transport(const ConnectionSpec& spec, Fn&& fn)
        -> decltype(fn(std::declval<TransportHandle&>())) {
        TransportHandle handle = open_transport(spec);
        try {
            return fn(handle);
        } catch (const MeshError&) {
            throw;
        } catch (const std::exception& e) {
            throw MeshError(ErrorCode::ConnectionFailed, e.what());
        }
    }

    const PortEnumerator& ports() const { return ports_; }

private:
    std::mutex& resource_mutex(const std::string& key);

    PortEnumerator                 ports_;
    std::shared_ptr<DeviceLibrary> library_;

    std::mutex                                         locks_mu_;
    std::map<std::string, std::unique_ptr<std::mutex>> locks_;
};

} // namespace meshlink
