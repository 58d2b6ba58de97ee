// ============================================================================
// connector.cpp — implementation for meshlink/connector.hpp
// ============================================================================

#include "meshlink/connector.hpp"
#include "meshlink/log.hpp"

namespace meshlink {

// ---------- TransportHandle ----------

TransportHandle::TransportHandle(std::unique_ptr<RadioClient> client,
                                 ResolvedTransport resolved,
                                 std::optional<UsbPortInfo> usb,
                                 std::unique_lock<std::mutex> lock)
: client_(std::move(client)),
  resolved_(std::move(resolved)),
  usb_(std::move(usb)),
  lock_(std::move(lock)) {}

TransportHandle::~TransportHandle() {
    close();
}

void TransportHandle::close() noexcept {
    if (client_) {
        std::unique_ptr<RadioClient> c = std::move(client_);  // never close twice
        try {
            c->close();
        } catch (const std::exception& e) {
            log::warn("close_failed").kv("target", resolved_.key()).kv("reason", e.what());
        }
    }
    if (lock_.owns_lock()) lock_.unlock();
}

// ---------- Connector ----------

Connector::Connector(PortEnumerator ports, std::shared_ptr<DeviceLibrary> library)
: ports_(std::move(ports)), library_(std::move(library)) {}

std::mutex& Connector::resource_mutex(const std::string& key) {
    std::lock_guard<std::mutex> lk(locks_mu_);
    auto& slot = locks_[key];
    if (!slot) slot = std::make_unique<std::mutex>();
    return *slot;
}

TransportHandle Connector::open_transport(const ConnectionSpec& spec) {
    ResolvedTransport where;
    std::optional<UsbPortInfo> usb;

    // Phase 1: resolve the configured address to a concrete resource.
    switch (spec.kind) {
        case ConnectionKind::Serial: {
            usb = ports_.find_port(spec.serial_port);
            if (!usb) throw MeshError(ErrorCode::SerialPortNotFound, spec.serial_port);
            where.kind = ConnectionKind::Serial;
            where.serial_port = usb->device;
            break;
        }
        case ConnectionKind::Tcp: {
            if (spec.tcp_host.empty()) throw MeshError(ErrorCode::TcpHostMissing);
            where.kind = ConnectionKind::Tcp;
            where.tcp_host = spec.tcp_host;
            where.tcp_port = spec.effective_tcp_port();
            break;
        }
        default:
            throw MeshError(ErrorCode::InvalidConnectionKind);
    }

    if (!library_) throw MeshError(ErrorCode::DeviceLibraryUnavailable);

    // Phase 2: one session per physical resource.
    std::unique_lock<std::mutex> lock(resource_mutex(where.key()));

    // Phase 3: open. The library reports typed failures; anything else is wrapped.
    std::unique_ptr<RadioClient> client;
    try {
        client = where.kind == ConnectionKind::Serial
                     ? library_->open_serial(where.serial_port)
                     : library_->open_tcp(where.tcp_host, where.tcp_port);
    } catch (const MeshError&) {
        throw;
    } catch (const std::exception& e) {
        throw MeshError(ErrorCode::ConnectionFailed, e.what());
    }
    if (!client) throw MeshError(ErrorCode::ConnectionFailed, where.key() + ": no_client");

    log::debug("transport_open").kv("target", where.key()).kv("library", library_->name());
    return TransportHandle(std::move(client), std::move(where), std::move(usb), std::move(lock));
}

} // namespace meshlink
