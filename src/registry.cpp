// ============================================================================
// registry.cpp — implementation for meshlink/registry.hpp
// ============================================================================

#include "meshlink/registry.hpp"
#include "command_dispatch.hpp"
#include "meshlink/connector.hpp"
#include "meshlink/errors.hpp"
#include "meshlink/log.hpp"

#include <utility>

namespace meshlink {

ConnectionRegistry::ConnectionRegistry(Connector& connector) : connector_(connector) {}

ConnectionRegistry::~ConnectionRegistry() {
    teardown_all();
}

std::shared_ptr<const DeviceSnapshot>
ConnectionRegistry::setup(const std::string& id, const ConnectionSpec& spec, int interval_s) {
    if (id.empty())
        throw MeshError(ErrorCode::InvalidArgument, "connection id must not be empty");
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (connections_.count(id))
            throw MeshError(ErrorCode::InvalidArgument, "duplicate connection id: " + id);
    }

    auto conn = std::make_shared<ManagedConnection>();
    conn->id        = id;
    conn->spec      = spec;
    conn->scheduler = std::make_unique<PollScheduler>(connector_, spec, interval_s);

    // NotReady leaves the registry untouched; conn and its stopped scheduler die here.
    std::shared_ptr<const DeviceSnapshot> first = conn->scheduler->first_refresh();

    // Services go in before the connection is visible; concurrent setups
    // block in call_once until the table is complete.
    std::call_once(services_once_, [this] {
        install_services(*this);
        std::lock_guard<std::mutex> lk(mu_);
        services_registered_ = true;
    });

    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!connections_.emplace(id, conn).second)
            throw MeshError(ErrorCode::InvalidArgument, "duplicate connection id: " + id);
    }

    log::info("connection_setup").kv("id", id).kv("target", spec.describe())
        .kv("interval_s", interval_s);
    return first;
}

std::shared_ptr<const DeviceSnapshot>
ConnectionRegistry::setup_or_defer(const std::string& id, const ConnectionSpec& spec, int interval_s) {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (pending_.count(id))
            throw MeshError(ErrorCode::InvalidArgument, "duplicate connection id: " + id);
    }
    try {
        return setup(id, spec, interval_s);
    } catch (const MeshError& e) {
        if (e.code() != ErrorCode::NotReady) throw;
        log::warn("not_ready").kv("id", id).kv("target", spec.describe()).kv("reason", e.detail());
        std::lock_guard<std::mutex> lk(mu_);
        pending_[id] = PendingSetup{spec, interval_s};
        return nullptr;
    }
}

std::vector<ConnectionRegistry::Activated> ConnectionRegistry::retry_pending() {
    std::map<std::string, PendingSetup> due;
    {
        std::lock_guard<std::mutex> lk(mu_);
        due.swap(pending_);
    }

    std::vector<Activated> up;
    for (const auto& kv : due) {
        try {
            if (auto first = setup_or_defer(kv.first, kv.second.spec, kv.second.interval_s))
                up.emplace_back(kv.first, std::move(first));
        } catch (const MeshError& e) {
            // e.g. the id was set up directly in the meantime
            log::warn("retry_dropped").kv("id", kv.first).kv("reason", e.what());
        }
    }
    return up;
}

std::vector<std::string> ConnectionRegistry::pending_ids() const {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<std::string> out;
    out.reserve(pending_.size());
    for (const auto& kv : pending_) out.push_back(kv.first);
    return out;
}

bool ConnectionRegistry::teardown(const std::string& id) {
    std::shared_ptr<ManagedConnection> conn;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (pending_.erase(id)) return true;
        auto it = connections_.find(id);
        if (it == connections_.end()) return false;
        conn = it->second;
        connections_.erase(it);
    }
    conn->scheduler->stop();
    log::info("connection_teardown").kv("id", id);
    return true;
}

void ConnectionRegistry::teardown_all() {
    {
        std::lock_guard<std::mutex> lk(mu_);
        pending_.clear();
    }
    for (const auto& id : ids()) teardown(id);
}

std::shared_ptr<ManagedConnection>
ConnectionRegistry::resolve(const std::optional<std::string>& selector) const {
    std::lock_guard<std::mutex> lk(mu_);
    if (selector && !selector->empty()) {
        auto it = connections_.find(*selector);
        if (it == connections_.end()) throw MeshError(ErrorCode::UnknownConnection, *selector);
        return it->second;
    }
    if (connections_.empty()) throw MeshError(ErrorCode::NoConnections);
    if (connections_.size() > 1) throw MeshError(ErrorCode::AmbiguousConnection);
    return connections_.begin()->second;
}

std::vector<std::string> ConnectionRegistry::ids() const {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<std::string> out;
    out.reserve(connections_.size());
    for (const auto& kv : connections_) out.push_back(kv.first);
    return out;
}

// ---------- services ----------

void ConnectionRegistry::register_service(const std::string& name, ServiceHandler handler) {
    std::lock_guard<std::mutex> lk(mu_);
    services_[name] = std::move(handler);
}

bool ConnectionRegistry::services_registered() const {
    std::lock_guard<std::mutex> lk(mu_);
    return services_registered_;
}

nlohmann::json ConnectionRegistry::call(const std::string& name, const nlohmann::json& args) {
    ServiceHandler handler;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = services_.find(name);
        if (it == services_.end()) throw MeshError(ErrorCode::InvalidArgument, "unknown service: " + name);
        handler = it->second;
    }
    return handler(*this, args);
}

} // namespace meshlink
