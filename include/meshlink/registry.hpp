#pragma once
/**
 * @file registry.hpp
 * @brief Application-owned set of managed connections and their services.
 *
 * @details
 * PURPOSE
 * -------
 * Holds every configured connection (id -> spec + poll scheduler) and the
 * service table that commands are dispatched through. Owned by the
 * application; there is no global instance.
 *
 * LIFECYCLE
 * ---------
 *   setup(id, spec, interval)
 *     1. build a PollScheduler for spec
 *     2. first_refresh(): NotReady propagates and nothing is registered
 *     3. first setup only: install the service table (std::call_once)
 *     4. insert id -> connection (scheduler keeps polling on its worker)
 *   setup_or_defer(id, spec, interval)
 *     setup(); on NotReady log a warning and park (id, spec, interval)
 *   retry_pending()
 *     one setup attempt per parked connection; still-failing ones stay parked
 *   teardown(id)
 *     stop the scheduler, remove the connection (or drop it from the parked set)
 *
 * SELECTORS
 * ---------
 * resolve(selector) picks the connection a service call addresses:
 *   explicit id        -> that connection, else UnknownConnection(id)
 *   none, one entry    -> that entry
 *   none, no entries   -> NoConnections
 *   none, several      -> AmbiguousConnection
 */

#include "meshlink/connection.hpp"
#include "meshlink/poll_scheduler.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace meshlink {

class Connector;

struct ManagedConnection {
    std::string                    id;
    ConnectionSpec                 spec;
    std::unique_ptr<PollScheduler> scheduler;
};

class ConnectionRegistry;

/// One service: (registry, JSON arguments) -> JSON result.
using ServiceHandler = std::function<nlohmann::json(ConnectionRegistry&, const nlohmann::json&)>;

class ConnectionRegistry {
public:
    explicit ConnectionRegistry(Connector& connector);
    ~ConnectionRegistry();

    ConnectionRegistry(const ConnectionRegistry&) = delete;
    ConnectionRegistry& operator=(const ConnectionRegistry&) = delete;

    /**
     * @brief Start managing a connection.
     * @return The first snapshot.
     * @throws MeshError(InvalidArgument) on a duplicate id or bad interval.
     * @throws MeshError(NotReady, cause) if the first poll failed.
     */
    std::shared_ptr<const DeviceSnapshot> setup(const std::string& id, const ConnectionSpec& spec,
                                                int interval_s = DEFAULT_SCAN_INTERVAL_S);

    /**
     * @brief setup(), except that a failed first poll parks the connection for retry_pending().
     * @return The first snapshot, or null when the connection was parked.
     * @throws MeshError as setup() does, except NotReady.
     */
    std::shared_ptr<const DeviceSnapshot> setup_or_defer(const std::string& id, const ConnectionSpec& spec,
                                                         int interval_s = DEFAULT_SCAN_INTERVAL_S);

    using Activated = std::pair<std::string, std::shared_ptr<const DeviceSnapshot>>;

    /// Retry every parked setup once. Returns (id, first snapshot) for each one that came up.
    std::vector<Activated> retry_pending();

    /// Ids parked by setup_or_defer() and not yet up.
    std::vector<std::string> pending_ids() const;

    /// Stop and remove (or un-park). False if @p id was neither managed nor parked.
    bool teardown(const std::string& id);

    /// Stop and remove everything.
    void teardown_all();

    /// @throws MeshError(UnknownConnection | NoConnections | AmbiguousConnection)
    std::shared_ptr<ManagedConnection> resolve(const std::optional<std::string>& selector) const;

    std::vector<std::string> ids() const;

    // ---- services ----

    void register_service(const std::string& name, ServiceHandler handler);
    bool services_registered() const;

    /// @throws MeshError(InvalidArgument) for an unknown service; handler errors propagate.
    nlohmann::json call(const std::string& name, const nlohmann::json& args);

    Connector& connector() { return connector_; }

private:
    Connector& connector_;

    mutable std::mutex mu_;
    std::map<std::string, std::shared_ptr<ManagedConnection>> connections_;

    struct PendingSetup {
        ConnectionSpec spec;
        int            interval_s;
    };
    std::map<std::string, PendingSetup> pending_;
    std::map<std::string, ServiceHandler> services_;
    bool services_registered_{false};
    std::once_flag services_once_;
};

} // namespace meshlink
