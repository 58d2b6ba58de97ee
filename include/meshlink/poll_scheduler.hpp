#pragma once
/**
 * @file poll_scheduler.hpp
 * @brief Periodic telemetry polling for one connection.
 *
 * @details
 * PURPOSE
 * -------
 * Keeps the latest DeviceSnapshot for one configured radio fresh. One
 * scheduler per connection, one worker thread per scheduler; schedulers share
 * nothing but the Connector (whose per-radio lock serializes them against
 * commands on the same device).
 *
 * STATE MACHINE
 * -------------
 *   Idle --(interval elapsed | refresh requested)--> Polling --(publish)--> Idle
 *   any  --stop()--> Stopped
 *
 * Polls always run on the worker thread. A poll that hangs on I/O stalls only
 * this connection, and only until the link timeout fires.
 *
 * ERROR ISOLATION
 * ---------------
 * A failed poll publishes {telemetry absent, error=message} and the next tick
 * proceeds normally. The scheduler itself never fails after setup.
 * The first poll is the exception: first_refresh() waits for it and raises
 * MeshError(NotReady, cause) if it failed, leaving the scheduler stopped.
 *
 * LISTENERS
 * ---------
 * Called on the worker thread after every publish, in registration order. A
 * listener that throws is logged and skipped. Listeners must not call stop().
 */

#include "meshlink/connection.hpp"
#include "meshlink/telemetry.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

namespace meshlink {

class Connector;

constexpr int DEFAULT_SCAN_INTERVAL_S = 30;
constexpr int MIN_SCAN_INTERVAL_S     = 10;
constexpr int MAX_SCAN_INTERVAL_S     = 3600;

/// @throws MeshError(InvalidArgument) unless MIN_SCAN_INTERVAL_S <= seconds <= MAX_SCAN_INTERVAL_S.
void validate_scan_interval(int seconds);

enum class PollState { Idle, Polling, Stopped };

const char* poll_state_name(PollState s);

class PollScheduler {
public:
    using Reader   = std::function<DeviceSnapshot(const ConnectionSpec&)>;
    using Listener = std::function<void(const DeviceSnapshot&)>;

    /// Polls through read_device(connector, spec).
    PollScheduler(Connector& connector, ConnectionSpec spec,
                  int interval_s = DEFAULT_SCAN_INTERVAL_S);

    /// Polls through an arbitrary reader (tests, alternative sources).
    PollScheduler(Reader reader, ConnectionSpec spec,
                  int interval_s = DEFAULT_SCAN_INTERVAL_S);

    /// Sub-second periods for tests; no scan-interval bounds apply.
    /// @throws MeshError(InvalidArgument) unless @p period is positive.
    PollScheduler(Reader reader, ConnectionSpec spec, std::chrono::milliseconds period);

    ~PollScheduler();

    PollScheduler(const PollScheduler&) = delete;
    PollScheduler& operator=(const PollScheduler&) = delete;

    /**
     * @brief Start the worker and wait for its first poll.
     * @return The first snapshot (always ok()).
     * @throws MeshError(NotReady, cause) if the first poll failed; the worker is stopped.
     * @throws MeshError(InvalidArgument) if called twice.
     */
    std::shared_ptr<const DeviceSnapshot> first_refresh();

    /// Ask for an immediate poll. Returns the generation that will contain it.
    uint64_t request_refresh();

    /// Wait until at least @p generation polls have been published. False on timeout or stop.
    bool wait_for_generation(uint64_t generation, std::chrono::milliseconds timeout);

    /// Latest published snapshot; null before the first poll completes.
    std::shared_ptr<const DeviceSnapshot> latest() const;

    uint64_t  generation() const;
    PollState state() const;

    const ConnectionSpec& spec() const { return spec_; }
    int interval_s() const { return interval_s_; }

    std::size_t add_listener(Listener fn);
    void        remove_listener(std::size_t id);

    /// Stop and join the worker. Idempotent.
    void stop();

private:
    void          run();
    DeviceSnapshot poll_once() const;
    void          notify(const std::shared_ptr<const DeviceSnapshot>& snap);

    Reader         reader_;
    ConnectionSpec spec_;
    int            interval_s_;
    std::chrono::milliseconds period_;

    mutable std::mutex      mu_;
    std::condition_variable wake_;        // worker: refresh request or stop
    std::condition_variable published_;   // waiters: new generation or stop
    bool      started_{false};
    bool      stop_{false};
    bool      refresh_requested_{false};
    PollState state_{PollState::Idle};
    uint64_t  generation_{0};
    std::shared_ptr<const DeviceSnapshot> latest_;

    std::size_t next_listener_id_{1};
    std::vector<std::pair<std::size_t, Listener>> listeners_;

    std::thread worker_;
};

} // namespace meshlink
