// ============================================================================
// poll_scheduler.cpp — implementation for meshlink/poll_scheduler.hpp
// ============================================================================

#include "meshlink/poll_scheduler.hpp"
#include "meshlink/connector.hpp"
#include "meshlink/device_reader.hpp"
#include "meshlink/errors.hpp"
#include "meshlink/log.hpp"

#include <string>

namespace meshlink {

void validate_scan_interval(int seconds) {
    if (seconds < MIN_SCAN_INTERVAL_S || seconds > MAX_SCAN_INTERVAL_S)
        throw MeshError(ErrorCode::InvalidArgument,
                        "scan_interval must be in [" + std::to_string(MIN_SCAN_INTERVAL_S) +
                        ", " + std::to_string(MAX_SCAN_INTERVAL_S) + "], got " +
                        std::to_string(seconds));
}

const char* poll_state_name(PollState s) {
    switch (s) {
        case PollState::Idle:    return "idle";
        case PollState::Polling: return "polling";
        case PollState::Stopped: return "stopped";
    }
    return "unknown";
}

PollScheduler::PollScheduler(Connector& connector, ConnectionSpec spec, int interval_s)
: PollScheduler(Reader([&connector](const ConnectionSpec& s) { return read_device(connector, s); }),
                std::move(spec), interval_s) {}

PollScheduler::PollScheduler(Reader reader, ConnectionSpec spec, int interval_s)
: reader_(std::move(reader)), spec_(std::move(spec)), interval_s_(interval_s),
  period_(std::chrono::seconds(interval_s)) {
    validate_scan_interval(interval_s);
}

PollScheduler::PollScheduler(Reader reader, ConnectionSpec spec, std::chrono::milliseconds period)
: reader_(std::move(reader)), spec_(std::move(spec)),
  interval_s_(static_cast<int>(std::chrono::duration_cast<std::chrono::seconds>(period).count())),
  period_(period) {
    if (period_.count() <= 0)
        throw MeshError(ErrorCode::InvalidArgument, "poll period must be positive");
}

PollScheduler::~PollScheduler() {
    stop();
}

// ---------- lifecycle ----------

std::shared_ptr<const DeviceSnapshot> PollScheduler::first_refresh() {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (started_ || stop_)
            throw MeshError(ErrorCode::InvalidArgument, "scheduler already started");
        started_ = true;
        refresh_requested_ = true;
    }
    worker_ = std::thread(&PollScheduler::run, this);

    std::shared_ptr<const DeviceSnapshot> first;
    {
        std::unique_lock<std::mutex> lk(mu_);
        published_.wait(lk, [this] { return generation_ >= 1 || stop_; });
        first = latest_;
    }
    if (!first || !first->ok()) {
        stop();
        throw MeshError(ErrorCode::NotReady,
                        first && first->error ? *first->error : std::string("stopped"));
    }
    return first;
}

void PollScheduler::stop() {
    {
        std::lock_guard<std::mutex> lk(mu_);
        stop_ = true;
        state_ = PollState::Stopped;
    }
    wake_.notify_all();
    published_.notify_all();
    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id())
        worker_.join();
}

uint64_t PollScheduler::request_refresh() {
    uint64_t target;
    {
        std::lock_guard<std::mutex> lk(mu_);
        refresh_requested_ = true;
        // A poll already in flight may have read state from before the request.
        target = generation_ + (state_ == PollState::Polling ? 2 : 1);
    }
    wake_.notify_all();
    return target;
}

bool PollScheduler::wait_for_generation(uint64_t generation, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(mu_);
    published_.wait_for(lk, timeout, [&] { return generation_ >= generation || stop_; });
    return generation_ >= generation;
}

// ---------- accessors ----------

std::shared_ptr<const DeviceSnapshot> PollScheduler::latest() const {
    std::lock_guard<std::mutex> lk(mu_);
    return latest_;
}

uint64_t PollScheduler::generation() const {
    std::lock_guard<std::mutex> lk(mu_);
    return generation_;
}

PollState PollScheduler::state() const {
    std::lock_guard<std::mutex> lk(mu_);
    return state_;
}

std::size_t PollScheduler::add_listener(Listener fn) {
    std::lock_guard<std::mutex> lk(mu_);
    const std::size_t id = next_listener_id_++;
    listeners_.emplace_back(id, std::move(fn));
    return id;
}

void PollScheduler::remove_listener(std::size_t id) {
    std::lock_guard<std::mutex> lk(mu_);
    for (auto it = listeners_.begin(); it != listeners_.end(); ++it) {
        if (it->first == id) { listeners_.erase(it); return; }
    }
}

// ---------- worker ----------

DeviceSnapshot PollScheduler::poll_once() const {
    try {
        return reader_(spec_);
    } catch (const std::exception& e) {
        DeviceSnapshot failed;
        failed.spec  = spec_;
        failed.error = e.what();
        return failed;
    } catch (...) {
        DeviceSnapshot failed;
        failed.spec  = spec_;
        failed.error = "unknown_error";
        return failed;
    }
}

void PollScheduler::notify(const std::shared_ptr<const DeviceSnapshot>& snap) {
    std::vector<std::pair<std::size_t, Listener>> targets;
    {
        std::lock_guard<std::mutex> lk(mu_);
        targets = listeners_;
    }
    for (const auto& l : targets) {
        try {
            l.second(*snap);
        } catch (const std::exception& e) {
            log::warn("listener_failed").kv("target", spec_.describe()).kv("reason", e.what());
        }
    }
}

void PollScheduler::run() {
    using clock = std::chrono::steady_clock;
    std::unique_lock<std::mutex> lk(mu_);
    auto next_due = clock::now();

    while (!stop_) {
        wake_.wait_until(lk, next_due, [this] { return stop_ || refresh_requested_; });
        if (stop_) break;
        refresh_requested_ = false;
        state_ = PollState::Polling;
        lk.unlock();

        auto snap = std::make_shared<const DeviceSnapshot>(poll_once());
        if (snap->ok()) log::debug("poll_ok").kv("target", spec_.describe());
        else            log::warn("poll_failed").kv("target", spec_.describe()).kv("reason", *snap->error);

        lk.lock();
        if (stop_) break;
        latest_ = snap;
        ++generation_;
        state_ = PollState::Idle;
        next_due = clock::now() + period_;
        lk.unlock();

        published_.notify_all();
        notify(snap);
        lk.lock();
    }
    state_ = PollState::Stopped;
}

} // namespace meshlink
