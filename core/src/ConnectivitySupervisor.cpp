// Supervisor loop: probe, update state, sleep on a condition variable so stop() can
// cut the wait short, then send the departure notice on the way out.
#include "meterlink/ConnectivitySupervisor.hpp"
#include "meterlink/Log.hpp"
#include <exception>
#include <system_error>

namespace meterlink {

ConnectivitySupervisor::ConnectivitySupervisor(SupervisorConfig cfg) : cfg_(cfg) {}

ConnectivitySupervisor::~ConnectivitySupervisor() {
    stop();
}

bool ConnectivitySupervisor::start(std::unique_ptr<LivenessTransport> transport,
                                   const DeviceIdentity& id,
                                   std::string& err) {
    std::lock_guard<std::mutex> lifecycle(lifecycleMtx_);
    if (running_.load() || th_.joinable()) {
        err = "Liveness loop already running";
        return false;
    }
    if (!id.hasCredentials()) {
        err = "Device id and hardware key are required";
        LOGE("supervisor: %s", err.c_str());
        return false;
    }
    if (!transport) {
        err = "No liveness transport";
        return false;
    }

    transport_ = std::move(transport);
    identity_ = id;
    failureStreak_ = 0;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        stopRequested_ = false;
    }
    setState(ConnectionState::Connecting);
    running_ = true;
    try {
        th_ = std::thread(&ConnectivitySupervisor::loop, this);
    } catch (const std::system_error& e) {
        running_ = false;
        transport_.reset();
        setState(ConnectionState::Disconnected);
        err = std::string("Cannot start liveness loop: ") + e.what();
        LOGE("supervisor: %s", err.c_str());
        return false;
    }
    return true;
}

void ConnectivitySupervisor::stop() {
    std::lock_guard<std::mutex> lifecycle(lifecycleMtx_);
    if (!th_.joinable()) return;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        stopRequested_ = true;
    }
    cv_.notify_all();
    if (transport_) transport_->interrupt();
    if (th_.get_id() == std::this_thread::get_id()) {
        // Re-entrant call from a callback; the destructor joins later
        return;
    }
    LOGI("supervisor: stopping");
    th_.join();
    transport_.reset();
}

void ConnectivitySupervisor::loop() {
    LOGI("supervisor: %s liveness loop started for %s (every %lld ms, probe timeout %lld ms)",
         transport_->name(), identity_.deviceId.c_str(),
         static_cast<long long>(cfg_.interval.count()),
         static_cast<long long>(cfg_.probeTimeout.count()));

    for (;;) {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            if (stopRequested_) break;
        }

        LivenessProbe probe;
        probe.sentAt = std::chrono::steady_clock::now();
        probe.before = state_.load();
        std::string err;
        probe.outcome = transport_->probe(identity_, cfg_.probeTimeout, err);
        probes_.fetch_add(1);
        // Only our own stop() cancels a probe
        if (probe.outcome == ProbeOutcome::Cancelled) break;
        handleProbe(probe, err);

        std::unique_lock<std::mutex> lk(mtx_);
        if (cv_.wait_for(lk, cfg_.interval, [this] { return stopRequested_; })) break;
    }

    sendDeparture();
    setState(ConnectionState::Disconnected);
    running_ = false;
    LOGI("supervisor: stopped after %llu probe(s)", static_cast<unsigned long long>(probes_.load()));
    if (observer_) observer_->onDisconnected();
}

void ConnectivitySupervisor::handleProbe(LivenessProbe& probe, const std::string& err) {
    switch (probe.outcome) {
        case ProbeOutcome::Success:
            failureStreak_ = 0;
            if (state_.load() != ConnectionState::Connected) {
                setState(ConnectionState::Connected);
                LOGI("supervisor: connected (%s)", identity_.deviceId.c_str());
                if (observer_) observer_->onConnected();
            } else {
                LOGD("supervisor: heartbeat ok");
            }
            break;
        case ProbeOutcome::Idle:
            LOGD("supervisor: no traffic, state unchanged");
            break;
        case ProbeOutcome::Timeout:
        case ProbeOutcome::TransportError: {
            const int streak = failureStreak_.fetch_add(1) + 1;
            std::string reason = probe.outcome == ProbeOutcome::Timeout
                ? std::string("Heartbeat timed out")
                : "Heartbeat failed: " + (err.empty() ? std::string("transport error") : err);
            LOGW("supervisor: %s (%d in a row)", reason.c_str(), streak);
            // Connecting is only left by a success; failures while connected degrade
            if (state_.load() == ConnectionState::Connected) setState(ConnectionState::Degraded);
            if (observer_) observer_->onError(reason);
            break;
        }
        case ProbeOutcome::Cancelled:
            break;
    }
    probe.after = state_.load();
    if (probe.after != probe.before) {
        LOGD("supervisor: %s -> %s (%s)", toString(probe.before), toString(probe.after),
             toString(probe.outcome));
    }
}

void ConnectivitySupervisor::sendDeparture() {
    // Best-effort: the process is leaving whatever the server answers
    try {
        std::string err;
        if (transport_->depart(identity_, cfg_.departureTimeout, err)) {
            LOGI("supervisor: departure notice sent");
        } else {
            LOGW("supervisor: departure notice failed: %s", err.c_str());
        }
    } catch (const std::exception& e) {
        LOGW("supervisor: departure notice failed: %s", e.what());
    }
}

void ConnectivitySupervisor::setState(ConnectionState s) {
    const auto prev = state_.exchange(s);
    if (prev != s && observer_) observer_->onStateChanged(s);
}

} // namespace meterlink
