// Connectivity supervisor: keeps a periodic liveness signal running against the server,
// tracks the connection state and announces departure when stopped.
#pragma once
#include "LivenessTransport.hpp"
#include "Types.hpp"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace meterlink {

// Lifecycle events. Called on the supervisor thread.
class ConnectivityObserver {
public:
    virtual ~ConnectivityObserver() = default;
    virtual void onConnected() = 0;
    virtual void onDisconnected() = 0;
    virtual void onError(const std::string& reason) = 0;
    virtual void onStateChanged(ConnectionState state) { (void)state; }
};

class ConnectivitySupervisor {
public:
    explicit ConnectivitySupervisor(SupervisorConfig cfg = {});
    ~ConnectivitySupervisor();

    ConnectivitySupervisor(const ConnectivitySupervisor&) = delete;
    ConnectivitySupervisor& operator=(const ConnectivitySupervisor&) = delete;

    // Not owned. Set before start().
    void setObserver(ConnectivityObserver* o) { observer_ = o; }

    // Start the liveness loop on its own thread. Fails without starting anything when
    // the identity lacks a device id or hardware key, or when already running.
    bool start(std::unique_ptr<LivenessTransport> transport,
               const DeviceIdentity& id,
               std::string& err);

    // Wake the loop, wait for it to exit and for the departure notice to be attempted.
    // Called from an observer callback it only requests the stop.
    void stop();

    ConnectionState currentState() const { return state_.load(); }
    bool isRunning() const { return running_.load(); }
    int failureStreak() const { return failureStreak_.load(); }
    std::uint64_t probesSent() const { return probes_.load(); }
    const SupervisorConfig& config() const { return cfg_; }

private:
    void loop();
    void handleProbe(LivenessProbe& probe, const std::string& err);
    void sendDeparture();
    void setState(ConnectionState s);

    SupervisorConfig cfg_;
    std::unique_ptr<LivenessTransport> transport_;
    DeviceIdentity identity_;
    ConnectivityObserver* observer_ = nullptr;

    std::atomic<ConnectionState> state_{ConnectionState::Disconnected};
    std::atomic<bool> running_{false};
    std::atomic<int> failureStreak_{0};
    std::atomic<std::uint64_t> probes_{0};

    bool stopRequested_ = false;   // guarded by mtx_
    std::mutex mtx_;
    std::condition_variable cv_;   // interruptible wait between probes
    std::mutex lifecycleMtx_;      // serializes start/stop
    std::thread th_;
};

} // namespace meterlink
