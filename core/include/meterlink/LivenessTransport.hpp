// Liveness strategies. The supervisor only talks to LivenessTransport; the session
// picks the concrete strategy from its configuration.
#pragma once
#include "DeviceApi.hpp"
#include "StreamChannel.hpp"
#include "Types.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <string>

namespace meterlink {

class LivenessTransport {
public:
    virtual ~LivenessTransport() = default;

    virtual const char* name() const = 0;

    // One liveness exchange. Returns within "timeout" for request/response strategies,
    // and promptly with Cancelled once interrupt() was called.
    virtual ProbeOutcome probe(const DeviceIdentity& id,
                               std::chrono::milliseconds timeout,
                               std::string& err) = 0;

    // Best-effort "device is leaving" notice. Not affected by interrupt().
    virtual bool depart(const DeviceIdentity& id,
                        std::chrono::milliseconds timeout,
                        std::string& err) = 0;

    // Thread-safe and sticky: every running or later probe returns Cancelled.
    void interrupt() { interrupted_.store(true); }
    bool interrupted() const { return interrupted_.load(); }

private:
    std::atomic<bool> interrupted_{false};
};

// Polling: every cycle is one heartbeat request; departure is the offline call.
class PollingLivenessTransport : public LivenessTransport {
public:
    explicit PollingLivenessTransport(DeviceApi& api) : api_(api) {}

    const char* name() const override { return "polling"; }
    ProbeOutcome probe(const DeviceIdentity& id,
                       std::chrono::milliseconds timeout,
                       std::string& err) override;
    bool depart(const DeviceIdentity& id,
                std::chrono::milliseconds timeout,
                std::string& err) override;

private:
    DeviceApi& api_; // not owned
};

// Persistent stream: "ping" out, "pong" back. A read timeout only means the line was
// quiet; errors and closes drop the channel and the next probe reopens it.
class StreamLivenessTransport : public LivenessTransport {
public:
    StreamLivenessTransport(std::unique_ptr<StreamChannel> channel,
                            std::chrono::milliseconds readTimeout = std::chrono::seconds(60));

    const char* name() const override { return "stream"; }
    ProbeOutcome probe(const DeviceIdentity& id,
                       std::chrono::milliseconds timeout,
                       std::string& err) override;
    bool depart(const DeviceIdentity& id,
                std::chrono::milliseconds timeout,
                std::string& err) override;

    std::chrono::milliseconds readTimeout() const { return readTimeout_; }

private:
    std::unique_ptr<StreamChannel> channel_;
    std::chrono::milliseconds readTimeout_;
};

} // namespace meterlink
