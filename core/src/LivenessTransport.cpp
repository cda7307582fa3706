// Polling and persistent-stream liveness strategies.
#include "meterlink/LivenessTransport.hpp"
#include "meterlink/Log.hpp"
#include <algorithm>
#include <cctype>

namespace meterlink {

ProbeOutcome PollingLivenessTransport::probe(const DeviceIdentity& id,
                                             std::chrono::milliseconds timeout,
                                             std::string& err) {
    if (interrupted()) return ProbeOutcome::Cancelled;
    return api_.sendLivenessProbe(id, timeout, err, [this] { return interrupted(); });
}

bool PollingLivenessTransport::depart(const DeviceIdentity& id,
                                      std::chrono::milliseconds timeout,
                                      std::string& err) {
    return api_.notifyDeparture(id, timeout, err);
}

StreamLivenessTransport::StreamLivenessTransport(std::unique_ptr<StreamChannel> channel,
                                                 std::chrono::milliseconds readTimeout)
    : channel_(std::move(channel)), readTimeout_(readTimeout) {}

static std::string normalized(const std::string& s) {
    auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return std::string();
    auto e = s.find_last_not_of(" \t\r\n");
    std::string out = s.substr(b, e - b + 1);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

ProbeOutcome StreamLivenessTransport::probe(const DeviceIdentity& id,
                                            std::chrono::milliseconds timeout,
                                            std::string& err) {
    if (!channel_) {
        err = "No stream channel";
        return ProbeOutcome::TransportError;
    }
    if (interrupted()) return ProbeOutcome::Cancelled;
    auto cancel = [this] { return interrupted(); };

    // (Re)open: an established channel is itself proof that the server is reachable
    bool fresh = false;
    if (!channel_->isOpen()) {
        if (!channel_->open(id, timeout, err, cancel)) {
            channel_->close();
            return interrupted() ? ProbeOutcome::Cancelled : ProbeOutcome::TransportError;
        }
        LOGI("stream: channel open for %s", id.deviceId.c_str());
        fresh = true;
    }

    if (!channel_->sendText("ping", err)) {
        channel_->close();
        return ProbeOutcome::TransportError;
    }
    LOGD("stream: ping sent");

    using clock = std::chrono::steady_clock;
    const auto deadline = clock::now() + readTimeout_;
    for (;;) {
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now());
        if (left.count() <= 0) return fresh ? ProbeOutcome::Success : ProbeOutcome::Idle;

        std::string msg;
        switch (channel_->readText(msg, left, err, cancel)) {
            case StreamChannel::ReadStatus::Message:
                if (normalized(msg) == "pong") {
                    LOGD("stream: pong received");
                    return ProbeOutcome::Success;
                }
                LOGI("stream: message received: %s", msg.c_str());
                continue;
            case StreamChannel::ReadStatus::Timeout:
                LOGD("stream: no traffic for %lld ms", static_cast<long long>(readTimeout_.count()));
                return fresh ? ProbeOutcome::Success : ProbeOutcome::Idle;
            case StreamChannel::ReadStatus::Closed:
                if (err.empty()) err = "Stream closed by server";
                channel_->close();
                return ProbeOutcome::TransportError;
            case StreamChannel::ReadStatus::Error:
                if (err.empty()) err = "Stream error";
                channel_->close();
                return ProbeOutcome::TransportError;
            case StreamChannel::ReadStatus::Cancelled:
                return ProbeOutcome::Cancelled;
        }
    }
}

bool StreamLivenessTransport::depart(const DeviceIdentity& id,
                                     std::chrono::milliseconds timeout,
                                     std::string& err) {
    (void)id; (void)timeout;
    if (!channel_ || !channel_->isOpen()) {
        if (channel_) channel_->close();
        err = "Stream not open";
        return false;
    }
    channel_->close();
    return true;
}

} // namespace meterlink
