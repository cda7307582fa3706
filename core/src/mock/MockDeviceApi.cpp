// Mock implementation: answers from in-memory scripts, counts every call.
#include "meterlink/MockDeviceApi.hpp"
#include "meterlink/Log.hpp"
#include <algorithm>
#include <stdexcept>
#include <thread>

namespace meterlink {

bool MockDeviceApi::sleepFor(std::chrono::milliseconds d, const CancelCB& shouldCancel) {
    using clock = std::chrono::steady_clock;
    const auto until = clock::now() + d;
    while (clock::now() < until) {
        if (shouldCancel && shouldCancel()) return false;
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(until - clock::now());
        std::this_thread::sleep_for(std::min(left, std::chrono::milliseconds(5)));
    }
    return !(shouldCancel && shouldCancel());
}

bool MockDeviceApi::registerDevice(const DeviceIdentity& id, std::string& message, std::string& err) {
    registers_.fetch_add(1);
    if (id.deviceId.empty() || id.deviceName.empty()) {
        err = "Device ID and name are required";
        return false;
    }
    std::lock_guard<std::mutex> lk(mtx_);
    if (!registerOk_) {
        err = registerDetail_.empty() ? std::string("Registration refused") : registerDetail_;
        return false;
    }
    message = "Device " + id.deviceId + " registered";
    return true;
}

bool MockDeviceApi::authenticateDevice(const DeviceIdentity& id, std::string& message, std::string& err) {
    authenticates_.fetch_add(1);
    std::lock_guard<std::mutex> lk(mtx_);
    if (!authOk_ || !id.hasCredentials()) {
        err = authDetail_.empty() ? std::string("Authentication failed") : authDetail_;
        return false;
    }
    message = "Device authenticated";
    return true;
}

ProbeOutcome MockDeviceApi::sendLivenessProbe(const DeviceIdentity& id,
                                              std::chrono::milliseconds timeout,
                                              std::string& err,
                                              CancelCB shouldCancel) {
    (void)id;
    probes_.fetch_add(1);
    ProbeOutcome outcome;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (!probeScript_.empty()) {
            outcome = probeScript_.front();
            probeScript_.pop_front();
        } else {
            outcome = defaultProbe_;
        }
    }

    const std::chrono::milliseconds delay(probeDelayMs_.load());
    if (delay > timeout) {
        // The server is slower than the caller is willing to wait
        if (!sleepFor(timeout, shouldCancel)) return ProbeOutcome::Cancelled;
        err = "Heartbeat request timed out";
        return ProbeOutcome::Timeout;
    }
    if (!sleepFor(delay, shouldCancel)) return ProbeOutcome::Cancelled;

    if (outcome == ProbeOutcome::TransportError) err = "Simulated connection refused";
    if (outcome == ProbeOutcome::Timeout) err = "Heartbeat request timed out";
    return outcome;
}

bool MockDeviceApi::notifyDeparture(const DeviceIdentity& id,
                                    std::chrono::milliseconds timeout,
                                    std::string& err) {
    (void)id; (void)timeout;
    departures_.fetch_add(1);
    if (departureFails_.load()) {
        err = "Simulated offline failure";
        return false;
    }
    return true;
}

bool MockDeviceApi::setDeviceStatus(const DeviceIdentity& id, const std::string& status, std::string& err) {
    if (!id.hasCredentials()) {
        err = "Device ID and hardware key are required";
        return false;
    }
    std::lock_guard<std::mutex> lk(mtx_);
    statuses_.push_back(status);
    return true;
}

bool MockDeviceApi::transferFile(const DeviceIdentity& id,
                                 const TransferItem& item,
                                 TransferReceipt& receipt,
                                 std::string& err,
                                 ProgressCB progress,
                                 CancelCB shouldCancel) {
    (void)id;
    if (shouldCancel && shouldCancel()) {
        err = "Canceled";
        return false;
    }
    UploadBehavior b;
    std::uint64_t fileNo = 0;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        auto it = behaviors_.find(item.path);
        b = (it != behaviors_.end()) ? it->second : defaultBehavior_;
        fileNo = nextFileId_++;
    }

    uploads_.fetch_add(1);
    const int now = active_.fetch_add(1) + 1;
    int prev = maxActive_.load();
    while (now > prev && !maxActive_.compare_exchange_weak(prev, now)) {}

    // Four progress steps spread over the delay; the request itself is not cancellable
    const std::size_t total = item.size > 0 ? static_cast<std::size_t>(item.size) : 4;
    for (int step = 1; step <= 4; ++step) {
        sleepFor(b.delay / 4, {});
        if (progress) progress(total * step / 4, total);
    }
    active_.fetch_sub(1);

    if (b.throws) throw std::runtime_error(b.error);
    if (b.fail) {
        err = b.error;
        return false;
    }

    receipt.fileId = b.fileId.empty() ? "mock-" + std::to_string(fileNo) : b.fileId;
    receipt.originalSize = item.size;
    receipt.compressedSize = b.compressedSize;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        uploaded_.push_back(item.path);
    }
    LOGD("mock: stored %s as %s", item.path.c_str(), receipt.fileId.c_str());
    return true;
}

void MockDeviceApi::setAuthenticateResult(bool ok, std::string detail) {
    std::lock_guard<std::mutex> lk(mtx_);
    authOk_ = ok;
    authDetail_ = std::move(detail);
}

void MockDeviceApi::setRegisterResult(bool ok, std::string detail) {
    std::lock_guard<std::mutex> lk(mtx_);
    registerOk_ = ok;
    registerDetail_ = std::move(detail);
}

void MockDeviceApi::scriptProbes(std::vector<ProbeOutcome> outcomes) {
    std::lock_guard<std::mutex> lk(mtx_);
    probeScript_.assign(outcomes.begin(), outcomes.end());
}

void MockDeviceApi::setDefaultProbe(ProbeOutcome o) {
    std::lock_guard<std::mutex> lk(mtx_);
    defaultProbe_ = o;
}

void MockDeviceApi::setUploadBehavior(const std::string& path, UploadBehavior b) {
    std::lock_guard<std::mutex> lk(mtx_);
    behaviors_[path] = std::move(b);
}

void MockDeviceApi::setDefaultUploadBehavior(UploadBehavior b) {
    std::lock_guard<std::mutex> lk(mtx_);
    defaultBehavior_ = std::move(b);
}

std::vector<std::string> MockDeviceApi::uploadedPaths() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return uploaded_;
}

std::vector<std::string> MockDeviceApi::statuses() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return statuses_;
}

} // namespace meterlink
