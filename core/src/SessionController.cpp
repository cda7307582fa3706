// Session controller: validation, wiring and the shutdown sequence.
#include "meterlink/SessionController.hpp"
#include "meterlink/FileCatalog.hpp"
#include "meterlink/Log.hpp"
#include <algorithm>
#include <exception>

namespace meterlink {

SessionController::SessionController(DeviceApi& api, SessionConfig cfg, StreamChannelFactory streamFactory)
    : api_(api),
      cfg_(std::move(cfg)),
      streamFactory_(std::move(streamFactory)),
      scheduler_(queue_, api, cfg_.scheduler),
      supervisor_(cfg_.supervisor) {
    scheduler_.setIdentity(cfg_.identity);
    scheduler_.setObserver(this);
    supervisor_.setObserver(this);
}

SessionController::~SessionController() {
    shutdown();
}

void SessionController::log(const std::string& line, bool error) {
    if (error) {
        LOGE("session: %s", line.c_str());
    } else {
        LOGI("session: %s", line.c_str());
    }
    if (observer_) observer_->onLog(line, error);
}

bool SessionController::registerDevice(std::string& err) {
    const auto& id = cfg_.identity;
    const char* missing = nullptr;
    if (api_.baseUrl().empty()) {
        missing = "Server URL is not configured";
    } else if (id.deviceId.empty()) {
        missing = "Device ID is empty";
    } else if (id.deviceName.empty()) {
        missing = "Device name is empty";
    } else if (id.hardwareKey.empty()) {
        missing = "Hardware key is empty";
    }
    if (missing) {
        err = missing;
        log("Registration rejected: " + err, true);
        return false;
    }

    std::string message;
    if (!api_.registerDevice(id, message, err)) {
        log("Device registration failed: " + err, true);
        return false;
    }
    log("Device registered: " + (message.empty() ? std::string("ok") : message));
    return true;
}

std::unique_ptr<LivenessTransport> SessionController::makeTransport(std::string& err) {
    if (cfg_.mode == ConnectionMode::Polling) {
        return std::make_unique<PollingLivenessTransport>(api_);
    }
    if (!streamFactory_) {
        err = "Stream mode requires a stream channel backend";
        return nullptr;
    }
    auto channel = streamFactory_();
    if (!channel) {
        err = "Cannot create stream channel";
        return nullptr;
    }
    return std::make_unique<StreamLivenessTransport>(std::move(channel), cfg_.streamReadTimeout);
}

bool SessionController::connect(std::string& err) {
    const auto& id = cfg_.identity;
    if (!id.hasCredentials()) {
        err = "Device ID and hardware key are required";
        log("Connection rejected: " + err, true);
        return false;
    }
    if (supervisor_.isRunning()) {
        err = "Already connected";
        return false;
    }

    std::string message;
    if (!api_.authenticateDevice(id, message, err)) {
        log("Device authentication failed: " + err, true);
        return false;
    }
    authenticated_ = true;
    log("Device authenticated" + (message.empty() ? std::string() : ": " + message));

    auto transport = makeTransport(err);
    if (!transport) {
        log("Cannot start heartbeat: " + err, true);
        return false;
    }
    const std::string mode = transport->name();
    if (!supervisor_.start(std::move(transport), id, err)) {
        log("Cannot start heartbeat: " + err, true);
        return false;
    }
    log("Heartbeat started (" + mode + ")");
    return true;
}

bool SessionController::addFile(const std::string& path,
                                std::uint64_t& id,
                                std::string& err,
                                const std::optional<std::string>& description) {
    TransferItem item;
    if (!makeTransferItem(path, description, item, err)) return false;
    if (!queue_.add(std::move(item), id, err)) return false;
    LOGD("session: queued #%llu %s", static_cast<unsigned long long>(id), path.c_str());
    return true;
}

bool SessionController::uploadSelected(std::string& err) {
    if (!authenticated_.load()) {
        err = "Device is not authenticated";
        log("Upload rejected: " + err, true);
        return false;
    }
    const auto items = queue_.selected();
    const bool anyUploadable = std::any_of(items.begin(), items.end(), [](const TransferItem& t) {
        return t.status == TransferItem::Status::Pending || t.status == TransferItem::Status::Failed;
    });
    if (!anyUploadable) {
        err = "Nothing to upload";
        log("Please select files to upload", true);
        return false;
    }
    // Busy goes out before any worker can finish the batch and announce online
    const bool wasBusy = busy_.load();
    announceBusy(true);
    const std::size_t accepted = scheduler_.submit(items, err);
    if (accepted == 0) {
        if (!wasBusy) announceBusy(false);
        log("Upload rejected: " + err, true);
        return false;
    }
    log("Uploading " + std::to_string(accepted) + " file(s)");
    return true;
}

std::size_t SessionController::stopUploads() {
    const std::size_t dropped = scheduler_.cancelAll();
    log("Upload stopped, " + std::to_string(dropped) + " queued file(s) not started");
    // Nothing left running means no batch report will follow
    if (scheduler_.inFlight() == 0) announceBusy(false);
    return dropped;
}

bool SessionController::setDeviceStatus(const std::string& status, std::string& err) {
    if (!authenticated_.load()) {
        err = "Device is not authenticated";
        return false;
    }
    try {
        if (!api_.setDeviceStatus(cfg_.identity, status, err)) {
            LOGW("session: status '%s' not accepted: %s", status.c_str(), err.c_str());
            return false;
        }
    } catch (const std::exception& e) {
        err = e.what();
        LOGW("session: status '%s' failed: %s", status.c_str(), err.c_str());
        return false;
    }
    LOGD("session: status %s", status.c_str());
    return true;
}

void SessionController::announceBusy(bool busy) {
    if (busy_.exchange(busy) == busy) return;
    std::string err;
    if (!setDeviceStatus(busy ? "busy" : "online", err)) {
        log("Could not update device status: " + err, true);
    }
}

void SessionController::shutdown() {
    std::lock_guard<std::mutex> lk(shutdownMtx_);
    if (shutdownDone_) return;
    shutdownDone_ = true;

    LOGI("session: shutting down");
    if (scheduler_.inFlight() > 0 || scheduler_.queued() > 0) {
        scheduler_.cancelAll();
        if (!scheduler_.waitForIdle(cfg_.drainTimeout)) {
            LOGW("session: %d upload(s) still running after %lld ms", scheduler_.inFlight(),
                 static_cast<long long>(cfg_.drainTimeout.count()));
        }
    }

    // The supervisor sends the first departure notice on its way out
    const bool wasRunning = supervisor_.isRunning();
    supervisor_.stop();

    // Second, independent notice: at-least-once is the contract
    if (wasRunning || authenticated_.load()) {
        try {
            std::string err;
            if (!api_.notifyDeparture(cfg_.identity, cfg_.supervisor.departureTimeout, err)) {
                LOGW("session: offline notice failed: %s", err.c_str());
            }
        } catch (const std::exception& e) {
            LOGW("session: offline notice failed: %s", e.what());
        }
    }
    authenticated_ = false;
    LOGI("session: shut down");
}

void SessionController::onConnected() {
    if (observer_) observer_->onConnected();
}

void SessionController::onDisconnected() {
    if (observer_) observer_->onDisconnected();
}

void SessionController::onError(const std::string& reason) {
    if (observer_) observer_->onConnectionError(reason);
}

void SessionController::onStateChanged(ConnectionState state) {
    if (observer_) observer_->onStateChanged(state);
}

void SessionController::onProgress(std::uint64_t itemId, int percent) {
    if (observer_) observer_->onProgress(itemId, percent);
}

void SessionController::onResult(const TransferResult& result) {
    if (observer_) observer_->onResult(result);
}

void SessionController::onBatchFinished(const BatchTally& tally) {
    log("All uploads finished: " + std::to_string(tally.succeeded) + " succeeded, " +
        std::to_string(tally.failed) + " failed");
    announceBusy(false);
    if (observer_) observer_->onBatchFinished(tally);
}

} // namespace meterlink
