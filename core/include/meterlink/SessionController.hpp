// Session controller: owns the work queue, the upload scheduler and the connectivity
// supervisor, and sequences connect / upload / shutdown for the shell.
#pragma once
#include "ConnectivitySupervisor.hpp"
#include "DeviceApi.hpp"
#include "StreamChannel.hpp"
#include "Types.hpp"
#include "UploadScheduler.hpp"
#include "WorkQueue.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace meterlink {

struct SessionConfig {
    DeviceIdentity identity;
    ConnectionMode mode = ConnectionMode::Polling;
    SupervisorConfig supervisor;
    SchedulerConfig scheduler;
    std::chrono::milliseconds streamReadTimeout{60000};
    std::chrono::milliseconds drainTimeout{3000};   // wait for running uploads on shutdown
};

// Everything the shell may want to display. All methods are optional; callbacks arrive
// on the supervisor thread or on upload worker threads.
class SessionObserver {
public:
    virtual ~SessionObserver() = default;
    virtual void onStateChanged(ConnectionState state) { (void)state; }
    virtual void onConnected() {}
    virtual void onDisconnected() {}
    virtual void onConnectionError(const std::string& reason) { (void)reason; }
    virtual void onProgress(std::uint64_t itemId, int percent) { (void)itemId; (void)percent; }
    virtual void onResult(const TransferResult& result) { (void)result; }
    virtual void onBatchFinished(const BatchTally& tally) { (void)tally; }
    // Operator log line
    virtual void onLog(const std::string& line, bool error) { (void)line; (void)error; }
};

class SessionController : private ConnectivityObserver, private TransferObserver {
public:
    // api must outlive the controller and be usable from several threads.
    // streamFactory is required only for ConnectionMode::Stream.
    SessionController(DeviceApi& api, SessionConfig cfg, StreamChannelFactory streamFactory = {});
    ~SessionController() override;

    SessionController(const SessionController&) = delete;
    SessionController& operator=(const SessionController&) = delete;

    // Not owned. Set before connect().
    void setObserver(SessionObserver* o) { observer_ = o; }

    const SessionConfig& config() const { return cfg_; }
    WorkQueue& queue() { return queue_; }
    const WorkQueue& queue() const { return queue_; }
    UploadScheduler& scheduler() { return scheduler_; }
    ConnectivitySupervisor& supervisor() { return supervisor_; }

    // Enroll the device with the server
    bool registerDevice(std::string& err);
    // Authenticate, then start the liveness loop with the configured strategy
    bool connect(std::string& err);
    bool isAuthenticated() const { return authenticated_.load(); }
    ConnectionState connectionState() const { return supervisor_.currentState(); }

    // Classify and queue a local file
    bool addFile(const std::string& path,
                 std::uint64_t& id,
                 std::string& err,
                 const std::optional<std::string>& description = std::nullopt);
    // Submit every selected item
    bool uploadSelected(std::string& err);
    // Stop queued uploads; running ones finish
    std::size_t stopUploads();

    // Report an operator-visible device status ("busy", "online", ...) to the server.
    // The session marks itself busy while a batch runs and online when it ends.
    bool setDeviceStatus(const std::string& status, std::string& err);

    // Cancel queued uploads, drain running ones, stop the supervisor (departure notice)
    // and send a second, independent offline notice. Safe to call more than once.
    void shutdown();

private:
    std::unique_ptr<LivenessTransport> makeTransport(std::string& err);
    void log(const std::string& line, bool error = false);
    // Best-effort busy/online announcement, sent only on a change
    void announceBusy(bool busy);

    // ConnectivityObserver
    void onConnected() override;
    void onDisconnected() override;
    void onError(const std::string& reason) override;
    void onStateChanged(ConnectionState state) override;
    // TransferObserver
    void onProgress(std::uint64_t itemId, int percent) override;
    void onResult(const TransferResult& result) override;
    void onBatchFinished(const BatchTally& tally) override;

    DeviceApi& api_; // not owned
    SessionConfig cfg_;
    StreamChannelFactory streamFactory_;
    SessionObserver* observer_ = nullptr;

    WorkQueue queue_;
    UploadScheduler scheduler_;
    ConnectivitySupervisor supervisor_;

    std::atomic<bool> authenticated_{false};
    std::atomic<bool> busy_{false};
    std::mutex shutdownMtx_;
    bool shutdownDone_ = false; // guarded by shutdownMtx_
};

} // namespace meterlink
