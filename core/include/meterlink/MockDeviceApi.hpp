// Simulated upload server for tests without network.
#pragma once
#include "DeviceApi.hpp"
#include <atomic>
#include <chrono>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace meterlink {

class MockDeviceApi : public DeviceApi {
public:
    // How a transfer of one path behaves. Unknown paths use the default behavior.
    struct UploadBehavior {
        bool fail = false;                      // return false with "error"
        bool throws = false;                    // throw std::runtime_error("error")
        std::string error = "Simulated upload failure";
        std::chrono::milliseconds delay{0};     // time spent "on the wire"
        std::optional<std::uint64_t> compressedSize; // server recompressed to this size
        std::string fileId;                     // empty: generated
    };

    explicit MockDeviceApi(std::string baseUrl = "http://mock.local") : baseUrl_(std::move(baseUrl)) {}

    std::string baseUrl() const override { return baseUrl_; }

    bool registerDevice(const DeviceIdentity& id, std::string& message, std::string& err) override;
    bool authenticateDevice(const DeviceIdentity& id, std::string& message, std::string& err) override;
    ProbeOutcome sendLivenessProbe(const DeviceIdentity& id,
                                   std::chrono::milliseconds timeout,
                                   std::string& err,
                                   CancelCB shouldCancel = {}) override;
    bool notifyDeparture(const DeviceIdentity& id,
                         std::chrono::milliseconds timeout,
                         std::string& err) override;
    bool setDeviceStatus(const DeviceIdentity& id, const std::string& status, std::string& err) override;
    bool transferFile(const DeviceIdentity& id,
                      const TransferItem& item,
                      TransferReceipt& receipt,
                      std::string& err,
                      ProgressCB progress = {},
                      CancelCB shouldCancel = {}) override;

    // Scripting
    void setAuthenticateResult(bool ok, std::string detail = {});
    void setRegisterResult(bool ok, std::string detail = {});
    void setDepartureFails(bool on) { departureFails_ = on; }
    // Outcomes consumed one per probe; afterwards the default applies.
    void scriptProbes(std::vector<ProbeOutcome> outcomes);
    void setDefaultProbe(ProbeOutcome o);
    // Time each probe takes before answering (bounded by the probe timeout).
    void setProbeDelay(std::chrono::milliseconds d) { probeDelayMs_ = d.count(); }
    void setUploadBehavior(const std::string& path, UploadBehavior b);
    void setDefaultUploadBehavior(UploadBehavior b);

    // Observation
    int probeCount() const { return probes_.load(); }
    int departureCount() const { return departures_.load(); }
    int registerCount() const { return registers_.load(); }
    int authenticateCount() const { return authenticates_.load(); }
    int uploadCount() const { return uploads_.load(); }
    int maxConcurrentUploads() const { return maxActive_.load(); }
    std::vector<std::string> uploadedPaths() const;
    std::vector<std::string> statuses() const;

private:
    // Sleeps in short slices; false when shouldCancel fired first.
    static bool sleepFor(std::chrono::milliseconds d, const CancelCB& shouldCancel);

    std::string baseUrl_;
    mutable std::mutex mtx_; // protects the scripting state and the lists below
    bool authOk_ = true;
    std::string authDetail_;
    bool registerOk_ = true;
    std::string registerDetail_;
    std::deque<ProbeOutcome> probeScript_;
    ProbeOutcome defaultProbe_ = ProbeOutcome::Success;
    std::unordered_map<std::string, UploadBehavior> behaviors_;
    UploadBehavior defaultBehavior_;
    std::vector<std::string> uploaded_;
    std::vector<std::string> statuses_;
    std::uint64_t nextFileId_ = 1;

    std::atomic<bool> departureFails_{false};
    std::atomic<long long> probeDelayMs_{0};
    std::atomic<int> probes_{0};
    std::atomic<int> departures_{0};
    std::atomic<int> registers_{0};
    std::atomic<int> authenticates_{0};
    std::atomic<int> uploads_{0};
    std::atomic<int> active_{0};
    std::atomic<int> maxActive_{0};
};

} // namespace meterlink
