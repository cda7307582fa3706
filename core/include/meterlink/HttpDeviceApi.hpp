// DeviceApi backend over HTTP (Qt Network). Every call runs its own blocking request,
// so one instance can be shared by the supervisor thread and the upload workers.
// A QCoreApplication must exist for the lifetime of the instance.
#pragma once
#include "DeviceApi.hpp"
#include <chrono>
#include <string>

namespace meterlink {

class HttpDeviceApi : public DeviceApi {
public:
    explicit HttpDeviceApi(std::string baseUrl,
                           std::chrono::milliseconds requestTimeout = std::chrono::seconds(30));

    std::string baseUrl() const override { return baseUrl_; }
    std::chrono::milliseconds requestTimeout() const { return timeout_; }

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

    // First non-loopback IPv4 address of this host, empty if none.
    static std::string localAddress();

private:
    std::string baseUrl_;          // without trailing slash
    std::chrono::milliseconds timeout_;
};

} // namespace meterlink
