// Abstract interface to the upload server. Concrete implementations (e.g., Qt Network)
// must follow this API to keep the supervisor and scheduler decoupled from the backend.
#pragma once
#include "Types.hpp"
#include <chrono>
#include <functional>
#include <string>

namespace meterlink {

class DeviceApi {
public:
    using ProgressCB = std::function<void(std::size_t /*done*/, std::size_t /*total*/)>;
    using CancelCB = std::function<bool()>;

    virtual ~DeviceApi() = default;

    // Server base URL, e.g. http://localhost:8000
    virtual std::string baseUrl() const = 0;

    // Device enrollment. On success "message" carries the server's answer.
    virtual bool registerDevice(const DeviceIdentity& id,
                                std::string& message,
                                std::string& err) = 0;

    virtual bool authenticateDevice(const DeviceIdentity& id,
                                    std::string& message,
                                    std::string& err) = 0;

    // One heartbeat request. Must return within "timeout" (or sooner when shouldCancel
    // turns true, reporting Cancelled).
    virtual ProbeOutcome sendLivenessProbe(const DeviceIdentity& id,
                                           std::chrono::milliseconds timeout,
                                           std::string& err,
                                           CancelCB shouldCancel = {}) = 0;

    // Tell the server the device is going away. Callers treat it as best-effort.
    virtual bool notifyDeparture(const DeviceIdentity& id,
                                 std::chrono::milliseconds timeout,
                                 std::string& err) = 0;

    // Free-form device status (e.g. "online", "busy").
    virtual bool setDeviceStatus(const DeviceIdentity& id,
                                 const std::string& status,
                                 std::string& err) = 0;

    // Upload one file. shouldCancel is consulted before the request is sent; once the
    // request is on the wire it runs to completion.
    virtual bool transferFile(const DeviceIdentity& id,
                              const TransferItem& item,
                              TransferReceipt& receipt,
                              std::string& err,
                              ProgressCB progress = {},
                              CancelCB shouldCancel = {}) = 0;
};

} // namespace meterlink
