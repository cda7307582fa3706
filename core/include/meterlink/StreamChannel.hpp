// Long-lived duplex text channel used by the persistent-stream liveness strategy.
// Implementations are used from a single thread (the supervisor loop).
#pragma once
#include "Types.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace meterlink {

class StreamChannel {
public:
    using CancelCB = std::function<bool()>;

    enum class ReadStatus {
        Message,   // "out" holds one text frame
        Timeout,   // nothing arrived in time
        Closed,    // peer closed the channel
        Error,     // lower-level failure, "err" says why
        Cancelled  // shouldCancel turned true
    };

    virtual ~StreamChannel() = default;

    virtual bool open(const DeviceIdentity& id,
                      std::chrono::milliseconds timeout,
                      std::string& err,
                      CancelCB shouldCancel = {}) = 0;
    virtual bool isOpen() const = 0;
    virtual bool sendText(const std::string& text, std::string& err) = 0;
    virtual ReadStatus readText(std::string& out,
                                std::chrono::milliseconds timeout,
                                std::string& err,
                                CancelCB shouldCancel = {}) = 0;
    // Normal close; the peer sees it as the device leaving.
    virtual void close() = 0;
};

using StreamChannelFactory = std::function<std::unique_ptr<StreamChannel>()>;

} // namespace meterlink
