// StreamChannel over a WebSocket (Qt WebSockets). All calls must come from the thread
// that created the channel; the socket is created lazily on open().
#pragma once
#include "StreamChannel.hpp"
#include <deque>
#include <memory>
#include <string>

class QEventLoop;
class QWebSocket;

namespace meterlink {

// ws(s)://host/ws/device/<device_id>?hardware_key=<key>, derived from an http(s) base URL.
std::string streamUrl(const std::string& baseUrl, const DeviceIdentity& id);

class WebSocketStreamChannel : public StreamChannel {
public:
    explicit WebSocketStreamChannel(std::string baseUrl);
    ~WebSocketStreamChannel() override;

    bool open(const DeviceIdentity& id,
              std::chrono::milliseconds timeout,
              std::string& err,
              CancelCB shouldCancel = {}) override;
    bool isOpen() const override;
    bool sendText(const std::string& text, std::string& err) override;
    ReadStatus readText(std::string& out,
                        std::chrono::milliseconds timeout,
                        std::string& err,
                        CancelCB shouldCancel = {}) override;
    void close() override;

private:
    std::string baseUrl_;
    // Created on the first open(), before the socket, so the calling thread has an
    // event dispatcher; pumped by every blocking call.
    std::unique_ptr<QEventLoop> loop_;
    std::unique_ptr<QWebSocket> socket_;
    std::deque<std::string> inbox_;
    std::string lastError_;
    bool closedByPeer_ = false;
};

} // namespace meterlink
