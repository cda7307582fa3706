// Simulated persistent stream for tests without network. The "server" side is driven
// from the test through a shared State, which stays valid after the channel is moved
// into a StreamLivenessTransport.
#pragma once
#include "StreamChannel.hpp"
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>

namespace meterlink {

class MockStreamChannel : public StreamChannel {
public:
    struct State {
        std::mutex mtx;
        std::condition_variable cv;
        std::deque<std::string> inbox;   // frames waiting to be read
        std::deque<std::string> sent;    // frames written by the device
        bool open = false;
        bool autoPong = true;            // answer every "ping" with "pong"
        int failOpens = 0;               // next N open() calls fail
        bool closedByServer = false;     // next read reports Closed
        bool readError = false;          // next read reports Error
        int opens = 0;
        int closes = 0;
        int pings = 0;
    };

    MockStreamChannel() : st_(std::make_shared<State>()) {}
    explicit MockStreamChannel(std::shared_ptr<State> st) : st_(std::move(st)) {}

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

    std::shared_ptr<State> state() const { return st_; }

    // Server-side helpers
    static void push(State& st, const std::string& frame);
    static void closeFromServer(State& st);

private:
    std::shared_ptr<State> st_;
};

} // namespace meterlink
