// Mock stream: an in-memory inbox guarded by the shared state's mutex.
#include "meterlink/MockStreamChannel.hpp"
#include <algorithm>

namespace meterlink {

bool MockStreamChannel::open(const DeviceIdentity& id,
                             std::chrono::milliseconds timeout,
                             std::string& err,
                             CancelCB shouldCancel) {
    (void)timeout;
    if (shouldCancel && shouldCancel()) {
        err = "Canceled";
        return false;
    }
    std::lock_guard<std::mutex> lk(st_->mtx);
    if (!id.hasCredentials()) {
        err = "Device ID and hardware key are required";
        return false;
    }
    if (st_->failOpens > 0) {
        --st_->failOpens;
        err = "Simulated connection refused";
        return false;
    }
    st_->open = true;
    st_->closedByServer = false;
    ++st_->opens;
    return true;
}

bool MockStreamChannel::isOpen() const {
    std::lock_guard<std::mutex> lk(st_->mtx);
    return st_->open;
}

bool MockStreamChannel::sendText(const std::string& text, std::string& err) {
    {
        std::lock_guard<std::mutex> lk(st_->mtx);
        if (!st_->open) {
            err = "Stream not open";
            return false;
        }
        st_->sent.push_back(text);
        if (text == "ping") {
            ++st_->pings;
            if (st_->autoPong) st_->inbox.push_back("pong");
        }
    }
    st_->cv.notify_all();
    return true;
}

StreamChannel::ReadStatus MockStreamChannel::readText(std::string& out,
                                                      std::chrono::milliseconds timeout,
                                                      std::string& err,
                                                      CancelCB shouldCancel) {
    using clock = std::chrono::steady_clock;
    const auto deadline = clock::now() + timeout;
    std::unique_lock<std::mutex> lk(st_->mtx);
    for (;;) {
        if (shouldCancel && shouldCancel()) return ReadStatus::Cancelled;
        if (st_->readError) {
            st_->readError = false;
            err = "Simulated stream error";
            return ReadStatus::Error;
        }
        if (st_->closedByServer || !st_->open) {
            err = "Stream closed by server";
            return ReadStatus::Closed;
        }
        if (!st_->inbox.empty()) {
            out = st_->inbox.front();
            st_->inbox.pop_front();
            return ReadStatus::Message;
        }
        if (clock::now() >= deadline) return ReadStatus::Timeout;
        // Short slices so cancellation is seen without a notify
        st_->cv.wait_until(lk, std::min(deadline, clock::now() + std::chrono::milliseconds(10)));
    }
}

void MockStreamChannel::close() {
    {
        std::lock_guard<std::mutex> lk(st_->mtx);
        if (st_->open) ++st_->closes;
        st_->open = false;
        st_->inbox.clear();
    }
    st_->cv.notify_all();
}

void MockStreamChannel::push(State& st, const std::string& frame) {
    {
        std::lock_guard<std::mutex> lk(st.mtx);
        st.inbox.push_back(frame);
    }
    st.cv.notify_all();
}

void MockStreamChannel::closeFromServer(State& st) {
    {
        std::lock_guard<std::mutex> lk(st.mtx);
        st.closedByServer = true;
    }
    st.cv.notify_all();
}

} // namespace meterlink
