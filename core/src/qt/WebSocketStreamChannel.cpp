// WebSocket stream: incoming text frames are queued by the socket's signal handlers
// and handed out by readText() while it pumps events.
#include "meterlink/WebSocketStreamChannel.hpp"
#include "meterlink/Log.hpp"
#include "EventWait.hpp"

#include <QAbstractSocket>
#include <QEventLoop>
#include <QUrl>
#include <QUrlQuery>
#include <QWebSocket>
#include <QWebSocketProtocol>

namespace meterlink {

std::string streamUrl(const std::string& baseUrl, const DeviceIdentity& id) {
    std::string base = baseUrl;
    while (!base.empty() && base.back() == '/') base.pop_back();
    if (base.rfind("https://", 0) == 0) {
        base = "wss://" + base.substr(8);
    } else if (base.rfind("http://", 0) == 0) {
        base = "ws://" + base.substr(7);
    }
    QUrlQuery q;
    q.addQueryItem(QStringLiteral("hardware_key"), QString::fromStdString(id.hardwareKey));
    QUrl url(QString::fromStdString(base + "/ws/device/") +
             QString::fromUtf8(QUrl::toPercentEncoding(QString::fromStdString(id.deviceId))));
    url.setQuery(q);
    return url.toString(QUrl::FullyEncoded).toStdString();
}

WebSocketStreamChannel::WebSocketStreamChannel(std::string baseUrl) : baseUrl_(std::move(baseUrl)) {}

WebSocketStreamChannel::~WebSocketStreamChannel() {
    close();
}

bool WebSocketStreamChannel::open(const DeviceIdentity& id,
                                  std::chrono::milliseconds timeout,
                                  std::string& err,
                                  CancelCB shouldCancel) {
    close();
    inbox_.clear();
    lastError_.clear();
    closedByPeer_ = false;

    if (!loop_) loop_ = std::make_unique<QEventLoop>();
    socket_ = std::make_unique<QWebSocket>();
    QWebSocket* ws = socket_.get();
    QObject::connect(ws, &QWebSocket::textMessageReceived, [this](const QString& msg) {
        inbox_.push_back(msg.toStdString());
    });
    QObject::connect(ws, &QWebSocket::disconnected, [this]() {
        closedByPeer_ = true;
    });
    QObject::connect(ws, &QWebSocket::errorOccurred, [this, ws](QAbstractSocket::SocketError) {
        lastError_ = ws->errorString().toStdString();
    });

    const std::string url = streamUrl(baseUrl_, id);
    LOGD("websocket: connecting to %s", url.c_str());
    ws->open(QUrl(QString::fromStdString(url)));

    const auto res = detail::pumpUntil(*loop_, [ws, this] {
        return ws->state() == QAbstractSocket::ConnectedState || closedByPeer_ || !lastError_.empty();
    }, timeout, shouldCancel);

    if (res == detail::WaitResult::Ready && ws->state() == QAbstractSocket::ConnectedState) return true;

    if (res == detail::WaitResult::Cancelled) {
        err = "Canceled";
    } else if (res == detail::WaitResult::TimedOut) {
        err = "WebSocket connection timed out";
    } else {
        err = lastError_.empty() ? std::string("WebSocket connection failed") : lastError_;
    }
    socket_->abort();
    socket_.reset();
    return false;
}

bool WebSocketStreamChannel::isOpen() const {
    return socket_ && !closedByPeer_ && socket_->state() == QAbstractSocket::ConnectedState;
}

bool WebSocketStreamChannel::sendText(const std::string& text, std::string& err) {
    if (!isOpen()) {
        err = "Stream not open";
        return false;
    }
    const qint64 n = socket_->sendTextMessage(QString::fromStdString(text));
    if (n <= 0) {
        err = lastError_.empty() ? std::string("WebSocket send failed") : lastError_;
        return false;
    }
    return true;
}

StreamChannel::ReadStatus WebSocketStreamChannel::readText(std::string& out,
                                                           std::chrono::milliseconds timeout,
                                                           std::string& err,
                                                           CancelCB shouldCancel) {
    if (!socket_) {
        err = "Stream not open";
        return ReadStatus::Closed;
    }
    const auto res = detail::pumpUntil(*loop_, [this] {
        return !inbox_.empty() || closedByPeer_ || !lastError_.empty();
    }, timeout, shouldCancel);

    // Frames that arrived before a close are still delivered
    if (!inbox_.empty()) {
        out = inbox_.front();
        inbox_.pop_front();
        return ReadStatus::Message;
    }
    switch (res) {
        case detail::WaitResult::Cancelled: return ReadStatus::Cancelled;
        case detail::WaitResult::TimedOut:  return ReadStatus::Timeout;
        case detail::WaitResult::Ready:     break;
    }
    if (!lastError_.empty()) {
        err = lastError_;
        return ReadStatus::Error;
    }
    err = "Stream closed by server";
    return ReadStatus::Closed;
}

void WebSocketStreamChannel::close() {
    if (!socket_) return;
    if (socket_->state() == QAbstractSocket::ConnectedState) {
        socket_->close(QWebSocketProtocol::CloseCodeNormal, QStringLiteral("device offline"));
        // Let the close frame go out before the socket is destroyed
        detail::pumpUntil(*loop_, [this] {
            return socket_->state() == QAbstractSocket::UnconnectedState;
        }, std::chrono::milliseconds(1000), {});
    }
    socket_->disconnect();
    socket_.reset();
}

} // namespace meterlink
