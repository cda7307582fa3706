// HTTP backend: URL-encoded form posts and a multipart upload, one QNetworkAccessManager
// per call so the calling thread owns every Qt object it touches.
#include "meterlink/HttpDeviceApi.hpp"
#include "meterlink/Log.hpp"
#include "EventWait.hpp"

#include <QElapsedTimer>
#include <QEventLoop>
#include <QFile>
#include <QFileInfo>
#include <QHostAddress>
#include <QHttpMultiPart>
#include <QHttpPart>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonValue>
#include <QNetworkAccessManager>
#include <QNetworkInterface>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QUrl>
#include <QUrlQuery>

namespace meterlink {

namespace {

struct HttpReply {
    int status = 0;
    QByteArray body;
    QNetworkReply::NetworkError error = QNetworkReply::NoError;
    QString errorString;
    detail::WaitResult wait = detail::WaitResult::Ready;
};

QNetworkRequest makeRequest(const std::string& baseUrl, const char* path, std::chrono::milliseconds timeout) {
    QNetworkRequest req(QUrl(QString::fromStdString(baseUrl) + QLatin1String(path)));
    // Inactivity limit; the hard deadline is enforced by the wait loop
    req.setTransferTimeout(static_cast<int>(timeout.count()));
    return req;
}

QUrlQuery credentialsForm(const DeviceIdentity& id) {
    QUrlQuery form;
    form.addQueryItem(QStringLiteral("device_id"), QString::fromStdString(id.deviceId));
    form.addQueryItem(QStringLiteral("hardware_key"), QString::fromStdString(id.hardwareKey));
    return form;
}

void collect(QNetworkReply* reply, HttpReply& out) {
    out.status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    out.body = reply->readAll();
    out.error = reply->error();
    out.errorString = reply->errorString();
}

// Wait for the reply, aborting it on deadline or cancel, and collect status and body.
void finish(QEventLoop& loop,
            QNetworkReply* reply,
            std::chrono::milliseconds timeout,
            const std::function<bool()>& shouldCancel,
            HttpReply& out) {
    out.wait = detail::pumpUntil(loop, [reply] { return reply->isFinished(); }, timeout, shouldCancel);
    if (out.wait != detail::WaitResult::Ready) {
        reply->abort();
        return;
    }
    collect(reply, out);
}

HttpReply postForm(const std::string& baseUrl,
                   const char* path,
                   const QUrlQuery& form,
                   std::chrono::milliseconds timeout,
                   const std::function<bool()>& shouldCancel = {}) {
    QEventLoop loop; // must exist before the manager on a plain std::thread
    QNetworkAccessManager nam;
    QNetworkRequest req = makeRequest(baseUrl, path, timeout);
    req.setHeader(QNetworkRequest::ContentTypeHeader, QStringLiteral("application/x-www-form-urlencoded"));
    QNetworkReply* reply = nam.post(req, form.toString(QUrl::FullyEncoded).toUtf8());
    HttpReply out;
    finish(loop, reply, timeout, shouldCancel, out);
    return out;
}

QJsonObject jsonObject(const QByteArray& body) {
    QJsonParseError perr{};
    const auto doc = QJsonDocument::fromJson(body, &perr);
    if (perr.error != QJsonParseError::NoError || !doc.isObject()) return QJsonObject();
    return doc.object();
}

// Server rejection text: "detail" as a string, or the raw JSON of a structured detail.
std::string detailOf(const QJsonObject& obj) {
    const QJsonValue d = obj.value(QStringLiteral("detail"));
    if (d.isString()) return d.toString().toStdString();
    if (d.isArray()) return QJsonDocument(d.toArray()).toJson(QJsonDocument::Compact).toStdString();
    if (d.isObject()) return QJsonDocument(d.toObject()).toJson(QJsonDocument::Compact).toStdString();
    return std::string();
}

// Turns transport failures and non-2xx answers into an error string. True when usable.
bool checkReply(const HttpReply& r, std::string& err) {
    if (r.wait == detail::WaitResult::TimedOut) {
        err = "Request timed out";
        return false;
    }
    if (r.wait == detail::WaitResult::Cancelled) {
        err = "Canceled";
        return false;
    }
    if (r.status == 0) {
        err = r.errorString.toStdString();
        if (err.empty()) err = "Network error";
        return false;
    }
    if (r.status < 200 || r.status >= 300) {
        const std::string why = detailOf(jsonObject(r.body));
        err = "HTTP " + std::to_string(r.status) + (why.empty() ? std::string() : ": " + why);
        return false;
    }
    return true;
}

std::uint64_t toSize(const QJsonValue& v) {
    const double d = v.toDouble(0.0);
    return d > 0.0 ? static_cast<std::uint64_t>(d) : 0;
}

} // namespace

HttpDeviceApi::HttpDeviceApi(std::string baseUrl, std::chrono::milliseconds requestTimeout)
    : baseUrl_(std::move(baseUrl)), timeout_(requestTimeout) {
    while (!baseUrl_.empty() && baseUrl_.back() == '/') baseUrl_.pop_back();
}

bool HttpDeviceApi::registerDevice(const DeviceIdentity& id, std::string& message, std::string& err) {
    QUrlQuery form;
    form.addQueryItem(QStringLiteral("device_id"), QString::fromStdString(id.deviceId));
    form.addQueryItem(QStringLiteral("device_name"), QString::fromStdString(id.deviceName));
    form.addQueryItem(QStringLiteral("hardware_key"), QString::fromStdString(id.hardwareKey));
    form.addQueryItem(QStringLiteral("device_ip"), QString::fromStdString(id.networkAddress));
    const HttpReply r = postForm(baseUrl_, "/api/device/register", form, timeout_);

    // A rejection still carries a JSON body with "detail"
    if (r.wait != detail::WaitResult::Ready || r.status == 0) {
        checkReply(r, err);
        LOGE("http: register failed: %s", err.c_str());
        return false;
    }
    const QJsonObject obj = jsonObject(r.body);
    if (obj.contains(QStringLiteral("message"))) {
        message = obj.value(QStringLiteral("message")).toString().toStdString();
        return true;
    }
    err = detailOf(obj);
    if (err.empty()) err = "Unknown error (HTTP " + std::to_string(r.status) + ")";
    LOGE("http: register rejected: %s", err.c_str());
    return false;
}

bool HttpDeviceApi::authenticateDevice(const DeviceIdentity& id, std::string& message, std::string& err) {
    QUrlQuery form = credentialsForm(id);
    form.addQueryItem(QStringLiteral("device_ip"), QString::fromStdString(id.networkAddress));
    const HttpReply r = postForm(baseUrl_, "/api/device/authenticate", form, timeout_);
    if (!checkReply(r, err)) {
        LOGE("http: authenticate failed: %s", err.c_str());
        return false;
    }
    message = jsonObject(r.body).value(QStringLiteral("message")).toString().toStdString();
    return true;
}

ProbeOutcome HttpDeviceApi::sendLivenessProbe(const DeviceIdentity& id,
                                              std::chrono::milliseconds timeout,
                                              std::string& err,
                                              CancelCB shouldCancel) {
    const HttpReply r = postForm(baseUrl_, "/api/polling/heartbeat", credentialsForm(id), timeout, shouldCancel);
    switch (r.wait) {
        case detail::WaitResult::Cancelled:
            return ProbeOutcome::Cancelled;
        case detail::WaitResult::TimedOut:
            err = "Heartbeat request timed out";
            return ProbeOutcome::Timeout;
        case detail::WaitResult::Ready:
            break;
    }
    if (r.error == QNetworkReply::TimeoutError || r.error == QNetworkReply::OperationCanceledError) {
        err = "Heartbeat request timed out";
        return ProbeOutcome::Timeout;
    }
    if (r.status == 200) return ProbeOutcome::Success;
    if (r.status == 0) {
        err = r.errorString.toStdString();
    } else {
        err = "HTTP " + std::to_string(r.status);
    }
    return ProbeOutcome::TransportError;
}

bool HttpDeviceApi::notifyDeparture(const DeviceIdentity& id,
                                    std::chrono::milliseconds timeout,
                                    std::string& err) {
    const HttpReply r = postForm(baseUrl_, "/api/device/offline", credentialsForm(id), timeout);
    return checkReply(r, err);
}

bool HttpDeviceApi::setDeviceStatus(const DeviceIdentity& id, const std::string& status, std::string& err) {
    QUrlQuery form = credentialsForm(id);
    form.addQueryItem(QStringLiteral("status"), QString::fromStdString(status));
    const HttpReply r = postForm(baseUrl_, "/api/device/set-status", form, timeout_);
    return checkReply(r, err);
}

bool HttpDeviceApi::transferFile(const DeviceIdentity& id,
                                 const TransferItem& item,
                                 TransferReceipt& receipt,
                                 std::string& err,
                                 ProgressCB progress,
                                 CancelCB shouldCancel) {
    if (shouldCancel && shouldCancel()) {
        err = "Canceled";
        return false;
    }

    QEventLoop loop; // must exist before the manager on a plain std::thread
    QNetworkAccessManager nam;
    auto* multi = new QHttpMultiPart(QHttpMultiPart::FormDataType);
    auto addField = [multi](const char* name, const std::string& value) {
        QHttpPart part;
        part.setHeader(QNetworkRequest::ContentDispositionHeader,
                       QStringLiteral("form-data; name=\"%1\"").arg(QLatin1String(name)));
        part.setBody(QByteArray::fromStdString(value));
        multi->append(part);
    };
    addField("device_id", id.deviceId);
    addField("hardware_key", id.hardwareKey);
    addField("description", item.description);

    auto* file = new QFile(QString::fromStdString(item.path), multi);
    if (!file->open(QIODevice::ReadOnly)) {
        err = "Cannot open local file: " + file->errorString().toStdString();
        delete multi;
        return false;
    }
    QHttpPart filePart;
    filePart.setHeader(QNetworkRequest::ContentTypeHeader, QStringLiteral("application/octet-stream"));
    filePart.setHeader(QNetworkRequest::ContentDispositionHeader,
                       QStringLiteral("form-data; name=\"file\"; filename=\"%1\"")
                           .arg(QFileInfo(*file).fileName()));
    filePart.setBodyDevice(file);
    multi->append(filePart);

    QNetworkReply* reply = nam.post(makeRequest(baseUrl_, "/api/upload/file", timeout_), multi);
    multi->setParent(reply);
    QElapsedTimer idle;
    idle.start();
    QObject::connect(reply, &QNetworkReply::uploadProgress, [&progress, &idle](qint64 sent, qint64 total) {
        idle.restart();
        if (progress && total > 0) progress(static_cast<std::size_t>(sent), static_cast<std::size_t>(total));
    });
    QObject::connect(reply, &QNetworkReply::downloadProgress, [&idle](qint64, qint64) {
        idle.restart();
    });

    // Once on the wire the upload is not cancellable. It may take as long as it keeps
    // moving; timeout_ without any traffic in either direction aborts it.
    bool stalled = false;
    const auto res = detail::pumpUntil(loop, [&] {
        if (reply->isFinished()) return true;
        stalled = idle.elapsed() >= timeout_.count();
        return stalled;
    }, std::chrono::milliseconds::max(), {});
    if (stalled || res != detail::WaitResult::Ready) {
        reply->abort();
        err = "Upload stalled: no traffic for " + std::to_string(timeout_.count()) + " ms";
        LOGE("http: upload of %s failed: %s", item.path.c_str(), err.c_str());
        return false;
    }
    HttpReply r;
    collect(reply, r);
    if (!checkReply(r, err)) {
        LOGE("http: upload of %s failed: %s", item.path.c_str(), err.c_str());
        return false;
    }

    const QJsonObject obj = jsonObject(r.body);
    if (!obj.contains(QStringLiteral("file_id"))) {
        err = "Unexpected server response";
        return false;
    }
    const QJsonValue fid = obj.value(QStringLiteral("file_id"));
    receipt.fileId = fid.isString() ? fid.toString().toStdString()
                                    : QString::number(fid.toVariant().toLongLong()).toStdString();
    receipt.originalSize = obj.contains(QStringLiteral("original_size"))
        ? toSize(obj.value(QStringLiteral("original_size"))) : item.size;
    const QJsonValue comp = obj.value(QStringLiteral("compressed_size"));
    if (comp.isDouble()) receipt.compressedSize = toSize(comp);
    return true;
}

std::string HttpDeviceApi::localAddress() {
    for (const QHostAddress& a : QNetworkInterface::allAddresses()) {
        if (a.protocol() == QAbstractSocket::IPv4Protocol && !a.isLoopback()) {
            return a.toString().toStdString();
        }
    }
    return std::string();
}

} // namespace meterlink
