// INI persistence for the console application.
#include "Settings.hpp"
#include "meterlink/HttpDeviceApi.hpp"
#include <algorithm>
#include <QCryptographicHash>
#include <QDateTime>
#include <QFileInfo>
#include <QNetworkInterface>
#include <QSettings>
#include <QThread>

using meterlink::ConnectionMode;

QString modeName(ConnectionMode mode) {
    return mode == ConnectionMode::Stream ? QStringLiteral("stream") : QStringLiteral("polling");
}

bool parseMode(const QString& text, ConnectionMode& out) {
    const QString t = text.trimmed().toLower();
    if (t == QLatin1String("polling")) { out = ConnectionMode::Polling; return true; }
    if (t == QLatin1String("stream") || t == QLatin1String("websocket")) { out = ConnectionMode::Stream; return true; }
    return false;
}

static std::chrono::milliseconds seconds(const QSettings& s, const char* key, std::chrono::milliseconds def) {
    bool ok = false;
    const double v = s.value(QLatin1String(key), double(def.count()) / 1000.0).toDouble(&ok);
    if (!ok || v <= 0.0) return def;
    return std::chrono::milliseconds(static_cast<long long>(v * 1000.0));
}

static double toSeconds(std::chrono::milliseconds ms) {
    return double(ms.count()) / 1000.0;
}

bool AppSettings::load(const QString& path, AppSettings& out, QString& err) {
    out = AppSettings();
    if (!QFileInfo::exists(path)) {
        // First run: write the defaults so the operator has a file to edit
        return out.save(path, err);
    }
    QSettings s(path, QSettings::IniFormat);
    if (s.status() != QSettings::NoError) {
        err = QStringLiteral("Cannot read %1").arg(path);
        return false;
    }
    out.serverUrl = s.value("Server/url", out.serverUrl).toString().trimmed();
    out.requestTimeout = seconds(s, "Server/timeout", out.requestTimeout);
    out.deviceId = s.value("Device/deviceId", out.deviceId).toString().trimmed();
    out.deviceName = s.value("Device/deviceName", out.deviceName).toString().trimmed();
    out.hardwareKey = s.value("Device/hardwareKey", out.hardwareKey).toString().trimmed();
    out.concurrentUploads = std::max(1, s.value("Upload/concurrentUploads", out.concurrentUploads).toInt());
    const QString mode = s.value("Connection/mode", modeName(out.mode)).toString();
    if (!parseMode(mode, out.mode)) {
        err = QStringLiteral("Unknown connection mode: %1").arg(mode);
        return false;
    }
    out.heartbeatInterval = seconds(s, "Connection/heartbeatInterval", out.heartbeatInterval);
    out.probeTimeout = seconds(s, "Connection/probeTimeout", out.probeTimeout);
    out.streamReadTimeout = seconds(s, "Connection/streamReadTimeout", out.streamReadTimeout);
    out.departureTimeout = seconds(s, "Connection/departureTimeout", out.departureTimeout);
    out.tabularDescriptionFormat = s.value("MeterData/tabularDescriptionFormat", out.tabularDescriptionFormat).toString();
    out.imageDescriptionFormat = s.value("MeterData/imageDescriptionFormat", out.imageDescriptionFormat).toString();
    return true;
}

bool AppSettings::save(const QString& path, QString& err) const {
    QSettings s(path, QSettings::IniFormat);
    s.setValue("Server/url", serverUrl);
    s.setValue("Server/timeout", toSeconds(requestTimeout));
    s.setValue("Device/deviceId", deviceId);
    s.setValue("Device/deviceName", deviceName);
    s.setValue("Device/hardwareKey", hardwareKey);
    s.setValue("Upload/concurrentUploads", concurrentUploads);
    s.setValue("Connection/mode", modeName(mode));
    s.setValue("Connection/heartbeatInterval", toSeconds(heartbeatInterval));
    s.setValue("Connection/probeTimeout", toSeconds(probeTimeout));
    s.setValue("Connection/streamReadTimeout", toSeconds(streamReadTimeout));
    s.setValue("Connection/departureTimeout", toSeconds(departureTimeout));
    s.setValue("MeterData/tabularDescriptionFormat", tabularDescriptionFormat);
    s.setValue("MeterData/imageDescriptionFormat", imageDescriptionFormat);
    s.sync();
    if (s.status() != QSettings::NoError) {
        err = QStringLiteral("Cannot write %1").arg(path);
        return false;
    }
    return true;
}

QString AppSettings::descriptionFor(meterlink::FileCategory category) const {
    QString fmt = category == meterlink::FileCategory::Image ? imageDescriptionFormat : tabularDescriptionFormat;
    fmt.replace(QLatin1String("{timestamp}"),
                QDateTime::currentDateTime().toString(QStringLiteral("yyyyMMdd_HHmmss")));
    return fmt;
}

meterlink::SessionConfig AppSettings::toSessionConfig() const {
    meterlink::SessionConfig cfg;
    cfg.identity.deviceId = deviceId.toStdString();
    cfg.identity.deviceName = deviceName.toStdString();
    cfg.identity.hardwareKey = hardwareKey.toStdString();
    cfg.identity.networkAddress = meterlink::HttpDeviceApi::localAddress();
    cfg.mode = mode;
    cfg.supervisor.interval = heartbeatInterval;
    cfg.supervisor.probeTimeout = probeTimeout;
    cfg.supervisor.departureTimeout = departureTimeout;
    cfg.scheduler.maxConcurrent = concurrentUploads;
    cfg.streamReadTimeout = streamReadTimeout;
    return cfg;
}

QString machineKey() {
    QString mac;
    for (const QNetworkInterface& nif : QNetworkInterface::allInterfaces()) {
        if (nif.flags().testFlag(QNetworkInterface::IsLoopBack)) continue;
        const QString hw = nif.hardwareAddress();
        if (!hw.isEmpty()) {
            mac = hw.toLower();
            break;
        }
    }
    const QString info = QStringLiteral("%1-%2").arg(mac).arg(QThread::idealThreadCount());
    return QString::fromLatin1(QCryptographicHash::hash(info.toUtf8(), QCryptographicHash::Sha256).toHex());
}
