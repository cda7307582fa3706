// Console application settings, stored in an INI file through QSettings.
#pragma once
#include "meterlink/SessionController.hpp"
#include <QString>
#include <chrono>

struct AppSettings {
    QString serverUrl = QStringLiteral("http://localhost:8000");
    std::chrono::milliseconds requestTimeout{30000};
    QString deviceId;
    QString deviceName = QStringLiteral("Three-Phase Meter Device");
    QString hardwareKey;
    int concurrentUploads = 2;
    meterlink::ConnectionMode mode = meterlink::ConnectionMode::Polling;
    std::chrono::milliseconds heartbeatInterval{30000};
    std::chrono::milliseconds probeTimeout{10000};
    std::chrono::milliseconds streamReadTimeout{60000};
    std::chrono::milliseconds departureTimeout{5000};
    QString tabularDescriptionFormat = QStringLiteral("Tabular data_{timestamp}");
    QString imageDescriptionFormat = QStringLiteral("Image data_{timestamp}");

    // Read "path"; a missing file is created with the defaults.
    static bool load(const QString& path, AppSettings& out, QString& err);
    bool save(const QString& path, QString& err) const;

    // Description for a new item, with {timestamp} expanded to yyyyMMdd_HHmmss.
    QString descriptionFor(meterlink::FileCategory category) const;

    meterlink::SessionConfig toSessionConfig() const;
};

// SHA-256 over the first hardware address and the CPU count, hex encoded.
QString machineKey();

QString modeName(meterlink::ConnectionMode mode);
bool parseMode(const QString& text, meterlink::ConnectionMode& out);
