#include "Settings.hpp"
#include "TestUtil.hpp"
#include <QFileInfo>
#include <QRegularExpression>
#include <QSettings>
#include <gtest/gtest.h>

using namespace std::chrono_literals;

TEST(Settings, MissingFileIsCreatedWithDefaults) {
    meterlink::test::TempDir dir;
    const QString path = QString::fromStdString((dir.path() / "meterlink.ini").string());

    AppSettings s;
    QString err;
    ASSERT_TRUE(AppSettings::load(path, s, err)) << err.toStdString();
    EXPECT_TRUE(QFileInfo::exists(path));
    EXPECT_EQ(s.serverUrl, QStringLiteral("http://localhost:8000"));
    EXPECT_EQ(s.deviceName, QStringLiteral("Three-Phase Meter Device"));
    EXPECT_EQ(s.concurrentUploads, 2);
    EXPECT_EQ(s.mode, meterlink::ConnectionMode::Polling);
    EXPECT_EQ(s.heartbeatInterval, 30s);
    EXPECT_EQ(s.probeTimeout, 10s);
    EXPECT_EQ(s.streamReadTimeout, 60s);
    EXPECT_EQ(s.departureTimeout, 5s);

    QSettings raw(path, QSettings::IniFormat);
    EXPECT_EQ(raw.value("Connection/mode").toString(), QStringLiteral("polling"));
    EXPECT_EQ(raw.value("Server/timeout").toInt(), 30);
}

TEST(Settings, ValuesSurviveSaveAndLoad) {
    meterlink::test::TempDir dir;
    const QString path = QString::fromStdString((dir.path() / "device.ini").string());

    AppSettings s;
    s.serverUrl = QStringLiteral("https://meters.example.org");
    s.deviceId = QStringLiteral("METER-7");
    s.hardwareKey = QStringLiteral("abc123");
    s.concurrentUploads = 4;
    s.mode = meterlink::ConnectionMode::Stream;
    s.heartbeatInterval = 15s;
    QString err;
    ASSERT_TRUE(s.save(path, err));

    AppSettings back;
    ASSERT_TRUE(AppSettings::load(path, back, err)) << err.toStdString();
    EXPECT_EQ(back.serverUrl, s.serverUrl);
    EXPECT_EQ(back.deviceId, s.deviceId);
    EXPECT_EQ(back.concurrentUploads, 4);
    EXPECT_EQ(back.mode, meterlink::ConnectionMode::Stream);
    EXPECT_EQ(back.heartbeatInterval, 15s);

    const auto cfg = back.toSessionConfig();
    EXPECT_EQ(cfg.identity.deviceId, "METER-7");
    EXPECT_EQ(cfg.scheduler.maxConcurrent, 4);
    EXPECT_EQ(cfg.supervisor.interval, 15s);
    EXPECT_EQ(cfg.mode, meterlink::ConnectionMode::Stream);
}

TEST(Settings, UnknownModeIsRejected) {
    meterlink::test::TempDir dir;
    const QString path = QString::fromStdString((dir.path() / "bad.ini").string());
    {
        QSettings raw(path, QSettings::IniFormat);
        raw.setValue("Connection/mode", "carrier-pigeon");
    }
    AppSettings s;
    QString err;
    EXPECT_FALSE(AppSettings::load(path, s, err));
    EXPECT_TRUE(err.contains(QStringLiteral("carrier-pigeon")));

    meterlink::ConnectionMode m = meterlink::ConnectionMode::Polling;
    EXPECT_TRUE(parseMode(QStringLiteral(" Stream "), m));
    EXPECT_EQ(m, meterlink::ConnectionMode::Stream);
}

TEST(Settings, DescriptionExpandsTimestamp) {
    AppSettings s;
    const QString d = s.descriptionFor(meterlink::FileCategory::Image);
    EXPECT_TRUE(QRegularExpression(QStringLiteral("^Image data_\\d{8}_\\d{6}$")).match(d).hasMatch())
        << d.toStdString();
    s.tabularDescriptionFormat = QStringLiteral("fixed");
    EXPECT_EQ(s.descriptionFor(meterlink::FileCategory::Tabular), QStringLiteral("fixed"));
}

TEST(Settings, MachineKeyIsStableHex) {
    const QString k = machineKey();
    EXPECT_EQ(k.size(), 64);
    EXPECT_EQ(k, machineKey());
}
