// HttpDeviceApi against a local QTcpServer. Calls run on plain std::threads, the way
// the supervisor and the upload workers make them; the test thread serves HTTP.
#include "meterlink/HttpDeviceApi.hpp"
#include "TestUtil.hpp"
#include <QCoreApplication>
#include <QEventLoop>
#include <QTcpServer>
#include <QTcpSocket>
#include <future>
#include <gtest/gtest.h>
#include <memory>

using namespace meterlink;
using namespace std::chrono_literals;

namespace {

// Minimal HTTP/1.1 responder: one canned answer per request, or none at all.
class LocalHttpServer {
public:
    LocalHttpServer() {
        QObject::connect(&server_, &QTcpServer::newConnection, [this] { accept(); });
        listening_ = server_.listen(QHostAddress::LocalHost, 0);
    }

    bool listening() const { return listening_; }
    std::string baseUrl() const { return "http://127.0.0.1:" + std::to_string(server_.serverPort()); }

    void respond(int status, const QByteArray& body) {
        status_ = status;
        body_ = body;
        silent_ = false;
    }
    void stayQuiet() { silent_ = true; }

    QByteArray lastRequestLine;
    QByteArray lastBody;
    int requests = 0;

private:
    void accept() {
        while (QTcpSocket* s = server_.nextPendingConnection()) {
            auto buf = std::make_shared<QByteArray>();
            QObject::connect(s, &QTcpSocket::readyRead, s, [this, s, buf] {
                buf->append(s->readAll());
                const int headerEnd = buf->indexOf("\r\n\r\n");
                if (headerEnd < 0) return;
                const QByteArray head = buf->left(headerEnd);
                long long length = 0;
                for (const QByteArray& line : head.split('\n')) {
                    if (line.toLower().startsWith("content-length:")) length = line.mid(15).trimmed().toLongLong();
                }
                if (buf->size() < headerEnd + 4 + length) return;
                lastRequestLine = head.left(head.indexOf("\r\n"));
                lastBody = buf->mid(headerEnd + 4, int(length));
                ++requests;
                buf->clear();
                if (silent_) return;
                QByteArray reply = "HTTP/1.1 " + QByteArray::number(status_) + " X\r\n"
                                   "Content-Type: application/json\r\n"
                                   "Content-Length: " + QByteArray::number(body_.size()) + "\r\n"
                                   "Connection: close\r\n\r\n" + body_;
                s->write(reply);
                s->disconnectFromHost();
            });
            QObject::connect(s, &QTcpSocket::disconnected, s, &QObject::deleteLater);
        }
    }

    QTcpServer server_;
    bool listening_ = false;
    bool silent_ = false;
    int status_ = 200;
    QByteArray body_ = "{}";
};

class HttpDeviceApiTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() {
        if (!QCoreApplication::instance()) {
            static int argc = 1;
            static char name[] = "HttpDeviceApiTest";
            static char* argv[] = {name, nullptr};
            static QCoreApplication app(argc, argv);
        }
    }

    void SetUp() override { ASSERT_TRUE(server.listening()); }

    // Run "f" on its own std::thread while this thread keeps serving.
    template <typename F>
    auto offThread(F f) -> decltype(f()) {
        auto fut = std::async(std::launch::async, std::move(f));
        const auto until = std::chrono::steady_clock::now() + 15s;
        while (fut.wait_for(0ms) != std::future_status::ready && std::chrono::steady_clock::now() < until) {
            QCoreApplication::processEvents(QEventLoop::AllEvents, 10);
        }
        return fut.get();
    }

    LocalHttpServer server;
    DeviceIdentity id = test::testIdentity();
};

} // namespace

TEST_F(HttpDeviceApiTest, HeartbeatFromWorkerThreadSucceeds) {
    HttpDeviceApi api(server.baseUrl() + "/");
    server.respond(200, R"({"status":"ok"})");

    std::string err;
    const auto outcome = offThread([&] { return api.sendLivenessProbe(id, 2s, err); });
    EXPECT_EQ(outcome, ProbeOutcome::Success) << err;
    EXPECT_TRUE(server.lastRequestLine.startsWith("POST /api/polling/heartbeat "));
    EXPECT_TRUE(server.lastBody.contains("device_id=METER-001"));
    EXPECT_TRUE(server.lastBody.contains("hardware_key=3f7a9c"));
}

TEST_F(HttpDeviceApiTest, SilentServerTimesOutOnTime) {
    HttpDeviceApi api(server.baseUrl());
    server.stayQuiet();

    std::string err;
    const auto t0 = std::chrono::steady_clock::now();
    const auto outcome = offThread([&] { return api.sendLivenessProbe(id, 300ms, err); });
    const auto took = std::chrono::steady_clock::now() - t0;
    EXPECT_EQ(outcome, ProbeOutcome::Timeout);
    EXPECT_GE(took, 250ms);
    EXPECT_LT(took, 3s);
}

TEST_F(HttpDeviceApiTest, ServerErrorIsTransportError) {
    HttpDeviceApi api(server.baseUrl());
    server.respond(503, "{}");

    std::string err;
    const auto outcome = offThread([&] { return api.sendLivenessProbe(id, 2s, err); });
    EXPECT_EQ(outcome, ProbeOutcome::TransportError);
    EXPECT_EQ(err, "HTTP 503");
}

TEST_F(HttpDeviceApiTest, RegistrationRejectionCarriesDetail) {
    HttpDeviceApi api(server.baseUrl(), 2s);
    server.respond(400, R"({"detail":"Device already registered"})");

    std::string message, err;
    const bool ok = offThread([&] { return api.registerDevice(id, message, err); });
    EXPECT_FALSE(ok);
    EXPECT_EQ(err, "Device already registered");

    server.respond(200, R"({"message":"Device registered successfully"})");
    err.clear();
    EXPECT_TRUE(offThread([&] { return api.registerDevice(id, message, err); })) << err;
    EXPECT_EQ(message, "Device registered successfully");
}

TEST_F(HttpDeviceApiTest, UploadFromWorkerThreadReturnsReceipt) {
    test::TempDir dir;
    TransferItem item = test::makeItem(dir.file("front.png", 64 * 1024), FileCategory::Image, 64 * 1024);
    HttpDeviceApi api(server.baseUrl(), 2s);
    server.respond(200, R"({"file_id":"f-17","original_size":2000000,"compressed_size":500000})");

    TransferReceipt receipt;
    std::string err;
    int progressCalls = 0;
    const bool ok = offThread([&] {
        return api.transferFile(id, item, receipt, err, [&](std::size_t, std::size_t) { ++progressCalls; });
    });
    ASSERT_TRUE(ok) << err;
    EXPECT_EQ(receipt.fileId, "f-17");
    EXPECT_EQ(receipt.originalSize, 2000000u);
    ASSERT_TRUE(receipt.compressedSize.has_value());
    EXPECT_EQ(*receipt.compressedSize, 500000u);
    EXPECT_GT(progressCalls, 0);
    EXPECT_TRUE(server.lastRequestLine.startsWith("POST /api/upload/file "));
    EXPECT_TRUE(server.lastBody.contains("name=\"device_id\""));
    EXPECT_TRUE(server.lastBody.contains("filename=\"front.png\""));
}

TEST_F(HttpDeviceApiTest, StalledUploadIsAbortedAfterIdleTimeout) {
    test::TempDir dir;
    TransferItem item = test::makeItem(dir.file("a.xlsx", 1024), FileCategory::Tabular, 1024);
    HttpDeviceApi api(server.baseUrl(), 300ms);
    server.stayQuiet();

    TransferReceipt receipt;
    std::string err;
    const auto t0 = std::chrono::steady_clock::now();
    const bool ok = offThread([&] { return api.transferFile(id, item, receipt, err); });
    EXPECT_FALSE(ok);
    EXPECT_FALSE(err.empty());
    EXPECT_LT(std::chrono::steady_clock::now() - t0, 5s);
}
