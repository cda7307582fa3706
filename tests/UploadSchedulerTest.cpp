#include "meterlink/MockDeviceApi.hpp"
#include "meterlink/UploadScheduler.hpp"
#include "meterlink/WorkQueue.hpp"
#include "TestUtil.hpp"
#include <gtest/gtest.h>

using namespace meterlink;
using namespace std::chrono_literals;
using test::makeItem;
using test::waitUntil;

namespace {

class UploadSchedulerTest : public ::testing::Test {
protected:
    std::uint64_t add(const std::string& path, FileCategory cat, std::uint64_t size = 1000) {
        std::uint64_t id = 0;
        std::string err;
        EXPECT_TRUE(queue.add(makeItem(path, cat, size), id, err)) << err;
        return id;
    }

    void useDelay(std::chrono::milliseconds d) {
        MockDeviceApi::UploadBehavior b;
        b.delay = d;
        api.setDefaultUploadBehavior(b);
    }

    std::unique_ptr<UploadScheduler> makeScheduler(int slots) {
        SchedulerConfig cfg;
        cfg.maxConcurrent = slots;
        auto s = std::make_unique<UploadScheduler>(queue, api, cfg);
        s->setIdentity(test::testIdentity());
        s->setObserver(&rec);
        return s;
    }

    WorkQueue queue;
    MockDeviceApi api;
    test::RecordingTransferObserver rec;
};

} // namespace

TEST(CompressionRatio, MatchesReportedSizes) {
    EXPECT_DOUBLE_EQ(compressionRatio(2000000, 500000), 75.0);
    EXPECT_DOUBLE_EQ(compressionRatio(0, 500000), 0.0);
    EXPECT_DOUBLE_EQ(compressionRatio(1000, 1000), 0.0);
}

TEST(CompressionRatio, ImageResultCarriesSizeReport) {
    TransferItem img = makeItem("/d/front.jpg", FileCategory::Image, 2000000);
    TransferReceipt receipt;
    receipt.fileId = "42";
    receipt.originalSize = 2000000;
    receipt.compressedSize = 500000;

    const auto r = makeSuccessResult(img, receipt);
    EXPECT_TRUE(r.success);
    EXPECT_EQ(r.fileName, "front.jpg");
    EXPECT_DOUBLE_EQ(r.compressionRatio, 75.0);
    EXPECT_EQ(r.originalSize, std::optional<std::uint64_t>(2000000));
    EXPECT_NE(r.message.find("File ID: 42"), std::string::npos);
    EXPECT_NE(r.message.find("Original size: 1.91MB"), std::string::npos);
    EXPECT_NE(r.message.find("Compressed: 0.48MB"), std::string::npos);
    EXPECT_NE(r.message.find("Compression ratio: 75.0%"), std::string::npos);

    // Spreadsheets never get a compression report
    TransferItem sheet = makeItem("/d/a.xlsx", FileCategory::Tabular, 2000000);
    const auto t = makeSuccessResult(sheet, receipt);
    EXPECT_EQ(t.message, "Upload succeeded. File ID: 42");
    EXPECT_FALSE(t.compressedSize.has_value());
}

TEST_F(UploadSchedulerTest, EmptySelectionIsRejected) {
    auto s = makeScheduler(2);
    std::string err;
    EXPECT_FALSE(s->submit({}, err));
    EXPECT_EQ(err, "Nothing to upload");
    EXPECT_EQ(s->batchTally().submitted, 0u);
}

TEST_F(UploadSchedulerTest, AllItemsRunTogetherWithinLimit) {
    add("/d/a.xlsx", FileCategory::Tabular);
    add("/d/b.xlsx", FileCategory::Tabular);
    add("/d/c.png", FileCategory::Image);
    useDelay(300ms);
    auto s = makeScheduler(3);

    std::string err;
    ASSERT_TRUE(s->submit(queue.selected(), err)) << err;
    ASSERT_TRUE(waitUntil([&] { return rec.batchCount() == 1; }));

    EXPECT_EQ(s->peakInFlight(), 3);
    EXPECT_EQ(api.maxConcurrentUploads(), 3);
    EXPECT_EQ(rec.resultCount(), 3u);
    EXPECT_EQ(s->inFlight(), 0);
}

TEST_F(UploadSchedulerTest, InFlightNeverExceedsLimit) {
    for (int i = 0; i < 7; ++i) add("/d/run" + std::to_string(i) + ".xlsx", FileCategory::Tabular);
    useDelay(40ms);
    auto s = makeScheduler(2);

    std::string err;
    ASSERT_TRUE(s->submit(queue.selected(), err));
    ASSERT_TRUE(waitUntil([&] { return rec.batchCount() == 1; }));

    EXPECT_LE(s->peakInFlight(), 2);
    EXPECT_LE(api.maxConcurrentUploads(), 2);
    EXPECT_EQ(rec.resultCount(), 7u);
    EXPECT_EQ(api.uploadCount(), 7);
}

TEST_F(UploadSchedulerTest, SingleSlotStartsItemsInSubmissionOrder) {
    std::vector<std::uint64_t> ids;
    for (const char* name : {"e.xlsx", "b.png", "d.xls", "a.jpg", "c.xlsx"})
        ids.push_back(add(std::string("/d/") + name,
                          std::string(name).find(".xls") != std::string::npos ? FileCategory::Tabular
                                                                               : FileCategory::Image));
    useDelay(20ms);
    auto s = makeScheduler(1);

    std::string err;
    ASSERT_EQ(s->submit(queue.selected(), err), 5u) << err;
    ASSERT_TRUE(waitUntil([&] { return rec.batchCount() == 1; }));

    std::lock_guard<std::mutex> lk(rec.mtx);
    EXPECT_EQ(rec.startOrder, ids);
    for (auto id : ids) EXPECT_EQ(rec.progress[id].front(), 0);
}

TEST_F(UploadSchedulerTest, SubmitReturnsOnlyNewlyQueuedCount) {
    for (int i = 0; i < 3; ++i) add("/d/q" + std::to_string(i) + ".xlsx", FileCategory::Tabular);
    useDelay(80ms);
    auto s = makeScheduler(1);

    std::string err;
    EXPECT_EQ(s->submit(queue.selected(), err), 3u);
    add("/d/q3.xlsx", FileCategory::Tabular);
    // The first three are queued or running and are skipped
    EXPECT_EQ(s->submit(queue.selected(), err), 1u);
    ASSERT_TRUE(waitUntil([&] { return rec.batchCount() == 1; }));
    EXPECT_EQ(rec.batches.front().submitted, 4u);
    EXPECT_EQ(s->submit(queue.selected(), err), 0u);
    EXPECT_EQ(err, "Nothing to upload");
}

TEST_F(UploadSchedulerTest, MixedBatchReportsEveryItemOnce) {
    const auto a = add("/d/a.xlsx", FileCategory::Tabular);
    const auto b = add("/d/b.xls", FileCategory::Tabular);
    const auto c = add("/d/c.jpg", FileCategory::Image, 2000000);
    MockDeviceApi::UploadBehavior img;
    img.compressedSize = 500000;
    img.delay = 20ms;
    api.setUploadBehavior("/d/c.jpg", img);
    useDelay(20ms);
    auto s = makeScheduler(2);

    std::string err;
    ASSERT_TRUE(s->submit(queue.selected(), err));
    ASSERT_TRUE(waitUntil([&] { return rec.batchCount() == 1; }));

    std::lock_guard<std::mutex> lk(rec.mtx);
    ASSERT_EQ(rec.results.size(), 3u);
    for (auto id : {a, b, c}) {
        const auto& p = rec.progress[id];
        ASSERT_FALSE(p.empty());
        EXPECT_EQ(p.front(), 0);
        EXPECT_EQ(p.back(), 100);
        for (std::size_t i = 1; i + 1 < p.size(); ++i) {
            EXPECT_GE(p[i], 1);
            EXPECT_LE(p[i], 99);
        }
        EXPECT_EQ(queue.status(id), TransferItem::Status::Succeeded);
        EXPECT_FALSE(queue.find(id)->selected);
    }
    for (const auto& r : rec.results) {
        EXPECT_TRUE(r.success);
        if (r.itemId == c) EXPECT_DOUBLE_EQ(r.compressionRatio, 75.0);
    }
    const BatchTally& t = rec.batches.front();
    EXPECT_EQ(t.submitted, 3u);
    EXPECT_EQ(t.succeeded, 3u);
    EXPECT_EQ(t.failed, 0u);
    EXPECT_EQ(t.outstanding, 0u);
}

TEST_F(UploadSchedulerTest, ThrowingTransferIsIsolated) {
    const auto bad = add("/d/bad.xlsx", FileCategory::Tabular);
    add("/d/ok1.xlsx", FileCategory::Tabular);
    add("/d/ok2.png", FileCategory::Image);
    MockDeviceApi::UploadBehavior boom;
    boom.throws = true;
    boom.error = "disk vanished";
    api.setUploadBehavior("/d/bad.xlsx", boom);
    auto s = makeScheduler(2);

    std::string err;
    ASSERT_TRUE(s->submit(queue.selected(), err));
    ASSERT_TRUE(waitUntil([&] { return rec.batchCount() == 1; }));

    std::lock_guard<std::mutex> lk(rec.mtx);
    ASSERT_EQ(rec.results.size(), 3u);
    for (const auto& r : rec.results) {
        if (r.itemId == bad) {
            EXPECT_FALSE(r.success);
            EXPECT_NE(r.message.find("disk vanished"), std::string::npos);
            EXPECT_EQ(rec.progress[bad].back(), 0);
        } else {
            EXPECT_TRUE(r.success) << r.message;
        }
    }
    EXPECT_EQ(queue.status(bad), TransferItem::Status::Failed);
    EXPECT_EQ(rec.batches.front().succeeded, 2u);
    EXPECT_EQ(rec.batches.front().failed, 1u);
    EXPECT_EQ(s->inFlight(), 0);
}

TEST_F(UploadSchedulerTest, TallyIsStableAfterCompletion) {
    add("/d/a.xlsx", FileCategory::Tabular);
    const auto b = add("/d/b.xlsx", FileCategory::Tabular);
    MockDeviceApi::UploadBehavior fail;
    fail.fail = true;
    api.setUploadBehavior("/d/b.xlsx", fail);
    auto s = makeScheduler(2);

    std::string err;
    ASSERT_TRUE(s->submit(queue.selected(), err));
    ASSERT_TRUE(waitUntil([&] { return rec.batchCount() == 1; }));

    const BatchTally first = s->batchTally();
    const BatchTally second = s->batchTally();
    EXPECT_EQ(first, second);
    EXPECT_EQ(first.succeeded, 1u);
    EXPECT_EQ(first.failed, 1u);
    EXPECT_TRUE(first.finished());
    EXPECT_EQ(queue.find(b)->lastMessage, "Upload failed: Simulated upload failure");

    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(rec.batchCount(), 1u);
}

TEST_F(UploadSchedulerTest, CancelAllKeepsQueuedItemsPending) {
    for (int i = 0; i < 4; ++i) add("/d/run" + std::to_string(i) + ".xlsx", FileCategory::Tabular);
    useDelay(200ms);
    auto s = makeScheduler(1);

    std::string err;
    ASSERT_TRUE(s->submit(queue.selected(), err));
    ASSERT_TRUE(waitUntil([&] { return s->inFlight() == 1; }));

    EXPECT_EQ(s->cancelAll(), 3u);
    ASSERT_TRUE(waitUntil([&] { return rec.batchCount() == 1; }));
    EXPECT_TRUE(s->waitForIdle(1s));

    // The running upload finished with its real outcome; the rest never started
    EXPECT_EQ(rec.resultCount(), 1u);
    EXPECT_EQ(api.uploadCount(), 1);
    std::size_t pending = 0;
    for (const auto& t : queue.snapshot())
        if (t.status == TransferItem::Status::Pending) ++pending;
    EXPECT_EQ(pending, 3u);
    EXPECT_EQ(rec.batches.front().submitted, 1u);
    EXPECT_EQ(rec.batches.front().succeeded, 1u);
}

TEST_F(UploadSchedulerTest, RetriedItemStartsNewBatch) {
    const auto a = add("/d/a.xlsx", FileCategory::Tabular);
    MockDeviceApi::UploadBehavior fail;
    fail.fail = true;
    api.setUploadBehavior("/d/a.xlsx", fail);
    auto s = makeScheduler(2);

    std::string err;
    ASSERT_TRUE(s->submit(queue.selected(), err));
    ASSERT_TRUE(waitUntil([&] { return rec.batchCount() == 1; }));
    EXPECT_EQ(queue.status(a), TransferItem::Status::Failed);

    api.setUploadBehavior("/d/a.xlsx", MockDeviceApi::UploadBehavior{});
    ASSERT_TRUE(queue.retry(a));
    ASSERT_TRUE(s->submit(queue.selected(), err));
    ASSERT_TRUE(waitUntil([&] { return rec.batchCount() == 2; }));
    EXPECT_EQ(queue.status(a), TransferItem::Status::Succeeded);

    // Nothing left: a succeeded item is never picked up again
    EXPECT_TRUE(queue.selected().empty());
    EXPECT_FALSE(s->submit(queue.snapshot(), err));
}

TEST_F(UploadSchedulerTest, RaisingLimitAtRuntimeAddsSlots) {
    for (int i = 0; i < 4; ++i) add("/d/run" + std::to_string(i) + ".xlsx", FileCategory::Tabular);
    useDelay(150ms);
    auto s = makeScheduler(1);

    std::string err;
    ASSERT_TRUE(s->submit(queue.selected(), err));
    ASSERT_TRUE(waitUntil([&] { return s->inFlight() == 1; }));
    s->setMaxConcurrent(3);
    EXPECT_EQ(s->maxConcurrent(), 3);
    ASSERT_TRUE(waitUntil([&] { return rec.batchCount() == 1; }));
    EXPECT_GE(s->peakInFlight(), 2);
    EXPECT_LE(s->peakInFlight(), 3);
}
