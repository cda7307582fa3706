// Upload scheduler: runs selected queue items on a bounded worker pool with
// progress reporting, batch tally and cooperative cancellation.
#pragma once
#include "DeviceApi.hpp"
#include "Types.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace meterlink {

class WorkQueue;

// Receives transfer events. Called from worker threads; for one item the order is
// always onProgress... then a single onResult.
class TransferObserver {
public:
    virtual ~TransferObserver() = default;
    virtual void onProgress(std::uint64_t itemId, int percent) = 0;
    virtual void onResult(const TransferResult& result) = 0;
    // Fired once per batch, after the last result of the batch was delivered.
    virtual void onBatchFinished(const BatchTally& tally) { (void)tally; }
};

// (original - compressed) / original * 100, or 0 when original is 0.
double compressionRatio(std::uint64_t original, std::uint64_t compressed);

// Success result for an item, including the compression report for images.
TransferResult makeSuccessResult(const TransferItem& item, const TransferReceipt& receipt);

class UploadScheduler {
public:
    UploadScheduler(WorkQueue& queue, DeviceApi& api, SchedulerConfig cfg = {});
    ~UploadScheduler();

    UploadScheduler(const UploadScheduler&) = delete;
    UploadScheduler& operator=(const UploadScheduler&) = delete;

    // Credentials sent with every upload
    void setIdentity(const DeviceIdentity& id);
    // Not owned. Set before submitting work.
    void setObserver(TransferObserver* o) { observer_ = o; }

    // Concurrency: maximum number of simultaneous transfers
    void setMaxConcurrent(int n);
    int maxConcurrent() const;

    // Queue every selected, not yet uploaded item. Returns immediately with the number
    // of items actually queued; 0 with "Nothing to upload" when no item qualifies.
    std::size_t submit(const std::vector<TransferItem>& items, std::string& err);

    // Drop queued tasks (they go back to Pending) and ask running ones to stop after
    // their current request. Returns the number of tasks that never started.
    std::size_t cancelAll();

    // Pure scan of the current batch's item statuses.
    BatchTally batchTally() const;

    int inFlight() const { return running_.load(); }
    int peakInFlight() const { return peak_.load(); }
    std::size_t queued() const;

    // Block until nothing is queued or running, or the timeout expires.
    bool waitForIdle(std::chrono::milliseconds timeout);

private:
    void workerLoop();
    void runTask(std::uint64_t id, std::uint64_t generation);
    void deliverResult(const TransferResult& result);
    void emitProgress(std::uint64_t id, int percent);
    // Caller holds mtx_
    bool ensureWorkersLocked(std::string& err);
    BatchTally tallyLocked() const;
    void removeFromBatchLocked(std::uint64_t id);
    bool takeBatchReportLocked(BatchTally& tally);

    // Decrements the in-flight counter exactly once, whatever way the task ends.
    class InFlightSlot {
    public:
        explicit InFlightSlot(UploadScheduler& s) : s_(s) {}
        ~InFlightSlot();
    private:
        UploadScheduler& s_;
    };

    WorkQueue& queue_;        // not owned
    DeviceApi& api_;          // not owned; must be callable from any thread
    TransferObserver* observer_ = nullptr;
    DeviceIdentity identity_;

    std::deque<std::uint64_t> pending_;   // FIFO of admitted-but-not-started ids
    std::vector<std::uint64_t> batch_;    // ids of the current batch
    bool batchReported_ = false;
    int undelivered_ = 0;                 // started tasks whose result is not out yet
    int maxConcurrent_ = 2;
    bool shutdown_ = false;

    std::atomic<int> running_{0};
    std::atomic<int> peak_{0};
    // Bumped by cancelAll(); a task compares it with the value seen at start
    std::atomic<std::uint64_t> cancelGeneration_{0};

    std::vector<std::thread> workers_;
    mutable std::mutex mtx_;             // protects everything above except atomics
    std::condition_variable workCv_;
    std::condition_variable idleCv_;
};

} // namespace meterlink
