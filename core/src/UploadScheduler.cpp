// Scheduler implementation: a pool of worker threads pulls item ids from a FIFO and
// runs one transfer each, never more than maxConcurrent_ at a time.
#include "meterlink/UploadScheduler.hpp"
#include "meterlink/Log.hpp"
#include "meterlink/WorkQueue.hpp"
#include <algorithm>
#include <cstdio>
#include <exception>
#include <system_error>

namespace meterlink {

static constexpr double MIB = 1024.0 * 1024.0;

double compressionRatio(std::uint64_t original, std::uint64_t compressed) {
    if (original == 0) return 0.0;
    const double o = static_cast<double>(original);
    return (o - static_cast<double>(compressed)) / o * 100.0;
}

TransferResult makeSuccessResult(const TransferItem& item, const TransferReceipt& receipt) {
    TransferResult r;
    r.itemId = item.id;
    r.fileName = item.fileName();
    r.success = true;
    r.message = "Upload succeeded. File ID: " + receipt.fileId;

    // Compression report only for images the server actually recompressed
    if (item.category == FileCategory::Image && receipt.compressedSize.has_value()) {
        const double ratio = compressionRatio(receipt.originalSize, *receipt.compressedSize);
        r.originalSize = receipt.originalSize;
        r.compressedSize = *receipt.compressedSize;
        r.compressionRatio = ratio;
        if (ratio > 0.0) {
            char buf[160];
            std::snprintf(buf, sizeof(buf),
                          "\nOriginal size: %.2fMB\nCompressed: %.2fMB\nCompression ratio: %.1f%%",
                          double(receipt.originalSize) / MIB,
                          double(*receipt.compressedSize) / MIB,
                          ratio);
            r.message += buf;
        }
    }
    return r;
}

UploadScheduler::InFlightSlot::~InFlightSlot() {
    {
        std::lock_guard<std::mutex> lk(s_.mtx_);
        s_.running_.fetch_sub(1);
    }
    s_.workCv_.notify_all();
    s_.idleCv_.notify_all();
}

UploadScheduler::UploadScheduler(WorkQueue& queue, DeviceApi& api, SchedulerConfig cfg)
    : queue_(queue), api_(api), maxConcurrent_(std::max(1, cfg.maxConcurrent)) {}

UploadScheduler::~UploadScheduler() {
    // Running transfers finish their request; queued ones are dropped
    {
        std::lock_guard<std::mutex> lk(mtx_);
        shutdown_ = true;
        pending_.clear();
        cancelGeneration_.fetch_add(1);
    }
    workCv_.notify_all();
    for (auto& th : workers_) {
        if (th.joinable()) th.join();
    }
    workers_.clear();
}

void UploadScheduler::setIdentity(const DeviceIdentity& id) {
    std::lock_guard<std::mutex> lk(mtx_);
    identity_ = id;
}

void UploadScheduler::setMaxConcurrent(int n) {
    if (n < 1) n = 1;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        maxConcurrent_ = n;
        if (!workers_.empty()) {
            std::string err;
            if (!ensureWorkersLocked(err)) LOGE("scheduler: %s", err.c_str());
        }
    }
    workCv_.notify_all();
}

int UploadScheduler::maxConcurrent() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return maxConcurrent_;
}

std::size_t UploadScheduler::submit(const std::vector<TransferItem>& items, std::string& err) {
    std::size_t accepted = 0;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (shutdown_) {
            err = "Scheduler is shutting down";
            return 0;
        }
        bool newBatch = batch_.empty() || batchReported_;
        for (const auto& t : items) {
            if (!t.selected) continue;
            if (std::find(pending_.begin(), pending_.end(), t.id) != pending_.end()) continue;
            // Rejects succeeded, in-flight and removed items
            if (!queue_.markQueued(t.id)) continue;
            if (newBatch) {
                batch_.clear();
                batchReported_ = false;
                newBatch = false;
            }
            pending_.push_back(t.id);
            if (std::find(batch_.begin(), batch_.end(), t.id) == batch_.end()) batch_.push_back(t.id);
            ++accepted;
        }
        if (accepted == 0) {
            err = "Nothing to upload";
            LOGW("scheduler: submit with no eligible item");
            return 0;
        }
        if (!ensureWorkersLocked(err) && workers_.empty()) {
            for (auto id : pending_) removeFromBatchLocked(id);
            pending_.clear();
            return 0;
        }
        LOGI("scheduler: queued %zu item(s), batch size %zu, %d slot(s)",
             accepted, batch_.size(), maxConcurrent_);
    }
    workCv_.notify_all();
    return accepted;
}

std::size_t UploadScheduler::cancelAll() {
    std::size_t dropped = 0;
    BatchTally tally;
    bool report = false;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        dropped = pending_.size();
        for (auto id : pending_) removeFromBatchLocked(id);
        pending_.clear();
        cancelGeneration_.fetch_add(1);
        report = takeBatchReportLocked(tally);
    }
    LOGI("scheduler: cancel requested, %zu queued task(s) dropped, %d still running",
         dropped, running_.load());
    idleCv_.notify_all();
    if (report && observer_) observer_->onBatchFinished(tally);
    return dropped;
}

BatchTally UploadScheduler::batchTally() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return tallyLocked();
}

std::size_t UploadScheduler::queued() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return pending_.size();
}

bool UploadScheduler::waitForIdle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(mtx_);
    return idleCv_.wait_for(lk, timeout, [this] {
        return pending_.empty() && running_.load() == 0;
    });
}

bool UploadScheduler::ensureWorkersLocked(std::string& err) {
    while (static_cast<int>(workers_.size()) < maxConcurrent_) {
        try {
            workers_.emplace_back(&UploadScheduler::workerLoop, this);
        } catch (const std::system_error& e) {
            err = std::string("Cannot start upload worker: ") + e.what();
            LOGE("scheduler: %s", err.c_str());
            return false;
        }
    }
    return true;
}

void UploadScheduler::workerLoop() {
    for (;;) {
        std::uint64_t id = 0;
        std::uint64_t generation = 0;
        {
            std::unique_lock<std::mutex> lk(mtx_);
            // Extra workers left over after lowering the limit simply stay idle here
            workCv_.wait(lk, [this] {
                return shutdown_ || (!pending_.empty() && running_.load() < maxConcurrent_);
            });
            if (shutdown_) return;
            id = pending_.front();
            pending_.pop_front();
            const int now = running_.fetch_add(1) + 1;
            int prev = peak_.load();
            while (now > prev && !peak_.compare_exchange_weak(prev, now)) {}
            ++undelivered_;
            generation = cancelGeneration_.load();
        }
        InFlightSlot slot(*this);
        runTask(id, generation);
    }
}

void UploadScheduler::runTask(std::uint64_t id, std::uint64_t generation) {
    if (!queue_.markInFlight(id)) {
        // Removed by the operator while it waited for a slot
        LOGW("scheduler: item #%llu left the queue before starting", static_cast<unsigned long long>(id));
        BatchTally tally;
        bool report = false;
        {
            std::lock_guard<std::mutex> lk(mtx_);
            --undelivered_;
            removeFromBatchLocked(id);
            report = takeBatchReportLocked(tally);
        }
        if (report && observer_) observer_->onBatchFinished(tally);
        return;
    }

    const auto item = queue_.find(id);
    DeviceIdentity ident;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        ident = identity_;
    }

    TransferResult result;
    result.itemId = id;
    result.fileName = item ? item->fileName() : std::string();
    emitProgress(id, 0);

    // Task boundary: nothing thrown by the backend may reach the pool
    try {
        if (!item) {
            result.message = "Upload failed: item is no longer queued";
        } else {
            LOGI("scheduler: uploading #%llu %s", static_cast<unsigned long long>(id),
                 result.fileName.c_str());
            int lastPct = 0;
            auto progress = [this, id, &lastPct](std::size_t done, std::size_t total) {
                int pct = (total > 0) ? int((done * 100) / total) : 0;
                pct = std::min(99, std::max(1, pct));
                if (pct == lastPct) return;
                lastPct = pct;
                emitProgress(id, pct);
            };
            auto shouldCancel = [this, generation]() -> bool {
                return cancelGeneration_.load() != generation;
            };

            TransferReceipt receipt;
            std::string err;
            if (api_.transferFile(ident, *item, receipt, err, progress, shouldCancel)) {
                result = makeSuccessResult(*item, receipt);
            } else {
                result.message = "Upload failed: " + (err.empty() ? std::string("unknown error") : err);
            }
        }
    } catch (const std::exception& e) {
        result.success = false;
        result.message = std::string("Upload failed: ") + e.what();
    } catch (...) {
        result.success = false;
        result.message = "Upload failed: unexpected error";
    }

    queue_.markFinished(id, result.success, result.message);
    if (result.success) {
        LOGI("scheduler: #%llu done: %s", static_cast<unsigned long long>(id), result.message.c_str());
    } else {
        LOGE("scheduler: #%llu %s", static_cast<unsigned long long>(id), result.message.c_str());
    }
    // Success fills the bar, failure resets it
    emitProgress(id, result.success ? 100 : 0);
    deliverResult(result);
}

void UploadScheduler::deliverResult(const TransferResult& result) {
    if (observer_) observer_->onResult(result);

    BatchTally tally;
    bool report = false;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        --undelivered_;
        report = takeBatchReportLocked(tally);
    }
    if (report && observer_) observer_->onBatchFinished(tally);
}

void UploadScheduler::emitProgress(std::uint64_t id, int percent) {
    if (observer_) observer_->onProgress(id, percent);
}

BatchTally UploadScheduler::tallyLocked() const {
    BatchTally t;
    for (auto id : batch_) {
        const auto st = queue_.status(id);
        if (!st) continue; // removed while waiting
        ++t.submitted;
        switch (*st) {
            case TransferItem::Status::Succeeded: ++t.succeeded; break;
            case TransferItem::Status::Failed:    ++t.failed; break;
            case TransferItem::Status::Pending:
            case TransferItem::Status::InFlight:  ++t.outstanding; break;
        }
    }
    return t;
}

void UploadScheduler::removeFromBatchLocked(std::uint64_t id) {
    batch_.erase(std::remove(batch_.begin(), batch_.end(), id), batch_.end());
}

bool UploadScheduler::takeBatchReportLocked(BatchTally& tally) {
    if (batchReported_ || undelivered_ > 0) return false;
    tally = tallyLocked();
    if (!tally.finished()) return false;
    batchReported_ = true;
    LOGI("scheduler: batch finished, %zu succeeded, %zu failed",
         tally.succeeded, tally.failed);
    return true;
}

} // namespace meterlink
