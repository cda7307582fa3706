// Prints session events to the terminal. Callbacks arrive on worker threads, so every
// write goes through one mutex.
#pragma once
#include "meterlink/SessionController.hpp"
#include <QTextStream>
#include <atomic>
#include <condition_variable>
#include <map>
#include <mutex>

class ConsoleShell : public meterlink::SessionObserver {
public:
    ConsoleShell();

    void onStateChanged(meterlink::ConnectionState state) override;
    void onConnectionError(const std::string& reason) override;
    void onProgress(std::uint64_t itemId, int percent) override;
    void onResult(const meterlink::TransferResult& result) override;
    void onBatchFinished(const meterlink::BatchTally& tally) override;
    void onLog(const std::string& line, bool error) override;

    void print(const QString& line, bool error = false);

    // Blocks until a batch was reported or "stop" turns true (polled).
    bool waitForBatch(const std::atomic<bool>& stop, meterlink::BatchTally& tally);

private:
    std::mutex mtx_;
    std::condition_variable cv_;
    QTextStream out_;
    QTextStream err_;
    std::map<std::uint64_t, int> lastPct_; // progress printed in 25% steps
    bool batchDone_ = false;
    meterlink::BatchTally tally_;
};
