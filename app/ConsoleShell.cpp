#include "ConsoleShell.hpp"
#include <chrono>
#include <cstdio>

using namespace meterlink;

ConsoleShell::ConsoleShell() : out_(stdout), err_(stderr) {}

void ConsoleShell::print(const QString& line, bool error) {
    std::lock_guard<std::mutex> lk(mtx_);
    QTextStream& s = error ? err_ : out_;
    s << line << Qt::endl;
}

void ConsoleShell::onStateChanged(ConnectionState state) {
    print(QStringLiteral("[connection] %1").arg(QLatin1String(toString(state))));
}

void ConsoleShell::onConnectionError(const std::string& reason) {
    print(QStringLiteral("[connection] %1").arg(QString::fromStdString(reason)), true);
}

void ConsoleShell::onProgress(std::uint64_t itemId, int percent) {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        int& last = lastPct_[itemId];
        // 0 is the start (or a reset after failure); print only quarter steps in between
        if (percent != 0 && percent != 100 && percent / 25 == last / 25) return;
        last = percent;
    }
    print(QStringLiteral("[upload #%1] %2%").arg(itemId).arg(percent));
}

void ConsoleShell::onResult(const TransferResult& result) {
    const QString head = QStringLiteral("[upload #%1] %2: ")
        .arg(result.itemId).arg(QString::fromStdString(result.fileName));
    print(head + QString::fromStdString(result.message), !result.success);
}

void ConsoleShell::onBatchFinished(const BatchTally& tally) {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        batchDone_ = true;
        tally_ = tally;
    }
    cv_.notify_all();
}

void ConsoleShell::onLog(const std::string& line, bool error) {
    print(QString::fromStdString(line), error);
}

bool ConsoleShell::waitForBatch(const std::atomic<bool>& stop, BatchTally& tally) {
    std::unique_lock<std::mutex> lk(mtx_);
    while (!batchDone_) {
        if (stop.load()) return false;
        cv_.wait_for(lk, std::chrono::milliseconds(100));
    }
    batchDone_ = false;
    tally = tally_;
    return true;
}
