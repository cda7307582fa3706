// Blocking wait on a Qt object from a plain thread. The caller constructs a QEventLoop
// before any QObject that needs events (constructing it installs this thread's event
// dispatcher), then pumps it in short slices until the condition holds, the deadline
// passes or the caller cancels.
#pragma once
#include <QCoreApplication>
#include <QElapsedTimer>
#include <QEventLoop>
#include <QThread>
#include <chrono>
#include <functional>

namespace meterlink {
namespace detail {

enum class WaitResult { Ready, TimedOut, Cancelled };

template <typename Ready>
WaitResult pumpUntil(QEventLoop& loop,
                     Ready ready,
                     std::chrono::milliseconds timeout,
                     const std::function<bool()>& shouldCancel) {
    QElapsedTimer timer;
    timer.start();
    for (;;) {
        loop.processEvents(QEventLoop::AllEvents, 10);
        if (ready()) return WaitResult::Ready;
        if (shouldCancel && shouldCancel()) return WaitResult::Cancelled;
        if (timer.elapsed() >= timeout.count()) return WaitResult::TimedOut;
        QThread::msleep(2);
    }
}

} // namespace detail
} // namespace meterlink
