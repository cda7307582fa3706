// Basic types shared between the shell and core for device sessions and transfers.
// Kept as plain structures so the shell can copy them across threads freely.
#pragma once
#include <string>
#include <optional>
#include <cstdint>
#include <cstddef>
#include <chrono>
#include <filesystem>

namespace meterlink {

// Liveness state as seen by the device. Written only by the ConnectivitySupervisor.
enum class ConnectionState {
    Disconnected,
    Connecting,   // loop started, no probe has succeeded yet
    Connected,
    Degraded      // a probe failed after having been Connected
};

inline const char* toString(ConnectionState s) {
    switch (s) {
        case ConnectionState::Disconnected: return "Disconnected";
        case ConnectionState::Connecting:   return "Connecting";
        case ConnectionState::Connected:    return "Connected";
        case ConnectionState::Degraded:     return "Degraded";
    }
    return "?";
}

// Which LivenessTransport the session uses.
enum class ConnectionMode { Polling, Stream };

// Result of one liveness exchange.
//  - Idle: stream strategy read timeout with no traffic; not a failure
//  - Cancelled: the wait was interrupted by the caller's own stop()
enum class ProbeOutcome { Success, Timeout, TransportError, Idle, Cancelled };

inline const char* toString(ProbeOutcome o) {
    switch (o) {
        case ProbeOutcome::Success:        return "success";
        case ProbeOutcome::Timeout:        return "timeout";
        case ProbeOutcome::TransportError: return "transport-error";
        case ProbeOutcome::Idle:           return "idle";
        case ProbeOutcome::Cancelled:      return "cancelled";
    }
    return "?";
}

enum class FileCategory {
    Tabular,  // spreadsheet exports of electrical measurements
    Image     // geometry photographs; the server may recompress them
};

inline const char* toString(FileCategory c) {
    return c == FileCategory::Tabular ? "Tabular data" : "Image data";
}

struct DeviceIdentity {
    std::string deviceId;
    std::string deviceName;
    std::string hardwareKey;
    std::string networkAddress; // reported on register/authenticate

    bool hasCredentials() const { return !deviceId.empty() && !hardwareKey.empty(); }
};

// Outcome of register/authenticate/set-status calls.
struct ApiOutcome {
    bool ok = false;
    std::string message; // server "message" on success, "detail" on rejection
};

// One heartbeat round-trip. Created and dropped by the supervisor each cycle.
struct LivenessProbe {
    std::chrono::steady_clock::time_point sentAt{};
    ProbeOutcome outcome = ProbeOutcome::Success;
    ConnectionState before = ConnectionState::Disconnected;
    ConnectionState after = ConnectionState::Disconnected;
};

// Upload queue item.
struct TransferItem {
    std::uint64_t id = 0;        // stable identifier for cross-thread updates
    std::string path;            // local file
    FileCategory category = FileCategory::Tabular;
    std::string description;
    std::uint64_t size = 0;      // bytes
    // Item state:
    //  - Pending: waiting for the operator or for a worker slot
    //  - InFlight: a worker is transferring it
    //  - Succeeded: uploaded; never selected again automatically
    //  - Failed: last attempt failed; the operator may retry it
    enum class Status { Pending, InFlight, Succeeded, Failed } status = Status::Pending;
    bool selected = true;        // operator checkbox
    std::string lastMessage;     // message of the last TransferResult

    std::string fileName() const { return std::filesystem::path(path).filename().string(); }
};

inline const char* toString(TransferItem::Status s) {
    switch (s) {
        case TransferItem::Status::Pending:   return "Pending";
        case TransferItem::Status::InFlight:  return "InFlight";
        case TransferItem::Status::Succeeded: return "Succeeded";
        case TransferItem::Status::Failed:    return "Failed";
    }
    return "?";
}

// What the server answered to an upload.
struct TransferReceipt {
    std::string fileId;
    std::uint64_t originalSize = 0;
    std::optional<std::uint64_t> compressedSize; // only when the server recompressed
};

// Outcome of one attempt. Delivered to the observer once and never stored.
struct TransferResult {
    std::uint64_t itemId = 0;
    std::string fileName;
    bool success = false;
    std::string message;
    // Image items only, when the server reported compression
    std::optional<std::uint64_t> originalSize;
    std::optional<std::uint64_t> compressedSize;
    double compressionRatio = 0.0; // percent
};

// Aggregate state of the current batch, computed by scanning item statuses.
struct BatchTally {
    std::size_t submitted = 0;
    std::size_t succeeded = 0;
    std::size_t failed = 0;
    std::size_t outstanding = 0; // queued or in flight

    bool finished() const { return submitted > 0 && outstanding == 0; }
    bool operator==(const BatchTally& o) const {
        return submitted == o.submitted && succeeded == o.succeeded &&
               failed == o.failed && outstanding == o.outstanding;
    }
    bool operator!=(const BatchTally& o) const { return !(*this == o); }
};

struct SupervisorConfig {
    std::chrono::milliseconds interval{30000};         // heartbeat period
    std::chrono::milliseconds probeTimeout{10000};     // per-probe timeout
    std::chrono::milliseconds departureTimeout{5000};  // offline notice timeout
};

struct SchedulerConfig {
    int maxConcurrent = 2; // worker slots
};

} // namespace meterlink
