// Ordered list of files waiting to be uploaded, shared between the operator layer
// and the UploadScheduler.
#pragma once
#include "Types.hpp"
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace meterlink {

class UploadScheduler;

// Operator actions touch "selected" (and the manual retry); statuses InFlight,
// Succeeded and Failed are written only by the UploadScheduler.
class WorkQueue {
public:
    struct Counts {
        std::size_t tabular = 0;
        std::size_t image = 0;
        std::size_t total() const { return tabular + image; }
    };

    // Append an item; rejects a path that is already queued. Assigns item.id.
    bool add(TransferItem item, std::uint64_t& id, std::string& err);
    // Remove one item (not while it is being transferred)
    bool remove(std::uint64_t id, std::string& err);
    // Remove every item that is not in flight. Returns the number removed.
    std::size_t clear();
    // Drop succeeded items
    std::size_t clearCompleted();

    // Checkbox handling. Rejected for in-flight and succeeded items.
    bool setSelected(std::uint64_t id, bool on);
    void selectAll();
    void deselectAll();
    // Manual retry: Failed -> Pending, selected again
    bool retry(std::uint64_t id);

    // Items eligible for the next upload: selected, Pending or Failed.
    std::vector<TransferItem> selected() const;
    std::vector<TransferItem> snapshot() const;
    std::optional<TransferItem> find(std::uint64_t id) const;
    std::optional<TransferItem::Status> status(std::uint64_t id) const;
    Counts counts() const;
    std::size_t size() const;

private:
    friend class UploadScheduler;

    // Failed -> Pending when resubmitted. False if the item vanished or is not eligible.
    bool markQueued(std::uint64_t id);
    // Pending/Failed -> InFlight. False if the item vanished or is not eligible.
    bool markInFlight(std::uint64_t id);
    // InFlight -> Succeeded (deselected) | Failed
    void markFinished(std::uint64_t id, bool success, const std::string& message);

    int indexForId(std::uint64_t id) const;
    static bool selectable(const TransferItem& t) {
        return t.status != TransferItem::Status::InFlight &&
               t.status != TransferItem::Status::Succeeded;
    }

    mutable std::mutex mtx_; // protects items_ and nextId_
    std::vector<TransferItem> items_;
    std::uint64_t nextId_ = 1;
};

} // namespace meterlink
