// Work queue implementation: every accessor copies under the lock so callers never
// hold references into items_.
#include "meterlink/WorkQueue.hpp"
#include "meterlink/Log.hpp"
#include <algorithm>

namespace meterlink {

bool WorkQueue::add(TransferItem item, std::uint64_t& id, std::string& err) {
    std::lock_guard<std::mutex> lk(mtx_);
    for (const auto& t : items_) {
        if (t.path == item.path) {
            err = "Already in the list: " + item.fileName();
            return false;
        }
    }
    item.id = nextId_++;
    item.status = TransferItem::Status::Pending;
    item.lastMessage.clear();
    id = item.id;
    LOGI("queue: added #%llu %s (%s, %llu bytes)", static_cast<unsigned long long>(id),
         item.fileName().c_str(), toString(item.category),
         static_cast<unsigned long long>(item.size));
    items_.push_back(std::move(item));
    return true;
}

bool WorkQueue::remove(std::uint64_t id, std::string& err) {
    std::lock_guard<std::mutex> lk(mtx_);
    int i = indexForId(id);
    if (i < 0) {
        err = "No such item";
        return false;
    }
    if (items_[i].status == TransferItem::Status::InFlight) {
        err = "Item is being uploaded";
        return false;
    }
    items_.erase(items_.begin() + i);
    return true;
}

std::size_t WorkQueue::clear() {
    std::lock_guard<std::mutex> lk(mtx_);
    const auto before = items_.size();
    items_.erase(std::remove_if(items_.begin(), items_.end(), [](const TransferItem& t) {
        return t.status != TransferItem::Status::InFlight;
    }), items_.end());
    return before - items_.size();
}

std::size_t WorkQueue::clearCompleted() {
    std::lock_guard<std::mutex> lk(mtx_);
    const auto before = items_.size();
    items_.erase(std::remove_if(items_.begin(), items_.end(), [](const TransferItem& t) {
        return t.status == TransferItem::Status::Succeeded;
    }), items_.end());
    return before - items_.size();
}

bool WorkQueue::setSelected(std::uint64_t id, bool on) {
    std::lock_guard<std::mutex> lk(mtx_);
    int i = indexForId(id);
    if (i < 0 || !selectable(items_[i])) return false;
    items_[i].selected = on;
    return true;
}

void WorkQueue::selectAll() {
    std::lock_guard<std::mutex> lk(mtx_);
    for (auto& t : items_)
        if (selectable(t)) t.selected = true;
}

void WorkQueue::deselectAll() {
    std::lock_guard<std::mutex> lk(mtx_);
    for (auto& t : items_)
        if (selectable(t)) t.selected = false;
}

bool WorkQueue::retry(std::uint64_t id) {
    std::lock_guard<std::mutex> lk(mtx_);
    int i = indexForId(id);
    if (i < 0 || items_[i].status != TransferItem::Status::Failed) return false;
    items_[i].status = TransferItem::Status::Pending;
    items_[i].selected = true;
    items_[i].lastMessage.clear();
    return true;
}

std::vector<TransferItem> WorkQueue::selected() const {
    std::lock_guard<std::mutex> lk(mtx_);
    std::vector<TransferItem> out;
    for (const auto& t : items_)
        if (t.selected && selectable(t)) out.push_back(t);
    return out;
}

std::vector<TransferItem> WorkQueue::snapshot() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return items_;
}

std::optional<TransferItem> WorkQueue::find(std::uint64_t id) const {
    std::lock_guard<std::mutex> lk(mtx_);
    int i = indexForId(id);
    if (i < 0) return std::nullopt;
    return items_[i];
}

std::optional<TransferItem::Status> WorkQueue::status(std::uint64_t id) const {
    std::lock_guard<std::mutex> lk(mtx_);
    int i = indexForId(id);
    if (i < 0) return std::nullopt;
    return items_[i].status;
}

WorkQueue::Counts WorkQueue::counts() const {
    std::lock_guard<std::mutex> lk(mtx_);
    Counts c;
    for (const auto& t : items_) {
        if (t.category == FileCategory::Tabular) ++c.tabular;
        else ++c.image;
    }
    return c;
}

std::size_t WorkQueue::size() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return items_.size();
}

bool WorkQueue::markQueued(std::uint64_t id) {
    std::lock_guard<std::mutex> lk(mtx_);
    int i = indexForId(id);
    if (i < 0 || !selectable(items_[i])) return false;
    items_[i].status = TransferItem::Status::Pending;
    return true;
}

bool WorkQueue::markInFlight(std::uint64_t id) {
    std::lock_guard<std::mutex> lk(mtx_);
    int i = indexForId(id);
    if (i < 0) return false;
    auto& t = items_[i];
    if (!selectable(t)) return false;
    t.status = TransferItem::Status::InFlight;
    t.lastMessage.clear();
    return true;
}

void WorkQueue::markFinished(std::uint64_t id, bool success, const std::string& message) {
    std::lock_guard<std::mutex> lk(mtx_);
    int i = indexForId(id);
    if (i < 0) return;
    auto& t = items_[i];
    t.status = success ? TransferItem::Status::Succeeded : TransferItem::Status::Failed;
    t.lastMessage = message;
    if (success) t.selected = false;
}

int WorkQueue::indexForId(std::uint64_t id) const {
    for (int i = 0; i < static_cast<int>(items_.size()); ++i)
        if (items_[i].id == id) return i;
    return -1;
}

} // namespace meterlink
