#include "railmap/entity/entity_store.h"
#include <algorithm>
#include <utility>

namespace railmap {

void EntityStore::clear() noexcept {
    records_.clear();
    index_.clear();
    order_.clear();
    nextId_ = 1;
    nextLane_ = 0;
}

bool EntityStore::upsert(const EntityRecord& record) {
    if (record.id == kInvalidEntityId) return false;

    const auto it = index_.find(record.id);
    if (it != index_.end()) {
        const std::uint32_t lane = records_[it->second].laneIndex;
        records_[it->second] = record;
        records_[it->second].laneIndex = lane;
        return true;
    }

    index_[record.id] = records_.size();
    records_.push_back(record);
    records_.back().laneIndex = nextLane_++;
    order_.push_back(record.id);
    if (record.id >= nextId_) nextId_ = record.id + 1;
    return true;
}

bool EntityStore::remove(EntityId id) {
    const auto it = index_.find(id);
    if (it == index_.end()) return false;

    // Swap-remove keeps records_ dense; patch the index of the moved record.
    const std::size_t slot = it->second;
    const std::size_t last = records_.size() - 1;
    if (slot != last) {
        records_[slot] = std::move(records_[last]);
        index_[records_[slot].id] = slot;
    }
    records_.pop_back();
    index_.erase(id);
    order_.erase(std::remove(order_.begin(), order_.end(), id), order_.end());
    return true;
}

EntityRecord* EntityStore::get(EntityId id) {
    const auto it = index_.find(id);
    if (it == index_.end()) return nullptr;
    return &records_[it->second];
}

const EntityRecord* EntityStore::get(EntityId id) const {
    const auto it = index_.find(id);
    if (it == index_.end()) return nullptr;
    return &records_[it->second];
}

EntityId EntityStore::pick(const Point2& world, double radius) const {
    if (!isFinite(world) || !(radius >= 0.0)) return kInvalidEntityId;
    for (auto it = order_.rbegin(); it != order_.rend(); ++it) {
        const EntityRecord* rec = get(*it);
        if (!rec || !rec->draggable) continue;
        if (distance(world, rec->position + rec->laneOffset) <= radius) return rec->id;
    }
    return kInvalidEntityId;
}

} // namespace railmap
