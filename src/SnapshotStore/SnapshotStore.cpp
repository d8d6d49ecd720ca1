#include "SnapshotStore.hpp"
#include <mutex>
#include <utility>


void SnapshotStore::publish(std::shared_ptr<const MonitorSnapshot> snap) {
    std::unique_lock wlk(mu_);
    snap_ = std::move(snap);
}

std::shared_ptr<const MonitorSnapshot> SnapshotStore::latest() const {
    std::shared_lock rlk(mu_);
    return snap_;
}
