#include "app/SnapshotStore.hpp"
#include <utility>

namespace puls::app {

SnapshotStore::SnapshotStore() {
  current_.store(std::make_shared<const puls::model::Snapshot>());
}

void SnapshotStore::publish(puls::model::Snapshot snap) {
  // only the scheduler thread publishes, so load+store needs no CAS
  snap.seq = current_.load(std::memory_order_acquire)->seq + 1;
  current_.store(std::make_shared<const puls::model::Snapshot>(std::move(snap)),
                 std::memory_order_release);
}

std::shared_ptr<const puls::model::Snapshot> SnapshotStore::latest() const {
  return current_.load(std::memory_order_acquire);
}

} // namespace puls::app
