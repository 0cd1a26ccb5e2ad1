#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include "model/Snapshot.hpp"

namespace puls::app {

// Single-writer, multi-reader snapshot hand-off. The writer publishes a
// fully built Snapshot; readers take a shared reference to whichever one
// was current and keep it alive for as long as they need it.
class SnapshotStore {
public:
  SnapshotStore();
  SnapshotStore(const SnapshotStore&) = delete;
  SnapshotStore& operator=(const SnapshotStore&) = delete;

  // Assigns the next sequence number and swaps the snapshot in.
  void publish(puls::model::Snapshot snap);

  [[nodiscard]] std::shared_ptr<const puls::model::Snapshot> latest() const;
  [[nodiscard]] uint64_t seq() const { return latest()->seq; }

private:
  std::atomic<std::shared_ptr<const puls::model::Snapshot>> current_;
};

} // namespace puls::app
