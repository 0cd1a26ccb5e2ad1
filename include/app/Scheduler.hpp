#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <thread>
#include <vector>
#include "app/MetricHistory.hpp"
#include "app/ProcessTable.hpp"
#include "app/SnapshotStore.hpp"
#include "collectors/IMetricSource.hpp"
#include "control/PrivilegeGate.hpp"

namespace puls::app {

struct SchedulerOptions {
  int refresh_ms{1000};
  int timeout_ms{500};    // per-source budget within one tick
  int stale_ticks{3};     // K
  size_t history_length{60};
  int shutdown_grace_ms{1000}; // stop() waits this long for abandoned polls
};

// Drives every metric source once per tick, bounds each poll with a
// timeout, applies the stale/N-A policy and publishes one Snapshot.
class Scheduler {
public:
  Scheduler(SchedulerOptions opts, puls::control::PrivilegeGate gate);
  ~Scheduler();
  Scheduler(const Scheduler&) = delete;
  Scheduler& operator=(const Scheduler&) = delete;

  // Must be called before start(). A source is also disabled when the
  // capability forbids its kind.
  void add_source(std::unique_ptr<puls::collectors::IMetricSource> src, bool enabled = true);

  // Runs one full tick on the calling thread and publishes the result.
  void tick_once();

  void start();
  // Joins the loop, then waits up to shutdown_grace_ms for polls still
  // running from timed-out ticks.
  void stop();

  // True once no poll thread is running. Waits at most `ms`.
  bool wait_idle(int ms);

  void set_process_view(ProcessView v);
  [[nodiscard]] ProcessView process_view() const;

  // Discards all history.
  void set_history_length(size_t n);

  [[nodiscard]] SnapshotStore& store() { return store_; }
  [[nodiscard]] const SchedulerOptions& options() const { return opts_; }

private:
  // Shared with the poll thread so an abandoned poll can outlive the tick.
  struct Slot {
    std::unique_ptr<puls::collectors::IMetricSource> source;
    std::atomic<bool> busy{false};
  };

  // Count of live poll threads; outlives the Scheduler if a poll does.
  struct InFlight {
    std::mutex mu;
    std::condition_variable cv;
    int running{0};
  };

  struct Entry {
    std::shared_ptr<Slot> slot;
    puls::model::SourceKind kind{};
    bool enabled{true};
    std::optional<puls::collectors::Fragment> last_good;
    puls::model::SourceHealth health{};
  };

  void run(std::stop_token st);
  // Starts e's poll on its own thread. Returns an invalid future and sets
  // `out` when no poll could be started.
  std::future<puls::collectors::PollResult> launch(Entry& e, puls::collectors::PollResult& out);
  void apply_outcome(Entry& e, puls::collectors::PollResult r);
  void append_history(const puls::model::Snapshot& s);

  SchedulerOptions opts_;
  puls::control::PrivilegeGate gate_;
  SnapshotStore store_{};
  std::vector<Entry> entries_;

  mutable std::mutex view_mu_;
  ProcessView view_{};

  std::mutex hist_mu_;
  MetricHistory history_;

  std::shared_ptr<InFlight> inflight_{std::make_shared<InFlight>()};
  std::jthread thread_{};
};

} // namespace puls::app
