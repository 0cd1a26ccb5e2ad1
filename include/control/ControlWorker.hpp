#pragma once
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>
#include "control/ActionOutcome.hpp"

namespace puls::control {

// Completion notice for one queued control job.
struct StatusEvent {
  uint64_t id{0};
  std::string label;      // e.g. "restart nginx.service"
  ActionOutcome outcome;
};

// Runs control jobs one at a time on its own thread so the render loop
// never blocks on systemctl. Results are picked up with poll_events().
class ControlWorker {
public:
  using Job = std::function<ActionOutcome()>;

  ControlWorker();
  ~ControlWorker();
  ControlWorker(const ControlWorker&) = delete;
  ControlWorker& operator=(const ControlWorker&) = delete;

  // Returns the id the matching StatusEvent will carry.
  uint64_t submit(std::string label, Job job);

  // Completed events, oldest first. Never blocks on a running job.
  [[nodiscard]] std::vector<StatusEvent> poll_events();

  // Blocks until every submitted job has finished. Used at shutdown and by tests.
  void drain();

  void stop();

private:
  struct Queued { uint64_t id; std::string label; Job job; };

  void run(std::stop_token st);

  std::mutex mu_;
  std::condition_variable_any cv_;
  std::condition_variable_any idle_cv_;
  std::deque<Queued> queue_;
  std::vector<StatusEvent> done_;
  uint64_t next_id_{1};
  bool busy_{false};
  std::jthread thread_;
};

} // namespace puls::control
