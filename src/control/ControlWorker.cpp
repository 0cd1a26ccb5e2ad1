#include "control/ControlWorker.hpp"
#include <cstdio>
#include <exception>
#include <utility>

namespace puls::control {

ControlWorker::ControlWorker() {
  thread_ = std::jthread([this](std::stop_token st){ run(st); });
}

ControlWorker::~ControlWorker() { stop(); }

uint64_t ControlWorker::submit(std::string label, Job job) {
  uint64_t id;
  {
    std::lock_guard<std::mutex> lk(mu_);
    id = next_id_++;
    queue_.push_back(Queued{id, std::move(label), std::move(job)});
  }
  cv_.notify_one();
  return id;
}

std::vector<StatusEvent> ControlWorker::poll_events() {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<StatusEvent> out;
  out.swap(done_);
  return out;
}

void ControlWorker::drain() {
  std::unique_lock<std::mutex> lk(mu_);
  idle_cv_.wait(lk, [this]{ return queue_.empty() && !busy_; });
}

void ControlWorker::stop() {
  if (!thread_.joinable()) return;
  thread_.request_stop();
  cv_.notify_all();
  thread_.join();
}

void ControlWorker::run(std::stop_token st) {
  while (true) {
    Queued q;
    {
      std::unique_lock<std::mutex> lk(mu_);
      cv_.wait(lk, st, [this]{ return !queue_.empty(); });
      if (queue_.empty()) return;  // stop requested
      q = std::move(queue_.front());
      queue_.pop_front();
      busy_ = true;
    }
    StatusEvent ev;
    ev.id = q.id;
    ev.label = std::move(q.label);
    try {
      ev.outcome = q.job();
    } catch (const std::exception& ex) {
      std::fprintf(stderr, "puls: control: %s: %s\n", ev.label.c_str(), ex.what());
      ev.outcome = ActionOutcome::fail(ActionStatus::IoError, ex.what());
    }
    {
      std::lock_guard<std::mutex> lk(mu_);
      done_.push_back(std::move(ev));
      busy_ = false;
    }
    idle_cv_.notify_all();
  }
}

} // namespace puls::control
