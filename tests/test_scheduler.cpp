#include "minitest.hpp"
#include "app/Scheduler.hpp"
#include <atomic>
#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>

using namespace std::chrono;
using puls::app::Scheduler;
using puls::app::SchedulerOptions;
using puls::collectors::PollResult;
using puls::control::Capability;
using puls::control::PrivilegeGate;
using puls::model::SourceKind;
using puls::model::SourceState;
using puls::model::SourceStatus;

namespace {

// State lives outside the source so the test can inspect it after the
// scheduler owns the source, and an abandoned poll thread can still use it.
struct ScriptState {
  std::atomic<int> polls{0};
  std::atomic<int> sleep_ms{0};
  std::atomic<int> finished{0};
  std::mutex mu;
  std::deque<PollResult> script;   // front is the next result
  PollResult fallback = PollResult::fail(SourceStatus::Unavailable, "script exhausted");
  bool throw_on_poll{false};
};

class ScriptedSource : public puls::collectors::IMetricSource {
public:
  ScriptedSource(SourceKind k, std::shared_ptr<ScriptState> st) : kind_(k), st_(std::move(st)) {}

  PollResult poll() override {
    ++st_->polls;
    if (int ms = st_->sleep_ms.load(); ms > 0) std::this_thread::sleep_for(milliseconds(ms));
    ++st_->finished;
    std::lock_guard<std::mutex> lk(st_->mu);
    if (st_->throw_on_poll) throw std::runtime_error("boom");
    if (st_->script.empty()) return st_->fallback;
    auto r = st_->script.front();
    st_->script.pop_front();
    return r;
  }
  SourceKind kind() const override { return kind_; }
  const char* name() const override { return "scripted"; }

private:
  SourceKind kind_;
  std::shared_ptr<ScriptState> st_;
};

puls::model::GpuList one_gpu(double util) {
  puls::model::GpuDevice d;
  d.name = "MockGPU";
  d.has_util = true;
  d.util_pct = util;
  d.has_vram = true;
  d.vram_used_mb = 1024;
  d.vram_total_mb = 4096;
  return {d};
}

puls::model::HostSnapshot host_at(double cpu) {
  puls::model::HostSnapshot h;
  h.cpu.usage_pct = cpu;
  h.cpu.per_core_pct = {cpu, cpu};
  h.mem.used_pct = 50.0;
  return h;
}

SchedulerOptions fast_opts() {
  SchedulerOptions o;
  o.refresh_ms = 1000;
  o.timeout_ms = 200;
  o.stale_ticks = 2;
  o.history_length = 10;
  return o;
}

} // namespace

TEST(scheduler_slow_source_does_not_stall_tick) {
  auto slow = std::make_shared<ScriptState>();
  slow->sleep_ms = 2000;
  slow->fallback = PollResult::ok(one_gpu(10.0));
  auto host = std::make_shared<ScriptState>();
  host->fallback = PollResult::ok(host_at(12.0));

  SchedulerOptions o = fast_opts();
  o.timeout_ms = 100;
  Scheduler s(o, PrivilegeGate(Capability::ReadOnly));
  s.add_source(std::make_unique<ScriptedSource>(SourceKind::Gpu, slow));
  s.add_source(std::make_unique<ScriptedSource>(SourceKind::Host, host));

  auto t0 = steady_clock::now();
  s.tick_once();
  auto ms = duration_cast<milliseconds>(steady_clock::now() - t0).count();
  ASSERT_TRUE(ms < 1000);

  auto snap = s.store().latest();
  ASSERT_EQ(snap->seq, 1u);
  ASSERT_TRUE(snap->health_of(SourceKind::Gpu).last_status == SourceStatus::TimedOut);
  ASSERT_TRUE(snap->health_of(SourceKind::Gpu).state == SourceState::NotAvailable);
  ASSERT_TRUE(!snap->gpus.has_value());
  // the healthy source in the same tick is unaffected
  ASSERT_TRUE(snap->health_of(SourceKind::Host).state == SourceState::Live);
  ASSERT_TRUE(snap->host.has_value());

  // the abandoned poll is still running: no second poll is started
  s.tick_once();
  ASSERT_EQ(slow->polls.load(), 1);
  snap = s.store().latest();
  ASSERT_TRUE(snap->health_of(SourceKind::Gpu).last_status == SourceStatus::TimedOut);
  ASSERT_EQ(snap->health_of(SourceKind::Gpu).consecutive_misses, 2);
}

TEST(scheduler_stop_waits_for_abandoned_poll) {
  auto slow = std::make_shared<ScriptState>();
  slow->sleep_ms = 300;
  slow->fallback = PollResult::ok(one_gpu(5.0));
  SchedulerOptions o = fast_opts();
  o.timeout_ms = 50;
  o.shutdown_grace_ms = 2000;
  Scheduler s(o, PrivilegeGate(Capability::ReadOnly));
  s.add_source(std::make_unique<ScriptedSource>(SourceKind::Gpu, slow));
  s.tick_once();
  ASSERT_TRUE(s.store().latest()->health_of(SourceKind::Gpu).last_status == SourceStatus::TimedOut);
  ASSERT_EQ(slow->finished.load(), 0);
  // a short wait gives up while the poll is still sleeping
  ASSERT_TRUE(!s.wait_idle(10));
  s.stop();
  ASSERT_EQ(slow->finished.load(), 1);
  ASSERT_TRUE(s.wait_idle(0));
}

TEST(scheduler_stop_grace_is_bounded) {
  auto slow = std::make_shared<ScriptState>();
  slow->sleep_ms = 1500;
  SchedulerOptions o = fast_opts();
  o.timeout_ms = 20;
  o.shutdown_grace_ms = 100;
  auto t0 = steady_clock::now();
  {
    Scheduler s(o, PrivilegeGate(Capability::ReadOnly));
    s.add_source(std::make_unique<ScriptedSource>(SourceKind::Gpu, slow));
    s.tick_once();
  }
  auto ms = duration_cast<milliseconds>(steady_clock::now() - t0).count();
  ASSERT_TRUE(ms < 1000);
  ASSERT_EQ(slow->finished.load(), 0);
}

TEST(scheduler_stale_then_not_available) {
  auto st = std::make_shared<ScriptState>();
  st->script.push_back(PollResult::ok(one_gpu(45.0)));
  for (int i = 0; i < 3; ++i)
    st->script.push_back(PollResult::fail(SourceStatus::Unavailable, "gone"));

  Scheduler s(fast_opts(), PrivilegeGate(Capability::ReadOnly));
  s.add_source(std::make_unique<ScriptedSource>(SourceKind::Gpu, st));

  s.tick_once();
  auto snap = s.store().latest();
  ASSERT_TRUE(snap->health_of(SourceKind::Gpu).state == SourceState::Live);
  ASSERT_TRUE(snap->gpus.has_value());

  s.tick_once();
  snap = s.store().latest();
  ASSERT_TRUE(snap->health_of(SourceKind::Gpu).state == SourceState::Stale);
  ASSERT_TRUE(snap->gpus.has_value());
  ASSERT_EQ((*snap->gpus)[0].util_pct, 45.0);

  s.tick_once();
  snap = s.store().latest();
  ASSERT_TRUE(snap->health_of(SourceKind::Gpu).state == SourceState::Stale);

  s.tick_once();
  snap = s.store().latest();
  ASSERT_TRUE(snap->health_of(SourceKind::Gpu).state == SourceState::NotAvailable);
  ASSERT_TRUE(!snap->gpus.has_value());
  ASSERT_EQ(snap->health_of(SourceKind::Gpu).detail, std::string("gone"));
  ASSERT_EQ(snap->seq, 4u);
}

TEST(scheduler_recovery_resets_misses) {
  auto st = std::make_shared<ScriptState>();
  st->script.push_back(PollResult::ok(one_gpu(10.0)));
  st->script.push_back(PollResult::fail(SourceStatus::Error, "driver"));
  st->script.push_back(PollResult::ok(one_gpu(20.0)));

  Scheduler s(fast_opts(), PrivilegeGate(Capability::ReadOnly));
  s.add_source(std::make_unique<ScriptedSource>(SourceKind::Gpu, st));
  s.tick_once();
  s.tick_once();
  ASSERT_EQ(s.store().latest()->health_of(SourceKind::Gpu).consecutive_misses, 1);
  s.tick_once();
  auto snap = s.store().latest();
  ASSERT_TRUE(snap->health_of(SourceKind::Gpu).state == SourceState::Live);
  ASSERT_EQ(snap->health_of(SourceKind::Gpu).consecutive_misses, 0);
  ASSERT_EQ((*snap->gpus)[0].util_pct, 20.0);
}

TEST(scheduler_zero_stale_budget_drops_immediately) {
  auto st = std::make_shared<ScriptState>();
  st->script.push_back(PollResult::ok(host_at(5.0)));
  SchedulerOptions o = fast_opts();
  o.stale_ticks = 0;
  Scheduler s(o, PrivilegeGate(Capability::ReadOnly));
  s.add_source(std::make_unique<ScriptedSource>(SourceKind::Host, st));
  s.tick_once();
  s.tick_once();
  auto snap = s.store().latest();
  ASSERT_TRUE(snap->health_of(SourceKind::Host).state == SourceState::NotAvailable);
  ASSERT_TRUE(!snap->host.has_value());
}

TEST(scheduler_disabled_source_is_never_polled) {
  auto st = std::make_shared<ScriptState>();
  st->fallback = PollResult::ok(one_gpu(1.0));
  Scheduler s(fast_opts(), PrivilegeGate(Capability::ReadOnly));
  s.add_source(std::make_unique<ScriptedSource>(SourceKind::Gpu, st), false);
  s.tick_once();
  s.tick_once();
  ASSERT_EQ(st->polls.load(), 0);
  auto snap = s.store().latest();
  ASSERT_TRUE(snap->health_of(SourceKind::Gpu).state == SourceState::Disabled);
  ASSERT_TRUE(!snap->gpus.has_value());
}

TEST(scheduler_safe_capability_disables_gpu_and_containers) {
  auto gpu = std::make_shared<ScriptState>();
  gpu->fallback = PollResult::ok(one_gpu(1.0));
  auto ctr = std::make_shared<ScriptState>();
  ctr->fallback = PollResult::ok(puls::model::ContainerList{});
  auto host = std::make_shared<ScriptState>();
  host->fallback = PollResult::ok(host_at(3.0));

  Scheduler s(fast_opts(), PrivilegeGate(Capability::Safe));
  s.add_source(std::make_unique<ScriptedSource>(SourceKind::Gpu, gpu));
  s.add_source(std::make_unique<ScriptedSource>(SourceKind::Container, ctr));
  s.add_source(std::make_unique<ScriptedSource>(SourceKind::Host, host));
  s.tick_once();
  ASSERT_EQ(gpu->polls.load(), 0);
  ASSERT_EQ(ctr->polls.load(), 0);
  ASSERT_EQ(host->polls.load(), 1);
  auto snap = s.store().latest();
  ASSERT_TRUE(snap->health_of(SourceKind::Gpu).state == SourceState::Disabled);
  ASSERT_TRUE(snap->health_of(SourceKind::Container).state == SourceState::Disabled);
  ASSERT_TRUE(snap->health_of(SourceKind::Host).state == SourceState::Live);
}

TEST(scheduler_unregistered_kinds_are_disabled) {
  Scheduler s(fast_opts(), PrivilegeGate(Capability::ReadOnly));
  s.tick_once();
  auto snap = s.store().latest();
  ASSERT_TRUE(snap->health_of(SourceKind::Net).state == SourceState::Disabled);
  ASSERT_EQ(snap->health_of(SourceKind::Net).detail, std::string("not configured"));
}

TEST(scheduler_throwing_source_reports_error) {
  auto st = std::make_shared<ScriptState>();
  st->throw_on_poll = true;
  Scheduler s(fast_opts(), PrivilegeGate(Capability::ReadOnly));
  s.add_source(std::make_unique<ScriptedSource>(SourceKind::Disk, st));
  s.tick_once();
  auto snap = s.store().latest();
  ASSERT_TRUE(snap->health_of(SourceKind::Disk).last_status == SourceStatus::Error);
  ASSERT_EQ(snap->health_of(SourceKind::Disk).detail, std::string("boom"));
}

TEST(scheduler_history_projections) {
  auto host = std::make_shared<ScriptState>();
  for (int i = 1; i <= 4; ++i) host->script.push_back(PollResult::ok(host_at(i * 10.0)));
  auto gpu = std::make_shared<ScriptState>();
  gpu->fallback = PollResult::ok(one_gpu(70.0));

  SchedulerOptions o = fast_opts();
  o.history_length = 3;
  Scheduler s(o, PrivilegeGate(Capability::ReadOnly));
  s.add_source(std::make_unique<ScriptedSource>(SourceKind::Host, host));
  s.add_source(std::make_unique<ScriptedSource>(SourceKind::Gpu, gpu));
  for (int i = 0; i < 4; ++i) s.tick_once();

  auto snap = s.store().latest();
  const auto& cpu = snap->history.at("cpu.total");
  ASSERT_EQ(cpu.size(), 3u);
  ASSERT_EQ(cpu.front(), 20.0);
  ASSERT_EQ(cpu.back(), 40.0);
  ASSERT_EQ(snap->history.at("cpu.core1").size(), 3u);
  ASSERT_EQ(snap->history.at("mem.used_pct").back(), 50.0);
  ASSERT_EQ(snap->history.at("gpu0.util").back(), 70.0);
  ASSERT_EQ(snap->history.at("gpu0.vram_used_pct").back(), 25.0);
  ASSERT_EQ(snap->history.at("gpu.util").back(), 70.0);
  // no net source: no net stream
  ASSERT_TRUE(snap->history.find("net.rx_bps") == snap->history.end());

  s.set_history_length(5);
  s.tick_once();
  snap = s.store().latest();
  ASSERT_EQ(snap->history.at("gpu0.util").size(), 1u);
}

TEST(scheduler_applies_process_view) {
  auto st = std::make_shared<ScriptState>();
  puls::model::ProcessSnapshot ps;
  ps.cpu_count = 1;
  for (int pid : {3, 1, 2}) {
    puls::model::ProcSample p;
    p.pid = pid;
    p.name = "app" + std::to_string(pid);
    ps.processes.push_back(p);
  }
  st->fallback = PollResult::ok(ps);
  Scheduler s(fast_opts(), PrivilegeGate(Capability::ReadOnly));
  s.add_source(std::make_unique<ScriptedSource>(SourceKind::Process, st));
  puls::app::ProcessView v;
  v.sort = puls::app::SortKey::Pid;
  v.ascending = true;
  s.set_process_view(v);
  s.tick_once();
  auto snap = s.store().latest();
  ASSERT_EQ(snap->process_table.size(), 3u);
  ASSERT_EQ(snap->process_table[0].pid, 1);
  ASSERT_EQ(snap->process_table[2].pid, 3);
}

TEST(scheduler_background_loop_publishes) {
  auto host = std::make_shared<ScriptState>();
  host->fallback = PollResult::ok(host_at(1.0));
  SchedulerOptions o = fast_opts();
  o.refresh_ms = 100;
  o.timeout_ms = 50;
  Scheduler s(o, PrivilegeGate(Capability::ReadOnly));
  s.add_source(std::make_unique<ScriptedSource>(SourceKind::Host, host));
  s.start();
  auto until = steady_clock::now() + seconds(3);
  while (s.store().seq() < 3 && steady_clock::now() < until)
    std::this_thread::sleep_for(milliseconds(20));
  s.stop();
  ASSERT_TRUE(s.store().seq() >= 3);
  auto after = s.store().seq();
  std::this_thread::sleep_for(milliseconds(250));
  ASSERT_EQ(s.store().seq(), after);
}
