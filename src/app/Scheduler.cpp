#include "app/Scheduler.hpp"
#include <cstdio>
#include <exception>
#include <string>
#include <system_error>
#include <utility>

using namespace std::chrono;
using puls::collectors::Fragment;
using puls::collectors::PollResult;
using puls::model::SourceKind;
using puls::model::SourceState;
using puls::model::SourceStatus;

namespace puls::app {

Scheduler::Scheduler(SchedulerOptions opts, puls::control::PrivilegeGate gate)
  : opts_(opts), gate_(gate), history_(opts.history_length) {
  if (opts_.refresh_ms < 1) opts_.refresh_ms = 1;
  if (opts_.timeout_ms < 1) opts_.timeout_ms = 1;
  if (opts_.stale_ticks < 0) opts_.stale_ticks = 0;
  if (opts_.shutdown_grace_ms < 0) opts_.shutdown_grace_ms = 0;
}

Scheduler::~Scheduler() { stop(); }

void Scheduler::add_source(std::unique_ptr<puls::collectors::IMetricSource> src, bool enabled) {
  Entry e;
  e.kind = src->kind();
  e.enabled = enabled && gate_.allows_source(e.kind);
  e.slot = std::make_shared<Slot>();
  e.slot->source = std::move(src);
  if (!e.enabled) {
    e.health.state = SourceState::Disabled;
    e.health.detail = "disabled";
  }
  entries_.push_back(std::move(e));
}

void Scheduler::set_process_view(ProcessView v) {
  std::lock_guard<std::mutex> lk(view_mu_);
  view_ = std::move(v);
}

ProcessView Scheduler::process_view() const {
  std::lock_guard<std::mutex> lk(view_mu_);
  return view_;
}

void Scheduler::set_history_length(size_t n) {
  std::lock_guard<std::mutex> lk(hist_mu_);
  history_.reset(n);
}

std::future<PollResult> Scheduler::launch(Entry& e, PollResult& out) {
  auto slot = e.slot;
  // a poll abandoned on an earlier tick is still running
  if (slot->busy.exchange(true)) {
    out = PollResult::fail(SourceStatus::TimedOut, "previous poll still running");
    return {};
  }
  auto prom = std::make_shared<std::promise<PollResult>>();
  auto fut = prom->get_future();
  auto inflight = inflight_;
  {
    std::lock_guard<std::mutex> lk(inflight->mu);
    ++inflight->running;
  }
  try {
    std::thread([slot, prom, inflight]{
      PollResult r;
      try {
        r = slot->source->poll();
      } catch (const std::exception& ex) {
        r = PollResult::fail(SourceStatus::Error, ex.what());
      }
      slot->busy.store(false);
      prom->set_value(std::move(r));
      std::lock_guard<std::mutex> lk(inflight->mu);
      --inflight->running;
      inflight->cv.notify_all();
    }).detach();
  } catch (const std::system_error& ex) {
    {
      std::lock_guard<std::mutex> lk(inflight->mu);
      --inflight->running;
    }
    slot->busy.store(false);
    out = PollResult::fail(SourceStatus::Error, std::string("cannot start poll: ") + ex.what());
    return {};
  }
  return fut;
}

void Scheduler::apply_outcome(Entry& e, PollResult r) {
  const char* name = e.slot->source->name();
  SourceStatus prev = e.health.last_status;
  bool prev_bad = prev == SourceStatus::Error || prev == SourceStatus::TimedOut;

  if (r.status == SourceStatus::Ok) {
    if (prev_bad) std::fprintf(stderr, "puls: scheduler: %s recovered\n", name);
    e.last_good = std::move(r.fragment);
    e.health.state = SourceState::Live;
    e.health.consecutive_misses = 0;
    e.health.detail.clear();
  } else {
    if (r.status != prev && r.status != SourceStatus::Unavailable) {
      std::fprintf(stderr, "puls: scheduler: %s %s: %s\n", name, to_string(r.status), r.detail.c_str());
    }
    ++e.health.consecutive_misses;
    if (e.last_good && e.health.consecutive_misses <= opts_.stale_ticks) {
      e.health.state = SourceState::Stale;
    } else {
      e.last_good.reset();
      e.health.state = SourceState::NotAvailable;
    }
    e.health.detail = std::move(r.detail);
  }
  e.health.last_status = r.status;
}

static void place_fragment(puls::model::Snapshot& s, const Fragment& f) {
  if (auto* h = std::get_if<puls::model::HostSnapshot>(&f)) s.host = *h;
  else if (auto* d = std::get_if<puls::model::DiskSnapshot>(&f)) s.disk = *d;
  else if (auto* n = std::get_if<puls::model::NetSnapshot>(&f)) s.net = *n;
  else if (auto* p = std::get_if<puls::model::ProcessSnapshot>(&f)) s.procs = *p;
  else if (auto* g = std::get_if<puls::model::GpuList>(&f)) s.gpus = *g;
  else if (auto* c = std::get_if<puls::model::ContainerList>(&f)) s.containers = *c;
}

void Scheduler::tick_once() {
  const auto t0 = steady_clock::now();
  const auto deadline = t0 + milliseconds(opts_.timeout_ms);

  // launch every enabled source before waiting on any of them
  std::vector<std::future<PollResult>> futures(entries_.size());
  std::vector<std::optional<PollResult>> results(entries_.size());
  for (size_t i = 0; i < entries_.size(); ++i) {
    if (!entries_[i].enabled) continue;
    PollResult immediate;
    futures[i] = launch(entries_[i], immediate);
    if (!futures[i].valid()) results[i] = std::move(immediate);
  }
  for (size_t i = 0; i < entries_.size(); ++i) {
    if (!futures[i].valid()) continue;
    if (futures[i].wait_until(deadline) == std::future_status::ready) {
      results[i] = futures[i].get();
    } else {
      // late result is dropped with the future
      results[i] = PollResult::fail(SourceStatus::TimedOut,
                                    "no result within " + std::to_string(opts_.timeout_ms) + " ms");
    }
  }

  puls::model::Snapshot snap;
  snap.taken_at = system_clock::now();
  for (size_t i = 0; i < entries_.size(); ++i) {
    auto& e = entries_[i];
    if (e.enabled && results[i]) apply_outcome(e, std::move(*results[i]));
    if (e.last_good && e.health.state != SourceState::Disabled) place_fragment(snap, *e.last_good);
    snap.health[static_cast<size_t>(e.kind)] = e.health;
  }
  for (size_t k = 0; k < puls::model::kSourceKindCount; ++k) {
    bool registered = false;
    for (const auto& e : entries_) if (static_cast<size_t>(e.kind) == k) registered = true;
    if (!registered) {
      snap.health[k].state = SourceState::Disabled;
      snap.health[k].detail = "not configured";
    }
  }

  if (snap.procs) snap.process_table = build_process_table(*snap.procs, process_view());

  {
    std::lock_guard<std::mutex> lk(hist_mu_);
    append_history(snap);
    snap.history = history_.export_all();
  }
  store_.publish(std::move(snap));

  auto elapsed = duration_cast<milliseconds>(steady_clock::now() - t0).count();
  if (elapsed > opts_.refresh_ms / 2) {
    std::fprintf(stderr, "puls: scheduler: slow tick: %lld ms (interval %d ms)\n",
                 static_cast<long long>(elapsed), opts_.refresh_ms);
  }
}

void Scheduler::append_history(const puls::model::Snapshot& s) {
  if (s.host) {
    const auto& cpu = s.host->cpu;
    history_.append("cpu.total", cpu.usage_pct);
    for (size_t i = 0; i < cpu.per_core_pct.size(); ++i)
      history_.append("cpu.core" + std::to_string(i), cpu.per_core_pct[i]);
    history_.append("mem.used_pct", s.host->mem.used_pct);
    history_.append("swap.used_pct", s.host->mem.swap_used_pct);
  }
  if (s.net) {
    history_.append("net.rx_bps", s.net->agg_rx_bps);
    history_.append("net.tx_bps", s.net->agg_tx_bps);
  }
  if (s.disk) {
    history_.append("disk.read_bps", s.disk->total_read_bps);
    history_.append("disk.write_bps", s.disk->total_write_bps);
  }
  if (s.gpus) {
    bool any = false;
    double top = 0.0;
    for (size_t i = 0; i < s.gpus->size(); ++i) {
      const auto& g = (*s.gpus)[i];
      std::string prefix = "gpu" + std::to_string(i);
      if (g.has_util) {
        history_.append(prefix + ".util", g.util_pct);
        if (!any || g.util_pct > top) top = g.util_pct;
        any = true;
      }
      if (g.has_vram && g.vram_total_mb) history_.append(prefix + ".vram_used_pct", g.vram_used_pct());
    }
    if (any) history_.append("gpu.util", top);
  }
}

void Scheduler::start() {
  if (thread_.joinable()) return;
  thread_ = std::jthread([this](std::stop_token st){ run(st); });
}

void Scheduler::stop() {
  if (thread_.joinable()) {
    thread_.request_stop();
    thread_.join();
  }
  if (!wait_idle(opts_.shutdown_grace_ms)) {
    std::lock_guard<std::mutex> lk(inflight_->mu);
    std::fprintf(stderr, "puls: scheduler: %d poll(s) still running at shutdown\n", inflight_->running);
  }
}

bool Scheduler::wait_idle(int ms) {
  std::unique_lock<std::mutex> lk(inflight_->mu);
  return inflight_->cv.wait_for(lk, milliseconds(ms < 0 ? 0 : ms),
                                [this]{ return inflight_->running == 0; });
}

void Scheduler::run(std::stop_token st) {
  const auto interval = milliseconds(opts_.refresh_ms);
  auto next = steady_clock::now();
  while (!st.stop_requested()) {
    tick_once();
    next += interval;
    auto now = steady_clock::now();
    // fell behind: resync instead of bursting
    if (next < now) next = now;
    // sleep in short slices so stop() stays prompt
    while (!st.stop_requested()) {
      auto left = duration_cast<milliseconds>(next - steady_clock::now());
      if (left <= 0ms) break;
      std::this_thread::sleep_for(left < 100ms ? left : 100ms);
    }
  }
}

} // namespace puls::app
