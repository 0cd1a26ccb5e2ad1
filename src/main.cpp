#include "app/Config.hpp"
#include "app/Scheduler.hpp"
#include "collectors/Sources.hpp"
#include "control/ControlSubsystem.hpp"
#include "control/ControlWorker.hpp"
#include "control/PrivilegeGate.hpp"
#include "util/Command.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

static std::atomic<bool> g_stop{false};
static void on_sigint(int) { g_stop.store(true); }

static const char* state_tag(puls::model::SourceState s) {
  switch (s) {
    case puls::model::SourceState::Live: return "";
    case puls::model::SourceState::Stale: return "~";
    case puls::model::SourceState::NotAvailable: return "N/A";
    case puls::model::SourceState::Disabled: return "off";
  }
  return "";
}

// One status line per published snapshot.
static void print_status(const puls::model::Snapshot& s) {
  using puls::model::SourceKind;
  std::printf("#%llu", static_cast<unsigned long long>(s.seq));
  if (s.host) {
    std::printf(" cpu %5.1f%%%s mem %5.1f%% load %.2f",
                s.host->cpu.usage_pct, state_tag(s.health_of(SourceKind::Host).state),
                s.host->mem.used_pct, s.host->loadavg.one);
  } else {
    std::printf(" host %s", state_tag(s.health_of(SourceKind::Host).state));
  }
  if (s.net) std::printf(" net rx %.0f B/s tx %.0f B/s", s.net->agg_rx_bps, s.net->agg_tx_bps);
  else std::printf(" net %s", state_tag(s.health_of(SourceKind::Net).state));
  if (s.disk) std::printf(" disk r %.0f B/s w %.0f B/s", s.disk->total_read_bps, s.disk->total_write_bps);
  if (s.gpus) {
    for (const auto& g : *s.gpus) {
      if (g.has_util) std::printf(" %s %.0f%%", to_string(g.vendor), g.util_pct);
      else std::printf(" %s N/A", to_string(g.vendor));
    }
  } else {
    std::printf(" gpu %s", state_tag(s.health_of(SourceKind::Gpu).state));
  }
  if (s.containers) std::printf(" containers %zu", s.containers->size());
  else std::printf(" containers %s", state_tag(s.health_of(SourceKind::Container).state));
  if (s.procs) {
    std::printf(" procs %zu", s.procs->total_processes);
    if (!s.process_table.empty())
      std::printf(" top %s(%d) %.1f%%", s.process_table.front().name.c_str(),
                  s.process_table.front().pid, s.process_table.front().cpu_pct);
  }
  std::printf("\n");
  std::fflush(stdout);
}

static int list_services(puls::control::ControlSubsystem& ctl) {
  std::vector<puls::model::ServiceUnit> units;
  auto r = ctl.list_services(units);
  if (!r.ok()) {
    std::fprintf(stderr, "puls: services: %s: %s\n", to_string(r.status), r.detail.c_str());
    return 1;
  }
  for (const auto& u : units)
    std::printf("%-48s %-10s %-10s %-10s %s\n", u.name.c_str(), u.active_state.c_str(),
                u.sub_state.c_str(), u.enabled_state.c_str(), u.description.c_str());
  return 0;
}

static int show_journal(puls::control::ControlSubsystem& ctl, const std::string& unit) {
  puls::model::JournalQuery q;
  q.unit = unit;
  q.boot = "0";
  std::vector<puls::model::JournalEntry> entries;
  auto r = ctl.query_journal(q, entries);
  if (!r.ok()) {
    std::fprintf(stderr, "puls: journal: %s: %s\n", to_string(r.status), r.detail.c_str());
    return 1;
  }
  for (const auto& e : entries) {
    std::time_t t = static_cast<std::time_t>(e.timestamp_us / 1000000);
    std::tm tm{};
    ::localtime_r(&t, &tm);
    char ts[32];
    std::strftime(ts, sizeof(ts), "%b %d %H:%M:%S", &tm);
    std::printf("%s <%d> %s[%d]: %s\n", ts, e.priority,
                e.identifier.empty() ? e.unit.c_str() : e.identifier.c_str(), e.pid, e.message.c_str());
  }
  return 0;
}

static int show_boot_config(puls::control::ControlSubsystem& ctl) {
  puls::control::GrubConfig cfg;
  auto r = ctl.read_boot_config(cfg);
  if (!r.ok()) {
    std::fprintf(stderr, "puls: bootcfg: %s: %s\n", to_string(r.status), r.detail.c_str());
    return 1;
  }
  for (const auto& [k, v] : cfg.entries()) std::printf("%s=%s\n", k.c_str(), v.c_str());
  return 0;
}

// Service action through the worker, confirming destructive verbs on stdin.
static int service_action(puls::control::ControlSubsystem& ctl, puls::control::ServiceVerb verb,
                          const std::string& unit) {
  using puls::control::ActionStatus;
  puls::control::ControlWorker worker;
  worker.submit(std::string(to_string(verb)) + " " + unit, [&ctl, verb, unit]{ return ctl.request(verb, unit); });
  worker.drain();
  int rc = 0;
  for (auto& ev : worker.poll_events()) {
    auto r = ev.outcome;
    if (r.status == ActionStatus::ConfirmationRequired) {
      std::printf("%s [y/N] ", r.detail.c_str());
      std::fflush(stdout);
      std::string answer;
      std::getline(std::cin, answer);
      if (answer != "y" && answer != "Y") {
        ctl.cancel();
        std::printf("cancelled\n");
        continue;
      }
      uint64_t ticket = r.ticket;
      worker.submit(ev.label, [&ctl, ticket]{ return ctl.confirm(ticket); });
      worker.drain();
      for (auto& done : worker.poll_events()) r = done.outcome;
    }
    std::printf("%s: %s%s%s\n", ev.label.c_str(), to_string(r.status),
                r.detail.empty() ? "" : ": ", r.detail.c_str());
    if (!r.ok()) { rc = 1; continue; }
    puls::model::ServiceUnit now;
    auto st = ctl.service_status(unit, now);
    if (st.ok())
      std::printf("%s: %s/%s, %s\n", now.name.c_str(), now.active_state.c_str(),
                  now.sub_state.c_str(), now.enabled_state.c_str());
    else
      std::fprintf(stderr, "puls: control: refreshing %s: %s\n", unit.c_str(), st.detail.c_str());
  }
  return rc;
}

int main(int argc, char** argv) {
  int iterations = 0; // 0: until SIGINT
  bool force_safe = false;
  std::string config_path = puls::app::config_file_path();
  std::string mode;
  std::string arg1, arg2;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--iterations" && i + 1 < argc) iterations = std::atoi(argv[++i]);
    else if (a == "--config" && i + 1 < argc) config_path = argv[++i];
    else if (a == "--safe") force_safe = true;
    else if (a == "--services") mode = "services";
    else if (a == "--journal") { mode = "journal"; if (i + 1 < argc && argv[i + 1][0] != '-') arg1 = argv[++i]; }
    else if (a == "--boot-config") mode = "boot";
    else if (a == "--set-boot" && i + 2 < argc) { mode = "set-boot"; arg1 = argv[++i]; arg2 = argv[++i]; }
    else if ((a == "--start" || a == "--stop" || a == "--restart" || a == "--enable" || a == "--disable") && i + 1 < argc) {
      mode = a.substr(2);
      arg1 = argv[++i];
    }
    else if (a == "-h" || a == "--help") {
      std::cout << "Usage: puls [--config FILE] [--safe] [--iterations N]\n"
                   "            [--services] [--journal [UNIT]] [--boot-config]\n"
                   "            [--start|--stop|--restart|--enable|--disable UNIT]\n"
                   "            [--set-boot KEY VALUE]\n";
      return 0;
    }
  }

  auto cfg = puls::app::load_config(config_path);
  if (force_safe) cfg.general.safe_mode = true;
  auto gate = puls::control::PrivilegeGate::detect(cfg.general.safe_mode);

  puls::util::PopenCommandRunner runner;
  puls::control::ControlOptions copts;
  copts.boot.path = cfg.control.grub_path;
  copts.boot.backup_dir = cfg.control.backup_dir;
  copts.journal_limit = cfg.control.journal_limit;
  puls::control::ControlSubsystem ctl(gate, runner, copts);

  if (mode == "services") return list_services(ctl);
  if (mode == "journal") return show_journal(ctl, arg1);
  if (mode == "boot") return show_boot_config(ctl);
  if (mode == "set-boot") {
    auto r = ctl.set_boot_param(arg1, arg2);
    std::printf("%s: %s\n", to_string(r.status), r.detail.c_str());
    return r.ok() ? 0 : 1;
  }
  if (mode == "start") return service_action(ctl, puls::control::ServiceVerb::Start, arg1);
  if (mode == "stop") return service_action(ctl, puls::control::ServiceVerb::Stop, arg1);
  if (mode == "restart") return service_action(ctl, puls::control::ServiceVerb::Restart, arg1);
  if (mode == "enable") return service_action(ctl, puls::control::ServiceVerb::Enable, arg1);
  if (mode == "disable") return service_action(ctl, puls::control::ServiceVerb::Disable, arg1);

  std::signal(SIGINT, on_sigint);
  std::signal(SIGTERM, on_sigint);

  puls::app::SchedulerOptions sopts;
  sopts.refresh_ms = cfg.general.refresh_ms;
  sopts.timeout_ms = cfg.general.source_timeout_ms;
  sopts.stale_ticks = cfg.general.stale_ticks;
  sopts.history_length = static_cast<size_t>(cfg.general.history_length);
  puls::app::Scheduler sched(sopts, gate);

  puls::collectors::GpuOptions gopts;
  gopts.disable_nvml = cfg.nvidia.disable_nvml;
  gopts.nvml_path = cfg.nvidia.nvml_path;
  gopts.smi_path = cfg.nvidia.smi_path;
  puls::collectors::ContainerOptions kopts;
  kopts.socket_path = cfg.containers.socket;
  kopts.timeout_ms = cfg.general.source_timeout_ms;

  sched.add_source(std::make_unique<puls::collectors::HostSource>());
  sched.add_source(std::make_unique<puls::collectors::DiskSource>(), cfg.sources.disk);
  sched.add_source(std::make_unique<puls::collectors::NetSource>(), cfg.sources.network);
  sched.add_source(std::make_unique<puls::collectors::ProcessSource>());
  sched.add_source(std::make_unique<puls::collectors::GpuSource>(gopts), cfg.sources.gpu);
  sched.add_source(std::make_unique<puls::collectors::ContainerSource>(kopts), cfg.sources.containers);

  puls::app::ProcessView view;
  view.sort = puls::app::parse_sort_key(cfg.process.sort);
  view.ascending = cfg.process.ascending;
  view.show_system = cfg.process.show_system;
  view.cpu_weight = cfg.process.cpu_weight / 100.0;
  view.mem_weight = cfg.process.mem_weight / 100.0;
  sched.set_process_view(view);

  std::fprintf(stderr, "puls: capability %s, refresh %d ms, source timeout %d ms\n",
               to_string(gate.capability()), cfg.general.refresh_ms, cfg.general.source_timeout_ms);

  sched.start();
  uint64_t last_seq = 0;
  int printed = 0;
  // stands in for the render loop: reads only the published snapshot
  while (!g_stop.load()) {
    auto snap = sched.store().latest();
    if (snap->seq != last_seq) {
      last_seq = snap->seq;
      print_status(*snap);
      if (iterations > 0 && ++printed >= iterations) break;
    }
    std::this_thread::sleep_for(50ms);
  }
  sched.stop();
  return 0;
}
