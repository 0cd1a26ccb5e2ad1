#pragma once
#include <string>
#include <variant>
#include "model/Snapshot.hpp"

namespace puls::collectors {

using Fragment = std::variant<std::monostate,
                              puls::model::HostSnapshot,
                              puls::model::DiskSnapshot,
                              puls::model::NetSnapshot,
                              puls::model::ProcessSnapshot,
                              puls::model::GpuList,
                              puls::model::ContainerList>;

struct PollResult {
  puls::model::SourceStatus status{puls::model::SourceStatus::Unavailable};
  Fragment fragment{};   // set only when status is Ok
  std::string detail;    // reason for a non-Ok status

  static PollResult ok(Fragment f) { return PollResult{puls::model::SourceStatus::Ok, std::move(f), {}}; }
  static PollResult fail(puls::model::SourceStatus s, std::string why) { return PollResult{s, std::monostate{}, std::move(why)}; }
};

// One telemetry subsystem. poll() may block on slow I/O; the scheduler
// runs it off its own thread and bounds it with a timeout. A source is
// never polled concurrently with itself.
class IMetricSource {
public:
  virtual ~IMetricSource() = default;

  [[nodiscard]] virtual PollResult poll() = 0;

  [[nodiscard]] virtual puls::model::SourceKind kind() const = 0;

  [[nodiscard]] virtual const char* name() const = 0;
};

} // namespace puls::collectors
