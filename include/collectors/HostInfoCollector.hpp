#pragma once
#include "model/Host.hpp"

namespace puls::collectors {

// Load average, uptime and the static identity of the machine.
class HostInfoCollector {
public:
  bool sample(puls::model::HostSnapshot& out);
private:
  puls::model::HostInfo info_{};
  bool have_info_{false};
};

} // namespace puls::collectors
