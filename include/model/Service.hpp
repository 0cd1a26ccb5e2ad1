#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace puls::model {

struct ServiceUnit {
  std::string name;           // e.g. sshd.service
  std::string description;
  std::string load_state;     // loaded, not-found, masked
  std::string active_state;   // active, inactive, failed, ...
  std::string sub_state;      // running, dead, exited, ...
  std::string enabled_state;  // enabled, disabled, static, masked, ...
};

struct JournalEntry {
  int64_t     timestamp_us{0}; // __REALTIME_TIMESTAMP
  int         priority{6};     // 0 emerg .. 7 debug
  std::string unit;
  std::string identifier;      // SYSLOG_IDENTIFIER
  int32_t     pid{0};
  std::string message;
};

struct JournalQuery {
  std::string unit;       // empty: all units
  int max_priority{-1};   // -1: any; otherwise 0..7 inclusive upper bound
  std::string boot;       // empty: all boots; "0" current, "-1" previous, or a boot id
  int limit{200};
};

} // namespace puls::model
