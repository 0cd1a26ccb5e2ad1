#pragma once
#include <cstdint>

namespace puls::model {

struct Memory {
  uint64_t total_kb{};
  uint64_t used_kb{};
  uint64_t available_kb{};
  uint64_t cached_kb{};
  uint64_t buffers_kb{};
  uint64_t swap_total_kb{};
  uint64_t swap_used_kb{};
  double   used_pct{};      // 0..100
  double   swap_used_pct{}; // 0 when no swap is configured
};

} // namespace puls::model
