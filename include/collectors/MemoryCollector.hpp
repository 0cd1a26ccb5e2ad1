#pragma once
#include "model/Memory.hpp"

namespace puls::collectors {

class MemoryCollector {
public:
  bool sample(puls::model::Memory& out) const; // returns true on success
};

} // namespace puls::collectors
