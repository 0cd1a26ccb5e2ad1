#pragma once
#include "model/Thermal.hpp"

namespace puls::collectors {

class ThermalCollector {
public:
  // Hottest CPU-side sensor; false when the machine exposes none.
  bool sample(puls::model::Thermal& out);
};

} // namespace puls::collectors
