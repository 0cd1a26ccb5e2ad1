#pragma once
#include <map>
#include <string>
#include "model/Net.hpp"

namespace puls::collectors {

class NetCollector {
public:
  bool sample(puls::model::NetSnapshot& out);

  // Bridges, veth pairs and container/VM plumbing are not reported.
  static bool is_virtual(const std::string& name);

private:
  struct Counters { uint64_t rx{}; uint64_t tx{}; double ts{}; };
  std::map<std::string, Counters> prev_;
};

} // namespace puls::collectors
