#pragma once
#include "model/Fs.hpp"
#include <vector>

namespace puls::collectors {

class FsCollector {
public:
  // Usage of mounted, user-visible filesystems, fullest first
  bool sample(std::vector<puls::model::FsMount>& out);
};

} // namespace puls::collectors
