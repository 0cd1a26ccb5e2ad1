#pragma once
#include <map>
#include <string>
#include <vector>
#include "util/HistoryBuffer.hpp"

namespace puls::app {

// Named scalar streams, each a fixed-length ring. Owned by the scheduler.
class MetricHistory {
public:
  explicit MetricHistory(size_t length = 60) : length_(length) {}

  void append(const std::string& name, double v) {
    auto it = streams_.find(name);
    if (it == streams_.end()) it = streams_.emplace(name, puls::util::HistoryBuffer<double>(length_)).first;
    it->second.push(v);
  }

  // Changing the length discards every stream.
  void reset(size_t length) {
    length_ = length;
    streams_.clear();
  }

  [[nodiscard]] size_t length() const { return length_; }

  [[nodiscard]] std::map<std::string, std::vector<double>> export_all() const {
    std::map<std::string, std::vector<double>> out;
    for (const auto& [name, buf] : streams_) out.emplace(name, buf.values());
    return out;
  }

private:
  size_t length_;
  std::map<std::string, puls::util::HistoryBuffer<double>> streams_;
};

} // namespace puls::app
