#pragma once
#include <string>
#include <unordered_map>
#include <vector>
#include "model/Container.hpp"
#include "model/Snapshot.hpp"

namespace Json { class Value; }

namespace puls::collectors {

struct ContainerOptions {
  std::string socket_path;   // empty: probe DOCKER_HOST, Docker and Podman defaults
  int timeout_ms{500};
};

// Docker Engine API (also served by Podman) over the engine's UNIX socket.
class ContainerCollector {
public:
  explicit ContainerCollector(ContainerOptions opts = {});

  puls::model::SourceStatus poll(puls::model::ContainerList& out, std::string& detail);

  // Socket paths to try, in order.
  std::vector<std::string> socket_candidates() const;

  // Parse a /containers/json response. Full ids are returned alongside for stats calls.
  static bool parse_list(const std::string& body, puls::model::ContainerList& out,
                         std::vector<std::string>& full_ids, std::string& err);

private:
  struct Prev {
    uint64_t cpu_total{}, system_total{};
    uint64_t rx{}, tx{}, rd{}, wr{};
    double ts{};
  };
  void apply_stats(const std::string& full_id, const Json::Value& stats,
                   puls::model::ContainerEntry& e, std::unordered_map<std::string, Prev>& next, double ts);

  ContainerOptions opts_;
  std::unordered_map<std::string, Prev> prev_;
};

} // namespace puls::collectors
