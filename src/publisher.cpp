#include "liqmap/publisher.hpp"

namespace liqmap {

void InMemoryPublisher::publish_gap(const GapEvent &event) {
  std::lock_guard<std::mutex> lock(mutex_);
  gaps_.push_back(event);
}

void InMemoryPublisher::publish_zones(const ZoneSnapshot &snapshot) {
  std::lock_guard<std::mutex> lock(mutex_);
  snapshots_.push_back(snapshot);
}

std::vector<GapEvent> InMemoryPublisher::gaps() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return gaps_;
}

std::vector<ZoneSnapshot> InMemoryPublisher::snapshots() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return snapshots_;
}

} // namespace liqmap
