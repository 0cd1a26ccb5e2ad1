#pragma once
#include <cstddef>
#include <optional>
#include <vector>

namespace puls::util {

// Fixed-capacity ring buffer. push() is O(1) and evicts the oldest sample
// once the buffer is full.
template <typename T>
class HistoryBuffer {
public:
  explicit HistoryBuffer(size_t capacity = 60) { reset(capacity); }

  void push(const T& v) {
    if (cap_ == 0) return;
    data_[head_] = v;
    head_ = (head_ + 1) % cap_;
    if (size_ < cap_) ++size_;
  }

  // Drops all samples.
  void reset(size_t capacity) {
    cap_ = capacity;
    data_.assign(cap_, T{});
    head_ = 0;
    size_ = 0;
  }

  // Oldest to newest.
  [[nodiscard]] std::vector<T> values() const {
    std::vector<T> out;
    out.reserve(size_);
    size_t first = (head_ + cap_ - size_) % (cap_ ? cap_ : 1);
    for (size_t i = 0; i < size_; ++i) out.push_back(data_[(first + i) % cap_]);
    return out;
  }

  // Newest sample; nullopt while empty.
  [[nodiscard]] std::optional<T> latest() const {
    if (size_ == 0) return std::nullopt;
    return data_[(head_ + cap_ - 1) % cap_];
  }
  [[nodiscard]] size_t size() const { return size_; }
  [[nodiscard]] size_t capacity() const { return cap_; }
  [[nodiscard]] bool empty() const { return size_ == 0; }

private:
  std::vector<T> data_;
  size_t head_{0};
  size_t size_{0};
  size_t cap_{0};
};

} // namespace puls::util
