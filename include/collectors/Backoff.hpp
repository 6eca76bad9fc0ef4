#pragma once
#include <algorithm>
#include <chrono>

namespace ifwatch::collectors {

// Restart delay for the n-th consecutive failure: initial * 2^(n-1), capped.
class Backoff {
public:
  Backoff(std::chrono::milliseconds initial, std::chrono::milliseconds cap)
      : initial_(std::max(initial, std::chrono::milliseconds(1))), cap_(std::max(cap, initial_)) {}

  [[nodiscard]] std::chrono::milliseconds delay_for(int failures) const {
    if (failures <= 1) return std::min(initial_, cap_);
    auto d = initial_;
    for (int i = 1; i < failures; ++i) {
      if (d >= cap_) return cap_;
      d *= 2;
    }
    return std::min(d, cap_);
  }

  [[nodiscard]] std::chrono::milliseconds cap() const { return cap_; }

private:
  std::chrono::milliseconds initial_;
  std::chrono::milliseconds cap_;
};

} // namespace ifwatch::collectors
