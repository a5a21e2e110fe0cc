#pragma once

#include <chrono>

namespace trophdiv {

class WallTimer {
public:
  using clock = std::chrono::steady_clock;

  WallTimer() : t0_(clock::now()) {}

  void reset() { t0_ = clock::now(); }

  double elapsed_seconds() const {
    return std::chrono::duration<double>(clock::now() - t0_).count();
  }

private:
  clock::time_point t0_;
};

// Adds the lifetime of the scope to *accumulator (ignored when null).
class ScopedTimer {
public:
  explicit ScopedTimer(double* accumulator) : acc_(accumulator) {}
  ~ScopedTimer() {
    if (acc_) *acc_ += t_.elapsed_seconds();
  }

  ScopedTimer(const ScopedTimer&) = delete;
  ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
  double* acc_ = nullptr;
  WallTimer t_;
};

} // namespace trophdiv
