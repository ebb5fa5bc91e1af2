#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <format>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

#include "common/diagnostic.h"
#include "flipflop/flipflop.h"

namespace seqlogic {

// =============================================================================
// RippleCounter: asynchronous up counter of N toggle-wired D flip-flops
// =============================================================================
//
// Stage 0 is the least significant bit and is clocked by the external clock.
// Stage i (i >= 1) is clocked by stage i-1's Qn, and every stage feeds its
// own Qn back as D. Stages are updated in increasing index order within one
// Update call, so a carry ripples through every affected stage in that call.
// The count wraps modulo 2^N.

template <size_t N>
class RippleCounter {
  static_assert(N >= 1 && N <= 64, "counter width must be 1..64 bits");

 public:
  RippleCounter() { Init(); }

  void Update(bool clk) {
    flipflops_[0].Update(clk, flipflops_[0].qn());
    for (size_t i = 1; i < N; ++i) {
      flipflops_[i].Update(flipflops_[i - 1].qn(), flipflops_[i].qn());
    }
  }

  void Clear() {
    for (auto& ff : flipflops_) ff.Clear();
    Init();
  }

  // Counter value if it fits in T, nullopt otherwise.
  template <typename T>
  std::optional<T> Value() const {
    static_assert(std::is_integral_v<T> && !std::is_same_v<T, bool>,
                  "counter value requires an integer type");
    uint64_t val = Accumulate();
    if (!std::in_range<T>(val)) return std::nullopt;
    return static_cast<T>(val);
  }

  // As above, and records an error in diag when the value does not fit.
  template <typename T>
  std::optional<T> Value(DiagEngine& diag) const {
    auto result = Value<T>();
    if (!result) {
      diag.Error(Name(),
                 std::format("value {} does not fit in a {}-bit {} integer",
                             Accumulate(), sizeof(T) * 8,
                             std::is_signed_v<T> ? "signed" : "unsigned"));
    }
    return result;
  }

  std::optional<bool> bit(size_t i) const {
    if (i >= N) return std::nullopt;
    return flipflops_[i].q();
  }

  static constexpr size_t width() { return N; }

  static std::string Name() { return std::format("ripple_counter<{}>", N); }

 private:
  // Settle with the clock low so no stage sees clk and D rise together.
  void Init() { Update(false); }

  uint64_t Accumulate() const {
    uint64_t val = 0;
    for (size_t i = 0; i < N; ++i) {
      if (flipflops_[i].q()) val |= uint64_t{1} << i;
    }
    return val;
  }

  std::array<DFlipflop, N> flipflops_;
};

}  // namespace seqlogic
