#pragma once

namespace seqlogic {

// =============================================================================
// DLatch: level-sensitive data latch
// =============================================================================
//
// Transparent while enabled (Q follows data), opaque while disabled (Q holds).
// Starts in the reset state, Q = false.

class DLatch {
 public:
  void Set(bool enable, bool data);
  void Clear() { q_ = false; }

  bool q() const { return q_; }
  bool qn() const;

 private:
  bool q_ = false;
};

// =============================================================================
// GatedSRLatch: level-sensitive set/reset latch with an enable input
// =============================================================================
//
// While enabled: s sets, r resets, neither holds. s and r together are a
// forbidden input whose outcome is unspecified; callers must not produce it.
// While disabled, Q holds regardless of s and r.

class GatedSRLatch {
 public:
  void Set(bool s, bool enable, bool r);
  void Clear() { q_ = false; }

  bool q() const { return q_; }
  bool qn() const;

 private:
  bool q_ = false;
};

}  // namespace seqlogic
