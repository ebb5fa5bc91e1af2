#pragma once

#include "latch/latch.h"

namespace seqlogic {

// =============================================================================
// Master-slave flip-flops (rising edge triggered)
// =============================================================================
//
// The master latch is enabled while clk is low and the slave while clk is
// high, so the two are never transparent at the same time. Q changes only
// when clk goes from false to true across two consecutive Update calls, and
// takes the input the master sampled just before that transition. Repeated
// calls with the same clk level do not produce extra edges.
//
// Every flip-flop settles with clk held low after construction and Clear().

class DFlipflop {
 public:
  DFlipflop();

  void Update(bool clk, bool d);
  void Clear();

  bool q() const { return slave_.q(); }
  bool qn() const { return slave_.qn(); }

 private:
  DLatch master_;
  DLatch slave_;
};

class SRFlipflop {
 public:
  SRFlipflop();

  // s and r both high while clk is low is unspecified.
  void Update(bool clk, bool s, bool r);
  void Clear();

  bool q() const { return slave_.q(); }
  bool qn() const { return slave_.qn(); }

 private:
  GatedSRLatch master_;
  GatedSRLatch slave_;
};

// Derives S and R from its own previous outputs, so the inner SR flip-flop
// never sees both asserted: j/k = 00 holds, 10 sets, 01 resets, 11 toggles.
class JKFlipflop {
 public:
  void Update(bool clk, bool j, bool k);
  void Clear() { sr_.Clear(); }

  bool q() const { return sr_.q(); }
  bool qn() const { return sr_.qn(); }

 private:
  SRFlipflop sr_;
};

}  // namespace seqlogic
