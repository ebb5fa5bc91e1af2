#include "flipflop/flipflop.h"

#include "gate/gate.h"

namespace seqlogic {

// --- DFlipflop ---

DFlipflop::DFlipflop() { Update(false, false); }

void DFlipflop::Update(bool clk, bool d) {
  master_.Set(Not(clk), d);
  slave_.Set(clk, master_.q());
}

void DFlipflop::Clear() {
  master_.Clear();
  slave_.Clear();
  Update(false, false);
}

// --- SRFlipflop ---

SRFlipflop::SRFlipflop() { Update(false, false, false); }

void SRFlipflop::Update(bool clk, bool s, bool r) {
  master_.Set(s, Not(clk), r);
  slave_.Set(master_.q(), clk, master_.qn());
}

void SRFlipflop::Clear() {
  master_.Clear();
  slave_.Clear();
  Update(false, false, false);
}

// --- JKFlipflop ---

void JKFlipflop::Update(bool clk, bool j, bool k) {
  // Snapshot the current outputs before the inner flip-flop is updated.
  bool s = And({j, sr_.qn()});
  bool r = And({k, sr_.q()});
  sr_.Update(clk, s, r);
}

}  // namespace seqlogic
