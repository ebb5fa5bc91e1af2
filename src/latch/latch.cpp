#include "latch/latch.h"

#include "gate/gate.h"

namespace seqlogic {

// --- DLatch ---

void DLatch::Set(bool enable, bool data) {
  q_ = Or({And({enable, data}), And({Not(enable), q_})});
}

bool DLatch::qn() const { return Not(q_); }

// --- GatedSRLatch ---

void GatedSRLatch::Set(bool s, bool enable, bool r) {
  bool set = And({s, enable});
  bool reset = And({r, enable});
  q_ = Or({set, And({q_, Not(reset)})});
}

bool GatedSRLatch::qn() const { return Not(q_); }

}  // namespace seqlogic
