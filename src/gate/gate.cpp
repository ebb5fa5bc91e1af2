#include "gate/gate.h"

namespace seqlogic {

bool Not(bool a) { return !a; }

bool And(std::initializer_list<bool> inputs) {
  for (bool in : inputs) {
    if (!in) return false;
  }
  return true;
}

bool Or(std::initializer_list<bool> inputs) {
  for (bool in : inputs) {
    if (in) return true;
  }
  return false;
}

// Odd parity.
bool Xor(std::initializer_list<bool> inputs) {
  bool result = false;
  for (bool in : inputs) result = result != in;
  return result;
}

bool Nand(std::initializer_list<bool> inputs) { return Not(And(inputs)); }

bool Nor(std::initializer_list<bool> inputs) { return Not(Or(inputs)); }

}  // namespace seqlogic
