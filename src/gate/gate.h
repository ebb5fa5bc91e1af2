#pragma once

#include <initializer_list>

namespace seqlogic {

// --- Combinational gates over two-state signals ---
// The argument set is fixed at the call site. Empty sets reduce to the
// identity element of the operator.

bool Not(bool a);
bool And(std::initializer_list<bool> inputs);
bool Or(std::initializer_list<bool> inputs);
bool Xor(std::initializer_list<bool> inputs);
bool Nand(std::initializer_list<bool> inputs);
bool Nor(std::initializer_list<bool> inputs);

}  // namespace seqlogic
