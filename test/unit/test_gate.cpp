#include <gtest/gtest.h>

#include "gate/gate.h"

using namespace seqlogic;

TEST(Gate, Not) {
  EXPECT_TRUE(Not(false));
  EXPECT_FALSE(Not(true));
}

TEST(Gate, AndTruthTable) {
  EXPECT_FALSE(And({false, false}));
  EXPECT_FALSE(And({false, true}));
  EXPECT_FALSE(And({true, false}));
  EXPECT_TRUE(And({true, true}));
  EXPECT_FALSE(And({true, true, false}));
  EXPECT_TRUE(And({true, true, true}));
}

TEST(Gate, OrTruthTable) {
  EXPECT_FALSE(Or({false, false}));
  EXPECT_TRUE(Or({false, true}));
  EXPECT_TRUE(Or({true, false}));
  EXPECT_TRUE(Or({true, true}));
  EXPECT_TRUE(Or({false, false, true}));
}

TEST(Gate, XorIsOddParity) {
  EXPECT_FALSE(Xor({false, false}));
  EXPECT_TRUE(Xor({false, true}));
  EXPECT_TRUE(Xor({true, false}));
  EXPECT_FALSE(Xor({true, true}));
  EXPECT_TRUE(Xor({true, true, true}));
  EXPECT_FALSE(Xor({true, false, true, false}));
}

TEST(Gate, NandNor) {
  EXPECT_TRUE(Nand({false, true}));
  EXPECT_FALSE(Nand({true, true}));
  EXPECT_TRUE(Nor({false, false}));
  EXPECT_FALSE(Nor({false, true}));
}

TEST(Gate, EmptyInputsReduceToIdentity) {
  EXPECT_TRUE(And({}));
  EXPECT_FALSE(Or({}));
  EXPECT_FALSE(Xor({}));
}
