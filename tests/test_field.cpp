// Copyright 2025 Fidesinnova.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "zkattest/error.hpp"
#include "zkattest/field.hpp"
#include "zkattest/mimc.hpp"

#include <set>
#include <string>
#include <vector>

#include "gtest/gtest.h"

namespace zkattest {
namespace {

class FieldTest : public ::testing::Test {
 protected:
  void SetUp() override { init_curve(); }
};

TEST_F(FieldTest, Sha256KnownVector) {
  EXPECT_EQ(sha256_hex("abc"),
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
  EXPECT_EQ(sha256_hex(""),
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST_F(FieldTest, IncrementalHashMatchesOneShot) {
  Sha256 h;
  h.update("ab").update("c");
  EXPECT_EQ(h.final_hex(), sha256_hex("abc"));
}

TEST_F(FieldTest, NegativeIntegersMapToFieldNegation) {
  Fr a = fr_from_i64(-1500);
  Fr b = fr_from_i64(1500);
  EXPECT_TRUE((a + b).isZero());
  Fr m = fr_from_i64(INT64_MIN);
  EXPECT_FALSE(m.isZero());
}

TEST_F(FieldTest, SmallValuesRoundTripThroughU64) {
  uint64_t v = 0;
  ASSERT_TRUE(fr_to_u64(fr_from_u64(1717171717ULL), v));
  EXPECT_EQ(v, 1717171717ULL);
  ASSERT_TRUE(fr_to_u64(fr_from_u64(UINT64_MAX), v));
  EXPECT_EQ(v, UINT64_MAX);
  EXPECT_FALSE(fr_to_u64(fr_from_i64(-1), v));
}

TEST_F(FieldTest, DecimalParsingRejectsNonCanonicalInput) {
  EXPECT_EQ(fr_to_dec(fr_from_dec("12345")), "12345");
  EXPECT_THROW(fr_from_dec(""), Error);
  EXPECT_THROW(fr_from_dec("-5"), Error);
  EXPECT_THROW(fr_from_dec("0x10"), Error);
  EXPECT_THROW(fr_from_dec("007"), Error);
  // r itself is out of range
  std::string r;
  Fr::getModulo(r);
  EXPECT_THROW(fr_from_dec(r), Error);
  try {
    fr_from_dec("abc");
    FAIL() << "expected InvalidInput";
  } catch (const Error& e) {
    EXPECT_EQ(e.code(), ErrorCode::InvalidInput);
    EXPECT_EQ(e.category(), ErrorCategory::InputValidation);
  }
}

TEST_F(FieldTest, PointHexCodec) {
  G1 p;
  G1::mul(p, gen_g1(), fr_from_u64(42));
  EXPECT_EQ(g1_from_hex(g1_to_hex(p)), p);
  G2 q;
  G2::mul(q, gen_g2(), fr_from_u64(42));
  EXPECT_EQ(g2_from_hex(g2_to_hex(q)), q);

  EXPECT_THROW(g1_from_hex("zz"), Error);
  EXPECT_THROW(g1_from_hex(""), Error);
  std::string h = g1_to_hex(p);
  EXPECT_THROW(g1_from_hex(h.substr(0, h.size() - 2)), Error);
  EXPECT_THROW(g1_from_hex(h + "00"), Error);
}

TEST_F(FieldTest, RandomScalarsAreDistinct) {
  std::set<std::string> seen;
  for (int i = 0; i < 32; ++i) seen.insert(fr_key(fr_random()));
  EXPECT_EQ(seen.size(), 32u);
  EXPECT_FALSE(fr_random_nonzero().isZero());
}

TEST_F(FieldTest, GeneratorsArePairingNonDegenerate) {
  GT e;
  mcl::bn::pairing(e, gen_g1(), gen_g2());
  EXPECT_FALSE(e.isOne());
}

// ---------------------------------------------------------------- MiMC-7

TEST_F(FieldTest, MimcConstants) {
  const auto& c = mimc_constants();
  ASSERT_EQ(c.size(), kMimcRounds);
  EXPECT_TRUE(c[0].isZero());
  EXPECT_EQ(c[1], fr_from_hash("zkattest.mimc7.1"));
  EXPECT_NE(c[1], c[2]);
}

TEST_F(FieldTest, MimcMatchesRoundDefinition) {
  Fr x = fr_from_u64(7), k = fr_from_u64(11);
  Fr t = x;
  for (size_t i = 0; i < kMimcRounds; ++i) {
    Fr b = t + k + mimc_constants()[i];
    t = b * b * b * b * b * b * b;
  }
  EXPECT_EQ(mimc7(x, k), t + k);
}

TEST_F(FieldTest, SpongeIsDeterministicAndOrderSensitive) {
  std::vector<Fr> a = {fr_from_u64(1), fr_from_u64(2), fr_from_u64(3)};
  std::vector<Fr> b = {fr_from_u64(3), fr_from_u64(2), fr_from_u64(1)};
  EXPECT_EQ(mimc_sponge(a), mimc_sponge(a));
  EXPECT_NE(mimc_sponge(a), mimc_sponge(b));

  Fr h1 = fr_from_u64(1) + mimc7(fr_from_u64(1), Fr(0));
  EXPECT_EQ(mimc_sponge({fr_from_u64(1)}), h1);
}

}  // namespace
}  // namespace zkattest
