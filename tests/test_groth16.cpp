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

#include "zkattest/ceremony.hpp"
#include "zkattest/error.hpp"
#include "zkattest/groth16.hpp"
#include "zkattest/r1cs.hpp"
#include "zkattest/serialize.hpp"

#include <cstdio>
#include <string>
#include <utility>
#include <vector>

#include "gtest/gtest.h"
#include "test_util.hpp"

namespace zkattest {
namespace {

using LC = LinearCombination;

// x^3 + x + 5 == out, out public.
CircuitBuilder cubic(uint64_t x_value) {
  CircuitBuilder cb("cubic", 1, 1);
  LC x = LC::variable(cb.alloc(fr_from_u64(x_value)));
  size_t x2 = cb.mul(x, x);
  size_t x3 = cb.mul(LC::variable(x2), x);
  LC sum = LC::variable(x3) + x + LC::constant(fr_from_u64(5));
  cb.set_value(cb.public_var(0), cb.evaluate(sum));
  cb.enforce(sum, cb.one(), LC::variable(cb.public_var(0)));
  return cb;
}

class Groth16Test : public ::testing::Test {
 protected:
  static void SetUpTestSuite() {
    init_curve();
    tau_ = new PowersOfTau(new_transcript(3));
    contribute(*tau_, "alice", "first toss");
    keys_ = new CircuitKeys(setup_circuit(*tau_, cubic(0).system()));
    contribute_delta(*keys_, "bob", "second toss");
  }
  static void TearDownTestSuite() {
    delete keys_;
    delete tau_;
    keys_ = nullptr;
    tau_ = nullptr;
  }

  static PowersOfTau* tau_;
  static CircuitKeys* keys_;
};

PowersOfTau* Groth16Test::tau_ = nullptr;
CircuitKeys* Groth16Test::keys_ = nullptr;

TEST_F(Groth16Test, ValidProofVerifies) {
  CircuitBuilder cb = cubic(3);
  Proof p = prove(keys_->pk, cb.system(), cb.witness());
  std::string why;
  EXPECT_TRUE(verify(keys_->vk(), p, {fr_from_u64(35)}, &why)) << why;
  EXPECT_EQ(keys_->pk.domain_size, 8u);
}

TEST_F(Groth16Test, WrongPublicInputsAreRejected) {
  CircuitBuilder cb = cubic(3);
  Proof p = prove(keys_->pk, cb.system(), cb.witness());
  std::string why;
  EXPECT_FALSE(verify(keys_->vk(), p, {fr_from_u64(36)}, &why));
  EXPECT_EQ(why, "pairing check failed");
  EXPECT_FALSE(verify(keys_->vk(), p, {}, &why));
  EXPECT_FALSE(verify(keys_->vk(), p, {fr_from_u64(35), fr_from_u64(0)}, &why));
  EXPECT_NE(why.find("public inputs"), std::string::npos);
}

TEST_F(Groth16Test, TamperedProofsAreRejected) {
  CircuitBuilder cb = cubic(3);
  Proof p = prove(keys_->pk, cb.system(), cb.witness());
  Proof swapped = p;
  std::swap(swapped.a, swapped.c);
  EXPECT_FALSE(verify(keys_->vk(), swapped, {fr_from_u64(35)}));
  Proof shifted = p;
  G1::add(shifted.c, shifted.c, gen_g1());
  EXPECT_FALSE(verify(keys_->vk(), shifted, {fr_from_u64(35)}));
  Proof negated = p;
  G1::neg(negated.a, negated.a);
  EXPECT_FALSE(verify(keys_->vk(), negated, {fr_from_u64(35)}));
}

TEST_F(Groth16Test, ProofsAreRandomized) {
  CircuitBuilder cb = cubic(2);
  Proof p1 = prove(keys_->pk, cb.system(), cb.witness());
  Proof p2 = prove(keys_->pk, cb.system(), cb.witness());
  EXPECT_NE(p1, p2);
  EXPECT_TRUE(verify(keys_->vk(), p1, {fr_from_u64(15)}));
  EXPECT_TRUE(verify(keys_->vk(), p2, {fr_from_u64(15)}));
}

TEST_F(Groth16Test, UnsatisfiedWitnessIsRefused) {
  CircuitBuilder cb = cubic(3);
  std::vector<Fr> w = cb.witness();
  w[1] = fr_from_u64(36);
  EXPECT_ZK_ERROR(prove(keys_->pk, cb.system(), w), ErrorCode::InvalidInput);
  w.pop_back();
  EXPECT_ZK_ERROR(prove(keys_->pk, cb.system(), w), ErrorCode::InvalidInput);
}

TEST_F(Groth16Test, QuotientHasDegreeBelowDomain) {
  CircuitBuilder cb = cubic(4);
  std::vector<Fr> h = quotient_coefficients(cb.system(), cb.witness(), 8);
  ASSERT_EQ(h.size(), 8u);
  EXPECT_TRUE(h[7].isZero());
}

// ---------------------------------------------------------------- ceremony

TEST_F(Groth16Test, FreshTranscriptIsNotUsable) {
  PowersOfTau t = new_transcript(3);
  EXPECT_ZK_ERROR(verify_transcript(t), ErrorCode::SetupFailure);
  EXPECT_ZK_ERROR(setup_circuit(t, cubic(0).system()), ErrorCode::SetupFailure);
  EXPECT_ZK_ERROR(new_transcript(0), ErrorCode::InvalidInput);
}

TEST_F(Groth16Test, ContributionsChain) {
  PowersOfTau t = *tau_;
  contribute(t, "carol", "");
  ASSERT_EQ(t.contributions.size(), 2u);
  EXPECT_EQ(t.contributions[1].prev_hash, t.contributions[0].hash);
  EXPECT_EQ(t.contributions[1].hash, t.state_hash());
  EXPECT_NO_THROW(verify_transcript(t));
  EXPECT_FALSE(t.tau_g1[1] == tau_->tau_g1[1]);
}

TEST_F(Groth16Test, CorruptTranscriptsAreDetected) {
  {
    PowersOfTau t = *tau_;
    G1::add(t.tau_g1[2], t.tau_g1[2], gen_g1());
    EXPECT_ZK_ERROR(verify_transcript(t), ErrorCode::SetupFailure);
  }
  {
    PowersOfTau t = *tau_;
    G1::add(t.alpha_tau_g1[3], t.alpha_tau_g1[3], gen_g1());
    EXPECT_ZK_ERROR(verify_transcript(t), ErrorCode::SetupFailure);
  }
  {
    PowersOfTau t = *tau_;
    G2::add(t.tau_g2[5], t.tau_g2[5], gen_g2());
    EXPECT_ZK_ERROR(verify_transcript(t), ErrorCode::SetupFailure);
  }
  {
    PowersOfTau t = *tau_;
    G2::add(t.beta_g2, t.beta_g2, gen_g2());
    EXPECT_ZK_ERROR(verify_transcript(t), ErrorCode::SetupFailure);
  }
  {
    PowersOfTau t = *tau_;
    t.contributions[0].hash[0] = t.contributions[0].hash[0] == '0' ? '1' : '0';
    EXPECT_ZK_ERROR(verify_transcript(t), ErrorCode::SetupFailure);
  }
  {
    // same-ratio consistent rescaling without a matching contribution record
    PowersOfTau t = *tau_;
    PowersOfTau other = *tau_;
    contribute(other, "mallory", "");
    other.contributions = t.contributions;
    EXPECT_ZK_ERROR(verify_transcript(other), ErrorCode::SetupFailure);
  }
  {
    PowersOfTau t = *tau_;
    t.tau_g1.pop_back();
    EXPECT_ZK_ERROR(verify_transcript(t), ErrorCode::SetupFailure);
  }
}

TEST_F(Groth16Test, TranscriptMustCoverTheCircuit) {
  PowersOfTau small = new_transcript(2);
  contribute(small, "dave", "");
  EXPECT_ZK_ERROR(setup_circuit(small, cubic(0).system()), ErrorCode::SetupFailure);

  PowersOfTau big = new_transcript(4);
  contribute(big, "erin", "");
  CircuitKeys keys = setup_circuit(big, cubic(0).system());
  contribute_delta(keys, "erin", "");
  EXPECT_EQ(keys.pk.domain_size, 8u);
  CircuitBuilder cb = cubic(5);
  EXPECT_TRUE(verify(keys.vk(), prove(keys.pk, cb.system(), cb.witness()), {fr_from_u64(135)}));
  EXPECT_NO_THROW(verify_circuit_keys(keys, big, cubic(0).system()));
}

TEST_F(Groth16Test, KeyVerification) {
  EXPECT_NO_THROW(verify_circuit_keys(*keys_, *tau_, cubic(0).system()));

  CircuitKeys initial = setup_circuit(*tau_, cubic(0).system());
  EXPECT_ZK_ERROR(verify_circuit_keys(initial, *tau_, cubic(0).system()), ErrorCode::SetupFailure);

  CircuitKeys twice = *keys_;
  contribute_delta(twice, "frank", "");
  EXPECT_NO_THROW(verify_circuit_keys(twice, *tau_, cubic(0).system()));
  CircuitBuilder cb = cubic(3);
  EXPECT_TRUE(verify(twice.vk(), prove(twice.pk, cb.system(), cb.witness()), {fr_from_u64(35)}));

  CircuitKeys bad_l = *keys_;
  G1::add(bad_l.pk.l_query[0], bad_l.pk.l_query[0], gen_g1());
  EXPECT_ZK_ERROR(verify_circuit_keys(bad_l, *tau_, cubic(0).system()), ErrorCode::SetupFailure);

  CircuitKeys bad_ic = *keys_;
  G1::add(bad_ic.pk.vk.ic[1], bad_ic.pk.vk.ic[1], gen_g1());
  EXPECT_ZK_ERROR(verify_circuit_keys(bad_ic, *tau_, cubic(0).system()), ErrorCode::SetupFailure);

  PowersOfTau other = *tau_;
  contribute(other, "grace", "");
  EXPECT_ZK_ERROR(verify_circuit_keys(*keys_, other, cubic(0).system()), ErrorCode::SetupFailure);
}

// ----------------------------------------------------------- serialization

TEST_F(Groth16Test, TranscriptJsonPreservesState) {
  PowersOfTau back = transcript_from_json(transcript_to_json(*tau_));
  EXPECT_EQ(back.state_hash(), tau_->state_hash());
  ASSERT_EQ(back.contributions.size(), 1u);
  EXPECT_EQ(back.contributions[0].name, "alice");
  EXPECT_NO_THROW(verify_transcript(back));
}

TEST_F(Groth16Test, KeysJsonProvesAndVerifies) {
  CircuitKeys back = keys_from_json(keys_to_json(*keys_));
  EXPECT_EQ(back.state_hash(), keys_->state_hash());
  VerificationKey vk = vk_from_json(vk_to_json(keys_->vk()));
  EXPECT_EQ(vk.circuit_digest, cubic(0).system().digest());
  CircuitBuilder cb = cubic(3);
  EXPECT_TRUE(verify(vk, prove(back.pk, cb.system(), cb.witness()), {fr_from_u64(35)}));
}

TEST_F(Groth16Test, MalformedProofJsonIsInvalidInput) {
  CircuitBuilder cb = cubic(3);
  ordered_json j = proof_to_json(prove(keys_->pk, cb.system(), cb.witness()));
  EXPECT_EQ(proof_from_json(j), proof_from_json(j));
  ordered_json bad = j;
  bad["pi_a"] = "not-hex";
  EXPECT_ZK_ERROR(proof_from_json(bad), ErrorCode::InvalidInput);
  bad = j;
  bad.erase("pi_c");
  EXPECT_ZK_ERROR(proof_from_json(bad), ErrorCode::InvalidInput);
  bad = j;
  bad["pi_b"] = j["pi_a"];
  EXPECT_ZK_ERROR(proof_from_json(bad), ErrorCode::InvalidInput);
}

TEST_F(Groth16Test, MissingTranscriptFileIsSetupFailure) {
  EXPECT_ZK_ERROR(load_transcript("/nonexistent/zkattest.ptau"), ErrorCode::SetupFailure);
  std::string path = ::testing::TempDir() + "zkattest_garbage.ptau";
  write_file(path, "{ not json");
  EXPECT_ZK_ERROR(load_transcript(path), ErrorCode::SetupFailure);
  save_transcript(path, *tau_);
  EXPECT_EQ(load_transcript(path).state_hash(), tau_->state_hash());
  std::remove(path.c_str());
}

}  // namespace
}  // namespace zkattest
