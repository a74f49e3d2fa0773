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

// Proof generation and registry attestation against real Groth16 keys.
// All tests share one set of keys (see test_keys.cpp), so this binary runs
// as a single process.

#include "zkattest/circuits.hpp"
#include "zkattest/error.hpp"
#include "zkattest/prover.hpp"
#include "zkattest/registry.hpp"
#include "zkattest/serialize.hpp"

#include <filesystem>
#include <limits>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "gtest/gtest.h"
#include "test_keys.hpp"
#include "test_util.hpp"

namespace zkattest {
namespace {

using test::test_key_dir;
using test::test_keys;
using test::test_prover;

constexpr uint64_t kNow = 1700000000;

ModelInput sample_model(uint64_t version = 1, uint64_t timestamp = kNow) {
  ModelInput in;
  for (size_t i = 0; i < kModelWeights; ++i) in.weights.push_back(0.125 * double(i) - 1.0);
  in.version = version;
  in.timestamp = timestamp;
  return in;
}

SignalInput sample_signal(const Fr& model_hash, int64_t type = 5, int64_t confidence = 87,
                          uint64_t timestamp = kNow) {
  SignalInput in;
  in.signal_type = type;
  in.confidence = confidence;
  in.model_hash = model_hash;
  in.timestamp = timestamp;
  return in;
}

class AttestationTest : public ::testing::Test {
 protected:
  void SetUp() override { init_curve(); }
  const SignalProver& prover() { return test_prover(); }
};

// ------------------------------------------------------------------ prover

TEST_F(AttestationTest, ModelProofCommitsToWeights) {
  ModelProof p = prover().generate_model_proof(sample_model(3, kNow - 20));
  std::vector<int64_t> scaled;
  for (double w : sample_model().weights) scaled.push_back(scale_weight(w));
  EXPECT_EQ(p.model_hash, model_hash_of(scaled));
  ASSERT_EQ(p.artifact.public_signals.size(), 3u);
  EXPECT_EQ(p.artifact.public_signals[0], p.model_hash);
  EXPECT_EQ(p.artifact.public_signals[1], fr_from_u64(3));
  EXPECT_EQ(p.artifact.public_signals[2], fr_from_u64(kNow - 20));
  EXPECT_EQ(p.version, 3u);
  EXPECT_EQ(p.timestamp, kNow - 20);
  EXPECT_TRUE(prover().verify_proof_locally(p.artifact));

  std::vector<Fr> other = p.artifact.public_signals;
  other[1] = fr_from_u64(4);
  EXPECT_FALSE(prover().verify_proof_locally(p.artifact.proof, other, Circuit::Model));
}

TEST_F(AttestationTest, ModelInputIsValidated) {
  ModelInput in = sample_model();
  in.weights.pop_back();
  EXPECT_ZK_ERROR(prover().generate_model_proof(in), ErrorCode::InvalidInput);
  in = sample_model();
  in.weights.push_back(0.5);
  EXPECT_ZK_ERROR(prover().generate_model_proof(in), ErrorCode::InvalidInput);
  in = sample_model(0);
  EXPECT_ZK_ERROR(prover().generate_model_proof(in), ErrorCode::InvalidInput);
  in = sample_model();
  in.weights[4] = std::numeric_limits<double>::quiet_NaN();
  EXPECT_ZK_ERROR(prover().generate_model_proof(in), ErrorCode::InvalidInput);
}

TEST_F(AttestationTest, SignalProofCommitsToReading) {
  Fr mh = fr_from_u64(0xAA);
  SignalProof p = prover().generate_signal_proof(sample_signal(mh, 7, 42, kNow - 5));
  EXPECT_EQ(p.signal_hash, signal_hash_of(7, 42, mh, kNow - 5));
  EXPECT_TRUE(p.is_valid);
  EXPECT_EQ(p.signal_type, 7u);
  ASSERT_EQ(p.artifact.public_signals.size(), 4u);
  EXPECT_EQ(p.artifact.public_signals[1], Fr(1));
  EXPECT_EQ(p.artifact.public_signals[2], mh);
  EXPECT_EQ(p.artifact.public_signals[3], fr_from_u64(kNow - 5));

  EXPECT_TRUE(prover().verify_proof_locally(p.artifact.proof, p.artifact.public_signals, "signal"));
  EXPECT_TRUE(prover().verify_proof_locally(p.artifact.proof, p.artifact.public_signals, "signal_attestation"));
  EXPECT_FALSE(prover().verify_proof_locally(p.artifact.proof, p.artifact.public_signals, "bogus"));
  EXPECT_FALSE(prover().verify_proof_locally(p.artifact.proof, p.artifact.public_signals, Circuit::Model));

  std::vector<Fr> flipped = p.artifact.public_signals;
  flipped[1] = Fr(0);
  EXPECT_FALSE(prover().verify_proof_locally(p.artifact.proof, flipped, Circuit::Signal));
  std::vector<Fr> reordered = p.artifact.public_signals;
  std::swap(reordered[0], reordered[2]);
  EXPECT_FALSE(prover().verify_proof_locally(p.artifact.proof, reordered, Circuit::Signal));
}

TEST_F(AttestationTest, SignalBoundsAreInclusive) {
  Fr mh = fr_from_u64(0xAA);
  EXPECT_ZK_ERROR(prover().generate_signal_proof(sample_signal(mh, 0)), ErrorCode::InvalidInput);
  EXPECT_ZK_ERROR(prover().generate_signal_proof(sample_signal(mh, 11)), ErrorCode::InvalidInput);
  EXPECT_ZK_ERROR(prover().generate_signal_proof(sample_signal(mh, 5, -1)), ErrorCode::InvalidInput);
  EXPECT_ZK_ERROR(prover().generate_signal_proof(sample_signal(mh, 5, 101)), ErrorCode::InvalidInput);

  SignalProof lo = prover().generate_signal_proof(sample_signal(mh, 1, 0));
  SignalProof hi = prover().generate_signal_proof(sample_signal(mh, 10, 100));
  EXPECT_TRUE(lo.is_valid);
  EXPECT_TRUE(hi.is_valid);
  EXPECT_TRUE(prover().verify_proof_locally(lo.artifact));
  EXPECT_TRUE(prover().verify_proof_locally(hi.artifact));
}

TEST_F(AttestationTest, CompositeProofLinksSignalToModel) {
  CompositeProof c = prover().generate_composite_proof(sample_model(1, kNow - 30),
                                                       sample_signal(fr_from_u64(1), 2, 60, kNow - 10));
  EXPECT_EQ(c.linkage.model_hash, c.model.model_hash);
  EXPECT_EQ(c.linkage.signal_hash, c.signal.signal_hash);
  EXPECT_EQ(c.linkage.timestamp, kNow - 10);
  EXPECT_EQ(c.signal.artifact.public_signals[2], c.model.model_hash);
  EXPECT_TRUE(prover().verify_proof_locally(c.model.artifact));
  EXPECT_TRUE(prover().verify_proof_locally(c.signal.artifact));
}

TEST_F(AttestationTest, ConcurrentProofsAreIndependent) {
  Fr mh = fr_from_u64(0xAA);
  std::vector<SignalProof> proofs(4);
  std::vector<std::thread> threads;
  for (size_t i = 0; i < proofs.size(); ++i) {
    threads.emplace_back([&, i] {
      proofs[i] = prover().generate_signal_proof(sample_signal(mh, int64_t(i) + 1, 50, kNow));
    });
  }
  for (auto& t : threads) t.join();
  for (size_t i = 0; i < proofs.size(); ++i) {
    EXPECT_EQ(proofs[i].signal_hash, signal_hash_of(i + 1, 50, mh, kNow));
    EXPECT_TRUE(prover().verify_proof_locally(proofs[i].artifact));
  }
}

// ------------------------------------------------------------ key binding

TEST_F(AttestationTest, KeysAreBoundToTheirCircuit) {
  const auto& k = test_keys();
  EXPECT_NO_THROW(Groth16Verifier(k.model.vk(), k.signal.vk()));
  EXPECT_ZK_ERROR(Groth16Verifier(k.signal.vk(), k.model.vk()), ErrorCode::KeyMismatch);
  EXPECT_ZK_ERROR(SignalProver(k.signal, k.model), ErrorCode::KeyMismatch);

  VerificationKey stale = k.signal.vk();
  stale.circuit_version = kCircuitVersion + 1;
  EXPECT_ZK_ERROR(check_key_binding(stale, Circuit::Signal), ErrorCode::KeyMismatch);
  stale = k.signal.vk();
  stale.circuit_digest = sha256_hex("some other circuit");
  EXPECT_ZK_ERROR(check_key_binding(stale, Circuit::Signal), ErrorCode::KeyMismatch);
}

TEST_F(AttestationTest, UncontributedKeysAreRefused) {
  const auto& k = test_keys();
  CircuitKeys raw = setup_circuit(k.tau, compiled_circuit(Circuit::Signal));
  const VerificationKey& vk = raw.vk();

  // with delta == gamma, A = alpha, B = beta, C = -IC(x) passes for any x
  std::vector<Fr> x = {fr_from_u64(0xBB), Fr(1), fr_from_u64(0xAA), fr_from_u64(kNow)};
  G1 ic = vk.ic[0];
  for (size_t i = 0; i < x.size(); ++i) {
    G1 t;
    G1::mul(t, vk.ic[i + 1], x[i]);
    G1::add(ic, ic, t);
  }
  Proof forged;
  forged.a = vk.alpha_g1;
  forged.b = vk.beta_g2;
  G1::neg(forged.c, ic);
  EXPECT_TRUE(verify(vk, forged, x));
  EXPECT_FALSE(verify(k.signal.vk(), forged, x));

  EXPECT_ZK_ERROR(check_key_binding(vk, Circuit::Signal), ErrorCode::KeyMismatch);
  EXPECT_ZK_ERROR(Groth16Verifier(k.model.vk(), vk), ErrorCode::KeyMismatch);
  EXPECT_ZK_ERROR(SignalProver(k.model, raw), ErrorCode::KeyMismatch);

  CircuitKeys unrecorded = k.signal;
  unrecorded.contributions.clear();
  EXPECT_ZK_ERROR(SignalProver(k.model, unrecorded), ErrorCode::KeyMismatch);

  std::string dir = ::testing::TempDir() + "zkattest_raw_keys/";
  std::filesystem::create_directories(dir);
  save_keys(dir, Circuit::Model, k.model);
  save_keys(dir, Circuit::Signal, raw);
  EXPECT_ZK_ERROR(Groth16Verifier::load(dir), ErrorCode::KeyMismatch);
  EXPECT_ZK_ERROR(SignalProver::load(dir), ErrorCode::KeyMismatch);
}

TEST_F(AttestationTest, SignalKeysVerifyAgainstTranscript) {
  EXPECT_NO_THROW(verify_circuit_keys(test_keys().signal, test_keys().tau, compiled_circuit(Circuit::Signal)));
}

TEST_F(AttestationTest, KeysLoadFromDisk) {
  SignalProver loaded = SignalProver::load(test_key_dir());
  Groth16Verifier verifier = Groth16Verifier::load(test_key_dir());
  SignalProof p = loaded.generate_signal_proof(sample_signal(fr_from_u64(9), 3, 30));
  EXPECT_TRUE(verifier.verify(Circuit::Signal, p.artifact.proof, p.artifact.public_signals));
  EXPECT_TRUE(prover().verify_proof_locally(p.artifact));
  EXPECT_ZK_ERROR(SignalProver::load(test_key_dir() + "missing/"), ErrorCode::SetupFailure);
}

// ----------------------------------------------------------- serialization

TEST_F(AttestationTest, ArtifactsSurviveJson) {
  CompositeProof c = prover().generate_composite_proof(sample_model(), sample_signal(Fr(0)));
  CompositeProof back = composite_proof_from_json(ordered_json::parse(composite_proof_to_json(c).dump()));
  EXPECT_EQ(back.model.model_hash, c.model.model_hash);
  EXPECT_EQ(back.model.version, 1u);
  EXPECT_EQ(back.signal.signal_hash, c.signal.signal_hash);
  EXPECT_TRUE(back.signal.is_valid);
  EXPECT_EQ(back.signal.signal_type, 5u);
  EXPECT_EQ(back.linkage.timestamp, c.linkage.timestamp);
  EXPECT_EQ(back.signal.artifact.proof, c.signal.artifact.proof);
  EXPECT_TRUE(prover().verify_proof_locally(back.model.artifact));
  EXPECT_TRUE(prover().verify_proof_locally(back.signal.artifact));
  EXPECT_EQ(artifact_digest(back.signal.artifact), artifact_digest(c.signal.artifact));
  EXPECT_NE(artifact_digest(back.signal.artifact), artifact_digest(back.model.artifact));

  ordered_json j = signal_proof_to_json(c.signal);
  EXPECT_EQ(j.at("circuit").get<std::string>(), "signal_attestation");
  EXPECT_EQ(j.at("publicSignals").size(), 4u);
  j["publicSignals"][0] = "12abc";
  EXPECT_ZK_ERROR(signal_proof_from_json(j), ErrorCode::InvalidInput);
  EXPECT_ZK_ERROR(signal_proof_from_json(model_proof_to_json(c.model)), ErrorCode::InvalidInput);
}

TEST_F(AttestationTest, MismatchedCompositeIsRejected) {
  CompositeProof c = prover().generate_composite_proof(sample_model(), sample_signal(Fr(0), 6, 20));
  Fr other_model = fr_from_u64(0xCC);
  SignalProof foreign = prover().generate_signal_proof(sample_signal(other_model, 6, 20));
  ASSERT_TRUE(prover().verify_proof_locally(foreign.artifact));

  // both proofs verify on their own, but the signal names another model
  CompositeProof spliced = c;
  spliced.signal = foreign;
  spliced.linkage.model_hash = other_model;
  spliced.linkage.signal_hash = foreign.signal_hash;
  EXPECT_ZK_ERROR(composite_proof_from_json(composite_proof_to_json(spliced)), ErrorCode::InvalidInput);

  CompositeProof relinked = c;
  relinked.linkage.signal_hash = foreign.signal_hash;
  EXPECT_ZK_ERROR(composite_proof_from_json(composite_proof_to_json(relinked)), ErrorCode::InvalidInput);
  EXPECT_NO_THROW(composite_proof_from_json(composite_proof_to_json(c)));
}

TEST_F(AttestationTest, DeclaredFieldsMustMatchPublicSignals) {
  CompositeProof c = prover().generate_composite_proof(sample_model(), sample_signal(Fr(0)));

  ordered_json m = model_proof_to_json(c.model);
  m["modelHash"] = fr_to_dec(fr_from_u64(0xCC));
  EXPECT_ZK_ERROR(model_proof_from_json(m), ErrorCode::InvalidInput);
  m = model_proof_to_json(c.model);
  m["version"] = 9;
  EXPECT_ZK_ERROR(model_proof_from_json(m), ErrorCode::InvalidInput);

  ordered_json s = signal_proof_to_json(c.signal);
  s["signalHash"] = fr_to_dec(fr_from_u64(0xBB));
  EXPECT_ZK_ERROR(signal_proof_from_json(s), ErrorCode::InvalidInput);
  s = signal_proof_to_json(c.signal);
  s["isValid"] = false;
  EXPECT_ZK_ERROR(signal_proof_from_json(s), ErrorCode::InvalidInput);
  s = signal_proof_to_json(c.signal);
  s["timestamp"] = kNow + 1;
  EXPECT_ZK_ERROR(signal_proof_from_json(s), ErrorCode::InvalidInput);
  s = signal_proof_to_json(c.signal);
  s["publicSignals"].erase(3);
  EXPECT_ZK_ERROR(signal_proof_from_json(s), ErrorCode::InvalidInput);
}

// -------------------------------------------------------------- end to end

class EndToEndTest : public AttestationTest {
 protected:
  void SetUp() override {
    AttestationTest::SetUp();
    registry_.reset(new Registry(prover().verifier(), "deployer", RegistryOptions(), [] { return kNow; }));
  }
  std::unique_ptr<Registry> registry_;
};

TEST_F(EndToEndTest, ModelThenSignal) {
  ModelProof m = prover().generate_model_proof(sample_model(1, kNow - 60));
  registry_->attest_model("deployer", m.artifact.proof, m.model_hash, m.version, m.timestamp);
  ModelAttestation rec = registry_->verify_model(m.model_hash);
  EXPECT_TRUE(rec.verified);
  EXPECT_EQ(rec.version, 1u);

  SignalProof s = prover().generate_signal_proof(sample_signal(m.model_hash, 4, 90, kNow - 1));
  registry_->attest_signal("deployer", s.artifact.proof, s.signal_hash, m.model_hash, 4, s.timestamp);
  EXPECT_TRUE(registry_->is_signal_linked_to_model(s.signal_hash, m.model_hash));
  EXPECT_EQ(registry_->events().size(), 3u);
}

TEST_F(EndToEndTest, PublicValuesMustMatchTheProof) {
  ModelProof m = prover().generate_model_proof(sample_model(2, kNow - 60));
  EXPECT_ZK_ERROR(registry_->attest_model("deployer", m.artifact.proof, m.model_hash, 3, m.timestamp),
                  ErrorCode::InvalidProof);
  EXPECT_ZK_ERROR(registry_->attest_model("deployer", m.artifact.proof, m.model_hash, 2, m.timestamp + 1),
                  ErrorCode::InvalidProof);
  registry_->attest_model("deployer", m.artifact.proof, m.model_hash, 2, m.timestamp);

  SignalProof s = prover().generate_signal_proof(sample_signal(m.model_hash, 4, 90, kNow - 10));
  EXPECT_ZK_ERROR(registry_->attest_signal("deployer", s.artifact.proof, s.signal_hash, m.model_hash, 4, kNow - 9),
                  ErrorCode::InvalidProof);
  EXPECT_ZK_ERROR(registry_->attest_signal("deployer", m.artifact.proof, s.signal_hash, m.model_hash, 4, s.timestamp),
                  ErrorCode::InvalidProof);
  EXPECT_FALSE(registry_->verify_signal(s.signal_hash).verified);
}

TEST_F(EndToEndTest, SignalForAnotherModelIsRejected) {
  ModelProof m1 = prover().generate_model_proof(sample_model(1, kNow));
  ModelInput other = sample_model(1, kNow);
  other.weights[0] = 3.5;
  ModelProof m2 = prover().generate_model_proof(other);
  ASSERT_NE(m1.model_hash, m2.model_hash);
  registry_->attest_model("deployer", m1.artifact.proof, m1.model_hash, 1, kNow);
  registry_->attest_model("deployer", m2.artifact.proof, m2.model_hash, 1, kNow);

  SignalProof s = prover().generate_signal_proof(sample_signal(m1.model_hash, 8, 10, kNow));
  EXPECT_ZK_ERROR(registry_->attest_signal("deployer", s.artifact.proof, s.signal_hash, m2.model_hash, 8, kNow),
                  ErrorCode::InvalidProof);
  registry_->attest_signal("deployer", s.artifact.proof, s.signal_hash, m1.model_hash, 8, kNow);
  EXPECT_TRUE(registry_->is_signal_linked_to_model(s.signal_hash, m1.model_hash));
  EXPECT_FALSE(registry_->is_signal_linked_to_model(s.signal_hash, m2.model_hash));
}

TEST_F(EndToEndTest, ProofOfInvalidSignalIsNotAttested) {
  ModelProof m = prover().generate_model_proof(sample_model(1, kNow));
  registry_->attest_model("deployer", m.artifact.proof, m.model_hash, 1, kNow);

  // the circuit proves out-of-range readings too, with isValid = 0
  SignalWitness w;
  w.signal_type = 11;
  w.confidence = 50;
  w.model_hash = m.model_hash;
  w.timestamp = kNow;
  CircuitBuilder cb = build_signal_circuit(w);
  ASSERT_TRUE(cb.system().is_satisfied(cb.witness()));
  Proof p = prove(test_keys().signal.pk, cb.system(), cb.witness());
  std::vector<Fr> ps = cb.public_signals();
  ASSERT_TRUE(ps[1].isZero());
  EXPECT_TRUE(prover().verify_proof_locally(p, ps, Circuit::Signal));

  EXPECT_ZK_ERROR(registry_->attest_signal("deployer", p, ps[0], m.model_hash, 5, kNow), ErrorCode::InvalidProof);
  EXPECT_FALSE(registry_->verify_signal(ps[0]).verified);
}

}  // namespace
}  // namespace zkattest
