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

// ceremony.hpp
// Trusted setup.
//
//   phase 1  powers of tau, independent of any circuit:
//              [tau^i]G1 (i < 2n-1), [tau^i]G2, [alpha tau^i]G1, [beta tau^i]G1 (i < n), [beta]G2
//            every contributor rescales by fresh secrets and publishes a
//            proof of knowledge of each secret
//   phase 2  circuit keys from the Lagrange basis of the transcript, then
//            delta contributions rescaling the private and quotient queries
//
// Proof of knowledge for a secret x (challenge = state hash before the
// contribution): s random in G1, s_x = x*s, r = H2(challenge, s, s_x), r_x = x*r.
// Checked as e(s, r_x) == e(s_x, r) and e(before, r_x) == e(after, r).

#pragma once
#include "groth16.hpp"

#include <string>
#include <vector>

namespace zkattest {

struct KnowledgeProof {
    G1 s;
    G1 s_x;
    G2 r_x;
};

struct Contribution {
    std::string name;
    std::string prev_hash;   // transcript state before
    std::string hash;        // transcript state after
    G1 tau_g1;               // [tau]G1 after
    G1 alpha_g1;             // [alpha]G1 after
    G1 beta_g1;              // [beta]G1 after
    KnowledgeProof tau_pok, alpha_pok, beta_pok;
};

struct PowersOfTau {
    uint32_t power = 0;
    std::vector<G1> tau_g1;
    std::vector<G2> tau_g2;
    std::vector<G1> alpha_tau_g1;
    std::vector<G1> beta_tau_g1;
    G2 beta_g2;
    std::vector<Contribution> contributions;

    size_t domain_size() const { return size_t(1) << power; }
    std::string state_hash() const;
};

struct DeltaContribution {
    std::string name;
    std::string prev_hash;
    std::string hash;
    G1 delta_g1;             // [delta]G1 after
    KnowledgeProof pok;
};

struct CircuitKeys {
    ProvingKey pk;
    std::string transcript_hash;   // phase-1 state the keys were derived from
    std::vector<DeltaContribution> contributions;

    const VerificationKey& vk() const { return pk.vk; }
    std::string state_hash() const;
};

constexpr uint32_t kMaxTauPower = 24;

// Fresh transcript with tau = alpha = beta = 1.
PowersOfTau new_transcript(uint32_t power);

void contribute(PowersOfTau& t, const std::string& name, const std::string& entropy);

// Throws SetupFailure naming the first failed check.
void verify_transcript(const PowersOfTau& t);

// Verifies the transcript, then derives keys with gamma = delta = 1.
CircuitKeys setup_circuit(const PowersOfTau& t, const R1CS& cs);

void contribute_delta(CircuitKeys& keys, const std::string& name, const std::string& entropy);

// Recomputes the initial keys and checks the delta chain. Throws SetupFailure.
void verify_circuit_keys(const CircuitKeys& keys, const PowersOfTau& t, const R1CS& cs);

} // namespace zkattest
