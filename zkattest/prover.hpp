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

// prover.hpp
// Off-chain proof generation: turns private model weights or signal values
// plus declared public values into Groth16 proofs and their public signals.
// Public signals are deterministic for given inputs; proofs are randomized.
// A SignalProver is immutable after construction and safe to share between
// threads.

#pragma once
#include "ceremony.hpp"
#include "circuits.hpp"
#include "verifier.hpp"

#include <string>
#include <vector>

namespace zkattest {

struct ModelInput {
    std::vector<double> weights;   // kModelWeights floating-point weights
    uint64_t version = 0;
    uint64_t timestamp = 0;
};

struct SignalInput {
    int64_t signal_type = 0;       // 1..10
    int64_t confidence = 0;        // 0..100
    Fr model_hash = 0;
    uint64_t timestamp = 0;
};

struct ProofArtifact {
    Circuit circuit = Circuit::Model;
    Proof proof;
    std::vector<Fr> public_signals;
};

struct ModelProof {
    ProofArtifact artifact;
    Fr model_hash = 0;
    uint64_t timestamp = 0;
    uint64_t version = 0;
};

struct SignalProof {
    ProofArtifact artifact;
    Fr signal_hash = 0;
    bool is_valid = false;
    uint64_t timestamp = 0;
    uint32_t signal_type = 0;
};

struct Linkage {
    Fr model_hash = 0;
    Fr signal_hash = 0;
    uint64_t timestamp = 0;        // max of both proofs
};

struct CompositeProof {
    ModelProof model;
    SignalProof signal;
    Linkage linkage;
};

class SignalProver {
public:
    // Throws KeyMismatch when a key does not belong to the compiled circuit.
    SignalProver(CircuitKeys model_keys, CircuitKeys signal_keys);

    // Reads <key_dir>/{model,signal}.{pk,vk}.json.
    static SignalProver load(const std::string& key_dir);

    ModelProof generate_model_proof(const ModelInput& in) const;
    SignalProof generate_signal_proof(const SignalInput& in) const;
    // The signal's model hash is replaced by the one just proven.
    CompositeProof generate_composite_proof(const ModelInput& model, const SignalInput& signal) const;

    bool verify_proof_locally(const Proof& proof, const std::vector<Fr>& public_signals, Circuit c) const;
    bool verify_proof_locally(const Proof& proof, const std::vector<Fr>& public_signals,
                              const std::string& circuit_name) const;
    bool verify_proof_locally(const ProofArtifact& a) const {
        return verify_proof_locally(a.proof, a.public_signals, a.circuit);
    }

    const ProofVerifier& verifier() const { return verifier_; }

private:
    CircuitKeys model_keys_;
    CircuitKeys signal_keys_;
    Groth16Verifier verifier_;
};

} // namespace zkattest
