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

// verifier.hpp
// Proof-system seam used by the registry. Groth16Verifier is the production
// implementation; tests substitute their own.

#pragma once
#include "circuits.hpp"
#include "groth16.hpp"

#include <string>
#include <vector>

namespace zkattest {

class ProofVerifier {
public:
    virtual ~ProofVerifier() = default;
    virtual bool verify(Circuit circuit, const Proof& proof, const std::vector<Fr>& public_inputs) const = 0;
};

// Throws KeyMismatch unless vk was generated for the circuit as compiled by
// this build (id, version, digest, public-input count) and has been through
// at least one delta contribution.
void check_key_binding(const VerificationKey& vk, Circuit c);

class Groth16Verifier : public ProofVerifier {
public:
    Groth16Verifier(VerificationKey model_vk, VerificationKey signal_vk);

    // Reads <key_dir>/model.vk.json and <key_dir>/signal.vk.json.
    static Groth16Verifier load(const std::string& key_dir);

    bool verify(Circuit circuit, const Proof& proof, const std::vector<Fr>& public_inputs) const override;
    const VerificationKey& key(Circuit c) const { return c==Circuit::Model ? model_vk_ : signal_vk_; }

private:
    VerificationKey model_vk_;
    VerificationKey signal_vk_;
};

} // namespace zkattest
