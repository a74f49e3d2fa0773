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

#include "verifier.hpp"
#include "error.hpp"
#include "log.hpp"
#include "serialize.hpp"

#include <utility>

namespace zkattest {

void check_key_binding(const VerificationKey& vk, Circuit c){
    const R1CS& cs = compiled_circuit(c);
    auto fail=[&](const std::string& why){
        throw Error(ErrorCode::KeyMismatch, std::string(circuit_name(c)) + " verification key: " + why);
    };
    if(vk.circuit_id != cs.circuit_id) fail("generated for '" + vk.circuit_id + "'");
    if(vk.circuit_version != cs.circuit_version) fail("circuit version " + std::to_string(vk.circuit_version));
    if(vk.num_public() != cs.num_public) fail("public input count " + std::to_string(vk.num_public()));
    if(vk.circuit_digest != cs.digest()) fail("circuit digest differs from the compiled circuit");
    // delta == gamma only before any phase-2 contribution; such keys admit forged proofs
    if(vk.delta_g2 == vk.gamma_g2) fail("no delta contribution (delta equals gamma)");
}

Groth16Verifier::Groth16Verifier(VerificationKey model_vk, VerificationKey signal_vk)
    : model_vk_(std::move(model_vk)), signal_vk_(std::move(signal_vk)) {
    check_key_binding(model_vk_, Circuit::Model);
    check_key_binding(signal_vk_, Circuit::Signal);
}

Groth16Verifier Groth16Verifier::load(const std::string& key_dir){
    return Groth16Verifier(load_vk(key_dir, Circuit::Model), load_vk(key_dir, Circuit::Signal));
}

bool Groth16Verifier::verify(Circuit circuit, const Proof& proof, const std::vector<Fr>& public_inputs) const {
    std::string why;
    bool ok = zkattest::verify(key(circuit), proof, public_inputs, &why);
    if(!ok) dbg(std::string(circuit_name(circuit)) + " proof rejected: " + why);
    return ok;
}

} // namespace zkattest
