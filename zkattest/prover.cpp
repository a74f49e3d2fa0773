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

#include "prover.hpp"
#include "error.hpp"
#include "log.hpp"
#include "serialize.hpp"

#include <algorithm>
#include <utility>

namespace zkattest {

static void check_proving_key(const CircuitKeys& keys, Circuit c){
    const R1CS& cs = compiled_circuit(c);
    const ProvingKey& pk = keys.pk;
    if(pk.circuit_id != cs.circuit_id || pk.circuit_digest != cs.digest()
       || pk.num_variables != cs.num_variables || pk.num_public != cs.num_public)
        throw Error(ErrorCode::KeyMismatch, std::string(circuit_name(c)) + " proving key does not match the compiled circuit");
    if(keys.contributions.empty() || !(pk.delta_g2 == pk.vk.delta_g2))
        throw Error(ErrorCode::KeyMismatch, std::string(circuit_name(c)) + " proving key has no delta contribution");
}

SignalProver::SignalProver(CircuitKeys model_keys, CircuitKeys signal_keys)
    : model_keys_(std::move(model_keys)),
      signal_keys_(std::move(signal_keys)),
      verifier_(model_keys_.pk.vk, signal_keys_.pk.vk) {
    check_proving_key(model_keys_, Circuit::Model);
    check_proving_key(signal_keys_, Circuit::Signal);
}

SignalProver SignalProver::load(const std::string& key_dir){
    return SignalProver(load_keys(key_dir, Circuit::Model), load_keys(key_dir, Circuit::Signal));
}

ModelProof SignalProver::generate_model_proof(const ModelInput& in) const {
    if(in.weights.size() != kModelWeights)
        throw Error(ErrorCode::InvalidInput, "model proof needs " + std::to_string(kModelWeights)
                    + " weights, got " + std::to_string(in.weights.size()));
    if(in.version == 0) throw Error(ErrorCode::InvalidInput, "model version must be positive");

    ModelWitness w;
    w.version = in.version;
    w.timestamp = in.timestamp;
    for(double x: in.weights) w.weights.push_back(scale_weight(x));
    CircuitBuilder cb = build_model_circuit(w);

    ModelProof out;
    out.artifact.circuit = Circuit::Model;
    out.artifact.proof = prove(model_keys_.pk, cb.system(), cb.witness());
    out.artifact.public_signals = cb.public_signals();
    out.model_hash = out.artifact.public_signals[0];
    out.version = in.version;
    out.timestamp = in.timestamp;
    dbg("model proof: hash " + fr_to_dec(out.model_hash));
    return out;
}

SignalProof SignalProver::generate_signal_proof(const SignalInput& in) const {
    if(in.signal_type < kSignalTypeMin || in.signal_type > kSignalTypeMax)
        throw Error(ErrorCode::InvalidInput, "signal type must be in [1, 10], got " + std::to_string(in.signal_type));
    if(in.confidence < 0 || in.confidence > kConfidenceMax)
        throw Error(ErrorCode::InvalidInput, "confidence must be in [0, 100], got " + std::to_string(in.confidence));

    SignalWitness w;
    w.signal_type = uint64_t(in.signal_type);
    w.confidence = uint64_t(in.confidence);
    w.model_hash = in.model_hash;
    w.timestamp = in.timestamp;
    CircuitBuilder cb = build_signal_circuit(w);

    SignalProof out;
    out.artifact.circuit = Circuit::Signal;
    out.artifact.proof = prove(signal_keys_.pk, cb.system(), cb.witness());
    out.artifact.public_signals = cb.public_signals();
    out.signal_hash = out.artifact.public_signals[0];
    out.is_valid = out.artifact.public_signals[1].isOne();
    out.timestamp = in.timestamp;
    out.signal_type = uint32_t(in.signal_type);
    dbg("signal proof: hash " + fr_to_dec(out.signal_hash) + (out.is_valid ? " (valid)" : " (invalid)"));
    return out;
}

CompositeProof SignalProver::generate_composite_proof(const ModelInput& model, const SignalInput& signal) const {
    CompositeProof out;
    out.model = generate_model_proof(model);
    SignalInput s = signal;
    s.model_hash = out.model.model_hash;
    out.signal = generate_signal_proof(s);
    out.linkage.model_hash = out.model.model_hash;
    out.linkage.signal_hash = out.signal.signal_hash;
    out.linkage.timestamp = std::max(out.model.timestamp, out.signal.timestamp);
    return out;
}

bool SignalProver::verify_proof_locally(const Proof& proof, const std::vector<Fr>& public_signals, Circuit c) const {
    return verifier_.verify(c, proof, public_signals);
}

bool SignalProver::verify_proof_locally(const Proof& proof, const std::vector<Fr>& public_signals,
                                        const std::string& name) const {
    Circuit c;
    if(!parse_circuit(name, c)){
        dbg("unknown circuit '" + name + "'");
        return false;
    }
    return verify_proof_locally(proof, public_signals, c);
}

} // namespace zkattest
