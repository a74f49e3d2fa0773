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

// circuits.hpp
// The two attestation circuits.
//
//   model_attestation v1   public [modelHash, version, timestamp]
//                          private weights[16] (fixed point, scale 1000)
//                          modelHash = Sponge(weights)
//
//   signal_attestation v1  public [signalHash, isValid, modelHash, timestamp]
//                          private signalType, confidence (8 bit)
//                          isValid = (1 <= type) * (type <= 10) * (confidence <= 100)
//                          signalHash = Sponge(type, confidence, modelHash, timestamp)

#pragma once
#include "r1cs.hpp"

#include <string>
#include <vector>

namespace zkattest {

enum class Circuit { Model, Signal };

constexpr size_t kModelWeights = 16;
constexpr double kWeightScale = 1000.0;
constexpr uint32_t kCircuitVersion = 1;
constexpr int64_t kSignalTypeMin = 1;
constexpr int64_t kSignalTypeMax = 10;
constexpr int64_t kConfidenceMax = 100;

const char* circuit_name(Circuit c);   // "model" / "signal"
const char* circuit_id(Circuit c);     // "model_attestation" / "signal_attestation"
bool parse_circuit(const std::string& s, Circuit& out);
size_t public_signal_count(Circuit c);

struct ModelWitness {
    std::vector<int64_t> weights;  // already scaled
    uint64_t version = 0;
    uint64_t timestamp = 0;
};

struct SignalWitness {
    uint64_t signal_type = 0;
    uint64_t confidence = 0;
    Fr model_hash = 0;
    uint64_t timestamp = 0;
};

// Builds the constraint system together with a full witness for the inputs.
// No range checks happen here; out-of-range inputs produce either isValid = 0
// or an unsatisfied system.
CircuitBuilder build_model_circuit(const ModelWitness& in);
CircuitBuilder build_signal_circuit(const SignalWitness& in);

// Compiled once per process.
const R1CS& compiled_circuit(Circuit c);

// floor(w * 1000); throws InvalidInput on non-finite or oversized values.
int64_t scale_weight(double w);

Fr model_hash_of(const std::vector<int64_t>& scaled_weights);
Fr signal_hash_of(uint64_t signal_type, uint64_t confidence, const Fr& model_hash, uint64_t timestamp);

} // namespace zkattest
