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

// serialize.hpp
// JSON encoding (nlohmann/json) of transcripts, keys, proof artifacts,
// attestation records and journal events. Points are hex-encoded mcl
// serializations, field elements are decimal strings.
//
// Parse failures of artifacts and records throw InvalidInput; transcripts and
// keys that cannot be loaded throw SetupFailure.

#pragma once
#include "ceremony.hpp"
#include "circuits.hpp"
#include "prover.hpp"
#include "registry.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace zkattest {

using ordered_json = nlohmann::ordered_json;

ordered_json proof_to_json(const Proof& p);
Proof proof_from_json(const ordered_json& j);

ordered_json artifact_to_json(const ProofArtifact& a);
ProofArtifact artifact_from_json(const ordered_json& j);

ordered_json model_proof_to_json(const ModelProof& p);
ModelProof model_proof_from_json(const ordered_json& j);
ordered_json signal_proof_to_json(const SignalProof& p);
SignalProof signal_proof_from_json(const ordered_json& j);
ordered_json composite_proof_to_json(const CompositeProof& p);
CompositeProof composite_proof_from_json(const ordered_json& j);

// SHA-256 (hex) of the canonical artifact JSON, for audit references.
std::string artifact_digest(const ProofArtifact& a);

ordered_json vk_to_json(const VerificationKey& vk);
VerificationKey vk_from_json(const ordered_json& j);

ordered_json keys_to_json(const CircuitKeys& k);
CircuitKeys keys_from_json(const ordered_json& j);

ordered_json transcript_to_json(const PowersOfTau& t);
PowersOfTau transcript_from_json(const ordered_json& j);

ordered_json model_record_to_json(const ModelAttestation& m);
ordered_json signal_record_to_json(const SignalAttestation& s);

ordered_json event_to_json(const Event& e);
Event event_from_json(const ordered_json& j);

// ------------------------------------------------------------------- files
std::string read_file(const std::string& path);                  // throws InvalidInput
void write_file(const std::string& path, const std::string& data); // throws InvalidInput
ordered_json load_json(const std::string& path);
void save_json(const std::string& path, const ordered_json& j);

PowersOfTau load_transcript(const std::string& path);
void save_transcript(const std::string& path, const PowersOfTau& t);

std::string key_path(const std::string& key_dir, Circuit c, const char* kind);  // kind: "pk" | "vk"
CircuitKeys load_keys(const std::string& key_dir, Circuit c);
VerificationKey load_vk(const std::string& key_dir, Circuit c);
// Writes <circuit>.pk.json and <circuit>.vk.json.
void save_keys(const std::string& key_dir, Circuit c, const CircuitKeys& keys);

} // namespace zkattest
