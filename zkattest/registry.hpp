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

// registry.hpp
// Append-only attestation registry with an embedded authorization map.
//
// Every public call runs under one mutex, so checks and the write of an
// attestation are a single atomic step and calls are totally ordered.
// Records are write-once: a verified hash is never updated or removed.
// With a journal configured, each committed event is appended as one JSON
// line before memory changes, and the file is replayed on construction.
// Replay enforces the same authorization, write-once and model-exists rules
// as live calls, and attestation events keep their proof for reverify().

#pragma once
#include "verifier.hpp"

#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace zkattest {

using Principal = std::string;
using Clock = std::function<uint64_t()>;

uint64_t system_clock_seconds();

struct ModelAttestation {
    Fr model_hash = 0;
    uint64_t version = 0;
    uint64_t timestamp = 0;
    Principal attester;
    std::string artifact_digest;
    bool verified = false;
};

struct SignalAttestation {
    Fr signal_hash = 0;
    Fr model_hash = 0;
    uint64_t timestamp = 0;
    uint32_t signal_type = 0;
    Principal attester;
    std::string artifact_digest;
    bool verified = false;
};

enum class EventKind { ModelAttested, SignalAttested, AttesterAuthorized };

const char* event_name(EventKind k);
bool parse_event_kind(const std::string& s, EventKind& out);

struct Event {
    uint64_t sequence = 0;
    EventKind kind = EventKind::ModelAttested;
    Fr hash = 0;              // model hash or signal hash
    Fr model_hash = 0;        // SignalAttested
    uint64_t timestamp = 0;   // declared by the attester
    uint64_t version = 0;     // ModelAttested
    uint32_t signal_type = 0; // SignalAttested
    Principal actor;
    Principal subject;        // AttesterAuthorized
    bool authorized = false;  // AttesterAuthorized
    Proof proof;              // attestation events
    std::string artifact_digest;
    uint64_t recorded_at = 0; // ledger time
};

struct RegistryOptions {
    uint64_t staleness_bound_sec = 3600;
    std::string journal_path;  // empty: in-memory only
};

struct RegistryStats {
    size_t models = 0;
    size_t signals = 0;
    size_t authorized = 0;
    size_t events = 0;
};

class Registry {
public:
    // The deployer is authorized at bootstrap. When the journal already holds
    // events they are replayed instead. The verifier must outlive the registry.
    Registry(const ProofVerifier& verifier, const Principal& deployer,
             RegistryOptions options = RegistryOptions(), Clock clock = system_clock_seconds);

    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    void attest_model(const Principal& caller, const Proof& proof, const Fr& model_hash,
                      uint64_t version, uint64_t timestamp);

    void attest_signal(const Principal& caller, const Proof& proof, const Fr& signal_hash,
                       const Fr& model_hash, int64_t signal_type, uint64_t timestamp);

    // Unknown hashes yield an empty record with verified == false.
    ModelAttestation verify_model(const Fr& model_hash) const;
    SignalAttestation verify_signal(const Fr& signal_hash) const;
    bool is_signal_linked_to_model(const Fr& signal_hash, const Fr& model_hash) const;

    void set_attester_authorization(const Principal& caller, const Principal& principal, bool authorized);
    bool is_authorized(const Principal& principal) const;

    std::vector<Event> events() const;
    // Sequence numbers of attestation events whose stored proof the verifier
    // no longer accepts.
    std::vector<uint64_t> reverify() const;
    RegistryStats stats() const;
    uint64_t staleness_bound() const { return options_.staleness_bound_sec; }

private:
    void require_authorized(const Principal& caller) const;
    void require_fresh(uint64_t timestamp) const;
    void commit(Event e);
    void apply(const Event& e);
    void replay_journal();
    void check_replayed(const Event& e, const std::string& at) const;

    const ProofVerifier& verifier_;
    RegistryOptions options_;
    Clock clock_;

    mutable std::mutex mu_;
    std::unordered_map<std::string, ModelAttestation> models_;
    std::unordered_map<std::string, SignalAttestation> signals_;
    std::unordered_map<Principal, bool> authorized_;
    std::vector<Event> events_;
};

} // namespace zkattest
