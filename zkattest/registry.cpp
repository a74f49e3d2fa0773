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

#include "registry.hpp"
#include "error.hpp"
#include "log.hpp"
#include "serialize.hpp"

#include <chrono>
#include <fstream>
#include <utility>

namespace zkattest {

uint64_t system_clock_seconds(){
    using namespace std::chrono;
    return uint64_t(duration_cast<seconds>(system_clock::now().time_since_epoch()).count());
}

const char* event_name(EventKind k){
    switch(k){
        case EventKind::ModelAttested:      return "ModelAttested";
        case EventKind::SignalAttested:     return "SignalAttested";
        case EventKind::AttesterAuthorized: return "AttesterAuthorized";
    }
    return "Unknown";
}

bool parse_event_kind(const std::string& s, EventKind& out){
    for(EventKind k: {EventKind::ModelAttested, EventKind::SignalAttested, EventKind::AttesterAuthorized}){
        if(s == event_name(k)){ out = k; return true; }
    }
    return false;
}

static Circuit attested_circuit(const Event& e){
    return e.kind == EventKind::ModelAttested ? Circuit::Model : Circuit::Signal;
}

// Public inputs the registry verifies an attestation against; isValid is
// pinned to 1, so proofs of invalid signals never verify.
static std::vector<Fr> attested_inputs(const Event& e){
    if(e.kind == EventKind::ModelAttested)
        return {e.hash, fr_from_u64(e.version), fr_from_u64(e.timestamp)};
    return {e.hash, Fr(1), e.model_hash, fr_from_u64(e.timestamp)};
}

static std::string attested_digest(const Event& e){
    ProofArtifact a;
    a.circuit = attested_circuit(e);
    a.proof = e.proof;
    a.public_signals = attested_inputs(e);
    return artifact_digest(a);
}

Registry::Registry(const ProofVerifier& verifier, const Principal& deployer,
                   RegistryOptions options, Clock clock)
    : verifier_(verifier), options_(std::move(options)), clock_(std::move(clock)) {
    if(!clock_) throw Error(ErrorCode::InvalidInput, "registry needs a clock");
    if(!options_.journal_path.empty()) replay_journal();
    if(events_.empty()){
        if(deployer.empty()) throw Error(ErrorCode::InvalidInput, "registry needs a deployer principal");
        Event e;
        e.kind = EventKind::AttesterAuthorized;
        e.actor = deployer;
        e.subject = deployer;
        e.authorized = true;
        commit(e);
    }
}

void Registry::replay_journal(){
    std::ifstream in(options_.journal_path);
    if(!in) return;  // first run
    std::string line;
    size_t lineno = 0;
    while(std::getline(in, line)){
        ++lineno;
        if(line.empty()) continue;
        const std::string at = options_.journal_path + ":" + std::to_string(lineno) + ": ";
        Event e;
        try{
            e = event_from_json(ordered_json::parse(line));
        }catch(const nlohmann::json::parse_error& ex){
            throw Error(ErrorCode::JournalFailure, at + ex.what());
        }catch(const Error& ex){
            throw Error(ErrorCode::JournalFailure, at + ex.what());
        }
        if(e.sequence != events_.size()+1)
            throw Error(ErrorCode::JournalFailure, at + "sequence " + std::to_string(e.sequence) + " out of order");
        check_replayed(e, at);
        apply(e);
    }
    if(in.bad()) throw Error(ErrorCode::JournalFailure, "read error on " + options_.journal_path);
    dbg("journal replayed: " + std::to_string(events_.size()) + " event(s) from " + options_.journal_path);
}

void Registry::check_replayed(const Event& e, const std::string& at) const {
    auto fail=[&](const std::string& why){ throw Error(ErrorCode::JournalFailure, at + why); };
    if(events_.empty()){
        if(e.kind != EventKind::AttesterAuthorized || e.actor != e.subject || !e.authorized || e.actor.empty())
            fail("first event is not the deployer bootstrap");
        return;
    }
    auto it = authorized_.find(e.actor);
    if(it == authorized_.end() || !it->second) fail("actor '" + e.actor + "' was not authorized");
    switch(e.kind){
        case EventKind::ModelAttested:
            if(models_.count(fr_key(e.hash))) fail("model " + fr_to_dec(e.hash) + " attested twice");
            break;
        case EventKind::SignalAttested:
            if(e.signal_type < kSignalTypeMin || e.signal_type > kSignalTypeMax)
                fail("signal type " + std::to_string(e.signal_type) + " out of range");
            if(!models_.count(fr_key(e.model_hash))) fail("signal refers to unattested model " + fr_to_dec(e.model_hash));
            if(signals_.count(fr_key(e.hash))) fail("signal " + fr_to_dec(e.hash) + " attested twice");
            break;
        case EventKind::AttesterAuthorized:
            if(e.subject.empty()) fail("empty principal");
            return;
    }
    if(e.artifact_digest != attested_digest(e)) fail("artifact digest does not match the recorded proof and values");
}

// Caller holds mu_ (or is the constructor).
void Registry::commit(Event e){
    e.sequence = events_.size() + 1;
    e.recorded_at = clock_();
    if(!options_.journal_path.empty()){
        std::ofstream out(options_.journal_path, std::ios::app);
        out << event_to_json(e).dump() << '\n';
        out.flush();
        if(!out) throw Error(ErrorCode::JournalFailure, "cannot append to " + options_.journal_path);
    }
    apply(e);
    dbg(std::string("event ") + std::to_string(e.sequence) + " " + event_name(e.kind) + " by " + e.actor);
}

void Registry::apply(const Event& e){
    switch(e.kind){
        case EventKind::ModelAttested: {
            ModelAttestation m;
            m.model_hash = e.hash;
            m.version = e.version;
            m.timestamp = e.timestamp;
            m.attester = e.actor;
            m.artifact_digest = e.artifact_digest;
            m.verified = true;
            models_.emplace(fr_key(e.hash), m);
            break;
        }
        case EventKind::SignalAttested: {
            SignalAttestation s;
            s.signal_hash = e.hash;
            s.model_hash = e.model_hash;
            s.timestamp = e.timestamp;
            s.signal_type = e.signal_type;
            s.attester = e.actor;
            s.artifact_digest = e.artifact_digest;
            s.verified = true;
            signals_.emplace(fr_key(e.hash), s);
            break;
        }
        case EventKind::AttesterAuthorized:
            authorized_[e.subject] = e.authorized;
            break;
    }
    events_.push_back(e);
}

void Registry::require_authorized(const Principal& caller) const {
    auto it = authorized_.find(caller);
    if(it == authorized_.end() || !it->second)
        throw Error(ErrorCode::UnauthorizedAttester, "principal '" + caller + "' is not an authorized attester");
}

void Registry::require_fresh(uint64_t timestamp) const {
    const uint64_t now = clock_();
    if(timestamp > now)
        throw Error(ErrorCode::InvalidTimestamp, "timestamp " + std::to_string(timestamp) + " is in the future");
    if(now - timestamp > options_.staleness_bound_sec)
        throw Error(ErrorCode::InvalidTimestamp, "timestamp " + std::to_string(timestamp) + " is older than "
                    + std::to_string(options_.staleness_bound_sec) + "s");
}

void Registry::attest_model(const Principal& caller, const Proof& proof, const Fr& model_hash,
                            uint64_t version, uint64_t timestamp){
    std::lock_guard<std::mutex> lock(mu_);
    require_authorized(caller);
    if(models_.count(fr_key(model_hash)))
        throw Error(ErrorCode::ModelAlreadyAttested, "model " + fr_to_dec(model_hash) + " already attested");
    require_fresh(timestamp);

    Event e;
    e.kind = EventKind::ModelAttested;
    e.hash = model_hash;
    e.version = version;
    e.timestamp = timestamp;
    e.actor = caller;
    e.proof = proof;
    if(!verifier_.verify(Circuit::Model, proof, attested_inputs(e)))
        throw Error(ErrorCode::InvalidProof, "model proof rejected");
    e.artifact_digest = attested_digest(e);
    commit(e);
}

void Registry::attest_signal(const Principal& caller, const Proof& proof, const Fr& signal_hash,
                             const Fr& model_hash, int64_t signal_type, uint64_t timestamp){
    std::lock_guard<std::mutex> lock(mu_);
    require_authorized(caller);
    if(signal_type < kSignalTypeMin || signal_type > kSignalTypeMax)
        throw Error(ErrorCode::InvalidSignalType, "signal type " + std::to_string(signal_type) + " outside [1, 10]");
    if(!models_.count(fr_key(model_hash)))
        throw Error(ErrorCode::ModelNotFound, "model " + fr_to_dec(model_hash) + " has no attestation");
    if(signals_.count(fr_key(signal_hash)))
        throw Error(ErrorCode::SignalAlreadyAttested, "signal " + fr_to_dec(signal_hash) + " already attested");
    require_fresh(timestamp);

    Event e;
    e.kind = EventKind::SignalAttested;
    e.hash = signal_hash;
    e.model_hash = model_hash;
    e.signal_type = uint32_t(signal_type);
    e.timestamp = timestamp;
    e.actor = caller;
    e.proof = proof;
    if(!verifier_.verify(Circuit::Signal, proof, attested_inputs(e)))
        throw Error(ErrorCode::InvalidProof, "signal proof rejected");
    e.artifact_digest = attested_digest(e);
    commit(e);
}

ModelAttestation Registry::verify_model(const Fr& model_hash) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = models_.find(fr_key(model_hash));
    return it == models_.end() ? ModelAttestation() : it->second;
}

SignalAttestation Registry::verify_signal(const Fr& signal_hash) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = signals_.find(fr_key(signal_hash));
    return it == signals_.end() ? SignalAttestation() : it->second;
}

bool Registry::is_signal_linked_to_model(const Fr& signal_hash, const Fr& model_hash) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = signals_.find(fr_key(signal_hash));
    return it != signals_.end() && it->second.model_hash == model_hash;
}

void Registry::set_attester_authorization(const Principal& caller, const Principal& principal, bool authorized){
    std::lock_guard<std::mutex> lock(mu_);
    require_authorized(caller);
    if(principal.empty()) throw Error(ErrorCode::InvalidInput, "empty principal");
    Event e;
    e.kind = EventKind::AttesterAuthorized;
    e.actor = caller;
    e.subject = principal;
    e.authorized = authorized;
    commit(e);
}

bool Registry::is_authorized(const Principal& principal) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = authorized_.find(principal);
    return it != authorized_.end() && it->second;
}

std::vector<Event> Registry::events() const {
    std::lock_guard<std::mutex> lock(mu_);
    return events_;
}

std::vector<uint64_t> Registry::reverify() const {
    std::lock_guard<std::mutex> lock(mu_);
    std::vector<uint64_t> failed;
    for(const Event& e: events_){
        if(e.kind == EventKind::AttesterAuthorized) continue;
        if(!verifier_.verify(attested_circuit(e), e.proof, attested_inputs(e))) failed.push_back(e.sequence);
    }
    dbg("reverify: " + std::to_string(failed.size()) + " attestation(s) rejected");
    return failed;
}

RegistryStats Registry::stats() const {
    std::lock_guard<std::mutex> lock(mu_);
    RegistryStats s;
    s.models = models_.size();
    s.signals = signals_.size();
    for(const auto& kv: authorized_) if(kv.second) ++s.authorized;
    s.events = events_.size();
    return s;
}

} // namespace zkattest
