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

#include "serialize.hpp"
#include "error.hpp"
#include "log.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>

namespace zkattest {

// ------------------------------------------------------------------ points
static std::string hex(const G1& P){ return g1_to_hex(P); }
static std::string hex(const G2& Q){ return g2_to_hex(Q); }
static void from_hex(const ordered_json& j, G1& P){ P = g1_from_hex(j.get<std::string>()); }
static void from_hex(const ordered_json& j, G2& Q){ Q = g2_from_hex(j.get<std::string>()); }

template<class P>
static ordered_json points_to_json(const std::vector<P>& v){
    ordered_json a = ordered_json::array();
    for(const auto& x: v) a.push_back(hex(x));
    return a;
}

template<class P>
static std::vector<P> points_from_json(const ordered_json& a){
    if(!a.is_array()) throw Error(ErrorCode::InvalidInput, "expected an array of points");
    std::vector<P> v(a.size());
    for(size_t i=0;i<a.size();i++) from_hex(a[i], v[i]);
    return v;
}

static ordered_json frs_to_json(const std::vector<Fr>& v){
    ordered_json a = ordered_json::array();
    for(const auto& x: v) a.push_back(fr_to_dec(x));
    return a;
}

static std::vector<Fr> frs_from_json(const ordered_json& a){
    if(!a.is_array()) throw Error(ErrorCode::InvalidInput, "expected an array of field elements");
    std::vector<Fr> v;
    for(const auto& x: a) v.push_back(fr_from_dec(x.get<std::string>()));
    return v;
}

// Runs f, mapping JSON access errors onto an Error with the given code.
template<class F>
static auto guarded(ErrorCode code, const char* what, F f) -> decltype(f()) {
    try{
        return f();
    }catch(const nlohmann::json::exception& e){
        throw Error(code, std::string(what) + ": " + e.what());
    }
}

// ------------------------------------------------------------------- proofs
ordered_json proof_to_json(const Proof& p){
    ordered_json j;
    j["protocol"] = "groth16";
    j["curve"] = "bn254";
    j["pi_a"] = hex(p.a);
    j["pi_b"] = hex(p.b);
    j["pi_c"] = hex(p.c);
    return j;
}

Proof proof_from_json(const ordered_json& j){
    return guarded(ErrorCode::InvalidInput, "proof", [&]{
        if(j.contains("protocol") && j.at("protocol").get<std::string>() != "groth16")
            throw Error(ErrorCode::InvalidInput, "proof: unsupported protocol");
        Proof p;
        from_hex(j.at("pi_a"), p.a);
        from_hex(j.at("pi_b"), p.b);
        from_hex(j.at("pi_c"), p.c);
        return p;
    });
}

ordered_json artifact_to_json(const ProofArtifact& a){
    ordered_json j;
    j["circuit"] = circuit_id(a.circuit);
    j["proof"] = proof_to_json(a.proof);
    j["publicSignals"] = frs_to_json(a.public_signals);
    return j;
}

ProofArtifact artifact_from_json(const ordered_json& j){
    return guarded(ErrorCode::InvalidInput, "proof artifact", [&]{
        ProofArtifact a;
        std::string c = j.at("circuit").get<std::string>();
        if(!parse_circuit(c, a.circuit)) throw Error(ErrorCode::InvalidInput, "proof artifact: unknown circuit '" + c + "'");
        a.proof = proof_from_json(j.at("proof"));
        a.public_signals = frs_from_json(j.at("publicSignals"));
        return a;
    });
}

std::string artifact_digest(const ProofArtifact& a){
    return sha256_hex(artifact_to_json(a).dump());
}

ordered_json model_proof_to_json(const ModelProof& p){
    ordered_json j = artifact_to_json(p.artifact);
    j["modelHash"] = fr_to_dec(p.model_hash);
    j["timestamp"] = p.timestamp;
    j["version"] = p.version;
    return j;
}

ModelProof model_proof_from_json(const ordered_json& j){
    return guarded(ErrorCode::InvalidInput, "model proof", [&]{
        ModelProof p;
        p.artifact = artifact_from_json(j);
        if(p.artifact.circuit != Circuit::Model) throw Error(ErrorCode::InvalidInput, "model proof: wrong circuit");
        p.model_hash = fr_from_dec(j.at("modelHash").get<std::string>());
        p.timestamp = j.at("timestamp").get<uint64_t>();
        p.version = j.at("version").get<uint64_t>();
        const auto& ps = p.artifact.public_signals;
        if(ps.size() != public_signal_count(Circuit::Model) || !(ps[0] == p.model_hash)
           || !(ps[1] == fr_from_u64(p.version)) || !(ps[2] == fr_from_u64(p.timestamp)))
            throw Error(ErrorCode::InvalidInput, "model proof: modelHash/version/timestamp differ from publicSignals");
        return p;
    });
}

ordered_json signal_proof_to_json(const SignalProof& p){
    ordered_json j = artifact_to_json(p.artifact);
    j["signalHash"] = fr_to_dec(p.signal_hash);
    j["isValid"] = p.is_valid;
    j["timestamp"] = p.timestamp;
    j["signalType"] = p.signal_type;
    return j;
}

SignalProof signal_proof_from_json(const ordered_json& j){
    return guarded(ErrorCode::InvalidInput, "signal proof", [&]{
        SignalProof p;
        p.artifact = artifact_from_json(j);
        if(p.artifact.circuit != Circuit::Signal) throw Error(ErrorCode::InvalidInput, "signal proof: wrong circuit");
        p.signal_hash = fr_from_dec(j.at("signalHash").get<std::string>());
        p.is_valid = j.at("isValid").get<bool>();
        p.timestamp = j.at("timestamp").get<uint64_t>();
        p.signal_type = j.at("signalType").get<uint32_t>();
        const auto& ps = p.artifact.public_signals;
        if(ps.size() != public_signal_count(Circuit::Signal) || !(ps[0] == p.signal_hash)
           || !(ps[1] == Fr(p.is_valid ? 1 : 0)) || !(ps[3] == fr_from_u64(p.timestamp)))
            throw Error(ErrorCode::InvalidInput, "signal proof: signalHash/isValid/timestamp differ from publicSignals");
        return p;
    });
}

ordered_json composite_proof_to_json(const CompositeProof& p){
    ordered_json j;
    j["modelProof"] = model_proof_to_json(p.model);
    j["signalProof"] = signal_proof_to_json(p.signal);
    j["linkage"]["modelHash"] = fr_to_dec(p.linkage.model_hash);
    j["linkage"]["signalHash"] = fr_to_dec(p.linkage.signal_hash);
    j["linkage"]["timestamp"] = p.linkage.timestamp;
    return j;
}

CompositeProof composite_proof_from_json(const ordered_json& j){
    return guarded(ErrorCode::InvalidInput, "composite proof", [&]{
        CompositeProof p;
        p.model = model_proof_from_json(j.at("modelProof"));
        p.signal = signal_proof_from_json(j.at("signalProof"));
        const auto& l = j.at("linkage");
        p.linkage.model_hash = fr_from_dec(l.at("modelHash").get<std::string>());
        p.linkage.signal_hash = fr_from_dec(l.at("signalHash").get<std::string>());
        p.linkage.timestamp = l.at("timestamp").get<uint64_t>();
        // the signal proof must commit to the model proven alongside it
        if(!(p.signal.artifact.public_signals[2] == p.model.model_hash))
            throw Error(ErrorCode::InvalidInput, "composite proof: signal proof is bound to a different model");
        if(!(p.linkage.model_hash == p.model.model_hash) || !(p.linkage.signal_hash == p.signal.signal_hash)
           || p.linkage.timestamp != std::max(p.model.timestamp, p.signal.timestamp))
            throw Error(ErrorCode::InvalidInput, "composite proof: linkage differs from the proofs");
        return p;
    });
}

// --------------------------------------------------------------------- keys
ordered_json vk_to_json(const VerificationKey& vk){
    ordered_json j;
    j["protocol"] = "groth16";
    j["curve"] = "bn254";
    j["circuit"] = vk.circuit_id;
    j["circuitVersion"] = vk.circuit_version;
    j["circuitDigest"] = vk.circuit_digest;
    j["nPublic"] = vk.num_public();
    j["vk_alpha_1"] = hex(vk.alpha_g1);
    j["vk_beta_2"] = hex(vk.beta_g2);
    j["vk_gamma_2"] = hex(vk.gamma_g2);
    j["vk_delta_2"] = hex(vk.delta_g2);
    j["IC"] = points_to_json(vk.ic);
    return j;
}

VerificationKey vk_from_json(const ordered_json& j){
    return guarded(ErrorCode::InvalidInput, "verification key", [&]{
        VerificationKey vk;
        vk.circuit_id = j.at("circuit").get<std::string>();
        vk.circuit_version = j.at("circuitVersion").get<uint32_t>();
        vk.circuit_digest = j.at("circuitDigest").get<std::string>();
        from_hex(j.at("vk_alpha_1"), vk.alpha_g1);
        from_hex(j.at("vk_beta_2"), vk.beta_g2);
        from_hex(j.at("vk_gamma_2"), vk.gamma_g2);
        from_hex(j.at("vk_delta_2"), vk.delta_g2);
        vk.ic = points_from_json<G1>(j.at("IC"));
        if(vk.num_public() != j.at("nPublic").get<size_t>())
            throw Error(ErrorCode::InvalidInput, "verification key: IC size does not match nPublic");
        return vk;
    });
}

static ordered_json pok_to_json(const KnowledgeProof& p){
    ordered_json j;
    j["s"] = hex(p.s);
    j["s_x"] = hex(p.s_x);
    j["r_x"] = hex(p.r_x);
    return j;
}

static KnowledgeProof pok_from_json(const ordered_json& j){
    KnowledgeProof p;
    from_hex(j.at("s"), p.s);
    from_hex(j.at("s_x"), p.s_x);
    from_hex(j.at("r_x"), p.r_x);
    return p;
}

ordered_json keys_to_json(const CircuitKeys& k){
    const ProvingKey& pk = k.pk;
    ordered_json j;
    j["protocol"] = "groth16";
    j["curve"] = "bn254";
    j["circuit"] = pk.circuit_id;
    j["circuitVersion"] = pk.circuit_version;
    j["circuitDigest"] = pk.circuit_digest;
    j["transcriptHash"] = k.transcript_hash;
    j["domainSize"] = pk.domain_size;
    j["nVars"] = pk.num_variables;
    j["nPublic"] = pk.num_public;
    j["alpha_1"] = hex(pk.alpha_g1);
    j["beta_1"] = hex(pk.beta_g1);
    j["delta_1"] = hex(pk.delta_g1);
    j["beta_2"] = hex(pk.beta_g2);
    j["delta_2"] = hex(pk.delta_g2);
    j["A"] = points_to_json(pk.a_query);
    j["B1"] = points_to_json(pk.b_g1_query);
    j["B2"] = points_to_json(pk.b_g2_query);
    j["L"] = points_to_json(pk.l_query);
    j["H"] = points_to_json(pk.h_query);
    j["vk"] = vk_to_json(pk.vk);
    ordered_json cs = ordered_json::array();
    for(const auto& c: k.contributions){
        ordered_json e;
        e["name"] = c.name;
        e["prevHash"] = c.prev_hash;
        e["hash"] = c.hash;
        e["delta_1"] = hex(c.delta_g1);
        e["pok"] = pok_to_json(c.pok);
        cs.push_back(e);
    }
    j["contributions"] = cs;
    return j;
}

CircuitKeys keys_from_json(const ordered_json& j){
    return guarded(ErrorCode::InvalidInput, "proving key", [&]{
        CircuitKeys k;
        ProvingKey& pk = k.pk;
        pk.circuit_id = j.at("circuit").get<std::string>();
        pk.circuit_version = j.at("circuitVersion").get<uint32_t>();
        pk.circuit_digest = j.at("circuitDigest").get<std::string>();
        k.transcript_hash = j.at("transcriptHash").get<std::string>();
        pk.domain_size = j.at("domainSize").get<size_t>();
        pk.num_variables = j.at("nVars").get<size_t>();
        pk.num_public = j.at("nPublic").get<size_t>();
        from_hex(j.at("alpha_1"), pk.alpha_g1);
        from_hex(j.at("beta_1"), pk.beta_g1);
        from_hex(j.at("delta_1"), pk.delta_g1);
        from_hex(j.at("beta_2"), pk.beta_g2);
        from_hex(j.at("delta_2"), pk.delta_g2);
        pk.a_query = points_from_json<G1>(j.at("A"));
        pk.b_g1_query = points_from_json<G1>(j.at("B1"));
        pk.b_g2_query = points_from_json<G2>(j.at("B2"));
        pk.l_query = points_from_json<G1>(j.at("L"));
        pk.h_query = points_from_json<G1>(j.at("H"));
        pk.vk = vk_from_json(j.at("vk"));
        for(const auto& e: j.at("contributions")){
            DeltaContribution c;
            c.name = e.at("name").get<std::string>();
            c.prev_hash = e.at("prevHash").get<std::string>();
            c.hash = e.at("hash").get<std::string>();
            from_hex(e.at("delta_1"), c.delta_g1);
            c.pok = pok_from_json(e.at("pok"));
            k.contributions.push_back(c);
        }
        const size_t nv = pk.num_variables;
        if(pk.a_query.size() != nv || pk.b_g1_query.size() != nv || pk.b_g2_query.size() != nv
           || pk.l_query.size() + pk.num_public + 1 != nv || pk.domain_size < 2 || pk.h_query.size() + 1 != pk.domain_size
           || pk.vk.num_public() != pk.num_public)
            throw Error(ErrorCode::InvalidInput, "proving key: query sizes are inconsistent");
        return k;
    });
}

ordered_json transcript_to_json(const PowersOfTau& t){
    ordered_json j;
    j["protocol"] = "powersoftau";
    j["curve"] = "bn254";
    j["power"] = t.power;
    j["tauG1"] = points_to_json(t.tau_g1);
    j["tauG2"] = points_to_json(t.tau_g2);
    j["alphaTauG1"] = points_to_json(t.alpha_tau_g1);
    j["betaTauG1"] = points_to_json(t.beta_tau_g1);
    j["betaG2"] = hex(t.beta_g2);
    ordered_json cs = ordered_json::array();
    for(const auto& c: t.contributions){
        ordered_json e;
        e["name"] = c.name;
        e["prevHash"] = c.prev_hash;
        e["hash"] = c.hash;
        e["tauG1"] = hex(c.tau_g1);
        e["alphaG1"] = hex(c.alpha_g1);
        e["betaG1"] = hex(c.beta_g1);
        e["tauPok"] = pok_to_json(c.tau_pok);
        e["alphaPok"] = pok_to_json(c.alpha_pok);
        e["betaPok"] = pok_to_json(c.beta_pok);
        cs.push_back(e);
    }
    j["contributions"] = cs;
    return j;
}

PowersOfTau transcript_from_json(const ordered_json& j){
    return guarded(ErrorCode::InvalidInput, "transcript", [&]{
        PowersOfTau t;
        t.power = j.at("power").get<uint32_t>();
        t.tau_g1 = points_from_json<G1>(j.at("tauG1"));
        t.tau_g2 = points_from_json<G2>(j.at("tauG2"));
        t.alpha_tau_g1 = points_from_json<G1>(j.at("alphaTauG1"));
        t.beta_tau_g1 = points_from_json<G1>(j.at("betaTauG1"));
        from_hex(j.at("betaG2"), t.beta_g2);
        for(const auto& e: j.at("contributions")){
            Contribution c;
            c.name = e.at("name").get<std::string>();
            c.prev_hash = e.at("prevHash").get<std::string>();
            c.hash = e.at("hash").get<std::string>();
            from_hex(e.at("tauG1"), c.tau_g1);
            from_hex(e.at("alphaG1"), c.alpha_g1);
            from_hex(e.at("betaG1"), c.beta_g1);
            c.tau_pok = pok_from_json(e.at("tauPok"));
            c.alpha_pok = pok_from_json(e.at("alphaPok"));
            c.beta_pok = pok_from_json(e.at("betaPok"));
            t.contributions.push_back(c);
        }
        return t;
    });
}

// ------------------------------------------------------------------ records
ordered_json model_record_to_json(const ModelAttestation& m){
    ordered_json j;
    j["modelHash"] = fr_to_dec(m.model_hash);
    j["version"] = m.version;
    j["timestamp"] = m.timestamp;
    j["attester"] = m.attester;
    j["artifactDigest"] = m.artifact_digest;
    j["verified"] = m.verified;
    return j;
}

ordered_json signal_record_to_json(const SignalAttestation& s){
    ordered_json j;
    j["signalHash"] = fr_to_dec(s.signal_hash);
    j["modelHash"] = fr_to_dec(s.model_hash);
    j["timestamp"] = s.timestamp;
    j["signalType"] = s.signal_type;
    j["attester"] = s.attester;
    j["artifactDigest"] = s.artifact_digest;
    j["verified"] = s.verified;
    return j;
}

ordered_json event_to_json(const Event& e){
    ordered_json j;
    j["seq"] = e.sequence;
    j["event"] = event_name(e.kind);
    j["actor"] = e.actor;
    switch(e.kind){
        case EventKind::ModelAttested:
            j["modelHash"] = fr_to_dec(e.hash);
            j["version"] = e.version;
            j["timestamp"] = e.timestamp;
            break;
        case EventKind::SignalAttested:
            j["signalHash"] = fr_to_dec(e.hash);
            j["modelHash"] = fr_to_dec(e.model_hash);
            j["signalType"] = e.signal_type;
            j["timestamp"] = e.timestamp;
            break;
        case EventKind::AttesterAuthorized:
            j["principal"] = e.subject;
            j["authorized"] = e.authorized;
            break;
    }
    if(e.kind != EventKind::AttesterAuthorized){
        j["proof"] = proof_to_json(e.proof);
        j["artifactDigest"] = e.artifact_digest;
    }
    j["recordedAt"] = e.recorded_at;
    return j;
}

Event event_from_json(const ordered_json& j){
    return guarded(ErrorCode::InvalidInput, "event", [&]{
        Event e;
        e.sequence = j.at("seq").get<uint64_t>();
        std::string kind = j.at("event").get<std::string>();
        if(!parse_event_kind(kind, e.kind)) throw Error(ErrorCode::InvalidInput, "event: unknown kind '" + kind + "'");
        e.actor = j.at("actor").get<std::string>();
        switch(e.kind){
            case EventKind::ModelAttested:
                e.hash = fr_from_dec(j.at("modelHash").get<std::string>());
                e.version = j.at("version").get<uint64_t>();
                e.timestamp = j.at("timestamp").get<uint64_t>();
                break;
            case EventKind::SignalAttested:
                e.hash = fr_from_dec(j.at("signalHash").get<std::string>());
                e.model_hash = fr_from_dec(j.at("modelHash").get<std::string>());
                e.signal_type = j.at("signalType").get<uint32_t>();
                e.timestamp = j.at("timestamp").get<uint64_t>();
                break;
            case EventKind::AttesterAuthorized:
                e.subject = j.at("principal").get<std::string>();
                e.authorized = j.at("authorized").get<bool>();
                break;
        }
        if(e.kind != EventKind::AttesterAuthorized){
            e.proof = proof_from_json(j.at("proof"));
            e.artifact_digest = j.at("artifactDigest").get<std::string>();
        }
        e.recorded_at = j.at("recordedAt").get<uint64_t>();
        return e;
    });
}

// -------------------------------------------------------------------- files
std::string read_file(const std::string& path){
    std::ifstream f(path, std::ios::binary);
    if(!f) throw Error(ErrorCode::InvalidInput, "cannot open " + path);
    std::ostringstream ss; ss<<f.rdbuf();
    return ss.str();
}

void write_file(const std::string& path, const std::string& data){
    std::ofstream f(path, std::ios::binary);
    if(!f) throw Error(ErrorCode::InvalidInput, "cannot open " + path + " for writing");
    f<<data;
    if(!f) throw Error(ErrorCode::InvalidInput, "write to " + path + " failed");
}

ordered_json load_json(const std::string& path){
    std::string s = read_file(path);
    try{
        return ordered_json::parse(s);
    }catch(const nlohmann::json::parse_error& e){
        throw Error(ErrorCode::InvalidInput, path + ": " + e.what());
    }
}

void save_json(const std::string& path, const ordered_json& j){
    write_file(path, j.dump(2) + "\n");
    dbg("wrote " + path);
}

PowersOfTau load_transcript(const std::string& path){
    try{
        return transcript_from_json(load_json(path));
    }catch(const Error& e){
        throw Error(ErrorCode::SetupFailure, "transcript " + path + ": " + e.what());
    }
}

void save_transcript(const std::string& path, const PowersOfTau& t){
    save_json(path, transcript_to_json(t));
}

std::string key_path(const std::string& key_dir, Circuit c, const char* kind){
    std::string dir = key_dir.empty() ? "." : key_dir;
    if(dir.back() != '/') dir += '/';
    return dir + circuit_name(c) + "." + kind + ".json";
}

CircuitKeys load_keys(const std::string& key_dir, Circuit c){
    std::string path = key_path(key_dir, c, "pk");
    try{
        return keys_from_json(load_json(path));
    }catch(const Error& e){
        throw Error(ErrorCode::SetupFailure, "proving key " + path + ": " + e.what());
    }
}

VerificationKey load_vk(const std::string& key_dir, Circuit c){
    std::string path = key_path(key_dir, c, "vk");
    try{
        return vk_from_json(load_json(path));
    }catch(const Error& e){
        throw Error(ErrorCode::SetupFailure, "verification key " + path + ": " + e.what());
    }
}

void save_keys(const std::string& key_dir, Circuit c, const CircuitKeys& keys){
    save_json(key_path(key_dir, c, "pk"), keys_to_json(keys));
    save_json(key_path(key_dir, c, "vk"), vk_to_json(keys.pk.vk));
}

} // namespace zkattest
