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

// zkattest.cpp
//
// CLI for zero-knowledge signal attestation: trusted setup, off-chain proof
// generation, local verification and the attestation registry.
//
// BUILD
// -----
// Dependencies:
//   - Herumi mcl (BN254)       https://github.com/herumi/mcl
//   - OpenSSL (SHA-256 EVP, RAND_bytes)
//   - nlohmann/json
//
//   cmake -S . -B build && cmake --build build
//
// USAGE
// -----
// setup
//   ./zkattest -t <power> <out.ptau>
//   ./zkattest -x <in.ptau> <out.ptau> [--name N] [--entropy E]
//   ./zkattest -X <in.ptau>
//   ./zkattest -k <model|signal> <in.ptau> [keydir] [--name N] [--entropy E]
//   ./zkattest -K <model|signal> <in.ptau> [keydir]
// proving
//   ./zkattest -p model <weights.json> --version V [--timestamp T] [--out F]
//   ./zkattest -p signal --type T --confidence C --model-hash H [--timestamp T] [--out F]
//   ./zkattest -p composite <weights.json> --version V --type T --confidence C [--timestamp T] [--out F]
//   ./zkattest -v <proof.json>
// registry
//   ./zkattest -a <proof.json> --caller P
//   ./zkattest -g <principal> --caller P [--revoke]
//   ./zkattest -q <model|signal> <hash>
//   ./zkattest -l <signalHash> <modelHash>
//   ./zkattest -s
//   ./zkattest -e [--verify]
// global
//   --config FILE  --keys DIR  --debug
//
// -----------------------------------------------------------------------------

#include "zkattest/ceremony.hpp"
#include "zkattest/circuits.hpp"
#include "zkattest/config.hpp"
#include "zkattest/error.hpp"
#include "zkattest/log.hpp"
#include "zkattest/prover.hpp"
#include "zkattest/registry.hpp"
#include "zkattest/serialize.hpp"
#include "zkattest/verifier.hpp"

#include <cstdio>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

using namespace zkattest;

// ------------------------------------------------------------------ args
struct Args {
    std::vector<std::string> pos;
    std::map<std::string, std::string> opts;

    bool has(const std::string& k) const { return opts.count(k) != 0; }
    std::string get(const std::string& k, const std::string& def = "") const {
        auto it = opts.find(k);
        return it==opts.end() ? def : it->second;
    }
    std::string need(const std::string& k) const {
        auto it = opts.find(k);
        if(it==opts.end()) throw Error(ErrorCode::InvalidInput, "missing --" + k);
        return it->second;
    }
};

static Args parse_args(int argc, char** argv, int from){
    static const char* switches[] = {"debug", "revoke", "verify"};
    Args a;
    for(int i=from;i<argc;i++){
        std::string s = argv[i];
        if(s.size()>2 && s.compare(0, 2, "--")==0){
            std::string k = s.substr(2);
            bool flag = false;
            for(const char* sw: switches) if(k==sw) flag = true;
            if(flag || i+1>=argc) a.opts[k] = "1";
            else a.opts[k] = argv[++i];
        } else {
            a.pos.push_back(s);
        }
    }
    return a;
}

static uint64_t to_u64(const std::string& s, const char* what){
    if(s.empty() || s.find_first_not_of("0123456789") != std::string::npos)
        throw Error(ErrorCode::InvalidInput, std::string(what) + " must be a non-negative integer: " + s);
    return std::stoull(s);
}

static int64_t to_i64(const std::string& s, const char* what){
    size_t used = 0;
    int64_t v = 0;
    try{ v = std::stoll(s, &used); }
    catch(const std::logic_error&){ throw Error(ErrorCode::InvalidInput, std::string(what) + " must be an integer: " + s); }
    if(used != s.size()) throw Error(ErrorCode::InvalidInput, std::string(what) + " must be an integer: " + s);
    return v;
}

static Circuit to_circuit(const std::string& s){
    Circuit c;
    if(!parse_circuit(s, c)) throw Error(ErrorCode::InvalidInput, "unknown circuit '" + s + "' (model|signal)");
    return c;
}

static void emit(const ordered_json& j, const Args& a){
    if(a.has("out")){
        save_json(a.get("out"), j);
        printf("Wrote %s\n", a.get("out").c_str());
    } else {
        printf("%s\n", j.dump(2).c_str());
    }
}

// Verifier for registry commands that never check proofs.
struct NoProofVerifier : ProofVerifier {
    bool verify(Circuit, const Proof&, const std::vector<Fr>&) const override { return false; }
};

static RegistryOptions registry_options(const Config& cfg){
    RegistryOptions o;
    o.staleness_bound_sec = cfg.staleness_bound_sec;
    o.journal_path = cfg.journal;
    return o;
}

// ------------------------------------------------------------------ setup
static int cmd_new_transcript(const Args& a){
    if(a.pos.size() < 2){ fprintf(stderr, "Usage: ./zkattest -t <power> <out.ptau>\n"); return 1; }
    uint64_t power = to_u64(a.pos[0], "power");
    PowersOfTau t = new_transcript(uint32_t(power));
    save_transcript(a.pos[1], t);
    printf("Transcript: power %u (%zu points), no contributions yet -> %s\n",
           t.power, t.domain_size(), a.pos[1].c_str());
    return 0;
}

static int cmd_contribute(const Args& a){
    if(a.pos.size() < 2){ fprintf(stderr, "Usage: ./zkattest -x <in.ptau> <out.ptau> [--name N] [--entropy E]\n"); return 1; }
    PowersOfTau t = load_transcript(a.pos[0]);
    contribute(t, a.get("name", "anonymous"), a.get("entropy"));
    save_transcript(a.pos[1], t);
    printf("Contribution #%zu: %s\n", t.contributions.size(), t.contributions.back().hash.c_str());
    return 0;
}

static int cmd_verify_transcript(const Args& a){
    if(a.pos.empty()){ fprintf(stderr, "Usage: ./zkattest -X <in.ptau>\n"); return 1; }
    PowersOfTau t = load_transcript(a.pos[0]);
    try{
        verify_transcript(t);
    }catch(const Error& e){
        if(e.code() != ErrorCode::SetupFailure) throw;
        fprintf(stderr, "Transcript: REJECT (%s)\n", e.what());
        return 1;
    }
    printf("Transcript: ACCEPT (power %u, %zu contribution(s))\n", t.power, t.contributions.size());
    for(const auto& c: t.contributions) printf("  %s  %s\n", c.hash.c_str(), c.name.c_str());
    return 0;
}

static int cmd_setup_keys(const Args& a, Config cfg){
    if(a.pos.size() < 2){ fprintf(stderr, "Usage: ./zkattest -k <model|signal> <in.ptau> [keydir] [--name N] [--entropy E]\n"); return 1; }
    Circuit c = to_circuit(a.pos[0]);
    if(a.pos.size() > 2) cfg.key_dir = a.pos[2];
    PowersOfTau t = load_transcript(a.pos[1]);
    CircuitKeys keys = setup_circuit(t, compiled_circuit(c));
    contribute_delta(keys, a.get("name", "anonymous"), a.get("entropy"));
    std::filesystem::create_directories(cfg.key_dir);
    save_keys(cfg.key_dir, c, keys);
    printf("Keys: %s digest %s -> %s, %s\n", keys.pk.circuit_id.c_str(), keys.pk.circuit_digest.c_str(),
           key_path(cfg.key_dir, c, "pk").c_str(), key_path(cfg.key_dir, c, "vk").c_str());
    return 0;
}

static int cmd_verify_keys(const Args& a, Config cfg){
    if(a.pos.size() < 2){ fprintf(stderr, "Usage: ./zkattest -K <model|signal> <in.ptau> [keydir]\n"); return 1; }
    Circuit c = to_circuit(a.pos[0]);
    if(a.pos.size() > 2) cfg.key_dir = a.pos[2];
    PowersOfTau t = load_transcript(a.pos[1]);
    CircuitKeys keys = load_keys(cfg.key_dir, c);
    try{
        verify_circuit_keys(keys, t, compiled_circuit(c));
        if(!(load_vk(cfg.key_dir, c).delta_g2 == keys.pk.delta_g2))
            throw Error(ErrorCode::SetupFailure, "exported verification key does not match the proving key");
    }catch(const Error& e){
        if(e.code() != ErrorCode::SetupFailure) throw;
        fprintf(stderr, "Keys: REJECT (%s)\n", e.what());
        return 1;
    }
    printf("Keys: ACCEPT (%s, %zu delta contribution(s))\n", keys.pk.circuit_id.c_str(), keys.contributions.size());
    return 0;
}

// ---------------------------------------------------------------- proving
static std::vector<double> load_weights(const std::string& path){
    ordered_json j = load_json(path);
    const ordered_json& arr = j.is_object() && j.contains("weights") ? j.at("weights") : j;
    if(!arr.is_array()) throw Error(ErrorCode::InvalidInput, path + ": expected an array of weights");
    std::vector<double> w;
    for(const auto& x: arr){
        if(!x.is_number()) throw Error(ErrorCode::InvalidInput, path + ": weights must be numbers");
        w.push_back(x.get<double>());
    }
    return w;
}

static int cmd_prove(const Args& a, const Config& cfg){
    if(a.pos.empty()){ fprintf(stderr, "Usage: ./zkattest -p <model|signal|composite> ...\n"); return 1; }
    const std::string kind = a.pos[0];
    const uint64_t ts = a.has("timestamp") ? to_u64(a.get("timestamp"), "timestamp") : system_clock_seconds();
    SignalProver prover = SignalProver::load(cfg.key_dir);

    ModelInput mi;
    SignalInput si;
    if(kind=="model" || kind=="composite"){
        if(a.pos.size() < 2){ fprintf(stderr, "Usage: ./zkattest -p %s <weights.json> --version V ...\n", kind.c_str()); return 1; }
        mi.weights = load_weights(a.pos[1]);
        mi.version = to_u64(a.need("version"), "version");
        mi.timestamp = ts;
    }
    if(kind=="signal" || kind=="composite"){
        si.signal_type = to_i64(a.need("type"), "type");
        si.confidence = to_i64(a.need("confidence"), "confidence");
        if(kind=="signal") si.model_hash = fr_from_dec(a.need("model-hash"));
        si.timestamp = ts;
    }

    if(kind=="model"){
        ModelProof p = prover.generate_model_proof(mi);
        dbg("artifact digest " + artifact_digest(p.artifact));
        emit(model_proof_to_json(p), a);
    } else if(kind=="signal"){
        SignalProof p = prover.generate_signal_proof(si);
        dbg("artifact digest " + artifact_digest(p.artifact));
        emit(signal_proof_to_json(p), a);
    } else if(kind=="composite"){
        emit(composite_proof_to_json(prover.generate_composite_proof(mi, si)), a);
    } else {
        fprintf(stderr, "Unknown proof kind: %s\n", kind.c_str());
        return 1;
    }
    return 0;
}

static int cmd_verify(const Args& a, const Config& cfg){
    if(a.pos.empty()){ fprintf(stderr, "Usage: ./zkattest -v <proof.json>\n"); return 1; }
    ordered_json j = load_json(a.pos[0]);
    Groth16Verifier verifier = Groth16Verifier::load(cfg.key_dir);

    std::vector<ProofArtifact> arts;
    if(j.contains("modelProof")){
        CompositeProof c = composite_proof_from_json(j);
        if(!(c.model.artifact.public_signals.at(0) == c.signal.artifact.public_signals.at(2))){
            fprintf(stderr, "Verify: REJECT (signal proof is not linked to the model proof)\n");
            return 1;
        }
        arts = {c.model.artifact, c.signal.artifact};
    } else {
        arts = {artifact_from_json(j)};
    }
    for(const auto& art: arts){
        if(!verifier.verify(art.circuit, art.proof, art.public_signals)){
            fprintf(stderr, "Verify: REJECT (%s proof)\n", circuit_id(art.circuit));
            return 1;
        }
        printf("%s: %s\n", circuit_id(art.circuit), artifact_digest(art).c_str());
    }
    printf("Verify: ACCEPT\n");
    return 0;
}

// --------------------------------------------------------------- registry
static void attest_artifact(Registry& reg, const std::string& caller, const ordered_json& j){
    if(j.contains("modelProof")){
        CompositeProof c = composite_proof_from_json(j);
        if(!reg.verify_model(c.model.artifact.public_signals.at(0)).verified)
            attest_artifact(reg, caller, j.at("modelProof"));
        attest_artifact(reg, caller, j.at("signalProof"));
        return;
    }
    ProofArtifact art = artifact_from_json(j);
    const auto& ps = art.public_signals;
    if(ps.size() != public_signal_count(art.circuit))
        throw Error(ErrorCode::InvalidInput, "wrong number of public signals for " + std::string(circuit_id(art.circuit)));
    uint64_t version = 0, ts = 0;
    if(art.circuit == Circuit::Model){
        if(!fr_to_u64(ps[1], version) || !fr_to_u64(ps[2], ts))
            throw Error(ErrorCode::InvalidInput, "model public signals out of range");
        reg.attest_model(caller, art.proof, ps[0], version, ts);
        printf("Attest: ACCEPT model %s\n", fr_to_dec(ps[0]).c_str());
    } else {
        if(!fr_to_u64(ps[3], ts)) throw Error(ErrorCode::InvalidInput, "signal timestamp out of range");
        int64_t type = j.at("signalType").get<int64_t>();
        reg.attest_signal(caller, art.proof, ps[0], ps[2], type, ts);
        printf("Attest: ACCEPT signal %s -> model %s\n", fr_to_dec(ps[0]).c_str(), fr_to_dec(ps[2]).c_str());
    }
}

static int cmd_attest(const Args& a, const Config& cfg){
    if(a.pos.empty()){ fprintf(stderr, "Usage: ./zkattest -a <proof.json> --caller P\n"); return 1; }
    ordered_json j = load_json(a.pos[0]);
    Groth16Verifier verifier = Groth16Verifier::load(cfg.key_dir);
    Registry reg(verifier, cfg.deployer, registry_options(cfg));
    try{
        attest_artifact(reg, a.need("caller"), j);
    }catch(const nlohmann::json::exception& e){
        throw Error(ErrorCode::InvalidInput, a.pos[0] + ": " + e.what());
    }
    return 0;
}

static int cmd_authorize(const Args& a, const Config& cfg){
    if(a.pos.empty()){ fprintf(stderr, "Usage: ./zkattest -g <principal> --caller P [--revoke]\n"); return 1; }
    NoProofVerifier none;
    Registry reg(none, cfg.deployer, registry_options(cfg));
    bool grant = !a.has("revoke");
    reg.set_attester_authorization(a.need("caller"), a.pos[0], grant);
    printf("Authorization: %s %s\n", a.pos[0].c_str(), grant ? "granted" : "revoked");
    return 0;
}

static int cmd_query(const Args& a, const Config& cfg){
    if(a.pos.size() < 2){ fprintf(stderr, "Usage: ./zkattest -q <model|signal> <hash>\n"); return 1; }
    NoProofVerifier none;
    Registry reg(none, cfg.deployer, registry_options(cfg));
    Fr h = fr_from_dec(a.pos[1]);
    if(to_circuit(a.pos[0]) == Circuit::Model) printf("%s\n", model_record_to_json(reg.verify_model(h)).dump(2).c_str());
    else printf("%s\n", signal_record_to_json(reg.verify_signal(h)).dump(2).c_str());
    return 0;
}

static int cmd_linked(const Args& a, const Config& cfg){
    if(a.pos.size() < 2){ fprintf(stderr, "Usage: ./zkattest -l <signalHash> <modelHash>\n"); return 1; }
    NoProofVerifier none;
    Registry reg(none, cfg.deployer, registry_options(cfg));
    bool linked = reg.is_signal_linked_to_model(fr_from_dec(a.pos[0]), fr_from_dec(a.pos[1]));
    printf("linked: %s\n", linked ? "true" : "false");
    return linked ? 0 : 1;
}

static int cmd_stats(const Config& cfg){
    NoProofVerifier none;
    Registry reg(none, cfg.deployer, registry_options(cfg));
    RegistryStats s = reg.stats();
    ordered_json j;
    j["models"] = s.models;
    j["signals"] = s.signals;
    j["authorized"] = s.authorized;
    j["events"] = s.events;
    printf("%s\n", j.dump(2).c_str());
    return 0;
}

static int cmd_events(const Args& a, const Config& cfg){
    if(a.has("verify")){
        Groth16Verifier verifier = Groth16Verifier::load(cfg.key_dir);
        Registry reg(verifier, cfg.deployer, registry_options(cfg));
        std::vector<uint64_t> failed = reg.reverify();
        for(uint64_t seq: failed) fprintf(stderr, "  event %llu: proof rejected\n", (unsigned long long)seq);
        printf("Reverify: %s (%zu event(s), %zu rejected)\n", failed.empty() ? "ACCEPT" : "REJECT",
               reg.events().size(), failed.size());
        return failed.empty() ? 0 : 1;
    }
    NoProofVerifier none;
    Registry reg(none, cfg.deployer, registry_options(cfg));
    for(const Event& e: reg.events()) printf("%s\n", event_to_json(e).dump().c_str());
    return 0;
}

// --------------------------------------------------------------------- MAIN
int main(int argc, char** argv){
    if(argc<2){
        fprintf(stderr,
            "Usage:\n"
            "  ./zkattest -t <power> <out.ptau>\n"
            "  ./zkattest -x <in.ptau> <out.ptau> [--name N] [--entropy E]\n"
            "  ./zkattest -X <in.ptau>\n"
            "  ./zkattest -k <model|signal> <in.ptau> [keydir] [--name N] [--entropy E]\n"
            "  ./zkattest -K <model|signal> <in.ptau> [keydir]\n"
            "  ./zkattest -p model <weights.json> --version V [--timestamp T] [--out F]\n"
            "  ./zkattest -p signal --type T --confidence C --model-hash H [--timestamp T] [--out F]\n"
            "  ./zkattest -p composite <weights.json> --version V --type T --confidence C [--timestamp T] [--out F]\n"
            "  ./zkattest -v <proof.json>\n"
            "  ./zkattest -a <proof.json> --caller P\n"
            "  ./zkattest -g <principal> --caller P [--revoke]\n"
            "  ./zkattest -q <model|signal> <hash>\n"
            "  ./zkattest -l <signalHash> <modelHash>\n"
            "  ./zkattest -s | -e [--verify]\n"
            "Global: --config FILE  --keys DIR  --debug\n");
        return 1;
    }
    std::string mode = argv[1];
    try{
        Args a = parse_args(argc, argv, 2);
        if(a.has("debug")) set_debug(true);
        Config cfg = load_config(a.get("config", kDefaultConfigPath), a.has("config"));
        if(cfg.debug) set_debug(true);
        if(a.has("keys")) cfg.key_dir = a.get("keys");
        init_curve();

        if(mode=="-t") return cmd_new_transcript(a);
        if(mode=="-x") return cmd_contribute(a);
        if(mode=="-X") return cmd_verify_transcript(a);
        if(mode=="-k") return cmd_setup_keys(a, cfg);
        if(mode=="-K") return cmd_verify_keys(a, cfg);
        if(mode=="-p") return cmd_prove(a, cfg);
        if(mode=="-v") return cmd_verify(a, cfg);
        if(mode=="-a") return cmd_attest(a, cfg);
        if(mode=="-g") return cmd_authorize(a, cfg);
        if(mode=="-q") return cmd_query(a, cfg);
        if(mode=="-l") return cmd_linked(a, cfg);
        if(mode=="-s") return cmd_stats(cfg);
        if(mode=="-e") return cmd_events(a, cfg);
        fprintf(stderr, "Unknown mode: %s\n", mode.c_str());
        return 1;
    }catch(const Error& e){
        fprintf(stderr, "Error: [%s] %s\n", to_string(e.code()), e.what());
        return 2;
    }catch(const std::exception& e){
        fprintf(stderr, "Error: %s\n", e.what());
        return 2;
    }
}
