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

#include "ceremony.hpp"
#include "domain.hpp"
#include "error.hpp"
#include "log.hpp"

namespace zkattest {

// ------------------------------------------------------------------ helpers
static void setup_fail(const std::string& why){ throw Error(ErrorCode::SetupFailure, why); }

// e(a1, b2) == e(b1, a2), i.e. b1/a1 and b2/a2 share the same discrete log.
static bool same_ratio(const G1& a1, const G1& b1, const G2& a2, const G2& b2){
    if(a1.isZero() || b1.isZero() || a2.isZero() || b2.isZero()) return false;
    GT l, r;
    mcl::bn::pairing(l, a1, b2);
    mcl::bn::pairing(r, b1, a2);
    return l == r;
}

template<class P>
static void random_shift_pair(const std::vector<P>& v, size_t count, P& lo, P& hi){
    lo.clear(); hi.clear();
    for(size_t i=0;i<count;i++){
        Fr rho = fr_random();
        P t;
        P::mul(t, v[i], rho);   P::add(lo, lo, t);
        P::mul(t, v[i+1], rho); P::add(hi, hi, t);
    }
}

template<class P>
static P random_combination(const std::vector<P>& v, const std::vector<Fr>& rho){
    return msm(v, rho);
}

static Fr contributor_secret(const std::string& entropy, const std::string& name,
                             const std::string& prev_hash, const char* tag){
    for(;;){
        Fr x = fr_random() + fr_from_hash(entropy + "|" + name + "|" + prev_hash + "|" + tag);
        if(!x.isZero()) return x;
    }
}

static G2 pok_base(const std::string& challenge, const G1& s, const G1& s_x){
    return hash_to_g2("zkattest.pok|" + challenge + "|" + g1_bytes(s) + g1_bytes(s_x));
}

static KnowledgeProof prove_knowledge(const Fr& x, const std::string& challenge){
    KnowledgeProof p;
    G1::mul(p.s, gen_g1(), fr_random_nonzero());
    G1::mul(p.s_x, p.s, x);
    G2 r = pok_base(challenge, p.s, p.s_x);
    G2::mul(p.r_x, r, x);
    return p;
}

static bool check_knowledge(const KnowledgeProof& p, const std::string& challenge,
                            const G1& before, const G1& after){
    G2 r = pok_base(challenge, p.s, p.s_x);
    return same_ratio(p.s, p.s_x, r, p.r_x) && same_ratio(before, after, r, p.r_x);
}

static void check_shape(const PowersOfTau& t){
    if(t.power < 1 || t.power > kMaxTauPower) setup_fail("transcript: unsupported power " + std::to_string(t.power));
    const size_t n = t.domain_size();
    if(t.tau_g1.size() != 2*n-1 || t.tau_g2.size() != n || t.alpha_tau_g1.size() != n || t.beta_tau_g1.size() != n)
        setup_fail("transcript: section sizes do not match power " + std::to_string(t.power));
}

// ----------------------------------------------------------------- phase 1
std::string PowersOfTau::state_hash() const {
    Sha256 h;
    h.update("zkattest.ptau.v1");
    h.update_u64(power);
    h.update_u64(tau_g1.size());
    for(const auto& P: tau_g1) h.update_g1(P);
    h.update_u64(tau_g2.size());
    for(const auto& Q: tau_g2) h.update_g2(Q);
    h.update_u64(alpha_tau_g1.size());
    for(const auto& P: alpha_tau_g1) h.update_g1(P);
    h.update_u64(beta_tau_g1.size());
    for(const auto& P: beta_tau_g1) h.update_g1(P);
    h.update_g2(beta_g2);
    return h.final_hex();
}

PowersOfTau new_transcript(uint32_t power){
    init_curve();
    if(power < 1 || power > kMaxTauPower)
        throw Error(ErrorCode::InvalidInput, "tau power must be in [1, " + std::to_string(kMaxTauPower) + "]");
    PowersOfTau t;
    t.power = power;
    const size_t n = t.domain_size();
    t.tau_g1.assign(2*n-1, gen_g1());
    t.tau_g2.assign(n, gen_g2());
    t.alpha_tau_g1.assign(n, gen_g1());
    t.beta_tau_g1.assign(n, gen_g1());
    t.beta_g2 = gen_g2();
    dbg("new transcript: power " + std::to_string(power) + ", " + std::to_string(n) + " points");
    return t;
}

void contribute(PowersOfTau& t, const std::string& name, const std::string& entropy){
    init_curve();
    check_shape(t);
    Contribution c;
    c.name = name;
    c.prev_hash = t.state_hash();

    Fr tau   = contributor_secret(entropy, name, c.prev_hash, "tau");
    Fr alpha = contributor_secret(entropy, name, c.prev_hash, "alpha");
    Fr beta  = contributor_secret(entropy, name, c.prev_hash, "beta");
    const G1 before_tau = t.tau_g1[1], before_alpha = t.alpha_tau_g1[0], before_beta = t.beta_tau_g1[0];

    const size_t n = t.domain_size();
    Fr p = 1;
    for(size_t i=0;i<t.tau_g1.size();i++){
        if(i) G1::mul(t.tau_g1[i], t.tau_g1[i], p);
        if(i < n){
            if(i) G2::mul(t.tau_g2[i], t.tau_g2[i], p);
            G1::mul(t.alpha_tau_g1[i], t.alpha_tau_g1[i], alpha*p);
            G1::mul(t.beta_tau_g1[i], t.beta_tau_g1[i], beta*p);
        }
        p *= tau;
    }
    G2::mul(t.beta_g2, t.beta_g2, beta);

    c.tau_g1 = t.tau_g1[1];
    c.alpha_g1 = t.alpha_tau_g1[0];
    c.beta_g1 = t.beta_tau_g1[0];
    c.tau_pok = prove_knowledge(tau, c.prev_hash + "|tau");
    c.alpha_pok = prove_knowledge(alpha, c.prev_hash + "|alpha");
    c.beta_pok = prove_knowledge(beta, c.prev_hash + "|beta");
    if(!check_knowledge(c.tau_pok, c.prev_hash + "|tau", before_tau, c.tau_g1))
        setup_fail("contribution: tau proof of knowledge does not verify");
    c.hash = t.state_hash();
    t.contributions.push_back(c);
    dbg("phase-1 contribution '" + name + "': " + c.prev_hash.substr(0,16) + " -> " + c.hash.substr(0,16));
}

void verify_transcript(const PowersOfTau& t){
    init_curve();
    auto fail=[&](const std::string& why){ setup_fail("transcript: " + why); };
    check_shape(t);
    const size_t n = t.domain_size();
    const G1& g1 = gen_g1();
    const G2& g2 = gen_g2();

    if(!(t.tau_g1[0] == g1) || !(t.tau_g2[0] == g2)) fail("generators do not match");
    if(t.contributions.empty()) fail("no entropy contributions");

    if(t.contributions.front().prev_hash != new_transcript(t.power).state_hash())
        fail("first contribution does not start from the initial state");
    G1 tau_before = g1, alpha_before = g1, beta_before = g1;
    for(size_t i=0;i<t.contributions.size();i++){
        const Contribution& c = t.contributions[i];
        const std::string at = "contribution " + std::to_string(i) + " (" + c.name + "): ";
        if(i && c.prev_hash != t.contributions[i-1].hash) fail(at + "hash chain broken");
        if(!check_knowledge(c.tau_pok, c.prev_hash + "|tau", tau_before, c.tau_g1)) fail(at + "tau proof of knowledge");
        if(!check_knowledge(c.alpha_pok, c.prev_hash + "|alpha", alpha_before, c.alpha_g1)) fail(at + "alpha proof of knowledge");
        if(!check_knowledge(c.beta_pok, c.prev_hash + "|beta", beta_before, c.beta_g1)) fail(at + "beta proof of knowledge");
        tau_before = c.tau_g1; alpha_before = c.alpha_g1; beta_before = c.beta_g1;
    }
    const Contribution& last = t.contributions.back();
    if(last.hash != t.state_hash()) fail("state hash does not match the last contribution");
    if(!(last.tau_g1 == t.tau_g1[1]) || !(last.alpha_g1 == t.alpha_tau_g1[0]) || !(last.beta_g1 == t.beta_tau_g1[0]))
        fail("last contribution does not match transcript points");

    G1 lo, hi;
    random_shift_pair(t.tau_g1, t.tau_g1.size()-1, lo, hi);
    if(!same_ratio(lo, hi, g2, t.tau_g2[1])) fail("tau_g1 powers are inconsistent");
    G2 lo2, hi2;
    random_shift_pair(t.tau_g2, n-1, lo2, hi2);
    if(!same_ratio(g1, t.tau_g1[1], lo2, hi2)) fail("tau_g2 powers are inconsistent");
    random_shift_pair(t.alpha_tau_g1, n-1, lo, hi);
    if(!same_ratio(lo, hi, g2, t.tau_g2[1])) fail("alpha_tau_g1 powers are inconsistent");
    random_shift_pair(t.beta_tau_g1, n-1, lo, hi);
    if(!same_ratio(lo, hi, g2, t.tau_g2[1])) fail("beta_tau_g1 powers are inconsistent");
    if(!same_ratio(g1, t.beta_tau_g1[0], g2, t.beta_g2)) fail("beta_g2 does not match beta_tau_g1");
    dbg("transcript verified: power " + std::to_string(t.power) + ", "
        + std::to_string(t.contributions.size()) + " contribution(s)");
}

// ----------------------------------------------------------------- phase 2
std::string CircuitKeys::state_hash() const {
    Sha256 h;
    h.update("zkattest.keys.v1");
    h.update_u64(pk.circuit_id.size()).update(pk.circuit_id);
    h.update_u64(pk.circuit_version).update(pk.circuit_digest).update(transcript_hash);
    h.update_u64(pk.domain_size).update_u64(pk.num_variables).update_u64(pk.num_public);
    h.update_g1(pk.alpha_g1).update_g1(pk.beta_g1).update_g1(pk.delta_g1);
    h.update_g2(pk.beta_g2).update_g2(pk.delta_g2);
    for(const auto* q: {&pk.a_query, &pk.b_g1_query, &pk.l_query, &pk.h_query}){
        h.update_u64(q->size());
        for(const auto& P: *q) h.update_g1(P);
    }
    h.update_u64(pk.b_g2_query.size());
    for(const auto& Q: pk.b_g2_query) h.update_g2(Q);
    h.update_g2(pk.vk.gamma_g2);
    h.update_u64(pk.vk.ic.size());
    for(const auto& P: pk.vk.ic) h.update_g1(P);
    return h.final_hex();
}

template<class P>
static void accumulate(P& dst, const P& base, const Fr& coeff){
    if(coeff.isOne()){ P::add(dst, dst, base); return; }
    P t; P::mul(t, base, coeff);
    P::add(dst, dst, t);
}

CircuitKeys setup_circuit(const PowersOfTau& t, const R1CS& cs){
    verify_transcript(t);
    Domain d(cs.num_rows());
    if(d.size() > t.domain_size())
        setup_fail("transcript power " + std::to_string(t.power) + " too small for " + cs.circuit_id
                   + " (needs 2^" + std::to_string(d.log_size()) + ")");
    const size_t n = d.size(), m = cs.num_constraints(), nv = cs.num_variables, l = cs.num_public;
    dbg("phase 2 for " + cs.circuit_id + ": " + std::to_string(m) + " constraints, domain " + std::to_string(n));

    std::vector<G1> lag(t.tau_g1.begin(), t.tau_g1.begin()+n);
    std::vector<G1> lag_alpha(t.alpha_tau_g1.begin(), t.alpha_tau_g1.begin()+n);
    std::vector<G1> lag_beta(t.beta_tau_g1.begin(), t.beta_tau_g1.begin()+n);
    std::vector<G2> lag_g2(t.tau_g2.begin(), t.tau_g2.begin()+n);
    d.ifft(lag); d.ifft(lag_alpha); d.ifft(lag_beta); d.ifft(lag_g2);

    CircuitKeys keys;
    ProvingKey& pk = keys.pk;
    pk.circuit_id = cs.circuit_id;
    pk.circuit_version = cs.circuit_version;
    pk.circuit_digest = cs.digest();
    pk.domain_size = n;
    pk.num_variables = nv;
    pk.num_public = l;
    pk.alpha_g1 = t.alpha_tau_g1[0];
    pk.beta_g1 = t.beta_tau_g1[0];
    pk.beta_g2 = t.beta_g2;
    pk.delta_g1 = gen_g1();
    pk.delta_g2 = gen_g2();

    pk.a_query.assign(nv, g1_zero());
    pk.b_g1_query.assign(nv, g1_zero());
    pk.b_g2_query.assign(nv, g2_zero());
    std::vector<G1> k(nv, g1_zero());
    for(size_t i=0;i<m;i++){
        const Constraint& row = cs.constraints[i];
        for(const Term& x: row.a.terms()){
            accumulate(pk.a_query[x.var], lag[i], x.coeff);
            accumulate(k[x.var], lag_beta[i], x.coeff);
        }
        for(const Term& x: row.b.terms()){
            accumulate(pk.b_g1_query[x.var], lag[i], x.coeff);
            accumulate(pk.b_g2_query[x.var], lag_g2[i], x.coeff);
            accumulate(k[x.var], lag_alpha[i], x.coeff);
        }
        for(const Term& x: row.c.terms()) accumulate(k[x.var], lag[i], x.coeff);
    }
    for(size_t j=0;j<=l;j++){
        G1::add(pk.a_query[j], pk.a_query[j], lag[m+j]);
        G1::add(k[j], k[j], lag_beta[m+j]);
    }
    pk.l_query.assign(k.begin()+l+1, k.end());

    pk.h_query.resize(n-1);
    for(size_t i=0;i+1<n;i++) G1::sub(pk.h_query[i], t.tau_g1[i+n], t.tau_g1[i]);

    VerificationKey& vk = pk.vk;
    vk.circuit_id = pk.circuit_id;
    vk.circuit_version = pk.circuit_version;
    vk.circuit_digest = pk.circuit_digest;
    vk.alpha_g1 = pk.alpha_g1;
    vk.beta_g2 = pk.beta_g2;
    vk.gamma_g2 = gen_g2();
    vk.delta_g2 = pk.delta_g2;
    vk.ic.assign(k.begin(), k.begin()+l+1);

    keys.transcript_hash = t.state_hash();
    return keys;
}

void contribute_delta(CircuitKeys& keys, const std::string& name, const std::string& entropy){
    init_curve();
    ProvingKey& pk = keys.pk;
    DeltaContribution c;
    c.name = name;
    c.prev_hash = keys.state_hash();

    Fr delta = contributor_secret(entropy, name, c.prev_hash, "delta");
    Fr delta_inv; Fr::inv(delta_inv, delta);
    G1::mul(pk.delta_g1, pk.delta_g1, delta);
    G2::mul(pk.delta_g2, pk.delta_g2, delta);
    pk.vk.delta_g2 = pk.delta_g2;
    for(auto& P: pk.l_query) G1::mul(P, P, delta_inv);
    for(auto& P: pk.h_query) G1::mul(P, P, delta_inv);

    c.delta_g1 = pk.delta_g1;
    c.pok = prove_knowledge(delta, c.prev_hash + "|delta");
    c.hash = keys.state_hash();
    keys.contributions.push_back(c);
    dbg("delta contribution '" + name + "' to " + pk.circuit_id + ": " + c.hash.substr(0,16));
}

void verify_circuit_keys(const CircuitKeys& keys, const PowersOfTau& t, const R1CS& cs){
    auto fail=[&](const std::string& why){ setup_fail("keys for " + cs.circuit_id + ": " + why); };
    const ProvingKey& pk = keys.pk;
    if(pk.circuit_id != cs.circuit_id || pk.circuit_version != cs.circuit_version) fail("circuit id/version differ");
    if(pk.circuit_digest != cs.digest()) fail("circuit digest differs");
    if(keys.transcript_hash != t.state_hash()) fail("derived from a different transcript");

    CircuitKeys fresh = setup_circuit(t, cs);
    const ProvingKey& f = fresh.pk;
    if(pk.domain_size != f.domain_size || pk.num_variables != f.num_variables || pk.num_public != f.num_public)
        fail("dimensions differ");
    if(!(pk.alpha_g1 == f.alpha_g1) || !(pk.beta_g1 == f.beta_g1) || !(pk.beta_g2 == f.beta_g2))
        fail("alpha/beta differ from transcript");
    if(pk.a_query != f.a_query || pk.b_g1_query != f.b_g1_query || pk.b_g2_query != f.b_g2_query)
        fail("A/B queries differ from transcript");
    if(pk.l_query.size() != f.l_query.size() || pk.h_query.size() != f.h_query.size())
        fail("L/H query sizes differ");
    const VerificationKey& vk = pk.vk;
    if(vk.circuit_id != pk.circuit_id || vk.circuit_version != pk.circuit_version || vk.circuit_digest != pk.circuit_digest)
        fail("verification key metadata differs");
    if(!(vk.alpha_g1 == f.vk.alpha_g1) || !(vk.beta_g2 == f.vk.beta_g2) || !(vk.gamma_g2 == f.vk.gamma_g2) || vk.ic != f.vk.ic)
        fail("verification key differs from transcript");
    if(!(vk.delta_g2 == pk.delta_g2)) fail("verification key delta differs");

    if(keys.contributions.empty()) fail("no delta contributions");
    if(keys.contributions.front().prev_hash != fresh.state_hash()) fail("first delta contribution does not start from the initial keys");
    G1 before = gen_g1();
    for(size_t i=0;i<keys.contributions.size();i++){
        const DeltaContribution& c = keys.contributions[i];
        if(i && c.prev_hash != keys.contributions[i-1].hash) fail("delta hash chain broken at " + std::to_string(i));
        if(!check_knowledge(c.pok, c.prev_hash + "|delta", before, c.delta_g1))
            fail("delta proof of knowledge fails at " + std::to_string(i) + " (" + c.name + ")");
        before = c.delta_g1;
    }
    if(keys.contributions.back().hash != keys.state_hash()) fail("state hash does not match the last contribution");
    if(!(before == pk.delta_g1)) fail("delta does not match the last contribution");

    const G1& g1 = gen_g1();
    const G2& g2 = gen_g2();
    if(!same_ratio(g1, pk.delta_g1, g2, pk.delta_g2)) fail("delta_g1 and delta_g2 disagree");

    std::vector<Fr> rho(f.l_query.size());
    for(auto& r: rho) r = fr_random();
    if(!rho.empty() && !same_ratio(random_combination(pk.l_query, rho), random_combination(f.l_query, rho), g2, pk.delta_g2))
        fail("L query is not scaled by delta");
    rho.resize(f.h_query.size());
    for(auto& r: rho) r = fr_random();
    if(!same_ratio(random_combination(pk.h_query, rho), random_combination(f.h_query, rho), g2, pk.delta_g2))
        fail("H query is not scaled by delta");
    dbg("keys verified for " + cs.circuit_id + ": " + std::to_string(keys.contributions.size()) + " delta contribution(s)");
}

} // namespace zkattest
