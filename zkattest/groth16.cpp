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

#include "groth16.hpp"
#include "domain.hpp"
#include "log.hpp"

namespace zkattest {

std::vector<Fr> quotient_coefficients(const R1CS& cs, const std::vector<Fr>& w, size_t domain_size){
    Domain d(domain_size);
    if(d.size() != domain_size) throw Error(ErrorCode::InvalidInput, "domain size is not a power of two");
    if(cs.num_rows() > domain_size) throw Error(ErrorCode::InvalidInput, "constraint system exceeds domain");

    const size_t n = domain_size, m = cs.num_constraints();
    std::vector<Fr> a(n, Fr(0)), b(n, Fr(0)), c(n, Fr(0));
    for(size_t i=0;i<m;i++){
        const auto& row = cs.constraints[i];
        a[i] = row.a.evaluate(w);
        b[i] = row.b.evaluate(w);
        c[i] = row.c.evaluate(w);
    }
    // input-binding rows: w_j * 0 = 0
    for(size_t j=0;j<=cs.num_public;j++) a[m+j] = w[j];

    d.ifft(a); d.ifft(b); d.ifft(c);
    d.coset_fft(a); d.coset_fft(b); d.coset_fft(c);

    Fr z_inv; Fr::inv(z_inv, d.vanishing_on_coset());
    std::vector<Fr> h(n);
    for(size_t i=0;i<n;i++) h[i] = (a[i]*b[i] - c[i]) * z_inv;
    d.coset_ifft(h);
    return h;
}

Proof prove(const ProvingKey& pk, const R1CS& cs, const std::vector<Fr>& w){
    init_curve();
    if(cs.num_variables != pk.num_variables || cs.num_public != pk.num_public || w.size() != pk.num_variables)
        throw Error(ErrorCode::InvalidInput, "witness does not fit the proving key for " + pk.circuit_id);
    size_t bad = cs.first_unsatisfied_constraint(w);
    if(bad != cs.num_constraints())
        throw Error(ErrorCode::InvalidInput, cs.circuit_id + ": witness violates constraint " + std::to_string(bad));

    std::vector<Fr> h = quotient_coefficients(cs, w, pk.domain_size);
    dbg("prove " + pk.circuit_id + ": quotient over " + std::to_string(pk.domain_size) + " points");

    Fr r = fr_random(), s = fr_random();
    G1 t1; G2 t2;

    Proof p;
    p.a = msm(pk.a_query, w);
    G1::add(p.a, p.a, pk.alpha_g1);
    G1::mul(t1, pk.delta_g1, r); G1::add(p.a, p.a, t1);

    p.b = msm(pk.b_g2_query, w);
    G2::add(p.b, p.b, pk.beta_g2);
    G2::mul(t2, pk.delta_g2, s); G2::add(p.b, p.b, t2);

    G1 b1 = msm(pk.b_g1_query, w);
    G1::add(b1, b1, pk.beta_g1);
    G1::mul(t1, pk.delta_g1, s); G1::add(b1, b1, t1);

    p.c = msm(pk.l_query, w, pk.num_public+1);
    G1::add(p.c, p.c, msm(pk.h_query, h));
    G1::mul(t1, p.a, s);  G1::add(p.c, p.c, t1);
    G1::mul(t1, b1, r);   G1::add(p.c, p.c, t1);
    G1::mul(t1, pk.delta_g1, r*s); G1::sub(p.c, p.c, t1);
    return p;
}

bool verify(const VerificationKey& vk, const Proof& proof, const std::vector<Fr>& x, std::string* reason_out){
    auto fail=[&](const std::string& why){ if(reason_out) *reason_out=why; return false; };
    init_curve();
    if(vk.ic.empty()) return fail("verification key has no IC points");
    if(x.size() != vk.num_public()) return fail("expected " + std::to_string(vk.num_public()) + " public inputs, got " + std::to_string(x.size()));
    if(!proof.a.isValid() || !proof.b.isValid() || !proof.c.isValid()) return fail("proof point not in group");

    G1 ic = vk.ic[0];
    for(size_t i=0;i<x.size();i++){
        if(x[i].isZero()) continue;
        G1 t; G1::mul(t, vk.ic[i+1], x[i]);
        G1::add(ic, ic, t);
    }

    GT lhs, e_ab, e_ic, e_c;
    mcl::bn::pairing(lhs, proof.a, proof.b);
    mcl::bn::pairing(e_ab, vk.alpha_g1, vk.beta_g2);
    mcl::bn::pairing(e_ic, ic, vk.gamma_g2);
    mcl::bn::pairing(e_c, proof.c, vk.delta_g2);
    GT rhs;
    GT::mul(rhs, e_ab, e_ic);
    GT::mul(rhs, rhs, e_c);
    if(!(lhs == rhs)) return fail("pairing check failed");
    return true;
}

} // namespace zkattest
