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

// groth16.hpp
// Groth16 over BN254 (mcl pairings). Keys come out of the ceremony
// (ceremony.hpp); this file only proves and verifies.
//
// Verification equation, gamma fixed to the G2 generator:
//   e(A, B) == e(alpha, beta) * e(IC(x), gamma) * e(C, delta)

#pragma once
#include "error.hpp"
#include "field.hpp"
#include "r1cs.hpp"

#include <string>
#include <vector>

namespace zkattest {

struct VerificationKey {
    std::string circuit_id;
    uint32_t circuit_version = 0;
    std::string circuit_digest;
    G1 alpha_g1;
    G2 beta_g2;
    G2 gamma_g2;
    G2 delta_g2;
    std::vector<G1> ic;  // one per public input plus the constant

    size_t num_public() const { return ic.empty() ? 0 : ic.size()-1; }
};

struct ProvingKey {
    std::string circuit_id;
    uint32_t circuit_version = 0;
    std::string circuit_digest;
    size_t domain_size = 0;
    size_t num_variables = 0;
    size_t num_public = 0;

    G1 alpha_g1, beta_g1, delta_g1;
    G2 beta_g2, delta_g2;
    std::vector<G1> a_query;     // [A_j(tau)]        per variable
    std::vector<G1> b_g1_query;  // [B_j(tau)]        per variable
    std::vector<G2> b_g2_query;  // [B_j(tau)]_2      per variable
    std::vector<G1> l_query;     // [K_j(tau)/delta]  per private variable
    std::vector<G1> h_query;     // [tau^i Z(tau)/delta], i < domain_size-1

    VerificationKey vk;
};

struct Proof {
    G1 a;
    G2 b;
    G1 c;

    bool operator==(const Proof& o) const { return a==o.a && b==o.b && c==o.c; }
    bool operator!=(const Proof& o) const { return !(*this == o); }
};

template<class P>
P msm(const std::vector<P>& bases, const std::vector<Fr>& scalars, size_t offset = 0){
    if(offset + bases.size() > scalars.size()) throw Error(ErrorCode::InvalidInput, "msm len mismatch");
    P acc; acc.clear();
    for(size_t i=0;i<bases.size();++i){
        const Fr& s = scalars[offset+i];
        if(s.isZero()) continue;
        if(s.isOne()){ P::add(acc, acc, bases[i]); continue; }
        P tmp; P::mul(tmp, bases[i], s);
        P::add(acc, acc, tmp);
    }
    return acc;
}

// Coefficients of H(X) = (A(X)B(X) - C(X)) / Z(X) for a satisfying witness.
std::vector<Fr> quotient_coefficients(const R1CS& cs, const std::vector<Fr>& witness, size_t domain_size);

// Throws InvalidInput when the witness does not satisfy cs or does not fit pk.
Proof prove(const ProvingKey& pk, const R1CS& cs, const std::vector<Fr>& witness);

// Never throws on a bad proof; reason_out receives the first failed check.
bool verify(const VerificationKey& vk, const Proof& proof, const std::vector<Fr>& public_inputs,
            std::string* reason_out = nullptr);

} // namespace zkattest
