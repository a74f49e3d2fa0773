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

#include "domain.hpp"

#include <string>

namespace zkattest {

// Decimal string -> little-endian bits.
static std::vector<bool> dec_to_bits(std::string d){
    std::vector<bool> bits;
    while(!(d.size()==1 && d[0]=='0') && !d.empty()){
        int carry = 0;
        std::string q;
        for(char c: d){
            int cur = carry*10 + (c-'0');
            q.push_back(char('0' + cur/2));
            carry = cur % 2;
        }
        bits.push_back(carry != 0);
        size_t nz = q.find_first_not_of('0');
        d = (nz==std::string::npos) ? "0" : q.substr(nz);
    }
    return bits;
}

static Fr pow_bits(const Fr& base, const std::vector<bool>& e){
    Fr r = 1;
    for(size_t i=e.size(); i-->0;){
        r *= r;
        if(e[i]) r *= base;
    }
    return r;
}

// Generator of the order-2^28 subgroup: g^((r-1)/2^28) for a non-residue g.
static const Fr& two_adic_root(){
    static const Fr root = []{
        init_curve();
        std::string mod;
        Fr::getModulo(mod);
        std::vector<bool> bits = dec_to_bits(mod);
        bits[0] = false;  // r - 1
        for(uint32_t i=0;i<Domain::kMaxLogSize;i++)
            if(bits[i]) throw Error(ErrorCode::SetupFailure, "scalar field 2-adicity below 28");
        std::vector<bool> q(bits.begin()+Domain::kMaxLogSize, bits.end());
        for(int g: {5, 7, 11, 13, 17}){
            Fr w = pow_bits(Fr(g), q);
            Fr half = w;
            for(uint32_t i=0;i+1<Domain::kMaxLogSize;i++) half *= half;
            if(!half.isOne()) return w;
        }
        throw Error(ErrorCode::SetupFailure, "no 2^28-th root of unity found");
    }();
    return root;
}

const Fr& Domain::coset_gen(){
    static const Fr g = [](){ init_curve(); return Fr(5); }();
    return g;
}

Domain::Domain(size_t min_size){
    while(n_ < min_size){
        n_ <<= 1;
        if(++log_n_ > kMaxLogSize) throw Error(ErrorCode::SetupFailure, "domain exceeds 2^28");
    }
    Fr w = two_adic_root();
    for(uint32_t i=log_n_; i<kMaxLogSize; i++) w *= w;
    omega_ = w;
    Fr::inv(omega_inv_, omega_);
    Fr::inv(n_inv_, fr_from_u64(n_));
    if(vanishing_on_coset().isZero()) throw Error(ErrorCode::SetupFailure, "coset generator lies in the domain");
}

void Domain::coset_fft(std::vector<Fr>& a) const {
    Fr gp = 1;
    for(auto& x: a){ x *= gp; gp *= coset_gen(); }
    fft(a);
}

void Domain::coset_ifft(std::vector<Fr>& a) const {
    ifft(a);
    Fr g_inv; Fr::inv(g_inv, coset_gen());
    Fr gp = 1;
    for(auto& x: a){ x *= gp; gp *= g_inv; }
}

Fr Domain::vanishing_at(const Fr& x) const {
    return fr_pow(x, n_) - Fr(1);
}

} // namespace zkattest
