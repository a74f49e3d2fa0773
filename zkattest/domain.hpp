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

// domain.hpp
// Radix-2 evaluation domain over the BN254 scalar field (2-adicity 28).
// The transforms work on field elements and on G1/G2 points alike; the
// point versions turn [tau^i] powers into Lagrange-basis commitments.

#pragma once
#include "error.hpp"
#include "field.hpp"

#include <utility>
#include <vector>

namespace zkattest {

inline void scale_by(Fr& z, const Fr& x, const Fr& k){ Fr::mul(z, x, k); }
inline void scale_by(G1& z, const G1& x, const Fr& k){ G1::mul(z, x, k); }
inline void scale_by(G2& z, const G2& x, const Fr& k){ G2::mul(z, x, k); }

class Domain {
public:
    static constexpr uint32_t kMaxLogSize = 28;

    // Smallest power of two >= min_size; throws SetupFailure beyond 2^28.
    explicit Domain(size_t min_size);

    size_t size() const { return n_; }
    uint32_t log_size() const { return log_n_; }
    const Fr& omega() const { return omega_; }

    // Coefficients to evaluations over {omega^i}, in place; a.size() == size().
    template<class T> void fft(std::vector<T>& a) const { transform(a, omega_); }
    // Evaluations to coefficients.
    template<class T> void ifft(std::vector<T>& a) const {
        transform(a, omega_inv_);
        for(auto& x: a) scale_by(x, x, n_inv_);
    }

    // Same transforms over the coset g*{omega^i}.
    void coset_fft(std::vector<Fr>& a) const;
    void coset_ifft(std::vector<Fr>& a) const;

    // Z(x) = x^n - 1; constant on the coset.
    Fr vanishing_at(const Fr& x) const;
    Fr vanishing_on_coset() const { return vanishing_at(coset_gen()); }

    static const Fr& coset_gen();

private:
    template<class T> void transform(std::vector<T>& a, const Fr& w) const;

    size_t n_ = 1;
    uint32_t log_n_ = 0;
    Fr omega_, omega_inv_, n_inv_;
};

template<class T>
void Domain::transform(std::vector<T>& a, const Fr& w) const {
    if(a.size() != n_) throw Error(ErrorCode::InvalidInput, "fft: vector size does not match domain");
    for(size_t i=1, j=0; i<n_; i++){
        size_t bit = n_ >> 1;
        for(; j & bit; bit >>= 1) j ^= bit;
        j ^= bit;
        if(i < j) std::swap(a[i], a[j]);
    }
    for(size_t len=2; len<=n_; len<<=1){
        const size_t half = len/2;
        std::vector<Fr> tw(half);
        Fr wl = fr_pow(w, n_/len);
        tw[0] = 1;
        for(size_t j=1;j<half;j++) tw[j] = tw[j-1] * wl;
        for(size_t i=0;i<n_;i+=len){
            for(size_t j=0;j<half;j++){
                T u = a[i+j], v;
                if(j == 0) v = a[i+j+half];
                else scale_by(v, a[i+j+half], tw[j]);
                T::add(a[i+j], u, v);
                T::sub(a[i+j+half], u, v);
            }
        }
    }
}

} // namespace zkattest
