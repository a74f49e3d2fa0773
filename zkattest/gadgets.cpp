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

#include "gadgets.hpp"
#include "error.hpp"
#include "mimc.hpp"

namespace zkattest {

using LC = LinearCombination;

LC mimc7_gadget(CircuitBuilder& cb, const LC& x, const LC& k){
    const auto& c = mimc_constants();
    LC t = x;
    for(size_t i=0;i<kMimcRounds;i++){
        LC b = t + k + LC::constant(c[i]);
        size_t s2 = cb.mul(b, b);
        size_t s4 = cb.mul(LC::variable(s2), LC::variable(s2));
        size_t s6 = cb.mul(LC::variable(s4), LC::variable(s2));
        size_t s7 = cb.mul(LC::variable(s6), b);
        t = LC::variable(s7);
    }
    return t + k;
}

size_t mimc_sponge_gadget(CircuitBuilder& cb, const std::vector<LC>& inputs, size_t out_var){
    if(inputs.empty()) throw Error(ErrorCode::InvalidInput, "sponge: no inputs");
    LC h;  // h_0 = 0
    size_t hv = 0;
    for(size_t i=0;i<inputs.size();i++){
        LC sum = h + inputs[i] + mimc7_gadget(cb, inputs[i], h);
        Fr hval = cb.evaluate(sum);
        if(i+1 == inputs.size() && out_var){ hv = out_var; cb.set_value(hv, hval); }
        else hv = cb.alloc(hval);
        cb.enforce(sum, cb.one(), LC::variable(hv));
        h = LC::variable(hv);
    }
    return hv;
}

std::vector<size_t> to_bits(CircuitBuilder& cb, const LC& x, size_t nbits){
    uint64_t v = 0;
    // out-of-range values get a decomposition of their low word, which fails
    // the recomposition constraint
    if(!fr_to_u64(cb.evaluate(x), v)) v = 0;
    std::vector<size_t> bits(nbits);
    LC sum;
    Fr pow = 1;
    for(size_t i=0;i<nbits;i++){
        Fr bit = (i < 64 && ((v >> i) & 1)) ? 1 : 0;
        bits[i] = cb.alloc(bit);
        LC b = LC::variable(bits[i]);
        cb.enforce(b, b - cb.one(), LC());
        sum.add(bits[i], pow);
        pow += pow;
    }
    cb.enforce(sum, cb.one(), x);
    return bits;
}

LC less_than(CircuitBuilder& cb, const LC& a, const LC& b, size_t nbits){
    // a + 2^n - b lies in [0, 2^(n+1)); bit n is set iff a >= b
    Fr two_n = fr_pow(Fr(2), nbits);
    auto bits = to_bits(cb, a + LC::constant(two_n) - b, nbits+1);
    return cb.one() - LC::variable(bits[nbits]);
}

} // namespace zkattest
