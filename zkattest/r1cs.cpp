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

#include "r1cs.hpp"
#include "error.hpp"

namespace zkattest {

LinearCombination LinearCombination::variable(size_t var, const Fr& coeff){
    LinearCombination lc;
    lc.add(var, coeff);
    return lc;
}

LinearCombination LinearCombination::constant(const Fr& value){
    return variable(0, value);
}

LinearCombination& LinearCombination::add(size_t var, const Fr& coeff){
    if(coeff.isZero()) return *this;
    for(auto it=terms_.begin(); it!=terms_.end(); ++it){
        if(it->var != var) continue;
        it->coeff += coeff;
        if(it->coeff.isZero()) terms_.erase(it);
        return *this;
    }
    terms_.push_back({var, coeff});
    return *this;
}

LinearCombination LinearCombination::operator+(const LinearCombination& o) const {
    LinearCombination r = *this;
    for(const auto& t: o.terms_) r.add(t.var, t.coeff);
    return r;
}

LinearCombination LinearCombination::operator-(const LinearCombination& o) const {
    LinearCombination r = *this;
    for(const auto& t: o.terms_){ Fr n; Fr::neg(n, t.coeff); r.add(t.var, n); }
    return r;
}

LinearCombination LinearCombination::operator*(const Fr& k) const {
    LinearCombination r;
    for(const auto& t: terms_) r.add(t.var, t.coeff * k);
    return r;
}

Fr LinearCombination::evaluate(const std::vector<Fr>& w) const {
    Fr acc = 0;
    for(const auto& t: terms_){
        if(t.var >= w.size()) throw Error(ErrorCode::InvalidInput, "witness too short");
        acc += t.coeff * w[t.var];
    }
    return acc;
}

// ---------------------------------------------------------------- R1CS
size_t R1CS::first_unsatisfied_constraint(const std::vector<Fr>& w) const {
    if(w.size() != num_variables || !w[0].isOne()) return 0;
    for(size_t i=0;i<constraints.size();i++){
        const auto& c = constraints[i];
        if(c.a.evaluate(w) * c.b.evaluate(w) != c.c.evaluate(w)) return i;
    }
    return constraints.size();
}

bool R1CS::is_satisfied(const std::vector<Fr>& w) const {
    return w.size() == num_variables && first_unsatisfied_constraint(w) == constraints.size();
}

std::string R1CS::digest() const {
    Sha256 h;
    h.update("zkattest.r1cs.v1");
    h.update_u64(circuit_id.size()).update(circuit_id);
    h.update_u64(circuit_version);
    h.update_u64(num_variables).update_u64(num_public).update_u64(constraints.size());
    auto lc=[&](const LinearCombination& l){
        h.update_u64(l.terms().size());
        for(const auto& t: l.terms()){ h.update_u64(t.var); h.update_fr(t.coeff); }
    };
    for(const auto& c: constraints){ lc(c.a); lc(c.b); lc(c.c); }
    return h.final_hex();
}

// ------------------------------------------------------------ CircuitBuilder
CircuitBuilder::CircuitBuilder(const std::string& circuit_id, uint32_t version, size_t num_public){
    r1cs_.circuit_id = circuit_id;
    r1cs_.circuit_version = version;
    r1cs_.num_public = num_public;
    r1cs_.num_variables = 1 + num_public;
    witness_.assign(r1cs_.num_variables, Fr(0));
    witness_[0] = 1;
}

size_t CircuitBuilder::alloc(const Fr& value){
    witness_.push_back(value);
    return r1cs_.num_variables++;
}

void CircuitBuilder::set_value(size_t var, const Fr& value){
    if(var == 0 || var >= witness_.size()) throw Error(ErrorCode::InvalidInput, "set_value: bad variable");
    witness_[var] = value;
}

void CircuitBuilder::enforce(const LinearCombination& a, const LinearCombination& b, const LinearCombination& c){
    r1cs_.constraints.push_back({a, b, c});
}

size_t CircuitBuilder::mul(const LinearCombination& a, const LinearCombination& b){
    size_t v = alloc(evaluate(a) * evaluate(b));
    enforce(a, b, LinearCombination::variable(v));
    return v;
}

std::vector<Fr> CircuitBuilder::public_signals() const {
    return std::vector<Fr>(witness_.begin()+1, witness_.begin()+1+r1cs_.num_public);
}

} // namespace zkattest
