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

// r1cs.hpp
// Rank-1 constraint systems: <A_i,w> * <B_i,w> = <C_i,w> for every row i.
//
// Variable layout: w[0] = 1, w[1..num_public] = public signals in order,
// then private inputs and intermediates.

#pragma once
#include "field.hpp"

#include <string>
#include <vector>

namespace zkattest {

struct Term {
    size_t var;
    Fr coeff;
};

class LinearCombination {
public:
    LinearCombination() = default;

    static LinearCombination variable(size_t var, const Fr& coeff = 1);
    static LinearCombination constant(const Fr& value);

    LinearCombination& add(size_t var, const Fr& coeff);
    LinearCombination operator+(const LinearCombination& o) const;
    LinearCombination operator-(const LinearCombination& o) const;
    LinearCombination operator*(const Fr& k) const;

    Fr evaluate(const std::vector<Fr>& w) const;
    const std::vector<Term>& terms() const { return terms_; }

private:
    std::vector<Term> terms_;
};

struct Constraint {
    LinearCombination a, b, c;
};

struct R1CS {
    std::string circuit_id;
    uint32_t circuit_version = 0;
    size_t num_variables = 1;  // includes the constant one
    size_t num_public = 0;
    std::vector<Constraint> constraints;

    size_t num_private() const { return num_variables - num_public - 1; }
    size_t num_constraints() const { return constraints.size(); }

    // QAP rows: every constraint plus one input-binding row per public
    // variable (and the constant one).
    size_t num_rows() const { return constraints.size() + num_public + 1; }

    bool is_satisfied(const std::vector<Fr>& witness) const;
    // Index of the first failing row, or constraints.size() when all hold.
    size_t first_unsatisfied_constraint(const std::vector<Fr>& witness) const;

    // SHA-256 (hex) over the canonical serialization of the system.
    std::string digest() const;
};

// Allocates variables and constraints while computing the witness alongside.
class CircuitBuilder {
public:
    CircuitBuilder(const std::string& circuit_id, uint32_t version, size_t num_public);

    LinearCombination one() const { return LinearCombination::variable(0); }
    size_t public_var(size_t i) const { return 1 + i; }

    size_t alloc(const Fr& value = Fr(0));
    void set_value(size_t var, const Fr& value);
    const Fr& value(size_t var) const { return witness_[var]; }
    Fr evaluate(const LinearCombination& lc) const { return lc.evaluate(witness_); }

    void enforce(const LinearCombination& a, const LinearCombination& b, const LinearCombination& c);

    // New variable holding a*b, constrained.
    size_t mul(const LinearCombination& a, const LinearCombination& b);

    const R1CS& system() const { return r1cs_; }
    const std::vector<Fr>& witness() const { return witness_; }
    std::vector<Fr> public_signals() const;

private:
    R1CS r1cs_;
    std::vector<Fr> witness_;
};

} // namespace zkattest
