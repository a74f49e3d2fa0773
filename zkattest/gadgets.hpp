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

// gadgets.hpp
// Constraint gadgets shared by the attestation circuits.

#pragma once
#include "r1cs.hpp"

#include <vector>

namespace zkattest {

// MiMC-7 in constraints: four multiplications per round. Returns t + k.
LinearCombination mimc7_gadget(CircuitBuilder& cb, const LinearCombination& x, const LinearCombination& k);

// Sponge over inputs. The final state is written into out_var when given,
// otherwise into a freshly allocated variable. Returns that variable.
size_t mimc_sponge_gadget(CircuitBuilder& cb, const std::vector<LinearCombination>& inputs,
                          size_t out_var = 0);

// Little-endian bit decomposition with booleanity and recomposition
// constraints; forces 0 <= x < 2^nbits.
std::vector<size_t> to_bits(CircuitBuilder& cb, const LinearCombination& x, size_t nbits);

// 1 if a < b else 0, for a, b < 2^nbits.
LinearCombination less_than(CircuitBuilder& cb, const LinearCombination& a,
                            const LinearCombination& b, size_t nbits);

} // namespace zkattest
