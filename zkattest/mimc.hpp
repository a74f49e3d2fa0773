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

// mimc.hpp
// MiMC-7 permutation over the BN254 scalar field and the Miyaguchi-Preneel
// sponge used for model and signal content hashes. The circuits compute the
// same function with constraints (see gadgets.hpp).

#pragma once
#include "field.hpp"

#include <vector>

namespace zkattest {

constexpr size_t kMimcRounds = 91;

// c_0 = 0, c_i = SHA-256("zkattest.mimc7." || i) mod r
const std::vector<Fr>& mimc_constants();

// t <- (t + k + c_i)^7 for every round, output t + k.
Fr mimc7(const Fr& x, const Fr& k);

// h_0 = 0, h_{i+1} = h_i + x_i + mimc7(x_i, h_i)
Fr mimc_sponge(const std::vector<Fr>& inputs);

} // namespace zkattest
